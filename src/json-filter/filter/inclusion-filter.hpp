#pragma once

#include <json-filter/filter/filter.hpp>

namespace jsonfilter {

// Keeps only the keys named by the path expression.
//
// A terminal node keeps the whole value below it; an explicit list, even an
// empty one, keeps narrowing. Arrays are filtered element by element with the
// same node and never shrink.
class InclusionFilter : public Filter {
protected:
  Json filter(const Json *source, const path::Node &node) const override;
private:
  Json filter_object(const Json &source, const path::Node &node) const;
  Json filter_array(const Json &source, const path::Node &node) const;
};

} // namespace jsonfilter
