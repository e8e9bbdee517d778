#pragma once

#include <optional>
#include <string>

#include <json-filter/path/node.hpp>
#include <json-filter/json.hpp>

namespace jsonfilter {

// Applies a path expression to a JSON value and returns a new, filtered
// value. The source is never modified.
//
// Filters hold no state, so a single instance may be shared between threads.
class Filter {
public:
  virtual ~Filter() = default;

  // A null `source` is treated like JSON null. Throws ParseError when `paths`
  // is malformed.
  Json apply(const Json *source, const std::optional<std::string> &paths) const;
  Json apply(const Json &source, const std::optional<std::string> &paths) const;

  // For callers that parse an expression once and reuse it.
  Json apply(const Json &source, const path::Node &root) const;
protected:
  virtual Json filter(const Json *source, const path::Node &root) const = 0;
};

} // namespace jsonfilter
