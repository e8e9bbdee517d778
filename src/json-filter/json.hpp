#pragma once

#include <nlohmann/json.hpp>

namespace jsonfilter {

// Objects keep their insertion order, so filtered output lists keys in a
// predictable order.
using Json = nlohmann::ordered_json;

} // namespace jsonfilter
