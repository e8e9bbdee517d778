#pragma once

#include <stdexcept>

struct ParseError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct InvalidFilterType : std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};
