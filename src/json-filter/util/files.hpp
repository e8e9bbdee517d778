#pragma once

#include <fstream>
#include <string>
#include <sstream>
#include <iostream>

namespace util {

// Returns the whole file, or an empty string if it can't be opened.
inline std::string load_file_content(const std::string &filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    std::cerr << "Could not open file: " << filename << std::endl;
    return "";
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  return buffer.str();
}

} // namespace util
