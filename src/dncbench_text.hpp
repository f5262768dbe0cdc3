// Small string helpers shared by the library sources (not installed)

#pragma once

#include <cctype>
#include <string>

namespace dncbench::detail {

inline std::string to_lower(std::string s) {
  for (char &c : s)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

} // namespace dncbench::detail
