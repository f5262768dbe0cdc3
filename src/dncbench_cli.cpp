#include "dncbench/cli.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace dncbench::cli {

std::vector<std::string> split_list(const std::string &s) {
  std::vector<std::string> out;
  std::string cur;
  std::istringstream is(s);
  while (std::getline(is, cur, ',')) {
    auto b = cur.find_first_not_of(" \t");
    auto e = cur.find_last_not_of(" \t");
    if (b == std::string::npos)
      continue;
    out.push_back(cur.substr(b, e - b + 1));
  }
  return out;
}

std::size_t parse_size_expr(const std::string &s) {
  if (s.empty())
    throw std::runtime_error("Invalid size expression: (empty)");
  if (s.find('-') != std::string::npos)
    throw std::runtime_error("Invalid size expression: " + s);
  errno = 0;
  char *end = nullptr;
  unsigned long long v = std::strtoull(s.c_str(), &end, 10);
  if (errno == 0 && end && *end == '\0') {
    if constexpr (sizeof(unsigned long long) > sizeof(std::size_t)) {
      if (v > std::numeric_limits<std::size_t>::max())
        throw std::runtime_error("Size out of range: " + s);
    }
    return static_cast<std::size_t>(v);
  }
  std::string base = s;
  double mul = 1.0;
  char last =
      static_cast<char>(std::tolower(static_cast<unsigned char>(s.back())));
  if (last == 'k' || last == 'm') {
    base = s.substr(0, s.size() - 1);
    mul = (last == 'k' ? 1e3 : 1e6);
  }
  end = nullptr;
  double d = std::strtod(base.c_str(), &end);
  if (base.empty() || !end || *end != '\0' || !(d >= 0))
    throw std::runtime_error("Invalid size expression: " + s);
  // 2^digits is exactly representable; anything at or above it cannot convert
  const double limit =
      std::ldexp(1.0, std::numeric_limits<std::size_t>::digits);
  const double total = d * mul;
  if (!(total < limit))
    throw std::runtime_error("Size out of range: " + s);
  return static_cast<std::size_t>(total);
}

long long parse_int(const std::string &s, const char *flag, long long lo,
                    long long hi) {
  errno = 0;
  char *end = nullptr;
  long long v = std::strtoll(s.c_str(), &end, 10);
  if (s.empty() || errno != 0 || !end || *end != '\0' || v < lo || v > hi)
    throw std::runtime_error(std::string("Invalid value for ") + flag + ": " +
                             s);
  return v;
}

std::uint64_t parse_u64(const std::string &s, const char *flag) {
  if (s.empty() || s.find('-') != std::string::npos)
    throw std::runtime_error(std::string("Invalid value for ") + flag + ": " +
                             s);
  errno = 0;
  char *end = nullptr;
  unsigned long long v = std::strtoull(s.c_str(), &end, 10);
  if (errno != 0 || !end || *end != '\0')
    throw std::runtime_error(std::string("Invalid value for ") + flag + ": " +
                             s);
  return static_cast<std::uint64_t>(v);
}

} // namespace dncbench::cli
