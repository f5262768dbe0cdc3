// Command-line value parsing shared by the dncbench executable and its tests.
// Every helper throws std::runtime_error naming the offending flag or value.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace dncbench::cli {

// "a, b,,c" -> {"a", "b", "c"}
std::vector<std::string> split_list(const std::string &s);

// Plain integers, e-notation and k/m suffixes: "5000", "1e4", "5k", "1.5m".
// Rejects negatives and values that do not fit in std::size_t.
std::size_t parse_size_expr(const std::string &s);

// Base-10 integer in [lo, hi].
long long parse_int(const std::string &s, const char *flag, long long lo,
                    long long hi);

// Base-10 unsigned 64-bit integer; a leading '-' is rejected.
std::uint64_t parse_u64(const std::string &s, const char *flag);

} // namespace dncbench::cli
