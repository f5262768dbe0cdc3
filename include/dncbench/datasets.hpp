// Synthetic input generation for the benchmark harness

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "dncbench/sorts.hpp"

namespace dncbench {

// Dataset shapes supported by the generator
enum class Dataset : int {
  sorted = 0,
  reverse = 1,
  random = 2,
  nearly_sorted = 3,
  duplicates_heavy = 4,
};

// Output-friendly dataset names
std::string_view dataset_name(Dataset d);
const std::vector<std::string_view> &all_dataset_names();
std::vector<Dataset> all_datasets();

std::optional<Dataset> parse_dataset(std::string s);

// Throws std::invalid_argument for unknown names.
Dataset dataset_from_name(const std::string &s);

// sorted:           0, 1, ..., size-1
// reverse:          size-1, ..., 0
// random:           uniform in [0, size*10]
// nearly_sorted:    sorted, then max(1, size/100) random pair swaps
// duplicates_heavy: uniform in [0, max(1, size/10) - 1]
// Deterministic for a fixed seed; default_seed() is used when none is given.
Seq generate(std::size_t size, Dataset kind,
             std::optional<std::uint64_t> seed = std::nullopt);
Seq generate(std::size_t size, Dataset kind, std::mt19937_64 &rng);

} // namespace dncbench
