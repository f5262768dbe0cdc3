#include "dncbench/datasets.hpp"
#include "dncbench_text.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <utility>

namespace dncbench {

static constexpr std::array<std::string_view, 5> kDatasetNames{
    "sorted", "reverse", "random", "nearly_sorted", "duplicates_heavy"};

std::string_view dataset_name(Dataset d) {
  int i = static_cast<int>(d);
  if (i < 0 || i >= static_cast<int>(kDatasetNames.size()))
    return "unknown";
  return kDatasetNames[static_cast<std::size_t>(i)];
}

const std::vector<std::string_view> &all_dataset_names() {
  static const std::vector<std::string_view> v(kDatasetNames.begin(),
                                               kDatasetNames.end());
  return v;
}

std::vector<Dataset> all_datasets() {
  return {Dataset::sorted, Dataset::reverse, Dataset::random,
          Dataset::nearly_sorted, Dataset::duplicates_heavy};
}

std::optional<Dataset> parse_dataset(std::string s) {
  s = detail::to_lower(std::move(s));
  if (s == "sorted")
    return Dataset::sorted;
  if (s == "reverse" || s == "reversed")
    return Dataset::reverse;
  if (s == "random")
    return Dataset::random;
  if (s == "nearly_sorted" || s == "nearly-sorted")
    return Dataset::nearly_sorted;
  if (s == "duplicates_heavy" || s == "duplicates-heavy" || s == "dups")
    return Dataset::duplicates_heavy;
  return std::nullopt;
}

Dataset dataset_from_name(const std::string &s) {
  if (auto d = parse_dataset(s))
    return *d;
  throw std::invalid_argument("Unknown dataset type: " + s);
}

Seq generate(std::size_t size, Dataset kind, std::mt19937_64 &rng) {
  Seq v;
  v.resize(size);
  const auto n = static_cast<std::int64_t>(size);

  switch (kind) {
  case Dataset::sorted:
    for (std::size_t i = 0; i < size; ++i)
      v[i] = static_cast<std::int64_t>(i);
    return v;

  case Dataset::reverse:
    for (std::size_t i = 0; i < size; ++i)
      v[i] = n - 1 - static_cast<std::int64_t>(i);
    return v;

  case Dataset::random: {
    std::uniform_int_distribution<std::int64_t> d(0, n * 10);
    for (std::size_t i = 0; i < size; ++i)
      v[i] = d(rng);
    return v;
  }

  case Dataset::nearly_sorted: {
    for (std::size_t i = 0; i < size; ++i)
      v[i] = static_cast<std::int64_t>(i);
    if (size == 0)
      return v;
    const std::size_t swaps = std::max<std::size_t>(1, size / 100);
    std::uniform_int_distribution<std::size_t> d(0, size - 1);
    for (std::size_t k = 0; k < swaps; ++k) {
      std::size_t a = d(rng), b = d(rng);
      std::swap(v[a], v[b]);
    }
    return v;
  }

  case Dataset::duplicates_heavy: {
    const std::int64_t distinct = std::max<std::int64_t>(1, n / 10);
    std::uniform_int_distribution<std::int64_t> d(0, distinct - 1);
    for (std::size_t i = 0; i < size; ++i)
      v[i] = d(rng);
    return v;
  }
  }
  throw std::invalid_argument("Unknown dataset type: " +
                              std::to_string(static_cast<int>(kind)));
}

Seq generate(std::size_t size, Dataset kind,
             std::optional<std::uint64_t> seed) {
  std::mt19937_64 rng(seed.value_or(default_seed()));
  return generate(size, kind, rng);
}

} // namespace dncbench
