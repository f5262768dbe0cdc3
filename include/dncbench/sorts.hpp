// Divide-and-conquer sorts with optional operation counting.
// Both algorithms sort a private copy; the caller's sequence is never touched.

#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace dncbench {

using Seq = std::vector<std::int64_t>;

// Pivot selection for quick_sort
enum class PivotStrategy : int {
  first = 0,
  last = 1,
  median_of_three = 2,
  random = 3,
};

std::string_view pivot_name(PivotStrategy p);
const std::vector<std::string_view> &all_pivot_names();

// Accepts "median_of_three", "median-of-three" and "median3".
std::optional<PivotStrategy> parse_pivot_strategy(std::string s);

// Throws std::invalid_argument for unknown names.
PivotStrategy pivot_from_name(const std::string &s);

enum class OpKind : int { comparison = 0, swap = 1 };

// Receives one event per counted operation. Implementations must not throw.
class Instrument {
public:
  virtual ~Instrument() = default;
  virtual void record(OpKind op) noexcept = 0;
};

struct OpCounts {
  std::uint64_t comparisons = 0;
  std::uint64_t swaps = 0;
};

class CountingInstrument final : public Instrument {
public:
  void record(OpKind op) noexcept override {
    if (op == OpKind::comparison)
      ++counts_.comparisons;
    else
      ++counts_.swaps;
  }
  const OpCounts &counts() const { return counts_; }
  void reset() { counts_ = OpCounts{}; }

private:
  OpCounts counts_;
};

// Fixed seed used when the caller does not supply one.
std::uint64_t default_seed();

// Stable merge sort. Emits only comparison events.
Seq merge_sort(const Seq &in);
Seq merge_sort(const Seq &in, Instrument &sink);

// Lomuto quick sort. `seed` only matters for PivotStrategy::random.
// Throws std::invalid_argument if `pivot` is not a known strategy.
Seq quick_sort(const Seq &in, PivotStrategy pivot,
               std::optional<std::uint64_t> seed = std::nullopt);
Seq quick_sort(const Seq &in, PivotStrategy pivot, Instrument &sink,
               std::optional<std::uint64_t> seed = std::nullopt);

// Variants drawing random pivots from a caller-owned engine.
Seq quick_sort(const Seq &in, PivotStrategy pivot, std::mt19937_64 &rng);
Seq quick_sort(const Seq &in, PivotStrategy pivot, Instrument &sink,
               std::mt19937_64 &rng);

} // namespace dncbench
