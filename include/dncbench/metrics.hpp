// Per-run measurements and their aggregation

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "dncbench/sorts.hpp"

namespace dncbench {

struct Metrics {
  double time_s = 0.0;
  std::uint64_t peak_mem_bytes = 0;
  std::uint64_t comparisons = 0;
  std::uint64_t swaps = 0;
};

struct Summary {
  double time_mean_s = 0.0;
  double time_std_s = 0.0;
  double time_best_s = 0.0;
  double time_worst_s = 0.0;
  double memory_mean_bytes = 0.0;
  double memory_std_bytes = 0.0;
  std::uint64_t memory_peak_bytes = 0;
  std::size_t runs = 0;
  // Present only when the runs were instrumented
  std::optional<double> comparisons_mean;
  std::optional<double> comparisons_std;
  std::optional<double> swaps_mean;
  std::optional<double> swaps_std;
};

// Heap bytes currently allocated by the calling thread (net of frees).
std::int64_t thread_live_bytes();

// Tracks the calling thread's heap high-water mark from construction on.
// Counts come from the global operator new/delete replacements.
class AllocScope {
public:
  AllocScope();
  AllocScope(const AllocScope &) = delete;
  AllocScope &operator=(const AllocScope &) = delete;

  // Bytes allocated above the live level seen at construction.
  std::uint64_t peak_bytes() const;

private:
  std::int64_t base_;
};

// Times a single sort call. `fn` must be callable as `fn(input)` and as
// `fn(input, Instrument&)`; the second form is used when `instrument` is set.
// The sorted output is moved into `out`.
template <class Fn>
Metrics measure(Fn &&fn, const Seq &input, bool instrument, Seq &out) {
  using Clock = std::chrono::steady_clock;
  Metrics m;
  CountingInstrument counter;
  Seq result;
  AllocScope mem;
  auto t0 = Clock::now();
  if (instrument)
    result = fn(input, counter);
  else
    result = fn(input);
  auto t1 = Clock::now();
  m.peak_mem_bytes = mem.peak_bytes();
  m.time_s = std::chrono::duration<double>(t1 - t0).count();
  if (instrument) {
    m.comparisons = counter.counts().comparisons;
    m.swaps = counter.counts().swaps;
  }
  out = std::move(result);
  return m;
}

// Mean, sample standard deviation (0 for a single run), best and worst.
// An empty list yields a default Summary with runs == 0.
Summary aggregate(const std::vector<Metrics> &runs, bool instrumented);

} // namespace dncbench
