#include "dncbench/metrics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace dncbench {

static double mean_of(const std::vector<double> &v) {
  if (v.empty())
    return 0.0;
  return std::accumulate(v.begin(), v.end(), 0.0) /
         static_cast<double>(v.size());
}

// Sample standard deviation (n - 1); zero below two samples.
static double stdev_of(const std::vector<double> &v, double mean) {
  if (v.size() < 2)
    return 0.0;
  double var = 0.0;
  for (double x : v) {
    double d = x - mean;
    var += d * d;
  }
  var /= static_cast<double>(v.size() - 1);
  return std::sqrt(var);
}

Summary aggregate(const std::vector<Metrics> &runs, bool instrumented) {
  Summary s;
  if (runs.empty())
    return s;

  std::vector<double> times, mems, cmps, swps;
  times.reserve(runs.size());
  mems.reserve(runs.size());
  for (const auto &m : runs) {
    times.push_back(m.time_s);
    mems.push_back(static_cast<double>(m.peak_mem_bytes));
    cmps.push_back(static_cast<double>(m.comparisons));
    swps.push_back(static_cast<double>(m.swaps));
  }

  s.runs = runs.size();
  s.time_mean_s = mean_of(times);
  s.time_std_s = stdev_of(times, s.time_mean_s);
  auto mm = std::minmax_element(times.begin(), times.end());
  s.time_best_s = *mm.first;
  s.time_worst_s = *mm.second;

  s.memory_mean_bytes = mean_of(mems);
  s.memory_std_bytes = stdev_of(mems, s.memory_mean_bytes);
  for (const auto &m : runs)
    s.memory_peak_bytes = std::max(s.memory_peak_bytes, m.peak_mem_bytes);

  if (instrumented) {
    s.comparisons_mean = mean_of(cmps);
    s.comparisons_std = stdev_of(cmps, *s.comparisons_mean);
    s.swaps_mean = mean_of(swps);
    s.swaps_std = stdev_of(swps, *s.swaps_mean);
  }
  return s;
}

} // namespace dncbench
