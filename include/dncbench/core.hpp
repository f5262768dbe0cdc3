// Public API for the dncbench benchmark core.
// Runs a batch of sort configurations in-process and formats the results
// without any CLI parsing or file I/O.

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dncbench/datasets.hpp"
#include "dncbench/metrics.hpp"
#include "dncbench/sorts.hpp"

namespace dncbench {

enum class Algorithm : int { merge = 0, quick = 1 };

std::string_view algorithm_name(Algorithm a);
std::optional<Algorithm> parse_algorithm(std::string s);

// Throws std::invalid_argument for unknown names.
Algorithm algorithm_from_name(const std::string &s);

std::vector<std::string> list_algorithms();

// Replacement implementation for one algorithm, run for every pivot
// configuration of it. Output is verified against std::sort like the built-in
// sorts; operation counts stay zero.
struct SortOverride {
  Algorithm algorithm;
  std::function<Seq(const Seq &)> run;
};

inline constexpr int kMaxThreads = 1024;

struct CoreConfig {
  std::vector<Algorithm> algorithms{Algorithm::merge, Algorithm::quick};
  std::vector<PivotStrategy> pivots{PivotStrategy::random}; // quick only
  std::vector<Dataset> datasets = all_datasets();
  std::vector<std::size_t> sizes{1000, 5000, 10000, 50000};
  int runs = 5;
  std::uint64_t seed = 42;  // run r uses seed + r*1000
  bool instrument = false;  // count comparisons and swaps
  int threads = 0;          // >1 runs configurations concurrently
  std::vector<SortOverride> overrides;
};

// One timed run; immutable once produced.
struct RunRecord {
  std::string algorithm;
  std::optional<std::string> pivot; // unset for merge
  std::string dataset;
  std::size_t size = 0;
  int run = 0; // 1-based
  Metrics metrics;
  std::uint64_t seed = 0; // batch seed
};

struct SummaryRow {
  std::string algorithm;
  std::optional<std::string> pivot;
  std::string dataset;
  std::size_t size = 0;
  Summary stats;
};

struct BatchResult {
  bool instrumented = false;
  std::vector<RunRecord> runs;     // in configuration order
  std::vector<SummaryRow> summary; // one per successful configuration
  bool failed = false;
  std::vector<std::string> failures;
};

// Execute every configuration of `cfg`. A configuration whose output differs
// from std::sort (or which throws) is discarded and recorded in `failures`;
// the remaining configurations still run. Throws std::invalid_argument for
// an invalid config (runs < 1, empty algorithm/dataset/size lists, threads
// outside [0, 1024], an override without a callable).
BatchResult run_benchmark(const CoreConfig &cfg);

// "<algorithm>_<pivot or N/A>_<dataset>_<size>"
std::string summary_key(const SummaryRow &row);

// Formatting helpers (pure; no file I/O)
std::string to_csv(const BatchResult &r, bool with_header = true);
std::string to_json(const BatchResult &r, bool pretty = true);
std::string to_jsonl(const BatchResult &r);

} // namespace dncbench
