// dncbench core library
// Runs merge/quick sort configurations over generated datasets

#include "dncbench/core.hpp"
#include "dncbench/log.hpp"
#include "dncbench_text.hpp"

#include <algorithm>
#include <exception>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#include <tbb/parallel_for.h>

namespace dncbench {

std::string_view algorithm_name(Algorithm a) {
  switch (a) {
  case Algorithm::merge:
    return "merge";
  case Algorithm::quick:
    return "quick";
  }
  return "unknown";
}

std::optional<Algorithm> parse_algorithm(std::string s) {
  s = detail::to_lower(std::move(s));
  if (s == "merge" || s == "merge_sort" || s == "mergesort")
    return Algorithm::merge;
  if (s == "quick" || s == "quick_sort" || s == "quicksort")
    return Algorithm::quick;
  return std::nullopt;
}

Algorithm algorithm_from_name(const std::string &s) {
  if (auto a = parse_algorithm(s))
    return *a;
  throw std::invalid_argument("Unknown algorithm: " + s);
}

std::vector<std::string> list_algorithms() { return {"merge", "quick"}; }

namespace {

// One (algorithm, pivot, dataset, size) cell of the benchmark grid
struct Job {
  Algorithm algo;
  std::optional<PivotStrategy> pivot;
  Dataset dataset;
  std::size_t size;
};

struct JobOutcome {
  std::vector<RunRecord> runs;
  std::optional<SummaryRow> summary;
  std::optional<std::string> failure;
};

std::string job_label(const Job &job) {
  std::string s(algorithm_name(job.algo));
  if (job.pivot) {
    s += '(';
    s += pivot_name(*job.pivot);
    s += ')';
  }
  return s;
}

std::string head_of(const Seq &v, std::size_t n = 10) {
  std::ostringstream os;
  os << '[';
  for (std::size_t i = 0; i < std::min(n, v.size()); ++i) {
    if (i)
      os << ", ";
    os << v[i];
  }
  if (v.size() > n)
    os << ", ...";
  os << ']';
  return os.str();
}

const SortOverride *find_override(const CoreConfig &cfg, Algorithm a) {
  for (const auto &o : cfg.overrides)
    if (o.algorithm == a)
      return &o;
  return nullptr;
}

JobOutcome run_job(const Job &job, const CoreConfig &cfg) {
  JobOutcome out;
  const SortOverride *ov = find_override(cfg, job.algo);
  std::vector<Metrics> metrics;
  metrics.reserve(static_cast<std::size_t>(cfg.runs));
  const std::string label = job_label(job);
  const std::string_view dname = dataset_name(job.dataset);

  for (int r = 0; r < cfg.runs; ++r) {
    {
      std::ostringstream os;
      os << "Running " << label << " on " << dname << " size=" << job.size
         << " run=" << (r + 1) << "/" << cfg.runs;
      log::info(os.str());
    }
    const std::uint64_t run_seed =
        cfg.seed + static_cast<std::uint64_t>(r) * 1000u;
    const Seq input = generate(job.size, job.dataset, run_seed);

    Seq sorted;
    Metrics m;
    if (ov) {
      m = measure([ov](const Seq &s, auto &...) { return ov->run(s); }, input,
                  cfg.instrument, sorted);
    } else if (job.algo == Algorithm::merge) {
      m = measure(
          [](const Seq &s, auto &...sink) { return merge_sort(s, sink...); },
          input, cfg.instrument, sorted);
    } else {
      const PivotStrategy p = *job.pivot;
      m = measure(
          [p, run_seed](const Seq &s, auto &...sink) {
            return quick_sort(s, p, sink..., run_seed);
          },
          input, cfg.instrument, sorted);
    }

    Seq expected = input;
    std::sort(expected.begin(), expected.end());
    if (sorted != expected) {
      std::ostringstream os;
      os << "Correctness check failed for " << label << " on " << dname
         << " size=" << job.size << " run=" << (r + 1);
      log::error(os.str());
      log::error("Expected: " + head_of(expected));
      log::error("Got: " + head_of(sorted));
      out.runs.clear();
      out.failure = os.str();
      return out;
    }

    RunRecord rec;
    rec.algorithm = std::string(algorithm_name(job.algo));
    if (job.pivot)
      rec.pivot = std::string(pivot_name(*job.pivot));
    rec.dataset = std::string(dname);
    rec.size = job.size;
    rec.run = r + 1;
    rec.metrics = m;
    rec.seed = cfg.seed;
    out.runs.push_back(std::move(rec));
    metrics.push_back(m);
  }

  SummaryRow row;
  row.algorithm = std::string(algorithm_name(job.algo));
  if (job.pivot)
    row.pivot = std::string(pivot_name(*job.pivot));
  row.dataset = std::string(dname);
  row.size = job.size;
  row.stats = aggregate(metrics, cfg.instrument);
  out.summary = std::move(row);
  return out;
}

JobOutcome run_job_guarded(const Job &job, const CoreConfig &cfg) {
  try {
    return run_job(job, cfg);
  } catch (const std::exception &e) {
    std::ostringstream os;
    os << "Error running benchmark: " << job_label(job) << ", "
       << dataset_name(job.dataset) << ", " << job.size << ": " << e.what();
    log::error(os.str());
    JobOutcome out;
    out.failure = os.str();
    return out;
  }
}

void validate(const CoreConfig &cfg) {
  if (cfg.runs < 1)
    throw std::invalid_argument("runs must be >= 1");
  if (cfg.algorithms.empty())
    throw std::invalid_argument("no algorithms selected");
  if (cfg.datasets.empty())
    throw std::invalid_argument("no datasets selected");
  if (cfg.sizes.empty())
    throw std::invalid_argument("no sizes selected");
  if (cfg.threads < 0 || cfg.threads > kMaxThreads)
    throw std::invalid_argument("threads must be in [0, " +
                                std::to_string(kMaxThreads) + "]");
  for (const auto &o : cfg.overrides)
    if (!o.run)
      throw std::invalid_argument("sort override for " +
                                  std::string(algorithm_name(o.algorithm)) +
                                  " has no implementation");
  for (Algorithm a : cfg.algorithms)
    if (algorithm_name(a) == "unknown")
      throw std::invalid_argument("Unknown algorithm: " +
                                  std::to_string(static_cast<int>(a)));
  for (Dataset d : cfg.datasets)
    if (dataset_name(d) == "unknown")
      throw std::invalid_argument("Unknown dataset type: " +
                                  std::to_string(static_cast<int>(d)));
  bool wants_quick = std::find(cfg.algorithms.begin(), cfg.algorithms.end(),
                               Algorithm::quick) != cfg.algorithms.end();
  if (wants_quick && cfg.pivots.empty())
    throw std::invalid_argument("quick sort selected without a pivot strategy");
  for (PivotStrategy p : cfg.pivots)
    if (pivot_name(p) == "unknown")
      throw std::invalid_argument("Unknown pivot strategy: " +
                                  std::to_string(static_cast<int>(p)));
}

std::vector<Job> build_jobs(const CoreConfig &cfg) {
  std::vector<Job> jobs;
  for (Algorithm a : cfg.algorithms) {
    std::vector<std::optional<PivotStrategy>> pivots;
    if (a == Algorithm::quick)
      pivots.assign(cfg.pivots.begin(), cfg.pivots.end());
    else
      pivots.emplace_back(std::nullopt);
    for (const auto &p : pivots)
      for (Dataset d : cfg.datasets)
        for (std::size_t n : cfg.sizes)
          jobs.push_back(Job{a, p, d, n});
  }
  return jobs;
}

} // namespace

BatchResult run_benchmark(const CoreConfig &cfg) {
  validate(cfg);
  const std::vector<Job> jobs = build_jobs(cfg);
  std::vector<JobOutcome> outcomes(jobs.size());

  if (cfg.threads > 1) {
    // Each job owns its generators, so concurrent jobs stay reproducible.
    tbb::global_control ctl(tbb::global_control::max_allowed_parallelism,
                            static_cast<std::size_t>(cfg.threads));
    tbb::parallel_for(tbb::blocked_range<std::size_t>(0, jobs.size()),
                      [&](const tbb::blocked_range<std::size_t> &r) {
                        for (std::size_t i = r.begin(); i != r.end(); ++i)
                          outcomes[i] = run_job_guarded(jobs[i], cfg);
                      });
  } else {
    for (std::size_t i = 0; i < jobs.size(); ++i)
      outcomes[i] = run_job_guarded(jobs[i], cfg);
  }

  BatchResult out;
  out.instrumented = cfg.instrument;
  for (auto &o : outcomes) {
    if (o.failure) {
      out.failed = true;
      out.failures.push_back(std::move(*o.failure));
      continue;
    }
    for (auto &rec : o.runs)
      out.runs.push_back(std::move(rec));
    if (o.summary)
      out.summary.push_back(std::move(*o.summary));
  }
  return out;
}

} // namespace dncbench
