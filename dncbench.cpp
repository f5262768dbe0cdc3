#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <sys/utsname.h>

#include "dncbench/cli.hpp"
#include "dncbench/core.hpp"
#include "dncbench/log.hpp"

enum class OutFmt : int { csv = 0, json = 1, jsonl = 2, none = 3 };

// Command-line options
struct Options {
  dncbench::CoreConfig core;              // algorithms/datasets/sizes/...
  std::string outdir = "results";         // bench_results.csv, summary.json
  dncbench::log::Level log_level = dncbench::log::Level::info;
  OutFmt format = OutFmt::csv;            // stdout echo
  bool no_file = false;                   // suppress writing results files
  bool list = false;                      // list choices and exit
  bool print_build = false;               // show compiler/flags used
};

static void print_usage(const char *argv0) {
  std::cerr << "Usage: " << argv0
            << " [--algorithms merge,quick] [--pivot first,last,"
               "median_of_three,random]\n"
               "       [--datasets sorted,reverse,random,nearly_sorted,"
               "duplicates_heavy]\n"
               "       [--sizes 1000,5k,1e4] [--runs k] [--seed s] "
               "[--instrument] [--threads K]\n"
               "       [--outdir DIR] [--log-level DEBUG|INFO|WARNING|ERROR]\n"
               "       [--format csv|json|jsonl|none] [--no-file] [--list] "
               "[--print-build]\n";
  std::cerr << "       --pivot applies to quick sort; several strategies run "
               "as separate configurations\n";
  std::cerr << "       --threads K (>1 runs configurations concurrently)\n";
  std::cerr << "       --no-file (print to stdout only; no results files)\n";
}

static Options parse_args(int argc, char **argv) {
  Options opt;
  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];
    auto get_value_inline =
        [&](std::string_view arg,
            std::string_view key) -> std::optional<std::string> {
      if (arg.size() > key.size() + 1 && arg.substr(0, key.size()) == key &&
          arg[key.size()] == '=') {
        return std::string(arg.substr(key.size() + 1));
      }
      return std::nullopt;
    };
    auto need_value = [&](std::string_view flag) {
      if (i + 1 >= argc) {
        throw std::runtime_error(std::string("Missing value for ") +
                                 std::string(flag));
      }
      return std::string(argv[++i]);
    };
    auto value_of = [&](std::string_view key) {
      if (auto v = get_value_inline(a, key))
        return *v;
      return need_value(key);
    };
    auto is = [&](std::string_view key) {
      return a == key || (a.size() > key.size() && a.substr(0, key.size()) == key &&
                          a[key.size()] == '=');
    };

    if (is("--algorithms") || is("--algo")) {
      std::string v = value_of(a.substr(0, a.find('=')));
      opt.core.algorithms.clear();
      for (const auto &s : dncbench::cli::split_list(v)) {
        auto al = dncbench::parse_algorithm(s);
        if (!al)
          throw std::runtime_error("Invalid algorithm: " + s);
        opt.core.algorithms.push_back(*al);
      }
    } else if (is("--pivot")) {
      std::string v = value_of("--pivot");
      opt.core.pivots.clear();
      for (const auto &s : dncbench::cli::split_list(v)) {
        auto p = dncbench::parse_pivot_strategy(s);
        if (!p)
          throw std::runtime_error("Invalid --pivot: " + s);
        opt.core.pivots.push_back(*p);
      }
    } else if (is("--datasets") || is("--dataset")) {
      std::string v = value_of(a.substr(0, a.find('=')));
      opt.core.datasets.clear();
      for (const auto &s : dncbench::cli::split_list(v)) {
        auto d = dncbench::parse_dataset(s);
        if (!d)
          throw std::runtime_error("Invalid dataset: " + s);
        opt.core.datasets.push_back(*d);
      }
    } else if (is("--sizes") || is("--size")) {
      std::string v = value_of(a.substr(0, a.find('=')));
      opt.core.sizes.clear();
      for (const auto &s : dncbench::cli::split_list(v))
        opt.core.sizes.push_back(dncbench::cli::parse_size_expr(s));
    } else if (is("--runs") || a == "-r") {
      std::string v = a == "-r" ? need_value(a) : value_of("--runs");
      opt.core.runs = static_cast<int>(dncbench::cli::parse_int(
          v, "--runs", 1, std::numeric_limits<int>::max()));
    } else if (is("--seed")) {
      std::string v = value_of("--seed");
      opt.core.seed = dncbench::cli::parse_u64(v, "--seed");
    } else if (a == "--instrument") {
      opt.core.instrument = true;
    } else if (is("--threads")) {
      std::string v = value_of("--threads");
      opt.core.threads = static_cast<int>(dncbench::cli::parse_int(
          v, "--threads", 0, dncbench::kMaxThreads));
    } else if (is("--outdir")) {
      opt.outdir = value_of("--outdir");
    } else if (is("--log-level")) {
      std::string v = value_of("--log-level");
      auto l = dncbench::log::parse_level(v);
      if (!l)
        throw std::runtime_error(
            "Invalid --log-level (DEBUG|INFO|WARNING|ERROR): " + v);
      opt.log_level = *l;
    } else if (is("--format")) {
      std::string v = value_of("--format");
      if (v == "csv")
        opt.format = OutFmt::csv;
      else if (v == "json")
        opt.format = OutFmt::json;
      else if (v == "jsonl")
        opt.format = OutFmt::jsonl;
      else if (v == "none")
        opt.format = OutFmt::none;
      else
        throw std::runtime_error("Invalid --format (csv|json|jsonl|none): " +
                                 v);
    } else if (a == "--no-file") {
      opt.no_file = true;
    } else if (a == "--list") {
      opt.list = true;
    } else if (a == "--print-build") {
      opt.print_build = true;
    } else if (a == "--help" || a == "-h") {
      print_usage(argv[0]);
      std::exit(0);
    } else {
      std::cerr << "Unknown argument: " << a << "\n";
      print_usage(argv[0]);
      std::exit(1);
    }
  }
  return opt;
}

#ifdef DNCBENCH_CXX
static const char *built_cxx = DNCBENCH_CXX;
#else
static const char *built_cxx = "c++";
#endif
#ifdef DNCBENCH_CXXFLAGS
static const char *built_cxxflags = DNCBENCH_CXXFLAGS;
#else
static const char *built_cxxflags = "-O2 -std=c++20";
#endif

static std::optional<std::string> git_commit() {
  FILE *p = popen("git rev-parse HEAD 2>/dev/null", "r");
  if (!p)
    return std::nullopt;
  char buf[128];
  std::string out;
  while (std::fgets(buf, sizeof(buf), p))
    out += buf;
  int rc = pclose(p);
  while (!out.empty() && (out.back() == '\n' || out.back() == '\r'))
    out.pop_back();
  if (rc != 0 || out.empty())
    return std::nullopt;
  return out;
}

static void log_session_banner() {
  namespace log = dncbench::log;
  log::info(std::string(80, '='));
  log::info("Benchmark session started");
  log::info(std::string("Compiler: ") + built_cxx + " " + __VERSION__);
  struct utsname u {};
  if (uname(&u) == 0) {
    log::info(std::string("Platform: ") + u.sysname + " " + u.release);
    log::info(std::string("Architecture: ") + u.machine);
  }
  if (auto c = git_commit())
    log::info("Git commit: " + *c);
  log::info(std::string(80, '='));
}

// Appends run rows; writes the header only when the file is new or empty.
static bool append_results_csv(const std::filesystem::path &p,
                               const dncbench::BatchResult &r) {
  namespace fs = std::filesystem;
  std::error_code ec;
  bool fresh = !fs::exists(p, ec) || fs::file_size(p, ec) == 0;
  std::ofstream f(p, std::ios::out | std::ios::app);
  if (!f) {
    dncbench::log::error("Failed to open results file: " + p.string());
    return false;
  }
  f << dncbench::to_csv(r, fresh);
  return static_cast<bool>(f);
}

static bool write_summary_json(const std::filesystem::path &p,
                               const dncbench::BatchResult &r) {
  std::ofstream f(p);
  if (!f) {
    dncbench::log::error("Failed to open summary file: " + p.string());
    return false;
  }
  f << dncbench::to_json(r, true);
  return static_cast<bool>(f);
}

int main(int argc, char **argv) {
  namespace fs = std::filesystem;
  namespace log = dncbench::log;
  try {
    Options opt = parse_args(argc, argv);
    if (opt.print_build) {
      std::cout << "CXX=" << built_cxx << "\n"
                << "CXXFLAGS=" << built_cxxflags << "\n";
      return 0;
    }
    if (opt.list) {
      std::cout << "algorithms:";
      for (const auto &n : dncbench::list_algorithms())
        std::cout << ' ' << n;
      std::cout << "\npivots:";
      for (auto n : dncbench::all_pivot_names())
        std::cout << ' ' << n;
      std::cout << "\ndatasets:";
      for (auto n : dncbench::all_dataset_names())
        std::cout << ' ' << n;
      std::cout << "\n";
      return 0;
    }

    log::set_level(opt.log_level);
    if (!opt.no_file) {
      std::error_code ec;
      fs::create_directories(opt.outdir, ec);
      if (ec)
        throw std::runtime_error("Cannot create output directory '" +
                                 opt.outdir + "': " + ec.message());
      const fs::path lp = fs::path(opt.outdir) / "bench.log";
      if (!log::open_file(lp.string()))
        log::warning("Failed to open log file: " + lp.string());
    }
    log_session_banner();

    dncbench::BatchResult r = dncbench::run_benchmark(opt.core);

    switch (opt.format) {
    case OutFmt::csv:
      std::cout << dncbench::to_csv(r, true);
      break;
    case OutFmt::json:
      std::cout << dncbench::to_json(r, true);
      break;
    case OutFmt::jsonl:
      std::cout << dncbench::to_jsonl(r);
      break;
    case OutFmt::none:
      break;
    }

    if (!opt.no_file && !r.runs.empty()) {
      const fs::path csvp = fs::path(opt.outdir) / "bench_results.csv";
      const fs::path jsp = fs::path(opt.outdir) / "summary.json";
      bool ok = append_results_csv(csvp, r);
      ok = write_summary_json(jsp, r) && ok;
      if (ok)
        log::info("Results saved to " + csvp.string() + " and " +
                  jsp.string());
    }

    int rc = 0;
    if (r.failed) {
      log::error("Benchmark failed due to correctness check failures (" +
                 std::to_string(r.failures.size()) + " configuration(s))");
      rc = 1;
    } else {
      log::info("Benchmark completed successfully");
    }
    log::close_file();
    return rc;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
