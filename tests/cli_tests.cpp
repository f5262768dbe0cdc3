// Command-line value parsing tests for dncbench
#include "dncbench/cli.hpp"
#include "dncbench/core.hpp"

#include <climits>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace dncbench;

static void require(bool cond, const char *msg) {
  if (!cond) {
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
  }
}

template <class Fn> static bool rejects(Fn &&fn) {
  try {
    fn();
  } catch (const std::runtime_error &) {
    return true;
  }
  return false;
}

static void test_split_list() {
  auto v = cli::split_list(" merge, quick ,,");
  require(v.size() == 2 && v[0] == "merge" && v[1] == "quick", "split/trim");
  require(cli::split_list("").empty(), "empty list");
}

static void test_size_expressions() {
  require(cli::parse_size_expr("5000") == 5000, "plain integer");
  require(cli::parse_size_expr("1e4") == 10000, "e-notation");
  require(cli::parse_size_expr("5k") == 5000, "k suffix");
  require(cli::parse_size_expr("1.5M") == 1500000, "m suffix");
  require(cli::parse_size_expr("0") == 0, "zero");

  require(rejects([] { (void)cli::parse_size_expr(""); }), "empty size");
  require(rejects([] { (void)cli::parse_size_expr("-5"); }), "negative size");
  require(rejects([] { (void)cli::parse_size_expr(" -5"); }),
          "negative size after whitespace");
  require(rejects([] { (void)cli::parse_size_expr("abc"); }), "garbage size");
  require(rejects([] { (void)cli::parse_size_expr("k"); }), "bare suffix");
  require(rejects([] { (void)cli::parse_size_expr("1e30"); }),
          "size beyond size_t");
  require(rejects([] { (void)cli::parse_size_expr("99999999999999999999"); }),
          "integer beyond size_t");
  require(rejects([] { (void)cli::parse_size_expr("inf"); }), "infinite size");
  require(rejects([] { (void)cli::parse_size_expr("nan"); }), "nan size");
}

static void test_int_ranges() {
  require(cli::parse_int("5", "--runs", 1, INT_MAX) == 5, "runs value");
  require(cli::parse_int(std::to_string(INT_MAX), "--runs", 1, INT_MAX) ==
              INT_MAX,
          "runs at INT_MAX");
  require(rejects([] { (void)cli::parse_int("4294967297", "--runs", 1, INT_MAX); }),
          "runs beyond int rejected, not wrapped");
  require(rejects([] { (void)cli::parse_int("0", "--runs", 1, INT_MAX); }),
          "runs = 0 rejected");
  require(rejects([] { (void)cli::parse_int("3x", "--runs", 1, INT_MAX); }),
          "trailing junk rejected");
  require(rejects([] {
            (void)cli::parse_int("99999999999999999999", "--runs", 1, INT_MAX);
          }),
          "long long overflow rejected");

  require(cli::parse_int("1024", "--threads", 0, kMaxThreads) == 1024,
          "threads at cap");
  require(rejects([] {
            (void)cli::parse_int("99999999999", "--threads", 0, kMaxThreads);
          }),
          "huge thread count rejected");
  require(rejects([] { (void)cli::parse_int("100000", "--threads", 0, kMaxThreads); }),
          "threads above cap rejected");
  require(rejects([] { (void)cli::parse_int("-1", "--threads", 0, kMaxThreads); }),
          "negative threads rejected");

  try {
    (void)cli::parse_int("4294967297", "--runs", 1, INT_MAX);
  } catch (const std::runtime_error &e) {
    require(std::string(e.what()) == "Invalid value for --runs: 4294967297",
            "error names flag and value");
  }
}

static void test_seed() {
  require(cli::parse_u64("42", "--seed") == 42, "seed value");
  require(cli::parse_u64("18446744073709551615", "--seed") ==
              18446744073709551615ull,
          "seed at uint64 max");
  require(rejects([] { (void)cli::parse_u64("-1", "--seed"); }),
          "negative seed rejected");
  require(rejects([] { (void)cli::parse_u64("18446744073709551616", "--seed"); }),
          "seed overflow rejected");
}

int main() {
  try {
    test_split_list();
    test_size_expressions();
    test_int_ranges();
    test_seed();
  } catch (const std::exception &e) {
    std::cerr << "Unhandled exception: " << e.what() << "\n";
    return 2;
  }
  std::cout << "OK\n";
  return 0;
}
