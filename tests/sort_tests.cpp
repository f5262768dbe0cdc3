// Tests for merge_sort / quick_sort
#include "dncbench/sorts.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using namespace dncbench;

static void require(bool cond, const char *msg) {
  if (!cond) {
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
  }
}

static const PivotStrategy kAllPivots[] = {
    PivotStrategy::first, PivotStrategy::last, PivotStrategy::median_of_three,
    PivotStrategy::random};

static Seq random_seq(std::size_t n, std::uint64_t seed) {
  std::mt19937_64 rng(seed);
  std::uniform_int_distribution<std::int64_t> d(-1000, 1000);
  Seq v(n);
  for (auto &x : v)
    x = d(rng);
  return v;
}

static bool is_permutation_sorted(const Seq &in, const Seq &out) {
  Seq ref = in;
  std::sort(ref.begin(), ref.end());
  return ref == out;
}

static void test_merge_basic() {
  require(merge_sort(Seq{}).empty(), "merge: empty");
  require(merge_sort(Seq{42}) == Seq{42}, "merge: single");
  require(merge_sort(Seq{3, 1, 4, 1, 5, 9, 2, 6, 5}) ==
              (Seq{1, 1, 2, 3, 4, 5, 5, 6, 9}),
          "merge: mixed");
  require(merge_sort(Seq{5, 5, 5, 3, 3, 1}) == (Seq{1, 3, 3, 5, 5, 5}),
          "merge: duplicates");
  require(merge_sort(Seq{5, 4, 3, 2, 1}) == (Seq{1, 2, 3, 4, 5}),
          "merge: reverse");

  Seq big(1000);
  for (std::size_t i = 0; i < big.size(); ++i)
    big[i] = static_cast<std::int64_t>(1000 - i);
  Seq out = merge_sort(big);
  for (std::size_t i = 0; i < out.size(); ++i)
    require(out[i] == static_cast<std::int64_t>(i + 1), "merge: 1000 reverse");

  for (std::size_t n : {10u, 100u, 1000u}) {
    Seq v = random_seq(n, 42);
    require(is_permutation_sorted(v, merge_sort(v)), "merge: random property");
  }
}

static void test_merge_instrumented() {
  CountingInstrument c;
  Seq out = merge_sort(Seq{3, 1, 4, 1, 5}, c);
  require(out == (Seq{1, 1, 3, 4, 5}), "merge instrumented: result");
  require(c.counts().comparisons == 7, "merge instrumented: 7 comparisons");
  require(c.counts().swaps == 0, "merge instrumented: no swaps");

  c.reset();
  Seq v = random_seq(500, 7);
  (void)merge_sort(v, c);
  require(c.counts().comparisons > 0, "merge: comparisons on random input");
  require(c.counts().swaps == 0, "merge never swaps");

  // Already-sorted halves: each merge stops after the left side runs out
  c.reset();
  (void)merge_sort(Seq{1, 2, 3, 4}, c);
  require(c.counts().comparisons == 4, "merge: sorted input comparisons");
}

static void test_quick_basic() {
  for (PivotStrategy p : kAllPivots) {
    const std::string name(pivot_name(p));
    require(quick_sort(Seq{}, p).empty(), ("quick empty: " + name).c_str());
    require(quick_sort(Seq{42}, p) == Seq{42}, ("quick single: " + name).c_str());
    require(quick_sort(Seq{5, 4, 3, 2, 1}, p, 42) == (Seq{1, 2, 3, 4, 5}),
            ("quick reverse: " + name).c_str());
    require(quick_sort(Seq{3, 1, 4, 1, 5, 9, 2, 6, 5}, p, 42) ==
                (Seq{1, 1, 2, 3, 4, 5, 5, 6, 9}),
            ("quick mixed: " + name).c_str());
    require(quick_sort(Seq{5, 5, 5, 3, 3, 1}, p, 42) == (Seq{1, 3, 3, 5, 5, 5}),
            ("quick duplicates: " + name).c_str());
    require(quick_sort(Seq{7, 7, 7, 7}, p, 42) == (Seq{7, 7, 7, 7}),
            ("quick all equal: " + name).c_str());
    require(quick_sort(Seq{-3, 0, -9, 2}, p) == (Seq{-9, -3, 0, 2}),
            ("quick negatives: " + name).c_str());

    Seq big(1000);
    for (std::size_t i = 0; i < big.size(); ++i)
      big[i] = static_cast<std::int64_t>(1000 - i);
    Seq out = quick_sort(big, p, 42);
    bool ok = true;
    for (std::size_t i = 0; i < out.size(); ++i)
      ok = ok && out[i] == static_cast<std::int64_t>(i + 1);
    require(ok, ("quick 1000 reverse: " + name).c_str());

    for (std::size_t n : {10u, 100u, 1000u}) {
      Seq v = random_seq(n, 42);
      require(is_permutation_sorted(v, quick_sort(v, p, 42)),
              ("quick random property: " + name).c_str());
    }
  }
  require(quick_sort(Seq{5, 4, 3, 2, 1}, PivotStrategy::first) ==
              (Seq{1, 2, 3, 4, 5}),
          "quick first without seed");
}

static void test_idempotence_and_non_mutation() {
  const Seq sorted{1, 2, 3, 4, 5, 6, 7, 8};
  require(merge_sort(sorted) == sorted, "merge idempotent");
  for (PivotStrategy p : kAllPivots)
    require(quick_sort(sorted, p, 42) == sorted, "quick idempotent");

  const Seq orig = random_seq(200, 99);
  Seq arg = orig;
  (void)merge_sort(arg);
  require(arg == orig, "merge leaves input untouched");
  for (PivotStrategy p : kAllPivots) {
    CountingInstrument c;
    (void)quick_sort(arg, p, c, 5);
    require(arg == orig, "quick leaves input untouched");
  }
}

static void test_quick_instrumented() {
  CountingInstrument c;
  Seq out = quick_sort(Seq{3, 1, 4, 1, 5}, PivotStrategy::first, c, 42);
  require(out == (Seq{1, 1, 3, 4, 5}), "quick instrumented: result");
  require(c.counts().comparisons > 0, "quick instrumented: comparisons");
  require(c.counts().swaps > 0, "quick instrumented: swaps");

  // first on [1,2,3]: two partitions, 2 + 1 scans, 2 relocations each
  c.reset();
  (void)quick_sort(Seq{1, 2, 3}, PivotStrategy::first, c);
  require(c.counts().comparisons == 3, "first [1,2,3] comparisons");
  require(c.counts().swaps == 4, "first [1,2,3] swaps");

  // at least one swap for every input of length >= 2
  for (PivotStrategy p : kAllPivots) {
    for (const Seq &v : {Seq{1, 2}, Seq{2, 1}, Seq{4, 4}}) {
      c.reset();
      (void)quick_sort(v, p, c, 1);
      require(c.counts().swaps >= 1, "quick swaps >= 1 for n >= 2");
    }
  }
  c.reset();
  (void)quick_sort(Seq{9}, PivotStrategy::median_of_three, c);
  require(c.counts().comparisons == 0 && c.counts().swaps == 0,
          "single element emits nothing");
}

static void test_median_of_three() {
  CountingInstrument c;
  // mid is the median: 2 pivot comparisons + 2 scan comparisons
  (void)quick_sort(Seq{1, 2, 3}, PivotStrategy::median_of_three, c);
  require(c.counts().comparisons == 4, "median3 [1,2,3] comparisons");
  require(c.counts().swaps == 2, "median3 [1,2,3] swaps");

  // left is the median
  c.reset();
  Seq out = quick_sort(Seq{2, 1, 3}, PivotStrategy::median_of_three, c);
  require(out == (Seq{1, 2, 3}), "median3 [2,1,3] result");
  require(c.counts().comparisons == 4, "median3 [2,1,3] comparisons");
  require(c.counts().swaps == 3, "median3 [2,1,3] swaps");

  // Two-element range: mid == left, so mid wins the first branch
  c.reset();
  (void)quick_sort(Seq{2, 1}, PivotStrategy::median_of_three, c);
  require(c.counts().comparisons == 3, "median3 [2,1] comparisons");

  // Same pivot as 'first' here, so the difference is the two extra
  // comparisons of the single partition call.
  c.reset();
  CountingInstrument f;
  (void)quick_sort(Seq{2, 1, 3}, PivotStrategy::first, f);
  (void)quick_sort(Seq{2, 1, 3}, PivotStrategy::median_of_three, c);
  require(c.counts().comparisons == f.counts().comparisons + 2,
          "median3 adds two comparisons per partition");
}

static void test_random_determinism() {
  Seq v = random_seq(2000, 3);
  CountingInstrument a, b;
  Seq r1 = quick_sort(v, PivotStrategy::random, a, 1234);
  Seq r2 = quick_sort(v, PivotStrategy::random, b, 1234);
  require(r1 == r2, "random pivot: identical output for same seed");
  require(a.counts().comparisons == b.counts().comparisons,
          "random pivot: identical comparisons for same seed");
  require(a.counts().swaps == b.counts().swaps,
          "random pivot: identical swaps for same seed");

  std::mt19937_64 rng(1234);
  CountingInstrument e;
  Seq r3 = quick_sort(v, PivotStrategy::random, e, rng);
  require(r3 == r1 && e.counts().swaps == a.counts().swaps,
          "engine overload matches seed overload");
}

static void test_degenerate_inputs() {
  // Sorted input with first/last pivots is the worst case for depth
  Seq v(20000);
  for (std::size_t i = 0; i < v.size(); ++i)
    v[i] = static_cast<std::int64_t>(i);
  require(quick_sort(v, PivotStrategy::first) == v, "sorted 20000 first");
  require(quick_sort(v, PivotStrategy::last) == v, "sorted 20000 last");
}

static void test_pivot_names() {
  require(parse_pivot_strategy("median-of-three") ==
              PivotStrategy::median_of_three,
          "parse median-of-three");
  require(parse_pivot_strategy("RANDOM") == PivotStrategy::random,
          "parse is case-insensitive");
  require(!parse_pivot_strategy("middle").has_value(), "reject unknown pivot");
  require(pivot_name(PivotStrategy::median_of_three) == "median_of_three",
          "pivot_name");
  bool threw = false;
  try {
    (void)pivot_from_name("middle");
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  require(threw, "pivot_from_name throws");

  threw = false;
  try {
    (void)quick_sort(Seq{}, static_cast<PivotStrategy>(42));
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  require(threw, "unknown pivot enum throws");
}

int main() {
  try {
    test_merge_basic();
    test_merge_instrumented();
    test_quick_basic();
    test_idempotence_and_non_mutation();
    test_quick_instrumented();
    test_median_of_three();
    test_random_determinism();
    test_degenerate_inputs();
    test_pivot_names();
  } catch (const std::exception &e) {
    std::cerr << "Unhandled exception: " << e.what() << "\n";
    return 2;
  }
  std::cout << "OK\n";
  return 0;
}
