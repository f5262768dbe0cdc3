// Merge sort and quick sort over dncbench::Seq

#include "dncbench/sorts.hpp"
#include "dncbench_text.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace dncbench {

static constexpr std::array<std::string_view, 4> kPivotNames{
    "first", "last", "median_of_three", "random"};

std::string_view pivot_name(PivotStrategy p) {
  int i = static_cast<int>(p);
  if (i < 0 || i >= static_cast<int>(kPivotNames.size()))
    return "unknown";
  return kPivotNames[static_cast<std::size_t>(i)];
}

const std::vector<std::string_view> &all_pivot_names() {
  static const std::vector<std::string_view> v(kPivotNames.begin(),
                                               kPivotNames.end());
  return v;
}

std::optional<PivotStrategy> parse_pivot_strategy(std::string s) {
  s = detail::to_lower(std::move(s));
  if (s == "first")
    return PivotStrategy::first;
  if (s == "last")
    return PivotStrategy::last;
  if (s == "median_of_three" || s == "median-of-three" || s == "median3")
    return PivotStrategy::median_of_three;
  if (s == "random")
    return PivotStrategy::random;
  return std::nullopt;
}

PivotStrategy pivot_from_name(const std::string &s) {
  if (auto p = parse_pivot_strategy(s))
    return *p;
  throw std::invalid_argument("Unknown pivot strategy: " + s);
}

std::uint64_t default_seed() { return 0x9E3779B97F4A7C15ULL; }

namespace {

// Sink used by the uninstrumented entry points; compiles away.
struct NullInstrument {
  void record(OpKind) noexcept {}
};

template <class Sink>
void merge_sort_range(Seq &v, Seq &buf, std::size_t lo, std::size_t hi,
                      Sink &sink) {
  if (hi - lo <= 1)
    return;
  // left half gets the lower (hi - lo) / 2 elements
  const std::size_t mid = lo + (hi - lo) / 2;
  merge_sort_range(v, buf, lo, mid, sink);
  merge_sort_range(v, buf, mid, hi, sink);

  std::size_t a = lo, b = mid, k = lo;
  while (a < mid && b < hi) {
    sink.record(OpKind::comparison);
    if (v[a] <= v[b])
      buf[k++] = v[a++];
    else
      buf[k++] = v[b++];
  }
  if (a < mid) {
    std::copy(v.begin() + static_cast<std::ptrdiff_t>(a),
              v.begin() + static_cast<std::ptrdiff_t>(mid),
              buf.begin() + static_cast<std::ptrdiff_t>(k));
    k += (mid - a);
  }
  if (b < hi) {
    std::copy(v.begin() + static_cast<std::ptrdiff_t>(b),
              v.begin() + static_cast<std::ptrdiff_t>(hi),
              buf.begin() + static_cast<std::ptrdiff_t>(k));
    k += (hi - b);
  }
  std::copy(buf.begin() + static_cast<std::ptrdiff_t>(lo),
            buf.begin() + static_cast<std::ptrdiff_t>(hi),
            v.begin() + static_cast<std::ptrdiff_t>(lo));
}

template <class Sink> Seq merge_sort_t(const Seq &in, Sink &sink) {
  Seq out(in);
  if (out.size() <= 1)
    return out;
  Seq buf(out.size());
  merge_sort_range(out, buf, 0, out.size(), sink);
  return out;
}

void check_pivot(PivotStrategy p) {
  switch (p) {
  case PivotStrategy::first:
  case PivotStrategy::last:
  case PivotStrategy::median_of_three:
  case PivotStrategy::random:
    return;
  }
  throw std::invalid_argument("Unknown pivot strategy: " +
                              std::to_string(static_cast<int>(p)));
}

template <class Sink> class QuickSorter {
public:
  using Index = std::ptrdiff_t;

  QuickSorter(Seq &v, PivotStrategy pivot, Sink &sink, std::mt19937_64 &rng)
      : v_(v), pivot_(pivot), sink_(sink), rng_(rng) {}

  void run() {
    if (v_.size() > 1)
      sort_range(0, static_cast<Index>(v_.size()) - 1);
  }

private:
  // Recurse into the smaller side, loop on the larger: O(log n) stack.
  void sort_range(Index left, Index right) {
    while (left < right) {
      Index p = partition(left, right, choose_pivot(left, right));
      if (p - left < right - p) {
        sort_range(left, p - 1);
        left = p + 1;
      } else {
        sort_range(p + 1, right);
        right = p - 1;
      }
    }
  }

  Index choose_pivot(Index left, Index right) {
    switch (pivot_) {
    case PivotStrategy::first:
      return left;
    case PivotStrategy::last:
      return right;
    case PivotStrategy::median_of_three: {
      const Index mid = left + (right - left) / 2;
      sink_.record(OpKind::comparison);
      sink_.record(OpKind::comparison);
      const auto a = at(left), m = at(mid), b = at(right);
      if ((a <= m && m <= b) || (b <= m && m <= a))
        return mid;
      if ((m <= a && a <= b) || (b <= a && a <= m))
        return left;
      return right;
    }
    case PivotStrategy::random: {
      std::uniform_int_distribution<Index> d(left, right);
      return d(rng_);
    }
    }
    throw std::invalid_argument("Unknown pivot strategy: " +
                                std::to_string(static_cast<int>(pivot_)));
  }

  Index partition(Index left, Index right, Index pivot_idx) {
    const std::int64_t pivot_val = at(pivot_idx);
    swap_at(pivot_idx, right);
    Index store = left;
    for (Index i = left; i < right; ++i) {
      sink_.record(OpKind::comparison);
      if (at(i) <= pivot_val) {
        if (i != store)
          swap_at(i, store);
        ++store;
      }
    }
    swap_at(store, right);
    return store;
  }

  std::int64_t at(Index i) const { return v_[static_cast<std::size_t>(i)]; }

  void swap_at(Index a, Index b) {
    std::swap(v_[static_cast<std::size_t>(a)], v_[static_cast<std::size_t>(b)]);
    sink_.record(OpKind::swap);
  }

  Seq &v_;
  PivotStrategy pivot_;
  Sink &sink_;
  std::mt19937_64 &rng_;
};

template <class Sink>
Seq quick_sort_t(const Seq &in, PivotStrategy pivot, Sink &sink,
                 std::mt19937_64 &rng) {
  check_pivot(pivot);
  Seq out(in);
  if (out.size() <= 1)
    return out;
  QuickSorter<Sink>(out, pivot, sink, rng).run();
  return out;
}

} // namespace

Seq merge_sort(const Seq &in) {
  NullInstrument sink;
  return merge_sort_t(in, sink);
}

Seq merge_sort(const Seq &in, Instrument &sink) {
  return merge_sort_t(in, sink);
}

Seq quick_sort(const Seq &in, PivotStrategy pivot,
               std::optional<std::uint64_t> seed) {
  NullInstrument sink;
  std::mt19937_64 rng(seed.value_or(default_seed()));
  return quick_sort_t(in, pivot, sink, rng);
}

Seq quick_sort(const Seq &in, PivotStrategy pivot, Instrument &sink,
               std::optional<std::uint64_t> seed) {
  std::mt19937_64 rng(seed.value_or(default_seed()));
  return quick_sort_t(in, pivot, sink, rng);
}

Seq quick_sort(const Seq &in, PivotStrategy pivot, std::mt19937_64 &rng) {
  NullInstrument sink;
  return quick_sort_t(in, pivot, sink, rng);
}

Seq quick_sort(const Seq &in, PivotStrategy pivot, Instrument &sink,
               std::mt19937_64 &rng) {
  return quick_sort_t(in, pivot, sink, rng);
}

} // namespace dncbench
