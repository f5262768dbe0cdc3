// Per-thread heap accounting via replacement global operator new/delete.
// Each block carries a header holding its size so frees can be counted.

#include "dncbench/metrics.hpp"

#include <cstddef>
#include <cstdlib>
#include <new>

namespace {

thread_local std::int64_t t_live = 0;
thread_local std::int64_t t_peak = 0;

// Keeps the returned pointer aligned like a plain malloc result.
constexpr std::size_t kHeader = alignof(std::max_align_t);

inline void *tracked_alloc(std::size_t sz) noexcept {
  void *raw = std::malloc(kHeader + sz);
  if (!raw)
    return nullptr;
  *static_cast<std::size_t *>(raw) = sz;
  t_live += static_cast<std::int64_t>(sz);
  if (t_live > t_peak)
    t_peak = t_live;
  return static_cast<char *>(raw) + kHeader;
}

inline void tracked_free(void *p) noexcept {
  if (!p)
    return;
  void *raw = static_cast<char *>(p) - kHeader;
  // Blocks freed on another thread than their allocator drift t_live on
  // both threads; AllocScope only reports growth so the drift cancels out.
  t_live -= static_cast<std::int64_t>(*static_cast<std::size_t *>(raw));
  std::free(raw);
}

inline void *tracked_new(std::size_t sz) {
  if (sz == 0)
    sz = 1;
  for (;;) {
    if (void *p = tracked_alloc(sz))
      return p;
    std::new_handler h = std::get_new_handler();
    if (!h)
      throw std::bad_alloc();
    h();
  }
}

} // namespace

void *operator new(std::size_t sz) { return tracked_new(sz); }
void *operator new[](std::size_t sz) { return tracked_new(sz); }
void *operator new(std::size_t sz, const std::nothrow_t &) noexcept {
  return tracked_alloc(sz == 0 ? 1 : sz);
}
void *operator new[](std::size_t sz, const std::nothrow_t &) noexcept {
  return tracked_alloc(sz == 0 ? 1 : sz);
}
void operator delete(void *p) noexcept { tracked_free(p); }
void operator delete[](void *p) noexcept { tracked_free(p); }
void operator delete(void *p, std::size_t) noexcept { tracked_free(p); }
void operator delete[](void *p, std::size_t) noexcept { tracked_free(p); }
void operator delete(void *p, const std::nothrow_t &) noexcept {
  tracked_free(p);
}
void operator delete[](void *p, const std::nothrow_t &) noexcept {
  tracked_free(p);
}

namespace dncbench {

std::int64_t thread_live_bytes() { return t_live; }

AllocScope::AllocScope() : base_(t_live) { t_peak = t_live; }

std::uint64_t AllocScope::peak_bytes() const {
  return t_peak > base_ ? static_cast<std::uint64_t>(t_peak - base_) : 0;
}

} // namespace dncbench
