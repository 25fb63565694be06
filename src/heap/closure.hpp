#pragma once

#include <atomic>
#include <cstdint>
#include <span>
#include <thread>
#include <vector>

namespace gp::heap {

class Heap;
struct Closure;

/// Entry code of a suspended computation. Receives the thunk's free variables
/// and returns the closure it evaluates to.
using ThunkCode = Closure *(*)(Heap &heap, std::span<Closure *const> env);

enum class ClosureKind : std::uint8_t {
  Int = 1,
  Con = 2,
  Thunk = 3,
  Indirection = 4,
  BlackHole = 5,
  MutCell = 6,
  Foreign = 7,
};

/// One heap object. Allocated and owned by a Heap.
///
/// A thunk moves Thunk -> BlackHole (while one thread evaluates it) ->
/// Indirection (pointing at its value). code and fields stay intact through
/// the transitions so a concurrent reader that saw Thunk can still use them.
struct Closure {
  explicit Closure(ClosureKind k) : kind(k) {}

  Closure(const Closure &) = delete;
  auto operator=(const Closure &) -> Closure & = delete;

  std::atomic<ClosureKind> kind;
  std::uint32_t tag = 0;
  std::int64_t value = 0;
  ThunkCode code = nullptr;
  void *handle = nullptr;
  std::vector<Closure *> fields;
  /// Value of an evaluated thunk, or the contents of a MutCell.
  std::atomic<Closure *> indirectee{nullptr};
  /// Evaluating thread while kind is BlackHole. Guarded by the heap.
  std::thread::id owner;

  auto load_kind() const -> ClosureKind {
    return kind.load(std::memory_order_acquire);
  }
};

/// Skip evaluated thunks.
inline auto follow(const Closure *node) -> const Closure * {
  while (node && node->load_kind() == ClosureKind::Indirection) {
    node = node->indirectee.load(std::memory_order_acquire);
  }
  return node;
}

inline auto follow(Closure *node) -> Closure * {
  return const_cast<Closure *>(follow(static_cast<const Closure *>(node)));
}

} // namespace gp::heap
