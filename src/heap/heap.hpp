#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "heap/closure.hpp"

namespace gp::heap {

/// Arena of closures shared by any number of worker threads.
///
/// Closures live as long as the heap. Allocation and forcing are thread-safe;
/// a thread forcing a thunk that another thread is evaluating waits for it.
class Heap {
public:
  Heap() = default;
  ~Heap();

  Heap(const Heap &) = delete;
  auto operator=(const Heap &) -> Heap & = delete;

  auto make_int(std::int64_t value) -> Closure *;
  /// Throws std::invalid_argument on a null field.
  auto make_con(std::uint32_t tag, std::vector<Closure *> fields) -> Closure *;
  /// Registers code with the CodeTable so the thunk can be packed. Every
  /// thunk sharing a code pointer must carry the same number of free
  /// variables; a mismatch throws std::invalid_argument.
  auto make_thunk(ThunkCode code, std::vector<Closure *> env) -> Closure *;
  /// Externally-synchronized mutable cell holding contents.
  auto make_cell(Closure *contents) -> Closure *;
  /// Opaque native handle; never packable.
  auto make_foreign(void *handle) -> Closure *;

  /// Evaluate to weak head normal form and return the value closure.
  ///
  /// Blocks while another thread holds the thunk. Throws std::logic_error if
  /// the calling thread re-enters a thunk it is evaluating. If the thunk code
  /// throws, the thunk is restored and the exception propagates.
  auto force(Closure *node) -> Closure *;

  /// Take ownership of closures built outside the heap (graph unpacking).
  auto adopt(std::vector<std::unique_ptr<Closure>> closures) -> void;

  /// Number of closures owned.
  auto size() const -> std::size_t;

private:
  auto allocate(ClosureKind kind) -> Closure *;
  auto evaluate(Closure *thunk) -> Closure *;

  mutable std::mutex alloc_mutex_;
  std::vector<std::unique_ptr<Closure>> closures_;

  std::mutex eval_mutex_;
  std::condition_variable eval_cv_;
};

} // namespace gp::heap
