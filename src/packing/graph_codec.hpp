#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace gp::heap {
struct Closure;
} // namespace gp::heap

namespace gp::packing {

/// Machine word; the unit of a packed graph.
using Word = std::uintptr_t;

/// Status codes of the pack/unpack primitive. Any non-zero value is a failure
/// and numerically equal to the matching PackErrc.
enum class PackStatus : int {
  Success = 0,
  BlackHole = 1,
  NoBuffer = 2,
  CannotPack = 3,
  Unsupported = 4,
  Impossible = 5,
  Garbled = 6,
};

struct PackOutcome {
  int status = 0;
  /// Only meaningful when status is Success.
  std::vector<Word> words;
};

struct UnpackOutcome {
  int status = 0;
  /// Root of the reconstructed graph; null unless status is Success.
  heap::Closure *root = nullptr;
};

/// Primitive that flattens a live graph into words and back.
///
/// pack() must never block: meeting a computation that another thread is
/// evaluating reports BlackHole. unpack() returns an independently rooted
/// graph equivalent to the packed one, or Garbled for invalid input.
class GraphCodec {
public:
  virtual ~GraphCodec() = default;

  virtual auto pack(const heap::Closure *root) -> PackOutcome = 0;
  virtual auto unpack(std::span<const Word> words) -> UnpackOutcome = 0;
};

constexpr auto status_code(PackStatus status) -> int {
  return static_cast<int>(status);
}

} // namespace gp::packing
