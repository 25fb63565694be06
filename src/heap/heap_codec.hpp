#pragma once

#include <cstddef>
#include <span>

#include "heap/heap.hpp"
#include "packing/graph_codec.hpp"

namespace gp::heap {

struct HeapCodecConfig {
  /// Largest packed graph, in words. Bigger graphs fail with NoBuffer.
  std::size_t max_words = std::size_t{1} << 20;

  /// Defaults taken from --pack_buffer_words.
  static auto from_flags() -> HeapCodecConfig;
};

/// GraphCodec over a Heap.
///
/// Packed layout, one word per cell:
///   magic, format version, closure count n,
///   then n closures in breadth-first order from the root (index 0):
///     Int:   header, value
///     Con:   header, tag, field index * arity
///     Thunk: header, code offset, free variable index * arity
/// where header = kind | arity << 8. Sharing and cycles are kept since every
/// closure is emitted once and referenced by index; evaluated thunks are
/// replaced by their values. Unpacked graphs are allocated in the heap the
/// codec was built with.
class HeapCodec final : public packing::GraphCodec {
public:
  explicit HeapCodec(Heap &heap, HeapCodecConfig config = {});

  auto pack(const Closure *root) -> packing::PackOutcome override;
  auto unpack(std::span<const packing::Word> words) -> packing::UnpackOutcome override;

  auto config() const -> const HeapCodecConfig & { return config_; }

private:
  Heap &heap_;
  HeapCodecConfig config_;
};

} // namespace gp::heap
