#pragma once

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

#include "heap/closure.hpp"
#include "packing/graph_codec.hpp"

namespace gp::heap {

/// Process-wide set of thunk entry points that may appear in packed graphs.
///
/// Packed thunks carry their code as an offset from a fixed anchor inside
/// this binary, which survives address space randomization between runs of
/// the same executable. Decoding an offset only yields a callable when it
/// lands on a registered entry, and only for a closure carrying exactly the
/// number of free variables the entry reads.
class CodeTable {
public:
  struct Entry {
    ThunkCode code = nullptr;
    std::size_t arity = 0;
  };

  static auto instance() -> CodeTable &;

  /// Throws std::invalid_argument if code is already registered with a
  /// different arity.
  auto add(ThunkCode code, std::size_t arity) -> void;
  auto contains(ThunkCode code) const -> bool;
  auto size() const -> std::size_t;

  /// Position-independent encoding of a code pointer.
  static auto offset_of(ThunkCode code) -> packing::Word;

  auto find(packing::Word offset) const -> std::optional<Entry>;

private:
  CodeTable() = default;

  mutable std::shared_mutex mutex_;
  std::unordered_map<packing::Word, Entry> entries_;
};

/// Registers a thunk entry during static initialization, so packets naming it
/// can be unpacked before any thunk with that code is built in this run.
struct CodeRegistrar {
  CodeRegistrar(ThunkCode code, std::size_t arity) {
    CodeTable::instance().add(code, arity);
  }
};

} // namespace gp::heap
