#pragma once

#include <optional>
#include <span>
#include <utility>
#include <vector>

#include "heap/ref.hpp"
#include "packing/error.hpp"
#include "packing/graph_codec.hpp"
#include "packing/packet.hpp"
#include "packing/type_identity.hpp"

namespace gp::packing {

/// Typed front end of a GraphCodec.
///
/// The only place where primitive status codes are turned into PackErrc
/// values. Holds no state besides the codec reference; concurrent calls on
/// independent values need no coordination beyond what the codec provides.
class SerializationService {
public:
  explicit SerializationService(GraphCodec &codec) : codec_(codec) {}

  /// Pack value without blocking. A graph that reaches a computation under
  /// evaluation by another thread fails with BlackHole.
  template <typename T>
  auto try_serialize(heap::Ref<T> value) -> Expected<Packet<T>> {
    auto words = pack_root(value.node());
    if (!words) {
      return tl::unexpected(std::move(words.error()));
    }
    return detail::PacketAccess::make<T>(std::move(*words), TypeIdentity::of<T>());
  }

  /// Rebuild the graph held by packet, consuming it.
  template <typename T>
  auto deserialize(Packet<T> &&packet) -> Expected<heap::Ref<T>> {
    const auto words = detail::PacketAccess::release(std::move(packet));
    auto root = unpack_words(words);
    if (!root) {
      return tl::unexpected(std::move(root.error()));
    }
    return heap::Ref<T>(*root);
  }

  /// Error for a pack status, or nullopt on success. Unknown codes and a
  /// Garbled report from pack are contract breaches and map to Impossible.
  static auto classify_pack_status(int status) -> std::optional<PackErrc>;

  /// Error for an unpack status, or nullopt on success. Every failure is
  /// Garbled.
  static auto classify_unpack_status(int status) -> std::optional<PackErrc>;

private:
  auto pack_root(const heap::Closure *root) -> Expected<std::vector<Word>>;
  auto unpack_words(std::span<const Word> words) -> Expected<heap::Closure *>;

  GraphCodec &codec_;
};

} // namespace gp::packing
