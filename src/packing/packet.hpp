#pragma once

#include <cstddef>
#include <span>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "packing/error.hpp"
#include "packing/fingerprint.hpp"
#include "packing/graph_codec.hpp"
#include "packing/type_identity.hpp"

namespace gp::packing {

namespace detail {
struct PacketAccess;
} // namespace detail

/// Packed graph whose root has logical type T.
///
/// Immutable and move-only. Obtainable only from SerializationService or a
/// record codec, both of which go through a factory that checks the type tag
/// against TypeIdentity::of<T>(). The words are opaque outside the packing
/// layer. A packet is consumed by SerializationService::deserialize; a
/// moved-from packet is empty and unpacks as Garbled.
template <typename T>
class Packet {
public:
  using value_type = T;

  Packet(Packet &&) noexcept = default;
  auto operator=(Packet &&) noexcept -> Packet & = default;
  Packet(const Packet &) = delete;
  auto operator=(const Packet &) -> Packet & = delete;

  /// Payload length in machine words.
  auto size() const -> std::size_t { return words_.size(); }

  auto type() const -> const Fingerprint & { return type_; }

  friend auto operator==(const Packet &lhs, const Packet &rhs) -> bool {
    return lhs.type_ == rhs.type_ && lhs.words_ == rhs.words_;
  }

private:
  friend struct detail::PacketAccess;

  Packet(std::vector<Word> words, const Fingerprint &type)
      : words_(std::move(words)), type_(type) {}

  std::vector<Word> words_;
  Fingerprint type_;
};

namespace detail {

/// The only way into a Packet's representation.
struct PacketAccess {
  template <typename T>
  static auto make(std::vector<Word> words, const Fingerprint &type)
      -> Expected<Packet<T>> {
    if (type != TypeIdentity::of<T>()) {
      return tl::unexpected(make_error(
          PackErrc::TypeMismatch, fmt::format("packet tagged {}", to_hex(type))));
    }
    return Packet<T>(std::move(words), type);
  }

  template <typename T>
  static auto words(const Packet<T> &packet) -> std::span<const Word> {
    return packet.words_;
  }

  template <typename T>
  static auto release(Packet<T> &&packet) -> std::vector<Word> {
    return std::exchange(packet.words_, {});
  }
};

} // namespace detail

} // namespace gp::packing
