#pragma once

#include <cstddef>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "packing/error.hpp"
#include "packing/executable_identity.hpp"
#include "packing/packet.hpp"
#include "packing/record.hpp"
#include "packing/type_identity.hpp"

namespace gp::packing {

/// Compact packet encoding. Little-endian throughout:
///
///   program fingerprint   16 bytes (hi, lo)
///   type fingerprint      16 bytes (hi, lo)
///   word count             8 bytes
///   words                  count * sizeof(Word) bytes
struct BinaryCodec {
  static constexpr std::size_t kFingerprintBytes = 16;
  static constexpr std::size_t kHeaderBytes = 2 * kFingerprintBytes + 8;

  auto get_name() const -> std::string_view { return "binary"; }

  template <typename T>
  auto encode(const Packet<T> &packet) const -> std::vector<std::byte> {
    return format_record(ExecutableIdentity::current(), packet.type(),
                         detail::PacketAccess::words(packet));
  }

  template <typename T>
  auto decode(std::span<const std::byte> bytes) const -> Expected<Packet<T>> {
    auto record = parse_record(bytes, ExecutableIdentity::current());
    if (!record) {
      return tl::unexpected(std::move(record.error()));
    }
    if (record->type != TypeIdentity::of<T>()) {
      return tl::unexpected(make_error(PackErrc::TypeMismatch,
                                       "record type " + to_hex(record->type)));
    }
    return detail::PacketAccess::make<T>(std::move(record->words), record->type);
  }

  static auto format_record(const Fingerprint &program, const Fingerprint &type,
                            std::span<const Word> words) -> std::vector<std::byte>;

  /// Validate header, program fingerprint and exact payload length; the type
  /// is left to the caller.
  static auto parse_record(std::span<const std::byte> bytes, const Fingerprint &program)
      -> Expected<EncodedRecord>;
};

} // namespace gp::packing
