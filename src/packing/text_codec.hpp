#pragma once

#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "packing/error.hpp"
#include "packing/executable_identity.hpp"
#include "packing/packet.hpp"
#include "packing/record.hpp"
#include "packing/type_identity.hpp"

namespace gp::packing {

/// Human-readable packet encoding:
///
///   Serialization Packet, size <N>, program <fingerprint>
///   , type <fingerprint>
///   0:\t0x...\t0x...\t0x...\t0x...
///   4:\t0x...
///
/// Words are printed as zero-padded hex, four per row, each row prefixed by
/// the index of its first word.
struct TextCodec {
  static constexpr std::size_t kWordsPerRow = 4;

  auto get_name() const -> std::string_view { return "text"; }

  template <typename T>
  auto encode(const Packet<T> &packet) const -> std::string {
    return format_record(ExecutableIdentity::current(), packet.type(),
                         detail::PacketAccess::words(packet));
  }

  template <typename T>
  auto decode(std::string_view text) const -> Expected<Packet<T>> {
    auto record = parse_record(text, ExecutableIdentity::current());
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
                            std::span<const Word> words) -> std::string;

  /// Parse and validate everything except the type: the header, the program
  /// fingerprint (BinaryMismatch as soon as it is read, before any row), the
  /// rows, and the declared word count.
  static auto parse_record(std::string_view text, const Fingerprint &program)
      -> Expected<EncodedRecord>;
};

} // namespace gp::packing
