#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gp::packing {

/// 128-bit opaque identity value. Only equality is meaningful.
struct Fingerprint {
  std::uint64_t hi = 0;
  std::uint64_t lo = 0;

  /// Build from a 16-byte digest (two little-endian words, hi first).
  static auto from_bytes(const std::array<std::uint8_t, 16> &bytes) -> Fingerprint;

  friend auto operator==(const Fingerprint &, const Fingerprint &) -> bool = default;
};

/// 32 lowercase hex digits, hi word first.
auto to_hex(const Fingerprint &fp) -> std::string;

/// Inverse of to_hex. Requires exactly 32 hex digits (either case).
auto parse_fingerprint(std::string_view text) -> std::optional<Fingerprint>;

} // namespace gp::packing
