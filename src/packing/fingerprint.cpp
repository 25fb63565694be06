#include "packing/fingerprint.hpp"

#include <charconv>
#include <system_error>

#include <fmt/format.h>

namespace gp::packing {
namespace {

constexpr std::size_t kHexDigits = 16;

auto read_u64_le(const std::uint8_t *bytes) -> std::uint64_t {
  std::uint64_t value = 0;
  for (int i = 7; i >= 0; --i) {
    value = (value << 8) | bytes[i];
  }
  return value;
}

auto parse_word(std::string_view text, std::uint64_t &out) -> bool {
  for (char c : text) {
    const bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') ||
                     (c >= 'A' && c <= 'F');
    if (!hex) {
      return false;
    }
  }
  auto res = std::from_chars(text.data(), text.data() + text.size(), out, 16);
  return res.ec == std::errc{} && res.ptr == text.data() + text.size();
}

} // namespace

auto Fingerprint::from_bytes(const std::array<std::uint8_t, 16> &bytes) -> Fingerprint {
  return Fingerprint{read_u64_le(bytes.data()), read_u64_le(bytes.data() + 8)};
}

auto to_hex(const Fingerprint &fp) -> std::string {
  return fmt::format("{:016x}{:016x}", fp.hi, fp.lo);
}

auto parse_fingerprint(std::string_view text) -> std::optional<Fingerprint> {
  if (text.size() != 2 * kHexDigits) {
    return std::nullopt;
  }
  Fingerprint fp;
  if (!parse_word(text.substr(0, kHexDigits), fp.hi) ||
      !parse_word(text.substr(kHexDigits), fp.lo)) {
    return std::nullopt;
  }
  return fp;
}

} // namespace gp::packing
