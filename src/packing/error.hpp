#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <tl/expected.hpp>

namespace gp::packing {

/// Every failure the packing layer can report. The first six mirror the
/// status codes of the graph primitive (status value == enumerator value);
/// the last three are raised by the record codecs.
enum class PackErrc : std::uint8_t {
  BlackHole = 1,
  NoBuffer = 2,
  CannotPack = 3,
  Unsupported = 4,
  Impossible = 5,
  Garbled = 6,
  ParseError = 7,
  BinaryMismatch = 8,
  TypeMismatch = 9,
};

struct PackError {
  PackErrc code;
  std::string detail;

  /// Short description followed by the detail (if any).
  auto message() const -> std::string;
};

template <typename T>
using Expected = tl::expected<T, PackError>;

inline auto make_error(PackErrc code, std::string detail = {}) -> PackError {
  return PackError{code, std::move(detail)};
}

/// Fixed user-facing description of an error code.
auto describe(PackErrc code) -> std::string_view;

/// Enumerator name, e.g. "BlackHole".
auto name_of(PackErrc code) -> std::string_view;

/// True for conditions that signal a bug rather than an expected outcome.
inline auto is_fatal(PackErrc code) -> bool {
  return code == PackErrc::Impossible;
}

} // namespace gp::packing

template <>
struct fmt::formatter<gp::packing::PackErrc> : fmt::formatter<std::string_view> {
  auto format(gp::packing::PackErrc code, fmt::format_context &ctx) const {
    return fmt::formatter<std::string_view>::format(gp::packing::name_of(code), ctx);
  }
};
