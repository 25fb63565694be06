#include "packing/error.hpp"

namespace gp::packing {

auto describe(PackErrc code) -> std::string_view {
  switch (code) {
    case PackErrc::BlackHole:
      return "Packing hit a blackhole";
    case PackErrc::NoBuffer:
      return "Buffer too small (increase --pack_buffer_words)";
    case PackErrc::CannotPack:
      return "Data contain a closure that cannot be packed (mutable cell)";
    case PackErrc::Unsupported:
      return "Contains an unsupported closure type";
    case PackErrc::Impossible:
      return "An impossible case happened. This is probably a bug.";
    case PackErrc::Garbled:
      return "Garbled data for deserialisation";
    case PackErrc::ParseError:
      return "Packet parse error";
    case PackErrc::BinaryMismatch:
      return "Executable binaries do not match";
    case PackErrc::TypeMismatch:
      return "Packet data has unexpected type";
  }
  return "Unknown packing error";
}

auto name_of(PackErrc code) -> std::string_view {
  switch (code) {
    case PackErrc::BlackHole: return "BlackHole";
    case PackErrc::NoBuffer: return "NoBuffer";
    case PackErrc::CannotPack: return "CannotPack";
    case PackErrc::Unsupported: return "Unsupported";
    case PackErrc::Impossible: return "Impossible";
    case PackErrc::Garbled: return "Garbled";
    case PackErrc::ParseError: return "ParseError";
    case PackErrc::BinaryMismatch: return "BinaryMismatch";
    case PackErrc::TypeMismatch: return "TypeMismatch";
  }
  return "Unknown";
}

auto PackError::message() const -> std::string {
  if (detail.empty()) {
    return std::string(describe(code));
  }
  return fmt::format("{}: {}", describe(code), detail);
}

} // namespace gp::packing
