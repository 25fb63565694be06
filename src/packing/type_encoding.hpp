#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "packing/fingerprint.hpp"

namespace gp::packing {

/// Runtime descriptor of a compiled type.
struct TypeDescriptor {
  /// Implementation (mangled) name from std::type_info.
  std::string_view name;
  std::size_t size = 0;
  std::size_t align = 0;
  /// Identity of the binary the type was compiled into.
  Fingerprint binary;
};

struct TypeEncoding {
  std::vector<std::uint8_t> bytes;
};

/// Canonical byte form of a descriptor; the input to the type fingerprint.
auto encode_descriptor(const TypeDescriptor &desc) -> TypeEncoding;

} // namespace gp::packing
