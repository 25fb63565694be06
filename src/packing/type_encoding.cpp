#include "packing/type_encoding.hpp"

#include <limits>
#include <stdexcept>

namespace gp::packing {
namespace {

constexpr auto kDescriptorKind = std::uint8_t{0x02};
constexpr auto kDescriptorVersion = std::uint8_t{0x01};

auto write_u8(std::vector<std::uint8_t> &out, std::uint8_t value) -> void {
  out.push_back(value);
}

auto write_u64_le(std::vector<std::uint8_t> &out, std::uint64_t value) -> void {
  for (int shift = 0; shift < 64; shift += 8) {
    out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFu));
  }
}

auto write_string(std::vector<std::uint8_t> &out, std::string_view value) -> void {
  if (value.size() > std::numeric_limits<std::uint32_t>::max()) {
    throw std::length_error("type name too large to encode");
  }
  const auto size = static_cast<std::uint32_t>(value.size());
  for (int shift = 0; shift < 32; shift += 8) {
    out.push_back(static_cast<std::uint8_t>((size >> shift) & 0xFFu));
  }
  out.insert(out.end(), value.begin(), value.end());
}

} // namespace

auto encode_descriptor(const TypeDescriptor &desc) -> TypeEncoding {
  TypeEncoding encoding;
  encoding.bytes.reserve(2 + 4 + desc.name.size() + 4 * 8);
  write_u8(encoding.bytes, kDescriptorKind);
  write_u8(encoding.bytes, kDescriptorVersion);
  write_string(encoding.bytes, desc.name);
  write_u64_le(encoding.bytes, desc.size);
  write_u64_le(encoding.bytes, desc.align);
  write_u64_le(encoding.bytes, desc.binary.hi);
  write_u64_le(encoding.bytes, desc.binary.lo);
  return encoding;
}

} // namespace gp::packing
