#include "packing/type_identity.hpp"

#include <string_view>

#include "packing/digest.hpp"

namespace gp::packing {

auto TypeIdentity::of(const TypeDescriptor &desc) -> Fingerprint {
  const auto encoding = encode_descriptor(desc);
  return hash_bytes(std::string_view(reinterpret_cast<const char *>(encoding.bytes.data()),
                                     encoding.bytes.size()));
}

} // namespace gp::packing
