#pragma once

#include <typeinfo>

#include "packing/executable_identity.hpp"
#include "packing/fingerprint.hpp"
#include "packing/type_encoding.hpp"

namespace gp::packing {

/// Fingerprint of a compiled type.
///
/// Derived from the type's mangled name and layout salted with the executable
/// identity, so it is only stable within one compiled binary: rebuilding after
/// changing a definition changes the value even if the name stays the same.
/// Recomputed on every call; the result is deterministic.
class TypeIdentity {
public:
  template <typename T>
  static auto describe() -> TypeDescriptor {
    return TypeDescriptor{typeid(T).name(), sizeof(T), alignof(T),
                          ExecutableIdentity::current()};
  }

  template <typename T>
  static auto of() -> Fingerprint {
    return of(describe<T>());
  }

  static auto of(const TypeDescriptor &desc) -> Fingerprint;

private:
  TypeIdentity() = delete;
};

} // namespace gp::packing
