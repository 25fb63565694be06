#pragma once

#include <filesystem>

#include "packing/fingerprint.hpp"

namespace gp::packing {

/// Fingerprint of the executable image running this process.
///
/// The value is computed on the first call to current() by hashing the file
/// behind /proc/self/exe, and is then held for the lifetime of the process.
/// Initialization runs under std::call_once: concurrent first callers block
/// until the single computation finishes and all observe the same value. If
/// the image cannot be read, current() throws std::system_error and nothing is
/// cached, so a later call retries.
class ExecutableIdentity {
public:
  static auto current() -> const Fingerprint &;

  /// Resolved path of the running image (for diagnostics).
  static auto image_path() -> std::filesystem::path;

private:
  ExecutableIdentity() = delete;
};

} // namespace gp::packing
