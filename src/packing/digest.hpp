#pragma once

#include <filesystem>
#include <string_view>

#include "packing/fingerprint.hpp"

namespace gp::packing {

/// BLAKE3 of the payload, truncated to 128 bits.
auto hash_bytes(std::string_view payload) -> Fingerprint;

/// BLAKE3 of a file's contents, truncated to 128 bits. Streams the file in
/// fixed-size chunks; throws std::system_error if it cannot be read.
auto hash_file(const std::filesystem::path &path) -> Fingerprint;

} // namespace gp::packing
