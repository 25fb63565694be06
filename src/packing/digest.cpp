#include "packing/digest.hpp"

#include <array>
#include <cerrno>
#include <fstream>
#include <system_error>

extern "C" {
#include "blake3.h"
}

namespace gp::packing {
namespace {

constexpr std::size_t kChunkSize = 64 * 1024;

auto finish(blake3_hasher &hasher) -> Fingerprint {
  std::array<std::uint8_t, 16> digest{};
  blake3_hasher_finalize(&hasher, digest.data(), digest.size());
  return Fingerprint::from_bytes(digest);
}

} // namespace

auto hash_bytes(std::string_view payload) -> Fingerprint {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finish(hasher);
}

auto hash_file(const std::filesystem::path &path) -> Fingerprint {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::system_error(errno ? errno : ENOENT, std::generic_category(),
                            "cannot open " + path.string());
  }

  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  std::array<char, kChunkSize> chunk{};
  while (in) {
    in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    const auto got = in.gcount();
    if (got > 0) {
      blake3_hasher_update(&hasher, chunk.data(), static_cast<std::size_t>(got));
    }
  }
  if (in.bad()) {
    throw std::system_error(EIO, std::generic_category(),
                            "read failed on " + path.string());
  }
  return finish(hasher);
}

} // namespace gp::packing
