#include "packing/executable_identity.hpp"

#include <mutex>
#include <system_error>

#include "common/logging/log.hpp"
#include "packing/digest.hpp"

namespace gp::packing {
namespace {

constexpr const char *kSelfImage = "/proc/self/exe";

std::once_flag g_once;
Fingerprint g_identity;

} // namespace

auto ExecutableIdentity::image_path() -> std::filesystem::path {
  std::error_code ec;
  auto resolved = std::filesystem::read_symlink(kSelfImage, ec);
  if (ec) {
    return kSelfImage;
  }
  return resolved;
}

auto ExecutableIdentity::current() -> const Fingerprint & {
  std::call_once(g_once, [] {
    // Hash through the magic link so a binary replaced on disk after start
    // still yields the identity of the running image.
    g_identity = hash_file(kSelfImage);
    log::debug("executable identity {} from {}", to_hex(g_identity),
               image_path().string());
  });
  return g_identity;
}

} // namespace gp::packing
