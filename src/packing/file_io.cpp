#include "packing/file_io.hpp"

#include <array>
#include <cerrno>
#include <fstream>
#include <string>
#include <system_error>

#include "common/logging/log.hpp"

namespace gp::packing {
namespace {

[[noreturn]] auto throw_io(std::string_view what, const std::filesystem::path &path) -> void {
  const int code = errno ? errno : EIO;
  throw std::system_error(code, std::generic_category(),
                          std::string(what) + " " + path.string());
}

} // namespace

auto format_name(Format format) -> std::string_view {
  switch (format) {
    case Format::Text:
      return TextCodec{}.get_name();
    case Format::Binary:
      return BinaryCodec{}.get_name();
  }
  return "unknown";
}

auto write_file(const std::filesystem::path &path, std::span<const std::byte> bytes) -> void {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw_io("cannot open for writing", path);
  }
  out.write(reinterpret_cast<const char *>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
  out.flush();
  if (!out) {
    throw_io("write failed on", path);
  }
  log::debug("wrote {} bytes to {}", bytes.size(), path.string());
}

auto read_file(const std::filesystem::path &path) -> std::vector<std::byte> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw_io("cannot open for reading", path);
  }
  std::vector<std::byte> bytes;
  std::array<char, 64 * 1024> chunk{};
  while (in) {
    in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    const auto got = static_cast<std::size_t>(in.gcount());
    const auto *first = reinterpret_cast<const std::byte *>(chunk.data());
    bytes.insert(bytes.end(), first, first + got);
  }
  if (in.bad()) {
    throw_io("read failed on", path);
  }
  log::debug("read {} bytes from {}", bytes.size(), path.string());
  return bytes;
}

} // namespace gp::packing
