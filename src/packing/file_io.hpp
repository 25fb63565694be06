#pragma once

#include <cstddef>
#include <filesystem>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "heap/ref.hpp"
#include "packing/binary_codec.hpp"
#include "packing/error.hpp"
#include "packing/serialization_service.hpp"
#include "packing/text_codec.hpp"

namespace gp::packing {

enum class Format {
  Text,
  Binary,
};

auto format_name(Format format) -> std::string_view;

/// Whole-file helpers. Both throw std::system_error when the file cannot be
/// opened, read or written; content problems are left to the codecs.
auto write_file(const std::filesystem::path &path, std::span<const std::byte> bytes) -> void;
auto read_file(const std::filesystem::path &path) -> std::vector<std::byte>;

/// Pack value and store it at path.
template <typename T>
auto encode_to_file(SerializationService &service, const std::filesystem::path &path,
                    heap::Ref<T> value, Format format = Format::Binary) -> Expected<void> {
  auto packet = service.try_serialize(value);
  if (!packet) {
    return tl::unexpected(std::move(packet.error()));
  }
  if (format == Format::Text) {
    const auto text = TextCodec{}.encode(*packet);
    write_file(path, std::as_bytes(std::span(text.data(), text.size())));
  } else {
    write_file(path, BinaryCodec{}.encode(*packet));
  }
  return {};
}

/// Load a packet stored by encode_to_file and rebuild its graph.
///
/// Identity checks happen before anything is unpacked. Any failure to make
/// sense of the stored bytes is reported as ParseError.
template <typename T>
auto decode_from_file(SerializationService &service, const std::filesystem::path &path,
                      Format format = Format::Binary) -> Expected<heap::Ref<T>> {
  const auto bytes = read_file(path);
  auto packet = format == Format::Text
                    ? TextCodec{}.decode<T>(std::string_view(
                          reinterpret_cast<const char *>(bytes.data()), bytes.size()))
                    : BinaryCodec{}.decode<T>(bytes);
  if (!packet) {
    return tl::unexpected(std::move(packet.error()));
  }
  return service.deserialize(std::move(*packet));
}

} // namespace gp::packing
