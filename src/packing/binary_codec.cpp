#include "packing/binary_codec.hpp"

#include <cstdint>
#include <limits>

#include <fmt/format.h>

#include "common/logging/log.hpp"

namespace gp::packing {
namespace {

template <typename U>
auto write_le(std::vector<std::byte> &out, U value) -> void {
  for (std::size_t i = 0; i < sizeof(U); ++i) {
    out.push_back(static_cast<std::byte>((value >> (8 * i)) & 0xFFu));
  }
}

template <typename U>
auto read_le(std::span<const std::byte> bytes) -> U {
  U value = 0;
  for (std::size_t i = sizeof(U); i-- > 0;) {
    value = static_cast<U>((value << 8) | std::to_integer<U>(bytes[i]));
  }
  return value;
}

auto read_fingerprint(std::span<const std::byte> bytes) -> Fingerprint {
  return Fingerprint{read_le<std::uint64_t>(bytes.first(8)),
                     read_le<std::uint64_t>(bytes.subspan(8, 8))};
}

} // namespace

auto BinaryCodec::format_record(const Fingerprint &program, const Fingerprint &type,
                                std::span<const Word> words) -> std::vector<std::byte> {
  std::vector<std::byte> out;
  out.reserve(kHeaderBytes + words.size() * sizeof(Word));
  write_le(out, program.hi);
  write_le(out, program.lo);
  write_le(out, type.hi);
  write_le(out, type.lo);
  write_le(out, static_cast<std::uint64_t>(words.size()));
  for (auto word : words) {
    write_le(out, word);
  }
  return out;
}

auto BinaryCodec::parse_record(std::span<const std::byte> bytes, const Fingerprint &program)
    -> Expected<EncodedRecord> {
  if (bytes.size() < kFingerprintBytes) {
    return tl::unexpected(make_error(PackErrc::ParseError, "truncated program fingerprint"));
  }
  EncodedRecord record;
  record.program = read_fingerprint(bytes.first(kFingerprintBytes));
  if (record.program != program) {
    log::warn("binary packet from binary {} rejected (running {})",
              to_hex(record.program), to_hex(program));
    return tl::unexpected(make_error(PackErrc::BinaryMismatch,
                                     "record program " + to_hex(record.program)));
  }

  if (bytes.size() < kHeaderBytes) {
    return tl::unexpected(make_error(PackErrc::ParseError, "truncated packet header"));
  }
  record.type = read_fingerprint(bytes.subspan(kFingerprintBytes, kFingerprintBytes));
  const auto count = read_le<std::uint64_t>(bytes.subspan(2 * kFingerprintBytes, 8));

  const auto payload = bytes.subspan(kHeaderBytes);
  if (count > std::numeric_limits<std::size_t>::max() / sizeof(Word) ||
      payload.size() != count * sizeof(Word)) {
    return tl::unexpected(make_error(
        PackErrc::ParseError,
        fmt::format("declared {} words, payload holds {} bytes", count, payload.size())));
  }

  record.words.reserve(static_cast<std::size_t>(count));
  for (std::size_t offset = 0; offset < payload.size(); offset += sizeof(Word)) {
    record.words.push_back(read_le<Word>(payload.subspan(offset, sizeof(Word))));
  }
  return record;
}

} // namespace gp::packing
