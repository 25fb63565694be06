#include "packing/text_codec.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <iterator>
#include <optional>
#include <system_error>

#include <fmt/format.h>

#include "common/logging/log.hpp"

namespace gp::packing {
namespace {

constexpr std::string_view kHeaderPrefix = "Serialization Packet, size ";
constexpr std::string_view kProgramPrefix = ", program ";
constexpr std::string_view kTypePrefix = ", type ";
constexpr std::size_t kHexWidth = 2 * sizeof(Word);

auto parse_error(std::string detail) -> tl::unexpected<PackError> {
  return tl::unexpected(make_error(PackErrc::ParseError, std::move(detail)));
}

auto is_hex(char c) -> bool {
  return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

auto is_digit(char c) -> bool {
  return c >= '0' && c <= '9';
}

auto is_blank(char c) -> bool {
  return c == ' ' || c == '\t';
}

class Cursor {
public:
  explicit Cursor(std::string_view text) : text_(text) {}

  auto at_end() const -> bool { return pos_ >= text_.size(); }
  auto peek() const -> char { return text_[pos_]; }
  auto offset() const -> std::size_t { return pos_; }

  auto literal(std::string_view expected) -> bool {
    if (text_.substr(pos_, expected.size()) != expected) {
      return false;
    }
    pos_ += expected.size();
    return true;
  }

  template <typename Pred>
  auto munch(Pred pred) -> std::string_view {
    const auto start = pos_;
    while (!at_end() && pred(text_[pos_])) {
      ++pos_;
    }
    return text_.substr(start, pos_ - start);
  }

  /// Rest of the current line, without the newline.
  auto line() -> std::string_view {
    return munch([](char c) { return c != '\n'; });
  }

  /// One or more blanks and newlines, at least one of them a newline.
  auto line_break() -> bool {
    auto run = munch([](char c) { return is_blank(c) || c == '\r' || c == '\n'; });
    return run.find('\n') != std::string_view::npos;
  }

private:
  std::string_view text_;
  std::size_t pos_ = 0;
};

auto parse_decimal(std::string_view digits) -> std::optional<std::uint64_t> {
  std::uint64_t value = 0;
  auto res = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (digits.empty() || res.ec != std::errc{} || res.ptr != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return value;
}

auto parse_word(Cursor &cursor) -> std::optional<Word> {
  if (!cursor.literal("0x")) {
    return std::nullopt;
  }
  auto digits = cursor.munch(is_hex);
  if (digits.empty() || digits.size() > kHexWidth) {
    return std::nullopt;
  }
  Word value = 0;
  auto res = std::from_chars(digits.data(), digits.data() + digits.size(), value, 16);
  if (res.ec != std::errc{}) {
    return std::nullopt;
  }
  return value;
}

auto parse_fingerprint_line(Cursor &cursor) -> std::optional<Fingerprint> {
  auto text = cursor.line();
  while (!text.empty() && (is_blank(text.back()) || text.back() == '\r')) {
    text.remove_suffix(1);
  }
  return parse_fingerprint(text);
}

} // namespace

auto TextCodec::format_record(const Fingerprint &program, const Fingerprint &type,
                              std::span<const Word> words) -> std::string {
  std::string out = fmt::format("{}{}{}{}\n{}{}\n", kHeaderPrefix, words.size(),
                                kProgramPrefix, to_hex(program), kTypePrefix,
                                to_hex(type));
  for (std::size_t row = 0; row < words.size(); row += kWordsPerRow) {
    fmt::format_to(std::back_inserter(out), "{}:", row);
    const auto end = std::min(words.size(), row + kWordsPerRow);
    for (std::size_t i = row; i < end; ++i) {
      fmt::format_to(std::back_inserter(out), "\t0x{:0{}x}", words[i], kHexWidth);
    }
    out.push_back('\n');
  }
  return out;
}

auto TextCodec::parse_record(std::string_view text, const Fingerprint &program)
    -> Expected<EncodedRecord> {
  Cursor cursor(text);
  if (!cursor.literal(kHeaderPrefix)) {
    return parse_error("missing packet header");
  }
  auto declared = parse_decimal(cursor.munch(is_digit));
  if (!declared) {
    return parse_error("bad packet size");
  }
  if (!cursor.literal(kProgramPrefix)) {
    return parse_error("missing program fingerprint");
  }
  auto parsed_program = parse_fingerprint_line(cursor);
  if (!parsed_program) {
    return parse_error("bad program fingerprint");
  }
  if (*parsed_program != program) {
    log::warn("text packet from binary {} rejected (running {})",
              to_hex(*parsed_program), to_hex(program));
    return tl::unexpected(make_error(PackErrc::BinaryMismatch,
                                     "record program " + to_hex(*parsed_program)));
  }

  if (!cursor.line_break() || !cursor.literal(kTypePrefix)) {
    return parse_error("missing type fingerprint");
  }
  auto type = parse_fingerprint_line(cursor);
  if (!type) {
    return parse_error("bad type fingerprint");
  }

  EncodedRecord record;
  record.program = *parsed_program;
  record.type = *type;
  while (cursor.line_break() && !cursor.at_end()) {
    const auto row_at = cursor.offset();
    auto index = parse_decimal(cursor.munch(is_digit));
    if (!index || !cursor.literal(":")) {
      return parse_error(fmt::format("bad row label at offset {}", row_at));
    }
    if (*index != record.words.size()) {
      return parse_error(fmt::format("row labelled {} starts at word {}", *index,
                                     record.words.size()));
    }
    std::size_t in_row = 0;
    while (!cursor.munch(is_blank).empty() && !cursor.at_end() &&
           cursor.peek() != '\n' && cursor.peek() != '\r') {
      auto word = parse_word(cursor);
      if (!word) {
        return parse_error(fmt::format("bad word at offset {}", cursor.offset()));
      }
      record.words.push_back(*word);
      ++in_row;
    }
    if (in_row == 0) {
      return parse_error(fmt::format("empty row {}", *index));
    }
    if (record.words.size() > *declared) {
      break;
    }
  }
  if (!cursor.at_end()) {
    return parse_error(fmt::format("unexpected text at offset {}", cursor.offset()));
  }
  if (record.words.size() != *declared) {
    return parse_error(fmt::format("declared {} words, found {}", *declared,
                                   record.words.size()));
  }
  return record;
}

} // namespace gp::packing
