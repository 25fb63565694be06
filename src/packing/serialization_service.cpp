#include "packing/serialization_service.hpp"

#include <fmt/format.h>

#include "common/logging/log.hpp"

namespace gp::packing {

auto SerializationService::classify_pack_status(int status) -> std::optional<PackErrc> {
  switch (status) {
    case status_code(PackStatus::Success):
      return std::nullopt;
    case status_code(PackStatus::BlackHole):
    case status_code(PackStatus::NoBuffer):
    case status_code(PackStatus::CannotPack):
    case status_code(PackStatus::Unsupported):
    case status_code(PackStatus::Impossible):
      return static_cast<PackErrc>(status);
    default:
      return PackErrc::Impossible;
  }
}

auto SerializationService::classify_unpack_status(int status) -> std::optional<PackErrc> {
  if (status == status_code(PackStatus::Success)) {
    return std::nullopt;
  }
  return PackErrc::Garbled;
}

auto SerializationService::pack_root(const heap::Closure *root)
    -> Expected<std::vector<Word>> {
  if (!root) {
    return tl::unexpected(make_error(PackErrc::Impossible, "null graph root"));
  }

  auto outcome = codec_.pack(root);
  if (auto code = classify_pack_status(outcome.status)) {
    auto error = make_error(*code, fmt::format("pack status {}", outcome.status));
    if (*code == PackErrc::BlackHole) {
      log::debug("trySerialize: {}", error.message());
    } else if (is_fatal(*code)) {
      log::critical("trySerialize: {}", error.message());
    } else {
      log::error("trySerialize: {}", error.message());
    }
    return tl::unexpected(std::move(error));
  }

  log::debug("trySerialize: packed {} words", outcome.words.size());
  return std::move(outcome.words);
}

auto SerializationService::unpack_words(std::span<const Word> words)
    -> Expected<heap::Closure *> {
  auto outcome = codec_.unpack(words);
  if (auto code = classify_unpack_status(outcome.status)) {
    log::error("deserialize: unpack status {} for {} words", outcome.status, words.size());
    return tl::unexpected(
        make_error(*code, fmt::format("unpack status {}", outcome.status)));
  }
  if (!outcome.root) {
    log::error("deserialize: unpack reported success without a root");
    return tl::unexpected(make_error(PackErrc::Garbled, "no root"));
  }
  log::debug("deserialize: unpacked {} words", words.size());
  return outcome.root;
}

} // namespace gp::packing
