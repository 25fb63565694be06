#include "heap/heap_codec.hpp"

#include <memory>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include <gflags/gflags.h>

#include "common/logging/log.hpp"
#include "heap/code_table.hpp"

DECLARE_uint64(pack_buffer_words);

namespace gp::heap {
namespace {

using packing::PackOutcome;
using packing::PackStatus;
using packing::UnpackOutcome;
using packing::Word;
using packing::status_code;

static_assert(sizeof(Word) == 8, "heap codec stores 64-bit integers in one word");

constexpr Word kMagic = 0x4750414BU; // "GPAK"
constexpr Word kFormatVersion = 1;
constexpr std::size_t kPreambleWords = 3;
constexpr Word kMaxArity = (Word{1} << 24) - 1;

auto make_header(ClosureKind kind, std::size_t arity) -> Word {
  return static_cast<Word>(kind) | (static_cast<Word>(arity) << 8);
}

/// Closure as recorded by the packer: the kind observed once and the indices
/// of its children, so later state changes cannot tear the packet.
struct PackedNode {
  const Closure *node = nullptr;
  ClosureKind kind = ClosureKind::Int;
  std::vector<Word> children;
};

auto payload_words(const PackedNode &packed) -> std::size_t {
  // header + (value | tag | code) + children
  return 2 + packed.children.size();
}

auto fail(PackStatus status) -> PackOutcome {
  return PackOutcome{status_code(status), {}};
}

/// Decoded closure before allocation.
struct ParsedNode {
  ClosureKind kind = ClosureKind::Int;
  std::uint32_t tag = 0;
  std::int64_t value = 0;
  ThunkCode code = nullptr;
  std::vector<Word> children;
};

class Reader {
public:
  explicit Reader(std::span<const Word> words) : words_(words) {}

  auto next() -> std::optional<Word> {
    if (pos_ >= words_.size()) {
      return std::nullopt;
    }
    return words_[pos_++];
  }

  auto exhausted() const -> bool { return pos_ == words_.size(); }
  auto remaining() const -> std::size_t { return words_.size() - pos_; }

private:
  std::span<const Word> words_;
  std::size_t pos_ = 0;
};

auto parse_node(Reader &reader, Word count) -> std::optional<ParsedNode> {
  auto header = reader.next();
  if (!header) {
    return std::nullopt;
  }
  ParsedNode parsed;
  const auto kind_byte = *header & 0xFFu;
  if ((*header >> 8) > kMaxArity) {
    return std::nullopt;
  }
  const auto arity = static_cast<std::size_t>(*header >> 8);
  auto payload = reader.next();
  if (!payload || arity > reader.remaining()) {
    return std::nullopt;
  }

  switch (kind_byte) {
    case static_cast<Word>(ClosureKind::Int):
      if (arity != 0) {
        return std::nullopt;
      }
      parsed.kind = ClosureKind::Int;
      parsed.value = static_cast<std::int64_t>(*payload);
      break;
    case static_cast<Word>(ClosureKind::Con):
      if (*payload > 0xFFFFFFFFu) {
        return std::nullopt;
      }
      parsed.kind = ClosureKind::Con;
      parsed.tag = static_cast<std::uint32_t>(*payload);
      break;
    case static_cast<Word>(ClosureKind::Thunk): {
      // The code reads exactly as many free variables as it was registered with.
      auto entry = CodeTable::instance().find(*payload);
      if (!entry || entry->arity != arity) {
        return std::nullopt;
      }
      parsed.kind = ClosureKind::Thunk;
      parsed.code = entry->code;
      break;
    }
    default:
      return std::nullopt;
  }

  parsed.children.reserve(arity);
  for (std::size_t i = 0; i < arity; ++i) {
    auto child = reader.next();
    if (!child || *child >= count) {
      return std::nullopt;
    }
    parsed.children.push_back(*child);
  }
  return parsed;
}

} // namespace

auto HeapCodecConfig::from_flags() -> HeapCodecConfig {
  HeapCodecConfig config;
  config.max_words = static_cast<std::size_t>(FLAGS_pack_buffer_words);
  return config;
}

HeapCodec::HeapCodec(Heap &heap, HeapCodecConfig config)
    : heap_(heap), config_(config) {}

auto HeapCodec::pack(const Closure *root) -> PackOutcome {
  root = follow(root);
  if (!root) {
    return fail(PackStatus::Impossible);
  }

  std::vector<PackedNode> order;
  std::unordered_map<const Closure *, Word> index;
  std::size_t total = kPreambleWords;

  auto visit = [&](const Closure *node) -> std::optional<Word> {
    node = follow(node);
    if (!node) {
      return std::nullopt;
    }
    auto [it, inserted] = index.emplace(node, static_cast<Word>(order.size()));
    if (inserted) {
      order.push_back(PackedNode{node, node->load_kind(), {}});
    }
    return it->second;
  };

  visit(root);
  for (std::size_t i = 0; i < order.size(); ++i) {
    const auto *node = order[i].node;
    switch (order[i].kind) {
      case ClosureKind::Int:
        break;
      case ClosureKind::Con:
      case ClosureKind::Thunk: {
        if (node->fields.size() > kMaxArity) {
          return fail(PackStatus::Unsupported);
        }
        std::vector<Word> children;
        children.reserve(node->fields.size());
        for (const auto *field : node->fields) {
          auto child = visit(field);
          if (!child) {
            return fail(PackStatus::Impossible);
          }
          children.push_back(*child);
        }
        order[i].children = std::move(children);
        break;
      }
      case ClosureKind::BlackHole:
        log::debug("pack: closure {} is under evaluation", i);
        return fail(PackStatus::BlackHole);
      case ClosureKind::MutCell:
        return fail(PackStatus::CannotPack);
      case ClosureKind::Foreign:
        return fail(PackStatus::Unsupported);
      case ClosureKind::Indirection:
        // follow() never stops on an indirection with a target.
      default:
        return fail(PackStatus::Impossible);
    }
    total += payload_words(order[i]);
    if (total > config_.max_words) {
      log::debug("pack: graph exceeds {} words", config_.max_words);
      return fail(PackStatus::NoBuffer);
    }
  }

  PackOutcome outcome;
  outcome.status = status_code(PackStatus::Success);
  auto &words = outcome.words;
  words.reserve(total);
  words.push_back(kMagic);
  words.push_back(kFormatVersion);
  words.push_back(static_cast<Word>(order.size()));
  for (const auto &packed : order) {
    words.push_back(make_header(packed.kind, packed.children.size()));
    switch (packed.kind) {
      case ClosureKind::Int:
        words.push_back(static_cast<Word>(packed.node->value));
        break;
      case ClosureKind::Con:
        words.push_back(static_cast<Word>(packed.node->tag));
        break;
      default:
        words.push_back(CodeTable::offset_of(packed.node->code));
        break;
    }
    words.insert(words.end(), packed.children.begin(), packed.children.end());
  }
  log::trace("pack: {} closures in {} words", order.size(), words.size());
  return outcome;
}

auto HeapCodec::unpack(std::span<const Word> words) -> UnpackOutcome {
  const UnpackOutcome garbled{status_code(PackStatus::Garbled), nullptr};
  if (words.size() < kPreambleWords || words[0] != kMagic ||
      words[1] != kFormatVersion) {
    return garbled;
  }
  const Word count = words[2];
  // Every closure takes at least two words.
  if (count == 0 || count > (words.size() - kPreambleWords) / 2) {
    return garbled;
  }

  Reader reader(words.subspan(kPreambleWords));
  std::vector<ParsedNode> parsed;
  parsed.reserve(static_cast<std::size_t>(count));
  for (Word i = 0; i < count; ++i) {
    auto node = parse_node(reader, count);
    if (!node) {
      log::debug("unpack: closure {} is malformed", i);
      return garbled;
    }
    parsed.push_back(std::move(*node));
  }
  if (!reader.exhausted()) {
    log::debug("unpack: {} trailing words", reader.remaining());
    return garbled;
  }

  std::vector<std::unique_ptr<Closure>> closures;
  closures.reserve(parsed.size());
  for (const auto &node : parsed) {
    auto closure = std::make_unique<Closure>(node.kind);
    closure->tag = node.tag;
    closure->value = node.value;
    closure->code = node.code;
    closures.push_back(std::move(closure));
  }
  for (std::size_t i = 0; i < parsed.size(); ++i) {
    auto &fields = closures[i]->fields;
    fields.reserve(parsed[i].children.size());
    for (auto child : parsed[i].children) {
      fields.push_back(closures[static_cast<std::size_t>(child)].get());
    }
  }

  auto *root = closures.front().get();
  heap_.adopt(std::move(closures));
  return UnpackOutcome{status_code(PackStatus::Success), root};
}

} // namespace gp::heap
