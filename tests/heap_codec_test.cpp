#include "heap/code_table.hpp"
#include "heap/heap.hpp"
#include "heap/heap_codec.hpp"
#include "heap/values.hpp"
#include "test_support.hpp"

#include <cstdint>
#include <stdexcept>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace {

using gp::heap::Closure;
using gp::heap::ClosureKind;
using gp::heap::Heap;
using gp::heap::HeapCodec;
using gp::packing::PackStatus;
using gp::packing::Word;
using gp::packing::status_code;

auto never_built_code(Heap &heap, std::span<Closure *const>) -> Closure * {
  return heap.make_int(0);
}

auto header(ClosureKind kind, std::size_t arity) -> Word {
  return static_cast<Word>(kind) | (static_cast<Word>(arity) << 8);
}

auto pack_ok(HeapCodec &codec, const Closure *root) -> std::vector<Word> {
  auto outcome = codec.pack(root);
  EXPECT_EQ(outcome.status, status_code(PackStatus::Success));
  return outcome.words;
}

} // namespace

TEST(HeapCodec, PacksAndUnpacksList) {
  Heap heap;
  HeapCodec codec(heap);
  const std::vector<std::int64_t> values{1, 2, 3};
  auto words = pack_ok(codec, gp::heap::make_list(heap, values).node());

  Heap target;
  HeapCodec into(target);
  auto outcome = into.unpack(words);
  ASSERT_EQ(outcome.status, status_code(PackStatus::Success));
  ASSERT_NE(outcome.root, nullptr);
  gp::heap::Ref<gp::heap::List<std::int64_t>> copy(outcome.root);
  EXPECT_EQ(gp::heap::list_to_vector(target, copy), values);
  // 3 Ints + 3 Cons + Nil
  EXPECT_EQ(target.size(), 7u);
}

TEST(HeapCodec, LayoutOfASingleInt) {
  Heap heap;
  HeapCodec codec(heap);
  auto words = pack_ok(codec, heap.make_int(-5));
  ASSERT_EQ(words.size(), 5u);
  EXPECT_EQ(words[0], 0x4750414Bu);
  EXPECT_EQ(words[1], 1u);
  EXPECT_EQ(words[2], 1u);
  EXPECT_EQ(words[3], static_cast<Word>(ClosureKind::Int));
  EXPECT_EQ(static_cast<std::int64_t>(words[4]), -5);
}

TEST(HeapCodec, PreservesSharing) {
  Heap heap;
  HeapCodec codec(heap);
  auto *shared = heap.make_int(9);
  auto *pair = heap.make_con(3, {shared, shared});
  auto outcome = codec.unpack(pack_ok(codec, pair));
  ASSERT_EQ(outcome.status, 0);
  ASSERT_EQ(outcome.root->fields.size(), 2u);
  EXPECT_EQ(outcome.root->fields[0], outcome.root->fields[1]);
  EXPECT_NE(outcome.root->fields[0], shared);
  EXPECT_EQ(outcome.root->tag, 3u);
}

TEST(HeapCodec, PreservesCycles) {
  Heap heap;
  HeapCodec codec(heap);
  auto *node = heap.make_con(gp::heap::kConsTag, {heap.make_int(1), heap.make_int(0)});
  node->fields[1] = node; // repeat 1
  auto outcome = codec.unpack(pack_ok(codec, node));
  ASSERT_EQ(outcome.status, 0);
  EXPECT_EQ(outcome.root->fields[1], outcome.root);
  EXPECT_EQ(outcome.root->fields[0]->value, 1);
}

TEST(HeapCodec, KeepsSuspendedComputations) {
  Heap heap;
  HeapCodec codec(heap);
  auto list = gp::heap::enum_from_to(heap, 1, 6);
  gp::heap::force_prefix(heap, list, 2);

  auto outcome = codec.unpack(pack_ok(codec, list.node()));
  ASSERT_EQ(outcome.status, 0);
  gp::heap::Ref<gp::heap::List<std::int64_t>> copy(outcome.root);
  EXPECT_EQ(gp::heap::evaluated_prefix(copy), 2u);
  EXPECT_EQ(gp::heap::list_to_vector(heap, copy),
            (std::vector<std::int64_t>{1, 2, 3, 4, 5, 6}));
  // The original is untouched by evaluating the copy.
  EXPECT_EQ(gp::heap::evaluated_prefix(list), 2u);
}

TEST(HeapCodec, EvaluatedThunksAreReplacedByValues) {
  Heap heap;
  HeapCodec codec(heap);
  auto total = gp::heap::lazy_sum(heap, gp::heap::enum_from_to(heap, 1, 4));
  ASSERT_EQ(gp::heap::read_int(heap, total), 10);
  auto words = pack_ok(codec, total.node());
  EXPECT_EQ(words.size(), 5u);
  EXPECT_EQ(words[3], static_cast<Word>(ClosureKind::Int));
}

TEST(HeapCodec, BlackHoleIsReportedWithoutBlocking) {
  Heap heap;
  HeapCodec codec(heap);
  HeldComputation held;
  g_held = &held;
  auto *busy = heap.make_thunk(&held_code, {});
  auto *root = heap.make_con(1, {heap.make_int(0), busy});

  std::thread owner([&] { heap.force(busy); });
  ASSERT_TRUE(held.wait_entered(std::chrono::seconds(5)));
  EXPECT_EQ(codec.pack(root).status, status_code(PackStatus::BlackHole));

  held.release();
  owner.join();
  EXPECT_EQ(codec.pack(root).status, status_code(PackStatus::Success));
  g_held = nullptr;
}

TEST(HeapCodec, MutableCellCannotBePacked) {
  Heap heap;
  HeapCodec codec(heap);
  auto cell = gp::heap::make_cell(heap, gp::heap::make_int(heap, 1));
  auto *root = heap.make_con(1, {cell.node()});
  auto outcome = codec.pack(root);
  EXPECT_EQ(outcome.status, status_code(PackStatus::CannotPack));
  EXPECT_TRUE(outcome.words.empty());
}

TEST(HeapCodec, ForeignHandleIsUnsupported) {
  Heap heap;
  HeapCodec codec(heap);
  int resource = 0;
  auto handle = gp::heap::make_foreign(heap, &resource);
  EXPECT_EQ(codec.pack(handle.node()).status, status_code(PackStatus::Unsupported));
}

TEST(HeapCodec, BufferLimit) {
  Heap heap;
  const std::vector<std::int64_t> values{1, 2, 3, 4, 5, 6, 7, 8};
  auto list = gp::heap::make_list(heap, values);

  HeapCodec small(heap, gp::heap::HeapCodecConfig{16});
  EXPECT_EQ(small.pack(list.node()).status, status_code(PackStatus::NoBuffer));

  HeapCodec large(heap, gp::heap::HeapCodecConfig{1024});
  EXPECT_EQ(large.pack(list.node()).status, status_code(PackStatus::Success));
}

TEST(HeapCodec, MalformedListCellsAreRejectedWhenRead) {
  // Structurally valid closures that do not form a list.
  const std::vector<Word> cons_without_fields{
      0x4750414Bu, 1, 1, header(ClosureKind::Con, 0), gp::heap::kConsTag};
  const std::vector<Word> nil_with_a_field{
      0x4750414Bu, 1, 2, header(ClosureKind::Con, 1), gp::heap::kNilTag, 1,
      header(ClosureKind::Int, 0), 5};

  for (const auto &words : {cons_without_fields, nil_with_a_field}) {
    Heap target;
    HeapCodec codec(target);
    auto outcome = codec.unpack(words);
    ASSERT_EQ(outcome.status, status_code(PackStatus::Success));
    gp::heap::Ref<gp::heap::List<std::int64_t>> list(outcome.root);
    EXPECT_THROW(gp::heap::list_to_vector(target, list), std::logic_error);
    EXPECT_EQ(gp::heap::evaluated_prefix(list), 0u);
  }
}

TEST(HeapCodec, ConfigFromFlags) {
  auto config = gp::heap::HeapCodecConfig::from_flags();
  EXPECT_EQ(config.max_words, std::size_t{1} << 20);
}

class HeapCodecGarbled : public ::testing::Test {
protected:
  void SetUp() override {
    const std::vector<std::int64_t> values{4, 5};
    auto lazy = gp::heap::enum_from_to(source_, 1, 3);
    auto *root = source_.make_con(2, {gp::heap::make_list(source_, values).node(), lazy.node()});
    HeapCodec codec(source_);
    auto outcome = codec.pack(root);
    ASSERT_EQ(outcome.status, 0);
    words_ = outcome.words;
  }

  /// Position of the first thunk header in words_.
  auto find_thunk() const -> std::size_t {
    std::size_t pos = 3;
    for (Word i = 0; i < words_[2]; ++i) {
      const auto arity = static_cast<std::size_t>(words_[pos] >> 8);
      if ((words_[pos] & 0xFFu) == static_cast<Word>(ClosureKind::Thunk)) {
        return pos;
      }
      pos += 2 + arity;
    }
    ADD_FAILURE() << "no thunk in packed graph";
    return 0;
  }

  auto expect_garbled(const std::vector<Word> &words) -> void {
    HeapCodec codec(target_);
    auto outcome = codec.unpack(words);
    EXPECT_EQ(outcome.status, status_code(PackStatus::Garbled));
    EXPECT_EQ(outcome.root, nullptr);
    EXPECT_EQ(target_.size(), 0u);
  }

  Heap source_;
  Heap target_;
  std::vector<Word> words_;
};

TEST_F(HeapCodecGarbled, ValidBaseline) {
  HeapCodec codec(target_);
  EXPECT_EQ(codec.unpack(words_).status, 0);
}

TEST_F(HeapCodecGarbled, Empty) {
  expect_garbled({});
}

TEST_F(HeapCodecGarbled, BadMagic) {
  words_[0] ^= 1;
  expect_garbled(words_);
}

TEST_F(HeapCodecGarbled, BadVersion) {
  words_[1] = 99;
  expect_garbled(words_);
}

TEST_F(HeapCodecGarbled, ZeroOrHugeCount) {
  auto zero = words_;
  zero[2] = 0;
  expect_garbled(zero);
  words_[2] = ~Word{0};
  expect_garbled(words_);
}

TEST_F(HeapCodecGarbled, Truncated) {
  words_.pop_back();
  expect_garbled(words_);
}

TEST_F(HeapCodecGarbled, TrailingWords) {
  words_.push_back(0);
  expect_garbled(words_);
}

TEST_F(HeapCodecGarbled, UnknownKind) {
  words_[3] = (words_[3] & ~Word{0xFF}) | 0x7F;
  expect_garbled(words_);
}

TEST_F(HeapCodecGarbled, FieldIndexOutOfRange) {
  // Root is Con(list, lazy): header, tag, then its two field indices.
  ASSERT_EQ(words_[3] & 0xFFu, static_cast<Word>(ClosureKind::Con));
  words_[5] = words_[2];
  expect_garbled(words_);
}

TEST_F(HeapCodecGarbled, UnregisteredCode) {
  const auto pos = find_thunk();
  ASSERT_NE(pos, 0u);
  words_[pos + 1] = gp::heap::CodeTable::offset_of(&never_built_code);
  expect_garbled(words_);
}

TEST_F(HeapCodecGarbled, ThunkWithoutItsFreeVariables) {
  const auto pos = find_thunk();
  ASSERT_NE(pos, 0u);
  // enum_from_to reads [from, to].
  ASSERT_EQ(words_[pos] >> 8, 2u);
  const Word code = words_[pos + 1];
  expect_garbled({0x4750414Bu, 1, 1, header(ClosureKind::Thunk, 0), code});
}

TEST_F(HeapCodecGarbled, ThunkWithExtraFreeVariables) {
  const auto pos = find_thunk();
  ASSERT_NE(pos, 0u);
  const Word code = words_[pos + 1];
  expect_garbled({0x4750414Bu, 1, 2, header(ClosureKind::Thunk, 3), code, 1, 1, 1,
                  header(ClosureKind::Int, 0), 7});
}

TEST_F(HeapCodecGarbled, ArityBeyondHeaderField) {
  words_[3] |= Word{1} << 40;
  expect_garbled(words_);
}
