#include "heap/heap.hpp"
#include "heap/heap_codec.hpp"
#include "heap/values.hpp"
#include "packing/serialization_service.hpp"
#include "packing/text_codec.hpp"
#include "test_support.hpp"

#include <cstdint>
#include <string>
#include <vector>

#include <gtest/gtest.h>

using gp::heap::Heap;
using gp::heap::HeapCodec;
using gp::heap::List;
using gp::packing::ExecutableIdentity;
using gp::packing::Fingerprint;
using gp::packing::PackErrc;
using gp::packing::SerializationService;
using gp::packing::TextCodec;
using gp::packing::TypeIdentity;
using gp::packing::Word;

using IntList = List<std::int64_t>;

namespace {

auto record_for(const std::vector<Word> &words) -> std::string {
  return TextCodec::format_record(ExecutableIdentity::current(), TypeIdentity::of<IntList>(),
                                  words);
}

auto replace_once(std::string text, const std::string &from, const std::string &to)
    -> std::string {
  auto pos = text.find(from);
  EXPECT_NE(pos, std::string::npos) << from;
  if (pos != std::string::npos) {
    text.replace(pos, from.size(), to);
  }
  return text;
}

} // namespace

TEST(TextCodec, ExactLayout) {
  const std::vector<Word> words{0x1, 0x2, 0x3, 0x4, 0xabc};
  auto text = TextCodec::format_record(Fingerprint{1, 2}, Fingerprint{3, 4}, words);
  EXPECT_EQ(text,
            "Serialization Packet, size 5, program 00000000000000010000000000000002\n"
            ", type 00000000000000030000000000000004\n"
            "0:\t0x0000000000000001\t0x0000000000000002\t0x0000000000000003\t0x0000000000000004\n"
            "4:\t0x0000000000000abc\n");
}

TEST(TextCodec, ReparsesToTheSameRecord) {
  const std::vector<Word> words{0xdeadbeef, 0, ~Word{0}, 7, 8, 9, 10, 11, 12};
  const Fingerprint program = ExecutableIdentity::current();
  const Fingerprint type{0x1111, 0x2222};
  auto parsed = TextCodec::parse_record(TextCodec::format_record(program, type, words), program);
  ASSERT_TRUE(parsed.has_value()) << parsed.error().message();
  EXPECT_EQ(parsed->program, program);
  EXPECT_EQ(parsed->type, type);
  EXPECT_EQ(parsed->words, words);
}

TEST(TextCodec, EmptyRecordRoundTrips) {
  const Fingerprint program = ExecutableIdentity::current();
  auto text = TextCodec::format_record(program, Fingerprint{5, 6}, {});
  auto parsed = TextCodec::parse_record(text, program);
  ASSERT_TRUE(parsed.has_value()) << parsed.error().message();
  EXPECT_TRUE(parsed->words.empty());
}

TEST(TextCodec, EndToEndList) {
  Heap heap;
  HeapCodec graph(heap);
  SerializationService service(graph);
  TextCodec codec;
  const std::vector<std::int64_t> values{1, 2, 3};

  auto packet = service.try_serialize(gp::heap::make_list(heap, values));
  ASSERT_TRUE(packet.has_value());
  auto text = codec.encode(*packet);

  auto decoded = codec.decode<IntList>(text);
  ASSERT_TRUE(decoded.has_value()) << decoded.error().message();
  EXPECT_TRUE(*decoded == *packet);

  auto value = service.deserialize(std::move(*decoded));
  ASSERT_TRUE(value.has_value()) << value.error().message();
  EXPECT_EQ(gp::heap::list_to_vector(heap, *value), values);
}

TEST(TextCodec, LazyListRoundTrip) {
  Heap heap;
  HeapCodec graph(heap);
  SerializationService service(graph);
  TextCodec codec;
  auto list = gp::heap::enum_from_to(heap, 1, 12);
  gp::heap::force_prefix(heap, list, 4);

  auto packet = service.try_serialize(list);
  ASSERT_TRUE(packet.has_value());
  auto decoded = codec.decode<IntList>(codec.encode(*packet));
  ASSERT_TRUE(decoded.has_value()) << decoded.error().message();
  auto value = service.deserialize(std::move(*decoded));
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(gp::heap::evaluated_prefix(*value), 4u);
  EXPECT_EQ(gp::heap::list_to_vector(heap, *value).size(), 12u);
}

TEST(TextCodec, ForeignBinaryIsRejectedBeforeReconstruction) {
  Heap heap;
  ScriptedCodec graph;
  SerializationService service(graph);
  Fingerprint other = ExecutableIdentity::current();
  other.lo ^= 1;
  auto text = TextCodec::format_record(other, TypeIdentity::of<IntList>(),
                                         std::vector<Word>{1, 2, 3});

  auto decoded = TextCodec{}.decode<IntList>(text);
  ASSERT_FALSE(decoded.has_value());
  EXPECT_EQ(decoded.error().code, PackErrc::BinaryMismatch);
  EXPECT_EQ(graph.unpack_calls, 0);
}

TEST(TextCodec, BinaryMismatchIsRaisedBeforeTheRowsAreRead) {
  Fingerprint other = ExecutableIdentity::current();
  other.hi ^= 0x8000;
  std::string text = "Serialization Packet, size 3, program " + gp::packing::to_hex(other) +
                     "\n, type nonsense\nthis is not a row\n";
  auto decoded = TextCodec{}.decode<IntList>(text);
  ASSERT_FALSE(decoded.has_value());
  EXPECT_EQ(decoded.error().code, PackErrc::BinaryMismatch);
}

TEST(TextCodec, WrongTypeIsRejected) {
  Heap heap;
  HeapCodec graph(heap);
  SerializationService service(graph);
  auto packet = service.try_serialize(gp::heap::make_list(heap, std::vector<std::int64_t>{1}));
  ASSERT_TRUE(packet.has_value());
  auto text = TextCodec{}.encode(*packet);

  auto as_int = TextCodec{}.decode<std::int64_t>(text);
  ASSERT_FALSE(as_int.has_value());
  EXPECT_EQ(as_int.error().code, PackErrc::TypeMismatch);

  auto as_other_list = TextCodec{}.decode<List<std::int32_t>>(text);
  ASSERT_FALSE(as_other_list.has_value());
  EXPECT_EQ(as_other_list.error().code, PackErrc::TypeMismatch);
}

TEST(TextCodec, DeclaredSizeMustMatch) {
  const std::vector<Word> words{1, 2, 3, 4};
  auto text = record_for(words);

  auto longer = TextCodec{}.decode<IntList>(replace_once(text, "size 4,", "size 5,"));
  ASSERT_FALSE(longer.has_value());
  EXPECT_EQ(longer.error().code, PackErrc::ParseError);

  auto shorter = TextCodec{}.decode<IntList>(replace_once(text, "size 4,", "size 3,"));
  ASSERT_FALSE(shorter.has_value());
  EXPECT_EQ(shorter.error().code, PackErrc::ParseError);
}

TEST(TextCodec, MalformedInputIsAParseError) {
  const auto good = record_for({1, 2, 3, 4, 5});
  const std::vector<std::string> bad{
      "",
      "Serialization Packet",
      replace_once(good, "Serialization", "Serialisation"),
      replace_once(good, "size 5", "size x"),
      replace_once(good, ", type ", ", kind "),
      replace_once(good, "4:", "5:"),
      replace_once(good, "0:", "0"),
      replace_once(good, "\t0x0000000000000002", "\t0000000000000002"),
      replace_once(good, "\t0x0000000000000002", "\t0x"),
      replace_once(good, "\t0x0000000000000002", "\t0x00000000000000002"),
      replace_once(good, "\t0x0000000000000002", "\t0x00000000000000g2"),
      good + "trailing",
      good + "8:\n",
  };
  for (const auto &text : bad) {
    auto decoded = TextCodec{}.decode<IntList>(text);
    ASSERT_FALSE(decoded.has_value()) << text;
    EXPECT_EQ(decoded.error().code, PackErrc::ParseError) << text;
  }
}

TEST(TextCodec, ToleratesWhitespaceVariants) {
  const std::vector<Word> words{1, 2, 3, 4, 5};
  auto text = record_for(words);
  text = replace_once(text, "\t0x0000000000000002", "  0x2");
  text = replace_once(text, "\n4:", " \r\n\n4:");
  text += "  \n\n";
  auto decoded = TextCodec::parse_record(text, ExecutableIdentity::current());
  ASSERT_TRUE(decoded.has_value()) << decoded.error().message();
  EXPECT_EQ(decoded->words, words);
}
