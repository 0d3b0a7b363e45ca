#include "nbt_writer.hpp"
#include <nbtcmp/nbtcmp.hpp>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace nbtcmp;
using nbt_test::Writer;

TEST(Decode, MinimalDocumentIsEmptyMap) {
  std::string nbt = nbt_test::minimal_document();
  DocumentView doc;
  Value root = load_reuse(doc, nbt);
  EXPECT_TRUE(root.is_map());
  EXPECT_EQ(root.size(), 0u);
  EXPECT_EQ(root.dump(), "{}");
}

TEST(Decode, RootNameIsDiscarded) {
  std::string a = Writer().root("one").add_int("x", 1).end().str();
  std::string b = Writer().root("another").add_int("x", 1).end().str();
  EXPECT_TRUE(compare(a, b));
}

TEST(Decode, NumericSpansAliasSource) {
  std::string nbt = Writer().root().add_int("Seed", 42).add_byte("B", -1).end().str();
  DocumentView doc;
  Value root = load_reuse(doc, nbt);
  auto seed = root.find("Seed");
  ASSERT_TRUE(seed.has_value());
  EXPECT_TRUE(seed->is_span());
  EXPECT_EQ(seed->tag(), detail::to_u8(TagId::Int));
  EXPECT_EQ(seed->bytes(), std::string_view("\x00\x00\x00\x2a", 4));
  EXPECT_GE(seed->bytes().data(), nbt.data());
  EXPECT_LT(seed->bytes().data(), nbt.data() + nbt.size());
  EXPECT_EQ(root.find("B")->bytes(), "\xff");
  EXPECT_FALSE(root.find("missing").has_value());
}

TEST(Decode, ArraysAndStrings) {
  std::string nbt = Writer()
                        .root()
                        .add_byte_array("BA", {1, 2, 3})
                        .add_int_array("IA", {1, 2})
                        .add_long_array("LA", {7})
                        .add_string("S", "hello")
                        .add_string("E", "")
                        .end()
                        .str();
  DocumentView doc;
  Value root = load_reuse(doc, nbt);
  EXPECT_EQ(root.find("BA")->size(), 3u);
  EXPECT_EQ(root.find("IA")->size(), 8u);
  EXPECT_EQ(root.find("LA")->size(), 8u);
  EXPECT_EQ(root.find("S")->bytes(), "hello");
  EXPECT_TRUE(root.find("E")->is_span());
  EXPECT_TRUE(root.find("E")->bytes().empty());
}

TEST(Decode, NumericListIsOneSpan) {
  std::string nbt = Writer().root().add_int_list("Pos", {1, 2, 3}).end().str();
  DocumentView doc;
  Value root = load_reuse(doc, nbt);
  Value pos = *root.find("Pos");
  EXPECT_TRUE(pos.is_span());
  EXPECT_EQ(pos.tag(), detail::to_u8(TagId::List));
  EXPECT_EQ(pos.size(), 12u);
  // Root map, key, one span: no per-element nodes.
  EXPECT_EQ(doc.tape.size(), 3u);
}

TEST(Decode, CompoundListIsSequence) {
  Writer w;
  w.root().begin_list("L", 10, 2);
  w.add_int("a", 1).end();
  w.add_int("b", 2).add_string("c", "x").end();
  w.end();
  std::string nbt = w.str();
  DocumentView doc;
  Value l = *load_reuse(doc, nbt).find("L");
  ASSERT_TRUE(l.is_list());
  EXPECT_EQ(l.size(), 2u);
  std::vector<size_t> sizes;
  l.for_each_element([&](Value e) {
    EXPECT_TRUE(e.is_map());
    sizes.push_back(e.size());
  });
  EXPECT_EQ(sizes, (std::vector<size_t>{1, 2}));
}

TEST(Decode, ListsOfStringsListsAndArrays) {
  Writer w;
  w.root();
  w.begin_list("S", 8, 2).text("a").text("bc");
  w.begin_list("LL", 9, 2);
  w.u8(3).u32(1).u32(5); // inner Int list [5]
  w.u8(8).u32(1).text("z");
  w.begin_list("A", 12, 1).u32(1).u64(9);
  w.end();
  std::string nbt = w.str();
  DocumentView doc;
  Value root = load_reuse(doc, nbt);
  EXPECT_EQ(root.find("S")->dump(), R"(["a","bc"])");
  EXPECT_EQ(root.find("LL")->dump(), R"([TAG_List(0x00000005),["z"]])");
  EXPECT_EQ(root.find("A")->dump(), "[TAG_Long_Array(0x0000000000000009)]");
}

TEST(Decode, EmptyListsAreEmptySequences) {
  Writer w;
  w.root().begin_list("End", 0, 0).begin_list("Int", 3, 0).begin_list("Cmp", 10, 0).end();
  std::string nbt = w.str();
  DocumentView doc;
  Value root = load_reuse(doc, nbt);
  for (const char *k : {"End", "Int", "Cmp"}) {
    Value v = *root.find(k);
    EXPECT_TRUE(v.is_list()) << k;
    EXPECT_EQ(v.size(), 0u) << k;
  }
  EXPECT_EQ(*root.find("End"), *root.find("Int"));
  EXPECT_EQ(*root.find("Int"), *root.find("Cmp"));
}

TEST(Decode, NestedCompounds) {
  Writer w;
  w.root().begin_compound("a").begin_compound("b").add_short("c", 3).end().end().end();
  std::string nbt = w.str();
  DocumentView doc;
  Value root = load_reuse(doc, nbt);
  EXPECT_EQ(root.dump(), "{a:{b:{c:TAG_Short(0x0003)}}}");
  Value c = *root.find("a")->find("b")->find("c");
  EXPECT_EQ(c.bytes(), std::string_view("\x00\x03", 2));
}

TEST(Decode, SampleDocumentDump) {
  std::string nbt = nbt_test::sample_document();
  DocumentView doc;
  Value root = load_reuse(doc, nbt);
  EXPECT_EQ(root.size(), 15u);
  EXPECT_EQ(root.find("Entities")->dump(),
            R"([{id:"zombie",hp:TAG_Int(0x00000014)},{id:"cow"}])");
  EXPECT_EQ(root.find("Data")->dump(), "{x:TAG_Int(0x00000001),Empty:[]}");
}

TEST(Decode, TrailingBytesAreIgnored) {
  std::string nbt = nbt_test::minimal_document() + "garbage";
  DocumentView doc;
  EXPECT_NO_THROW(load_reuse(doc, nbt));
}

TEST(Decode, DocumentViewIsReusable) {
  std::string big = nbt_test::sample_document();
  std::string small = Writer().root().add_int("x", 1).end().str();
  DocumentView doc;
  load_reuse(doc, big);
  size_t cap = doc.tape.capacity();
  Value v = load_reuse(doc, small);
  EXPECT_EQ(doc.tape.capacity(), cap);
  EXPECT_EQ(v.dump(), "{x:TAG_Int(0x00000001)}");
}

TEST(Decode, ManyElementsGrowTape) {
  Writer w;
  w.root().begin_list("L", 8, 5000);
  for (int i = 0; i < 5000; ++i)
    w.text("s");
  w.end();
  std::string nbt = w.str();
  DocumentView doc;
  Value root = load_reuse(doc, nbt);
  EXPECT_EQ(root.find("L")->size(), 5000u);
  EXPECT_EQ(doc.tape.size(), 5003u);
}
