#include "marshal.h"

#include "test_support.h"

#include "doctest.h"

#include <string>

namespace gemfetch {

namespace {

std::int64_t decode_integer(std::int64_t value) {
  test::marshal_builder b;
  b.integer(value);
  return marshal_document::parse(b.bytes()).root().as_integer();
}

}  // namespace

TEST_CASE("marshal decodes fixnum boundaries") {
  for (std::int64_t const v : { 0, 1, 122, 123, 255, 256, 65535, 65536, -1, -123, -124,
                                -256, -257, 1 << 29, -(1 << 29) }) {
    CAPTURE(v);
    CHECK(decode_integer(v) == v);
  }
}

TEST_CASE("marshal decodes literal fixnum bytes") {
  CHECK(marshal_document::parse(std::string{ "\x04\x08i\x00", 4 }).root().as_integer() == 0);
  CHECK(marshal_document::parse("\x04\x08i\x06").root().as_integer() == 1);
  CHECK(marshal_document::parse("\x04\x08i\xfa").root().as_integer() == -1);
  CHECK(marshal_document::parse("\x04\x08i\x01\xc8").root().as_integer() == 200);
  CHECK(marshal_document::parse("\x04\x08i\xff\x38").root().as_integer() == -200);
}

TEST_CASE("marshal decodes nil, booleans and bignums") {
  CHECK(marshal_document::parse("\x04\x08" "0").root().is_nil());
  CHECK(marshal_document::parse("\x04\x08T").root().is(marshal_type::TRUE_VALUE));
  CHECK(marshal_document::parse("\x04\x08" "F").root().is(marshal_type::FALSE_VALUE));

  // 2**32 as "l+" with 3 words
  std::string const big{ "\x04\x08l+\x08\x00\x00\x00\x00\x01\x00", 11 };
  CHECK(marshal_document::parse(big).root().as_integer() == (std::int64_t{ 1 } << 32));
}

TEST_CASE("marshal decodes strings with encoding ivars") {
  // "abc".force_encoding("UTF-8") -> I"\x08abc\x06:\x06ET
  auto const &root{ marshal_document::parse("\x04\x08I\"\x08" "abc\x06:\x06" "ET").root() };
  CHECK(root.as_string() == "abc");
  REQUIRE(root.ivar("E") != nullptr);
  CHECK(root.ivar("E")->is(marshal_type::TRUE_VALUE));
}

TEST_CASE("marshal decodes hashes with symbol keys and symbol links") {
  test::marshal_builder b;
  b.array(2);
  b.hash(2).symbol("name").str("rack").symbol("number").str("2.2.3");
  b.hash(1).symbol("name").str("rake");

  auto const doc{ marshal_document::parse(b.bytes()) };
  auto const &items{ doc.root().as_array() };
  REQUIRE(items.size() == 2);
  CHECK(items[0]->get("name")->as_string() == "rack");
  CHECK(items[0]->get("number")->as_string() == "2.2.3");
  CHECK(items[1]->get("name")->as_string() == "rake");
  CHECK(items[1]->get("missing") == nullptr);
  CHECK(items[0]->get("name")->as_string() == items[0]->entries[0].second->text);
}

TEST_CASE("marshal resolves object links") {
  test::marshal_builder b;
  b.array(2).str("shared").raw("@\x06");
  auto const doc{ marshal_document::parse(b.bytes()) };
  auto const &items{ doc.root().as_array() };
  REQUIRE(items.size() == 2);
  CHECK(items[0] == items[1]);
}

TEST_CASE("marshal decodes objects and user types") {
  test::marshal_builder b;
  b.array(3);
  b.object("Gem::Dependency", 1).symbol("@name").str("rack");
  b.gem_version("1.2.0");
  b.user_dump("Gem::Specification", "payload");

  auto const doc{ marshal_document::parse(b.bytes()) };
  auto const &items{ doc.root().as_array() };

  CHECK(items[0]->is(marshal_type::OBJECT));
  CHECK(items[0]->class_name == "Gem::Dependency");
  CHECK(items[0]->ivar("@name")->as_string() == "rack");

  CHECK(items[1]->is(marshal_type::USER_MARSHAL));
  CHECK(items[1]->class_name == "Gem::Version");
  CHECK(items[1]->payload->as_array()[0]->as_string() == "1.2.0");

  CHECK(items[2]->is(marshal_type::USER_DUMP));
  CHECK(items[2]->text == "payload");
}

TEST_CASE("marshal rejects malformed input") {
  CHECK_THROWS_AS(marshal_document::parse(""), marshal_error);
  CHECK_THROWS_AS(marshal_document::parse("\x04\x09" "0"), marshal_error);
  CHECK_THROWS_AS(marshal_document::parse("\x03\x08" "0"), marshal_error);
  CHECK_THROWS_AS(marshal_document::parse("\x04\x08[\x07" "0"), marshal_error);
  CHECK_THROWS_AS(marshal_document::parse("\x04\x08\"\x0a" "ab"), marshal_error);
  CHECK_THROWS_AS(marshal_document::parse("\x04\x08;\x06"), marshal_error);
  CHECK_THROWS_AS(marshal_document::parse("\x04\x08@\x06"), marshal_error);
  CHECK_THROWS_AS(marshal_document::parse("\x04\x08Z"), marshal_error);
}

TEST_CASE("marshal_value accessors check their type") {
  auto const doc{ marshal_document::parse("\x04\x08i\x06") };
  CHECK_THROWS_AS(doc.root().as_string(), marshal_error);
  CHECK_THROWS_AS(doc.root().as_array(), marshal_error);
  CHECK(doc.root().get("x") == nullptr);
}

TEST_CASE("marshal rejects deeply nested input") {
  std::string bytes{ "\x04\x08" };
  for (int i{ 0 }; i < 10000; ++i) { bytes += "[\x06"; }
  bytes += "0";
  CHECK_THROWS_AS(marshal_document::parse(bytes), marshal_error);
}

TEST_CASE("marshal rejects deeply wrapped symbols") {
  // Object whose class name is behind a long run of ivar wrappers.
  std::string bytes{ "\x04\x08o" };
  bytes += std::string(100000, 'I');
  CHECK_THROWS_WITH_AS(marshal_document::parse(bytes),
                       "marshal: nesting too deep",
                       marshal_error);
}

}  // namespace gemfetch
