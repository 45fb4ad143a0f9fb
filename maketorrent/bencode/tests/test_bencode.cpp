#include <catch2/catch_all.hpp>

#include <string>

#include "../bencode.hpp"

using namespace maketorrent::bencode;

TEST_CASE("BencodeParser: decodes scalars") {
    CHECK(BencodeParser::parse("i42e").asInt() == 42);
    CHECK(BencodeParser::parse("i-7e").asInt() == -7);
    CHECK(BencodeParser::parse("i0e").asInt() == 0);
    CHECK(BencodeParser::parse("5:hello").asString() == "hello");
    CHECK(BencodeParser::parse("0:").asString().empty());
}

TEST_CASE("BencodeParser: rejects non-canonical integers") {
    CHECK_THROWS_AS(BencodeParser::parse("i-0e"), std::runtime_error);
    CHECK_THROWS_AS(BencodeParser::parse("i03e"), std::runtime_error);
    CHECK_THROWS_AS(BencodeParser::parse("ie"), std::runtime_error);
    CHECK_THROWS_AS(BencodeParser::parse("i99999999999999999999e"), std::runtime_error);
}

TEST_CASE("BencodeParser: rejects truncated and trailing input") {
    CHECK_THROWS_AS(BencodeParser::parse("10:abc"), std::runtime_error);
    CHECK_THROWS_AS(BencodeParser::parse("l4:spam"), std::runtime_error);
    CHECK_THROWS_AS(BencodeParser::parse("i1eX"), std::runtime_error);
    CHECK_THROWS_AS(BencodeParser::parse(""), std::runtime_error);
}

TEST_CASE("BencodeParser: rejects duplicate keys and non-string keys") {
    CHECK_THROWS_AS(BencodeParser::parse("d1:ai1e1:ai2ee"), std::runtime_error);
    CHECK_THROWS_AS(BencodeParser::parse("di1ei2ee"), std::runtime_error);
}

TEST_CASE("BencodeParser: rejects excessive nesting") {
    std::string deep(BencodeParser::kMaxDepth + 2, 'l');
    deep += std::string(BencodeParser::kMaxDepth + 2, 'e');
    CHECK_THROWS_AS(BencodeParser::parse(deep), std::runtime_error);
}

TEST_CASE("BencodeParser: encodes dict keys in sorted order") {
    BencodeValue::Dict d;
    d["zeta"] = BencodeValue(int64_t{1});
    d["alpha"] = BencodeValue("x");
    d["piece length"] = BencodeValue(int64_t{262144});

    const auto out = BencodeParser::encode(BencodeValue(std::move(d)));
    CHECK(out == "d5:alpha1:x12:piece lengthi262144e4:zetai1ee");
}

TEST_CASE("BencodeParser: encodes binary strings verbatim") {
    std::string raw("\x00\xff\x10", 3);
    CHECK(BencodeParser::encode(BencodeValue(raw)) == std::string("3:\x00\xff\x10", 5));
}

TEST_CASE("BencodeParser: None cannot be encoded") {
    CHECK_THROWS_AS(BencodeParser::encode(BencodeValue{}), std::runtime_error);
}

TEST_CASE("BencodeParser: nested list/dict structure survives decode") {
    auto v = BencodeParser::parse("d5:filesld6:lengthi3e4:pathl1:a5:b.binee"
                                  "d6:lengthi0e4:pathl1:ceeee");
    REQUIRE(v.isDict());
    const auto* files = v.find("files");
    REQUIRE(files != nullptr);
    REQUIRE(files->asList().size() == 2);
    const auto& first = files->asList()[0];
    CHECK(first.find("length")->asInt() == 3);
    CHECK(first.find("path")->asList()[1].asString() == "b.bin");
    CHECK(v.find("missing") == nullptr);
}

TEST_CASE("BencodeParser: parseWithInfoSlice captures exact top-level info bytes") {
    const std::string doc = "d8:announce3:url4:infod4:name1:x6:lengthi5eee";
    auto res = BencodeParser::parseWithInfoSlice(doc);
    REQUIRE(res.infoSlice.has_value());
    CHECK(*res.infoSlice == "d4:name1:x6:lengthi5ee");
}

TEST_CASE("BencodeParser: nested info keys are not captured") {
    const std::string doc = "d5:outerd4:infoi1eee";
    auto res = BencodeParser::parseWithInfoSlice(doc);
    CHECK_FALSE(res.infoSlice.has_value());
}

TEST_CASE("BencodeValue: typed accessors throw on mismatch") {
    BencodeValue v(int64_t{3});
    CHECK_THROWS_AS(v.asString(), std::runtime_error);
    CHECK_THROWS_AS(v.asList(), std::runtime_error);
    CHECK_THROWS_AS(v.find("k"), std::runtime_error);
}
