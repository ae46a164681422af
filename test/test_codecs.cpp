// test_codecs.cpp - Tests for the binary, JSON and text encodings

#include <catch2/catch_all.hpp>
#include <objgraph/serialization.h>

#include <cmath>
#include <limits>

using namespace objgraph;

namespace {

Value sample_document()
{
    return Value::tagged("Level", {
        {"name", "castle"},
        {"scale", 1.0},
        {"count", 1},
        {"open", false},
        {"owner", nullptr},
        {"tags", Value::vector({"a", "b\n\"c\""})},
        {"rooms", Value::map({
            {"hall", Value::tagged("Room", {{"size", 4}})},
            {"tower", Value::tagged("Room", {{"size", -2}})},
        })},
    });
}

} // namespace

// ============================================================
// JSON
// ============================================================

TEST_CASE("JSON output", "[codec][json]") {
    SECTION("compact tagged object with the type first") {
        REQUIRE(encode_json(Value::tagged("Item", {{"value", 5}}), true) ==
                R"({"@type":"Item","value":5})");
    }

    SECTION("floats always carry a fraction or exponent") {
        REQUIRE(encode_json(Value{1.0}, true) == "1.0");
        REQUIRE(encode_json(Value{1}, true) == "1");
        REQUIRE(encode_json(Value{0.5}, true) == "0.5");
    }

    SECTION("mapping keys are sorted") {
        Value v = Value::map({{"b", 1}, {"a", 2}});
        REQUIRE(encode_json(v, true) == R"({"a":2,"b":1})");
    }

    SECTION("pretty output is indented by two spaces") {
        REQUIRE(encode_json(Value::vector({1}), false) == "[\n  1\n]");
        REQUIRE(encode_json(Value::map({}), false) == "{}");
    }

    SECTION("strings are escaped") {
        REQUIRE(encode_json(Value{"a\"b\\c\n"}, true) == R"("a\"b\\c\n")");
    }
}

TEST_CASE("JSON round trip", "[codec][json]") {
    Value doc = sample_document();
    REQUIRE(decode_json(encode_json(doc)) == doc);
    REQUIRE(decode_json(encode_json(doc, true)) == doc);

    SECTION("int and float stay distinct") {
        Value restored = decode_json("[1, 1.0, 1e2, -0]");
        REQUIRE(restored.at(std::size_t{0}).is_int());
        REQUIRE(restored.at(std::size_t{1}).is_float());
        REQUIRE(restored.at(std::size_t{2}).as_float() == 100.0);
        REQUIRE(restored.at(std::size_t{3}).is_int());
    }

    SECTION("a member named @type makes a tagged object") {
        Value restored = decode_json(R"({"value": 5, "@type": "Item"})");
        REQUIRE(restored == Value::tagged("Item", {{"value", 5}}));
    }

    SECTION("unicode escapes") {
        REQUIRE(decode_json(R"("\u00e9")").as_string() == "\xC3\xA9");
        REQUIRE(decode_json(R"("\ud83d\ude00")").as_string() == "\xF0\x9F\x98\x80");
    }
}

TEST_CASE("Malformed JSON", "[codec][json][errors]") {
    auto rejects = [](const std::string& input) {
        REQUIRE_THROWS_AS(decode_json(input), DecodeError);
    };

    SECTION("syntax") {
        rejects("");
        rejects("   ");
        rejects("{");
        rejects("[1,]");
        rejects("{\"a\" 1}");
        rejects("'a'");
        rejects("01");
        rejects("1.");
        rejects("tru");
        rejects("\"unterminated");
        rejects("\"\\ud83d\"");
        rejects("1 2");
    }

    SECTION("structure") {
        rejects(R"({"a": 1, "a": 2})");
        rejects(R"({"@type": 5})");
    }

    SECTION("integer overflow") {
        rejects("99999999999999999999");
    }

    SECTION("excessive nesting") {
        rejects(std::string(600, '['));
    }

    SECTION("errors name the offset") {
        try {
            (void)decode_json("[1,]");
            FAIL("expected DecodeError");
        } catch (const DecodeError& e) {
            REQUIRE(std::string(e.what()).find("offset") != std::string::npos);
        }
    }
}

TEST_CASE("JSON rejects values it cannot represent", "[codec][json][errors]") {
    REQUIRE_THROWS_AS(encode_json(Value{std::numeric_limits<double>::quiet_NaN()}), UnsupportedValueError);
    REQUIRE_THROWS_AS(encode_json(Value{std::numeric_limits<double>::infinity()}), UnsupportedValueError);
    REQUIRE_THROWS_AS(encode_json(Value::map({{"@type", "Item"}})), UnsupportedValueError);
}

// ============================================================
// Text
// ============================================================

TEST_CASE("Text output", "[codec][text]") {
    REQUIRE(encode_text(Value::tagged("Item", {{"value", 5}})) == "@Item{\n  \"value\": 5\n}");
    REQUIRE(encode_text(Value::tagged("type name")) == "@\"type name\"{}");
    REQUIRE(encode_text(Value{-std::numeric_limits<double>::infinity()}) == "-inf");
}

TEST_CASE("Text round trip", "[codec][text]") {
    Value doc = sample_document();
    REQUIRE(decode_text(encode_text(doc)) == doc);

    SECTION("non-finite floats") {
        const double inf = std::numeric_limits<double>::infinity();
        Value v = Value::vector({inf, -inf});
        REQUIRE(decode_text(encode_text(v)) == v);

        Value nan = decode_text(encode_text(Value{std::numeric_limits<double>::quiet_NaN()}));
        REQUIRE(nan.is_float());
        REQUIRE(std::isnan(nan.as_float()));
    }

    SECTION("quoted type names") {
        Value v = Value::tagged("type name", {{"x", 1}});
        REQUIRE(decode_text(encode_text(v)) == v);
    }

    SECTION("plain mappings and JSON-style tags") {
        REQUIRE(decode_text(R"({"k": [1, 2.5]})") == Value::map({{"k", Value::vector({1, 2.5})}}));
        REQUIRE(decode_text(R"({"@type": "Item"})") == Value::tagged("Item"));
    }
}

TEST_CASE("Malformed text", "[codec][text][errors]") {
    REQUIRE_THROWS_AS(decode_text(""), DecodeError);
    REQUIRE_THROWS_AS(decode_text("@{}"), DecodeError);
    REQUIRE_THROWS_AS(decode_text("@Item"), DecodeError);
    REQUIRE_THROWS_AS(decode_text("@Item{\"v\": 1, \"v\": 2}"), DecodeError);
    REQUIRE_THROWS_AS(decode_text("@Item{\"@type\": \"Item\"}"), DecodeError);
    REQUIRE_THROWS_AS(decode_text("infinity"), DecodeError);
    REQUIRE_THROWS_AS(decode_text("[1] x"), DecodeError);
}

// ============================================================
// Binary
// ============================================================

TEST_CASE("Binary layout", "[codec][binary]") {
    SECTION("int64 is a tag and eight little-endian bytes") {
        REQUIRE((encode_binary(Value{1}) == ByteBuffer{0x02, 1, 0, 0, 0, 0, 0, 0, 0}));
    }

    SECTION("scalars") {
        REQUIRE((encode_binary(Value{}) == ByteBuffer{0x00}));
        REQUIRE((encode_binary(Value{true}) == ByteBuffer{0x01, 0x01}));
        REQUIRE((encode_binary(Value{"ab"}) == ByteBuffer{0x04, 2, 0, 0, 0, 'a', 'b'}));
    }

    SECTION("tagged object") {
        ByteBuffer expected{0x07, 2, 0, 0, 0, 'I', 't', 1, 0, 0, 0,
                            1, 0, 0, 0, 'v', 0x01, 0x00};
        REQUIRE(encode_binary(Value::tagged("It", {{"v", false}})) == expected);
    }

    SECTION("encoded_size matches the buffer") {
        Value doc = sample_document();
        REQUIRE(encoded_size(doc) == encode_binary(doc).size());
    }
}

TEST_CASE("Binary round trip", "[codec][binary]") {
    Value doc = sample_document();
    ByteBuffer buffer = encode_binary(doc);
    REQUIRE(decode_binary(buffer) == doc);
    REQUIRE(decode_binary(buffer.data(), buffer.size()) == doc);

    SECTION("mapping order does not change the bytes") {
        Value a = Value::map({{"x", 1}, {"y", 2}});
        Value b = Value::map({{"y", 2}, {"x", 1}});
        REQUIRE(encode_binary(a) == encode_binary(b));
    }

    SECTION("non-finite floats survive") {
        const double inf = std::numeric_limits<double>::infinity();
        REQUIRE(decode_binary(encode_binary(Value{-inf})) == Value{-inf});
    }
}

TEST_CASE("Malformed binary", "[codec][binary][errors]") {
    SECTION("empty buffer") {
        REQUIRE_THROWS_AS(decode_binary(ByteBuffer{}), DecodeError);
    }

    SECTION("truncated") {
        ByteBuffer buffer = encode_binary(sample_document());
        buffer.pop_back();
        REQUIRE_THROWS_AS(decode_binary(buffer), DecodeError);
        REQUIRE_THROWS_AS(decode_binary(ByteBuffer{0x02, 1, 0}), DecodeError);
    }

    SECTION("unknown tag") {
        REQUIRE_THROWS_AS(decode_binary(ByteBuffer{0x2A}), DecodeError);
    }

    SECTION("invalid bool") {
        REQUIRE_THROWS_AS(decode_binary(ByteBuffer{0x01, 0x02}), DecodeError);
    }

    SECTION("trailing bytes") {
        REQUIRE_THROWS_AS(decode_binary(ByteBuffer{0x00, 0x00}), DecodeError);
    }

    SECTION("count larger than the input") {
        REQUIRE_THROWS_AS(decode_binary(ByteBuffer{0x06, 0xFF, 0xFF, 0xFF, 0x7F}), DecodeError);
    }

    SECTION("duplicate keys") {
        ByteBuffer buffer{0x05, 2, 0, 0, 0,
                          1, 0, 0, 0, 'a', 0x00,
                          1, 0, 0, 0, 'a', 0x00};
        REQUIRE_THROWS_AS(decode_binary(buffer), DecodeError);
    }
}

TEST_CASE("Binary rejects the reserved key", "[codec][binary][errors]") {
    REQUIRE_THROWS_AS(encode_binary(Value::map({{"@type", 1}})), UnsupportedValueError);
}
