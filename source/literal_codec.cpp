// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// literal_codec.cpp - JSON and literal text encodings

#include <objgraph/serialization.h>
#include <objgraph/builders.h>

#include "codec_detail.h"

#include <limits>

namespace objgraph {

namespace {

using detail::LiteralSyntax;

// ============================================================
// Parser (JSON grammar, plus @Type{...}, inf and nan in text mode)
// ============================================================

class LiteralParser : public detail::LiteralScanner {
public:
    LiteralParser(std::string_view input, LiteralSyntax syntax)
        : LiteralScanner(input, syntax == LiteralSyntax::Json ? "JSON" : "text"), syntax_(syntax) {}

    Value parse() {
        skip_whitespace();
        if (at_end()) {
            fail("empty input");
        }
        Value result = parse_value();
        expect_end();
        return result;
    }

private:
    LiteralSyntax syntax_;

    [[nodiscard]] bool text_mode() const noexcept { return syntax_ == LiteralSyntax::Text; }

    Value parse_value() {
        skip_whitespace();
        const char c = peek();

        if (c == '{') return parse_object();
        if (c == '[') return parse_array();
        if (c == '"') return Value{parse_string_raw()};
        if (text_mode()) {
            if (c == '@') return parse_tagged();
            if (consume_keyword("inf")) return Value{std::numeric_limits<double>::infinity()};
            if (consume_keyword("nan")) return Value{std::numeric_limits<double>::quiet_NaN()};
            if (c == '-' && input_.substr(pos_ + 1, 3) == "inf") {
                consume();
                if (consume_keyword("inf")) return Value{-std::numeric_limits<double>::infinity()};
                fail("invalid number");
            }
        }
        if (c == '-' || (c >= '0' && c <= '9')) return parse_number();
        if (consume_keyword("true")) return Value{true};
        if (consume_keyword("false")) return Value{false};
        if (consume_keyword("null")) return Value{};

        if (at_end()) {
            fail("unexpected end of input");
        }
        fail(std::string("unexpected character '") + c + "'");
    }

    detail::MemberList parse_members() {
        expect('{');
        detail::MemberList members;

        skip_whitespace();
        if (peek() == '}') {
            consume();
            return members;
        }

        while (true) {
            skip_whitespace();
            if (peek() != '"') {
                fail("expected string key");
            }
            std::string key = parse_string_raw();
            expect(':');
            Value val = parse_value();
            members.emplace_back(std::move(key), std::move(val));

            skip_whitespace();
            const char c = consume();
            if (c == '}') {
                break;
            }
            if (c != ',') {
                fail("expected ',' or '}' in object");
            }
        }
        return members;
    }

    Value parse_object() {
        detail::DepthGuard guard(depth_, format_);
        return detail::make_object(parse_members(), format_);
    }

    Value parse_tagged() {
        detail::DepthGuard guard(depth_, format_);
        consume();  // '@'

        std::string type_name;
        if (peek() == '"') {
            type_name = parse_string_raw();
        } else {
            const std::size_t start = pos_;
            while (!at_end()) {
                const char c = peek();
                const bool ident = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                                   (c >= '0' && c <= '9') || c == '_';
                if (!ident) break;
                consume();
            }
            type_name = std::string(input_.substr(start, pos_ - start));
            if (!detail::is_identifier(type_name)) {
                fail("expected type name after '@'");
            }
        }
        return detail::make_tagged(std::move(type_name), parse_members(), format_);
    }

    Value parse_array() {
        detail::DepthGuard guard(depth_, format_);
        expect('[');

        VectorBuilder builder;
        skip_whitespace();
        if (peek() == ']') {
            consume();
            return builder.finish();
        }

        while (true) {
            builder.push_back(parse_value());

            skip_whitespace();
            const char c = consume();
            if (c == ']') {
                break;
            }
            if (c != ',') {
                fail("expected ',' or ']' in array");
            }
        }
        return builder.finish();
    }
};

} // anonymous namespace

// ============================================================
// JSON
// ============================================================

std::string encode_json(const Value& val, bool compact)
{
    std::string out;
    detail::write_literal(val, out, LiteralSyntax::Json, compact, 0);
    return out;
}

Value decode_json(const std::string& json_str)
{
    return LiteralParser(json_str, LiteralSyntax::Json).parse();
}

// ============================================================
// Literal text
// ============================================================

std::string encode_text(const Value& val)
{
    std::string out;
    detail::write_literal(val, out, LiteralSyntax::Text, false, 0);
    return out;
}

Value decode_text(const std::string& text)
{
    return LiteralParser(text, LiteralSyntax::Text).parse();
}

} // namespace objgraph
