// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include "codec_detail.h"

#include <objgraph/builders.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <tsl/robin_set.h>

namespace objgraph::detail {

namespace {

bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

bool is_identifier_char(char c) noexcept
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || is_digit(c) || c == '_';
}

void append_utf8(std::string& out, uint32_t cp)
{
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

using MemberRefs = std::vector<std::pair<std::string_view, const Value*>>;

void write_newline(std::string& out, bool compact, int indent_level)
{
    if (!compact) {
        out += '\n';
        out.append(static_cast<std::size_t>(indent_level) * 2, ' ');
    }
}

void write_members(const MemberRefs& members, std::string& out, LiteralSyntax syntax, bool compact, int indent_level)
{
    if (members.empty()) {
        out += "{}";
        return;
    }
    out += '{';
    for (std::size_t i = 0; i < members.size(); ++i) {
        if (i > 0) out += ',';
        write_newline(out, compact, indent_level + 1);
        out += '"';
        out += escape_string(members[i].first);
        out += compact ? "\":" : "\": ";
        write_literal(*members[i].second, out, syntax, compact, indent_level + 1);
    }
    write_newline(out, compact, indent_level);
    out += '}';
}

} // anonymous namespace

// ============================================================
// Decoded object assembly
// ============================================================

Value make_object(MemberList members, std::string_view format)
{
    tsl::robin_set<std::string_view> seen;
    seen.reserve(members.size());
    const Value* type = nullptr;
    for (const auto& [key, value] : members) {
        if (!seen.insert(key).second) {
            throw DecodeError(std::string(format) + ": duplicate key '" + key + "'");
        }
        if (key == type_key) {
            type = &value;
        }
    }

    if (!type) {
        MapBuilder builder;
        for (auto& [key, value] : members) {
            builder.set(key, std::move(value));
        }
        return builder.finish();
    }

    if (!type->is_string()) {
        throw DecodeError(std::string(format) + ": \"@type\" must be a string");
    }
    TaggedObjectBuilder builder(type->as_string());
    for (auto& [key, value] : members) {
        if (key != type_key) {
            builder.set(key, std::move(value));
        }
    }
    return builder.finish();
}

Value make_tagged(std::string type_name, MemberList fields, std::string_view format)
{
    TaggedObjectBuilder builder(std::move(type_name));
    for (auto& [name, value] : fields) {
        if (name == type_key) {
            throw DecodeError(std::string(format) + ": \"@type\" cannot be a field name");
        }
        if (builder.contains(name)) {
            throw DecodeError(std::string(format) + ": duplicate field '" + name + "'");
        }
        builder.set(name, std::move(value));
    }
    return builder.finish();
}

void check_member_name(std::string_view name)
{
    if (name == type_key) {
        throw UnsupportedValueError("\"@type\" is reserved and cannot be used as a mapping key or field name");
    }
}

DepthGuard::DepthGuard(int& depth, std::string_view format) : depth_(depth)
{
    if (++depth_ > OBJGRAPH_MAX_DECODE_DEPTH) {
        --depth_;
        throw DecodeError(std::string(format) + ": nesting deeper than " +
                          std::to_string(OBJGRAPH_MAX_DECODE_DEPTH));
    }
}

// ============================================================
// Literal output
// ============================================================

std::string escape_string(std::string_view s)
{
    std::string result;
    result.reserve(s.size() + 16);

    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

std::string format_float(double v)
{
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    std::string result(buf, ptr);
    if (result.find_first_of(".e") == std::string::npos) {
        result += ".0";
    }
    return result;
}

bool is_identifier(std::string_view name) noexcept
{
    if (name.empty() || is_digit(name.front())) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), is_identifier_char);
}

void write_literal(const Value& val, std::string& out, LiteralSyntax syntax, bool compact, int indent_level)
{
    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            if (std::isfinite(arg)) {
                out += format_float(arg);
            } else if (syntax == LiteralSyntax::Json) {
                throw UnsupportedValueError("JSON cannot represent the float " +
                                            std::string(std::isnan(arg) ? "nan" : (arg < 0 ? "-inf" : "inf")));
            } else {
                out += std::isnan(arg) ? "nan" : (arg < 0 ? "-inf" : "inf");
            }
        } else if constexpr (std::is_same_v<T, std::string>) {
            out += '"';
            out += escape_string(arg);
            out += '"';
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            if (arg.empty()) {
                out += "[]";
                return;
            }
            out += '[';
            bool first = true;
            for (const auto& element : arg) {
                if (!first) out += ',';
                first = false;
                write_newline(out, compact, indent_level + 1);
                write_literal(element.get(), out, syntax, compact, indent_level + 1);
            }
            write_newline(out, compact, indent_level);
            out += ']';
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            // Sorted keys keep the output deterministic
            MemberRefs members;
            members.reserve(arg.size());
            for (const auto& [key, element] : arg) {
                check_member_name(key);
                members.emplace_back(key, &element.get());
            }
            std::sort(members.begin(), members.end(),
                      [](const auto& a, const auto& b) { return a.first < b.first; });
            write_members(members, out, syntax, compact, indent_level);
        } else if constexpr (std::is_same_v<T, TaggedObject>) {
            const Value type_value{arg.type_name};
            MemberRefs members;
            members.reserve(arg.fields.size() + 1);
            if (syntax == LiteralSyntax::Json) {
                members.emplace_back(type_key, &type_value);
            } else {
                out += '@';
                if (is_identifier(arg.type_name)) {
                    out += arg.type_name;
                } else {
                    out += '"';
                    out += escape_string(arg.type_name);
                    out += '"';
                }
            }
            for (const auto& entry : arg.fields) {
                check_member_name(entry.name);
                members.emplace_back(entry.name, &entry.value.get());
            }
            write_members(members, out, syntax, compact, indent_level);
        }
    }, val.data);
}

// ============================================================
// Literal input
// ============================================================

void LiteralScanner::fail(const std::string& message) const
{
    throw DecodeError(std::string(format_) + ": " + message + " at offset " + std::to_string(pos_));
}

void LiteralScanner::skip_whitespace() noexcept
{
    while (!at_end()) {
        const char c = input_[pos_];
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            break;
        }
        ++pos_;
    }
}

void LiteralScanner::expect(char c)
{
    skip_whitespace();
    if (at_end() || input_[pos_] != c) {
        fail(std::string("expected '") + c + "'");
    }
    ++pos_;
}

bool LiteralScanner::consume_keyword(std::string_view word) noexcept
{
    if (input_.substr(pos_, word.size()) != word) {
        return false;
    }
    const std::size_t next = pos_ + word.size();
    if (next < input_.size() && is_identifier_char(input_[next])) {
        return false;
    }
    pos_ = next;
    return true;
}

uint32_t LiteralScanner::parse_hex4()
{
    uint32_t cp = 0;
    for (int i = 0; i < 4; ++i) {
        if (at_end()) {
            fail("truncated unicode escape");
        }
        const char c = consume();
        cp <<= 4;
        if (c >= '0' && c <= '9') {
            cp |= static_cast<uint32_t>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            cp |= static_cast<uint32_t>(c - 'a' + 10);
        } else if (c >= 'A' && c <= 'F') {
            cp |= static_cast<uint32_t>(c - 'A' + 10);
        } else {
            fail("invalid hex digit in unicode escape");
        }
    }
    return cp;
}

std::string LiteralScanner::parse_string_raw()
{
    expect('"');
    std::string result;

    while (!at_end()) {
        const char c = consume();
        if (c == '"') {
            return result;
        }
        if (static_cast<unsigned char>(c) < 0x20) {
            fail("unescaped control character in string");
        }
        if (c != '\\') {
            result += c;
            continue;
        }
        if (at_end()) {
            break;
        }
        const char escaped = consume();
        switch (escaped) {
            case '"':  result += '"'; break;
            case '\\': result += '\\'; break;
            case '/':  result += '/'; break;
            case 'b':  result += '\b'; break;
            case 'f':  result += '\f'; break;
            case 'n':  result += '\n'; break;
            case 'r':  result += '\r'; break;
            case 't':  result += '\t'; break;
            case 'u': {
                uint32_t cp = parse_hex4();
                if (cp >= 0xD800 && cp <= 0xDBFF) {
                    if (consume() != '\\' || consume() != 'u') {
                        fail("unpaired surrogate in unicode escape");
                    }
                    const uint32_t low = parse_hex4();
                    if (low < 0xDC00 || low > 0xDFFF) {
                        fail("invalid low surrogate in unicode escape");
                    }
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                    fail("unpaired surrogate in unicode escape");
                }
                append_utf8(result, cp);
                break;
            }
            default:
                fail(std::string("invalid escape sequence \\") + escaped);
        }
    }

    fail("unterminated string");
}

Value LiteralScanner::parse_number()
{
    const std::size_t start = pos_;
    bool is_float = false;

    if (peek() == '-') {
        consume();
    }
    if (peek() == '0') {
        consume();
    } else if (is_digit(peek())) {
        while (is_digit(peek())) consume();
    } else {
        fail("invalid number");
    }
    if (peek() == '.') {
        is_float = true;
        consume();
        if (!is_digit(peek())) fail("expected digit after '.'");
        while (is_digit(peek())) consume();
    }
    if (peek() == 'e' || peek() == 'E') {
        is_float = true;
        consume();
        if (peek() == '+' || peek() == '-') consume();
        if (!is_digit(peek())) fail("expected digit in exponent");
        while (is_digit(peek())) consume();
    }

    const char* first = input_.data() + start;
    const char* last = input_.data() + pos_;

    if (is_float) {
        double v = 0.0;
        auto [ptr, ec] = std::from_chars(first, last, v);
        if (ec != std::errc{} || ptr != last) {
            fail("float literal out of range");
        }
        return Value{v};
    }

    int64_t v = 0;
    auto [ptr, ec] = std::from_chars(first, last, v);
    if (ec != std::errc{} || ptr != last) {
        fail("integer literal out of range");
    }
    return Value{v};
}

void LiteralScanner::expect_end()
{
    skip_whitespace();
    if (!at_end()) {
        fail("trailing content");
    }
}

} // namespace objgraph::detail
