// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// codec_detail.h - pieces shared by the binary, JSON and text codecs (not installed)

#pragma once

#include <objgraph/errors.h>
#include <objgraph/objgraph_config.h>
#include <objgraph/value.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace objgraph::detail {

/// Members of a decoded object, in input order
using MemberList = std::vector<std::pair<std::string, Value>>;

/// Build a Mapping, or a TaggedObject when a "@type" member is present.
/// Duplicate keys and a non-string "@type" are DecodeError.
[[nodiscard]] Value make_object(MemberList members, std::string_view format);

/// Build a TaggedObject from explicit fields. Duplicate names and a field
/// named "@type" are DecodeError.
[[nodiscard]] Value make_tagged(std::string type_name, MemberList fields, std::string_view format);

/// Throws UnsupportedValueError when an encoder meets "@type" as a mapping
/// key or field name
void check_member_name(std::string_view name);

/// Tracks container nesting while decoding; throws DecodeError past
/// OBJGRAPH_MAX_DECODE_DEPTH
class DepthGuard {
public:
    DepthGuard(int& depth, std::string_view format);
    ~DepthGuard() { --depth_; }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

private:
    int& depth_;
};

// ============================================================
// Literal (JSON / text) output
// ============================================================

enum class LiteralSyntax {
    Json, ///< tagged objects as {"@type": ...}; non-finite floats rejected
    Text, ///< tagged objects as @Type{...}; inf, -inf, nan allowed
};

/// Escape for a double-quoted string literal (both syntaxes)
[[nodiscard]] std::string escape_string(std::string_view s);

/// Shortest round-trip form of a finite double, always with '.' or an exponent
[[nodiscard]] std::string format_float(double v);

/// [A-Za-z_][A-Za-z0-9_]*
[[nodiscard]] bool is_identifier(std::string_view name) noexcept;

/// Append @p val to @p out. Throws UnsupportedValueError for non-finite
/// floats in JSON and for the reserved key used as a mapping key or field.
void write_literal(const Value& val, std::string& out, LiteralSyntax syntax, bool compact, int indent_level);

// ============================================================
// Literal (JSON / text) input
// ============================================================

/// Cursor over literal input, with the lexical rules both syntaxes share
class LiteralScanner {
public:
    LiteralScanner(std::string_view input, std::string_view format)
        : input_(input), format_(format) {}

protected:
    [[noreturn]] void fail(const std::string& message) const;

    [[nodiscard]] bool at_end() const noexcept { return pos_ >= input_.size(); }
    [[nodiscard]] char peek() const noexcept { return at_end() ? '\0' : input_[pos_]; }
    char consume() noexcept { return at_end() ? '\0' : input_[pos_++]; }

    void skip_whitespace() noexcept;
    void expect(char c);

    /// Consume @p word if it is next and not followed by an identifier character
    bool consume_keyword(std::string_view word) noexcept;

    [[nodiscard]] std::string parse_string_raw();

    /// JSON number grammar; integers stay int64, the rest become double
    [[nodiscard]] Value parse_number();

    /// Only whitespace may follow the top-level value
    void expect_end();

    std::string_view input_;
    std::string_view format_;
    std::size_t pos_ = 0;
    int depth_ = 0;

private:
    [[nodiscard]] uint32_t parse_hex4();
};

} // namespace objgraph::detail
