// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief Value <-> bytes / text codecs (binary, JSON, literal text).
///
/// All three encodings round-trip a Value exactly, including the
/// distinction between integers and floats. Decoders throw DecodeError on
/// malformed input; encoders throw UnsupportedValueError for values the
/// format cannot represent (non-finite floats in JSON).
///
/// Usage:
/// @code
///   Value data = Value::tagged("Item", {{"value", 5}});
///
///   ByteBuffer buffer = encode_binary(data);
///   Value restored = decode_binary(buffer);
///
///   std::string json = encode_json(data);       // pretty-printed
///   std::string text = encode_text(data);       // @Item{"value": 5}
/// @endcode
///
/// Binary Format Type Tags (1 byte), payloads little-endian:
///   0x00 = null
///   0x01 = bool (1 byte: 0x00=false, 0x01=true)
///   0x02 = int64 (8 bytes)
///   0x03 = double (8 bytes, IEEE 754)
///   0x04 = string (4-byte length + UTF-8 data)
///   0x05 = mapping (4-byte count + (string key, value) entries)
///   0x06 = sequence (4-byte count + values)
///   0x07 = tagged object (string type name + 4-byte count + (string name, value) fields)
///
/// JSON: a tagged object is an object whose first member is "@type".
/// Floats always carry a '.' or an exponent; integers never do.
///
/// Text: JSON-like literal syntax plus
///   - tagged objects: @Type{"field": value} or @"type name"{...}
///   - inf, -inf, nan float literals

#pragma once

#include "api.h"
#include "value.h"

#include <cstdint>
#include <string>
#include <vector>

namespace objgraph {

// ============================================================
// Binary
// ============================================================

[[nodiscard]] OBJGRAPH_API ByteBuffer encode_binary(const Value& val);

/// Throws DecodeError on truncated input, unknown tags, trailing bytes or
/// an empty buffer
[[nodiscard]] OBJGRAPH_API Value decode_binary(const ByteBuffer& buffer);

/// @note Useful for memory-mapped data or network buffers
[[nodiscard]] OBJGRAPH_API Value decode_binary(const uint8_t* data, std::size_t size);

/// Number of bytes encode_binary() will produce
[[nodiscard]] OBJGRAPH_API std::size_t encoded_size(const Value& val);

// ============================================================
// JSON
// ============================================================

/// @param compact If true, produce minimal output; otherwise pretty-print
[[nodiscard]] OBJGRAPH_API std::string encode_json(const Value& val, bool compact = false);

[[nodiscard]] OBJGRAPH_API Value decode_json(const std::string& json_str);

// ============================================================
// Literal text
// ============================================================

/// Multi-line, two-space indented literal text
[[nodiscard]] OBJGRAPH_API std::string encode_text(const Value& val);

[[nodiscard]] OBJGRAPH_API Value decode_text(const std::string& text);

} // namespace objgraph
