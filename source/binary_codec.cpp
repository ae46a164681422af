// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// binary_codec.cpp - length-prefixed binary encoding

#include <objgraph/serialization.h>
#include <objgraph/builders.h>

#include "codec_detail.h"

#include <algorithm>
#include <bit>
#include <limits>

namespace objgraph {

namespace {

constexpr std::string_view binary_format = "binary";

enum class TypeTag : uint8_t {
    Null     = 0x00,
    Bool     = 0x01,
    Int      = 0x02,
    Float    = 0x03,
    String   = 0x04,
    Mapping  = 0x05,
    Sequence = 0x06,
    Tagged   = 0x07,
};

// Fixed-width fields are written byte by byte, least significant first,
// so the format does not depend on the host byte order
class ByteWriter {
public:
    ByteBuffer buffer;

    void write_tag(TypeTag tag) {
        buffer.push_back(static_cast<uint8_t>(tag));
    }

    void write_u8(uint8_t v) {
        buffer.push_back(v);
    }

    void write_u32(uint32_t v) {
        for (int i = 0; i < 4; ++i) {
            buffer.push_back(static_cast<uint8_t>(v >> (8 * i)));
        }
    }

    void write_u64(uint64_t v) {
        for (int i = 0; i < 8; ++i) {
            buffer.push_back(static_cast<uint8_t>(v >> (8 * i)));
        }
    }

    void write_i64(int64_t v) {
        write_u64(static_cast<uint64_t>(v));
    }

    void write_f64(double v) {
        write_u64(std::bit_cast<uint64_t>(v));
    }

    void write_length(std::size_t n) {
        if (n > std::numeric_limits<uint32_t>::max()) {
            throw UnsupportedValueError("binary: length " + std::to_string(n) + " does not fit in 32 bits");
        }
        write_u32(static_cast<uint32_t>(n));
    }

    void write_string(const std::string& s) {
        write_length(s.size());
        buffer.insert(buffer.end(), s.begin(), s.end());
    }
};

class ByteReader {
public:
    const uint8_t* data;
    std::size_t size;
    std::size_t pos = 0;
    int depth = 0;

    ByteReader(const uint8_t* d, std::size_t s) : data(d), size(s) {}

    bool has_bytes(std::size_t n) const {
        return n <= size - pos;
    }

    void require(std::size_t n) const {
        if (!has_bytes(n)) {
            throw DecodeError("binary: unexpected end of buffer at offset " + std::to_string(pos));
        }
    }

    uint8_t read_u8() {
        require(1);
        return data[pos++];
    }

    uint32_t read_u32() {
        require(4);
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) {
            v |= static_cast<uint32_t>(data[pos + i]) << (8 * i);
        }
        pos += 4;
        return v;
    }

    uint64_t read_u64() {
        require(8);
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) {
            v |= static_cast<uint64_t>(data[pos + i]) << (8 * i);
        }
        pos += 8;
        return v;
    }

    int64_t read_i64() {
        return static_cast<int64_t>(read_u64());
    }

    double read_f64() {
        return std::bit_cast<double>(read_u64());
    }

    std::string read_string() {
        const uint32_t len = read_u32();
        require(len);
        std::string s(reinterpret_cast<const char*>(data + pos), len);
        pos += len;
        return s;
    }

    /// Element count of a container; every element takes at least one byte
    uint32_t read_count() {
        const uint32_t count = read_u32();
        require(count);
        return count;
    }
};

// Forward declarations
void serialize_value(ByteWriter& w, const Value& val);
Value deserialize_value(ByteReader& r);

void serialize_value(ByteWriter& w, const Value& val) {
    std::visit([&w](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            w.write_tag(TypeTag::Null);
        } else if constexpr (std::is_same_v<T, bool>) {
            w.write_tag(TypeTag::Bool);
            w.write_u8(arg ? 0x01 : 0x00);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            w.write_tag(TypeTag::Int);
            w.write_i64(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            w.write_tag(TypeTag::Float);
            w.write_f64(arg);
        } else if constexpr (std::is_same_v<T, std::string>) {
            w.write_tag(TypeTag::String);
            w.write_string(arg);
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            // Sorted keys give identical bytes for equal mappings
            std::vector<std::pair<const std::string*, const Value*>> entries;
            entries.reserve(arg.size());
            for (const auto& [k, v] : arg) {
                detail::check_member_name(k);
                entries.emplace_back(&k, &v.get());
            }
            std::sort(entries.begin(), entries.end(),
                      [](const auto& a, const auto& b) { return *a.first < *b.first; });

            w.write_tag(TypeTag::Mapping);
            w.write_length(entries.size());
            for (const auto& [k, v] : entries) {
                w.write_string(*k);
                serialize_value(w, *v);
            }
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            w.write_tag(TypeTag::Sequence);
            w.write_length(arg.size());
            for (const auto& v : arg) {
                serialize_value(w, v.get());
            }
        } else if constexpr (std::is_same_v<T, TaggedObject>) {
            w.write_tag(TypeTag::Tagged);
            w.write_string(arg.type_name);
            w.write_length(arg.fields.size());
            for (const auto& entry : arg.fields) {
                detail::check_member_name(entry.name);
                w.write_string(entry.name);
                serialize_value(w, entry.value.get());
            }
        }
    }, val.data);
}

Value deserialize_value(ByteReader& r) {
    const std::size_t tag_offset = r.pos;
    const uint8_t tag = r.read_u8();

    switch (static_cast<TypeTag>(tag)) {
        case TypeTag::Null:
            return Value{};

        case TypeTag::Bool: {
            const uint8_t b = r.read_u8();
            if (b > 1) {
                throw DecodeError("binary: invalid bool byte at offset " + std::to_string(r.pos - 1));
            }
            return Value{b == 1};
        }

        case TypeTag::Int:
            return Value{r.read_i64()};

        case TypeTag::Float:
            return Value{r.read_f64()};

        case TypeTag::String:
            return Value{r.read_string()};

        case TypeTag::Mapping: {
            detail::DepthGuard guard(r.depth, binary_format);
            const uint32_t count = r.read_count();
            detail::MemberList members;
            members.reserve(count);
            for (uint32_t i = 0; i < count; ++i) {
                std::string key = r.read_string();
                Value val = deserialize_value(r);
                members.emplace_back(std::move(key), std::move(val));
            }
            return detail::make_object(std::move(members), binary_format);
        }

        case TypeTag::Sequence: {
            detail::DepthGuard guard(r.depth, binary_format);
            const uint32_t count = r.read_count();
            VectorBuilder builder;
            for (uint32_t i = 0; i < count; ++i) {
                builder.push_back(deserialize_value(r));
            }
            return builder.finish();
        }

        case TypeTag::Tagged: {
            detail::DepthGuard guard(r.depth, binary_format);
            std::string type_name = r.read_string();
            const uint32_t count = r.read_count();
            detail::MemberList fields;
            fields.reserve(count);
            for (uint32_t i = 0; i < count; ++i) {
                std::string name = r.read_string();
                Value val = deserialize_value(r);
                fields.emplace_back(std::move(name), std::move(val));
            }
            return detail::make_tagged(std::move(type_name), std::move(fields), binary_format);
        }
    }

    throw DecodeError("binary: unknown type tag " + std::to_string(tag) +
                      " at offset " + std::to_string(tag_offset));
}

std::size_t calc_encoded_size(const Value& val) {
    std::size_t size = 1; // type tag

    std::visit([&size](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            // no payload
        } else if constexpr (std::is_same_v<T, bool>) {
            size += 1;
        } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, double>) {
            size += 8;
        } else if constexpr (std::is_same_v<T, std::string>) {
            size += 4 + arg.size();
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            size += 4; // count
            for (const auto& [k, v] : arg) {
                size += 4 + k.size();
                size += calc_encoded_size(v.get());
            }
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            size += 4; // count
            for (const auto& v : arg) {
                size += calc_encoded_size(v.get());
            }
        } else if constexpr (std::is_same_v<T, TaggedObject>) {
            size += 4 + arg.type_name.size();
            size += 4; // count
            for (const auto& entry : arg.fields) {
                size += 4 + entry.name.size();
                size += calc_encoded_size(entry.value.get());
            }
        }
    }, val.data);

    return size;
}

} // anonymous namespace

ByteBuffer encode_binary(const Value& val)
{
    ByteWriter w;
    w.buffer.reserve(calc_encoded_size(val));
    serialize_value(w, val);
    return std::move(w.buffer);
}

Value decode_binary(const ByteBuffer& buffer)
{
    return decode_binary(buffer.data(), buffer.size());
}

Value decode_binary(const uint8_t* data, std::size_t size)
{
    if (size == 0 || data == nullptr) {
        throw DecodeError("binary: empty buffer");
    }
    ByteReader r(data, size);
    Value result = deserialize_value(r);
    if (r.pos != size) {
        throw DecodeError("binary: " + std::to_string(size - r.pos) + " trailing bytes after value");
    }
    return result;
}

std::size_t encoded_size(const Value& val)
{
    return calc_encoded_size(val);
}

} // namespace objgraph
