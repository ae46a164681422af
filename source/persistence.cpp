// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <objgraph/persistence.h>
#include <objgraph/errors.h>
#include <objgraph/serialization.h>

#include <fstream>
#include <iterator>
#include <sstream>

namespace objgraph {

namespace {

std::string read_file(const std::filesystem::path& path)
{
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        throw IoError("'" + path.string() + "' is a directory");
    }
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IoError("cannot open '" + path.string() + "' for reading");
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw IoError("failed to read '" + path.string() + "'");
    }
    return buffer.str();
}

void write_file(const std::filesystem::path& path, const char* data, std::size_t size)
{
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw IoError("cannot open '" + path.string() + "' for writing");
    }
    file.write(data, static_cast<std::streamsize>(size));
    file.flush();
    if (!file) {
        throw IoError("failed to write '" + path.string() + "'");
    }
}

} // anonymous namespace

Persistence::Persistence(TypeRegistry& registry, SerializeOptions options)
    : serializer_(registry, options), deserializer_(registry)
{
}

// ============================================================
// In-memory
// ============================================================

std::string Persistence::to_text(const Object& instance)
{
    return encode_text(serializer_.serialize(instance));
}

std::string Persistence::to_json(const Object& instance, bool compact)
{
    return encode_json(serializer_.serialize(instance), compact);
}

ByteBuffer Persistence::to_binary(const Object& instance)
{
    return encode_binary(serializer_.serialize(instance));
}

ObjectPtr Persistence::from_text(const std::string& text)
{
    return deserializer_.deserialize(decode_text(text));
}

ObjectPtr Persistence::from_json(const std::string& json)
{
    return deserializer_.deserialize(decode_json(json));
}

ObjectPtr Persistence::from_binary(const ByteBuffer& buffer)
{
    return deserializer_.deserialize(decode_binary(buffer));
}

// ============================================================
// Files
// ============================================================

void Persistence::save_text(const Object& instance, const std::filesystem::path& path)
{
    const std::string text = to_text(instance);
    write_file(path, text.data(), text.size());
}

void Persistence::save_json(const Object& instance, const std::filesystem::path& path)
{
    const std::string json = to_json(instance);
    write_file(path, json.data(), json.size());
}

void Persistence::save_binary(const Object& instance, const std::filesystem::path& path)
{
    const ByteBuffer buffer = to_binary(instance);
    write_file(path, reinterpret_cast<const char*>(buffer.data()), buffer.size());
}

ObjectPtr Persistence::load_text(const std::filesystem::path& path)
{
    return from_text(read_file(path));
}

ObjectPtr Persistence::load_json(const std::filesystem::path& path)
{
    return from_json(read_file(path));
}

ObjectPtr Persistence::load_binary(const std::filesystem::path& path)
{
    const std::string raw = read_file(path);
    return from_binary(ByteBuffer(raw.begin(), raw.end()));
}

} // namespace objgraph
