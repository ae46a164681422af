// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file persistence.h
/// @brief save/load pairing each encoding with the Serializer/Deserializer.
///
///   save_X(instance, path) = write(encode_X(serialize(instance)))
///   load_X(path)           = deserialize(decode_X(read(path)))
///
/// File access failures raise IoError; malformed content raises
/// DecodeError; structural problems raise the engine's own errors.

#pragma once

#include <objgraph/api.h>
#include <objgraph/object.h>
#include <objgraph/serializer.h>
#include <objgraph/type_registry.h>
#include <objgraph/value.h>

#include <filesystem>
#include <string>

namespace objgraph {

class OBJGRAPH_API Persistence {
public:
    explicit Persistence(TypeRegistry& registry, SerializeOptions options = {});

    void save_text(const Object& instance, const std::filesystem::path& path);
    void save_json(const Object& instance, const std::filesystem::path& path);
    void save_binary(const Object& instance, const std::filesystem::path& path);

    [[nodiscard]] ObjectPtr load_text(const std::filesystem::path& path);
    [[nodiscard]] ObjectPtr load_json(const std::filesystem::path& path);
    [[nodiscard]] ObjectPtr load_binary(const std::filesystem::path& path);

    // In-memory variants (no file step)
    [[nodiscard]] std::string to_text(const Object& instance);
    [[nodiscard]] std::string to_json(const Object& instance, bool compact = false);
    [[nodiscard]] ByteBuffer to_binary(const Object& instance);

    [[nodiscard]] ObjectPtr from_text(const std::string& text);
    [[nodiscard]] ObjectPtr from_json(const std::string& json);
    [[nodiscard]] ObjectPtr from_binary(const ByteBuffer& buffer);

    [[nodiscard]] Serializer& serializer() noexcept { return serializer_; }
    [[nodiscard]] Deserializer& deserializer() noexcept { return deserializer_; }

private:
    Serializer serializer_;
    Deserializer deserializer_;
};

} // namespace objgraph
