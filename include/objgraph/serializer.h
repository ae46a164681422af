// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serializer.h
/// @brief Live objects -> Value (Serializer) and Value -> live objects (Deserializer).
///
/// Write path: instance -> Serializer -> Value -> encoder
/// Read path:  decoder -> Value -> Deserializer -> instance
///
/// Usage:
/// @code
///   TypeRegistry registry;
///   registry.register_type<Item>("Item");
///
///   auto item = registry.create_as<Item>("Item");
///   item->value = 5;
///
///   Serializer serializer(registry);
///   Value v = serializer.serialize(*item);   // Item{"value": 5}
///
///   Deserializer deserializer(registry);
///   auto copy = deserializer.deserialize(v); // fresh tagged Item, value == 5
/// @endcode

#pragma once

#include <objgraph/api.h>
#include <objgraph/objgraph_config.h>
#include <objgraph/object.h>
#include <objgraph/type_registry.h>
#include <objgraph/value.h>
#include <objgraph/variant.h>

#include <string>
#include <vector>

namespace objgraph {

struct SerializeOptions {
    /// Omit fields whose name starts with '_'
    bool skip_underscore = OBJGRAPH_DEFAULT_SKIP_UNDERSCORE != 0;

    /// Write every field. When false, fields deep-equal to the type's
    /// default instance are omitted. Read at serialize time.
    bool serialize_defaults = OBJGRAPH_DEFAULT_SERIALIZE_DEFAULTS != 0;

    /// Throw UnsupportedValueError for untagged nested objects and "@type"
    /// dictionary keys instead of dropping them with a diagnostic
    bool strict = OBJGRAPH_DEFAULT_STRICT != 0;
};

/// True for names hidden by SerializeOptions::skip_underscore
[[nodiscard]] inline bool is_private_field(std::string_view name) noexcept {
    return !name.empty() && name.front() == '_';
}

class OBJGRAPH_API Serializer {
public:
    explicit Serializer(TypeRegistry& registry, SerializeOptions options = {});

    /// Convert a registry-created instance into a TaggedObject Value.
    /// Throws UntaggedInstanceError, or UnsupportedValueError in strict mode.
    [[nodiscard]] Value serialize(const Object& instance);

    /// Convert an arbitrary field value
    [[nodiscard]] Value to_value(const Variant& value);

    [[nodiscard]] const SerializeOptions& options() const noexcept { return options_; }
    void set_options(const SerializeOptions& options) noexcept { options_ = options; }

    /// Downgraded events (untagged objects written as null, reserved
    /// dictionary keys dropped) of the last serialize() or to_value() call
    [[nodiscard]] const std::vector<std::string>& diagnostics() const noexcept { return diagnostics_; }

private:
    [[nodiscard]] Value serialize_object(const Object& instance);
    [[nodiscard]] Value convert(const Variant& value, const std::string& where);

    /// Throw in strict mode, otherwise record a diagnostic
    void downgrade(std::string message);

    TypeRegistry& registry_;
    SerializeOptions options_;
    std::vector<std::string> diagnostics_;
};

class OBJGRAPH_API Deserializer {
public:
    explicit Deserializer(TypeRegistry& registry);

    /// Instantiate and populate an object from a TaggedObject Value (or a
    /// Mapping carrying a string "@type" entry), then call its on_loaded().
    /// Throws MissingTypeTagError, UnknownTypeError, TypeMismatchError;
    /// never returns a partially populated instance.
    [[nodiscard]] ObjectPtr deserialize(const Value& value);

    /// deserialize() followed by a downcast (TypeMismatchError on failure)
    template <typename T>
        requires std::derived_from<T, Object>
    [[nodiscard]] std::shared_ptr<T> deserialize_as(const Value& value) {
        auto typed = std::dynamic_pointer_cast<T>(deserialize(value));
        if (!typed) {
            throw TypeMismatchError("loaded object is not of the requested class");
        }
        return typed;
    }

    /// Convert a Value into a native field value (objects are deserialized)
    [[nodiscard]] Variant from_value(const Value& value);

private:
    void assign_field(Object& instance, const std::string& name, const Value& value);

    TypeRegistry& registry_;
};

} // namespace objgraph
