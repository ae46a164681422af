// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <objgraph/serializer.h>
#include <objgraph/builders.h>
#include <objgraph/errors.h>
#include <objgraph/log.h>

namespace objgraph {

Serializer::Serializer(TypeRegistry& registry, SerializeOptions options)
    : registry_(registry), options_(options)
{
}

Value Serializer::serialize(const Object& instance)
{
    diagnostics_.clear();
    return serialize_object(instance);
}

Value Serializer::to_value(const Variant& value)
{
    diagnostics_.clear();
    return convert(value, "value");
}

Value Serializer::serialize_object(const Object& instance)
{
    if (!instance.is_tagged()) {
        throw UntaggedInstanceError("cannot serialize an instance that was not created by the registry");
    }

    const std::string& type = instance.type_name();

    // Fetched per call so a change of serialize_defaults applies immediately
    const Object* defaults = options_.serialize_defaults ? nullptr : registry_.default_instance(type);

    TaggedObjectBuilder builder(type);
    for (const auto& name : instance.field_names()) {
        if (options_.skip_underscore && is_private_field(name)) {
            continue;
        }
        Variant current = instance.get(name);
        if (defaults && defaults->has_field(name) && defaults->get(name) == current) {
            continue;
        }
        builder.set(name, convert(current, type + "." + name));
    }
    return builder.finish();
}

Value Serializer::convert(const Variant& value, const std::string& where)
{
    return std::visit([&](const auto& arg) -> Value {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            return Value{};
        } else if constexpr (std::is_same_v<T, bool> ||
                             std::is_same_v<T, int64_t> ||
                             std::is_same_v<T, double> ||
                             std::is_same_v<T, std::string>) {
            return Value{arg};
        } else if constexpr (std::is_same_v<T, Array>) {
            VectorBuilder builder;
            const auto& elements = arg.elements();
            for (std::size_t i = 0; i < elements.size(); ++i) {
                builder.push_back(convert(elements[i], where + "[" + std::to_string(i) + "]"));
            }
            return builder.finish();
        } else if constexpr (std::is_same_v<T, Dictionary>) {
            MapBuilder builder;
            for (const auto& [key, element] : arg.entries()) {
                if (key == type_key) {
                    downgrade("reserved key \"@type\" in dictionary at " + where);
                    continue;
                }
                builder.set(key, convert(element, where + "[\"" + key + "\"]"));
            }
            return builder.finish();
        } else {
            if (!arg) {
                return Value{};
            }
            if (arg->is_tagged()) {
                return serialize_object(*arg);
            }
            downgrade("untagged object at " + where);
            return Value{};
        }
    }, value.data);
}

void Serializer::downgrade(std::string message)
{
    if (options_.strict) {
        throw UnsupportedValueError(message);
    }
    detail::log_warning("Serializer::serialize", message + " dropped");
    diagnostics_.push_back(std::move(message));
}

} // namespace objgraph
