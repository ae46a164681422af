// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <objgraph/serializer.h>
#include <objgraph/errors.h>
#include <objgraph/log.h>

namespace objgraph {

namespace {

/// Type name carried by a Mapping's "@type" entry, or nullptr
const std::string* mapping_type_tag(const ValueMap& map)
{
    const ValueBox* tag = map.find(std::string(type_key));
    if (!tag) {
        return nullptr;
    }
    if (auto* name = tag->get().get_if<std::string>()) {
        return name;
    }
    throw MissingTypeTagError("\"@type\" entry is not a string");
}

std::string describe_field(const Object& instance, const std::string& name)
{
    return "field '" + name + "' of '" + instance.type_name() + "'";
}

} // anonymous namespace

Deserializer::Deserializer(TypeRegistry& registry)
    : registry_(registry)
{
}

ObjectPtr Deserializer::deserialize(const Value& value)
{
    if (auto* obj = value.get_if<TaggedObject>()) {
        ObjectPtr instance = registry_.create(obj->type_name);
        for (const auto& entry : obj->fields) {
            assign_field(*instance, entry.name, entry.value.get());
        }
        instance->on_loaded();
        return instance;
    }

    if (auto* map = value.get_if<ValueMap>()) {
        if (const std::string* type = mapping_type_tag(*map)) {
            ObjectPtr instance = registry_.create(*type);

            // Mapping order is unspecified: assign in declaration order
            for (const auto& name : instance->field_names()) {
                if (const ValueBox* field = map->find(name)) {
                    assign_field(*instance, name, field->get());
                }
            }
            for (const auto& [key, field] : *map) {
                if (key != type_key && !instance->has_field(key)) {
                    detail::log_key_error("Deserializer::deserialize", key,
                                          "is not a field of '" + *type + "', skipped");
                }
            }
            instance->on_loaded();
            return instance;
        }
    }

    throw MissingTypeTagError("cannot deserialize " + value_to_string(value) + ": no type tag");
}

Variant Deserializer::from_value(const Value& value)
{
    return std::visit([this, &value](const auto& arg) -> Variant {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            return Variant{};
        } else if constexpr (std::is_same_v<T, bool> ||
                             std::is_same_v<T, int64_t> ||
                             std::is_same_v<T, double> ||
                             std::is_same_v<T, std::string>) {
            return Variant{arg};
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            Array result;
            for (const auto& element : arg) {
                result.push_back(from_value(element.get()));
            }
            return Variant{std::move(result)};
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            if (mapping_type_tag(arg)) {
                return Variant{deserialize(value)};
            }
            Dictionary result;
            for (const auto& [key, element] : arg) {
                result.set(key, from_value(element.get()));
            }
            return Variant{std::move(result)};
        } else {
            return Variant{deserialize(value)};
        }
    }, value.data);
}

void Deserializer::assign_field(Object& instance, const std::string& name, const Value& value)
{
    if (!instance.has_field(name)) {
        detail::log_key_error("Deserializer::deserialize", name,
                              "is not a field of '" + instance.type_name() + "', skipped");
        return;
    }

    Variant decoded = from_value(value);
    Variant current = instance.get(name);

    // Containers already held by the field keep their declared constraint
    try {
        if (auto* target = current.get_if<Array>(); target && decoded.is_array()) {
            target->assign(decoded.as_array());
            return;
        }
        if (auto* target = current.get_if<Dictionary>(); target && decoded.is_dictionary()) {
            target->assign(decoded.as_dictionary());
            return;
        }
    } catch (const TypeMismatchError& e) {
        throw TypeMismatchError(describe_field(instance, name) + ": " + e.what());
    }

    instance.set(name, decoded);
}

} // namespace objgraph
