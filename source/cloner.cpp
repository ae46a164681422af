// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <objgraph/cloner.h>
#include <objgraph/errors.h>
#include <objgraph/serializer.h>

namespace objgraph {

Cloner::Cloner(TypeRegistry& registry, CloneOptions options)
    : registry_(registry), options_(options)
{
}

ObjectPtr Cloner::duplicate(const Object& source, bool deep)
{
    if (!source.is_tagged()) {
        throw UntaggedInstanceError("cannot duplicate an instance that was not created by the registry");
    }

    ObjectPtr copy = registry_.create(source.type_name());
    for (const auto& name : source.field_names()) {
        if (options_.skip_underscore && is_private_field(name)) {
            continue;
        }
        Variant value = source.get(name);
        copy->set(name, deep ? duplicate_value(value) : value);
    }
    return copy;
}

Variant Cloner::duplicate_value(const Variant& value)
{
    if (auto* obj = value.get_if<ObjectPtr>()) {
        if (!*obj) {
            return value;
        }
        if (!(*obj)->is_tagged()) {
            throw UnsupportedValueError("cannot deep-duplicate an untagged nested object");
        }
        return Variant{duplicate(**obj, true)};
    }

    if (auto* array = value.get_if<Array>()) {
        Array copy{array->element_type()};
        for (const auto& element : array->elements()) {
            copy.push_back(duplicate_value(element));
        }
        return Variant{std::move(copy)};
    }

    if (auto* dict = value.get_if<Dictionary>()) {
        Dictionary copy{dict->value_type()};
        for (const auto& [key, element] : dict->entries()) {
            copy.set(key, duplicate_value(element));
        }
        return Variant{std::move(copy)};
    }

    return value;
}

} // namespace objgraph
