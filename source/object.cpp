// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <objgraph/object.h>
#include <objgraph/value.h>

#include <stdexcept>

namespace objgraph {

void Object::add_binding(std::string name,
                         std::function<Variant()> getter,
                         std::function<void(const Variant&)> setter)
{
    if (name.empty()) {
        throw std::invalid_argument("field name must not be empty");
    }
    if (name == type_key) {
        throw std::invalid_argument("field name '" + name + "' is reserved");
    }
    if (find_binding(name)) {
        throw std::invalid_argument("field '" + name + "' is bound twice");
    }
    fields_.push_back(FieldBinding{std::move(name), std::move(getter), std::move(setter)});
}

const Object::FieldBinding* Object::find_binding(std::string_view name) const noexcept
{
    for (const auto& binding : fields_) {
        if (binding.name == name) {
            return &binding;
        }
    }
    return nullptr;
}

std::vector<std::string> Object::field_names() const
{
    std::vector<std::string> names;
    names.reserve(fields_.size());
    for (const auto& binding : fields_) {
        names.push_back(binding.name);
    }
    return names;
}

bool Object::has_field(std::string_view name) const noexcept
{
    return find_binding(name) != nullptr;
}

Variant Object::get(std::string_view name) const
{
    const FieldBinding* binding = find_binding(name);
    if (!binding) {
        throw UnknownFieldError(type_name_, name);
    }
    try {
        return binding->getter();
    } catch (const UnsupportedValueError& e) {
        throw UnsupportedValueError("field '" + binding->name + "' of " +
                                    (is_tagged() ? "'" + type_name_ + "'" : std::string("untagged object")) +
                                    ": " + e.what());
    }
}

void Object::set(std::string_view name, const Variant& value)
{
    const FieldBinding* binding = find_binding(name);
    if (!binding) {
        throw UnknownFieldError(type_name_, name);
    }
    try {
        binding->setter(value);
    } catch (const TypeMismatchError& e) {
        throw TypeMismatchError("field '" + binding->name + "' of " +
                                (is_tagged() ? "'" + type_name_ + "'" : std::string("untagged object")) +
                                ": " + e.what());
    }
}

bool deep_equals(const Object& a, const Object& b)
{
    if (&a == &b) {
        return true;
    }
    if (a.type_name() != b.type_name() || a.field_count() != b.field_count()) {
        return false;
    }
    for (const auto& name : a.field_names()) {
        if (!b.has_field(name) || a.get(name) != b.get(name)) {
            return false;
        }
    }
    return true;
}

} // namespace objgraph
