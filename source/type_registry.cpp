// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <objgraph/type_registry.h>

#include <algorithm>

namespace objgraph {

void TypeRegistry::register_type(std::string name, Factory factory)
{
    auto it = entries_.find(name);
    if (it != entries_.end()) {
        // Replacing drops the cached default of the previous factory
        it.value() = Entry{std::move(factory), nullptr};
        return;
    }
    entries_.emplace(std::move(name), Entry{std::move(factory), nullptr});
}

bool TypeRegistry::unregister_type(std::string_view name)
{
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

bool TypeRegistry::contains(std::string_view name) const
{
    return entries_.find(name) != entries_.end();
}

std::vector<std::string> TypeRegistry::type_names() const
{
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& [name, entry] : entries_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

ObjectPtr TypeRegistry::create(std::string_view name) const
{
    auto it = entries_.find(name);
    if (it == entries_.end() || !it->second.factory) {
        throw UnknownTypeError(std::string(name));
    }
    ObjectPtr instance = it->second.factory();
    if (!instance) {
        throw UnknownTypeError(std::string(name), "factory for '" + std::string(name) + "' returned null");
    }
    if (instance->type_name_.empty()) {
        instance->type_name_ = it->first;
    } else if (instance->type_name_ != it->first) {
        throw TypeMismatchError("factory for '" + it->first + "' returned an instance already tagged '" +
                                instance->type_name_ + "'");
    }
    return instance;
}

const Object* TypeRegistry::default_instance(std::string_view name)
{
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        return nullptr;
    }
    if (!it->second.default_instance) {
        ObjectPtr instance = create(name);
        // A factory may register types itself, which can rehash
        it = entries_.find(name);
        if (it == entries_.end()) {
            return nullptr;
        }
        it.value().default_instance = std::move(instance);
    }
    return it->second.default_instance.get();
}

void TypeRegistry::clear_default_cache() noexcept
{
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        it.value().default_instance.reset();
    }
}

} // namespace objgraph
