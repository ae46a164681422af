// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file type_registry.h
/// @brief Name -> factory table; the only way to produce serializable instances.
///
/// Usage:
/// @code
///   TypeRegistry registry;
///   registry.register_type<Item>("Item");
///   registry.register_type("Crate", [] { return std::make_shared<Item>(); });
///
///   auto item = registry.create_as<Item>("Item");   // tagged "Item"
///   registry.create("Nonexistent");                 // throws UnknownTypeError
/// @endcode
///
/// ## Threading
/// Not synchronized. Register every type during initialization, before
/// any concurrent create/serialize/deserialize traffic starts. The lazy
/// default cache is filled on first use, so concurrent serializers with
/// elision enabled must either warm it (default_instance() for every type)
/// during setup or serialize with serialize_defaults = true.

#pragma once

#include <objgraph/api.h>
#include <objgraph/concepts.h>
#include <objgraph/errors.h>
#include <objgraph/object.h>
#include <objgraph/variant.h>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <tsl/robin_map.h>
#include <utility>
#include <vector>

namespace objgraph {

class OBJGRAPH_API TypeRegistry {
public:
    using Factory = std::function<ObjectPtr()>;

    TypeRegistry() = default;

    TypeRegistry(const TypeRegistry&) = delete;
    TypeRegistry& operator=(const TypeRegistry&) = delete;
    TypeRegistry(TypeRegistry&&) = default;
    TypeRegistry& operator=(TypeRegistry&&) = default;

    /// Store @p factory under @p name. An existing entry is silently
    /// replaced, and its cached default instance is dropped.
    void register_type(std::string name, Factory factory);

    template <RegistrableObject T>
    void register_type(std::string name) {
        register_type(std::move(name), [] { return ObjectPtr(std::make_shared<T>()); });
    }

    /// Returns true if an entry was removed
    bool unregister_type(std::string_view name);

    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

    /// Registered names, sorted
    [[nodiscard]] std::vector<std::string> type_names() const;

    /// Invoke the factory for @p name and tag the result with it.
    /// Throws UnknownTypeError if the name is not registered or the factory
    /// returns null, TypeMismatchError if the result already carries a
    /// different tag.
    [[nodiscard]] ObjectPtr create(std::string_view name) const;

    /// create() followed by a downcast; throws TypeMismatchError if the
    /// factory produced some other class.
    template <typename T>
        requires std::derived_from<T, Object>
    [[nodiscard]] std::shared_ptr<T> create_as(std::string_view name) const {
        auto obj = create(name);
        auto typed = std::dynamic_pointer_cast<T>(obj);
        if (!typed) {
            throw TypeMismatchError("factory for '" + std::string(name) + "' produced an unexpected class");
        }
        return typed;
    }

    /// Default instance used for default-value elision. Created through
    /// create() on first request and cached until the type is registered
    /// again or clear_default_cache() is called. Never mutated by the engine.
    /// Returns nullptr for unknown names.
    [[nodiscard]] const Object* default_instance(std::string_view name);

    void clear_default_cache() noexcept;

private:
    struct Entry {
        Factory factory;
        ObjectPtr default_instance;
    };

    tsl::robin_map<std::string, Entry, StringHash, StringEqual> entries_;
};

} // namespace objgraph
