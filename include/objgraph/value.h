// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Canonical Value tree flowing between live objects and the encoders.
///
/// A Value is one of:
/// - Scalar: null (std::monostate), bool, int64_t, double, string
/// - Sequence: ordered list of Values (immer::vector)
/// - Mapping: string-keyed Values, key order irrelevant (immer::map)
/// - TaggedObject: a type name plus an ordered list of (field, Value) pairs
///
/// Values are immutable; every "set" returns a new Value sharing structure
/// with the old one. The type is templated on an immer memory policy so a
/// thread-safe flavour (SyncValue) is available next to the default one.

#pragma once

#include <objgraph/objgraph_config.h>
#include <objgraph/api.h>
#include <objgraph/concepts.h>
#include <objgraph/log.h>

#include <immer/box.hpp>
#include <immer/heap/heap_policy.hpp>
#include <immer/lock/spinlock_policy.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>
#include <immer/refcount/refcount_policy.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace objgraph {

/// Reserved mapping key that carries the type name of a tagged object
inline constexpr std::string_view type_key = "@type";

// Forward declaration
template <typename MemoryPolicy>
struct BasicValue;

template <typename MemoryPolicy>
using BasicValueBox = immer::box<BasicValue<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueMap = immer::map<std::string,
                                 BasicValueBox<MemoryPolicy>,
                                 std::hash<std::string>,
                                 std::equal_to<std::string>,
                                 MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueVector = immer::vector<BasicValueBox<MemoryPolicy>, MemoryPolicy>;

/// One (field name, value) pair of a tagged object
template <typename MemoryPolicy>
struct BasicFieldEntry {
    std::string name;
    BasicValueBox<MemoryPolicy> value;

    bool operator==(const BasicFieldEntry& other) const {
        return name == other.name && value == other.value;
    }

    bool operator!=(const BasicFieldEntry& other) const {
        return !(*this == other);
    }
};

template <typename MemoryPolicy>
using BasicFieldList = immer::vector<BasicFieldEntry<MemoryPolicy>, MemoryPolicy>;

/// Serialized form of a registry-created instance.
/// Field order is the enumeration order of the source object.
template <typename MemoryPolicy>
struct BasicTaggedObject {
    std::string type_name;
    BasicFieldList<MemoryPolicy> fields;

    /// Linear lookup; objects rarely carry more than a few dozen fields.
    [[nodiscard]] const BasicValue<MemoryPolicy>* find(std::string_view name) const {
        for (const auto& entry : fields) {
            if (entry.name == name) return &entry.value.get();
        }
        return nullptr;
    }

    [[nodiscard]] std::size_t size() const { return fields.size(); }

    bool operator==(const BasicTaggedObject& other) const {
        return type_name == other.type_name && fields == other.fields;
    }

    bool operator!=(const BasicTaggedObject& other) const {
        return !(*this == other);
    }
};

using ByteBuffer = std::vector<uint8_t>;

template <typename MemoryPolicy>
struct BasicValue
{
    using memory_policy = MemoryPolicy;
    using value_box     = BasicValueBox<MemoryPolicy>;
    using value_map     = BasicValueMap<MemoryPolicy>;
    using value_vector  = BasicValueVector<MemoryPolicy>;
    using field_entry   = BasicFieldEntry<MemoryPolicy>;
    using field_list    = BasicFieldList<MemoryPolicy>;
    using tagged_object = BasicTaggedObject<MemoryPolicy>;

    std::variant<bool,
                 int64_t,
                 double,
                 std::string,
                 value_vector,
                 value_map,
                 tagged_object,
                 std::monostate>
        data;

    constexpr BasicValue() noexcept : data(std::monostate{}) {}
    BasicValue(std::nullptr_t) noexcept : data(std::monostate{}) {}
    BasicValue(bool v) noexcept : data(v) {}

    template <std::integral T>
        requires (!std::same_as<T, bool> && !WideUnsigned<T>)
    BasicValue(T v) noexcept : data(static_cast<int64_t>(v)) {}

    template <std::integral T>
        requires WideUnsigned<T>
    BasicValue(T v) = delete;

    template <std::floating_point T>
    BasicValue(T v) noexcept : data(static_cast<double>(v)) {}

    BasicValue(const std::string& v) : data(v) {}
    BasicValue(std::string&& v) noexcept : data(std::move(v)) {}
    BasicValue(std::string_view v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(const char* v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(value_vector v) : data(std::move(v)) {}
    BasicValue(value_map v) : data(std::move(v)) {}
    BasicValue(tagged_object v) : data(std::move(v)) {}

    // Factory functions for container types
    static BasicValue map(std::initializer_list<std::pair<std::string, BasicValue>> init) {
        auto t = value_map{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    static BasicValue vector(std::initializer_list<BasicValue> init) {
        auto t = value_vector{}.transient();
        for (const auto& val : init) {
            t.push_back(value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    /// Tagged object with fields in the given order (a repeated name replaces the earlier entry)
    static BasicValue tagged(std::string type_name,
                             std::initializer_list<std::pair<std::string, BasicValue>> fields = {}) {
        tagged_object obj{std::move(type_name), {}};
        for (const auto& [name, val] : fields) {
            obj = with_field(std::move(obj), name, val);
        }
        return BasicValue{std::move(obj)};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_int() const noexcept { return is<int64_t>(); }
    [[nodiscard]] bool is_float() const noexcept { return is<double>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_sequence() const noexcept { return is<value_vector>(); }
    [[nodiscard]] bool is_mapping() const noexcept { return is<value_map>(); }
    [[nodiscard]] bool is_tagged() const noexcept { return is<tagged_object>(); }
    [[nodiscard]] bool is_scalar() const noexcept {
        return !is_sequence() && !is_mapping() && !is_tagged();
    }

    /// Type name of a tagged object, empty for every other kind
    [[nodiscard]] std::string_view type_name() const noexcept {
        if (auto* obj = get_if<tagged_object>()) return obj->type_name;
        return {};
    }

    /// Mapping entry or tagged-object field; null if absent
    [[nodiscard]] BasicValue at(const std::string& key) const {
        if (auto* m = get_if<value_map>()) {
            if (auto* found = m->find(key)) return found->get();
        }
        if (auto* obj = get_if<tagged_object>()) {
            if (auto* found = obj->find(key)) return *found;
        }
        detail::log_key_error("Value::at", key, "not found or type mismatch");
        return BasicValue{};
    }

    /// Tagged-object field, or nullptr (no mapping fallback)
    [[nodiscard]] const BasicValue* field(std::string_view name) const {
        if (auto* obj = get_if<tagged_object>()) return obj->find(name);
        return nullptr;
    }

    [[nodiscard]] BasicValue at(std::size_t index) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return (*v)[index].get();
        }
        detail::log_index_error("Value::at", index, "out of range or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] BasicValue at_or(const std::string& key, BasicValue default_val) const {
        if (!contains(key)) return default_val;
        return at(key);
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] int64_t as_int(int64_t default_val = 0) const {
        if (auto* p = get_if<int64_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_float(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_number(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        if (auto* p = get_if<int64_t>()) return static_cast<double>(*p);
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string_view as_string_view() const noexcept {
        if (auto* p = get_if<std::string>()) return *p;
        return {};
    }

    [[nodiscard]] bool contains(const std::string& key) const { return count(key) > 0; }

    [[nodiscard]] std::size_t count(const std::string& key) const {
        if (auto* m = get_if<value_map>()) return m->count(key);
        if (auto* obj = get_if<tagged_object>()) return obj->find(key) ? 1 : 0;
        return 0;
    }

    /// Mapping entry or tagged-object field (appended if new, replaced in place otherwise)
    [[nodiscard]] BasicValue set(const std::string& key, BasicValue val) const {
        if (auto* m = get_if<value_map>()) return m->set(key, value_box{std::move(val)});
        if (auto* obj = get_if<tagged_object>()) return with_field(*obj, key, std::move(val));
        detail::log_key_error("Value::set", key, "cannot set on non-mapping type");
        return *this;
    }

    [[nodiscard]] BasicValue set(std::size_t index, BasicValue val) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return v->set(index, value_box{std::move(val)});
        }
        detail::log_index_error("Value::set", index, "cannot set on non-sequence type");
        return *this;
    }

    [[nodiscard]] BasicValue push_back(BasicValue val) const {
        if (auto* v = get_if<value_vector>()) return v->push_back(value_box{std::move(val)});
        detail::log_warning("Value::push_back", "cannot append to non-sequence type");
        return *this;
    }

    /// Number of elements, entries or fields; 0 for scalars
    [[nodiscard]] std::size_t size() const {
        if (auto* m = get_if<value_map>()) return m->size();
        if (auto* v = get_if<value_vector>()) return v->size();
        if (auto* obj = get_if<tagged_object>()) return obj->size();
        return 0;
    }

    using size_type = std::size_t;

private:
    static tagged_object with_field(tagged_object obj, const std::string& name, BasicValue val) {
        for (std::size_t i = 0; i < obj.fields.size(); ++i) {
            if (obj.fields[i].name == name) {
                obj.fields = obj.fields.set(i, field_entry{name, value_box{std::move(val)}});
                return obj;
            }
        }
        obj.fields = obj.fields.push_back(field_entry{name, value_box{std::move(val)}});
        return obj;
    }
};

// ============================================================
// Memory Policy Definitions
// ============================================================

/// Single-threaded memory policy: non-atomic refcount + no locks
using unsafe_memory_policy = immer::memory_policy<
    immer::unsafe_free_list_heap_policy<immer::cpp_heap>,
    immer::unsafe_refcount_policy,
    immer::no_lock_policy
>;

/// Thread-safe memory policy: atomic refcount + spinlock. Spelled out
/// because IMMER_NO_THREAD_SAFETY also changes immer::default_memory_policy.
using thread_safe_memory_policy = immer::memory_policy<
    immer::free_list_heap_policy<immer::cpp_heap>,
    immer::refcount_policy,
    immer::spinlock_policy
>;

// Value = single-threaded flavour, used by the engine and the codecs
using Value        = BasicValue<unsafe_memory_policy>;
using ValueBox     = BasicValueBox<unsafe_memory_policy>;
using ValueMap     = BasicValueMap<unsafe_memory_policy>;
using ValueVector  = BasicValueVector<unsafe_memory_policy>;
using TaggedObject = BasicTaggedObject<unsafe_memory_policy>;

// SyncValue = Value trees shared across threads
using SyncValue = BasicValue<thread_safe_memory_policy>;

/// Deep structural equality (mapping key order is irrelevant, field order is not)
template <typename MemoryPolicy>
bool operator==(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    return a.data == b.data;
}

template <typename MemoryPolicy>
bool operator!=(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    return !(a == b);
}

// ============================================================
// Utility functions
// ============================================================

// Short one-line description, e.g. "Item{2 fields}" or "[sequence:3]"
[[nodiscard]] OBJGRAPH_API std::string value_to_string(const Value& val);

// Print Value tree with indentation
OBJGRAPH_API void print_value(const Value& val, const std::string& prefix = "", std::size_t depth = 0);

// ============================================================
// Extern Template Declarations
// ============================================================

extern template struct BasicValue<unsafe_memory_policy>;
extern template struct BasicTaggedObject<unsafe_memory_policy>;

extern template struct BasicValue<thread_safe_memory_policy>;
extern template struct BasicTaggedObject<thread_safe_memory_policy>;

} // namespace objgraph
