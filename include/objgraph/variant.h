// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file variant.h
/// @brief Mutable dynamic value held by object fields.
///
/// Variant is the live-side counterpart of Value: what Object::get returns
/// and Object::set accepts. It supports:
/// - Nil, bool, int64, double, string
/// - Array and Dictionary containers with reference semantics
/// - Object references (std::shared_ptr<Object>, may be null)
///
/// ## Reference semantics
/// Array and Dictionary are handles: copying one shares the underlying
/// storage, the same way an object field holding a container is shared by
/// a shallow duplicate. Use Cloner (or copy element by element) for an
/// independent container.
///
/// ## Typed containers
/// An Array may constrain its element type and a Dictionary its value
/// type (keys are always strings). Inserting an incompatible value throws
/// TypeMismatchError. Int is widened to Float where Float is required,
/// and Nil is accepted where Object is required.
///
/// ```cpp
/// Array scores{VariantType::Float};
/// scores.push_back(3);        // stored as 3.0
/// scores.push_back("x");      // throws TypeMismatchError
///
/// Array alias = scores;       // same storage
/// alias.push_back(1.5);
/// assert(scores.size() == 2);
/// ```

#pragma once

#include <objgraph/objgraph_config.h>
#include <objgraph/api.h>
#include <objgraph/concepts.h>

#include <concepts>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <tsl/robin_map.h>
#include <utility>
#include <variant>
#include <vector>

namespace objgraph {

class Object;
struct Variant;

using ObjectPtr = std::shared_ptr<Object>;

enum class VariantType : uint8_t {
    Nil,
    Bool,
    Int,
    Float,
    String,
    Array,
    Dictionary,
    Object,
};

[[nodiscard]] OBJGRAPH_API std::string_view variant_type_name(VariantType type) noexcept;

// ============================================================
// Transparent Hash/Equal for robin_map heterogeneous lookup
// ============================================================

struct StringHash {
    using is_transparent = void;

    [[nodiscard]] std::size_t operator()(std::string_view sv) const noexcept {
        return std::hash<std::string_view>{}(sv);
    }

    [[nodiscard]] std::size_t operator()(const std::string& s) const noexcept {
        return std::hash<std::string_view>{}(s);
    }

    [[nodiscard]] std::size_t operator()(const char* s) const noexcept { return std::hash<std::string_view>{}(s); }
};

struct StringEqual {
    using is_transparent = void;

    [[nodiscard]] bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

using ArrayStorage      = std::vector<Variant>;
using DictionaryStorage = tsl::robin_map<std::string, Variant, StringHash, StringEqual>;

// ============================================================
// Array
// ============================================================

class OBJGRAPH_API Array {
public:
    /// Untyped, empty array
    Array();

    /// Empty array whose elements must be of @p element_type (Nil = untyped)
    explicit Array(VariantType element_type);

    [[nodiscard]] VariantType element_type() const noexcept;
    [[nodiscard]] bool is_typed() const noexcept { return element_type() != VariantType::Nil; }

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    /// Bounds-checked element access (throws std::out_of_range)
    [[nodiscard]] const Variant& at(std::size_t index) const;

    /// Replace one element, enforcing the element type
    void set(std::size_t index, Variant value);

    /// Append, enforcing the element type
    void push_back(Variant value);

    void clear() noexcept;

    /// Replace the whole content with a copy of @p source's elements.
    /// This array keeps its own element type; every element is checked
    /// before anything is modified.
    void assign(const Array& source);

    [[nodiscard]] const ArrayStorage& elements() const noexcept;

    /// True when both handles share the same storage
    [[nodiscard]] bool same_ref(const Array& other) const noexcept { return data_ == other.data_; }

    /// Deep content equality (element type is not compared)
    bool operator==(const Array& other) const;
    bool operator!=(const Array& other) const { return !(*this == other); }

private:
    struct Data;
    std::shared_ptr<Data> data_;
};

// ============================================================
// Dictionary
// ============================================================

class OBJGRAPH_API Dictionary {
public:
    Dictionary();

    /// Empty dictionary whose values must be of @p value_type (Nil = untyped)
    explicit Dictionary(VariantType value_type);

    [[nodiscard]] VariantType value_type() const noexcept;
    [[nodiscard]] bool is_typed() const noexcept { return value_type() != VariantType::Nil; }

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    /// Value for @p key, or nullptr
    [[nodiscard]] const Variant* find(std::string_view key) const;
    [[nodiscard]] bool contains(std::string_view key) const { return find(key) != nullptr; }

    /// Insert or replace, enforcing the value type
    void set(std::string_view key, Variant value);

    bool erase(std::string_view key);
    void clear() noexcept;

    /// Replace the whole content with a copy of @p source's entries,
    /// keeping this dictionary's own value type.
    void assign(const Dictionary& source);

    [[nodiscard]] const DictionaryStorage& entries() const noexcept;

    /// Keys sorted lexicographically (for stable iteration)
    [[nodiscard]] std::vector<std::string> keys() const;

    [[nodiscard]] bool same_ref(const Dictionary& other) const noexcept { return data_ == other.data_; }

    bool operator==(const Dictionary& other) const;
    bool operator!=(const Dictionary& other) const { return !(*this == other); }

private:
    struct Data;
    std::shared_ptr<Data> data_;
};

// ============================================================
// Variant
// ============================================================

struct OBJGRAPH_API Variant {
    using DataVariant = std::variant<std::monostate,
                                     bool,
                                     int64_t,
                                     double,
                                     std::string,
                                     Array,
                                     Dictionary,
                                     ObjectPtr>;

    DataVariant data;

    // Constructors are NOT explicit so fields can be set with plain literals:
    //   obj.set("value", 5);
    //   obj.set("name", "crate");

    Variant() noexcept : data(std::monostate{}) {}
    Variant(std::nullptr_t) noexcept : data(std::monostate{}) {}
    Variant(bool v) noexcept : data(v) {}

    template <std::integral T>
        requires (!std::same_as<T, bool> && !WideUnsigned<T>)
    Variant(T v) noexcept : data(static_cast<int64_t>(v)) {}

    // Would wrap above INT64_MAX; convert explicitly after a range check
    template <std::integral T>
        requires WideUnsigned<T>
    Variant(T v) = delete;

    template <std::floating_point T>
    Variant(T v) noexcept : data(static_cast<double>(v)) {}

    Variant(std::string v) noexcept : data(std::move(v)) {}
    Variant(std::string_view v) : data(std::string(v)) {}
    Variant(const char* v) : data(std::string(v)) {}
    Variant(Array v) noexcept : data(std::move(v)) {}
    Variant(Dictionary v) noexcept : data(std::move(v)) {}

    /// Object reference (null pointer is stored as a null Object, not Nil)
    template <typename T>
        requires std::derived_from<T, Object>
    Variant(std::shared_ptr<T> v) noexcept : data(ObjectPtr(std::move(v))) {}

    [[nodiscard]] VariantType type() const noexcept { return static_cast<VariantType>(data.index()); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    template <typename T>
    [[nodiscard]] T* get_if() { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    [[nodiscard]] bool is_nil() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_int() const noexcept { return is<int64_t>(); }
    [[nodiscard]] bool is_float() const noexcept { return is<double>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_array() const noexcept { return is<Array>(); }
    [[nodiscard]] bool is_dictionary() const noexcept { return is<Dictionary>(); }
    [[nodiscard]] bool is_object() const noexcept { return is<ObjectPtr>(); }

    // Checked accessors (throw TypeMismatchError on the wrong alternative)
    [[nodiscard]] bool as_bool() const;
    [[nodiscard]] int64_t as_int() const;
    /// Int is widened
    [[nodiscard]] double as_float() const;
    [[nodiscard]] const std::string& as_string() const;
    [[nodiscard]] Array as_array() const;
    [[nodiscard]] Dictionary as_dictionary() const;
    /// Nil yields a null pointer
    [[nodiscard]] ObjectPtr as_object() const;

    /// Deep structural equality; objects compare by type tag and fields
    [[nodiscard]] bool operator==(const Variant& other) const;
    [[nodiscard]] bool operator!=(const Variant& other) const { return !(*this == other); }

    /// Debug representation
    [[nodiscard]] std::string to_string() const;
};

/// Convert @p value so it satisfies @p constraint (Nil = anything).
/// Throws TypeMismatchError when no lossless conversion exists.
[[nodiscard]] OBJGRAPH_API Variant coerce_to(Variant value, VariantType constraint, std::string_view context);

} // namespace objgraph
