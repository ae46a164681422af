// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file object.h
/// @brief Base class for instances the engine can serialize, load and clone.
///
/// Subclasses declare their fields by binding data members in the
/// constructor. The binding order is the field enumeration order used by
/// the serializer.
///
/// @code
///   class Item : public objgraph::Object {
///   public:
///       Item() {
///           bind("value", value);
///           bind("tags", tags);
///       }
///       int64_t value = 0;
///       objgraph::Array tags{objgraph::VariantType::String};
///   };
/// @endcode
///
/// Every instance carries one piece of out-of-band metadata: its type tag.
/// Only TypeRegistry assigns it (on create), and it never changes after.
/// An instance constructed directly (std::make_shared<Item>()) is untagged
/// and is treated as an opaque object by the engine.

#pragma once

#include <objgraph/api.h>
#include <objgraph/concepts.h>
#include <objgraph/errors.h>
#include <objgraph/variant.h>

#include <functional>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace objgraph {

// ============================================================
// Field conversion traits (member type <-> Variant)
// ============================================================

template <typename T>
struct FieldTraits;

template <>
struct FieldTraits<bool> {
    static Variant get(const bool& member) { return Variant{member}; }
    static void set(bool& member, const Variant& v) { member = v.as_bool(); }
};

template <typename T>
    requires IntegerField<T>
struct FieldTraits<T> {
    static Variant get(const T& member) {
        if (!std::in_range<int64_t>(member)) {
            throw UnsupportedValueError("integer " + std::to_string(member) + " does not fit in a 64-bit signed Int");
        }
        return Variant{static_cast<int64_t>(member)};
    }
    static void set(T& member, const Variant& v) {
        const int64_t raw = v.as_int();
        if (!std::in_range<T>(raw)) {
            throw TypeMismatchError("integer " + std::to_string(raw) + " out of range for field");
        }
        member = static_cast<T>(raw);
    }
};

template <std::floating_point T>
struct FieldTraits<T> {
    static Variant get(const T& member) { return Variant{member}; }
    static void set(T& member, const Variant& v) { member = static_cast<T>(v.as_float()); }
};

template <>
struct FieldTraits<std::string> {
    static Variant get(const std::string& member) { return Variant{member}; }
    static void set(std::string& member, const Variant& v) { member = v.as_string(); }
};

template <>
struct FieldTraits<Variant> {
    static Variant get(const Variant& member) { return member; }
    static void set(Variant& member, const Variant& v) { member = v; }
};

/// Assignment shares the source container unless this field is typed
/// differently, in which case the elements are copied into a container
/// carrying the field's own constraint.
template <>
struct FieldTraits<Array> {
    static Variant get(const Array& member) { return Variant{member}; }
    static void set(Array& member, const Variant& v) {
        Array source = v.as_array();
        if (member.is_typed() && source.element_type() != member.element_type()) {
            Array converted{member.element_type()};
            converted.assign(source);
            member = std::move(converted);
        } else {
            member = std::move(source);
        }
    }
};

template <>
struct FieldTraits<Dictionary> {
    static Variant get(const Dictionary& member) { return Variant{member}; }
    static void set(Dictionary& member, const Variant& v) {
        Dictionary source = v.as_dictionary();
        if (member.is_typed() && source.value_type() != member.value_type()) {
            Dictionary converted{member.value_type()};
            converted.assign(source);
            member = std::move(converted);
        } else {
            member = std::move(source);
        }
    }
};

template <typename T>
    requires std::derived_from<T, Object>
struct FieldTraits<std::shared_ptr<T>> {
    static Variant get(const std::shared_ptr<T>& member) { return Variant{ObjectPtr(member)}; }
    static void set(std::shared_ptr<T>& member, const Variant& v) {
        ObjectPtr obj = v.as_object();
        if (!obj) {
            member.reset();
            return;
        }
        auto typed = std::dynamic_pointer_cast<T>(obj);
        if (!typed) {
            throw TypeMismatchError("object is not of the field's declared class");
        }
        member = std::move(typed);
    }
};

/// Member types bind() accepts
template <typename T>
concept BindableField = requires(T& member, const Variant& v) {
    { FieldTraits<T>::get(member) } -> std::same_as<Variant>;
    FieldTraits<T>::set(member, v);
};

// ============================================================
// Object
// ============================================================

class OBJGRAPH_API Object {
public:
    Object() = default;
    virtual ~Object() = default;

    // Fields are bound by reference to this instance's members
    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;
    Object(Object&&) = delete;
    Object& operator=(Object&&) = delete;

    /// Registry type name; empty when the instance was not created by a registry
    [[nodiscard]] const std::string& type_name() const noexcept { return type_name_; }
    [[nodiscard]] bool is_tagged() const noexcept { return !type_name_.empty(); }

    /// Field names in declaration (bind) order
    [[nodiscard]] std::vector<std::string> field_names() const;
    [[nodiscard]] std::size_t field_count() const noexcept { return fields_.size(); }
    [[nodiscard]] bool has_field(std::string_view name) const noexcept;

    /// Throws UnknownFieldError, or UnsupportedValueError for an unsigned
    /// 64-bit member above INT64_MAX
    [[nodiscard]] Variant get(std::string_view name) const;

    /// Plain assignment. Throws UnknownFieldError or TypeMismatchError;
    /// the field is left unchanged on failure.
    void set(std::string_view name, const Variant& value);

    /// Called by the deserializer after every field present in the loaded
    /// value has been assigned. Nested objects are loaded (and their hooks
    /// run) before their owner's hook. State that is not serialized at all
    /// remains the caller's responsibility.
    virtual void on_loaded() {}

protected:
    template <BindableField T>
    void bind(std::string name, T& member) {
        add_binding(std::move(name),
                    [&member] { return FieldTraits<T>::get(member); },
                    [&member](const Variant& v) { FieldTraits<T>::set(member, v); });
    }

private:
    friend class TypeRegistry;

    struct FieldBinding {
        std::string name;
        std::function<Variant()> getter;
        std::function<void(const Variant&)> setter;
    };

    void add_binding(std::string name,
                     std::function<Variant()> getter,
                     std::function<void(const Variant&)> setter);
    [[nodiscard]] const FieldBinding* find_binding(std::string_view name) const noexcept;

    std::vector<FieldBinding> fields_;
    std::string type_name_;
};

/// Structural equality: same type tag, same fields, deep-equal values
[[nodiscard]] OBJGRAPH_API bool deep_equals(const Object& a, const Object& b);

} // namespace objgraph
