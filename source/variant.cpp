// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <objgraph/variant.h>
#include <objgraph/errors.h>
#include <objgraph/object.h>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace objgraph {

std::string_view variant_type_name(VariantType type) noexcept
{
    switch (type) {
        case VariantType::Nil:        return "Nil";
        case VariantType::Bool:       return "Bool";
        case VariantType::Int:        return "Int";
        case VariantType::Float:      return "Float";
        case VariantType::String:     return "String";
        case VariantType::Array:      return "Array";
        case VariantType::Dictionary: return "Dictionary";
        case VariantType::Object:     return "Object";
    }
    return "Unknown";
}

Variant coerce_to(Variant value, VariantType constraint, std::string_view context)
{
    if (constraint == VariantType::Nil || value.type() == constraint) {
        return value;
    }
    if (constraint == VariantType::Float && value.is_int()) {
        return Variant{static_cast<double>(value.as_int())};
    }
    if (constraint == VariantType::Object && value.is_nil()) {
        return Variant{ObjectPtr{}};
    }
    throw TypeMismatchError(std::string(context) + ": expected " +
                            std::string(variant_type_name(constraint)) + ", got " +
                            std::string(variant_type_name(value.type())));
}

// ============================================================
// Array
// ============================================================

struct Array::Data {
    VariantType element_type = VariantType::Nil;
    ArrayStorage elements;
};

Array::Array() : data_(std::make_shared<Data>()) {}

Array::Array(VariantType element_type) : data_(std::make_shared<Data>())
{
    data_->element_type = element_type;
}

VariantType Array::element_type() const noexcept { return data_->element_type; }

std::size_t Array::size() const noexcept { return data_->elements.size(); }

const Variant& Array::at(std::size_t index) const
{
    if (index >= data_->elements.size()) {
        throw std::out_of_range("Array index " + std::to_string(index) + " out of range (size " +
                                std::to_string(data_->elements.size()) + ")");
    }
    return data_->elements[index];
}

void Array::set(std::size_t index, Variant value)
{
    if (index >= data_->elements.size()) {
        throw std::out_of_range("Array index " + std::to_string(index) + " out of range (size " +
                                std::to_string(data_->elements.size()) + ")");
    }
    data_->elements[index] = coerce_to(std::move(value), data_->element_type, "Array element");
}

void Array::push_back(Variant value)
{
    data_->elements.push_back(coerce_to(std::move(value), data_->element_type, "Array element"));
}

void Array::clear() noexcept { data_->elements.clear(); }

void Array::assign(const Array& source)
{
    if (same_ref(source)) {
        return;
    }
    ArrayStorage converted;
    converted.reserve(source.size());
    for (const auto& element : source.elements()) {
        converted.push_back(coerce_to(element, data_->element_type, "Array element"));
    }
    data_->elements = std::move(converted);
}

const ArrayStorage& Array::elements() const noexcept { return data_->elements; }

bool Array::operator==(const Array& other) const
{
    if (same_ref(other)) {
        return true;
    }
    return data_->elements == other.data_->elements;
}

// ============================================================
// Dictionary
// ============================================================

struct Dictionary::Data {
    VariantType value_type = VariantType::Nil;
    DictionaryStorage entries;
};

Dictionary::Dictionary() : data_(std::make_shared<Data>()) {}

Dictionary::Dictionary(VariantType value_type) : data_(std::make_shared<Data>())
{
    data_->value_type = value_type;
}

VariantType Dictionary::value_type() const noexcept { return data_->value_type; }

std::size_t Dictionary::size() const noexcept { return data_->entries.size(); }

const Variant* Dictionary::find(std::string_view key) const
{
    auto it = data_->entries.find(key);
    return it != data_->entries.end() ? &it->second : nullptr;
}

void Dictionary::set(std::string_view key, Variant value)
{
    Variant converted = coerce_to(std::move(value), data_->value_type, "Dictionary value");
    auto it = data_->entries.find(key);
    if (it != data_->entries.end()) {
        it.value() = std::move(converted);
    } else {
        data_->entries.emplace(std::string(key), std::move(converted));
    }
}

bool Dictionary::erase(std::string_view key)
{
    auto it = data_->entries.find(key);
    if (it == data_->entries.end()) {
        return false;
    }
    data_->entries.erase(it);
    return true;
}

void Dictionary::clear() noexcept { data_->entries.clear(); }

void Dictionary::assign(const Dictionary& source)
{
    if (same_ref(source)) {
        return;
    }
    DictionaryStorage converted;
    converted.reserve(source.size());
    for (const auto& [key, value] : source.entries()) {
        converted.emplace(key, coerce_to(value, data_->value_type, "Dictionary value"));
    }
    data_->entries = std::move(converted);
}

const DictionaryStorage& Dictionary::entries() const noexcept { return data_->entries; }

std::vector<std::string> Dictionary::keys() const
{
    std::vector<std::string> result;
    result.reserve(data_->entries.size());
    for (const auto& [key, value] : data_->entries) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

bool Dictionary::operator==(const Dictionary& other) const
{
    if (same_ref(other)) {
        return true;
    }
    if (size() != other.size()) {
        return false;
    }
    for (const auto& [key, value] : data_->entries) {
        const Variant* found = other.find(key);
        if (!found || *found != value) {
            return false;
        }
    }
    return true;
}

// ============================================================
// Variant
// ============================================================

namespace {

[[noreturn]] void throw_access_mismatch(VariantType expected, VariantType actual)
{
    throw TypeMismatchError("expected " + std::string(variant_type_name(expected)) + ", got " +
                            std::string(variant_type_name(actual)));
}

} // anonymous namespace

bool Variant::as_bool() const
{
    if (auto* p = get_if<bool>()) return *p;
    throw_access_mismatch(VariantType::Bool, type());
}

int64_t Variant::as_int() const
{
    if (auto* p = get_if<int64_t>()) return *p;
    throw_access_mismatch(VariantType::Int, type());
}

double Variant::as_float() const
{
    if (auto* p = get_if<double>()) return *p;
    if (auto* p = get_if<int64_t>()) return static_cast<double>(*p);
    throw_access_mismatch(VariantType::Float, type());
}

const std::string& Variant::as_string() const
{
    if (auto* p = get_if<std::string>()) return *p;
    throw_access_mismatch(VariantType::String, type());
}

Array Variant::as_array() const
{
    if (auto* p = get_if<Array>()) return *p;
    throw_access_mismatch(VariantType::Array, type());
}

Dictionary Variant::as_dictionary() const
{
    if (auto* p = get_if<Dictionary>()) return *p;
    throw_access_mismatch(VariantType::Dictionary, type());
}

ObjectPtr Variant::as_object() const
{
    if (auto* p = get_if<ObjectPtr>()) return *p;
    if (is_nil()) return nullptr;
    throw_access_mismatch(VariantType::Object, type());
}

bool Variant::operator==(const Variant& other) const
{
    if (data.index() != other.data.index()) {
        return false;
    }
    return std::visit([&other](const auto& arg) -> bool {
        using T = std::decay_t<decltype(arg)>;
        const T& rhs = *std::get_if<T>(&other.data);

        if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else if constexpr (std::is_same_v<T, ObjectPtr>) {
            if (arg == rhs) return true;
            if (!arg || !rhs) return false;
            return deep_equals(*arg, *rhs);
        } else {
            return arg == rhs;
        }
    }, data);
}

std::string Variant::to_string() const
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            return "nil";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << std::setprecision(6) << arg;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, Array>) {
            return "Array[" + std::to_string(arg.size()) + "]";
        } else if constexpr (std::is_same_v<T, Dictionary>) {
            return "Dictionary{" + std::to_string(arg.size()) + "}";
        } else {
            if (!arg) return "<null object>";
            return "<" + (arg->is_tagged() ? arg->type_name() : std::string("untagged")) + ">";
        }
    }, data);
}

} // namespace objgraph
