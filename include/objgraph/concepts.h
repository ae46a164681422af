// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file concepts.h
/// @brief C++20 Concepts for type constraints in objgraph.
///
/// @note Requires C++20 or later.

#pragma once

#include <concepts>
#include <cstdint>
#include <type_traits>

namespace objgraph {

class Object;

// ============================================================
// Field Type Concepts
// ============================================================

/// Concept for character types (never bound as integers; int8_t/uint8_t are fine)
template <typename T>
concept CharacterType = std::is_same_v<std::remove_cv_t<T>, char> ||
                        std::is_same_v<std::remove_cv_t<T>, wchar_t> ||
                        std::is_same_v<std::remove_cv_t<T>, char8_t> ||
                        std::is_same_v<std::remove_cv_t<T>, char16_t> ||
                        std::is_same_v<std::remove_cv_t<T>, char32_t>;

/// Unsigned types whose upper half does not fit in int64_t
template <typename T>
concept WideUnsigned = std::unsigned_integral<T> && sizeof(T) >= sizeof(int64_t);

/// Integer members stored as Variant Int (range-checked in both directions)
template <typename T>
concept IntegerField = std::integral<T> &&
                       !std::is_same_v<std::remove_cv_t<T>, bool> &&
                       !CharacterType<T>;

// ============================================================
// Registry Concepts
// ============================================================

/// Concept for classes the registry can default-construct
template <typename T>
concept RegistrableObject = std::derived_from<T, Object> && std::default_initializable<T>;

} // namespace objgraph
