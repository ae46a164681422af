// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Builder classes for O(n) construction of immutable Value containers.
///
/// - MapBuilder: build a Mapping
/// - VectorBuilder: build a Sequence
/// - TaggedObjectBuilder: build a TaggedObject, keeping field order
///
/// Usage:
/// @code
///   Value item = TaggedObjectBuilder("Item")
///       .set("value", 5)
///       .set("tags", VectorBuilder().push_back("a").push_back("b").finish())
///       .finish();
/// @endcode

#pragma once

#include "value.h"

#include <unordered_map>

namespace objgraph {

/// Builder for constructing value_map efficiently - O(n) complexity
template <typename MemoryPolicy>
class BasicMapBuilder {
public:
    using value_type = BasicValue<MemoryPolicy>;
    using value_box = BasicValueBox<MemoryPolicy>;
    using value_map = BasicValueMap<MemoryPolicy>;
    using transient_type = typename value_map::transient_type;

    BasicMapBuilder() : transient_(value_map{}.transient()) {}

    BasicMapBuilder(BasicMapBuilder&&) noexcept = default;
    BasicMapBuilder& operator=(BasicMapBuilder&&) noexcept = default;

    // Copy operations (disabled - transient sharing is dangerous)
    BasicMapBuilder(const BasicMapBuilder&) = delete;
    BasicMapBuilder& operator=(const BasicMapBuilder&) = delete;

    /// Set a key with an already constructed BasicValue
    BasicMapBuilder& set(const std::string& key, value_type val) {
        transient_.set(key, value_box{std::move(val)});
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        return transient_.count(key) > 0;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    /// Finish building and return the immutable Value
    /// Note: After calling finish(), the builder is in an undefined state
    [[nodiscard]] value_type finish() {
        return value_type{transient_.persistent()};
    }

private:
    transient_type transient_;
};

/// Builder for constructing value_vector efficiently - O(n) complexity
template <typename MemoryPolicy>
class BasicVectorBuilder {
public:
    using value_type = BasicValue<MemoryPolicy>;
    using value_box = BasicValueBox<MemoryPolicy>;
    using value_vector = BasicValueVector<MemoryPolicy>;
    using transient_type = typename value_vector::transient_type;

    BasicVectorBuilder() : transient_(value_vector{}.transient()) {}

    BasicVectorBuilder(BasicVectorBuilder&&) noexcept = default;
    BasicVectorBuilder& operator=(BasicVectorBuilder&&) noexcept = default;

    BasicVectorBuilder(const BasicVectorBuilder&) = delete;
    BasicVectorBuilder& operator=(const BasicVectorBuilder&) = delete;

    BasicVectorBuilder& push_back(value_type val) {
        transient_.push_back(value_box{std::move(val)});
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    [[nodiscard]] value_type finish() {
        return value_type{transient_.persistent()};
    }

private:
    transient_type transient_;
};

/// Builder for tagged objects. Fields keep insertion order; setting an
/// existing name replaces its value in place.
template <typename MemoryPolicy>
class BasicTaggedObjectBuilder {
public:
    using value_type = BasicValue<MemoryPolicy>;
    using value_box = BasicValueBox<MemoryPolicy>;
    using field_entry = BasicFieldEntry<MemoryPolicy>;
    using field_list = BasicFieldList<MemoryPolicy>;
    using tagged_object = BasicTaggedObject<MemoryPolicy>;
    using transient_type = typename field_list::transient_type;

    explicit BasicTaggedObjectBuilder(std::string type_name)
        : type_name_(std::move(type_name)), transient_(field_list{}.transient()) {}

    BasicTaggedObjectBuilder(BasicTaggedObjectBuilder&&) noexcept = default;
    BasicTaggedObjectBuilder& operator=(BasicTaggedObjectBuilder&&) noexcept = default;

    BasicTaggedObjectBuilder(const BasicTaggedObjectBuilder&) = delete;
    BasicTaggedObjectBuilder& operator=(const BasicTaggedObjectBuilder&) = delete;

    BasicTaggedObjectBuilder& set(const std::string& name, value_type val) {
        if (auto it = index_.find(name); it != index_.end()) {
            transient_.set(it->second, field_entry{name, value_box{std::move(val)}});
        } else {
            index_.emplace(name, transient_.size());
            transient_.push_back(field_entry{name, value_box{std::move(val)}});
        }
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& name) const {
        return index_.count(name) > 0;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    [[nodiscard]] const std::string& type_name() const noexcept { return type_name_; }

    [[nodiscard]] value_type finish() {
        return value_type{tagged_object{std::move(type_name_), transient_.persistent()}};
    }

private:
    std::string type_name_;
    transient_type transient_;
    std::unordered_map<std::string, std::size_t> index_;
};

// ============================================================
// Builder type aliases
// ============================================================

using MapBuilder          = BasicMapBuilder<unsafe_memory_policy>;
using VectorBuilder       = BasicVectorBuilder<unsafe_memory_policy>;
using TaggedObjectBuilder = BasicTaggedObjectBuilder<unsafe_memory_policy>;

// ============================================================
// Extern Template Declarations for Builders
// ============================================================

extern template class BasicMapBuilder<unsafe_memory_policy>;
extern template class BasicVectorBuilder<unsafe_memory_policy>;
extern template class BasicTaggedObjectBuilder<unsafe_memory_policy>;

} // namespace objgraph
