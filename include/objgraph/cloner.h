// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file cloner.h
/// @brief Structural duplication of tagged instances, without going through Value.
///
/// - Shallow: fields are assigned as-is; Array, Dictionary and nested
///   object references stay shared with the source.
/// - Deep: containers are rebuilt with the source container's type
///   constraint, nested tagged objects are duplicated recursively, and an
///   untagged nested object is an error (UnsupportedValueError).
///
/// The post-load hook is not invoked on duplicates.

#pragma once

#include <objgraph/api.h>
#include <objgraph/objgraph_config.h>
#include <objgraph/object.h>
#include <objgraph/type_registry.h>
#include <objgraph/variant.h>

namespace objgraph {

struct CloneOptions {
    /// Leave fields whose name starts with '_' at the new instance's default
    bool skip_underscore = OBJGRAPH_DEFAULT_SKIP_UNDERSCORE != 0;
};

class OBJGRAPH_API Cloner {
public:
    explicit Cloner(TypeRegistry& registry, CloneOptions options = {});

    /// Throws UntaggedInstanceError; deep copies may also throw
    /// UnsupportedValueError.
    [[nodiscard]] ObjectPtr duplicate(const Object& source, bool deep);

    template <typename T>
        requires std::derived_from<T, Object>
    [[nodiscard]] std::shared_ptr<T> duplicate_as(const T& source, bool deep) {
        auto typed = std::dynamic_pointer_cast<T>(duplicate(source, deep));
        if (!typed) {
            throw TypeMismatchError("duplicate of '" + source.type_name() + "' is not of the source class");
        }
        return typed;
    }

    /// Deep copy of a single field value
    [[nodiscard]] Variant duplicate_value(const Variant& value);

    [[nodiscard]] const CloneOptions& options() const noexcept { return options_; }

private:
    TypeRegistry& registry_;
    CloneOptions options_;
};

} // namespace objgraph
