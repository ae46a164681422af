// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Exception types thrown by the registry, the engine and the codecs.
///
/// Every objgraph failure derives from objgraph::Error (itself a
/// std::runtime_error), so callers can catch one type and branch on kind():
///
/// @code
///   try {
///       auto obj = persistence.load_json("level.json");
///   } catch (const objgraph::IoError& e) {
///       // file missing or unreadable
///   } catch (const objgraph::Error& e) {
///       std::cerr << error_kind_name(e.kind()) << ": " << e.what() << "\n";
///   }
/// @endcode

#pragma once

#include <objgraph/api.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace objgraph {

enum class ErrorKind : uint8_t {
    UnknownType,      ///< registry lookup miss (create / deserialize)
    UntaggedInstance, ///< serialize / duplicate of an instance not made by the registry
    MissingTypeTag,   ///< deserialize of a value without the reserved type key
    UnsupportedValue, ///< opaque object, or a value an encoding cannot represent
    DecodeError,      ///< malformed text / JSON / binary input
    IoError,          ///< file could not be read or written
    UnknownField,     ///< Object::get / set of an undeclared field
    TypeMismatch,     ///< value incompatible with a field or container constraint
};

[[nodiscard]] OBJGRAPH_API std::string_view error_kind_name(ErrorKind kind) noexcept;

class OBJGRAPH_API Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class OBJGRAPH_API UnknownTypeError : public Error {
public:
    explicit UnknownTypeError(std::string type_name, const std::string& message);
    explicit UnknownTypeError(std::string type_name);

    [[nodiscard]] const std::string& type_name() const noexcept { return type_name_; }

private:
    std::string type_name_;
};

class OBJGRAPH_API UntaggedInstanceError : public Error {
public:
    explicit UntaggedInstanceError(const std::string& message)
        : Error(ErrorKind::UntaggedInstance, message) {}
};

class OBJGRAPH_API MissingTypeTagError : public Error {
public:
    explicit MissingTypeTagError(const std::string& message)
        : Error(ErrorKind::MissingTypeTag, message) {}
};

class OBJGRAPH_API UnsupportedValueError : public Error {
public:
    explicit UnsupportedValueError(const std::string& message)
        : Error(ErrorKind::UnsupportedValue, message) {}
};

class OBJGRAPH_API DecodeError : public Error {
public:
    explicit DecodeError(const std::string& message)
        : Error(ErrorKind::DecodeError, message) {}
};

class OBJGRAPH_API IoError : public Error {
public:
    explicit IoError(const std::string& message)
        : Error(ErrorKind::IoError, message) {}
};

class OBJGRAPH_API UnknownFieldError : public Error {
public:
    UnknownFieldError(std::string_view type_name, std::string_view field);
};

class OBJGRAPH_API TypeMismatchError : public Error {
public:
    explicit TypeMismatchError(const std::string& message)
        : Error(ErrorKind::TypeMismatch, message) {}
};

} // namespace objgraph
