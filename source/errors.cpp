// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <objgraph/errors.h>

namespace objgraph {

std::string_view error_kind_name(ErrorKind kind) noexcept
{
    switch (kind) {
        case ErrorKind::UnknownType:      return "UnknownType";
        case ErrorKind::UntaggedInstance: return "UntaggedInstance";
        case ErrorKind::MissingTypeTag:   return "MissingTypeTag";
        case ErrorKind::UnsupportedValue: return "UnsupportedValue";
        case ErrorKind::DecodeError:      return "DecodeError";
        case ErrorKind::IoError:          return "IoError";
        case ErrorKind::UnknownField:     return "UnknownField";
        case ErrorKind::TypeMismatch:     return "TypeMismatch";
    }
    return "Unknown";
}

UnknownTypeError::UnknownTypeError(std::string type_name, const std::string& message)
    : Error(ErrorKind::UnknownType, message), type_name_(std::move(type_name))
{
}

UnknownTypeError::UnknownTypeError(std::string type_name)
    : UnknownTypeError(type_name, "unknown type '" + type_name + "'")
{
}

UnknownFieldError::UnknownFieldError(std::string_view type_name, std::string_view field)
    : Error(ErrorKind::UnknownField,
            "no field '" + std::string(field) + "' on " +
            (type_name.empty() ? std::string("untagged object") : "'" + std::string(type_name) + "'"))
{
}

} // namespace objgraph
