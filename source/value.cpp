// value.cpp - Value type utilities

#include <objgraph/value.h>
#include <objgraph/builders.h>

#include <iostream>
#include <sstream>
#include <iomanip>

namespace objgraph {

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << std::setprecision(6) << arg;
            return oss.str();
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return "{mapping:" + std::to_string(arg.size()) + "}";
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return "[sequence:" + std::to_string(arg.size()) + "]";
        } else if constexpr (std::is_same_v<T, TaggedObject>) {
            return arg.type_name + "{" + std::to_string(arg.size()) + " fields}";
        } else {
            return "null";
        }
    }, val.data);
}

void print_value(const Value& val, const std::string& prefix, std::size_t depth)
{
    const std::string indent(depth * 2, ' ');

    if (auto* m = val.get_if<ValueMap>()) {
        std::cout << indent << prefix << "{\n";
        for (const auto& [k, v] : *m) {
            print_value(v.get(), k + ": ", depth + 1);
        }
        std::cout << indent << "}\n";
    } else if (auto* vec = val.get_if<ValueVector>()) {
        std::cout << indent << prefix << "[\n";
        std::size_t index = 0;
        for (const auto& v : *vec) {
            print_value(v.get(), "[" + std::to_string(index++) + "] ", depth + 1);
        }
        std::cout << indent << "]\n";
    } else if (auto* obj = val.get_if<TaggedObject>()) {
        std::cout << indent << prefix << obj->type_name << " {\n";
        for (const auto& entry : obj->fields) {
            print_value(entry.value.get(), entry.name + ": ", depth + 1);
        }
        std::cout << indent << "}\n";
    } else {
        std::cout << indent << prefix << value_to_string(val) << "\n";
    }
}

// ============================================================
// Explicit Template Instantiations
//
// Matching the 'extern template' declarations in value.h and builders.h,
// so the common specializations are compiled once.
// ============================================================

template struct BasicValue<unsafe_memory_policy>;
template struct BasicTaggedObject<unsafe_memory_policy>;
template class BasicMapBuilder<unsafe_memory_policy>;
template class BasicVectorBuilder<unsafe_memory_policy>;
template class BasicTaggedObjectBuilder<unsafe_memory_policy>;

template struct BasicValue<thread_safe_memory_policy>;
template struct BasicTaggedObject<thread_safe_memory_policy>;

} // namespace objgraph
