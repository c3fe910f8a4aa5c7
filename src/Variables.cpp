/**
 * @file Variables.cpp
 * @brief Variable table and interpolation
 */

#include "gura/Variables.hpp"
#include "gura/Dump.hpp"

#include <cstdlib>

namespace gura {

bool is_variable_value(const Value& value) noexcept {
    return value.is_string() || value.is_integer() || value.is_float();
}

std::string interpolate(const Value& value) {
    switch (value.type()) {
        case ValueType::String:
            return value.as_string();
        case ValueType::Integer:
            return std::to_string(value.as_integer());
        case ValueType::Float:
            return format_float(value.as_float());
        default:
            return "";
    }
}

bool VariableTable::define(const std::string& name, Value value) {
    return values_.emplace(name, std::move(value)).second;
}

std::optional<Value> VariableTable::lookup(const std::string& name) const {
    auto it = values_.find(name);
    if (it != values_.end()) {
        return it->second;
    }

    const char* env = std::getenv(name.c_str());
    if (env != nullptr) {
        return Value(std::string(env));
    }
    return std::nullopt;
}

} // namespace gura
