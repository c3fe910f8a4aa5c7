/**
 * @file Value.cpp
 * @brief Value accessors and comparison
 */

#include "gura/Value.hpp"
#include "gura/Dump.hpp"

#include <algorithm>
#include <cmath>
#include <ostream>
#include <stdexcept>

namespace gura {

std::string to_string(BigInt value) {
    if (value == 0) {
        return "0";
    }

    const bool negative = value < 0;
    std::string digits;
    // Work on negative remainders so the minimum value does not overflow
    while (value != 0) {
        int digit = static_cast<int>(value % 10);
        digits.push_back(static_cast<char>('0' + (digit < 0 ? -digit : digit)));
        value /= 10;
    }
    if (negative) {
        digits.push_back('-');
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

std::size_t Value::size() const noexcept {
    if (is_array()) return std::get<Array>(data_).size();
    if (is_object()) return std::get<Object>(data_).size();
    return 0;
}

const Value* Value::find(const std::string& key) const noexcept {
    if (!is_object()) {
        return nullptr;
    }
    for (const auto& member : std::get<Object>(data_)) {
        if (member.first == key) {
            return &member.second;
        }
    }
    return nullptr;
}

const Value& Value::at(const std::string& key) const {
    const Value* found = find(key);
    if (found == nullptr) {
        throw std::out_of_range("Missing key: " + key);
    }
    return *found;
}

const Value& Value::at(std::size_t index) const {
    if (!is_array()) {
        throw std::out_of_range("Attempt to index a " + std::string(type_name(*this)));
    }
    return std::get<Array>(data_).at(index);
}

bool Value::insert(std::string key, Value value) {
    auto& members = std::get<Object>(data_);
    if (contains(key)) {
        return false;
    }
    members.emplace_back(std::move(key), std::move(value));
    return true;
}

void Value::push_back(Value value) {
    std::get<Array>(data_).push_back(std::move(value));
}

bool operator==(const Value& lhs, const Value& rhs) {
    if (lhs.type() != rhs.type()) {
        return false;
    }

    switch (lhs.type()) {
        case ValueType::Null:
            return true;
        case ValueType::Bool:
            return lhs.as_bool() == rhs.as_bool();
        case ValueType::Integer:
            return lhs.as_integer() == rhs.as_integer();
        case ValueType::BigInteger:
            return lhs.as_big_integer() == rhs.as_big_integer();
        case ValueType::Float: {
            const double a = lhs.as_float();
            const double b = rhs.as_float();
            return (std::isnan(a) && std::isnan(b)) || a == b;
        }
        case ValueType::String:
            return lhs.as_string() == rhs.as_string();
        case ValueType::Array:
            return lhs.as_array() == rhs.as_array();
        case ValueType::Object: {
            const auto& a = lhs.as_object();
            const auto& b = rhs.as_object();
            if (a.size() != b.size()) {
                return false;
            }
            for (const auto& member : a) {
                const Value* other = rhs.find(member.first);
                if (other == nullptr || !(member.second == *other)) {
                    return false;
                }
            }
            return true;
        }
    }
    return false;
}

const char* type_name(const Value& val) noexcept {
    switch (val.type()) {
        case ValueType::Null: return "null";
        case ValueType::Bool: return "boolean";
        case ValueType::Integer: return "integer";
        case ValueType::BigInteger: return "big integer";
        case ValueType::Float: return "float";
        case ValueType::String: return "string";
        case ValueType::Array: return "array";
        case ValueType::Object: return "object";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& os, const Value& val) {
    return os << dump(val);
}

} // namespace gura
