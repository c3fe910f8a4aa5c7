/**
 * @file Value.hpp
 * @brief Value type produced by the Gura parser
 *
 * Tagged union covering the Gura value model:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t)
 * - BigInteger (128-bit, for decimal literals overflowing int64_t)
 * - Float (double, NaN and infinities allowed)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...}, insertion ordered)
 */

#ifndef GURA_VALUE_HPP
#define GURA_VALUE_HPP

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace gura {

/**
 * @brief 128-bit signed integer used by BigInteger values
 */
using BigInt = __int128;

/**
 * @brief Decimal text of a 128-bit integer
 */
std::string to_string(BigInt value);

/**
 * @brief Discriminator of a Value
 */
enum class ValueType {
    Null,
    Bool,
    Integer,
    BigInteger,
    Float,
    String,
    Array,
    Object
};

/**
 * @brief A parsed Gura value
 *
 * Objects keep their pairs in insertion order and never hold the same key
 * twice when built by the parser. Equality treats NaN as equal to NaN and
 * compares objects as mappings.
 */
class Value {
public:
    using Array = std::vector<Value>;
    using Member = std::pair<std::string, Value>;
    using Object = std::vector<Member>;

    Value() noexcept = default;
    Value(std::nullptr_t) noexcept {}
    Value(bool b) : data_(b) {}

    template <typename T,
              std::enable_if_t<std::is_integral<T>::value && !std::is_same<T, bool>::value, int> = 0>
    Value(T i) : data_(static_cast<std::int64_t>(i)) {}

    Value(BigInt i) : data_(i) {}
    Value(double d) : data_(d) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(Array a) : data_(std::move(a)) {}
    Value(Object o) : data_(std::move(o)) {}

    /**
     * @brief Empty array value
     */
    static Value array() {
        return Value(Array{});
    }

    /**
     * @brief Empty object value
     */
    static Value object() {
        return Value(Object{});
    }

    ValueType type() const noexcept {
        return static_cast<ValueType>(data_.index());
    }

    bool is_null() const noexcept { return type() == ValueType::Null; }
    bool is_bool() const noexcept { return type() == ValueType::Bool; }
    bool is_integer() const noexcept { return type() == ValueType::Integer; }
    bool is_big_integer() const noexcept { return type() == ValueType::BigInteger; }
    bool is_float() const noexcept { return type() == ValueType::Float; }
    bool is_string() const noexcept { return type() == ValueType::String; }
    bool is_array() const noexcept { return type() == ValueType::Array; }
    bool is_object() const noexcept { return type() == ValueType::Object; }

    /**
     * @brief Typed access, throws std::bad_variant_access on mismatch
     */
    bool as_bool() const { return std::get<bool>(data_); }
    std::int64_t as_integer() const { return std::get<std::int64_t>(data_); }
    BigInt as_big_integer() const { return std::get<BigInt>(data_); }
    double as_float() const { return std::get<double>(data_); }
    const std::string& as_string() const { return std::get<std::string>(data_); }
    const Array& as_array() const { return std::get<Array>(data_); }
    Array& as_array() { return std::get<Array>(data_); }
    const Object& as_object() const { return std::get<Object>(data_); }
    Object& as_object() { return std::get<Object>(data_); }

    /**
     * @brief Number of elements (array), pairs (object) or 0 for scalars
     */
    std::size_t size() const noexcept;

    /**
     * @brief Object member lookup
     * @return Pointer to the member value, nullptr if absent or not an object
     */
    const Value* find(const std::string& key) const noexcept;

    /**
     * @brief True if this is an object holding key
     */
    bool contains(const std::string& key) const noexcept {
        return find(key) != nullptr;
    }

    /**
     * @brief Object member access
     * @throws std::out_of_range if the key is missing or this is not an object
     */
    const Value& at(const std::string& key) const;

    /**
     * @brief Array element access
     * @throws std::out_of_range if the index is invalid or this is not an array
     */
    const Value& at(std::size_t index) const;

    /**
     * @brief Append a member to an object
     * @return false if the key already exists (the value is not inserted)
     * @throws std::bad_variant_access if this is not an object
     */
    bool insert(std::string key, Value value);

    /**
     * @brief Append an element to an array
     * @throws std::bad_variant_access if this is not an array
     */
    void push_back(Value value);

    friend bool operator==(const Value& lhs, const Value& rhs);
    friend bool operator!=(const Value& lhs, const Value& rhs) {
        return !(lhs == rhs);
    }

private:
    std::variant<std::nullptr_t, bool, std::int64_t, BigInt, double, std::string, Array, Object> data_;
};

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string ("null", "boolean", "integer", "big integer",
 *         "float", "string", "array", "object")
 */
const char* type_name(const Value& val) noexcept;

/**
 * @brief Check if value is a container (array or object)
 */
inline bool is_container(const Value& val) noexcept {
    return val.is_array() || val.is_object();
}

/**
 * @brief Writes dump(val)
 */
std::ostream& operator<<(std::ostream& os, const Value& val);

} // namespace gura

#endif // GURA_VALUE_HPP
