/**
 * @file Variables.hpp
 * @brief Document variables with environment fallback
 *
 * Variables are defined with `$name: value` and are write-once across the
 * whole flattened document. A reference to a name the document does not
 * define falls back to the process environment, where the value is always
 * a string.
 */

#ifndef GURA_VARIABLES_HPP
#define GURA_VARIABLES_HPP

#include "gura/Value.hpp"

#include <map>
#include <optional>
#include <string>

namespace gura {

/**
 * @brief Check that a value may be stored in a variable
 * @return true for String, Integer and Float values
 */
bool is_variable_value(const Value& value) noexcept;

/**
 * @brief Text of a variable value as spliced into a string
 *
 * Strings verbatim, integers in decimal, floats formatted like dump().
 * Other kinds give an empty string.
 */
std::string interpolate(const Value& value);

/**
 * @brief Write-once table of document variables
 */
class VariableTable {
public:
    /**
     * @brief Define a variable
     * @return false if the name is already defined (the table is unchanged)
     */
    bool define(const std::string& name, Value value);

    bool contains(const std::string& name) const {
        return values_.count(name) != 0;
    }

    /**
     * @brief Resolve a name against the document, then the environment
     * @return The value, std::nullopt if neither defines it
     */
    std::optional<Value> lookup(const std::string& name) const;

    std::size_t size() const noexcept {
        return values_.size();
    }

    void clear() noexcept {
        values_.clear();
    }

private:
    std::map<std::string, Value> values_;
};

} // namespace gura

#endif // GURA_VARIABLES_HPP
