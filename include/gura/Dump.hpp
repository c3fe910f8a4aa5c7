/**
 * @file Dump.hpp
 * @brief Serialization of a Value tree back to Gura text
 *
 * Output re-parses to an equal tree. Literal style is not preserved:
 * hexadecimal, octal, binary and underscored numbers come out as plain
 * decimal, strings always as basic strings.
 */

#ifndef GURA_DUMP_HPP
#define GURA_DUMP_HPP

#include "gura/Value.hpp"

#include <string>

namespace gura {

/**
 * @brief Serialize a value as Gura text
 *
 * Objects are written one `key: value` per line with nested non-empty
 * objects indented by 4 spaces, empty objects as `empty`. Arrays are
 * written inline unless they hold a non-empty object. The result has no
 * leading or trailing whitespace.
 *
 * @param value Value to serialize (usually an object)
 * @return Gura text
 */
std::string dump(const Value& value);

/**
 * @brief Shortest decimal text that reads back as the same double
 *
 * `nan`, `inf` and `-inf` for the non-finite values.
 */
std::string format_float(double number);

/**
 * @brief Quote a string, escaping control characters, quotes, backslashes and `$`
 */
std::string quote_string(const std::string& text);

} // namespace gura

#endif // GURA_DUMP_HPP
