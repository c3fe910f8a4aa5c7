/**
 * @file Convert.hpp
 * @brief Conversion between Gura values, JSON (nlohmann) and TOML (toml++)
 *
 * Mapping to JSON:
 * - Null, Bool, Integer, Float, String, Array, Object map one to one
 * - BigInteger becomes an unsigned number when it fits 64 bits, else its
 *   decimal text
 * - NaN and infinities follow nlohmann (written as null)
 *
 * Mapping to TOML (root must be an object):
 * - null becomes "" (TOML has no null)
 * - BigInteger becomes a float when it overflows the TOML integer range
 * - arrays of objects become arrays of tables
 */

#ifndef GURA_CONVERT_HPP
#define GURA_CONVERT_HPP

#include "gura/Value.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <string>

namespace gura {

/**
 * @brief Convert a value to JSON, keeping object key order
 */
nlohmann::ordered_json to_json(const Value& value);

/**
 * @brief Convert JSON to a value
 *
 * Unsigned numbers above the int64 range become BigInteger.
 */
Value from_json(const nlohmann::ordered_json& json);

/**
 * @brief Convert an object value to a TOML table
 *
 * A value that is not an object is stored under the key "value".
 */
toml::table to_toml(const Value& value);

/**
 * @brief Convert a TOML node to a value
 *
 * Dates and times become their TOML text.
 */
Value from_toml(const toml::node& node);

/**
 * @brief Serialize a value as JSON text
 * @param indent Spaces per level, -1 for a single line
 */
std::string to_json_string(const Value& value, int indent = 2);

/**
 * @brief Serialize a value as TOML text
 */
std::string to_toml_string(const Value& value);

/**
 * @brief Load a file by extension: `.json`, `.toml`, anything else as Gura
 * @throws ParseError (FileNotFound) if the file does not exist
 * @throws nlohmann::json::parse_error, toml::parse_error, ParseError on
 *         malformed content
 */
Value read_file_any(const std::string& path);

} // namespace gura

#endif // GURA_CONVERT_HPP
