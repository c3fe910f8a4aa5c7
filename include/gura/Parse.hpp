/**
 * @file Parse.hpp
 * @brief Number literal classification
 *
 * Converts the text of a number literal into a typed Value. Underscores are
 * digit separators and are removed first. Rules, first match wins:
 * - `0x`, `0o`, `0b` prefix: Integer in base 16, 8 or 2
 * - `inf`, `+inf`, `-inf`, `nan` (optionally signed): Float
 * - contains `E`, `e` or `.`: Float
 * - otherwise: Integer, or BigInteger when it overflows 64 bits
 */

#ifndef GURA_PARSE_HPP
#define GURA_PARSE_HPP

#include "gura/Value.hpp"

#include <optional>
#include <string>

namespace gura {

/**
 * @brief Parse a number literal
 *
 * @param literal Literal text as scanned from the document
 * @return Parsed Value, std::nullopt if the text is not a valid number
 *
 * Examples:
 * ```cpp
 * parse_number("1_000")     // → 1000 (integer)
 * parse_number("0xDEADBEEF") // → 3735928559 (integer)
 * parse_number("0o755")     // → 493 (integer)
 * parse_number("6.626e-34") // → 6.626e-34 (float)
 * parse_number("-inf")      // → -inf (float)
 * parse_number("99999999999999999999") // → big integer
 * parse_number("1.2.3")     // → std::nullopt
 * ```
 */
std::optional<Value> parse_number(const std::string& literal);

} // namespace gura

#endif // GURA_PARSE_HPP
