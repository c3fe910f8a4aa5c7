/**
 * @file Graphemes.hpp
 * @brief Grapheme cluster segmentation of UTF-8 text
 *
 * The parser scans user-perceived characters rather than bytes, so that a
 * combining sequence or a multi-byte code point is never split. Segmentation
 * follows the Unicode extended grapheme cluster rules through ICU.
 */

#ifndef GURA_GRAPHEMES_HPP
#define GURA_GRAPHEMES_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace gura {

/**
 * @brief Split UTF-8 text into grapheme clusters
 *
 * "\r\n" is a single cluster. The text must be valid UTF-8 (see
 * invalid_utf8_offset()); invalid sequences would come out as U+FFFD.
 *
 * @param text UTF-8 input
 * @return One UTF-8 string per grapheme cluster
 * @throws std::runtime_error if ICU cannot create a break iterator
 */
std::vector<std::string> split_graphemes(const std::string& text);

/**
 * @brief Byte offset of the first invalid UTF-8 sequence, if any
 *
 * Overlong forms, surrogates and truncated sequences are invalid.
 */
std::optional<std::size_t> invalid_utf8_offset(const std::string& text);

/**
 * @brief Encode a Unicode code point as UTF-8
 * @return false if the code point is a surrogate or above U+10FFFF
 */
bool append_utf8(std::string& out, unsigned long code_point);

} // namespace gura

#endif // GURA_GRAPHEMES_HPP
