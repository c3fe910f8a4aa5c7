/**
 * @file Cursor.hpp
 * @brief Grapheme cursor and primitive scanners
 *
 * The cursor is the whole mutable state of one parse: the text as grapheme
 * clusters, the scan position and line, the char-class cache, the variable
 * table, the indentation stack and the set of imported files.
 *
 * Character classes are strings of literal members and `a-z` style ranges,
 * with a literal `-` written last:
 * @code
 *   cursor.character("0-9A-Fa-f");   // one hex digit
 *   cursor.maybe_character(" \t");   // optional blank
 *   cursor.keyword({"true", "false"});
 * @endcode
 */

#ifndef GURA_CURSOR_HPP
#define GURA_CURSOR_HPP

#include "gura/Errors.hpp"
#include "gura/Indentation.hpp"
#include "gura/Variables.hpp"

#include <cstddef>
#include <initializer_list>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gura {

/// Line break graphemes ("\r\n" is one cluster)
constexpr const char* kNewLineChars = "\r\n\n\r\f\v";
/// Characters of keys and variable names
constexpr const char* kKeyChars = "0-9A-Za-z_";
/// Characters a number literal may contain, inf and nan included
constexpr const char* kNumberChars = "0-9A-Fa-fxobinEe+._-";
/// Blanks and line breaks skipped between top level items
constexpr const char* kBlankAndNewLineChars = " \t\r\n\n\r\f\v";

/**
 * @brief Text with line breaks and tabs written as escapes, for messages
 */
std::string printable(const std::string& text);

/**
 * @brief True if a grapheme is a line break
 */
bool is_new_line(const std::string& grapheme) noexcept;

/**
 * @brief Mutable scanning state of one document
 */
class Cursor {
public:
    /**
     * @brief Position and line, enough to rewind a failed rule
     */
    struct State {
        std::ptrdiff_t position;
        std::size_t line;
    };

    Cursor() = default;
    explicit Cursor(const std::string& text);

    /**
     * @brief Replace the text and rewind to its start
     *
     * Variables, indentation levels and imported files are kept.
     */
    void reset(const std::string& text);

    State snapshot() const noexcept {
        return State{position_, line_};
    }

    void restore(const State& state) noexcept {
        position_ = state.position;
        line_ = state.line;
    }

    std::ptrdiff_t position() const noexcept {
        return position_;
    }

    std::size_t line() const noexcept {
        return line_;
    }

    std::ptrdiff_t length() const noexcept {
        return static_cast<std::ptrdiff_t>(graphemes_.size());
    }

    bool at_end() const noexcept {
        return position_ >= length();
    }

    /**
     * @brief Next grapheme without consuming it, empty at end of input
     */
    const std::string& peek() const noexcept;

    /**
     * @brief Text between two positions (clamped to the input)
     */
    std::string slice(std::ptrdiff_t from, std::ptrdiff_t to) const;

    /**
     * @brief Text from the current position to the end
     */
    std::string remainder() const {
        return slice(position_, length());
    }

    /**
     * @brief Consume any grapheme
     * @throws ParseError (Syntax) at end of input
     */
    std::string character();

    /**
     * @brief Consume a grapheme belonging to a character class
     * @throws ParseError (Syntax) if the next grapheme is not a member
     * @throws std::invalid_argument if the class has an ill-formed range
     */
    std::string character(const std::string& char_class);

    /**
     * @brief Like character(char_class), but std::nullopt instead of an error
     */
    std::optional<std::string> maybe_character(const std::string& char_class);

    /**
     * @brief Consume the first option whose text comes next
     * @throws ParseError (Syntax) if no option matches
     */
    std::string keyword(std::initializer_list<std::string_view> options);

    /**
     * @brief Like keyword(), but std::nullopt instead of an error
     */
    std::optional<std::string> maybe_keyword(std::initializer_list<std::string_view> options);

    /**
     * @brief Build an error located at the current position and line
     */
    ParseError error(ErrorKind kind, const std::string& message) const {
        return ParseError(kind, message, position_, line_);
    }

    /**
     * @brief Throw a Syntax error at the current position
     */
    [[noreturn]] void fail(const std::string& message) const;

    /**
     * @brief Remember a syntax failure if it is the furthest seen so far
     */
    void note_failure(const ParseError& failure);

    /**
     * @brief Furthest syntax failure seen since the last reset()
     */
    const std::optional<ParseError>& furthest_failure() const noexcept {
        return furthest_failure_;
    }

    VariableTable& variables() noexcept {
        return variables_;
    }

    IndentationStack& indentation() noexcept {
        return indentation_;
    }

    std::set<std::string>& imported_files() noexcept {
        return imported_files_;
    }

private:
    using CharRange = std::pair<std::string, std::string>;

    std::vector<std::string> graphemes_;
    std::ptrdiff_t position_ = 0;
    std::size_t line_ = 1;

    std::map<std::string, std::vector<CharRange>> class_cache_;
    std::optional<ParseError> furthest_failure_;

    VariableTable variables_;
    IndentationStack indentation_;
    std::set<std::string> imported_files_;

    const std::vector<CharRange>& ranges_of(const std::string& char_class);
    bool matches_class(const std::string& grapheme, const std::string& char_class);
    std::size_t match_length(std::string_view text) const;
    void advance(std::ptrdiff_t count);
};

} // namespace gura

#endif // GURA_CURSOR_HPP
