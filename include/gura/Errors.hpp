/**
 * @file Errors.hpp
 * @brief Error type raised by the Gura parser
 *
 * Every failure is reported through a single exception type carrying a
 * kind, so callers (and the rule combinator) can dispatch on the category:
 * - Syntax: grammar mismatch, the only recoverable kind
 * - InvalidIndentation: tabs, levels not multiple of 4, bad nesting
 * - DuplicatedKey: same key twice in one object
 * - DuplicatedVariable: same variable defined twice
 * - VariableNotDefined: variable absent from document and environment
 * - FileNotFound: import target missing or unreadable
 * - DuplicatedImport: same file imported more than once
 */

#ifndef GURA_ERRORS_HPP
#define GURA_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace gura {

/**
 * @brief Category of a parse failure
 */
enum class ErrorKind {
    Syntax,
    InvalidIndentation,
    DuplicatedKey,
    DuplicatedVariable,
    VariableNotDefined,
    FileNotFound,
    DuplicatedImport
};

/**
 * @brief Canonical name of an error kind (e.g. "DuplicatedKeyError")
 */
const char* kind_name(ErrorKind kind) noexcept;

/**
 * @brief Exception thrown by parse(), parse_file() and the import expander
 *
 * Position is the grapheme offset from the start of the (flattened)
 * document, line is 1-based.
 */
class ParseError : public std::runtime_error {
public:
    /**
     * @brief Construct a positioned error
     * @param kind Error category
     * @param message Human readable description
     * @param position Grapheme offset where the error was detected
     * @param line 1-based line where the error was detected
     */
    ParseError(ErrorKind kind, std::string message, std::ptrdiff_t position, std::size_t line);

    /**
     * @brief Error category
     */
    ErrorKind kind() const noexcept {
        return kind_;
    }

    /**
     * @brief Message without the position suffix
     */
    const std::string& message() const noexcept {
        return message_;
    }

    /**
     * @brief Grapheme offset from the start of the document
     */
    std::ptrdiff_t position() const noexcept {
        return position_;
    }

    /**
     * @brief 1-based line number
     */
    std::size_t line() const noexcept {
        return line_;
    }

    /**
     * @brief True for the kind the rule combinator may backtrack over
     */
    bool recoverable() const noexcept {
        return kind_ == ErrorKind::Syntax;
    }

private:
    ErrorKind kind_;
    std::string message_;
    std::ptrdiff_t position_;
    std::size_t line_;

    static std::string format_message(ErrorKind kind, const std::string& message,
                                      std::ptrdiff_t position, std::size_t line);
};

} // namespace gura

#endif // GURA_ERRORS_HPP
