/**
 * @file Errors.cpp
 * @brief ParseError formatting
 */

#include "gura/Errors.hpp"

#include <sstream>

namespace gura {

const char* kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Syntax: return "ParseError";
        case ErrorKind::InvalidIndentation: return "InvalidIndentationError";
        case ErrorKind::DuplicatedKey: return "DuplicatedKeyError";
        case ErrorKind::DuplicatedVariable: return "DuplicatedVariableError";
        case ErrorKind::VariableNotDefined: return "VariableNotDefinedError";
        case ErrorKind::FileNotFound: return "FileNotFoundError";
        case ErrorKind::DuplicatedImport: return "DuplicatedImportError";
    }
    return "UnknownError";
}

ParseError::ParseError(ErrorKind kind, std::string message, std::ptrdiff_t position, std::size_t line)
    : std::runtime_error(format_message(kind, message, position, line))
    , kind_(kind)
    , message_(std::move(message))
    , position_(position)
    , line_(line)
{}

std::string ParseError::format_message(ErrorKind kind, const std::string& message,
                                       std::ptrdiff_t position, std::size_t line) {
    std::ostringstream oss;
    oss << kind_name(kind) << ": " << message
        << " (line " << line << ", position " << position << ")";
    return oss.str();
}

} // namespace gura
