/**
 * @file Cursor.cpp
 * @brief Grapheme cursor and primitive scanners
 */

#include "gura/Cursor.hpp"
#include "gura/Graphemes.hpp"

#include <algorithm>
#include <stdexcept>

namespace gura {

namespace {

std::string join_options(std::initializer_list<std::string_view> options) {
    std::string joined;
    for (auto option : options) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += printable(std::string(option));
    }
    return joined;
}

} // anonymous namespace

std::string printable(const std::string& text) {
    std::string result;
    for (char c : text) {
        switch (c) {
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            case '\f': result += "\\f"; break;
            case '\v': result += "\\v"; break;
            default: result += c; break;
        }
    }
    return result;
}

bool is_new_line(const std::string& grapheme) noexcept {
    return grapheme == "\n" || grapheme == "\r\n" || grapheme == "\r" ||
           grapheme == "\f" || grapheme == "\v";
}

Cursor::Cursor(const std::string& text) {
    reset(text);
}

void Cursor::reset(const std::string& text) {
    if (auto offset = invalid_utf8_offset(text)) {
        std::size_t line = 1;
        const auto valid = split_graphemes(text.substr(0, *offset));
        for (const auto& grapheme : valid) {
            if (is_new_line(grapheme)) {
                ++line;
            }
        }
        throw ParseError(ErrorKind::Syntax, "Invalid UTF-8 sequence",
                         static_cast<std::ptrdiff_t>(valid.size()), line);
    }

    graphemes_ = split_graphemes(text);
    position_ = 0;
    line_ = 1;
    furthest_failure_.reset();
}

const std::string& Cursor::peek() const noexcept {
    static const std::string kNone;
    if (at_end() || position_ < 0) {
        return kNone;
    }
    return graphemes_[static_cast<std::size_t>(position_)];
}

std::string Cursor::slice(std::ptrdiff_t from, std::ptrdiff_t to) const {
    from = std::clamp<std::ptrdiff_t>(from, 0, length());
    to = std::clamp<std::ptrdiff_t>(to, from, length());

    std::string text;
    for (auto i = from; i < to; ++i) {
        text += graphemes_[static_cast<std::size_t>(i)];
    }
    return text;
}

void Cursor::advance(std::ptrdiff_t count) {
    for (std::ptrdiff_t i = 0; i < count && !at_end(); ++i) {
        if (is_new_line(peek())) {
            ++line_;
        }
        ++position_;
    }
}

std::string Cursor::character() {
    if (at_end()) {
        fail("Expected next character but got end of string");
    }
    std::string next = peek();
    advance(1);
    return next;
}

std::string Cursor::character(const std::string& char_class) {
    if (at_end()) {
        fail("Expected '[" + printable(char_class) + "]' but got end of string");
    }
    if (!matches_class(peek(), char_class)) {
        fail("Expected '[" + printable(char_class) + "]' but got '" + printable(peek()) + "'");
    }
    std::string next = peek();
    advance(1);
    return next;
}

std::optional<std::string> Cursor::maybe_character(const std::string& char_class) {
    if (at_end() || !matches_class(peek(), char_class)) {
        return std::nullopt;
    }
    std::string next = peek();
    advance(1);
    return next;
}

std::string Cursor::keyword(std::initializer_list<std::string_view> options) {
    if (at_end()) {
        fail("Expected '" + join_options(options) + "' but got end of string");
    }
    auto matched = maybe_keyword(options);
    if (!matched) {
        fail("Expected '" + join_options(options) + "' but got '" + printable(peek()) + "'");
    }
    return *matched;
}

std::optional<std::string> Cursor::maybe_keyword(std::initializer_list<std::string_view> options) {
    for (auto option : options) {
        const std::size_t count = match_length(option);
        if (count > 0) {
            advance(static_cast<std::ptrdiff_t>(count));
            return std::string(option);
        }
    }
    return std::nullopt;
}

std::size_t Cursor::match_length(std::string_view text) const {
    if (text.empty()) {
        return 0;
    }

    std::size_t offset = 0;
    std::size_t count = 0;
    for (auto i = position_; i < length() && offset < text.size(); ++i) {
        const std::string& grapheme = graphemes_[static_cast<std::size_t>(i)];
        if (text.compare(offset, grapheme.size(), grapheme) != 0) {
            return 0;
        }
        offset += grapheme.size();
        ++count;
    }
    return offset == text.size() ? count : 0;
}

const std::vector<Cursor::CharRange>& Cursor::ranges_of(const std::string& char_class) {
    auto cached = class_cache_.find(char_class);
    if (cached != class_cache_.end()) {
        return cached->second;
    }

    const std::vector<std::string> members = split_graphemes(char_class);
    std::vector<CharRange> ranges;
    std::size_t index = 0;
    while (index < members.size()) {
        if (index + 2 < members.size() && members[index + 1] == "-") {
            if (members[index] >= members[index + 2]) {
                throw std::invalid_argument("Ill-formed range '" + members[index] + "-" +
                                            members[index + 2] + "' in class '" + char_class + "'");
            }
            ranges.emplace_back(members[index], members[index + 2]);
            index += 3;
        } else {
            ranges.emplace_back(members[index], members[index]);
            ++index;
        }
    }

    return class_cache_.emplace(char_class, std::move(ranges)).first->second;
}

bool Cursor::matches_class(const std::string& grapheme, const std::string& char_class) {
    for (const auto& range : ranges_of(char_class)) {
        if (range.first <= grapheme && grapheme <= range.second) {
            return true;
        }
    }
    return false;
}

void Cursor::fail(const std::string& message) const {
    throw error(ErrorKind::Syntax, message);
}

void Cursor::note_failure(const ParseError& failure) {
    if (!failure.recoverable()) {
        return;
    }
    if (!furthest_failure_ || failure.position() > furthest_failure_->position()) {
        furthest_failure_ = failure;
    }
}

} // namespace gura
