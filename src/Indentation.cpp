/**
 * @file Indentation.cpp
 * @brief Indentation level stack
 */

#include "gura/Indentation.hpp"

namespace gura {

std::optional<std::size_t> IndentationStack::top() const noexcept {
    if (levels_.empty()) {
        return std::nullopt;
    }
    return levels_.back();
}

Placement IndentationStack::place(std::size_t level) {
    if (levels_.empty()) {
        levels_.push_back(level);
        return Placement::Root;
    }

    const std::size_t innermost = levels_.back();
    if (level > innermost) {
        levels_.push_back(level);
        return Placement::Nested;
    }
    if (level < innermost) {
        levels_.pop_back();
        return Placement::EndOfBlock;
    }
    return Placement::Sibling;
}

void IndentationStack::pop() noexcept {
    if (!levels_.empty()) {
        levels_.pop_back();
    }
}

} // namespace gura
