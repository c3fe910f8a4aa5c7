/**
 * @file Indentation.hpp
 * @brief Indentation level stack shared by every object of a document
 *
 * Objects nest through indentation rather than delimiters, so the block
 * structure is tracked by one stack of levels per parse, innermost last:
 * - a deeper pair opens a nested object (push)
 * - a shallower pair ends the innermost block (pop)
 * - an equal pair is a sibling
 */

#ifndef GURA_INDENTATION_HPP
#define GURA_INDENTATION_HPP

#include <cstddef>
#include <optional>
#include <vector>

namespace gura {

/**
 * @brief Number of spaces of one indentation unit
 */
constexpr std::size_t kIndentWidth = 4;

/**
 * @brief Where a pair sits relative to the innermost open block
 */
enum class Placement {
    Root,        ///< first pair of the document, stack was empty
    Nested,      ///< deeper than the innermost block, level pushed
    Sibling,     ///< same level as the innermost block
    EndOfBlock   ///< shallower, innermost level popped
};

/**
 * @brief Stack of indentation levels, strictly increasing bottom to top
 */
class IndentationStack {
public:
    bool empty() const noexcept {
        return levels_.empty();
    }

    std::size_t depth() const noexcept {
        return levels_.size();
    }

    /**
     * @brief Innermost level, if any
     */
    std::optional<std::size_t> top() const noexcept;

    /**
     * @brief Classify a pair's level and update the stack accordingly
     *
     * Root and Nested push the level, EndOfBlock pops the innermost one,
     * Sibling leaves the stack untouched. Callers validate that a Root level
     * is 0 before calling.
     */
    Placement place(std::size_t level);

    /**
     * @brief Remove the innermost level, no-op on an empty stack
     */
    void pop() noexcept;

    /**
     * @brief Copy of the levels, bottom first
     */
    const std::vector<std::size_t>& levels() const noexcept {
        return levels_;
    }

    /**
     * @brief Replace the levels with a previously saved copy
     */
    void restore(std::vector<std::size_t> levels) {
        levels_ = std::move(levels);
    }

    void clear() noexcept {
        levels_.clear();
    }

private:
    std::vector<std::size_t> levels_;
};

} // namespace gura

#endif // GURA_INDENTATION_HPP
