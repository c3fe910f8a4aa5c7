/**
 * @file Grammar.hpp
 * @brief Gura grammar rules and the ordered-choice combinator
 *
 * Each rule is a member function consuming input from the cursor and
 * returning a Node, or throwing a ParseError. Syntax errors are
 * recoverable: matches() rewinds the cursor and tries the next
 * alternative, and when all alternatives fail raises the error that got
 * furthest into the input. Every other error kind aborts the parse.
 *
 * Rule overview:
 * - start: import pre-pass, one object, end of input
 * - any_type: primitive_type, else list or object
 * - primitive_type: null, booleans, basic and literal strings, numbers,
 *   variable references, `empty`
 * - object: pairs, variable definitions and useless lines
 * - pair: indentation, key, value
 */

#ifndef GURA_GRAMMAR_HPP
#define GURA_GRAMMAR_HPP

#include "gura/Cursor.hpp"
#include "gura/Value.hpp"

#include <cstddef>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>

namespace gura {

/**
 * @brief What a rule matched
 */
enum class NodeKind {
    Value,        ///< a scalar or list
    Blank,        ///< blanks or a line break
    Comment,
    UselessLine,  ///< blank line or comment line
    Pair,         ///< key, value and indentation level
    Variable,     ///< variable definition, already stored
    Import,       ///< import directive, key holds the path
    Block,        ///< non-empty object with the level of its pairs
    BreakParent   ///< object ended (dedent or no pairs)
};

/**
 * @brief Result of a rule
 *
 * Position and line locate the construct for error reports: the key of a
 * Pair, the first key of a Block, the start of an Import.
 */
struct Node {
    NodeKind kind = NodeKind::Value;
    Value value;
    std::string key;
    std::size_t indentation = 0;
    std::ptrdiff_t position = 0;
    std::size_t line = 1;

    static Node of(Value value) {
        Node node;
        node.value = std::move(value);
        return node;
    }

    static Node marker(NodeKind kind) {
        Node node;
        node.kind = kind;
        return node;
    }
};

class Grammar {
public:
    using Rule = Node (Grammar::*)();

    explicit Grammar(Cursor& cursor) : cursor_(cursor) {}

    Cursor& cursor() noexcept {
        return cursor_;
    }

    /**
     * @brief Parse a whole document
     *
     * @param origin_dir Directory relative imports resolve against, none to
     *                   use paths as written
     * @return Root object, empty when the document has no pairs
     */
    Value start(const std::optional<std::filesystem::path>& origin_dir = std::nullopt);

    /**
     * @brief First rule that succeeds, in order
     * @throws ParseError the furthest syntax error if every rule fails, or
     *         the first non-syntax error raised by a rule
     */
    Node matches(std::initializer_list<Rule> rules);

    /**
     * @brief Like matches(), but std::nullopt when every rule fails with a
     *        syntax error
     */
    std::optional<Node> maybe_match(std::initializer_list<Rule> rules);

    // Values
    Node any_type();
    Node primitive_type();
    Node complex_type();
    Node null_value();
    Node empty_object();
    Node boolean();
    Node basic_string();
    Node literal_string();
    Node number();
    Node variable_value();
    Node list();

    // Structure
    Node object();
    Node pair();
    Node variable();
    Node gura_import();
    Node useless_line();
    Node comment();
    Node ws();
    Node new_line();

    /**
     * @brief Double-quoted string with `$name` interpolation and no escapes
     */
    std::string quoted_string_with_var();

    /**
     * @brief Skip blanks and line breaks
     */
    void eat_ws_and_new_lines();

private:
    Cursor& cursor_;

    std::string key();
    std::string unquoted_string();
    std::string variable_name();
    Value lookup_variable(const std::string& name, const Cursor::State& at);
    Node pair_body(const Cursor::State& before);
};

} // namespace gura

#endif // GURA_GRAMMAR_HPP
