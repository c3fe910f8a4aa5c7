/**
 * @file Grammar.cpp
 * @brief Gura grammar rules
 */

#include "gura/Grammar.hpp"
#include "gura/Graphemes.hpp"
#include "gura/Imports.hpp"
#include "gura/Parse.hpp"

#include <map>

namespace gura {

namespace {

const std::map<std::string, std::string>& escape_sequences() {
    static const std::map<std::string, std::string> sequences = {
        {"b", "\b"},
        {"f", "\f"},
        {"n", "\n"},
        {"r", "\r"},
        {"t", "\t"},
        {"\"", "\""},
        {"\\", "\\"},
        {"$", "$"},
    };
    return sequences;
}

} // anonymous namespace

// ============================================================================
// Combinator
// ============================================================================

Node Grammar::matches(std::initializer_list<Rule> rules) {
    std::optional<ParseError> furthest;

    for (Rule rule : rules) {
        const Cursor::State state = cursor_.snapshot();
        try {
            return (this->*rule)();
        } catch (const ParseError& e) {
            if (!e.recoverable()) {
                throw;
            }
            cursor_.restore(state);
            cursor_.note_failure(e);
            if (!furthest || e.position() > furthest->position()) {
                furthest = e;
            }
        }
    }

    if (!furthest) {
        cursor_.fail("No rule to match");
    }
    throw *furthest;
}

std::optional<Node> Grammar::maybe_match(std::initializer_list<Rule> rules) {
    try {
        return matches(rules);
    } catch (const ParseError& e) {
        if (!e.recoverable()) {
            throw;
        }
        return std::nullopt;
    }
}

// ============================================================================
// Document
// ============================================================================

Value Grammar::start(const std::optional<std::filesystem::path>& origin_dir) {
    expand_imports(cursor_, origin_dir);

    Node root = matches({&Grammar::object});

    // A document holding no pairs may be written as a lone `empty`
    if (root.kind != NodeKind::Block && cursor_.maybe_keyword({"empty"})) {
        while (maybe_match({&Grammar::useless_line})) {
        }
    }
    eat_ws_and_new_lines();

    if (!cursor_.at_end()) {
        const auto& furthest = cursor_.furthest_failure();
        if (furthest && furthest->position() > cursor_.position()) {
            throw *furthest;
        }
        cursor_.fail("Expected end of string but got '" + printable(cursor_.peek()) + "'");
    }

    if (root.kind == NodeKind::Block) {
        return std::move(root.value);
    }
    return Value::object();
}

void Grammar::eat_ws_and_new_lines() {
    while (cursor_.maybe_character(kBlankAndNewLineChars)) {
    }
}

// ============================================================================
// Blanks, comments and useless lines
// ============================================================================

Node Grammar::ws() {
    while (cursor_.maybe_keyword({" ", "\t"})) {
    }
    return Node::marker(NodeKind::Blank);
}

Node Grammar::new_line() {
    cursor_.character(kNewLineChars);
    return Node::marker(NodeKind::Blank);
}

Node Grammar::comment() {
    cursor_.keyword({"#"});
    while (!cursor_.at_end()) {
        if (is_new_line(cursor_.character())) {
            break;
        }
    }
    return Node::marker(NodeKind::Comment);
}

Node Grammar::useless_line() {
    const std::ptrdiff_t start = cursor_.position();
    ws();
    const bool has_comment = maybe_match({&Grammar::comment}).has_value();
    const bool has_new_line = maybe_match({&Grammar::new_line}).has_value();

    // Blanks closing the document count as a line of their own
    const bool trailing_blanks = cursor_.at_end() && cursor_.position() > start;

    if (!has_comment && !has_new_line && !trailing_blanks) {
        cursor_.fail("It is a valid line");
    }
    return Node::marker(NodeKind::UselessLine);
}

// ============================================================================
// Primitive values
// ============================================================================

Node Grammar::any_type() {
    if (auto primitive = maybe_match({&Grammar::primitive_type})) {
        return std::move(*primitive);
    }
    return matches({&Grammar::complex_type});
}

Node Grammar::primitive_type() {
    ws();
    return matches({
        &Grammar::null_value,
        &Grammar::boolean,
        &Grammar::basic_string,
        &Grammar::literal_string,
        &Grammar::number,
        &Grammar::variable_value,
        &Grammar::empty_object,
    });
}

Node Grammar::complex_type() {
    return matches({&Grammar::list, &Grammar::object});
}

Node Grammar::null_value() {
    cursor_.keyword({"null"});
    return Node::of(Value(nullptr));
}

Node Grammar::empty_object() {
    cursor_.keyword({"empty"});
    return Node::of(Value::object());
}

Node Grammar::boolean() {
    return Node::of(Value(cursor_.keyword({"true", "false"}) == "true"));
}

Node Grammar::basic_string() {
    const std::string quote = cursor_.keyword({"\"\"\"", "\""});
    const bool multiline = quote == "\"\"\"";

    // A line break right after the opening delimiter is not part of the value
    if (multiline) {
        cursor_.maybe_keyword({"\r\n", "\n"});
    }

    std::string result;
    while (!cursor_.maybe_keyword({quote})) {
        const Cursor::State at = cursor_.snapshot();
        const std::string current = cursor_.character();

        if (current == "$") {
            result += interpolate(lookup_variable(variable_name(), at));
            continue;
        }
        if (current != "\\") {
            result += current;
            continue;
        }

        const std::string escape = cursor_.character();
        if (multiline && is_new_line(escape)) {
            eat_ws_and_new_lines();
        } else if (escape == "u" || escape == "U") {
            const int digits = escape == "u" ? 4 : 8;
            std::string hex;
            for (int i = 0; i < digits; ++i) {
                hex += cursor_.character("0-9a-fA-F");
            }
            if (!append_utf8(result, std::stoul(hex, nullptr, 16))) {
                throw ParseError(ErrorKind::Syntax, "Invalid Unicode code point \\" + escape + hex,
                                 at.position, at.line);
            }
        } else {
            auto it = escape_sequences().find(escape);
            if (it != escape_sequences().end()) {
                result += it->second;
            } else {
                result += current + escape;
            }
        }
    }

    return Node::of(Value(std::move(result)));
}

Node Grammar::literal_string() {
    const std::string quote = cursor_.keyword({"'''", "'"});
    if (quote == "'''") {
        cursor_.maybe_keyword({"\r\n", "\n"});
    }

    std::string result;
    while (!cursor_.maybe_keyword({quote})) {
        result += cursor_.character();
    }
    return Node::of(Value(std::move(result)));
}

Node Grammar::number() {
    std::string literal = cursor_.character(kNumberChars);
    while (auto next = cursor_.maybe_character(kNumberChars)) {
        literal += *next;
    }

    auto value = parse_number(literal);
    if (!value) {
        cursor_.fail("'" + literal + "' is not a valid number");
    }
    return Node::of(std::move(*value));
}

Node Grammar::variable_value() {
    const Cursor::State at = cursor_.snapshot();
    cursor_.keyword({"$"});
    return Node::of(lookup_variable(unquoted_string(), at));
}

Node Grammar::list() {
    Value result = Value::array();

    ws();
    cursor_.keyword({"["});
    while (true) {
        // Blank and comment lines between elements
        if (maybe_match({&Grammar::useless_line})) {
            continue;
        }

        auto item = maybe_match({&Grammar::any_type});
        if (!item) {
            break;
        }
        if (item->kind != NodeKind::BreakParent) {
            result.push_back(std::move(item->value));
        }

        ws();
        maybe_match({&Grammar::new_line});
        if (!cursor_.maybe_keyword({","})) {
            break;
        }
    }

    ws();
    maybe_match({&Grammar::new_line});
    cursor_.keyword({"]"});
    return Node::of(std::move(result));
}

// ============================================================================
// Keys and variables
// ============================================================================

std::string Grammar::unquoted_string() {
    auto first = cursor_.maybe_character(kKeyChars);
    if (!first) {
        cursor_.fail(cursor_.at_end() ? std::string("Expected string but got end of string")
                                      : "Expected string but got '" + printable(cursor_.peek()) + "'");
    }

    std::string text = *first;
    while (auto next = cursor_.maybe_character(kKeyChars)) {
        text += *next;
    }
    return text;
}

std::string Grammar::key() {
    std::string name = unquoted_string();
    cursor_.keyword({":"});
    return name;
}

std::string Grammar::variable_name() {
    std::string name;
    while (auto next = cursor_.maybe_character(kKeyChars)) {
        name += *next;
    }
    return name;
}

Value Grammar::lookup_variable(const std::string& name, const Cursor::State& at) {
    auto value = cursor_.variables().lookup(name);
    if (!value) {
        throw ParseError(ErrorKind::VariableNotDefined,
                         "Variable '" + name + "' is not defined in Gura nor as environment variable",
                         at.position, at.line);
    }
    return std::move(*value);
}

Node Grammar::variable() {
    const Cursor::State at = cursor_.snapshot();
    cursor_.keyword({"$"});
    const std::string name = key();
    ws();

    Node value = matches({
        &Grammar::basic_string,
        &Grammar::literal_string,
        &Grammar::number,
        &Grammar::variable_value,
    });

    if (cursor_.variables().contains(name)) {
        throw ParseError(ErrorKind::DuplicatedVariable,
                         "Variable '" + name + "' has been already declared", at.position, at.line);
    }
    if (!is_variable_value(value.value)) {
        cursor_.fail("Invalid variable value");
    }

    cursor_.variables().define(name, std::move(value.value));
    return Node::marker(NodeKind::Variable);
}

// ============================================================================
// Imports
// ============================================================================

std::string Grammar::quoted_string_with_var() {
    cursor_.keyword({"\""});

    std::string result;
    while (true) {
        const Cursor::State at = cursor_.snapshot();
        const std::string current = cursor_.character();
        if (current == "\"") {
            break;
        }
        if (current == "$") {
            result += interpolate(lookup_variable(variable_name(), at));
        } else {
            result += current;
        }
    }
    return result;
}

Node Grammar::gura_import() {
    const Cursor::State at = cursor_.snapshot();
    cursor_.keyword({"import"});
    cursor_.character(" ");
    std::string path = quoted_string_with_var();
    ws();
    maybe_match({&Grammar::new_line});

    Node node = Node::marker(NodeKind::Import);
    node.key = std::move(path);
    node.position = at.position;
    node.line = at.line;
    return node;
}

// ============================================================================
// Objects and indentation
// ============================================================================

Node Grammar::object() {
    Value result = Value::object();
    std::optional<std::size_t> level;
    std::ptrdiff_t first_position = cursor_.position();
    std::size_t first_line = cursor_.line();

    while (!cursor_.at_end()) {
        auto item = maybe_match({&Grammar::variable, &Grammar::pair, &Grammar::useless_line});
        if (!item || item->kind == NodeKind::BreakParent) {
            break;
        }

        if (item->kind == NodeKind::Pair) {
            if (level && item->indentation != *level) {
                throw ParseError(ErrorKind::InvalidIndentation,
                                 "Key '" + item->key + "' is not aligned with its siblings",
                                 item->position, item->line);
            }
            if (!result.insert(item->key, std::move(item->value))) {
                throw ParseError(ErrorKind::DuplicatedKey,
                                 "The key '" + item->key + "' has been already defined",
                                 item->position, item->line);
            }
            if (!level) {
                level = item->indentation;
                first_position = item->position;
                first_line = item->line;
            }
        }

        // An object inside a list ends at the list's separator or bracket
        const std::string& next = cursor_.peek();
        if (next == "]" || next == ",") {
            if (level) {
                cursor_.indentation().pop();
            }
            break;
        }
    }

    if (!level) {
        return Node::marker(NodeKind::BreakParent);
    }

    Node block = Node::of(std::move(result));
    block.kind = NodeKind::Block;
    block.indentation = *level;
    block.position = first_position;
    block.line = first_line;
    return block;
}

Node Grammar::pair() {
    IndentationStack& stack = cursor_.indentation();
    const auto saved_levels = stack.levels();
    const Cursor::State before = cursor_.snapshot();

    try {
        return pair_body(before);
    } catch (const ParseError&) {
        stack.restore(saved_levels);
        throw;
    }
}

Node Grammar::pair_body(const Cursor::State& before) {
    IndentationStack& stack = cursor_.indentation();

    std::size_t level = 0;
    std::optional<Cursor::State> tab;
    while (auto blank = cursor_.maybe_keyword({" ", "\t"})) {
        if (*blank == "\t" && !tab) {
            tab = Cursor::State{cursor_.position() - 1, cursor_.line()};
        }
        ++level;
    }

    // Tabs only matter when they indent a key, a blank line may hold them
    if (tab) {
        if (!cursor_.maybe_character(kKeyChars)) {
            cursor_.fail("Invalid pair");
        }
        throw ParseError(ErrorKind::InvalidIndentation,
                         "Tabs are not allowed to define indentation blocks",
                         tab->position, tab->line);
    }

    const Cursor::State at_key = cursor_.snapshot();
    const std::string name = key();
    ws();

    if (level % kIndentWidth != 0) {
        throw ParseError(ErrorKind::InvalidIndentation,
                         "Indentation block (" + std::to_string(level) + ") must be divisible by " +
                             std::to_string(kIndentWidth),
                         at_key.position, at_key.line);
    }
    if (stack.empty() && level != 0) {
        throw ParseError(ErrorKind::InvalidIndentation,
                         "The first key of the document must not be indented",
                         at_key.position, at_key.line);
    }

    if (stack.place(level) == Placement::EndOfBlock) {
        // The enclosing object reads this pair again at its own level
        cursor_.restore(before);
        return Node::marker(NodeKind::BreakParent);
    }

    const auto levels_before_value = stack.levels();
    Node value = matches({&Grammar::any_type});

    if (value.kind == NodeKind::BreakParent) {
        cursor_.fail("Invalid pair");
    }
    if (value.kind == NodeKind::Block) {
        if (value.indentation == level) {
            throw ParseError(ErrorKind::InvalidIndentation,
                             "Wrong level for parent with key '" + name + "'",
                             value.position, value.line);
        }
        if (value.indentation != level + kIndentWidth) {
            throw ParseError(ErrorKind::InvalidIndentation,
                             "Difference between different indentation levels must be " +
                                 std::to_string(kIndentWidth),
                             value.position, value.line);
        }
    } else {
        if (value.value.is_array()) {
            stack.restore(levels_before_value);
        }
        ws();
    }
    maybe_match({&Grammar::new_line});

    Node node = Node::marker(NodeKind::Pair);
    node.key = name;
    node.value = std::move(value.value);
    node.indentation = level;
    node.position = at_key.position;
    node.line = at_key.line;
    return node;
}

} // namespace gura
