/**
 * @file test_indentation.cpp
 * @brief Tests for the indentation stack and indentation errors
 */

#include <gtest/gtest.h>
#include "gura/Errors.hpp"
#include "gura/Indentation.hpp"
#include "gura/Parser.hpp"

#include <vector>

using namespace gura;

namespace {

/**
 * @brief Parse text that must fail and return the error
 */
ParseError parse_error_of(const std::string& text) {
    try {
        parse(text);
    } catch (const ParseError& e) {
        return e;
    }
    ADD_FAILURE() << "Expected a ParseError for: " << text;
    return ParseError(ErrorKind::Syntax, "no error", -1, 0);
}

} // namespace

// ============================================================================
// IndentationStack
// ============================================================================

TEST(IndentationStack, FirstLevelIsRoot) {
    IndentationStack stack;
    EXPECT_TRUE(stack.empty());
    EXPECT_FALSE(stack.top().has_value());

    EXPECT_EQ(stack.place(0), Placement::Root);
    EXPECT_EQ(stack.depth(), 1u);
    EXPECT_EQ(stack.top(), 0u);
}

TEST(IndentationStack, DeeperPushesEqualKeeps) {
    IndentationStack stack;
    stack.place(0);
    EXPECT_EQ(stack.place(4), Placement::Nested);
    EXPECT_EQ(stack.place(4), Placement::Sibling);
    EXPECT_EQ(stack.place(8), Placement::Nested);
    EXPECT_EQ(stack.levels(), (std::vector<std::size_t>{0, 4, 8}));
}

TEST(IndentationStack, ShallowerPopsOneLevel) {
    IndentationStack stack;
    stack.place(0);
    stack.place(4);
    stack.place(8);

    EXPECT_EQ(stack.place(0), Placement::EndOfBlock);
    EXPECT_EQ(stack.levels(), (std::vector<std::size_t>{0, 4}));
    EXPECT_EQ(stack.place(0), Placement::EndOfBlock);
    EXPECT_EQ(stack.levels(), (std::vector<std::size_t>{0}));
    EXPECT_EQ(stack.place(0), Placement::Sibling);
}

TEST(IndentationStack, PopOnEmptyIsNoop) {
    IndentationStack stack;
    stack.pop();
    EXPECT_TRUE(stack.empty());

    stack.place(0);
    stack.pop();
    EXPECT_TRUE(stack.empty());
}

TEST(IndentationStack, RestoreAndClear) {
    IndentationStack stack;
    stack.place(0);
    const auto saved = stack.levels();
    stack.place(4);

    stack.restore(saved);
    EXPECT_EQ(stack.levels(), (std::vector<std::size_t>{0}));

    stack.clear();
    EXPECT_TRUE(stack.empty());
}

// ============================================================================
// Indentation in documents
// ============================================================================

TEST(IndentationParse, NestedBlocksCloseOnDedent) {
    Value doc = parse(
        "a:\n"
        "    b: 1\n"
        "    c:\n"
        "        d: true\n"
        "e: \"x\"\n");

    Value expected(Value::Object{
        {"a", Value::Object{{"b", 1}, {"c", Value::Object{{"d", true}}}}},
        {"e", "x"},
    });
    EXPECT_EQ(doc, expected);
}

TEST(IndentationParse, TabIndentingKey) {
    ParseError e = parse_error_of("a: 1\n\tb: 2");
    EXPECT_EQ(e.kind(), ErrorKind::InvalidIndentation);
    EXPECT_EQ(e.position(), 5);
    EXPECT_EQ(e.line(), 2u);
}

TEST(IndentationParse, TabsAllowedOnCommentLines) {
    Value doc = parse("a: 1\n\t# note\nb: 2");
    EXPECT_EQ(doc, Value(Value::Object{{"a", 1}, {"b", 2}}));
}

TEST(IndentationParse, TabsAllowedAfterValues) {
    Value doc = parse("a: 1\t# note\nb: 2");
    EXPECT_EQ(doc, Value(Value::Object{{"a", 1}, {"b", 2}}));
}

TEST(IndentationParse, NotDivisibleByFour) {
    ParseError e = parse_error_of("a:\n   b: 1");
    EXPECT_EQ(e.kind(), ErrorKind::InvalidIndentation);
    EXPECT_EQ(e.position(), 6);
    EXPECT_EQ(e.line(), 2u);
    EXPECT_NE(e.message().find("(3)"), std::string::npos);
}

TEST(IndentationParse, SkippedLevel) {
    ParseError e = parse_error_of("a:\n        b: 1");
    EXPECT_EQ(e.kind(), ErrorKind::InvalidIndentation);
    EXPECT_EQ(e.position(), 11);
    EXPECT_EQ(e.line(), 2u);
}

TEST(IndentationParse, ChildAtParentLevel) {
    ParseError e = parse_error_of("a:\nb: 1");
    EXPECT_EQ(e.kind(), ErrorKind::InvalidIndentation);
    EXPECT_EQ(e.message(), "Wrong level for parent with key 'a'");
    EXPECT_EQ(e.position(), 3);
    EXPECT_EQ(e.line(), 2u);
}

TEST(IndentationParse, IndentedFirstKey) {
    ParseError e = parse_error_of("    a: 1");
    EXPECT_EQ(e.kind(), ErrorKind::InvalidIndentation);
    EXPECT_EQ(e.position(), 4);
    EXPECT_EQ(e.line(), 1u);
}

TEST(IndentationParse, MisalignedSibling) {
    ParseError e = parse_error_of("a: 1\n    b: 2");
    EXPECT_EQ(e.kind(), ErrorKind::InvalidIndentation);
    EXPECT_EQ(e.position(), 9);
    EXPECT_EQ(e.line(), 2u);
}
