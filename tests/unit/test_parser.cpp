/**
 * Unit tests for the snippet lexer and parser
 *
 * Covers statement shapes, source positions and the nesting ceiling that
 * keeps hostile input from exhausting the stack.
 */

#include <gtest/gtest.h>
#include "../../src/parser.h"
#include "codegate/constants.h"
#include "codegate/errors.h"
#include <string>

using namespace codegate;

namespace {

const ast::Stmt& statement(const ast::Module& module, size_t index) {
    return *module.body.at(index);
}

} // namespace

// ============================================================================
// Test Contract: Statement structure
// ============================================================================

TEST(ParserTest, ParsesAssignmentAndTrailingExpression) {
    // Given: Two simple statements
    std::string code = "x = client.list_items()\nlen(x)\n";

    // When: Parsed
    ast::Module module = Parser::parse(code);

    // Then: One assignment followed by one expression statement
    ASSERT_EQ(module.body.size(), 2u);
    EXPECT_EQ(statement(module, 0).kind, ast::NodeKind::Assign);
    EXPECT_EQ(statement(module, 1).kind, ast::NodeKind::Expr);
    EXPECT_EQ(statement(module, 1).line, 2);
}

TEST(ParserTest, ParsesCompoundStatements) {
    // Given: Nested control flow
    std::string code =
        "total = 0\n"
        "for item in items:\n"
        "    if item > 2:\n"
        "        total += item\n"
        "    else:\n"
        "        continue\n"
        "try:\n"
        "    x = 1 / 0\n"
        "except ZeroDivisionError as e:\n"
        "    x = None\n"
        "finally:\n"
        "    pass\n";

    // When: Parsed
    ast::Module module = Parser::parse(code);

    // Then: Top-level kinds are preserved and the loop body holds the if
    ASSERT_EQ(module.body.size(), 3u);
    EXPECT_EQ(statement(module, 1).kind, ast::NodeKind::For);
    EXPECT_EQ(statement(module, 2).kind, ast::NodeKind::Try);

    const auto& loop = static_cast<const ast::For&>(statement(module, 1));
    ASSERT_EQ(loop.body.size(), 1u);
    EXPECT_EQ(loop.body[0]->kind, ast::NodeKind::If);

    const auto& guarded = static_cast<const ast::Try&>(statement(module, 2));
    ASSERT_EQ(guarded.handlers.size(), 1u);
    EXPECT_EQ(guarded.handlers[0].name, "e");
    EXPECT_EQ(guarded.finalbody.size(), 1u);
}

TEST(ParserTest, ParsesFunctionAndClassDefinitionsForTheValidator) {
    // Given: Definitions the default policy forbids
    std::string code = "def f(a, b=1):\n    return a\nclass C:\n    pass\n";

    // When: Parsed
    ast::Module module = Parser::parse(code);

    // Then: The nodes exist so the validator can name them
    ASSERT_EQ(module.body.size(), 2u);
    EXPECT_EQ(statement(module, 0).kind, ast::NodeKind::FunctionDef);
    EXPECT_EQ(statement(module, 1).kind, ast::NodeKind::ClassDef);
}

TEST(ParserTest, ParsesImportForms) {
    // Given: Plain, aliased and from-imports
    ast::Module module = Parser::parse("import json\nimport math as m\nfrom json import dumps\n");

    // Then: Each form gets its node kind
    ASSERT_EQ(module.body.size(), 3u);
    EXPECT_EQ(statement(module, 0).kind, ast::NodeKind::Import);
    EXPECT_EQ(statement(module, 1).kind, ast::NodeKind::Import);
    EXPECT_EQ(statement(module, 2).kind, ast::NodeKind::ImportFrom);
}

TEST(ParserTest, AcceptsSemicolonSeparatedStatements) {
    ast::Module module = Parser::parse("a = 1; b = 2; a + b");
    EXPECT_EQ(module.body.size(), 3u);
}

TEST(ParserTest, EmptySourceIsAnEmptyModule) {
    EXPECT_TRUE(Parser::parse("").body.empty());
    EXPECT_TRUE(Parser::parse("\n\n# only a comment\n").body.empty());
}

// ============================================================================
// Test Contract: Syntax errors carry positions
// ============================================================================

TEST(ParserTest, ReportsLineAndColumnOfSyntaxError) {
    // Given: A broken second line
    std::string code = "x = 1\ny = (2 +\n";

    // When/Then: SyntaxError points into the source
    try {
        Parser::parse(code);
        FAIL() << "Expected SyntaxError";
    } catch (const SyntaxError& e) {
        EXPECT_GE(e.line(), 2);
        EXPECT_FALSE(e.message().empty());
    }
}

TEST(ParserTest, RejectsBadIndentation) {
    EXPECT_THROW(Parser::parse("if True:\nx = 1\n"), SyntaxError);
    EXPECT_THROW(Parser::parse("if True:\n    x = 1\n  y = 2\n"), SyntaxError);
}

TEST(ParserTest, RejectsUnterminatedString) {
    EXPECT_THROW(Parser::parse("x = 'abc\n"), SyntaxError);
}

TEST(ParserTest, RejectsAssignmentToCall) {
    EXPECT_THROW(Parser::parse("f() = 1\n"), SyntaxError);
}

// ============================================================================
// Test Contract: Nesting ceiling
// ============================================================================

TEST(ParserTest, RejectsParenthesesBeyondNestingLimit) {
    // Given: Far more nested brackets than allowed
    std::string code = std::string(MAX_NESTING_DEPTH * 3, '(') + "1" +
                       std::string(MAX_NESTING_DEPTH * 3, ')');

    // When/Then: Parsing fails cleanly instead of recursing without bound
    EXPECT_THROW(Parser::parse(code), SyntaxError);
}

TEST(ParserTest, RejectsDeeplyNestedUnaryOperators) {
    std::string code = std::string(10000, '-') + "1";
    EXPECT_THROW(Parser::parse(code), SyntaxError);
}

TEST(ParserTest, AcceptsModerateNesting) {
    std::string code = std::string(20, '[') + "1" + std::string(20, ']');
    EXPECT_NO_THROW(Parser::parse(code));
}

TEST(ParserTest, LongElifChainCountsAsOneLevel) {
    // Given: An if statement with several times more elif branches than the ceiling
    std::string code = "x = 299\nif x == 0:\n    r = 0\n";
    for (int i = 1; i < MAX_NESTING_DEPTH * 3; ++i) {
        code += "elif x == " + std::to_string(i) + ":\n    r = " + std::to_string(i) + "\n";
    }
    code += "else:\n    r = -1\n";

    // When: Parsed
    ast::Module module = Parser::parse(code);

    // Then: The chain hangs off the orelse of each branch, ending in the else block
    ASSERT_EQ(module.body.size(), 2u);
    const auto* node = static_cast<const ast::If*>(&statement(module, 1));
    size_t branches = 1;
    while (node->orelse.size() == 1 && node->orelse[0]->kind == ast::NodeKind::If) {
        node = static_cast<const ast::If*>(node->orelse[0].get());
        ++branches;
    }
    EXPECT_EQ(branches, static_cast<size_t>(MAX_NESTING_DEPTH * 3));
    EXPECT_EQ(node->orelse.size(), 1u);
}
