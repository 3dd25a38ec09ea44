#pragma once

#include "ast.h"
#include "lexer.h"
#include <string>
#include <utility>
#include <vector>

namespace codegate {

// Recursive-descent parser producing the snippet syntax tree.
// Nesting is bounded by MAX_NESTING_DEPTH so hostile input cannot exhaust
// the host stack. Throws SyntaxError.
class Parser {
public:
    explicit Parser(std::vector<Token> tokens, int depth = 0);

    ast::Module parse_module();

    // Tokenize and parse in one step
    static ast::Module parse(const std::string& source);

private:
    std::vector<Token> tokens_;
    size_t pos_ = 0;
    int depth_ = 0;

    class DepthGuard {
    public:
        explicit DepthGuard(Parser& parser);
        ~DepthGuard() { --parser_.depth_; }
    private:
        Parser& parser_;
    };

    // Token helpers
    const Token& current() const { return tokens_[pos_]; }
    const Token& peek_token(size_t offset = 1) const;
    bool check_op(const char* op) const;
    bool check_keyword(const char* keyword) const;
    bool check(TokenType type) const { return current().type == type; }
    bool match_op(const char* op);
    bool match_keyword(const char* keyword);
    const Token& advance();
    const Token& expect_op(const char* op);
    void expect_keyword(const char* keyword);
    std::string expect_name();
    void expect_newline();
    [[noreturn]] void fail(const std::string& message) const;
    [[noreturn]] void fail_at(const std::string& message, int line, int column) const;

    // Statements
    void parse_statement(ast::Block& out);
    void parse_simple_statements(ast::Block& out);
    ast::StmtPtr parse_small_statement();
    ast::StmtPtr parse_expression_statement();
    ast::StmtPtr parse_if();
    ast::StmtPtr parse_for();
    ast::StmtPtr parse_while();
    ast::StmtPtr parse_try();
    ast::StmtPtr parse_with();
    ast::StmtPtr parse_decorated();
    ast::StmtPtr parse_function_def(std::vector<ast::ExprPtr> decorators);
    ast::StmtPtr parse_class_def(std::vector<ast::ExprPtr> decorators);
    ast::StmtPtr parse_import();
    ast::StmtPtr parse_import_from();
    ast::StmtPtr parse_raise();
    ast::StmtPtr parse_delete();
    ast::StmtPtr parse_scope_declaration(ast::NodeKind kind);
    ast::Block parse_block();
    ast::Parameters parse_parameters(const char* terminator);
    std::string parse_dotted_name();

    // Expressions
    ast::ExprPtr parse_testlist(bool allow_star = false);
    ast::ExprPtr parse_test();
    ast::ExprPtr parse_lambda();
    ast::ExprPtr parse_or_test();
    ast::ExprPtr parse_and_test();
    ast::ExprPtr parse_not_test();
    ast::ExprPtr parse_comparison();
    ast::ExprPtr parse_bitor();
    ast::ExprPtr parse_bitxor();
    ast::ExprPtr parse_bitand();
    ast::ExprPtr parse_shift();
    ast::ExprPtr parse_arith();
    ast::ExprPtr parse_term();
    ast::ExprPtr parse_factor();
    ast::ExprPtr parse_power();
    ast::ExprPtr parse_primary();
    ast::ExprPtr parse_atom();
    ast::ExprPtr parse_parenthesized();
    ast::ExprPtr parse_list_display();
    ast::ExprPtr parse_brace_display();
    ast::ExprPtr parse_strings();
    ast::ExprPtr parse_subscript_index();
    ast::ExprPtr parse_slice_item();
    ast::ExprPtr parse_star_or_test();
    ast::ExprPtr parse_exprlist();
    void parse_call_arguments(ast::Call& call);
    std::vector<ast::Comprehension> parse_comprehension_clauses();
    void parse_formatted_text(const std::string& text, ast::FormattedString& out, int line, int column);
    ast::ExprPtr parse_embedded_expression(const std::string& text, int line, int column);

    using Level = ast::ExprPtr (Parser::*)();
    ast::ExprPtr parse_binary_level(Level next, const std::vector<std::pair<std::string, ast::BinaryOperator>>& ops);

    bool starts_expression() const;
    void check_target(const ast::Expr& target, const char* context) const;
};

} // namespace codegate
