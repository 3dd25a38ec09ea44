#include "parser.h"
#include "codegate/constants.h"
#include "codegate/errors.h"
#include <cstring>

namespace codegate {

using namespace ast;

namespace {

const std::vector<std::pair<std::string, BinaryOperator>> AUGMENTED_OPERATORS = {
    {"+=", BinaryOperator::ADD}, {"-=", BinaryOperator::SUB},
    {"*=", BinaryOperator::MULT}, {"/=", BinaryOperator::DIV},
    {"//=", BinaryOperator::FLOOR_DIV}, {"%=", BinaryOperator::MOD},
    {"**=", BinaryOperator::POW}, {"<<=", BinaryOperator::LSHIFT},
    {">>=", BinaryOperator::RSHIFT}, {"|=", BinaryOperator::BIT_OR},
    {"^=", BinaryOperator::BIT_XOR}, {"&=", BinaryOperator::BIT_AND},
    {"@=", BinaryOperator::MAT_MULT}
};

const std::vector<std::pair<std::string, BinaryOperator>> BIT_OR_OPS = {{"|", BinaryOperator::BIT_OR}};
const std::vector<std::pair<std::string, BinaryOperator>> BIT_XOR_OPS = {{"^", BinaryOperator::BIT_XOR}};
const std::vector<std::pair<std::string, BinaryOperator>> BIT_AND_OPS = {{"&", BinaryOperator::BIT_AND}};
const std::vector<std::pair<std::string, BinaryOperator>> SHIFT_OPS = {
    {"<<", BinaryOperator::LSHIFT}, {">>", BinaryOperator::RSHIFT}
};
const std::vector<std::pair<std::string, BinaryOperator>> ARITH_OPS = {
    {"+", BinaryOperator::ADD}, {"-", BinaryOperator::SUB}
};
const std::vector<std::pair<std::string, BinaryOperator>> TERM_OPS = {
    {"*", BinaryOperator::MULT}, {"/", BinaryOperator::DIV},
    {"//", BinaryOperator::FLOOR_DIV}, {"%", BinaryOperator::MOD},
    {"@", BinaryOperator::MAT_MULT}
};

const char* describe_target(const Expr& expr) {
    switch (expr.kind) {
        case NodeKind::Call: return "function call";
        case NodeKind::Constant:
        case NodeKind::FormattedString: return "literal";
        case NodeKind::Lambda: return "lambda";
        case NodeKind::Compare: return "comparison";
        case NodeKind::IfExp: return "conditional expression";
        case NodeKind::ListComp: return "list comprehension";
        case NodeKind::DictComp: return "dict comprehension";
        case NodeKind::GeneratorExp: return "generator expression";
        default: return "expression";
    }
}

void add_literal(FormattedString& out, const std::string& text) {
    if (text.empty()) return;
    if (!out.parts.empty() && !out.parts.back().expr) {
        out.parts.back().literal += text;
        return;
    }
    FormattedString::Part part;
    part.literal = text;
    out.parts.push_back(std::move(part));
}

} // namespace

Parser::DepthGuard::DepthGuard(Parser& parser) : parser_(parser) {
    if (++parser_.depth_ > MAX_NESTING_DEPTH) {
        parser_.fail("too many nested expressions or blocks");
    }
}

Parser::Parser(std::vector<Token> tokens, int depth)
    : tokens_(std::move(tokens)), depth_(depth) {
    if (tokens_.empty() || tokens_.back().type != TokenType::END_OF_INPUT) {
        Token end;
        end.type = TokenType::END_OF_INPUT;
        tokens_.push_back(end);
    }
}

ast::Module Parser::parse(const std::string& source) {
    Lexer lexer(source);
    Parser parser(lexer.tokenize());
    return parser.parse_module();
}

// ---------------------------------------------------------------------------
// Token helpers
// ---------------------------------------------------------------------------

const Token& Parser::peek_token(size_t offset) const {
    size_t index = pos_ + offset;
    return index < tokens_.size() ? tokens_[index] : tokens_.back();
}

bool Parser::check_op(const char* op) const {
    return current().type == TokenType::OP && current().text == op;
}

bool Parser::check_keyword(const char* keyword) const {
    return current().type == TokenType::KEYWORD && current().text == keyword;
}

bool Parser::match_op(const char* op) {
    if (!check_op(op)) return false;
    advance();
    return true;
}

bool Parser::match_keyword(const char* keyword) {
    if (!check_keyword(keyword)) return false;
    advance();
    return true;
}

const Token& Parser::advance() {
    const Token& token = tokens_[pos_];
    if (token.type != TokenType::END_OF_INPUT) ++pos_;
    return token;
}

const Token& Parser::expect_op(const char* op) {
    if (!check_op(op)) fail(std::string("expected '") + op + "'");
    return advance();
}

void Parser::expect_keyword(const char* keyword) {
    if (!check_keyword(keyword)) fail(std::string("expected '") + keyword + "'");
    advance();
}

std::string Parser::expect_name() {
    if (!check(TokenType::NAME)) fail("invalid syntax");
    return advance().text;
}

void Parser::expect_newline() {
    if (check(TokenType::NEWLINE)) {
        advance();
        return;
    }
    if (check(TokenType::END_OF_INPUT)) return;
    fail("invalid syntax");
}

void Parser::fail(const std::string& message) const {
    throw SyntaxError(message, current().line, current().column);
}

void Parser::fail_at(const std::string& message, int line, int column) const {
    throw SyntaxError(message, line, column);
}

bool Parser::starts_expression() const {
    const Token& token = current();
    switch (token.type) {
        case TokenType::NAME:
        case TokenType::INT:
        case TokenType::FLOAT:
        case TokenType::STRING:
        case TokenType::BYTES:
        case TokenType::FSTRING:
            return true;
        case TokenType::KEYWORD:
            return token.text == "None" || token.text == "True" || token.text == "False" ||
                   token.text == "not" || token.text == "lambda" || token.text == "await" ||
                   token.text == "yield";
        case TokenType::OP:
            return token.text == "(" || token.text == "[" || token.text == "{" ||
                   token.text == "-" || token.text == "+" || token.text == "~" ||
                   token.text == "*" || token.text == "...";
        default:
            return false;
    }
}

void Parser::check_target(const Expr& target, const char* context) const {
    switch (target.kind) {
        case NodeKind::Name:
        case NodeKind::Attribute:
        case NodeKind::Subscript:
            return;
        case NodeKind::Tuple:
            for (const auto& element : static_cast<const TupleExpr&>(target).elements) {
                check_target(*element, context);
            }
            return;
        case NodeKind::List:
            for (const auto& element : static_cast<const ListExpr&>(target).elements) {
                check_target(*element, context);
            }
            return;
        case NodeKind::Starred:
            if (std::strcmp(context, "delete") != 0) {
                check_target(*static_cast<const Starred&>(target).value, context);
                return;
            }
            break;
        default:
            break;
    }
    fail_at(std::string("cannot ") + context + " " + describe_target(target), target.line, target.column);
}

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

ast::Module Parser::parse_module() {
    ast::Module module;
    while (!check(TokenType::END_OF_INPUT)) {
        if (check(TokenType::NEWLINE)) {
            advance();
            continue;
        }
        if (check(TokenType::INDENT)) fail("unexpected indent");
        parse_statement(module.body);
    }
    return module;
}

void Parser::parse_statement(Block& out) {
    if (current().type == TokenType::KEYWORD) {
        const std::string& word = current().text;
        if (word == "if") { out.push_back(parse_if()); return; }
        if (word == "for") { out.push_back(parse_for()); return; }
        if (word == "while") { out.push_back(parse_while()); return; }
        if (word == "try") { out.push_back(parse_try()); return; }
        if (word == "with") { out.push_back(parse_with()); return; }
        if (word == "def") { out.push_back(parse_function_def({})); return; }
        if (word == "class") { out.push_back(parse_class_def({})); return; }
        if (word == "async") fail("'async' is not supported");
    }
    if (check_op("@")) {
        out.push_back(parse_decorated());
        return;
    }
    parse_simple_statements(out);
}

void Parser::parse_simple_statements(Block& out) {
    while (true) {
        out.push_back(parse_small_statement());
        if (!match_op(";")) break;
        if (check(TokenType::NEWLINE) || check(TokenType::END_OF_INPUT)) break;
    }
    expect_newline();
}

StmtPtr Parser::parse_small_statement() {
    const Token& token = current();
    int line = token.line;
    int column = token.column;

    if (token.type == TokenType::KEYWORD) {
        const std::string word = token.text;
        if (word == "pass" || word == "break" || word == "continue") {
            advance();
            NodeKind kind = word == "pass" ? NodeKind::Pass : word == "break" ? NodeKind::Break : NodeKind::Continue;
            return std::make_unique<SimpleStmt>(kind, line, column);
        }
        if (word == "del") return parse_delete();
        if (word == "raise") return parse_raise();
        if (word == "import") return parse_import();
        if (word == "from") return parse_import_from();
        if (word == "global") return parse_scope_declaration(NodeKind::Global);
        if (word == "nonlocal") return parse_scope_declaration(NodeKind::Nonlocal);
        if (word == "return") {
            advance();
            auto node = std::make_unique<Return>(line, column);
            if (starts_expression()) node->value = parse_testlist(true);
            return node;
        }
        if (word == "assert") {
            advance();
            auto node = std::make_unique<Assert>(line, column);
            node->test = parse_test();
            if (match_op(",")) node->msg = parse_test();
            return node;
        }
        if (word == "yield") fail("'yield' is not supported");
        if (word == "await") fail("'await' is not supported");
    }
    return parse_expression_statement();
}

StmtPtr Parser::parse_expression_statement() {
    int line = current().line;
    int column = current().column;
    ExprPtr first = parse_testlist(true);

    if (check_op("=")) {
        auto node = std::make_unique<Assign>(line, column);
        std::vector<ExprPtr> parts;
        parts.push_back(std::move(first));
        while (match_op("=")) {
            if (check_keyword("yield")) fail("'yield' is not supported");
            parts.push_back(parse_testlist(true));
        }
        node->value = std::move(parts.back());
        parts.pop_back();
        for (auto& target : parts) {
            check_target(*target, "assign to");
            node->targets.push_back(std::move(target));
        }
        return node;
    }

    if (current().type == TokenType::OP) {
        for (const auto& [symbol, op] : AUGMENTED_OPERATORS) {
            if (current().text != symbol) continue;
            if (first->kind != NodeKind::Name && first->kind != NodeKind::Attribute &&
                first->kind != NodeKind::Subscript) {
                fail_at(std::string("'") + describe_target(*first) +
                        "' is an illegal expression for augmented assignment", first->line, first->column);
            }
            advance();
            auto node = std::make_unique<AugAssign>(line, column);
            node->target = std::move(first);
            node->op = op;
            node->value = parse_testlist();
            return node;
        }
    }

    if (check_op(":")) fail("variable annotations are not supported");
    if (first->kind == NodeKind::Starred) {
        fail_at("can't use starred expression here", first->line, first->column);
    }

    auto node = std::make_unique<ExprStmt>(line, column);
    node->value = std::move(first);
    return node;
}

Block Parser::parse_block() {
    expect_op(":");
    DepthGuard guard(*this);
    Block body;
    if (!check(TokenType::NEWLINE)) {
        parse_simple_statements(body);
        return body;
    }
    advance();
    if (!check(TokenType::INDENT)) fail("expected an indented block");
    advance();
    while (!check(TokenType::DEDENT) && !check(TokenType::END_OF_INPUT)) {
        if (check(TokenType::NEWLINE)) {
            advance();
            continue;
        }
        parse_statement(body);
    }
    if (check(TokenType::DEDENT)) advance();
    return body;
}

// An elif chain nests in the tree but counts as one level of depth
StmtPtr Parser::parse_if() {
    DepthGuard guard(*this);
    const Token& keyword = advance();   // 'if'
    auto node = std::make_unique<If>(keyword.line, keyword.column);
    node->test = parse_test();
    node->body = parse_block();

    If* tail = node.get();
    while (check_keyword("elif")) {
        const Token& elif = advance();
        auto branch = std::make_unique<If>(elif.line, elif.column);
        branch->test = parse_test();
        branch->body = parse_block();
        If* next = branch.get();
        tail->orelse.push_back(std::move(branch));
        tail = next;
    }
    if (match_keyword("else")) {
        tail->orelse = parse_block();
    }
    return node;
}

StmtPtr Parser::parse_for() {
    const Token& keyword = advance();
    auto node = std::make_unique<For>(keyword.line, keyword.column);
    node->target = parse_exprlist();
    check_target(*node->target, "assign to");
    expect_keyword("in");
    node->iter = parse_testlist();
    node->body = parse_block();
    if (match_keyword("else")) node->orelse = parse_block();
    return node;
}

StmtPtr Parser::parse_while() {
    const Token& keyword = advance();
    auto node = std::make_unique<While>(keyword.line, keyword.column);
    node->test = parse_test();
    node->body = parse_block();
    if (match_keyword("else")) node->orelse = parse_block();
    return node;
}

StmtPtr Parser::parse_try() {
    const Token& keyword = advance();
    auto node = std::make_unique<Try>(keyword.line, keyword.column);
    node->body = parse_block();

    bool saw_bare = false;
    while (check_keyword("except")) {
        if (saw_bare) fail("default 'except:' must be last");
        ExceptHandler handler;
        handler.line = current().line;
        handler.column = current().column;
        advance();
        if (check_op("*")) fail("'except*' is not supported");
        if (!check_op(":")) {
            handler.type = parse_test();
            if (match_keyword("as")) handler.name = expect_name();
        } else {
            saw_bare = true;
        }
        handler.body = parse_block();
        node->handlers.push_back(std::move(handler));
    }
    if (check_keyword("else")) {
        if (node->handlers.empty()) fail("'else' requires an 'except' clause");
        advance();
        node->orelse = parse_block();
    }
    if (match_keyword("finally")) node->finalbody = parse_block();
    if (node->handlers.empty() && node->finalbody.empty()) {
        fail("expected 'except' or 'finally' block");
    }
    return node;
}

StmtPtr Parser::parse_with() {
    const Token& keyword = advance();
    auto node = std::make_unique<With>(keyword.line, keyword.column);
    do {
        WithItem item;
        item.context = parse_test();
        if (match_keyword("as")) {
            item.target = parse_exprlist();
            check_target(*item.target, "assign to");
        }
        node->items.push_back(std::move(item));
    } while (match_op(","));
    node->body = parse_block();
    return node;
}

StmtPtr Parser::parse_decorated() {
    std::vector<ExprPtr> decorators;
    while (match_op("@")) {
        decorators.push_back(parse_test());
        expect_newline();
    }
    if (check_keyword("def")) return parse_function_def(std::move(decorators));
    if (check_keyword("class")) return parse_class_def(std::move(decorators));
    fail("invalid syntax");
}

StmtPtr Parser::parse_function_def(std::vector<ExprPtr> decorators) {
    const Token& keyword = advance();
    auto node = std::make_unique<FunctionDef>(keyword.line, keyword.column);
    node->decorators = std::move(decorators);
    node->name = expect_name();
    expect_op("(");
    node->params = parse_parameters(")");
    expect_op(")");
    if (match_op("->")) parse_test();
    node->body = parse_block();
    return node;
}

StmtPtr Parser::parse_class_def(std::vector<ExprPtr> decorators) {
    const Token& keyword = advance();
    auto node = std::make_unique<ClassDef>(keyword.line, keyword.column);
    node->decorators = std::move(decorators);
    node->name = expect_name();
    if (match_op("(")) {
        while (!check_op(")")) {
            if (check(TokenType::NAME) && peek_token().type == TokenType::OP && peek_token().text == "=") {
                advance();
                advance();
                node->bases.push_back(parse_test());
            } else {
                node->bases.push_back(parse_test());
            }
            if (!match_op(",")) break;
        }
        expect_op(")");
    }
    node->body = parse_block();
    return node;
}

Parameters Parser::parse_parameters(const char* terminator) {
    Parameters params;
    bool annotations = std::strcmp(terminator, ")") == 0;
    while (!check_op(terminator)) {
        if (match_op("*") || match_op("**") || match_op("/")) {
            if (!check(TokenType::NAME)) {
                if (!match_op(",")) break;
                continue;
            }
        }
        params.names.push_back(expect_name());
        if (annotations && match_op(":")) parse_test();
        if (match_op("=")) params.defaults.push_back(parse_test());
        if (!match_op(",")) break;
    }
    return params;
}

std::string Parser::parse_dotted_name() {
    std::string name = expect_name();
    while (match_op(".")) name += "." + expect_name();
    return name;
}

StmtPtr Parser::parse_import() {
    const Token& keyword = advance();
    auto node = std::make_unique<Import>(keyword.line, keyword.column);
    do {
        Alias alias;
        alias.line = current().line;
        alias.column = current().column;
        alias.name = parse_dotted_name();
        if (match_keyword("as")) alias.asname = expect_name();
        node->names.push_back(std::move(alias));
    } while (match_op(","));
    return node;
}

StmtPtr Parser::parse_import_from() {
    const Token& keyword = advance();
    auto node = std::make_unique<ImportFrom>(keyword.line, keyword.column);
    while (check_op(".") || check_op("...")) {
        node->level += static_cast<int>(advance().text.size());
    }
    if (check(TokenType::NAME)) node->module = parse_dotted_name();
    if (node->module.empty() && node->level == 0) fail("invalid syntax");
    expect_keyword("import");

    if (check_op("*")) {
        Alias alias;
        alias.line = current().line;
        alias.column = current().column;
        alias.name = "*";
        advance();
        node->names.push_back(std::move(alias));
        return node;
    }

    bool parenthesized = match_op("(");
    do {
        if (parenthesized && check_op(")")) break;
        Alias alias;
        alias.line = current().line;
        alias.column = current().column;
        alias.name = expect_name();
        if (match_keyword("as")) alias.asname = expect_name();
        node->names.push_back(std::move(alias));
    } while (match_op(","));
    if (parenthesized) expect_op(")");
    if (node->names.empty()) fail("invalid syntax");
    return node;
}

StmtPtr Parser::parse_raise() {
    const Token& keyword = advance();
    auto node = std::make_unique<Raise>(keyword.line, keyword.column);
    if (starts_expression()) {
        node->exc = parse_test();
        if (match_keyword("from")) node->cause = parse_test();
    }
    return node;
}

StmtPtr Parser::parse_delete() {
    const Token& keyword = advance();
    auto node = std::make_unique<Delete>(keyword.line, keyword.column);
    do {
        if (!starts_expression()) break;
        ExprPtr target = parse_bitor();
        check_target(*target, "delete");
        node->targets.push_back(std::move(target));
    } while (match_op(","));
    if (node->targets.empty()) fail("invalid syntax");
    return node;
}

StmtPtr Parser::parse_scope_declaration(NodeKind kind) {
    const Token& keyword = advance();
    auto node = std::make_unique<ScopeDecl>(kind, keyword.line, keyword.column);
    do {
        node->names.push_back(expect_name());
    } while (match_op(","));
    return node;
}

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

ExprPtr Parser::parse_testlist(bool allow_star) {
    int line = current().line;
    int column = current().column;
    ExprPtr first = allow_star ? parse_star_or_test() : parse_test();
    if (!check_op(",")) return first;

    auto tuple = std::make_unique<TupleExpr>(line, column);
    tuple->elements.push_back(std::move(first));
    while (match_op(",")) {
        if (!starts_expression()) break;
        tuple->elements.push_back(allow_star ? parse_star_or_test() : parse_test());
    }
    return tuple;
}

ExprPtr Parser::parse_star_or_test() {
    if (check_op("*")) {
        const Token& star = advance();
        auto node = std::make_unique<Starred>(star.line, star.column);
        node->value = parse_bitor();
        return node;
    }
    return parse_test();
}

ExprPtr Parser::parse_exprlist() {
    int line = current().line;
    int column = current().column;
    auto parse_one = [this]() -> ExprPtr {
        if (check_op("*")) {
            const Token& star = advance();
            auto node = std::make_unique<Starred>(star.line, star.column);
            node->value = parse_bitor();
            return node;
        }
        return parse_bitor();
    };

    ExprPtr first = parse_one();
    if (!check_op(",")) return first;
    auto tuple = std::make_unique<TupleExpr>(line, column);
    tuple->elements.push_back(std::move(first));
    while (match_op(",")) {
        if (!starts_expression()) break;
        tuple->elements.push_back(parse_one());
    }
    return tuple;
}

ExprPtr Parser::parse_test() {
    if (check_keyword("lambda")) return parse_lambda();

    int line = current().line;
    int column = current().column;
    ExprPtr body = parse_or_test();
    if (check_keyword("if")) {
        DepthGuard guard(*this);
        advance();
        auto node = std::make_unique<IfExp>(line, column);
        node->body = std::move(body);
        node->test = parse_or_test();
        expect_keyword("else");
        node->orelse = parse_test();
        return node;
    }
    if (check_op(":=")) fail("assignment expressions are not supported");
    return body;
}

ExprPtr Parser::parse_lambda() {
    DepthGuard guard(*this);
    const Token& keyword = advance();
    auto node = std::make_unique<Lambda>(keyword.line, keyword.column);
    node->params = parse_parameters(":");
    expect_op(":");
    node->body = parse_test();
    return node;
}

ExprPtr Parser::parse_or_test() {
    ExprPtr first = parse_and_test();
    if (!check_keyword("or")) return first;
    auto node = std::make_unique<BoolOp>(first->line, first->column);
    node->op = BoolOperator::OR;
    node->values.push_back(std::move(first));
    while (match_keyword("or")) node->values.push_back(parse_and_test());
    return node;
}

ExprPtr Parser::parse_and_test() {
    ExprPtr first = parse_not_test();
    if (!check_keyword("and")) return first;
    auto node = std::make_unique<BoolOp>(first->line, first->column);
    node->op = BoolOperator::AND;
    node->values.push_back(std::move(first));
    while (match_keyword("and")) node->values.push_back(parse_not_test());
    return node;
}

ExprPtr Parser::parse_not_test() {
    if (!check_keyword("not")) return parse_comparison();
    DepthGuard guard(*this);
    const Token& keyword = advance();
    auto node = std::make_unique<UnaryOp>(keyword.line, keyword.column);
    node->op = UnaryOperator::NOT;
    node->operand = parse_not_test();
    return node;
}

ExprPtr Parser::parse_comparison() {
    ExprPtr left = parse_bitor();
    std::unique_ptr<Compare> node;

    while (true) {
        CompareOperator op;
        const Token& token = current();
        if (token.type == TokenType::OP && token.text == "==") op = CompareOperator::EQ;
        else if (token.type == TokenType::OP && token.text == "!=") op = CompareOperator::NOT_EQ;
        else if (token.type == TokenType::OP && token.text == "<") op = CompareOperator::LT;
        else if (token.type == TokenType::OP && token.text == "<=") op = CompareOperator::LT_E;
        else if (token.type == TokenType::OP && token.text == ">") op = CompareOperator::GT;
        else if (token.type == TokenType::OP && token.text == ">=") op = CompareOperator::GT_E;
        else if (check_keyword("in")) op = CompareOperator::IN;
        else if (check_keyword("not") && peek_token().type == TokenType::KEYWORD && peek_token().text == "in") {
            advance();
            op = CompareOperator::NOT_IN;
        } else if (check_keyword("is")) {
            if (peek_token().type == TokenType::KEYWORD && peek_token().text == "not") {
                advance();
                op = CompareOperator::IS_NOT;
            } else {
                op = CompareOperator::IS;
            }
        } else {
            break;
        }
        advance();

        if (!node) {
            node = std::make_unique<Compare>(left->line, left->column);
            node->left = std::move(left);
        }
        node->ops.push_back(op);
        node->comparators.push_back(parse_bitor());
    }

    if (node) return node;
    return left;
}

ExprPtr Parser::parse_binary_level(Level next, const std::vector<std::pair<std::string, BinaryOperator>>& ops) {
    ExprPtr left = (this->*next)();
    int chained = 0;
    while (current().type == TokenType::OP) {
        const BinaryOperator* found = nullptr;
        for (const auto& entry : ops) {
            if (current().text == entry.first) {
                found = &entry.second;
                break;
            }
        }
        if (!found) break;

        // Left-deep chains nest as deeply as parentheses do
        ++chained;
        if (++depth_ > MAX_NESTING_DEPTH) fail("too many nested expressions or blocks");
        advance();
        auto node = std::make_unique<BinOp>(left->line, left->column);
        node->op = *found;
        node->left = std::move(left);
        node->right = (this->*next)();
        left = std::move(node);
    }
    depth_ -= chained;
    return left;
}

ExprPtr Parser::parse_bitor() { return parse_binary_level(&Parser::parse_bitxor, BIT_OR_OPS); }
ExprPtr Parser::parse_bitxor() { return parse_binary_level(&Parser::parse_bitand, BIT_XOR_OPS); }
ExprPtr Parser::parse_bitand() { return parse_binary_level(&Parser::parse_shift, BIT_AND_OPS); }
ExprPtr Parser::parse_shift() { return parse_binary_level(&Parser::parse_arith, SHIFT_OPS); }
ExprPtr Parser::parse_arith() { return parse_binary_level(&Parser::parse_term, ARITH_OPS); }
ExprPtr Parser::parse_term() { return parse_binary_level(&Parser::parse_factor, TERM_OPS); }

ExprPtr Parser::parse_factor() {
    UnaryOperator op;
    if (check_op("-")) op = UnaryOperator::NEGATE;
    else if (check_op("+")) op = UnaryOperator::PLUS;
    else if (check_op("~")) op = UnaryOperator::INVERT;
    else return parse_power();

    DepthGuard guard(*this);
    const Token& sign = advance();
    auto node = std::make_unique<UnaryOp>(sign.line, sign.column);
    node->op = op;
    node->operand = parse_factor();
    return node;
}

ExprPtr Parser::parse_power() {
    if (check_keyword("await")) fail("'await' is not supported");
    ExprPtr base = parse_primary();
    if (!check_op("**")) return base;

    DepthGuard guard(*this);
    advance();
    auto node = std::make_unique<BinOp>(base->line, base->column);
    node->op = BinaryOperator::POW;
    node->left = std::move(base);
    node->right = parse_factor();
    return node;
}

ExprPtr Parser::parse_primary() {
    ExprPtr expr = parse_atom();
    int chained = 0;
    while (true) {
        if (!check_op("(") && !check_op("[") && !check_op(".")) break;
        ++chained;
        if (++depth_ > MAX_NESTING_DEPTH) fail("too many nested expressions or blocks");

        if (match_op("(")) {
            auto call = std::make_unique<Call>(expr->line, expr->column);
            call->func = std::move(expr);
            parse_call_arguments(*call);
            expr = std::move(call);
        } else if (match_op("[")) {
            auto subscript = std::make_unique<Subscript>(expr->line, expr->column);
            subscript->value = std::move(expr);
            subscript->index = parse_subscript_index();
            expect_op("]");
            expr = std::move(subscript);
        } else {
            advance();
            auto attribute = std::make_unique<Attribute>(expr->line, expr->column);
            attribute->value = std::move(expr);
            attribute->attr = expect_name();
            expr = std::move(attribute);
        }
    }
    depth_ -= chained;
    return expr;
}

void Parser::parse_call_arguments(Call& call) {
    while (!check_op(")")) {
        int line = current().line;
        int column = current().column;
        if (match_op("*")) {
            auto starred = std::make_unique<Starred>(line, column);
            starred->value = parse_test();
            call.args.push_back(std::move(starred));
        } else if (match_op("**")) {
            Keyword keyword;
            keyword.value = parse_test();
            keyword.line = line;
            keyword.column = column;
            call.keywords.push_back(std::move(keyword));
        } else if (check(TokenType::NAME) && peek_token().type == TokenType::OP && peek_token().text == "=") {
            Keyword keyword;
            keyword.arg = advance().text;
            advance();
            keyword.value = parse_test();
            keyword.line = line;
            keyword.column = column;
            call.keywords.push_back(std::move(keyword));
        } else {
            ExprPtr arg = parse_test();
            if (check_keyword("for")) {
                auto generator = std::make_unique<ListComp>(NodeKind::GeneratorExp, arg->line, arg->column);
                generator->element = std::move(arg);
                generator->generators = parse_comprehension_clauses();
                arg = std::move(generator);
            }
            if (!call.keywords.empty()) {
                fail_at("positional argument follows keyword argument", line, column);
            }
            call.args.push_back(std::move(arg));
        }
        if (!match_op(",")) break;
    }
    expect_op(")");
}

std::vector<Comprehension> Parser::parse_comprehension_clauses() {
    std::vector<Comprehension> generators;
    while (match_keyword("for")) {
        Comprehension clause;
        clause.target = parse_exprlist();
        check_target(*clause.target, "assign to");
        expect_keyword("in");
        clause.iter = parse_or_test();
        while (match_keyword("if")) clause.ifs.push_back(parse_or_test());
        generators.push_back(std::move(clause));
    }
    if (check_keyword("async")) fail("'async' is not supported");
    return generators;
}

ExprPtr Parser::parse_subscript_index() {
    int line = current().line;
    int column = current().column;
    ExprPtr first = parse_slice_item();
    if (!check_op(",")) return first;
    auto tuple = std::make_unique<TupleExpr>(line, column);
    tuple->elements.push_back(std::move(first));
    while (match_op(",")) {
        if (check_op("]")) break;
        tuple->elements.push_back(parse_slice_item());
    }
    return tuple;
}

ExprPtr Parser::parse_slice_item() {
    int line = current().line;
    int column = current().column;
    ExprPtr lower;
    if (!check_op(":")) {
        lower = parse_test();
        if (!check_op(":")) return lower;
    }
    auto slice = std::make_unique<Slice>(line, column);
    slice->lower = std::move(lower);
    expect_op(":");
    if (!check_op("]") && !check_op(",") && !check_op(":")) slice->upper = parse_test();
    if (match_op(":")) {
        if (!check_op("]") && !check_op(",")) slice->step = parse_test();
    }
    return slice;
}

ExprPtr Parser::parse_atom() {
    const Token& token = current();
    int line = token.line;
    int column = token.column;

    switch (token.type) {
        case TokenType::NAME:
            advance();
            return std::make_unique<Name>(line, column, token.text);
        case TokenType::INT:
            advance();
            return std::make_unique<Constant>(line, column, Value(token.int_value));
        case TokenType::FLOAT:
            advance();
            return std::make_unique<Constant>(line, column, Value(token.float_value));
        case TokenType::STRING:
        case TokenType::BYTES:
        case TokenType::FSTRING:
            return parse_strings();
        case TokenType::KEYWORD:
            if (token.text == "None") {
                advance();
                return std::make_unique<Constant>(line, column, Value());
            }
            if (token.text == "True" || token.text == "False") {
                bool flag = token.text == "True";
                advance();
                return std::make_unique<Constant>(line, column, Value(flag));
            }
            if (token.text == "yield") fail("'yield' is not supported");
            break;
        case TokenType::OP:
            if (token.text == "(") {
                DepthGuard guard(*this);
                return parse_parenthesized();
            }
            if (token.text == "[") {
                DepthGuard guard(*this);
                return parse_list_display();
            }
            if (token.text == "{") {
                DepthGuard guard(*this);
                return parse_brace_display();
            }
            if (token.text == "...") {
                advance();
                return std::make_unique<Constant>(line, column, Value::opaque("ellipsis", "Ellipsis"));
            }
            break;
        case TokenType::INDENT:
            fail("unexpected indent");
        case TokenType::DEDENT:
            fail("unexpected unindent");
        case TokenType::NEWLINE:
        case TokenType::END_OF_INPUT:
            fail("unexpected end of input");
    }
    fail("invalid syntax");
}

ExprPtr Parser::parse_parenthesized() {
    const Token& open = advance();
    int line = open.line;
    int column = open.column;
    if (match_op(")")) return std::make_unique<TupleExpr>(line, column);
    if (check_keyword("yield")) fail("'yield' is not supported");

    ExprPtr first = parse_star_or_test();
    if (check_keyword("for")) {
        auto generator = std::make_unique<ListComp>(NodeKind::GeneratorExp, line, column);
        generator->element = std::move(first);
        generator->generators = parse_comprehension_clauses();
        expect_op(")");
        return generator;
    }
    if (!check_op(",")) {
        expect_op(")");
        return first;
    }

    auto tuple = std::make_unique<TupleExpr>(line, column);
    tuple->elements.push_back(std::move(first));
    while (match_op(",")) {
        if (check_op(")")) break;
        tuple->elements.push_back(parse_star_or_test());
    }
    expect_op(")");
    return tuple;
}

ExprPtr Parser::parse_list_display() {
    const Token& open = advance();
    int line = open.line;
    int column = open.column;
    if (match_op("]")) return std::make_unique<ListExpr>(line, column);

    ExprPtr first = parse_star_or_test();
    if (check_keyword("for")) {
        auto comprehension = std::make_unique<ListComp>(NodeKind::ListComp, line, column);
        comprehension->element = std::move(first);
        comprehension->generators = parse_comprehension_clauses();
        expect_op("]");
        return comprehension;
    }

    auto list = std::make_unique<ListExpr>(line, column);
    list->elements.push_back(std::move(first));
    while (match_op(",")) {
        if (check_op("]")) break;
        list->elements.push_back(parse_star_or_test());
    }
    expect_op("]");
    return list;
}

ExprPtr Parser::parse_brace_display() {
    const Token& open = advance();
    int line = open.line;
    int column = open.column;
    auto dict = std::make_unique<DictExpr>(line, column);
    if (match_op("}")) return dict;

    auto parse_entry = [this, &dict]() {
        if (match_op("**")) {
            dict->keys.push_back(nullptr);
            dict->values.push_back(parse_bitor());
            return;
        }
        ExprPtr key = parse_test();
        if (!check_op(":")) fail_at("set displays are not supported", key->line, key->column);
        advance();
        dict->keys.push_back(std::move(key));
        dict->values.push_back(parse_test());
    };

    parse_entry();
    if (check_keyword("for")) {
        if (!dict->keys.front()) fail("dict unpacking cannot be used in dict comprehension");
        auto comprehension = std::make_unique<DictComp>(line, column);
        comprehension->key = std::move(dict->keys.front());
        comprehension->value = std::move(dict->values.front());
        comprehension->generators = parse_comprehension_clauses();
        expect_op("}");
        return comprehension;
    }
    while (match_op(",")) {
        if (check_op("}")) break;
        parse_entry();
    }
    expect_op("}");
    return dict;
}

ExprPtr Parser::parse_strings() {
    int line = current().line;
    int column = current().column;

    bool has_bytes = false;
    bool has_text = false;
    bool has_formatted = false;
    size_t start = pos_;
    while (check(TokenType::STRING) || check(TokenType::BYTES) || check(TokenType::FSTRING)) {
        if (check(TokenType::BYTES)) has_bytes = true;
        else has_text = true;
        if (check(TokenType::FSTRING)) has_formatted = true;
        advance();
    }
    if (has_bytes && has_text) fail_at("cannot mix bytes and nonbytes literals", line, column);

    if (has_bytes || !has_formatted) {
        std::string text;
        for (size_t i = start; i < pos_; ++i) text += tokens_[i].text;
        Value value = has_bytes ? Value::bytes(std::move(text)) : Value(std::move(text));
        return std::make_unique<Constant>(line, column, std::move(value));
    }

    auto formatted = std::make_unique<FormattedString>(line, column);
    for (size_t i = start; i < pos_; ++i) {
        const Token& piece = tokens_[i];
        if (piece.type == TokenType::FSTRING) {
            parse_formatted_text(piece.text, *formatted, piece.line, piece.column);
        } else {
            add_literal(*formatted, piece.text);
        }
    }
    return formatted;
}

void Parser::parse_formatted_text(const std::string& text, FormattedString& out, int line, int column) {
    const size_t n = text.size();
    std::string literal;
    size_t i = 0;

    while (i < n) {
        char c = text[i];
        if (c == '}') {
            if (i + 1 < n && text[i + 1] == '}') {
                literal += '}';
                i += 2;
                continue;
            }
            fail_at("f-string: single '}' is not allowed", line, column);
        }
        if (c != '{') {
            literal += c;
            ++i;
            continue;
        }
        if (i + 1 < n && text[i + 1] == '{') {
            literal += '{';
            i += 2;
            continue;
        }

        // Replacement field: scan to the first top-level '!', ':' or '}'
        size_t start = i + 1;
        size_t j = start;
        int nesting = 0;
        char quote = 0;
        for (; j < n; ++j) {
            char d = text[j];
            if (quote) {
                if (d == quote) quote = 0;
                continue;
            }
            if (d == '\'' || d == '"') {
                quote = d;
            } else if (d == '(' || d == '[' || d == '{') {
                ++nesting;
            } else if (d == ')' || d == ']') {
                --nesting;
            } else if (d == '}') {
                if (nesting == 0) break;
                --nesting;
            } else if (nesting == 0 && d == '!' && j + 1 < n && text[j + 1] != '=') {
                break;
            } else if (nesting == 0 && d == ':') {
                break;
            }
        }
        if (j >= n) fail_at("f-string: expecting '}'", line, column);

        std::string expression = text.substr(start, j - start);
        std::string trimmed = expression;
        while (!trimmed.empty() && (trimmed.back() == ' ' || trimmed.back() == '\t')) trimmed.pop_back();

        FormattedString::Part part;
        bool self_documenting = false;
        if (trimmed.size() > 1 && trimmed.back() == '=' &&
            std::string("=!<>").find(trimmed[trimmed.size() - 2]) == std::string::npos) {
            self_documenting = true;
            literal += expression;
            trimmed.pop_back();
        }
        if (trimmed.find_first_not_of(" \t\n") == std::string::npos) {
            fail_at("f-string: empty expression not allowed", line, column);
        }
        if (!literal.empty()) {
            add_literal(out, literal);
            literal.clear();
        }
        part.expr = parse_embedded_expression(trimmed, line, column);

        if (text[j] == '!') {
            char conversion = j + 1 < n ? text[j + 1] : 0;
            if (conversion != 's' && conversion != 'r' && conversion != 'a') {
                fail_at("f-string: invalid conversion character", line, column);
            }
            part.conversion = conversion;
            j += 2;
            if (j >= n || (text[j] != ':' && text[j] != '}')) {
                fail_at("f-string: expecting '}'", line, column);
            }
        }
        if (text[j] == ':') {
            size_t spec_start = ++j;
            while (j < n && text[j] != '}') {
                if (text[j] == '{') {
                    fail_at("f-string: nested replacement fields are not supported", line, column);
                }
                ++j;
            }
            if (j >= n) fail_at("f-string: expecting '}'", line, column);
            part.format_spec = text.substr(spec_start, j - spec_start);
        }
        if (self_documenting && part.conversion == 0 && part.format_spec.empty()) {
            part.conversion = 'r';
        }
        out.parts.push_back(std::move(part));
        i = j + 1;
    }
    add_literal(out, literal);
}

ExprPtr Parser::parse_embedded_expression(const std::string& text, int line, int column) {
    // Parenthesizing lets the expression span lines and carry outer whitespace
    std::string wrapped = "(" + text + ")";
    try {
        Lexer lexer(wrapped);
        std::vector<Token> tokens = lexer.tokenize();
        for (auto& token : tokens) {
            token.line = line;
            token.column = column;
        }
        Parser inner(std::move(tokens), depth_ + 1);
        ExprPtr expr = inner.parse_testlist();
        inner.expect_newline();
        if (!inner.check(TokenType::END_OF_INPUT)) inner.fail("invalid syntax");
        return expr;
    } catch (const SyntaxError& e) {
        throw SyntaxError("f-string: " + e.message(), line, column);
    }
}

} // namespace codegate
