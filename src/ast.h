#pragma once

#include "codegate/value.h"
#include <memory>
#include <string>
#include <vector>

namespace codegate {
namespace ast {

enum class NodeKind {
    // Expressions
    Name,
    Constant,
    FormattedString,
    List,
    Tuple,
    Dict,
    Attribute,
    Subscript,
    Slice,
    Call,
    Starred,
    BinOp,
    UnaryOp,
    BoolOp,
    Compare,
    IfExp,
    Lambda,
    ListComp,
    DictComp,
    GeneratorExp,

    // Statements
    Expr,
    Assign,
    AugAssign,
    If,
    For,
    While,
    Break,
    Continue,
    Pass,
    Raise,
    Try,
    Import,
    ImportFrom,
    FunctionDef,
    ClassDef,
    Return,
    Global,
    Nonlocal,
    Delete,
    Assert,
    With
};

// Name used in policy documents ("FunctionDef", "Lambda", ...)
const char* node_kind_name(NodeKind kind);

enum class BinaryOperator { ADD, SUB, MULT, DIV, FLOOR_DIV, MOD, POW, LSHIFT, RSHIFT, BIT_OR, BIT_XOR, BIT_AND, MAT_MULT };
enum class UnaryOperator { NOT, NEGATE, PLUS, INVERT };
enum class BoolOperator { AND, OR };
enum class CompareOperator { EQ, NOT_EQ, LT, LT_E, GT, GT_E, IS, IS_NOT, IN, NOT_IN };

const char* binary_operator_symbol(BinaryOperator op);

struct Node {
    Node(NodeKind k, int l, int c) : kind(k), line(l), column(c) {}
    virtual ~Node() = default;

    NodeKind kind;
    int line;
    int column;
};

struct Expr : Node {
    using Node::Node;
};

struct Stmt : Node {
    using Node::Node;
};

using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;
using Block = std::vector<StmtPtr>;

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

struct Name : Expr {
    Name(int l, int c, std::string i) : Expr(NodeKind::Name, l, c), id(std::move(i)) {}
    std::string id;
};

struct Constant : Expr {
    Constant(int l, int c, Value v) : Expr(NodeKind::Constant, l, c), value(std::move(v)) {}
    Value value;
};

struct FormattedString : Expr {
    struct Part {
        std::string literal;        // Used when expr is null
        ExprPtr expr;
        char conversion = 0;        // 'r', 's', 'a' or 0
        std::string format_spec;
    };

    FormattedString(int l, int c) : Expr(NodeKind::FormattedString, l, c) {}
    std::vector<Part> parts;
};

struct ListExpr : Expr {
    ListExpr(int l, int c) : Expr(NodeKind::List, l, c) {}
    std::vector<ExprPtr> elements;
};

struct TupleExpr : Expr {
    TupleExpr(int l, int c) : Expr(NodeKind::Tuple, l, c) {}
    std::vector<ExprPtr> elements;
};

struct DictExpr : Expr {
    DictExpr(int l, int c) : Expr(NodeKind::Dict, l, c) {}
    std::vector<ExprPtr> keys;
    std::vector<ExprPtr> values;
};

struct Attribute : Expr {
    Attribute(int l, int c) : Expr(NodeKind::Attribute, l, c) {}
    ExprPtr value;
    std::string attr;
};

struct Subscript : Expr {
    Subscript(int l, int c) : Expr(NodeKind::Subscript, l, c) {}
    ExprPtr value;
    ExprPtr index;
};

struct Slice : Expr {
    Slice(int l, int c) : Expr(NodeKind::Slice, l, c) {}
    ExprPtr lower;
    ExprPtr upper;
    ExprPtr step;
};

struct Keyword {
    std::string arg;                // Empty for **mapping
    ExprPtr value;
    int line = 0;
    int column = 0;
};

struct Call : Expr {
    Call(int l, int c) : Expr(NodeKind::Call, l, c) {}
    ExprPtr func;
    std::vector<ExprPtr> args;
    std::vector<Keyword> keywords;
};

struct Starred : Expr {
    Starred(int l, int c) : Expr(NodeKind::Starred, l, c) {}
    ExprPtr value;
};

struct BinOp : Expr {
    BinOp(int l, int c) : Expr(NodeKind::BinOp, l, c) {}
    BinaryOperator op = BinaryOperator::ADD;
    ExprPtr left;
    ExprPtr right;
};

struct UnaryOp : Expr {
    UnaryOp(int l, int c) : Expr(NodeKind::UnaryOp, l, c) {}
    UnaryOperator op = UnaryOperator::NOT;
    ExprPtr operand;
};

struct BoolOp : Expr {
    BoolOp(int l, int c) : Expr(NodeKind::BoolOp, l, c) {}
    BoolOperator op = BoolOperator::AND;
    std::vector<ExprPtr> values;
};

struct Compare : Expr {
    Compare(int l, int c) : Expr(NodeKind::Compare, l, c) {}
    ExprPtr left;
    std::vector<CompareOperator> ops;
    std::vector<ExprPtr> comparators;
};

struct IfExp : Expr {
    IfExp(int l, int c) : Expr(NodeKind::IfExp, l, c) {}
    ExprPtr test;
    ExprPtr body;
    ExprPtr orelse;
};

struct Parameters {
    std::vector<std::string> names;
    std::vector<ExprPtr> defaults;
};

struct Lambda : Expr {
    Lambda(int l, int c) : Expr(NodeKind::Lambda, l, c) {}
    Parameters params;
    ExprPtr body;
};

struct Comprehension {
    ExprPtr target;
    ExprPtr iter;
    std::vector<ExprPtr> ifs;
};

struct ListComp : Expr {
    ListComp(NodeKind k, int l, int c) : Expr(k, l, c) {}   // ListComp or GeneratorExp
    ExprPtr element;
    std::vector<Comprehension> generators;
};

struct DictComp : Expr {
    DictComp(int l, int c) : Expr(NodeKind::DictComp, l, c) {}
    ExprPtr key;
    ExprPtr value;
    std::vector<Comprehension> generators;
};

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

struct ExprStmt : Stmt {
    ExprStmt(int l, int c) : Stmt(NodeKind::Expr, l, c) {}
    ExprPtr value;
};

struct Assign : Stmt {
    Assign(int l, int c) : Stmt(NodeKind::Assign, l, c) {}
    std::vector<ExprPtr> targets;
    ExprPtr value;
};

struct AugAssign : Stmt {
    AugAssign(int l, int c) : Stmt(NodeKind::AugAssign, l, c) {}
    ExprPtr target;
    BinaryOperator op = BinaryOperator::ADD;
    ExprPtr value;
};

struct If : Stmt {
    If(int l, int c) : Stmt(NodeKind::If, l, c) {}
    ExprPtr test;
    Block body;
    Block orelse;
};

struct For : Stmt {
    For(int l, int c) : Stmt(NodeKind::For, l, c) {}
    ExprPtr target;
    ExprPtr iter;
    Block body;
    Block orelse;
};

struct While : Stmt {
    While(int l, int c) : Stmt(NodeKind::While, l, c) {}
    ExprPtr test;
    Block body;
    Block orelse;
};

struct Raise : Stmt {
    Raise(int l, int c) : Stmt(NodeKind::Raise, l, c) {}
    ExprPtr exc;                    // Null for a bare re-raise
    ExprPtr cause;
};

struct ExceptHandler {
    ExprPtr type;                   // Null for a bare except
    std::string name;
    Block body;
    int line = 0;
    int column = 0;
};

struct Try : Stmt {
    Try(int l, int c) : Stmt(NodeKind::Try, l, c) {}
    Block body;
    std::vector<ExceptHandler> handlers;
    Block orelse;
    Block finalbody;
};

struct Alias {
    std::string name;
    std::string asname;
    int line = 0;
    int column = 0;
};

struct Import : Stmt {
    Import(int l, int c) : Stmt(NodeKind::Import, l, c) {}
    std::vector<Alias> names;
};

struct ImportFrom : Stmt {
    ImportFrom(int l, int c) : Stmt(NodeKind::ImportFrom, l, c) {}
    std::string module;
    int level = 0;                  // Leading dots of a relative import
    std::vector<Alias> names;
};

struct FunctionDef : Stmt {
    FunctionDef(int l, int c) : Stmt(NodeKind::FunctionDef, l, c) {}
    std::string name;
    Parameters params;
    std::vector<ExprPtr> decorators;
    Block body;
};

struct ClassDef : Stmt {
    ClassDef(int l, int c) : Stmt(NodeKind::ClassDef, l, c) {}
    std::string name;
    std::vector<ExprPtr> bases;
    std::vector<ExprPtr> decorators;
    Block body;
};

struct Return : Stmt {
    Return(int l, int c) : Stmt(NodeKind::Return, l, c) {}
    ExprPtr value;
};

struct SimpleStmt : Stmt {
    using Stmt::Stmt;               // Break, Continue, Pass
};

struct ScopeDecl : Stmt {
    using Stmt::Stmt;               // Global, Nonlocal
    std::vector<std::string> names;
};

struct Delete : Stmt {
    Delete(int l, int c) : Stmt(NodeKind::Delete, l, c) {}
    std::vector<ExprPtr> targets;
};

struct Assert : Stmt {
    Assert(int l, int c) : Stmt(NodeKind::Assert, l, c) {}
    ExprPtr test;
    ExprPtr msg;
};

struct WithItem {
    ExprPtr context;
    ExprPtr target;
};

struct With : Stmt {
    With(int l, int c) : Stmt(NodeKind::With, l, c) {}
    std::vector<WithItem> items;
    Block body;
};

struct Module {
    Block body;
};

} // namespace ast
} // namespace codegate
