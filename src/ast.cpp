#include "ast.h"

namespace codegate {
namespace ast {

const char* node_kind_name(NodeKind kind) {
    switch (kind) {
        case NodeKind::Name: return "Name";
        case NodeKind::Constant: return "Constant";
        case NodeKind::FormattedString: return "JoinedStr";
        case NodeKind::List: return "List";
        case NodeKind::Tuple: return "Tuple";
        case NodeKind::Dict: return "Dict";
        case NodeKind::Attribute: return "Attribute";
        case NodeKind::Subscript: return "Subscript";
        case NodeKind::Slice: return "Slice";
        case NodeKind::Call: return "Call";
        case NodeKind::Starred: return "Starred";
        case NodeKind::BinOp: return "BinOp";
        case NodeKind::UnaryOp: return "UnaryOp";
        case NodeKind::BoolOp: return "BoolOp";
        case NodeKind::Compare: return "Compare";
        case NodeKind::IfExp: return "IfExp";
        case NodeKind::Lambda: return "Lambda";
        case NodeKind::ListComp: return "ListComp";
        case NodeKind::DictComp: return "DictComp";
        case NodeKind::GeneratorExp: return "GeneratorExp";
        case NodeKind::Expr: return "Expr";
        case NodeKind::Assign: return "Assign";
        case NodeKind::AugAssign: return "AugAssign";
        case NodeKind::If: return "If";
        case NodeKind::For: return "For";
        case NodeKind::While: return "While";
        case NodeKind::Break: return "Break";
        case NodeKind::Continue: return "Continue";
        case NodeKind::Pass: return "Pass";
        case NodeKind::Raise: return "Raise";
        case NodeKind::Try: return "Try";
        case NodeKind::Import: return "Import";
        case NodeKind::ImportFrom: return "ImportFrom";
        case NodeKind::FunctionDef: return "FunctionDef";
        case NodeKind::ClassDef: return "ClassDef";
        case NodeKind::Return: return "Return";
        case NodeKind::Global: return "Global";
        case NodeKind::Nonlocal: return "Nonlocal";
        case NodeKind::Delete: return "Delete";
        case NodeKind::Assert: return "Assert";
        case NodeKind::With: return "With";
    }
    return "Unknown";
}

const char* binary_operator_symbol(BinaryOperator op) {
    switch (op) {
        case BinaryOperator::ADD: return "+";
        case BinaryOperator::SUB: return "-";
        case BinaryOperator::MULT: return "*";
        case BinaryOperator::DIV: return "/";
        case BinaryOperator::FLOOR_DIV: return "//";
        case BinaryOperator::MOD: return "%";
        case BinaryOperator::POW: return "**";
        case BinaryOperator::LSHIFT: return "<<";
        case BinaryOperator::RSHIFT: return ">>";
        case BinaryOperator::BIT_OR: return "|";
        case BinaryOperator::BIT_XOR: return "^";
        case BinaryOperator::BIT_AND: return "&";
        case BinaryOperator::MAT_MULT: return "@";
    }
    return "?";
}

} // namespace ast
} // namespace codegate
