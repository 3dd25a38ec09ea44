#include "codegate/validator.h"
#include "codegate/errors.h"
#include "ast.h"
#include "parser.h"

namespace codegate {

using namespace ast;

namespace {

struct Violation {
    ValidationVerdict verdict;
};

class PolicyWalker {
public:
    explicit PolicyWalker(const PolicyConfig& policy) : policy_(policy) {}

    void visit_block(const Block& block) {
        for (const auto& stmt : block) visit_stmt(*stmt);
    }

private:
    const PolicyConfig& policy_;

    [[noreturn]] void reject(const std::string& reason, const std::string& construct, const Node& node) {
        throw Violation{ValidationVerdict::reject(reason, construct, node.line, node.column)};
    }

    [[noreturn]] void reject(const std::string& reason, const std::string& construct, int line, int column) {
        throw Violation{ValidationVerdict::reject(reason, construct, line, column)};
    }

    void check_construct(const Node& node) {
        const char* name = node_kind_name(node.kind);
        if (policy_.banned_constructs.count(name)) {
            reject(std::string("Construct '") + name + "' is not allowed", name, node);
        }
    }

    void check_identifier(const std::string& name, const char* construct, int line, int column) {
        if (policy_.is_identifier_banned(name)) {
            reject("Identifier '" + name + "' is not allowed", construct, line, column);
        }
    }

    // Rejects any binding that would replace the client handle
    void check_bound_name(const std::string& name, const char* construct, int line, int column) {
        if (name == CLIENT_BINDING_NAME) {
            reject(std::string("Rebinding '") + CLIENT_BINDING_NAME + "' is not allowed", construct, line, column);
        }
        check_identifier(name, construct, line, column);
    }

    static bool rooted_at_client(const Expr& expr) {
        const Expr* node = &expr;
        while (true) {
            if (node->kind == NodeKind::Attribute) {
                node = static_cast<const Attribute*>(node)->value.get();
            } else if (node->kind == NodeKind::Subscript) {
                node = static_cast<const Subscript*>(node)->value.get();
            } else {
                break;
            }
        }
        return node->kind == NodeKind::Name && static_cast<const Name*>(node)->id == CLIENT_BINDING_NAME;
    }

    void check_target(const Expr& target, const char* construct) {
        switch (target.kind) {
            case NodeKind::Name:
                check_bound_name(static_cast<const Name&>(target).id, construct, target.line, target.column);
                break;
            case NodeKind::Attribute:
            case NodeKind::Subscript:
                if (rooted_at_client(target)) {
                    reject(std::string("Modifying '") + CLIENT_BINDING_NAME + "' is not allowed",
                           construct, target);
                }
                break;
            case NodeKind::Tuple:
                for (const auto& element : static_cast<const TupleExpr&>(target).elements) {
                    check_target(*element, construct);
                }
                break;
            case NodeKind::List:
                for (const auto& element : static_cast<const ListExpr&>(target).elements) {
                    check_target(*element, construct);
                }
                break;
            case NodeKind::Starred:
                check_target(*static_cast<const Starred&>(target).value, construct);
                break;
            default:
                break;
        }
        visit_expr(target);
    }

    void check_parameters(const Parameters& params, const char* construct, const Node& node) {
        for (const auto& name : params.names) check_bound_name(name, construct, node.line, node.column);
        for (const auto& value : params.defaults) visit_expr(*value);
    }

    void visit_comprehensions(const std::vector<Comprehension>& generators) {
        for (const auto& clause : generators) {
            check_target(*clause.target, "comprehension");
            visit_expr(*clause.iter);
            for (const auto& condition : clause.ifs) visit_expr(*condition);
        }
    }

    void visit_optional(const ExprPtr& expr) {
        if (expr) visit_expr(*expr);
    }

    void visit_call(const Call& call) {
        std::string callee;
        if (call.func->kind == NodeKind::Name) {
            callee = static_cast<const Name&>(*call.func).id;
        } else if (call.func->kind == NodeKind::Attribute) {
            callee = static_cast<const Attribute&>(*call.func).attr;
        }
        if (!callee.empty() && policy_.banned_calls.count(callee)) {
            reject("Call to '" + callee + "' is not allowed", "Call", call);
        }
        visit_expr(*call.func);
        for (const auto& arg : call.args) visit_expr(*arg);
        for (const auto& keyword : call.keywords) {
            if (!keyword.arg.empty()) check_identifier(keyword.arg, "keyword", keyword.line, keyword.column);
            visit_expr(*keyword.value);
        }
    }

    void visit_expr(const Expr& expr) {
        check_construct(expr);
        switch (expr.kind) {
            case NodeKind::Name: {
                const auto& name = static_cast<const Name&>(expr);
                check_identifier(name.id, "Name", expr.line, expr.column);
                if (policy_.banned_calls.count(name.id)) {
                    reject("Reference to '" + name.id + "' is not allowed", "Name", expr);
                }
                break;
            }
            case NodeKind::Constant:
                break;
            case NodeKind::FormattedString:
                for (const auto& part : static_cast<const FormattedString&>(expr).parts) {
                    visit_optional(part.expr);
                }
                break;
            case NodeKind::List:
                for (const auto& element : static_cast<const ListExpr&>(expr).elements) visit_expr(*element);
                break;
            case NodeKind::Tuple:
                for (const auto& element : static_cast<const TupleExpr&>(expr).elements) visit_expr(*element);
                break;
            case NodeKind::Dict: {
                const auto& dict = static_cast<const DictExpr&>(expr);
                for (const auto& key : dict.keys) visit_optional(key);
                for (const auto& value : dict.values) visit_expr(*value);
                break;
            }
            case NodeKind::Attribute: {
                const auto& attribute = static_cast<const Attribute&>(expr);
                check_identifier(attribute.attr, "Attribute", expr.line, expr.column);
                if (!policy_.allowed_operations.empty() && attribute.value->kind == NodeKind::Name &&
                    static_cast<const Name&>(*attribute.value).id == CLIENT_BINDING_NAME &&
                    !policy_.allowed_operations.count(attribute.attr)) {
                    reject("Client operation '" + attribute.attr + "' is not allowed", "Attribute", expr);
                }
                visit_expr(*attribute.value);
                break;
            }
            case NodeKind::Subscript: {
                const auto& subscript = static_cast<const Subscript&>(expr);
                visit_expr(*subscript.value);
                visit_expr(*subscript.index);
                break;
            }
            case NodeKind::Slice: {
                const auto& slice = static_cast<const Slice&>(expr);
                visit_optional(slice.lower);
                visit_optional(slice.upper);
                visit_optional(slice.step);
                break;
            }
            case NodeKind::Call:
                visit_call(static_cast<const Call&>(expr));
                break;
            case NodeKind::Starred:
                visit_expr(*static_cast<const Starred&>(expr).value);
                break;
            case NodeKind::BinOp: {
                const auto& binop = static_cast<const BinOp&>(expr);
                visit_expr(*binop.left);
                visit_expr(*binop.right);
                break;
            }
            case NodeKind::UnaryOp:
                visit_expr(*static_cast<const UnaryOp&>(expr).operand);
                break;
            case NodeKind::BoolOp:
                for (const auto& value : static_cast<const BoolOp&>(expr).values) visit_expr(*value);
                break;
            case NodeKind::Compare: {
                const auto& compare = static_cast<const Compare&>(expr);
                visit_expr(*compare.left);
                for (const auto& comparator : compare.comparators) visit_expr(*comparator);
                break;
            }
            case NodeKind::IfExp: {
                const auto& ifexp = static_cast<const IfExp&>(expr);
                visit_expr(*ifexp.test);
                visit_expr(*ifexp.body);
                visit_expr(*ifexp.orelse);
                break;
            }
            case NodeKind::Lambda: {
                const auto& lambda = static_cast<const Lambda&>(expr);
                check_parameters(lambda.params, "Lambda", expr);
                visit_expr(*lambda.body);
                break;
            }
            case NodeKind::ListComp:
            case NodeKind::GeneratorExp: {
                const auto& comp = static_cast<const ListComp&>(expr);
                visit_comprehensions(comp.generators);
                visit_expr(*comp.element);
                break;
            }
            case NodeKind::DictComp: {
                const auto& comp = static_cast<const DictComp&>(expr);
                visit_comprehensions(comp.generators);
                visit_expr(*comp.key);
                visit_expr(*comp.value);
                break;
            }
            default:
                break;
        }
    }

    void visit_alias(const Alias& alias, const char* construct, bool dotted_import) {
        std::string bound = alias.asname;
        if (bound.empty()) {
            // "import a.b" binds "a"
            bound = dotted_import ? alias.name.substr(0, alias.name.find('.')) : alias.name;
        }
        size_t start = 0;
        while (start <= alias.name.size()) {
            size_t dot = alias.name.find('.', start);
            std::string part = alias.name.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
            check_identifier(part, construct, alias.line, alias.column);
            if (dot == std::string::npos) break;
            start = dot + 1;
        }
        check_bound_name(bound, construct, alias.line, alias.column);
    }

    void visit_stmt(const Stmt& stmt) {
        check_construct(stmt);
        switch (stmt.kind) {
            case NodeKind::Expr:
                visit_expr(*static_cast<const ExprStmt&>(stmt).value);
                break;
            case NodeKind::Assign: {
                const auto& assign = static_cast<const Assign&>(stmt);
                for (const auto& target : assign.targets) check_target(*target, "Assign");
                visit_expr(*assign.value);
                break;
            }
            case NodeKind::AugAssign: {
                const auto& assign = static_cast<const AugAssign&>(stmt);
                check_target(*assign.target, "AugAssign");
                visit_expr(*assign.value);
                break;
            }
            case NodeKind::If: {
                const auto& node = static_cast<const If&>(stmt);
                visit_expr(*node.test);
                visit_block(node.body);
                visit_block(node.orelse);
                break;
            }
            case NodeKind::For: {
                const auto& node = static_cast<const For&>(stmt);
                check_target(*node.target, "For");
                visit_expr(*node.iter);
                visit_block(node.body);
                visit_block(node.orelse);
                break;
            }
            case NodeKind::While: {
                const auto& node = static_cast<const While&>(stmt);
                visit_expr(*node.test);
                visit_block(node.body);
                visit_block(node.orelse);
                break;
            }
            case NodeKind::Raise: {
                const auto& node = static_cast<const Raise&>(stmt);
                visit_optional(node.exc);
                visit_optional(node.cause);
                break;
            }
            case NodeKind::Try: {
                const auto& node = static_cast<const Try&>(stmt);
                visit_block(node.body);
                for (const auto& handler : node.handlers) {
                    visit_optional(handler.type);
                    if (!handler.name.empty()) {
                        check_bound_name(handler.name, "ExceptHandler", handler.line, handler.column);
                    }
                    visit_block(handler.body);
                }
                visit_block(node.orelse);
                visit_block(node.finalbody);
                break;
            }
            case NodeKind::Import: {
                const auto& node = static_cast<const Import&>(stmt);
                for (const auto& alias : node.names) {
                    if (!policy_.is_module_allowed(alias.name)) {
                        reject("Import of module '" + alias.name + "' is not allowed", "Import",
                               alias.line, alias.column);
                    }
                    visit_alias(alias, "Import", true);
                }
                break;
            }
            case NodeKind::ImportFrom: {
                const auto& node = static_cast<const ImportFrom&>(stmt);
                if (node.level > 0) reject("Relative imports are not allowed", "ImportFrom", stmt);
                if (!policy_.is_module_allowed(node.module)) {
                    reject("Import of module '" + node.module + "' is not allowed", "ImportFrom", stmt);
                }
                for (const auto& alias : node.names) {
                    if (alias.name == "*") {
                        reject("Wildcard imports are not allowed", "ImportFrom", alias.line, alias.column);
                    }
                    visit_alias(alias, "ImportFrom", false);
                }
                break;
            }
            case NodeKind::FunctionDef: {
                const auto& node = static_cast<const FunctionDef&>(stmt);
                for (const auto& decorator : node.decorators) visit_expr(*decorator);
                check_bound_name(node.name, "FunctionDef", stmt.line, stmt.column);
                check_parameters(node.params, "FunctionDef", stmt);
                visit_block(node.body);
                break;
            }
            case NodeKind::ClassDef: {
                const auto& node = static_cast<const ClassDef&>(stmt);
                for (const auto& decorator : node.decorators) visit_expr(*decorator);
                check_bound_name(node.name, "ClassDef", stmt.line, stmt.column);
                for (const auto& base : node.bases) visit_expr(*base);
                visit_block(node.body);
                break;
            }
            case NodeKind::Return:
                visit_optional(static_cast<const Return&>(stmt).value);
                break;
            case NodeKind::Global:
            case NodeKind::Nonlocal:
                for (const auto& name : static_cast<const ScopeDecl&>(stmt).names) {
                    check_identifier(name, node_kind_name(stmt.kind), stmt.line, stmt.column);
                }
                break;
            case NodeKind::Delete:
                for (const auto& target : static_cast<const Delete&>(stmt).targets) {
                    check_target(*target, "Delete");
                }
                break;
            case NodeKind::Assert: {
                const auto& node = static_cast<const Assert&>(stmt);
                visit_expr(*node.test);
                visit_optional(node.msg);
                break;
            }
            case NodeKind::With: {
                const auto& node = static_cast<const With&>(stmt);
                for (const auto& item : node.items) {
                    visit_expr(*item.context);
                    if (item.target) check_target(*item.target, "With");
                }
                visit_block(node.body);
                break;
            }
            default:
                break;
        }
    }
};

} // namespace

Validator::Validator(PolicyPtr policy) : policy_(std::move(policy)) {}

ValidationVerdict Validator::validate(const std::string& code, ast::Module* parsed) const {
    if (code.size() > policy_->max_code_bytes) {
        return ValidationVerdict::reject("Code exceeds maximum size of " +
                                         std::to_string(policy_->max_code_bytes) + " bytes", "code");
    }

    ast::Module module;
    try {
        module = Parser::parse(code);
    } catch (const SyntaxError& e) {
        return ValidationVerdict::reject("Syntax error: " + e.message(), "SyntaxError", e.line(), e.column());
    }

    ValidationVerdict verdict = check(module);
    if (verdict.accepted && parsed) *parsed = std::move(module);
    return verdict;
}

ValidationVerdict Validator::check(const ast::Module& module) const {
    try {
        PolicyWalker walker(*policy_);
        walker.visit_block(module.body);
    } catch (const Violation& violation) {
        return violation.verdict;
    }
    return ValidationVerdict::accept();
}

} // namespace codegate
