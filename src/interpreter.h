#pragma once

#include "ast.h"
#include "namespace_builder.h"
#include "codegate/errors.h"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace codegate {

// Tree-walking evaluator for validated snippets. Faults raised by the
// snippet propagate as ScriptError; the interpreter itself never checks
// the clock, preemption is the supervisor's job.
class Interpreter {
public:
    explicit Interpreter(Namespace& ns);

    void run(const ast::Module& module);

    // The `result` binding when the snippet set one, otherwise the value of
    // a trailing expression statement, otherwise None
    Value result() const;

private:
    enum class Flow { NORMAL, BREAK, CONTINUE };

    using Scope = std::unordered_map<std::string, Value>;
    using ScopeChain = std::vector<std::shared_ptr<Scope>>;

    // Pushes a local scope for a comprehension or lambda body
    class ScopeGuard {
    public:
        ScopeGuard(Interpreter& interp, ScopeChain chain);
        ~ScopeGuard();
    private:
        Interpreter& interp_;
        ScopeChain saved_;
    };

    Namespace& ns_;
    ScopeChain scopes_;
    std::vector<Value> handling_;           // Exceptions whose handlers are running
    std::map<std::string, Value> modules_;  // Imported during this run
    int call_depth_ = 0;
    Value last_value_;
    bool has_last_value_ = false;

    // Statements
    Flow exec_block(const ast::Block& block);
    Flow exec(const ast::Stmt& stmt);
    Flow exec_for(const ast::For& node);
    Flow exec_while(const ast::While& node);
    Flow exec_try(const ast::Try& node);
    Flow exec_try_body(const ast::Try& node);
    bool handle_exception(const ast::Try& node, const ScriptError& error, Flow& flow);
    void exec_raise(const ast::Raise& node);
    void exec_import(const ast::Import& node);
    void exec_import_from(const ast::ImportFrom& node);
    void exec_aug_assign(const ast::AugAssign& node);
    void exec_delete(const ast::Expr& target);

    // Expressions
    Value eval(const ast::Expr& expr);
    Value eval_call(const ast::Call& node);
    Value eval_bool_op(const ast::BoolOp& node);
    Value eval_compare(const ast::Compare& node);
    Value eval_formatted(const ast::FormattedString& node);
    Value eval_subscript(const ast::Subscript& node);
    Value eval_comprehension(const ast::ListComp& node);
    Value eval_dict_comprehension(const ast::DictComp& node);
    Value make_lambda(const ast::Lambda& node);
    std::vector<Value> eval_elements(const std::vector<ast::ExprPtr>& elements);
    void run_generators(const std::vector<ast::Comprehension>& generators, size_t index,
                        const std::function<void()>& emit);

    // Bindings
    Value lookup(const std::string& name) const;
    void bind(const std::string& name, Value value);
    void unbind(const std::string& name);
    void assign(const ast::Expr& target, const Value& value);
    void assign_unpacked(const std::vector<ast::ExprPtr>& targets, const Value& value);
    void store_subscript(const Value& container, const ast::Expr& index_expr, const Value& value);
    Value import_module(const std::string& name);
};

} // namespace codegate
