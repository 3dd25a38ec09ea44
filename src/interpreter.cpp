#include "interpreter.h"
#include "operators.h"
#include "codegate/constants.h"
#include <algorithm>
#include <new>

namespace codegate {

using namespace ast;

namespace {

constexpr int MAX_CALL_DEPTH = 64;

struct SliceBounds {
    int64_t start = 0;
    int64_t stop = 0;
    int64_t step = 1;
};

int64_t slice_index(const Value& v) {
    return to_integer(v, "slice indices");
}

// Python's slice index adjustment for a sequence of `length` items
SliceBounds adjust_slice(const Value& lower, const Value& upper, const Value& step_value, int64_t length) {
    SliceBounds bounds;
    if (!step_value.is_none()) {
        bounds.step = slice_index(step_value);
        if (bounds.step == 0) throw ScriptError("ValueError", "slice step cannot be zero");
    }
    bool forward = bounds.step > 0;
    auto clamp = [&](const Value& v, int64_t fallback) {
        if (v.is_none()) return fallback;
        int64_t i = slice_index(v);
        if (i < 0) {
            i += length;
            if (i < 0) i = forward ? 0 : -1;
        } else if (i >= length) {
            i = forward ? length : length - 1;
        }
        return i;
    };
    bounds.start = clamp(lower, forward ? 0 : length - 1);
    bounds.stop = clamp(upper, forward ? length : -1);
    return bounds;
}

std::vector<int64_t> slice_positions(const SliceBounds& b) {
    std::vector<int64_t> positions;
    if (b.step > 0) {
        for (int64_t i = b.start; i < b.stop; i += b.step) positions.push_back(i);
    } else {
        for (int64_t i = b.start; i > b.stop; i += b.step) positions.push_back(i);
    }
    return positions;
}

int64_t sequence_length(const Value& v) {
    switch (v.type()) {
        case ValueType::LIST: return static_cast<int64_t>(v.as_list().items.size());
        case ValueType::TUPLE: return static_cast<int64_t>(v.as_tuple().items.size());
        case ValueType::STR: return static_cast<int64_t>(utf8_length(v.as_str()));
        case ValueType::BYTES: return static_cast<int64_t>(v.as_bytes().size());
        case ValueType::RANGE: return v.as_range().length();
        default: return -1;
    }
}

Value slice_value(const Value& container, const SliceBounds& b) {
    std::vector<int64_t> positions = slice_positions(b);
    switch (container.type()) {
        case ValueType::LIST:
        case ValueType::TUPLE: {
            const auto& items = container.is_list() ? container.as_list().items : container.as_tuple().items;
            std::vector<Value> out;
            out.reserve(positions.size());
            for (int64_t i : positions) out.push_back(items[static_cast<size_t>(i)]);
            return container.is_list() ? Value::list(std::move(out)) : Value::tuple(std::move(out));
        }
        case ValueType::STR: {
            const std::string& text = container.as_str();
            if (b.step == 1 && utf8_length(text) == text.size()) {
                if (b.start >= b.stop) return Value(std::string());
                return Value(text.substr(static_cast<size_t>(b.start), static_cast<size_t>(b.stop - b.start)));
            }
            std::vector<std::string> chars = utf8_chars(text);
            std::string out;
            for (int64_t i : positions) out += chars[static_cast<size_t>(i)];
            return Value(out);
        }
        case ValueType::BYTES: {
            const std::string& data = container.as_bytes();
            std::string out;
            for (int64_t i : positions) out += data[static_cast<size_t>(i)];
            return Value::bytes(out);
        }
        case ValueType::RANGE: {
            const Range& r = container.as_range();
            return Value::range(r.start + b.start * r.step, r.start + b.stop * r.step, r.step * b.step);
        }
        default:
            throw ScriptError("TypeError", "'" + container.type_name() + "' object is not subscriptable");
    }
}

int64_t checked_position(const Value& index, int64_t length, const std::string& kind) {
    if (!index.is_int() && !index.is_bool()) {
        throw ScriptError("TypeError", kind + " indices must be integers or slices, not " + index.type_name());
    }
    int64_t i = to_integer(index, "index");
    if (i < 0) i += length;
    if (i < 0 || i >= length) throw ScriptError("IndexError", kind + " index out of range");
    return i;
}

Value index_value(const Value& container, const Value& index) {
    switch (container.type()) {
        case ValueType::LIST: {
            const auto& items = container.as_list().items;
            return items[static_cast<size_t>(checked_position(index, static_cast<int64_t>(items.size()), "list"))];
        }
        case ValueType::TUPLE: {
            const auto& items = container.as_tuple().items;
            return items[static_cast<size_t>(checked_position(index, static_cast<int64_t>(items.size()), "tuple"))];
        }
        case ValueType::STR: {
            const std::string& text = container.as_str();
            if (utf8_length(text) == text.size()) {
                int64_t i = checked_position(index, static_cast<int64_t>(text.size()), "string");
                return Value(text.substr(static_cast<size_t>(i), 1));
            }
            std::vector<std::string> chars = utf8_chars(text);
            return Value(chars[static_cast<size_t>(checked_position(index, static_cast<int64_t>(chars.size()), "string"))]);
        }
        case ValueType::BYTES: {
            const std::string& data = container.as_bytes();
            int64_t i = checked_position(index, static_cast<int64_t>(data.size()), "index");
            return Value(static_cast<int64_t>(static_cast<unsigned char>(data[static_cast<size_t>(i)])));
        }
        case ValueType::RANGE: {
            const Range& r = container.as_range();
            return Value(r.at(checked_position(index, r.length(), "range object")));
        }
        case ValueType::DICT: {
            const Value* found = container.as_dict().find(index);
            if (!found) throw ScriptError("KeyError", repr(index));
            return *found;
        }
        default:
            throw ScriptError("TypeError", "'" + container.type_name() + "' object is not subscriptable");
    }
}

Value exception_instance(const Value& raised) {
    if (raised.is_exception()) return raised;
    if (raised.is_callable() && raised.as_callable().is_exception_type) {
        CallArgs none;
        return call_value(raised, none);
    }
    throw ScriptError("TypeError", "exceptions must derive from BaseException");
}

bool handler_matches(const Value& handler, const std::string& raised_type) {
    if (handler.is_tuple()) {
        for (const auto& item : handler.as_tuple().items) {
            if (handler_matches(item, raised_type)) return true;
        }
        return false;
    }
    if (!handler.is_callable() || !handler.as_callable().is_exception_type) {
        throw ScriptError("TypeError", "catching classes that do not inherit from BaseException is not allowed");
    }
    return exception_matches(raised_type, handler.as_callable().name);
}

} // namespace

Interpreter::ScopeGuard::ScopeGuard(Interpreter& interp, ScopeChain chain)
    : interp_(interp), saved_(std::move(interp.scopes_)) {
    interp_.scopes_ = std::move(chain);
    interp_.scopes_.push_back(std::make_shared<Scope>());
}

Interpreter::ScopeGuard::~ScopeGuard() {
    interp_.scopes_ = std::move(saved_);
}

Interpreter::Interpreter(Namespace& ns) : ns_(ns) {}

void Interpreter::run(const ast::Module& module) {
    for (const auto& stmt : module.body) {
        if (stmt->kind == NodeKind::Expr) {
            last_value_ = eval(*static_cast<const ExprStmt&>(*stmt).value);
            has_last_value_ = true;
            continue;
        }
        has_last_value_ = false;
        if (exec(*stmt) != Flow::NORMAL) {
            throw ScriptError("SyntaxError", "'break' or 'continue' outside loop");
        }
    }
}

Value Interpreter::result() const {
    auto it = ns_.globals.find(RESULT_BINDING_NAME);
    if (it != ns_.globals.end()) return it->second;
    return has_last_value_ ? last_value_ : Value();
}

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

Interpreter::Flow Interpreter::exec_block(const Block& block) {
    for (const auto& stmt : block) {
        Flow flow = exec(*stmt);
        if (flow != Flow::NORMAL) return flow;
    }
    return Flow::NORMAL;
}

Interpreter::Flow Interpreter::exec(const Stmt& stmt) {
    switch (stmt.kind) {
        case NodeKind::Expr:
            eval(*static_cast<const ExprStmt&>(stmt).value);
            return Flow::NORMAL;

        case NodeKind::Assign: {
            const auto& node = static_cast<const Assign&>(stmt);
            Value value = eval(*node.value);
            for (const auto& target : node.targets) assign(*target, value);
            return Flow::NORMAL;
        }

        case NodeKind::AugAssign:
            exec_aug_assign(static_cast<const AugAssign&>(stmt));
            return Flow::NORMAL;

        case NodeKind::If: {
            const auto& node = static_cast<const If&>(stmt);
            return truthy(eval(*node.test)) ? exec_block(node.body) : exec_block(node.orelse);
        }

        case NodeKind::For:
            return exec_for(static_cast<const For&>(stmt));

        case NodeKind::While:
            return exec_while(static_cast<const While&>(stmt));

        case NodeKind::Break:
            return Flow::BREAK;

        case NodeKind::Continue:
            return Flow::CONTINUE;

        case NodeKind::Pass:
            return Flow::NORMAL;

        case NodeKind::Raise:
            exec_raise(static_cast<const Raise&>(stmt));
            return Flow::NORMAL;

        case NodeKind::Try:
            return exec_try(static_cast<const Try&>(stmt));

        case NodeKind::Import:
            exec_import(static_cast<const Import&>(stmt));
            return Flow::NORMAL;

        case NodeKind::ImportFrom:
            exec_import_from(static_cast<const ImportFrom&>(stmt));
            return Flow::NORMAL;

        case NodeKind::Delete:
            for (const auto& target : static_cast<const Delete&>(stmt).targets) exec_delete(*target);
            return Flow::NORMAL;

        case NodeKind::Assert: {
            const auto& node = static_cast<const Assert&>(stmt);
            if (!truthy(eval(*node.test))) {
                throw ScriptError("AssertionError", node.msg ? to_display(eval(*node.msg)) : "");
            }
            return Flow::NORMAL;
        }

        case NodeKind::Global:
            // Module-level declarations change nothing
            return Flow::NORMAL;

        case NodeKind::Nonlocal:
            throw ScriptError("SyntaxError", "nonlocal declaration not allowed at module level");

        case NodeKind::Return:
            throw ScriptError("SyntaxError", "'return' outside function");

        case NodeKind::FunctionDef:
            throw ScriptError("NotImplementedError", "function definitions are not supported");

        case NodeKind::ClassDef:
            throw ScriptError("NotImplementedError", "class definitions are not supported");

        case NodeKind::With:
            throw ScriptError("NotImplementedError", "context managers are not supported");

        default:
            throw ScriptError("RuntimeError", std::string("unexpected statement ") + node_kind_name(stmt.kind));
    }
}

Interpreter::Flow Interpreter::exec_for(const For& node) {
    Value iterable = eval(*node.iter);
    bool broke = false;
    for_each_item(iterable, [&](const Value& item) {
        assign(*node.target, item);
        if (exec_block(node.body) == Flow::BREAK) {
            broke = true;
            return false;
        }
        return true;
    });
    if (!broke) return exec_block(node.orelse);
    return Flow::NORMAL;
}

Interpreter::Flow Interpreter::exec_while(const While& node) {
    while (truthy(eval(*node.test))) {
        if (exec_block(node.body) == Flow::BREAK) return Flow::NORMAL;
    }
    return exec_block(node.orelse);
}

Interpreter::Flow Interpreter::exec_try(const Try& node) {
    Flow flow = Flow::NORMAL;
    try {
        flow = exec_try_body(node);
    } catch (...) {
        // finally runs on the way out, then the original error continues
        exec_block(node.finalbody);
        throw;
    }
    Flow final_flow = exec_block(node.finalbody);
    return final_flow != Flow::NORMAL ? final_flow : flow;
}

Interpreter::Flow Interpreter::exec_try_body(const Try& node) {
    Flow flow = Flow::NORMAL;
    try {
        flow = exec_block(node.body);
    } catch (const ScriptError& error) {
        if (handle_exception(node, error, flow)) return flow;
        throw;
    } catch (const std::bad_alloc&) {
        if (handle_exception(node, ScriptError("MemoryError", ""), flow)) return flow;
        throw;
    }
    return exec_block(node.orelse);
}

bool Interpreter::handle_exception(const Try& node, const ScriptError& error, Flow& flow) {
    for (const auto& handler : node.handlers) {
        if (handler.type && !handler_matches(eval(*handler.type), error.type())) continue;

        Value instance = Value::exception(error.type(), error.message());
        if (!handler.name.empty()) bind(handler.name, instance);
        handling_.push_back(instance);
        try {
            flow = exec_block(handler.body);
        } catch (...) {
            handling_.pop_back();
            throw;
        }
        handling_.pop_back();
        if (!handler.name.empty()) unbind(handler.name);
        return true;
    }
    return false;
}

void Interpreter::exec_raise(const Raise& node) {
    if (!node.exc) {
        if (handling_.empty()) throw ScriptError("RuntimeError", "No active exception to reraise");
        const Opaque& active = handling_.back().as_opaque();
        throw ScriptError(active.type_name, active.text);
    }
    Value instance = exception_instance(eval(*node.exc));
    if (node.cause) eval(*node.cause);
    const Opaque& exc = instance.as_opaque();
    throw ScriptError(exc.type_name, exc.text);
}

Value Interpreter::import_module(const std::string& name) {
    if (!ns_.policy->is_module_allowed(name)) {
        throw ScriptError("ImportError", "Import of module '" + name + "' is not allowed");
    }
    auto it = modules_.find(name);
    if (it != modules_.end()) return it->second;
    Value module = load_module(name);
    modules_[name] = module;
    return module;
}

void Interpreter::exec_import(const Import& node) {
    for (const auto& alias : node.names) {
        Value module = import_module(alias.name);
        if (!alias.asname.empty()) {
            bind(alias.asname, module);
            continue;
        }
        std::string top = alias.name.substr(0, alias.name.find('.'));
        bind(top, top == alias.name ? module : import_module(top));
    }
}

void Interpreter::exec_import_from(const ImportFrom& node) {
    if (node.level > 0) throw ScriptError("ImportError", "attempted relative import with no known parent package");
    Value module = import_module(node.module);
    const auto& members = module.as_module().members;
    for (const auto& alias : node.names) {
        if (alias.name == "*") throw ScriptError("ImportError", "wildcard imports are not supported");
        auto it = members.find(alias.name);
        if (it == members.end()) {
            throw ScriptError("ImportError", "cannot import name '" + alias.name + "' from '" + node.module + "'");
        }
        bind(alias.asname.empty() ? alias.name : alias.asname, it->second);
    }
}

void Interpreter::exec_aug_assign(const AugAssign& node) {
    switch (node.target->kind) {
        case NodeKind::Name: {
            const std::string& name = static_cast<const Name&>(*node.target).id;
            Value current = lookup(name);
            Value operand = eval(*node.value);
            if (current.is_list() && node.op == BinaryOperator::ADD) {
                // In-place extend keeps aliases in sync
                std::vector<Value> extra = collect_items(operand);
                auto& items = current.as_list().items;
                items.insert(items.end(), extra.begin(), extra.end());
                return;
            }
            bind(name, binary_op(node.op, current, operand));
            return;
        }
        case NodeKind::Subscript: {
            const auto& target = static_cast<const Subscript&>(*node.target);
            Value container = eval(*target.value);
            if (target.index->kind == NodeKind::Slice) {
                throw ScriptError("TypeError", "augmented assignment to a slice is not supported");
            }
            Value index = eval(*target.index);
            Value current = index_value(container, index);
            Value operand = eval(*node.value);
            Value updated;
            if (current.is_list() && node.op == BinaryOperator::ADD) {
                std::vector<Value> extra = collect_items(operand);
                auto& items = current.as_list().items;
                items.insert(items.end(), extra.begin(), extra.end());
                updated = current;
            } else {
                updated = binary_op(node.op, current, operand);
            }
            if (container.is_dict()) {
                container.as_dict().set(index, updated);
            } else if (container.is_list()) {
                auto& items = container.as_list().items;
                items[static_cast<size_t>(checked_position(index, static_cast<int64_t>(items.size()), "list"))] = updated;
            } else {
                throw ScriptError("TypeError", "'" + container.type_name() + "' object does not support item assignment");
            }
            return;
        }
        case NodeKind::Attribute: {
            const auto& target = static_cast<const Attribute&>(*node.target);
            Value object = eval(*target.value);
            throw ScriptError("AttributeError", "'" + object.type_name() + "' object attribute '" + target.attr + "' is read-only");
        }
        default:
            throw ScriptError("SyntaxError", "illegal expression for augmented assignment");
    }
}

void Interpreter::exec_delete(const Expr& target) {
    switch (target.kind) {
        case NodeKind::Name:
            unbind(static_cast<const Name&>(target).id);
            return;
        case NodeKind::Tuple:
            for (const auto& element : static_cast<const TupleExpr&>(target).elements) exec_delete(*element);
            return;
        case NodeKind::List:
            for (const auto& element : static_cast<const ListExpr&>(target).elements) exec_delete(*element);
            return;
        case NodeKind::Subscript: {
            const auto& node = static_cast<const Subscript&>(target);
            Value container = eval(*node.value);
            if (container.is_dict()) {
                Value key = eval(*node.index);
                if (!container.as_dict().erase(key)) throw ScriptError("KeyError", repr(key));
                return;
            }
            if (!container.is_list()) {
                throw ScriptError("TypeError", "'" + container.type_name() + "' object doesn't support item deletion");
            }
            auto& items = container.as_list().items;
            if (node.index->kind == NodeKind::Slice) {
                const auto& slice = static_cast<const Slice&>(*node.index);
                Value lower = slice.lower ? eval(*slice.lower) : Value();
                Value upper = slice.upper ? eval(*slice.upper) : Value();
                Value step = slice.step ? eval(*slice.step) : Value();
                std::vector<int64_t> positions = slice_positions(
                    adjust_slice(lower, upper, step, static_cast<int64_t>(items.size())));
                std::sort(positions.begin(), positions.end());
                for (auto it = positions.rbegin(); it != positions.rend(); ++it) {
                    items.erase(items.begin() + *it);
                }
                return;
            }
            int64_t i = checked_position(eval(*node.index), static_cast<int64_t>(items.size()), "list");
            items.erase(items.begin() + i);
            return;
        }
        case NodeKind::Attribute: {
            const auto& node = static_cast<const Attribute&>(target);
            Value object = eval(*node.value);
            throw ScriptError("AttributeError", "'" + object.type_name() + "' object attribute '" + node.attr + "' is read-only");
        }
        default:
            throw ScriptError("SyntaxError", "cannot delete expression");
    }
}

// ---------------------------------------------------------------------------
// Bindings
// ---------------------------------------------------------------------------

Value Interpreter::lookup(const std::string& name) const {
    for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
        auto found = (*it)->find(name);
        if (found != (*it)->end()) return found->second;
    }
    auto global = ns_.globals.find(name);
    if (global != ns_.globals.end()) return global->second;
    auto builtin = ns_.builtins.find(name);
    if (builtin != ns_.builtins.end()) return builtin->second;
    throw ScriptError("NameError", "name '" + name + "' is not defined");
}

void Interpreter::bind(const std::string& name, Value value) {
    if (!scopes_.empty()) {
        (*scopes_.back())[name] = std::move(value);
        return;
    }
    ns_.globals[name] = std::move(value);
}

void Interpreter::unbind(const std::string& name) {
    size_t erased = scopes_.empty() ? ns_.globals.erase(name) : scopes_.back()->erase(name);
    if (erased == 0) throw ScriptError("NameError", "name '" + name + "' is not defined");
}

void Interpreter::assign(const Expr& target, const Value& value) {
    switch (target.kind) {
        case NodeKind::Name:
            bind(static_cast<const Name&>(target).id, value);
            return;
        case NodeKind::Tuple:
            assign_unpacked(static_cast<const TupleExpr&>(target).elements, value);
            return;
        case NodeKind::List:
            assign_unpacked(static_cast<const ListExpr&>(target).elements, value);
            return;
        case NodeKind::Subscript: {
            const auto& node = static_cast<const Subscript&>(target);
            Value container = eval(*node.value);
            store_subscript(container, *node.index, value);
            return;
        }
        case NodeKind::Attribute: {
            const auto& node = static_cast<const Attribute&>(target);
            Value object = eval(*node.value);
            throw ScriptError("AttributeError", "'" + object.type_name() + "' object attribute '" + node.attr + "' is read-only");
        }
        default:
            throw ScriptError("SyntaxError", "cannot assign to expression");
    }
}

void Interpreter::assign_unpacked(const std::vector<ExprPtr>& targets, const Value& value) {
    std::vector<Value> items = collect_items(value);
    size_t star = targets.size();
    for (size_t i = 0; i < targets.size(); ++i) {
        if (targets[i]->kind == NodeKind::Starred) star = i;
    }

    if (star == targets.size()) {
        if (items.size() < targets.size()) {
            throw ScriptError("ValueError", "not enough values to unpack (expected " + std::to_string(targets.size()) +
                                            ", got " + std::to_string(items.size()) + ")");
        }
        if (items.size() > targets.size()) {
            throw ScriptError("ValueError", "too many values to unpack (expected " + std::to_string(targets.size()) + ")");
        }
        for (size_t i = 0; i < targets.size(); ++i) assign(*targets[i], items[i]);
        return;
    }

    size_t after = targets.size() - star - 1;
    if (items.size() < star + after) {
        throw ScriptError("ValueError", "not enough values to unpack (expected at least " +
                                        std::to_string(star + after) + ", got " + std::to_string(items.size()) + ")");
    }
    for (size_t i = 0; i < star; ++i) assign(*targets[i], items[i]);
    std::vector<Value> rest(items.begin() + static_cast<std::ptrdiff_t>(star),
                            items.end() - static_cast<std::ptrdiff_t>(after));
    assign(*static_cast<const Starred&>(*targets[star]).value, Value::list(std::move(rest)));
    for (size_t i = 0; i < after; ++i) {
        assign(*targets[star + 1 + i], items[items.size() - after + i]);
    }
}

void Interpreter::store_subscript(const Value& container, const Expr& index_expr, const Value& value) {
    if (container.is_dict()) {
        container.as_dict().set(eval(index_expr), value);
        return;
    }
    if (!container.is_list()) {
        throw ScriptError("TypeError", "'" + container.type_name() + "' object does not support item assignment");
    }
    auto& items = container.as_list().items;

    if (index_expr.kind != NodeKind::Slice) {
        int64_t i = checked_position(eval(index_expr), static_cast<int64_t>(items.size()), "list assignment");
        items[static_cast<size_t>(i)] = value;
        return;
    }

    const auto& slice = static_cast<const Slice&>(index_expr);
    Value lower = slice.lower ? eval(*slice.lower) : Value();
    Value upper = slice.upper ? eval(*slice.upper) : Value();
    Value step = slice.step ? eval(*slice.step) : Value();
    std::vector<Value> replacement = collect_items(value);
    SliceBounds bounds = adjust_slice(lower, upper, step, static_cast<int64_t>(items.size()));

    if (bounds.step == 1) {
        int64_t stop = std::max(bounds.start, bounds.stop);
        items.erase(items.begin() + bounds.start, items.begin() + stop);
        items.insert(items.begin() + bounds.start, replacement.begin(), replacement.end());
        return;
    }
    std::vector<int64_t> positions = slice_positions(bounds);
    if (positions.size() != replacement.size()) {
        throw ScriptError("ValueError", "attempt to assign sequence of size " + std::to_string(replacement.size()) +
                                        " to extended slice of size " + std::to_string(positions.size()));
    }
    for (size_t i = 0; i < positions.size(); ++i) items[static_cast<size_t>(positions[i])] = replacement[i];
}

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

Value Interpreter::eval(const Expr& expr) {
    switch (expr.kind) {
        case NodeKind::Name:
            return lookup(static_cast<const Name&>(expr).id);

        case NodeKind::Constant:
            return static_cast<const Constant&>(expr).value;

        case NodeKind::FormattedString:
            return eval_formatted(static_cast<const FormattedString&>(expr));

        case NodeKind::List:
            return Value::list(eval_elements(static_cast<const ListExpr&>(expr).elements));

        case NodeKind::Tuple:
            return Value::tuple(eval_elements(static_cast<const TupleExpr&>(expr).elements));

        case NodeKind::Dict: {
            const auto& node = static_cast<const DictExpr&>(expr);
            Value dict = Value::dict();
            for (size_t i = 0; i < node.keys.size(); ++i) {
                if (!node.keys[i]) {
                    // {**mapping}
                    Value source = eval(*node.values[i]);
                    if (!source.is_dict()) {
                        throw ScriptError("TypeError", "'" + source.type_name() + "' object is not a mapping");
                    }
                    for (const auto& [k, v] : source.as_dict().entries()) dict.as_dict().set(k, v);
                    continue;
                }
                Value key = eval(*node.keys[i]);
                dict.as_dict().set(key, eval(*node.values[i]));
            }
            return dict;
        }

        case NodeKind::Attribute: {
            const auto& node = static_cast<const Attribute&>(expr);
            return get_attribute(eval(*node.value), node.attr);
        }

        case NodeKind::Subscript:
            return eval_subscript(static_cast<const Subscript&>(expr));

        case NodeKind::Call:
            return eval_call(static_cast<const Call&>(expr));

        case NodeKind::BinOp: {
            const auto& node = static_cast<const BinOp&>(expr);
            Value left = eval(*node.left);
            return binary_op(node.op, left, eval(*node.right));
        }

        case NodeKind::UnaryOp: {
            const auto& node = static_cast<const UnaryOp&>(expr);
            return unary_op(node.op, eval(*node.operand));
        }

        case NodeKind::BoolOp:
            return eval_bool_op(static_cast<const BoolOp&>(expr));

        case NodeKind::Compare:
            return eval_compare(static_cast<const Compare&>(expr));

        case NodeKind::IfExp: {
            const auto& node = static_cast<const IfExp&>(expr);
            return truthy(eval(*node.test)) ? eval(*node.body) : eval(*node.orelse);
        }

        case NodeKind::Lambda:
            return make_lambda(static_cast<const Lambda&>(expr));

        case NodeKind::ListComp:
        case NodeKind::GeneratorExp:
            return eval_comprehension(static_cast<const ListComp&>(expr));

        case NodeKind::DictComp:
            return eval_dict_comprehension(static_cast<const DictComp&>(expr));

        case NodeKind::Starred:
            throw ScriptError("SyntaxError", "can't use starred expression here");

        case NodeKind::Slice:
            throw ScriptError("SyntaxError", "slice outside of a subscript");

        default:
            throw ScriptError("RuntimeError", std::string("unexpected expression ") + node_kind_name(expr.kind));
    }
}

std::vector<Value> Interpreter::eval_elements(const std::vector<ExprPtr>& elements) {
    std::vector<Value> items;
    items.reserve(elements.size());
    for (const auto& element : elements) {
        if (element->kind == NodeKind::Starred) {
            std::vector<Value> expanded = collect_items(eval(*static_cast<const Starred&>(*element).value));
            items.insert(items.end(), expanded.begin(), expanded.end());
        } else {
            items.push_back(eval(*element));
        }
    }
    return items;
}

Value Interpreter::eval_call(const Call& node) {
    Value callee = eval(*node.func);

    CallArgs args;
    args.positional = eval_elements(node.args);
    auto add_keyword = [&](const std::string& name, Value value) {
        if (args.keyword(name)) {
            throw ScriptError("TypeError", "got multiple values for keyword argument '" + name + "'");
        }
        args.keywords.emplace_back(name, std::move(value));
    };
    for (const auto& keyword : node.keywords) {
        Value value = eval(*keyword.value);
        if (!keyword.arg.empty()) {
            add_keyword(keyword.arg, std::move(value));
            continue;
        }
        if (!value.is_dict()) {
            throw ScriptError("TypeError", "argument after ** must be a mapping, not " + value.type_name());
        }
        for (const auto& [k, v] : value.as_dict().entries()) {
            if (!k.is_str()) throw ScriptError("TypeError", "keywords must be strings");
            add_keyword(k.as_str(), v);
        }
    }
    return call_value(callee, args);
}

Value Interpreter::eval_bool_op(const BoolOp& node) {
    Value value;
    for (const auto& operand : node.values) {
        value = eval(*operand);
        bool t = truthy(value);
        if (node.op == BoolOperator::AND ? !t : t) return value;
    }
    return value;
}

Value Interpreter::eval_compare(const Compare& node) {
    Value left = eval(*node.left);
    for (size_t i = 0; i < node.ops.size(); ++i) {
        Value right = eval(*node.comparators[i]);
        if (!compare_op(node.ops[i], left, right)) return Value(false);
        left = std::move(right);
    }
    return Value(true);
}

Value Interpreter::eval_formatted(const FormattedString& node) {
    std::string out;
    for (const auto& part : node.parts) {
        if (!part.expr) {
            out += part.literal;
            continue;
        }
        out += part.literal;
        Value value = eval(*part.expr);
        if (part.conversion == 'r' || part.conversion == 'a') value = Value(repr(value));
        else if (part.conversion == 's') value = Value(to_display(value));
        out += format_value(value, part.format_spec);
    }
    return Value(out);
}

Value Interpreter::eval_subscript(const Subscript& node) {
    Value container = eval(*node.value);
    if (node.index->kind == NodeKind::Slice) {
        const auto& slice = static_cast<const Slice&>(*node.index);
        Value lower = slice.lower ? eval(*slice.lower) : Value();
        Value upper = slice.upper ? eval(*slice.upper) : Value();
        Value step = slice.step ? eval(*slice.step) : Value();
        int64_t length = sequence_length(container);
        if (length < 0) {
            throw ScriptError("TypeError", "'" + container.type_name() + "' object is not subscriptable");
        }
        return slice_value(container, adjust_slice(lower, upper, step, length));
    }
    return index_value(container, eval(*node.index));
}

void Interpreter::run_generators(const std::vector<Comprehension>& generators, size_t index,
                                 const std::function<void()>& emit) {
    if (index == generators.size()) {
        emit();
        return;
    }
    const Comprehension& generator = generators[index];
    Value iterable = eval(*generator.iter);
    for_each_item(iterable, [&](const Value& item) {
        assign(*generator.target, item);
        for (const auto& condition : generator.ifs) {
            if (!truthy(eval(*condition))) return true;
        }
        run_generators(generators, index + 1, emit);
        return true;
    });
}

Value Interpreter::eval_comprehension(const ListComp& node) {
    std::vector<Value> items;
    ScopeGuard scope(*this, scopes_);
    run_generators(node.generators, 0, [&]() { items.push_back(eval(*node.element)); });
    return Value::list(std::move(items));
}

Value Interpreter::eval_dict_comprehension(const DictComp& node) {
    Value dict = Value::dict();
    ScopeGuard scope(*this, scopes_);
    run_generators(node.generators, 0, [&]() {
        Value key = eval(*node.key);
        dict.as_dict().set(key, eval(*node.value));
    });
    return dict;
}

Value Interpreter::make_lambda(const Lambda& node) {
    std::vector<Value> defaults;
    for (const auto& expr : node.params.defaults) defaults.push_back(eval(*expr));
    ScopeChain closure = scopes_;
    const Lambda* definition = &node;

    return Value::callable("<lambda>", [this, definition, defaults, closure](CallArgs& args) -> Value {
        const auto& names = definition->params.names;
        if (args.positional.size() > names.size()) {
            throw ScriptError("TypeError", "<lambda>() takes " + std::to_string(names.size()) +
                                           " positional arguments but " + std::to_string(args.positional.size()) +
                                           " were given");
        }
        if (call_depth_ >= MAX_CALL_DEPTH) {
            throw ScriptError("RecursionError", "maximum recursion depth exceeded");
        }

        ScopeGuard scope(*this, closure);
        Scope& locals = *scopes_.back();
        for (size_t i = 0; i < args.positional.size(); ++i) locals[names[i]] = args.positional[i];
        for (const auto& [name, value] : args.keywords) {
            if (std::find(names.begin(), names.end(), name) == names.end()) {
                throw ScriptError("TypeError", "<lambda>() got an unexpected keyword argument '" + name + "'");
            }
            if (locals.count(name)) {
                throw ScriptError("TypeError", "<lambda>() got multiple values for argument '" + name + "'");
            }
            locals[name] = value;
        }
        size_t first_default = names.size() - defaults.size();
        for (size_t i = 0; i < names.size(); ++i) {
            if (locals.count(names[i])) continue;
            if (i < first_default) {
                throw ScriptError("TypeError", "<lambda>() missing required argument: '" + names[i] + "'");
            }
            locals[names[i]] = defaults[i - first_default];
        }

        ++call_depth_;
        try {
            Value result = eval(*definition->body);
            --call_depth_;
            return result;
        } catch (...) {
            --call_depth_;
            throw;
        }
    });
}

} // namespace codegate
