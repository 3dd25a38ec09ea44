#include "codegate/value.h"
#include "codegate/errors.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace codegate {

namespace {

constexpr int MAX_COMPARISON_DEPTH = 200;

const char* TYPE_NAMES[] = {
    "NoneType", "bool", "int", "float", "str", "bytes", "list", "tuple",
    "range", "dict", "object", "builtin_function_or_method", "module", "client"
};

std::string escape_text(const std::string& text, char quote, bool bytes_literal) {
    std::string out;
    out.reserve(text.size() + 2);
    out += quote;
    for (unsigned char c : text) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c == static_cast<unsigned char>(quote)) {
                    out += '\\';
                    out += static_cast<char>(c);
                } else if (c < 0x20 || c == 0x7f || (bytes_literal && c >= 0x80)) {
                    char buf[5];
                    snprintf(buf, sizeof(buf), "\\x%02x", c);
                    out += buf;
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
    out += quote;
    return out;
}

std::string quote_text(const std::string& text, bool bytes_literal) {
    bool has_single = text.find('\'') != std::string::npos;
    bool has_double = text.find('"') != std::string::npos;
    char quote = (has_single && !has_double) ? '"' : '\'';
    return escape_text(text, quote, bytes_literal);
}

// Tracks containers currently being rendered so cycles print as [...]
class ReprContext {
public:
    bool enter(const void* ptr) {
        if (std::find(active_.begin(), active_.end(), ptr) != active_.end()) {
            return false;
        }
        active_.push_back(ptr);
        return true;
    }
    void leave() { active_.pop_back(); }

private:
    std::vector<const void*> active_;
};

std::string render(const Value& value, ReprContext& ctx);

std::string render_sequence(const std::vector<Value>& items, ReprContext& ctx,
                            const char* open, const char* close, bool tuple) {
    std::string out = open;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += render(items[i], ctx);
    }
    if (tuple && items.size() == 1) out += ",";
    out += close;
    return out;
}

std::string render(const Value& value, ReprContext& ctx) {
    switch (value.type()) {
        case ValueType::NONE: return "None";
        case ValueType::BOOL: return value.as_bool() ? "True" : "False";
        case ValueType::INT: return std::to_string(value.as_int());
        case ValueType::FLOAT: return format_float(value.as_float());
        case ValueType::STR: return quote_text(value.as_str(), false);
        case ValueType::BYTES: return "b" + quote_text(value.as_bytes(), true);
        case ValueType::LIST: {
            const List& list = value.as_list();
            if (!ctx.enter(&list)) return "[...]";
            std::string out = render_sequence(list.items, ctx, "[", "]", false);
            ctx.leave();
            return out;
        }
        case ValueType::TUPLE: {
            const Tuple& tuple = value.as_tuple();
            if (!ctx.enter(&tuple)) return "(...)";
            std::string out = render_sequence(tuple.items, ctx, "(", ")", true);
            ctx.leave();
            return out;
        }
        case ValueType::RANGE: {
            const Range& r = value.as_range();
            std::string out = "range(" + std::to_string(r.start) + ", " + std::to_string(r.stop);
            if (r.step != 1) out += ", " + std::to_string(r.step);
            return out + ")";
        }
        case ValueType::DICT: {
            const Dict& dict = value.as_dict();
            if (!ctx.enter(&dict)) return "{...}";
            std::string out = "{";
            bool first = true;
            for (const auto& [k, v] : dict.entries()) {
                if (!first) out += ", ";
                first = false;
                out += render(k, ctx);
                out += ": ";
                out += render(v, ctx);
            }
            out += "}";
            ctx.leave();
            return out;
        }
        case ValueType::OPAQUE: {
            const Opaque& opaque = value.as_opaque();
            if (opaque.exception) {
                return opaque.type_name + "(" +
                       (opaque.text.empty() ? "" : quote_text(opaque.text, false)) + ")";
            }
            return opaque.text;
        }
        case ValueType::CALLABLE: {
            const Callable& callable = value.as_callable();
            if (callable.is_type || callable.is_exception_type) {
                return "<class '" + callable.name + "'>";
            }
            return "<built-in function " + callable.name + ">";
        }
        case ValueType::MODULE:
            return "<module '" + value.as_module().name + "'>";
        case ValueType::CLIENT:
            return "<client>";
    }
    return "<unknown>";
}

bool equal_at(const Value& a, const Value& b, int depth);

bool sequences_equal(const std::vector<Value>& a, const std::vector<Value>& b, int depth) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (!equal_at(a[i], b[i], depth + 1)) return false;
    }
    return true;
}

bool equal_at(const Value& a, const Value& b, int depth) {
    if (depth > MAX_COMPARISON_DEPTH) {
        throw ScriptError("RecursionError", "maximum recursion depth exceeded in comparison");
    }
    if (a.is_number() && b.is_number()) {
        if (a.is_float() || b.is_float()) return a.as_number() == b.as_number();
        int64_t x = a.is_bool() ? (a.as_bool() ? 1 : 0) : a.as_int();
        int64_t y = b.is_bool() ? (b.as_bool() ? 1 : 0) : b.as_int();
        return x == y;
    }
    if (a.type() != b.type()) return false;
    switch (a.type()) {
        case ValueType::NONE: return true;
        case ValueType::STR: return a.as_str() == b.as_str();
        case ValueType::BYTES: return a.as_bytes() == b.as_bytes();
        case ValueType::LIST:
            if (a.same_object(b)) return true;
            return sequences_equal(a.as_list().items, b.as_list().items, depth);
        case ValueType::TUPLE:
            return sequences_equal(a.as_tuple().items, b.as_tuple().items, depth);
        case ValueType::RANGE: {
            const Range& x = a.as_range();
            const Range& y = b.as_range();
            int64_t n = x.length();
            if (n != y.length()) return false;
            if (n == 0) return true;
            return x.start == y.start && (n == 1 || x.step == y.step);
        }
        case ValueType::DICT: {
            if (a.same_object(b)) return true;
            const Dict& x = a.as_dict();
            const Dict& y = b.as_dict();
            if (x.size() != y.size()) return false;
            for (const auto& [k, v] : x.entries()) {
                const Value* other = y.find(k);
                if (!other || !equal_at(v, *other, depth + 1)) return false;
            }
            return true;
        }
        case ValueType::OPAQUE: {
            if (a.same_object(b)) return true;
            const Opaque& x = a.as_opaque();
            const Opaque& y = b.as_opaque();
            return !x.exception && !y.exception &&
                   x.type_name == y.type_name && x.text == y.text;
        }
        default:
            return a.same_object(b);
    }
}

int compare_sequences(const std::vector<Value>& a, const std::vector<Value>& b) {
    size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        if (!values_equal(a[i], b[i])) return compare_values(a[i], b[i]);
    }
    if (a.size() == b.size()) return 0;
    return a.size() < b.size() ? -1 : 1;
}

} // namespace

Value Value::bytes(std::string data) {
    Value v;
    v.data_ = Bytes{std::move(data)};
    return v;
}

Value Value::list(std::vector<Value> items) {
    Value v;
    v.data_ = std::make_shared<List>(List{std::move(items)});
    return v;
}

Value Value::tuple(std::vector<Value> items) {
    Value v;
    v.data_ = TuplePtr(std::make_shared<Tuple>(Tuple{std::move(items)}));
    return v;
}

Value Value::range(int64_t start, int64_t stop, int64_t step) {
    Value v;
    v.data_ = RangePtr(std::make_shared<Range>(Range{start, stop, step}));
    return v;
}

Value Value::dict() {
    Value v;
    v.data_ = std::make_shared<Dict>();
    return v;
}

Value Value::dict(std::vector<std::pair<Value, Value>> entries) {
    Value v = dict();
    Dict& d = v.as_dict();
    for (auto& [key, value] : entries) {
        d.set(key, std::move(value));
    }
    return v;
}

Value Value::opaque(std::string type_name, std::string text) {
    Value v;
    v.data_ = OpaquePtr(std::make_shared<Opaque>(Opaque{std::move(type_name), std::move(text), false}));
    return v;
}

Value Value::exception(std::string type_name, std::string message) {
    Value v;
    v.data_ = OpaquePtr(std::make_shared<Opaque>(Opaque{std::move(type_name), std::move(message), true}));
    return v;
}

Value Value::callable(std::string name, NativeFunction fn) {
    auto callable = std::make_shared<Callable>();
    callable->name = std::move(name);
    callable->fn = std::move(fn);
    Value v;
    v.data_ = CallablePtr(callable);
    return v;
}

Value Value::type_object(std::string name, NativeFunction constructor) {
    auto callable = std::make_shared<Callable>();
    callable->name = std::move(name);
    callable->fn = std::move(constructor);
    callable->is_type = true;
    Value v;
    v.data_ = CallablePtr(callable);
    return v;
}

Value Value::exception_type(std::string name) {
    auto callable = std::make_shared<Callable>();
    callable->name = name;
    callable->is_exception_type = true;
    callable->fn = [name](CallArgs& args) -> Value {
        if (!args.keywords.empty()) {
            throw ScriptError("TypeError", name + "() takes no keyword arguments");
        }
        if (args.positional.empty()) return Value::exception(name, "");
        if (args.positional.size() == 1) {
            return Value::exception(name, to_display(args.positional[0]));
        }
        return Value::exception(name, repr(Value::tuple(args.positional)));
    };
    Value v;
    v.data_ = CallablePtr(callable);
    return v;
}

Value Value::module(std::string name, std::map<std::string, Value> members) {
    Value v;
    v.data_ = ModulePtr(std::make_shared<Module>(Module{std::move(name), std::move(members)}));
    return v;
}

Value Value::client(std::shared_ptr<ClientGateway> gateway) {
    Value v;
    v.data_ = ClientPtr(std::make_shared<ClientRef>(ClientRef{std::move(gateway)}));
    return v;
}

bool Value::is_exception() const {
    return is_opaque() && as_opaque().exception;
}

double Value::as_number() const {
    switch (type()) {
        case ValueType::BOOL: return as_bool() ? 1.0 : 0.0;
        case ValueType::INT: return static_cast<double>(as_int());
        case ValueType::FLOAT: return as_float();
        default:
            throw ScriptError("TypeError", "expected a number, got '" + type_name() + "'");
    }
}

bool Value::same_object(const Value& other) const {
    if (type() != other.type()) return false;
    switch (type()) {
        case ValueType::NONE: return true;
        case ValueType::BOOL: return as_bool() == other.as_bool();
        case ValueType::INT: return as_int() == other.as_int();
        case ValueType::FLOAT: return as_float() == other.as_float();
        case ValueType::STR: return as_str() == other.as_str();
        case ValueType::BYTES: return as_bytes() == other.as_bytes();
        case ValueType::LIST: return std::get<ListPtr>(data_) == std::get<ListPtr>(other.data_);
        case ValueType::TUPLE: return std::get<TuplePtr>(data_) == std::get<TuplePtr>(other.data_);
        case ValueType::RANGE: return std::get<RangePtr>(data_) == std::get<RangePtr>(other.data_);
        case ValueType::DICT: return std::get<DictPtr>(data_) == std::get<DictPtr>(other.data_);
        case ValueType::OPAQUE: return std::get<OpaquePtr>(data_) == std::get<OpaquePtr>(other.data_);
        case ValueType::CALLABLE: return std::get<CallablePtr>(data_) == std::get<CallablePtr>(other.data_);
        case ValueType::MODULE: return std::get<ModulePtr>(data_) == std::get<ModulePtr>(other.data_);
        case ValueType::CLIENT: return std::get<ClientPtr>(data_) == std::get<ClientPtr>(other.data_);
    }
    return false;
}

std::string Value::type_name() const {
    if (is_opaque()) return as_opaque().type_name;
    if (is_callable()) {
        const Callable& callable = as_callable();
        if (callable.is_type || callable.is_exception_type) return "type";
    }
    return TYPE_NAMES[static_cast<size_t>(type())];
}

int64_t Range::length() const {
    if (step > 0 && start < stop) return (stop - start + step - 1) / step;
    if (step < 0 && start > stop) return (start - stop - step - 1) / (-step);
    return 0;
}

const Value* Dict::find(const Value& key) const {
    auto it = index_.find(hash_key(key));
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].second;
}

Value* Dict::find(const Value& key) {
    auto it = index_.find(hash_key(key));
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].second;
}

void Dict::set(const Value& key, Value value) {
    std::string hashed = hash_key(key);
    auto it = index_.find(hashed);
    if (it != index_.end()) {
        entries_[it->second].second = std::move(value);
        return;
    }
    index_.emplace(std::move(hashed), entries_.size());
    entries_.emplace_back(key, std::move(value));
}

bool Dict::erase(const Value& key) {
    auto it = index_.find(hash_key(key));
    if (it == index_.end()) return false;
    size_t position = it->second;
    index_.erase(it);
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(position));
    for (auto& [_, slot] : index_) {
        if (slot > position) --slot;
    }
    return true;
}

void Dict::clear() {
    entries_.clear();
    index_.clear();
}

const Value* CallArgs::keyword(const std::string& name) const {
    for (const auto& [key, value] : keywords) {
        if (key == name) return &value;
    }
    return nullptr;
}

bool truthy(const Value& value) {
    switch (value.type()) {
        case ValueType::NONE: return false;
        case ValueType::BOOL: return value.as_bool();
        case ValueType::INT: return value.as_int() != 0;
        case ValueType::FLOAT: return value.as_float() != 0.0;
        case ValueType::STR: return !value.as_str().empty();
        case ValueType::BYTES: return !value.as_bytes().empty();
        case ValueType::LIST: return !value.as_list().items.empty();
        case ValueType::TUPLE: return !value.as_tuple().items.empty();
        case ValueType::RANGE: return value.as_range().length() > 0;
        case ValueType::DICT: return !value.as_dict().empty();
        default: return true;
    }
}

bool values_equal(const Value& a, const Value& b) {
    return equal_at(a, b, 0);
}

int compare_values(const Value& a, const Value& b) {
    if (a.is_number() && b.is_number()) {
        if (a.is_int() && b.is_int()) {
            if (a.as_int() == b.as_int()) return 0;
            return a.as_int() < b.as_int() ? -1 : 1;
        }
        double x = a.as_number();
        double y = b.as_number();
        if (x == y) return 0;
        return x < y ? -1 : 1;
    }
    if (a.type() == b.type()) {
        switch (a.type()) {
            case ValueType::STR: {
                int c = a.as_str().compare(b.as_str());
                return c == 0 ? 0 : (c < 0 ? -1 : 1);
            }
            case ValueType::BYTES: {
                int c = a.as_bytes().compare(b.as_bytes());
                return c == 0 ? 0 : (c < 0 ? -1 : 1);
            }
            case ValueType::LIST:
                return compare_sequences(a.as_list().items, b.as_list().items);
            case ValueType::TUPLE:
                return compare_sequences(a.as_tuple().items, b.as_tuple().items);
            default:
                break;
        }
    }
    throw ScriptError("TypeError", "'<' not supported between instances of '" +
                                   a.type_name() + "' and '" + b.type_name() + "'");
}

std::string repr(const Value& value) {
    ReprContext ctx;
    return render(value, ctx);
}

std::string to_display(const Value& value) {
    switch (value.type()) {
        case ValueType::STR: return value.as_str();
        case ValueType::OPAQUE: return value.as_opaque().text;
        default: return repr(value);
    }
}

std::string format_float(double value) {
    if (std::isnan(value)) return "nan";
    if (std::isinf(value)) return value > 0 ? "inf" : "-inf";
    char buf[32];
    for (int precision = 1; precision <= 17; ++precision) {
        snprintf(buf, sizeof(buf), "%.*g", precision, value);
        if (std::strtod(buf, nullptr) == value) break;
    }
    std::string out = buf;
    if (out.find_first_of(".e") == std::string::npos) out += ".0";
    return out;
}

std::string hash_key(const Value& value) {
    switch (value.type()) {
        case ValueType::NONE: return "n";
        case ValueType::BOOL: return value.as_bool() ? "i:1" : "i:0";
        case ValueType::INT: return "i:" + std::to_string(value.as_int());
        case ValueType::FLOAT: {
            double d = value.as_float();
            if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 9.2e18) {
                return "i:" + std::to_string(static_cast<int64_t>(d));
            }
            return "f:" + format_float(d);
        }
        case ValueType::STR: return "s:" + value.as_str();
        case ValueType::BYTES: return "b:" + value.as_bytes();
        case ValueType::TUPLE: {
            std::string out = "t:";
            for (const auto& item : value.as_tuple().items) {
                std::string inner = hash_key(item);
                out += std::to_string(inner.size()) + ":" + inner;
            }
            return out;
        }
        case ValueType::LIST:
        case ValueType::DICT:
            throw ScriptError("TypeError", "unhashable type: '" + value.type_name() + "'");
        default: {
            // Identity-hashed objects
            char buf[32];
            snprintf(buf, sizeof(buf), "o:%d:", static_cast<int>(value.type()));
            return buf + repr(value);
        }
    }
}

size_t utf8_length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

std::vector<std::string> utf8_chars(const std::string& text) {
    std::vector<std::string> chars;
    chars.reserve(text.size());
    for (size_t i = 0; i < text.size();) {
        size_t len = 1;
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c >= 0xF0) len = 4;
        else if (c >= 0xE0) len = 3;
        else if (c >= 0xC0) len = 2;
        len = std::min(len, text.size() - i);
        chars.push_back(text.substr(i, len));
        i += len;
    }
    return chars;
}

} // namespace codegate
