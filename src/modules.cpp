#include "builtins.h"
#include "operators.h"
#include "codegate/errors.h"
#include <json/json.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <numeric>

namespace codegate {

namespace {

constexpr int MAX_JSON_DEPTH = 200;

// Python-compatible json.dumps rendering
class JsonEncoder {
public:
    JsonEncoder(std::string indent, bool use_indent, std::string item_separator,
                std::string key_separator, bool sort_keys)
        : indent_(std::move(indent)), use_indent_(use_indent),
          item_separator_(std::move(item_separator)), key_separator_(std::move(key_separator)),
          sort_keys_(sort_keys) {}

    std::string encode(const Value& value) {
        std::string out;
        write(value, out, 0);
        return out;
    }

private:
    static std::string quoted(const std::string& text) {
        return Json::valueToQuotedString(text.c_str());
    }

    static std::string float_text(double d) {
        if (std::isnan(d)) return "NaN";
        if (std::isinf(d)) return d > 0 ? "Infinity" : "-Infinity";
        return format_float(d);
    }

    static std::string key_text(const Value& key) {
        switch (key.type()) {
            case ValueType::STR: return key.as_str();
            case ValueType::INT: return std::to_string(key.as_int());
            case ValueType::BOOL: return key.as_bool() ? "true" : "false";
            case ValueType::NONE: return "null";
            case ValueType::FLOAT: return float_text(key.as_float());
            default:
                throw ScriptError("TypeError", "keys must be str, int, float, bool or None, not " + key.type_name());
        }
    }

    void newline(std::string& out, int depth) const {
        out += '\n';
        for (int i = 0; i < depth; ++i) out += indent_;
    }

    void enter(const void* container) {
        if (std::find(active_.begin(), active_.end(), container) != active_.end()) {
            throw ScriptError("ValueError", "Circular reference detected");
        }
        if (static_cast<int>(active_.size()) >= MAX_JSON_DEPTH) {
            throw ScriptError("RecursionError", "maximum recursion depth exceeded while encoding a JSON object");
        }
        active_.push_back(container);
    }

    void write_items(const std::vector<Value>& items, std::string& out, int depth) {
        if (items.empty()) {
            out += "[]";
            return;
        }
        out += '[';
        for (size_t i = 0; i < items.size(); ++i) {
            if (i > 0) out += item_separator_;
            if (use_indent_) newline(out, depth + 1);
            write(items[i], out, depth + 1);
        }
        if (use_indent_) newline(out, depth);
        out += ']';
    }

    void write(const Value& value, std::string& out, int depth) {
        switch (value.type()) {
            case ValueType::NONE: out += "null"; return;
            case ValueType::BOOL: out += value.as_bool() ? "true" : "false"; return;
            case ValueType::INT: out += std::to_string(value.as_int()); return;
            case ValueType::FLOAT: out += float_text(value.as_float()); return;
            case ValueType::STR: out += quoted(value.as_str()); return;
            case ValueType::LIST:
                enter(&value.as_list());
                write_items(value.as_list().items, out, depth);
                active_.pop_back();
                return;
            case ValueType::TUPLE:
                enter(&value.as_tuple());
                write_items(value.as_tuple().items, out, depth);
                active_.pop_back();
                return;
            case ValueType::DICT: {
                const Dict& dict = value.as_dict();
                enter(&dict);
                std::vector<std::pair<std::string, Value>> members;
                for (const auto& [k, v] : dict.entries()) members.emplace_back(key_text(k), v);
                if (sort_keys_) {
                    std::stable_sort(members.begin(), members.end(),
                                     [](const auto& a, const auto& b) { return a.first < b.first; });
                }
                if (members.empty()) {
                    out += "{}";
                } else {
                    out += '{';
                    for (size_t i = 0; i < members.size(); ++i) {
                        if (i > 0) out += item_separator_;
                        if (use_indent_) newline(out, depth + 1);
                        out += quoted(members[i].first);
                        out += key_separator_;
                        write(members[i].second, out, depth + 1);
                    }
                    if (use_indent_) newline(out, depth);
                    out += '}';
                }
                active_.pop_back();
                return;
            }
            default:
                throw ScriptError("TypeError", "Object of type " + value.type_name() + " is not JSON serializable");
        }
    }

    std::string indent_;
    bool use_indent_;
    std::string item_separator_;
    std::string key_separator_;
    bool sort_keys_;
    std::vector<const void*> active_;
};

Value from_json(const Json::Value& json) {
    switch (json.type()) {
        case Json::nullValue: return Value();
        case Json::booleanValue: return Value(json.asBool());
        case Json::intValue: return Value(static_cast<int64_t>(json.asInt64()));
        case Json::uintValue:
            if (json.isInt64()) return Value(static_cast<int64_t>(json.asInt64()));
            return Value(json.asDouble());
        case Json::realValue: return Value(json.asDouble());
        case Json::stringValue: return Value(json.asString());
        case Json::arrayValue: {
            std::vector<Value> items;
            items.reserve(json.size());
            for (const auto& item : json) items.push_back(from_json(item));
            return Value::list(std::move(items));
        }
        case Json::objectValue: {
            Value dict = Value::dict();
            for (const auto& name : json.getMemberNames()) {
                dict.as_dict().set(Value(name), from_json(json[name]));
            }
            return dict;
        }
    }
    return Value();
}

Value json_dumps(CallArgs& args) {
    check_keywords(args, "dumps", {"indent", "sort_keys", "separators"});
    check_arity(args, "dumps", 1, 1);

    const Value* indent_arg = args.keyword("indent");
    bool use_indent = indent_arg && !indent_arg->is_none();
    std::string indent;
    if (use_indent) {
        if (indent_arg->is_str()) {
            indent = indent_arg->as_str();
        } else {
            int64_t width = to_integer(*indent_arg, "indent");
            indent = std::string(static_cast<size_t>(std::max<int64_t>(0, std::min<int64_t>(width, 64))), ' ');
        }
    }

    std::string item_separator = use_indent ? "," : ", ";
    std::string key_separator = ": ";
    const Value* separators = args.keyword("separators");
    if (separators && !separators->is_none()) {
        std::vector<Value> pair = collect_items(*separators);
        if (pair.size() != 2 || !pair[0].is_str() || !pair[1].is_str()) {
            throw ScriptError("TypeError", "separators must be a (item_separator, key_separator) tuple");
        }
        item_separator = pair[0].as_str();
        key_separator = pair[1].as_str();
    }
    const Value* sort_arg = args.keyword("sort_keys");
    bool sort_keys = sort_arg && truthy(*sort_arg);

    JsonEncoder encoder(indent, use_indent, item_separator, key_separator, sort_keys);
    return Value(encoder.encode(args.positional[0]));
}

Value json_loads(CallArgs& args) {
    check_no_keywords(args, "loads");
    check_arity(args, "loads", 1, 1);
    const Value& source = args.positional[0];
    if (!source.is_str() && !source.is_bytes()) {
        throw ScriptError("TypeError", "the JSON object must be str or bytes, not " + source.type_name());
    }
    const std::string& text = source.is_str() ? source.as_str() : source.as_bytes();

    Json::CharReaderBuilder builder;
    builder["allowSpecialFloats"] = true;
    builder["stackLimit"] = MAX_JSON_DEPTH;
    builder["failIfExtra"] = true;
    builder["rejectDupKeys"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value parsed;
    std::string errors;
    try {
        if (!reader->parse(text.data(), text.data() + text.size(), &parsed, &errors)) {
            std::string first_line = errors.substr(0, errors.find('\n'));
            throw ScriptError("JSONDecodeError", first_line.empty() ? "Expecting value" : first_line);
        }
    } catch (const Json::Exception& e) {
        throw ScriptError("JSONDecodeError", e.what());
    }
    return from_json(parsed);
}

double real_arg(const CallArgs& args, size_t index) {
    const Value& v = args.positional[index];
    if (!v.is_number()) {
        throw ScriptError("TypeError", "must be real number, not " + v.type_name());
    }
    return v.as_number();
}

double checked(double result) {
    if (std::isnan(result)) throw ScriptError("ValueError", "math domain error");
    if (std::isinf(result)) throw ScriptError("OverflowError", "math range error");
    return result;
}

Value unary_math(const std::string& name, double (*fn)(double), bool check_domain = true) {
    return Value::callable(name, [name, fn, check_domain](CallArgs& args) -> Value {
        check_no_keywords(args, name);
        check_arity(args, name, 1, 1);
        double x = real_arg(args, 0);
        double result = fn(x);
        if (check_domain && std::isfinite(x)) result = checked(result);
        return Value(result);
    });
}

Value rounding_math(const std::string& name, double (*fn)(double)) {
    return Value::callable(name, [name, fn](CallArgs& args) -> Value {
        check_no_keywords(args, name);
        check_arity(args, name, 1, 1);
        const Value& v = args.positional[0];
        if (v.is_int() || v.is_bool()) return Value(to_integer(v, name.c_str()));
        double x = real_arg(args, 0);
        if (std::isnan(x)) throw ScriptError("ValueError", "cannot convert float NaN to integer");
        if (std::isinf(x)) throw ScriptError("OverflowError", "cannot convert float infinity to integer");
        double r = fn(x);
        if (r >= 9223372036854775808.0 || r < -9223372036854775808.0) {
            throw ScriptError("OverflowError", "int too large to convert");
        }
        return Value(static_cast<int64_t>(r));
    });
}

Value math_log(CallArgs& args) {
    check_no_keywords(args, "log");
    check_arity(args, "log", 1, 2);
    double x = real_arg(args, 0);
    if (x <= 0) throw ScriptError("ValueError", "math domain error");
    double result = std::log(x);
    if (args.positional.size() == 2) {
        double base = real_arg(args, 1);
        if (base <= 0 || base == 1.0) {
            if (base == 1.0) throw ScriptError("ZeroDivisionError", "float division by zero");
            throw ScriptError("ValueError", "math domain error");
        }
        result /= std::log(base);
    }
    return Value(result);
}

Value math_gcd(CallArgs& args) {
    check_no_keywords(args, "gcd");
    int64_t result = 0;
    for (const auto& arg : args.positional) {
        int64_t n = to_integer(arg, "gcd");
        if (n == std::numeric_limits<int64_t>::min()) throw ScriptError("OverflowError", "integer overflow");
        result = std::gcd(result, n < 0 ? -n : n);
    }
    return Value(result);
}

Value math_factorial(CallArgs& args) {
    check_no_keywords(args, "factorial");
    check_arity(args, "factorial", 1, 1);
    if (args.positional[0].is_float()) throw ScriptError("TypeError", "'float' object cannot be interpreted as an integer");
    int64_t n = to_integer(args.positional[0], "factorial");
    if (n < 0) throw ScriptError("ValueError", "factorial() not defined for negative values");
    if (n > 20) throw ScriptError("OverflowError", "factorial() result does not fit in 64 bits");
    int64_t result = 1;
    for (int64_t i = 2; i <= n; ++i) result *= i;
    return Value(result);
}

Value math_pow(CallArgs& args) {
    check_no_keywords(args, "pow");
    check_arity(args, "pow", 2, 2);
    double x = real_arg(args, 0);
    double y = real_arg(args, 1);
    if (x == 0.0 && y < 0) throw ScriptError("ValueError", "math domain error");
    double result = std::pow(x, y);
    if (std::isfinite(x) && std::isfinite(y)) result = checked(result);
    return Value(result);
}

Value binary_math(const std::string& name, double (*fn)(double, double)) {
    return Value::callable(name, [name, fn](CallArgs& args) -> Value {
        check_no_keywords(args, name);
        check_arity(args, name, 2, 2);
        return Value(fn(real_arg(args, 0), real_arg(args, 1)));
    });
}

Value predicate_math(const std::string& name, bool (*fn)(double)) {
    return Value::callable(name, [name, fn](CallArgs& args) -> Value {
        check_no_keywords(args, name);
        check_arity(args, name, 1, 1);
        return Value(fn(real_arg(args, 0)));
    });
}

Value math_fsum(CallArgs& args) {
    check_no_keywords(args, "fsum");
    check_arity(args, "fsum", 1, 1);
    // Kahan-Babuska summation
    double sum = 0.0;
    double compensation = 0.0;
    for_each_item(args.positional[0], [&](const Value& item) {
        if (!item.is_number()) throw ScriptError("TypeError", "must be real number, not " + item.type_name());
        double x = item.as_number();
        double t = sum + x;
        if (std::fabs(sum) >= std::fabs(x)) compensation += (sum - t) + x;
        else compensation += (x - t) + sum;
        sum = t;
        return true;
    });
    return Value(sum + compensation);
}

Value math_prod(CallArgs& args) {
    check_keywords(args, "prod", {"start"});
    check_arity(args, "prod", 1, 1);
    const Value* start = args.keyword("start");
    Value total = start ? *start : Value(1);
    for_each_item(args.positional[0], [&](const Value& item) {
        total = binary_op(ast::BinaryOperator::MULT, total, item);
        return true;
    });
    return total;
}

Value math_isclose(CallArgs& args) {
    check_keywords(args, "isclose", {"rel_tol", "abs_tol"});
    check_arity(args, "isclose", 2, 2);
    double a = real_arg(args, 0);
    double b = real_arg(args, 1);
    const Value* rel = args.keyword("rel_tol");
    const Value* abs_tol = args.keyword("abs_tol");
    double rel_tol = rel ? rel->as_number() : 1e-09;
    double abs_value = abs_tol ? abs_tol->as_number() : 0.0;
    if (rel_tol < 0 || abs_value < 0) throw ScriptError("ValueError", "tolerances must be non-negative");
    if (a == b) return Value(true);
    if (std::isinf(a) || std::isinf(b)) return Value(false);
    double diff = std::fabs(b - a);
    return Value(diff <= std::fabs(rel_tol * b) || diff <= std::fabs(rel_tol * a) || diff <= abs_value);
}

Value make_json_module() {
    std::map<std::string, Value> members;
    members["dumps"] = Value::callable("dumps", json_dumps);
    members["loads"] = Value::callable("loads", json_loads);
    members["JSONDecodeError"] = Value::exception_type("JSONDecodeError");
    return Value::module("json", std::move(members));
}

Value make_math_module() {
    std::map<std::string, Value> members;
    members["pi"] = Value(M_PI);
    members["e"] = Value(M_E);
    members["tau"] = Value(2 * M_PI);
    members["inf"] = Value(std::numeric_limits<double>::infinity());
    members["nan"] = Value(std::numeric_limits<double>::quiet_NaN());

    members["sqrt"] = unary_math("sqrt", [](double x) { return std::sqrt(x); });
    members["exp"] = unary_math("exp", [](double x) { return std::exp(x); });
    members["log2"] = unary_math("log2", [](double x) { return x <= 0 ? std::nan("") : std::log2(x); });
    members["log10"] = unary_math("log10", [](double x) { return x <= 0 ? std::nan("") : std::log10(x); });
    members["sin"] = unary_math("sin", [](double x) { return std::sin(x); });
    members["cos"] = unary_math("cos", [](double x) { return std::cos(x); });
    members["tan"] = unary_math("tan", [](double x) { return std::tan(x); });
    members["asin"] = unary_math("asin", [](double x) { return std::asin(x); });
    members["acos"] = unary_math("acos", [](double x) { return std::acos(x); });
    members["atan"] = unary_math("atan", [](double x) { return std::atan(x); });
    members["fabs"] = unary_math("fabs", [](double x) { return std::fabs(x); }, false);
    members["degrees"] = unary_math("degrees", [](double x) { return x * 180.0 / M_PI; }, false);
    members["radians"] = unary_math("radians", [](double x) { return x * M_PI / 180.0; }, false);

    members["floor"] = rounding_math("floor", [](double x) { return std::floor(x); });
    members["ceil"] = rounding_math("ceil", [](double x) { return std::ceil(x); });
    members["trunc"] = rounding_math("trunc", [](double x) { return std::trunc(x); });

    members["atan2"] = binary_math("atan2", [](double y, double x) { return std::atan2(y, x); });
    members["hypot"] = binary_math("hypot", [](double x, double y) { return std::hypot(x, y); });
    members["copysign"] = binary_math("copysign", [](double x, double y) { return std::copysign(x, y); });

    members["isnan"] = predicate_math("isnan", [](double x) { return std::isnan(x); });
    members["isinf"] = predicate_math("isinf", [](double x) { return std::isinf(x); });
    members["isfinite"] = predicate_math("isfinite", [](double x) { return std::isfinite(x); });

    members["log"] = Value::callable("log", math_log);
    members["pow"] = Value::callable("pow", math_pow);
    members["gcd"] = Value::callable("gcd", math_gcd);
    members["factorial"] = Value::callable("factorial", math_factorial);
    members["fsum"] = Value::callable("fsum", math_fsum);
    members["prod"] = Value::callable("prod", math_prod);
    members["isclose"] = Value::callable("isclose", math_isclose);
    return Value::module("math", std::move(members));
}

} // namespace

Value load_module(const std::string& name) {
    if (name == "json") return make_json_module();
    if (name == "math") return make_math_module();
    throw ScriptError("ModuleNotFoundError", "No module named '" + name + "'");
}

} // namespace codegate
