#include "builtins.h"
#include "operators.h"
#include "codegate/errors.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cfenv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <numeric>

namespace codegate {

namespace {

const std::map<std::string, std::string> EXCEPTION_PARENTS = {
    {"BaseException", ""},
    {"Exception", "BaseException"},
    {"ArithmeticError", "Exception"},
    {"ZeroDivisionError", "ArithmeticError"},
    {"OverflowError", "ArithmeticError"},
    {"LookupError", "Exception"},
    {"KeyError", "LookupError"},
    {"IndexError", "LookupError"},
    {"ValueError", "Exception"},
    {"UnicodeError", "ValueError"},
    {"UnicodeDecodeError", "UnicodeError"},
    {"JSONDecodeError", "ValueError"},
    {"TypeError", "Exception"},
    {"AttributeError", "Exception"},
    {"NameError", "Exception"},
    {"RuntimeError", "Exception"},
    {"RecursionError", "RuntimeError"},
    {"NotImplementedError", "RuntimeError"},
    {"AssertionError", "Exception"},
    {"ImportError", "Exception"},
    {"ModuleNotFoundError", "ImportError"},
    {"StopIteration", "Exception"},
    {"MemoryError", "Exception"},
    {"TimeoutError", "Exception"},
    {"ClientError", "Exception"},
};

const Value& positional(const CallArgs& args, size_t index) {
    return args.positional[index];
}

const Value* optional_arg(const CallArgs& args, size_t index, const char* keyword) {
    if (index < args.positional.size()) return &args.positional[index];
    return args.keyword(keyword);
}

bool is_integral(const Value& v) {
    return v.is_int() || v.is_bool();
}

std::string strip_whitespace(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\n\r\f\v");
    return text.substr(start, end - start + 1);
}

int64_t float_to_integer(double value) {
    if (std::isnan(value)) throw ScriptError("ValueError", "cannot convert float NaN to integer");
    if (std::isinf(value)) throw ScriptError("OverflowError", "cannot convert float infinity to integer");
    double truncated = std::trunc(value);
    if (truncated >= 9223372036854775808.0 || truncated < -9223372036854775808.0) {
        throw ScriptError("OverflowError", "int too large to convert");
    }
    return static_cast<int64_t>(truncated);
}

double parse_float(const std::string& raw) {
    std::string text = strip_whitespace(raw);
    std::string lower;
    for (char c : text) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    std::string unsigned_part = lower;
    bool negative = false;
    if (!unsigned_part.empty() && (unsigned_part[0] == '+' || unsigned_part[0] == '-')) {
        negative = unsigned_part[0] == '-';
        unsigned_part = unsigned_part.substr(1);
    }
    if (unsigned_part == "nan") return std::numeric_limits<double>::quiet_NaN();
    if (unsigned_part == "inf" || unsigned_part == "infinity") {
        return negative ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
    }

    std::string digits;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '_' && i > 0 && i + 1 < text.size() &&
            std::isdigit(static_cast<unsigned char>(text[i - 1])) &&
            std::isdigit(static_cast<unsigned char>(text[i + 1]))) {
            continue;
        }
        digits += text[i];
    }
    bool valid = !digits.empty() && digits.find_first_not_of("0123456789+-.eE") == std::string::npos;
    char* end = nullptr;
    double value = valid ? std::strtod(digits.c_str(), &end) : 0.0;
    if (!valid || end != digits.c_str() + digits.size()) {
        throw ScriptError("ValueError", "could not convert string to float: " + repr(Value(raw)));
    }
    return value;
}

double round_half_even(double value) {
    int previous = std::fegetround();
    std::fesetround(FE_TONEAREST);
    double rounded = std::nearbyint(value);
    std::fesetround(previous);
    return rounded;
}

Value builtin_len(CallArgs& args) {
    check_no_keywords(args, "len");
    check_arity(args, "len", 1, 1);
    const Value& v = positional(args, 0);
    switch (v.type()) {
        case ValueType::STR: return Value(static_cast<int64_t>(utf8_length(v.as_str())));
        case ValueType::BYTES: return Value(static_cast<int64_t>(v.as_bytes().size()));
        case ValueType::LIST: return Value(static_cast<int64_t>(v.as_list().items.size()));
        case ValueType::TUPLE: return Value(static_cast<int64_t>(v.as_tuple().items.size()));
        case ValueType::DICT: return Value(static_cast<int64_t>(v.as_dict().size()));
        case ValueType::RANGE: return Value(v.as_range().length());
        default:
            throw ScriptError("TypeError", "object of type '" + v.type_name() + "' has no len()");
    }
}

Value builtin_str(CallArgs& args) {
    check_keywords(args, "str", {"encoding", "errors"});
    check_arity(args, "str", 0, 3);
    if (args.positional.empty()) return Value(std::string());
    const Value& v = positional(args, 0);
    if (v.is_bytes() && (args.positional.size() > 1 || args.keyword("encoding"))) {
        return Value(v.as_bytes());
    }
    return Value(to_display(v));
}

Value builtin_int(CallArgs& args) {
    check_keywords(args, "int", {"base"});
    check_arity(args, "int", 0, 2);
    const Value* base_arg = optional_arg(args, 1, "base");
    if (args.positional.empty()) {
        if (base_arg) throw ScriptError("TypeError", "int() missing string argument");
        return Value(0);
    }
    const Value& v = positional(args, 0);
    if (base_arg) {
        if (!v.is_str()) throw ScriptError("TypeError", "int() can't convert non-string with explicit base");
        int64_t base = to_integer(*base_arg, "base");
        if (base != 0 && (base < 2 || base > 36)) throw ScriptError("ValueError", "int() base must be >= 2 and <= 36, or 0");
        return Value(parse_integer(v.as_str(), static_cast<int>(base)));
    }
    if (is_integral(v)) return Value(to_integer(v, "int"));
    if (v.is_float()) return Value(float_to_integer(v.as_float()));
    if (v.is_str()) return Value(parse_integer(v.as_str(), 10));
    throw ScriptError("TypeError", "int() argument must be a string or a real number, not '" + v.type_name() + "'");
}

Value builtin_float(CallArgs& args) {
    check_no_keywords(args, "float");
    check_arity(args, "float", 0, 1);
    if (args.positional.empty()) return Value(0.0);
    const Value& v = positional(args, 0);
    if (v.is_number()) return Value(v.as_number());
    if (v.is_str()) return Value(parse_float(v.as_str()));
    throw ScriptError("TypeError", "float() argument must be a string or a real number, not '" + v.type_name() + "'");
}

Value builtin_bool(CallArgs& args) {
    check_no_keywords(args, "bool");
    check_arity(args, "bool", 0, 1);
    return Value(!args.positional.empty() && truthy(positional(args, 0)));
}

Value builtin_list(CallArgs& args) {
    check_no_keywords(args, "list");
    check_arity(args, "list", 0, 1);
    if (args.positional.empty()) return Value::list();
    return Value::list(collect_items(positional(args, 0)));
}

Value builtin_tuple(CallArgs& args) {
    check_no_keywords(args, "tuple");
    check_arity(args, "tuple", 0, 1);
    if (args.positional.empty()) return Value::tuple();
    const Value& v = positional(args, 0);
    if (v.is_tuple()) return v;
    return Value::tuple(collect_items(v));
}

Value builtin_dict(CallArgs& args) {
    check_arity(args, "dict", 0, 1);
    Value result = Value::dict();
    Dict& dict = result.as_dict();
    if (!args.positional.empty()) {
        const Value& source = positional(args, 0);
        if (source.is_dict()) {
            for (const auto& [k, v] : source.as_dict().entries()) dict.set(k, v);
        } else {
            size_t index = 0;
            for_each_item(source, [&](const Value& pair) {
                std::vector<Value> items;
                try {
                    items = collect_items(pair);
                } catch (const ScriptError&) {
                    throw ScriptError("TypeError", "cannot convert dictionary update sequence element #" +
                                                   std::to_string(index) + " to a sequence");
                }
                if (items.size() != 2) {
                    throw ScriptError("ValueError", "dictionary update sequence element #" + std::to_string(index) +
                                                    " has length " + std::to_string(items.size()) + "; 2 is required");
                }
                dict.set(items[0], items[1]);
                ++index;
                return true;
            });
        }
    }
    for (const auto& [name, value] : args.keywords) dict.set(Value(name), value);
    return result;
}

Value builtin_range(CallArgs& args) {
    check_no_keywords(args, "range");
    check_arity(args, "range", 1, 3);
    int64_t start = 0;
    int64_t stop = 0;
    int64_t step = 1;
    if (args.positional.size() == 1) {
        stop = to_integer(positional(args, 0), "range() argument");
    } else {
        start = to_integer(positional(args, 0), "range() argument");
        stop = to_integer(positional(args, 1), "range() argument");
        if (args.positional.size() == 3) step = to_integer(positional(args, 2), "range() argument");
    }
    if (step == 0) throw ScriptError("ValueError", "range() arg 3 must not be zero");
    return Value::range(start, stop, step);
}

Value builtin_enumerate(CallArgs& args) {
    check_keywords(args, "enumerate", {"start"});
    check_arity(args, "enumerate", 1, 2);
    const Value* start_arg = optional_arg(args, 1, "start");
    int64_t index = start_arg ? to_integer(*start_arg, "enumerate() start") : 0;
    std::vector<Value> out;
    for_each_item(positional(args, 0), [&](const Value& item) {
        out.push_back(Value::tuple({Value(index++), item}));
        return true;
    });
    return Value::list(std::move(out));
}

Value builtin_zip(CallArgs& args) {
    check_keywords(args, "zip", {"strict"});
    std::vector<std::vector<Value>> sources;
    for (const auto& iterable : args.positional) sources.push_back(collect_items(iterable));
    std::vector<Value> out;
    if (sources.empty()) return Value::list();
    size_t shortest = sources.front().size();
    size_t longest = shortest;
    for (const auto& source : sources) {
        shortest = std::min(shortest, source.size());
        longest = std::max(longest, source.size());
    }
    const Value* strict = args.keyword("strict");
    if (strict && truthy(*strict) && shortest != longest) {
        throw ScriptError("ValueError", "zip() arguments have different lengths");
    }
    for (size_t i = 0; i < shortest; ++i) {
        std::vector<Value> row;
        for (const auto& source : sources) row.push_back(source[i]);
        out.push_back(Value::tuple(std::move(row)));
    }
    return Value::list(std::move(out));
}

Value builtin_sorted(CallArgs& args) {
    check_keywords(args, "sorted", {"key", "reverse"});
    check_arity(args, "sorted", 1, 1);
    std::vector<Value> items = collect_items(positional(args, 0));
    const Value* key = args.keyword("key");
    const Value* reverse_arg = args.keyword("reverse");
    bool reverse = reverse_arg && truthy(*reverse_arg);

    std::vector<Value> keys;
    if (key && !key->is_none()) {
        keys.reserve(items.size());
        for (const auto& item : items) {
            CallArgs key_args;
            key_args.positional.push_back(item);
            keys.push_back(call_value(*key, key_args));
        }
    } else {
        keys = items;
    }

    std::vector<size_t> order(items.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return reverse ? compare_values(keys[b], keys[a]) < 0 : compare_values(keys[a], keys[b]) < 0;
    });

    std::vector<Value> sorted;
    sorted.reserve(items.size());
    for (size_t index : order) sorted.push_back(items[index]);
    return Value::list(std::move(sorted));
}

Value builtin_reversed(CallArgs& args) {
    check_no_keywords(args, "reversed");
    check_arity(args, "reversed", 1, 1);
    const Value& v = positional(args, 0);
    if (!v.is_list() && !v.is_tuple() && !v.is_str() && !v.is_range() && !v.is_dict() && !v.is_bytes()) {
        throw ScriptError("TypeError", "'" + v.type_name() + "' object is not reversible");
    }
    std::vector<Value> items = collect_items(v);
    std::reverse(items.begin(), items.end());
    return Value::list(std::move(items));
}

Value extreme(CallArgs& args, const char* name, bool want_max) {
    check_keywords(args, name, {"key", "default"});
    if (args.positional.empty()) {
        throw ScriptError("TypeError", std::string(name) + " expected at least 1 argument, got 0");
    }
    std::vector<Value> items = args.positional.size() == 1 ? collect_items(positional(args, 0)) : args.positional;
    const Value* default_value = args.keyword("default");
    if (default_value && args.positional.size() > 1) {
        throw ScriptError("TypeError", std::string("Cannot specify a default for ") + name + "() with multiple positional arguments");
    }
    if (items.empty()) {
        if (default_value) return *default_value;
        throw ScriptError("ValueError", std::string(name) + "() arg is an empty sequence");
    }

    const Value* key = args.keyword("key");
    auto key_of = [&](const Value& item) {
        if (!key || key->is_none()) return item;
        CallArgs key_args;
        key_args.positional.push_back(item);
        return call_value(*key, key_args);
    };

    size_t best = 0;
    Value best_key = key_of(items[0]);
    for (size_t i = 1; i < items.size(); ++i) {
        Value candidate = key_of(items[i]);
        int c = compare_values(candidate, best_key);
        if (want_max ? c > 0 : c < 0) {
            best = i;
            best_key = candidate;
        }
    }
    return items[best];
}

Value builtin_sum(CallArgs& args) {
    check_keywords(args, "sum", {"start"});
    check_arity(args, "sum", 1, 2);
    const Value* start = optional_arg(args, 1, "start");
    Value total = start ? *start : Value(0);
    if (total.is_str()) throw ScriptError("TypeError", "sum() can't sum strings [use ''.join(seq) instead]");
    for_each_item(positional(args, 0), [&](const Value& item) {
        total = binary_op(ast::BinaryOperator::ADD, total, item);
        return true;
    });
    return total;
}

Value builtin_abs(CallArgs& args) {
    check_no_keywords(args, "abs");
    check_arity(args, "abs", 1, 1);
    const Value& v = positional(args, 0);
    if (is_integral(v)) {
        int64_t n = to_integer(v, "abs");
        if (n == std::numeric_limits<int64_t>::min()) throw ScriptError("OverflowError", "integer overflow");
        return Value(n < 0 ? -n : n);
    }
    if (v.is_float()) return Value(std::fabs(v.as_float()));
    throw ScriptError("TypeError", "bad operand type for abs(): '" + v.type_name() + "'");
}

Value builtin_round(CallArgs& args) {
    check_keywords(args, "round", {"ndigits"});
    check_arity(args, "round", 1, 2);
    const Value& v = positional(args, 0);
    const Value* digits_arg = optional_arg(args, 1, "ndigits");
    bool has_digits = digits_arg && !digits_arg->is_none();

    if (is_integral(v)) {
        int64_t n = to_integer(v, "round");
        if (!has_digits) return Value(n);
        int64_t digits = to_integer(*digits_arg, "ndigits");
        if (digits >= 0) return Value(n);
        if (digits < -18) return Value(0);
        int64_t scale = 1;
        for (int64_t i = 0; i < -digits; ++i) scale *= 10;
        double rounded = round_half_even(static_cast<double>(n) / static_cast<double>(scale));
        return Value(static_cast<int64_t>(rounded) * scale);
    }
    if (!v.is_float()) throw ScriptError("TypeError", "type " + v.type_name() + " doesn't define __round__ method");

    double x = v.as_float();
    if (!has_digits) return Value(float_to_integer(round_half_even(x)));
    int64_t digits = to_integer(*digits_arg, "ndigits");
    if (!std::isfinite(x) || digits > 300) return Value(x);
    if (digits < -308) return Value(0.0 * x);
    double scale = std::pow(10.0, static_cast<double>(digits));
    double scaled = x * scale;
    if (!std::isfinite(scaled)) return Value(x);
    return Value(round_half_even(scaled) / scale);
}

Value builtin_any(CallArgs& args) {
    check_no_keywords(args, "any");
    check_arity(args, "any", 1, 1);
    bool found = false;
    for_each_item(positional(args, 0), [&](const Value& item) {
        found = truthy(item);
        return !found;
    });
    return Value(found);
}

Value builtin_all(CallArgs& args) {
    check_no_keywords(args, "all");
    check_arity(args, "all", 1, 1);
    bool result = true;
    for_each_item(positional(args, 0), [&](const Value& item) {
        result = truthy(item);
        return result;
    });
    return Value(result);
}

Value builtin_isinstance(CallArgs& args) {
    check_no_keywords(args, "isinstance");
    check_arity(args, "isinstance", 2, 2);
    return Value(isinstance_of(positional(args, 0), positional(args, 1)));
}

Value builtin_map(CallArgs& args) {
    check_no_keywords(args, "map");
    if (args.positional.size() < 2) throw ScriptError("TypeError", "map() must have at least two arguments.");
    std::vector<std::vector<Value>> sources;
    for (size_t i = 1; i < args.positional.size(); ++i) sources.push_back(collect_items(args.positional[i]));
    size_t shortest = sources.front().size();
    for (const auto& source : sources) shortest = std::min(shortest, source.size());

    std::vector<Value> out;
    out.reserve(shortest);
    for (size_t i = 0; i < shortest; ++i) {
        CallArgs call;
        for (const auto& source : sources) call.positional.push_back(source[i]);
        out.push_back(call_value(positional(args, 0), call));
    }
    return Value::list(std::move(out));
}

Value builtin_filter(CallArgs& args) {
    check_no_keywords(args, "filter");
    check_arity(args, "filter", 2, 2);
    const Value& predicate = positional(args, 0);
    std::vector<Value> out;
    for_each_item(positional(args, 1), [&](const Value& item) {
        bool keep;
        if (predicate.is_none()) {
            keep = truthy(item);
        } else {
            CallArgs call;
            call.positional.push_back(item);
            keep = truthy(call_value(predicate, call));
        }
        if (keep) out.push_back(item);
        return true;
    });
    return Value::list(std::move(out));
}

Value builtin_repr(CallArgs& args) {
    check_no_keywords(args, "repr");
    check_arity(args, "repr", 1, 1);
    return Value(repr(positional(args, 0)));
}

Value builtin_chr(CallArgs& args) {
    check_no_keywords(args, "chr");
    check_arity(args, "chr", 1, 1);
    int64_t code = to_integer(positional(args, 0), "chr() argument");
    if (code < 0 || code > 0x10FFFF) throw ScriptError("ValueError", "chr() arg not in range(0x110000)");
    return Value(encode_code_point(static_cast<uint32_t>(code)));
}

Value builtin_ord(CallArgs& args) {
    check_no_keywords(args, "ord");
    check_arity(args, "ord", 1, 1);
    const Value& v = positional(args, 0);
    if (v.is_bytes()) {
        if (v.as_bytes().size() != 1) {
            throw ScriptError("TypeError", "ord() expected a character, but string of length " +
                                           std::to_string(v.as_bytes().size()) + " found");
        }
        return Value(static_cast<int64_t>(static_cast<unsigned char>(v.as_bytes()[0])));
    }
    if (!v.is_str()) throw ScriptError("TypeError", "ord() expected string of length 1, but " + v.type_name() + " found");
    auto chars = utf8_chars(v.as_str());
    if (chars.size() != 1) {
        throw ScriptError("TypeError", "ord() expected a character, but string of length " +
                                       std::to_string(chars.size()) + " found");
    }
    const std::string& ch = chars[0];
    uint32_t cp = static_cast<unsigned char>(ch[0]);
    if (ch.size() == 2) cp = ((cp & 0x1F) << 6) | (ch[1] & 0x3F);
    else if (ch.size() == 3) cp = ((cp & 0x0F) << 12) | ((ch[1] & 0x3F) << 6) | (ch[2] & 0x3F);
    else if (ch.size() == 4) cp = ((cp & 0x07) << 18) | ((ch[1] & 0x3F) << 12) | ((ch[2] & 0x3F) << 6) | (ch[3] & 0x3F);
    return Value(static_cast<int64_t>(cp));
}

Value builtin_divmod(CallArgs& args) {
    check_no_keywords(args, "divmod");
    check_arity(args, "divmod", 2, 2);
    return Value::tuple({binary_op(ast::BinaryOperator::FLOOR_DIV, positional(args, 0), positional(args, 1)),
                         binary_op(ast::BinaryOperator::MOD, positional(args, 0), positional(args, 1))});
}

Value builtin_pow(CallArgs& args) {
    check_no_keywords(args, "pow");
    check_arity(args, "pow", 2, 3);
    Value result = binary_op(ast::BinaryOperator::POW, positional(args, 0), positional(args, 1));
    if (args.positional.size() == 3) {
        result = binary_op(ast::BinaryOperator::MOD, result, positional(args, 2));
    }
    return result;
}

Value builtin_hex(CallArgs& args) {
    check_no_keywords(args, "hex");
    check_arity(args, "hex", 1, 1);
    return Value(format_value(Value(to_integer(positional(args, 0), "hex() argument")), "#x"));
}

} // namespace

Value sorted_items(CallArgs& args) {
    return builtin_sorted(args);
}

Value dict_from_args(CallArgs& args) {
    return builtin_dict(args);
}

void OutputBuffer::write(const std::string& text) {
    if (truncated_) return;
    if (text_.size() + text.size() > limit_) {
        text_ += text.substr(0, limit_ - text_.size());
        truncated_ = true;
        return;
    }
    text_ += text;
}

void for_each_item(const Value& iterable, const std::function<bool(const Value&)>& visit) {
    switch (iterable.type()) {
        case ValueType::STR:
            for (const auto& ch : utf8_chars(iterable.as_str())) {
                if (!visit(Value(ch))) return;
            }
            return;
        case ValueType::BYTES:
            for (unsigned char byte : iterable.as_bytes()) {
                if (!visit(Value(static_cast<int64_t>(byte)))) return;
            }
            return;
        case ValueType::LIST: {
            // Index-based so that appends made by the loop body are visited
            const List& list = iterable.as_list();
            for (size_t i = 0; i < list.items.size(); ++i) {
                Value item = list.items[i];
                if (!visit(item)) return;
            }
            return;
        }
        case ValueType::TUPLE:
            for (const auto& item : iterable.as_tuple().items) {
                if (!visit(item)) return;
            }
            return;
        case ValueType::RANGE: {
            const Range& range = iterable.as_range();
            int64_t n = range.length();
            for (int64_t i = 0; i < n; ++i) {
                if (!visit(Value(range.at(i)))) return;
            }
            return;
        }
        case ValueType::DICT: {
            const Dict& dict = iterable.as_dict();
            size_t expected = dict.size();
            for (size_t i = 0; i < dict.entries().size(); ++i) {
                Value key = dict.entries()[i].first;
                if (!visit(key)) return;
                if (dict.size() != expected) {
                    throw ScriptError("RuntimeError", "dictionary changed size during iteration");
                }
            }
            return;
        }
        default:
            throw ScriptError("TypeError", "'" + iterable.type_name() + "' object is not iterable");
    }
}

std::vector<Value> collect_items(const Value& iterable) {
    if (iterable.is_list()) return iterable.as_list().items;
    if (iterable.is_tuple()) return iterable.as_tuple().items;
    std::vector<Value> items;
    for_each_item(iterable, [&](const Value& item) {
        items.push_back(item);
        return true;
    });
    return items;
}

Value call_value(const Value& callee, CallArgs& args) {
    if (!callee.is_callable()) {
        throw ScriptError("TypeError", "'" + callee.type_name() + "' object is not callable");
    }
    return callee.as_callable().fn(args);
}

void check_arity(const CallArgs& args, const std::string& name, size_t min, size_t max) {
    size_t n = args.positional.size();
    if (n >= min && n <= max) return;
    if (min == max) {
        throw ScriptError("TypeError", name + "() takes exactly " + std::to_string(min) + " argument" +
                                       (min == 1 ? "" : "s") + " (" + std::to_string(n) + " given)");
    }
    if (n < min) {
        throw ScriptError("TypeError", name + "() expected at least " + std::to_string(min) + " argument" +
                                       (min == 1 ? "" : "s") + ", got " + std::to_string(n));
    }
    throw ScriptError("TypeError", name + "() expected at most " + std::to_string(max) + " argument" +
                                   (max == 1 ? "" : "s") + ", got " + std::to_string(n));
}

void check_no_keywords(const CallArgs& args, const std::string& name) {
    if (!args.keywords.empty()) throw ScriptError("TypeError", name + "() takes no keyword arguments");
}

void check_keywords(const CallArgs& args, const std::string& name, const std::vector<std::string>& allowed) {
    for (const auto& keyword : args.keywords) {
        if (std::find(allowed.begin(), allowed.end(), keyword.first) == allowed.end()) {
            throw ScriptError("TypeError", name + "() got an unexpected keyword argument '" + keyword.first + "'");
        }
    }
}

bool is_exception_type_name(const std::string& name) {
    return EXCEPTION_PARENTS.count(name) > 0;
}

bool exception_matches(const std::string& raised_type, const std::string& handler_type) {
    std::string current = raised_type;
    while (!current.empty()) {
        if (current == handler_type) return true;
        auto it = EXCEPTION_PARENTS.find(current);
        // Client-raised types outside the table derive from Exception
        current = it == EXCEPTION_PARENTS.end() ? "Exception" : it->second;
    }
    return false;
}

bool isinstance_of(const Value& value, const Value& type) {
    if (type.is_tuple()) {
        for (const auto& item : type.as_tuple().items) {
            if (isinstance_of(value, item)) return true;
        }
        return false;
    }
    if (!type.is_callable() || (!type.as_callable().is_type && !type.as_callable().is_exception_type)) {
        throw ScriptError("TypeError", "isinstance() arg 2 must be a type, a tuple of types, or a union");
    }
    const Callable& cls = type.as_callable();
    if (cls.is_exception_type) {
        return value.is_exception() && exception_matches(value.as_opaque().type_name, cls.name);
    }
    if (cls.name == "int") return value.is_int() || value.is_bool();
    if (cls.name == "bool") return value.is_bool();
    if (cls.name == "float") return value.is_float();
    if (cls.name == "str") return value.is_str();
    if (cls.name == "bytes") return value.is_bytes();
    if (cls.name == "list") return value.is_list();
    if (cls.name == "tuple") return value.is_tuple();
    if (cls.name == "dict") return value.is_dict();
    if (cls.name == "range") return value.is_range();
    return false;
}

std::string encode_code_point(uint32_t cp) {
    std::string out;
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return out;
}

int64_t parse_integer(const std::string& raw, int base) {
    auto invalid = [&]() -> ScriptError {
        return ScriptError("ValueError", "invalid literal for int() with base " + std::to_string(base) +
                                         ": " + repr(Value(raw)));
    };

    std::string text = strip_whitespace(raw);
    bool negative = false;
    size_t i = 0;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
        negative = text[i] == '-';
        ++i;
    }
    auto has_prefix = [&](char lower) {
        return i + 1 < text.size() && text[i] == '0' && std::tolower(static_cast<unsigned char>(text[i + 1])) == lower;
    };
    int effective = base;
    if (base == 0 || base == 16 || base == 8 || base == 2) {
        if (has_prefix('x') && (base == 0 || base == 16)) { effective = 16; i += 2; }
        else if (has_prefix('o') && (base == 0 || base == 8)) { effective = 8; i += 2; }
        else if (has_prefix('b') && (base == 0 || base == 2)) { effective = 2; i += 2; }
        else if (base == 0) effective = 10;
    }

    if (i >= text.size()) throw invalid();
    uint64_t magnitude = 0;
    bool last_underscore = true;
    for (; i < text.size(); ++i) {
        char c = text[i];
        if (c == '_') {
            if (last_underscore) throw invalid();
            last_underscore = true;
            continue;
        }
        int digit;
        if (c >= '0' && c <= '9') digit = c - '0';
        else if (std::isalpha(static_cast<unsigned char>(c))) digit = std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
        else throw invalid();
        if (digit >= effective) throw invalid();
        if (magnitude > (std::numeric_limits<uint64_t>::max() - static_cast<uint64_t>(digit)) / static_cast<uint64_t>(effective)) {
            throw ScriptError("OverflowError", "int too large to convert");
        }
        magnitude = magnitude * static_cast<uint64_t>(effective) + static_cast<uint64_t>(digit);
        last_underscore = false;
    }
    if (last_underscore) throw invalid();

    const uint64_t limit = negative ? static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1
                                    : static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    if (magnitude > limit) throw ScriptError("OverflowError", "int too large to convert");
    if (negative) return magnitude == limit ? std::numeric_limits<int64_t>::min() : -static_cast<int64_t>(magnitude);
    return static_cast<int64_t>(magnitude);
}

std::map<std::string, Value> make_builtins(std::shared_ptr<OutputBuffer> output) {
    std::map<std::string, Value> table;

    table["len"] = Value::callable("len", builtin_len);
    table["str"] = Value::type_object("str", builtin_str);
    table["int"] = Value::type_object("int", builtin_int);
    table["float"] = Value::type_object("float", builtin_float);
    table["bool"] = Value::type_object("bool", builtin_bool);
    table["list"] = Value::type_object("list", builtin_list);
    table["dict"] = Value::type_object("dict", builtin_dict);
    table["tuple"] = Value::type_object("tuple", builtin_tuple);
    table["range"] = Value::type_object("range", builtin_range);
    table["enumerate"] = Value::callable("enumerate", builtin_enumerate);
    table["zip"] = Value::callable("zip", builtin_zip);
    table["sorted"] = Value::callable("sorted", builtin_sorted);
    table["reversed"] = Value::callable("reversed", builtin_reversed);
    table["min"] = Value::callable("min", [](CallArgs& args) { return extreme(args, "min", false); });
    table["max"] = Value::callable("max", [](CallArgs& args) { return extreme(args, "max", true); });
    table["sum"] = Value::callable("sum", builtin_sum);
    table["abs"] = Value::callable("abs", builtin_abs);
    table["round"] = Value::callable("round", builtin_round);
    table["any"] = Value::callable("any", builtin_any);
    table["all"] = Value::callable("all", builtin_all);
    table["isinstance"] = Value::callable("isinstance", builtin_isinstance);
    table["map"] = Value::callable("map", builtin_map);
    table["filter"] = Value::callable("filter", builtin_filter);
    table["repr"] = Value::callable("repr", builtin_repr);
    table["chr"] = Value::callable("chr", builtin_chr);
    table["ord"] = Value::callable("ord", builtin_ord);
    table["divmod"] = Value::callable("divmod", builtin_divmod);
    table["pow"] = Value::callable("pow", builtin_pow);
    table["hex"] = Value::callable("hex", builtin_hex);

    table["print"] = Value::callable("print", [output](CallArgs& args) -> Value {
        check_keywords(args, "print", {"sep", "end", "flush"});
        const Value* sep_arg = args.keyword("sep");
        const Value* end_arg = args.keyword("end");
        std::string sep = (sep_arg && !sep_arg->is_none()) ? to_display(*sep_arg) : " ";
        std::string end = (end_arg && !end_arg->is_none()) ? to_display(*end_arg) : "\n";
        std::string line;
        for (size_t i = 0; i < args.positional.size(); ++i) {
            if (i > 0) line += sep;
            line += to_display(args.positional[i]);
        }
        output->write(line + end);
        return Value();
    });

    for (const auto& entry : EXCEPTION_PARENTS) {
        table[entry.first] = Value::exception_type(entry.first);
    }
    return table;
}

} // namespace codegate
