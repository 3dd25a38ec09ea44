#include "operators.h"
#include "codegate/errors.h"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <limits>

namespace codegate {

using ast::BinaryOperator;
using ast::CompareOperator;
using ast::UnaryOperator;

namespace {

constexpr size_t MAX_REPEAT_BYTES = 256 * 1024 * 1024;

bool is_integral(const Value& v) {
    return v.is_int() || v.is_bool();
}

int64_t integral(const Value& v) {
    return v.is_bool() ? (v.as_bool() ? 1 : 0) : v.as_int();
}

[[noreturn]] void overflow() {
    throw ScriptError("OverflowError", "integer overflow");
}

[[noreturn]] void unsupported(BinaryOperator op, const Value& left, const Value& right) {
    throw ScriptError("TypeError", std::string("unsupported operand type(s) for ") +
                                   ast::binary_operator_symbol(op) + ": '" + left.type_name() +
                                   "' and '" + right.type_name() + "'");
}

int64_t checked_add(int64_t a, int64_t b) {
    int64_t r;
    if (__builtin_add_overflow(a, b, &r)) overflow();
    return r;
}

int64_t checked_sub(int64_t a, int64_t b) {
    int64_t r;
    if (__builtin_sub_overflow(a, b, &r)) overflow();
    return r;
}

int64_t checked_mul(int64_t a, int64_t b) {
    int64_t r;
    if (__builtin_mul_overflow(a, b, &r)) overflow();
    return r;
}

int64_t floor_div(int64_t a, int64_t b) {
    if (b == 0) throw ScriptError("ZeroDivisionError", "integer division or modulo by zero");
    if (a == std::numeric_limits<int64_t>::min() && b == -1) overflow();
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

int64_t floor_mod(int64_t a, int64_t b) {
    if (b == 0) throw ScriptError("ZeroDivisionError", "integer division or modulo by zero");
    if (b == -1) return 0;
    int64_t r = a % b;
    if (r != 0 && ((r < 0) != (b < 0))) r += b;
    return r;
}

double float_mod(double a, double b) {
    if (b == 0.0) throw ScriptError("ZeroDivisionError", "float modulo");
    double r = std::fmod(a, b);
    if (r != 0.0) {
        if ((r < 0) != (b < 0)) r += b;
    } else {
        r = std::copysign(0.0, b);
    }
    return r;
}

Value integer_power(int64_t base, int64_t exponent) {
    if (exponent < 0) {
        if (base == 0) throw ScriptError("ZeroDivisionError", "0.0 cannot be raised to a negative power");
        return Value(std::pow(static_cast<double>(base), static_cast<double>(exponent)));
    }
    int64_t result = 1;
    while (exponent > 0) {
        if (exponent & 1) result = checked_mul(result, base);
        exponent >>= 1;
        if (exponent > 0) base = checked_mul(base, base);
    }
    return Value(result);
}

Value float_power(double base, double exponent) {
    if (base == 0.0 && exponent < 0) {
        throw ScriptError("ZeroDivisionError", "0.0 cannot be raised to a negative power");
    }
    if (base < 0 && std::floor(exponent) != exponent) {
        throw ScriptError("ValueError", "complex results are not supported");
    }
    double r = std::pow(base, exponent);
    if (std::isinf(r) && std::isfinite(base) && std::isfinite(exponent)) {
        throw ScriptError("OverflowError", "numerical result out of range");
    }
    return Value(r);
}

template <typename Sequence>
Sequence repeat(const Sequence& items, int64_t count, size_t unit_bytes) {
    Sequence out;
    if (count <= 0 || items.empty()) return out;
    if (static_cast<double>(items.size()) * unit_bytes * static_cast<double>(count) > MAX_REPEAT_BYTES) {
        throw ScriptError("MemoryError", "repeated sequence is too large");
    }
    out.reserve(items.size() * static_cast<size_t>(count));
    for (int64_t i = 0; i < count; ++i) out.insert(out.end(), items.begin(), items.end());
    return out;
}

Value multiply_sequence(const Value& sequence, int64_t count) {
    switch (sequence.type()) {
        case ValueType::STR:
            return Value(repeat(sequence.as_str(), count, 1));
        case ValueType::BYTES:
            return Value::bytes(repeat(sequence.as_bytes(), count, 1));
        case ValueType::LIST:
            return Value::list(repeat(sequence.as_list().items, count, sizeof(Value)));
        case ValueType::TUPLE:
            return Value::tuple(repeat(sequence.as_tuple().items, count, sizeof(Value)));
        default:
            return Value();
    }
}

bool is_sequence(const Value& v) {
    return v.is_str() || v.is_bytes() || v.is_list() || v.is_tuple();
}

Value arithmetic(BinaryOperator op, const Value& left, const Value& right) {
    if (is_integral(left) && is_integral(right)) {
        int64_t a = integral(left);
        int64_t b = integral(right);
        switch (op) {
            case BinaryOperator::ADD: return Value(checked_add(a, b));
            case BinaryOperator::SUB: return Value(checked_sub(a, b));
            case BinaryOperator::MULT: return Value(checked_mul(a, b));
            case BinaryOperator::DIV:
                if (b == 0) throw ScriptError("ZeroDivisionError", "division by zero");
                return Value(static_cast<double>(a) / static_cast<double>(b));
            case BinaryOperator::FLOOR_DIV: return Value(floor_div(a, b));
            case BinaryOperator::MOD: return Value(floor_mod(a, b));
            case BinaryOperator::POW: return integer_power(a, b);
            case BinaryOperator::LSHIFT:
                if (b < 0) throw ScriptError("ValueError", "negative shift count");
                if (a == 0) return Value(0);
                if (b >= 63) overflow();
                if ((a > 0 && a > (std::numeric_limits<int64_t>::max() >> b)) ||
                    (a < 0 && a < (std::numeric_limits<int64_t>::min() >> b))) {
                    overflow();
                }
                return Value(static_cast<int64_t>(static_cast<uint64_t>(a) << b));
            case BinaryOperator::RSHIFT:
                if (b < 0) throw ScriptError("ValueError", "negative shift count");
                return Value(b >= 63 ? (a < 0 ? -1 : 0) : (a >> b));
            case BinaryOperator::BIT_AND:
                if (left.is_bool() && right.is_bool()) return Value(left.as_bool() && right.as_bool());
                return Value(a & b);
            case BinaryOperator::BIT_OR:
                if (left.is_bool() && right.is_bool()) return Value(left.as_bool() || right.as_bool());
                return Value(a | b);
            case BinaryOperator::BIT_XOR:
                if (left.is_bool() && right.is_bool()) return Value(left.as_bool() != right.as_bool());
                return Value(a ^ b);
            case BinaryOperator::MAT_MULT:
                break;
        }
        unsupported(op, left, right);
    }

    double a = left.as_number();
    double b = right.as_number();
    switch (op) {
        case BinaryOperator::ADD: return Value(a + b);
        case BinaryOperator::SUB: return Value(a - b);
        case BinaryOperator::MULT: return Value(a * b);
        case BinaryOperator::DIV:
            if (b == 0.0) throw ScriptError("ZeroDivisionError", "float division by zero");
            return Value(a / b);
        case BinaryOperator::FLOOR_DIV:
            if (b == 0.0) throw ScriptError("ZeroDivisionError", "float floor division by zero");
            return Value(std::floor(a / b));
        case BinaryOperator::MOD: return Value(float_mod(a, b));
        case BinaryOperator::POW: return float_power(a, b);
        default:
            unsupported(op, left, right);
    }
}

// ---------------------------------------------------------------------------
// Format specification mini-language
// ---------------------------------------------------------------------------

struct FormatSpec {
    std::string fill = " ";
    char align = 0;
    char sign = 0;
    bool alternate = false;
    bool zero = false;
    int width = -1;
    char grouping = 0;
    int precision = -1;
    char type = 0;
};

FormatSpec parse_spec(const std::string& text) {
    FormatSpec spec;
    size_t i = 0;
    auto is_align = [](char c) { return c == '<' || c == '>' || c == '=' || c == '^'; };

    // The fill may be a multi-byte character
    size_t first_len = 1;
    if (!text.empty()) {
        unsigned char lead = static_cast<unsigned char>(text[0]);
        if (lead >= 0xF0) first_len = 4;
        else if (lead >= 0xE0) first_len = 3;
        else if (lead >= 0xC0) first_len = 2;
    }
    if (text.size() > first_len && is_align(text[first_len])) {
        spec.fill = text.substr(0, first_len);
        spec.align = text[first_len];
        i = first_len + 1;
    } else if (!text.empty() && is_align(text[0])) {
        spec.align = text[0];
        i = 1;
    }
    if (i < text.size() && (text[i] == '+' || text[i] == '-' || text[i] == ' ')) spec.sign = text[i++];
    if (i < text.size() && text[i] == '#') {
        spec.alternate = true;
        ++i;
    }
    if (i < text.size() && text[i] == '0') {
        spec.zero = true;
        ++i;
    }
    if (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
        spec.width = 0;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
            spec.width = spec.width * 10 + (text[i++] - '0');
            if (spec.width > 100000) throw ScriptError("ValueError", "Too many decimal digits in format string");
        }
    }
    if (i < text.size() && (text[i] == ',' || text[i] == '_')) spec.grouping = text[i++];
    if (i < text.size() && text[i] == '.') {
        ++i;
        if (i >= text.size() || !std::isdigit(static_cast<unsigned char>(text[i]))) {
            throw ScriptError("ValueError", "Format specifier missing precision");
        }
        spec.precision = 0;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
            spec.precision = spec.precision * 10 + (text[i++] - '0');
            if (spec.precision > 1000) throw ScriptError("ValueError", "precision too big");
        }
    }
    if (i < text.size()) spec.type = text[i++];
    if (i != text.size()) throw ScriptError("ValueError", "Invalid format specifier '" + text + "'");
    return spec;
}

std::string group_digits(const std::string& digits, char separator, size_t group) {
    std::string out;
    size_t count = 0;
    for (size_t i = digits.size(); i > 0; --i) {
        out.insert(out.begin(), digits[i - 1]);
        if (++count % group == 0 && i > 1) out.insert(out.begin(), separator);
    }
    return out;
}

std::string pad(const std::string& sign, const std::string& body, const FormatSpec& spec, char default_align) {
    char align = spec.align ? spec.align : default_align;
    std::string fill = spec.fill;
    if (spec.zero && !spec.align) {
        fill = "0";
        align = '=';
    }
    size_t length = utf8_length(sign) + utf8_length(body);
    if (spec.width < 0 || length >= static_cast<size_t>(spec.width)) return sign + body;

    size_t missing = static_cast<size_t>(spec.width) - length;
    auto fill_n = [&](size_t n) {
        std::string out;
        for (size_t i = 0; i < n; ++i) out += fill;
        return out;
    };
    switch (align) {
        case '<': return sign + body + fill_n(missing);
        case '^': return fill_n(missing / 2) + sign + body + fill_n(missing - missing / 2);
        case '=': return sign + fill_n(missing) + body;
        default: return fill_n(missing) + sign + body;
    }
}

std::string sign_prefix(bool negative, char sign) {
    if (negative) return "-";
    if (sign == '+') return "+";
    if (sign == ' ') return " ";
    return "";
}

std::string format_integer(int64_t value, const FormatSpec& spec) {
    bool negative = value < 0;
    uint64_t magnitude = negative ? (~static_cast<uint64_t>(value) + 1) : static_cast<uint64_t>(value);
    std::string digits;
    std::string prefix;
    size_t group = 3;

    switch (spec.type) {
        case 0:
        case 'd':
        case 'n':
            digits = std::to_string(magnitude);
            break;
        case 'x':
        case 'X': {
            char buf[32];
            snprintf(buf, sizeof(buf), spec.type == 'x' ? "%llx" : "%llX", static_cast<unsigned long long>(magnitude));
            digits = buf;
            if (spec.alternate) prefix = spec.type == 'x' ? "0x" : "0X";
            group = 4;
            break;
        }
        case 'o': {
            char buf[32];
            snprintf(buf, sizeof(buf), "%llo", static_cast<unsigned long long>(magnitude));
            digits = buf;
            if (spec.alternate) prefix = "0o";
            group = 4;
            break;
        }
        case 'b':
            if (magnitude == 0) digits = "0";
            while (magnitude > 0) {
                digits.insert(digits.begin(), static_cast<char>('0' + (magnitude & 1)));
                magnitude >>= 1;
            }
            if (spec.alternate) prefix = "0b";
            group = 4;
            break;
        default:
            throw ScriptError("ValueError", std::string("Unknown format code '") + spec.type +
                                            "' for object of type 'int'");
    }
    if (spec.grouping) digits = group_digits(digits, spec.grouping, group);
    return pad(sign_prefix(negative, spec.sign) + prefix, digits, spec, '>');
}

std::string format_double(double value, const FormatSpec& spec) {
    bool negative = std::signbit(value) && !std::isnan(value);
    double magnitude = std::fabs(value);
    std::string body;
    char type = spec.type;
    bool percent = type == '%';

    if (std::isnan(value) || std::isinf(value)) {
        body = std::isnan(value) ? "nan" : "inf";
        if (type == 'F' || type == 'E' || type == 'G') body = std::isnan(value) ? "NAN" : "INF";
        if (percent) body += "%";
    } else if (type == 0 && spec.precision < 0) {
        body = format_float(magnitude);
    } else {
        char buf[1200];
        int precision = spec.precision < 0 ? 6 : spec.precision;
        switch (type) {
            case 'f':
            case 'F':
                snprintf(buf, sizeof(buf), spec.alternate ? "%#.*f" : "%.*f", precision, magnitude);
                break;
            case '%':
                snprintf(buf, sizeof(buf), "%.*f", precision, magnitude * 100.0);
                break;
            case 'e':
            case 'E':
                snprintf(buf, sizeof(buf), type == 'e' ? "%.*e" : "%.*E", precision, magnitude);
                break;
            case 'g':
            case 'G':
            case 0:
                if (precision == 0) precision = 1;
                snprintf(buf, sizeof(buf), type == 'G' ? "%.*G" : "%.*g", precision, magnitude);
                break;
            default:
                throw ScriptError("ValueError", std::string("Unknown format code '") + type +
                                                "' for object of type 'float'");
        }
        body = buf;
        if (type == 0 && body.find_first_of(".eEn") == std::string::npos) body += ".0";
        if (percent) body += "%";
    }

    if (spec.grouping && std::isfinite(value)) {
        size_t end = body.find_first_of(".eE%");
        std::string integer_part = body.substr(0, end);
        std::string rest = end == std::string::npos ? "" : body.substr(end);
        body = group_digits(integer_part, spec.grouping, 3) + rest;
    }
    return pad(sign_prefix(negative, spec.sign), body, spec, '>');
}

std::string format_text(const std::string& text, const FormatSpec& spec) {
    if (spec.type != 0 && spec.type != 's') {
        throw ScriptError("ValueError", std::string("Unknown format code '") + spec.type +
                                        "' for object of type 'str'");
    }
    if (spec.sign) throw ScriptError("ValueError", "Sign not allowed in string format specifier");
    if (spec.align == '=') throw ScriptError("ValueError", "'=' alignment not allowed in string format specifier");
    std::string body = text;
    if (spec.precision >= 0) {
        auto chars = utf8_chars(text);
        if (chars.size() > static_cast<size_t>(spec.precision)) {
            body.clear();
            for (int i = 0; i < spec.precision; ++i) body += chars[i];
        }
    }
    FormatSpec text_spec = spec;
    text_spec.zero = false;
    return pad("", body, text_spec, '<');
}

} // namespace

int64_t to_integer(const Value& value, const char* context) {
    if (is_integral(value)) return integral(value);
    throw ScriptError("TypeError", std::string(context) + " must be an integer, not '" + value.type_name() + "'");
}

Value binary_op(BinaryOperator op, const Value& left, const Value& right) {
    if (left.is_number() && right.is_number()) return arithmetic(op, left, right);

    switch (op) {
        case BinaryOperator::ADD:
            if (left.type() == right.type()) {
                switch (left.type()) {
                    case ValueType::STR: return Value(left.as_str() + right.as_str());
                    case ValueType::BYTES: return Value::bytes(left.as_bytes() + right.as_bytes());
                    case ValueType::LIST: {
                        std::vector<Value> items = left.as_list().items;
                        const auto& extra = right.as_list().items;
                        items.insert(items.end(), extra.begin(), extra.end());
                        return Value::list(std::move(items));
                    }
                    case ValueType::TUPLE: {
                        std::vector<Value> items = left.as_tuple().items;
                        const auto& extra = right.as_tuple().items;
                        items.insert(items.end(), extra.begin(), extra.end());
                        return Value::tuple(std::move(items));
                    }
                    default:
                        break;
                }
            }
            break;
        case BinaryOperator::MULT:
            if (is_sequence(left) && is_integral(right)) return multiply_sequence(left, integral(right));
            if (is_integral(left) && is_sequence(right)) return multiply_sequence(right, integral(left));
            break;
        case BinaryOperator::MOD:
            if (left.is_str()) return Value(percent_format(left.as_str(), right));
            break;
        case BinaryOperator::BIT_OR:
            if (left.is_dict() && right.is_dict()) {
                Value merged = Value::dict();
                for (const auto& [k, v] : left.as_dict().entries()) merged.as_dict().set(k, v);
                for (const auto& [k, v] : right.as_dict().entries()) merged.as_dict().set(k, v);
                return merged;
            }
            break;
        default:
            break;
    }
    unsupported(op, left, right);
}

Value unary_op(UnaryOperator op, const Value& operand) {
    switch (op) {
        case UnaryOperator::NOT:
            return Value(!truthy(operand));
        case UnaryOperator::NEGATE:
            if (is_integral(operand)) {
                int64_t v = integral(operand);
                if (v == std::numeric_limits<int64_t>::min()) overflow();
                return Value(-v);
            }
            if (operand.is_float()) return Value(-operand.as_float());
            throw ScriptError("TypeError", "bad operand type for unary -: '" + operand.type_name() + "'");
        case UnaryOperator::PLUS:
            if (is_integral(operand)) return Value(integral(operand));
            if (operand.is_float()) return operand;
            throw ScriptError("TypeError", "bad operand type for unary +: '" + operand.type_name() + "'");
        case UnaryOperator::INVERT:
            if (is_integral(operand)) return Value(~integral(operand));
            throw ScriptError("TypeError", "bad operand type for unary ~: '" + operand.type_name() + "'");
    }
    return Value();
}

bool compare_op(CompareOperator op, const Value& left, const Value& right) {
    switch (op) {
        case CompareOperator::EQ: return values_equal(left, right);
        case CompareOperator::NOT_EQ: return !values_equal(left, right);
        case CompareOperator::IS: return left.same_object(right);
        case CompareOperator::IS_NOT: return !left.same_object(right);
        case CompareOperator::IN: return contains_value(right, left);
        case CompareOperator::NOT_IN: return !contains_value(right, left);
        default:
            break;
    }

    // NaN compares false with everything
    if (left.is_number() && right.is_number() && (left.is_float() || right.is_float())) {
        double a = left.as_number();
        double b = right.as_number();
        switch (op) {
            case CompareOperator::LT: return a < b;
            case CompareOperator::LT_E: return a <= b;
            case CompareOperator::GT: return a > b;
            case CompareOperator::GT_E: return a >= b;
            default: return false;
        }
    }

    int c;
    try {
        c = compare_values(left, right);
    } catch (const ScriptError& e) {
        const char* symbol = op == CompareOperator::LT ? "<" : op == CompareOperator::LT_E ? "<=" :
                             op == CompareOperator::GT ? ">" : ">=";
        if (e.type() != "TypeError") throw;
        throw ScriptError("TypeError", std::string("'") + symbol + "' not supported between instances of '" +
                                       left.type_name() + "' and '" + right.type_name() + "'");
    }
    switch (op) {
        case CompareOperator::LT: return c < 0;
        case CompareOperator::LT_E: return c <= 0;
        case CompareOperator::GT: return c > 0;
        case CompareOperator::GT_E: return c >= 0;
        default: return false;
    }
}

bool contains_value(const Value& container, const Value& item) {
    switch (container.type()) {
        case ValueType::STR:
            if (!item.is_str()) {
                throw ScriptError("TypeError", "'in <string>' requires string as left operand, not " + item.type_name());
            }
            return container.as_str().find(item.as_str()) != std::string::npos;
        case ValueType::BYTES:
            if (is_integral(item)) {
                int64_t byte = integral(item);
                return byte >= 0 && byte < 256 &&
                       container.as_bytes().find(static_cast<char>(byte)) != std::string::npos;
            }
            if (!item.is_bytes()) {
                throw ScriptError("TypeError", "a bytes-like object is required, not '" + item.type_name() + "'");
            }
            return container.as_bytes().find(item.as_bytes()) != std::string::npos;
        case ValueType::LIST:
            for (const auto& element : container.as_list().items) {
                if (element.same_object(item) || values_equal(element, item)) return true;
            }
            return false;
        case ValueType::TUPLE:
            for (const auto& element : container.as_tuple().items) {
                if (element.same_object(item) || values_equal(element, item)) return true;
            }
            return false;
        case ValueType::DICT:
            return container.as_dict().contains(item);
        case ValueType::RANGE: {
            if (!is_integral(item) && !(item.is_float() && std::floor(item.as_float()) == item.as_float())) {
                return false;
            }
            int64_t v = item.is_float() ? static_cast<int64_t>(item.as_float()) : integral(item);
            const Range& r = container.as_range();
            if (r.step > 0 ? (v < r.start || v >= r.stop) : (v > r.start || v <= r.stop)) return false;
            return (v - r.start) % r.step == 0;
        }
        default:
            throw ScriptError("TypeError", "argument of type '" + container.type_name() + "' is not iterable");
    }
}

std::string format_value(const Value& value, const std::string& spec_text) {
    if (spec_text.empty()) return to_display(value);
    FormatSpec spec = parse_spec(spec_text);

    if (value.is_bool() && spec.type == 0) return format_text(value.as_bool() ? "True" : "False", spec);
    if (is_integral(value)) {
        char t = spec.type;
        if (t == 'e' || t == 'E' || t == 'f' || t == 'F' || t == 'g' || t == 'G' || t == '%') {
            return format_double(static_cast<double>(integral(value)), spec);
        }
        if (t == 'c') {
            int64_t code = integral(value);
            if (code < 0 || code > 0x10FFFF) throw ScriptError("OverflowError", "%c arg not in range(0x110000)");
            std::string text;
            uint32_t cp = static_cast<uint32_t>(code);
            if (cp < 0x80) {
                text += static_cast<char>(cp);
            } else if (cp < 0x800) {
                text += static_cast<char>(0xC0 | (cp >> 6));
                text += static_cast<char>(0x80 | (cp & 0x3F));
            } else if (cp < 0x10000) {
                text += static_cast<char>(0xE0 | (cp >> 12));
                text += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                text += static_cast<char>(0x80 | (cp & 0x3F));
            } else {
                text += static_cast<char>(0xF0 | (cp >> 18));
                text += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
                text += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                text += static_cast<char>(0x80 | (cp & 0x3F));
            }
            FormatSpec text_spec = spec;
            text_spec.type = 0;
            return format_text(text, text_spec);
        }
        return format_integer(integral(value), spec);
    }
    if (value.is_float()) return format_double(value.as_float(), spec);
    if (value.is_str()) return format_text(value.as_str(), spec);
    if (value.is_opaque() && (spec.type == 0 || spec.type == 's')) {
        return format_text(value.as_opaque().text, spec);
    }
    throw ScriptError("TypeError", "unsupported format string passed to " + value.type_name() + ".__format__");
}

std::string percent_format(const std::string& format, const Value& args) {
    std::vector<Value> items;
    const Dict* mapping = nullptr;
    if (args.is_tuple()) {
        items = args.as_tuple().items;
    } else {
        items.push_back(args);
        if (args.is_dict()) mapping = &args.as_dict();
    }

    std::string out;
    size_t next = 0;
    bool used_mapping = false;
    size_t i = 0;
    while (i < format.size()) {
        char c = format[i];
        if (c != '%') {
            out += c;
            ++i;
            continue;
        }
        if (++i >= format.size()) throw ScriptError("ValueError", "incomplete format");

        const Value* mapped = nullptr;
        if (format[i] == '(') {
            size_t close = format.find(')', i);
            if (close == std::string::npos) throw ScriptError("ValueError", "incomplete format key");
            if (!mapping) throw ScriptError("TypeError", "format requires a mapping");
            Value key(format.substr(i + 1, close - i - 1));
            mapped = mapping->find(key);
            if (!mapped) throw ScriptError("KeyError", repr(key));
            used_mapping = true;
            i = close + 1;
        }

        FormatSpec spec;
        bool left = false;
        while (i < format.size() && std::string("-+ 0#").find(format[i]) != std::string::npos) {
            switch (format[i]) {
                case '-': left = true; break;
                case '+': spec.sign = '+'; break;
                case ' ': if (!spec.sign) spec.sign = ' '; break;
                case '0': spec.zero = true; break;
                case '#': spec.alternate = true; break;
            }
            ++i;
        }
        auto take_number = [&](int& target) {
            if (i < format.size() && format[i] == '*') {
                if (next >= items.size()) throw ScriptError("TypeError", "not enough arguments for format string");
                target = static_cast<int>(to_integer(items[next++], "* wants int"));
                ++i;
                return;
            }
            if (i < format.size() && std::isdigit(static_cast<unsigned char>(format[i]))) {
                target = 0;
                while (i < format.size() && std::isdigit(static_cast<unsigned char>(format[i]))) {
                    target = target * 10 + (format[i++] - '0');
                    if (target > 100000) throw ScriptError("ValueError", "width too big");
                }
            }
        };
        take_number(spec.width);
        if (i < format.size() && format[i] == '.') {
            ++i;
            spec.precision = 0;
            take_number(spec.precision);
        }
        if (i >= format.size()) throw ScriptError("ValueError", "incomplete format");
        char conversion = format[i++];
        if (conversion == '%') {
            out += '%';
            continue;
        }

        const Value* arg = mapped;
        if (!arg) {
            if (next >= items.size()) throw ScriptError("TypeError", "not enough arguments for format string");
            arg = &items[next++];
        }
        if (left) {
            spec.align = '<';
            spec.zero = false;
        }

        switch (conversion) {
            case 's':
            case 'r':
            case 'a': {
                std::string text = conversion == 's' ? to_display(*arg) : repr(*arg);
                spec.sign = 0;
                out += format_text(text, spec);
                break;
            }
            case 'd':
            case 'i':
            case 'u': {
                if (!arg->is_number()) {
                    throw ScriptError("TypeError", std::string("%") + conversion +
                                                   " format: a real number is required, not " + arg->type_name());
                }
                int64_t v = arg->is_float() ? static_cast<int64_t>(arg->as_float()) : integral(*arg);
                spec.type = 'd';
                spec.precision = -1;
                out += format_integer(v, spec);
                break;
            }
            case 'x':
            case 'X':
            case 'o': {
                spec.type = conversion;
                spec.precision = -1;
                out += format_integer(to_integer(*arg, "%x format: an integer"), spec);
                break;
            }
            case 'f':
            case 'F':
            case 'e':
            case 'E':
            case 'g':
            case 'G': {
                if (!arg->is_number()) {
                    throw ScriptError("TypeError", "must be real number, not " + arg->type_name());
                }
                spec.type = conversion;
                out += format_double(arg->as_number(), spec);
                break;
            }
            case 'c': {
                std::string text;
                if (arg->is_str() && utf8_length(arg->as_str()) == 1) {
                    text = arg->as_str();
                } else {
                    text = format_value(Value(to_integer(*arg, "%c requires int or char")), "c");
                }
                out += format_text(text, spec);
                break;
            }
            default:
                throw ScriptError("ValueError", std::string("unsupported format character '") + conversion + "'");
        }
    }

    if (!used_mapping && !mapping && next < items.size()) {
        throw ScriptError("TypeError", "not all arguments converted during string formatting");
    }
    return out;
}

std::string str_format(const std::string& format, const CallArgs& args) {
    std::string out;
    size_t auto_index = 0;
    bool used_auto = false;
    bool used_manual = false;
    size_t i = 0;

    while (i < format.size()) {
        char c = format[i];
        if (c == '}') {
            if (i + 1 < format.size() && format[i + 1] == '}') {
                out += '}';
                i += 2;
                continue;
            }
            throw ScriptError("ValueError", "Single '}' encountered in format string");
        }
        if (c != '{') {
            out += c;
            ++i;
            continue;
        }
        if (i + 1 < format.size() && format[i + 1] == '{') {
            out += '{';
            i += 2;
            continue;
        }

        size_t close = format.find('}', i);
        if (close == std::string::npos) throw ScriptError("ValueError", "expected '}' before end of string");
        std::string field = format.substr(i + 1, close - i - 1);
        i = close + 1;

        std::string spec;
        size_t colon = field.find(':');
        if (colon != std::string::npos) {
            spec = field.substr(colon + 1);
            field = field.substr(0, colon);
        }
        char conversion = 0;
        size_t bang = field.find('!');
        if (bang != std::string::npos) {
            if (bang + 2 != field.size()) throw ScriptError("ValueError", "expected ':' after conversion specifier");
            conversion = field[bang + 1];
            field = field.substr(0, bang);
        }

        std::string name = field.substr(0, field.find_first_of(".["));
        std::string accessors = field.substr(name.size());
        if (accessors.find('.') != std::string::npos) {
            throw ScriptError("ValueError", "attribute access in format fields is not supported");
        }

        Value value;
        if (name.empty()) {
            if (used_manual) {
                throw ScriptError("ValueError", "cannot switch from manual field specification to automatic field numbering");
            }
            used_auto = true;
            if (auto_index >= args.positional.size()) {
                throw ScriptError("IndexError", "Replacement index " + std::to_string(auto_index) +
                                                " out of range for positional args tuple");
            }
            value = args.positional[auto_index++];
        } else if (std::isdigit(static_cast<unsigned char>(name[0]))) {
            if (used_auto) {
                throw ScriptError("ValueError", "cannot switch from automatic field numbering to manual field specification");
            }
            used_manual = true;
            size_t index = static_cast<size_t>(std::stoul(name));
            if (index >= args.positional.size()) {
                throw ScriptError("IndexError", "Replacement index " + name + " out of range for positional args tuple");
            }
            value = args.positional[index];
        } else {
            const Value* found = args.keyword(name);
            if (!found) throw ScriptError("KeyError", repr(Value(name)));
            value = *found;
        }

        // Index accessors: {0[key]} or {data[2]}
        size_t pos = 0;
        while (pos < accessors.size()) {
            size_t end = accessors.find(']', pos);
            if (accessors[pos] != '[' || end == std::string::npos) {
                throw ScriptError("ValueError", "Missing ']' in format string");
            }
            std::string key = accessors.substr(pos + 1, end - pos - 1);
            pos = end + 1;
            bool numeric = !key.empty() && key.find_first_not_of("0123456789") == std::string::npos;
            if (value.is_dict()) {
                Value lookup = numeric ? Value(static_cast<int64_t>(std::stoll(key))) : Value(key);
                const Value* found = value.as_dict().find(lookup);
                if (!found) throw ScriptError("KeyError", repr(lookup));
                value = *found;
            } else if ((value.is_list() || value.is_tuple()) && numeric) {
                const auto& items = value.is_list() ? value.as_list().items : value.as_tuple().items;
                size_t index = static_cast<size_t>(std::stoul(key));
                if (index >= items.size()) throw ScriptError("IndexError", "list index out of range");
                value = items[index];
            } else {
                throw ScriptError("TypeError", "'" + value.type_name() + "' object is not subscriptable");
            }
        }

        if (conversion == 'r' || conversion == 'a') {
            value = Value(repr(value));
        } else if (conversion == 's') {
            value = Value(to_display(value));
        } else if (conversion != 0) {
            throw ScriptError("ValueError", std::string("Unknown conversion specifier ") + conversion);
        }
        if (spec.find('{') != std::string::npos) {
            throw ScriptError("ValueError", "nested replacement fields are not supported");
        }
        out += format_value(value, spec);
    }
    return out;
}

} // namespace codegate
