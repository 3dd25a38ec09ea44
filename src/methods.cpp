#include "builtins.h"
#include "client_gateway.h"
#include "operators.h"
#include "codegate/errors.h"
#include <algorithm>
#include <cctype>

namespace codegate {

namespace {

const char* WHITESPACE = " \t\n\r\f\v";

Value method(const std::string& name, NativeFunction fn) {
    return Value::callable(name, std::move(fn));
}

const std::string& str_arg(const CallArgs& args, size_t index, const std::string& name) {
    const Value& v = args.positional[index];
    if (!v.is_str()) {
        throw ScriptError("TypeError", name + "() argument must be str, not " + v.type_name());
    }
    return v.as_str();
}

// Python-style index normalization for find/index ranges
void clamp_range(int64_t length, const CallArgs& args, size_t first, int64_t& start, int64_t& end) {
    start = 0;
    end = length;
    if (args.positional.size() > first && !args.positional[first].is_none()) {
        start = to_integer(args.positional[first], "slice index");
        if (start < 0) start = std::max<int64_t>(0, start + length);
    }
    if (args.positional.size() > first + 1 && !args.positional[first + 1].is_none()) {
        end = to_integer(args.positional[first + 1], "slice index");
        if (end < 0) end = std::max<int64_t>(0, end + length);
    }
    start = std::min(start, length);
    end = std::min(end, length);
}

std::string strip_chars(const std::string& text, const std::string& chars, bool left, bool right) {
    size_t begin = 0;
    size_t end = text.size();
    if (left) {
        while (begin < end && chars.find(text[begin]) != std::string::npos) ++begin;
    }
    if (right) {
        while (end > begin && chars.find(text[end - 1]) != std::string::npos) --end;
    }
    return text.substr(begin, end - begin);
}

std::vector<Value> split_text(const std::string& text, const Value* sep, int64_t maxsplit) {
    std::vector<Value> parts;
    if (!sep || sep->is_none()) {
        size_t i = 0;
        while (true) {
            i = text.find_first_not_of(WHITESPACE, i);
            if (i == std::string::npos) break;
            if (maxsplit >= 0 && static_cast<int64_t>(parts.size()) >= maxsplit) {
                parts.push_back(Value(strip_chars(text.substr(i), WHITESPACE, false, true)));
                break;
            }
            size_t j = text.find_first_of(WHITESPACE, i);
            if (j == std::string::npos) j = text.size();
            parts.push_back(Value(text.substr(i, j - i)));
            i = j;
        }
        return parts;
    }
    if (!sep->is_str()) throw ScriptError("TypeError", "must be str or None, not " + sep->type_name());
    const std::string& separator = sep->as_str();
    if (separator.empty()) throw ScriptError("ValueError", "empty separator");
    size_t start = 0;
    while (maxsplit < 0 || static_cast<int64_t>(parts.size()) < maxsplit) {
        size_t pos = text.find(separator, start);
        if (pos == std::string::npos) break;
        parts.push_back(Value(text.substr(start, pos - start)));
        start = pos + separator.size();
    }
    parts.push_back(Value(text.substr(start)));
    return parts;
}

// Byte offset of code point `index`
size_t byte_offset(const std::string& text, int64_t index) {
    size_t offset = 0;
    int64_t seen = 0;
    while (offset < text.size() && seen < index) {
        ++offset;
        while (offset < text.size() && (static_cast<unsigned char>(text[offset]) & 0xC0) == 0x80) ++offset;
        ++seen;
    }
    return offset;
}

int64_t code_point_index(const std::string& text, size_t offset) {
    return static_cast<int64_t>(utf8_length(text.substr(0, offset)));
}

bool matches_affix(const std::string& text, const Value& affix, bool prefix, const char* name) {
    auto test = [&](const Value& candidate) {
        if (!candidate.is_str()) {
            throw ScriptError("TypeError", std::string(name) + " first arg must be str or a tuple of str, not " +
                                           candidate.type_name());
        }
        const std::string& s = candidate.as_str();
        if (s.size() > text.size()) return false;
        return prefix ? text.compare(0, s.size(), s) == 0
                      : text.compare(text.size() - s.size(), s.size(), s) == 0;
    };
    if (affix.is_tuple()) {
        for (const auto& item : affix.as_tuple().items) {
            if (test(item)) return true;
        }
        return false;
    }
    return test(affix);
}

template <typename Predicate>
bool all_chars(const std::string& text, Predicate predicate) {
    if (text.empty()) return false;
    for (unsigned char c : text) {
        if (!predicate(c)) return false;
    }
    return true;
}

std::string padded(const std::string& text, int64_t width, const std::string& fill, char align) {
    int64_t length = static_cast<int64_t>(utf8_length(text));
    if (width <= length) return text;
    int64_t total = width - length;
    int64_t left = align == '<' ? 0 : (align == '>' ? total : total / 2 + (total & width & 1));
    int64_t right = total - left;
    std::string out;
    for (int64_t i = 0; i < left; ++i) out += fill;
    out += text;
    for (int64_t i = 0; i < right; ++i) out += fill;
    return out;
}

std::string fill_char(const CallArgs& args, size_t index) {
    if (args.positional.size() <= index) return " ";
    const Value& v = args.positional[index];
    if (!v.is_str() || utf8_length(v.as_str()) != 1) {
        throw ScriptError("TypeError", "The fill character must be exactly one character long");
    }
    return v.as_str();
}

Value str_method(const Value& self, const std::string& name) {
    const std::string text = self.as_str();
    const std::string qual = "str." + name;

    if (name == "upper" || name == "lower" || name == "title" || name == "capitalize" || name == "swapcase") {
        return method(qual, [text, name](CallArgs& args) -> Value {
            check_no_keywords(args, name);
            check_arity(args, name, 0, 0);
            std::string out = text;
            bool word_start = true;
            for (size_t i = 0; i < out.size(); ++i) {
                unsigned char c = static_cast<unsigned char>(out[i]);
                if (name == "upper") out[i] = static_cast<char>(std::toupper(c));
                else if (name == "lower") out[i] = static_cast<char>(std::tolower(c));
                else if (name == "swapcase") out[i] = static_cast<char>(std::isupper(c) ? std::tolower(c) : std::toupper(c));
                else if (name == "capitalize") out[i] = static_cast<char>(i == 0 ? std::toupper(c) : std::tolower(c));
                else {
                    out[i] = static_cast<char>(word_start ? std::toupper(c) : std::tolower(c));
                    word_start = !std::isalpha(c);
                }
            }
            return Value(out);
        });
    }
    if (name == "strip" || name == "lstrip" || name == "rstrip") {
        return method(qual, [text, name](CallArgs& args) -> Value {
            check_no_keywords(args, name);
            check_arity(args, name, 0, 1);
            std::string chars = WHITESPACE;
            if (!args.positional.empty() && !args.positional[0].is_none()) chars = str_arg(args, 0, name);
            return Value(strip_chars(text, chars, name != "rstrip", name != "lstrip"));
        });
    }
    if (name == "split") {
        return method(qual, [text](CallArgs& args) -> Value {
            check_keywords(args, "split", {"sep", "maxsplit"});
            check_arity(args, "split", 0, 2);
            const Value* sep = args.positional.size() > 0 ? &args.positional[0] : args.keyword("sep");
            const Value* limit = args.positional.size() > 1 ? &args.positional[1] : args.keyword("maxsplit");
            int64_t maxsplit = limit ? to_integer(*limit, "maxsplit") : -1;
            return Value::list(split_text(text, sep, maxsplit));
        });
    }
    if (name == "splitlines") {
        return method(qual, [text](CallArgs& args) -> Value {
            check_arity(args, "splitlines", 0, 0);
            std::vector<Value> lines;
            size_t start = 0;
            for (size_t i = 0; i < text.size(); ++i) {
                if (text[i] == '\n' || text[i] == '\r') {
                    lines.push_back(Value(text.substr(start, i - start)));
                    if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') ++i;
                    start = i + 1;
                }
            }
            if (start < text.size()) lines.push_back(Value(text.substr(start)));
            return Value::list(std::move(lines));
        });
    }
    if (name == "join") {
        return method(qual, [text](CallArgs& args) -> Value {
            check_no_keywords(args, "join");
            check_arity(args, "join", 1, 1);
            std::string out;
            size_t index = 0;
            for_each_item(args.positional[0], [&](const Value& item) {
                if (!item.is_str()) {
                    throw ScriptError("TypeError", "sequence item " + std::to_string(index) +
                                                   ": expected str instance, " + item.type_name() + " found");
                }
                if (index++ > 0) out += text;
                out += item.as_str();
                return true;
            });
            return Value(out);
        });
    }
    if (name == "replace") {
        return method(qual, [text](CallArgs& args) -> Value {
            check_no_keywords(args, "replace");
            check_arity(args, "replace", 2, 3);
            const std::string& old_text = str_arg(args, 0, "replace");
            const std::string& new_text = str_arg(args, 1, "replace");
            int64_t count = args.positional.size() > 2 ? to_integer(args.positional[2], "count") : -1;
            std::string out;
            if (old_text.empty()) {
                auto chars = utf8_chars(text);
                int64_t done = 0;
                for (const auto& ch : chars) {
                    if (count < 0 || done < count) { out += new_text; ++done; }
                    out += ch;
                }
                if (count < 0 || done < count) out += new_text;
                return Value(out);
            }
            size_t start = 0;
            int64_t done = 0;
            while (count < 0 || done < count) {
                size_t pos = text.find(old_text, start);
                if (pos == std::string::npos) break;
                out += text.substr(start, pos - start);
                out += new_text;
                start = pos + old_text.size();
                ++done;
            }
            out += text.substr(start);
            return Value(out);
        });
    }
    if (name == "startswith" || name == "endswith") {
        bool prefix = name == "startswith";
        return method(qual, [text, prefix, name](CallArgs& args) -> Value {
            check_no_keywords(args, name);
            check_arity(args, name, 1, 3);
            int64_t start;
            int64_t end;
            int64_t length = static_cast<int64_t>(utf8_length(text));
            clamp_range(length, args, 1, start, end);
            if (start > end) return Value(false);
            std::string window = text.substr(byte_offset(text, start),
                                             byte_offset(text, end) - byte_offset(text, start));
            return Value(matches_affix(window, args.positional[0], prefix, name.c_str()));
        });
    }
    if (name == "find" || name == "rfind" || name == "index" || name == "rindex" || name == "count") {
        return method(qual, [text, name](CallArgs& args) -> Value {
            check_no_keywords(args, name);
            check_arity(args, name, 1, 3);
            const std::string& needle = str_arg(args, 0, name);
            int64_t length = static_cast<int64_t>(utf8_length(text));
            int64_t start;
            int64_t end;
            clamp_range(length, args, 1, start, end);
            if (start > end) {
                if (name == "count") return Value(0);
                if (name == "index" || name == "rindex") throw ScriptError("ValueError", "substring not found");
                return Value(-1);
            }
            size_t begin = byte_offset(text, start);
            std::string window = text.substr(begin, byte_offset(text, end) - begin);
            if (name == "count") {
                if (needle.empty()) return Value(static_cast<int64_t>(utf8_length(window) + 1));
                int64_t found = 0;
                for (size_t pos = window.find(needle); pos != std::string::npos;
                     pos = window.find(needle, pos + needle.size())) {
                    ++found;
                }
                return Value(found);
            }
            size_t pos = (name[0] == 'r') ? window.rfind(needle) : window.find(needle);
            if (pos == std::string::npos) {
                if (name == "index" || name == "rindex") throw ScriptError("ValueError", "substring not found");
                return Value(-1);
            }
            return Value(start + code_point_index(window, pos));
        });
    }
    if (name == "format") {
        return method(qual, [text](CallArgs& args) -> Value { return Value(str_format(text, args)); });
    }
    if (name == "isdigit" || name == "isnumeric" || name == "isdecimal" || name == "isalpha" ||
        name == "isalnum" || name == "isspace" || name == "isupper" || name == "islower") {
        return method(qual, [text, name](CallArgs& args) -> Value {
            check_arity(args, name, 0, 0);
            if (name == "isalpha") return Value(all_chars(text, [](unsigned char c) { return std::isalpha(c) != 0; }));
            if (name == "isalnum") return Value(all_chars(text, [](unsigned char c) { return std::isalnum(c) != 0; }));
            if (name == "isspace") return Value(all_chars(text, [](unsigned char c) { return std::isspace(c) != 0; }));
            if (name == "isupper" || name == "islower") {
                bool upper = name == "isupper";
                bool cased = false;
                for (unsigned char c : text) {
                    if (std::isalpha(c)) {
                        cased = true;
                        if ((std::isupper(c) != 0) != upper) return Value(false);
                    }
                }
                return Value(cased);
            }
            return Value(all_chars(text, [](unsigned char c) { return std::isdigit(c) != 0; }));
        });
    }
    if (name == "zfill") {
        return method(qual, [text](CallArgs& args) -> Value {
            check_arity(args, "zfill", 1, 1);
            int64_t width = to_integer(args.positional[0], "zfill");
            int64_t length = static_cast<int64_t>(utf8_length(text));
            if (width <= length) return Value(text);
            std::string zeros(static_cast<size_t>(width - length), '0');
            if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
                return Value(text.substr(0, 1) + zeros + text.substr(1));
            }
            return Value(zeros + text);
        });
    }
    if (name == "center" || name == "ljust" || name == "rjust") {
        char align = name == "center" ? '^' : (name == "ljust" ? '<' : '>');
        return method(qual, [text, name, align](CallArgs& args) -> Value {
            check_arity(args, name, 1, 2);
            int64_t width = to_integer(args.positional[0], name.c_str());
            return Value(padded(text, width, fill_char(args, 1), align));
        });
    }
    if (name == "partition" || name == "rpartition") {
        return method(qual, [text, name](CallArgs& args) -> Value {
            check_arity(args, name, 1, 1);
            const std::string& sep = str_arg(args, 0, name);
            if (sep.empty()) throw ScriptError("ValueError", "empty separator");
            size_t pos = name == "partition" ? text.find(sep) : text.rfind(sep);
            if (pos == std::string::npos) {
                if (name == "partition") return Value::tuple({Value(text), Value(""), Value("")});
                return Value::tuple({Value(""), Value(""), Value(text)});
            }
            return Value::tuple({Value(text.substr(0, pos)), Value(sep), Value(text.substr(pos + sep.size()))});
        });
    }
    if (name == "encode") {
        return method(qual, [text](CallArgs& args) -> Value {
            check_keywords(args, "encode", {"encoding", "errors"});
            check_arity(args, "encode", 0, 2);
            return Value::bytes(text);
        });
    }
    throw ScriptError("AttributeError", "'str' object has no attribute '" + name + "'");
}

int64_t list_position(const Value& index_value, int64_t size, bool clamp) {
    int64_t index = to_integer(index_value, "list index");
    if (index < 0) index += size;
    if (clamp) return std::max<int64_t>(0, std::min(index, size));
    return index;
}

Value list_method(const Value& self, const std::string& name) {
    const std::string qual = "list." + name;

    if (name == "append") {
        return method(qual, [self](CallArgs& args) -> Value {
            check_no_keywords(args, "append");
            check_arity(args, "append", 1, 1);
            self.as_list().items.push_back(args.positional[0]);
            return Value();
        });
    }
    if (name == "extend") {
        return method(qual, [self](CallArgs& args) -> Value {
            check_no_keywords(args, "extend");
            check_arity(args, "extend", 1, 1);
            std::vector<Value> items = collect_items(args.positional[0]);
            auto& target = self.as_list().items;
            target.insert(target.end(), items.begin(), items.end());
            return Value();
        });
    }
    if (name == "insert") {
        return method(qual, [self](CallArgs& args) -> Value {
            check_no_keywords(args, "insert");
            check_arity(args, "insert", 2, 2);
            auto& items = self.as_list().items;
            int64_t pos = list_position(args.positional[0], static_cast<int64_t>(items.size()), true);
            items.insert(items.begin() + pos, args.positional[1]);
            return Value();
        });
    }
    if (name == "pop") {
        return method(qual, [self](CallArgs& args) -> Value {
            check_no_keywords(args, "pop");
            check_arity(args, "pop", 0, 1);
            auto& items = self.as_list().items;
            if (items.empty()) throw ScriptError("IndexError", "pop from empty list");
            int64_t size = static_cast<int64_t>(items.size());
            int64_t pos = args.positional.empty() ? size - 1 : list_position(args.positional[0], size, false);
            if (pos < 0 || pos >= size) throw ScriptError("IndexError", "pop index out of range");
            Value item = items[static_cast<size_t>(pos)];
            items.erase(items.begin() + pos);
            return item;
        });
    }
    if (name == "remove") {
        return method(qual, [self](CallArgs& args) -> Value {
            check_no_keywords(args, "remove");
            check_arity(args, "remove", 1, 1);
            auto& items = self.as_list().items;
            for (size_t i = 0; i < items.size(); ++i) {
                if (values_equal(items[i], args.positional[0])) {
                    items.erase(items.begin() + static_cast<std::ptrdiff_t>(i));
                    return Value();
                }
            }
            throw ScriptError("ValueError", "list.remove(x): x not in list");
        });
    }
    if (name == "index" || name == "count") {
        return method(qual, [self, name](CallArgs& args) -> Value {
            check_no_keywords(args, name);
            check_arity(args, name, 1, name == "index" ? 3 : 1);
            const auto& items = self.as_list().items;
            if (name == "count") {
                int64_t found = 0;
                for (const auto& item : items) {
                    if (values_equal(item, args.positional[0])) ++found;
                }
                return Value(found);
            }
            int64_t start;
            int64_t end;
            clamp_range(static_cast<int64_t>(items.size()), args, 1, start, end);
            for (int64_t i = start; i < end && i < static_cast<int64_t>(items.size()); ++i) {
                if (values_equal(items[static_cast<size_t>(i)], args.positional[0])) return Value(i);
            }
            throw ScriptError("ValueError", repr(args.positional[0]) + " is not in list");
        });
    }
    if (name == "sort") {
        return method(qual, [self](CallArgs& args) -> Value {
            check_keywords(args, "sort", {"key", "reverse"});
            check_arity(args, "sort", 0, 0);
            CallArgs sort_args;
            sort_args.positional.push_back(self);
            sort_args.keywords = args.keywords;
            Value sorted = sorted_items(sort_args);
            self.as_list().items = sorted.as_list().items;
            return Value();
        });
    }
    if (name == "reverse") {
        return method(qual, [self](CallArgs& args) -> Value {
            check_arity(args, "reverse", 0, 0);
            auto& items = self.as_list().items;
            std::reverse(items.begin(), items.end());
            return Value();
        });
    }
    if (name == "copy") {
        return method(qual, [self](CallArgs& args) -> Value {
            check_arity(args, "copy", 0, 0);
            return Value::list(self.as_list().items);
        });
    }
    if (name == "clear") {
        return method(qual, [self](CallArgs& args) -> Value {
            check_arity(args, "clear", 0, 0);
            self.as_list().items.clear();
            return Value();
        });
    }
    throw ScriptError("AttributeError", "'list' object has no attribute '" + name + "'");
}

Value dict_method(const Value& self, const std::string& name) {
    const std::string qual = "dict." + name;

    if (name == "get") {
        return method(qual, [self](CallArgs& args) -> Value {
            check_no_keywords(args, "get");
            check_arity(args, "get", 1, 2);
            const Value* found = self.as_dict().find(args.positional[0]);
            if (found) return *found;
            return args.positional.size() > 1 ? args.positional[1] : Value();
        });
    }
    if (name == "keys" || name == "values" || name == "items") {
        return method(qual, [self, name](CallArgs& args) -> Value {
            check_arity(args, name, 0, 0);
            std::vector<Value> out;
            for (const auto& [k, v] : self.as_dict().entries()) {
                if (name == "keys") out.push_back(k);
                else if (name == "values") out.push_back(v);
                else out.push_back(Value::tuple({k, v}));
            }
            return Value::list(std::move(out));
        });
    }
    if (name == "pop") {
        return method(qual, [self](CallArgs& args) -> Value {
            check_no_keywords(args, "pop");
            check_arity(args, "pop", 1, 2);
            Dict& dict = self.as_dict();
            const Value* found = dict.find(args.positional[0]);
            if (!found) {
                if (args.positional.size() > 1) return args.positional[1];
                throw ScriptError("KeyError", repr(args.positional[0]));
            }
            Value value = *found;
            dict.erase(args.positional[0]);
            return value;
        });
    }
    if (name == "popitem") {
        return method(qual, [self](CallArgs& args) -> Value {
            check_arity(args, "popitem", 0, 0);
            Dict& dict = self.as_dict();
            if (dict.empty()) throw ScriptError("KeyError", "'popitem(): dictionary is empty'");
            auto last = dict.entries().back();
            dict.erase(last.first);
            return Value::tuple({last.first, last.second});
        });
    }
    if (name == "setdefault") {
        return method(qual, [self](CallArgs& args) -> Value {
            check_no_keywords(args, "setdefault");
            check_arity(args, "setdefault", 1, 2);
            Dict& dict = self.as_dict();
            const Value* found = dict.find(args.positional[0]);
            if (found) return *found;
            Value fallback = args.positional.size() > 1 ? args.positional[1] : Value();
            dict.set(args.positional[0], fallback);
            return fallback;
        });
    }
    if (name == "update") {
        return method(qual, [self](CallArgs& args) -> Value {
            check_arity(args, "update", 0, 1);
            CallArgs build;
            build.positional = args.positional;
            build.keywords = args.keywords;
            Value merged = dict_from_args(build);
            Dict& dict = self.as_dict();
            for (const auto& [k, v] : merged.as_dict().entries()) dict.set(k, v);
            return Value();
        });
    }
    if (name == "copy") {
        return method(qual, [self](CallArgs& args) -> Value {
            check_arity(args, "copy", 0, 0);
            return Value::dict(self.as_dict().entries());
        });
    }
    if (name == "clear") {
        return method(qual, [self](CallArgs& args) -> Value {
            check_arity(args, "clear", 0, 0);
            self.as_dict().clear();
            return Value();
        });
    }
    throw ScriptError("AttributeError", "'dict' object has no attribute '" + name + "'");
}

Value tuple_method(const Value& self, const std::string& name) {
    if (name == "index" || name == "count") {
        return method("tuple." + name, [self, name](CallArgs& args) -> Value {
            check_no_keywords(args, name);
            check_arity(args, name, 1, 1);
            const auto& items = self.as_tuple().items;
            int64_t found = 0;
            for (size_t i = 0; i < items.size(); ++i) {
                if (!values_equal(items[i], args.positional[0])) continue;
                if (name == "index") return Value(static_cast<int64_t>(i));
                ++found;
            }
            if (name == "index") throw ScriptError("ValueError", "tuple.index(x): x not in tuple");
            return Value(found);
        });
    }
    throw ScriptError("AttributeError", "'tuple' object has no attribute '" + name + "'");
}

bool valid_utf8(const std::string& data, size_t& bad_offset) {
    for (size_t i = 0; i < data.size();) {
        unsigned char c = static_cast<unsigned char>(data[i]);
        size_t len = c < 0x80 ? 1 : (c >> 5) == 0x6 ? 2 : (c >> 4) == 0xE ? 3 : (c >> 3) == 0x1E ? 4 : 0;
        if (len == 0 || i + len > data.size()) {
            bad_offset = i;
            return false;
        }
        for (size_t k = 1; k < len; ++k) {
            if ((static_cast<unsigned char>(data[i + k]) & 0xC0) != 0x80) {
                bad_offset = i;
                return false;
            }
        }
        i += len;
    }
    return true;
}

Value bytes_method(const Value& self, const std::string& name) {
    const std::string data = self.as_bytes();
    if (name == "decode") {
        return method("bytes.decode", [data](CallArgs& args) -> Value {
            check_keywords(args, "decode", {"encoding", "errors"});
            check_arity(args, "decode", 0, 2);
            size_t bad = 0;
            if (!valid_utf8(data, bad)) {
                throw ScriptError("UnicodeDecodeError", "'utf-8' codec can't decode byte at position " +
                                                        std::to_string(bad));
            }
            return Value(data);
        });
    }
    if (name == "hex") {
        return method("bytes.hex", [data](CallArgs& args) -> Value {
            check_arity(args, "hex", 0, 0);
            static const char* DIGITS = "0123456789abcdef";
            std::string out;
            for (unsigned char c : data) {
                out += DIGITS[c >> 4];
                out += DIGITS[c & 0xF];
            }
            return Value(out);
        });
    }
    throw ScriptError("AttributeError", "'bytes' object has no attribute '" + name + "'");
}

} // namespace

Value get_attribute(const Value& object, const std::string& name) {
    switch (object.type()) {
        case ValueType::STR: return str_method(object, name);
        case ValueType::LIST: return list_method(object, name);
        case ValueType::DICT: return dict_method(object, name);
        case ValueType::TUPLE: return tuple_method(object, name);
        case ValueType::BYTES: return bytes_method(object, name);
        case ValueType::RANGE: {
            const Range& r = object.as_range();
            if (name == "start") return Value(r.start);
            if (name == "stop") return Value(r.stop);
            if (name == "step") return Value(r.step);
            break;
        }
        case ValueType::OPAQUE:
            if (object.is_exception() && name == "args") {
                const std::string& message = object.as_opaque().text;
                return message.empty() ? Value::tuple() : Value::tuple({Value(message)});
            }
            break;
        case ValueType::MODULE: {
            const Module& module = object.as_module();
            auto it = module.members.find(name);
            if (it != module.members.end()) return it->second;
            throw ScriptError("AttributeError", "module '" + module.name + "' has no attribute '" + name + "'");
        }
        case ValueType::CLIENT: {
            std::shared_ptr<ClientGateway> gateway = object.as_client().gateway;
            if (!gateway->has_operation(name)) {
                throw ScriptError("AttributeError", "'client' object has no attribute '" + name + "'");
            }
            return Value::callable("client." + name, [gateway, name](CallArgs& args) -> Value {
                return gateway->invoke(name, args);
            });
        }
        default:
            break;
    }
    throw ScriptError("AttributeError", "'" + object.type_name() + "' object has no attribute '" + name + "'");
}

} // namespace codegate
