#pragma once

#include "codegate/constants.h"
#include "codegate/value.h"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace codegate {

// Collects print() output up to a byte ceiling
class OutputBuffer {
public:
    explicit OutputBuffer(size_t limit = MAX_CAPTURED_OUTPUT) : limit_(limit) {}

    void write(const std::string& text);
    const std::string& text() const { return text_; }
    bool truncated() const { return truncated_; }

private:
    size_t limit_;
    std::string text_;
    bool truncated_ = false;
};

// Visits the items of an iterable in order; return false from `visit` to stop.
// Ranges are walked lazily.
void for_each_item(const Value& iterable, const std::function<bool(const Value&)>& visit);
std::vector<Value> collect_items(const Value& iterable);

// Invokes any callable value
Value call_value(const Value& callee, CallArgs& args);

// Argument checking for native functions
void check_arity(const CallArgs& args, const std::string& name, size_t min, size_t max);
void check_no_keywords(const CallArgs& args, const std::string& name);
void check_keywords(const CallArgs& args, const std::string& name, const std::vector<std::string>& allowed);

// Exception classes visible to snippets and their hierarchy
bool is_exception_type_name(const std::string& name);
bool exception_matches(const std::string& raised_type, const std::string& handler_type);
bool isinstance_of(const Value& value, const Value& type);

// sorted() and dict() entry points reused by list.sort and dict.update
Value sorted_items(CallArgs& args);
Value dict_from_args(CallArgs& args);

// The builtin function table of a fresh namespace
std::map<std::string, Value> make_builtins(std::shared_ptr<OutputBuffer> output);

// Methods and attributes of runtime values (str.upper, dict.items, ...)
Value get_attribute(const Value& object, const std::string& name);

// Importable modules; raises ModuleNotFoundError for anything else
Value load_module(const std::string& name);

// UTF-8 encoding of one code point
std::string encode_code_point(uint32_t code_point);

// int(text, base) parsing shared by int() and json
int64_t parse_integer(const std::string& text, int base);

} // namespace codegate
