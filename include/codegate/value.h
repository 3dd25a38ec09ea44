#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace codegate {

class Value;
class Dict;
class ClientGateway;
struct List;
struct Tuple;
struct Range;
struct Opaque;
struct Callable;
struct Module;
struct ClientRef;
struct CallArgs;

using ListPtr = std::shared_ptr<List>;
using TuplePtr = std::shared_ptr<const Tuple>;
using RangePtr = std::shared_ptr<const Range>;
using DictPtr = std::shared_ptr<Dict>;
using OpaquePtr = std::shared_ptr<const Opaque>;
using CallablePtr = std::shared_ptr<const Callable>;
using ModulePtr = std::shared_ptr<const Module>;
using ClientPtr = std::shared_ptr<const ClientRef>;

using NativeFunction = std::function<Value(CallArgs&)>;

enum class ValueType {
    NONE,
    BOOL,
    INT,
    FLOAT,
    STR,
    BYTES,
    LIST,
    TUPLE,
    RANGE,
    DICT,
    OPAQUE,     // Client objects, timestamps, exceptions
    CALLABLE,   // Builtins, bound methods, exception types
    MODULE,
    CLIENT      // The authorized client handle
};

struct Bytes {
    std::string data;
};

// Runtime value of the snippet language. Scalars are held inline, containers
// by shared pointer so that aliasing behaves like reference semantics.
class Value {
public:
    Value() = default;
    Value(bool b) : data_(b) {}
    Value(int i) : data_(static_cast<int64_t>(i)) {}
    Value(long i) : data_(static_cast<int64_t>(i)) {}
    Value(long long i) : data_(static_cast<int64_t>(i)) {}
    Value(double d) : data_(d) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}

    static Value bytes(std::string data);
    static Value list(std::vector<Value> items = {});
    static Value tuple(std::vector<Value> items = {});
    static Value range(int64_t start, int64_t stop, int64_t step = 1);
    static Value dict();
    static Value dict(std::vector<std::pair<Value, Value>> entries);
    static Value opaque(std::string type_name, std::string text);
    static Value exception(std::string type_name, std::string message);
    static Value callable(std::string name, NativeFunction fn);
    static Value type_object(std::string name, NativeFunction constructor);
    static Value exception_type(std::string name);
    static Value module(std::string name, std::map<std::string, Value> members);
    static Value client(std::shared_ptr<ClientGateway> gateway);

    ValueType type() const { return static_cast<ValueType>(data_.index()); }

    bool is_none() const { return type() == ValueType::NONE; }
    bool is_bool() const { return type() == ValueType::BOOL; }
    bool is_int() const { return type() == ValueType::INT; }
    bool is_float() const { return type() == ValueType::FLOAT; }
    bool is_number() const { return is_int() || is_float() || is_bool(); }
    bool is_str() const { return type() == ValueType::STR; }
    bool is_bytes() const { return type() == ValueType::BYTES; }
    bool is_list() const { return type() == ValueType::LIST; }
    bool is_tuple() const { return type() == ValueType::TUPLE; }
    bool is_range() const { return type() == ValueType::RANGE; }
    bool is_dict() const { return type() == ValueType::DICT; }
    bool is_opaque() const { return type() == ValueType::OPAQUE; }
    bool is_exception() const;
    bool is_callable() const { return type() == ValueType::CALLABLE; }
    bool is_module() const { return type() == ValueType::MODULE; }
    bool is_client() const { return type() == ValueType::CLIENT; }

    bool as_bool() const { return std::get<bool>(data_); }
    int64_t as_int() const { return std::get<int64_t>(data_); }
    double as_float() const { return std::get<double>(data_); }
    // Numeric promotion for bool, int and float
    double as_number() const;
    const std::string& as_str() const { return std::get<std::string>(data_); }
    const std::string& as_bytes() const { return std::get<Bytes>(data_).data; }
    List& as_list() const;
    const Tuple& as_tuple() const;
    const Range& as_range() const;
    Dict& as_dict() const;
    const Opaque& as_opaque() const;
    const Callable& as_callable() const;
    const Module& as_module() const;
    const ClientRef& as_client() const;

    // Identity comparison (the `is` operator)
    bool same_object(const Value& other) const;

    // Type name as the snippet sees it ("int", "dict", "ValueError", ...)
    std::string type_name() const;

private:
    std::variant<std::monostate, bool, int64_t, double, std::string, Bytes,
                 ListPtr, TuplePtr, RangePtr, DictPtr, OpaquePtr, CallablePtr,
                 ModulePtr, ClientPtr> data_;
};

struct List {
    std::vector<Value> items;
};

struct Tuple {
    std::vector<Value> items;
};

struct Range {
    int64_t start = 0;
    int64_t stop = 0;
    int64_t step = 1;

    int64_t length() const;
    int64_t at(int64_t index) const { return start + index * step; }
};

// Insertion-ordered mapping with hashable keys
class Dict {
public:
    const Value* find(const Value& key) const;
    Value* find(const Value& key);
    void set(const Value& key, Value value);
    bool erase(const Value& key);
    bool contains(const Value& key) const { return find(key) != nullptr; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    void clear();
    const std::vector<std::pair<Value, Value>>& entries() const { return entries_; }

private:
    std::vector<std::pair<Value, Value>> entries_;
    std::unordered_map<std::string, size_t> index_;
};

struct Opaque {
    std::string type_name;
    std::string text;
    bool exception = false;
};

struct Callable {
    std::string name;
    NativeFunction fn;
    bool is_type = false;            // int, str, list, ... (usable with isinstance)
    bool is_exception_type = false;  // ValueError, KeyError, ...
};

struct Module {
    std::string name;
    std::map<std::string, Value> members;
};

struct ClientRef {
    std::shared_ptr<ClientGateway> gateway;
};

struct CallArgs {
    std::vector<Value> positional;
    std::vector<std::pair<std::string, Value>> keywords;

    // Keyword lookup; nullptr when absent
    const Value* keyword(const std::string& name) const;
};

inline List& Value::as_list() const { return *std::get<ListPtr>(data_); }
inline const Tuple& Value::as_tuple() const { return *std::get<TuplePtr>(data_); }
inline const Range& Value::as_range() const { return *std::get<RangePtr>(data_); }
inline Dict& Value::as_dict() const { return *std::get<DictPtr>(data_); }
inline const Opaque& Value::as_opaque() const { return *std::get<OpaquePtr>(data_); }
inline const Callable& Value::as_callable() const { return *std::get<CallablePtr>(data_); }
inline const Module& Value::as_module() const { return *std::get<ModulePtr>(data_); }
inline const ClientRef& Value::as_client() const { return *std::get<ClientPtr>(data_); }

// Truthiness as used by if/while/and/or/not
bool truthy(const Value& value);

// Deep equality (==); raises RecursionError on self-referential structures
bool values_equal(const Value& a, const Value& b);

// Ordering (<); returns negative, zero or positive. Raises TypeError.
int compare_values(const Value& a, const Value& b);

// repr() and str() renderings
std::string repr(const Value& value);
std::string to_display(const Value& value);

// Shortest round-tripping decimal rendering ("1.0", "0.1", "1e+20")
std::string format_float(double value);

// Canonical dictionary key; raises TypeError for unhashable values
std::string hash_key(const Value& value);

// Length in code points of a UTF-8 string
size_t utf8_length(const std::string& text);

// Splits a UTF-8 string into its code points
std::vector<std::string> utf8_chars(const std::string& text);

} // namespace codegate
