#pragma once

#include "ast.h"
#include "codegate/value.h"
#include <string>

namespace codegate {

// Arithmetic, bitwise and sequence operators. Integers are 64-bit; results
// that do not fit raise OverflowError.
Value binary_op(ast::BinaryOperator op, const Value& left, const Value& right);
Value unary_op(ast::UnaryOperator op, const Value& operand);
bool compare_op(ast::CompareOperator op, const Value& left, const Value& right);

// The `in` operator
bool contains_value(const Value& container, const Value& item);

// format(value, spec) using the format-specification mini-language
std::string format_value(const Value& value, const std::string& spec);

// "text % args"
std::string percent_format(const std::string& format, const Value& args);

// "text".format(*args, **kwargs)
std::string str_format(const std::string& format, const CallArgs& args);

// Integer view of int and bool values; raises TypeError for anything else
int64_t to_integer(const Value& value, const char* context);

} // namespace codegate
