#pragma once

#include <stdexcept>
#include <string>

namespace codegate {

// Malformed snippet text (lexer or parser)
class SyntaxError : public std::runtime_error {
public:
    SyntaxError(const std::string& message, int line, int column)
        : std::runtime_error(message + " (line " + std::to_string(line) +
                             ", column " + std::to_string(column) + ")"),
          message_(message), line_(line), column_(column) {}

    const std::string& message() const { return message_; }
    int line() const { return line_; }
    int column() const { return column_; }

private:
    std::string message_;
    int line_;
    int column_;
};

// Fault raised by a running snippet, typed like the snippet language sees it
// (ValueError, KeyError, ...). Catchable from inside the snippet.
class ScriptError : public std::runtime_error {
public:
    ScriptError(const std::string& type, const std::string& message)
        : std::runtime_error(message.empty() ? type : type + ": " + message),
          type_(type), message_(message) {}

    const std::string& type() const { return type_; }
    const std::string& message() const { return message_; }

private:
    std::string type_;
    std::string message_;
};

// Result could not be normalized within the configured bounds
class SerializationError : public std::runtime_error {
public:
    explicit SerializationError(const std::string& message)
        : std::runtime_error(message) {}
};

// Invalid policy document or command line
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("Configuration error: " + message) {}
};

// Raised by ServiceClient implementations; surfaced to snippets as ClientError
class ClientError : public std::runtime_error {
public:
    explicit ClientError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace codegate
