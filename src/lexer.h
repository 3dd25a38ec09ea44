#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace codegate {

enum class TokenType {
    NAME,
    KEYWORD,
    INT,
    FLOAT,
    STRING,
    BYTES,
    FSTRING,
    OP,
    NEWLINE,
    INDENT,
    DEDENT,
    END_OF_INPUT
};

struct Token {
    TokenType type = TokenType::END_OF_INPUT;
    std::string text;       // Identifier, operator, or decoded string contents
    int64_t int_value = 0;
    double float_value = 0.0;
    int line = 1;
    int column = 1;
};

// Converts snippet source into tokens, including the INDENT/DEDENT tokens
// that delimit blocks. Throws SyntaxError on malformed input.
class Lexer {
public:
    explicit Lexer(const std::string& source);

    std::vector<Token> tokenize();

    static bool is_keyword(const std::string& word);

private:
    const std::string& source_;
    size_t pos_ = 0;
    int line_ = 1;
    int column_ = 1;
    int bracket_depth_ = 0;
    bool at_line_start_ = true;
    bool line_has_content_ = false;
    std::vector<int> indents_{0};
    std::vector<Token> tokens_;

    char peek(size_t offset = 0) const;
    char advance();
    bool at_end() const { return pos_ >= source_.size(); }

    void handle_indentation();
    void read_number();
    void read_name_or_string();
    void read_string(bool raw, bool bytes, bool formatted, int line, int column);
    void read_operator();
    void emit(TokenType type, std::string text, int line, int column);
    void append_escape(std::string& out, bool bytes);

    [[noreturn]] void fail(const std::string& message) const;
};

} // namespace codegate
