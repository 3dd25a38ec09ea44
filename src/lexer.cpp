#include "lexer.h"
#include "codegate/constants.h"
#include "codegate/errors.h"
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <unordered_set>

namespace codegate {

namespace {

const std::unordered_set<std::string> KEYWORDS = {
    "False", "None", "True", "and", "as", "assert", "async", "await",
    "break", "class", "continue", "def", "del", "elif", "else", "except",
    "finally", "for", "from", "global", "if", "import", "in", "is",
    "lambda", "nonlocal", "not", "or", "pass", "raise", "return", "try",
    "while", "with", "yield"
};

const char* const THREE_CHAR_OPS[] = {"**=", "//=", ">>=", "<<=", "..."};
const char* const TWO_CHAR_OPS[] = {
    "**", "//", "<<", ">>", "<=", ">=", "==", "!=", "->", "+=", "-=", "*=",
    "/=", "%=", "&=", "|=", "^=", "@=", ":="
};
const std::string SINGLE_CHAR_OPS = "+-*/%@&|^~<>()[]{},:.;=";

bool is_identifier_start(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || u >= 0x80;
}

bool is_identifier_char(char c) {
    return is_identifier_start(c) || (c >= '0' && c <= '9');
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void append_utf8(std::string& out, uint32_t cp) {
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
}

} // namespace

Lexer::Lexer(const std::string& source) : source_(source) {}

bool Lexer::is_keyword(const std::string& word) {
    return KEYWORDS.count(word) > 0;
}

char Lexer::peek(size_t offset) const {
    size_t index = pos_ + offset;
    return index < source_.size() ? source_[index] : '\0';
}

char Lexer::advance() {
    char c = source_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

void Lexer::fail(const std::string& message) const {
    throw SyntaxError(message, line_, column_);
}

void Lexer::emit(TokenType type, std::string text, int line, int column) {
    Token token;
    token.type = type;
    token.text = std::move(text);
    token.line = line;
    token.column = column;
    tokens_.push_back(std::move(token));
    if (type != TokenType::NEWLINE && type != TokenType::INDENT && type != TokenType::DEDENT) {
        line_has_content_ = true;
    }
}

std::vector<Token> Lexer::tokenize() {
    tokens_.clear();

    while (!at_end()) {
        if (at_line_start_ && bracket_depth_ == 0) {
            handle_indentation();
            if (at_end()) break;
        }

        char c = peek();
        if (c == ' ' || c == '\t' || c == '\f' || c == '\r') {
            advance();
        } else if (c == '#') {
            while (!at_end() && peek() != '\n') advance();
        } else if (c == '\n') {
            int line = line_;
            int column = column_;
            advance();
            if (bracket_depth_ == 0) {
                if (line_has_content_) {
                    emit(TokenType::NEWLINE, "", line, column);
                    line_has_content_ = false;
                }
                at_line_start_ = true;
            }
        } else if (c == '\\') {
            advance();
            if (peek() == '\r') advance();
            if (peek() != '\n') fail("unexpected character after line continuation character");
            advance();
        } else if ((c >= '0' && c <= '9') || (c == '.' && peek(1) >= '0' && peek(1) <= '9')) {
            read_number();
        } else if (is_identifier_start(c)) {
            read_name_or_string();
        } else if (c == '\'' || c == '"') {
            read_string(false, false, false, line_, column_);
        } else {
            read_operator();
        }
    }

    if (bracket_depth_ > 0) fail("unexpected EOF: unclosed bracket");
    if (line_has_content_) emit(TokenType::NEWLINE, "", line_, column_);
    while (indents_.size() > 1) {
        indents_.pop_back();
        emit(TokenType::DEDENT, "", line_, column_);
    }
    emit(TokenType::END_OF_INPUT, "", line_, column_);
    return std::move(tokens_);
}

void Lexer::handle_indentation() {
    int width = 0;
    while (!at_end()) {
        char c = peek();
        if (c == ' ') {
            ++width;
        } else if (c == '\t') {
            width = (width / 8 + 1) * 8;
        } else if (c == '\f' || c == '\r') {
            // ignored
        } else {
            break;
        }
        advance();
    }

    // Blank and comment-only lines do not affect indentation
    if (at_end() || peek() == '\n' || peek() == '#') return;

    at_line_start_ = false;
    if (width > indents_.back()) {
        indents_.push_back(width);
        emit(TokenType::INDENT, "", line_, 1);
        line_has_content_ = false;
        return;
    }
    while (width < indents_.back()) {
        indents_.pop_back();
        emit(TokenType::DEDENT, "", line_, column_);
    }
    if (width != indents_.back()) {
        fail("unindent does not match any outer indentation level");
    }
}

void Lexer::read_number() {
    int line = line_;
    int column = column_;
    std::string digits;
    bool is_float = false;

    if (peek() == '0' && (peek(1) == 'x' || peek(1) == 'X' || peek(1) == 'o' ||
                          peek(1) == 'O' || peek(1) == 'b' || peek(1) == 'B')) {
        advance();
        char base_char = advance();
        int base = (base_char == 'x' || base_char == 'X') ? 16 : (base_char == 'o' || base_char == 'O') ? 8 : 2;
        while (!at_end() && (is_identifier_char(peek()))) {
            char c = advance();
            if (c == '_') continue;
            int d = hex_digit(c);
            if (d < 0 || d >= base) fail("invalid digit '" + std::string(1, c) + "' in numeric literal");
            digits += c;
        }
        if (digits.empty()) fail("invalid numeric literal");
        errno = 0;
        unsigned long long parsed = std::strtoull(digits.c_str(), nullptr, base);
        if (errno == ERANGE || parsed > static_cast<unsigned long long>(std::numeric_limits<int64_t>::max())) {
            fail("integer literal too large");
        }
        Token token;
        token.type = TokenType::INT;
        token.text = digits;
        token.int_value = static_cast<int64_t>(parsed);
        token.line = line;
        token.column = column;
        tokens_.push_back(std::move(token));
        line_has_content_ = true;
        return;
    }

    auto read_digits = [&]() {
        while (!at_end() && ((peek() >= '0' && peek() <= '9') || peek() == '_')) {
            char c = advance();
            if (c != '_') digits += c;
        }
    };

    read_digits();
    if (peek() == '.') {
        is_float = true;
        digits += advance();
        read_digits();
    }
    if (peek() == 'e' || peek() == 'E') {
        char sign = peek(1);
        bool has_sign = sign == '+' || sign == '-';
        char first = has_sign ? peek(2) : sign;
        if (first >= '0' && first <= '9') {
            is_float = true;
            digits += advance();
            if (has_sign) digits += advance();
            read_digits();
        }
    }
    if (peek() == 'j' || peek() == 'J') fail("complex literals are not supported");
    if (is_identifier_start(peek())) fail("invalid decimal literal");

    Token token;
    token.text = digits;
    token.line = line;
    token.column = column;
    if (is_float) {
        token.type = TokenType::FLOAT;
        token.float_value = std::strtod(digits.c_str(), nullptr);
    } else {
        if (digits.size() > 1 && digits[0] == '0' && digits.find_first_not_of('0') != std::string::npos) {
            fail("leading zeros in decimal integer literals are not permitted");
        }
        errno = 0;
        unsigned long long parsed = std::strtoull(digits.c_str(), nullptr, 10);
        if (errno == ERANGE || parsed > static_cast<unsigned long long>(std::numeric_limits<int64_t>::max())) {
            fail("integer literal too large");
        }
        token.type = TokenType::INT;
        token.int_value = static_cast<int64_t>(parsed);
    }
    tokens_.push_back(std::move(token));
    line_has_content_ = true;
}

void Lexer::read_name_or_string() {
    int line = line_;
    int column = column_;

    // String prefixes: any combination of r, b, f (and a lone u)
    size_t prefix_len = 0;
    bool raw = false;
    bool bytes = false;
    bool formatted = false;
    bool unicode = false;
    while (prefix_len < 3) {
        char c = peek(prefix_len);
        char lower = static_cast<char>(c | 0x20);
        if (lower == 'r' && !raw) raw = true;
        else if (lower == 'b' && !bytes) bytes = true;
        else if (lower == 'f' && !formatted) formatted = true;
        else if (lower == 'u' && !unicode && prefix_len == 0) unicode = true;
        else break;
        ++prefix_len;
    }
    char after = peek(prefix_len);
    bool valid_prefix = !(bytes && formatted) && !(unicode && (raw || bytes || formatted));
    if (prefix_len > 0 && valid_prefix && (after == '\'' || after == '"')) {
        for (size_t i = 0; i < prefix_len; ++i) advance();
        read_string(raw, bytes, formatted, line, column);
        return;
    }

    std::string name;
    while (!at_end() && is_identifier_char(peek())) name += advance();
    emit(is_keyword(name) ? TokenType::KEYWORD : TokenType::NAME, std::move(name), line, column);
}

void Lexer::append_escape(std::string& out, bool bytes) {
    // Positioned just after the backslash
    if (at_end()) fail("unterminated string literal");
    char c = advance();
    switch (c) {
        case '\n': return;
        case '\\': out += '\\'; return;
        case '\'': out += '\''; return;
        case '"': out += '"'; return;
        case 'a': out += '\a'; return;
        case 'b': out += '\b'; return;
        case 'f': out += '\f'; return;
        case 'n': out += '\n'; return;
        case 'r': out += '\r'; return;
        case 't': out += '\t'; return;
        case 'v': out += '\v'; return;
        case 'x': {
            int hi = hex_digit(peek());
            int lo = hex_digit(peek(1));
            if (hi < 0 || lo < 0) fail("truncated \\xXX escape");
            advance();
            advance();
            uint32_t value = static_cast<uint32_t>(hi * 16 + lo);
            if (bytes) out += static_cast<char>(value);
            else append_utf8(out, value);
            return;
        }
        case 'u':
        case 'U': {
            if (bytes) {
                out += '\\';
                out += c;
                return;
            }
            int count = c == 'u' ? 4 : 8;
            uint32_t value = 0;
            for (int i = 0; i < count; ++i) {
                int d = hex_digit(peek());
                if (d < 0) fail("truncated \\" + std::string(1, c) + " escape");
                advance();
                value = value * 16 + static_cast<uint32_t>(d);
            }
            if (value > 0x10FFFF) fail("illegal Unicode character");
            append_utf8(out, value);
            return;
        }
        case 'N':
            if (!bytes) fail("named Unicode escapes are not supported");
            out += "\\N";
            return;
        default:
            if (c >= '0' && c <= '7') {
                uint32_t value = static_cast<uint32_t>(c - '0');
                for (int i = 0; i < 2 && peek() >= '0' && peek() <= '7'; ++i) {
                    value = value * 8 + static_cast<uint32_t>(advance() - '0');
                }
                if (bytes) out += static_cast<char>(value & 0xFF);
                else append_utf8(out, value);
                return;
            }
            out += '\\';
            out += c;
    }
}

void Lexer::read_string(bool raw, bool bytes, bool formatted, int line, int column) {
    char quote = advance();
    bool triple = false;
    if (peek() == quote && peek(1) == quote) {
        advance();
        advance();
        triple = true;
    }

    std::string text;
    while (true) {
        if (at_end()) {
            throw SyntaxError(triple ? "unterminated triple-quoted string literal"
                                     : "unterminated string literal", line, column);
        }
        char c = peek();
        if (c == quote) {
            if (!triple) {
                advance();
                break;
            }
            if (peek(1) == quote && peek(2) == quote) {
                advance();
                advance();
                advance();
                break;
            }
            text += advance();
            continue;
        }
        if (c == '\n' && !triple) {
            throw SyntaxError("unterminated string literal", line, column);
        }
        if (c == '\\') {
            advance();
            if (raw) {
                text += '\\';
                if (!at_end()) text += advance();
            } else {
                append_escape(text, bytes);
            }
            continue;
        }
        if (bytes && static_cast<unsigned char>(c) >= 0x80) {
            fail("bytes can only contain ASCII literal characters");
        }
        text += advance();
    }

    TokenType type = bytes ? TokenType::BYTES : formatted ? TokenType::FSTRING : TokenType::STRING;
    emit(type, std::move(text), line, column);
}

void Lexer::read_operator() {
    int line = line_;
    int column = column_;

    for (const char* op : THREE_CHAR_OPS) {
        if (source_.compare(pos_, 3, op) == 0) {
            for (int i = 0; i < 3; ++i) advance();
            emit(TokenType::OP, op, line, column);
            return;
        }
    }
    for (const char* op : TWO_CHAR_OPS) {
        if (source_.compare(pos_, 2, op) == 0) {
            advance();
            advance();
            emit(TokenType::OP, op, line, column);
            return;
        }
    }

    char c = peek();
    if (SINGLE_CHAR_OPS.find(c) == std::string::npos) {
        std::string shown = (c >= 0x20 && c < 0x7f) ? std::string(1, c) : "\\x" + std::to_string(static_cast<unsigned char>(c));
        fail("invalid character '" + shown + "'");
    }
    advance();
    if (c == '(' || c == '[' || c == '{') {
        if (++bracket_depth_ > MAX_NESTING_DEPTH) fail("too many nested parentheses");
    } else if (c == ')' || c == ']' || c == '}') {
        if (bracket_depth_ == 0) fail("unmatched '" + std::string(1, c) + "'");
        --bracket_depth_;
    }
    emit(TokenType::OP, std::string(1, c), line, column);
}

} // namespace codegate
