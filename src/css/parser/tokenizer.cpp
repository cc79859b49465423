#include <selcheck/css/parser/tokenizer.h>
#include <cctype>
#include <cstdlib>

namespace selcheck::css {

// ---------------------------------------------------------------------------
// CSSToken
// ---------------------------------------------------------------------------

bool CSSToken::operator==(const CSSToken& other) const {
    return type == other.type && value == other.value &&
           offset == other.offset && length == other.length;
}

const char* token_type_name(CSSToken::Type type) {
    switch (type) {
        case CSSToken::Ident:        return "identifier";
        case CSSToken::Function:     return "function";
        case CSSToken::AtKeyword:    return "at-keyword";
        case CSSToken::Hash:         return "hash";
        case CSSToken::String:       return "string";
        case CSSToken::BadString:    return "unterminated string";
        case CSSToken::Number:       return "number";
        case CSSToken::Percentage:   return "percentage";
        case CSSToken::Dimension:    return "dimension";
        case CSSToken::Whitespace:   return "whitespace";
        case CSSToken::Colon:        return "':'";
        case CSSToken::Semicolon:    return "';'";
        case CSSToken::Comma:        return "','";
        case CSSToken::LeftBrace:    return "'{'";
        case CSSToken::RightBrace:   return "'}'";
        case CSSToken::LeftParen:    return "'('";
        case CSSToken::RightParen:   return "')'";
        case CSSToken::LeftBracket:  return "'['";
        case CSSToken::RightBracket: return "']'";
        case CSSToken::Delim:        return "delimiter";
        case CSSToken::EndOfFile:    return "end of input";
    }
    return "token";
}

// ---------------------------------------------------------------------------
// CSSTokenizer
// ---------------------------------------------------------------------------

CSSTokenizer::CSSTokenizer(std::string_view input) : input_(input), pos_(0) {}

char CSSTokenizer::consume() {
    if (pos_ < input_.size()) {
        return input_[pos_++];
    }
    return '\0';
}

char CSSTokenizer::peek() const {
    if (pos_ < input_.size()) {
        return input_[pos_];
    }
    return '\0';
}

char CSSTokenizer::peek(size_t offset) const {
    size_t idx = pos_ + offset;
    if (idx < input_.size()) {
        return input_[idx];
    }
    return '\0';
}

bool CSSTokenizer::at_end() const {
    return pos_ >= input_.size();
}

void CSSTokenizer::reconsume() {
    if (pos_ > 0) {
        --pos_;
    }
}

void CSSTokenizer::consume_whitespace() {
    while (!at_end() && (peek() == ' ' || peek() == '\t' || peek() == '\n' ||
                         peek() == '\r' || peek() == '\f')) {
        consume();
    }
}

bool CSSTokenizer::is_name_start_char(char c) const {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' ||
           (static_cast<unsigned char>(c) >= 0x80);
}

bool CSSTokenizer::is_name_char(char c) const {
    return is_name_start_char(c) || std::isdigit(static_cast<unsigned char>(c)) ||
           c == '-';
}

bool CSSTokenizer::starts_identifier() const {
    char c = peek();
    if (is_name_start_char(c)) return true;
    if (c == '-') {
        char next = peek(1);
        return is_name_start_char(next) || next == '-' ||
               (next == '\\' && peek(2) != '\n' && peek(2) != '\0');
    }
    if (c == '\\') {
        // Valid escape: backslash not followed by newline
        char next = peek(1);
        return next != '\n' && next != '\0';
    }
    return false;
}

bool CSSTokenizer::starts_number() const {
    char c = peek();
    if (std::isdigit(static_cast<unsigned char>(c))) return true;
    if (c == '.') {
        return std::isdigit(static_cast<unsigned char>(peek(1)));
    }
    if (c == '+' || c == '-') {
        char next = peek(1);
        if (std::isdigit(static_cast<unsigned char>(next))) return true;
        if (next == '.' && std::isdigit(static_cast<unsigned char>(peek(2))))
            return true;
    }
    return false;
}

std::string CSSTokenizer::consume_name() {
    std::string result;
    while (!at_end()) {
        char c = peek();
        if (is_name_char(c)) {
            result += consume();
        } else if (c == '\\' && peek(1) != '\n' && peek(1) != '\0') {
            consume(); // backslash
            char escaped = consume();
            if (std::isxdigit(static_cast<unsigned char>(escaped))) {
                // Hex escape: up to 6 hex digits, optional trailing space
                std::string hex(1, escaped);
                for (int i = 0; i < 5 && !at_end() &&
                     std::isxdigit(static_cast<unsigned char>(peek())); ++i) {
                    hex += consume();
                }
                if (!at_end() && (peek() == ' ' || peek() == '\t' ||
                                  peek() == '\n')) {
                    consume();
                }
                unsigned long code = std::strtoul(hex.c_str(), nullptr, 16);
                if (code > 0 && code <= 0x7F) {
                    result += static_cast<char>(code);
                } else {
                    // Keep non-ASCII escapes verbatim so names stay distinct.
                    result += '\\';
                    result += hex;
                    result += ' ';
                }
            } else {
                result += escaped;
            }
        } else {
            break;
        }
    }
    return result;
}

void CSSTokenizer::consume_number_text() {
    if (peek() == '+' || peek() == '-') {
        consume();
    }
    while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) {
        consume();
    }
    if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1)))) {
        consume(); // '.'
        while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) {
            consume();
        }
    }
    if (peek() == 'e' || peek() == 'E') {
        char after_e = peek(1);
        bool signed_exponent = (after_e == '+' || after_e == '-') &&
                               std::isdigit(static_cast<unsigned char>(peek(2)));
        if (std::isdigit(static_cast<unsigned char>(after_e)) || signed_exponent) {
            consume(); // 'e' or 'E'
            if (peek() == '+' || peek() == '-') {
                consume();
            }
            while (!at_end() &&
                   std::isdigit(static_cast<unsigned char>(peek()))) {
                consume();
            }
        }
    }
}

CSSToken CSSTokenizer::consume_string(char ending) {
    CSSToken token{CSSToken::String, ""};
    std::string result;

    while (!at_end()) {
        char c = consume();
        if (c == ending) {
            token.value = result;
            return token;
        }
        if (c == '\\') {
            if (at_end()) {
                break;
            }
            char next = peek();
            if (next == '\n') {
                // Escaped newline: line continuation
                consume();
            } else {
                result += consume();
            }
        } else if (c == '\n') {
            // Unescaped newline ends the string as a bad string
            reconsume();
            token.type = CSSToken::BadString;
            token.value = result;
            return token;
        } else {
            result += c;
        }
    }

    // End of input before the closing quote
    token.type = CSSToken::BadString;
    token.value = result;
    return token;
}

CSSToken CSSTokenizer::consume_numeric() {
    size_t start = pos_;
    consume_number_text();
    std::string number(input_.substr(start, pos_ - start));

    if (starts_identifier()) {
        std::string unit = consume_name();
        return CSSToken{CSSToken::Dimension, number + unit};
    }
    if (peek() == '%') {
        consume();
        return CSSToken{CSSToken::Percentage, number + "%"};
    }
    return CSSToken{CSSToken::Number, number};
}

CSSToken CSSTokenizer::consume_ident_like() {
    std::string name = consume_name();

    // Function token: name followed by '('
    if (peek() == '(') {
        consume();
        return CSSToken{CSSToken::Function, name};
    }
    return CSSToken{CSSToken::Ident, name};
}

CSSToken CSSTokenizer::consume_hash() {
    // '#' has already been consumed
    if (!at_end() && (is_name_char(peek()) ||
                      (peek() == '\\' && peek(1) != '\n' && peek(1) != '\0'))) {
        return CSSToken{CSSToken::Hash, consume_name()};
    }
    return CSSToken{CSSToken::Delim, "#"};
}

CSSToken CSSTokenizer::next_token() {
    // Comments produce no token. An unterminated comment runs to end of input.
    while (peek() == '/' && peek(1) == '*') {
        consume();
        consume();
        while (!at_end() && !(peek() == '*' && peek(1) == '/')) {
            consume();
        }
        consume();
        consume();
    }

    size_t start = pos_;
    CSSToken token = consume_token();
    token.offset = start;
    token.length = pos_ - start;
    return token;
}

CSSToken CSSTokenizer::consume_token() {
    if (at_end()) {
        return CSSToken{CSSToken::EndOfFile, ""};
    }

    char c = consume();

    if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f') {
        consume_whitespace();
        return CSSToken{CSSToken::Whitespace, " "};
    }

    if (c == '"' || c == '\'') {
        return consume_string(c);
    }

    if (c == '#') {
        return consume_hash();
    }

    switch (c) {
        case '(': return CSSToken{CSSToken::LeftParen, "("};
        case ')': return CSSToken{CSSToken::RightParen, ")"};
        case ',': return CSSToken{CSSToken::Comma, ","};
        case ':': return CSSToken{CSSToken::Colon, ":"};
        case ';': return CSSToken{CSSToken::Semicolon, ";"};
        case '[': return CSSToken{CSSToken::LeftBracket, "["};
        case ']': return CSSToken{CSSToken::RightBracket, "]"};
        case '{': return CSSToken{CSSToken::LeftBrace, "{"};
        case '}': return CSSToken{CSSToken::RightBrace, "}"};
        default: break;
    }

    // Plus sign: could start a number
    if (c == '+') {
        reconsume();
        if (starts_number()) {
            return consume_numeric();
        }
        consume();
        return CSSToken{CSSToken::Delim, "+"};
    }

    // Hyphen-minus: could start a number or an ident
    if (c == '-') {
        reconsume();
        if (starts_number()) {
            return consume_numeric();
        }
        if (starts_identifier()) {
            return consume_ident_like();
        }
        consume();
        return CSSToken{CSSToken::Delim, "-"};
    }

    // Period: could start a number
    if (c == '.') {
        reconsume();
        if (starts_number()) {
            return consume_numeric();
        }
        consume();
        return CSSToken{CSSToken::Delim, "."};
    }

    if (c == '@') {
        if (starts_identifier()) {
            return CSSToken{CSSToken::AtKeyword, consume_name()};
        }
        return CSSToken{CSSToken::Delim, "@"};
    }

    // Backslash: could start an escaped ident
    if (c == '\\') {
        if (!at_end() && peek() != '\n') {
            reconsume();
            return consume_ident_like();
        }
        return CSSToken{CSSToken::Delim, "\\"};
    }

    if (std::isdigit(static_cast<unsigned char>(c))) {
        reconsume();
        return consume_numeric();
    }

    if (is_name_start_char(c)) {
        reconsume();
        return consume_ident_like();
    }

    return CSSToken{CSSToken::Delim, std::string(1, c)};
}

std::vector<CSSToken> CSSTokenizer::tokenize_all(std::string_view input) {
    CSSTokenizer tokenizer(input);
    std::vector<CSSToken> tokens;

    while (true) {
        CSSToken token = tokenizer.next_token();
        tokens.push_back(token);
        if (token.type == CSSToken::EndOfFile) {
            break;
        }
    }

    return tokens;
}

} // namespace selcheck::css
