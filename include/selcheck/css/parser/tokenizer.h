#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace selcheck::css {

struct CSSToken {
    enum Type {
        Ident, Function, AtKeyword, Hash, String, BadString, Number, Percentage,
        Dimension, Whitespace, Colon, Semicolon, Comma,
        LeftBrace, RightBrace, LeftParen, RightParen, LeftBracket, RightBracket,
        Delim, EndOfFile
    };
    Type type;
    std::string value;
    size_t offset = 0;  // byte offset of the token's first character
    size_t length = 0;  // byte length in the source, quotes and escapes included

    bool operator==(const CSSToken& other) const;
};

const char* token_type_name(CSSToken::Type type);

class CSSTokenizer {
public:
    explicit CSSTokenizer(std::string_view input);
    CSSToken next_token();

    // Tokenize all at once. The last token is always EndOfFile.
    static std::vector<CSSToken> tokenize_all(std::string_view input);

private:
    std::string_view input_;
    size_t pos_ = 0;

    char consume();
    char peek() const;
    char peek(size_t offset) const;
    bool at_end() const;
    void reconsume();

    CSSToken consume_token();
    void consume_whitespace();
    CSSToken consume_string(char ending);
    CSSToken consume_numeric();
    CSSToken consume_ident_like();
    CSSToken consume_hash();
    void consume_number_text();
    std::string consume_name();
    bool starts_identifier() const;
    bool starts_number() const;
    bool is_name_start_char(char c) const;
    bool is_name_char(char c) const;
};

} // namespace selcheck::css
