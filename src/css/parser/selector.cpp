#include <selcheck/css/parser/selector.h>
#include <selcheck/css/parser/tokenizer.h>
#include <algorithm>
#include <cctype>
#include <utility>

namespace selcheck::css {

namespace {

std::string ascii_lower(std::string_view value) {
    std::string result(value);
    std::transform(
        result.begin(),
        result.end(),
        result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
    while (!text.empty() && is_space(text.back())) text.remove_suffix(1);
    return text;
}

bool is_digits(std::string_view text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) {
               return std::isdigit(c) != 0;
           });
}

// Accepts odd, even, B, An, An+B with optional signs; whitespace is only
// significant inside the An and B terms.
bool is_valid_anb(std::string_view raw) {
    std::string text = ascii_lower(trim(raw));
    if (text == "odd" || text == "even") return true;

    std::string compact;
    for (char c : text) {
        if (!is_space(c)) compact += c;
    }
    if (compact.empty()) return false;

    std::string_view rest(compact);
    size_t n_pos = rest.find('n');
    if (n_pos == std::string_view::npos) {
        if (rest.front() == '+' || rest.front() == '-') rest.remove_prefix(1);
        return is_digits(rest);
    }

    std::string_view a = rest.substr(0, n_pos);
    if (!a.empty() && (a.front() == '+' || a.front() == '-')) a.remove_prefix(1);
    if (!a.empty() && !is_digits(a)) return false;

    std::string_view b = rest.substr(n_pos + 1);
    if (b.empty()) return true;
    if (b.front() != '+' && b.front() != '-') return false;
    return is_digits(b.substr(1));
}

bool is_name_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '-' || c == '_' || u >= 0x80;
}

std::string serialize_identifier(std::string_view name) {
    std::string out;
    for (size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        bool leading_digit = std::isdigit(static_cast<unsigned char>(c)) &&
                             (i == 0 || (i == 1 && name[0] == '-'));
        if (leading_digit) {
            static const char kHex[] = "0123456789abcdef";
            out += '\\';
            out += kHex[(static_cast<unsigned char>(c) >> 4) & 0xF];
            out += kHex[static_cast<unsigned char>(c) & 0xF];
            out += ' ';
        } else if (is_name_char(c) || c == '\\') {
            out += c;
        } else {
            out += '\\';
            out += c;
        }
    }
    return out;
}

std::string serialize_string(std::string_view value) {
    std::string out = "\"";
    for (char c : value) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

const char* attribute_operator(AttributeMatch match) {
    switch (match) {
        case AttributeMatch::Exists:    return "";
        case AttributeMatch::Exact:     return "=";
        case AttributeMatch::Includes:  return "~=";
        case AttributeMatch::DashMatch: return "|=";
        case AttributeMatch::Prefix:    return "^=";
        case AttributeMatch::Suffix:    return "$=";
        case AttributeMatch::Substring: return "*=";
    }
    return "";
}

} // namespace

// ---------------------------------------------------------------------------
// Selector Parser
// ---------------------------------------------------------------------------

// Parses selectors from a slice [begin, end) of a token stream. Nested
// argument lists are parsed by a fresh parser over the same tokens, so token
// offsets are always relative to the full input.
class SelectorParser {
public:
    SelectorParser(std::string_view input, const std::vector<CSSToken>& tokens)
        : input_(input), tokens_(tokens) {}

    std::vector<std::pair<size_t, size_t>> split_top_level(size_t begin,
                                                           size_t end) const;
    bool parse_list(size_t begin, size_t end, bool relative, SelectorList& out);
    bool parse_complex(size_t begin, size_t end, bool relative,
                       ComplexSelector& out);

    const SelectorParseError& error() const { return error_; }
    std::string text_between(size_t begin, size_t end) const;
    size_t offset_of(size_t index) const;

private:
    std::string_view input_;
    const std::vector<CSSToken>& tokens_;
    size_t pos_ = 0;
    size_t end_ = 0;
    SelectorParseError error_;

    const CSSToken& current() const;
    const CSSToken* token_after(size_t index) const;
    bool at_end() const;
    void advance();
    bool skip_whitespace();
    bool is_delim(const CSSToken& tok, char c) const;
    bool adjacent(size_t first, size_t second) const;
    bool at_column_combinator() const;
    bool at_combinator() const;
    std::optional<Combinator> consume_combinator();
    bool only_whitespace(size_t begin, size_t end) const;

    bool parse_compound(CompoundSelector& compound);
    bool parse_type_or_universal(CompoundSelector& compound);
    bool parse_attribute_selector(SimpleSelector& ss);
    bool parse_pseudo(CompoundSelector& compound);
    bool parse_functional_pseudo_class(SimpleSelector& ss, size_t arg_begin,
                                       size_t arg_end);
    bool parse_nth_argument(SimpleSelector& ss, size_t arg_begin,
                            size_t arg_end, bool allow_of);
    bool collect_function_argument(size_t& arg_begin, size_t& arg_end);
    bool parse_nested(size_t begin, size_t end, bool relative,
                      SelectorList& out);

    bool fail(const std::string& message, size_t index);
    bool fail_span(const std::string& message, size_t begin, size_t end);
};

const CSSToken& SelectorParser::current() const {
    if (pos_ < end_) {
        return tokens_[pos_];
    }
    // The token at end_ is the boundary (comma, ')' or EndOfFile).
    return tokens_[std::min(end_, tokens_.size() - 1)];
}

const CSSToken* SelectorParser::token_after(size_t index) const {
    if (index + 1 < end_) {
        return &tokens_[index + 1];
    }
    return nullptr;
}

bool SelectorParser::at_end() const {
    return pos_ >= end_;
}

void SelectorParser::advance() {
    if (pos_ < end_) {
        ++pos_;
    }
}

bool SelectorParser::skip_whitespace() {
    bool skipped = false;
    while (!at_end() && current().type == CSSToken::Whitespace) {
        advance();
        skipped = true;
    }
    return skipped;
}

bool SelectorParser::is_delim(const CSSToken& tok, char c) const {
    return tok.type == CSSToken::Delim && tok.value.size() == 1 &&
           tok.value[0] == c;
}

bool SelectorParser::adjacent(size_t first, size_t second) const {
    return tokens_[first].offset + tokens_[first].length == tokens_[second].offset;
}

bool SelectorParser::at_column_combinator() const {
    if (at_end() || !is_delim(current(), '|')) return false;
    const CSSToken* next = token_after(pos_);
    return next && is_delim(*next, '|') && adjacent(pos_, pos_ + 1);
}

bool SelectorParser::at_combinator() const {
    if (at_end()) return false;
    const CSSToken& tok = current();
    return is_delim(tok, '>') || is_delim(tok, '+') || is_delim(tok, '~') ||
           at_column_combinator();
}

std::optional<Combinator> SelectorParser::consume_combinator() {
    if (at_end()) return std::nullopt;
    const CSSToken& tok = current();
    if (is_delim(tok, '>')) {
        advance();
        return Combinator::Child;
    }
    if (is_delim(tok, '+')) {
        advance();
        return Combinator::NextSibling;
    }
    if (is_delim(tok, '~')) {
        advance();
        return Combinator::SubsequentSibling;
    }
    if (at_column_combinator()) {
        advance();
        advance();
        return Combinator::Column;
    }
    return std::nullopt;
}

bool SelectorParser::only_whitespace(size_t begin, size_t end) const {
    for (size_t i = begin; i < end; ++i) {
        if (tokens_[i].type != CSSToken::Whitespace) return false;
    }
    return true;
}

size_t SelectorParser::offset_of(size_t index) const {
    return tokens_[std::min(index, tokens_.size() - 1)].offset;
}

std::string SelectorParser::text_between(size_t begin, size_t end) const {
    if (begin >= end) return "";
    size_t from = tokens_[begin].offset;
    size_t to = tokens_[end - 1].offset + tokens_[end - 1].length;
    return std::string(trim(input_.substr(from, to - from)));
}

bool SelectorParser::fail(const std::string& message, size_t index) {
    const CSSToken& tok = tokens_[std::min(index, tokens_.size() - 1)];
    error_.message = message;
    error_.fragment = std::string(input_.substr(tok.offset, tok.length));
    error_.offset = tok.offset;
    return false;
}

bool SelectorParser::fail_span(const std::string& message, size_t begin,
                               size_t end) {
    error_.message = message;
    error_.fragment = text_between(begin, end);
    error_.offset = offset_of(begin);
    return false;
}

std::vector<std::pair<size_t, size_t>>
SelectorParser::split_top_level(size_t begin, size_t end) const {
    std::vector<std::pair<size_t, size_t>> ranges;
    int paren_depth = 0;
    int bracket_depth = 0;
    size_t start = begin;
    for (size_t i = begin; i < end; ++i) {
        switch (tokens_[i].type) {
            case CSSToken::Function:
            case CSSToken::LeftParen:
                paren_depth++;
                break;
            case CSSToken::RightParen:
                if (paren_depth > 0) paren_depth--;
                break;
            case CSSToken::LeftBracket:
                bracket_depth++;
                break;
            case CSSToken::RightBracket:
                if (bracket_depth > 0) bracket_depth--;
                break;
            case CSSToken::Comma:
                if (paren_depth == 0 && bracket_depth == 0) {
                    ranges.emplace_back(start, i);
                    start = i + 1;
                }
                break;
            default:
                break;
        }
    }
    ranges.emplace_back(start, end);
    return ranges;
}

bool SelectorParser::parse_list(size_t begin, size_t end, bool relative,
                                SelectorList& out) {
    for (const auto& [first, last] : split_top_level(begin, end)) {
        ComplexSelector selector;
        if (!parse_complex(first, last, relative, selector)) {
            return false;
        }
        out.selectors.push_back(std::move(selector));
    }
    return true;
}

bool SelectorParser::parse_complex(size_t begin, size_t end, bool relative,
                                   ComplexSelector& out) {
    pos_ = begin;
    end_ = end;
    skip_whitespace();
    if (at_end()) {
        return fail("empty selector", pos_);
    }

    std::optional<Combinator> pending;
    if (at_combinator()) {
        size_t comb_index = pos_;
        pending = consume_combinator();
        if (!relative) {
            return fail("unexpected combinator at start of selector", comb_index);
        }
        skip_whitespace();
        if (at_end()) {
            return fail("dangling combinator", comb_index);
        }
    }

    while (true) {
        if (at_combinator()) {
            return fail("unexpected combinator", pos_);
        }

        size_t compound_start = pos_;
        CompoundSelector compound;
        if (!parse_compound(compound)) {
            return false;
        }
        if (compound.simple_selectors.empty()) {
            return fail("empty compound selector", compound_start);
        }

        ComplexSelector::Part part;
        part.compound = std::move(compound);
        part.combinator = pending;
        out.parts.push_back(std::move(part));

        bool had_whitespace = skip_whitespace();
        if (at_end()) {
            break;
        }

        size_t comb_index = pos_;
        pending = consume_combinator();
        if (pending.has_value()) {
            skip_whitespace();
            if (at_end()) {
                return fail("dangling combinator", comb_index);
            }
        } else if (had_whitespace) {
            pending = Combinator::Descendant;
        } else {
            return fail(std::string("unexpected ") +
                            token_type_name(current().type),
                        pos_);
        }
    }

    return true;
}

bool SelectorParser::parse_compound(CompoundSelector& compound) {
    while (!at_end()) {
        const CSSToken& tok = current();

        if (tok.type == CSSToken::Whitespace || at_combinator()) {
            break;
        }

        if (tok.type == CSSToken::Ident || is_delim(tok, '*') ||
            is_delim(tok, '|')) {
            if (!parse_type_or_universal(compound)) return false;
            continue;
        }

        if (is_delim(tok, '&')) {
            SimpleSelector ss;
            ss.type = SimpleSelectorType::Nesting;
            ss.value = "&";
            compound.simple_selectors.push_back(std::move(ss));
            advance();
            continue;
        }

        // Class selector: .name
        if (is_delim(tok, '.')) {
            size_t dot = pos_;
            advance();
            if (at_end() || current().type != CSSToken::Ident ||
                !adjacent(dot, pos_)) {
                return fail("expected class name after '.'", dot);
            }
            SimpleSelector ss;
            ss.type = SimpleSelectorType::Class;
            ss.value = current().value;
            compound.simple_selectors.push_back(std::move(ss));
            advance();
            continue;
        }

        // ID selector: #name (Hash token). The name must be an identifier.
        if (tok.type == CSSToken::Hash) {
            const std::string& name = tok.value;
            bool digit_start =
                std::isdigit(static_cast<unsigned char>(name[0])) ||
                (name.size() > 1 && name[0] == '-' &&
                 std::isdigit(static_cast<unsigned char>(name[1])));
            if (digit_start) {
                return fail("ID selector must be an identifier", pos_);
            }
            SimpleSelector ss;
            ss.type = SimpleSelectorType::Id;
            ss.value = name;
            compound.simple_selectors.push_back(std::move(ss));
            advance();
            continue;
        }

        if (tok.type == CSSToken::LeftBracket) {
            SimpleSelector ss;
            if (!parse_attribute_selector(ss)) return false;
            compound.simple_selectors.push_back(std::move(ss));
            continue;
        }

        if (tok.type == CSSToken::Colon) {
            if (!parse_pseudo(compound)) return false;
            continue;
        }

        switch (tok.type) {
            case CSSToken::RightParen:
                return fail("unbalanced parentheses", pos_);
            case CSSToken::RightBracket:
                return fail("unbalanced brackets", pos_);
            case CSSToken::BadString:
                return fail("unterminated string", pos_);
            default:
                return fail(std::string("unexpected ") +
                                token_type_name(tok.type) + " '" + tok.value +
                                "'",
                            pos_);
        }
    }
    return true;
}

bool SelectorParser::parse_type_or_universal(CompoundSelector& compound) {
    size_t start = pos_;
    SimpleSelector ss;

    auto is_name_token = [this](const CSSToken& t) {
        return t.type == CSSToken::Ident || is_delim(t, '*');
    };

    const CSSToken& first = current();
    const CSSToken* second = token_after(pos_);
    const CSSToken* third = second ? token_after(pos_ + 1) : nullptr;

    if (is_delim(first, '|')) {
        // |name: element in no namespace
        if (!second || !is_name_token(*second) || !adjacent(pos_, pos_ + 1)) {
            return fail("expected element name after '|'", pos_);
        }
        ss.ns = "";
        advance();
    } else if (second && is_delim(*second, '|') && adjacent(pos_, pos_ + 1) &&
               third && is_name_token(*third) && adjacent(pos_ + 1, pos_ + 2)) {
        // ns|name
        ss.ns = first.value;
        advance();
        advance();
    }

    const CSSToken& name = current();
    ss.type = is_delim(name, '*') ? SimpleSelectorType::Universal
                                  : SimpleSelectorType::Type;
    ss.value = name.value;

    if (!compound.simple_selectors.empty()) {
        return fail("type selector must come first in a compound selector",
                    start);
    }
    compound.simple_selectors.push_back(std::move(ss));
    advance();
    return true;
}

bool SelectorParser::parse_attribute_selector(SimpleSelector& ss) {
    size_t open = pos_;
    ss.type = SimpleSelectorType::Attribute;

    advance(); // skip '['
    skip_whitespace();

    // Attribute name, optionally namespaced: ns|name, *|name, |name
    const CSSToken* second = at_end() ? nullptr : token_after(pos_);
    if (!at_end() && (current().type == CSSToken::Ident || is_delim(current(), '*')) &&
        second && is_delim(*second, '|')) {
        const CSSToken* third = token_after(pos_ + 1);
        if (third && third->type == CSSToken::Ident) {
            ss.ns = current().value;
            advance();
            advance();
        }
    } else if (!at_end() && is_delim(current(), '|') && second &&
               second->type == CSSToken::Ident) {
        ss.ns = "";
        advance();
    }

    if (at_end() || current().type != CSSToken::Ident) {
        if (at_end()) return fail_span("unbalanced brackets", open, end_);
        return fail("expected attribute name", pos_);
    }
    ss.attr_name = current().value;
    ss.value = ss.attr_name;
    advance();
    skip_whitespace();

    if (at_end()) {
        return fail_span("unbalanced brackets", open, end_);
    }
    if (current().type == CSSToken::RightBracket) {
        ss.attr_match = AttributeMatch::Exists;
        advance();
        return true;
    }

    // Match operator
    size_t op_index = pos_;
    if (is_delim(current(), '=')) {
        ss.attr_match = AttributeMatch::Exact;
        advance();
    } else if (current().type == CSSToken::Delim && current().value.size() == 1) {
        char op = current().value[0];
        const CSSToken* eq = token_after(pos_);
        bool valid = (op == '~' || op == '|' || op == '^' || op == '$' ||
                      op == '*') &&
                     eq && is_delim(*eq, '=') && adjacent(pos_, pos_ + 1);
        if (!valid) {
            return fail("invalid attribute matcher", op_index);
        }
        switch (op) {
            case '~': ss.attr_match = AttributeMatch::Includes; break;
            case '|': ss.attr_match = AttributeMatch::DashMatch; break;
            case '^': ss.attr_match = AttributeMatch::Prefix; break;
            case '$': ss.attr_match = AttributeMatch::Suffix; break;
            default:  ss.attr_match = AttributeMatch::Substring; break;
        }
        advance();
        advance();
    } else {
        return fail("invalid attribute matcher", op_index);
    }

    skip_whitespace();
    if (at_end()) {
        return fail_span("unbalanced brackets", open, end_);
    }
    if (current().type == CSSToken::BadString) {
        return fail("unterminated string", pos_);
    }
    if (current().type != CSSToken::String && current().type != CSSToken::Ident) {
        return fail("attribute value must be an identifier or a string", pos_);
    }
    ss.attr_value = current().value;
    advance();

    skip_whitespace();
    if (!at_end() && current().type == CSSToken::Ident) {
        std::string flag = ascii_lower(current().value);
        if (flag != "i" && flag != "s") {
            return fail("invalid attribute modifier", pos_);
        }
        ss.attr_flag = flag[0];
        advance();
        skip_whitespace();
    }

    if (at_end()) {
        return fail_span("unbalanced brackets", open, end_);
    }
    if (current().type != CSSToken::RightBracket) {
        return fail(std::string("unexpected ") + token_type_name(current().type) +
                        " in attribute selector",
                    pos_);
    }
    advance(); // skip ']'
    return true;
}

bool SelectorParser::collect_function_argument(size_t& arg_begin,
                                               size_t& arg_end) {
    size_t function_index = pos_;
    advance(); // Function token includes '('
    arg_begin = pos_;
    int depth = 1;
    while (!at_end()) {
        const CSSToken& tok = current();
        if (tok.type == CSSToken::Function || tok.type == CSSToken::LeftParen) {
            depth++;
        } else if (tok.type == CSSToken::RightParen) {
            depth--;
            if (depth == 0) {
                arg_end = pos_;
                advance();
                return true;
            }
        } else if (tok.type == CSSToken::BadString) {
            return fail("unterminated string", pos_);
        }
        advance();
    }
    return fail_span("unbalanced parentheses", function_index, end_);
}

bool SelectorParser::parse_pseudo(CompoundSelector& compound) {
    size_t colon = pos_;
    advance(); // skip ':'

    SimpleSelector ss;
    if (!at_end() && current().type == CSSToken::Colon && adjacent(colon, pos_)) {
        // Pseudo-element ::name or ::name(...)
        advance();
        if (at_end() || !adjacent(colon + 1, pos_) ||
            (current().type != CSSToken::Ident &&
             current().type != CSSToken::Function)) {
            return fail("expected pseudo-element name after '::'", colon);
        }
        ss.type = SimpleSelectorType::PseudoElement;
        ss.value = current().value;
        if (current().type == CSSToken::Function) {
            size_t arg_begin = 0;
            size_t arg_end = 0;
            if (!collect_function_argument(arg_begin, arg_end)) return false;
            ss.is_function = true;
            ss.argument = text_between(arg_begin, arg_end);
        } else {
            advance();
        }
        compound.simple_selectors.push_back(std::move(ss));
        return true;
    }

    if (at_end() || !adjacent(colon, pos_) ||
        (current().type != CSSToken::Ident &&
         current().type != CSSToken::Function)) {
        return fail("expected pseudo-class name after ':'", colon);
    }

    ss.value = current().value;
    if (current().type == CSSToken::Ident) {
        ss.type = is_legacy_pseudo_element(ss.value)
                      ? SimpleSelectorType::PseudoElement
                      : SimpleSelectorType::PseudoClass;
        advance();
        compound.simple_selectors.push_back(std::move(ss));
        return true;
    }

    ss.type = SimpleSelectorType::PseudoClass;
    ss.is_function = true;
    size_t arg_begin = 0;
    size_t arg_end = 0;
    if (!collect_function_argument(arg_begin, arg_end)) return false;
    ss.argument = text_between(arg_begin, arg_end);
    if (!parse_functional_pseudo_class(ss, arg_begin, arg_end)) {
        return false;
    }
    compound.simple_selectors.push_back(std::move(ss));
    return true;
}

bool SelectorParser::parse_nested(size_t begin, size_t end, bool relative,
                                  SelectorList& out) {
    SelectorParser nested(input_, tokens_);
    if (!nested.parse_list(begin, end, relative, out)) {
        error_ = nested.error();
        return false;
    }
    return true;
}

bool SelectorParser::parse_functional_pseudo_class(SimpleSelector& ss,
                                                   size_t arg_begin,
                                                   size_t arg_end) {
    const std::string name = ascii_lower(ss.value);

    if (is_forwarding_pseudo_class(name) || name == "where") {
        auto list = std::make_shared<SelectorList>();
        if (!only_whitespace(arg_begin, arg_end) &&
            !parse_nested(arg_begin, arg_end, name == "has", *list)) {
            return false;
        }
        ss.arguments = std::move(list);
        return true;
    }

    if (name == "nth-child" || name == "nth-last-child") {
        return parse_nth_argument(ss, arg_begin, arg_end, true);
    }
    if (name == "nth-of-type" || name == "nth-last-of-type" ||
        name == "nth-col" || name == "nth-last-col") {
        return parse_nth_argument(ss, arg_begin, arg_end, false);
    }

    // Other functional pseudo-classes (:lang(), :dir(), :host(), ...) keep
    // their argument as text only.
    return true;
}

bool SelectorParser::parse_nth_argument(SimpleSelector& ss, size_t arg_begin,
                                        size_t arg_end, bool allow_of) {
    size_t of_index = arg_end;
    if (allow_of) {
        for (size_t i = arg_begin; i < arg_end; ++i) {
            if (tokens_[i].type == CSSToken::Ident &&
                ascii_lower(tokens_[i].value) == "of") {
                of_index = i;
                break;
            }
        }
    }

    if (only_whitespace(arg_begin, of_index)) {
        if (of_index != arg_end) {
            return fail("missing An+B before 'of'", of_index);
        }
        return fail_span("missing An+B argument", arg_begin > 0 ? arg_begin - 1 : 0,
                         arg_end + 1);
    }

    ss.anb = text_between(arg_begin, of_index);
    if (!is_valid_anb(ss.anb)) {
        return fail_span("invalid An+B expression", arg_begin, of_index);
    }
    if (of_index == arg_end) {
        return true;
    }

    if (only_whitespace(of_index + 1, arg_end)) {
        return fail("expected selector list after 'of'", of_index);
    }
    auto list = std::make_shared<SelectorList>();
    if (!parse_nested(of_index + 1, arg_end, false, *list)) {
        return false;
    }
    ss.arguments = std::move(list);
    return true;
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

bool is_forwarding_pseudo_class(std::string_view name) {
    const std::string lower = ascii_lower(name);
    return lower == "not" || lower == "is" || lower == "has";
}

bool is_legacy_pseudo_element(std::string_view name) {
    const std::string lower = ascii_lower(name);
    return lower == "before" || lower == "after" || lower == "first-line" ||
           lower == "first-letter";
}

std::vector<SelectorEntry> parse_selector_entries(std::string_view input) {
    auto tokens = CSSTokenizer::tokenize_all(input);
    SelectorParser splitter(input, tokens);
    size_t end = tokens.size() - 1;  // exclude EndOfFile

    std::vector<SelectorEntry> entries;
    auto ranges = splitter.split_top_level(0, end);
    if (ranges.size() == 1) {
        bool blank = true;
        for (size_t i = 0; i < end; ++i) {
            if (tokens[i].type != CSSToken::Whitespace) blank = false;
        }
        if (blank) return entries;
    }

    for (const auto& [first, last] : ranges) {
        SelectorEntry entry;
        entry.text = splitter.text_between(first, last);
        size_t text_start = first;
        while (text_start < last && tokens[text_start].type == CSSToken::Whitespace) {
            ++text_start;
        }
        entry.offset = splitter.offset_of(text_start);

        SelectorParser parser(input, tokens);
        entry.ok = parser.parse_complex(first, last, false, entry.selector);
        if (!entry.ok) {
            entry.error = parser.error();
            entry.selector = ComplexSelector{};
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

SelectorListParseResult parse_selector_list(std::string_view input) {
    SelectorListParseResult result;
    for (auto& entry : parse_selector_entries(input)) {
        if (!entry.ok) {
            result.ok = false;
            result.error = std::move(entry.error);
            result.list.selectors.clear();
            return result;
        }
        result.list.selectors.push_back(std::move(entry.selector));
    }
    result.ok = true;
    return result;
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

std::string combinator_text(Combinator combinator) {
    switch (combinator) {
        case Combinator::Descendant:        return " ";
        case Combinator::Child:             return ">";
        case Combinator::NextSibling:       return "+";
        case Combinator::SubsequentSibling: return "~";
        case Combinator::Column:            return "||";
    }
    return " ";
}

std::string serialize(const SimpleSelector& selector) {
    auto with_namespace = [&selector](const std::string& name) {
        if (!selector.ns.has_value()) return name;
        std::string prefix =
            *selector.ns == "*" ? "*" : serialize_identifier(*selector.ns);
        return prefix + "|" + name;
    };

    auto function_argument = [&selector]() {
        if (!selector.arguments) return selector.argument;
        std::string list = serialize(*selector.arguments);
        if (!selector.anb.empty()) return selector.anb + " of " + list;
        return list;
    };

    switch (selector.type) {
        case SimpleSelectorType::Type:
            return with_namespace(serialize_identifier(selector.value));
        case SimpleSelectorType::Universal:
            return with_namespace("*");
        case SimpleSelectorType::Class:
            return "." + serialize_identifier(selector.value);
        case SimpleSelectorType::Id:
            return "#" + serialize_identifier(selector.value);
        case SimpleSelectorType::Nesting:
            return "&";
        case SimpleSelectorType::Attribute: {
            std::string out = "[" + with_namespace(serialize_identifier(selector.attr_name));
            if (selector.attr_match != AttributeMatch::Exists) {
                out += attribute_operator(selector.attr_match);
                out += serialize_string(selector.attr_value);
                if (selector.attr_flag != '\0') {
                    out += ' ';
                    out += selector.attr_flag;
                }
            }
            return out + "]";
        }
        case SimpleSelectorType::PseudoClass: {
            std::string out = ":" + serialize_identifier(selector.value);
            if (selector.is_function) out += "(" + function_argument() + ")";
            return out;
        }
        case SimpleSelectorType::PseudoElement: {
            std::string out = "::" + serialize_identifier(selector.value);
            if (selector.is_function) out += "(" + selector.argument + ")";
            return out;
        }
    }
    return "";
}

std::string serialize(const ComplexSelector& selector) {
    std::string out;
    for (const auto& part : selector.parts) {
        if (part.combinator.has_value()) {
            if (*part.combinator == Combinator::Descendant) {
                out += " ";
            } else {
                if (!out.empty()) out += " ";
                out += combinator_text(*part.combinator) + " ";
            }
        }
        for (const auto& ss : part.compound.simple_selectors) {
            out += serialize(ss);
        }
    }
    return out;
}

std::string serialize(const SelectorList& list) {
    std::string out;
    for (size_t i = 0; i < list.selectors.size(); ++i) {
        if (i > 0) out += ", ";
        out += serialize(list.selectors[i]);
    }
    return out;
}

} // namespace selcheck::css
