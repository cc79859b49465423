#include <selcheck/css/extract/selector_extractor.h>
#include <algorithm>
#include <cctype>

namespace selcheck::css {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

// Skips leading whitespace and complete comments.
size_t skip_insignificant(std::string_view text, size_t pos) {
    while (pos < text.size()) {
        if (is_space(text[pos])) {
            ++pos;
        } else if (text.compare(pos, 2, "/*") == 0) {
            size_t close = text.find("*/", pos + 2);
            if (close == std::string_view::npos) return text.size();
            pos = close + 2;
        } else {
            break;
        }
    }
    return pos;
}

std::string at_rule_name(std::string_view prelude) {
    std::string name;
    for (size_t i = 1; i < prelude.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(prelude[i]);
        if (!std::isalnum(c) && c != '-' && c != '_') break;
        name += static_cast<char>(std::tolower(c));
    }
    return name;
}

} // namespace

bool is_selectorless_at_rule(std::string_view name) {
    const std::string_view kKeyframes = "keyframes";
    if (name.size() >= kKeyframes.size() &&
        name.compare(name.size() - kKeyframes.size(), kKeyframes.size(),
                     kKeyframes) == 0) {
        return true;  // @keyframes, @-webkit-keyframes, ...
    }
    return name == "font-face" || name == "page" || name == "property" ||
           name == "counter-style" || name == "font-feature-values" ||
           name == "font-palette-values" || name == "viewport" ||
           name == "-ms-viewport";
}

SelectorExtractor::SelectorExtractor(std::string_view css) : css_(css) {}

void SelectorExtractor::reset() {
    pos_ = 0;
    state_ = State::Default;
    return_state_ = State::Default;
    quote_ = '\0';
    string_start_ = 0;
    comment_start_ = 0;
    skip_depth_ = 0;
    prelude_start_ = 0;
    open_blocks_.clear();
    failed_ = false;
    error_ = ExtractionError{};
}

bool SelectorExtractor::fail(const std::string& message, size_t offset) {
    failed_ = true;
    error_.message = message;
    error_.offset = offset;
    pos_ = css_.size();
    return false;
}

bool SelectorExtractor::finish() {
    switch (state_) {
        case State::InString:
            return fail("unterminated string", string_start_);
        case State::InComment:
            return fail("unterminated comment", comment_start_);
        default:
            break;
    }
    if (!open_blocks_.empty()) {
        return fail("unclosed '{'", open_blocks_.back());
    }
    return true;
}

void SelectorExtractor::step_skip_block(char c) {
    if (c == '{') {
        ++skip_depth_;
    } else if (c == '}') {
        --skip_depth_;
        if (skip_depth_ == 0) {
            open_blocks_.pop_back();
            state_ = State::Default;
            prelude_start_ = pos_ + 1;
        }
    }
    ++pos_;
}

std::optional<RawSelectorList> SelectorExtractor::open_block() {
    size_t brace = pos_;
    size_t start = skip_insignificant(css_, prelude_start_);
    size_t end = brace;
    while (end > start && is_space(css_[end - 1])) --end;

    open_blocks_.push_back(brace);
    prelude_start_ = brace + 1;
    ++pos_;

    if (start >= end) {
        return std::nullopt;  // stray '{}'
    }

    std::string_view prelude = css_.substr(start, end - start);
    if (prelude.front() == '@') {
        if (is_selectorless_at_rule(at_rule_name(prelude))) {
            state_ = State::InAtRuleBlockSkip;
            skip_depth_ = 1;
        }
        return std::nullopt;
    }
    return RawSelectorList{std::string(prelude), start};
}

std::optional<RawSelectorList> SelectorExtractor::next() {
    while (!failed_ && pos_ < css_.size()) {
        char c = css_[pos_];

        switch (state_) {
            case State::InComment:
                if (c == '*' && pos_ + 1 < css_.size() && css_[pos_ + 1] == '/') {
                    pos_ += 2;
                    state_ = return_state_;
                } else {
                    ++pos_;
                }
                continue;

            case State::InString:
                if (c == '\\') {
                    pos_ += 2;  // escaped character never closes the string
                } else {
                    if (c == quote_) state_ = return_state_;
                    ++pos_;
                }
                continue;

            case State::InAtRuleBlockSkip:
            case State::Default:
                break;
        }

        // An escaped quote or brace is part of an identifier.
        if (c == '\\') {
            pos_ = std::min(pos_ + 2, css_.size());
            continue;
        }
        if (c == '/' && pos_ + 1 < css_.size() && css_[pos_ + 1] == '*') {
            comment_start_ = pos_;
            return_state_ = state_;
            state_ = State::InComment;
            pos_ += 2;
            continue;
        }
        if (c == '"' || c == '\'') {
            string_start_ = pos_;
            quote_ = c;
            return_state_ = state_;
            state_ = State::InString;
            ++pos_;
            continue;
        }

        if (state_ == State::InAtRuleBlockSkip) {
            step_skip_block(c);
            continue;
        }

        if (c == '{') {
            if (auto found = open_block()) {
                return found;
            }
            continue;
        }
        if (c == '}') {
            if (open_blocks_.empty()) {
                fail("unmatched '}'", pos_);
                return std::nullopt;
            }
            open_blocks_.pop_back();
            prelude_start_ = pos_ + 1;
        } else if (c == ';') {
            prelude_start_ = pos_ + 1;
        }
        ++pos_;
    }

    if (!failed_) {
        finish();
    }
    return std::nullopt;
}

ExtractionResult extract_selectors(std::string_view css) {
    ExtractionResult result;
    SelectorExtractor extractor(css);
    while (auto found = extractor.next()) {
        result.selectors.push_back(std::move(*found));
    }
    result.ok = !extractor.failed();
    if (!result.ok) {
        result.error = extractor.error();
    }
    return result;
}

} // namespace selcheck::css
