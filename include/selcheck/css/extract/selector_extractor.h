#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace selcheck::css {

// Raw selector-list text found before a rule block's '{'.
struct RawSelectorList {
    std::string text;
    size_t offset = 0;  // offset of `text` in the stylesheet
};

struct ExtractionError {
    std::string message;
    size_t offset = 0;
};

struct ExtractionResult {
    bool ok = false;
    std::vector<RawSelectorList> selectors;  // everything found before an error
    ExtractionError error;
};

// Scans stylesheet text for rule preludes without parsing declarations.
// Comments and strings are honored; at-rule preludes are never reported;
// blocks of conditional at-rules (@media, @supports, ...) and nested style
// rules are scanned, blocks of @keyframes, @font-face and similar are skipped.
//
// next() yields selector lists lazily in source order. Once it returns
// nullopt, either the input is exhausted or failed() is true and error()
// describes the malformed input.
class SelectorExtractor {
public:
    enum class State {
        Default,
        InString,
        InComment,
        InAtRuleBlockSkip,
    };

    explicit SelectorExtractor(std::string_view css);

    std::optional<RawSelectorList> next();
    void reset();

    bool failed() const { return failed_; }
    const ExtractionError& error() const { return error_; }
    State state() const { return state_; }

private:
    std::string_view css_;
    size_t pos_ = 0;
    State state_ = State::Default;
    State return_state_ = State::Default;  // state to resume after a string or comment
    char quote_ = '\0';
    size_t string_start_ = 0;
    size_t comment_start_ = 0;
    size_t skip_depth_ = 0;
    size_t prelude_start_ = 0;
    std::vector<size_t> open_blocks_;  // offsets of unmatched '{'
    bool failed_ = false;
    ExtractionError error_;

    bool fail(const std::string& message, size_t offset);
    bool finish();
    void step_skip_block(char c);
    std::optional<RawSelectorList> open_block();
};

bool is_selectorless_at_rule(std::string_view name);

ExtractionResult extract_selectors(std::string_view css);

} // namespace selcheck::css
