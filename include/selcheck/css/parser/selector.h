#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace selcheck::css {

enum class SimpleSelectorType {
    Type,         // div, svg|rect
    Class,        // .foo
    Id,           // #bar
    Universal,    // *, *|*
    Attribute,    // [attr=val]
    PseudoClass,  // :hover, :not(.a)
    PseudoElement, // ::before, :after
    Nesting       // & (parent rule reference in nested CSS)
};

enum class AttributeMatch {
    Exists,     // [attr]
    Exact,      // [attr=val]
    Includes,   // [attr~=val]
    DashMatch,  // [attr|=val]
    Prefix,     // [attr^=val]
    Suffix,     // [attr$=val]
    Substring   // [attr*=val]
};

struct SelectorList;

struct SimpleSelector {
    SimpleSelectorType type;
    std::string value;

    // Namespace prefix of a type, universal or attribute selector
    // ("svg" in svg|rect, "*" in *|a, "" in |a).
    std::optional<std::string> ns;

    // Attribute selector specifics
    AttributeMatch attr_match = AttributeMatch::Exists;
    std::string attr_name;
    std::string attr_value;
    char attr_flag = '\0';  // 'i' or 's' case-sensitivity modifier

    // Functional pseudo-classes and pseudo-elements keep the raw argument
    // text. `arguments` holds the parsed selector list for pseudo-classes
    // whose argument is one (:not, :is, :where, :has, :nth-child(... of S)).
    bool is_function = false;
    std::string argument;
    std::string anb;  // An+B part of :nth-child / :nth-last-child
    std::shared_ptr<const SelectorList> arguments;
};

enum class Combinator {
    Descendant,        // space
    Child,             // >
    NextSibling,       // +
    SubsequentSibling, // ~
    Column             // ||
};

struct CompoundSelector {
    std::vector<SimpleSelector> simple_selectors;
};

struct ComplexSelector {
    struct Part {
        CompoundSelector compound;
        std::optional<Combinator> combinator;  // combinator BEFORE this compound
    };
    std::vector<Part> parts;
};

struct SelectorList {
    std::vector<ComplexSelector> selectors;
};

struct SelectorParseError {
    std::string message;
    std::string fragment;  // offending text
    size_t offset = 0;     // offset of the fragment in the parsed input
};

// One comma-separated selector of a selector list, parsed on its own.
struct SelectorEntry {
    std::string text;      // trimmed selector text
    size_t offset = 0;     // offset of `text` in the parsed input
    bool ok = false;
    ComplexSelector selector;
    SelectorParseError error;
};

struct SelectorListParseResult {
    bool ok = false;
    SelectorList list;
    SelectorParseError error;
};

// Splits `input` on top-level commas and parses every selector
// independently, so one malformed selector does not hide its siblings.
std::vector<SelectorEntry> parse_selector_entries(std::string_view input);

// Strict parse: fails on the first malformed selector.
SelectorListParseResult parse_selector_list(std::string_view input);

bool is_forwarding_pseudo_class(std::string_view name);
bool is_legacy_pseudo_element(std::string_view name);

std::string combinator_text(Combinator combinator);
std::string serialize(const SimpleSelector& selector);
std::string serialize(const ComplexSelector& selector);
std::string serialize(const SelectorList& list);

} // namespace selcheck::css
