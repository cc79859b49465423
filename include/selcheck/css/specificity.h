#pragma once
#include <selcheck/css/parser/selector.h>
#include <string>
#include <string_view>

namespace selcheck::css {

struct Specificity {
    int a = 0;  // inline style (only set for an explicit inline-style context)
    int b = 0;  // ID selectors
    int c = 0;  // class, attribute, pseudo-class
    int d = 0;  // type, pseudo-element

    bool operator<(const Specificity& other) const;
    bool operator==(const Specificity& other) const;
    bool operator!=(const Specificity& other) const { return !(*this == other); }
    bool operator>(const Specificity& other) const { return other < *this; }
    bool operator<=(const Specificity& other) const { return !(other < *this); }
    bool operator>=(const Specificity& other) const { return !(*this < other); }

    Specificity& operator+=(const Specificity& other);

    // "a,b,c,d"
    std::string to_string() const;
};

struct SpecificityParseResult {
    bool ok = false;
    Specificity value;
    std::string error;
};

Specificity compute_specificity(const ComplexSelector& selector);

// Largest specificity among the list's selectors; (0,0,0,0) for an empty list.
Specificity max_specificity(const SelectorList& list);

// Specificity of a style attribute: (1,0,0,0). Selector text never reaches
// the inline tier, so the analyzer and reporter do not use this; it is the
// reference point for thresholds that set the first field.
Specificity inline_style_specificity();

// Parses "<inline>,<id>,<class>,<type>". Rejects wrong arity and negative or
// non-numeric fields instead of clamping.
SpecificityParseResult parse_specificity(std::string_view text);

// Strict lexicographic comparison, never a weighted sum.
bool exceeds_threshold(const Specificity& computed, const Specificity& threshold);

} // namespace selcheck::css
