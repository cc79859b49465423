#include <selcheck/css/specificity.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>
#include <vector>

namespace selcheck::css {

namespace {

std::string ascii_lower(std::string value) {
    std::transform(
        value.begin(),
        value.end(),
        value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

Specificity pseudo_class_specificity(const SimpleSelector& ss) {
    const std::string pseudo = ascii_lower(ss.value);
    Specificity spec;
    if (pseudo == "where") {
        return spec;
    }

    // :not()/:is()/:has() and :nth-child(An+B of S) take the specificity of
    // their most specific argument. An empty argument list counts as a plain
    // pseudo-class.
    bool takes_argument = is_forwarding_pseudo_class(pseudo) ||
                          ((pseudo == "nth-child" || pseudo == "nth-last-child") &&
                           ss.arguments);
    if (ss.is_function && takes_argument && ss.arguments &&
        !ss.arguments->selectors.empty()) {
        return max_specificity(*ss.arguments);
    }

    spec.c = 1;
    return spec;
}

} // namespace

// ---------------------------------------------------------------------------
// Specificity
// ---------------------------------------------------------------------------

bool Specificity::operator<(const Specificity& other) const {
    if (a != other.a) return a < other.a;
    if (b != other.b) return b < other.b;
    if (c != other.c) return c < other.c;
    return d < other.d;
}

bool Specificity::operator==(const Specificity& other) const {
    return a == other.a && b == other.b && c == other.c && d == other.d;
}

Specificity& Specificity::operator+=(const Specificity& other) {
    a += other.a;
    b += other.b;
    c += other.c;
    d += other.d;
    return *this;
}

std::string Specificity::to_string() const {
    return std::to_string(a) + "," + std::to_string(b) + "," +
           std::to_string(c) + "," + std::to_string(d);
}

Specificity compute_specificity(const ComplexSelector& selector) {
    Specificity spec;
    for (const auto& part : selector.parts) {
        for (const auto& ss : part.compound.simple_selectors) {
            switch (ss.type) {
                case SimpleSelectorType::Id:
                    spec.b++;
                    break;
                case SimpleSelectorType::Class:
                case SimpleSelectorType::Attribute:
                    spec.c++;
                    break;
                case SimpleSelectorType::PseudoClass:
                    spec += pseudo_class_specificity(ss);
                    break;
                case SimpleSelectorType::Type:
                case SimpleSelectorType::PseudoElement:
                    spec.d++;
                    break;
                case SimpleSelectorType::Universal:
                case SimpleSelectorType::Nesting:
                    // No contribution
                    break;
            }
        }
    }
    return spec;
}

Specificity max_specificity(const SelectorList& list) {
    Specificity max_spec;
    bool has_value = false;
    for (const auto& selector : list.selectors) {
        Specificity current = compute_specificity(selector);
        if (!has_value || max_spec < current) {
            max_spec = current;
            has_value = true;
        }
    }
    return max_spec;
}

Specificity inline_style_specificity() {
    Specificity spec;
    spec.a = 1;
    return spec;
}

SpecificityParseResult parse_specificity(std::string_view text) {
    SpecificityParseResult result;

    std::vector<std::string_view> fields;
    size_t start = 0;
    while (true) {
        size_t comma = text.find(',', start);
        if (comma == std::string_view::npos) {
            fields.push_back(trim(text.substr(start)));
            break;
        }
        fields.push_back(trim(text.substr(start, comma - start)));
        start = comma + 1;
    }

    if (fields.size() != 4) {
        result.error = "expected 4 comma-separated values "
                       "(inline,id,class,type), got " +
                       std::to_string(fields.size());
        return result;
    }

    static const char* const kFieldNames[] = {"inline", "id", "class", "type"};
    int values[4] = {0, 0, 0, 0};
    for (size_t i = 0; i < fields.size(); ++i) {
        std::string_view field = fields[i];
        std::string label = std::string(kFieldNames[i]) + " value";
        if (field.empty()) {
            result.error = label + " is empty";
            return result;
        }
        if (field.front() == '-') {
            result.error = label + " must not be negative: '" +
                           std::string(field) + "'";
            return result;
        }
        const char* begin = field.data();
        const char* end = begin + field.size();
        const std::from_chars_result parsed = std::from_chars(begin, end, values[i]);
        if (parsed.ec == std::errc::result_out_of_range) {
            result.error = label + " is out of range: '" + std::string(field) + "'";
            return result;
        }
        if (parsed.ec != std::errc() || parsed.ptr != end) {
            result.error = label + " is not a non-negative integer: '" +
                           std::string(field) + "'";
            return result;
        }
    }

    result.value = Specificity{values[0], values[1], values[2], values[3]};
    result.ok = true;
    return result;
}

bool exceeds_threshold(const Specificity& computed, const Specificity& threshold) {
    return computed > threshold;
}

} // namespace selcheck::css
