#include <gtest/gtest.h>
#include <selcheck/css/parser/selector.h>
#include <selcheck/css/specificity.h>

#include <string>

using namespace selcheck::css;

namespace {

Specificity spec_of(std::string_view selector) {
    auto result = parse_selector_list(selector);
    EXPECT_TRUE(result.ok) << selector << ": " << result.error.message;
    if (!result.ok || result.list.selectors.empty()) {
        return Specificity{};
    }
    return compute_specificity(result.list.selectors[0]);
}

Specificity make(int a, int b, int c, int d) {
    return Specificity{a, b, c, d};
}

} // namespace

class SpecificityTest : public ::testing::Test {};

// ---------------------------------------------------------------------------
// Counting
// ---------------------------------------------------------------------------

TEST_F(SpecificityTest, TypeSelector) {
    EXPECT_EQ(spec_of("div"), make(0, 0, 0, 1));
}

TEST_F(SpecificityTest, UniversalCountsNothing) {
    EXPECT_EQ(spec_of("*"), make(0, 0, 0, 0));
    EXPECT_EQ(spec_of("*|*"), make(0, 0, 0, 0));
    EXPECT_EQ(spec_of("* > *"), make(0, 0, 0, 0));
}

TEST_F(SpecificityTest, ClassAttributeAndPseudoClassTier) {
    for (int n = 1; n <= 5; ++n) {
        std::string classes;
        std::string attributes;
        std::string pseudos;
        for (int i = 0; i < n; ++i) {
            classes += ".c" + std::to_string(i);
            attributes += "[data-" + std::to_string(i) + "]";
            pseudos += ":hover";
        }
        EXPECT_EQ(spec_of(classes), make(0, 0, n, 0)) << classes;
        EXPECT_EQ(spec_of(attributes), make(0, 0, n, 0)) << attributes;
        EXPECT_EQ(spec_of(pseudos), make(0, 0, n, 0)) << pseudos;
    }
}

TEST_F(SpecificityTest, IdTier) {
    for (int n = 1; n <= 5; ++n) {
        std::string ids;
        for (int i = 0; i < n; ++i) {
            ids += "#id" + std::to_string(i);
        }
        EXPECT_EQ(spec_of(ids), make(0, n, 0, 0)) << ids;
    }
}

TEST_F(SpecificityTest, TypeAndPseudoElementTier) {
    for (int n = 1; n <= 5; ++n) {
        std::string types;
        for (int i = 0; i < n; ++i) {
            if (i > 0) types += " ";
            types += "div";
        }
        EXPECT_EQ(spec_of(types), make(0, 0, 0, n)) << types;
    }
    EXPECT_EQ(spec_of("p::before"), make(0, 0, 0, 2));
    EXPECT_EQ(spec_of("p:first-letter"), make(0, 0, 0, 2));
    EXPECT_EQ(spec_of("::part(label)"), make(0, 0, 0, 1));
}

TEST_F(SpecificityTest, CombinatorsContributeNothing) {
    EXPECT_EQ(spec_of("a > b"), make(0, 0, 0, 2));
    EXPECT_EQ(spec_of("a b"), make(0, 0, 0, 2));
    EXPECT_EQ(spec_of("a + b"), make(0, 0, 0, 2));
    EXPECT_EQ(spec_of("a ~ b"), make(0, 0, 0, 2));
    EXPECT_EQ(spec_of("a || b"), make(0, 0, 0, 2));
}

TEST_F(SpecificityTest, MixedSelector) {
    EXPECT_EQ(spec_of("#nav .menu li a"), make(0, 1, 1, 2));
    EXPECT_EQ(spec_of("input[type=checkbox]:checked + label::after"),
              make(0, 0, 2, 3));
}

TEST_F(SpecificityTest, NestingSelectorCountsNothing) {
    EXPECT_EQ(spec_of("& .child"), make(0, 0, 1, 0));
}

// ---------------------------------------------------------------------------
// Functional pseudo-classes
// ---------------------------------------------------------------------------

TEST_F(SpecificityTest, WhereIsAlwaysZero) {
    EXPECT_EQ(spec_of(":where(#a.b.c)"), make(0, 0, 0, 0));
    EXPECT_EQ(spec_of("p:where(.x, #y)"), make(0, 0, 0, 1));
}

TEST_F(SpecificityTest, NotTakesMostSpecificArgument) {
    EXPECT_EQ(spec_of(":not(.a, #b)"), make(0, 1, 0, 0));
}

TEST_F(SpecificityTest, IsTakesMostSpecificArgument) {
    EXPECT_EQ(spec_of(":is(.a.b, .c)"), make(0, 0, 2, 0));
}

TEST_F(SpecificityTest, HasTakesMostSpecificArgument) {
    EXPECT_EQ(spec_of("a:has(> img.hero, + p)"), make(0, 0, 1, 2));
}

TEST_F(SpecificityTest, NestedForwardingPseudoClasses) {
    EXPECT_EQ(spec_of(":not(:is(.a, #b.c))"), make(0, 1, 1, 0));
    EXPECT_EQ(spec_of(":is(:where(#x), .y)"), make(0, 0, 1, 0));
}

TEST_F(SpecificityTest, NthChildOfSelector) {
    EXPECT_EQ(spec_of("li:nth-child(2n+1 of .a.b)"), make(0, 0, 2, 1));
    EXPECT_EQ(spec_of("li:nth-last-child(1 of #x)"), make(0, 1, 0, 1));
}

TEST_F(SpecificityTest, NthChildWithoutOfIsPlainPseudoClass) {
    EXPECT_EQ(spec_of("li:nth-child(2n+1)"), make(0, 0, 1, 1));
    EXPECT_EQ(spec_of("td:nth-of-type(odd)"), make(0, 0, 1, 1));
}

TEST_F(SpecificityTest, EmptyArgumentListCountsAsPseudoClass) {
    EXPECT_EQ(spec_of(":is()"), make(0, 0, 1, 0));
    EXPECT_EQ(spec_of(":where()"), make(0, 0, 0, 0));
}

TEST_F(SpecificityTest, OtherFunctionalPseudoClasses) {
    EXPECT_EQ(spec_of(":lang(en)"), make(0, 0, 1, 0));
    EXPECT_EQ(spec_of(":-webkit-any(a, #b)"), make(0, 0, 1, 0));
}

TEST_F(SpecificityTest, ForwardingNamesAreCaseInsensitive) {
    EXPECT_EQ(spec_of(":NOT(#a)"), make(0, 1, 0, 0));
    EXPECT_EQ(spec_of(":Where(#a)"), make(0, 0, 0, 0));
}

TEST_F(SpecificityTest, MaxSpecificity) {
    auto result = parse_selector_list(".a, #b, div");
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(max_specificity(result.list), make(0, 1, 0, 0));
    EXPECT_EQ(max_specificity(SelectorList{}), make(0, 0, 0, 0));
}

TEST_F(SpecificityTest, InlineStyle) {
    EXPECT_EQ(inline_style_specificity(), make(1, 0, 0, 0));
    EXPECT_TRUE(exceeds_threshold(inline_style_specificity(), make(0, 99, 99, 99)));
}

// ---------------------------------------------------------------------------
// Ordering
// ---------------------------------------------------------------------------

TEST_F(SpecificityTest, LexicographicOrdering) {
    EXPECT_GT(make(0, 1, 0, 0), make(0, 0, 99, 99));
    EXPECT_GT(make(0, 0, 1, 0), make(0, 0, 0, 1000));
    EXPECT_LT(make(0, 0, 1, 2), make(0, 0, 1, 3));
    EXPECT_LE(make(0, 0, 1, 2), make(0, 0, 1, 2));
    EXPECT_NE(make(0, 0, 1, 2), make(0, 0, 2, 1));
}

TEST_F(SpecificityTest, ExceedsThresholdIsStrict) {
    Specificity threshold = make(0, 1, 3, 3);
    EXPECT_FALSE(exceeds_threshold(make(0, 1, 3, 3), threshold));
    EXPECT_FALSE(exceeds_threshold(make(0, 1, 1, 2), threshold));
    EXPECT_TRUE(exceeds_threshold(make(0, 1, 3, 4), threshold));
    EXPECT_TRUE(exceeds_threshold(make(0, 2, 0, 0), threshold));
}

TEST_F(SpecificityTest, ToString) {
    EXPECT_EQ(make(0, 1, 2, 3).to_string(), "0,1,2,3");
}

// ---------------------------------------------------------------------------
// Threshold parsing
// ---------------------------------------------------------------------------

TEST_F(SpecificityTest, ParseThreshold) {
    auto result = parse_specificity("0,1,3,3");
    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.value, make(0, 1, 3, 3));

    auto spaced = parse_specificity(" 1 , 0, 12 ,4 ");
    ASSERT_TRUE(spaced.ok) << spaced.error;
    EXPECT_EQ(spaced.value, make(1, 0, 12, 4));
}

TEST_F(SpecificityTest, ParseThresholdWrongArity) {
    auto result = parse_specificity("0,1,3");
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error,
              "expected 4 comma-separated values (inline,id,class,type), got 3");
    EXPECT_FALSE(parse_specificity("0,1,3,3,0").ok);
}

TEST_F(SpecificityTest, ParseThresholdRejectsBadFields) {
    EXPECT_EQ(parse_specificity("0,,3,3").error, "id value is empty");
    EXPECT_EQ(parse_specificity("0,-1,3,3").error,
              "id value must not be negative: '-1'");
    EXPECT_EQ(parse_specificity("0,1,x,3").error,
              "class value is not a non-negative integer: 'x'");
    EXPECT_EQ(parse_specificity("0,1,3,+1").error,
              "type value is not a non-negative integer: '+1'");
    EXPECT_EQ(parse_specificity("0,1,3,2.5").error,
              "type value is not a non-negative integer: '2.5'");
    EXPECT_EQ(parse_specificity("99999999999,0,0,0").error,
              "inline value is out of range: '99999999999'");
}
