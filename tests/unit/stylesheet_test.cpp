#include <gtest/gtest.h>
#include <minicss/css/css_parser.h>
#include <minicss/css/stylesheet.h>

using namespace minicss::css;

class StyleSheetModelTest : public ::testing::Test {};

TEST_F(StyleSheetModelTest, PropertyKindNames) {
    EXPECT_STREQ(property_kind_name(PropertyKind::Color), "color");
    EXPECT_STREQ(property_kind_name(PropertyKind::Background), "background");
    EXPECT_STREQ(property_kind_name(PropertyKind::Unknown), "unknown");
}

TEST_F(StyleSheetModelTest, LookupRecognizedNames) {
    ASSERT_TRUE(lookup_property_kind("color").has_value());
    EXPECT_EQ(*lookup_property_kind("color"), PropertyKind::Color);
    ASSERT_TRUE(lookup_property_kind("background").has_value());
    EXPECT_EQ(*lookup_property_kind("background"), PropertyKind::Background);
}

TEST_F(StyleSheetModelTest, LookupRejectsEverythingElse) {
    EXPECT_FALSE(lookup_property_kind("margin").has_value());
    EXPECT_FALSE(lookup_property_kind("unknown").has_value());
    EXPECT_FALSE(lookup_property_kind("Color").has_value());
    EXPECT_FALSE(lookup_property_kind("").has_value());
}

TEST_F(StyleSheetModelTest, DefaultPropertyIsUnknown) {
    Property property;
    EXPECT_EQ(property.kind, PropertyKind::Unknown);
    EXPECT_TRUE(property.value.empty());
}

class FormatSheetTest : public ::testing::Test {};

TEST_F(FormatSheetTest, EmptySheetPrintsNothing) {
    EXPECT_EQ(format_sheet(Sheet{}), "");
}

TEST_F(FormatSheetTest, RulesThenDeclarationsInOrder) {
    auto result = parse_sheet("a { color: red; background: blue; } b { color: green; }");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(format_sheet(result.sheet),
              "selector: a\n"
              " color: red\n"
              " background: blue\n"
              "\n"
              "selector: b\n"
              " color: green\n"
              "\n");
}

TEST_F(FormatSheetTest, UnknownPropertiesAreSkipped) {
    Sheet sheet;
    Rule rule;
    rule.selector = "p";
    rule.properties.push_back(Property{PropertyKind::Unknown, "x"});
    rule.properties.push_back(Property{PropertyKind::Background, "black"});
    sheet.rules.push_back(rule);
    EXPECT_EQ(format_sheet(sheet), "selector: p\n background: black\n\n");
}
