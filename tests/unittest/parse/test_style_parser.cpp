/**
 * ************************************************************************
 *
 * @file test_style_parser.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-18
 * @version 0.1
 * @brief 样式解析单元测试
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include <gtest/gtest.h>
#include "src/tx/parse/StyleParser.hpp"

using nlohmann::json;
using namespace tx;
using tx::parse::StyleParser;

// 测试 1: 尺寸的三种写法
TEST(StyleParserTest, Dimensions)
{
    EXPECT_EQ(StyleParser::parseDimension(120), Dimension::Point(120.0F));
    EXPECT_EQ(StyleParser::parseDimension("48"), Dimension::Point(48.0F));
    EXPECT_EQ(StyleParser::parseDimension("50%"), Dimension::Percent(50.0F));
    EXPECT_EQ(StyleParser::parseDimension("auto"), Dimension::Auto());
    EXPECT_FALSE(StyleParser::parseDimension("wide").has_value());
    EXPECT_FALSE(StyleParser::parseDimension("x%").has_value());
    EXPECT_FALSE(StyleParser::parseDimension(true).has_value());
}

// 测试 2: 边距支持数值、数组与对象
TEST(StyleParserTest, EdgeInsets)
{
    EXPECT_EQ(StyleParser::parseEdgeInsets(4), EdgeInsets::All(4.0F));
    EXPECT_EQ(StyleParser::parseEdgeInsets(json::array({2, 6})), EdgeInsets::Symmetric(2.0F, 6.0F));

    // [top, right, bottom, left]
    const auto four = StyleParser::parseEdgeInsets(json::array({1, 2, 3, 4}));
    ASSERT_TRUE(four.has_value());
    EXPECT_FLOAT_EQ(four->top, 1.0F);
    EXPECT_FLOAT_EQ(four->right, 2.0F);
    EXPECT_FLOAT_EQ(four->bottom, 3.0F);
    EXPECT_FLOAT_EQ(four->left, 4.0F);

    const auto partial = StyleParser::parseEdgeInsets(json{{"top", 5}});
    ASSERT_TRUE(partial.has_value());
    EXPECT_FLOAT_EQ(partial->top, 5.0F);
    EXPECT_FLOAT_EQ(partial->left, 0.0F);

    EXPECT_FALSE(StyleParser::parseEdgeInsets(json::array({1, 2, 3})).has_value());
    EXPECT_FALSE(StyleParser::parseEdgeInsets(json{{"top", "x"}}).has_value());
}

// 测试 3: 颜色
TEST(StyleParserTest, Colors)
{
    EXPECT_EQ(StyleParser::parseColor("#FF0000"), Color::Red());
    EXPECT_EQ(StyleParser::parseColor("#fff"), Color::White());
    EXPECT_EQ(StyleParser::parseColor("00000000"), Color::Transparent());

    const auto translucent = StyleParser::parseColor(0x80000000U);
    ASSERT_TRUE(translucent.has_value());
    EXPECT_NEAR(translucent->alpha, 128.0F / 255.0F, 1e-6F);

    EXPECT_FALSE(StyleParser::parseColor("#12345").has_value());
    EXPECT_FALSE(StyleParser::parseColor("#GGGGGG").has_value());
    EXPECT_FALSE(StyleParser::parseColor(1.5).has_value());
}

// 测试 4: 完整样式对象
TEST(StyleParserTest, FullStyle)
{
    const json source = {
        {"width", "100%"},
        {"height", 44},
        {"padding", 8},
        {"flexDirection", "row"},
        {"justifyContent", "center"},
        {"alignItems", "center"},
        {"flexGrow", 1},
        {"backgroundColor", "#FFFFFF"},
        {"cornerRadius", 6},
        {"fontSize", 14},
        {"numberOfLines", 2},
    };

    auto style = StyleParser::parse(source);
    ASSERT_TRUE(style.has_value()) << style.error();
    EXPECT_EQ(style->width, Dimension::Percent(100.0F));
    EXPECT_EQ(style->height, Dimension::Point(44.0F));
    EXPECT_EQ(style->padding, EdgeInsets::All(8.0F));
    EXPECT_EQ(style->flexDirection, policies::FlexDirection::ROW);
    EXPECT_EQ(style->justifyContent, policies::Justify::CENTER);
    EXPECT_EQ(style->alignItems, policies::Align::CENTER);
    EXPECT_FLOAT_EQ(style->flexGrow, 1.0F);
    EXPECT_EQ(style->backgroundColor, Color::White());
    EXPECT_FLOAT_EQ(style->cornerRadius, 6.0F);
    EXPECT_EQ(style->fontSize, 14.0F);
    EXPECT_EQ(style->numberOfLines, 2);
    EXPECT_TRUE(style->hasVisualEffect());
}

// 测试 5: 快捷属性在全部键之后合并
TEST(StyleParserTest, Shorthands)
{
    auto style = StyleParser::parse(json{{"paddingHorizontal", 12}, {"padding", 2}, {"marginVertical", 3}});
    ASSERT_TRUE(style.has_value());
    EXPECT_FLOAT_EQ(style->padding.left, 12.0F);
    EXPECT_FLOAT_EQ(style->padding.right, 12.0F);
    EXPECT_FLOAT_EQ(style->padding.top, 2.0F);
    EXPECT_FLOAT_EQ(style->margin.top, 3.0F);
    EXPECT_FLOAT_EQ(style->margin.bottom, 3.0F);
    EXPECT_FLOAT_EQ(style->margin.left, 0.0F);
}

// 测试 6: color 只在未设置 textColor 时生效
TEST(StyleParserTest, ColorFallsBackToTextColor)
{
    auto onlyColor = StyleParser::parse(json{{"color", "#000000"}});
    ASSERT_TRUE(onlyColor.has_value());
    EXPECT_EQ(onlyColor->textColor, Color::Black());

    auto both = StyleParser::parse(json{{"color", "#000000"}, {"textColor", "#FF0000"}});
    ASSERT_TRUE(both.has_value());
    EXPECT_EQ(both->textColor, Color::Red());
}

// 测试 7: 绝对定位
TEST(StyleParserTest, AbsolutePosition)
{
    auto style = StyleParser::parse(json{{"position", "absolute"}, {"top", 10}, {"right", 4}});
    ASSERT_TRUE(style.has_value());
    EXPECT_EQ(style->positionType, policies::PositionType::ABSOLUTE);
    EXPECT_EQ(style->position.top, 10.0F);
    EXPECT_EQ(style->position.right, 4.0F);
    EXPECT_FALSE(style->position.left.has_value());
}

// 测试 8: 未知键忽略，取值错误报告键名
TEST(StyleParserTest, ErrorsNameTheKey)
{
    auto ignored = StyleParser::parse(json{{"shimmer", true}, {"width", 10}});
    ASSERT_TRUE(ignored.has_value());
    EXPECT_EQ(ignored->width, Dimension::Point(10.0F));

    auto bad = StyleParser::parse(json{{"flexDirection", "diagonal"}});
    ASSERT_FALSE(bad.has_value());
    EXPECT_NE(bad.error().find("flexDirection"), std::string::npos);

    EXPECT_FALSE(StyleParser::parse(json::array({1, 2})).has_value());
}

// 测试 9: null 得到默认样式
TEST(StyleParserTest, NullIsDefault)
{
    auto style = StyleParser::parse(json());
    ASSERT_TRUE(style.has_value());
    EXPECT_EQ(*style, Style{});
    EXPECT_FALSE(style->hasVisualEffect());
}
