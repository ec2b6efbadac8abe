/**
 * ************************************************************************
 *
 * @file test_json_template_parser.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-18
 * @version 0.1
 * @brief JSON 模板解析单元测试
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include <gtest/gtest.h>
#include "src/tx/parse/JsonTemplateParser.hpp"

using nlohmann::json;
using namespace tx;
using tx::parse::JsonTemplateParser;

class JsonTemplateParserTest : public ::testing::Test
{
protected:
    JsonTemplateParser m_parser;

    std::unique_ptr<Node> parseOk(std::string_view text)
    {
        auto result = m_parser.parse(text);
        EXPECT_TRUE(result.has_value()) << (result ? "" : result.error());
        return result ? std::move(*result) : nullptr;
    }
};

// 测试 1: 基本结构与 id
TEST_F(JsonTemplateParserTest, BuildsTree)
{
    auto root = parseOk(R"({
        "type": "view", "id": "card",
        "children": [
            {"type": "text", "id": "title", "props": {"text": "Hi"}},
            {"type": "image", "props": {"src": "a.png", "scaleType": "fill"}},
            {"type": "button", "props": {"title": "Go", "disabled": true}}
        ]
    })");
    ASSERT_NE(root, nullptr);

    EXPECT_EQ(root->id(), "card");
    EXPECT_EQ(root->kind(), NodeKind::VIEW);
    ASSERT_EQ(root->childCount(), 3U);
    EXPECT_EQ(root->childAt(0)->contentAs<TextContent>()->text, "Hi");

    const Node* image = root->childAt(1);
    EXPECT_EQ(image->kind(), NodeKind::IMAGE);
    EXPECT_EQ(image->id(), "image_0");
    EXPECT_EQ(image->contentAs<ImageContent>()->src, "a.png");
    EXPECT_EQ(image->contentAs<ImageContent>()->scaleType, "fill");

    const Node* button = root->childAt(2);
    EXPECT_EQ(button->id(), "button_1");
    EXPECT_EQ(button->contentAs<ButtonContent>()->title, "Go");
    EXPECT_TRUE(button->contentAs<ButtonContent>()->disabled);
}

// 测试 2: 外层 root 包装
TEST_F(JsonTemplateParserTest, AcceptsRootWrapper)
{
    auto root = parseOk(R"({"version": 2, "root": {"type": "scroll", "props": {"horizontal": true}}})");
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->kind(), NodeKind::SCROLL);
    EXPECT_TRUE(root->contentAs<ScrollContent>()->horizontal);
}

// 测试 3: 表达式延后到绑定阶段，字面量进 bindings
TEST_F(JsonTemplateParserTest, ExpressionsAndBindings)
{
    auto root = parseOk(R"({
        "type": "text", "id": "t",
        "props": {"text": "${user.name}", "badge": 3},
        "bindings": {"key": "row-1", "subtitle": "Hello ${user.city}"}
    })");
    ASSERT_NE(root, nullptr);

    EXPECT_EQ(root->expressions().at("text"), "${user.name}");
    EXPECT_EQ(root->expressions().at("subtitle"), "Hello ${user.city}");
    EXPECT_EQ(root->contentAs<TextContent>()->text, "");
    EXPECT_EQ(root->bindings().at("badge"), 3);
    EXPECT_EQ(root->key(), "row-1");
}

// 测试 4: 事件声明
TEST_F(JsonTemplateParserTest, Events)
{
    auto root = parseOk(R"({"type": "button", "events": {"click": {"action": "open", "url": "/detail"}}})");
    ASSERT_NE(root, nullptr);
    ASSERT_EQ(root->events().size(), 1U);
    EXPECT_EQ(root->events().at("click").at("action"), "open");
    EXPECT_FALSE(root->flattenable());
}

// 测试 5: 样式写入节点，错误样式标记解析失败
TEST_F(JsonTemplateParserTest, StyleAndStyleErrors)
{
    auto root = parseOk(R"({
        "type": "view", "id": "root", "style": {"width": 200, "flexDirection": "row"},
        "children": [{"type": "view", "id": "bad", "style": {"width": "huge"}}]
    })");
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->style().width, Dimension::Point(200.0F));
    EXPECT_EQ(root->style().flexDirection, policies::FlexDirection::ROW);
    EXPECT_FALSE(root->hasParseError());

    const Node* bad = root->findById("bad");
    EXPECT_TRUE(bad->hasParseError());
    EXPECT_EQ(bad->style(), Style{});
}

// 测试 6: 未知类型保留为 UNKNOWN 节点，缺少 type 的子节点被跳过
TEST_F(JsonTemplateParserTest, UnknownAndMissingTypes)
{
    auto root = parseOk(R"({
        "type": "view",
        "children": [{"type": "lottie", "id": "anim"}, {"id": "nameless"}, 42, {"type": "container"}]
    })");
    ASSERT_NE(root, nullptr);
    ASSERT_EQ(root->childCount(), 2U);
    EXPECT_EQ(root->childAt(0)->kind(), NodeKind::UNKNOWN);
    EXPECT_EQ(root->childAt(0)->id(), "anim");
    EXPECT_EQ(root->childAt(1)->kind(), NodeKind::VIEW);
}

// 测试 7: 整体失败的情况
TEST_F(JsonTemplateParserTest, Failures)
{
    EXPECT_FALSE(m_parser.parse("{ nope").has_value());
    EXPECT_FALSE(m_parser.parse("[1, 2]").has_value());
    EXPECT_FALSE(m_parser.parse(R"({"id": "x"})").has_value());
    EXPECT_FALSE(m_parser.parse(R"({"root": "view"})").has_value());
}

// 测试 8: 属性写入规则
TEST_F(JsonTemplateParserTest, ApplyProp)
{
    Node list("l", NodeKind::LIST);
    EXPECT_TRUE(JsonTemplateParser::applyProp(list, "columns", 3));
    EXPECT_FALSE(JsonTemplateParser::applyProp(list, "columns", 2.5));
    EXPECT_TRUE(JsonTemplateParser::applyProp(list, "itemSpacing", 4.5));
    EXPECT_EQ(list.contentAs<ListContent>()->columns, 3);
    EXPECT_FLOAT_EQ(list.contentAs<ListContent>()->itemSpacing, 4.5F);

    Node text("t", NodeKind::TEXT);
    EXPECT_FALSE(JsonTemplateParser::applyProp(text, "text", 12));
    EXPECT_FALSE(JsonTemplateParser::applyProp(text, "color", "#fff"));

    Node view("v", NodeKind::VIEW);
    EXPECT_FALSE(JsonTemplateParser::applyProp(view, "text", "x"));
}

// 测试 9: 表达式识别
TEST_F(JsonTemplateParserTest, IsExpression)
{
    EXPECT_TRUE(JsonTemplateParser::isExpression("${a}"));
    EXPECT_TRUE(JsonTemplateParser::isExpression("Hi ${a.b}!"));
    EXPECT_FALSE(JsonTemplateParser::isExpression("plain"));
    EXPECT_FALSE(JsonTemplateParser::isExpression(5));
}
