/**
 * ************************************************************************
 *
 * @file JsonTemplateParser.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-15
 * @version 0.1
 * @brief JSON 模板解析实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "JsonTemplateParser.hpp"

#include <fmt/format.h>
#include "StyleParser.hpp"
#include "../singleton/Logger.hpp"

namespace tx::parse
{

namespace
{

bool readString(const nlohmann::json& value, std::string& out)
{
    if (!value.is_string()) return false;
    out = value.get<std::string>();
    return true;
}

bool readBool(const nlohmann::json& value, bool& out)
{
    if (!value.is_boolean()) return false;
    out = value.get<bool>();
    return true;
}

} // namespace

bool JsonTemplateParser::isExpression(const nlohmann::json& value)
{
    return value.is_string() && value.get_ref<const std::string&>().find("${") != std::string::npos;
}

bool JsonTemplateParser::applyProp(Node& node, std::string_view name, const nlohmann::json& value)
{
    switch (node.kind())
    {
        case NodeKind::TEXT:
        {
            auto* content = node.contentAs<TextContent>();
            if (name == "text") return readString(value, content->text);
            return false;
        }
        case NodeKind::IMAGE:
        {
            auto* content = node.contentAs<ImageContent>();
            if (name == "src" || name == "url") return readString(value, content->src);
            if (name == "scaleType") return readString(value, content->scaleType);
            if (name == "placeholder") return readString(value, content->placeholder);
            if (name == "tintColor")
            {
                auto color = StyleParser::parseColor(value);
                if (!color) return false;
                content->tintColor = color;
                return true;
            }
            return false;
        }
        case NodeKind::BUTTON:
        {
            auto* content = node.contentAs<ButtonContent>();
            if (name == "title" || name == "text") return readString(value, content->title);
            if (name == "icon") return readString(value, content->icon);
            if (name == "disabled") return readBool(value, content->disabled);
            if (name == "loading") return readBool(value, content->loading);
            return false;
        }
        case NodeKind::INPUT:
        {
            auto* content = node.contentAs<InputContent>();
            if (name == "text") return readString(value, content->text);
            if (name == "placeholder") return readString(value, content->placeholder);
            if (name == "inputType") return readString(value, content->inputType);
            if (name == "disabled") return readBool(value, content->disabled);
            if (name == "readOnly") return readBool(value, content->readOnly);
            return false;
        }
        case NodeKind::SCROLL:
        {
            auto* content = node.contentAs<ScrollContent>();
            if (name == "horizontal") return readBool(value, content->horizontal);
            if (name == "showsIndicator") return readBool(value, content->showsIndicator);
            return false;
        }
        case NodeKind::LIST:
        {
            auto* content = node.contentAs<ListContent>();
            if (name == "horizontal") return readBool(value, content->horizontal);
            if (name == "columns")
            {
                if (!value.is_number_integer()) return false;
                content->columns = value.get<int>();
                return true;
            }
            if (name == "itemSpacing")
            {
                if (!value.is_number()) return false;
                content->itemSpacing = value.get<float>();
                return true;
            }
            return false;
        }
        case NodeKind::VIEW:
        case NodeKind::UNKNOWN:
            break;
    }
    return false;
}

std::expected<std::unique_ptr<Node>, std::string> JsonTemplateParser::parse(std::string_view rawTemplate)
{
    auto json = nlohmann::json::parse(rawTemplate, nullptr, false);
    if (json.is_discarded())
    {
        Logger::error("[JsonTemplateParser] 模板不是合法 JSON");
        return std::unexpected(std::string("malformed JSON"));
    }
    return parseJson(json);
}

std::expected<std::unique_ptr<Node>, std::string> JsonTemplateParser::parseJson(const nlohmann::json& json)
{
    const nlohmann::json* rootJson = &json;
    if (json.is_object() && json.contains("root"))
    {
        rootJson = &json["root"];
    }
    if (!rootJson->is_object())
    {
        return std::unexpected(std::string("template root must be an object"));
    }
    if (!rootJson->contains("type") || !(*rootJson)["type"].is_string())
    {
        return std::unexpected(std::string("template root is missing 'type'"));
    }

    size_t generatedIds = 0;
    auto root = parseNode(*rootJson, generatedIds);
    if (!root)
    {
        return std::unexpected(std::string("failed to build root node"));
    }
    return root;
}

std::unique_ptr<Node> JsonTemplateParser::parseNode(const nlohmann::json& json, size_t& generatedIds)
{
    // 1. 类型与 id
    auto typeIter = json.find("type");
    if (typeIter == json.end() || !typeIter->is_string())
    {
        Logger::warn("[JsonTemplateParser] 节点缺少 type，已跳过");
        return nullptr;
    }
    const auto& typeName = typeIter->get_ref<const std::string&>();
    const NodeKind kind = kindFromString(typeName);

    std::string id;
    auto idIter = json.find("id");
    if (idIter != json.end() && idIter->is_string() && !idIter->get_ref<const std::string&>().empty())
    {
        id = idIter->get<std::string>();
    }
    else
    {
        id = fmt::format("{}_{}", typeName, generatedIds++);
    }

    auto node = std::make_unique<Node>(std::move(id), kind);
    if (kind == NodeKind::UNKNOWN)
    {
        Logger::warn("[JsonTemplateParser] 未知节点类型 {} ({})", typeName, node->id());
    }

    // 2. 样式
    if (auto styleIter = json.find("style"); styleIter != json.end())
    {
        auto style = StyleParser::parse(*styleIter);
        if (style)
        {
            node->setStyle(std::move(*style));
        }
        else
        {
            Logger::warn("[JsonTemplateParser] {} 样式解析失败: {}", node->id(), style.error());
            node->setParseError(true);
        }
    }

    // 3. 属性：表达式延后到绑定阶段，字面量直接写入
    if (auto propsIter = json.find("props"); propsIter != json.end() && propsIter->is_object())
    {
        for (const auto& [name, value] : propsIter->items())
        {
            if (isExpression(value))
            {
                node->setExpression(name, value.get<std::string>());
            }
            else if (!applyProp(*node, name, value))
            {
                node->setBinding(name, value);
            }
        }
    }

    // 4. 绑定
    if (auto bindingsIter = json.find("bindings"); bindingsIter != json.end() && bindingsIter->is_object())
    {
        for (const auto& [name, value] : bindingsIter->items())
        {
            if (isExpression(value))
            {
                node->setExpression(name, value.get<std::string>());
            }
            else
            {
                node->setBinding(name, value);
            }
        }
    }

    // 5. 事件
    if (auto eventsIter = json.find("events"); eventsIter != json.end() && eventsIter->is_object())
    {
        for (const auto& [name, value] : eventsIter->items())
        {
            node->declareEvent(name, value);
        }
    }

    // 6. 子节点
    if (auto childrenIter = json.find("children"); childrenIter != json.end() && childrenIter->is_array())
    {
        for (const auto& childJson : *childrenIter)
        {
            if (!childJson.is_object()) continue;
            if (auto child = parseNode(childJson, generatedIds))
            {
                node->addChild(std::move(child));
            }
        }
    }
    return node;
}

} // namespace tx::parse
