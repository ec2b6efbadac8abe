/**
 * ************************************************************************
 *
 * @file JsonTemplateParser.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-15
 * @version 0.1
 * @brief JSON 模板解析器（ITemplateParser 的参考实现）
 *
 * 节点格式：
 *   {
 *     "type": "text", "id": "title",
 *     "style": {...},
 *     "props": {"text": "${item.title}"},
 *     "bindings": {"key": "${item.id}"},
 *     "events": {"click": {...}},
 *     "children": [...]
 *   }
 * 顶层可以包一层 {"root": {...}}。含 "${" 的字符串作为绑定表达式保存，
 * 交给 DataBinder 解释；其余取值直接写入节点。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include "../core/Node.hpp"
#include "../interface/ITemplateParser.hpp"

namespace tx::parse
{

class JsonTemplateParser : public interface::ITemplateParser
{
public:
    std::expected<std::unique_ptr<Node>, std::string> parse(std::string_view rawTemplate) override;

    /**
     * @brief 解析已经反序列化的 JSON
     */
    std::expected<std::unique_ptr<Node>, std::string> parseJson(const nlohmann::json& json);

    /**
     * @brief 把一个属性值写入节点的类型专属内容
     * @return 该类型没有这个属性或取值类型不符时返回 false
     */
    static bool applyProp(Node& node, std::string_view name, const nlohmann::json& value);

    /**
     * @brief 字符串中是否含有绑定表达式
     */
    [[nodiscard]] static bool isExpression(const nlohmann::json& value);

private:
    std::unique_ptr<Node> parseNode(const nlohmann::json& json, size_t& generatedIds);
};

} // namespace tx::parse
