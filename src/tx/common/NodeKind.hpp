/**
 * ************************************************************************
 *
 * @file NodeKind.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.1
 * @brief 节点类型标签与各类型专属内容
 *
 * 类型字符串只在解析时转换一次，之后全部按封闭枚举分派。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include "Types.hpp"

namespace tx
{

enum class NodeKind : uint8_t
{
    VIEW,   // 容器
    TEXT,   // 文本
    IMAGE,  // 图片
    BUTTON, // 按钮
    INPUT,  // 输入框
    SCROLL, // 滚动容器
    LIST,   // 列表
    UNKNOWN // 未识别类型，渲染为占位视图
};

inline constexpr size_t NODE_KIND_COUNT = static_cast<size_t>(NodeKind::UNKNOWN) + 1;

inline constexpr std::array<std::pair<std::string_view, NodeKind>, 9> NODE_KIND_NAMES{{
    {"view", NodeKind::VIEW},
    {"container", NodeKind::VIEW},
    {"text", NodeKind::TEXT},
    {"image", NodeKind::IMAGE},
    {"button", NodeKind::BUTTON},
    {"input", NodeKind::INPUT},
    {"scroll", NodeKind::SCROLL},
    {"list", NodeKind::LIST},
    {"unknown", NodeKind::UNKNOWN},
}};

[[nodiscard]] constexpr NodeKind kindFromString(std::string_view name) noexcept
{
    for (const auto& [text, kind] : NODE_KIND_NAMES)
    {
        if (text == name) return kind;
    }
    return NodeKind::UNKNOWN;
}

[[nodiscard]] constexpr std::string_view toString(NodeKind kind) noexcept
{
    switch (kind)
    {
        case NodeKind::VIEW:
            return "view";
        case NodeKind::TEXT:
            return "text";
        case NodeKind::IMAGE:
            return "image";
        case NodeKind::BUTTON:
            return "button";
        case NodeKind::INPUT:
            return "input";
        case NodeKind::SCROLL:
            return "scroll";
        case NodeKind::LIST:
            return "list";
        case NodeKind::UNKNOWN:
            break;
    }
    return "unknown";
}

/**
 * @brief 文本内容是否需要测量回调（叶子节点尺寸由内容决定）
 */
[[nodiscard]] constexpr bool isMeasuredKind(NodeKind kind) noexcept
{
    return kind == NodeKind::TEXT || kind == NodeKind::BUTTON || kind == NodeKind::INPUT;
}

// ===================== 各类型专属内容 =====================

struct TextContent
{
    std::string text;
    bool operator==(const TextContent&) const = default;
};

struct ImageContent
{
    std::string src;
    std::string scaleType = "aspectFit";
    std::string placeholder;
    std::optional<Color> tintColor;
    bool operator==(const ImageContent&) const = default;
};

struct ButtonContent
{
    std::string title;
    std::string icon;
    bool disabled = false;
    bool loading = false;
    bool operator==(const ButtonContent&) const = default;
};

struct InputContent
{
    std::string text;
    std::string placeholder;
    std::string inputType = "text";
    bool disabled = false;
    bool readOnly = false;
    bool operator==(const InputContent&) const = default;
};

struct ScrollContent
{
    bool horizontal = false;
    bool showsIndicator = true;
    bool operator==(const ScrollContent&) const = default;
};

struct ListContent
{
    bool horizontal = false;
    int columns = 1;
    float itemSpacing = 0.0F;
    bool operator==(const ListContent&) const = default;
};

using NodeContent =
    std::variant<std::monostate, TextContent, ImageContent, ButtonContent, InputContent, ScrollContent, ListContent>;

/**
 * @brief 某类型节点的默认内容
 */
[[nodiscard]] inline NodeContent defaultContent(NodeKind kind)
{
    switch (kind)
    {
        case NodeKind::TEXT:
            return TextContent{};
        case NodeKind::IMAGE:
            return ImageContent{};
        case NodeKind::BUTTON:
            return ButtonContent{};
        case NodeKind::INPUT:
            return InputContent{};
        case NodeKind::SCROLL:
            return ScrollContent{};
        case NodeKind::LIST:
            return ListContent{};
        case NodeKind::VIEW:
        case NodeKind::UNKNOWN:
            break;
    }
    return std::monostate{};
}

} // namespace tx
