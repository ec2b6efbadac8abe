/**
 * ************************************************************************
 *
 * @file ContentCopiers.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-10
 * @version 0.1
 * @brief 按类型复制专属字段的函数表
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <array>
#include "../common/NodeKind.hpp"
#include "../core/Node.hpp"

namespace tx::patch
{

using ContentCopier = void (*)(Node& target, const NodeContent& source);

namespace detail
{

inline void copyNothing(Node& /*target*/, const NodeContent& /*source*/) {}

inline void copyText(Node& target, const NodeContent& source)
{
    const auto* from = std::get_if<TextContent>(&source);
    auto* to = target.contentAs<TextContent>();
    if (from == nullptr || to == nullptr) return;
    to->text = from->text;
}

inline void copyImage(Node& target, const NodeContent& source)
{
    const auto* from = std::get_if<ImageContent>(&source);
    auto* to = target.contentAs<ImageContent>();
    if (from == nullptr || to == nullptr) return;
    to->src = from->src;
    to->scaleType = from->scaleType;
    to->placeholder = from->placeholder;
    to->tintColor = from->tintColor;
}

inline void copyButton(Node& target, const NodeContent& source)
{
    const auto* from = std::get_if<ButtonContent>(&source);
    auto* to = target.contentAs<ButtonContent>();
    if (from == nullptr || to == nullptr) return;
    to->title = from->title;
    to->icon = from->icon;
    to->disabled = from->disabled;
    to->loading = from->loading;
}

inline void copyInput(Node& target, const NodeContent& source)
{
    const auto* from = std::get_if<InputContent>(&source);
    auto* to = target.contentAs<InputContent>();
    if (from == nullptr || to == nullptr) return;
    to->text = from->text;
    to->placeholder = from->placeholder;
    to->inputType = from->inputType;
    to->disabled = from->disabled;
    to->readOnly = from->readOnly;
}

inline void copyScroll(Node& target, const NodeContent& source)
{
    const auto* from = std::get_if<ScrollContent>(&source);
    auto* to = target.contentAs<ScrollContent>();
    if (from == nullptr || to == nullptr) return;
    *to = *from;
}

inline void copyList(Node& target, const NodeContent& source)
{
    const auto* from = std::get_if<ListContent>(&source);
    auto* to = target.contentAs<ListContent>();
    if (from == nullptr || to == nullptr) return;
    *to = *from;
}

} // namespace detail

/**
 * @brief 下标与 NodeKind 一一对应
 */
inline constexpr std::array<ContentCopier, NODE_KIND_COUNT> CONTENT_COPIERS{
    &detail::copyNothing, // VIEW
    &detail::copyText,    // TEXT
    &detail::copyImage,   // IMAGE
    &detail::copyButton,  // BUTTON
    &detail::copyInput,   // INPUT
    &detail::copyScroll,  // SCROLL
    &detail::copyList,    // LIST
    &detail::copyNothing, // UNKNOWN
};

inline void copyContent(Node& target, const NodeContent& source)
{
    CONTENT_COPIERS[static_cast<size_t>(target.kind())](target, source);
}

} // namespace tx::patch
