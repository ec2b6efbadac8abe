/**
 * ************************************************************************
 *
 * @file Style.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.1
 * @brief 样式模型：盒模型 + flex 属性 + 装饰属性的值类型
 *
 * 整体按值比较；可选字段使用 std::optional 而不是 NaN，保证相等比较自反。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <optional>
#include <string>
#include "Policies.hpp"
#include "Types.hpp"

namespace tx
{

/**
 * @brief 尺寸值：auto / 固定点数 / 百分比
 */
struct Dimension
{
    enum class Unit : uint8_t
    {
        AUTO,
        POINT,
        PERCENT
    };

    Unit unit = Unit::AUTO;
    float value = 0.0F;

    static constexpr Dimension Auto() { return {}; }
    static constexpr Dimension Point(float v) { return {Unit::POINT, v}; }
    static constexpr Dimension Percent(float v) { return {Unit::PERCENT, v}; }

    [[nodiscard]] constexpr bool isAuto() const noexcept { return unit == Unit::AUTO; }

    bool operator==(const Dimension&) const = default;
};

/**
 * @brief 四边数值（margin / padding / position 共用）
 */
struct EdgeInsets
{
    float top = 0.0F;
    float left = 0.0F;
    float bottom = 0.0F;
    float right = 0.0F;

    static constexpr EdgeInsets All(float v) { return {v, v, v, v}; }
    static constexpr EdgeInsets Symmetric(float vertical, float horizontal)
    {
        return {vertical, horizontal, vertical, horizontal};
    }

    [[nodiscard]] constexpr bool isZero() const noexcept
    {
        return top == 0.0F && left == 0.0F && bottom == 0.0F && right == 0.0F;
    }

    bool operator==(const EdgeInsets&) const = default;
};

/**
 * @brief 可选的四边数值，未设置的边不写入布局引擎（用于绝对定位）
 */
struct OptionalInsets
{
    std::optional<float> top;
    std::optional<float> left;
    std::optional<float> bottom;
    std::optional<float> right;

    bool operator==(const OptionalInsets&) const = default;
};

struct Style
{
    // ========== 尺寸 ==========
    Dimension width;
    Dimension height;
    std::optional<float> minWidth;
    std::optional<float> minHeight;
    std::optional<float> maxWidth;
    std::optional<float> maxHeight;

    // ========== 边距 ==========
    EdgeInsets margin;
    EdgeInsets padding;

    // ========== Flex ==========
    float flexGrow = 0.0F;
    float flexShrink = 1.0F;
    Dimension flexBasis;
    policies::FlexDirection flexDirection = policies::FlexDirection::COLUMN;
    policies::FlexWrap flexWrap = policies::FlexWrap::NO_WRAP;
    policies::Justify justifyContent = policies::Justify::FLEX_START;
    policies::Align alignItems = policies::Align::STRETCH;
    policies::Align alignSelf = policies::Align::AUTO;
    policies::Align alignContent = policies::Align::FLEX_START;

    // ========== 定位 ==========
    policies::PositionType positionType = policies::PositionType::RELATIVE;
    OptionalInsets position;

    // ========== 其他布局 ==========
    std::optional<float> aspectRatio;
    policies::Overflow overflow = policies::Overflow::VISIBLE;
    policies::Display display = policies::Display::FLEX;
    policies::Visibility visibility = policies::Visibility::VISIBLE;

    // ========== 装饰 ==========
    std::optional<Color> backgroundColor;
    float borderWidth = 0.0F;
    std::optional<Color> borderColor;
    float cornerRadius = 0.0F;
    std::optional<Color> shadowColor;
    float shadowOffsetX = 0.0F;
    float shadowOffsetY = 0.0F;
    float shadowRadius = 0.0F;
    float shadowOpacity = 0.0F;
    float opacity = 1.0F;
    bool clipsToBounds = false;

    // ========== 文本 ==========
    std::optional<float> fontSize;
    std::optional<std::string> fontWeight;
    std::optional<Color> textColor;
    policies::TextAlign textAlign = policies::TextAlign::LEFT;
    std::optional<float> lineHeight;
    std::optional<float> letterSpacing;
    int numberOfLines = 1;

    bool operator==(const Style&) const = default;

    /**
     * @brief 与另一份样式相比，差异是否可能影响布局
     */
    [[nodiscard]] bool needsRelayout(const Style& other) const
    {
        return width != other.width || height != other.height || minWidth != other.minWidth ||
               minHeight != other.minHeight || maxWidth != other.maxWidth || maxHeight != other.maxHeight ||
               margin != other.margin || padding != other.padding || flexGrow != other.flexGrow ||
               flexShrink != other.flexShrink || flexBasis != other.flexBasis ||
               flexDirection != other.flexDirection || flexWrap != other.flexWrap ||
               justifyContent != other.justifyContent || alignItems != other.alignItems ||
               alignSelf != other.alignSelf || alignContent != other.alignContent ||
               positionType != other.positionType || position != other.position ||
               aspectRatio != other.aspectRatio || overflow != other.overflow || display != other.display ||
               borderWidth != other.borderWidth || fontSize != other.fontSize || fontWeight != other.fontWeight ||
               lineHeight != other.lineHeight || letterSpacing != other.letterSpacing ||
               numberOfLines != other.numberOfLines;
    }

    /**
     * @brief 是否带有自身可见的绘制效果（背景、边框、圆角、阴影、透明度、裁剪）
     */
    [[nodiscard]] bool hasVisualEffect() const
    {
        const bool visibleBackground = backgroundColor.has_value() && backgroundColor->alpha > 0.0F;
        const bool visibleBorder = borderWidth > 0.0F && borderColor.has_value();
        const bool visibleShadow = shadowColor.has_value() && shadowOpacity > 0.0F;
        return visibleBackground || visibleBorder || visibleShadow || cornerRadius > 0.0F || opacity < 1.0F ||
               clipsToBounds || visibility == policies::Visibility::HIDDEN ||
               overflow != policies::Overflow::VISIBLE;
    }
};

} // namespace tx
