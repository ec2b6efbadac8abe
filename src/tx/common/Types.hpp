/**
 * ************************************************************************
 *
 * @file Types.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-01-13
 * @version 0.2
 * @brief 渲染核心基础类型定义
 *
 * 向量使用 Eigen 类型；Frame/Size 使用裸 float 以保证逐位可比较。
 * 另含颜色、视图句柄等基础类型。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <Eigen/Core>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string_view>

namespace tx
{

// ===================== 基础向量类型 =====================

/**
 * @brief 2D向量类型（偏移累加等）
 */
using Vec2 = Eigen::Vector2f;

/**
 * @brief 4D向量类型（颜色分量）
 */
using Vec4 = Eigen::Vector4f;

/**
 * @brief 表示"由内容决定"的尺寸分量
 */
inline constexpr float UNDEFINED_DIMENSION = std::numeric_limits<float>::quiet_NaN();

// ===================== 颜色类型 =====================

/**
 * @brief RGBA颜色结构体（浮点数表示，范围0.0-1.0）
 */
struct Color
{
    float red = 1.0F;
    float green = 1.0F;
    float blue = 1.0F;
    float alpha = 1.0F;

    constexpr Color() = default;
    constexpr Color(float red, float green, float blue, float alpha = 1.0F)
        : red(red), green(green), blue(blue), alpha(alpha)
    {
    }

    explicit Color(const Vec4& vec) : red(vec.x()), green(vec.y()), blue(vec.z()), alpha(vec.w()) {}

    [[nodiscard]] Vec4 toVec4() const { return {red, green, blue, alpha}; }

    bool operator==(const Color&) const = default;

    /**
     * @brief 转换为 0xRRGGBBAA
     */
    [[nodiscard]] uint32_t toRGBA8() const
    {
        auto clamp = [](float v) -> uint8_t { return static_cast<uint8_t>(std::clamp(v, 0.0F, 1.0F) * 255.0F); };
        return (static_cast<uint32_t>(clamp(red)) << 24) | (static_cast<uint32_t>(clamp(green)) << 16) |
               (static_cast<uint32_t>(clamp(blue)) << 8) | static_cast<uint32_t>(clamp(alpha));
    }

    static Color fromRGBA(uint8_t r_, uint8_t g_, uint8_t b_, uint8_t a_ = 255)
    {
        return {static_cast<float>(r_) / 255.0F,
                static_cast<float>(g_) / 255.0F,
                static_cast<float>(b_) / 255.0F,
                static_cast<float>(a_) / 255.0F};
    }

    /**
     * @brief 从预编译的 0xAARRGGBB 整数创建（模板编译器输出格式）
     */
    static Color fromARGB(uint32_t argb)
    {
        return fromRGBA(static_cast<uint8_t>((argb >> 16) & 0xFF),
                        static_cast<uint8_t>((argb >> 8) & 0xFF),
                        static_cast<uint8_t>(argb & 0xFF),
                        static_cast<uint8_t>((argb >> 24) & 0xFF));
    }

    /**
     * @brief 解析 "#RGB" / "#RRGGBB" / "#AARRGGBB"
     */
    static std::optional<Color> fromHex(std::string_view text)
    {
        if (text.starts_with('#')) text.remove_prefix(1);

        uint32_t value = 0;
        for (char ch : text)
        {
            uint32_t digit = 0;
            if (ch >= '0' && ch <= '9')
                digit = static_cast<uint32_t>(ch - '0');
            else if (ch >= 'a' && ch <= 'f')
                digit = static_cast<uint32_t>(ch - 'a' + 10);
            else if (ch >= 'A' && ch <= 'F')
                digit = static_cast<uint32_t>(ch - 'A' + 10);
            else
                return std::nullopt;
            value = (value << 4) | digit;
        }

        switch (text.size())
        {
            case 3:
            {
                auto expand = [](uint32_t nibble) { return static_cast<uint8_t>(nibble * 17); };
                return fromRGBA(expand((value >> 8) & 0xF), expand((value >> 4) & 0xF), expand(value & 0xF));
            }
            case 6:
                return fromARGB(0xFF000000U | value);
            case 8:
                return fromARGB(value);
            default:
                return std::nullopt;
        }
    }

    static constexpr Color White() { return {1.0F, 1.0F, 1.0F, 1.0F}; }
    static constexpr Color Black() { return {0.0F, 0.0F, 0.0F, 1.0F}; }
    static constexpr Color Red() { return {1.0F, 0.0F, 0.0F, 1.0F}; }
    static constexpr Color Transparent() { return {0.0F, 0.0F, 0.0F, 0.0F}; }
};

// ===================== 尺寸与矩形 =====================

/**
 * @brief 容器尺寸，任一分量为 NaN 表示该方向由内容撑开
 */
struct Size
{
    float width = 0.0F;
    float height = 0.0F;

    bool operator==(const Size&) const = default;

    [[nodiscard]] bool wrapsWidth() const { return std::isnan(width); }
    [[nodiscard]] bool wrapsHeight() const { return std::isnan(height); }
};

/**
 * @brief 布局结果，原点相对父节点（扁平化后相对最近的实体祖先）
 */
struct Frame
{
    float x = 0.0F;
    float y = 0.0F;
    float width = 0.0F;
    float height = 0.0F;

    bool operator==(const Frame&) const = default;

    [[nodiscard]] Vec2 origin() const { return {x, y}; }

    [[nodiscard]] Frame offsetBy(const Vec2& delta) const { return {x + delta.x(), y + delta.y(), width, height}; }
};

// ===================== 视图句柄 =====================

/**
 * @brief 外部控件的不透明引用，生命周期归宿主 UI 工具包所有
 */
struct ViewHandle
{
    uint64_t value = 0;

    constexpr ViewHandle() = default;
    constexpr explicit ViewHandle(uint64_t v) : value(v) {}

    [[nodiscard]] constexpr bool valid() const noexcept { return value != 0; }
    constexpr explicit operator bool() const noexcept { return valid(); }

    bool operator==(const ViewHandle&) const = default;
};

} // namespace tx

template <>
struct std::hash<tx::ViewHandle>
{
    size_t operator()(const tx::ViewHandle& handle) const noexcept { return std::hash<uint64_t>{}(handle.value); }
};
