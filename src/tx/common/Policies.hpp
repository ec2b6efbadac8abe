/**
 * ************************************************************************
 *
 * @file Policies.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.1
 * @brief 样式模型使用的 flexbox / 装饰枚举
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once
#include <cstdint>

namespace tx::policies
{

/**
 * @brief 主轴方向
 */
enum class FlexDirection : uint8_t
{
    COLUMN,         // 默认
    COLUMN_REVERSE, // 反向列
    ROW,            // 行
    ROW_REVERSE     // 反向行
};

enum class FlexWrap : uint8_t
{
    NO_WRAP,
    WRAP,
    WRAP_REVERSE
};

/**
 * @brief 主轴对齐
 */
enum class Justify : uint8_t
{
    FLEX_START,
    CENTER,
    FLEX_END,
    SPACE_BETWEEN,
    SPACE_AROUND,
    SPACE_EVENLY
};

/**
 * @brief 交叉轴对齐 (alignItems / alignSelf / alignContent 共用)
 */
enum class Align : uint8_t
{
    AUTO, // 仅 alignSelf 有意义
    FLEX_START,
    CENTER,
    FLEX_END,
    STRETCH,
    BASELINE,
    SPACE_BETWEEN,
    SPACE_AROUND
};

enum class PositionType : uint8_t
{
    RELATIVE,
    ABSOLUTE
};

enum class Overflow : uint8_t
{
    VISIBLE,
    HIDDEN,
    SCROLL
};

/**
 * @brief NONE 不参与布局
 */
enum class Display : uint8_t
{
    FLEX,
    NONE
};

/**
 * @brief HIDDEN 仍占位，只隐藏视图
 */
enum class Visibility : uint8_t
{
    VISIBLE,
    HIDDEN
};

enum class TextAlign : uint8_t
{
    LEFT,
    CENTER,
    RIGHT,
    JUSTIFIED,
    START,
    END
};

} // namespace tx::policies
