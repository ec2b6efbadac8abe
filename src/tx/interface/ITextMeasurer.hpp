/**
 * ************************************************************************
 *
 * @file ITextMeasurer.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-05
 * @version 0.1
 * @brief 叶子内容测量回调接口
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <cstdint>
#include "../common/Types.hpp"
#include "../core/Node.hpp"

namespace tx::interface
{

enum class MeasureMode : uint8_t
{
    UNDEFINED, // 无约束
    EXACTLY,   // 精确值
    AT_MOST    // 上限
};

struct MeasureConstraints
{
    float width = UNDEFINED_DIMENSION;
    MeasureMode widthMode = MeasureMode::UNDEFINED;
    float height = UNDEFINED_DIMENSION;
    MeasureMode heightMode = MeasureMode::UNDEFINED;
};

/**
 * @brief 在布局求解过程中同步调用，可能来自任意后台线程，实现必须线程安全
 */
class ITextMeasurer
{
public:
    virtual ~ITextMeasurer() = default;

    virtual Size measure(const Node& node, const MeasureConstraints& constraints) = 0;
};

} // namespace tx::interface
