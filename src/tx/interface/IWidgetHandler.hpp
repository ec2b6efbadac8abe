/**
 * ************************************************************************
 *
 * @file IWidgetHandler.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-05
 * @version 0.1
 * @brief 单一节点类型的控件创建/更新接口
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include "../common/Types.hpp"
#include "../core/Node.hpp"

namespace tx::interface
{

/**
 * @brief 每种 NodeKind 一个实现，只在 UI 线程被调用
 */
class IWidgetHandler
{
public:
    virtual ~IWidgetHandler() = default;

    virtual ViewHandle createView(const Node& node) = 0;

    /**
     * @brief 把节点当前的 frame、样式与内容写入视图
     */
    virtual void updateView(ViewHandle view, const Node& node) = 0;
};

} // namespace tx::interface
