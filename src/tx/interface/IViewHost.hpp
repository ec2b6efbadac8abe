/**
 * ************************************************************************
 *
 * @file IViewHost.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-05
 * @version 0.1
 * @brief 宿主 UI 工具包的视图层级操作接口
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <cstddef>
#include "../common/Types.hpp"
#include "../core/Node.hpp"

namespace tx::interface
{

class IViewHost
{
public:
    virtual ~IViewHost() = default;

    /**
     * @brief 把 child 挂到 parent 的第 index 个位置；已挂在别处时先移走
     */
    virtual void attachChild(ViewHandle parent, ViewHandle child, size_t index) = 0;

    virtual void detachView(ViewHandle view) = 0;

    virtual void destroyView(ViewHandle view) = 0;

    /**
     * @brief 类型未识别或属性解析失败时的替代视图
     * @param visible 开发模式下为醒目占位，发布模式下为隐藏的空视图
     */
    virtual ViewHandle createPlaceholder(const Node& node, bool visible) = 0;
};

} // namespace tx::interface
