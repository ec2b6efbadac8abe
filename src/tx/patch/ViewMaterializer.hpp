/**
 * ************************************************************************
 *
 * @file ViewMaterializer.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-10
 * @version 0.1
 * @brief 组件树 -> 视图层级的同步
 *
 * 扁平化节点不创建视图，其子孙视图挂到最近的实体祖先上。
 * 调用前节点的 flattened 标记与 frame 必须已由布局结果写好。
 * 所有方法只能在 UI 线程调用。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <cstddef>
#include <unordered_set>
#include "../common/Types.hpp"
#include "../core/Node.hpp"
#include "../interface/IRecyclePool.hpp"
#include "../managers/WidgetTable.hpp"

namespace tx::patch
{

class ViewMaterializer
{
public:
    ViewMaterializer(managers::WidgetTable& widgets, interface::IRecyclePool* recyclePool, bool enableReuse = true)
        : m_widgets(widgets), m_recyclePool(recyclePool), m_enableReuse(enableReuse)
    {
    }

    /**
     * @brief 为单个节点取得视图：优先从复用池取（并强制下次全量刷新），否则新建
     */
    ViewHandle createView(Node& node);

    /**
     * @brief 创建整棵子树的视图并依次挂到 hostView 下
     * @return 子树根的视图；根被扁平化时返回空句柄
     */
    ViewHandle createViewTree(Node& node, ViewHandle hostView);

    /**
     * @brief 把节点状态写入视图；记忆的样式与 frame 未变化时跳过
     */
    void updateView(Node& node);

    void updateViewTree(Node& root);

    /**
     * @brief 回收或销毁子树上的全部视图
     */
    void releaseViewTree(Node& subtree);

    /**
     * @brief 结构变化后使视图层级与树一致
     *
     * 按扁平化状态补建或回收视图，并对 changedParents 及新增视图所在的
     * 宿主视图重新排列子视图顺序。
     */
    void syncViews(Node& root, const std::unordered_set<const Node*>& changedParents);

    /**
     * @brief 按当前树顺序重新挂载 host 的全部直接子视图
     */
    void reattachChildren(Node& host);

    [[nodiscard]] managers::WidgetTable& widgets() const noexcept { return m_widgets; }
    void setEnableReuse(bool enabled) noexcept { m_enableReuse = enabled; }

private:
    void buildRecursive(Node& node, ViewHandle hostView, size_t& hostIndex);

    void ensureViews(Node& node,
                     Node* host,
                     const std::unordered_set<const Node*>& changedParents,
                     std::unordered_set<Node*>& dirtyHosts);

    void attachRecursive(Node& node, ViewHandle hostView, size_t& index);

    void releaseOwnView(Node& node);

    managers::WidgetTable& m_widgets;
    interface::IRecyclePool* m_recyclePool;
    bool m_enableReuse;
};

} // namespace tx::patch
