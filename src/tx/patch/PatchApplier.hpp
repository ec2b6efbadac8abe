/**
 * ************************************************************************
 *
 * @file PatchApplier.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-11
 * @version 0.1
 * @brief 把编辑脚本应用到活动树及其视图
 *
 * 结构修改、视图同步都只能在 UI 线程进行。
 * 纯树操作部分 applyToTree 不接触视图，可单独用于校验编辑脚本。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <unordered_set>
#include "ViewMaterializer.hpp"
#include "../common/Types.hpp"
#include "../core/Node.hpp"
#include "../core/ThreadAffinity.hpp"
#include "../diff/EditScript.hpp"
#include "../layout/LayoutAdapter.hpp"

namespace tx::patch
{

/**
 * @brief 被删除或被替换的子树在销毁前的回调
 */
using DiscardFn = std::function<void(Node&)>;

class PatchApplier
{
public:
    PatchApplier(layout::LayoutAdapter& layout, ViewMaterializer& views, const ThreadAffinity& affinity)
        : m_layout(layout), m_views(views), m_affinity(affinity)
    {
    }

    /**
     * @brief 应用脚本、重新布局并同步视图
     *
     * 根节点被替换或删除时 liveRoot 随之改变。
     * @return 成功应用的操作数
     */
    size_t apply(const diff::EditScript& script, std::unique_ptr<Node>& liveRoot, Size containerSize);

    /**
     * @brief 形状不变的快速路径：按位置复制绑定、内容与样式后重新布局
     *
     * 调用方保证两棵树结构一致；发现不一致时停止该分支并记录警告。
     */
    void quickUpdate(Node& liveRoot, const Node& boundTree, Size containerSize);

    /**
     * @brief 不改动树，只重新布局并刷新全部视图
     */
    void refresh(Node& liveRoot, Size containerSize);

    /**
     * @brief 只修改树结构与属性，不触碰视图与布局
     * @param onDiscard 被移出树的子树在释放前回调
     * @param changedParents 若非空，收集子列表发生结构变化且仍在树中的父节点
     */
    static size_t applyToTree(const diff::EditScript& script,
                              std::unique_ptr<Node>& root,
                              const DiscardFn& onDiscard = {},
                              std::unordered_set<const Node*>* changedParents = nullptr);

    /**
     * @brief 把一次 update 写到节点上（不含改名）
     */
    static void applyUpdate(Node& node, const diff::UpdateOp& op);

private:
    void relayout(Node& root, Size containerSize);

    layout::LayoutAdapter& m_layout;
    ViewMaterializer& m_views;
    const ThreadAffinity& m_affinity;
};

} // namespace tx::patch
