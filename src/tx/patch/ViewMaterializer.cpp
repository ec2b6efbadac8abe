/**
 * ************************************************************************
 *
 * @file ViewMaterializer.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-10
 * @version 0.1
 * @brief 视图层级同步实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "ViewMaterializer.hpp"

#include "../singleton/Logger.hpp"

namespace tx::patch
{

ViewHandle ViewMaterializer::createView(Node& node)
{
    ViewHandle view;
    if (m_enableReuse && m_recyclePool != nullptr && !m_widgets.usesPlaceholder(node))
    {
        if (auto reused = m_recyclePool->dequeue(node.kind()))
        {
            view = *reused;
            // 复用视图残留旧状态，记忆值失效
            node.setView(view);
            node.setForceApply(true);
            return view;
        }
    }

    view = m_widgets.createView(node);
    node.setView(view);
    node.setForceApply(true);
    return view;
}

ViewHandle ViewMaterializer::createViewTree(Node& node, ViewHandle hostView)
{
    size_t hostIndex = 0;
    buildRecursive(node, hostView, hostIndex);
    return node.view();
}

void ViewMaterializer::buildRecursive(Node& node, ViewHandle hostView, size_t& hostIndex)
{
    if (node.flattened())
    {
        for (const auto& child : node.children())
        {
            buildRecursive(*child, hostView, hostIndex);
        }
        return;
    }

    ViewHandle view = node.view() ? node.view() : createView(node);
    updateView(node);
    if (hostView)
    {
        m_widgets.host().attachChild(hostView, view, hostIndex++);
    }

    size_t childIndex = 0;
    for (const auto& child : node.children())
    {
        buildRecursive(*child, view, childIndex);
    }
}

void ViewMaterializer::updateView(Node& node)
{
    if (!node.view() || !node.needsViewUpdate()) return;
    m_widgets.updateView(node.view(), node);
    node.markApplied();
}

void ViewMaterializer::updateViewTree(Node& root)
{
    root.visit([this](Node& node) { updateView(node); });
}

void ViewMaterializer::releaseViewTree(Node& subtree)
{
    if (m_enableReuse && m_recyclePool != nullptr)
    {
        // 占位视图直接销毁，其余交给回收池
        subtree.visit(
            [this](Node& node)
            {
                if (node.view() && m_widgets.isPlaceholder(node.view()))
                {
                    releaseOwnView(node);
                }
            });
        m_recyclePool->recycle(subtree);
        return;
    }
    subtree.visit([this](Node& node) { releaseOwnView(node); });
}

void ViewMaterializer::releaseOwnView(Node& node)
{
    const ViewHandle view = node.view();
    if (!view) return;
    node.clearView();
    m_widgets.host().detachView(view);
    m_widgets.host().destroyView(view);
    m_widgets.forgetView(view);
}

void ViewMaterializer::syncViews(Node& root, const std::unordered_set<const Node*>& changedParents)
{
    std::unordered_set<Node*> dirtyHosts;
    ensureViews(root, nullptr, changedParents, dirtyHosts);
    if (!dirtyHosts.empty())
    {
        Logger::debug("[ViewMaterializer] 重排 {} 个宿主视图", dirtyHosts.size());
    }
    for (Node* host : dirtyHosts)
    {
        reattachChildren(*host);
    }
}

void ViewMaterializer::ensureViews(Node& node,
                                   Node* host,
                                   const std::unordered_set<const Node*>& changedParents,
                                   std::unordered_set<Node*>& dirtyHosts)
{
    // 1. 扁平化状态变化：补建或回收自身视图
    if (node.flattened())
    {
        if (node.view())
        {
            // 子视图随后由宿主重排接管
            releaseOwnView(node);
            if (host != nullptr) dirtyHosts.insert(host);
        }
    }
    else if (!node.view())
    {
        createView(node);
        if (host != nullptr) dirtyHosts.insert(host);
        if (node.childCount() > 0) dirtyHosts.insert(&node);
    }

    // 2. 子列表结构变化：所在宿主需要重排
    Node* childHost = node.flattened() ? host : &node;
    if (changedParents.contains(&node) && childHost != nullptr)
    {
        dirtyHosts.insert(childHost);
    }

    for (const auto& child : node.children())
    {
        ensureViews(*child, childHost, changedParents, dirtyHosts);
    }
}

void ViewMaterializer::reattachChildren(Node& host)
{
    if (!host.view()) return;
    size_t index = 0;
    for (const auto& child : host.children())
    {
        attachRecursive(*child, host.view(), index);
    }
}

void ViewMaterializer::attachRecursive(Node& node, ViewHandle hostView, size_t& index)
{
    if (node.flattened())
    {
        for (const auto& child : node.children())
        {
            attachRecursive(*child, hostView, index);
        }
        return;
    }
    if (node.view())
    {
        m_widgets.host().attachChild(hostView, node.view(), index++);
    }
}

} // namespace tx::patch
