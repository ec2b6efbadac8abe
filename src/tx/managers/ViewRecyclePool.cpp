/**
 * ************************************************************************
 *
 * @file ViewRecyclePool.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-09
 * @version 0.1
 * @brief 视图复用池实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "ViewRecyclePool.hpp"

#include <algorithm>
#include "../singleton/Logger.hpp"

namespace tx::managers
{

ViewRecyclePool::~ViewRecyclePool()
{
    clear();
}

std::optional<ViewHandle> ViewRecyclePool::dequeue(NodeKind kind)
{
    ++m_stats.dequeueCount;
    auto& bucket = m_pools[static_cast<size_t>(kind)];
    if (bucket.empty())
    {
        return std::nullopt;
    }
    ViewHandle view = bucket.back();
    bucket.pop_back();
    ++m_stats.hitCount;
    return view;
}

void ViewRecyclePool::recycle(Node& subtree)
{
    subtree.visit(
        [this](Node& node)
        {
            if (!node.view()) return;
            const ViewHandle view = node.view();
            node.clearView();
            m_host.detachView(view);

            // 占位视图不能当作该类型的控件复用
            if (node.kind() == NodeKind::UNKNOWN || node.hasParseError())
            {
                m_host.destroyView(view);
                return;
            }
            recycleView(node.kind(), view);
        });
}

void ViewRecyclePool::recycleView(NodeKind kind, ViewHandle view)
{
    if (!view) return;
    auto& bucket = m_pools[static_cast<size_t>(kind)];
    if (bucket.size() >= m_maxPerKind)
    {
        m_host.destroyView(view);
        ++m_stats.destroyedCount;
        return;
    }
    bucket.push_back(view);
    ++m_stats.recycleCount;
}

void ViewRecyclePool::warmUp(NodeKind kind, size_t count, const std::function<ViewHandle()>& factory)
{
    auto& bucket = m_pools[static_cast<size_t>(kind)];
    const size_t target = std::min(count, m_maxPerKind);
    while (bucket.size() < target)
    {
        ViewHandle view = factory();
        if (!view)
        {
            Logger::warn("[ViewRecyclePool] {} 类型预热时工厂返回空视图", toString(kind));
            break;
        }
        bucket.push_back(view);
    }
}

void ViewRecyclePool::clear()
{
    trim(0);
}

void ViewRecyclePool::trim(size_t keepPerKind)
{
    for (auto& bucket : m_pools)
    {
        while (bucket.size() > keepPerKind)
        {
            m_host.destroyView(bucket.back());
            bucket.pop_back();
            ++m_stats.destroyedCount;
        }
    }
}

size_t ViewRecyclePool::pooledCount(NodeKind kind) const noexcept
{
    return m_pools[static_cast<size_t>(kind)].size();
}

size_t ViewRecyclePool::totalPooled() const noexcept
{
    size_t total = 0;
    for (const auto& bucket : m_pools)
    {
        total += bucket.size();
    }
    return total;
}

} // namespace tx::managers
