/**
 * ************************************************************************
 *
 * @file LayoutNodePool.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-06
 * @version 0.1
 * @brief Yoga 节点池实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "LayoutNodePool.hpp"

#include <algorithm>
#include "../singleton/Logger.hpp"

namespace tx::layout
{

LayoutNodePool::LayoutNodePool(size_t maxIdle) : m_config(YGConfigNew()), m_maxIdle(maxIdle)
{
    m_idle.reserve(maxIdle);
    Logger::debug("[LayoutNodePool] Yoga 配置创建完成，空闲上限 {}", maxIdle);
}

LayoutNodePool::~LayoutNodePool()
{
    std::lock_guard lock(m_mutex);

    if (m_checkedOut > 0)
    {
        auto view = m_slots.view<PooledNode>();
        Logger::warn("[LayoutNodePool] 析构时仍有 {} 个节点未归还", m_checkedOut);
        for (auto slot : view)
        {
            YGNodeRef node = view.get<PooledNode>(slot).node;
            detach(node);
        }
        for (auto slot : view)
        {
            YGNodeFree(view.get<PooledNode>(slot).node);
        }
    }
    m_slots.clear();

    for (YGNodeRef node : m_idle)
    {
        YGNodeFree(node);
    }
    m_idle.clear();

    if (m_config != nullptr)
    {
        YGConfigFree(m_config);
        m_config = nullptr;
    }
}

LayoutSlot LayoutNodePool::acquire()
{
    std::lock_guard lock(m_mutex);

    YGNodeRef node = nullptr;
    if (!m_idle.empty())
    {
        node = m_idle.back();
        m_idle.pop_back();
        ++m_stats.reuseCount;
    }
    else
    {
        node = YGNodeNewWithConfig(m_config);
        ++m_stats.createCount;
    }
    ++m_stats.acquireCount;

    const LayoutSlot slot = m_slots.create();
    m_slots.emplace<PooledNode>(slot, node);
    ++m_checkedOut;
    return slot;
}

std::vector<LayoutSlot> LayoutNodePool::acquireBatch(size_t count)
{
    std::vector<LayoutSlot> slots;
    slots.reserve(count);
    for (size_t i = 0; i < count; ++i)
    {
        slots.push_back(acquire());
    }
    return slots;
}

bool LayoutNodePool::release(LayoutSlot slot)
{
    std::lock_guard lock(m_mutex);

    if (slot == entt::null || !m_slots.valid(slot)) [[unlikely]]
    {
        Logger::error("[LayoutNodePool] 归还了过期或重复的槽位 {}", entt::to_integral(slot));
        return false;
    }

    YGNodeRef node = m_slots.get<PooledNode>(slot).node;
    m_slots.destroy(slot);
    --m_checkedOut;
    ++m_stats.releaseCount;

    detach(node);
    if (m_idle.size() < m_maxIdle)
    {
        YGNodeReset(node);
        m_idle.push_back(node);
    }
    else
    {
        YGNodeFree(node);
        ++m_stats.freedCount;
    }
    return true;
}

size_t LayoutNodePool::releaseAll(std::span<const LayoutSlot> slots)
{
    size_t released = 0;
    for (LayoutSlot slot : slots)
    {
        if (release(slot)) ++released;
    }
    return released;
}

YGNodeRef LayoutNodePool::resolve(LayoutSlot slot) const
{
    std::lock_guard lock(m_mutex);
    if (slot == entt::null || !m_slots.valid(slot)) [[unlikely]]
    {
        Logger::error("[LayoutNodePool] 访问过期槽位 {}", entt::to_integral(slot));
        return nullptr;
    }
    return m_slots.get<PooledNode>(slot).node;
}

bool LayoutNodePool::valid(LayoutSlot slot) const
{
    std::lock_guard lock(m_mutex);
    return slot != entt::null && m_slots.valid(slot);
}

void LayoutNodePool::warmUp(size_t count)
{
    std::lock_guard lock(m_mutex);
    const size_t target = std::min(count, m_maxIdle);
    while (m_idle.size() < target)
    {
        m_idle.push_back(YGNodeNewWithConfig(m_config));
        ++m_stats.createCount;
    }
    Logger::debug("[LayoutNodePool] 预热完成，空闲节点 {}", m_idle.size());
}

void LayoutNodePool::drain()
{
    std::lock_guard lock(m_mutex);
    for (YGNodeRef node : m_idle)
    {
        YGNodeFree(node);
    }
    m_stats.freedCount += m_idle.size();
    m_idle.clear();
}

size_t LayoutNodePool::idleCount() const
{
    std::lock_guard lock(m_mutex);
    return m_idle.size();
}

size_t LayoutNodePool::checkedOutCount() const
{
    std::lock_guard lock(m_mutex);
    return m_checkedOut;
}

LayoutPoolStats LayoutNodePool::stats() const
{
    std::lock_guard lock(m_mutex);
    return m_stats;
}

void LayoutNodePool::resetStats()
{
    std::lock_guard lock(m_mutex);
    m_stats = LayoutPoolStats{};
}

void LayoutNodePool::detach(YGNodeRef node)
{
    if (YGNodeRef owner = YGNodeGetOwner(node); owner != nullptr)
    {
        YGNodeRemoveChild(owner, node);
    }
    YGNodeRemoveAllChildren(node);
}

} // namespace tx::layout
