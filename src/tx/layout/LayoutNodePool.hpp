/**
 * ************************************************************************
 *
 * @file LayoutNodePool.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-06
 * @version 0.1
 * @brief Yoga 节点池
 *
 * 池持有全部 YGNodeRef，对外只发放 entt::entity 形式的槽位。
 * 槽位的版本位随每次归还递增，过期槽位的访问会被检测并记录日志，
 * 而不是访问已复用的原生节点。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <entt/entt.hpp>
#include <yoga/Yoga.h>
#include <cstddef>
#include <mutex>
#include <span>
#include <vector>

namespace tx::layout
{

using LayoutSlot = entt::entity;

struct LayoutPoolStats
{
    size_t acquireCount = 0; // 总申请次数
    size_t reuseCount = 0;   // 命中空闲节点次数
    size_t createCount = 0;  // 新建原生节点次数
    size_t releaseCount = 0; // 成功归还次数
    size_t freedCount = 0;   // 因超出空闲上限被释放的节点数

    [[nodiscard]] double reuseRate() const noexcept
    {
        return acquireCount == 0 ? 0.0 : static_cast<double>(reuseCount) / static_cast<double>(acquireCount);
    }
};

class LayoutNodePool
{
public:
    static constexpr size_t DEFAULT_MAX_IDLE = 256;

    explicit LayoutNodePool(size_t maxIdle = DEFAULT_MAX_IDLE);
    ~LayoutNodePool();

    LayoutNodePool(const LayoutNodePool&) = delete;
    LayoutNodePool& operator=(const LayoutNodePool&) = delete;
    LayoutNodePool(LayoutNodePool&&) = delete;
    LayoutNodePool& operator=(LayoutNodePool&&) = delete;

    /**
     * @brief 取出一个默认状态的节点；空闲节点耗尽时新建，不会阻塞等待
     */
    [[nodiscard]] LayoutSlot acquire();

    [[nodiscard]] std::vector<LayoutSlot> acquireBatch(size_t count);

    /**
     * @brief 归还节点：脱离父子关系、重置为默认样式后放回空闲列表
     * @return 槽位已过期或重复归还时返回 false
     */
    bool release(LayoutSlot slot);

    size_t releaseAll(std::span<const LayoutSlot> slots);

    /**
     * @brief 槽位对应的原生节点，过期槽位返回 nullptr
     */
    [[nodiscard]] YGNodeRef resolve(LayoutSlot slot) const;

    [[nodiscard]] bool valid(LayoutSlot slot) const;

    void warmUp(size_t count);

    /**
     * @brief 释放全部空闲节点（已借出的不受影响）
     */
    void drain();

    [[nodiscard]] size_t idleCount() const;
    [[nodiscard]] size_t checkedOutCount() const;
    [[nodiscard]] size_t maxIdle() const noexcept { return m_maxIdle; }

    [[nodiscard]] LayoutPoolStats stats() const;
    void resetStats();

    [[nodiscard]] YGConfigRef config() const noexcept { return m_config; }

private:
    struct PooledNode
    {
        YGNodeRef node = nullptr;
    };

    static void detach(YGNodeRef node);

    YGConfigRef m_config = nullptr;
    size_t m_maxIdle;

    mutable std::mutex m_mutex;
    entt::registry m_slots;
    std::vector<YGNodeRef> m_idle;
    size_t m_checkedOut = 0;
    LayoutPoolStats m_stats;
};

} // namespace tx::layout
