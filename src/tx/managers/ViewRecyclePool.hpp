/**
 * ************************************************************************
 *
 * @file ViewRecyclePool.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-09
 * @version 0.1
 * @brief 按节点类型分桶的视图复用池
 *
 * 只在 UI 线程使用。每个类型的空闲视图数量有上限，超出的直接销毁。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <array>
#include <functional>
#include <optional>
#include <vector>
#include "../common/NodeKind.hpp"
#include "../interface/IRecyclePool.hpp"
#include "../interface/IViewHost.hpp"

namespace tx::managers
{

struct RecycleStats
{
    size_t dequeueCount = 0;   // 申请次数
    size_t hitCount = 0;       // 命中次数
    size_t recycleCount = 0;   // 回收入池次数
    size_t destroyedCount = 0; // 因超出上限被销毁的视图

    [[nodiscard]] double hitRate() const noexcept
    {
        return dequeueCount == 0 ? 0.0 : static_cast<double>(hitCount) / static_cast<double>(dequeueCount);
    }
};

class ViewRecyclePool : public interface::IRecyclePool
{
public:
    static constexpr size_t DEFAULT_MAX_PER_KIND = 32;

    explicit ViewRecyclePool(interface::IViewHost& host, size_t maxPerKind = DEFAULT_MAX_PER_KIND)
        : m_host(host), m_maxPerKind(maxPerKind)
    {
    }

    ~ViewRecyclePool() override;

    ViewRecyclePool(const ViewRecyclePool&) = delete;
    ViewRecyclePool& operator=(const ViewRecyclePool&) = delete;
    ViewRecyclePool(ViewRecyclePool&&) = delete;
    ViewRecyclePool& operator=(ViewRecyclePool&&) = delete;

    std::optional<ViewHandle> dequeue(NodeKind kind) override;

    void recycle(Node& subtree) override;

    /**
     * @brief 回收单个已脱离层级的视图
     */
    void recycleView(NodeKind kind, ViewHandle view);

    /**
     * @brief 预先创建视图放入池中
     */
    void warmUp(NodeKind kind, size_t count, const std::function<ViewHandle()>& factory);

    void clear();

    /**
     * @brief 每个类型最多保留 keepPerKind 个，多余的销毁
     */
    void trim(size_t keepPerKind);

    [[nodiscard]] size_t pooledCount(NodeKind kind) const noexcept;
    [[nodiscard]] size_t totalPooled() const noexcept;
    [[nodiscard]] const RecycleStats& stats() const noexcept { return m_stats; }

private:
    interface::IViewHost& m_host;
    size_t m_maxPerKind;
    std::array<std::vector<ViewHandle>, NODE_KIND_COUNT> m_pools;
    RecycleStats m_stats;
};

} // namespace tx::managers
