/**
 * ************************************************************************
 *
 * @file PipelinePool.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-14
 * @version 0.1
 * @brief RenderPipeline 对象池，用于列表单元等高频渲染场景
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>
#include "RenderPipeline.hpp"
#include "../core/RenderContext.hpp"

namespace tx::pipeline
{

struct PipelinePoolStats
{
    size_t acquireCount = 0;
    size_t reuseCount = 0;
    size_t releaseCount = 0;
    size_t droppedCount = 0; // 池满时直接销毁的数量
};

class PipelinePool
{
public:
    static constexpr size_t DEFAULT_CAPACITY = 8;

    explicit PipelinePool(RenderContext& context, size_t capacity = DEFAULT_CAPACITY)
        : m_context(context), m_capacity(capacity)
    {
    }

    PipelinePool(const PipelinePool&) = delete;
    PipelinePool& operator=(const PipelinePool&) = delete;
    PipelinePool(PipelinePool&&) = delete;
    PipelinePool& operator=(PipelinePool&&) = delete;

    /**
     * @brief 取出一个已重置并按 config 配置好的流水线
     */
    [[nodiscard]] std::unique_ptr<RenderPipeline> acquire(PipelineConfig config = {});

    /**
     * @brief 重置后放回；池已满时销毁
     */
    void release(std::unique_ptr<RenderPipeline> pipeline);

    void clear();

    [[nodiscard]] size_t idleCount() const;
    [[nodiscard]] size_t capacity() const noexcept { return m_capacity; }
    [[nodiscard]] PipelinePoolStats stats() const;

private:
    RenderContext& m_context;
    size_t m_capacity;
    mutable std::mutex m_mutex;
    std::vector<std::unique_ptr<RenderPipeline>> m_idle;
    PipelinePoolStats m_stats;
};

} // namespace tx::pipeline
