/**
 * ************************************************************************
 *
 * @file PipelinePool.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-14
 * @version 0.1
 * @brief 流水线对象池实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "PipelinePool.hpp"

#include "../singleton/Logger.hpp"

namespace tx::pipeline
{

std::unique_ptr<RenderPipeline> PipelinePool::acquire(PipelineConfig config)
{
    std::unique_ptr<RenderPipeline> pipeline;
    {
        std::lock_guard lock(m_mutex);
        ++m_stats.acquireCount;
        if (!m_idle.empty())
        {
            pipeline = std::move(m_idle.back());
            m_idle.pop_back();
            ++m_stats.reuseCount;
        }
    }

    if (!pipeline)
    {
        return std::make_unique<RenderPipeline>(m_context, config);
    }
    pipeline->reset();
    pipeline->configure(config);
    return pipeline;
}

void PipelinePool::release(std::unique_ptr<RenderPipeline> pipeline)
{
    if (!pipeline) return;

    // 重置会等待后台任务结束，放在锁外进行
    pipeline->reset();

    std::lock_guard lock(m_mutex);
    ++m_stats.releaseCount;
    if (m_idle.size() >= m_capacity)
    {
        ++m_stats.droppedCount;
        Logger::debug("[PipelinePool] 池已满 ({})，销毁流水线 #{}", m_capacity, pipeline->id());
        return;
    }
    m_idle.push_back(std::move(pipeline));
}

void PipelinePool::clear()
{
    std::vector<std::unique_ptr<RenderPipeline>> idle;
    {
        std::lock_guard lock(m_mutex);
        idle.swap(m_idle);
    }
}

size_t PipelinePool::idleCount() const
{
    std::lock_guard lock(m_mutex);
    return m_idle.size();
}

PipelinePoolStats PipelinePool::stats() const
{
    std::lock_guard lock(m_mutex);
    return m_stats;
}

} // namespace tx::pipeline
