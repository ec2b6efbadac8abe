/**
 * ************************************************************************
 *
 * @file OperationQueue.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-12
 * @version 0.1
 * @brief 延迟操作队列实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "OperationQueue.hpp"

#include <exception>
#include <utility>
#include "../singleton/Logger.hpp"

namespace tx::pipeline
{

namespace
{

double elapsedMs(std::chrono::steady_clock::time_point start)
{
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

const char* toString(QueueState state) noexcept
{
    switch (state)
    {
        case QueueState::IDLE:
            return "IDLE";
        case QueueState::PREPARING:
            return "PREPARING";
        case QueueState::READY:
            return "READY";
        case QueueState::FLUSHING:
            return "FLUSHING";
    }
    return "UNKNOWN";
}

Epoch OperationQueue::markPreparing()
{
    std::lock_guard lock(m_mutex);
    // 上一批次若仍有人等待，先放行
    signalReadyLocked();

    ++m_epoch;
    m_highPriority.clear();
    m_normal.clear();
    m_readyPromise = std::promise<void>();
    m_readyFuture = m_readyPromise.get_future().share();
    m_readySignalled = false;
    m_state = QueueState::PREPARING;
    return m_epoch;
}

bool OperationQueue::enqueue(Epoch epoch, UIOperationFn operation, OperationTag tag, OperationPriority priority)
{
    std::lock_guard lock(m_mutex);
    if (epoch != m_epoch)
    {
        Logger::debug("[OperationQueue] 丢弃过期批次 {} 的操作（当前 {}）", epoch, m_epoch);
        return false;
    }
    auto& queue = priority == OperationPriority::HIGH ? m_highPriority : m_normal;
    queue.push_back(UIOperation{std::move(operation), tag});
    return true;
}

void OperationQueue::markReady(Epoch epoch)
{
    std::lock_guard lock(m_mutex);
    if (epoch != m_epoch)
    {
        Logger::debug("[OperationQueue] 忽略过期批次 {} 的完成信号", epoch);
        return;
    }
    signalReadyLocked();
    if (m_state == QueueState::PREPARING)
    {
        m_state = QueueState::READY;
    }
}

void OperationQueue::markError(Epoch epoch)
{
    std::lock_guard lock(m_mutex);
    if (epoch != m_epoch)
    {
        return;
    }
    m_highPriority.clear();
    m_normal.clear();
    signalReadyLocked();
    m_state = QueueState::IDLE;
}

FlushResult OperationQueue::syncFlush(std::chrono::milliseconds timeout)
{
    std::shared_future<void> ready;
    bool mustWait = false;
    {
        std::lock_guard lock(m_mutex);
        if (!m_enableFlush)
        {
            return {};
        }
        mustWait = m_state == QueueState::PREPARING;
        ready = m_readyFuture;
    }

    // 1. 等待后台完成信号
    bool timedOut = false;
    const auto waitStart = std::chrono::steady_clock::now();
    if (mustWait && ready.valid())
    {
        if (ready.wait_for(timeout) == std::future_status::timeout)
        {
            timedOut = true;
            Logger::warn("[OperationQueue] 等待后台任务超时 ({}ms)，执行已就绪部分", timeout.count());
        }
    }
    const double waitMs = elapsedMs(waitStart);

    {
        std::lock_guard lock(m_mutex);
        m_stats.lastWaitTimeMs = waitMs;
        if (timedOut) ++m_stats.timeoutCount;
    }

    // 2. 执行
    return drain(timedOut);
}

FlushResult OperationQueue::forceFlush()
{
    {
        std::lock_guard lock(m_mutex);
        if (!m_enableFlush)
        {
            return {};
        }
        m_stats.lastWaitTimeMs = 0.0;
    }
    return drain(false);
}

FlushResult OperationQueue::drain(bool timedOut)
{
    FlushResult result;
    result.timedOut = timedOut;
    const auto executeStart = std::chrono::steady_clock::now();

    bool finishing = false;
    {
        std::lock_guard lock(m_mutex);
        // 后台仍在计算时只执行已入队部分，状态保持 PREPARING
        if (m_state == QueueState::READY || m_state == QueueState::IDLE)
        {
            m_state = QueueState::FLUSHING;
            finishing = true;
        }
    }

    // 任何方式离开都恢复状态并记录统计
    FlushScope scope(*this, result, finishing, executeStart);

    // 后台已完成时，执行期间嵌套入队的操作一并执行；否则只执行一次快照
    do
    {
        std::deque<UIOperation> high;
        std::deque<UIOperation> normal;
        {
            std::lock_guard lock(m_mutex);
            high.swap(m_highPriority);
            normal.swap(m_normal);
        }
        if (high.empty() && normal.empty())
        {
            break;
        }

        for (auto* queue : {&high, &normal})
        {
            for (auto& operation : *queue)
            {
                ViewHandle view;
                try
                {
                    view = operation.run();
                }
                catch (const std::exception& error)
                {
                    Logger::error("[OperationQueue] 操作执行异常: {}", error.what());
                    continue;
                }
                ++result.executed;
                if (operation.tag == OperationTag::ROOT && !result.rootView)
                {
                    result.rootView = view;
                }
            }
        }
    } while (finishing);

    return result;
}

OperationQueue::FlushScope::~FlushScope()
{
    std::lock_guard lock(m_queue.m_mutex);
    if (m_finishing && m_queue.m_state == QueueState::FLUSHING)
    {
        m_queue.m_state = QueueState::IDLE;
    }
    m_queue.m_stats.lastFlushCount = m_result.executed;
    m_queue.m_stats.lastExecuteTimeMs = elapsedMs(m_start);
}

void OperationQueue::reset()
{
    std::lock_guard lock(m_mutex);
    ++m_epoch;
    m_highPriority.clear();
    m_normal.clear();
    signalReadyLocked();
    m_state = QueueState::IDLE;
}

void OperationQueue::signalReadyLocked()
{
    if (m_readySignalled)
    {
        return;
    }
    m_readyPromise.set_value();
    m_readySignalled = true;
}

QueueState OperationQueue::state() const
{
    std::lock_guard lock(m_mutex);
    return m_state;
}

Epoch OperationQueue::currentEpoch() const
{
    std::lock_guard lock(m_mutex);
    return m_epoch;
}

bool OperationQueue::isReady() const
{
    std::lock_guard lock(m_mutex);
    return m_state == QueueState::READY;
}

size_t OperationQueue::pendingCount() const
{
    std::lock_guard lock(m_mutex);
    return m_highPriority.size() + m_normal.size();
}

QueueStats OperationQueue::stats() const
{
    std::lock_guard lock(m_mutex);
    return m_stats;
}

void OperationQueue::setEnableFlush(bool enabled)
{
    std::lock_guard lock(m_mutex);
    m_enableFlush = enabled;
}

} // namespace tx::pipeline
