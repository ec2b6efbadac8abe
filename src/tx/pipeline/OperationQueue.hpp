/**
 * ************************************************************************
 *
 * @file OperationQueue.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-12
 * @version 0.1
 * @brief 后台计算 -> UI 线程的延迟操作队列
 *
 * 状态机：IDLE -> PREPARING -> READY -> FLUSHING -> IDLE，任意状态出错回到 IDLE。
 * 后台完成信号是一次性的 future，UI 线程带超时等待它，不做轮询。
 * 每次 markPreparing 开启新的批次（epoch），旧批次的入队与完成信号一律丢弃。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include "../common/Types.hpp"

namespace tx::pipeline
{

enum class QueueState : uint8_t
{
    IDLE,      // 无后台任务
    PREPARING, // 后台计算中
    READY,     // 后台已完成，等待执行
    FLUSHING   // UI 线程执行中
};

enum class OperationTag : uint8_t
{
    NORMAL,
    ROOT // 返回值作为本次渲染的根视图
};

enum class OperationPriority : uint8_t
{
    NORMAL,
    HIGH
};

using Epoch = uint64_t;

/**
 * @brief 延迟到 UI 线程执行的闭包，返回其创建的视图（可为空）
 */
using UIOperationFn = std::move_only_function<ViewHandle()>;

struct UIOperation
{
    UIOperationFn run;
    OperationTag tag = OperationTag::NORMAL;
};

struct FlushResult
{
    std::optional<ViewHandle> rootView; // 第一个 ROOT 操作的返回值
    size_t executed = 0;
    bool timedOut = false;
};

struct QueueStats
{
    size_t lastFlushCount = 0;
    double lastWaitTimeMs = 0.0;
    double lastExecuteTimeMs = 0.0;
    size_t timeoutCount = 0;
};

[[nodiscard]] const char* toString(QueueState state) noexcept;

class OperationQueue
{
public:
    OperationQueue() = default;
    ~OperationQueue() = default;

    OperationQueue(const OperationQueue&) = delete;
    OperationQueue& operator=(const OperationQueue&) = delete;
    OperationQueue(OperationQueue&&) = delete;
    OperationQueue& operator=(OperationQueue&&) = delete;

    /**
     * @brief 后台任务开始：清空完成标记，进入 PREPARING
     * @return 本批次编号，入队与 markReady 时需携带
     */
    Epoch markPreparing();

    /**
     * @brief 入队；批次已过期时丢弃并返回 false
     */
    bool enqueue(Epoch epoch,
                 UIOperationFn operation,
                 OperationTag tag = OperationTag::NORMAL,
                 OperationPriority priority = OperationPriority::NORMAL);

    /**
     * @brief 后台任务完成：唤醒等待者，进入 READY
     */
    void markReady(Epoch epoch);

    /**
     * @brief 后台任务失败：清空队列、唤醒等待者并回到 IDLE
     */
    void markError(Epoch epoch);

    /**
     * @brief UI 线程调用：等待后台完成（最多 timeout），然后按 FIFO 执行全部操作
     *
     * 超时只记警告，仍执行已入队的部分，执行期间后台新入队的操作留给下一次 flush。
     * 高优先级操作先于普通操作。
     */
    FlushResult syncFlush(std::chrono::milliseconds timeout);

    /**
     * @brief 不等待，立即执行已入队的操作
     */
    FlushResult forceFlush();

    /**
     * @brief 丢弃全部操作并回到 IDLE，当前批次作废
     */
    void reset();

    [[nodiscard]] QueueState state() const;
    [[nodiscard]] Epoch currentEpoch() const;
    [[nodiscard]] bool isReady() const;
    [[nodiscard]] size_t pendingCount() const;
    [[nodiscard]] QueueStats stats() const;

    /**
     * @brief 关闭后 flush 不执行任何操作
     */
    void setEnableFlush(bool enabled);

private:
    /**
     * @brief drain 的收尾：恢复 FLUSHING 状态并写入统计，异常退出时同样生效
     */
    class FlushScope
    {
    public:
        FlushScope(OperationQueue& queue,
                   const FlushResult& result,
                   bool finishing,
                   std::chrono::steady_clock::time_point start)
            : m_queue(queue), m_result(result), m_finishing(finishing), m_start(start)
        {
        }
        ~FlushScope();

        FlushScope(const FlushScope&) = delete;
        FlushScope& operator=(const FlushScope&) = delete;
        FlushScope(FlushScope&&) = delete;
        FlushScope& operator=(FlushScope&&) = delete;

    private:
        OperationQueue& m_queue;
        const FlushResult& m_result;
        bool m_finishing;
        std::chrono::steady_clock::time_point m_start;
    };

    /**
     * @brief 执行已入队的操作；后台未完成时只执行调用时刻的快照
     */
    FlushResult drain(bool timedOut);

    /**
     * @brief 兑现尚未兑现的完成信号（需持锁）
     */
    void signalReadyLocked();

    mutable std::mutex m_mutex;
    std::deque<UIOperation> m_highPriority;
    std::deque<UIOperation> m_normal;
    QueueState m_state = QueueState::IDLE;
    Epoch m_epoch = 0;
    std::promise<void> m_readyPromise;
    std::shared_future<void> m_readyFuture;
    bool m_readySignalled = true;
    bool m_enableFlush = true;
    QueueStats m_stats;
};

} // namespace tx::pipeline
