/**
 * ************************************************************************
 *
 * @file test_operation_queue.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-18
 * @version 0.1
 * @brief UI 操作队列单元测试
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include <gtest/gtest.h>
#include "src/tx/pipeline/OperationQueue.hpp"
#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using tx::ViewHandle;
using namespace tx::pipeline;

class OperationQueueTest : public ::testing::Test
{
protected:
    OperationQueue m_queue;
    std::vector<std::string> m_trace;

    UIOperationFn record(std::string name, uint64_t handle = 0)
    {
        return [this, name = std::move(name), handle]
        {
            m_trace.push_back(name);
            return ViewHandle{handle};
        };
    }

    /**
     * @brief 每次执行都再入队一个自己，模拟持续产出的后台
     */
    UIOperationFn endless(Epoch epoch)
    {
        return [this, epoch]
        {
            m_trace.push_back("tick");
            m_queue.enqueue(epoch, endless(epoch));
            return ViewHandle{};
        };
    }
};

// 测试 1: 初始状态
TEST_F(OperationQueueTest, InitialState)
{
    EXPECT_EQ(m_queue.state(), QueueState::IDLE);
    EXPECT_EQ(m_queue.currentEpoch(), 0U);
    EXPECT_FALSE(m_queue.isReady());
    EXPECT_EQ(m_queue.pendingCount(), 0U);
}

// 测试 2: 按 FIFO 执行，高优先级在前
TEST_F(OperationQueueTest, FifoWithHighPriorityFirst)
{
    const Epoch epoch = m_queue.markPreparing();
    m_queue.enqueue(epoch, record("a"));
    m_queue.enqueue(epoch, record("b"));
    m_queue.enqueue(epoch, record("urgent"), OperationTag::NORMAL, OperationPriority::HIGH);
    m_queue.enqueue(epoch, record("c"));
    m_queue.markReady(epoch);
    EXPECT_EQ(m_queue.state(), QueueState::READY);

    const FlushResult result = m_queue.syncFlush(100ms);

    EXPECT_EQ(m_trace, (std::vector<std::string>{"urgent", "a", "b", "c"}));
    EXPECT_EQ(result.executed, 4U);
    EXPECT_FALSE(result.timedOut);
    EXPECT_EQ(m_queue.state(), QueueState::IDLE);
    EXPECT_EQ(m_queue.stats().lastFlushCount, 4U);
}

// 测试 3: 过期批次的入队与完成信号被忽略
TEST_F(OperationQueueTest, StaleEpochRejected)
{
    const Epoch first = m_queue.markPreparing();
    const Epoch second = m_queue.markPreparing();
    EXPECT_GT(second, first);

    EXPECT_FALSE(m_queue.enqueue(first, record("stale")));
    EXPECT_TRUE(m_queue.enqueue(second, record("fresh")));
    m_queue.markReady(first);
    EXPECT_EQ(m_queue.state(), QueueState::PREPARING);
    EXPECT_EQ(m_queue.pendingCount(), 1U);
}

// 测试 4: 第一个 ROOT 操作的返回值作为根视图
TEST_F(OperationQueueTest, FirstRootResultWins)
{
    const Epoch epoch = m_queue.markPreparing();
    m_queue.enqueue(epoch, record("child", 7));
    m_queue.enqueue(epoch, record("root", 42), OperationTag::ROOT);
    m_queue.enqueue(epoch, record("other", 43), OperationTag::ROOT);
    m_queue.markReady(epoch);

    const FlushResult result = m_queue.syncFlush(100ms);
    ASSERT_TRUE(result.rootView.has_value());
    EXPECT_EQ(result.rootView->value, 42U);
}

// 测试 5: 等待后台完成信号
TEST_F(OperationQueueTest, WaitsForBackground)
{
    const Epoch epoch = m_queue.markPreparing();
    std::thread worker(
        [this, epoch]
        {
            std::this_thread::sleep_for(20ms);
            m_queue.enqueue(epoch, [] { return ViewHandle{1}; }, OperationTag::ROOT);
            m_queue.markReady(epoch);
        });

    const FlushResult result = m_queue.syncFlush(5000ms);
    worker.join();

    EXPECT_FALSE(result.timedOut);
    ASSERT_TRUE(result.rootView.has_value());
    EXPECT_EQ(result.rootView->value, 1U);
    EXPECT_EQ(m_queue.state(), QueueState::IDLE);
    EXPECT_GT(m_queue.stats().lastWaitTimeMs, 0.0);
}

// 测试 6: 超时后仍执行已入队部分，状态保持 PREPARING
TEST_F(OperationQueueTest, TimeoutStillDrains)
{
    const Epoch epoch = m_queue.markPreparing();
    m_queue.enqueue(epoch, record("early"));

    const FlushResult result = m_queue.syncFlush(10ms);

    EXPECT_TRUE(result.timedOut);
    EXPECT_EQ(result.executed, 1U);
    EXPECT_EQ(m_trace, (std::vector<std::string>{"early"}));
    EXPECT_EQ(m_queue.stats().timeoutCount, 1U);
    EXPECT_EQ(m_queue.state(), QueueState::PREPARING);

    // 后续完成的部分在下一次 flush 执行
    m_queue.enqueue(epoch, record("late"));
    m_queue.markReady(epoch);
    EXPECT_EQ(m_queue.syncFlush(10ms).executed, 1U);
    EXPECT_EQ(m_queue.state(), QueueState::IDLE);
}

// 测试 7: 抛异常的操作被跳过，其余照常执行
TEST_F(OperationQueueTest, ThrowingOperationSkipped)
{
    const Epoch epoch = m_queue.markPreparing();
    m_queue.enqueue(epoch, record("before"));
    m_queue.enqueue(epoch, []() -> ViewHandle { throw std::runtime_error("boom"); });
    m_queue.enqueue(epoch, record("after"));
    m_queue.markReady(epoch);

    const FlushResult result = m_queue.syncFlush(100ms);
    EXPECT_EQ(result.executed, 2U);
    EXPECT_EQ(m_trace, (std::vector<std::string>{"before", "after"}));
}

// 测试 8: 执行中追加的操作在同一次 flush 内完成
TEST_F(OperationQueueTest, NestedEnqueueDrained)
{
    const Epoch epoch = m_queue.markPreparing();
    m_queue.enqueue(epoch,
                    [this, epoch]
                    {
                        m_trace.push_back("outer");
                        m_queue.enqueue(epoch, record("inner"));
                        return ViewHandle{};
                    });
    m_queue.markReady(epoch);

    EXPECT_EQ(m_queue.syncFlush(100ms).executed, 2U);
    EXPECT_EQ(m_trace, (std::vector<std::string>{"outer", "inner"}));
}

// 测试 9: reset 丢弃操作并作废批次，唤醒等待者
TEST_F(OperationQueueTest, ResetDiscardsAndWakes)
{
    const Epoch epoch = m_queue.markPreparing();
    m_queue.enqueue(epoch, record("dropped"));

    std::atomic<bool> finished{false};
    std::thread waiter(
        [this, &finished]
        {
            (void)m_queue.syncFlush(5000ms);
            finished = true;
        });
    std::this_thread::sleep_for(20ms);
    m_queue.reset();
    waiter.join();

    EXPECT_TRUE(finished);
    EXPECT_EQ(m_queue.state(), QueueState::IDLE);
    EXPECT_EQ(m_queue.pendingCount(), 0U);
    EXPECT_FALSE(m_queue.enqueue(epoch, record("late")));
    EXPECT_EQ(m_queue.stats().timeoutCount, 0U);
}

// 测试 10: markError 清空队列并回到 IDLE
TEST_F(OperationQueueTest, MarkErrorClears)
{
    const Epoch epoch = m_queue.markPreparing();
    m_queue.enqueue(epoch, record("x"));
    m_queue.markError(epoch);

    EXPECT_EQ(m_queue.state(), QueueState::IDLE);
    EXPECT_EQ(m_queue.pendingCount(), 0U);
    const FlushResult result = m_queue.syncFlush(10ms);
    EXPECT_FALSE(result.timedOut);
    EXPECT_EQ(result.executed, 0U);
}

// 测试 11: 关闭 flush 后不执行任何操作
TEST_F(OperationQueueTest, DisabledFlushDoesNothing)
{
    const Epoch epoch = m_queue.markPreparing();
    m_queue.enqueue(epoch, record("held"));
    m_queue.markReady(epoch);
    m_queue.setEnableFlush(false);

    EXPECT_EQ(m_queue.syncFlush(10ms).executed, 0U);
    EXPECT_EQ(m_queue.forceFlush().executed, 0U);
    EXPECT_EQ(m_queue.pendingCount(), 1U);

    m_queue.setEnableFlush(true);
    EXPECT_EQ(m_queue.forceFlush().executed, 1U);
}

// 测试 12: 后台未完成时只执行 flush 时刻的快照，执行中新入队的操作留到下一次
TEST_F(OperationQueueTest, UnfinishedFlushRunsSnapshotOnly)
{
    const Epoch epoch = m_queue.markPreparing();
    m_queue.enqueue(epoch, endless(epoch));
    m_queue.enqueue(epoch, record("queued"));

    const FlushResult result = m_queue.syncFlush(1ms);

    EXPECT_TRUE(result.timedOut);
    EXPECT_EQ(result.executed, 2U);
    EXPECT_EQ(m_trace, (std::vector<std::string>{"tick", "queued"}));
    EXPECT_EQ(m_queue.pendingCount(), 1U);
    EXPECT_EQ(m_queue.state(), QueueState::PREPARING);

    EXPECT_EQ(m_queue.forceFlush().executed, 1U);
    EXPECT_EQ(m_queue.pendingCount(), 1U);

    m_queue.reset();
    EXPECT_EQ(m_queue.pendingCount(), 0U);
}

// 测试 13: 非标准异常穿出 flush 时状态仍然复位
TEST_F(OperationQueueTest, StateRestoredWhenFlushThrows)
{
    const Epoch epoch = m_queue.markPreparing();
    m_queue.enqueue(epoch, record("first"));
    m_queue.enqueue(epoch, []() -> ViewHandle { throw 42; });
    m_queue.markReady(epoch);

    EXPECT_ANY_THROW((void)m_queue.syncFlush(10ms));
    EXPECT_EQ(m_queue.state(), QueueState::IDLE);
    EXPECT_EQ(m_queue.stats().lastFlushCount, 1U);

    const Epoch next = m_queue.markPreparing();
    m_queue.enqueue(next, record("second"));
    m_queue.markReady(next);
    EXPECT_EQ(m_queue.syncFlush(10ms).executed, 1U);
    EXPECT_EQ(m_trace, (std::vector<std::string>{"first", "second"}));
}
