/**
 * ************************************************************************
 *
 * @file RenderPipeline.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-14
 * @version 0.1
 * @brief 异步渲染流水线实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "RenderPipeline.hpp"

#include <exception>
#include <utility>
#include "../core/ThreadAffinity.hpp"
#include "../layout/LayoutAdapter.hpp"
#include "../singleton/Logger.hpp"

namespace tx::pipeline
{

namespace
{

using Clock = std::chrono::steady_clock;

double elapsedMs(Clock::time_point start)
{
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

} // namespace

const char* toString(PipelinePhase phase) noexcept
{
    switch (phase)
    {
        case PipelinePhase::IDLE:
            return "IDLE";
        case PipelinePhase::RUNNING:
            return "RUNNING";
        case PipelinePhase::COMPLETED:
            return "COMPLETED";
        case PipelinePhase::FAILED:
            return "FAILED";
        case PipelinePhase::CANCELLED:
            return "CANCELLED";
    }
    return "UNKNOWN";
}

RenderPipeline::RenderPipeline(RenderContext& context, Config config)
    : m_context(context),
      m_config(config),
      m_id(context.nextPipelineId()),
      m_materializer(context.widgets(), context.recyclePool(), config.enableViewReuse)
{
}

RenderPipeline::~RenderPipeline()
{
    reset();
}

void RenderPipeline::configure(Config config)
{
    m_config = config;
    m_materializer.setEnableReuse(config.enableViewReuse);
}

void RenderPipeline::start(std::unique_ptr<Node> tree, nlohmann::json data, Size containerSize)
{
    launch(Source{std::move(tree)}, std::move(data), containerSize);
}

void RenderPipeline::startWithTemplate(std::string rawTemplate, nlohmann::json data, Size containerSize)
{
    launch(Source{RawTemplate{std::move(rawTemplate)}}, std::move(data), containerSize);
}

void RenderPipeline::startWithPrototype(const Node& prototype, nlohmann::json data, Size containerSize)
{
    launch(Source{prototype.deepClone()}, std::move(data), containerSize);
}

void RenderPipeline::launch(Source source, nlohmann::json data, Size containerSize)
{
    // 1. 结束上一轮
    reset();

    // 2. 新批次
    {
        std::lock_guard lock(m_mutex);
        m_phase = PipelinePhase::RUNNING;
        m_startTime = Clock::now();
    }
    m_cancelled.store(false);
    const Epoch epoch = m_queue.markPreparing();

    // 3. 投递后台任务
    m_job = m_context.threadPool().enqueue(
        [this, epoch, source = std::move(source), data = std::move(data), containerSize]() mutable
        { run(epoch, std::move(source), data, containerSize); });
}

bool RenderPipeline::checkpoint(Epoch epoch) const
{
    if (m_cancelled.load() || m_queue.currentEpoch() != epoch)
    {
        Logger::debug("[RenderPipeline] #{} 任务已取消", m_id);
        return false;
    }
    return true;
}

void RenderPipeline::run(Epoch epoch, Source source, const nlohmann::json& data, Size containerSize)
{
    Timing timing;

    // 1. 解析
    auto stageStart = Clock::now();
    std::unique_ptr<Node> tree;
    if (auto* raw = std::get_if<RawTemplate>(&source))
    {
        auto* parser = m_context.parser();
        if (parser == nullptr)
        {
            Logger::error("[RenderPipeline] #{} 未注册模板解析器", m_id);
            fail(epoch, RenderError::PARSE_FAILURE);
            return;
        }
        try
        {
            auto parsed = parser->parse(raw->text);
            if (!parsed)
            {
                Logger::error("[RenderPipeline] #{} 模板解析失败: {}", m_id, parsed.error());
                fail(epoch, RenderError::PARSE_FAILURE);
                return;
            }
            tree = std::move(*parsed);
        }
        catch (const std::exception& error)
        {
            Logger::error("[RenderPipeline] #{} 解析器异常: {}", m_id, error.what());
            fail(epoch, RenderError::PARSE_FAILURE);
            return;
        }
    }
    else
    {
        tree = std::move(std::get<std::unique_ptr<Node>>(source));
    }
    if (!tree)
    {
        Logger::error("[RenderPipeline] #{} 没有可渲染的树", m_id);
        fail(epoch, RenderError::PARSE_FAILURE);
        return;
    }
    timing.parseMs = elapsedMs(stageStart);
    if (!checkpoint(epoch)) return;

    // 2. 数据绑定
    stageStart = Clock::now();
    try
    {
        if (auto* binder = m_context.binder())
        {
            binder->bind(data, *tree);
        }
    }
    catch (const std::exception& error)
    {
        Logger::error("[RenderPipeline] #{} 数据绑定异常: {}", m_id, error.what());
        fail(epoch, RenderError::LAYOUT_FAILURE);
        return;
    }
    timing.bindMs = elapsedMs(stageStart);
    if (!checkpoint(epoch)) return;

    // 3. 布局
    stageStart = Clock::now();
    try
    {
        auto frames = m_context.layoutAdapter().tryComputeLayout(*tree, containerSize);
        if (frames)
        {
            layout::LayoutAdapter::applyFrames(*tree, *frames);
        }
        else
        {
            Logger::warn("[RenderPipeline] #{} 布局失败，按零尺寸继续", m_id);
            layout::LayoutAdapter::applyFrames(*tree, {});
        }
    }
    catch (const std::exception& error)
    {
        Logger::error("[RenderPipeline] #{} 布局异常: {}", m_id, error.what());
        fail(epoch, RenderError::LAYOUT_FAILURE);
        return;
    }
    timing.layoutMs = elapsedMs(stageStart);
    if (!checkpoint(epoch)) return;

    // 4. 生成视图操作
    Node* root = tree.get();
    {
        std::lock_guard lock(m_mutex);
        m_tree = std::move(tree);
        m_timing.parseMs = timing.parseMs;
        m_timing.bindMs = timing.bindMs;
        m_timing.layoutMs = timing.layoutMs;
    }
    size_t hostIndex = 0;
    enqueueMaterialize(epoch, *root, nullptr, hostIndex, true);
    if (!checkpoint(epoch)) return;

    // 5. 先切换阶段再发信号，flush 一定能看到 COMPLETED
    {
        std::lock_guard lock(m_mutex);
        if (m_phase == PipelinePhase::RUNNING)
        {
            m_phase = PipelinePhase::COMPLETED;
        }
    }
    m_queue.markReady(epoch);
}

void RenderPipeline::enqueueMaterialize(Epoch epoch, Node& node, Node* host, size_t& hostIndex, bool isRoot)
{
    if (node.flattened())
    {
        for (const auto& child : node.children())
        {
            enqueueMaterialize(epoch, *child, host, hostIndex, false);
        }
        return;
    }

    Node* target = &node;
    m_queue.enqueue(
        epoch,
        [this, target] { return m_materializer.createView(*target); },
        isRoot ? OperationTag::ROOT : OperationTag::NORMAL);

    if (host != nullptr)
    {
        const size_t index = hostIndex++;
        m_queue.enqueue(epoch,
                        [this, host, target, index]
                        {
                            m_context.widgets().host().attachChild(host->view(), target->view(), index);
                            return ViewHandle{};
                        });
    }

    size_t childIndex = 0;
    for (const auto& child : node.children())
    {
        enqueueMaterialize(epoch, *child, target, childIndex, false);
    }

    m_queue.enqueue(epoch,
                    [this, target]
                    {
                        m_materializer.updateView(*target);
                        return ViewHandle{};
                    });
}

void RenderPipeline::fail(Epoch epoch, RenderError error)
{
    {
        std::lock_guard lock(m_mutex);
        if (m_queue.currentEpoch() != epoch) return;
        m_phase = PipelinePhase::FAILED;
        m_error = error;
    }
    m_queue.markError(epoch);
}

std::expected<ViewHandle, RenderError> RenderPipeline::syncFlush()
{
    TX_ASSERT_UI_THREAD(m_context.affinity());
    {
        std::lock_guard lock(m_mutex);
        if (m_phase == PipelinePhase::IDLE || m_phase == PipelinePhase::CANCELLED)
        {
            return std::unexpected(RenderError::CANCELLED);
        }
    }
    auto result = m_queue.syncFlush(std::chrono::milliseconds(m_config.syncFlushTimeoutMs));
    return finishFlush(result);
}

std::expected<ViewHandle, RenderError> RenderPipeline::forceFlush()
{
    TX_ASSERT_UI_THREAD(m_context.affinity());
    {
        std::lock_guard lock(m_mutex);
        if (m_phase == PipelinePhase::IDLE || m_phase == PipelinePhase::CANCELLED)
        {
            return std::unexpected(RenderError::CANCELLED);
        }
    }
    return finishFlush(m_queue.forceFlush());
}

std::expected<ViewHandle, RenderError> RenderPipeline::finishFlush(const FlushResult& result)
{
    const QueueStats stats = m_queue.stats();

    PipelinePhase phase;
    RenderError error;
    ViewHandle rootView;
    Timing timing;
    bool notify = false;
    {
        std::lock_guard lock(m_mutex);
        if (result.rootView && !m_rootView)
        {
            m_rootView = *result.rootView;
        }
        m_timing.waitMs += stats.lastWaitTimeMs;
        m_timing.flushMs += stats.lastExecuteTimeMs;

        phase = m_phase;
        error = m_error;
        rootView = m_rootView;

        const bool finished = phase == PipelinePhase::FAILED ||
                              (phase == PipelinePhase::COMPLETED && rootView && m_queue.pendingCount() == 0);
        if (finished && !m_notified)
        {
            m_notified = true;
            notify = true;
            m_timing.totalMs = elapsedMs(m_startTime);
        }
        timing = m_timing;
    }

    // 1. 失败
    if (phase == PipelinePhase::FAILED)
    {
        if (notify)
        {
            m_context.dispatcher().trigger(events::PipelineFailed{m_id, error});
        }
        return std::unexpected(error);
    }
    if (phase == PipelinePhase::CANCELLED)
    {
        return std::unexpected(RenderError::CANCELLED);
    }

    // 2. 根视图尚未创建
    if (!rootView)
    {
        return std::unexpected(RenderError::TIMEOUT_ON_FLUSH);
    }

    // 3. 完成通知
    if (notify)
    {
        if (m_config.enablePerformanceMonitor)
        {
            Logger::info("[RenderPipeline] #{} 解析 {:.2f}ms 绑定 {:.2f}ms 布局 {:.2f}ms 等待 {:.2f}ms 执行 {:.2f}ms 总计 {:.2f}ms",
                         m_id,
                         timing.parseMs,
                         timing.bindMs,
                         timing.layoutMs,
                         timing.waitMs,
                         timing.flushMs,
                         timing.totalMs);
        }
        m_context.dispatcher().trigger(events::PipelineCompleted{m_id, rootView, timing});
    }
    return rootView;
}

void RenderPipeline::cancel()
{
    m_cancelled.store(true);

    std::lock_guard lock(m_mutex);
    // 已完成的批次：排队操作照常执行
    if (m_phase != PipelinePhase::RUNNING)
    {
        return;
    }
    m_queue.reset();
    m_phase = PipelinePhase::CANCELLED;
    Logger::debug("[RenderPipeline] #{} 已取消", m_id);
}

void RenderPipeline::reset()
{
    m_cancelled.store(true);
    m_queue.reset();

    if (m_job.valid())
    {
        try
        {
            m_job.get();
        }
        catch (const std::exception& error)
        {
            Logger::error("[RenderPipeline] #{} 后台任务异常退出: {}", m_id, error.what());
        }
    }

    std::lock_guard lock(m_mutex);
    m_tree.reset();
    m_phase = PipelinePhase::IDLE;
    m_error = RenderError::CANCELLED;
    m_timing = Timing{};
    m_rootView = ViewHandle{};
    m_notified = false;
    m_cancelled.store(false);
}

PipelinePhase RenderPipeline::phase() const
{
    std::lock_guard lock(m_mutex);
    return m_phase;
}

RenderPipeline::Timing RenderPipeline::timing() const
{
    std::lock_guard lock(m_mutex);
    return m_timing;
}

ViewHandle RenderPipeline::rootView() const
{
    std::lock_guard lock(m_mutex);
    return m_rootView;
}

std::unique_ptr<Node> RenderPipeline::takeTree()
{
    // 排队的闭包引用树上的节点，树必须留到它们执行完
    if (const size_t pending = m_queue.pendingCount(); pending > 0)
    {
        Logger::warn("[RenderPipeline] #{} 仍有 {} 个排队操作，不能取走渲染树", m_id, pending);
        return nullptr;
    }
    std::lock_guard lock(m_mutex);
    if (m_phase != PipelinePhase::COMPLETED)
    {
        Logger::warn("[RenderPipeline] #{} 当前阶段 {} 不能取走渲染树", m_id, toString(m_phase));
        return nullptr;
    }
    return std::move(m_tree);
}

} // namespace tx::pipeline
