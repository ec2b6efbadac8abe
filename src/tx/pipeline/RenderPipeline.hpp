/**
 * ************************************************************************
 *
 * @file RenderPipeline.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-14
 * @version 0.1
 * @brief 异步渲染流水线：后台解析/绑定/布局，UI 线程 syncFlush 落地
 *
 * 后台任务在每个阶段之间检查取消标记；视图相关操作全部以闭包形式
 * 进入 OperationQueue，只在 UI 线程执行。
 *
 * 用法：
 *   pipeline.start(std::move(tree), data, {width, NaN});
 *   // ... UI 线程布局时
 *   auto root = pipeline.syncFlush();
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <variant>
#include "OperationQueue.hpp"
#include "../common/Errors.hpp"
#include "../common/Events.hpp"
#include "../common/Types.hpp"
#include "../core/Node.hpp"
#include "../core/RenderContext.hpp"
#include "../patch/ViewMaterializer.hpp"

namespace tx::pipeline
{

enum class PipelinePhase : uint8_t
{
    IDLE,
    RUNNING,   // 后台任务进行中或等待 flush
    COMPLETED, // 后台任务完成
    FAILED,
    CANCELLED
};

[[nodiscard]] const char* toString(PipelinePhase phase) noexcept;

struct PipelineConfig
{
    uint32_t syncFlushTimeoutMs = 100;
    bool enableViewReuse = true;
    bool enablePerformanceMonitor = false;

    static PipelineConfig from(const RenderConfig& config)
    {
        return PipelineConfig{config.syncFlushTimeoutMs, config.enableViewReuse, config.enablePerformanceMonitor};
    }
};

class RenderPipeline
{
public:
    using Config = PipelineConfig;
    using Timing = RenderTiming;

    explicit RenderPipeline(RenderContext& context, Config config = {});
    ~RenderPipeline();

    RenderPipeline(const RenderPipeline&) = delete;
    RenderPipeline& operator=(const RenderPipeline&) = delete;
    RenderPipeline(RenderPipeline&&) = delete;
    RenderPipeline& operator=(RenderPipeline&&) = delete;

    void configure(Config config);
    [[nodiscard]] const Config& config() const noexcept { return m_config; }

    /**
     * @brief 以已解析的树启动（树的所有权转入流水线）
     */
    void start(std::unique_ptr<Node> tree, nlohmann::json data, Size containerSize);

    /**
     * @brief 以原始模板启动，解析也在后台进行
     */
    void startWithTemplate(std::string rawTemplate, nlohmann::json data, Size containerSize);

    /**
     * @brief 以原型树启动：在调用线程深拷贝后交给后台
     */
    void startWithPrototype(const Node& prototype, nlohmann::json data, Size containerSize);

    /**
     * @brief UI 线程：等待后台完成（最多配置的超时）并执行全部排队操作
     * @return 根视图；解析失败返回 PARSE_FAILURE，超时且根视图尚未创建返回 TIMEOUT_ON_FLUSH
     */
    std::expected<ViewHandle, RenderError> syncFlush();

    /**
     * @brief UI 线程：不等待，执行已排队的操作
     */
    std::expected<ViewHandle, RenderError> forceFlush();

    /**
     * @brief 设置取消标记并丢弃排队操作，不等待后台任务
     */
    void cancel();

    /**
     * @brief 取消并等待后台任务结束，回到 IDLE
     */
    void reset();

    [[nodiscard]] bool isCancelled() const noexcept { return m_cancelled.load(); }
    [[nodiscard]] PipelinePhase phase() const;
    [[nodiscard]] uint64_t id() const noexcept { return m_id; }
    [[nodiscard]] Timing timing() const;
    [[nodiscard]] ViewHandle rootView() const;

    /**
     * @brief 取走已渲染的树（交给引擎缓存），只在 COMPLETED 且队列已清空时有效，否则返回 nullptr
     */
    [[nodiscard]] std::unique_ptr<Node> takeTree();

    [[nodiscard]] OperationQueue& queue() noexcept { return m_queue; }

private:
    struct RawTemplate
    {
        std::string text;
    };
    using Source = std::variant<std::unique_ptr<Node>, RawTemplate>;

    void launch(Source source, nlohmann::json data, Size containerSize);

    /**
     * @brief 后台任务主体
     */
    void run(Epoch epoch, Source source, const nlohmann::json& data, Size containerSize);

    void fail(Epoch epoch, RenderError error);

    /**
     * @brief 为非扁平节点生成创建、挂载、刷新三类闭包
     */
    void enqueueMaterialize(Epoch epoch, Node& node, Node* host, size_t& hostIndex, bool isRoot);

    [[nodiscard]] bool checkpoint(Epoch epoch) const;

    std::expected<ViewHandle, RenderError> finishFlush(const FlushResult& result);

    RenderContext& m_context;
    Config m_config;
    uint64_t m_id;
    OperationQueue m_queue;
    patch::ViewMaterializer m_materializer;

    mutable std::mutex m_mutex;
    std::unique_ptr<Node> m_tree;
    PipelinePhase m_phase = PipelinePhase::IDLE;
    RenderError m_error = RenderError::CANCELLED;
    Timing m_timing;
    ViewHandle m_rootView;
    bool m_notified = false;
    std::chrono::steady_clock::time_point m_startTime;

    std::atomic<bool> m_cancelled{false};
    std::future<void> m_job;
};

} // namespace tx::pipeline
