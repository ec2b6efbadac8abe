/**
 * ************************************************************************
 *
 * @file RenderContext.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-13
 * @version 0.1
 * @brief 渲染核心的组合根
 *
 * 持有配置、后台线程池、布局节点池、事件分发器与 UI 线程标识，
 * 外部协作者以非拥有指针登记，其生命周期须长于本对象。
 * 流水线、引擎都通过构造参数拿到它，不存在全局渲染状态。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <entt/entt.hpp>
#include <atomic>
#include <cstdint>
#include "ThreadAffinity.hpp"
#include "../config/RenderConfig.hpp"
#include "../interface/IDataBinder.hpp"
#include "../interface/IRecyclePool.hpp"
#include "../interface/ITemplateParser.hpp"
#include "../interface/ITextMeasurer.hpp"
#include "../layout/LayoutAdapter.hpp"
#include "../layout/LayoutNodePool.hpp"
#include "../managers/WidgetTable.hpp"
#include "../utils/ThreadPool.hpp"

namespace tx
{

/**
 * @brief 可选的外部协作者
 */
struct Collaborators
{
    interface::ITemplateParser* parser = nullptr;
    interface::IDataBinder* binder = nullptr;
    interface::ITextMeasurer* measurer = nullptr;
    interface::IRecyclePool* recyclePool = nullptr;
};

class RenderContext
{
public:
    /**
     * @brief 在 UI 线程上构造，构造线程即被登记为 UI 线程
     */
    RenderContext(RenderConfig config, managers::WidgetTable& widgets, Collaborators collaborators = {});
    ~RenderContext();

    RenderContext(const RenderContext&) = delete;
    RenderContext& operator=(const RenderContext&) = delete;
    RenderContext(RenderContext&&) = delete;
    RenderContext& operator=(RenderContext&&) = delete;

    [[nodiscard]] const RenderConfig& config() const noexcept { return m_config; }

    /**
     * @brief 更新配置中可在运行期切换的部分（日志级别、占位视图）
     */
    void applyConfig(const RenderConfig& config);

    [[nodiscard]] const Collaborators& collaborators() const noexcept { return m_collaborators; }
    [[nodiscard]] interface::ITemplateParser* parser() const noexcept { return m_collaborators.parser; }
    [[nodiscard]] interface::IDataBinder* binder() const noexcept { return m_collaborators.binder; }
    [[nodiscard]] managers::WidgetTable& widgets() const noexcept { return m_widgets; }
    [[nodiscard]] interface::IRecyclePool* recyclePool() const noexcept { return m_collaborators.recyclePool; }

    [[nodiscard]] utils::ThreadPool& threadPool() noexcept { return m_threadPool; }
    [[nodiscard]] layout::LayoutNodePool& layoutPool() noexcept { return m_layoutPool; }
    [[nodiscard]] const layout::LayoutAdapter& layoutAdapter() const noexcept { return m_layoutAdapter; }
    [[nodiscard]] layout::LayoutAdapter& layoutAdapter() noexcept { return m_layoutAdapter; }
    [[nodiscard]] entt::dispatcher& dispatcher() noexcept { return m_dispatcher; }

    [[nodiscard]] ThreadAffinity& affinity() noexcept { return m_affinity; }
    [[nodiscard]] bool isUIThread() const noexcept { return m_affinity.isCurrentThread(); }

    [[nodiscard]] uint64_t nextPipelineId() noexcept { return m_nextPipelineId.fetch_add(1) + 1; }

private:
    RenderConfig m_config;
    managers::WidgetTable& m_widgets;
    Collaborators m_collaborators;
    ThreadAffinity m_affinity;
    entt::dispatcher m_dispatcher;
    layout::LayoutNodePool m_layoutPool;
    layout::LayoutAdapter m_layoutAdapter;
    std::atomic<uint64_t> m_nextPipelineId{0};

    // 最后声明、最先析构：后台任务全部结束后才释放节点池
    utils::ThreadPool m_threadPool;
};

} // namespace tx
