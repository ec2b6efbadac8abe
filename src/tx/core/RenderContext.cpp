/**
 * ************************************************************************
 *
 * @file RenderContext.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-13
 * @version 0.1
 * @brief 渲染核心组合根实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "RenderContext.hpp"

#include "../singleton/Logger.hpp"

namespace tx
{

RenderContext::RenderContext(RenderConfig config, managers::WidgetTable& widgets, Collaborators collaborators)
    : m_config(config),
      m_widgets(widgets),
      m_collaborators(collaborators),
      m_layoutPool(config.layoutPoolMaxIdle),
      m_layoutAdapter(m_layoutPool, collaborators.measurer),
      m_threadPool(config.backgroundThreads)
{
    applyConfig(m_config);
    m_layoutPool.warmUp(m_config.layoutPoolWarmUp);

    Logger::info("[RenderContext] 初始化完成: 后台线程 {}, 布局节点预热 {}",
                 m_threadPool.threadCount(),
                 m_config.layoutPoolWarmUp);
}

RenderContext::~RenderContext()
{
    m_threadPool.shutdown();
    if (m_layoutPool.checkedOutCount() > 0)
    {
        Logger::warn("[RenderContext] 销毁时仍有 {} 个布局节点未归还", m_layoutPool.checkedOutCount());
    }
}

void RenderContext::applyConfig(const RenderConfig& config)
{
    m_config.enableVerboseLogging = config.enableVerboseLogging;
    m_config.enablePerformanceMonitor = config.enablePerformanceMonitor;
    m_config.debugPlaceholders = config.debugPlaceholders;
    m_config.syncFlushTimeoutMs = config.syncFlushTimeoutMs;

    Logger::setLevel(m_config.enableVerboseLogging ? spdlog::level::debug : spdlog::level::info);
    m_widgets.setDebugPlaceholders(m_config.debugPlaceholders);
}

} // namespace tx
