/**
 * ************************************************************************
 *
 * @file Events.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-13
 * @version 0.1
 * @brief 流水线通知事件（经 RenderContext 的 entt::dispatcher 分发）
 *
 * 均在 UI 线程 flush 结束后 trigger，监听器可直接操作视图。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <cstdint>
#include "Errors.hpp"
#include "Types.hpp"

namespace tx
{

/**
 * @brief 单次渲染各阶段耗时（毫秒）
 */
struct RenderTiming
{
    double parseMs = 0.0;
    double bindMs = 0.0;
    double layoutMs = 0.0;
    double waitMs = 0.0;  // syncFlush 等待后台的时间
    double flushMs = 0.0; // UI 线程执行操作的时间
    double totalMs = 0.0;
};

namespace events
{

struct PipelineCompleted
{
    uint64_t pipelineId;
    ViewHandle rootView;
    RenderTiming timing;
};

struct PipelineFailed
{
    uint64_t pipelineId;
    RenderError error;
};

/**
 * @brief 更新替换了根节点，宿主需要把 oldView 换成 newView
 */
struct RootViewReplaced
{
    ViewHandle oldView;
    ViewHandle newView;
};

} // namespace events

} // namespace tx
