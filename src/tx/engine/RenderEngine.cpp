/**
 * ************************************************************************
 *
 * @file RenderEngine.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-16
 * @version 0.1
 * @brief 渲染引擎实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "RenderEngine.hpp"

#include <fmt/format.h>
#include <chrono>
#include <cmath>
#include <exception>
#include <future>
#include <utility>
#include <vector>
#include "../layout/LayoutAdapter.hpp"
#include "../singleton/Logger.hpp"

namespace tx::engine
{

namespace
{

using Clock = std::chrono::steady_clock;

double elapsedMs(Clock::time_point start)
{
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

std::string heightCacheKey(const std::string& templateId, float width, const std::string& dataId)
{
    return fmt::format("{}_{}_{}", templateId, width, dataId);
}

/**
 * @brief NaN 表示由内容撑开，两侧都为 NaN 视为相同
 */
bool sameExtent(Size lhs, Size rhs)
{
    auto same = [](float a, float b) { return a == b || (std::isnan(a) && std::isnan(b)); };
    return same(lhs.width, rhs.width) && same(lhs.height, rhs.height);
}

/**
 * @brief 批量渲染中后台阶段的产物，视图在 UI 线程上创建
 */
struct PreparedRender
{
    std::unique_ptr<Node> tree;
    layout::FrameMap frames;
};

} // namespace

RenderEngine::RenderEngine(RenderContext& context)
    : m_context(context),
      m_materializer(context.widgets(), context.recyclePool(), context.config().enableViewReuse),
      m_patcher(context.layoutAdapter(), m_materializer, context.affinity()),
      m_differ(diff::DiffConfig{.enableKeyOptimization = context.config().enableKeyOptimization,
                                .maxDepth = context.config().maxDiffDepth}),
      m_pipelinePool(context, context.config().pipelinePoolCapacity),
      m_prototypes(context.config().prototypeCacheCapacity),
      m_heightCache(context.config().heightCacheCapacity)
{
}

RenderEngine::~RenderEngine()
{
    if (!m_renderCache.empty())
    {
        Logger::debug("[RenderEngine] 析构时仍有 {} 棵活动树，释放其视图", m_renderCache.size());
        clearAllCache();
    }
    m_pipelinePool.clear();
}

// ===================== 同步渲染 =====================

std::expected<ViewHandle, RenderError> RenderEngine::render(std::unique_ptr<Node> tree,
                                                            const nlohmann::json& data,
                                                            Size containerSize)
{
    TX_ASSERT_UI_THREAD(m_context.affinity());
    if (!tree) [[unlikely]]
    {
        Logger::error("[RenderEngine] render 收到空树");
        return std::unexpected(RenderError::PARSE_FAILURE);
    }

    const auto start = Clock::now();

    // 1. 绑定
    if (auto* binder = m_context.binder())
    {
        try
        {
            binder->bind(data, *tree);
        }
        catch (const std::exception& error)
        {
            Logger::error("[RenderEngine] 数据绑定异常: {}", error.what());
            return std::unexpected(RenderError::LAYOUT_FAILURE);
        }
    }

    // 2. 布局
    layoutTree(*tree, containerSize);

    // 3. 创建视图
    const ViewHandle root = m_materializer.createViewTree(*tree, ViewHandle{});
    if (!root) [[unlikely]]
    {
        Logger::error("[RenderEngine] 根视图创建失败 ({})", tree->id());
        m_materializer.releaseViewTree(*tree);
        return std::unexpected(RenderError::LAYOUT_FAILURE);
    }

    if (m_context.config().enablePerformanceMonitor)
    {
        Logger::info("[RenderEngine] render {} 耗时 {:.2f}ms", tree->id(), elapsedMs(start));
    }

    // 4. 缓存活动树
    storeEntry(root, CacheEntry{std::move(tree), data, containerSize});
    return root;
}

std::expected<ViewHandle, RenderError> RenderEngine::renderTemplate(std::string_view rawTemplate,
                                                                    const nlohmann::json& data,
                                                                    Size containerSize)
{
    auto* parser = m_context.parser();
    if (parser == nullptr)
    {
        Logger::error("[RenderEngine] 未注册模板解析器");
        return std::unexpected(RenderError::PARSE_FAILURE);
    }

    std::expected<std::unique_ptr<Node>, std::string> parsed;
    try
    {
        parsed = parser->parse(rawTemplate);
    }
    catch (const std::exception& error)
    {
        Logger::error("[RenderEngine] 解析器异常: {}", error.what());
        return std::unexpected(RenderError::PARSE_FAILURE);
    }
    if (!parsed)
    {
        Logger::error("[RenderEngine] 模板解析失败: {}", parsed.error());
        return std::unexpected(RenderError::PARSE_FAILURE);
    }
    return render(std::move(*parsed), data, containerSize);
}

std::expected<ViewHandle, RenderError> RenderEngine::renderWithPrototype(const std::string& templateId,
                                                                         const nlohmann::json& data,
                                                                         Size containerSize)
{
    auto proto = prototype(templateId);
    if (!proto)
    {
        Logger::error("[RenderEngine] 模板原型 {} 未注册", templateId);
        return std::unexpected(RenderError::PARSE_FAILURE);
    }
    return render(proto->deepClone(), data, containerSize);
}

std::vector<BatchRenderResult> RenderEngine::renderBatch(std::span<const BatchRenderTask> tasks)
{
    TX_ASSERT_UI_THREAD(m_context.affinity());
    const auto start = Clock::now();

    // 1. 解析 / 绑定 / 布局并发执行
    std::vector<std::future<std::expected<PreparedRender, RenderError>>> jobs;
    jobs.reserve(tasks.size());
    for (const auto& task : tasks)
    {
        jobs.push_back(m_context.threadPool().enqueue(
            [this, &task]() -> std::expected<PreparedRender, RenderError>
            {
                auto* parser = m_context.parser();
                if (parser == nullptr)
                {
                    Logger::error("[RenderEngine] 未注册模板解析器");
                    return std::unexpected(RenderError::PARSE_FAILURE);
                }
                std::expected<std::unique_ptr<Node>, std::string> parsed;
                try
                {
                    parsed = parser->parse(task.rawTemplate);
                }
                catch (const std::exception& error)
                {
                    Logger::error("[RenderEngine] 批量任务 {} 解析器异常: {}", task.id, error.what());
                    return std::unexpected(RenderError::PARSE_FAILURE);
                }
                if (!parsed || !*parsed)
                {
                    Logger::error("[RenderEngine] 批量任务 {} 模板解析失败", task.id);
                    return std::unexpected(RenderError::PARSE_FAILURE);
                }

                PreparedRender prepared{std::move(*parsed), {}};
                if (auto* binder = m_context.binder())
                {
                    try
                    {
                        binder->bind(task.data, *prepared.tree);
                    }
                    catch (const std::exception& error)
                    {
                        Logger::error("[RenderEngine] 批量任务 {} 数据绑定异常: {}", task.id, error.what());
                        return std::unexpected(RenderError::LAYOUT_FAILURE);
                    }
                }

                auto frames = m_context.layoutAdapter().tryComputeLayout(*prepared.tree, task.containerSize);
                if (frames)
                {
                    prepared.frames = std::move(*frames);
                }
                else
                {
                    Logger::warn("[RenderEngine] 批量任务 {} 布局失败，按零尺寸继续", task.id);
                }
                return prepared;
            }));
    }

    // 2. 后台任务引用 tasks，全部结束后再逐个取结果
    for (auto& job : jobs)
    {
        job.wait();
    }

    // 3. 按输入顺序在 UI 线程创建视图
    std::vector<BatchRenderResult> results;
    results.reserve(tasks.size());
    for (size_t i = 0; i < tasks.size(); ++i)
    {
        std::expected<PreparedRender, RenderError> prepared = std::unexpected(RenderError::LAYOUT_FAILURE);
        try
        {
            prepared = jobs[i].get();
        }
        catch (const std::exception& error)
        {
            Logger::error("[RenderEngine] 批量任务 {} 后台异常: {}", tasks[i].id, error.what());
        }
        if (!prepared)
        {
            results.push_back(BatchRenderResult{tasks[i].id, std::unexpected(prepared.error())});
            continue;
        }

        auto tree = std::move(prepared->tree);
        layout::LayoutAdapter::applyFrames(*tree, prepared->frames);
        const ViewHandle root = m_materializer.createViewTree(*tree, ViewHandle{});
        if (!root) [[unlikely]]
        {
            Logger::error("[RenderEngine] 批量任务 {} 根视图创建失败", tasks[i].id);
            m_materializer.releaseViewTree(*tree);
            results.push_back(BatchRenderResult{tasks[i].id, std::unexpected(RenderError::LAYOUT_FAILURE)});
            continue;
        }
        storeEntry(root, CacheEntry{std::move(tree), tasks[i].data, tasks[i].containerSize});
        results.push_back(BatchRenderResult{tasks[i].id, root});
    }

    if (m_context.config().enablePerformanceMonitor)
    {
        Logger::info("[RenderEngine] renderBatch {} 个任务耗时 {:.2f}ms", tasks.size(), elapsedMs(start));
    }
    return results;
}

// ===================== 增量更新 =====================

std::expected<size_t, RenderError> RenderEngine::update(ViewHandle view,
                                                        const nlohmann::json& data,
                                                        Size containerSize)
{
    TX_ASSERT_UI_THREAD(m_context.affinity());
    auto* entry = findEntry(view);
    if (entry == nullptr)
    {
        return std::unexpected(RenderError::UNKNOWN_VIEW);
    }

    auto bound = rebind(*entry->tree, data);
    if (!bound)
    {
        return std::unexpected(RenderError::LAYOUT_FAILURE);
    }
    const size_t applied = diffAndPatch(*entry, *bound, containerSize);
    entry->data = data;
    rekeyIfReplaced(view);
    return applied;
}

std::expected<size_t, RenderError> RenderEngine::update(ViewHandle view,
                                                        std::unique_ptr<Node> newTree,
                                                        const nlohmann::json& data,
                                                        Size containerSize)
{
    TX_ASSERT_UI_THREAD(m_context.affinity());
    auto* entry = findEntry(view);
    if (entry == nullptr)
    {
        return std::unexpected(RenderError::UNKNOWN_VIEW);
    }
    if (!newTree) [[unlikely]]
    {
        Logger::error("[RenderEngine] update 收到空树");
        return std::unexpected(RenderError::PARSE_FAILURE);
    }

    if (auto* binder = m_context.binder())
    {
        try
        {
            binder->bind(data, *newTree);
        }
        catch (const std::exception& error)
        {
            Logger::error("[RenderEngine] 数据绑定异常: {}", error.what());
            return std::unexpected(RenderError::LAYOUT_FAILURE);
        }
    }
    const size_t applied = diffAndPatch(*entry, *newTree, containerSize);
    entry->data = data;
    rekeyIfReplaced(view);
    return applied;
}

std::expected<void, RenderError> RenderEngine::quickUpdate(ViewHandle view,
                                                           const nlohmann::json& data,
                                                           Size containerSize)
{
    TX_ASSERT_UI_THREAD(m_context.affinity());
    auto* entry = findEntry(view);
    if (entry == nullptr)
    {
        return std::unexpected(RenderError::UNKNOWN_VIEW);
    }

    auto bound = rebind(*entry->tree, data);
    if (!bound)
    {
        return std::unexpected(RenderError::LAYOUT_FAILURE);
    }
    m_patcher.quickUpdate(*entry->tree, *bound, containerSize);
    entry->data = data;
    entry->containerSize = containerSize;
    return {};
}

std::expected<void, RenderError> RenderEngine::fullUpdate(ViewHandle view,
                                                          const nlohmann::json& data,
                                                          Size containerSize)
{
    TX_ASSERT_UI_THREAD(m_context.affinity());
    auto* entry = findEntry(view);
    if (entry == nullptr)
    {
        return std::unexpected(RenderError::UNKNOWN_VIEW);
    }

    if (auto* binder = m_context.binder())
    {
        try
        {
            binder->bind(data, *entry->tree);
        }
        catch (const std::exception& error)
        {
            Logger::error("[RenderEngine] 数据绑定异常: {}", error.what());
            return std::unexpected(RenderError::LAYOUT_FAILURE);
        }
    }
    entry->tree->visit(
        [](Node& node)
        {
            node.setForceApply(true);
            node.markContentDirty();
        });
    m_patcher.refresh(*entry->tree, containerSize);
    entry->data = data;
    entry->containerSize = containerSize;
    return {};
}

// ===================== 渲染缓存 =====================

Node* RenderEngine::liveTree(ViewHandle view)
{
    auto* entry = findEntry(view);
    return entry != nullptr ? entry->tree.get() : nullptr;
}

const nlohmann::json* RenderEngine::lastData(ViewHandle view) const
{
    auto iter = m_renderCache.find(view);
    return iter != m_renderCache.end() ? &iter->second.data : nullptr;
}

void RenderEngine::cleanup(ViewHandle view)
{
    TX_ASSERT_UI_THREAD(m_context.affinity());
    auto iter = m_renderCache.find(view);
    if (iter == m_renderCache.end())
    {
        return;
    }
    if (iter->second.tree)
    {
        m_materializer.releaseViewTree(*iter->second.tree);
    }
    m_renderCache.erase(iter);
}

void RenderEngine::clearAllCache()
{
    TX_ASSERT_UI_THREAD(m_context.affinity());
    for (auto& [view, entry] : m_renderCache)
    {
        if (entry.tree)
        {
            m_materializer.releaseViewTree(*entry.tree);
        }
    }
    m_renderCache.clear();
    m_heightCache.clear();
    Logger::debug("[RenderEngine] 已清空渲染缓存与高度缓存");
}

// ===================== 模板原型 =====================

void RenderEngine::registerPrototype(const std::string& templateId, std::unique_ptr<Node> prototype)
{
    if (!prototype) [[unlikely]]
    {
        Logger::warn("[RenderEngine] 忽略空的模板原型 {}", templateId);
        return;
    }
    m_prototypes.put(templateId, std::shared_ptr<const Node>(std::move(prototype)));
}

bool RenderEngine::hasPrototype(const std::string& templateId) const
{
    return m_prototypes.contains(templateId);
}

std::shared_ptr<const Node> RenderEngine::prototype(const std::string& templateId)
{
    return m_prototypes.get(templateId).value_or(nullptr);
}

void RenderEngine::clearTemplateCache()
{
    m_prototypes.clear();
    Logger::info("[RenderEngine] 已清空全部模板原型");
}

void RenderEngine::clearTemplateCache(const std::string& templateId)
{
    if (m_prototypes.erase(templateId))
    {
        Logger::info("[RenderEngine] 已移除模板原型 {}", templateId);
    }
}

// ===================== 高度计算 =====================

std::expected<float, RenderError> RenderEngine::calculateHeight(const std::string& templateId,
                                                                const nlohmann::json& data,
                                                                float width,
                                                                const std::string& dataId)
{
    // 1. 命中缓存
    const bool cacheable = !dataId.empty();
    std::string cacheKey;
    if (cacheable)
    {
        cacheKey = heightCacheKey(templateId, width, dataId);
        if (auto cached = m_heightCache.get(cacheKey))
        {
            return *cached;
        }
    }

    // 2. 克隆原型并绑定
    auto proto = prototype(templateId);
    if (!proto)
    {
        Logger::error("[RenderEngine] 模板原型 {} 未注册", templateId);
        return std::unexpected(RenderError::PARSE_FAILURE);
    }
    auto tree = proto->deepClone();
    if (auto* binder = m_context.binder())
    {
        try
        {
            binder->bind(data, *tree);
        }
        catch (const std::exception& error)
        {
            Logger::error("[RenderEngine] 数据绑定异常: {}", error.what());
            return std::unexpected(RenderError::LAYOUT_FAILURE);
        }
    }

    // 3. 宽度固定，高度由内容撑开
    auto frames = m_context.layoutAdapter().tryComputeLayout(*tree, Size{width, UNDEFINED_DIMENSION});
    if (!frames)
    {
        return std::unexpected(frames.error());
    }
    auto rootFrame = frames->find(tree->id());
    const float height = rootFrame != frames->end() ? rootFrame->second.height : 0.0F;

    if (cacheable)
    {
        m_heightCache.put(cacheKey, height);
    }
    return height;
}

std::vector<std::expected<float, RenderError>> RenderEngine::calculateHeights(const std::string& templateId,
                                                                              std::span<const nlohmann::json> items,
                                                                              float width,
                                                                              std::string_view idField)
{
    std::vector<std::future<std::expected<float, RenderError>>> futures;
    futures.reserve(items.size());
    for (const auto& item : items)
    {
        std::string dataId;
        if (item.is_object())
        {
            if (auto iter = item.find(idField); iter != item.end())
            {
                dataId = iter->is_string() ? iter->get<std::string>() : iter->dump();
            }
        }
        futures.push_back(m_context.threadPool().enqueue(
            [this, &templateId, &item, width, dataId = std::move(dataId)]()
            { return calculateHeight(templateId, item, width, dataId); }));
    }

    std::vector<std::expected<float, RenderError>> results;
    results.reserve(futures.size());
    for (auto& future : futures)
    {
        try
        {
            results.push_back(future.get());
        }
        catch (const std::exception& error)
        {
            Logger::error("[RenderEngine] 高度计算异常: {}", error.what());
            results.emplace_back(std::unexpected(RenderError::LAYOUT_FAILURE));
        }
    }
    return results;
}

size_t RenderEngine::clearHeightCache(const std::string& templateId)
{
    const std::string prefix = templateId + "_";
    const size_t removed = m_heightCache.eraseIf([&prefix](const std::string& key, float)
                                                 { return key.starts_with(prefix); });
    Logger::info("[RenderEngine] 已清除模板 {} 的 {} 条高度缓存", templateId, removed);
    return removed;
}

// ===================== 流水线 =====================

std::unique_ptr<pipeline::RenderPipeline> RenderEngine::acquirePipeline()
{
    return m_pipelinePool.acquire(pipeline::PipelineConfig::from(m_context.config()));
}

void RenderEngine::releasePipeline(std::unique_ptr<pipeline::RenderPipeline> pipeline)
{
    m_pipelinePool.release(std::move(pipeline));
}

std::expected<ViewHandle, RenderError> RenderEngine::adoptPipeline(pipeline::RenderPipeline& pipeline,
                                                                   const nlohmann::json& data,
                                                                   Size containerSize)
{
    TX_ASSERT_UI_THREAD(m_context.affinity());
    if (pipeline.phase() == pipeline::PipelinePhase::COMPLETED && pipeline.queue().pendingCount() > 0)
    {
        // 排队的闭包持有渲染树节点，取走树之前先执行完
        Logger::debug("[RenderEngine] 流水线 #{} 仍有 {} 个排队操作，先执行", pipeline.id(),
                      pipeline.queue().pendingCount());
        auto flushed = pipeline.forceFlush();
        if (!flushed)
        {
            return std::unexpected(flushed.error());
        }
    }

    const ViewHandle root = pipeline.rootView();
    if (pipeline.phase() != pipeline::PipelinePhase::COMPLETED || !root)
    {
        Logger::warn("[RenderEngine] 流水线 #{} 尚未完成 flush，无法纳入缓存", pipeline.id());
        return std::unexpected(RenderError::CANCELLED);
    }
    auto tree = pipeline.takeTree();
    if (!tree)
    {
        return std::unexpected(RenderError::CANCELLED);
    }
    storeEntry(root, CacheEntry{std::move(tree), data, containerSize});
    return root;
}

// ===================== 内部 =====================

RenderEngine::CacheEntry* RenderEngine::findEntry(ViewHandle view)
{
    auto iter = m_renderCache.find(view);
    if (iter == m_renderCache.end() || !iter->second.tree)
    {
        Logger::warn("[RenderEngine] 视图 {} 不在渲染缓存中", view.value);
        return nullptr;
    }
    return &iter->second;
}

void RenderEngine::storeEntry(ViewHandle root, CacheEntry entry)
{
    auto iter = m_renderCache.find(root);
    if (iter != m_renderCache.end()) [[unlikely]]
    {
        Logger::error("[RenderEngine] 视图 {} 已被另一棵活动树占用，释放旧树", root.value);
        if (auto& stale = iter->second.tree)
        {
            // 句柄已属于新树，旧树上同一句柄只清除引用
            stale->visit(
                [root](Node& node)
                {
                    if (node.view() == root) node.clearView();
                });
            m_materializer.releaseViewTree(*stale);
        }
        m_renderCache.erase(iter);
    }
    m_renderCache.emplace(root, std::move(entry));
}

ViewHandle RenderEngine::rekeyIfReplaced(ViewHandle view)
{
    auto iter = m_renderCache.find(view);
    if (iter == m_renderCache.end())
    {
        return {};
    }
    const ViewHandle current = iter->second.tree ? iter->second.tree->view() : ViewHandle{};
    if (current == view)
    {
        return view;
    }

    CacheEntry entry = std::move(iter->second);
    m_renderCache.erase(iter);
    if (!current) [[unlikely]]
    {
        Logger::error("[RenderEngine] 视图 {} 更新后没有根视图，移出渲染缓存", view.value);
        if (entry.tree)
        {
            m_materializer.releaseViewTree(*entry.tree);
        }
        return {};
    }

    storeEntry(current, std::move(entry));
    Logger::info("[RenderEngine] 根节点已替换，视图 {} -> {}", view.value, current.value);
    m_context.dispatcher().trigger(events::RootViewReplaced{view, current});
    return current;
}

std::unique_ptr<Node> RenderEngine::rebind(const Node& liveRoot, const nlohmann::json& data) const
{
    auto bound = liveRoot.deepClone();
    if (auto* binder = m_context.binder())
    {
        try
        {
            binder->bind(data, *bound);
        }
        catch (const std::exception& error)
        {
            Logger::error("[RenderEngine] 数据绑定异常: {}", error.what());
            return nullptr;
        }
    }
    return bound;
}

size_t RenderEngine::diffAndPatch(CacheEntry& entry, const Node& newTree, Size containerSize)
{
    const auto start = Clock::now();
    const auto script = m_differ.diff(entry.tree.get(), &newTree);
    const double diffMs = elapsedMs(start);

    size_t applied = 0;
    if (script.hasDiff())
    {
        applied = m_patcher.apply(script, entry.tree, containerSize);
    }
    else if (!sameExtent(containerSize, entry.containerSize))
    {
        m_patcher.refresh(*entry.tree, containerSize);
    }
    entry.containerSize = containerSize;

    if (m_context.config().enablePerformanceMonitor)
    {
        Logger::info("[RenderEngine] diff {:.2f}ms，{} 个操作，应用 {} 个", diffMs, script.operationCount(), applied);
    }
    return applied;
}

void RenderEngine::layoutTree(Node& root, Size containerSize) const
{
    auto frames = m_context.layoutAdapter().tryComputeLayout(root, containerSize);
    if (frames)
    {
        layout::LayoutAdapter::applyFrames(root, *frames);
        return;
    }
    Logger::warn("[RenderEngine] {} 布局失败，按零尺寸继续", root.id());
    layout::LayoutAdapter::applyFrames(root, {});
}

} // namespace tx::engine
