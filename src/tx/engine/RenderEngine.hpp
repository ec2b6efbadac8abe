/**
 * ************************************************************************
 *
 * @file RenderEngine.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-16
 * @version 0.1
 * @brief 对外渲染入口：同步渲染、增量更新、原型与高度缓存
 *
 * 渲染缓存以根视图句柄为键，只在 UI 线程读写。
 * 更新替换了根节点时缓存改用新的根视图为键，并在 dispatcher 上发出 RootViewReplaced，
 * 旧句柄此后不再有效。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include "../common/Errors.hpp"
#include "../common/Types.hpp"
#include "../core/Node.hpp"
#include "../core/RenderContext.hpp"
#include "../diff/Differ.hpp"
#include "../managers/LruCache.hpp"
#include "../patch/PatchApplier.hpp"
#include "../patch/ViewMaterializer.hpp"
#include "../pipeline/PipelinePool.hpp"
#include "../pipeline/RenderPipeline.hpp"

namespace tx::engine
{

/**
 * @brief 批量渲染中的一项
 */
struct BatchRenderTask
{
    std::string id;
    std::string rawTemplate;
    nlohmann::json data;
    Size containerSize;
};

struct BatchRenderResult
{
    std::string id;
    std::expected<ViewHandle, RenderError> view;
};

class RenderEngine
{
public:
    explicit RenderEngine(RenderContext& context);
    ~RenderEngine();

    RenderEngine(const RenderEngine&) = delete;
    RenderEngine& operator=(const RenderEngine&) = delete;
    RenderEngine(RenderEngine&&) = delete;
    RenderEngine& operator=(RenderEngine&&) = delete;

    // ===================== 同步渲染（UI 线程） =====================

    /**
     * @brief 绑定、布局并创建整棵视图树
     */
    std::expected<ViewHandle, RenderError> render(std::unique_ptr<Node> tree,
                                                  const nlohmann::json& data,
                                                  Size containerSize);

    std::expected<ViewHandle, RenderError> renderTemplate(std::string_view rawTemplate,
                                                          const nlohmann::json& data,
                                                          Size containerSize);

    std::expected<ViewHandle, RenderError> renderWithPrototype(const std::string& templateId,
                                                               const nlohmann::json& data,
                                                               Size containerSize);

    /**
     * @brief 后台线程池并发完成各项的解析、绑定与布局，再在 UI 线程按输入顺序创建视图
     *
     * 结果与输入一一对应，失败项各自携带错误。不可在池线程内调用。
     */
    std::vector<BatchRenderResult> renderBatch(std::span<const BatchRenderTask> tasks);

    // ===================== 增量更新（UI 线程） =====================

    /**
     * @brief 以新数据重新绑定活动树的副本，比较后把差异应用到活动树
     *
     * 根节点被替换时缓存改挂到新的根视图下，旧句柄随即失效，
     * 新句柄通过 events::RootViewReplaced 通知。
     * @return 应用的编辑操作数
     */
    std::expected<size_t, RenderError> update(ViewHandle view, const nlohmann::json& data, Size containerSize);

    /**
     * @brief 与显式给出的新树比较（模板本身发生了变化）
     */
    std::expected<size_t, RenderError> update(ViewHandle view,
                                              std::unique_ptr<Node> newTree,
                                              const nlohmann::json& data,
                                              Size containerSize);

    /**
     * @brief 结构不变时的快速路径，不做差异比较
     */
    std::expected<void, RenderError> quickUpdate(ViewHandle view, const nlohmann::json& data, Size containerSize);

    /**
     * @brief 直接在活动树上重新绑定，然后强制刷新全部视图
     */
    std::expected<void, RenderError> fullUpdate(ViewHandle view, const nlohmann::json& data, Size containerSize);

    // ===================== 渲染缓存 =====================

    [[nodiscard]] Node* liveTree(ViewHandle view);
    [[nodiscard]] const nlohmann::json* lastData(ViewHandle view) const;
    void cleanup(ViewHandle view);
    void clearAllCache();
    [[nodiscard]] size_t cachedViewCount() const noexcept { return m_renderCache.size(); }

    // ===================== 模板原型 =====================

    void registerPrototype(const std::string& templateId, std::unique_ptr<Node> prototype);
    [[nodiscard]] bool hasPrototype(const std::string& templateId) const;
    [[nodiscard]] std::shared_ptr<const Node> prototype(const std::string& templateId);
    void clearTemplateCache();
    void clearTemplateCache(const std::string& templateId);

    // ===================== 高度计算（任意线程） =====================

    /**
     * @brief 宽度固定、高度由内容撑开时的布局高度
     * @param dataId 非空时结果按 templateId_width_dataId 缓存
     */
    std::expected<float, RenderError> calculateHeight(const std::string& templateId,
                                                      const nlohmann::json& data,
                                                      float width,
                                                      const std::string& dataId = {});

    /**
     * @brief 在后台线程池上并发计算一批数据的高度，不可在池线程内调用
     * @param idField 数据中用作缓存 dataId 的字段
     */
    std::vector<std::expected<float, RenderError>> calculateHeights(const std::string& templateId,
                                                                    std::span<const nlohmann::json> items,
                                                                    float width,
                                                                    std::string_view idField = "id");

    void clearHeightCache() { m_heightCache.clear(); }

    /**
     * @brief 只清除以 "templateId_" 开头的高度缓存
     * @return 清除的条目数
     */
    size_t clearHeightCache(const std::string& templateId);

    // ===================== 流水线 =====================

    [[nodiscard]] std::unique_ptr<pipeline::RenderPipeline> acquirePipeline();
    void releasePipeline(std::unique_ptr<pipeline::RenderPipeline> pipeline);

    /**
     * @brief 把 flush 完成的流水线结果纳入渲染缓存，之后即可 update
     *
     * 流水线仍有排队的视图操作时先在当前线程执行完，再取走渲染树。
     */
    std::expected<ViewHandle, RenderError> adoptPipeline(pipeline::RenderPipeline& pipeline,
                                                         const nlohmann::json& data,
                                                         Size containerSize);

    [[nodiscard]] const diff::Differ& differ() const noexcept { return m_differ; }
    [[nodiscard]] pipeline::PipelinePool& pipelinePool() noexcept { return m_pipelinePool; }

private:
    struct CacheEntry
    {
        std::unique_ptr<Node> tree;
        nlohmann::json data;
        Size containerSize;
    };

    CacheEntry* findEntry(ViewHandle view);

    /**
     * @brief 写入渲染缓存；键已被占用时先释放旧条目
     */
    void storeEntry(ViewHandle root, CacheEntry entry);

    /**
     * @brief 根节点被替换后把缓存条目改挂到新的根视图下
     * @return 当前根视图；根视图缺失时条目被移除并返回空句柄
     */
    ViewHandle rekeyIfReplaced(ViewHandle view);

    std::unique_ptr<Node> rebind(const Node& liveRoot, const nlohmann::json& data) const;

    size_t diffAndPatch(CacheEntry& entry, const Node& newTree, Size containerSize);

    void layoutTree(Node& root, Size containerSize) const;

    RenderContext& m_context;
    patch::ViewMaterializer m_materializer;
    patch::PatchApplier m_patcher;
    diff::Differ m_differ;
    pipeline::PipelinePool m_pipelinePool;

    std::unordered_map<ViewHandle, CacheEntry> m_renderCache;
    managers::LruCache<std::string, std::shared_ptr<const Node>> m_prototypes;
    managers::LruCache<std::string, float> m_heightCache;
};

} // namespace tx::engine
