/**
 * ************************************************************************
 *
 * @file FakeViewWorld.h
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-17
 * @version 0.1
 * @brief 记录型视图宿主与控件处理器（用于单元测试）
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once
#include "src/tx/core/Node.hpp"
#include "src/tx/interface/IViewHost.hpp"
#include "src/tx/interface/IWidgetHandler.hpp"
#include "src/tx/managers/WidgetTable.hpp"
#include <algorithm>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tx::test
{

/**
 * @brief 一个假视图的全部可观察状态
 */
struct FakeView
{
    NodeKind kind = NodeKind::UNKNOWN;
    std::string nodeId;
    ViewHandle parent;
    std::vector<ViewHandle> children;
    bool placeholder = false;
    bool visible = true;
    bool destroyed = false;
    size_t updateCount = 0;
    Frame frame;
    NodeContent content;
    Bindings bindings;
};

/**
 * @brief 线程安全的视图宿主：按句柄记录父子关系与每次刷新
 */
class FakeViewHost : public interface::IViewHost
{
public:
    ViewHandle create(const Node& node)
    {
        std::lock_guard lock(m_mutex);
        ViewHandle handle{m_nextHandle++};
        FakeView view;
        view.kind = node.kind();
        view.nodeId = node.id();
        m_views.emplace(handle.value, std::move(view));
        ++m_createCount;
        return handle;
    }

    void recordUpdate(ViewHandle handle, const Node& node)
    {
        std::lock_guard lock(m_mutex);
        auto& view = m_views.at(handle.value);
        view.nodeId = node.id();
        view.frame = node.layoutResult();
        view.content = node.content();
        view.bindings = node.bindings();
        ++view.updateCount;
        ++m_updateCount;
    }

    void attachChild(ViewHandle parent, ViewHandle child, size_t index) override
    {
        std::lock_guard lock(m_mutex);
        detachLocked(child);
        auto& siblings = m_views.at(parent.value).children;
        index = std::min(index, siblings.size());
        siblings.insert(siblings.begin() + static_cast<std::ptrdiff_t>(index), child);
        m_views.at(child.value).parent = parent;
        ++m_attachCount;
    }

    void detachView(ViewHandle view) override
    {
        std::lock_guard lock(m_mutex);
        detachLocked(view);
    }

    void destroyView(ViewHandle view) override
    {
        std::lock_guard lock(m_mutex);
        detachLocked(view);
        m_views.at(view.value).destroyed = true;
        ++m_destroyCount;
    }

    ViewHandle createPlaceholder(const Node& node, bool visible) override
    {
        std::lock_guard lock(m_mutex);
        ViewHandle handle{m_nextHandle++};
        FakeView view;
        view.kind = node.kind();
        view.nodeId = node.id();
        view.placeholder = true;
        view.visible = visible;
        m_views.emplace(handle.value, std::move(view));
        ++m_placeholderCount;
        return handle;
    }

    // 测试辅助方法
    [[nodiscard]] FakeView view(ViewHandle handle) const
    {
        std::lock_guard lock(m_mutex);
        return m_views.at(handle.value);
    }

    [[nodiscard]] std::vector<ViewHandle> childrenOf(ViewHandle handle) const
    {
        std::lock_guard lock(m_mutex);
        return m_views.at(handle.value).children;
    }

    /**
     * @brief 子视图对应的节点 id，按挂载顺序
     */
    [[nodiscard]] std::vector<std::string> childIdsOf(ViewHandle handle) const
    {
        std::lock_guard lock(m_mutex);
        std::vector<std::string> ids;
        for (ViewHandle child : m_views.at(handle.value).children)
        {
            ids.push_back(m_views.at(child.value).nodeId);
        }
        return ids;
    }

    [[nodiscard]] size_t liveViewCount() const
    {
        std::lock_guard lock(m_mutex);
        return static_cast<size_t>(
            std::ranges::count_if(m_views, [](const auto& entry) { return !entry.second.destroyed; }));
    }

    [[nodiscard]] size_t createCount() const
    {
        std::lock_guard lock(m_mutex);
        return m_createCount;
    }

    [[nodiscard]] size_t placeholderCount() const
    {
        std::lock_guard lock(m_mutex);
        return m_placeholderCount;
    }

    [[nodiscard]] size_t updateCount() const
    {
        std::lock_guard lock(m_mutex);
        return m_updateCount;
    }

    [[nodiscard]] size_t destroyCount() const
    {
        std::lock_guard lock(m_mutex);
        return m_destroyCount;
    }

    [[nodiscard]] size_t attachCount() const
    {
        std::lock_guard lock(m_mutex);
        return m_attachCount;
    }

    void resetCounters()
    {
        std::lock_guard lock(m_mutex);
        m_createCount = m_placeholderCount = m_updateCount = m_destroyCount = m_attachCount = 0;
    }

private:
    void detachLocked(ViewHandle view)
    {
        auto& record = m_views.at(view.value);
        if (!record.parent) return;
        auto& siblings = m_views.at(record.parent.value).children;
        std::erase(siblings, view);
        record.parent = ViewHandle{};
    }

    mutable std::mutex m_mutex;
    std::unordered_map<uint64_t, FakeView> m_views;
    uint64_t m_nextHandle = 1;
    size_t m_createCount = 0;
    size_t m_placeholderCount = 0;
    size_t m_updateCount = 0;
    size_t m_destroyCount = 0;
    size_t m_attachCount = 0;
};

/**
 * @brief 把创建与刷新都转交给 FakeViewHost 记录
 */
class RecordingWidgetHandler : public interface::IWidgetHandler
{
public:
    explicit RecordingWidgetHandler(FakeViewHost& host) : m_host(host) {}

    ViewHandle createView(const Node& node) override { return m_host.create(node); }

    void updateView(ViewHandle view, const Node& node) override { m_host.recordUpdate(view, node); }

private:
    FakeViewHost& m_host;
};

/**
 * @brief 为 UNKNOWN 以外的全部类型注册记录型处理器
 */
inline void registerRecordingHandlers(managers::WidgetTable& table, FakeViewHost& host)
{
    for (size_t i = 0; i < NODE_KIND_COUNT; ++i)
    {
        const auto kind = static_cast<NodeKind>(i);
        if (kind == NodeKind::UNKNOWN) continue;
        table.registerHandler(kind, std::make_unique<RecordingWidgetHandler>(host));
    }
}

} // namespace tx::test
