/**
 * ************************************************************************
 *
 * @file Node.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-04
 * @version 0.1
 * @brief 组件树节点
 *
 * 父节点独占子节点（unique_ptr），子节点持有父节点的非拥有指针，
 * 只用于事件冒泡与查找，绝不参与生命周期管理。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <entt/entt.hpp>
#include <nlohmann/json.hpp>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "../common/NodeKind.hpp"
#include "../common/Style.hpp"
#include "../common/Types.hpp"

namespace tx
{

using Bindings = std::map<std::string, nlohmann::json>;    // 绑定后的数据值
using EventMap = std::map<std::string, nlohmann::json>;    // 事件声明（解析期确定）
using Expressions = std::map<std::string, std::string>;    // 绑定表达式原文，交给 DataBinder 解释

/**
 * @brief 作为列表 key 的绑定字段名
 */
inline constexpr std::string_view KEY_BINDING = "key";

class Node
{
public:
    Node(std::string id, NodeKind kind);
    ~Node();

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;
    Node(Node&&) = delete;
    Node& operator=(Node&&) = delete;

    // ===================== 标识 =====================

    [[nodiscard]] const std::string& id() const noexcept { return m_id; }
    void setId(std::string id) { m_id = std::move(id); }

    [[nodiscard]] NodeKind kind() const noexcept { return m_kind; }

    /**
     * @brief 列表项 key，来自 bindings["key"]
     */
    [[nodiscard]] std::optional<std::string> key() const;

    // ===================== 样式与内容 =====================

    [[nodiscard]] const Style& style() const noexcept { return m_style; }
    [[nodiscard]] Style& mutableStyle() noexcept { return m_style; }
    void setStyle(Style style) { m_style = std::move(style); }

    [[nodiscard]] const NodeContent& content() const noexcept { return m_content; }
    [[nodiscard]] NodeContent& mutableContent() noexcept { return m_content; }
    void setContent(NodeContent content) { m_content = std::move(content); }

    template <typename T>
    [[nodiscard]] T* contentAs() noexcept
    {
        return std::get_if<T>(&m_content);
    }

    template <typename T>
    [[nodiscard]] const T* contentAs() const noexcept
    {
        return std::get_if<T>(&m_content);
    }

    // ===================== 绑定 / 事件 / 表达式 =====================

    [[nodiscard]] const Bindings& bindings() const noexcept { return m_bindings; }
    [[nodiscard]] Bindings& mutableBindings() noexcept { return m_bindings; }
    void setBinding(const std::string& name, nlohmann::json value) { m_bindings[name] = std::move(value); }

    [[nodiscard]] const EventMap& events() const noexcept { return m_events; }
    void declareEvent(const std::string& name, nlohmann::json config) { m_events[name] = std::move(config); }

    [[nodiscard]] const Expressions& expressions() const noexcept { return m_expressions; }
    void setExpression(const std::string& name, std::string expression)
    {
        m_expressions[name] = std::move(expression);
    }

    // ===================== 树结构 =====================

    [[nodiscard]] Node* parent() const noexcept { return m_parent; }
    [[nodiscard]] bool isRoot() const noexcept { return m_parent == nullptr; }

    [[nodiscard]] const std::vector<std::unique_ptr<Node>>& children() const noexcept { return m_children; }
    [[nodiscard]] size_t childCount() const noexcept { return m_children.size(); }
    [[nodiscard]] Node* childAt(size_t index) const noexcept
    {
        return index < m_children.size() ? m_children[index].get() : nullptr;
    }

    Node& addChild(std::unique_ptr<Node> child);
    Node& insertChild(std::unique_ptr<Node> child, size_t index);
    std::unique_ptr<Node> removeChildAt(size_t index);
    std::unique_ptr<Node> removeChild(const Node* child);

    /**
     * @brief 摘下全部子节点并清除其父指针
     */
    std::vector<std::unique_ptr<Node>> detachChildren();

    [[nodiscard]] std::optional<size_t> indexInParent() const;
    [[nodiscard]] size_t depth() const noexcept;
    [[nodiscard]] const Node& root() const noexcept;
    [[nodiscard]] size_t subtreeSize() const noexcept;

    [[nodiscard]] Node* findById(std::string_view id);
    [[nodiscard]] const Node* findById(std::string_view id) const;

    /**
     * @brief 前序遍历整棵子树
     */
    template <typename Fn>
    void visit(Fn&& fn)
    {
        fn(*this);
        for (auto& child : m_children)
        {
            child->visit(fn);
        }
    }

    template <typename Fn>
    void visit(Fn&& fn) const
    {
        fn(*this);
        for (const auto& child : m_children)
        {
            static_cast<const Node&>(*child).visit(fn);
        }
    }

    // ===================== 克隆 =====================

    /**
     * @brief 值拷贝样式/绑定/事件/内容，不带子节点、视图与布局句柄
     */
    [[nodiscard]] std::unique_ptr<Node> clone() const;

    /**
     * @brief 递归克隆整棵子树并重建父指针
     */
    [[nodiscard]] std::unique_ptr<Node> deepClone() const;

    // ===================== 渲染期瞬态字段 =====================

    [[nodiscard]] ViewHandle view() const noexcept { return m_view; }
    void setView(ViewHandle view) noexcept { m_view = view; }
    void clearView() noexcept
    {
        m_view = ViewHandle{};
        m_lastAppliedStyle.reset();
        m_lastAppliedFrame.reset();
    }

    [[nodiscard]] const Frame& layoutResult() const noexcept { return m_layoutResult; }
    void setLayoutResult(const Frame& frame) noexcept { m_layoutResult = frame; }

    [[nodiscard]] entt::entity layoutSlot() const noexcept { return m_layoutSlot; }
    [[nodiscard]] bool hasLayoutSlot() const noexcept { return m_layoutSlot != entt::null; }
    void setLayoutSlot(entt::entity slot) noexcept { m_layoutSlot = slot; }
    void clearLayoutSlot() noexcept { m_layoutSlot = entt::null; }

    [[nodiscard]] bool flattened() const noexcept { return m_flattened; }
    void setFlattened(bool flattened) noexcept { m_flattened = flattened; }

    /**
     * @brief 纯布局容器：无绘制效果、无事件、非根节点
     */
    [[nodiscard]] bool flattenable() const noexcept;

    [[nodiscard]] bool hasParseError() const noexcept { return m_parseError; }
    void setParseError(bool failed) noexcept { m_parseError = failed; }

    // ===================== 视图更新记忆 =====================

    [[nodiscard]] bool forceApply() const noexcept { return m_forceApply; }
    void setForceApply(bool force) noexcept { m_forceApply = force; }

    /**
     * @brief 标记内容/绑定已变化，下次视图刷新不能跳过
     */
    void markContentDirty() noexcept { m_contentDirty = true; }

    [[nodiscard]] bool needsViewUpdate() const noexcept;

    /**
     * @brief 记录已应用到视图的样式与 frame，并清除强制刷新标记
     */
    void markApplied();

    [[nodiscard]] const std::optional<Style>& lastAppliedStyle() const noexcept { return m_lastAppliedStyle; }
    [[nodiscard]] const std::optional<Frame>& lastAppliedFrame() const noexcept { return m_lastAppliedFrame; }

private:
    std::string m_id;
    NodeKind m_kind;
    Style m_style;
    NodeContent m_content;
    Bindings m_bindings;
    EventMap m_events;
    Expressions m_expressions;

    Node* m_parent = nullptr;
    std::vector<std::unique_ptr<Node>> m_children;

    ViewHandle m_view;
    Frame m_layoutResult;
    entt::entity m_layoutSlot = entt::null;
    std::optional<Style> m_lastAppliedStyle;
    std::optional<Frame> m_lastAppliedFrame;
    bool m_forceApply = false;
    bool m_contentDirty = false;
    bool m_flattened = false;
    bool m_parseError = false;
};

/**
 * @brief 结构与值是否完全相同（id、类型、样式、内容、绑定、事件、子树）
 */
[[nodiscard]] bool treeEquals(const Node& lhs, const Node& rhs);

} // namespace tx
