/**
 * ************************************************************************
 *
 * @file Node.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-04
 * @version 0.1
 * @brief 组件树节点实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "Node.hpp"

#include <algorithm>
#include <utility>
#include "../singleton/Logger.hpp"

namespace tx
{

Node::Node(std::string id, NodeKind kind) : m_id(std::move(id)), m_kind(kind), m_content(defaultContent(kind)) {}

Node::~Node()
{
    // 布局句柄必须由布局池显式归还，这里只做泄漏告警
    if (m_layoutSlot != entt::null) [[unlikely]]
    {
        Logger::error("[Node] 节点 {} 销毁时仍持有布局句柄", m_id);
    }
}

std::optional<std::string> Node::key() const
{
    auto iter = m_bindings.find(std::string(KEY_BINDING));
    if (iter == m_bindings.end() || iter->second.is_null())
    {
        return std::nullopt;
    }
    if (iter->second.is_string())
    {
        return iter->second.get<std::string>();
    }
    return iter->second.dump();
}

Node& Node::addChild(std::unique_ptr<Node> child)
{
    return insertChild(std::move(child), m_children.size());
}

Node& Node::insertChild(std::unique_ptr<Node> child, size_t index)
{
    child->m_parent = this;
    index = std::min(index, m_children.size());
    auto iter = m_children.insert(m_children.begin() + static_cast<std::ptrdiff_t>(index), std::move(child));
    return **iter;
}

std::unique_ptr<Node> Node::removeChildAt(size_t index)
{
    if (index >= m_children.size())
    {
        return nullptr;
    }
    auto child = std::move(m_children[index]);
    m_children.erase(m_children.begin() + static_cast<std::ptrdiff_t>(index));
    child->m_parent = nullptr;
    return child;
}

std::unique_ptr<Node> Node::removeChild(const Node* child)
{
    auto iter = std::ranges::find_if(m_children, [child](const auto& ptr) { return ptr.get() == child; });
    if (iter == m_children.end())
    {
        return nullptr;
    }
    return removeChildAt(static_cast<size_t>(iter - m_children.begin()));
}

std::vector<std::unique_ptr<Node>> Node::detachChildren()
{
    std::vector<std::unique_ptr<Node>> detached = std::move(m_children);
    m_children.clear();
    for (auto& child : detached)
    {
        child->m_parent = nullptr;
    }
    return detached;
}

std::optional<size_t> Node::indexInParent() const
{
    if (m_parent == nullptr)
    {
        return std::nullopt;
    }
    const auto& siblings = m_parent->m_children;
    for (size_t i = 0; i < siblings.size(); ++i)
    {
        if (siblings[i].get() == this) return i;
    }
    return std::nullopt;
}

size_t Node::depth() const noexcept
{
    size_t result = 0;
    for (const Node* node = m_parent; node != nullptr; node = node->m_parent)
    {
        ++result;
    }
    return result;
}

const Node& Node::root() const noexcept
{
    const Node* node = this;
    while (node->m_parent != nullptr)
    {
        node = node->m_parent;
    }
    return *node;
}

size_t Node::subtreeSize() const noexcept
{
    size_t count = 1;
    for (const auto& child : m_children)
    {
        count += child->subtreeSize();
    }
    return count;
}

Node* Node::findById(std::string_view id)
{
    return const_cast<Node*>(std::as_const(*this).findById(id));
}

const Node* Node::findById(std::string_view id) const
{
    if (m_id == id) return this;
    for (const auto& child : m_children)
    {
        if (const Node* found = child->findById(id)) return found;
    }
    return nullptr;
}

std::unique_ptr<Node> Node::clone() const
{
    auto copy = std::make_unique<Node>(m_id, m_kind);
    copy->m_style = m_style;
    copy->m_content = m_content;
    copy->m_bindings = m_bindings;
    copy->m_events = m_events;
    copy->m_expressions = m_expressions;
    copy->m_parseError = m_parseError;
    return copy;
}

std::unique_ptr<Node> Node::deepClone() const
{
    auto copy = clone();
    copy->m_children.reserve(m_children.size());
    for (const auto& child : m_children)
    {
        copy->addChild(child->deepClone());
    }
    return copy;
}

bool Node::flattenable() const noexcept
{
    return m_kind == NodeKind::VIEW && m_parent != nullptr && !m_parseError && m_events.empty() &&
           !m_style.hasVisualEffect();
}

bool Node::needsViewUpdate() const noexcept
{
    return m_forceApply || m_contentDirty || !m_lastAppliedStyle.has_value() || !m_lastAppliedFrame.has_value() ||
           *m_lastAppliedStyle != m_style || *m_lastAppliedFrame != m_layoutResult;
}

void Node::markApplied()
{
    m_lastAppliedStyle = m_style;
    m_lastAppliedFrame = m_layoutResult;
    m_forceApply = false;
    m_contentDirty = false;
}

bool treeEquals(const Node& lhs, const Node& rhs)
{
    if (lhs.id() != rhs.id() || lhs.kind() != rhs.kind() || lhs.style() != rhs.style() ||
        lhs.content() != rhs.content() || lhs.bindings() != rhs.bindings() || lhs.events() != rhs.events() ||
        lhs.childCount() != rhs.childCount())
    {
        return false;
    }
    for (size_t i = 0; i < lhs.childCount(); ++i)
    {
        if (!treeEquals(*lhs.childAt(i), *rhs.childAt(i))) return false;
    }
    return true;
}

} // namespace tx
