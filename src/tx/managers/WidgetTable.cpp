/**
 * ************************************************************************
 *
 * @file WidgetTable.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-09
 * @version 0.1
 * @brief 控件处理器表实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "WidgetTable.hpp"

#include "../singleton/Logger.hpp"

namespace tx::managers
{

void WidgetTable::registerHandler(NodeKind kind, std::unique_ptr<interface::IWidgetHandler> handler)
{
    if (kind == NodeKind::UNKNOWN)
    {
        Logger::warn("[WidgetTable] UNKNOWN 类型固定使用占位视图，忽略注册");
        return;
    }
    m_handlers[static_cast<size_t>(kind)] = std::move(handler);
}

interface::IWidgetHandler* WidgetTable::handlerFor(NodeKind kind) const noexcept
{
    return m_handlers[static_cast<size_t>(kind)].get();
}

bool WidgetTable::usesPlaceholder(const Node& node) const noexcept
{
    return node.kind() == NodeKind::UNKNOWN || node.hasParseError() || handlerFor(node.kind()) == nullptr;
}

ViewHandle WidgetTable::createView(const Node& node)
{
    if (usesPlaceholder(node))
    {
        Logger::warn("[WidgetTable] 节点 {} ({}) 无法创建控件，使用占位视图", node.id(), toString(node.kind()));
        const ViewHandle placeholder = m_host.createPlaceholder(node, m_debugPlaceholders);
        if (placeholder)
        {
            m_placeholders.insert(placeholder);
        }
        return placeholder;
    }
    return handlerFor(node.kind())->createView(node);
}

void WidgetTable::updateView(ViewHandle view, const Node& node)
{
    if (!view) return;
    if (auto* handler = handlerFor(node.kind()); handler != nullptr && !usesPlaceholder(node))
    {
        handler->updateView(view, node);
    }
}

} // namespace tx::managers
