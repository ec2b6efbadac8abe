/**
 * ************************************************************************
 *
 * @file WidgetTable.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-09
 * @version 0.1
 * @brief 按 NodeKind 索引的控件处理器表
 *
 * 类型在解析期已确定为封闭枚举，这里用定长数组分派，不做运行时字符串查找。
 * 未注册处理器、未识别类型或属性解析失败的节点统一渲染为占位视图。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <array>
#include <memory>
#include <unordered_set>
#include "../common/NodeKind.hpp"
#include "../common/Types.hpp"
#include "../core/Node.hpp"
#include "../interface/IViewHost.hpp"
#include "../interface/IWidgetHandler.hpp"

namespace tx::managers
{

class WidgetTable
{
public:
    explicit WidgetTable(interface::IViewHost& host, bool debugPlaceholders = true)
        : m_host(host), m_debugPlaceholders(debugPlaceholders)
    {
    }

    void registerHandler(NodeKind kind, std::unique_ptr<interface::IWidgetHandler> handler);

    [[nodiscard]] interface::IWidgetHandler* handlerFor(NodeKind kind) const noexcept;

    /**
     * @brief 节点是否需要以占位视图代替
     */
    [[nodiscard]] bool usesPlaceholder(const Node& node) const noexcept;

    /**
     * @brief 创建视图（不挂载、不写属性）
     */
    [[nodiscard]] ViewHandle createView(const Node& node);

    /**
     * @brief 把节点状态写入视图
     */
    void updateView(ViewHandle view, const Node& node);

    /**
     * @brief 视图是否由本表以占位方式创建（与此后是否注册了处理器无关）
     */
    [[nodiscard]] bool isPlaceholder(ViewHandle view) const { return m_placeholders.contains(view); }

    /**
     * @brief 视图销毁后清除占位记录
     */
    void forgetView(ViewHandle view) { m_placeholders.erase(view); }

    [[nodiscard]] interface::IViewHost& host() const noexcept { return m_host; }
    [[nodiscard]] bool debugPlaceholders() const noexcept { return m_debugPlaceholders; }
    void setDebugPlaceholders(bool enabled) noexcept { m_debugPlaceholders = enabled; }

private:
    interface::IViewHost& m_host;
    std::array<std::unique_ptr<interface::IWidgetHandler>, NODE_KIND_COUNT> m_handlers{};
    bool m_debugPlaceholders;
    std::unordered_set<ViewHandle> m_placeholders;
};

} // namespace tx::managers
