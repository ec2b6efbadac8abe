/**
 * ************************************************************************
 *
 * @file EditScript.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-08
 * @version 0.1
 * @brief 差异编辑脚本：insert / delete / update / move / replace
 *
 * 插入与替换携带新子树的深拷贝，脚本的生命周期与新旧树无关。
 * 已存在节点一律以旧树中的 id 引用。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "../common/Style.hpp"
#include "../core/Node.hpp"

namespace tx::diff
{

/**
 * @brief 绑定差异：只含发生变化或新增的键，以及被移除的键
 */
struct BindingChanges
{
    Bindings changed;
    std::vector<std::string> removed;

    [[nodiscard]] bool empty() const noexcept { return changed.empty() && removed.empty(); }
    bool operator==(const BindingChanges&) const = default;
};

struct InsertOp
{
    std::shared_ptr<const Node> node; // 新子树
    size_t index = 0;                 // 在新子列表中的位置
    std::string parentId;
};

struct DeleteOp
{
    std::string id;
    std::string parentId;
};

struct UpdateOp
{
    std::string id;                              // 旧树中的 id
    std::optional<std::string> newId;            // 通过 key 匹配且 id 变化时的新 id
    std::optional<Style> styleChanges;           // 整体替换
    std::optional<BindingChanges> bindingChanges;
    std::optional<NodeContent> contentChanges;   // 类型专属字段

    [[nodiscard]] bool empty() const noexcept
    {
        return !newId && !styleChanges && !bindingChanges && !contentChanges;
    }
};

struct MoveOp
{
    std::string id;
    size_t fromIndex = 0;
    size_t toIndex = 0;
    std::string parentId;
};

struct ReplaceOp
{
    std::string oldId;
    std::shared_ptr<const Node> node; // 新子树
    size_t index = 0;                 // 在新子列表中的位置
    std::string parentId;
};

using EditOperation = std::variant<InsertOp, DeleteOp, UpdateOp, MoveOp, ReplaceOp>;

enum class OperationType : uint8_t
{
    INSERT,
    DELETE,
    UPDATE,
    MOVE,
    REPLACE
};

[[nodiscard]] inline OperationType typeOf(const EditOperation& op) noexcept
{
    return static_cast<OperationType>(op.index());
}

class EditScript
{
public:
    void push(EditOperation op);

    /**
     * @brief 追加另一份脚本（用于多棵子树分别比较后合并）
     */
    void merge(EditScript&& other);

    [[nodiscard]] const std::vector<EditOperation>& operations() const noexcept { return m_operations; }

    [[nodiscard]] bool hasDiff() const noexcept { return !m_operations.empty(); }
    [[nodiscard]] size_t operationCount() const noexcept { return m_operations.size(); }

    [[nodiscard]] size_t insertCount() const noexcept { return m_insertCount; }
    [[nodiscard]] size_t deleteCount() const noexcept { return m_deleteCount; }
    [[nodiscard]] size_t updateCount() const noexcept { return m_updateCount; }
    [[nodiscard]] size_t moveCount() const noexcept { return m_moveCount; }
    [[nodiscard]] size_t replaceCount() const noexcept { return m_replaceCount; }

    /**
     * @brief 日志用的统计摘要
     */
    [[nodiscard]] std::string summary() const;

private:
    std::vector<EditOperation> m_operations;
    size_t m_insertCount = 0;
    size_t m_deleteCount = 0;
    size_t m_updateCount = 0;
    size_t m_moveCount = 0;
    size_t m_replaceCount = 0;
};

} // namespace tx::diff
