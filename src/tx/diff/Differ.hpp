/**
 * ************************************************************************
 *
 * @file Differ.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-08
 * @version 0.1
 * @brief 组件树差异计算
 *
 * 匹配规则：双方都带 key 时按 key，否则按 id。子列表先做首尾双端比较，
 * 中段用 key/id 映射匹配；匹配节点中位于旧下标最长递增子序列上的保持不动，
 * 其余发出 move。重复 key 时先到先得，后来者视为插入。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "EditScript.hpp"
#include "../core/Node.hpp"

namespace tx::diff
{

struct DiffConfig
{
    bool enableKeyOptimization = true; // 关闭时按位置逐一比较
    size_t maxDepth = 50;              // 超出深度的子树整体替换
};

class Differ
{
public:
    explicit Differ(DiffConfig config = {}) : m_config(config) {}

    /**
     * @brief 计算 oldTree -> newTree 的编辑脚本，任一侧可为空
     *
     * 整树插入/删除以根 id 作为 parentId。
     */
    [[nodiscard]] EditScript diff(const Node* oldTree, const Node* newTree) const;

    [[nodiscard]] const DiffConfig& config() const noexcept { return m_config; }

    /**
     * @brief 两个节点是否视为同一身份（不比较类型）
     */
    [[nodiscard]] static bool sameIdentity(const Node& oldNode, const Node& newNode);

    /**
     * @brief 属性差异；无差异时返回 nullopt
     */
    [[nodiscard]] static std::optional<UpdateOp> propertyChanges(const Node& oldNode, const Node& newNode);

    /**
     * @brief 返回序列中最长递增子序列所在的下标
     */
    [[nodiscard]] static std::vector<bool> longestIncreasingMask(const std::vector<size_t>& sequence);

private:
    void diffNode(const Node& oldNode,
                  const Node& newNode,
                  const std::string& parentId,
                  size_t newIndex,
                  size_t depth,
                  EditScript& script) const;

    void diffChildren(const Node& oldParent, const Node& newParent, size_t depth, EditScript& script) const;

    void diffChildrenLinear(const Node& oldParent, const Node& newParent, size_t depth, EditScript& script) const;

    [[nodiscard]] static bool canMatch(const Node& oldNode, const Node& newNode);

    DiffConfig m_config;
};

} // namespace tx::diff
