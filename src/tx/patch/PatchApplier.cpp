/**
 * ************************************************************************
 *
 * @file PatchApplier.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-11
 * @version 0.1
 * @brief 编辑脚本应用实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "PatchApplier.hpp"

#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "ContentCopiers.hpp"
#include "../singleton/Logger.hpp"

namespace tx::patch
{

namespace
{

/**
 * @brief 同一父节点下的结构修改计划
 */
struct ChildPlan
{
    Node* parent = nullptr;
    std::unordered_set<std::string> removed;
    std::map<size_t, std::unique_ptr<Node>> placements; // 新子树
    std::unordered_map<std::string, size_t> moves;      // id -> 目标位置
};

void discard(std::unique_ptr<Node> node, const DiscardFn& onDiscard, std::vector<std::unique_ptr<Node>>& graveyard)
{
    if (!node) return;
    if (onDiscard) onDiscard(*node);
    graveyard.push_back(std::move(node));
}

/**
 * @brief 处理 parentId 指向自身的根级操作
 * @return 根级操作数量
 */
size_t applyRootOps(const diff::EditScript& script,
                    std::unique_ptr<Node>& root,
                    const DiscardFn& onDiscard,
                    std::vector<std::unique_ptr<Node>>& graveyard)
{
    size_t applied = 0;
    for (const auto& op : script.operations())
    {
        if (const auto* insert = std::get_if<diff::InsertOp>(&op))
        {
            if (!insert->node || insert->node->id() != insert->parentId) continue;
            discard(std::move(root), onDiscard, graveyard);
            root = insert->node->deepClone();
            ++applied;
        }
        else if (const auto* remove = std::get_if<diff::DeleteOp>(&op))
        {
            if (remove->id != remove->parentId) continue;
            if (!root || root->id() != remove->id)
            {
                Logger::warn("[PatchApplier] 根删除目标 {} 与活动树不符", remove->id);
                continue;
            }
            discard(std::move(root), onDiscard, graveyard);
            ++applied;
        }
        else if (const auto* replace = std::get_if<diff::ReplaceOp>(&op))
        {
            if (replace->oldId != replace->parentId || !replace->node) continue;
            if (root && root->id() != replace->oldId)
            {
                Logger::warn("[PatchApplier] 根替换目标 {} 与活动树不符", replace->oldId);
                continue;
            }
            discard(std::move(root), onDiscard, graveyard);
            root = replace->node->deepClone();
            ++applied;
        }
    }
    return applied;
}

bool isRootOp(const diff::EditOperation& op)
{
    if (const auto* insert = std::get_if<diff::InsertOp>(&op))
    {
        return insert->node && insert->node->id() == insert->parentId;
    }
    if (const auto* remove = std::get_if<diff::DeleteOp>(&op))
    {
        return remove->id == remove->parentId;
    }
    if (const auto* replace = std::get_if<diff::ReplaceOp>(&op))
    {
        return replace->oldId == replace->parentId;
    }
    return false;
}

/**
 * @brief 按计划重建父节点的子列表
 *
 * 显式放置的节点（插入、替换、移动）先就位，其余保留节点按原相对顺序填补空位。
 */
void rebuildChildren(ChildPlan& plan, const DiscardFn& onDiscard, std::vector<std::unique_ptr<Node>>& graveyard)
{
    Node& parent = *plan.parent;
    auto olds = parent.detachChildren();

    // 1. 拆出被删除 / 被替换 / 被移动的节点
    std::vector<std::unique_ptr<Node>> kept;
    std::vector<std::pair<size_t, std::unique_ptr<Node>>> explicitNodes;
    kept.reserve(olds.size());
    for (auto& child : olds)
    {
        if (plan.removed.contains(child->id()))
        {
            discard(std::move(child), onDiscard, graveyard);
            continue;
        }
        auto moveIter = plan.moves.find(child->id());
        if (moveIter != plan.moves.end())
        {
            explicitNodes.emplace_back(moveIter->second, std::move(child));
            continue;
        }
        kept.push_back(std::move(child));
    }
    for (auto& [index, node] : plan.placements)
    {
        explicitNodes.emplace_back(index, std::move(node));
    }

    // 2. 显式放置
    const size_t finalSize = kept.size() + explicitNodes.size();
    std::vector<std::unique_ptr<Node>> slots(finalSize);
    std::vector<std::unique_ptr<Node>> leftovers;
    for (auto& [index, node] : explicitNodes)
    {
        if (index < finalSize && !slots[index])
        {
            slots[index] = std::move(node);
        }
        else
        {
            leftovers.push_back(std::move(node));
        }
    }

    // 3. 保留节点按原顺序填补空位，冲突的显式节点殿后
    size_t cursor = 0;
    auto fill = [&](std::unique_ptr<Node> node)
    {
        while (cursor < finalSize && slots[cursor])
        {
            ++cursor;
        }
        if (cursor < finalSize) slots[cursor] = std::move(node);
    };
    for (auto& node : kept)
    {
        fill(std::move(node));
    }
    if (!leftovers.empty())
    {
        Logger::warn("[PatchApplier] {} 的 {} 个子节点位置冲突，追加到末尾", parent.id(), leftovers.size());
        for (auto& node : leftovers)
        {
            fill(std::move(node));
        }
    }

    for (auto& slot : slots)
    {
        if (slot) parent.addChild(std::move(slot));
    }
}

} // namespace

void PatchApplier::applyUpdate(Node& node, const diff::UpdateOp& op)
{
    if (op.styleChanges)
    {
        node.setStyle(*op.styleChanges);
    }
    if (op.bindingChanges)
    {
        auto& bindings = node.mutableBindings();
        for (const auto& [name, value] : op.bindingChanges->changed)
        {
            bindings[name] = value;
        }
        for (const auto& name : op.bindingChanges->removed)
        {
            bindings.erase(name);
        }
    }
    if (op.contentChanges)
    {
        copyContent(node, *op.contentChanges);
    }
    if (op.bindingChanges || op.contentChanges)
    {
        node.markContentDirty();
    }
}

size_t PatchApplier::applyToTree(const diff::EditScript& script,
                                 std::unique_ptr<Node>& root,
                                 const DiscardFn& onDiscard,
                                 std::unordered_set<const Node*>* changedParents)
{
    std::vector<std::unique_ptr<Node>> graveyard;

    // 1. 根级操作
    size_t applied = applyRootOps(script, root, onDiscard, graveyard);
    if (!root)
    {
        return applied;
    }

    // 2. 以旧 id 建立索引
    std::unordered_map<std::string, Node*> index;
    root->visit([&index](Node& node) { index.emplace(node.id(), &node); });

    auto lookup = [&index](const std::string& id) -> Node*
    {
        auto iter = index.find(id);
        return iter != index.end() ? iter->second : nullptr;
    };

    // 3. 属性更新与结构计划
    std::vector<std::pair<Node*, std::string>> renames;
    std::vector<std::string> planOrder;
    std::unordered_map<std::string, ChildPlan> plans;
    auto planFor = [&](const std::string& parentId) -> ChildPlan*
    {
        Node* parent = lookup(parentId);
        if (parent == nullptr)
        {
            Logger::warn("[PatchApplier] 找不到父节点 {}", parentId);
            return nullptr;
        }
        auto [iter, inserted] = plans.try_emplace(parentId);
        if (inserted)
        {
            iter->second.parent = parent;
            planOrder.push_back(parentId);
        }
        return &iter->second;
    };

    for (const auto& op : script.operations())
    {
        if (isRootOp(op)) continue;

        if (const auto* update = std::get_if<diff::UpdateOp>(&op))
        {
            Node* node = lookup(update->id);
            if (node == nullptr)
            {
                Logger::warn("[PatchApplier] update 目标 {} 不存在", update->id);
                continue;
            }
            applyUpdate(*node, *update);
            if (update->newId) renames.emplace_back(node, *update->newId);
            ++applied;
        }
        else if (const auto* insert = std::get_if<diff::InsertOp>(&op))
        {
            ChildPlan* plan = planFor(insert->parentId);
            if (plan == nullptr || !insert->node) continue;
            plan->placements[insert->index] = insert->node->deepClone();
            ++applied;
        }
        else if (const auto* remove = std::get_if<diff::DeleteOp>(&op))
        {
            ChildPlan* plan = planFor(remove->parentId);
            if (plan == nullptr) continue;
            plan->removed.insert(remove->id);
            ++applied;
        }
        else if (const auto* move = std::get_if<diff::MoveOp>(&op))
        {
            ChildPlan* plan = planFor(move->parentId);
            if (plan == nullptr) continue;
            plan->moves[move->id] = move->toIndex;
            ++applied;
        }
        else if (const auto* replace = std::get_if<diff::ReplaceOp>(&op))
        {
            ChildPlan* plan = planFor(replace->parentId);
            if (plan == nullptr || !replace->node) continue;
            plan->removed.insert(replace->oldId);
            plan->placements[replace->index] = replace->node->deepClone();
            ++applied;
        }
    }

    // 4. 逐个父节点重建子列表
    for (const auto& parentId : planOrder)
    {
        rebuildChildren(plans.at(parentId), onDiscard, graveyard);
    }

    // 5. 结构调整完毕后再改名，避免打乱按旧 id 的查找
    for (auto& [node, newId] : renames)
    {
        node->setId(std::move(newId));
    }

    if (changedParents != nullptr)
    {
        std::unordered_set<const Node*> alive;
        static_cast<const Node&>(*root).visit([&alive](const Node& node) { alive.insert(&node); });
        for (const auto& parentId : planOrder)
        {
            const Node* parent = plans.at(parentId).parent;
            if (alive.contains(parent)) changedParents->insert(parent);
        }
    }
    return applied;
}

size_t PatchApplier::apply(const diff::EditScript& script, std::unique_ptr<Node>& liveRoot, Size containerSize)
{
    TX_ASSERT_UI_THREAD(m_affinity);
    if (!script.hasDiff())
    {
        return 0;
    }

    std::unordered_set<const Node*> changedParents;
    const size_t applied = applyToTree(
        script, liveRoot, [this](Node& subtree) { m_views.releaseViewTree(subtree); }, &changedParents);

    if (applied != script.operationCount())
    {
        Logger::warn("[PatchApplier] 脚本共 {} 项，实际应用 {} 项", script.operationCount(), applied);
    }
    if (!liveRoot)
    {
        return applied;
    }

    relayout(*liveRoot, containerSize);
    m_views.syncViews(*liveRoot, changedParents);
    m_views.updateViewTree(*liveRoot);

    Logger::debug("[PatchApplier] 应用 {} 项修改 ({})", applied, script.summary());
    return applied;
}

void PatchApplier::quickUpdate(Node& liveRoot, const Node& boundTree, Size containerSize)
{
    TX_ASSERT_UI_THREAD(m_affinity);

    // 1. 并行遍历复制绑定值
    size_t mismatches = 0;
    std::function<void(Node&, const Node&)> copyRecursive = [&](Node& live, const Node& bound)
    {
        if (live.kind() != bound.kind() || live.childCount() != bound.childCount())
        {
            ++mismatches;
            return;
        }
        if (live.bindings() != bound.bindings())
        {
            live.mutableBindings() = bound.bindings();
            live.markContentDirty();
        }
        if (live.content() != bound.content())
        {
            copyContent(live, bound.content());
            live.markContentDirty();
        }
        if (live.style() != bound.style())
        {
            live.setStyle(bound.style());
        }
        for (size_t i = 0; i < live.childCount(); ++i)
        {
            copyRecursive(*live.childAt(i), *bound.childAt(i));
        }
    };
    copyRecursive(liveRoot, boundTree);

    if (mismatches > 0)
    {
        Logger::warn("[PatchApplier] 快速更新遇到 {} 处结构不一致，相应分支未更新", mismatches);
    }

    // 2. 重新布局并刷新视图
    refresh(liveRoot, containerSize);
}

void PatchApplier::refresh(Node& liveRoot, Size containerSize)
{
    TX_ASSERT_UI_THREAD(m_affinity);
    relayout(liveRoot, containerSize);
    m_views.syncViews(liveRoot, {});
    m_views.updateViewTree(liveRoot);
}

void PatchApplier::relayout(Node& root, Size containerSize)
{
    auto frames = m_layout.tryComputeLayout(root, containerSize);
    if (!frames)
    {
        Logger::warn("[PatchApplier] 重新布局失败: {}，按零尺寸处理", toString(frames.error()));
        layout::LayoutAdapter::applyFrames(root, {});
        return;
    }
    layout::LayoutAdapter::applyFrames(root, *frames);
}

} // namespace tx::patch
