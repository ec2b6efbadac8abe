/**
 * ************************************************************************
 *
 * @file Differ.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-08
 * @version 0.1
 * @brief 组件树差异计算实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "Differ.hpp"

#include <algorithm>
#include <unordered_map>
#include "../singleton/Logger.hpp"

namespace tx::diff
{

EditScript Differ::diff(const Node* oldTree, const Node* newTree) const
{
    EditScript script;

    // 1. 空树的三种情况
    if (oldTree == nullptr && newTree == nullptr)
    {
        return script;
    }
    if (oldTree == nullptr)
    {
        script.push(InsertOp{newTree->deepClone(), 0, newTree->id()});
        return script;
    }
    if (newTree == nullptr)
    {
        script.push(DeleteOp{oldTree->id(), oldTree->id()});
        return script;
    }

    // 2. 根节点类型不同：整体替换
    if (oldTree->kind() != newTree->kind())
    {
        script.push(ReplaceOp{oldTree->id(), newTree->deepClone(), 0, oldTree->id()});
        return script;
    }

    // 3. 递归比较
    diffNode(*oldTree, *newTree, oldTree->id(), 0, 0, script);

    if (script.hasDiff())
    {
        Logger::debug("[Differ] {} -> {}", oldTree->id(), script.summary());
    }
    return script;
}

bool Differ::sameIdentity(const Node& oldNode, const Node& newNode)
{
    auto oldKey = oldNode.key();
    auto newKey = newNode.key();
    if (oldKey && newKey)
    {
        return *oldKey == *newKey;
    }
    return oldNode.id() == newNode.id();
}

bool Differ::canMatch(const Node& oldNode, const Node& newNode)
{
    return oldNode.kind() == newNode.kind() && sameIdentity(oldNode, newNode);
}

std::optional<UpdateOp> Differ::propertyChanges(const Node& oldNode, const Node& newNode)
{
    UpdateOp update;
    update.id = oldNode.id();

    if (oldNode.id() != newNode.id())
    {
        update.newId = newNode.id();
    }

    // 样式按整体值比较
    if (oldNode.style() != newNode.style())
    {
        update.styleChanges = newNode.style();
    }

    // 绑定逐键比较，只记录变化的键
    BindingChanges bindings;
    const auto& oldBindings = oldNode.bindings();
    for (const auto& [name, value] : newNode.bindings())
    {
        auto iter = oldBindings.find(name);
        if (iter == oldBindings.end() || iter->second != value)
        {
            bindings.changed.emplace(name, value);
        }
    }
    for (const auto& [name, value] : oldBindings)
    {
        if (!newNode.bindings().contains(name))
        {
            bindings.removed.push_back(name);
        }
    }
    if (!bindings.empty())
    {
        update.bindingChanges = std::move(bindings);
    }

    if (oldNode.content() != newNode.content())
    {
        update.contentChanges = newNode.content();
    }

    if (update.empty())
    {
        return std::nullopt;
    }
    return update;
}

void Differ::diffNode(const Node& oldNode,
                      const Node& newNode,
                      const std::string& parentId,
                      size_t newIndex,
                      size_t depth,
                      EditScript& script) const
{
    if (depth > m_config.maxDepth) [[unlikely]]
    {
        Logger::warn("[Differ] 树深度超过 {}，子树 {} 整体替换", m_config.maxDepth, oldNode.id());
        script.push(ReplaceOp{oldNode.id(), newNode.deepClone(), newIndex, parentId});
        return;
    }

    if (auto update = propertyChanges(oldNode, newNode))
    {
        script.push(std::move(*update));
    }

    if (m_config.enableKeyOptimization)
    {
        diffChildren(oldNode, newNode, depth + 1, script);
    }
    else
    {
        diffChildrenLinear(oldNode, newNode, depth + 1, script);
    }
}

void Differ::diffChildren(const Node& oldParent, const Node& newParent, size_t depth, EditScript& script) const
{
    const std::string& parentId = oldParent.id();
    const auto& olds = oldParent.children();
    const auto& news = newParent.children();

    // 1. 一侧为空
    if (olds.empty())
    {
        for (size_t j = 0; j < news.size(); ++j)
        {
            script.push(InsertOp{news[j]->deepClone(), j, parentId});
        }
        return;
    }
    if (news.empty())
    {
        for (const auto& child : olds)
        {
            script.push(DeleteOp{child->id(), parentId});
        }
        return;
    }

    constexpr size_t NO_MATCH = static_cast<size_t>(-1);
    std::vector<size_t> newToOld(news.size(), NO_MATCH);
    std::vector<bool> oldMatched(olds.size(), false);

    // 2. 首尾双端比较
    size_t oldStart = 0;
    size_t newStart = 0;
    size_t oldEnd = olds.size();
    size_t newEnd = news.size();

    while (oldStart < oldEnd && newStart < newEnd && canMatch(*olds[oldStart], *news[newStart]))
    {
        newToOld[newStart] = oldStart;
        oldMatched[oldStart] = true;
        ++oldStart;
        ++newStart;
    }
    while (oldStart < oldEnd && newStart < newEnd && canMatch(*olds[oldEnd - 1], *news[newEnd - 1]))
    {
        newToOld[newEnd - 1] = oldEnd - 1;
        oldMatched[oldEnd - 1] = true;
        --oldEnd;
        --newEnd;
    }

    // 3. 中段：key / id 映射，先到先得
    std::unordered_map<std::string, size_t> oldKeyMap;
    std::unordered_map<std::string, size_t> oldIdMap;
    for (size_t i = oldStart; i < oldEnd; ++i)
    {
        if (auto key = olds[i]->key())
        {
            oldKeyMap.emplace(std::move(*key), i);
        }
        oldIdMap.emplace(olds[i]->id(), i);
    }

    std::vector<size_t> middleNew;      // 与旧节点同类型匹配的中段新下标
    std::vector<size_t> middleOldIndex; // 对应的旧下标
    for (size_t j = newStart; j < newEnd; ++j)
    {
        const Node& newChild = *news[j];
        const auto newKey = newChild.key();

        size_t candidate = NO_MATCH;
        bool keyHit = false;
        if (newKey)
        {
            if (auto iter = oldKeyMap.find(*newKey); iter != oldKeyMap.end())
            {
                keyHit = true;
                if (!oldMatched[iter->second]) candidate = iter->second;
            }
        }
        if (!keyHit)
        {
            if (auto iter = oldIdMap.find(newChild.id()); iter != oldIdMap.end() && !oldMatched[iter->second])
            {
                if (sameIdentity(*olds[iter->second], newChild)) candidate = iter->second;
            }
        }

        if (candidate == NO_MATCH) continue;

        newToOld[j] = candidate;
        oldMatched[candidate] = true;
        if (olds[candidate]->kind() == newChild.kind())
        {
            middleNew.push_back(j);
            middleOldIndex.push_back(candidate);
        }
    }

    // 4. 最长递增子序列上的节点保持相对位置
    std::vector<bool> stable = longestIncreasingMask(middleOldIndex);
    std::vector<bool> needsMove(news.size(), false);
    for (size_t k = 0; k < middleNew.size(); ++k)
    {
        if (!stable[k]) needsMove[middleNew[k]] = true;
    }

    // 5. 删除：旧下标升序
    for (size_t i = 0; i < olds.size(); ++i)
    {
        if (!oldMatched[i])
        {
            script.push(DeleteOp{olds[i]->id(), parentId});
        }
    }

    // 6. 按新下标升序输出 insert / replace / move，并递归
    for (size_t j = 0; j < news.size(); ++j)
    {
        const Node& newChild = *news[j];
        const size_t oldIndex = newToOld[j];

        if (oldIndex == NO_MATCH)
        {
            script.push(InsertOp{newChild.deepClone(), j, parentId});
            continue;
        }

        const Node& oldChild = *olds[oldIndex];
        if (oldChild.kind() != newChild.kind())
        {
            // 类型不同不再深入
            script.push(ReplaceOp{oldChild.id(), newChild.deepClone(), j, parentId});
            continue;
        }

        if (needsMove[j])
        {
            script.push(MoveOp{oldChild.id(), oldIndex, j, parentId});
        }
        diffNode(oldChild, newChild, parentId, j, depth, script);
    }
}

void Differ::diffChildrenLinear(const Node& oldParent, const Node& newParent, size_t depth, EditScript& script) const
{
    const std::string& parentId = oldParent.id();
    const auto& olds = oldParent.children();
    const auto& news = newParent.children();
    const size_t common = std::min(olds.size(), news.size());

    for (size_t i = common; i < olds.size(); ++i)
    {
        script.push(DeleteOp{olds[i]->id(), parentId});
    }

    for (size_t j = 0; j < news.size(); ++j)
    {
        if (j >= common)
        {
            script.push(InsertOp{news[j]->deepClone(), j, parentId});
        }
        else if (canMatch(*olds[j], *news[j]))
        {
            diffNode(*olds[j], *news[j], parentId, j, depth, script);
        }
        else
        {
            script.push(ReplaceOp{olds[j]->id(), news[j]->deepClone(), j, parentId});
        }
    }
}

std::vector<bool> Differ::longestIncreasingMask(const std::vector<size_t>& sequence)
{
    std::vector<bool> mask(sequence.size(), false);
    if (sequence.empty())
    {
        return mask;
    }

    // tails[k]：长度为 k+1 的递增子序列的末尾元素在 sequence 中的位置
    std::vector<size_t> tails;
    std::vector<size_t> previous(sequence.size(), static_cast<size_t>(-1));
    tails.reserve(sequence.size());

    for (size_t i = 0; i < sequence.size(); ++i)
    {
        auto iter = std::lower_bound(
            tails.begin(), tails.end(), sequence[i], [&](size_t pos, size_t value) { return sequence[pos] < value; });
        if (iter != tails.begin())
        {
            previous[i] = *(iter - 1);
        }
        if (iter == tails.end())
        {
            tails.push_back(i);
        }
        else
        {
            *iter = i;
        }
    }

    for (size_t pos = tails.back(); pos != static_cast<size_t>(-1); pos = previous[pos])
    {
        mask[pos] = true;
    }
    return mask;
}

} // namespace tx::diff
