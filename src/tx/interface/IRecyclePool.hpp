/**
 * ************************************************************************
 *
 * @file IRecyclePool.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-05
 * @version 0.1
 * @brief 视图复用池接口
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <optional>
#include "../common/NodeKind.hpp"
#include "../common/Types.hpp"
#include "../core/Node.hpp"

namespace tx::interface
{

class IRecyclePool
{
public:
    virtual ~IRecyclePool() = default;

    virtual std::optional<ViewHandle> dequeue(NodeKind kind) = 0;

    /**
     * @brief 回收整棵子树上的视图，并清空节点上的视图句柄
     */
    virtual void recycle(Node& subtree) = 0;
};

} // namespace tx::interface
