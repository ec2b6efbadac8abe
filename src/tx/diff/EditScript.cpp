/**
 * ************************************************************************
 *
 * @file EditScript.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-08
 * @version 0.1
 * @brief 编辑脚本实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "EditScript.hpp"

#include <fmt/format.h>
#include <iterator>

namespace tx::diff
{

void EditScript::push(EditOperation op)
{
    switch (typeOf(op))
    {
        case OperationType::INSERT:
            ++m_insertCount;
            break;
        case OperationType::DELETE:
            ++m_deleteCount;
            break;
        case OperationType::UPDATE:
            ++m_updateCount;
            break;
        case OperationType::MOVE:
            ++m_moveCount;
            break;
        case OperationType::REPLACE:
            ++m_replaceCount;
            break;
    }
    m_operations.push_back(std::move(op));
}

void EditScript::merge(EditScript&& other)
{
    m_operations.insert(m_operations.end(),
                        std::make_move_iterator(other.m_operations.begin()),
                        std::make_move_iterator(other.m_operations.end()));
    m_insertCount += other.m_insertCount;
    m_deleteCount += other.m_deleteCount;
    m_updateCount += other.m_updateCount;
    m_moveCount += other.m_moveCount;
    m_replaceCount += other.m_replaceCount;

    other.m_operations.clear();
    other.m_insertCount = other.m_deleteCount = other.m_updateCount = other.m_moveCount = other.m_replaceCount = 0;
}

std::string EditScript::summary() const
{
    return fmt::format("ops={} (insert={}, delete={}, update={}, move={}, replace={})",
                       m_operations.size(),
                       m_insertCount,
                       m_deleteCount,
                       m_updateCount,
                       m_moveCount,
                       m_replaceCount);
}

} // namespace tx::diff
