/**
 * ************************************************************************
 *
 * @file IDataBinder.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-05
 * @version 0.1
 * @brief 数据绑定器接口（外部协作者）
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <nlohmann/json.hpp>
#include "../core/Node.hpp"

namespace tx::interface
{

/**
 * @brief 按节点声明的表达式解析数据，原地写入 bindings（以及对应的类型内容）
 *
 * 会在后台线程被调用，实现必须可重入。
 */
class IDataBinder
{
public:
    virtual ~IDataBinder() = default;

    virtual void bind(const nlohmann::json& data, Node& root) = 0;
};

} // namespace tx::interface
