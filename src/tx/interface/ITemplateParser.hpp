/**
 * ************************************************************************
 *
 * @file ITemplateParser.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-05
 * @version 0.1
 * @brief 模板解析器接口（外部协作者）
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include "../core/Node.hpp"

namespace tx::interface
{

class ITemplateParser
{
public:
    virtual ~ITemplateParser() = default;

    /**
     * @brief 原始模板 -> 组件树；失败即本次渲染终止，核心不重试
     * @return 错误时返回描述信息
     */
    virtual std::expected<std::unique_ptr<Node>, std::string> parse(std::string_view rawTemplate) = 0;
};

} // namespace tx::interface
