/**
 * ************************************************************************
 *
 * @file Errors.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-04
 * @version 0.1
 * @brief 渲染核心错误码
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <cstdint>
#include <string_view>

namespace tx
{

enum class RenderError : uint8_t
{
    PARSE_FAILURE,    // 模板解析失败，本次渲染终止
    LAYOUT_FAILURE,   // 树结构异常，按零尺寸继续渲染
    TIMEOUT_ON_FLUSH, // 同步刷新等待超时，仅告警
    CANCELLED,        // 任务已取消
    UNKNOWN_VIEW      // 视图不在渲染缓存中
};

[[nodiscard]] constexpr std::string_view toString(RenderError error) noexcept
{
    switch (error)
    {
        case RenderError::PARSE_FAILURE:
            return "ParseFailure";
        case RenderError::LAYOUT_FAILURE:
            return "LayoutFailure";
        case RenderError::TIMEOUT_ON_FLUSH:
            return "TimeoutOnFlush";
        case RenderError::CANCELLED:
            return "Cancelled";
        case RenderError::UNKNOWN_VIEW:
            return "UnknownView";
    }
    return "Unknown";
}

enum class ConfigError : uint8_t
{
    FILE_NOT_FOUND,
    PARSE_ERROR,
    INVALID_VALUE
};

} // namespace tx
