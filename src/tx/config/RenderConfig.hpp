/**
 * ************************************************************************
 *
 * @file RenderConfig.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-13
 * @version 0.1
 * @brief 渲染核心配置与预设
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include "../common/Errors.hpp"

namespace tx
{

struct RenderConfig
{
    // 流水线
    uint32_t syncFlushTimeoutMs = 100;     // syncFlush 最长等待
    bool enableViewReuse = true;           // 是否使用视图复用池
    bool enablePerformanceMonitor = false; // 输出各阶段耗时
    bool enableVerboseLogging = false;     // debug 级别日志

    // 差异比较
    bool enableKeyOptimization = true;
    size_t maxDiffDepth = 50;

    // 资源池与缓存容量
    size_t layoutPoolMaxIdle = 256;
    size_t layoutPoolWarmUp = 64;
    size_t pipelinePoolCapacity = 8;
    size_t heightCacheCapacity = 500;
    size_t prototypeCacheCapacity = 64;
    size_t recyclePoolMaxPerKind = 32;
    size_t backgroundThreads = 0; // 0 取硬件并发数

#ifdef NDEBUG
    bool debugPlaceholders = false;
#else
    bool debugPlaceholders = true; // 未识别节点显示醒目占位
#endif

    static RenderConfig defaults() { return {}; }

    static RenderConfig highPerformance()
    {
        RenderConfig config;
        config.enableViewReuse = true;
        config.enablePerformanceMonitor = false;
        config.enableVerboseLogging = false;
        config.layoutPoolMaxIdle = 1024;
        config.layoutPoolWarmUp = 256;
        config.pipelinePoolCapacity = 16;
        config.heightCacheCapacity = 2000;
        config.recyclePoolMaxPerKind = 64;
        return config;
    }

    static RenderConfig debug()
    {
        RenderConfig config;
        config.enablePerformanceMonitor = true;
        config.enableVerboseLogging = true;
        config.debugPlaceholders = true;
        return config;
    }

    /**
     * @brief 从 JSON 读取，缺省键保持默认值，未知键忽略
     */
    static std::expected<RenderConfig, ConfigError> fromJson(const nlohmann::json& json);
};

/**
 * @brief 从 JSON 文件加载配置
 */
std::expected<RenderConfig, ConfigError> loadRenderConfig(const std::filesystem::path& path);

[[nodiscard]] constexpr const char* toString(ConfigError error) noexcept
{
    switch (error)
    {
        case ConfigError::FILE_NOT_FOUND:
            return "FileNotFound";
        case ConfigError::PARSE_ERROR:
            return "ParseError";
        case ConfigError::INVALID_VALUE:
            return "InvalidValue";
    }
    return "Unknown";
}

} // namespace tx
