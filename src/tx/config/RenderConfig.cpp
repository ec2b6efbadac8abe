/**
 * ************************************************************************
 *
 * @file RenderConfig.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-13
 * @version 0.1
 * @brief 配置读取
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "RenderConfig.hpp"

#include <fstream>
#include <string_view>
#include "../singleton/Logger.hpp"

namespace tx
{

namespace
{

bool readBool(const nlohmann::json& json, std::string_view key, bool& out)
{
    auto iter = json.find(key);
    if (iter == json.end()) return true;
    if (!iter->is_boolean())
    {
        Logger::warn("[RenderConfig] {} 应为布尔值", key);
        return false;
    }
    out = iter->get<bool>();
    return true;
}

template <typename T>
bool readUnsigned(const nlohmann::json& json, std::string_view key, T& out)
{
    auto iter = json.find(key);
    if (iter == json.end()) return true;
    if (!iter->is_number_integer() || iter->get<int64_t>() < 0)
    {
        Logger::warn("[RenderConfig] {} 应为非负整数", key);
        return false;
    }
    out = iter->get<T>();
    return true;
}

} // namespace

std::expected<RenderConfig, ConfigError> RenderConfig::fromJson(const nlohmann::json& json)
{
    if (!json.is_object())
    {
        return std::unexpected(ConfigError::INVALID_VALUE);
    }

    RenderConfig config;
    const bool ok = readUnsigned(json, "syncFlushTimeoutMs", config.syncFlushTimeoutMs) &&
                    readBool(json, "enableViewReuse", config.enableViewReuse) &&
                    readBool(json, "enablePerformanceMonitor", config.enablePerformanceMonitor) &&
                    readBool(json, "enableVerboseLogging", config.enableVerboseLogging) &&
                    readBool(json, "enableKeyOptimization", config.enableKeyOptimization) &&
                    readUnsigned(json, "maxDiffDepth", config.maxDiffDepth) &&
                    readUnsigned(json, "layoutPoolMaxIdle", config.layoutPoolMaxIdle) &&
                    readUnsigned(json, "layoutPoolWarmUp", config.layoutPoolWarmUp) &&
                    readUnsigned(json, "pipelinePoolCapacity", config.pipelinePoolCapacity) &&
                    readUnsigned(json, "heightCacheCapacity", config.heightCacheCapacity) &&
                    readUnsigned(json, "prototypeCacheCapacity", config.prototypeCacheCapacity) &&
                    readUnsigned(json, "recyclePoolMaxPerKind", config.recyclePoolMaxPerKind) &&
                    readUnsigned(json, "backgroundThreads", config.backgroundThreads) &&
                    readBool(json, "debugPlaceholders", config.debugPlaceholders);
    if (!ok)
    {
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    return config;
}

std::expected<RenderConfig, ConfigError> loadRenderConfig(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        Logger::error("[RenderConfig] 无法打开配置文件 {}", path.string());
        return std::unexpected(ConfigError::FILE_NOT_FOUND);
    }

    auto json = nlohmann::json::parse(file, nullptr, false);
    if (json.is_discarded())
    {
        Logger::error("[RenderConfig] 配置文件 {} 不是合法 JSON", path.string());
        return std::unexpected(ConfigError::PARSE_ERROR);
    }

    auto config = RenderConfig::fromJson(json);
    if (config)
    {
        Logger::info("[RenderConfig] 已加载配置 {}", path.string());
    }
    return config;
}

} // namespace tx
