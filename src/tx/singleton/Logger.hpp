/**
 * ************************************************************************
 *
 * @file Logger.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-01-26
 * @version 0.2
 * @brief 渲染核心日志系统封装
  - 基于 spdlog 实现，控制台 + 轮转文件双输出
  - 调用点自动捕获源码位置
  - 日志级别可由 RenderConfig 切换（详细日志开关）
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <source_location>
#include <vector>
#include "SingletonBase.hpp"

namespace tx
{
/**
 * @brief 辅助结构体：在调用点自动捕获位置和格式化字符串
 */
struct LogLocation
{
    spdlog::string_view_t fmt;
    std::source_location loc;

    template <typename T>
        requires std::convertible_to<T, spdlog::string_view_t>
    constexpr LogLocation(const T& s, std::source_location l = std::source_location::current()) : fmt(s), loc(l)
    {
    }
};

class Logger : public SingletonBase<Logger>
{
    static constexpr size_t MAX_LOG_FILE_SIZE = 1024 * 1024 * 5; // 5MB
    static constexpr size_t MAX_LOG_FILE_COUNT = 1;

    friend class SingletonBase<Logger>;

public:
    template <typename... Args>
    static void warn(LogLocation msg, Args&&... args)
    {
        getInstance().log_impl(spdlog::level::warn, msg, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void info(LogLocation msg, Args&&... args)
    {
        getInstance().log_impl(spdlog::level::info, msg, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void error(LogLocation msg, Args&&... args)
    {
        getInstance().log_impl(spdlog::level::err, msg, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void debug(LogLocation msg, Args&&... args)
    {
        getInstance().log_impl(spdlog::level::debug, msg, std::forward<Args>(args)...);
    }

    /**
     * @brief 切换日志级别（详细日志开关）
     */
    static void setLevel(spdlog::level::level_enum lvl) { getInstance().m_logger->set_level(lvl); }

    [[nodiscard]] static bool shouldLog(spdlog::level::level_enum lvl) { return getInstance().m_logger->should_log(lvl); }

private:
    Logger()
    {
        // 1. 控制台 sink
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern("%^[%T] [%l] %n: %v%$");

        // 2. 文件 sink
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            "logs/templatex.log", MAX_LOG_FILE_SIZE, MAX_LOG_FILE_COUNT);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%# %!] %v");

        // 3. 组装 logger
        std::vector<spdlog::sink_ptr> sinks{consoleSink, fileSink};
        m_logger = std::make_shared<spdlog::logger>("TemplateX", sinks.begin(), sinks.end());

        m_logger->set_level(spdlog::level::debug);
        m_logger->flush_on(spdlog::level::warn);
    }

    template <typename... Args>
    void log_impl(spdlog::level::level_enum lvl, const LogLocation& msg, Args&&... args)
    {
        m_logger->log(
            spdlog::source_loc{msg.loc.file_name(), static_cast<int>(msg.loc.line()), msg.loc.function_name()},
            lvl,
            fmt::runtime(msg.fmt),
            std::forward<Args>(args)...);
    }

    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace tx
