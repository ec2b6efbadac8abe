/**
 * ************************************************************************
 *
 * @file ThreadAffinity.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-09
 * @version 0.1
 * @brief UI 线程归属检查
 *
 * 视图句柄只能在唯一的 UI 线程上创建与修改；调试构建下违反即断言。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <cassert>
#include <thread>
#include "../singleton/Logger.hpp"

namespace tx
{

class ThreadAffinity
{
public:
    ThreadAffinity() : m_owner(std::this_thread::get_id()) {}

    /**
     * @brief 把当前线程指定为 UI 线程
     */
    void bindToCurrentThread() noexcept { m_owner = std::this_thread::get_id(); }

    [[nodiscard]] bool isCurrentThread() const noexcept { return std::this_thread::get_id() == m_owner; }

    [[nodiscard]] std::thread::id owner() const noexcept { return m_owner; }

private:
    std::thread::id m_owner;
};

} // namespace tx

#ifndef NDEBUG
#define TX_ASSERT_UI_THREAD(affinity)                                                                                  \
    do                                                                                                                 \
    {                                                                                                                  \
        if (!(affinity).isCurrentThread())                                                                             \
        {                                                                                                              \
            ::tx::Logger::error("[ThreadAffinity] 视图操作必须在 UI 线程执行");                                        \
            assert(false && "view mutation outside the UI thread");                                                    \
        }                                                                                                              \
    } while (0)
#else
#define TX_ASSERT_UI_THREAD(affinity) ((void)(affinity))
#endif
