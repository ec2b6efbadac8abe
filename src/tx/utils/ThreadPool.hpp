/**
 * ************************************************************************
 *
 * @file ThreadPool.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-12
 * @version 0.1
 * @brief 后台计算线程池（asio::thread_pool）
 *
 * 由 RenderContext 持有，不再是进程级单例。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <asio.hpp>
#include <concepts>
#include <cstddef>
#include <functional>
#include <future>
#include <thread>
#include <type_traits>

namespace tx::utils
{

class ThreadPool
{
public:
    /**
     * @param threadCount 为 0 时取硬件并发数
     */
    explicit ThreadPool(size_t threadCount = 0)
        : m_threadCount(threadCount == 0 ? defaultThreadCount() : threadCount), m_pool(m_threadCount)
    {
    }

    ~ThreadPool() { shutdown(); }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /**
     * @brief 投递任务；任务抛出的异常由返回的 future 携带
     */
    template <typename F>
        requires std::invocable<F>
    auto enqueue(F&& func) -> std::future<std::invoke_result_t<F>>
    {
        using R = std::invoke_result_t<F>;

        std::promise<R> promise;
        auto future = promise.get_future();

        std::move_only_function<void()> task = [pro = std::move(promise), fn = std::forward<F>(func)]() mutable
        {
            try
            {
                if constexpr (std::is_void_v<R>)
                {
                    std::invoke(fn);
                    pro.set_value();
                }
                else
                {
                    pro.set_value(std::invoke(fn));
                }
            }
            catch (...)
            {
                pro.set_exception(std::current_exception());
            }
        };

        asio::post(m_pool, std::move(task));
        return future;
    }

    /**
     * @brief 等待已投递任务完成后停止
     */
    void shutdown() noexcept
    {
        if (m_stopped) return;
        m_stopped = true;
        m_pool.join();
    }

    [[nodiscard]] size_t threadCount() const noexcept { return m_threadCount; }

private:
    static size_t defaultThreadCount() noexcept
    {
        const size_t hardware = std::thread::hardware_concurrency();
        return hardware == 0 ? 2 : hardware;
    }

    size_t m_threadCount;
    asio::thread_pool m_pool;
    bool m_stopped = false;
};

} // namespace tx::utils
