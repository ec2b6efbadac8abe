/**
 * ************************************************************************
 *
 * @file SingletonBase.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-01-26
 * @version 0.2
 * @brief 单例基类模板 (仅供日志等进程级设施使用)
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <utility>

namespace tx
{

template <typename Derived>
class SingletonBase
{
public:
    template <typename... Args>
    static Derived& getInstance(Args&&... args)
    {
        // 静态局部变量，首次调用时线程安全地构造一次
        static Derived instance(std::forward<Args>(args)...);
        return instance;
    }

    SingletonBase(const SingletonBase&) = delete;
    SingletonBase& operator=(const SingletonBase&) = delete;
    SingletonBase(SingletonBase&&) = delete;
    SingletonBase& operator=(SingletonBase&&) = delete;

protected:
    SingletonBase() = default;
    virtual ~SingletonBase() = default;
};

} // namespace tx
