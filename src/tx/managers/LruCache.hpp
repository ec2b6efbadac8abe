/**
 * ************************************************************************
 *
 * @file LruCache.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-15
 * @version 0.1
 * @brief 带容量上限的 LRU 缓存（互斥锁保护）
 *
 * 超出容量时淘汰最久未访问的条目。get 会刷新访问顺序。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <cstddef>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace tx::managers
{

template <typename Key, typename Value, typename Hash = std::hash<Key>>
class LruCache
{
public:
    explicit LruCache(size_t capacity) : m_capacity(capacity == 0 ? 1 : capacity) {}

    LruCache(const LruCache&) = delete;
    LruCache& operator=(const LruCache&) = delete;
    LruCache(LruCache&&) = delete;
    LruCache& operator=(LruCache&&) = delete;

    [[nodiscard]] std::optional<Value> get(const Key& key)
    {
        std::lock_guard lock(m_mutex);
        auto iter = m_index.find(key);
        if (iter == m_index.end())
        {
            ++m_misses;
            return std::nullopt;
        }
        m_entries.splice(m_entries.begin(), m_entries, iter->second);
        ++m_hits;
        return iter->second->second;
    }

    void put(const Key& key, Value value)
    {
        std::lock_guard lock(m_mutex);
        auto iter = m_index.find(key);
        if (iter != m_index.end())
        {
            iter->second->second = std::move(value);
            m_entries.splice(m_entries.begin(), m_entries, iter->second);
            return;
        }

        m_entries.emplace_front(key, std::move(value));
        m_index.emplace(key, m_entries.begin());
        if (m_entries.size() > m_capacity)
        {
            m_index.erase(m_entries.back().first);
            m_entries.pop_back();
        }
    }

    [[nodiscard]] bool contains(const Key& key) const
    {
        std::lock_guard lock(m_mutex);
        return m_index.contains(key);
    }

    bool erase(const Key& key)
    {
        std::lock_guard lock(m_mutex);
        auto iter = m_index.find(key);
        if (iter == m_index.end()) return false;
        m_entries.erase(iter->second);
        m_index.erase(iter);
        return true;
    }

    /**
     * @brief 删除所有满足 pred(key, value) 的条目
     * @return 删除的条目数
     */
    template <typename Pred>
    size_t eraseIf(Pred&& pred)
    {
        std::lock_guard lock(m_mutex);
        size_t removed = 0;
        for (auto iter = m_entries.begin(); iter != m_entries.end();)
        {
            if (pred(static_cast<const Key&>(iter->first), static_cast<const Value&>(iter->second)))
            {
                m_index.erase(iter->first);
                iter = m_entries.erase(iter);
                ++removed;
            }
            else
            {
                ++iter;
            }
        }
        return removed;
    }

    void clear()
    {
        std::lock_guard lock(m_mutex);
        m_entries.clear();
        m_index.clear();
    }

    [[nodiscard]] size_t size() const
    {
        std::lock_guard lock(m_mutex);
        return m_entries.size();
    }

    [[nodiscard]] size_t capacity() const noexcept { return m_capacity; }

    [[nodiscard]] size_t hitCount() const
    {
        std::lock_guard lock(m_mutex);
        return m_hits;
    }

    [[nodiscard]] size_t missCount() const
    {
        std::lock_guard lock(m_mutex);
        return m_misses;
    }

private:
    using Entry = std::pair<Key, Value>;

    size_t m_capacity;
    mutable std::mutex m_mutex;
    std::list<Entry> m_entries; // 头部最新
    std::unordered_map<Key, typename std::list<Entry>::iterator, Hash> m_index;
    size_t m_hits = 0;
    size_t m_misses = 0;
};

} // namespace tx::managers
