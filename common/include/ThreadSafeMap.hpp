#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <vector>
#include <functional>

/**
 * @brief Потокобезопасная map с разделяемыми значениями
 *
 * Чтение под shared_lock, запись под unique_lock.
 * Значения хранятся как shared_ptr: найденный объект остаётся валидным,
 * даже если ключ параллельно перезаписан или удалён.
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    void insert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_); // UNIQUE_LOCK для WRITE
        map_[key] = value;
    }

    /**
     * @brief Вставить, только если ключа ещё нет
     * @return true если значение вставлено
     */
    bool insertIfAbsent(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.emplace(key, value).second;
    }

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_); // shared_lock для READ
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    bool remove(const K &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    /**
     * @brief Снимок всех значений на момент вызова
     */
    std::vector<std::shared_ptr<V>> getAll() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<std::shared_ptr<V>> result;
        result.reserve(map_.size());
        for (const auto &entry : map_)
        {
            result.push_back(entry.second);
        }
        return result;
    }

    /**
     * @brief Обойти все пары под shared_lock
     * @note visitor не должен обращаться к этой же map на запись
     */
    void forEach(const std::function<void(const K &, const std::shared_ptr<V> &)> &visitor) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto &entry : map_)
        {
            visitor(entry.first, entry.second);
        }
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

    void clear()
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_.clear();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};
