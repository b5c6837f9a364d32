#pragma once

#include "ports/output/ICachePort.hpp"
#include "settings/ICacheSettings.hpp"
#include <cache/Cache.hpp>
#include <cache/eviction/LRUPolicy.hpp>
#include <cache/concurrency/ThreadSafeCache.hpp>
#include <cache/expiration/GlobalTTL.hpp>
#include <memory>
#include <chrono>
#include <iostream>
#include <limits>

namespace depcache::adapters::secondary
{

    /**
     * @brief Хранилище на основе cpp-cache библиотеки
     *
     * Реализует ICachePort используя LRU кэш с опциональным глобальным TTL.
     * Thread-safe благодаря ThreadSafeCache wrapper.
     *
     * @note TTL отдельной записи cpp-cache в этой конфигурации не поддерживает:
     *       положительный TTL из set() игнорируется (действует глобальный),
     *       TTL <= 0 удаляет запись.
     */
    class LruCacheAdapter : public ports::output::ICachePort
    {
    public:
        /**
         * @brief Конструктор
         *
         * @param capacity Максимальное количество элементов
         * @param ttlSeconds TTL в секундах (0 = без TTL)
         */
        explicit LruCacheAdapter(size_t capacity = 10000, int ttlSeconds = 0)
            : capacity_(capacity), ttlSeconds_(ttlSeconds)
        {
            if (ttlSeconds > 0)
            {
                auto innerCache = std::make_unique<CacheType>(
                    capacity,
                    std::make_unique<LRUPolicy<std::string>>(),
                    std::make_unique<GlobalTTL<std::string>>(
                        std::chrono::seconds(ttlSeconds)));
                cache_ = std::make_unique<ThreadSafeCacheType>(std::move(innerCache));
            }
            else
            {
                auto innerCache = std::make_unique<CacheType>(
                    capacity,
                    std::make_unique<LRUPolicy<std::string>>());
                cache_ = std::make_unique<ThreadSafeCacheType>(std::move(innerCache));
            }

            std::cout << "[LruCacheAdapter] Created with:"
                      << " capacity=" << capacity_
                      << " ttl=" << ttlSeconds_ << "s"
                      << std::endl;
        }

        /**
         * @brief Конструктор из настроек
         *
         * Ёмкость - getCapacity(), глобальный TTL - TTL по умолчанию.
         */
        explicit LruCacheAdapter(const settings::ICacheSettings &settings)
            : LruCacheAdapter(settings.getCapacity(), toTtlSeconds(settings.getDefaultTtl()))
        {
        }

        std::optional<domain::CacheEntry> get(const std::string &key) override
        {
            return cache_->get(key);
        }

        bool exists(const std::string &key) override
        {
            return cache_->get(key).has_value();
        }

        bool set(const std::string &key, const domain::CacheEntry &entry, domain::Ttl ttl) override
        {
            if (ttl && ttl->count() <= 0)
            {
                cache_->remove(key);
                return true;
            }
            cache_->put(key, entry);
            return true;
        }

        OptionalEntryMap getMultiple(const std::vector<std::string> &keys) override
        {
            OptionalEntryMap result;
            for (const auto &key : keys)
            {
                result[key] = cache_->get(key);
            }
            return result;
        }

        bool setMultiple(const EntryMap &entries, domain::Ttl ttl) override
        {
            bool success = true;
            for (const auto &[key, entry] : entries)
            {
                success = set(key, entry, ttl) && success;
            }
            return success;
        }

        /**
         * @brief Удалить значение (отсутствие ключа не ошибка)
         */
        bool remove(const std::string &key) override
        {
            cache_->remove(key);
            return true;
        }

        bool removeMultiple(const std::vector<std::string> &keys) override
        {
            for (const auto &key : keys)
            {
                cache_->remove(key);
            }
            return true;
        }

        bool clear() override
        {
            cache_->clear();
            return true;
        }

        size_t size() const override
        {
            return cache_->size();
        }

        size_t capacity() const
        {
            return capacity_;
        }

        int ttlSeconds() const
        {
            return ttlSeconds_;
        }

    private:
        // Отрицательный TTL как глобальный не имеет смысла - без TTL;
        // слишком большой урезается до предела int
        static int toTtlSeconds(domain::Ttl ttl)
        {
            if (!ttl || ttl->count() <= 0)
            {
                return 0;
            }
            if (ttl->count() > std::numeric_limits<int>::max())
            {
                return std::numeric_limits<int>::max();
            }
            return static_cast<int>(ttl->count());
        }

        using CacheType = ::Cache<std::string, domain::CacheEntry>;
        using ThreadSafeCacheType = ::ThreadSafeCache<std::string, domain::CacheEntry>;

        size_t capacity_;
        int ttlSeconds_;
        std::unique_ptr<ThreadSafeCacheType> cache_;
    };

} // namespace depcache::adapters::secondary
