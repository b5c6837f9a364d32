#pragma once

#include "ports/output/ICachePort.hpp"
#include <chrono>
#include <functional>
#include <mutex>
#include <unordered_map>

namespace depcache::adapters::secondary {

/**
 * @brief In-memory хранилище с TTL на каждую запись
 *
 * Истёкшие записи удаляются лениво, при обращении.
 * Вытеснения нет: размер ограничен только памятью.
 * Thread-safe (один mutex на всё хранилище).
 */
class InMemoryCacheAdapter : public ports::output::ICachePort {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    /**
     * @param now Источник времени (в тестах подменяется)
     */
    explicit InMemoryCacheAdapter(TimeSource now = [] { return Clock::now(); })
        : now_(std::move(now)) {}

    std::optional<domain::CacheEntry> get(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return findLive(key);
    }

    bool exists(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return findLive(key).has_value();
    }

    bool set(const std::string& key, const domain::CacheEntry& entry, domain::Ttl ttl) override {
        std::lock_guard<std::mutex> lock(mutex_);
        store(key, entry, ttl);
        return true;
    }

    OptionalEntryMap getMultiple(const std::vector<std::string>& keys) override {
        std::lock_guard<std::mutex> lock(mutex_);
        OptionalEntryMap result;
        for (const auto& key : keys) {
            result[key] = findLive(key);
        }
        return result;
    }

    bool setMultiple(const EntryMap& entries, domain::Ttl ttl) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, entry] : entries) {
            store(key, entry, ttl);
        }
        return true;
    }

    bool remove(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.erase(key);
        return true;
    }

    bool removeMultiple(const std::vector<std::string>& keys) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& key : keys) {
            items_.erase(key);
        }
        return true;
    }

    bool clear() override {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.clear();
        return true;
    }

    /**
     * @brief Количество неистёкших записей
     */
    size_t size() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = now_();
        size_t count = 0;
        for (const auto& [key, item] : items_) {
            if (!isExpired(item, now)) {
                ++count;
            }
        }
        return count;
    }

private:
    struct Item {
        domain::CacheEntry entry;
        std::optional<Clock::time_point> expiresAt;
    };

    static bool isExpired(const Item& item, Clock::time_point now) {
        return item.expiresAt && *item.expiresAt <= now;
    }

    // Вызывается под mutex_
    std::optional<domain::CacheEntry> findLive(const std::string& key) {
        auto it = items_.find(key);
        if (it == items_.end()) {
            return std::nullopt;
        }
        if (isExpired(it->second, now_())) {
            items_.erase(it);
            return std::nullopt;
        }
        return it->second.entry;
    }

    // Вызывается под mutex_
    void store(const std::string& key, const domain::CacheEntry& entry, domain::Ttl ttl) {
        if (ttl && ttl->count() <= 0) {
            items_.erase(key);
            return;
        }

        Item item{entry, std::nullopt};
        if (ttl) {
            auto now = now_();
            // TTL дальше предела часов - запись без срока
            auto maxTtl = std::chrono::duration_cast<std::chrono::seconds>(Clock::time_point::max() - now);
            if (*ttl < maxTtl) {
                item.expiresAt = now + std::chrono::duration_cast<Clock::duration>(*ttl);
            }
        }
        items_.insert_or_assign(key, std::move(item));
    }

    TimeSource now_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Item> items_;
};

} // namespace depcache::adapters::secondary
