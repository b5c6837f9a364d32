#pragma once

#include "domain/CacheEntry.hpp"
#include "domain/Ttl.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace depcache::ports::output {

/**
 * @brief Интерфейс хранилища кэша (backend)
 *
 * Output Port: сырое key-value хранилище, поверх которого работает Cache.
 * Ключи приходят уже нормализованными (с префиксом).
 * Никакой логики зависимостей хранилище не знает.
 *
 * Реализации:
 * - InMemoryCacheAdapter - unordered_map + TTL на каждую запись
 * - LruCacheAdapter - обёртка над cpp-cache (LRU + глобальный TTL)
 */
class ICachePort {
public:
    using EntryMap = std::map<std::string, domain::CacheEntry>;
    using OptionalEntryMap = std::map<std::string, std::optional<domain::CacheEntry>>;

    virtual ~ICachePort() = default;

    /**
     * @brief Получить запись
     *
     * @param key Нормализованный ключ
     * @return Запись или nullopt если не найдена или истекла
     */
    virtual std::optional<domain::CacheEntry> get(const std::string& key) = 0;

    /**
     * @brief Проверить наличие ключа
     *
     * @return true если запись существует и не истекла
     */
    virtual bool exists(const std::string& key) = 0;

    /**
     * @brief Сохранить запись
     *
     * @param key Нормализованный ключ
     * @param entry Запись
     * @param ttl Время жизни (nullopt = без ограничения, <= 0 = удалить)
     * @return true если запись сохранена
     */
    virtual bool set(
        const std::string& key,
        const domain::CacheEntry& entry,
        domain::Ttl ttl
    ) = 0;

    /**
     * @brief Получить несколько записей за один вызов
     *
     * @return Результат для каждого запрошенного ключа (nullopt для отсутствующих)
     */
    virtual OptionalEntryMap getMultiple(const std::vector<std::string>& keys) = 0;

    /**
     * @brief Сохранить несколько записей с общим TTL
     */
    virtual bool setMultiple(const EntryMap& entries, domain::Ttl ttl) = 0;

    /**
     * @brief Удалить запись
     *
     * @return true если не произошло ошибки (отсутствие ключа ошибкой не считается)
     */
    virtual bool remove(const std::string& key) = 0;

    /**
     * @brief Удалить несколько записей
     */
    virtual bool removeMultiple(const std::vector<std::string>& keys) = 0;

    /**
     * @brief Очистить всё хранилище
     */
    virtual bool clear() = 0;

    /**
     * @brief Количество записей в хранилище
     */
    virtual size_t size() const = 0;
};

} // namespace depcache::ports::output
