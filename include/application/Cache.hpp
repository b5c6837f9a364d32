#pragma once

#include "ports/input/ICache.hpp"
#include "ports/output/ICachePort.hpp"
#include "settings/ICacheSettings.hpp"
#include "domain/CacheEntry.hpp"
#include "domain/CacheKeyNormalizer.hpp"
#include <memory>
#include <optional>
#include <string>

namespace depcache::application {

/**
 * @brief Декоратор хранилища: нормализация ключей, TTL и зависимости
 *
 * Само хранение делегируется ICachePort. Cache добавляет:
 * - нормализацию ключей (CacheKeyNormalizer) и префикс;
 * - TTL по умолчанию для записей без явного TTL;
 * - зависимости: значение хранится вместе с вычисленной зависимостью
 *   (TaggedEntry) и при чтении считается отсутствующим, если
 *   зависимость изменилась.
 *
 * Типичное использование:
 * ```cpp
 * auto data = cache.get(key);
 * if (data.is_null()) {
 *     data = load();
 *     cache.set(key, data, ttl, dependency);
 * }
 * ```
 *
 * Внутренних блокировок нет: каждая операция - синхронная цепочка
 * "нормализация -> вызов хранилища -> разбор результата".
 * add()/addMultiple() - это проверка и запись двумя вызовами, не атомарно.
 * getOrSet() не защищает от одновременного вычисления одного ключа.
 */
class Cache : public ports::input::ICache {
public:
    /**
     * @param handler Хранилище (разделяемое, Cache им не владеет единолично)
     * @throws std::invalid_argument если handler пустой
     */
    explicit Cache(std::shared_ptr<ports::output::ICachePort> handler);

    /**
     * @brief Создать кэш и применить настройки
     *
     * @throws domain::exceptions::InvalidConfigurationException
     *         если префикс из настроек некорректен
     */
    Cache(
        std::shared_ptr<ports::output::ICachePort> handler,
        const settings::ICacheSettings& settings
    );

    nlohmann::json get(
        const nlohmann::json& key,
        const nlohmann::json& defaultValue = nullptr
    ) override;

    bool has(const nlohmann::json& key) override;

    KeyValueMap getMultiple(
        const std::vector<nlohmann::json>& keys,
        const nlohmann::json& defaultValue = nullptr
    ) override;

    bool set(
        const nlohmann::json& key,
        const nlohmann::json& value,
        domain::Ttl ttl = std::nullopt,
        DependencyPtr dependency = nullptr
    ) override;

    bool setMultiple(
        const KeyValueMap& values,
        domain::Ttl ttl = std::nullopt,
        DependencyPtr dependency = nullptr
    ) override;

    bool add(
        const nlohmann::json& key,
        const nlohmann::json& value,
        domain::Ttl ttl = std::nullopt,
        DependencyPtr dependency = nullptr
    ) override;

    bool addMultiple(
        const KeyValueMap& values,
        domain::Ttl ttl = std::nullopt,
        DependencyPtr dependency = nullptr
    ) override;

    bool remove(const nlohmann::json& key) override;

    bool removeMultiple(const std::vector<nlohmann::json>& keys) override;

    bool clear() override;

    nlohmann::json getOrSet(
        const nlohmann::json& key,
        const ValueFactory& factory,
        domain::Ttl ttl = std::nullopt,
        DependencyPtr dependency = nullptr
    ) override;

    // ============================================
    // НАСТРОЙКИ
    // ============================================

    void enableKeyNormalization();

    /**
     * @brief Передавать ключи в хранилище без хэширования
     *
     * Префикс по-прежнему добавляется. Действует на последующие вызовы.
     */
    void disableKeyNormalization();

    bool isKeyNormalizationEnabled() const;

    /**
     * @brief Установить префикс ключей
     *
     * Префикс отделяет ключи разных владельцев в общем хранилище.
     *
     * @param keyPrefix Только [A-Za-z0-9] или пустая строка
     * @throws domain::exceptions::InvalidConfigurationException
     */
    void setKeyPrefix(const std::string& keyPrefix);

    const std::string& getKeyPrefix() const;

    /**
     * @brief TTL для записей, у которых TTL не указан явно
     *
     * @param defaultTtl nullopt = без ограничения
     */
    void setDefaultTtl(domain::Ttl defaultTtl);

    domain::Ttl getDefaultTtl() const;

    /**
     * @brief Ключ, под которым запись окажется в хранилище
     *
     * @throws domain::exceptions::InvalidKeyException
     */
    std::string buildKey(const nlohmann::json& key) const;

private:
    using KeyMap = std::map<std::string, nlohmann::json>;

    domain::Ttl normalizeTtl(domain::Ttl ttl) const;

    /// Вычисляет зависимость (если ещё не вычислена) и упаковывает значение
    domain::CacheEntry addEvaluatedDependencyToValue(
        const nlohmann::json& value,
        const DependencyPtr& dependency
    );

    nlohmann::json getValueOrDefaultIfDependencyChanged(
        const std::optional<domain::CacheEntry>& entry,
        const nlohmann::json& defaultValue
    );

    ports::output::ICachePort::EntryMap prepareDataForSetOrAddMultiple(
        const KeyValueMap& values,
        const DependencyPtr& dependency
    );

    /// Убирает записи, для которых в хранилище уже есть не-null значение
    void excludeExistingValues(ports::output::ICachePort::EntryMap& entries);

    /// Нормализованный ключ -> исходный; при коллизии побеждает последний
    KeyMap buildKeyMap(const std::vector<nlohmann::json>& keys) const;

    static std::vector<std::string> normalizedKeys(const KeyMap& keyMap);

    std::shared_ptr<ports::output::ICachePort> handler_;
    domain::CacheKeyNormalizer normalizer_;
    std::string keyPrefix_;
    bool keyNormalization_ = true;
    domain::Ttl defaultTtl_;
};

} // namespace depcache::application
