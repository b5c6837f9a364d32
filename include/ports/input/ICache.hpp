#pragma once

#include "domain/JsonKeyLess.hpp"
#include "domain/Ttl.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <memory>
#include <vector>

namespace depcache::dependencies {
class IDependency;
}

namespace depcache::ports::input {

/**
 * @brief Интерфейс кэша
 *
 * Input Port: то, с чем работает прикладной код и зависимости.
 *
 * Ключ - любое JSON значение: строка, целое число или составная
 * структура (массив / объект). Значение - любое JSON значение,
 * null означает "нет данных".
 *
 * @example
 * ```cpp
 * auto top = cache.getOrSet({{"top-products", 10}}, [&](ICache&) {
 *     return loadTopProducts(10);
 * }, std::chrono::minutes(15));
 * ```
 */
class ICache {
public:
    /// Ключи разных видов (1 и 1.0) различаются, см. JsonKeyLess
    using KeyValueMap = std::map<nlohmann::json, nlohmann::json, domain::JsonKeyLess>;
    using DependencyPtr = std::shared_ptr<dependencies::IDependency>;
    using ValueFactory = std::function<nlohmann::json(ICache&)>;

    virtual ~ICache() = default;

    /**
     * @brief Получить значение
     *
     * @param key Ключ
     * @param defaultValue Возвращается если записи нет, она истекла
     *        или её зависимость изменилась
     */
    virtual nlohmann::json get(
        const nlohmann::json& key,
        const nlohmann::json& defaultValue = nullptr
    ) = 0;

    /**
     * @brief Проверить наличие записи в хранилище
     *
     * @note Зависимость записи НЕ проверяется: устаревшая по зависимости
     *       запись всё равно даёт true, хотя get() вернёт default.
     */
    virtual bool has(const nlohmann::json& key) = 0;

    /**
     * @brief Получить несколько значений
     *
     * @return Отображение исходный ключ -> значение (или defaultValue)
     */
    virtual KeyValueMap getMultiple(
        const std::vector<nlohmann::json>& keys,
        const nlohmann::json& defaultValue = nullptr
    ) = 0;

    /**
     * @brief Сохранить значение
     *
     * @param ttl TTL записи; если не задан - берётся TTL по умолчанию
     * @param dependency Зависимость; вычисляется здесь, если ещё не вычислена
     * @return Результат записи в хранилище
     */
    virtual bool set(
        const nlohmann::json& key,
        const nlohmann::json& value,
        domain::Ttl ttl = std::nullopt,
        DependencyPtr dependency = nullptr
    ) = 0;

    /**
     * @brief Сохранить несколько значений одним вызовом хранилища
     *
     * Общая зависимость вычисляется не более одного раза на весь пакет.
     */
    virtual bool setMultiple(
        const KeyValueMap& values,
        domain::Ttl ttl = std::nullopt,
        DependencyPtr dependency = nullptr
    ) = 0;

    /**
     * @brief Сохранить значение, только если ключа ещё нет
     *
     * @return false если ключ уже есть в хранилище
     */
    virtual bool add(
        const nlohmann::json& key,
        const nlohmann::json& value,
        domain::Ttl ttl = std::nullopt,
        DependencyPtr dependency = nullptr
    ) = 0;

    /**
     * @brief Сохранить значения для ключей, которых ещё нет
     *
     * Уже существующие ключи молча пропускаются.
     *
     * @return Результат единственного setMultiple() хранилища
     */
    virtual bool addMultiple(
        const KeyValueMap& values,
        domain::Ttl ttl = std::nullopt,
        DependencyPtr dependency = nullptr
    ) = 0;

    virtual bool remove(const nlohmann::json& key) = 0;

    virtual bool removeMultiple(const std::vector<nlohmann::json>& keys) = 0;

    /**
     * @brief Очистить хранилище целиком
     *
     * @warning Затрагивает всех, кто использует то же хранилище,
     *          независимо от префикса.
     */
    virtual bool clear() = 0;

    /**
     * @brief Получить значение или вычислить и сохранить его
     *
     * @param factory Вызывается с этим же кэшем, если значения нет
     * @throws domain::exceptions::SetCacheException если запись не удалась
     */
    virtual nlohmann::json getOrSet(
        const nlohmann::json& key,
        const ValueFactory& factory,
        domain::Ttl ttl = std::nullopt,
        DependencyPtr dependency = nullptr
    ) = 0;
};

} // namespace depcache::ports::input
