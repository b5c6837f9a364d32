#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace depcache::domain {

/**
 * @brief Нормализация ключей кэша
 *
 * Превращает произвольный ключ в строку, безопасную для хранилища:
 * - строка или целое число из одних [A-Za-z0-9] длиной до 32 байт
 *   возвращается как есть (удобно отлаживать);
 * - всё остальное сворачивается в MD5 (32 hex символа).
 *
 * Составные ключи сериализуются в канонический JSON: члены объекта
 * упорядочены по имени, поэтому {"a":1,"b":2} и {"b":2,"a":1}
 * дают один и тот же ключ.
 *
 * @note Коллизии MD5 возможны и считаются допустимыми.
 */
class CacheKeyNormalizer {
public:
    /// Максимальная длина ключа, который передаётся без хэширования
    static constexpr size_t MAX_PLAIN_KEY_LENGTH = 32;

    /**
     * @brief Нормализовать ключ
     *
     * @throws exceptions::InvalidKeyException если составной ключ
     *         не сериализуется (например, строка не в UTF-8)
     */
    std::string normalize(const nlohmann::json& key) const;

    /**
     * @brief Строковое представление ключа без хэширования
     *
     * Используется при выключенной нормализации: строки как есть,
     * целые числа в десятичной записи, остальное - канонический JSON.
     */
    static std::string toKeyString(const nlohmann::json& key);

    /**
     * @brief Непустая строка только из ASCII букв и цифр
     */
    static bool isAlphanumeric(const std::string& value);

private:
    static std::string serialize(const nlohmann::json& key);
};

} // namespace depcache::domain
