#pragma once

#include "domain/Ttl.hpp"
#include <string>

namespace depcache::settings {

/**
 * @brief Интерфейс настроек кэша
 *
 * Позволяет подменить источник настроек в тестах.
 */
class ICacheSettings {
public:
    virtual ~ICacheSettings() = default;

    /// Префикс ключей (только [A-Za-z0-9] или пусто)
    virtual std::string getKeyPrefix() const = 0;

    /// TTL по умолчанию (nullopt = без ограничения)
    virtual domain::Ttl getDefaultTtl() const = 0;

    /// Включена ли нормализация ключей
    virtual bool isKeyNormalizationEnabled() const = 0;

    /// Ёмкость хранилища для ограниченных backend'ов
    virtual size_t getCapacity() const = 0;
};

} // namespace depcache::settings
