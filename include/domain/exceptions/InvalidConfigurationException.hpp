#pragma once

#include "domain/exceptions/CacheException.hpp"

namespace depcache::domain::exceptions {

/**
 * @brief Некорректная настройка кэша
 *
 * Например, префикс ключа содержит не буквенно-цифровые символы
 * или переменная окружения не парсится.
 */
class InvalidConfigurationException : public CacheException {
public:
    explicit InvalidConfigurationException(const std::string& message)
        : CacheException(message) {}
};

} // namespace depcache::domain::exceptions
