#pragma once

#include <stdexcept>
#include <string>

/**
 * @file CacheException.hpp
 * @brief Базовое исключение библиотеки кэширования
 */

namespace depcache::domain::exceptions {

/**
 * @brief Базовый класс для ошибок, которые выбрасывает Cache
 *
 * Ошибки хранилища (backend) сюда не оборачиваются и
 * пробрасываются вызывающему коду как есть.
 */
class CacheException : public std::runtime_error {
public:
    explicit CacheException(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace depcache::domain::exceptions
