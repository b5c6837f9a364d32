#pragma once

#include "domain/exceptions/CacheException.hpp"

namespace depcache::domain::exceptions {

/**
 * @brief Составной ключ невозможно сериализовать в каноническую строку
 */
class InvalidKeyException : public CacheException {
public:
    explicit InvalidKeyException(const std::string& message)
        : CacheException(message) {}
};

} // namespace depcache::domain::exceptions
