#pragma once

#include "domain/exceptions/CacheException.hpp"
#include <nlohmann/json.hpp>

namespace depcache::ports::input {
class ICache;
}

namespace depcache::domain::exceptions {

/**
 * @brief Не удалось сохранить значение, вычисленное в getOrSet()
 *
 * Значение к этому моменту уже посчитано, поэтому исключение
 * несёт его вместе с исходным ключом и ссылкой на кэш:
 * вызывающий код может использовать результат или повторить запись.
 */
class SetCacheException : public CacheException {
public:
    SetCacheException(
        nlohmann::json key,
        nlohmann::json value,
        ports::input::ICache& cache
    ) : CacheException("Failed to store value in cache for key "
          + key.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace))
      , key_(std::move(key))
      , value_(std::move(value))
      , cache_(&cache)
    {}

    const nlohmann::json& getKey() const { return key_; }
    const nlohmann::json& getValue() const { return value_; }
    ports::input::ICache& getCache() const { return *cache_; }

private:
    nlohmann::json key_;
    nlohmann::json value_;
    ports::input::ICache* cache_;
};

} // namespace depcache::domain::exceptions
