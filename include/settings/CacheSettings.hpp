#pragma once

#include "settings/ICacheSettings.hpp"
#include "domain/exceptions/InvalidConfigurationException.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace depcache::settings {

/**
 * @brief Настройки кэша из переменных окружения
 *
 * Читает из ENV:
 * - CACHE_KEY_PREFIX (default: "")
 * - CACHE_DEFAULT_TTL_SECONDS (default: без ограничения)
 * - CACHE_KEY_NORMALIZATION (default: true)
 * - CACHE_CAPACITY (default: 10000)
 *
 * @throws domain::exceptions::InvalidConfigurationException
 *         если значение не парсится
 */
class CacheSettings : public ICacheSettings {
public:
    CacheSettings() {
        if (const char* val = std::getenv("CACHE_KEY_PREFIX")) {
            keyPrefix_ = val;
        }
        if (const char* val = std::getenv("CACHE_DEFAULT_TTL_SECONDS")) {
            if (*val != '\0') {
                defaultTtl_ = std::chrono::seconds(parseInteger("CACHE_DEFAULT_TTL_SECONDS", val));
            }
        }
        if (const char* val = std::getenv("CACHE_KEY_NORMALIZATION")) {
            keyNormalization_ = parseBool("CACHE_KEY_NORMALIZATION", val);
        }
        if (const char* val = std::getenv("CACHE_CAPACITY")) {
            long long capacity = parseInteger("CACHE_CAPACITY", val);
            if (capacity <= 0) {
                throw domain::exceptions::InvalidConfigurationException(
                    "CACHE_CAPACITY must be positive, got: " + std::string(val));
            }
            capacity_ = static_cast<size_t>(capacity);
        }
    }

    std::string getKeyPrefix() const override { return keyPrefix_; }
    domain::Ttl getDefaultTtl() const override { return defaultTtl_; }
    bool isKeyNormalizationEnabled() const override { return keyNormalization_; }
    size_t getCapacity() const override { return capacity_; }

private:
    static long long parseInteger(const std::string& name, const std::string& value) {
        try {
            size_t pos = 0;
            long long result = std::stoll(value, &pos);
            if (pos != value.size()) {
                throw std::invalid_argument(value);
            }
            return result;
        } catch (const std::logic_error&) {
            throw domain::exceptions::InvalidConfigurationException(
                name + " must be an integer, got: " + value);
        }
    }

    static bool parseBool(const std::string& name, std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (value == "1" || value == "true" || value == "on" || value == "yes") {
            return true;
        }
        if (value == "0" || value == "false" || value == "off" || value == "no") {
            return false;
        }
        throw domain::exceptions::InvalidConfigurationException(
            name + " must be a boolean, got: " + value);
    }

    std::string keyPrefix_;
    domain::Ttl defaultTtl_;
    bool keyNormalization_ = true;
    size_t capacity_ = 10000;
};

} // namespace depcache::settings
