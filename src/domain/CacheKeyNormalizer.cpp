#include "domain/CacheKeyNormalizer.hpp"
#include "domain/exceptions/InvalidKeyException.hpp"
#include "utils/HashUtils.hpp"

#include <algorithm>

namespace depcache::domain {

std::string CacheKeyNormalizer::normalize(const nlohmann::json& key) const {
    if (key.is_string() || key.is_number_integer()) {
        std::string plain = toKeyString(key);
        if (isAlphanumeric(plain) && plain.size() <= MAX_PLAIN_KEY_LENGTH) {
            return plain;
        }
        return utils::HashUtils::md5Hex(plain);
    }

    return utils::HashUtils::md5Hex(serialize(key));
}

std::string CacheKeyNormalizer::toKeyString(const nlohmann::json& key) {
    if (key.is_string()) {
        return key.get<std::string>();
    }
    // Для целых dump() даёт десятичную запись
    return serialize(key);
}

bool CacheKeyNormalizer::isAlphanumeric(const std::string& value) {
    if (value.empty()) {
        return false;
    }

    return std::all_of(value.begin(), value.end(), [](char c) {
        return (c >= '0' && c <= '9')
            || (c >= 'a' && c <= 'z')
            || (c >= 'A' && c <= 'Z');
    });
}

std::string CacheKeyNormalizer::serialize(const nlohmann::json& key) {
    try {
        return key.dump();
    } catch (const nlohmann::json::exception& e) {
        throw exceptions::InvalidKeyException(std::string("Invalid key. ") + e.what());
    }
}

} // namespace depcache::domain
