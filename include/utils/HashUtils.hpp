#pragma once

#include <string>

namespace depcache::utils {

/**
 * @brief Хэш-функции для построения ключей кэша
 *
 * Обёртка над OpenSSL EVP. Используется для сворачивания длинных
 * и составных ключей в строку фиксированной длины.
 */
class HashUtils {
public:
    /// Длина MD5 дайджеста в hex-представлении
    static constexpr size_t MD5_HEX_LENGTH = 32;

    /**
     * @brief MD5 дайджест строки
     *
     * @param data Произвольные байты
     * @return 32 символа [0-9a-f]
     * @throws std::runtime_error если OpenSSL не смог посчитать хэш
     */
    static std::string md5Hex(const std::string& data);
};

} // namespace depcache::utils
