#pragma once

#include <nlohmann/json.hpp>

namespace depcache::domain {

/**
 * @brief Строгий порядок на ключах-JSON для std::map
 *
 * Сначала сравнивается вид значения, потом само значение.
 * В отличие от json::operator< значения разных видов не равны:
 * 1 и 1.0 - разные ключи (и в хранилище они разные).
 * Целые со знаком и без знака - один вид: json(1) и json(1u)
 * дают одинаковый ключ хранилища.
 */
struct JsonKeyLess {
    bool operator()(const nlohmann::json& lhs, const nlohmann::json& rhs) const;
};

} // namespace depcache::domain
