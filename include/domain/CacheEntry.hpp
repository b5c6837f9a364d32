#pragma once

#include <nlohmann/json.hpp>
#include <memory>
#include <variant>

namespace depcache::dependencies {
class IDependency;
}

namespace depcache::domain {

/**
 * @brief Значение без зависимости
 */
struct PlainEntry {
    nlohmann::json value;
};

/**
 * @brief Значение, связанное с вычисленной зависимостью
 *
 * dependency хранит снимок внешнего состояния на момент записи.
 * При чтении Cache спрашивает у неё isChanged().
 */
struct TaggedEntry {
    nlohmann::json value;
    std::shared_ptr<dependencies::IDependency> dependency;
};

/**
 * @brief Запись, которую хранит backend
 *
 * Внутреннее представление Cache. Наружу (вызывающему коду)
 * всегда отдаётся только value.
 */
using CacheEntry = std::variant<PlainEntry, TaggedEntry>;

/**
 * @brief Достать сохранённое значение из записи любого вида
 */
inline const nlohmann::json& entryValue(const CacheEntry& entry) {
    if (const auto* tagged = std::get_if<TaggedEntry>(&entry)) {
        return tagged->value;
    }
    return std::get<PlainEntry>(entry).value;
}

} // namespace depcache::domain
