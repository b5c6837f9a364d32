#pragma once

#include <chrono>
#include <optional>

namespace depcache::domain {

/**
 * @brief Время жизни записи
 *
 * std::nullopt - без ограничения (или "взять TTL по умолчанию" на входе Cache).
 * Значение <= 0 означает удаление записи на стороне хранилища.
 */
using Ttl = std::optional<std::chrono::seconds>;

} // namespace depcache::domain
