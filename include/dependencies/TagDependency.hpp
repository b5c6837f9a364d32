#pragma once

#include "dependencies/Dependency.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace depcache::dependencies {

/**
 * @brief Зависимость от версий тегов
 *
 * Для каждого тега в том же кэше хранится счётчик версии.
 * Снимок - версии всех тегов на момент записи. Вызов
 * TagDependency::invalidate(cache, {"products"}) увеличивает
 * счётчики, и все значения, записанные с этими тегами, устаревают.
 *
 * @example
 * ```cpp
 * auto dep = std::make_shared<TagDependency>(std::vector<std::string>{"products"});
 * cache.set("top-products", top, std::nullopt, dep);
 * // ...товар изменён...
 * TagDependency::invalidate(cache, {"products"});
 * ```
 *
 * @note Счётчики подчиняются TTL по умолчанию кэша и политике вытеснения
 *       хранилища. Пропавший счётчик считается изменением.
 */
class TagDependency : public Dependency {
public:
    explicit TagDependency(std::vector<std::string> tags);

    explicit TagDependency(const std::string& tag);

    /**
     * @brief Сравнить текущие версии тегов со снимком
     *
     * В отличие от evaluateDependency() отсутствующие счётчики
     * не создаются.
     */
    bool isChanged(ports::input::ICache& cache) override;

    /**
     * @brief Инвалидировать все значения, зависящие от тегов
     *
     * @return Результат записи новых версий в кэш
     */
    static bool invalidate(ports::input::ICache& cache, const std::vector<std::string>& tags);

    const std::vector<std::string>& getTags() const { return tags_; }

protected:
    /**
     * @brief Текущие версии тегов; недостающие счётчики создаются
     */
    nlohmann::json generateDependencyData(ports::input::ICache& cache) override;

private:
    static nlohmann::json buildCacheKey(const std::string& tag);
    static int64_t initialVersion();

    nlohmann::json readVersions(ports::input::ICache& cache) const;

    std::vector<std::string> tags_;
};

} // namespace depcache::dependencies
