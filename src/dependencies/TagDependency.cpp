#include "dependencies/TagDependency.hpp"
#include "ports/input/ICache.hpp"

#include <chrono>
#include <iostream>

namespace depcache::dependencies {

TagDependency::TagDependency(std::vector<std::string> tags)
    : tags_(std::move(tags))
{
}

TagDependency::TagDependency(const std::string& tag)
    : tags_{tag}
{
}

bool TagDependency::isChanged(ports::input::ICache& cache) {
    if (!isEvaluated()) {
        return true;
    }
    return readVersions(cache) != getSnapshot();
}

bool TagDependency::invalidate(ports::input::ICache& cache, const std::vector<std::string>& tags) {
    std::vector<nlohmann::json> keys;
    keys.reserve(tags.size());
    for (const auto& tag : tags) {
        keys.push_back(buildCacheKey(tag));
    }

    auto current = cache.getMultiple(keys);
    int64_t floor = initialVersion();

    ports::input::ICache::KeyValueMap bumped;
    for (const auto& key : keys) {
        const auto& version = current[key];
        int64_t next = version.is_number_integer() ? version.get<int64_t>() + 1 : floor;
        bumped[key] = next > floor ? next : floor;
    }

    return cache.setMultiple(bumped);
}

nlohmann::json TagDependency::generateDependencyData(ports::input::ICache& cache) {
    auto versions = readVersions(cache);

    ports::input::ICache::KeyValueMap missing;
    for (const auto& tag : tags_) {
        if (versions[tag].is_null()) {
            int64_t version = initialVersion();
            versions[tag] = version;
            missing[buildCacheKey(tag)] = version;
        }
    }

    // Если счётчики не сохранились, при чтении их не будет,
    // и isChanged() честно сообщит об изменении
    if (!missing.empty() && !cache.setMultiple(missing)) {
        std::cout << "[TagDependency] Failed to store versions for "
                  << missing.size() << " tag(s)" << std::endl;
    }

    return versions;
}

nlohmann::json TagDependency::readVersions(ports::input::ICache& cache) const {
    std::vector<nlohmann::json> keys;
    keys.reserve(tags_.size());
    for (const auto& tag : tags_) {
        keys.push_back(buildCacheKey(tag));
    }

    auto stored = cache.getMultiple(keys);

    nlohmann::json versions = nlohmann::json::object();
    for (const auto& tag : tags_) {
        versions[tag] = stored[buildCacheKey(tag)];
    }
    return versions;
}

nlohmann::json TagDependency::buildCacheKey(const std::string& tag) {
    return {{"dependency", "tag"}, {"tag", tag}};
}

int64_t TagDependency::initialVersion() {
    // Версия от текущего времени: счётчик, пересозданный после
    // вытеснения, не совпадёт со старым снимком
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

} // namespace depcache::dependencies
