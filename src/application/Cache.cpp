#include "application/Cache.hpp"
#include "dependencies/IDependency.hpp"
#include "domain/exceptions/InvalidConfigurationException.hpp"
#include "domain/exceptions/SetCacheException.hpp"

#include <iostream>
#include <stdexcept>

namespace depcache::application {

Cache::Cache(std::shared_ptr<ports::output::ICachePort> handler)
    : handler_(std::move(handler))
{
    if (!handler_) {
        throw std::invalid_argument("Cache handler must not be null");
    }
}

Cache::Cache(
    std::shared_ptr<ports::output::ICachePort> handler,
    const settings::ICacheSettings& settings
) : Cache(std::move(handler))
{
    setKeyPrefix(settings.getKeyPrefix());
    setDefaultTtl(settings.getDefaultTtl());
    if (settings.isKeyNormalizationEnabled()) {
        enableKeyNormalization();
    } else {
        disableKeyNormalization();
    }

    std::cout << "[Cache] Created with:"
              << " prefix=" << (keyPrefix_.empty() ? "<none>" : keyPrefix_)
              << " defaultTtl=" << (defaultTtl_ ? std::to_string(defaultTtl_->count()) + "s" : "inf")
              << " normalization=" << (keyNormalization_ ? "on" : "off")
              << std::endl;
}

// ============================================
// ЧТЕНИЕ
// ============================================

nlohmann::json Cache::get(const nlohmann::json& key, const nlohmann::json& defaultValue) {
    auto entry = handler_->get(buildKey(key));
    return getValueOrDefaultIfDependencyChanged(entry, defaultValue);
}

bool Cache::has(const nlohmann::json& key) {
    // Зависимость намеренно не проверяется
    return handler_->exists(buildKey(key));
}

Cache::KeyValueMap Cache::getMultiple(
    const std::vector<nlohmann::json>& keys,
    const nlohmann::json& defaultValue) {
    KeyMap keyMap = buildKeyMap(keys);
    auto entries = handler_->getMultiple(normalizedKeys(keyMap));

    KeyValueMap results;
    for (const auto& [builtKey, entry] : entries) {
        auto it = keyMap.find(builtKey);
        nlohmann::json restoredKey = it != keyMap.end() ? it->second : nlohmann::json(builtKey);
        results[restoredKey] = getValueOrDefaultIfDependencyChanged(entry, defaultValue);
    }

    return results;
}

// ============================================
// ЗАПИСЬ
// ============================================

bool Cache::set(
    const nlohmann::json& key,
    const nlohmann::json& value,
    domain::Ttl ttl,
    DependencyPtr dependency) {
    std::string builtKey = buildKey(key);
    auto entry = addEvaluatedDependencyToValue(value, dependency);

    return handler_->set(builtKey, entry, normalizeTtl(ttl));
}

bool Cache::setMultiple(const KeyValueMap& values, domain::Ttl ttl, DependencyPtr dependency) {
    auto entries = prepareDataForSetOrAddMultiple(values, dependency);
    return handler_->setMultiple(entries, normalizeTtl(ttl));
}

bool Cache::add(
    const nlohmann::json& key,
    const nlohmann::json& value,
    domain::Ttl ttl,
    DependencyPtr dependency) {
    std::string builtKey = buildKey(key);

    if (handler_->exists(builtKey)) {
        return false;
    }

    auto entry = addEvaluatedDependencyToValue(value, dependency);
    return handler_->set(builtKey, entry, normalizeTtl(ttl));
}

bool Cache::addMultiple(const KeyValueMap& values, domain::Ttl ttl, DependencyPtr dependency) {
    auto entries = prepareDataForSetOrAddMultiple(values, dependency);
    excludeExistingValues(entries);

    return handler_->setMultiple(entries, normalizeTtl(ttl));
}

// ============================================
// УДАЛЕНИЕ
// ============================================

bool Cache::remove(const nlohmann::json& key) {
    return handler_->remove(buildKey(key));
}

bool Cache::removeMultiple(const std::vector<nlohmann::json>& keys) {
    return handler_->removeMultiple(normalizedKeys(buildKeyMap(keys)));
}

bool Cache::clear() {
    return handler_->clear();
}

nlohmann::json Cache::getOrSet(
    const nlohmann::json& key,
    const ValueFactory& factory,
    domain::Ttl ttl,
    DependencyPtr dependency) {
    nlohmann::json value = get(key);
    if (!value.is_null()) {
        return value;
    }

    value = factory(*this);

    if (!set(key, value, ttl, dependency)) {
        throw domain::exceptions::SetCacheException(key, value, *this);
    }

    return value;
}

// ============================================
// НАСТРОЙКИ
// ============================================

void Cache::enableKeyNormalization() {
    keyNormalization_ = true;
}

void Cache::disableKeyNormalization() {
    keyNormalization_ = false;
}

bool Cache::isKeyNormalizationEnabled() const {
    return keyNormalization_;
}

void Cache::setKeyPrefix(const std::string& keyPrefix) {
    if (!keyPrefix.empty() && !domain::CacheKeyNormalizer::isAlphanumeric(keyPrefix)) {
        throw domain::exceptions::InvalidConfigurationException(
            "Cache key prefix should be alphanumeric, got: " + keyPrefix);
    }
    keyPrefix_ = keyPrefix;
}

const std::string& Cache::getKeyPrefix() const {
    return keyPrefix_;
}

void Cache::setDefaultTtl(domain::Ttl defaultTtl) {
    defaultTtl_ = defaultTtl;
}

domain::Ttl Cache::getDefaultTtl() const {
    return defaultTtl_;
}

std::string Cache::buildKey(const nlohmann::json& key) const {
    if (!keyNormalization_) {
        return keyPrefix_ + domain::CacheKeyNormalizer::toKeyString(key);
    }
    return keyPrefix_ + normalizer_.normalize(key);
}

// ============================================
// ВНУТРЕННЕЕ
// ============================================

domain::Ttl Cache::normalizeTtl(domain::Ttl ttl) const {
    return ttl ? ttl : defaultTtl_;
}

domain::CacheEntry Cache::addEvaluatedDependencyToValue(
    const nlohmann::json& value,
    const DependencyPtr& dependency) {
    if (!dependency) {
        return domain::PlainEntry{value};
    }

    if (!dependency->isEvaluated()) {
        dependency->evaluateDependency(*this);
    }

    return domain::TaggedEntry{value, dependency};
}

nlohmann::json Cache::getValueOrDefaultIfDependencyChanged(
    const std::optional<domain::CacheEntry>& entry,
    const nlohmann::json& defaultValue) {
    if (!entry) {
        return defaultValue;
    }

    if (const auto* tagged = std::get_if<domain::TaggedEntry>(&*entry)) {
        if (tagged->dependency && tagged->dependency->isChanged(*this)) {
            return defaultValue;
        }
        return tagged->value;
    }

    return std::get<domain::PlainEntry>(*entry).value;
}

ports::output::ICachePort::EntryMap Cache::prepareDataForSetOrAddMultiple(
    const KeyValueMap& values,
    const DependencyPtr& dependency) {
    ports::output::ICachePort::EntryMap entries;
    for (const auto& [key, value] : values) {
        std::string builtKey = buildKey(key);
        entries.insert_or_assign(builtKey, addEvaluatedDependencyToValue(value, dependency));
    }
    return entries;
}

void Cache::excludeExistingValues(ports::output::ICachePort::EntryMap& entries) {
    std::vector<std::string> keys;
    keys.reserve(entries.size());
    for (const auto& [key, entry] : entries) {
        keys.push_back(key);
    }

    auto existing = handler_->getMultiple(keys);
    for (const auto& [key, entry] : existing) {
        // Сохранённый null - "нет значения", такой ключ перезаписывается
        if (entry && !domain::entryValue(*entry).is_null()) {
            entries.erase(key);
        }
    }
}

Cache::KeyMap Cache::buildKeyMap(const std::vector<nlohmann::json>& keys) const {
    KeyMap keyMap;
    for (const auto& key : keys) {
        keyMap[buildKey(key)] = key;
    }
    return keyMap;
}

std::vector<std::string> Cache::normalizedKeys(const KeyMap& keyMap) {
    std::vector<std::string> keys;
    keys.reserve(keyMap.size());
    for (const auto& [builtKey, key] : keyMap) {
        keys.push_back(builtKey);
    }
    return keys;
}

} // namespace depcache::application
