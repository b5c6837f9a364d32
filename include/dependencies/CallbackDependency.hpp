#pragma once

#include "dependencies/Dependency.hpp"
#include <functional>
#include <utility>

namespace depcache::dependencies {

/**
 * @brief Зависимость от результата пользовательской функции
 *
 * Значение устаревает, когда функция начинает возвращать другое.
 *
 * @example
 * ```cpp
 * auto dep = std::make_shared<CallbackDependency>([&](ICache&) {
 *     return settingsRepository.version();
 * });
 * cache.set("settings", settings, std::nullopt, dep);
 * ```
 */
class CallbackDependency : public Dependency {
public:
    using Callback = std::function<nlohmann::json(ports::input::ICache&)>;

    explicit CallbackDependency(Callback callback)
        : callback_(std::move(callback)) {}

protected:
    nlohmann::json generateDependencyData(ports::input::ICache& cache) override {
        return callback_(cache);
    }

private:
    Callback callback_;
};

} // namespace depcache::dependencies
