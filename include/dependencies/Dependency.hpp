#pragma once

#include "dependencies/IDependency.hpp"
#include <nlohmann/json.hpp>

namespace depcache::dependencies {

/**
 * @brief Базовая зависимость со снимком в виде JSON
 *
 * Берёт на себя учёт состояния: хранит снимок, флаг вычисления
 * и сравнение. Наследнику достаточно реализовать
 * generateDependencyData() - как получить текущее состояние.
 */
class Dependency : public IDependency {
public:
    void evaluateDependency(ports::input::ICache& cache) override;

    bool isEvaluated() const override;

    /**
     * @brief Пересчитать состояние и сравнить со снимком
     *
     * Невычисленная зависимость всегда считается изменившейся.
     */
    bool isChanged(ports::input::ICache& cache) override;

    /**
     * @brief Снимок, снятый в evaluateDependency()
     */
    const nlohmann::json& getSnapshot() const;

protected:
    /**
     * @brief Получить текущее состояние источника
     */
    virtual nlohmann::json generateDependencyData(ports::input::ICache& cache) = 0;

private:
    nlohmann::json snapshot_;
    bool evaluated_ = false;
};

} // namespace depcache::dependencies
