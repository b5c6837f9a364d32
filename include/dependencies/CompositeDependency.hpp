#pragma once

#include "dependencies/IDependency.hpp"
#include <memory>
#include <vector>

namespace depcache::dependencies {

/**
 * @brief Зависимость, составленная из нескольких других
 *
 * Вычисляет невычисленных детей и считается вычисленной, когда
 * вычислены все дети. Правило "изменилась ли" задают наследники.
 */
class CompositeDependency : public IDependency {
public:
    using Children = std::vector<std::shared_ptr<IDependency>>;

    explicit CompositeDependency(Children dependencies)
        : dependencies_(std::move(dependencies)) {}

    void evaluateDependency(ports::input::ICache& cache) override {
        for (const auto& dependency : dependencies_) {
            if (!dependency->isEvaluated()) {
                dependency->evaluateDependency(cache);
            }
        }
    }

    bool isEvaluated() const override {
        for (const auto& dependency : dependencies_) {
            if (!dependency->isEvaluated()) {
                return false;
            }
        }
        return true;
    }

    const Children& getDependencies() const { return dependencies_; }

protected:
    Children dependencies_;
};

/**
 * @brief Изменилась, только если изменились ВСЕ вложенные зависимости
 *
 * Пустой список никогда не считается изменившимся.
 */
class AllDependencies : public CompositeDependency {
public:
    using CompositeDependency::CompositeDependency;

    bool isChanged(ports::input::ICache& cache) override {
        if (dependencies_.empty()) {
            return false;
        }
        for (const auto& dependency : dependencies_) {
            if (!dependency->isChanged(cache)) {
                return false;
            }
        }
        return true;
    }
};

/**
 * @brief Изменилась, если изменилась ХОТЯ БЫ ОДНА вложенная зависимость
 */
class AnyDependency : public CompositeDependency {
public:
    using CompositeDependency::CompositeDependency;

    bool isChanged(ports::input::ICache& cache) override {
        for (const auto& dependency : dependencies_) {
            if (dependency->isChanged(cache)) {
                return true;
            }
        }
        return false;
    }
};

} // namespace depcache::dependencies
