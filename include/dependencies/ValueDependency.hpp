#pragma once

#include "dependencies/Dependency.hpp"
#include <utility>

namespace depcache::dependencies {

/**
 * @brief Зависимость от значения, которым управляет владелец
 *
 * Владелец меняет значение через setValue(); записи, сохранённые
 * со старым значением, становятся недействительными.
 */
class ValueDependency : public Dependency {
public:
    explicit ValueDependency(nlohmann::json value = nullptr)
        : value_(std::move(value)) {}

    void setValue(nlohmann::json value) { value_ = std::move(value); }

    const nlohmann::json& getValue() const { return value_; }

protected:
    nlohmann::json generateDependencyData(ports::input::ICache&) override {
        return value_;
    }

private:
    nlohmann::json value_;
};

} // namespace depcache::dependencies
