#include "dependencies/Dependency.hpp"

namespace depcache::dependencies {

void Dependency::evaluateDependency(ports::input::ICache& cache) {
    snapshot_ = generateDependencyData(cache);
    evaluated_ = true;
}

bool Dependency::isEvaluated() const {
    return evaluated_;
}

bool Dependency::isChanged(ports::input::ICache& cache) {
    if (!evaluated_) {
        return true;
    }
    return generateDependencyData(cache) != snapshot_;
}

const nlohmann::json& Dependency::getSnapshot() const {
    return snapshot_;
}

} // namespace depcache::dependencies
