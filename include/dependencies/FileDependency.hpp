#pragma once

#include "dependencies/Dependency.hpp"
#include <string>

namespace depcache::dependencies {

/**
 * @brief Зависимость от содержимого файла
 *
 * Снимок: {"exists": bool, "size": N, "md5": "..."}.
 * Отсутствующий файл - тоже состояние: его появление
 * или исчезновение инвалидирует значение.
 */
class FileDependency : public Dependency {
public:
    explicit FileDependency(std::string fileName);

    const std::string& getFileName() const { return fileName_; }

protected:
    nlohmann::json generateDependencyData(ports::input::ICache& cache) override;

private:
    std::string fileName_;
};

} // namespace depcache::dependencies
