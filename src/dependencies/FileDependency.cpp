#include "dependencies/FileDependency.hpp"
#include "utils/HashUtils.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace depcache::dependencies {

FileDependency::FileDependency(std::string fileName)
    : fileName_(std::move(fileName))
{
}

nlohmann::json FileDependency::generateDependencyData(ports::input::ICache&) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(fileName_, ec)) {
        return {{"exists", false}};
    }

    std::ifstream file(fileName_, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open dependency file: " + fileName_);
    }

    std::ostringstream content;
    content << file.rdbuf();
    std::string data = content.str();

    return {
        {"exists", true},
        {"size", data.size()},
        {"md5", utils::HashUtils::md5Hex(data)}
    };
}

} // namespace depcache::dependencies
