// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace chronolens::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetStateDir();
    static std::filesystem::path GetDefaultConfigPath();
};

} // namespace chronolens::infrastructure
