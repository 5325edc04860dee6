// PathUtils Header
#pragma once
#include <filesystem>
#include <string>

namespace sunflower::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    // <data home>/sunflower, created on demand.
    static std::filesystem::path GetAppDataDir();

    // <config home>/sunflower/config.json; may not exist.
    static std::filesystem::path GetDefaultConfigFile();

    // Keeps child ids usable as file names.
    static std::string SanitizeFileStem(const std::string& id);
};

} // namespace sunflower::infrastructure
