// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace longscribe::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetTranscriptsDir();
    static std::filesystem::path DefaultSettingsPath();
};

} // namespace longscribe::infrastructure
