// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace answerlens::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    /** @brief $XDG_CONFIG_HOME/answerlens (not created). */
    static std::filesystem::path GetAppConfigDir();
};

} // namespace answerlens::infrastructure
