#include "disk_analyzer/common/paths.hpp"
#include "disk_analyzer/common/constants.hpp"
#include "disk_analyzer/common/logger.hpp"
#include <unistd.h>
#include <pwd.h>
#include <cstdlib>

namespace disk_analyzer {
namespace common {

PathManager& PathManager::instance() {
    static PathManager instance;
    return instance;
}

std::string PathManager::getHomeDir() const {
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return home;
    }
    
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return pw->pw_dir;
    }
    
    Logger::instance().debug("[Paths] Home directory unavailable | uid={}", getuid());
    return "";
}

std::vector<std::string> PathManager::getConfigSearchPaths() const {
    std::vector<std::string> paths;
    
    if (const char* env = std::getenv(constants::system::CONFIG_ENV)) {
        if (env[0] != '\0') {
            paths.push_back(env);
        }
    }
    
    std::string config_file = getConfigFile();
    if (!config_file.empty()) {
        paths.push_back(config_file);
    }
    
    return paths;
}

std::string PathManager::getConfigDir() const {
    std::string base = getXdgConfigHome();
    if (base.empty()) {
        return "";
    }
    return base + "/" + constants::system::CONFIG_DIR_NAME;
}

std::string PathManager::getConfigFile() const {
    std::string dir = getConfigDir();
    if (dir.empty()) {
        return "";
    }
    return dir + "/" + constants::system::CONFIG_FILE_NAME;
}

std::string PathManager::getLogDir() const {
    std::string base = getXdgStateHome();
    if (base.empty()) {
        return "";
    }
    return base + "/" + constants::system::CONFIG_DIR_NAME;
}

std::string PathManager::getXdgConfigHome() const {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
        if (xdg[0] == '/') {
            return xdg;
        }
    }
    std::string home = getHomeDir();
    return home.empty() ? "" : home + "/.config";
}

std::string PathManager::getXdgStateHome() const {
    if (const char* xdg = std::getenv("XDG_STATE_HOME")) {
        if (xdg[0] == '/') {
            return xdg;
        }
    }
    std::string home = getHomeDir();
    return home.empty() ? "" : home + "/.local/state";
}

}}
