#include "essay_anonymizer/common/paths.hpp"
#include "essay_anonymizer/common/constants.hpp"
#include <cstdlib>
#include <cstring>

namespace essay_anonymizer {
namespace common {

PathManager& PathManager::instance() {
    static PathManager instance;
    return instance;
}

std::vector<std::string> PathManager::getConfigSearchPaths() const {
    std::vector<std::string> paths;

    const char* env = std::getenv(constants::system::CONFIG_ENV);
    if (env && strlen(env) > 0) {
        paths.push_back(env);
    }

    std::string user_file = getUserConfigFile();
    if (!user_file.empty()) {
        paths.push_back(user_file);
    }

    paths.push_back(getSystemConfigFile());

    return paths;
}

std::string PathManager::getUserConfigDir() const {
    std::string base = getXdgConfigHome();
    if (base.empty()) {
        return "";
    }
    return base + "/" + constants::system::CONFIG_DIR_NAME;
}

std::string PathManager::getUserConfigFile() const {
    std::string dir = getUserConfigDir();
    if (dir.empty()) {
        return "";
    }
    return dir + "/" + constants::system::CONFIG_FILE_NAME;
}

std::string PathManager::getSystemConfigFile() const {
    return constants::system::SYSTEM_CONFIG_FILE;
}

std::string PathManager::getXdgConfigHome() const {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && strlen(xdg) > 0) {
        return xdg;
    }
    const char* home = std::getenv("HOME");
    return home ? std::string(home) + "/.config" : "";
}

}}
