#pragma once

#include <string>
#include <vector>

namespace essay_anonymizer {
namespace common {

class PathManager {
public:
    static PathManager& instance();

    // Ordered candidates: $ESSAY_ANONYMIZER_CONFIG, user config, system config.
    std::vector<std::string> getConfigSearchPaths() const;

    std::string getUserConfigDir() const;
    std::string getUserConfigFile() const;
    std::string getSystemConfigFile() const;

private:
    PathManager() = default;

    std::string getXdgConfigHome() const;
};

}}
