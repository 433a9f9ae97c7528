#pragma once

#include <string>
#include <vector>

namespace disk_analyzer {
namespace common {

class PathManager {
public:
    static PathManager& instance();
    
    std::string getHomeDir() const;
    std::string getConfigDir() const;
    std::string getConfigFile() const;
    std::string getLogDir() const;
    
    std::vector<std::string> getConfigSearchPaths() const;
    
private:
    PathManager() = default;
    
    std::string getXdgConfigHome() const;
    std::string getXdgStateHome() const;
};

}}
