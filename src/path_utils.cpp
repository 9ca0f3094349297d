#include "path_utils.h"
#include <cstdlib>
#include <string>

namespace rtvoice {

std::string expand_path(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;

    const char* home = std::getenv("HOME");
    if (!home) return path;

    if (path.size() == 1) {
        return std::string(home);
    }
    if (path[1] == '/' || path[1] == '\\') {
        return std::string(home) + path.substr(1);
    }
    return path;
}

std::string resolve_config_path(const std::string& explicit_path) {
    if (!explicit_path.empty()) {
        return expand_path(explicit_path);
    }
    const char* env = std::getenv("RTVOICE_CONFIG");
    if (env && *env) {
        return expand_path(env);
    }
    return "config/config.json";
}

} // namespace rtvoice
