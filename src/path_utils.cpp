#include "path_utils.h"
#include <cstdlib>
#include <fstream>
#include <string>
#include <unistd.h>

namespace voxlink {

std::string expand_path(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;

    const char* home = std::getenv("HOME");
    if (!home) return path;
    return std::string(home) + path.substr(1);
}

std::string find_in_path(const std::string& name) {
    if (name.empty()) return "";
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0 ? name : "";
    }

    const char* env_path = std::getenv("PATH");
    if (!env_path) return "";

    std::string dirs(env_path);
    size_t start = 0;
    while (start <= dirs.size()) {
        size_t end = dirs.find(':', start);
        if (end == std::string::npos) end = dirs.size();
        std::string dir = dirs.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        start = end + 1;
    }
    return "";
}

static bool espeak_data_exists(const std::string& base) {
    std::ifstream f(base + "/phontab");
    return f.good();
}

std::string default_espeak_data_path() {
#if defined(__linux__)
    const char* candidates[] = {
        "/usr/share/espeak-ng-data",
        "/usr/lib/aarch64-linux-gnu/espeak-ng-data",
        "/usr/lib/x86_64-linux-gnu/espeak-ng-data",
    };
    for (const char* p : candidates) {
        if (espeak_data_exists(p)) return p;
    }
    return "";
#elif defined(__APPLE__)
    return "/opt/homebrew/share/espeak-ng-data";
#else
    return "";
#endif
}

} // namespace voxlink
