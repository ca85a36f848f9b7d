#include "skyline/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace skyline {

// Single definition of the global log level (declared extern in log.hpp).
std::atomic<log_level> g_log_level{log_level::warn};

bool set_log_level(const std::string& name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "off") set_log_level(log_level::off);
    else if (lowered == "error") set_log_level(log_level::error);
    else if (lowered == "warn" || lowered == "warning") set_log_level(log_level::warn);
    else if (lowered == "info") set_log_level(log_level::info);
    else if (lowered == "debug") set_log_level(log_level::debug);
    else return false;
    return true;
}

void init_log_level_from_environment() {
    const char* level = std::getenv("SKYLINE_LOG_LEVEL");
    if (level && level[0] != '\0' && !set_log_level(std::string(level))) {
        LOG_WARN("log", "Ignoring unknown SKYLINE_LOG_LEVEL '%s'", level);
    }
}

}  // namespace skyline
