#include "skyline/config.hpp"
#include "skyline/ipc.hpp"
#include "skyline/log.hpp"

#include <cstdlib>
#include <filesystem>

namespace skyline {

static std::optional<std::string> env_value(const char* name) {
    const char* value = std::getenv(name);
    if (value && value[0] != '\0') return std::string(value);
    return std::nullopt;
}

client_config client_config::from_environment() {
    init_log_level_from_environment();

    client_config config;
    if (auto dir = env_value("SKYLINE_DATA_DIR")) {
        config.data_directory = *dir;
    } else {
        const char* home = std::getenv("HOME");
        config.data_directory = std::string(home ? home : "/tmp") + "/Documents/SkylineDB";
    }
    if (auto channel = env_value("SKYLINE_CHANNEL")) config.channel = *channel;
    if (auto socket = env_value("SKYLINE_SOCKET")) config.socket_path = *socket;
    if (auto daemon = env_value("SKYLINE_DAEMON")) config.daemon_executable = *daemon;
    if (auto db = env_value("SKYLINE_DATABASE")) config.database = *db;

    LOG_DEBUG("config", "data_directory=%s channel=%s",
              config.data_directory.c_str(), config.channel.c_str());
    return config;
}

std::string client_config::resolved_socket_path() const {
    if (!socket_path.empty()) return socket_path;
    return resolve_ipc_socket_path(channel);
}

std::string client_config::resolved_daemon_executable() const {
    if (!daemon_executable.empty()) return daemon_executable;
    return (std::filesystem::path(data_directory) / "daemon" / "skylined").string();
}

} // namespace skyline
