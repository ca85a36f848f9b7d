#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace skyline {

/// Well-known channel shared by every client and the daemon.
inline constexpr const char* default_channel = "skylinedb-v1";

/// Placeholder database name sent with a Ping when no real database resolves.
inline constexpr const char* health_check_database = "health-check";

/// Retry and back-off knobs for reaching the daemon.
struct retry_policy {
    /// Connection attempts before giving up.
    int max_retries = 3;

    /// Wait after spawning the daemon on the first failure.
    std::chrono::milliseconds startup_settle{500};

    /// Later failures wait attempt × base_delay.
    std::chrono::milliseconds base_delay{200};
};

struct client_config {
    /// Channel name the socket path is derived from.
    std::string channel = default_channel;

    /// Explicit socket path. Empty = resolve from channel.
    std::string socket_path;

    /// Daemon binary started on demand when the channel does not answer.
    std::string daemon_executable;

    /// Directory holding the database files; passed to the daemon as its only argument.
    std::string data_directory;

    /// Database used when a call names none.
    std::optional<std::string> database;

    retry_policy retry;

    /// Pause between CloseDatabase and a file operation, so the OS drops its file locks.
    std::chrono::milliseconds file_lock_settle{100};

    /// Period of the background checkpoint timer.
    std::chrono::milliseconds checkpoint_interval{std::chrono::seconds(30)};

    client_config() = default;

    /// Data directory only; daemon path and socket use their defaults.
    explicit client_config(const std::string& data_dir) : data_directory(data_dir) {}

    client_config(const std::string& data_dir, const std::string& daemon_path)
        : daemon_executable(daemon_path), data_directory(data_dir) {}

    /// Build from SKYLINE_* environment variables, with defaults under $HOME.
    static client_config from_environment();

    /// socket_path if set, otherwise resolve_ipc_socket_path(channel).
    std::string resolved_socket_path() const;

    /// daemon_executable if set, otherwise <data_directory>/daemon/skylined.
    std::string resolved_daemon_executable() const;
};

} // namespace skyline
