#pragma once

#include "db.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace skyline {

class daemon_client;

/// A WAL smaller than its 32-byte header holds no frames.
constexpr std::uintmax_t min_wal_size = 32;

/// RESTART-checkpoint an open handle. Returns false (and does nothing)
/// unless the database is in WAL mode.
bool checkpoint_database(database& db);

/// Checkpoint a database file through a short-lived maintenance handle.
/// Returns false when the file or a non-trivial -wal companion is missing.
bool checkpoint_database_file(const std::string& path);

/// True when path-wal exists and is at least min_wal_size bytes.
bool has_pending_wal(const std::string& path);

/// *.db files directly inside `directory`, sorted by name.
std::vector<std::string> list_database_files(const std::string& directory);

/// Keeps WAL files small: periodically, and once more at shutdown, folds every
/// database's WAL back into its main file. With a daemon_client the daemon
/// checkpoints its own handle; otherwise a local handle is used.
class checkpoint_manager {
public:
    explicit checkpoint_manager(std::string data_directory,
                                std::chrono::milliseconds interval = std::chrono::seconds(30),
                                const daemon_client* client = nullptr);

    /// Use the client's data directory and checkpoint interval.
    explicit checkpoint_manager(const daemon_client& client);

    ~checkpoint_manager();

    checkpoint_manager(const checkpoint_manager&) = delete;
    checkpoint_manager& operator=(const checkpoint_manager&) = delete;

    /// Checkpoint every database found right now. Per-file failures are
    /// logged, never raised. Returns the number of files checkpointed.
    size_t checkpoint_all();

    /// Start the periodic timer.
    void start();

    /// Stop the timer and wait for an in-flight pass.
    void stop();

    /// Stop the timer and run one final pass.
    size_t on_exit();

    bool is_running() const { return running_.load(); }

    /// Completed timer passes.
    uint64_t passes() const { return passes_.load(); }

    /// Files that failed to checkpoint since construction.
    uint64_t failures() const { return failures_.load(); }

private:
    std::string data_directory_;
    std::chrono::milliseconds interval_;
    const daemon_client* client_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> passes_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace skyline
