#pragma once

#include "db.hpp"
#include "ipc.hpp"
#include "protocol.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace skyline {

/// The single writer. Owns one read-write handle per database file in its
/// data directory and executes client requests one at a time.
class daemon_server {
public:
    daemon_server(std::string data_directory, std::string socket_path);
    ~daemon_server();

    daemon_server(const daemon_server&) = delete;
    daemon_server& operator=(const daemon_server&) = delete;

    /// Bind the socket and start serving. Throws transport_error.
    void start();

    /// Stop serving and close (checkpointing) every handle.
    void stop();

    /// Block until a Shutdown request arrives or request_shutdown() is called.
    void wait();

    /// Stop accepting and wake wait(). Safe from any thread.
    void request_shutdown();

    bool shutdown_requested() const;

    /// Execute one request. Requests are serialized.
    response handle(const request& req);

    const std::string& data_directory() const { return data_directory_; }
    const std::string& socket_path() const { return server_.socket_path(); }

    /// Databases with an open handle.
    size_t open_database_count() const;

    /// Databases closed by CloseDatabase and not reopened yet.
    bool is_closed(const std::string& name) const;

    /// Idle connections are dropped after this long.
    void set_idle_timeout(std::chrono::milliseconds timeout) { idle_timeout_ = timeout; }

private:
    std::string data_directory_;
    ipc_server server_;
    std::chrono::milliseconds idle_timeout_{std::chrono::seconds(30)};
    std::atomic<int> active_fd_{-1};

    mutable std::mutex mutex_;  // guards everything below, serializes requests
    std::map<std::string, std::unique_ptr<database>> handles_;
    std::set<std::string> closed_;
    uint64_t rev_ = 0;

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    bool shutdown_requested_ = false;

    void serve(ipc_stream stream);

    response exec_batch(const exec_batch_request& req);
    response prepare_for_maintenance(const prepare_for_maintenance_request& req);
    response close_database(const close_database_request& req);
    response reopen_database(const reopen_database_request& req);

    /// Error response if `name` cannot be used, nullopt otherwise.
    std::optional<response> check_name(const std::string& name, bool allow_closed = false) const;
    std::string database_path(const std::string& name) const;
    database& open_database(const std::string& name, bool create);
};

} // namespace skyline
