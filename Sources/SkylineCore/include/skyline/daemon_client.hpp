#pragma once

#include "config.hpp"
#include "protocol.hpp"
#include "transport.hpp"
#include <functional>
#include <optional>
#include <string>

namespace skyline {

/// Result of an exec_batch call that did not raise.
struct batch_result {
    /// success, missing_metadata_table or duplicate_column. Hard errors throw.
    response_outcome outcome = response_outcome::success;
    int64_t rows_affected = 0;
    std::optional<uint64_t> rev;
    /// Daemon text for soft outcomes.
    std::string message;

    /// True when the batch committed, or was already in effect (duplicate column).
    bool applied() const { return outcome != response_outcome::missing_metadata_table; }
};

/// Acknowledgement flags of a maintenance request.
struct maintenance_result {
    bool checkpointed = false;
    bool closed = false;
    bool reopened = false;
};

/// Synchronous façade over the daemon channel. Every call opens one
/// connection, sends one request and reads one response. All writes to a
/// database go through here.
class daemon_client {
public:
    explicit daemon_client(client_config config);

    const client_config& config() const { return config_; }

    /// Database used when a call names none.
    void set_database(std::string name) { config_.database = std::move(name); }

    /// explicit → configured → the only *.db in the data directory.
    /// Throws config_error when none of them resolves.
    std::string resolve_database(const std::optional<std::string>& database = std::nullopt) const;

    /// Run statements as one atomic transaction in the daemon.
    /// Throws sql_error for genuine SQL failures, transport_error when the
    /// daemon cannot be reached.
    batch_result exec_batch(statement_list statements,
                            const std::optional<std::string>& database = std::nullopt) const;

    /// ALTER TABLE ... ADD COLUMN that tolerates an existing column.
    /// `default_sql` is a SQL literal ("0", "'main'").
    batch_result add_column_if_missing(const std::string& table,
                                       const std::string& column,
                                       const std::string& type,
                                       const std::optional<std::string>& default_sql = std::nullopt,
                                       const std::optional<std::string>& database = std::nullopt) const;

    /// Flush the daemon's WAL for this database into the main file.
    maintenance_result prepare_for_maintenance(const std::optional<std::string>& database = std::nullopt) const;

    /// Make the daemon release its handle on this database.
    maintenance_result close_database(const std::optional<std::string>& database = std::nullopt) const;

    /// Have the daemon open the database (again).
    maintenance_result reopen_database(const std::optional<std::string>& database = std::nullopt) const;

    /// checkpoint → close → settle → operation → reopen (as new_name if given).
    /// A failing step rethrows; after a failed checkpoint, close or operation
    /// the database is deliberately not reopened.
    void with_safe_file_operation(const std::string& database,
                                  const std::function<void()>& operation,
                                  const std::optional<std::string>& new_name = std::nullopt) const;

    /// True if a daemon answers on the channel. Never throws and never starts one.
    bool ping(const std::optional<std::string>& database = std::nullopt) const;

    /// End this client's session. No-op if no daemon is running.
    void disconnect() const;

    /// Stop the daemon for every client. Returns false if none was running.
    bool shutdown_daemon() const;

    /// One raw round trip, auto-starting the daemon.
    response send(const request& req) const;

private:
    client_config config_;

    ipc_stream open_stream(bool auto_start) const;
    maintenance_result maintenance(const request& req, const char* what) const;
};

} // namespace skyline
