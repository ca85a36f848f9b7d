#pragma once

#include "config.hpp"
#include "ipc.hpp"
#include "protocol.hpp"
#include <string>

namespace skyline {

/// How a daemon response should be treated by the caller.
enum class response_outcome {
    success,
    /// "no such table" naming a *_Metadata table. Soft and retryable.
    missing_metadata_table,
    /// "duplicate column name" from a pure ADD COLUMN batch. Same as success.
    duplicate_column,
    /// Anything else. Surfaced to the caller.
    hard_error
};

const char* outcome_name(response_outcome outcome);

/// Start the daemon fully detached from this process (own session, no
/// zombie, no retained handle), told to listen on `socket_path` through
/// SKYLINE_SOCKET. Throws transport_error if the executable is missing or
/// exec fails.
void spawn_daemon(const std::string& executable,
                  const std::string& data_directory,
                  const std::string& socket_path);

/// Open a connection to the daemon, auto-starting it once on the first
/// failure. Throws transport_error when the retry budget runs out.
ipc_stream connect_with_retry(const std::string& socket_path,
                              const std::string& daemon_executable,
                              const std::string& data_directory,
                              const retry_policy& policy = {});

/// Send one request and read exactly one response on an open stream.
response execute_request(ipc_stream& stream, const request& req);

/// Map a response to success, a soft outcome or a hard error.
response_outcome classify_response(const request& req, const response& resp);

/// True for "ALTER TABLE <t> ADD [COLUMN] ..." statements.
bool is_add_column_statement(const std::string& sql);

} // namespace skyline
