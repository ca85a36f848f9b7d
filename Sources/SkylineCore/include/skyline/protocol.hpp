#pragma once

#include "types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace skyline {

// ============================================================================
// Requests
// ============================================================================

/// Transaction mode of a batch. Only atomic batches exist.
enum class tx_mode {
    atomic
};

/// Run a list of statements as one all-or-nothing transaction.
struct exec_batch_request {
    std::string database;
    statement_list statements;
    tx_mode mode = tx_mode::atomic;
};

/// Ask the daemon to flush its WAL into the main file.
struct prepare_for_maintenance_request {
    std::string database;
};

/// Ask the daemon to release its handle on a database file.
struct close_database_request {
    std::string database;
};

/// Ask the daemon to open (or re-open) a database file.
struct reopen_database_request {
    std::string database;
};

struct ping_request {
    std::optional<std::string> database;
};

/// Stop the daemon for every client.
struct shutdown_request {};

/// End this client's session only.
struct disconnect_request {};

using request = std::variant<exec_batch_request,
                             prepare_for_maintenance_request,
                             close_database_request,
                             reopen_database_request,
                             ping_request,
                             shutdown_request,
                             disconnect_request>;

/// Wire name of the request type ("ExecBatch", "Ping", ...).
const char* request_type_name(const request& req);

// ============================================================================
// Responses
// ============================================================================

enum class response_status {
    ok,
    error
};

struct response {
    response_status status = response_status::ok;
    std::optional<uint64_t> rev;
    std::optional<int64_t> rows_affected;
    std::optional<std::string> error;
    std::optional<std::string> message;
    std::optional<std::string> code;
    std::optional<bool> checkpointed;
    std::optional<bool> closed;
    std::optional<bool> reopened;

    bool is_ok() const { return status == response_status::ok; }

    /// The daemon may put its text in either `error` or `message`.
    std::string error_text() const;

    static response ok_response();
    static response error_response(std::string text, std::optional<std::string> code = std::nullopt);
};

// ============================================================================
// JSON encoding (frame bodies)
// ============================================================================

std::string encode_request(const request& req);
request decode_request(const std::string& body);

std::string encode_response(const response& resp);
response decode_response(const std::string& body);

} // namespace skyline
