#include "skyline/daemon_client.hpp"
#include "skyline/error.hpp"
#include "skyline/log.hpp"

#include <filesystem>
#include <thread>

namespace fs = std::filesystem;

namespace skyline {

daemon_client::daemon_client(client_config config) : config_(std::move(config)) {}

ipc_stream daemon_client::open_stream(bool auto_start) const {
    const std::string socket_path = config_.resolved_socket_path();
    if (!auto_start) {
        return ipc_stream::connect(socket_path);
    }
    return connect_with_retry(socket_path,
                              config_.resolved_daemon_executable(),
                              config_.data_directory,
                              config_.retry);
}

response daemon_client::send(const request& req) const {
    auto stream = open_stream(true);
    return execute_request(stream, req);
}

std::string daemon_client::resolve_database(const std::optional<std::string>& database) const {
    if (database && !database->empty()) return *database;
    if (config_.database && !config_.database->empty()) return *config_.database;

    std::vector<std::string> candidates;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(config_.data_directory, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".db") {
            candidates.push_back(entry.path().filename().string());
        }
    }
    if (candidates.size() == 1) {
        return candidates.front();
    }
    throw config_error("no database specified and " + std::to_string(candidates.size()) +
                       " candidate .db files in " + config_.data_directory);
}

batch_result daemon_client::exec_batch(statement_list statements,
                                       const std::optional<std::string>& database) const {
    batch_result result;
    if (statements.empty()) return result;

    exec_batch_request batch;
    batch.database = resolve_database(database);
    batch.statements = std::move(statements);
    const std::string db_name = batch.database;
    const request req{std::move(batch)};

    response resp = send(req);
    result.outcome = classify_response(req, resp);
    result.rev = resp.rev;

    switch (result.outcome) {
        case response_outcome::success:
            result.rows_affected = resp.rows_affected.value_or(0);
            LOG_DEBUG("client", "ExecBatch on %s: %lld rows", db_name.c_str(),
                      static_cast<long long>(result.rows_affected));
            break;
        case response_outcome::missing_metadata_table:
            result.message = resp.error_text();
            LOG_DEBUG("client", "ExecBatch on %s: metadata table missing (%s)",
                      db_name.c_str(), result.message.c_str());
            break;
        case response_outcome::duplicate_column:
            result.message = resp.error_text();
            LOG_INFO("client", "ExecBatch on %s: column already exists (%s)",
                     db_name.c_str(), result.message.c_str());
            break;
        case response_outcome::hard_error: {
            const std::string text = resp.error_text();
            LOG_ERROR("client", "ExecBatch on %s failed: %s", db_name.c_str(), text.c_str());
            throw sql_error(text, resp.code.value_or(""));
        }
    }
    return result;
}

batch_result daemon_client::add_column_if_missing(const std::string& table,
                                                  const std::string& column,
                                                  const std::string& type,
                                                  const std::optional<std::string>& default_sql,
                                                  const std::optional<std::string>& database) const {
    std::string sql = "ALTER TABLE " + quote_identifier(table) + " ADD COLUMN " +
                      quote_identifier(column) + " " + type;
    if (default_sql) sql += " DEFAULT " + *default_sql;
    return exec_batch({statement(std::move(sql))}, database);
}

maintenance_result daemon_client::maintenance(const request& req, const char* what) const {
    response resp = send(req);
    if (!resp.is_ok()) {
        const std::string text = resp.error_text();
        LOG_ERROR("client", "%s failed: %s", what, text.c_str());
        throw sql_error(std::string(what) + " failed: " + text, resp.code.value_or(""));
    }
    maintenance_result result;
    result.checkpointed = resp.checkpointed.value_or(false);
    result.closed = resp.closed.value_or(false);
    result.reopened = resp.reopened.value_or(false);
    return result;
}

maintenance_result daemon_client::prepare_for_maintenance(const std::optional<std::string>& database) const {
    return maintenance(prepare_for_maintenance_request{resolve_database(database)}, "PrepareForMaintenance");
}

maintenance_result daemon_client::close_database(const std::optional<std::string>& database) const {
    return maintenance(close_database_request{resolve_database(database)}, "CloseDatabase");
}

maintenance_result daemon_client::reopen_database(const std::optional<std::string>& database) const {
    return maintenance(reopen_database_request{resolve_database(database)}, "ReopenDatabase");
}

void daemon_client::with_safe_file_operation(const std::string& database,
                                             const std::function<void()>& operation,
                                             const std::optional<std::string>& new_name) const {
    prepare_for_maintenance(database);
    close_database(database);

    std::this_thread::sleep_for(config_.file_lock_settle);

    try {
        operation();
    } catch (const std::exception& e) {
        LOG_ERROR("client", "File operation on %s failed, database left closed: %s",
                  database.c_str(), e.what());
        throw;
    }

    reopen_database(new_name.value_or(database));
}

bool daemon_client::ping(const std::optional<std::string>& database) const {
    ping_request req;
    try {
        req.database = resolve_database(database);
    } catch (const config_error&) {
        req.database = health_check_database;
    }

    try {
        auto stream = open_stream(false);
        return execute_request(stream, req).is_ok();
    } catch (const skyline_error& e) {
        LOG_DEBUG("client", "Ping failed: %s", e.what());
        return false;
    }
}

void daemon_client::disconnect() const {
    try {
        auto stream = open_stream(false);
        execute_request(stream, disconnect_request{});
    } catch (const transport_error& e) {
        LOG_DEBUG("client", "Disconnect: no daemon (%s)", e.what());
    }
}

bool daemon_client::shutdown_daemon() const {
    ipc_stream stream;
    try {
        stream = open_stream(false);
    } catch (const transport_error& e) {
        LOG_DEBUG("client", "Shutdown: no daemon (%s)", e.what());
        return false;
    }
    response resp = execute_request(stream, shutdown_request{});
    if (!resp.is_ok()) {
        throw sql_error("Shutdown failed: " + resp.error_text(), resp.code.value_or(""));
    }
    LOG_INFO("client", "Daemon on %s shut down", config_.resolved_socket_path().c_str());
    return true;
}

} // namespace skyline
