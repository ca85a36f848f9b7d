#include "skyline/daemon.hpp"
#include "skyline/checkpoint.hpp"
#include "skyline/error.hpp"
#include "skyline/log.hpp"

#include <sys/socket.h>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace skyline {

daemon_server::daemon_server(std::string data_directory, std::string socket_path)
    : data_directory_(std::move(data_directory))
    , server_(socket_path) {}

daemon_server::~daemon_server() {
    stop();
}

void daemon_server::start() {
    fs::create_directories(data_directory_);
    auto socket_dir = fs::path(server_.socket_path()).parent_path();
    if (!socket_dir.empty()) fs::create_directories(socket_dir);
    server_.start([this](ipc_stream stream) {
        serve(std::move(stream));
    });
    LOG_INFO("daemon", "Serving %s on %s", data_directory_.c_str(), server_.socket_path().c_str());
}

void daemon_server::stop() {
    // Wake a connection blocked in read so the accept thread can be joined.
    int fd = active_fd_.load();
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
    }
    server_.stop();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handles_.clear();
    }
    request_shutdown();
}

void daemon_server::request_shutdown() {
    server_.interrupt();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        shutdown_requested_ = true;
    }
    state_cv_.notify_all();
}

bool daemon_server::shutdown_requested() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return shutdown_requested_;
}

void daemon_server::wait() {
    std::unique_lock<std::mutex> lock(state_mutex_);
    state_cv_.wait(lock, [this] { return shutdown_requested_; });
}

size_t daemon_server::open_database_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.size();
}

bool daemon_server::is_closed(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_.count(name) > 0;
}

// ============================================================================
// Connection loop (runs on the accept thread)
// ============================================================================

void daemon_server::serve(ipc_stream stream) {
    stream.set_receive_timeout(idle_timeout_);
    active_fd_ = stream.fd();
    struct active_reset {
        std::atomic<int>& fd;
        ~active_reset() { fd = -1; }
    } reset{active_fd_};

    try {
        std::string body;
        while (stream.try_receive_frame(body)) {
            request req;
            try {
                req = decode_request(body);
            } catch (const protocol_error& e) {
                LOG_WARN("daemon", "Rejecting malformed request: %s", e.what());
                stream.send_frame(encode_response(response::error_response(e.what(), "PROTOCOL")));
                return;
            }

            stream.send_frame(encode_response(handle(req)));

            if (std::holds_alternative<disconnect_request>(req)) {
                return;
            }
            if (std::holds_alternative<shutdown_request>(req)) {
                LOG_INFO("daemon", "Shutdown requested by client");
                request_shutdown();
                return;
            }
        }
    } catch (const skyline_error& e) {
        LOG_DEBUG("daemon", "Connection ended: %s", e.what());
    }
}

// ============================================================================
// Request dispatch
// ============================================================================

response daemon_server::handle(const request& req) {
    std::lock_guard<std::mutex> lock(mutex_);

    response resp = std::visit([this](auto&& r) -> response {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, exec_batch_request>) {
            return exec_batch(r);
        } else if constexpr (std::is_same_v<T, prepare_for_maintenance_request>) {
            return prepare_for_maintenance(r);
        } else if constexpr (std::is_same_v<T, close_database_request>) {
            return close_database(r);
        } else if constexpr (std::is_same_v<T, reopen_database_request>) {
            return reopen_database(r);
        } else {
            // Ping, Shutdown and Disconnect never touch a database.
            return response::ok_response();
        }
    }, req);

    resp.rev = ++rev_;
    return resp;
}

std::optional<response> daemon_server::check_name(const std::string& name, bool allow_closed) const {
    if (name.empty() || name.find('/') != std::string::npos ||
        name.find('\\') != std::string::npos || name == "." || name == "..") {
        return response::error_response("invalid database name '" + name + "'", "INVALID_NAME");
    }
    if (!allow_closed && closed_.count(name)) {
        LOG_ERROR("daemon", "Request for %s while it is closed for maintenance", name.c_str());
        return response::error_response("database " + name + " is closed for maintenance", "DATABASE_CLOSED");
    }
    return std::nullopt;
}

std::string daemon_server::database_path(const std::string& name) const {
    return (fs::path(data_directory_) / name).string();
}

database& daemon_server::open_database(const std::string& name, bool create) {
    auto it = handles_.find(name);
    if (it != handles_.end()) return *it->second;

    const std::string path = database_path(name);
    if (!create && !fs::exists(path)) {
        throw db_error("no such database: " + name, "SQLITE_CANTOPEN");
    }
    auto db = std::make_unique<database>(path, database::open_mode::read_write);
    LOG_DEBUG("daemon", "Opened %s", path.c_str());
    return *handles_.emplace(name, std::move(db)).first->second;
}

// BEGIN/COMMIT/END/ROLLBACK inside a batch would end the batch transaction early.
static bool is_transaction_control(const std::string& sql) {
    size_t start = 0;
    while (start < sql.size() && (std::isspace(static_cast<unsigned char>(sql[start])) || sql[start] == ';')) {
        ++start;
    }
    size_t end = start;
    while (end < sql.size() && std::isalpha(static_cast<unsigned char>(sql[end]))) ++end;

    std::string keyword = sql.substr(start, end - start);
    std::transform(keyword.begin(), keyword.end(), keyword.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return keyword == "BEGIN" || keyword == "COMMIT" || keyword == "END" || keyword == "ROLLBACK";
}

response daemon_server::exec_batch(const exec_batch_request& req) {
    if (auto bad = check_name(req.database)) return *bad;
    for (const auto& stmt : req.statements) {
        if (is_transaction_control(stmt.sql)) {
            return response::error_response("transaction control is not allowed in a batch: " + stmt.sql,
                                            std::string("SQLITE_MISUSE"));
        }
    }

    try {
        database& db = open_database(req.database, true);
        const int64_t before = db.total_changes();

        transaction tx(db);
        for (const auto& stmt : req.statements) {
            db.execute(stmt.sql, stmt.params);
        }
        tx.commit();

        response resp = response::ok_response();
        resp.rows_affected = db.total_changes() - before;
        return resp;
    } catch (const db_error& e) {
        // The guard has rolled the batch back by now.
        LOG_DEBUG("daemon", "ExecBatch on %s failed: %s", req.database.c_str(), e.what());
        return response::error_response(e.what(), e.code().empty() ? std::nullopt
                                                                    : std::optional<std::string>(e.code()));
    }
}

response daemon_server::prepare_for_maintenance(const prepare_for_maintenance_request& req) {
    if (auto bad = check_name(req.database)) return *bad;
    try {
        database& db = open_database(req.database, false);
        response resp = response::ok_response();
        resp.checkpointed = checkpoint_database(db);
        return resp;
    } catch (const db_error& e) {
        LOG_ERROR("daemon", "Checkpoint of %s failed: %s", req.database.c_str(), e.what());
        return response::error_response(e.what(), e.code());
    }
}

response daemon_server::close_database(const close_database_request& req) {
    if (auto bad = check_name(req.database, true)) return *bad;

    // Dropping the handle checkpoints and closes the file.
    handles_.erase(req.database);
    closed_.insert(req.database);
    LOG_INFO("daemon", "Closed %s", req.database.c_str());

    response resp = response::ok_response();
    resp.closed = true;
    return resp;
}

response daemon_server::reopen_database(const reopen_database_request& req) {
    if (auto bad = check_name(req.database, true)) return *bad;

    closed_.erase(req.database);
    try {
        open_database(req.database, false);
    } catch (const db_error& e) {
        LOG_ERROR("daemon", "Reopen of %s failed: %s", req.database.c_str(), e.what());
        return response::error_response(e.what(), e.code());
    }
    LOG_INFO("daemon", "Reopened %s", req.database.c_str());

    response resp = response::ok_response();
    resp.reopened = true;
    return resp;
}

} // namespace skyline
