#include "skyline/db.hpp"
#include "skyline/log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <thread>

namespace skyline {

database::database(const std::string& path, open_mode mode) : path_(path), mode_(mode) {
    int flags = SQLITE_OPEN_FULLMUTEX;  // Always use serialized threading mode
    if (mode == open_mode::read_write) {
        flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    } else {
        // Readers and maintenance never create files. Readers are made
        // query-only below instead of SQLITE_OPEN_READONLY so they can
        // still map the WAL index of a live database.
        flags |= SQLITE_OPEN_READWRITE;
    }

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        throw db_error("Failed to open database " + path + ": " + error);
    }

    // Set busy timeout to handle lock contention (5 seconds)
    sqlite3_busy_timeout(db_, 5000);

    switch (mode) {
        case open_mode::read_write:
            execute("PRAGMA foreign_keys = ON");
            execute("PRAGMA journal_mode = WAL");
            break;
        case open_mode::read_only:
            execute("PRAGMA query_only = 1");
            break;
        case open_mode::maintenance:
            break;
    }
}

database::~database() {
    close();
}

void database::close() {
    if (db_) {
        if (mode_ == open_mode::read_write) {
            sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_TRUNCATE, nullptr, nullptr);
        }
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

database::database(database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)), mode_(other.mode_) {
    other.db_ = nullptr;
}

database& database::operator=(database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        path_ = std::move(other.path_);
        mode_ = other.mode_;
        other.db_ = nullptr;
    }
    return *this;
}

sqlite3_stmt* database::prepare(const std::string& sql, const std::vector<column_value_t>& params) const {
    sqlite3_stmt* stmt = nullptr;
    const char* tail = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, &tail);
    if (rc != SQLITE_OK) {
        LOG_DEBUG("db", "%s in %s", sqlite3_errmsg(db_), sql.c_str());
        throw db_error(sqlite3_errmsg(db_), error_code_name(rc));
    }
    // Exactly one statement per call; whitespace, comments and semicolons may follow.
    while (tail && *tail) {
        sqlite3_stmt* extra = nullptr;
        const char* next = nullptr;
        rc = sqlite3_prepare_v2(db_, tail, -1, &extra, &next);
        const bool more = rc != SQLITE_OK || extra != nullptr;
        sqlite3_finalize(extra);
        if (more) {
            sqlite3_finalize(stmt);
            throw db_error("only one SQL statement is allowed per call: " + sql, "SQLITE_MISUSE");
        }
        if (next == tail) break;
        tail = next;
    }
    for (size_t i = 0; i < params.size(); ++i) {
        bind_value(stmt, static_cast<int>(i) + 1, params[i]);
    }
    return stmt;
}

void database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    sqlite3_stmt* stmt = prepare(sql, params);
    int rc;
    do {
        rc = sqlite3_step(stmt);
    } while (rc == SQLITE_ROW);
    if (rc != SQLITE_DONE) {
        std::string text = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        throw db_error(text, error_code_name(rc));
    }
    sqlite3_finalize(stmt);
}

int64_t database::total_changes() const {
    return sqlite3_total_changes(db_);
}

bool database::table_exists(const std::string& name) const {
    return query_value("SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?", {name}).has_value();
}

std::vector<std::string> database::column_names(const std::string& table) const {
    std::vector<std::string> names;
    for (const auto& row : query("PRAGMA table_info(" + quote_identifier(table) + ")")) {
        names.push_back(as_string(row.at("name")));
    }
    return names;
}

std::unordered_map<std::string, std::string> database::get_table_info(const std::string& table) const {
    // Declared types, uppercased: "integer" and "INTEGER" compare equal.
    std::unordered_map<std::string, std::string> columns;
    for (const auto& row : query("PRAGMA table_info(" + quote_identifier(table) + ")")) {
        std::string type = as_string(row.at("type"));
        std::transform(type.begin(), type.end(), type.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        columns.emplace(as_string(row.at("name")), std::move(type));
    }
    return columns;
}

void database::bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value) const {
    std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, bool>) {
            sqlite3_bind_int64(stmt, index, v ? 1 : 0);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            sqlite3_bind_text(stmt, index, v.c_str(), -1, SQLITE_TRANSIENT);
        }
    }, value);
}

column_value_t database::extract_column(sqlite3_stmt* stmt, int index) const {
    int type = sqlite3_column_type(stmt, index);
    switch (type) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT:
        case SQLITE_BLOB: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            return std::string(text ? text : "");
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

std::vector<database::row_t> database::query(const std::string& sql,
                                             const std::vector<column_value_t>& params) const {
    sqlite3_stmt* stmt = prepare(sql, params);
    const int columns = sqlite3_column_count(stmt);

    std::vector<row_t> rows;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        row_t row;
        for (int i = 0; i < columns; ++i) {
            row.emplace(sqlite3_column_name(stmt, i), extract_column(stmt, i));
        }
        rows.push_back(std::move(row));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        std::string text = sqlite3_errmsg(db_);
        LOG_ERROR("db", "Query on %s failed: %s", path_.c_str(), text.c_str());
        throw db_error(text, error_code_name(rc));
    }
    return rows;
}

std::optional<column_value_t> database::query_value(const std::string& sql,
                                                    const std::vector<column_value_t>& params) const {
    sqlite3_stmt* stmt = prepare(sql, params);

    std::optional<column_value_t> value;
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        value = extract_column(stmt, 0);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        throw db_error(sqlite3_errmsg(db_), error_code_name(rc));
    }
    return value;
}

void database::begin_transaction() {
    // IMMEDIATE: acquires the write lock up front, readers still allowed (WAL mode).
    int rc = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr);

    // Retry with exponential backoff while another connection holds the lock.
    int backoff_ms = 1;
    const int max_backoff_ms = 1000;
    const int max_total_wait_ms = 30000;
    int total_waited_ms = 0;

    while ((rc == SQLITE_BUSY || rc == SQLITE_LOCKED) && total_waited_ms < max_total_wait_ms) {
        std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
        total_waited_ms += backoff_ms;
        backoff_ms = std::min(backoff_ms * 2, max_backoff_ms);
        rc = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr);
    }

    if (rc != SQLITE_OK) {
        auto error = std::string(sqlite3_errmsg(db_));
        LOG_ERROR("db", "Failed to begin transaction: %s", error.c_str());
        throw db_error("Failed to begin transaction: " + error);
    }
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

bool database::is_in_transaction() const {
    // sqlite3_get_autocommit returns 0 if a transaction is active, non-zero otherwise
    return sqlite3_get_autocommit(db_) == 0;
}

std::string database::journal_mode() const {
    auto mode = query_value("PRAGMA journal_mode");
    std::string result = mode ? as_string(*mode) : std::string();
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

checkpoint_result database::checkpoint() {
    checkpoint_result result;
    int rc = sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_RESTART,
                                       &result.log_frames, &result.checkpointed);
    if (rc == SQLITE_BUSY) {
        result.busy = true;
    } else if (rc != SQLITE_OK) {
        throw db_error("wal_checkpoint(RESTART) failed on " + path_ + ": " + sqlite3_errmsg(db_));
    }
    return result;
}

std::string database::error_code_name(int code) {
    switch (code & 0xFF) {
        case SQLITE_OK: return "SQLITE_OK";
        case SQLITE_ERROR: return "SQLITE_ERROR";
        case SQLITE_INTERNAL: return "SQLITE_INTERNAL";
        case SQLITE_PERM: return "SQLITE_PERM";
        case SQLITE_ABORT: return "SQLITE_ABORT";
        case SQLITE_BUSY: return "SQLITE_BUSY";
        case SQLITE_LOCKED: return "SQLITE_LOCKED";
        case SQLITE_NOMEM: return "SQLITE_NOMEM";
        case SQLITE_READONLY: return "SQLITE_READONLY";
        case SQLITE_INTERRUPT: return "SQLITE_INTERRUPT";
        case SQLITE_IOERR: return "SQLITE_IOERR";
        case SQLITE_CORRUPT: return "SQLITE_CORRUPT";
        case SQLITE_FULL: return "SQLITE_FULL";
        case SQLITE_CANTOPEN: return "SQLITE_CANTOPEN";
        case SQLITE_SCHEMA: return "SQLITE_SCHEMA";
        case SQLITE_TOOBIG: return "SQLITE_TOOBIG";
        case SQLITE_CONSTRAINT: return "SQLITE_CONSTRAINT";
        case SQLITE_MISMATCH: return "SQLITE_MISMATCH";
        case SQLITE_MISUSE: return "SQLITE_MISUSE";
        case SQLITE_RANGE: return "SQLITE_RANGE";
        case SQLITE_NOTADB: return "SQLITE_NOTADB";
        default: return "SQLITE_" + std::to_string(code);
    }
}

// Transaction RAII guard
transaction::transaction(database& db) : db_(db) {
    db_.begin_transaction();
}

transaction::~transaction() {
    if (!completed_ && db_.is_in_transaction()) {
        try {
            db_.rollback();
        } catch (const db_error& e) {
            LOG_ERROR("db", "Rollback in transaction guard failed: %s", e.what());
        }
    }
}

void transaction::commit() {
    db_.commit();
    completed_ = true;
}

void transaction::rollback() {
    db_.rollback();
    completed_ = true;
}

// ============================================================================
// Cell helpers
// ============================================================================

int64_t as_int(const column_value_t& value, int64_t fallback) {
    if (auto* i = std::get_if<int64_t>(&value)) return *i;
    if (auto* b = std::get_if<bool>(&value)) return *b ? 1 : 0;
    if (auto* d = std::get_if<double>(&value)) return static_cast<int64_t>(*d);
    if (auto* s = std::get_if<std::string>(&value)) {
        try {
            return std::stoll(*s);
        } catch (const std::logic_error&) {
            return fallback;
        }
    }
    return fallback;
}

std::string as_string(const column_value_t& value) {
    return std::visit([](auto&& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) return {};
        else if constexpr (std::is_same_v<T, bool>) return v ? "1" : "0";
        else if constexpr (std::is_same_v<T, std::string>) return v;
        else return std::to_string(v);
    }, value);
}

bool is_null(const column_value_t& value) {
    return std::holds_alternative<std::nullptr_t>(value);
}

} // namespace skyline
