#pragma once

#include "error.hpp"
#include "types.hpp"
#include <sqlite3.h>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace skyline {

/// Outcome of a wal_checkpoint call.
struct checkpoint_result {
    bool busy = false;      ///< a reader/writer prevented a full checkpoint
    int log_frames = 0;     ///< frames in the WAL
    int checkpointed = 0;   ///< frames copied back into the database
};

class database {
public:
    /// Open mode for database connections
    enum class open_mode {
        read_write,  ///< Daemon's writer handle: create if missing, WAL journal
        read_only,   ///< Query-only reader on an existing file
        maintenance  ///< Existing file, no journal change (checkpoints)
    };

    explicit database(const std::string& path, open_mode mode = open_mode::read_write);
    ~database();

    // Non-copyable
    database(const database&) = delete;
    database& operator=(const database&) = delete;

    // Moveable
    database(database&& other) noexcept;
    database& operator=(database&& other) noexcept;

    bool table_exists(const std::string& name) const;

    /// Column names in declaration order.
    std::vector<std::string> column_names(const std::string& table) const;

    // Get existing column names and types from a table
    // Returns map of column_name -> SQL_TYPE (uppercase)
    std::unordered_map<std::string, std::string> get_table_info(const std::string& table) const;

    // Query - returns rows as vector of column maps
    using row_t = std::unordered_map<std::string, column_value_t>;
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {}) const;

    /// First column of the first row, or nullopt when there are no rows.
    std::optional<column_value_t> query_value(const std::string& sql,
                                              const std::vector<column_value_t>& params = {}) const;

    // Execute SQL with optional params (for INSERT/UPDATE/DELETE without return)
    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    /// Rows changed on this connection since it was opened.
    int64_t total_changes() const;

    // Transaction support
    void begin_transaction();
    void commit();
    void rollback();
    bool is_in_transaction() const;

    /// "wal", "delete", ...
    std::string journal_mode() const;

    /// PRAGMA wal_checkpoint(RESTART) equivalent.
    checkpoint_result checkpoint();

    /// Name of the last SQLite result code ("SQLITE_CONSTRAINT").
    std::string last_error_code() const { return error_code_name(sqlite3_errcode(db_)); }

    static std::string error_code_name(int code);

    const std::string& path() const { return path_; }
    open_mode mode() const { return mode_; }

    // Raw access (use sparingly)
    sqlite3* handle() const { return db_; }

    void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value) const;

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    open_mode mode_;
    column_value_t extract_column(sqlite3_stmt* stmt, int index) const;
    /// Prepared and bound statement. Throws db_error; the caller finalizes.
    sqlite3_stmt* prepare(const std::string& sql, const std::vector<column_value_t>& params) const;
    void close();
};

// RAII transaction guard
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    void commit();
    void rollback();

private:
    database& db_;
    bool completed_ = false;
};

/// Read helpers for row_t cells.
int64_t as_int(const column_value_t& value, int64_t fallback = 0);
std::string as_string(const column_value_t& value);
bool is_null(const column_value_t& value);

} // namespace skyline
