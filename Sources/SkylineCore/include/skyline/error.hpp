#pragma once

#include <stdexcept>
#include <string>

namespace skyline {

/// Base class for every error raised by the storage core.
class skyline_error : public std::runtime_error {
public:
    explicit skyline_error(const std::string& msg) : std::runtime_error(msg) {}
};

/// The daemon channel could not be reached, the daemon could not be
/// started, or a frame could not be written/read in full.
class transport_error : public skyline_error {
public:
    explicit transport_error(const std::string& msg) : skyline_error(msg) {}

    /// Text suitable for showing to an end user.
    static const char* user_message() {
        return "could not reach or start the background service";
    }
};

/// A frame or message did not decode.
class protocol_error : public skyline_error {
public:
    explicit protocol_error(const std::string& msg) : skyline_error(msg) {}
};

/// The daemon rejected a request with a genuine SQL error.
class sql_error : public skyline_error {
public:
    sql_error(const std::string& msg, std::string code)
        : skyline_error(msg), code_(std::move(code)) {}

    /// SQLite result code name reported by the daemon ("SQLITE_CONSTRAINT"), may be empty.
    const std::string& code() const { return code_; }

private:
    std::string code_;
};

/// Bad or incomplete client configuration (e.g. no database could be resolved).
class config_error : public skyline_error {
public:
    explicit config_error(const std::string& msg) : skyline_error(msg) {}
};

/// A migration fix failed; the run stopped at this fix.
class migration_error : public skyline_error {
public:
    migration_error(std::string fix_id, const std::string& msg)
        : skyline_error("migration " + fix_id + " failed: " + msg), fix_id_(std::move(fix_id)) {}

    const std::string& fix_id() const { return fix_id_; }

private:
    std::string fix_id_;
};

/// Failure on a local SQLite handle.
class db_error : public skyline_error {
public:
    explicit db_error(const std::string& msg, std::string code = {})
        : skyline_error(msg), code_(std::move(code)) {}

    /// SQLite result code name at the point of failure, may be empty.
    const std::string& code() const { return code_; }

private:
    std::string code_;
};

} // namespace skyline
