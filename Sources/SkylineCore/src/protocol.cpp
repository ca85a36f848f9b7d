#include "skyline/protocol.hpp"
#include "skyline/error.hpp"

#include <nlohmann/json.hpp>

namespace skyline {

using json = nlohmann::json;

// ============================================================================
// Helpers
// ============================================================================

static json value_to_json(const column_value_t& value) {
    return std::visit([](auto&& v) -> json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return nullptr;
        } else {
            return v;
        }
    }, value);
}

static column_value_t json_to_value(const json& j) {
    switch (j.type()) {
        case json::value_t::null:
            return nullptr;
        case json::value_t::boolean:
            return j.get<bool>();
        case json::value_t::number_integer:
            return j.get<int64_t>();
        case json::value_t::number_unsigned:
            return static_cast<int64_t>(j.get<uint64_t>());
        case json::value_t::number_float:
            return j.get<double>();
        case json::value_t::string:
            return j.get<std::string>();
        default:
            throw protocol_error("unsupported parameter type: " + std::string(j.type_name()));
    }
}

static std::string required_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        throw protocol_error(std::string("missing string field '") + key + "'");
    }
    return it->get<std::string>();
}

template <typename T>
static void read_optional(const json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

template <typename T>
static void write_optional(json& j, const char* key, const std::optional<T>& value) {
    if (value) j[key] = *value;
}

// ============================================================================
// Requests
// ============================================================================

const char* request_type_name(const request& req) {
    return std::visit([](auto&& r) -> const char* {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, exec_batch_request>) return "ExecBatch";
        else if constexpr (std::is_same_v<T, prepare_for_maintenance_request>) return "PrepareForMaintenance";
        else if constexpr (std::is_same_v<T, close_database_request>) return "CloseDatabase";
        else if constexpr (std::is_same_v<T, reopen_database_request>) return "ReopenDatabase";
        else if constexpr (std::is_same_v<T, ping_request>) return "Ping";
        else if constexpr (std::is_same_v<T, shutdown_request>) return "Shutdown";
        else return "Disconnect";
    }, req);
}

std::string encode_request(const request& req) {
    json j;
    j["type"] = request_type_name(req);

    std::visit([&](auto&& r) {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, exec_batch_request>) {
            j["db"] = r.database;
            json stmts = json::array();
            for (const auto& stmt : r.statements) {
                json s;
                s["sql"] = stmt.sql;
                if (!stmt.params.empty()) {
                    json params = json::array();
                    for (const auto& p : stmt.params) {
                        params.push_back(value_to_json(p));
                    }
                    s["params"] = std::move(params);
                }
                stmts.push_back(std::move(s));
            }
            j["stmts"] = std::move(stmts);
            j["tx"] = "atomic";
        } else if constexpr (std::is_same_v<T, ping_request>) {
            if (r.database) j["db"] = *r.database;
        } else if constexpr (std::is_same_v<T, shutdown_request> ||
                             std::is_same_v<T, disconnect_request>) {
            // no payload
        } else {
            j["db"] = r.database;
        }
    }, req);

    return j.dump();
}

request decode_request(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        throw protocol_error(std::string("malformed request: ") + e.what());
    }
    if (!j.is_object()) {
        throw protocol_error("malformed request: not an object");
    }

    const std::string type = required_string(j, "type");
    try {
        if (type == "ExecBatch") {
            exec_batch_request r;
            r.database = required_string(j, "db");
            auto tx = j.find("tx");
            if (tx != j.end() && (!tx->is_string() || tx->get<std::string>() != "atomic")) {
                throw protocol_error("unsupported transaction mode");
            }
            auto stmts = j.find("stmts");
            if (stmts == j.end() || !stmts->is_array()) {
                throw protocol_error("missing field 'stmts'");
            }
            for (const auto& s : *stmts) {
                statement stmt(required_string(s, "sql"));
                auto params = s.find("params");
                if (params != s.end() && params->is_array()) {
                    for (const auto& p : *params) {
                        stmt.params.push_back(json_to_value(p));
                    }
                }
                r.statements.push_back(std::move(stmt));
            }
            return r;
        }
        if (type == "PrepareForMaintenance") return prepare_for_maintenance_request{required_string(j, "db")};
        if (type == "CloseDatabase") return close_database_request{required_string(j, "db")};
        if (type == "ReopenDatabase") return reopen_database_request{required_string(j, "db")};
        if (type == "Ping") {
            ping_request r;
            read_optional(j, "db", r.database);
            return r;
        }
        if (type == "Shutdown") return shutdown_request{};
        if (type == "Disconnect") return disconnect_request{};
    } catch (const json::exception& e) {
        throw protocol_error(std::string("malformed request: ") + e.what());
    }
    throw protocol_error("unknown request type '" + type + "'");
}

// ============================================================================
// Responses
// ============================================================================

std::string response::error_text() const {
    if (error && !error->empty()) return *error;
    if (message && !message->empty()) return *message;
    return "unknown daemon error";
}

response response::ok_response() {
    return response{};
}

response response::error_response(std::string text, std::optional<std::string> code) {
    response r;
    r.status = response_status::error;
    r.error = std::move(text);
    r.code = std::move(code);
    return r;
}

std::string encode_response(const response& resp) {
    json j;
    j["status"] = resp.is_ok() ? "ok" : "error";
    write_optional(j, "rev", resp.rev);
    write_optional(j, "rows_affected", resp.rows_affected);
    write_optional(j, "error", resp.error);
    write_optional(j, "message", resp.message);
    write_optional(j, "code", resp.code);
    write_optional(j, "checkpointed", resp.checkpointed);
    write_optional(j, "closed", resp.closed);
    write_optional(j, "reopened", resp.reopened);
    return j.dump();
}

response decode_response(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        throw protocol_error(std::string("malformed response: ") + e.what());
    }
    if (!j.is_object()) {
        throw protocol_error("malformed response: not an object");
    }

    response r;
    const std::string status = required_string(j, "status");
    if (status == "ok") {
        r.status = response_status::ok;
    } else if (status == "error") {
        r.status = response_status::error;
    } else {
        throw protocol_error("unknown response status '" + status + "'");
    }

    try {
        read_optional(j, "rev", r.rev);
        read_optional(j, "rows_affected", r.rows_affected);
        read_optional(j, "error", r.error);
        read_optional(j, "message", r.message);
        read_optional(j, "code", r.code);
        read_optional(j, "checkpointed", r.checkpointed);
        read_optional(j, "closed", r.closed);
        read_optional(j, "reopened", r.reopened);
    } catch (const json::type_error& e) {
        throw protocol_error(std::string("malformed response: ") + e.what());
    }
    return r;
}

} // namespace skyline
