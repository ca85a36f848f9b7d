#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace skyline {

// Bound parameter / result cell. Order matters for the JSON codec.
using column_value_t = std::variant<std::nullptr_t, bool, int64_t, double, std::string>;

/// One SQL text plus its positional parameters.
struct statement {
    std::string sql;
    std::vector<column_value_t> params;

    statement() = default;
    statement(std::string s) : sql(std::move(s)) {}
    statement(const char* s) : sql(s) {}
    statement(std::string s, std::vector<column_value_t> p)
        : sql(std::move(s)), params(std::move(p)) {}

    bool operator==(const statement&) const = default;
};

using statement_list = std::vector<statement>;

/// Quote an identifier for SQLite ("a""b").
inline std::string quote_identifier(const std::string& name) {
    std::string quoted = "\"";
    for (char c : name) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

} // namespace skyline
