#include "skyline/fixes.hpp"
#include "skyline/catalog.hpp"
#include "skyline/error.hpp"
#include "skyline/log.hpp"

#include <sqlite3.h>
#include <algorithm>
#include <cctype>
#include <limits>

namespace skyline {

// ============================================================================
// Table discovery
// ============================================================================

static std::vector<std::string> table_names(const database& reader, const std::string& sql) {
    std::vector<std::string> names;
    for (const auto& row : reader.query(sql)) {
        names.push_back(as_string(row.at("name")));
    }
    return names;
}

std::vector<std::string> metadata_tables(const database& reader) {
    return table_names(reader,
        "SELECT name FROM sqlite_master WHERE type = 'table' "
        "AND name LIKE '%\\_Metadata' ESCAPE '\\' AND name <> '_Metadata' ORDER BY name");
}

std::vector<std::string> data_tables(const database& reader) {
    return table_names(reader,
        "SELECT name FROM sqlite_master WHERE type = 'table' "
        "AND name NOT LIKE 'sqlite\\_%' ESCAPE '\\' "
        "AND name NOT LIKE '%\\_Metadata' ESCAPE '\\' "
        "AND name <> 'migration_fixes' ORDER BY name");
}

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// ============================================================================
// metadata_columns_fix
// ============================================================================

void metadata_columns_fix::apply(migration_context& ctx) {
    for (const auto& table : metadata_tables(ctx.reader)) {
        ctx.client.add_column_if_missing(table, "display_name", "TEXT", std::nullopt, ctx.database_name);
        ctx.exec({statement("UPDATE " + quote_identifier(table) +
                            " SET display_name = column_name WHERE display_name IS NULL OR display_name = ''")});
    }
    if (ctx.reader.table_exists(catalog_table)) {
        ctx.client.add_column_if_missing(catalog_table, "hidden", "INTEGER", "0", ctx.database_name);
    }
}

// ============================================================================
// sequential_index_repair
// ============================================================================

struct index_stats {
    int64_t total = 0;
    int64_t present = 0;
    int64_t distinct_values = 0;
    int64_t lowest = 0;
    int64_t highest = -1;
};

static index_stats read_index_stats(const database& reader, const std::string& table, const std::string& column) {
    const std::string col = quote_identifier(column);
    auto rows = reader.query("SELECT COUNT(*) AS total, COUNT(" + col + ") AS present, "
                             "COUNT(DISTINCT " + col + ") AS distinct_values, "
                             "MIN(" + col + ") AS lowest, MAX(" + col + ") AS highest FROM " +
                             quote_identifier(table));
    index_stats stats;
    if (rows.empty()) return stats;
    const auto& row = rows.front();
    stats.total = as_int(row.at("total"));
    stats.present = as_int(row.at("present"));
    stats.distinct_values = as_int(row.at("distinct_values"));
    stats.lowest = as_int(row.at("lowest"), 0);
    stats.highest = as_int(row.at("highest"), -1);
    return stats;
}

bool sequential_index_repair::needs_repair(const database& reader, const std::string& table) const {
    if (!reader.get_table_info(table).count(column_)) return false;

    auto stats = read_index_stats(reader, table, column_);
    if (stats.total == 0) return false;
    bool sequential = stats.present == stats.total &&
                      stats.distinct_values == stats.total &&
                      stats.lowest == 0 &&
                      stats.highest == stats.total - 1;
    return !sequential;
}

statement_list sequential_index_repair::repair_statements(const database& reader, const std::string& table) const {
    auto info = reader.get_table_info(table);
    auto stats = read_index_stats(reader, table, column_);

    const std::string t = quote_identifier(table);
    const std::string col = quote_identifier(column_);
    const std::string order = info.count("deleted") ? "COALESCE(deleted, 0) != 0, rowid" : "rowid";

    // Pass one moves every row outside the current range (so no UNIQUE
    // collision is possible), pass two maps them back onto 0..N-1. Rows go
    // below the minimum unless that would leave the int64 range.
    const int64_t lowest = std::min<int64_t>(stats.lowest, 0);
    const int64_t highest = std::max<int64_t>(stats.highest, 0);
    const std::string ranked = "WITH ranked AS (SELECT rowid AS rid, ROW_NUMBER() OVER (ORDER BY " + order +
                               ") - 1 AS position FROM " + t + ") ";
    const std::string position = "(SELECT position FROM ranked WHERE ranked.rid = " + t + ".rowid)";

    if (lowest > std::numeric_limits<int64_t>::min() + stats.total) {
        const int64_t base = lowest - 1;
        return {
            statement(ranked + "UPDATE " + t + " SET " + col + " = ? - " + position, {base}),
            statement("UPDATE " + t + " SET " + col + " = ? - " + col, {base}),
        };
    }
    if (highest < std::numeric_limits<int64_t>::max() - stats.total) {
        const int64_t base = highest + 1;
        return {
            statement(ranked + "UPDATE " + t + " SET " + col + " = ? + " + position, {base}),
            statement("UPDATE " + t + " SET " + col + " = " + col + " - ?", {base}),
        };
    }
    throw skyline_error(table + "." + column_ + " spans the whole integer range, cannot renumber");
}

void sequential_index_repair::apply(migration_context& ctx) {
    std::vector<std::string> tables;
    auto catalog = load_catalog(ctx.reader);
    if (catalog.empty()) {
        tables = data_tables(ctx.reader);
    } else {
        for (const auto& entry : catalog) {
            if (ctx.reader.table_exists(entry.name)) tables.push_back(entry.name);
        }
    }

    for (const auto& table : tables) {
        if (!needs_repair(ctx.reader, table)) continue;
        auto result = ctx.exec(repair_statements(ctx.reader, table));
        LOG_INFO("migration", "Renumbered %s.%s (%lld row updates)",
                 table.c_str(), column_.c_str(), static_cast<long long>(result.rows_affected));
    }
}

// ============================================================================
// column_retirement
// ============================================================================

void column_retirement::apply(migration_context& ctx) {
    const bool can_drop = sqlite3_libversion_number() >= 3035000;

    for (const auto& table : data_tables(ctx.reader)) {
        auto info = ctx.reader.get_table_info(table);
        if (!info.count(column_)) continue;

        const std::string t = quote_identifier(table);
        bool dropped = false;
        if (can_drop) {
            try {
                ctx.exec({statement("ALTER TABLE " + t + " DROP COLUMN " + quote_identifier(column_))});
                dropped = true;
                LOG_INFO("migration", "Dropped %s.%s", table.c_str(), column_.c_str());
            } catch (const sql_error& e) {
                LOG_WARN("migration", "DROP COLUMN %s.%s refused (%s), renaming instead",
                         table.c_str(), column_.c_str(), e.what());
            }
        }
        if (dropped) continue;

        if (info.count(obsolete_name())) {
            LOG_WARN("migration", "%s already has %s, leaving %s in place",
                     table.c_str(), obsolete_name().c_str(), column_.c_str());
            continue;
        }
        ctx.exec({statement("ALTER TABLE " + t + " RENAME COLUMN " + quote_identifier(column_) +
                            " TO " + quote_identifier(obsolete_name()))});
        LOG_INFO("migration", "Renamed %s.%s to %s", table.c_str(), column_.c_str(), obsolete_name().c_str());
    }

    for (const auto& metadata : metadata_tables(ctx.reader)) {
        if (!ctx.reader.get_table_info(metadata).count("deleted")) continue;
        ctx.exec({statement("UPDATE " + quote_identifier(metadata) +
                            " SET deleted = 1 WHERE LOWER(column_name) IN (?, ?) AND COALESCE(deleted, 0) = 0",
                            {lowercase(column_), lowercase(obsolete_name())})});
    }
}

// ============================================================================
// structural_repair
// ============================================================================

static const std::vector<std::string>& canonical_metadata_columns() {
    static const std::vector<std::string> columns = {
        "column_name", "display_name", "data_type", "validator_type", "validator_config",
        "ai_context", "filter_expr", "ai_enable_row_generation", "ai_include_in_send", "deleted",
    };
    return columns;
}

bool structural_repair::needs_repair(const database& reader, const std::string& metadata_table) const {
    if (!reader.table_exists(metadata_table)) return false;
    if (!reader.get_table_info(metadata_table).count("column_index")) return false;
    auto bad = reader.query_value("SELECT COUNT(*) FROM " + quote_identifier(metadata_table) +
                                  " WHERE typeof(column_index) != 'integer'");
    return bad && as_int(*bad) > 0;
}

statement_list structural_repair::repair_statements(const database& reader, const std::string& metadata_table) const {
    auto present = reader.get_table_info(metadata_table);
    if (!present.count("column_name")) {
        throw skyline_error(metadata_table + " has no column_name column, cannot rebuild");
    }

    std::string target_columns = "column_index";
    std::string source_columns;
    for (const auto& column : canonical_metadata_columns()) {
        if (!present.count(column)) continue;
        target_columns += ", " + column;
        source_columns += ", ";
        source_columns += column == "data_type" ? "COALESCE(data_type, 'TEXT')" : column;
    }

    const std::string m = quote_identifier(metadata_table);
    const std::string backup = quote_identifier(metadata_table + "_repair_backup");
    const bool has_deleted = present.count("deleted") > 0;
    const std::string live = has_deleted ? "COALESCE(deleted, 0) = 0" : "1";
    const std::string dead = has_deleted ? "COALESCE(deleted, 0) != 0" : "0";

    return {
        statement("DROP TABLE IF EXISTS " + backup),
        statement("CREATE TABLE " + backup + " AS SELECT * FROM " + m),
        statement("DROP TABLE " + m),
        statement(schema_writer::metadata_table_ddl(metadata_table, false)),
        statement("INSERT INTO " + m + " (" + target_columns + ") "
                  "SELECT ROW_NUMBER() OVER (ORDER BY rowid) - 1" + source_columns +
                  " FROM " + backup + " WHERE " + live),
        statement("INSERT INTO " + m + " (" + target_columns + ") "
                  "SELECT (SELECT COUNT(*) FROM " + backup + " WHERE " + live + ") + "
                  "ROW_NUMBER() OVER (ORDER BY rowid) - 1" + source_columns +
                  " FROM " + backup + " WHERE " + dead),
        statement("DROP TABLE " + backup),
    };
}

void structural_repair::apply(migration_context& ctx) {
    for (const auto& metadata : metadata_tables(ctx.reader)) {
        if (!needs_repair(ctx.reader, metadata)) continue;
        LOG_WARN("migration", "%s has non-integer column_index values, rebuilding", metadata.c_str());
        ctx.exec(repair_statements(ctx.reader, metadata));
    }
}

// ============================================================================

fix_list default_fixes() {
    fix_list fixes;
    fixes.push_back(std::make_unique<metadata_columns_fix>());
    fixes.push_back(std::make_unique<sequential_index_repair>());
    fixes.push_back(std::make_unique<column_retirement>());
    fixes.push_back(std::make_unique<structural_repair>());
    return fixes;
}

} // namespace skyline
