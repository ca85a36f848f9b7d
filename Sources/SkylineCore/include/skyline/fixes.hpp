#pragma once

#include "migration.hpp"
#include <string>
#include <vector>

namespace skyline {

// ============================================================================
// Table discovery helpers
// ============================================================================

/// Per-table metadata tables ("*_Metadata", excluding the catalog itself).
std::vector<std::string> metadata_tables(const database& reader);

/// User data tables: everything except sqlite internals, the catalog,
/// metadata tables and the migration tracking table.
std::vector<std::string> data_tables(const database& reader);

// ============================================================================
// Shipped fixes
// ============================================================================

/// Adds display_name to every metadata table and hidden to the catalog.
class metadata_columns_fix : public migration_fix {
public:
    std::string id() const override { return "add_metadata_display_name_2025_10_20"; }
    std::string description() const override {
        return "Add display_name to column metadata and hidden to the table catalog";
    }
    void apply(migration_context& ctx) override;
};

/// Renumbers an ordering column to 0..N-1: live rows first in creation
/// order, then soft-deleted rows. Tables already in that shape are left alone.
class sequential_index_repair : public migration_fix {
public:
    explicit sequential_index_repair(std::string column = "row_index") : column_(std::move(column)) {}

    std::string id() const override { return "fix_row_index_duplicates_2025_10_12"; }
    std::string description() const override {
        return "Renumber " + column_ + " sequentially where it has duplicates or gaps";
    }
    void apply(migration_context& ctx) override;

    /// True when `table` needs renumbering.
    bool needs_repair(const database& reader, const std::string& table) const;

    /// The two-pass UPDATE batch for one table.
    statement_list repair_statements(const database& reader, const std::string& table) const;

private:
    std::string column_;
};

/// Removes a leftover column: DROP COLUMN where SQLite supports it, otherwise
/// a rename to "_obsolete_<name>". Either way its metadata rows are hidden.
class column_retirement : public migration_fix {
public:
    explicit column_retirement(std::string column = "temp_new_row_index") : column_(std::move(column)) {}

    std::string id() const override { return "cleanup_temp_new_row_index_2025_10_27"; }
    std::string description() const override {
        return "Drop or retire the leftover " + column_ + " column and hide it from metadata";
    }
    void apply(migration_context& ctx) override;

    std::string obsolete_name() const { return "_obsolete_" + column_; }

private:
    std::string column_;
};

/// Rebuilds metadata tables whose column_index holds non-integer values:
/// copy aside, recreate in the canonical shape, renumber densely (live rows
/// first), drop the copy. One atomic batch per table.
class structural_repair : public migration_fix {
public:
    std::string id() const override { return "repair_metadata_column_index_2025_11_03"; }
    std::string description() const override {
        return "Rebuild metadata tables with non-integer column_index values";
    }
    void apply(migration_context& ctx) override;

    bool needs_repair(const database& reader, const std::string& metadata_table) const;
    statement_list repair_statements(const database& reader, const std::string& metadata_table) const;
};

/// The ordered list run at startup.
fix_list default_fixes();

} // namespace skyline
