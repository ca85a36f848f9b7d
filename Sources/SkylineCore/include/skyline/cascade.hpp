#pragma once

#include "catalog.hpp"
#include "db.hpp"
#include "types.hpp"
#include <optional>
#include <string>

namespace skyline {

class daemon_client;

struct cascade_report {
    std::string table;
    std::string old_value;
    std::string new_value;
    /// Descendant tables that carried a reference column.
    size_t tables_visited = 0;
    size_t statements = 0;
    /// Rows changed by the whole batch, including any leading statements.
    int64_t rows_updated = 0;
    /// Structure tables renamed along with their owning column.
    size_t tables_renamed = 0;
    /// False when the daemon rolled the batch back because a metadata table
    /// is missing. Nothing was written in that case.
    bool applied = true;
};

/// Propagates a changed key value of a table to every structure table below
/// it: direct children through parent_key, deeper descendants through their
/// grand_N_parent columns. All updates travel in one atomic batch, so a
/// failure leaves nothing half-renamed and a repeated run changes nothing.
class cascade_engine {
public:
    cascade_engine(const database& reader,
                   const daemon_client& client,
                   std::optional<std::string> database = std::nullopt);

    /// The UPDATE statements a propagate() call would send.
    statement_list plan(const std::string& table,
                        const std::string& old_value,
                        const std::string& new_value) const;

    /// Send `leading` (typically the cell update itself) followed by the
    /// cascade plan as one batch.
    cascade_report propagate(const std::string& table,
                             const std::string& old_value,
                             const std::string& new_value,
                             statement_list leading = {}) const;

    /// Rename a column of a data table together with its metadata row, every
    /// descendant reference holding the old column name and, when the column
    /// owns a structure table, that table's name and catalog links. One batch.
    cascade_report rename_column(const std::string& table,
                                 const std::string& old_column,
                                 const std::string& new_column) const;

private:
    const database& reader_;
    const daemon_client& client_;
    std::optional<std::string> database_;
};

} // namespace skyline
