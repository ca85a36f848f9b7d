#include "skyline/cascade.hpp"
#include "skyline/daemon_client.hpp"
#include "skyline/error.hpp"
#include "skyline/log.hpp"

namespace skyline {

cascade_engine::cascade_engine(const database& reader,
                               const daemon_client& client,
                               std::optional<std::string> database)
    : reader_(reader), client_(client), database_(std::move(database)) {}

static statement reference_update(const std::string& table,
                                  const std::string& column,
                                  const std::string& old_value,
                                  const std::string& new_value) {
    return statement("UPDATE " + quote_identifier(table) + " SET " + quote_identifier(column) +
                     " = ? WHERE " + quote_identifier(column) + " = ?",
                     {new_value, old_value});
}

static statement_list build_plan(const database& reader,
                                 const std::string& table,
                                 const std::string& old_value,
                                 const std::string& new_value,
                                 size_t& tables_visited) {
    statement_list stmts;
    tables_visited = 0;
    if (old_value == new_value) return stmts;

    auto hierarchy = table_hierarchy::load(reader);
    size_t root = hierarchy.find(table);
    if (root == table_hierarchy::npos) {
        LOG_DEBUG("cascade", "%s is not in the catalog, nothing to propagate", table.c_str());
        return stmts;
    }

    for (const auto& d : hierarchy.descendants_of(root)) {
        const auto& name = hierarchy.entry(d.index).name;
        if (!reader.table_exists(name)) {
            LOG_WARN("cascade", "Catalog lists %s but the table does not exist", name.c_str());
            continue;
        }
        auto columns = reader.get_table_info(name);

        const size_t before = stmts.size();
        if (d.distance == 1) {
            if (columns.count("parent_key")) {
                stmts.push_back(reference_update(name, "parent_key", old_value, new_value));
            } else {
                LOG_WARN("cascade", "Structure table %s has no parent_key column", name.c_str());
            }
        } else {
            // Deeper levels: every ancestor reference column present.
            for (size_t level = 1; columns.count(grand_parent_column(level)); ++level) {
                stmts.push_back(reference_update(name, grand_parent_column(level), old_value, new_value));
            }
        }
        if (stmts.size() > before) ++tables_visited;
    }
    return stmts;
}

statement_list cascade_engine::plan(const std::string& table,
                                    const std::string& old_value,
                                    const std::string& new_value) const {
    size_t tables_visited = 0;
    return build_plan(reader_, table, old_value, new_value, tables_visited);
}

cascade_report cascade_engine::propagate(const std::string& table,
                                         const std::string& old_value,
                                         const std::string& new_value,
                                         statement_list leading) const {
    cascade_report report;
    report.table = table;
    report.old_value = old_value;
    report.new_value = new_value;

    auto cascade = build_plan(reader_, table, old_value, new_value, report.tables_visited);
    report.statements = cascade.size();

    statement_list batch = std::move(leading);
    batch.insert(batch.end(), cascade.begin(), cascade.end());
    if (batch.empty()) return report;

    auto result = client_.exec_batch(std::move(batch), database_);
    if (!result.applied()) {
        report.applied = false;
        LOG_WARN("cascade", "%s: '%s' -> '%s' rolled back: %s",
                 table.c_str(), old_value.c_str(), new_value.c_str(), result.message.c_str());
        return report;
    }
    report.rows_updated = result.rows_affected;
    LOG_INFO("cascade", "%s: '%s' -> '%s' updated %lld rows in %zu tables",
             table.c_str(), old_value.c_str(), new_value.c_str(),
             static_cast<long long>(report.rows_updated), report.tables_visited);
    return report;
}

cascade_report cascade_engine::rename_column(const std::string& table,
                                             const std::string& old_column,
                                             const std::string& new_column) const {
    cascade_report report;
    report.table = table;
    report.old_value = old_column;
    report.new_value = new_column;
    if (old_column == new_column) return report;

    statement_list batch;
    batch.emplace_back("ALTER TABLE " + quote_identifier(table) + " RENAME COLUMN " +
                       quote_identifier(old_column) + " TO " + quote_identifier(new_column));

    const std::string metadata = metadata_table_for(table);
    if (reader_.table_exists(metadata)) {
        batch.emplace_back("UPDATE " + quote_identifier(metadata) +
                           " SET display_name = CASE WHEN display_name IS NULL OR display_name = ? "
                           "THEN ? ELSE display_name END, column_name = ? WHERE column_name = ?",
                           std::vector<column_value_t>{old_column, new_column, new_column, old_column});
    }

    // Descendant references are rewritten under the current table names,
    // before any structure table below is renamed.
    auto cascade = build_plan(reader_, table, old_column, new_column, report.tables_visited);
    batch.insert(batch.end(), cascade.begin(), cascade.end());

    // A structure table hanging off this column follows the rename. Its own
    // children keep their names; they are linked by parent_table.
    auto hierarchy = table_hierarchy::load(reader_);
    size_t root = hierarchy.find(table);
    if (root != table_hierarchy::npos) {
        for (size_t child : hierarchy.children_of(root)) {
            const auto& entry = hierarchy.entry(child);
            if (entry.parent_column != old_column) continue;

            const std::string renamed = table + "_" + new_column;
            batch.emplace_back("ALTER TABLE " + quote_identifier(entry.name) +
                               " RENAME TO " + quote_identifier(renamed));
            if (reader_.table_exists(metadata_table_for(entry.name))) {
                batch.emplace_back("ALTER TABLE " + quote_identifier(metadata_table_for(entry.name)) +
                                   " RENAME TO " + quote_identifier(metadata_table_for(renamed)));
            }
            batch.emplace_back("UPDATE \"_Metadata\" SET table_name = ?, parent_column = ?, "
                               "updated_at = CURRENT_TIMESTAMP WHERE table_name = ?",
                               std::vector<column_value_t>{renamed, new_column, entry.name});
            batch.emplace_back("UPDATE \"_Metadata\" SET parent_table = ? WHERE parent_table = ?",
                               std::vector<column_value_t>{renamed, entry.name});
            ++report.tables_renamed;
        }
    }

    report.statements = batch.size();
    auto result = client_.exec_batch(std::move(batch), database_);
    if (!result.applied()) {
        report.applied = false;
        LOG_WARN("cascade", "Rename of %s.%s rolled back: %s",
                 table.c_str(), old_column.c_str(), result.message.c_str());
        return report;
    }
    report.rows_updated = result.rows_affected;
    LOG_INFO("cascade", "Renamed %s.%s to %s (%lld rows in %zu descendant tables, %zu structure tables renamed)",
             table.c_str(), old_column.c_str(), new_column.c_str(),
             static_cast<long long>(report.rows_updated), report.tables_visited, report.tables_renamed);
    return report;
}

} // namespace skyline
