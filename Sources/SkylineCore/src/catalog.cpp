#include "skyline/catalog.hpp"
#include "skyline/daemon_client.hpp"
#include "skyline/error.hpp"
#include "skyline/log.hpp"

#include <deque>
#include <vector>

namespace skyline {

std::string metadata_table_for(const std::string& table) {
    return table + "_Metadata";
}

std::string grand_parent_column(size_t level) {
    return "grand_" + std::to_string(level) + "_parent";
}

static std::optional<std::string> optional_text(const database::row_t& row, const char* column) {
    auto it = row.find(column);
    if (it == row.end() || is_null(it->second)) return std::nullopt;
    std::string text = as_string(it->second);
    if (text.empty()) return std::nullopt;
    return text;
}

std::vector<catalog_entry> load_catalog(const database& reader) {
    std::vector<catalog_entry> entries;
    if (!reader.table_exists(catalog_table)) {
        return entries;
    }

    for (const auto& row : reader.query("SELECT * FROM \"_Metadata\" ORDER BY rowid")) {
        catalog_entry entry;
        entry.name = as_string(row.at("table_name"));
        if (entry.name.empty()) continue;

        auto type = optional_text(row, "table_type");
        entry.kind = (type && *type == "structure") ? table_kind::structure : table_kind::main;
        entry.parent_table = optional_text(row, "parent_table");
        entry.parent_column = optional_text(row, "parent_column");
        if (auto it = row.find("display_order"); it != row.end()) entry.display_order = as_int(it->second);
        if (auto it = row.find("hidden"); it != row.end()) entry.hidden = as_int(it->second) != 0;
        entries.push_back(std::move(entry));
    }
    return entries;
}

// ============================================================================
// table_hierarchy
// ============================================================================

table_hierarchy::table_hierarchy(std::vector<catalog_entry> entries)
    : entries_(std::move(entries)) {
    for (size_t i = 0; i < entries_.size(); ++i) {
        index_.emplace(entries_[i].name, i);
    }

    parent_.assign(entries_.size(), npos);
    children_.assign(entries_.size(), {});

    for (size_t i = 0; i < entries_.size(); ++i) {
        auto& e = entries_[i];
        size_t parent = npos;
        if (e.parent_table) {
            parent = find(*e.parent_table);
            if (parent == npos) {
                LOG_WARN("catalog", "%s names unknown parent %s", e.name.c_str(), e.parent_table->c_str());
            }
        } else if (e.kind == table_kind::structure) {
            parent = infer_parent(e.name);
            if (parent != npos) {
                const auto& parent_name = entries_[parent].name;
                e.parent_table = parent_name;
                if (!e.parent_column) e.parent_column = e.name.substr(parent_name.size() + 1);
                LOG_DEBUG("catalog", "Inferred parent of %s: %s", e.name.c_str(), parent_name.c_str());
            }
        }
        if (parent == i) parent = npos;
        parent_[i] = parent;
        if (parent != npos) children_[parent].push_back(i);
    }
}

table_hierarchy table_hierarchy::load(const database& reader) {
    return table_hierarchy(load_catalog(reader));
}

size_t table_hierarchy::find(const std::string& name) const {
    auto it = index_.find(name);
    return it == index_.end() ? npos : it->second;
}

size_t table_hierarchy::infer_parent(const std::string& name) const {
    // Longest catalog name that is followed by '_' in `name`.
    size_t best = npos;
    for (size_t i = 0; i < entries_.size(); ++i) {
        const auto& candidate = entries_[i].name;
        if (candidate.size() + 1 >= name.size()) continue;
        if (name.compare(0, candidate.size(), candidate) != 0 || name[candidate.size()] != '_') continue;
        if (best == npos || candidate.size() > entries_[best].name.size()) best = i;
    }
    return best;
}

size_t table_hierarchy::depth_of(size_t index) const {
    size_t depth = 0;
    for (size_t p = parent_.at(index); p != npos; p = parent_[p]) {
        if (++depth > entries_.size()) {
            throw skyline_error("catalog parent links form a cycle at " + entries_[index].name);
        }
    }
    return depth;
}

std::vector<table_hierarchy::descendant> table_hierarchy::descendants_of(size_t index) const {
    std::vector<descendant> result;
    std::vector<bool> seen(entries_.size(), false);
    seen.at(index) = true;

    std::deque<descendant> queue;
    for (size_t child : children_.at(index)) queue.push_back({child, 1});

    while (!queue.empty()) {
        auto current = queue.front();
        queue.pop_front();
        if (seen[current.index]) continue;
        seen[current.index] = true;
        result.push_back(current);
        for (size_t child : children_[current.index]) {
            queue.push_back({child, current.distance + 1});
        }
    }
    return result;
}

// ============================================================================
// schema_writer
// ============================================================================

schema_writer::schema_writer(const daemon_client& client, std::optional<std::string> database)
    : client_(client), database_(std::move(database)) {}

statement_list schema_writer::catalog_statements() {
    return {
        statement("CREATE TABLE IF NOT EXISTS \"_Metadata\" ("
                  "table_name TEXT PRIMARY KEY, "
                  "table_type TEXT NOT NULL DEFAULT 'main', "
                  "parent_table TEXT, "
                  "parent_column TEXT, "
                  "ai_context TEXT, "
                  "display_order INTEGER DEFAULT 0, "
                  "category TEXT, "
                  "hidden INTEGER DEFAULT 0, "
                  "created_at DATETIME DEFAULT CURRENT_TIMESTAMP, "
                  "updated_at DATETIME DEFAULT CURRENT_TIMESTAMP)"),
    };
}

std::string schema_writer::metadata_table_ddl(const std::string& metadata_table, bool if_not_exists) {
    return std::string("CREATE TABLE ") + (if_not_exists ? "IF NOT EXISTS " : "") +
           quote_identifier(metadata_table) + " ("
           "id INTEGER PRIMARY KEY AUTOINCREMENT, "
           "column_index INTEGER UNIQUE NOT NULL, "
           "column_name TEXT NOT NULL UNIQUE, "
           "display_name TEXT, "
           "data_type TEXT NOT NULL DEFAULT 'TEXT', "
           "validator_type TEXT, "
           "validator_config TEXT, "
           "ai_context TEXT, "
           "filter_expr TEXT, "
           "ai_enable_row_generation INTEGER DEFAULT 0, "
           "ai_include_in_send INTEGER DEFAULT 1, "
           "deleted INTEGER DEFAULT 0)";
}

static void append_columns(std::string& ddl, const std::vector<column_def>& columns) {
    for (const auto& col : columns) {
        ddl += ", " + quote_identifier(col.name) + " " + col.data_type;
    }
}

static void append_metadata_rows(statement_list& stmts,
                                 const std::string& table,
                                 const std::vector<column_def>& columns) {
    const std::string insert = "INSERT INTO " + quote_identifier(metadata_table_for(table)) +
                               " (column_index, column_name, display_name, data_type) VALUES (?, ?, ?, ?)";
    int64_t index = 0;
    for (const auto& col : columns) {
        stmts.emplace_back(insert, std::vector<column_value_t>{
            index++,
            col.name,
            col.display_name ? column_value_t(*col.display_name) : column_value_t(col.name),
            col.data_type,
        });
    }
}

statement_list schema_writer::main_table_statements(const std::string& name,
                                                    const std::vector<column_def>& columns,
                                                    int64_t display_order) {
    statement_list stmts = catalog_statements();

    std::string ddl = "CREATE TABLE " + quote_identifier(name) +
                      " (id INTEGER PRIMARY KEY AUTOINCREMENT, row_index INTEGER NOT NULL UNIQUE";
    append_columns(ddl, columns);
    ddl += ")";
    stmts.emplace_back(std::move(ddl));

    stmts.emplace_back(metadata_table_ddl(metadata_table_for(name)));
    append_metadata_rows(stmts, name, columns);

    stmts.emplace_back("INSERT INTO \"_Metadata\" (table_name, table_type, display_order) VALUES (?, 'main', ?)",
                       std::vector<column_value_t>{name, display_order});
    return stmts;
}

statement_list schema_writer::structure_table_statements(const std::string& parent,
                                                         const std::string& parent_column,
                                                         size_t depth,
                                                         const std::vector<column_def>& columns) {
    if (depth == 0) {
        throw skyline_error("structure table under " + parent + " needs a depth of at least 1");
    }
    const std::string name = parent + "_" + parent_column;
    statement_list stmts = catalog_statements();

    std::string ddl = "CREATE TABLE " + quote_identifier(name) +
                      " (id INTEGER PRIMARY KEY AUTOINCREMENT, row_index INTEGER NOT NULL, "
                      "parent_key TEXT NOT NULL";
    for (size_t level = 1; level < depth; ++level) {
        ddl += ", " + grand_parent_column(level) + " TEXT";
    }
    append_columns(ddl, columns);
    ddl += ")";
    stmts.emplace_back(std::move(ddl));
    stmts.emplace_back("CREATE INDEX " + quote_identifier("idx_" + name + "_parent_key") +
                       " ON " + quote_identifier(name) + " (parent_key, row_index)");

    stmts.emplace_back(metadata_table_ddl(metadata_table_for(name)));
    append_metadata_rows(stmts, name, columns);

    stmts.emplace_back("INSERT INTO \"_Metadata\" (table_name, table_type, parent_table, parent_column) "
                       "VALUES (?, 'structure', ?, ?)",
                       std::vector<column_value_t>{name, parent, parent_column});
    return stmts;
}

void schema_writer::ensure_catalog() const {
    client_.exec_batch(catalog_statements(), database_);
}

void schema_writer::create_main_table(const std::string& name,
                                      const std::vector<column_def>& columns,
                                      int64_t display_order) const {
    client_.exec_batch(main_table_statements(name, columns, display_order), database_);
    LOG_INFO("catalog", "Created table %s", name.c_str());
}

std::string schema_writer::create_structure_table(const table_hierarchy& hierarchy,
                                                  const std::string& parent,
                                                  const std::string& parent_column,
                                                  const std::vector<column_def>& columns) const {
    size_t parent_index = hierarchy.find(parent);
    if (parent_index == table_hierarchy::npos) {
        throw skyline_error("unknown parent table " + parent);
    }
    size_t depth = hierarchy.depth_of(parent_index) + 1;
    client_.exec_batch(structure_table_statements(parent, parent_column, depth, columns), database_);
    LOG_INFO("catalog", "Created structure table %s_%s (depth %zu)",
             parent.c_str(), parent_column.c_str(), depth);
    return parent + "_" + parent_column;
}

} // namespace skyline
