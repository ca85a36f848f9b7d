#pragma once

#include "db.hpp"
#include "types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace skyline {

class daemon_client;

/// Name of the catalog table listing every data table.
inline constexpr const char* catalog_table = "_Metadata";

/// "<table>_Metadata"
std::string metadata_table_for(const std::string& table);

enum class table_kind {
    main,      ///< top-level data table
    structure  ///< child table "<parent>_<column>" holding one parent cell's rows
};

/// One row of the catalog.
struct catalog_entry {
    std::string name;
    table_kind kind = table_kind::main;
    std::optional<std::string> parent_table;
    std::optional<std::string> parent_column;
    int64_t display_order = 0;
    bool hidden = false;
};

/// Read the catalog through a (query-only) handle. A database without a
/// catalog has no tables.
std::vector<catalog_entry> load_catalog(const database& reader);

/// Tables in the catalog with an explicit parent index. Children are found
/// through recorded parent links; the "<parent>_<column>" naming rule is
/// only consulted for structure tables whose parent was never recorded.
class table_hierarchy {
public:
    static constexpr size_t npos = static_cast<size_t>(-1);

    table_hierarchy() = default;
    explicit table_hierarchy(std::vector<catalog_entry> entries);

    static table_hierarchy load(const database& reader);

    size_t size() const { return entries_.size(); }
    size_t find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != npos; }

    const catalog_entry& entry(size_t index) const { return entries_.at(index); }
    const std::vector<catalog_entry>& entries() const { return entries_; }

    /// npos for main tables.
    size_t parent_of(size_t index) const { return parent_.at(index); }
    const std::vector<size_t>& children_of(size_t index) const { return children_.at(index); }

    /// 0 for main tables, 1 for their direct children, ...
    size_t depth_of(size_t index) const;

    /// A descendant and its distance from the starting table (1 = child).
    struct descendant {
        size_t index;
        size_t distance;
    };

    /// Every table below `index`, breadth first.
    std::vector<descendant> descendants_of(size_t index) const;

private:
    std::vector<catalog_entry> entries_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<size_t> parent_;
    std::vector<std::vector<size_t>> children_;

    size_t infer_parent(const std::string& name) const;
};

/// Column of a data table, as created by schema_writer.
struct column_def {
    std::string name;
    std::string data_type = "TEXT";
    std::optional<std::string> display_name;
};

/// Builds DDL for the catalog, data tables and their metadata tables, and
/// submits it through the daemon.
class schema_writer {
public:
    explicit schema_writer(const daemon_client& client,
                           std::optional<std::string> database = std::nullopt);

    static statement_list catalog_statements();

    /// CREATE TABLE for "<table>_Metadata" in its canonical shape.
    static std::string metadata_table_ddl(const std::string& metadata_table, bool if_not_exists = true);

    static statement_list main_table_statements(const std::string& name,
                                                const std::vector<column_def>& columns,
                                                int64_t display_order = 0);

    /// `depth` is the new table's depth (1 = child of a main table).
    static statement_list structure_table_statements(const std::string& parent,
                                                     const std::string& parent_column,
                                                     size_t depth,
                                                     const std::vector<column_def>& columns);

    void ensure_catalog() const;
    void create_main_table(const std::string& name,
                           const std::vector<column_def>& columns,
                           int64_t display_order = 0) const;

    /// Creates "<parent>_<parent_column>"; returns its name.
    std::string create_structure_table(const table_hierarchy& hierarchy,
                                       const std::string& parent,
                                       const std::string& parent_column,
                                       const std::vector<column_def>& columns) const;

private:
    const daemon_client& client_;
    std::optional<std::string> database_;
};

/// "grand_<n>_parent"
std::string grand_parent_column(size_t level);

} // namespace skyline
