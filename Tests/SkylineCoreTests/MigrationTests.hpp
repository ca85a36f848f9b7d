#pragma once

#include "TestSupport.hpp"
#include <skyline/catalog.hpp>
#include <skyline/error.hpp>
#include <skyline/fixes.hpp>
#include <skyline/migration.hpp>
#include <cassert>
#include <iostream>
#include <stdexcept>

namespace migration_tests {

using skyline::statement;
using skyline::migration_context;

/// Records every apply in `log`; throws when `fail` is set.
class recording_fix : public skyline::migration_fix {
public:
    recording_fix(std::string id, std::vector<std::string>& log, bool fail = false)
        : id_(std::move(id)), log_(log), fail_(fail) {}

    std::string id() const override { return id_; }
    std::string description() const override { return "records " + id_; }
    void apply(migration_context& ctx) override {
        log_.push_back(id_);
        if (fail_) throw std::runtime_error(id_ + " exploded");
        ctx.exec({statement("INSERT INTO seen (fix) VALUES (?)", {id_})});
    }

private:
    std::string id_;
    std::vector<std::string>& log_;
    bool fail_;
};

/// Writes a row and touches a metadata table that does not exist.
class ghost_metadata_fix : public skyline::migration_fix {
public:
    std::string id() const override { return "ghost_metadata"; }
    std::string description() const override { return "updates Ghost_Metadata"; }
    void apply(migration_context& ctx) override {
        ctx.exec({
            statement("INSERT INTO seen (fix) VALUES ('ghost')"),
            statement("UPDATE Ghost_Metadata SET display_name = 'x'"),
        });
    }
};

inline skyline::fix_list recording_fixes(std::vector<std::string>& log, const std::string& failing = "") {
    skyline::fix_list fixes;
    for (const char* id : {"A", "B", "C"}) {
        fixes.push_back(std::make_unique<recording_fix>(id, log, failing == id));
    }
    return fixes;
}

inline std::vector<int64_t> column_values(const skyline::database& reader, const std::string& sql) {
    std::vector<int64_t> values;
    for (const auto& row : reader.query(sql)) {
        values.push_back(skyline::as_int(row.at("v")));
    }
    return values;
}

// ============================================================================
// test_fix_manager_records_and_skips
// ============================================================================

void test_fix_manager_records_and_skips() {
    std::cout << "  test_fix_manager_records_and_skips..." << std::flush;

    test_support::running_daemon daemon("fixorder");
    skyline::daemon_client client(daemon.config());
    client.exec_batch({statement("CREATE TABLE seen (fix TEXT)")});
    auto reader = daemon.reader();
    migration_context ctx{reader, client, "app.db"};

    std::vector<std::string> log;
    skyline::fix_manager manager(recording_fixes(log));
    assert(manager.size() == 3);

    // Nothing recorded yet, and no tracking table either.
    for (const auto& status : manager.list_fixes(ctx)) assert(!status.applied);
    assert(!reader.table_exists(skyline::migration_table));

    auto applied = manager.apply_all(ctx);
    assert((applied == std::vector<std::string>{"A", "B", "C"}));
    assert((log == std::vector<std::string>{"A", "B", "C"}));
    assert(test_support::count_rows(reader, "SELECT COUNT(*) FROM migration_fixes") == 3);

    assert(manager.apply_all(ctx).empty());
    assert(log.size() == 3);
    assert(!manager.apply_fix_by_id(ctx, "B"));

    auto statuses = manager.list_fixes(ctx);
    assert(statuses.size() == 3);
    assert(statuses[1].id == "B" && statuses[1].applied && statuses[1].description == "records B");

    bool threw = false;
    try {
        manager.apply_fix_by_id(ctx, "Z");
    } catch (const skyline::migration_error& e) {
        threw = e.fix_id() == "Z";
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_fix_failure_aborts_run
// ============================================================================

void test_fix_failure_aborts_run() {
    std::cout << "  test_fix_failure_aborts_run..." << std::flush;

    test_support::running_daemon daemon("fixfail");
    skyline::daemon_client client(daemon.config());
    client.exec_batch({statement("CREATE TABLE seen (fix TEXT)")});
    auto reader = daemon.reader();
    migration_context ctx{reader, client, "app.db"};

    std::vector<std::string> log;
    skyline::fix_manager failing(recording_fixes(log, "B"));
    bool threw = false;
    try {
        failing.apply_all(ctx);
    } catch (const skyline::migration_error& e) {
        threw = true;
        assert(e.fix_id() == "B");
        assert(std::string(e.what()).find("exploded") != std::string::npos);
    }
    assert(threw);
    assert((log == std::vector<std::string>{"A", "B"}));

    auto statuses = failing.list_fixes(ctx);
    assert(statuses[0].applied);
    assert(!statuses[1].applied);
    assert(!statuses[2].applied);

    // Once B is fixed the run resumes where it stopped.
    skyline::fix_manager repaired(recording_fixes(log));
    assert((repaired.apply_all(ctx) == std::vector<std::string>{"B", "C"}));
    assert(test_support::count_rows(reader, "SELECT COUNT(*) FROM seen WHERE fix = 'A'") == 1);

    // apply_fix_by_id raises the same way.
    std::vector<std::string> other_log;
    skyline::fix_list single;
    single.push_back(std::make_unique<recording_fix>("D", other_log, true));
    skyline::fix_manager by_id(std::move(single));
    threw = false;
    try {
        by_id.apply_fix_by_id(ctx, "D");
    } catch (const skyline::migration_error& e) {
        threw = e.fix_id() == "D";
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_rolled_back_fix_is_not_recorded: a soft daemon outcome is a failure here
// ============================================================================

void test_rolled_back_fix_is_not_recorded() {
    std::cout << "  test_rolled_back_fix_is_not_recorded..." << std::flush;

    test_support::running_daemon daemon("fixrollback");
    skyline::daemon_client client(daemon.config());
    client.exec_batch({statement("CREATE TABLE seen (fix TEXT)")});
    auto reader = daemon.reader();
    migration_context ctx{reader, client, "app.db"};

    std::vector<std::string> log;
    skyline::fix_list fixes;
    fixes.push_back(std::make_unique<ghost_metadata_fix>());
    fixes.push_back(std::make_unique<recording_fix>("after", log));
    skyline::fix_manager manager(std::move(fixes));

    bool threw = false;
    try {
        manager.apply_all(ctx);
    } catch (const skyline::migration_error& e) {
        threw = e.fix_id() == "ghost_metadata";
        assert(std::string(e.what()).find("rolled back") != std::string::npos);
    }
    assert(threw);
    assert(log.empty());
    assert(test_support::count_rows(reader, "SELECT COUNT(*) FROM seen") == 0);
    assert(!manager.list_fixes(ctx)[0].applied);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_sequential_index_repair
// ============================================================================

void test_sequential_index_repair() {
    std::cout << "  test_sequential_index_repair..." << std::flush;

    {
        // No catalog: every data table is a candidate.
        test_support::running_daemon daemon("seqlegacy");
        skyline::daemon_client client(daemon.config());
        client.exec_batch({
            statement("CREATE TABLE Legacy (id INTEGER PRIMARY KEY, row_index INTEGER, deleted INTEGER DEFAULT 0, name TEXT)"),
            statement("INSERT INTO Legacy (row_index, deleted, name) VALUES "
                      "(5, 0, 'a'), (5, 1, 'b'), (2, 0, 'c'), (9, 0, 'd')"),
            statement("CREATE TABLE Fine (row_index INTEGER)"),
            statement("INSERT INTO Fine VALUES (0), (1), (2)"),
        });
        auto reader = daemon.reader();
        migration_context ctx{reader, client, "app.db"};

        skyline::sequential_index_repair fix;
        assert(fix.needs_repair(reader, "Legacy"));
        assert(!fix.needs_repair(reader, "Fine"));

        fix.apply(ctx);
        assert((column_values(reader, "SELECT row_index AS v FROM Legacy ORDER BY id") ==
                std::vector<int64_t>{0, 3, 1, 2}));
        assert(!fix.needs_repair(reader, "Legacy"));
    }
    {
        // With a catalog every listed table is renumbered, structure tables included.
        test_support::running_daemon daemon("seqcatalog");
        skyline::daemon_client client(daemon.config());
        skyline::schema_writer writer(client);
        writer.create_main_table("Games", {skyline::column_def{"Title"}});
        client.exec_batch(skyline::schema_writer::structure_table_statements("Games", "Tags", 1, {skyline::column_def{"Tag"}}));
        client.exec_batch({
            statement("INSERT INTO Games (row_index, Title) VALUES (7, 'x'), (3, 'y')"),
            statement("INSERT INTO Games_Tags (row_index, parent_key, Tag) VALUES (0, 'x', 'a'), (1, 'x', 'b'), (0, 'y', 'c')"),
        });
        auto reader = daemon.reader();
        migration_context ctx{reader, client, "app.db"};

        skyline::sequential_index_repair fix;
        assert(fix.needs_repair(reader, "Games_Tags"));
        fix.apply(ctx);
        assert((column_values(reader, "SELECT row_index AS v FROM Games ORDER BY id") ==
                std::vector<int64_t>{0, 1}));
        assert((column_values(reader, "SELECT row_index AS v FROM Games_Tags ORDER BY id") ==
                std::vector<int64_t>{0, 1, 2}));
        assert(!fix.needs_repair(reader, "Games_Tags"));
        assert(!fix.needs_repair(reader, "Games"));
    }
    {
        // Values at the bottom of the int64 range are renumbered upwards.
        test_support::running_daemon daemon("seqextreme");
        skyline::daemon_client client(daemon.config());
        client.exec_batch({
            statement("CREATE TABLE Extreme (id INTEGER PRIMARY KEY, row_index INTEGER)"),
            statement("INSERT INTO Extreme (row_index) VALUES (-9223372036854775808), (5), (5)"),
        });
        auto reader = daemon.reader();
        migration_context ctx{reader, client, "app.db"};

        skyline::sequential_index_repair fix;
        assert(fix.needs_repair(reader, "Extreme"));
        fix.apply(ctx);
        assert((column_values(reader, "SELECT row_index AS v FROM Extreme ORDER BY id") ==
                std::vector<int64_t>{0, 1, 2}));
        assert(test_support::count_rows(reader,
            "SELECT COUNT(*) FROM Extreme WHERE typeof(row_index) = 'integer'") == 3);
    }

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_column_retirement
// ============================================================================

void test_column_retirement() {
    std::cout << "  test_column_retirement..." << std::flush;

    test_support::running_daemon daemon("retire");
    skyline::daemon_client client(daemon.config());
    client.exec_batch({
        statement("CREATE TABLE Legacy (row_index INTEGER, temp_new_row_index INTEGER, name TEXT)"),
        statement("INSERT INTO Legacy VALUES (0, 10, 'a')"),
        // A UNIQUE column cannot be dropped; it is renamed instead.
        statement("CREATE TABLE Pinned (row_index INTEGER, temp_new_row_index INTEGER UNIQUE)"),
        statement(skyline::schema_writer::metadata_table_ddl("Legacy_Metadata")),
        statement("INSERT INTO Legacy_Metadata (column_index, column_name) VALUES "
                  "(0, 'row_index'), (1, 'TEMP_NEW_ROW_INDEX'), (2, 'name')"),
    });
    auto reader = daemon.reader();
    migration_context ctx{reader, client, "app.db"};

    skyline::column_retirement fix;
    assert(fix.obsolete_name() == "_obsolete_temp_new_row_index");
    fix.apply(ctx);

    auto legacy = reader.get_table_info("Legacy");
    assert(!legacy.count("temp_new_row_index"));
    assert(legacy.count("name"));
    assert(test_support::count_rows(reader, "SELECT COUNT(*) FROM Legacy WHERE name = 'a'") == 1);

    auto pinned = reader.get_table_info("Pinned");
    assert(!pinned.count("temp_new_row_index"));
    assert(pinned.count("_obsolete_temp_new_row_index"));

    assert(test_support::count_rows(reader,
        "SELECT COUNT(*) FROM Legacy_Metadata WHERE deleted = 1") == 1);
    assert(test_support::count_rows(reader,
        "SELECT COUNT(*) FROM Legacy_Metadata WHERE column_name = 'TEMP_NEW_ROW_INDEX' AND deleted = 1") == 1);

    // Running again finds nothing to do.
    fix.apply(ctx);
    assert(reader.get_table_info("Pinned").count("_obsolete_temp_new_row_index"));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_structural_repair
// ============================================================================

void test_structural_repair() {
    std::cout << "  test_structural_repair..." << std::flush;

    test_support::running_daemon daemon("structural");
    skyline::daemon_client client(daemon.config());
    client.exec_batch({
        statement("CREATE TABLE Docs_Metadata (column_index TEXT, column_name TEXT, display_name TEXT, "
                  "data_type TEXT, deleted INTEGER)"),
        statement("INSERT INTO Docs_Metadata VALUES "
                  "('b', 'Title', 'Title', 'TEXT', 0), "
                  "('1.5', 'Body', NULL, NULL, 1), "
                  "('2', 'Author', 'Author', 'INTEGER', 0)"),
        statement(skyline::schema_writer::metadata_table_ddl("Fine_Metadata")),
        statement("INSERT INTO Fine_Metadata (column_index, column_name) VALUES (0, 'x')"),
    });
    auto reader = daemon.reader();
    migration_context ctx{reader, client, "app.db"};

    skyline::structural_repair fix;
    assert(fix.needs_repair(reader, "Docs_Metadata"));
    assert(!fix.needs_repair(reader, "Fine_Metadata"));
    assert(!fix.needs_repair(reader, "Missing_Metadata"));

    fix.apply(ctx);
    assert(!fix.needs_repair(reader, "Docs_Metadata"));
    assert(!reader.table_exists("Docs_Metadata_repair_backup"));

    auto rows = reader.query("SELECT column_index, column_name, data_type, deleted FROM Docs_Metadata ORDER BY column_index");
    assert(rows.size() == 3);
    assert(skyline::as_string(rows[0].at("column_name")) == "Title");
    assert(skyline::as_string(rows[1].at("column_name")) == "Author");
    assert(skyline::as_string(rows[1].at("data_type")) == "INTEGER");
    assert(skyline::as_string(rows[2].at("column_name")) == "Body");
    assert(skyline::as_string(rows[2].at("data_type")) == "TEXT");
    assert(skyline::as_int(rows[2].at("deleted")) == 1);
    assert(skyline::as_int(rows[2].at("column_index")) == 2);

    // Canonical shape: the new table has every metadata column.
    auto info = reader.get_table_info("Docs_Metadata");
    assert(info.count("filter_expr") && info.count("ai_include_in_send"));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_metadata_columns_fix
// ============================================================================

void test_metadata_columns_fix() {
    std::cout << "  test_metadata_columns_fix..." << std::flush;

    test_support::running_daemon daemon("metacols");
    skyline::daemon_client client(daemon.config());
    client.exec_batch({
        statement("CREATE TABLE \"_Metadata\" (table_name TEXT PRIMARY KEY, table_type TEXT)"),
        statement("INSERT INTO \"_Metadata\" VALUES ('Games', 'main')"),
        statement("CREATE TABLE Games_Metadata (column_index INTEGER, column_name TEXT, deleted INTEGER)"),
        statement("INSERT INTO Games_Metadata VALUES (0, 'Title', 0), (1, 'Year', 0)"),
    });
    auto reader = daemon.reader();
    migration_context ctx{reader, client, "app.db"};

    skyline::metadata_columns_fix fix;
    fix.apply(ctx);
    fix.apply(ctx);  // tolerates the columns it added

    assert(reader.get_table_info("Games_Metadata").count("display_name"));
    assert(test_support::count_rows(reader,
        "SELECT COUNT(*) FROM Games_Metadata WHERE display_name = column_name") == 2);
    assert(test_support::count_rows(reader,
        "SELECT COUNT(*) FROM \"_Metadata\" WHERE hidden = 0") == 1);

    auto tables = skyline::metadata_tables(reader);
    assert((tables == std::vector<std::string>{"Games_Metadata"}));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_startup_migrations
// ============================================================================

void test_startup_migrations() {
    std::cout << "  test_startup_migrations..." << std::flush;

    test_support::running_daemon daemon("startup");
    skyline::daemon_client client(daemon.config());
    skyline::schema_writer writer(client);
    writer.create_main_table("Games", {skyline::column_def{"Title"}});
    client.exec_batch({statement("INSERT INTO Games (row_index, Title) VALUES (4, 'x')")});

    auto applied = skyline::run_startup_migrations(client);
    assert(applied.size() == 4);
    assert(applied.front() == "add_metadata_display_name_2025_10_20");
    assert(applied.back() == "repair_metadata_column_index_2025_11_03");
    assert(skyline::run_startup_migrations(client).empty());

    auto reader = daemon.reader();
    assert(test_support::count_rows(reader, "SELECT row_index FROM Games") == 0);

    // Missing database: nothing to do.
    assert(skyline::run_startup_migrations(client, std::string("later.db")).empty());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_startup_migrations_without_daemon: logged, never raised
// ============================================================================

void test_startup_migrations_without_daemon() {
    std::cout << "  test_startup_migrations_without_daemon..." << std::flush;

    test_support::scoped_dir dir("nodaemon");
    const auto data = dir.path / "data";
    std::filesystem::create_directories(data);
    {
        skyline::database local((data / "app.db").string());
        local.execute("CREATE TABLE Games_Metadata (column_index INTEGER, column_name TEXT)");
    }

    skyline::client_config config(data.string(), (dir.path / "no-such-daemon").string());
    config.socket_path = (dir.path / "none.sock").string();
    config.database = "app.db";
    config.retry = test_support::fast_retry();
    skyline::daemon_client client(config);

    assert(skyline::run_startup_migrations(client).empty());

    // Nothing was recorded.
    skyline::database reader((data / "app.db").string(), skyline::database::open_mode::read_only);
    assert(!reader.table_exists(skyline::migration_table));

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Migration tests:" << std::endl;
    test_fix_manager_records_and_skips();
    test_fix_failure_aborts_run();
    test_rolled_back_fix_is_not_recorded();
    test_sequential_index_repair();
    test_column_retirement();
    test_structural_repair();
    test_metadata_columns_fix();
    test_startup_migrations();
    test_startup_migrations_without_daemon();
}

} // namespace migration_tests
