#include "skyline/migration.hpp"
#include "skyline/error.hpp"
#include "skyline/fixes.hpp"
#include "skyline/log.hpp"

#include <filesystem>

namespace skyline {

// ============================================================================
// migration_context
// ============================================================================

batch_result migration_context::exec(statement_list statements) const {
    auto result = client.exec_batch(std::move(statements), database_name);
    if (!result.applied()) {
        throw skyline_error("batch on " + database_name + " was rolled back: " + result.message);
    }
    return result;
}

// ============================================================================
// migration_fix defaults
// ============================================================================

bool migration_fix::is_applied(migration_context& ctx) const {
    if (!ctx.reader.table_exists(migration_table)) {
        return false;
    }
    auto row = ctx.reader.query_value("SELECT 1 FROM migration_fixes WHERE fix_id = ?", {id()});
    return row.has_value();
}

void migration_fix::mark_applied(migration_context& ctx) const {
    ctx.exec({
        statement("CREATE TABLE IF NOT EXISTS migration_fixes ("
                  "id INTEGER PRIMARY KEY AUTOINCREMENT, "
                  "fix_id TEXT UNIQUE NOT NULL, "
                  "description TEXT, "
                  "applied_at DATETIME DEFAULT CURRENT_TIMESTAMP)"),
        statement("INSERT OR IGNORE INTO migration_fixes (fix_id, description) VALUES (?, ?)",
                  {id(), description()}),
    });
}

// ============================================================================
// fix_manager
// ============================================================================

fix_manager::fix_manager(fix_list fixes) : fixes_(std::move(fixes)) {}

void fix_manager::run(migration_fix& fix, migration_context& ctx) {
    const std::string id = fix.id();
    LOG_INFO("migration", "Applying %s: %s", id.c_str(), fix.description().c_str());
    try {
        fix.apply(ctx);
        fix.mark_applied(ctx);
    } catch (const migration_error&) {
        throw;
    } catch (const std::exception& e) {
        LOG_ERROR("migration", "%s failed: %s", id.c_str(), e.what());
        throw migration_error(id, e.what());
    }
}

std::vector<std::string> fix_manager::apply_all(migration_context& ctx) {
    std::vector<std::string> applied;
    for (auto& fix : fixes_) {
        if (fix->is_applied(ctx)) {
            LOG_DEBUG("migration", "%s already applied", fix->id().c_str());
            continue;
        }
        run(*fix, ctx);
        applied.push_back(fix->id());
    }
    if (!applied.empty()) {
        LOG_INFO("migration", "Applied %zu fixes to %s", applied.size(), ctx.database_name.c_str());
    }
    return applied;
}

bool fix_manager::apply_fix_by_id(migration_context& ctx, const std::string& id) {
    for (auto& fix : fixes_) {
        if (fix->id() != id) continue;
        if (fix->is_applied(ctx)) return false;
        run(*fix, ctx);
        return true;
    }
    throw migration_error(id, "no such fix");
}

std::vector<fix_status> fix_manager::list_fixes(migration_context& ctx) const {
    std::vector<fix_status> result;
    for (const auto& fix : fixes_) {
        result.push_back({fix->id(), fix->description(), fix->is_applied(ctx)});
    }
    return result;
}

// ============================================================================
// Startup
// ============================================================================

std::vector<std::string> run_startup_migrations(const daemon_client& client,
                                                const std::optional<std::string>& database) {
    try {
        const std::string name = client.resolve_database(database);
        const auto path = std::filesystem::path(client.config().data_directory) / name;
        if (!std::filesystem::exists(path)) {
            LOG_INFO("migration", "%s does not exist yet, nothing to migrate", path.c_str());
            return {};
        }

        skyline::database reader(path.string(), skyline::database::open_mode::read_only);
        migration_context ctx{reader, client, name};
        fix_manager manager(default_fixes());
        return manager.apply_all(ctx);
    } catch (const skyline_error& e) {
        LOG_ERROR("migration", "Startup migrations FAILED, continuing without them: %s", e.what());
        return {};
    }
}

} // namespace skyline
