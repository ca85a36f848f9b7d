#pragma once

#include "daemon_client.hpp"
#include "db.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace skyline {

/// Table recording which fixes have run.
inline constexpr const char* migration_table = "migration_fixes";

/// What a fix sees: reads through a local query-only handle, writes through the daemon.
struct migration_context {
    const database& reader;
    const daemon_client& client;
    std::string database_name;

    /// Submit one atomic batch against `database_name`. A batch the daemon
    /// rolled back (missing metadata table) throws, so the fix is not
    /// recorded as applied.
    batch_result exec(statement_list statements) const;
};

/// One named, idempotent data repair. Implementations keep their state out
/// of the fix object; everything they need comes from the context.
class migration_fix {
public:
    virtual ~migration_fix() = default;

    /// Stable identifier, recorded once applied ("fix_row_index_duplicates_2025_10_12").
    virtual std::string id() const = 0;
    virtual std::string description() const = 0;

    /// Perform the repair. Throws on failure.
    virtual void apply(migration_context& ctx) = 0;

    /// Default: the id is present in migration_fixes. A database without the
    /// tracking table has applied nothing.
    virtual bool is_applied(migration_context& ctx) const;

    /// Default: record the id (idempotent).
    virtual void mark_applied(migration_context& ctx) const;
};

using fix_list = std::vector<std::unique_ptr<migration_fix>>;

struct fix_status {
    std::string id;
    std::string description;
    bool applied = false;
};

/// Runs a fixed, ordered list of fixes. The list is built once, up front.
class fix_manager {
public:
    explicit fix_manager(fix_list fixes);

    /// Apply every pending fix in order. Stops at the first failure with a
    /// migration_error; fixes before it stay applied. Returns the ids applied
    /// by this call.
    std::vector<std::string> apply_all(migration_context& ctx);

    /// Apply one fix unless already applied. Returns false if it was.
    /// Throws migration_error for an unknown id or a failing fix.
    bool apply_fix_by_id(migration_context& ctx, const std::string& id);

    std::vector<fix_status> list_fixes(migration_context& ctx) const;

    size_t size() const { return fixes_.size(); }

private:
    fix_list fixes_;

    void run(migration_fix& fix, migration_context& ctx);
};

/// Open a reader on the database and apply default_fixes(). A failure is
/// logged loudly and the application carries on. Returns the applied ids.
std::vector<std::string> run_startup_migrations(const daemon_client& client,
                                                const std::optional<std::string>& database = std::nullopt);

} // namespace skyline
