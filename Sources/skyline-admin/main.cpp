// skyline-admin - maintenance commands against the running daemon.
//
//   skyline-admin ping
//   skyline-admin shutdown
//   skyline-admin checkpoint
//   skyline-admin migrate [db]
//   skyline-admin list-fixes [db]
//   skyline-admin cascade <db> <table> <old-value> <new-value>
//
// Configuration comes from SKYLINE_* environment variables.

#include <skyline/cascade.hpp>
#include <skyline/checkpoint.hpp>
#include <skyline/daemon_client.hpp>
#include <skyline/error.hpp>
#include <skyline/fixes.hpp>
#include <skyline/log.hpp>
#include <skyline/migration.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

void usage() {
    std::cerr << "usage: skyline-admin ping | shutdown | checkpoint | migrate [db] | "
                 "list-fixes [db] | cascade <db> <table> <old> <new>" << std::endl;
}

std::string database_path(const skyline::daemon_client& client, const std::string& name) {
    return (std::filesystem::path(client.config().data_directory) / name).string();
}

int run(const std::vector<std::string>& args) {
    skyline::daemon_client client(skyline::client_config::from_environment());
    const std::string& command = args[0];
    auto arg = [&](size_t i) -> std::optional<std::string> {
        if (i < args.size()) return args[i];
        return std::nullopt;
    };

    if (command == "ping") {
        bool alive = client.ping();
        std::cout << (alive ? "alive" : "not running") << std::endl;
        return alive ? 0 : 1;
    }

    if (command == "shutdown") {
        std::cout << (client.shutdown_daemon() ? "stopped" : "not running") << std::endl;
        return 0;
    }

    if (command == "checkpoint") {
        skyline::checkpoint_manager manager(client);
        size_t n = manager.checkpoint_all();
        std::cout << n << " database(s) checkpointed" << std::endl;
        return manager.failures() == 0 ? 0 : 1;
    }

    if (command == "migrate" || command == "list-fixes") {
        const std::string name = client.resolve_database(arg(1));
        skyline::database reader(database_path(client, name), skyline::database::open_mode::read_only);
        skyline::migration_context ctx{reader, client, name};
        skyline::fix_manager manager(skyline::default_fixes());

        if (command == "migrate") {
            auto applied = manager.apply_all(ctx);
            for (const auto& id : applied) std::cout << "applied " << id << std::endl;
            if (applied.empty()) std::cout << "nothing to apply" << std::endl;
        } else {
            for (const auto& status : manager.list_fixes(ctx)) {
                std::cout << (status.applied ? "[x] " : "[ ] ") << status.id
                          << "  " << status.description << std::endl;
            }
        }
        return 0;
    }

    if (command == "cascade") {
        if (args.size() != 5) {
            usage();
            return 2;
        }
        skyline::database reader(database_path(client, args[1]), skyline::database::open_mode::read_only);
        skyline::cascade_engine engine(reader, client, args[1]);
        auto report = engine.propagate(args[2], args[3], args[4]);
        if (!report.applied) {
            std::cerr << "cascade rolled back: a metadata table is missing" << std::endl;
            return 1;
        }
        std::cout << report.rows_updated << " row(s) in " << report.tables_visited
                  << " table(s) updated" << std::endl;
        return 0;
    }

    usage();
    return 2;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        usage();
        return 2;
    }
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        return run(args);
    } catch (const skyline::transport_error& e) {
        LOG_ERROR("skyline-admin", "%s", e.what());
        std::cerr << skyline::transport_error::user_message() << std::endl;
        return 1;
    } catch (const skyline::skyline_error& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
}
