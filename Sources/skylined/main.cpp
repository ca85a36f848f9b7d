// skylined - the single writer for every Skyline database in a directory.
//
// Usage: skylined <data-dir>
//
// Socket path and log level come from SKYLINE_SOCKET / SKYLINE_CHANNEL and
// SKYLINE_LOG_LEVEL. Exits quietly if another daemon already answers.

#include <skyline/config.hpp>
#include <skyline/daemon.hpp>
#include <skyline/error.hpp>
#include <skyline/log.hpp>
#include <skyline/transport.hpp>

#include <atomic>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <pthread.h>
#include <thread>

namespace {

bool another_daemon_answers(const std::string& socket_path) {
    try {
        auto stream = skyline::ipc_stream::connect(socket_path);
        return skyline::execute_request(stream, skyline::ping_request{}).is_ok();
    } catch (const skyline::skyline_error&) {
        return false;
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc != 2) {
        std::cerr << "usage: " << argv[0] << " <data-dir>" << std::endl;
        return 2;
    }

    auto config = skyline::client_config::from_environment();
    config.data_directory = std::filesystem::absolute(argv[1]).string();
    const std::string socket_path = config.resolved_socket_path();

    if (another_daemon_answers(socket_path)) {
        LOG_INFO("skylined", "A daemon is already serving %s", socket_path.c_str());
        return 0;
    }

    // Signals are taken by a dedicated thread; every other thread keeps them blocked.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGHUP);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    try {
        skyline::daemon_server server(config.data_directory, socket_path);
        server.start();

        std::atomic<bool> signalled{false};
        std::thread signal_thread([&server, &signalled, signals] {
            int sig = 0;
            if (sigwait(&signals, &sig) == 0) {
                LOG_INFO("skylined", "Received signal %d, shutting down", sig);
            }
            signalled = true;
            server.request_shutdown();
        });

        server.wait();
        server.stop();

        // Unblock the signal thread if the shutdown came from a client.
        if (!signalled) {
            pthread_kill(signal_thread.native_handle(), SIGTERM);
        }
        signal_thread.join();
    } catch (const skyline::skyline_error& e) {
        LOG_ERROR("skylined", "Fatal: %s", e.what());
        return 1;
    }

    LOG_INFO("skylined", "Stopped");
    return 0;
}
