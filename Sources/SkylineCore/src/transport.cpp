#include "skyline/transport.hpp"
#include "skyline/error.hpp"
#include "skyline/log.hpp"

#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <thread>
#include <vector>

extern char** environ;

namespace skyline {

const char* outcome_name(response_outcome outcome) {
    switch (outcome) {
        case response_outcome::success: return "success";
        case response_outcome::missing_metadata_table: return "missing_metadata_table";
        case response_outcome::duplicate_column: return "duplicate_column";
        case response_outcome::hard_error: return "hard_error";
    }
    return "unknown";
}

// ============================================================================
// Daemon auto-start
// ============================================================================

static void report_errno(int fd, int err) {
    ssize_t ignored = ::write(fd, &err, sizeof(err));
    (void)ignored;
}

void spawn_daemon(const std::string& executable,
                  const std::string& data_directory,
                  const std::string& socket_path) {
    if (::access(executable.c_str(), X_OK) != 0) {
        throw transport_error("daemon executable not found at " + executable);
    }

    // Everything the children touch is prepared before fork.
    std::string abs_data_dir = std::filesystem::absolute(data_directory).string();
    const char* exe = executable.c_str();

    std::vector<char*> argv = {
        const_cast<char*>(exe),
        const_cast<char*>(abs_data_dir.c_str()),
        nullptr,
    };

    const std::string socket_env = "SKYLINE_SOCKET=" + socket_path;
    std::vector<char*> envp;
    for (char** e = environ; e && *e; ++e) {
        if (std::strncmp(*e, "SKYLINE_SOCKET=", 15) != 0) envp.push_back(*e);
    }
    envp.push_back(const_cast<char*>(socket_env.c_str()));
    envp.push_back(nullptr);

    // Close-on-exec pipe: EOF means exec succeeded, an int means errno.
    int status_pipe[2];
    if (::pipe2(status_pipe, O_CLOEXEC) != 0) {
        throw transport_error("spawn: pipe2 failed: " + std::string(strerror(errno)));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(status_pipe[0]);
        ::close(status_pipe[1]);
        throw transport_error("spawn: fork failed: " + std::string(strerror(err)));
    }

    if (pid == 0) {
        ::close(status_pipe[0]);
        if (::setsid() < 0) {
            report_errno(status_pipe[1], errno);
            ::_exit(1);
        }
        pid_t grandchild = ::fork();
        if (grandchild < 0) {
            report_errno(status_pipe[1], errno);
            ::_exit(1);
        }
        if (grandchild > 0) {
            ::_exit(0);
        }

        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) ::close(devnull);
        }
        ::execve(exe, argv.data(), envp.data());
        report_errno(status_pipe[1], errno);
        ::_exit(127);
    }

    ::close(status_pipe[1]);

    // Reap the intermediate child; the daemon is re-parented to init.
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        throw transport_error("failed to start daemon " + executable + ": " + strerror(child_errno));
    }
    LOG_INFO("transport", "Started daemon %s for %s", executable.c_str(), abs_data_dir.c_str());
}

// ============================================================================
// Connect with retry
// ============================================================================

ipc_stream connect_with_retry(const std::string& socket_path,
                              const std::string& daemon_executable,
                              const std::string& data_directory,
                              const retry_policy& policy) {
    const int attempts = std::max(1, policy.max_retries);
    bool spawned = false;
    std::string last_error;

    for (int attempt = 0; attempt < attempts; ++attempt) {
        try {
            return ipc_stream::connect(socket_path);
        } catch (const transport_error& e) {
            last_error = e.what();
            LOG_DEBUG("transport", "attempt %d/%d: %s", attempt + 1, attempts, e.what());
        }

        if (!spawned) {
            spawned = true;
            spawn_daemon(daemon_executable, data_directory, socket_path);
            if (attempt + 1 < attempts) {
                std::this_thread::sleep_for(policy.startup_settle);
            }
        } else if (attempt + 1 < attempts) {
            std::this_thread::sleep_for(policy.base_delay * (attempt + 1));
        }
    }

    LOG_ERROR("transport", "Daemon unreachable at %s: %s", socket_path.c_str(), last_error.c_str());
    throw transport_error("could not connect to daemon at " + socket_path + " after " +
                          std::to_string(attempts) + " attempts: " + last_error);
}

// ============================================================================
// Request execution
// ============================================================================

response execute_request(ipc_stream& stream, const request& req) {
    stream.send_frame(encode_request(req));
    return decode_response(stream.receive_frame());
}

static std::string normalized_upper(const std::string& sql) {
    std::string out;
    out.reserve(sql.size());
    bool in_space = true;
    for (unsigned char c : sql) {
        if (std::isspace(c)) {
            if (!in_space) out += ' ';
            in_space = true;
        } else {
            out += static_cast<char>(std::toupper(c));
            in_space = false;
        }
    }
    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

bool is_add_column_statement(const std::string& sql) {
    std::string s = normalized_upper(sql);
    if (s.rfind("ALTER TABLE ", 0) != 0) return false;
    return s.find(" ADD ") != std::string::npos &&
           s.find(" RENAME ") == std::string::npos &&
           s.find(" DROP ") == std::string::npos;
}

response_outcome classify_response(const request& req, const response& resp) {
    if (resp.is_ok()) return response_outcome::success;

    const std::string text = resp.error_text();
    if (text.find("no such table") != std::string::npos &&
        text.find("_Metadata") != std::string::npos) {
        return response_outcome::missing_metadata_table;
    }

    if (text.find("duplicate column name") != std::string::npos) {
        if (auto* batch = std::get_if<exec_batch_request>(&req)) {
            bool only_add_column = !batch->statements.empty() &&
                std::all_of(batch->statements.begin(), batch->statements.end(),
                            [](const statement& s) { return is_add_column_statement(s.sql); });
            if (only_add_column) return response_outcome::duplicate_column;
        }
    }
    return response_outcome::hard_error;
}

} // namespace skyline
