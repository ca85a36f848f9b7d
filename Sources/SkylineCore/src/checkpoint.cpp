#include "skyline/checkpoint.hpp"
#include "skyline/daemon_client.hpp"
#include "skyline/log.hpp"

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace skyline {

bool checkpoint_database(database& db) {
    if (db.journal_mode() != "wal") {
        LOG_DEBUG("checkpoint", "%s is not in WAL mode, skipping", db.path().c_str());
        return false;
    }
    auto result = db.checkpoint();
    if (result.busy) {
        LOG_WARN("checkpoint", "%s: checkpoint blocked by an active connection (%d/%d frames)",
                 db.path().c_str(), result.checkpointed, result.log_frames);
    } else {
        LOG_DEBUG("checkpoint", "%s: %d frames checkpointed", db.path().c_str(), result.checkpointed);
    }
    return true;
}

bool has_pending_wal(const std::string& path) {
    std::error_code ec;
    auto size = fs::file_size(path + "-wal", ec);
    return !ec && size >= min_wal_size;
}

bool checkpoint_database_file(const std::string& path) {
    if (!fs::exists(path) || !has_pending_wal(path)) {
        return false;
    }
    database db(path, database::open_mode::maintenance);
    return checkpoint_database(db);
}

std::vector<std::string> list_database_files(const std::string& directory) {
    std::vector<std::string> files;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        if (entry.is_regular_file(ec) && entry.path().extension() == ".db") {
            files.push_back(entry.path().string());
        }
    }
    if (ec) {
        LOG_WARN("checkpoint", "Cannot scan %s: %s", directory.c_str(), ec.message().c_str());
    }
    std::sort(files.begin(), files.end());
    return files;
}

// ============================================================================
// checkpoint_manager
// ============================================================================

checkpoint_manager::checkpoint_manager(std::string data_directory,
                                       std::chrono::milliseconds interval,
                                       const daemon_client* client)
    : data_directory_(std::move(data_directory))
    , interval_(interval)
    , client_(client) {}

checkpoint_manager::checkpoint_manager(const daemon_client& client)
    : checkpoint_manager(client.config().data_directory, client.config().checkpoint_interval, &client) {}

checkpoint_manager::~checkpoint_manager() {
    stop();
}

size_t checkpoint_manager::checkpoint_all() {
    size_t checkpointed = 0;
    // Re-scan every pass: databases come and go while the app runs.
    for (const auto& path : list_database_files(data_directory_)) {
        if (!has_pending_wal(path)) continue;
        try {
            if (client_) {
                auto result = client_->prepare_for_maintenance(fs::path(path).filename().string());
                if (result.checkpointed) ++checkpointed;
            } else if (checkpoint_database_file(path)) {
                ++checkpointed;
            }
        } catch (const skyline_error& e) {
            ++failures_;
            LOG_ERROR("checkpoint", "Checkpoint of %s failed: %s", path.c_str(), e.what());
        }
    }
    return checkpointed;
}

void checkpoint_manager::start() {
    if (running_.exchange(true)) return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }

    thread_ = std::thread([this] {
        LOG_DEBUG("checkpoint", "Timer started (%lld ms)", static_cast<long long>(interval_.count()));
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stop_requested_) {
            if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
                break;
            }
            lock.unlock();
            size_t n = checkpoint_all();
            ++passes_;
            LOG_DEBUG("checkpoint", "Periodic pass checkpointed %zu databases", n);
            lock.lock();
        }
        LOG_DEBUG("checkpoint", "Timer exiting");
    });
}

void checkpoint_manager::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    running_ = false;
}

size_t checkpoint_manager::on_exit() {
    stop();
    size_t n = checkpoint_all();
    LOG_INFO("checkpoint", "Exit checkpoint: %zu databases", n);
    return n;
}

} // namespace skyline
