#include "skyline/ipc.hpp"
#include "skyline/error.hpp"
#include "skyline/log.hpp"

#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>

namespace skyline {

// ============================================================================
// Channel → socket path resolution
// ============================================================================

std::string resolve_ipc_socket_path(const std::string& channel) {
    // $XDG_RUNTIME_DIR/skyline/<channel>.sock
    // Fallback: /tmp/skyline-<uid>/<channel>.sock
    const char* runtime_dir = getenv("XDG_RUNTIME_DIR");
    std::string dir;
    if (runtime_dir && runtime_dir[0] != '\0') {
        dir = std::string(runtime_dir) + "/skyline";
    } else {
        dir = "/tmp/skyline-" + std::to_string(getuid());
    }
    std::filesystem::create_directories(dir);
    return dir + "/" + channel + ".sock";
}

// ============================================================================
// Length-prefix framing
// ============================================================================

static bool write_all(int fd, const uint8_t* data, size_t length) {
    size_t written = 0;
    while (written < length) {
        ssize_t n = ::send(fd, data + written, length - written, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        written += static_cast<size_t>(n);
    }
    return true;
}

// Returns the number of bytes read before EOF/error.
static size_t read_all(int fd, uint8_t* data, size_t length) {
    size_t received = 0;
    while (received < length) {
        ssize_t n = ::read(fd, data + received, length - received);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        received += static_cast<size_t>(n);
    }
    return received;
}

bool write_length_prefixed(int fd, const void* data, uint32_t length) {
    uint8_t hdr[4] = {
        static_cast<uint8_t>(length & 0xFF),
        static_cast<uint8_t>((length >> 8) & 0xFF),
        static_cast<uint8_t>((length >> 16) & 0xFF),
        static_cast<uint8_t>((length >> 24) & 0xFF),
    };
    if (!write_all(fd, hdr, sizeof(hdr))) return false;
    return write_all(fd, static_cast<const uint8_t*>(data), length);
}

frame_status read_length_prefixed(int fd, std::vector<uint8_t>& payload) {
    payload.clear();

    uint8_t hdr[4];
    size_t got = read_all(fd, hdr, sizeof(hdr));
    if (got == 0) return frame_status::closed;
    if (got < sizeof(hdr)) return frame_status::truncated;

    uint32_t length = static_cast<uint32_t>(hdr[0])
                    | (static_cast<uint32_t>(hdr[1]) << 8)
                    | (static_cast<uint32_t>(hdr[2]) << 16)
                    | (static_cast<uint32_t>(hdr[3]) << 24);
    if (length > max_frame_size) return frame_status::oversized;

    payload.resize(length);
    if (read_all(fd, payload.data(), length) < length) {
        payload.clear();
        return frame_status::truncated;
    }
    return frame_status::ok;
}

// ============================================================================
// ipc_stream implementation
// ============================================================================

ipc_stream::~ipc_stream() {
    close();
}

ipc_stream::ipc_stream(ipc_stream&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

ipc_stream& ipc_stream::operator=(ipc_stream&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

ipc_stream ipc_stream::connect(const std::string& socket_path) {
    struct sockaddr_un addr{};
    if (socket_path.size() >= sizeof(addr.sun_path)) {
        throw transport_error("ipc: socket path too long: " + socket_path);
    }

    int sock = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (sock < 0) {
        throw transport_error("ipc: socket() failed: " + std::string(strerror(errno)));
    }

    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(sock, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        ::close(sock);
        throw transport_error("ipc: connect(" + socket_path + ") failed: " + std::string(strerror(err)));
    }
    return ipc_stream(sock);
}

void ipc_stream::send_frame(const std::string& body) {
    if (fd_ < 0) {
        throw transport_error("ipc: send on closed stream");
    }
    if (body.size() > max_frame_size) {
        throw protocol_error("ipc: frame of " + std::to_string(body.size()) + " bytes exceeds limit");
    }
    if (!write_length_prefixed(fd_, body.data(), static_cast<uint32_t>(body.size()))) {
        throw transport_error("ipc: short write: " + std::string(strerror(errno)));
    }
}

bool ipc_stream::try_receive_frame(std::string& body) {
    if (fd_ < 0) {
        throw transport_error("ipc: receive on closed stream");
    }
    std::vector<uint8_t> payload;
    switch (read_length_prefixed(fd_, payload)) {
        case frame_status::ok:
            body.assign(payload.begin(), payload.end());
            return true;
        case frame_status::closed:
            return false;
        case frame_status::truncated:
            throw transport_error("ipc: short read, stream ended inside a frame");
        case frame_status::oversized:
            throw protocol_error("ipc: peer announced a frame larger than the limit");
    }
    return false;
}

std::string ipc_stream::receive_frame() {
    std::string body;
    if (!try_receive_frame(body)) {
        throw transport_error("ipc: connection closed before a response arrived");
    }
    return body;
}

void ipc_stream::set_receive_timeout(std::chrono::milliseconds timeout) {
    struct timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
        LOG_WARN("ipc", "setsockopt(SO_RCVTIMEO) failed: %s", strerror(errno));
    }
}

void ipc_stream::close() {
    int fd = fd_;
    fd_ = -1;
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
        ::close(fd);
    }
}

// ============================================================================
// ipc_server implementation
// ============================================================================

ipc_server::ipc_server(const std::string& socket_path)
    : socket_path_(socket_path) {}

ipc_server::~ipc_server() {
    stop();
}

void ipc_server::start(accept_callback callback) {
    if (is_listening_) return;

    // Remove stale socket file if it exists
    ::unlink(socket_path_.c_str());

    struct sockaddr_un addr{};
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        throw transport_error("ipc_server: socket path too long: " + socket_path_);
    }

    listen_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0) {
        throw transport_error("ipc_server: socket() failed: " + std::string(strerror(errno)));
    }

    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (::bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        ::close(listen_fd_);
        listen_fd_ = -1;
        throw transport_error("ipc_server: bind() failed: " + std::string(strerror(err)));
    }

    if (::listen(listen_fd_, 16) < 0) {
        int err = errno;
        ::close(listen_fd_);
        listen_fd_ = -1;
        ::unlink(socket_path_.c_str());
        throw transport_error("ipc_server: listen() failed: " + std::string(strerror(err)));
    }

    is_listening_ = true;
    should_stop_ = false;
    unlinked_ = false;

    accept_thread_ = std::thread([this, cb = std::move(callback)]() {
        LOG_DEBUG("ipc_server", "Accept thread started on %s", socket_path_.c_str());
        while (!should_stop_) {
            int client_fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
            if (client_fd < 0) {
                if (should_stop_ || errno == EBADF || errno == EINVAL) break;
                LOG_DEBUG("ipc_server", "accept() error: %s", strerror(errno));
                continue;
            }
            LOG_DEBUG("ipc_server", "Accepted client fd=%d", client_fd);
            cb(ipc_stream(client_fd));
        }
        LOG_DEBUG("ipc_server", "Accept thread exiting");
    });
}

void ipc_server::interrupt() {
    should_stop_ = true;
    is_listening_ = false;
    if (listen_fd_ >= 0) {
        ::shutdown(listen_fd_, SHUT_RDWR);
    }
    unlink_socket();
}

void ipc_server::stop() {
    if (!is_listening_ && listen_fd_ < 0) return;

    interrupt();

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
}

void ipc_server::unlink_socket() {
    // Only once: a successor daemon may already own the path.
    if (!unlinked_.exchange(true)) {
        ::unlink(socket_path_.c_str());
    }
}

} // namespace skyline
