#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace skyline {

/// Resolve a channel name to a Unix domain socket path.
/// $XDG_RUNTIME_DIR/skyline/<channel>.sock (fallback: /tmp/skyline-<uid>/<channel>.sock)
std::string resolve_ipc_socket_path(const std::string& channel);

// ============================================================================
// Length-prefix framing helpers
// ============================================================================

/// Largest payload a peer may announce (256 MB).
constexpr uint32_t max_frame_size = 1u << 28;

/// Write a length-prefixed frame to a file descriptor.
/// Format: [4 bytes little-endian length][payload]
/// Returns true only if every byte was written.
bool write_length_prefixed(int fd, const void* data, uint32_t length);

enum class frame_status {
    ok,
    closed,     ///< peer closed cleanly before a new frame started
    truncated,  ///< stream ended (or failed) inside a frame
    oversized   ///< announced length exceeds max_frame_size
};

/// Read exactly one length-prefixed frame into `payload`.
frame_status read_length_prefixed(int fd, std::vector<uint8_t>& payload);

// ============================================================================
// ipc_stream: one connected, blocking socket
// ============================================================================

class ipc_stream {
public:
    ipc_stream() = default;

    /// Take ownership of an already-connected descriptor.
    explicit ipc_stream(int fd) : fd_(fd) {}

    ~ipc_stream();

    ipc_stream(const ipc_stream&) = delete;
    ipc_stream& operator=(const ipc_stream&) = delete;

    ipc_stream(ipc_stream&& other) noexcept;
    ipc_stream& operator=(ipc_stream&& other) noexcept;

    /// Connect to a listening socket. Throws transport_error.
    static ipc_stream connect(const std::string& socket_path);

    /// Send one frame. Throws transport_error on a short write.
    void send_frame(const std::string& body);

    /// Receive one frame. Throws transport_error when the peer goes away and
    /// protocol_error when the frame is oversized.
    std::string receive_frame();

    /// Like receive_frame, but a clean end of stream yields false.
    bool try_receive_frame(std::string& body);

    /// Bound blocking reads on this socket.
    void set_receive_timeout(std::chrono::milliseconds timeout);

    bool is_open() const { return fd_ >= 0; }
    int fd() const { return fd_; }
    void close();

private:
    int fd_ = -1;
};

// ============================================================================
// IPC Server: listens on a Unix domain socket, accepts connections
// ============================================================================

class ipc_server {
public:
    /// Callback invoked on the accept thread for each accepted connection.
    using accept_callback = std::function<void(ipc_stream)>;

    explicit ipc_server(const std::string& socket_path);
    ~ipc_server();

    // Non-copyable
    ipc_server(const ipc_server&) = delete;
    ipc_server& operator=(const ipc_server&) = delete;

    /// Start listening and accepting connections in a background thread.
    void start(accept_callback callback);

    /// Stop accepting without joining. Safe to call from the accept thread.
    void interrupt();

    /// Stop accepting, join the accept thread, close the listen socket.
    void stop();

    /// Returns true if the server is currently listening.
    bool is_listening() const { return is_listening_.load(); }

    /// The socket path this server is bound to.
    const std::string& socket_path() const { return socket_path_; }

private:
    std::string socket_path_;
    int listen_fd_ = -1;
    std::atomic<bool> is_listening_{false};
    std::atomic<bool> should_stop_{false};
    std::atomic<bool> unlinked_{false};
    std::thread accept_thread_;

    void unlink_socket();
};

} // namespace skyline
