#pragma once

#include "TestSupport.hpp"
#include <skyline/error.hpp>
#include <skyline/ipc.hpp>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <thread>
#include <chrono>
#include <filesystem>
#include <sys/socket.h>
#include <unistd.h>

namespace ipc_tests {

// ============================================================================
// test_resolve_ipc_socket_path: channel name resolves to correct path
// ============================================================================

void test_resolve_ipc_socket_path() {
    std::cout << "  test_resolve_ipc_socket_path..." << std::flush;

    auto path = skyline::resolve_ipc_socket_path("test_channel");

    // Should end with the channel name + .sock
    assert(path.find("test_channel.sock") != std::string::npos);
    assert(path.find("skyline") != std::string::npos);

    // Directory should have been created
    auto dir = std::filesystem::path(path).parent_path();
    assert(std::filesystem::exists(dir));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_length_prefix_framing: little-endian header, exact payloads
// ============================================================================

void test_length_prefix_framing() {
    std::cout << "  test_length_prefix_framing..." << std::flush;

    int fds[2];
    int ret = socketpair(AF_UNIX, SOCK_STREAM, 0, fds);
    assert(ret == 0);

    // Header bytes are little-endian
    std::string msg = "Hello, IPC!";
    bool ok = skyline::write_length_prefixed(fds[0], msg.data(), static_cast<uint32_t>(msg.size()));
    assert(ok);
    uint8_t hdr[4];
    assert(::read(fds[1], hdr, 4) == 4);
    assert(hdr[0] == msg.size() && hdr[1] == 0 && hdr[2] == 0 && hdr[3] == 0);
    char body[32];
    assert(::read(fds[1], body, msg.size()) == static_cast<ssize_t>(msg.size()));
    assert(std::string(body, msg.size()) == msg);

    // Two frames back to back are read one at a time
    std::vector<uint8_t> payload;
    assert(skyline::write_length_prefixed(fds[0], "ab", 2));
    assert(skyline::write_length_prefixed(fds[0], "cde", 3));
    assert(skyline::read_length_prefixed(fds[1], payload) == skyline::frame_status::ok);
    assert(std::string(payload.begin(), payload.end()) == "ab");
    assert(skyline::read_length_prefixed(fds[1], payload) == skyline::frame_status::ok);
    assert(std::string(payload.begin(), payload.end()) == "cde");

    // Empty frame is a valid frame
    assert(skyline::write_length_prefixed(fds[0], "", 0));
    assert(skyline::read_length_prefixed(fds[1], payload) == skyline::frame_status::ok);
    assert(payload.empty());

    // Large message (1MB): needs concurrent read/write since socket
    // buffers are finite.
    std::string large(1'000'000, 'X');
    std::vector<uint8_t> large_result;
    skyline::frame_status large_status = skyline::frame_status::closed;
    std::thread reader([&]() {
        large_status = skyline::read_length_prefixed(fds[1], large_result);
    });
    ok = skyline::write_length_prefixed(fds[0], large.data(), static_cast<uint32_t>(large.size()));
    assert(ok);
    reader.join();
    assert(large_status == skyline::frame_status::ok);
    assert(large_result.size() == 1'000'000);

    close(fds[0]);
    close(fds[1]);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_short_and_oversized_frames: partial frames never parse
// ============================================================================

void test_short_and_oversized_frames() {
    std::cout << "  test_short_and_oversized_frames..." << std::flush;

    std::vector<uint8_t> payload;

    // Clean close before a frame
    {
        int fds[2];
        assert(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
        close(fds[0]);
        assert(skyline::read_length_prefixed(fds[1], payload) == skyline::frame_status::closed);

        skyline::ipc_stream stream(fds[1]);
        std::string body;
        assert(!stream.try_receive_frame(body));
    }

    // Header announces 10 bytes, only 3 arrive
    {
        int fds[2];
        assert(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
        uint8_t partial[] = {10, 0, 0, 0, 'a', 'b', 'c'};
        assert(::write(fds[0], partial, sizeof(partial)) == static_cast<ssize_t>(sizeof(partial)));
        close(fds[0]);

        skyline::ipc_stream stream(fds[1]);
        bool threw = false;
        try {
            stream.receive_frame();
        } catch (const skyline::transport_error&) {
            threw = true;
        }
        assert(threw);
    }

    // Header cut in half
    {
        int fds[2];
        assert(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
        uint8_t half[] = {1, 0};
        assert(::write(fds[0], half, sizeof(half)) == 2);
        close(fds[0]);
        assert(skyline::read_length_prefixed(fds[1], payload) == skyline::frame_status::truncated);
        close(fds[1]);
    }

    // Length above the 256 MB limit
    {
        int fds[2];
        assert(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
        uint8_t huge[] = {0xFF, 0xFF, 0xFF, 0xFF};
        assert(::write(fds[0], huge, sizeof(huge)) == 4);

        skyline::ipc_stream stream(fds[1]);
        bool threw = false;
        try {
            stream.receive_frame();
        } catch (const skyline::protocol_error&) {
            threw = true;
        }
        assert(threw);
        close(fds[0]);
    }

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_ipc_server_round_trip: server accepts, stream sends and receives
// ============================================================================

void test_ipc_server_round_trip() {
    std::cout << "  test_ipc_server_round_trip..." << std::flush;

    test_support::scoped_dir dir("ipc");
    auto socket_path = (dir.path / "echo.sock").string();

    std::atomic<int> accepted{0};
    skyline::ipc_server server(socket_path);
    server.start([&](skyline::ipc_stream client) {
        ++accepted;
        std::string body;
        while (client.try_receive_frame(body)) {
            client.send_frame("echo:" + body);
        }
    });
    assert(server.is_listening());

    {
        auto stream = skyline::ipc_stream::connect(socket_path);
        stream.send_frame("one");
        assert(stream.receive_frame() == "echo:one");
        stream.send_frame("two");
        assert(stream.receive_frame() == "echo:two");
    }

    server.stop();
    assert(!server.is_listening());
    assert(accepted == 1);
    assert(!std::filesystem::exists(socket_path));

    // Nobody listening any more
    bool threw = false;
    try {
        skyline::ipc_stream::connect(socket_path);
    } catch (const skyline::transport_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "IPC tests:" << std::endl;
    test_resolve_ipc_socket_path();
    test_length_prefix_framing();
    test_short_and_oversized_frames();
    test_ipc_server_round_trip();
}

} // namespace ipc_tests
