/**
 * @file test_virtual_endpoint.cpp
 * @brief Tests for the virtual port state machine
 * @version 0.1
 * @date 2025-11-10
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <filesystem>
#include <fstream>
#include <sys/stat.h>

#include "../include/pattern/virtual_endpoint.hpp"
#include "test_utils.hpp"

using namespace serialmux;
using namespace serialmux::test;

namespace {

    std::string link_target(const std::string& path) {
        char target[256] = {};
        ssize_t len = ::readlink(path.c_str(), target, sizeof(target) - 1);
        return len < 0 ? std::string() : std::string(target, static_cast<std::size_t>(len));
    }

    bool is_symlink(const std::string& path) {
        struct stat st {};
        return ::lstat(path.c_str(), &st) == 0 && S_ISLNK(st.st_mode);
    }

    Result<std::size_t> read_into(VirtualEndpoint& ep, std::vector<std::uint8_t>& buffer) {
        return ep.read(boost::span<std::uint8_t>(buffer.data(), buffer.size()));
    }

    Result<std::size_t> write_bytes(VirtualEndpoint& ep, const std::vector<std::uint8_t>& data) {
        return ep.write(boost::span<const std::uint8_t>(data.data(), data.size()));
    }

} // namespace

TEST_CASE("VirtualEndpoint::open - Publishes the symlink", "[endpoint]") {
    TempDir dir;
    MockPtyFactory ptys;
    const auto path = dir.file("ttyV0");
    VirtualEndpoint ep(path, ptys.make());

    REQUIRE(ep.state() == EndpointState::ABSENT);
    REQUIRE(ep.open());
    REQUIRE(ep.state() == EndpointState::IDLE);
    REQUIRE(ep.generation() == 1);
    REQUIRE(is_symlink(path));
    REQUIRE(link_target(path) == ep.get_slave_name());
    REQUIRE(ep.verify_link());

    SECTION("Opening twice keeps the same PTY-pair") {
        REQUIRE(ep.open());
        REQUIRE(ep.generation() == 1);
    }
}

TEST_CASE("VirtualEndpoint::open - Replaces a stale symlink", "[endpoint]") {
    TempDir dir;
    MockPtyFactory ptys;
    const auto path = dir.file("ttyV0");
    REQUIRE(::symlink("/dev/pts/left_over", path.c_str()) == 0);

    VirtualEndpoint ep(path, ptys.make());
    REQUIRE(ep.open());
    REQUIRE(link_target(path) == ep.get_slave_name());

    // No staging link is left beside it
    std::size_t entries = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir.path())) {
        (void)entry;
        ++entries;
    }
    REQUIRE(entries == 1);
}

TEST_CASE("VirtualEndpoint::open - Failures leave the endpoint dead", "[endpoint]") {
    TempDir dir;
    MockPtyFactory ptys;
    const auto path = dir.file("ttyV0");

    SECTION("PTY allocation fails") {
        ptys.failing.insert(path);
        VirtualEndpoint ep(path, ptys.make());
        REQUIRE_FALSE(ep.open());
        REQUIRE(ep.state() == EndpointState::DEAD);
        REQUIRE_FALSE(is_symlink(path));
    }

    SECTION("A regular file is never replaced") {
        std::ofstream(path) << "keep me";
        VirtualEndpoint ep(path, ptys.make());
        REQUIRE_FALSE(ep.open());
        REQUIRE(ep.is_dead());
        REQUIRE_FALSE(is_symlink(path));
        REQUIRE_THAT(ep.last_error(), Catch::Matchers::ContainsSubstring("non-symlink"));

        ep.close();
        std::ifstream in(path);
        std::string content;
        std::getline(in, content);
        REQUIRE(content == "keep me");
    }
}

TEST_CASE("VirtualEndpoint::accept_client - Idle to active", "[endpoint][attach]") {
    TempDir dir;
    MockPtyFactory ptys;
    const auto path = dir.file("ttyV0");
    VirtualEndpoint ep(path, ptys.make());
    ep.open();

    REQUIRE_FALSE(ep.accept_client());
    REQUIRE(ep.state() == EndpointState::IDLE);

    ptys.pty(path).attach();
    REQUIRE(ep.accept_client());
    REQUIRE(ep.is_active());

    // Already active: nothing new
    REQUIRE_FALSE(ep.accept_client());

    SECTION("Peer state error kills an idle endpoint") {
        VirtualEndpoint other(dir.file("ttyV1"), ptys.make());
        other.open();
        ptys.pty(dir.file("ttyV1")).closed = true;
        REQUIRE_FALSE(other.accept_client());
        REQUIRE(other.is_dead());
    }
}

TEST_CASE("VirtualEndpoint - I/O guards by state", "[endpoint][io]") {
    TempDir dir;
    MockPtyFactory ptys;
    const auto path = dir.file("ttyV0");
    VirtualEndpoint ep(path, ptys.make());
    std::vector<std::uint8_t> buffer(16);

    SECTION("Idle reports no client") {
        ep.open();
        REQUIRE(read_into(ep, buffer).error() == Status::PNO_CLIENT);
        REQUIRE(write_bytes(ep, bytes("x")).error() == Status::PNO_CLIENT);
        REQUIRE(ptys.pty(path).tx_history.empty());
    }

    SECTION("Dead reports dead") {
        ptys.failing.insert(path);
        ep.open();
        REQUIRE(read_into(ep, buffer).error() == Status::PDEAD);
        REQUIRE(write_bytes(ep, bytes("x")).error() == Status::PDEAD);
    }
}

TEST_CASE("VirtualEndpoint - Active session I/O", "[endpoint][io]") {
    TempDir dir;
    MockPtyFactory ptys;
    const auto path = dir.file("ttyV0");
    VirtualEndpoint ep(path, ptys.make());
    ep.open();
    auto& pty = ptys.pty(path);
    pty.attach();
    ep.accept_client();
    std::vector<std::uint8_t> buffer(16);

    SECTION("Reads client bytes") {
        pty.client_write(bytes("hello"));
        auto r = read_into(ep, buffer);
        REQUIRE(r.value() == 5);
        REQUIRE(std::vector<std::uint8_t>(buffer.begin(), buffer.begin() + 5) == bytes("hello"));
    }

    SECTION("Nothing pending is zero bytes") {
        auto r = read_into(ep, buffer);
        REQUIRE(r.ok());
        REQUIRE(r.value() == 0);
        REQUIRE(ep.is_active());
    }

    SECTION("Writes reach the client") {
        REQUIRE(write_bytes(ep, bytes("data")).value() == 4);
        REQUIRE(tx_bytes(pty) == bytes("data"));
    }

    SECTION("Client not draining drops for this endpoint only") {
        pty.write_capacity = 2;
        pty.write_blocked = false;
        auto r = write_bytes(ep, bytes("abcdef"));
        REQUIRE(r.value() == 6);

        pty.write_blocked = true;
        r = write_bytes(ep, bytes("xyz"));
        REQUIRE(r.ok());
        REQUIRE(r.value() == 0);
        REQUIRE(ep.is_active());
    }

    SECTION("Client closing is detected on read") {
        pty.detach();
        REQUIRE(read_into(ep, buffer).error() == Status::PNO_CLIENT);
        REQUIRE(ep.state() == EndpointState::IDLE);
        REQUIRE(link_target(path) == ep.get_slave_name());
    }

    SECTION("Client closing is detected on write") {
        pty.detach();
        REQUIRE(write_bytes(ep, bytes("x")).error() == Status::PNO_CLIENT);
        REQUIRE(ep.state() == EndpointState::IDLE);
    }

    SECTION("Other errors kill the endpoint") {
        pty.read_errno = EBADF;
        REQUIRE(read_into(ep, buffer).error() == Status::PDEAD);
        REQUIRE(ep.is_dead());
    }

    SECTION("Write error other than EIO kills the endpoint") {
        pty.write_errno = ENXIO;
        REQUIRE(write_bytes(ep, bytes("x")).error() == Status::PDEAD);
        REQUIRE(ep.is_dead());
    }
}

TEST_CASE("VirtualEndpoint::recreate - Fresh PTY-pair at the same path", "[endpoint][recreate]") {
    TempDir dir;
    MockPtyFactory ptys;
    const auto path = dir.file("ttyV0");
    VirtualEndpoint ep(path, ptys.make());
    ep.open();
    auto old_state = ptys.current.at(path);
    const auto old_slave = ep.get_slave_name();

    old_state->read_errno = EBADF;
    old_state->attach();
    ep.accept_client();
    std::vector<std::uint8_t> buffer(4);
    read_into(ep, buffer);
    REQUIRE(ep.is_dead());

    REQUIRE(ep.recreate());
    REQUIRE(ep.state() == EndpointState::IDLE);
    REQUIRE(ep.generation() == 2);
    REQUIRE(ep.get_slave_name() != old_slave);
    REQUIRE(link_target(path) == ep.get_slave_name());
    REQUIRE(old_state->closed);
}

TEST_CASE("VirtualEndpoint::verify_link - Detects tampering", "[endpoint]") {
    TempDir dir;
    MockPtyFactory ptys;
    const auto path = dir.file("ttyV0");
    VirtualEndpoint ep(path, ptys.make());
    ep.open();

    SECTION("Link removed") {
        ::unlink(path.c_str());
        REQUIRE_FALSE(ep.verify_link());
    }

    SECTION("Link redirected") {
        ::unlink(path.c_str());
        REQUIRE(::symlink("/dev/null", path.c_str()) == 0);
        REQUIRE_FALSE(ep.verify_link());
    }

    SECTION("Nothing published is trivially fine") {
        ep.close();
        REQUIRE(ep.verify_link());
    }
}

TEST_CASE("VirtualEndpoint::close - Removes the link once", "[endpoint]") {
    TempDir dir;
    MockPtyFactory ptys;
    const auto path = dir.file("ttyV0");

    {
        VirtualEndpoint ep(path, ptys.make());
        ep.open();
        auto state = ptys.current.at(path);

        ep.close();
        REQUIRE(ep.state() == EndpointState::ABSENT);
        REQUIRE_FALSE(is_symlink(path));
        REQUIRE(state->close_count == 1);

        ep.close();
        REQUIRE(state->close_count == 1);
    }

    SECTION("Destructor removes the link") {
        {
            VirtualEndpoint ep(path, ptys.make());
            ep.open();
            REQUIRE(is_symlink(path));
        }
        REQUIRE_FALSE(is_symlink(path));
    }
}

TEST_CASE("VirtualEndpoint - Real PTY session", "[endpoint][pty]") {
    TempDir dir;
    const auto path = dir.file("ttyV0");
    auto ep = VirtualEndpoint::create(path);
    REQUIRE(ep->open());
    std::vector<std::uint8_t> buffer(64);

    REQUIRE_FALSE(ep->accept_client());

    {
        PtyClient client(path);  // opened through the symlink
        REQUIRE(ep->accept_client());

        REQUIRE(client.write(bytes("AT")) == 2);
        std::vector<std::uint8_t> received;
        for (int i = 0; i < 100 && received.size() < 2; ++i) {
            auto r = read_into(*ep, buffer);
            REQUIRE(r.ok());
            received.insert(received.end(), buffer.begin(), buffer.begin() + r.value());
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        REQUIRE(received == bytes("AT"));

        REQUIRE(write_bytes(*ep, bytes("OK")).value() == 2);
        REQUIRE(client.read_for(2) == bytes("OK"));
    }

    // Client gone: the session ends, the port stays
    auto r = read_into(*ep, buffer);
    REQUIRE(r.error() == Status::PNO_CLIENT);
    REQUIRE(ep->state() == EndpointState::IDLE);
    REQUIRE(ep->verify_link());

    PtyClient second(path);
    REQUIRE(ep->accept_client());
    REQUIRE(ep->generation() == 1);
}
