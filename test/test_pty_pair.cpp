/**
 * @file test_pty_pair.cpp
 * @brief Tests for PtyPair against real pseudo-terminals
 * @version 0.1
 * @date 2025-11-10
 */

#include <catch2/catch_test_macros.hpp>
#include <sys/stat.h>

#include "../include/io/pty_pair.hpp"
#include "test_utils.hpp"

using namespace serialmux;
using namespace serialmux::test;

TEST_CASE("PtyPair - Allocation", "[pty]") {
    PtyPair pty;

    REQUIRE(pty.is_open());
    REQUIRE(pty.get_fd() >= 0);
    REQUIRE(pty.get_slave_name().rfind("/dev/pts/", 0) == 0);
    REQUIRE(pty.get_path() == pty.get_slave_name());

    SECTION("Slave node is world read/writable") {
        struct stat st {};
        REQUIRE(::stat(pty.get_slave_name().c_str(), &st) == 0);
        REQUIRE((st.st_mode & 0666) == 0666);
    }

    SECTION("Master is non-blocking") {
        REQUIRE((::fcntl(pty.get_fd(), F_GETFL) & O_NONBLOCK) != 0);
    }

    SECTION("Every allocation is a fresh pair") {
        PtyPair other;
        REQUIRE(other.get_slave_name() != pty.get_slave_name());
    }
}

TEST_CASE("PtyPair::peer_state - Tracks client presence", "[pty][attach]") {
    PtyPair pty;
    REQUIRE(pty.peer_state() == PeerState::ABSENT);

    {
        PtyClient client(pty.get_slave_name());
        REQUIRE(pty.peer_state() == PeerState::PRESENT);
    }

    REQUIRE(pty.peer_state() == PeerState::ABSENT);

    PtyClient again(pty.get_slave_name());
    REQUIRE(pty.peer_state() == PeerState::PRESENT);
}

TEST_CASE("PtyPair - Data both ways with a client", "[pty][io]") {
    PtyPair pty;
    PtyClient client(pty.get_slave_name());

    SECTION("Client to master") {
        REQUIRE(client.write(bytes("ping")) == 4);
        auto received = PtyClient::read_until(pty.get_fd(), 4, std::chrono::milliseconds(500));
        REQUIRE(received == bytes("ping"));
    }

    SECTION("Master to client, binary safe") {
        std::vector<std::uint8_t> payload = {0x00, 0x0D, 0x0A, 0x03, 0x7F, 0xFF};
        REQUIRE(pty.write(payload.data(), payload.size()) ==
            static_cast<ssize_t>(payload.size()));
        REQUIRE(client.read_for(payload.size()) == payload);
    }

    SECTION("Nothing pending reads as EAGAIN") {
        std::uint8_t buffer[8];
        errno = 0;
        REQUIRE(pty.read(buffer, sizeof(buffer)) == -1);
        REQUIRE(errno == EAGAIN);
    }
}

TEST_CASE("PtyPair - No client means EIO", "[pty][io]") {
    PtyPair pty;
    std::uint8_t buffer[8] = {};

    SECTION("Read") {
        errno = 0;
        REQUIRE(pty.read(buffer, sizeof(buffer)) == -1);
        REQUIRE(errno == EIO);
    }

    SECTION("Read after the client left") {
        { PtyClient client(pty.get_slave_name()); }
        errno = 0;
        REQUIRE(pty.read(buffer, sizeof(buffer)) == -1);
        REQUIRE(errno == EIO);
    }

    SECTION("Write") {
        errno = 0;
        REQUIRE(pty.write(buffer, sizeof(buffer)) == -1);
        REQUIRE(errno == EIO);
    }
}

TEST_CASE("PtyPair::close - Idempotent", "[pty]") {
    PtyPair pty;
    pty.close();
    pty.close();

    REQUIRE_FALSE(pty.is_open());
    REQUIRE(pty.get_fd() == -1);
    REQUIRE(pty.peer_state() == PeerState::ERROR);

    std::uint8_t byte = 0;
    REQUIRE(pty.read(&byte, 1) == -1);
    REQUIRE(errno == EBADF);
}
