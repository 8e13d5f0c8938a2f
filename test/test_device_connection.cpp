/**
 * @file test_device_connection.cpp
 * @brief Unit tests for the device connection state machine
 * @version 0.1
 * @date 2025-11-10
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "../include/pattern/device_connection.hpp"
#include "test_utils.hpp"

using namespace serialmux;
using namespace serialmux::test;
using namespace std::chrono_literals;

namespace {

    std::unique_ptr<DeviceConnection> make_device(MockDeviceFactory& factory,
        std::size_t tx_queue_bytes = DeviceConnection::DEFAULT_TX_QUEUE_BYTES) {
        return std::make_unique<DeviceConnection>("/dev/mock_serial", 115200, factory.make(),
            2000ms, tx_queue_bytes);
    }

    Result<std::size_t> read_into(DeviceConnection& device, std::vector<std::uint8_t>& buffer) {
        return device.read_chunk(boost::span<std::uint8_t>(buffer.data(), buffer.size()));
    }

    Result<std::size_t> write_bytes(DeviceConnection& device, const std::vector<std::uint8_t>& data) {
        return device.write_chunk(boost::span<const std::uint8_t>(data.data(), data.size()));
    }

} // namespace

TEST_CASE("DeviceConnection - Construction", "[device]") {
    SECTION("Starts disconnected without opening anything") {
        MockDeviceFactory factory;
        auto device = make_device(factory);
        REQUIRE(device->state() == DeviceState::DISCONNECTED);
        REQUIRE(factory.open_calls == 0);
        REQUIRE(device->get_fd() == -1);
    }

    SECTION("Empty factory throws") {
        REQUIRE_THROWS_AS(DeviceConnection("/dev/x", 9600, nullptr), std::invalid_argument);
    }

    SECTION("Zero-sized queue throws") {
        MockDeviceFactory factory;
        REQUIRE_THROWS_AS(make_device(factory, 0), std::invalid_argument);
    }
}

TEST_CASE("DeviceConnection::poll - First attempt is immediate", "[device][reconnect]") {
    MockDeviceFactory factory;
    auto device = make_device(factory);

    REQUIRE(device->poll(DeviceConnection::Clock::now()) == DeviceState::CONNECTED);
    REQUIRE(factory.open_calls == 1);
    REQUIRE(device->attempts() == 1);
    REQUIRE(device->connects() == 1);
}

TEST_CASE("DeviceConnection::poll - Retries on a fixed interval", "[device][reconnect]") {
    MockDeviceFactory factory;
    factory.available = false;
    auto device = make_device(factory);
    auto t0 = DeviceConnection::Clock::now();

    device->poll(t0);
    REQUIRE(factory.open_calls == 1);
    REQUIRE(device->state() == DeviceState::DISCONNECTED);
    REQUIRE(device->next_attempt() == t0 + 2000ms);

    // Polling more often than the interval does not open more often
    device->poll(t0 + 500ms);
    device->poll(t0 + 1999ms);
    REQUIRE(factory.open_calls == 1);

    device->poll(t0 + 2000ms);
    REQUIRE(factory.open_calls == 2);

    SECTION("Never gives up") {
        for (int i = 2; i < 50; ++i) {
            device->poll(t0 + std::chrono::milliseconds(2000 * i));
        }
        REQUIRE(factory.open_calls == 50);
        REQUIRE(device->connects() == 0);
    }

    SECTION("Connects once the device appears") {
        factory.replug();
        REQUIRE(device->poll(t0 + 4000ms) == DeviceState::CONNECTED);
        REQUIRE(factory.open_calls == 3);
    }
}

TEST_CASE("DeviceConnection::read_chunk - Data and idle reads", "[device][read]") {
    MockDeviceFactory factory;
    auto device = make_device(factory);
    device->poll(DeviceConnection::Clock::now());
    std::vector<std::uint8_t> buffer(64);

    SECTION("Nothing ready is success with zero bytes") {
        auto r = read_into(*device, buffer);
        REQUIRE(r.ok());
        REQUIRE(r.value() == 0);
        REQUIRE(device->is_connected());
    }

    SECTION("Returns buffered bytes") {
        factory.line->rx_queue.push_back(bytes("hello"));
        auto r = read_into(*device, buffer);
        REQUIRE(r.ok());
        REQUIRE(r.value() == 5);
        REQUIRE(std::string(buffer.begin(), buffer.begin() + 5) == "hello");
    }

    SECTION("Interrupted read is not a failure") {
        factory.line->read_errno = EINTR;
        auto r = read_into(*device, buffer);
        REQUIRE(r.ok());
        REQUIRE(device->is_connected());
    }
}

TEST_CASE("DeviceConnection::read_chunk - Loss closes and reopens immediately",
    "[device][read][reconnect]") {
    MockDeviceFactory factory;
    auto device = make_device(factory);
    auto t0 = DeviceConnection::Clock::now();
    device->poll(t0);
    std::vector<std::uint8_t> buffer(64);

    SECTION("End of stream") {
        factory.line->eof = true;
        auto r = read_into(*device, buffer);
        REQUIRE(r.fail());
        REQUIRE(r.error() == Status::DDISCONNECTED);
    }

    SECTION("I/O error") {
        factory.line->read_errno = EIO;
        auto r = read_into(*device, buffer);
        REQUIRE(r.error() == Status::DREAD_ERROR);
        REQUIRE(r.error_chain().size() == 2);
        REQUIRE_THAT(r.error_chain().front(), Catch::Matchers::ContainsSubstring("/dev/mock_serial"));
        REQUIRE(r.error_chain().back() == "read_chunk");
    }

    REQUIRE(device->state() == DeviceState::DISCONNECTED);
    REQUIRE(device->disconnects() == 1);
    REQUIRE(factory.line->close_count == 1);

    // The old handle is closed before the next open, which is not delayed
    factory.line->eof = false;
    factory.line->read_errno = 0;
    REQUIRE(device->poll(t0) == DeviceState::CONNECTED);
    REQUIRE(factory.open_calls == 2);
}

TEST_CASE("DeviceConnection - Unplug then replug", "[device][reconnect]") {
    MockDeviceFactory factory;
    auto device = make_device(factory);
    auto t0 = DeviceConnection::Clock::now();
    device->poll(t0);
    std::vector<std::uint8_t> buffer(64);

    factory.unplug();
    REQUIRE(read_into(*device, buffer).error() == Status::DREAD_ERROR);

    device->poll(t0 + 10ms);   // immediate reopen, fails
    REQUIRE(factory.open_calls == 2);
    device->poll(t0 + 1000ms);
    REQUIRE(factory.open_calls == 2);

    factory.replug();
    REQUIRE(device->poll(t0 + 2010ms) == DeviceState::CONNECTED);
    REQUIRE(device->connects() == 2);

    factory.line->rx_queue.push_back(bytes("back"));
    REQUIRE(read_into(*device, buffer).value() == 4);
}

TEST_CASE("DeviceConnection::write_chunk - Writes", "[device][write]") {
    MockDeviceFactory factory;
    auto device = make_device(factory);
    device->poll(DeviceConnection::Clock::now());

    SECTION("Full write") {
        auto r = write_bytes(*device, bytes("AT\r\n"));
        REQUIRE(r.value() == 4);
        REQUIRE(tx_bytes(*factory.line) == bytes("AT\r\n"));
    }

    SECTION("Short writes are continued") {
        factory.line->write_capacity = 3;
        auto r = write_bytes(*device, bytes("0123456789"));
        REQUIRE(r.value() == 10);
        REQUIRE(factory.line->tx_history.size() == 4);
        REQUIRE(tx_bytes(*factory.line) == bytes("0123456789"));
    }

    SECTION("Busy device keeps every byte until it drains") {
        factory.line->write_blocked = true;
        auto r = write_bytes(*device, bytes("kept"));
        REQUIRE(r.value() == 4);
        REQUIRE(device->pending() == 4);
        REQUIRE(device->has_pending());
        REQUIRE(factory.line->tx_history.empty());

        REQUIRE(device->flush().value() == 0);
        REQUIRE(device->pending() == 4);

        factory.line->write_blocked = false;
        REQUIRE(device->flush().value() == 4);
        REQUIRE(tx_bytes(*factory.line) == bytes("kept"));
        REQUIRE_FALSE(device->has_pending());
        REQUIRE(device->bytes_written() == 4);
        REQUIRE(device->bytes_dropped() == 0);
        REQUIRE(device->is_connected());
    }

    SECTION("Write error disconnects") {
        factory.line->write_errno = EIO;
        auto r = write_bytes(*device, bytes("x"));
        REQUIRE(r.error() == Status::DWRITE_ERROR);
        REQUIRE(r.error_chain().back() == "write_chunk");
        REQUIRE(device->state() == DeviceState::DISCONNECTED);
        REQUIRE(device->disconnects() == 1);
        REQUIRE(device->bytes_dropped() == 1);
    }
}

TEST_CASE("DeviceConnection::write_chunk - Queue is bounded", "[device][write][flow]") {
    MockDeviceFactory factory;
    auto device = make_device(factory, 8);
    device->poll(DeviceConnection::Clock::now());
    REQUIRE(device->tx_capacity() == 8);

    factory.line->write_blocked = true;
    REQUIRE(write_bytes(*device, bytes("012345")).value() == 6);
    REQUIRE(device->tx_space() == 2);

    // Only what fits is accepted; the caller keeps the rest
    REQUIRE(write_bytes(*device, bytes("6789")).value() == 2);
    REQUIRE(device->tx_space() == 0);
    REQUIRE(write_bytes(*device, bytes("x")).value() == 0);

    SECTION("Partial drains make room in order") {
        factory.line->write_blocked = false;
        factory.line->write_capacity = 3;
        REQUIRE(device->flush().value() == 8);
        REQUIRE(tx_bytes(*factory.line) == bytes("01234567"));
        REQUIRE(device->tx_space() == 8);

        REQUIRE(write_bytes(*device, bytes("89")).value() == 2);
        REQUIRE(tx_bytes(*factory.line) == bytes("0123456789"));
    }

    SECTION("Losing the device discards the queue") {
        factory.line->write_blocked = false;
        factory.line->write_errno = EIO;
        auto r = device->flush();
        REQUIRE(r.error() == Status::DWRITE_ERROR);
        REQUIRE(r.error_chain().back() == "flush");
        REQUIRE_FALSE(device->is_connected());
        REQUIRE(device->pending() == 0);
        REQUIRE(device->bytes_dropped() == 8);

        // A reconnect starts from an empty queue
        factory.line->write_errno = 0;
        device->poll(DeviceConnection::Clock::now());
        REQUIRE(device->is_connected());
        REQUIRE(device->tx_space() == 8);
        REQUIRE(device->flush().value() == 0);
        REQUIRE(factory.line->tx_history.empty());
    }

    SECTION("Closing discards the queue") {
        device->close();
        REQUIRE(device->pending() == 0);
        REQUIRE(device->bytes_dropped() == 8);
    }
}

TEST_CASE("DeviceConnection - I/O while disconnected", "[device]") {
    MockDeviceFactory factory;
    auto device = make_device(factory);
    std::vector<std::uint8_t> buffer(8);

    REQUIRE(read_into(*device, buffer).error() == Status::DNOT_OPEN);
    REQUIRE(write_bytes(*device, bytes("x")).error() == Status::DNOT_OPEN);
    REQUIRE(factory.open_calls == 0);
}

TEST_CASE("DeviceConnection::close - Final and idempotent", "[device]") {
    MockDeviceFactory factory;
    auto device = make_device(factory);
    auto t0 = DeviceConnection::Clock::now();
    device->poll(t0);

    device->close();
    device->close();
    REQUIRE(device->is_closed());
    REQUIRE(device->state() == DeviceState::DISCONNECTED);
    REQUIRE(factory.line->close_count == 1);

    device->poll(t0 + 10000ms);
    REQUIRE(factory.open_calls == 1);
}

TEST_CASE("DeviceConnection::create - Missing device retries instead of throwing",
    "[device][hardware]") {
    test::TempDir dir;
    auto device = DeviceConnection::create(dir.file("no_such_tty"), 115200);

    REQUIRE_NOTHROW(device->poll(DeviceConnection::Clock::now()));
    REQUIRE(device->state() == DeviceState::DISCONNECTED);
    REQUIRE(device->attempts() == 1);
}
