/**
 * @file device_connection.hpp
 * @brief Owner of the physical device handle and its reconnect state machine
 * @version 0.1
 * @date 2025-11-10
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <boost/core/span.hpp>

#include "../enums/state.hpp"
#include "../io/byte_channel.hpp"
#include "../template/result.hpp"

namespace serialmux {

    /**
     * @brief Physical device connection with timer driven reopen
     *
     * ## State machine
     *
     * @code{.txt}
     *   DISCONNECTED --(timer due)--> CONNECTING --(open ok)--> CONNECTED
     *        ^                             |                        |
     *        +-------(open failed)---------+                        |
     *        +-------(read/write failure, handle closed)------------+
     * @endcode
     *
     * poll() never sleeps: it only attempts an open when the retry timer is
     * due, so the wait between attempts never blocks the forwarding cycle. The
     * first attempt, and the first attempt after a connection loss, are
     * immediate; every later attempt waits reconnect_interval.
     *
     * At most one handle exists at a time; it is closed and released before
     * the next open is attempted.
     *
     * ## Outbound queue
     *
     * write_chunk() never waits for the device. Accepted bytes go to a bounded
     * queue that flush() drains as far as the device takes them without
     * blocking; the caller polls get_fd() for POLLOUT while has_pending() and
     * stops reading from clients while tx_space() is 0. Queued bytes are only
     * discarded when the connection is lost or closed.
     *
     * ## Dependency Injection
     *
     * @code{.cpp}
     * // Production: RealSerialPort
     * auto device = DeviceConnection::create("/dev/ttyUSB0", 115200);
     *
     * // Testing: channel factory returning mocks
     * DeviceConnection device("/dev/mock", 115200,
     *     [](const std::string& p, std::uint32_t) { return std::make_unique<MockByteChannel>(p); });
     * @endcode
     */
    class DeviceConnection {
        public:
            using Clock = std::chrono::steady_clock;
            using ChannelFactory = std::function<std::unique_ptr<IByteChannel>(
                        const std::string& path, std::uint32_t baud_rate)>;

            static constexpr std::chrono::milliseconds DEFAULT_RECONNECT_INTERVAL{2000};
            static constexpr std::size_t DEFAULT_TX_QUEUE_BYTES = 65536;

            /**
             * @brief Constructor with dependency injection
             * @param path Device path
             * @param baud_rate Serial baud rate in bps
             * @param factory Opens a channel or throws on failure
             * @param reconnect_interval Delay between failed open attempts
             * @param tx_queue_bytes Capacity of the outbound queue
             * @throws std::invalid_argument if the factory is empty or the capacity is 0
             */
            DeviceConnection(std::string path, std::uint32_t baud_rate, ChannelFactory factory,
                std::chrono::milliseconds reconnect_interval = DEFAULT_RECONNECT_INTERVAL,
                std::size_t tx_queue_bytes = DEFAULT_TX_QUEUE_BYTES);

            /**
             * @brief Factory method using RealSerialPort
             * @param path Device path
             * @param baud_rate Serial baud rate in bps
             * @param reconnect_interval Delay between failed open attempts
             * @param tx_queue_bytes Capacity of the outbound queue
             */
            static std::unique_ptr<DeviceConnection> create(const std::string& path,
                std::uint32_t baud_rate,
                std::chrono::milliseconds reconnect_interval = DEFAULT_RECONNECT_INTERVAL,
                std::size_t tx_queue_bytes = DEFAULT_TX_QUEUE_BYTES);

            ~DeviceConnection();

            DeviceConnection(const DeviceConnection&) = delete;
            DeviceConnection& operator=(const DeviceConnection&) = delete;

            /**
             * @brief Drive the reconnect timer
             *
             * Attempts one open if DISCONNECTED and the retry timer is due.
             *
             * @param now Current time
             * @return DeviceState State after this call
             */
            DeviceState poll(Clock::time_point now);

            /**
             * @brief Read whatever the device has buffered
             * @param buffer Destination
             * @return Result<std::size_t> Bytes read (0 if nothing ready);
             *         DNOT_OPEN if not connected; DDISCONNECTED on end of stream;
             *         DREAD_ERROR on an I/O error. Both failures close the handle.
             */
            Result<std::size_t> read_chunk(boost::span<std::uint8_t> buffer);

            /**
             * @brief Queue a chunk for the device and flush what it takes now
             *
             * At most tx_space() bytes are accepted; callers size their chunks
             * by tx_space() so nothing is left over.
             *
             * @param data Bytes to send
             * @return Result<std::size_t> Bytes accepted into the queue;
             *         DNOT_OPEN if not connected; DWRITE_ERROR if flushing lost the
             *         link (the queue, this chunk included, is discarded)
             */
            Result<std::size_t> write_chunk(boost::span<const std::uint8_t> data);

            /**
             * @brief Write queued bytes until the queue is empty or the device is busy
             * @return Result<std::size_t> Bytes written by this call;
             *         DWRITE_ERROR if the link was lost
             */
            Result<std::size_t> flush();

            /// Bytes waiting in the outbound queue
            std::size_t pending() const { return tx_queue_.size() - tx_offset_; }
            bool has_pending() const { return pending() > 0; }
            /// Room left in the outbound queue
            std::size_t tx_space() const {
                return pending() < tx_capacity_ ? tx_capacity_ - pending() : 0;
            }
            std::size_t tx_capacity() const { return tx_capacity_; }

            /**
             * @brief Close the handle for good; poll() no longer reopens
             *
             * Idempotent.
             */
            void close();

            DeviceState state() const { return state_.load(std::memory_order_relaxed); }
            bool is_connected() const { return state() == DeviceState::CONNECTED; }
            bool is_closed() const { return closed_; }

            /// Descriptor of the open handle for poll(), -1 when not connected
            int get_fd() const;

            const std::string& get_path() const { return path_; }
            std::uint32_t get_baud_rate() const { return baud_rate_; }
            std::chrono::milliseconds get_reconnect_interval() const { return reconnect_interval_; }

            /// Time of the next scheduled open attempt (meaningful while DISCONNECTED)
            Clock::time_point next_attempt() const { return next_attempt_; }

            std::uint64_t attempts() const { return attempts_; }
            std::uint64_t connects() const { return connects_; }
            std::uint64_t disconnects() const { return disconnects_; }
            /// Bytes delivered to the device
            std::uint64_t bytes_written() const { return bytes_written_; }
            /// Queued bytes discarded because the link was lost or closed
            std::uint64_t bytes_dropped() const { return bytes_dropped_; }

        private:
            std::string path_;
            std::uint32_t baud_rate_;
            ChannelFactory factory_;
            std::chrono::milliseconds reconnect_interval_;
            std::size_t tx_capacity_;

            std::unique_ptr<IByteChannel> channel_;
            std::atomic<DeviceState> state_{DeviceState::DISCONNECTED};
            bool retry_immediately_ = true;
            bool closed_ = false;
            Clock::time_point next_attempt_{};
            std::string last_error_;

            std::vector<std::uint8_t> tx_queue_;
            std::size_t tx_offset_ = 0;  ///< First unsent byte in tx_queue_

            std::uint64_t attempts_ = 0;
            std::uint64_t connects_ = 0;
            std::uint64_t disconnects_ = 0;
            std::uint64_t bytes_written_ = 0;
            std::uint64_t bytes_dropped_ = 0;

            /**
             * @brief Single open attempt (CONNECTING -> CONNECTED | DISCONNECTED)
             */
            void try_connect(Clock::time_point now);

            /**
             * @brief Close the handle after an I/O failure and schedule an immediate reopen
             *
             * Discards the outbound queue.
             *
             * @param reason Logged cause
             */
            void drop_connection(const std::string& reason);

            void discard_queue();
    };

} // namespace serialmux
