/**
 * @file serial_mux.hpp
 * @brief Broadcast/merge engine between one serial device and N virtual ports
 * @version 0.1
 * @date 2025-11-10
 *
 * Bytes read from the device are copied to every virtual port that has a
 * client attached; bytes written by any client are merged into one stream
 * toward the device:
 * - Device -> all active virtual ports (broadcast)
 * - Each active virtual port -> device (merge)
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <boost/core/span.hpp>

#include "mux_config.hpp"
#include "device_connection.hpp"
#include "endpoint_pool.hpp"

namespace serialmux {

    /**
     * @brief Statistics for multiplexer monitoring
     *
     * All counters are atomic for thread-safe updates.
     * Use get_statistics() to get a non-atomic snapshot.
     */
    struct MuxStatistics {
        std::atomic<std::uint64_t> device_rx_bytes{0};         ///< Bytes read from the device
        std::atomic<std::uint64_t> device_rx_chunks{0};        ///< Reads that returned data
        std::atomic<std::uint64_t> device_tx_bytes{0};         ///< Bytes written to the device
        std::atomic<std::uint64_t> device_tx_chunks{0};        ///< Client chunks forwarded
        std::atomic<std::uint64_t> dropped_device_down{0};     ///< Client bytes lost while disconnected
        std::atomic<std::uint64_t> dropped_endpoint_full{0};   ///< Device bytes a client could not take
        std::atomic<std::uint64_t> device_connects{0};
        std::atomic<std::uint64_t> device_disconnects{0};
        std::atomic<std::uint64_t> endpoint_recreations{0};
        std::atomic<std::uint64_t> client_attaches{0};
        std::atomic<std::uint64_t> client_detaches{0};

        /**
         * @brief Reset all counters to zero
         */
        void reset() {
            device_rx_bytes.store(0, std::memory_order_relaxed);
            device_rx_chunks.store(0, std::memory_order_relaxed);
            device_tx_bytes.store(0, std::memory_order_relaxed);
            device_tx_chunks.store(0, std::memory_order_relaxed);
            dropped_device_down.store(0, std::memory_order_relaxed);
            dropped_endpoint_full.store(0, std::memory_order_relaxed);
            device_connects.store(0, std::memory_order_relaxed);
            device_disconnects.store(0, std::memory_order_relaxed);
            endpoint_recreations.store(0, std::memory_order_relaxed);
            client_attaches.store(0, std::memory_order_relaxed);
            client_detaches.store(0, std::memory_order_relaxed);
        }

        /**
         * @brief Get human-readable statistics string
         * @return std::string Formatted statistics
         */
        std::string to_string() const {
            std::ostringstream oss;
            oss << "Mux Statistics:\n"
                << "  Device RX:      " << std::setw(10) <<
                device_rx_bytes.load(std::memory_order_relaxed) << " bytes in " <<
                device_rx_chunks.load(std::memory_order_relaxed) << " chunks\n"
                << "  Device TX:      " << std::setw(10) <<
                device_tx_bytes.load(std::memory_order_relaxed) << " bytes in " <<
                device_tx_chunks.load(std::memory_order_relaxed) << " chunks\n"
                << "  Dropped (down): " << std::setw(10) <<
                dropped_device_down.load(std::memory_order_relaxed) << " bytes\n"
                << "  Dropped (full): " << std::setw(10) <<
                dropped_endpoint_full.load(std::memory_order_relaxed) << " bytes\n"
                << "  Connects:       " << std::setw(10) <<
                device_connects.load(std::memory_order_relaxed) << "\n"
                << "  Disconnects:    " << std::setw(10) <<
                device_disconnects.load(std::memory_order_relaxed) << "\n"
                << "  Recreations:    " << std::setw(10) <<
                endpoint_recreations.load(std::memory_order_relaxed) << "\n"
                << "  Attaches:       " << std::setw(10) <<
                client_attaches.load(std::memory_order_relaxed) << "\n"
                << "  Detaches:       " << std::setw(10) <<
                client_detaches.load(std::memory_order_relaxed);
            return oss.str();
        }
    };

    /**
     * @brief Non-atomic snapshot of multiplexer statistics
     */
    struct MuxStatisticsSnapshot {
        std::uint64_t device_rx_bytes;
        std::uint64_t device_rx_chunks;
        std::uint64_t device_tx_bytes;
        std::uint64_t device_tx_chunks;
        std::uint64_t dropped_device_down;
        std::uint64_t dropped_endpoint_full;
        std::uint64_t device_connects;
        std::uint64_t device_disconnects;
        std::uint64_t endpoint_recreations;
        std::uint64_t client_attaches;
        std::uint64_t client_detaches;

        /**
         * @brief Single-line summary for the periodic log
         */
        std::string to_string() const {
            std::ostringstream oss;
            oss << "rx=" << device_rx_bytes << "B/" << device_rx_chunks
                << " tx=" << device_tx_bytes << "B/" << device_tx_chunks
                << " dropped(down)=" << dropped_device_down
                << " dropped(full)=" << dropped_endpoint_full
                << " connects=" << device_connects
                << " disconnects=" << device_disconnects
                << " recreations=" << endpoint_recreations
                << " attaches=" << client_attaches
                << " detaches=" << client_detaches;
            return oss.str();
        }
    };

    /**
     * @brief Cooperative single-loop multiplexer
     *
     * ## Scheduling
     *
     * One cycle (run_cycle) services every source without blocking:
     *
     * @code{.txt}
     *   1. device retry timer        (DeviceConnection::poll)
     *   2. recreate dead ports       (EndpointPool::supervise)
     *   3. detect new clients        (EndpointPool::accept_clients)
     *   4. device -> active ports    (broadcast)
     *   5. active ports -> device    (merge, port order)
     *   6. periodic statistics
     * @endcode
     *
     * Between cycles the loop thread waits in poll() on the device and on every
     * active port for at most poll_interval_ms. Each source gets at most
     * MAX_READS_PER_CYCLE reads per cycle so a busy source cannot starve the
     * others. Per-source byte order is preserved; chunks from different ports
     * interleave in port order.
     *
     * ## Thread Safety
     *
     * The device handle and every PTY-pair are touched only by the loop thread
     * while running. Statistics are atomic; callbacks are invoked from the loop
     * thread and must not block.
     *
     * ## Dependency Injection
     *
     * @code{.cpp}
     * // Production
     * auto mux = SerialMux::create(config);
     *
     * // Testing: mock device and mock PTYs
     * auto mux = std::make_unique<SerialMux>(config, std::move(mock_device), std::move(mock_pool));
     * @endcode
     */
    class SerialMux {
        public:
            using Clock = DeviceConnection::Clock;
            using DataCallback = std::function<void(const std::string& source,
                boost::span<const std::uint8_t> data)>;

            static constexpr std::size_t BUFFER_SIZE = 4096;
            static constexpr int MAX_READS_PER_CYCLE = 64;

            /**
             * @brief Constructor with dependency injection
             * @param config Multiplexer configuration (timing fields are used)
             * @param device Device connection (real or mock-backed)
             * @param pool Virtual port pool (real or mock-backed)
             * @throws std::invalid_argument if device or pool is null
             */
            SerialMux(const MuxConfig& config,
                std::unique_ptr<DeviceConnection> device,
                std::unique_ptr<EndpointPool> pool);

            /**
             * @brief Factory method building the real device and PTY stack
             * @param config Validated configuration
             */
            static std::unique_ptr<SerialMux> create(const MuxConfig& config);

            /**
             * @brief Destructor - stops the loop thread
             */
            ~SerialMux();

            SerialMux(const SerialMux&) = delete;
            SerialMux& operator=(const SerialMux&) = delete;
            SerialMux(SerialMux&&) = delete;
            SerialMux& operator=(SerialMux&&) = delete;

            /**
             * @brief Publish every virtual port
             * @return std::size_t Number of ports that came up
             */
            std::size_t open();

            /**
             * @brief Run one scheduling cycle
             * @param now Current time (drives the device retry timer and stats)
             */
            void run_cycle(Clock::time_point now);

            /**
             * @brief Wait for readable data on the device or any active port
             *
             * Also waits for the device to become writable while its outbound
             * queue holds bytes. Ports are left out while that queue is full.
             * Returns after at most poll_interval_ms, or earlier when data
             * arrives or a signal interrupts the wait.
             */
            void wait_for_io();

            /**
             * @brief Start the cycle loop thread
             * @throws std::logic_error if already running
             */
            void start();

            /**
             * @brief Stop the cycle loop thread
             * Blocks until the thread joined (bounded by one poll interval)
             */
            void stop();

            bool is_running() const { return running_.load(std::memory_order_relaxed); }

            const MuxConfig& get_config() const { return config_; }
            DeviceConnection& device() { return *device_; }
            EndpointPool& pool() { return *pool_; }

            /**
             * @brief Get statistics snapshot
             * @return MuxStatisticsSnapshot Non-atomic copy of current statistics
             */
            MuxStatisticsSnapshot get_statistics() const;

            /**
             * @brief Reset all statistics counters to zero
             */
            void reset_statistics();

            /**
             * @brief Set callback for device -> ports forwarding
             *
             * Called once per chunk read from the device with ("device", chunk).
             */
            void set_device_to_endpoints_callback(DataCallback callback) {
                std::lock_guard<std::mutex> lock(callback_mutex_);
                device_to_endpoints_callback_ = std::move(callback);
            }

            /**
             * @brief Set callback for port -> device forwarding
             *
             * Called once per chunk read from a port with (symlink path, chunk).
             */
            void set_endpoint_to_device_callback(DataCallback callback) {
                std::lock_guard<std::mutex> lock(callback_mutex_);
                endpoint_to_device_callback_ = std::move(callback);
            }

        private:
            // === Configuration ===
            MuxConfig config_;

            // === Owned participants ===
            std::unique_ptr<DeviceConnection> device_;
            std::unique_ptr<EndpointPool> pool_;

            // === Statistics ===
            MuxStatistics stats_;
            Clock::time_point last_stats_{};
            bool stats_started_ = false;

            // === Threading ===
            std::atomic<bool> running_{false};
            std::thread loop_thread_;

            // === Callbacks ===
            std::mutex callback_mutex_;
            DataCallback device_to_endpoints_callback_;
            DataCallback endpoint_to_device_callback_;

            std::vector<std::uint8_t> buffer_;

            struct DeviceCounters {
                std::uint64_t connects;
                std::uint64_t disconnects;
                std::uint64_t written;
                std::uint64_t dropped;
            };

            void loop();
            DeviceCounters device_counters() const;
            void account_device(const DeviceCounters& before);
            void flush_device();
            bool device_backlogged() const;
            void pump_device_to_endpoints();
            void broadcast(boost::span<const std::uint8_t> chunk);
            void pump_endpoints_to_device();
            void forward_to_device(boost::span<const std::uint8_t> chunk);
            void log_statistics(Clock::time_point now);
    };

} // namespace serialmux
