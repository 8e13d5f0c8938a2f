/**
 * @file serial_mux.cpp
 * @brief Broadcast/merge engine implementation
 * @version 0.1
 * @date 2025-11-10
 */

#include "../include/pattern/serial_mux.hpp"
#include "../include/log.hpp"

#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace serialmux {

    // ===================================================================
    // Constructor / Destructor
    // ===================================================================

    SerialMux::SerialMux(const MuxConfig& config,
        std::unique_ptr<DeviceConnection> device,
        std::unique_ptr<EndpointPool> pool)
        : config_(config),
        device_(std::move(device)),
        pool_(std::move(pool)),
        buffer_(BUFFER_SIZE) {
        if (!device_) {
            throw std::invalid_argument("SerialMux: device connection cannot be null");
        }
        if (!pool_) {
            throw std::invalid_argument("SerialMux: endpoint pool cannot be null");
        }
    }

    std::unique_ptr<SerialMux> SerialMux::create(const MuxConfig& config) {
        auto device = DeviceConnection::create(config.device_path, config.baud_rate,
                std::chrono::milliseconds(config.reconnect_interval_ms),
                config.tx_queue_bytes);
        auto pool = EndpointPool::create(config.virtual_ports,
                std::chrono::milliseconds(config.reconnect_interval_ms));
        return std::make_unique<SerialMux>(config, std::move(device), std::move(pool));
    }

    SerialMux::~SerialMux() {
        try {
            stop();
        } catch (const std::exception& e) {
            log::error("MUX", std::string("Error stopping multiplexer in destructor: ") + e.what());
        }
    }

    std::size_t SerialMux::open() {
        log::info("MUX", "Starting with " + config_.to_string());
        return pool_->open_all();
    }

    // ===================================================================
    // Scheduling Cycle
    // ===================================================================

    void SerialMux::run_cycle(Clock::time_point now) {
        if (pool_->is_shutting_down()) {
            return;
        }

        const DeviceCounters before = device_counters();

        device_->poll(now);
        stats_.endpoint_recreations.fetch_add(pool_->supervise(now), std::memory_order_relaxed);
        stats_.client_attaches.fetch_add(pool_->accept_clients(), std::memory_order_relaxed);

        flush_device();
        pump_device_to_endpoints();
        pump_endpoints_to_device();

        account_device(before);
        log_statistics(now);
    }

    SerialMux::DeviceCounters SerialMux::device_counters() const {
        return DeviceCounters{device_->connects(), device_->disconnects(),
                              device_->bytes_written(), device_->bytes_dropped()};
    }

    void SerialMux::account_device(const DeviceCounters& before) {
        const DeviceCounters after = device_counters();
        stats_.device_connects.fetch_add(after.connects - before.connects,
            std::memory_order_relaxed);
        stats_.device_disconnects.fetch_add(after.disconnects - before.disconnects,
            std::memory_order_relaxed);
        stats_.device_tx_bytes.fetch_add(after.written - before.written,
            std::memory_order_relaxed);
        stats_.dropped_device_down.fetch_add(after.dropped - before.dropped,
            std::memory_order_relaxed);
    }

    void SerialMux::flush_device() {
        if (!device_->is_connected() || !device_->has_pending()) {
            return;
        }
        auto result = device_->flush();
        if (!result) {
            log::debug("MUX", result.describe());
        }
    }

    bool SerialMux::device_backlogged() const {
        return device_->is_connected() && device_->tx_space() == 0;
    }

    void SerialMux::wait_for_io() {
        std::vector<struct pollfd> fds;
        fds.reserve(pool_->size() + 1);

        int device_fd = device_->get_fd();
        if (device_fd >= 0) {
            short events = POLLIN;
            if (device_->has_pending()) {
                events |= POLLOUT;
            }
            fds.push_back({device_fd, events, 0});
        }

        // Client data stays in the PTY while the device queue is full;
        // waking up for it would only spin
        if (!device_backlogged()) {
            for (std::size_t i = 0; i < pool_->size(); ++i) {
                const auto& endpoint = pool_->at(i);
                if (endpoint.is_active() && endpoint.get_fd() >= 0) {
                    fds.push_back({endpoint.get_fd(), POLLIN, 0});
                }
            }
        }

        int ret = ::poll(fds.empty() ? nullptr : fds.data(), fds.size(),
                static_cast<int>(config_.poll_interval_ms));
        if (ret < 0 && errno != EINTR) {
            log::warn("MUX", "poll() failed: " + std::string(std::strerror(errno)));
        }
    }

    // ===================================================================
    // Device -> Ports
    // ===================================================================

    void SerialMux::pump_device_to_endpoints() {
        for (int reads = 0; reads < MAX_READS_PER_CYCLE && device_->is_connected(); ++reads) {
            auto result = device_->read_chunk(boost::span<std::uint8_t>(buffer_.data(),
                buffer_.size()));
            if (!result) {
                log::debug("MUX", result.describe());
                break;
            }

            std::size_t n = result.value();
            if (n == 0) {
                break;
            }

            stats_.device_rx_bytes.fetch_add(n, std::memory_order_relaxed);
            stats_.device_rx_chunks.fetch_add(1, std::memory_order_relaxed);

            boost::span<const std::uint8_t> chunk(buffer_.data(), n);
            broadcast(chunk);

            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (device_to_endpoints_callback_) {
                device_to_endpoints_callback_("device", chunk);
            }
        }
    }

    void SerialMux::broadcast(boost::span<const std::uint8_t> chunk) {
        for (std::size_t i = 0; i < pool_->size(); ++i) {
            auto& endpoint = pool_->at(i);
            if (!endpoint.is_active()) {
                continue;
            }

            auto result = endpoint.write(chunk);
            if (result) {
                if (result.value() < chunk.size()) {
                    stats_.dropped_endpoint_full.fetch_add(chunk.size() - result.value(),
                        std::memory_order_relaxed);
                }
                continue;
            }

            // Client gone or PTY-pair dead: the endpoint already changed state
            if (result.error() == Status::PNO_CLIENT) {
                stats_.client_detaches.fetch_add(1, std::memory_order_relaxed);
            }
        }
    }

    // ===================================================================
    // Ports -> Device
    // ===================================================================

    void SerialMux::pump_endpoints_to_device() {
        for (std::size_t i = 0; i < pool_->size(); ++i) {
            auto& endpoint = pool_->at(i);

            for (int reads = 0; reads < MAX_READS_PER_CYCLE && endpoint.is_active(); ++reads) {
                // Never read more than the device queue can take: what is not
                // read stays in the client's PTY and the kernel holds the client back
                std::size_t room = buffer_.size();
                if (device_->is_connected()) {
                    room = std::min(room, device_->tx_space());
                    if (room == 0) {
                        return;
                    }
                }

                auto result = endpoint.read(boost::span<std::uint8_t>(buffer_.data(), room));
                if (!result) {
                    if (result.error() == Status::PNO_CLIENT) {
                        stats_.client_detaches.fetch_add(1, std::memory_order_relaxed);
                    }
                    break;
                }

                std::size_t n = result.value();
                if (n == 0) {
                    break;
                }

                boost::span<const std::uint8_t> chunk(buffer_.data(), n);
                forward_to_device(chunk);

                std::lock_guard<std::mutex> lock(callback_mutex_);
                if (endpoint_to_device_callback_) {
                    endpoint_to_device_callback_(endpoint.get_symlink_path(), chunk);
                }
            }
        }
    }

    void SerialMux::forward_to_device(boost::span<const std::uint8_t> chunk) {
        if (!device_->is_connected()) {
            stats_.dropped_device_down.fetch_add(chunk.size(), std::memory_order_relaxed);
            return;
        }

        // Lost bytes, this chunk included, are counted through bytes_dropped()
        auto result = device_->write_chunk(chunk);
        if (!result) {
            log::debug("MUX", result.describe());
            return;
        }
        stats_.device_tx_chunks.fetch_add(1, std::memory_order_relaxed);
    }

    // ===================================================================
    // Statistics
    // ===================================================================

    void SerialMux::log_statistics(Clock::time_point now) {
        if (config_.stats_interval_s == 0) {
            return;
        }
        if (!stats_started_) {
            last_stats_ = now;
            stats_started_ = true;
            return;
        }
        if (now - last_stats_ < std::chrono::seconds(config_.stats_interval_s)) {
            return;
        }
        last_stats_ = now;

        log::info("STATS", get_statistics().to_string() + " | device=" +
            to_string(device_->state()) + " ports alive=" +
            std::to_string(pool_->size() - pool_->dead_count()) + " idle=" +
            std::to_string(pool_->idle_count()) + " active=" +
            std::to_string(pool_->active_count()));
    }

    MuxStatisticsSnapshot SerialMux::get_statistics() const {
        MuxStatisticsSnapshot snapshot;
        snapshot.device_rx_bytes = stats_.device_rx_bytes.load(std::memory_order_relaxed);
        snapshot.device_rx_chunks = stats_.device_rx_chunks.load(std::memory_order_relaxed);
        snapshot.device_tx_bytes = stats_.device_tx_bytes.load(std::memory_order_relaxed);
        snapshot.device_tx_chunks = stats_.device_tx_chunks.load(std::memory_order_relaxed);
        snapshot.dropped_device_down = stats_.dropped_device_down.load(std::memory_order_relaxed);
        snapshot.dropped_endpoint_full =
            stats_.dropped_endpoint_full.load(std::memory_order_relaxed);
        snapshot.device_connects = stats_.device_connects.load(std::memory_order_relaxed);
        snapshot.device_disconnects = stats_.device_disconnects.load(std::memory_order_relaxed);
        snapshot.endpoint_recreations =
            stats_.endpoint_recreations.load(std::memory_order_relaxed);
        snapshot.client_attaches = stats_.client_attaches.load(std::memory_order_relaxed);
        snapshot.client_detaches = stats_.client_detaches.load(std::memory_order_relaxed);
        return snapshot;
    }

    void SerialMux::reset_statistics() {
        stats_.reset();
    }

    // ===================================================================
    // Threading
    // ===================================================================

    void SerialMux::start() {
        bool expected = false;
        if (!running_.compare_exchange_strong(expected, true, std::memory_order_relaxed)) {
            throw std::logic_error("Multiplexer is already running");
        }
        loop_thread_ = std::thread(&SerialMux::loop, this);
    }

    void SerialMux::stop() {
        running_.store(false, std::memory_order_relaxed);
        if (loop_thread_.joinable()) {
            loop_thread_.join();
        }
    }

    void SerialMux::loop() {
        log::debug("MUX", "Cycle loop started");
        while (running_.load(std::memory_order_relaxed)) {
            try {
                run_cycle(Clock::now());
            } catch (const std::exception& e) {
                // One failed cycle never ends the loop
                log::error("MUX", std::string("Cycle error: ") + e.what());
            }
            wait_for_io();
        }
        log::debug("MUX", "Cycle loop stopped");
    }

} // namespace serialmux
