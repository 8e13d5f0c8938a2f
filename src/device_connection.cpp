/**
 * @file device_connection.cpp
 * @brief Device connection state machine implementation
 * @version 0.1
 * @date 2025-11-10
 */

#include "../include/pattern/device_connection.hpp"
#include "../include/io/real_serial_port.hpp"
#include "../include/exception/serialmux_exception.hpp"
#include "../include/log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace serialmux {

    // ===================================================================
    // Constructor / Factory
    // ===================================================================

    DeviceConnection::DeviceConnection(std::string path, std::uint32_t baud_rate,
        ChannelFactory factory, std::chrono::milliseconds reconnect_interval,
        std::size_t tx_queue_bytes)
        : path_(std::move(path)),
        baud_rate_(baud_rate),
        factory_(std::move(factory)),
        reconnect_interval_(reconnect_interval),
        tx_capacity_(tx_queue_bytes) {
        if (!factory_) {
            throw std::invalid_argument("DeviceConnection: channel factory is empty");
        }
        if (tx_capacity_ == 0) {
            throw std::invalid_argument("DeviceConnection: TX queue capacity must be > 0");
        }
        tx_queue_.reserve(tx_capacity_);
    }

    std::unique_ptr<DeviceConnection> DeviceConnection::create(const std::string& path,
        std::uint32_t baud_rate, std::chrono::milliseconds reconnect_interval,
        std::size_t tx_queue_bytes) {
        auto factory = [](const std::string& p, std::uint32_t baud) {
                return std::unique_ptr<IByteChannel>(std::make_unique<RealSerialPort>(p, baud));
            };
        return std::make_unique<DeviceConnection>(path, baud_rate, factory,
            reconnect_interval, tx_queue_bytes);
    }

    DeviceConnection::~DeviceConnection() {
        close();
    }

    // ===================================================================
    // Reconnect State Machine
    // ===================================================================

    DeviceState DeviceConnection::poll(Clock::time_point now) {
        if (closed_ || state() != DeviceState::DISCONNECTED) {
            return state();
        }
        if (retry_immediately_ || now >= next_attempt_) {
            try_connect(now);
        }
        return state();
    }

    void DeviceConnection::try_connect(Clock::time_point now) {
        state_.store(DeviceState::CONNECTING, std::memory_order_relaxed);
        retry_immediately_ = false;
        ++attempts_;

        std::string error;
        try {
            channel_ = factory_(path_, baud_rate_);
            if (!channel_ || !channel_->is_open()) {
                channel_.reset();
                error = "channel not open after open";
            }
        } catch (const SerialMuxException& e) {
            error = e.what();
        } catch (const std::exception& e) {
            error = e.what();
        }

        if (!error.empty()) {
            state_.store(DeviceState::DISCONNECTED, std::memory_order_relaxed);
            next_attempt_ = now + reconnect_interval_;
            if (error != last_error_) {
                log::warn("DEVICE", "Cannot open " + path_ + ": " + error + " (retrying every " +
                    std::to_string(reconnect_interval_.count()) + " ms)");
                last_error_ = error;
            } else {
                log::debug("DEVICE", "Retry " + std::to_string(attempts_) + " failed: " + error);
            }
            return;
        }

        state_.store(DeviceState::CONNECTED, std::memory_order_relaxed);
        last_error_.clear();
        ++connects_;
        log::info("DEVICE", "Connected to " + path_ + " @ " + std::to_string(baud_rate_) +
            " baud");
    }

    void DeviceConnection::drop_connection(const std::string& reason) {
        if (channel_) {
            channel_->close();
            channel_.reset();
        }
        state_.store(DeviceState::DISCONNECTED, std::memory_order_relaxed);
        retry_immediately_ = true;
        ++disconnects_;
        const std::size_t lost = pending();
        discard_queue();
        log::warn("DEVICE", "Lost " + path_ + ": " + reason +
            (lost > 0 ? " (" + std::to_string(lost) + " queued bytes dropped)" : ""));
    }

    void DeviceConnection::discard_queue() {
        bytes_dropped_ += pending();
        tx_queue_.clear();
        tx_offset_ = 0;
    }

    void DeviceConnection::close() {
        if (closed_) {
            return;
        }
        closed_ = true;
        discard_queue();
        if (channel_) {
            channel_->close();
            channel_.reset();
            log::info("DEVICE", "Closed " + path_);
        }
        state_.store(DeviceState::DISCONNECTED, std::memory_order_relaxed);
    }

    int DeviceConnection::get_fd() const {
        return (is_connected() && channel_) ? channel_->get_fd() : -1;
    }

    // ===================================================================
    // Data Transfer
    // ===================================================================

    Result<std::size_t> DeviceConnection::read_chunk(boost::span<std::uint8_t> buffer) {
        if (!is_connected()) {
            return Result<std::size_t>::error(Status::DNOT_OPEN, "read_chunk");
        }

        ssize_t n = channel_->read(buffer.data(), buffer.size());
        int err = errno;
        if (n > 0) {
            return Result<std::size_t>::success(static_cast<std::size_t>(n));
        }
        if (n < 0 && (err == EAGAIN || err == EWOULDBLOCK || err == EINTR)) {
            return Result<std::size_t>::success(0);
        }

        if (n == 0) {
            drop_connection("end of stream");
            return Result<std::size_t>::error(Status::DDISCONNECTED, "read_chunk");
        }
        auto failed = Result<std::size_t>::error(Status::DREAD_ERROR,
                "read(" + path_ + "): " + std::strerror(err));
        drop_connection(std::strerror(err));
        return Result<std::size_t>::error(failed, "read_chunk");
    }

    Result<std::size_t> DeviceConnection::write_chunk(boost::span<const std::uint8_t> data) {
        if (!is_connected()) {
            return Result<std::size_t>::error(Status::DNOT_OPEN, "write_chunk");
        }

        const std::size_t accepted = std::min(data.size(), tx_space());
        tx_queue_.insert(tx_queue_.end(), data.begin(), data.begin() + accepted);

        auto flushed = flush();
        if (!flushed) {
            return Result<std::size_t>::error(flushed, "write_chunk");
        }
        return Result<std::size_t>::success(accepted);
    }

    Result<std::size_t> DeviceConnection::flush() {
        if (!is_connected()) {
            return Result<std::size_t>::error(Status::DNOT_OPEN, "flush");
        }

        std::size_t written = 0;
        while (has_pending()) {
            ssize_t n = channel_->write(tx_queue_.data() + tx_offset_, pending());
            int err = errno;
            if (n > 0) {
                tx_offset_ += static_cast<std::size_t>(n);
                written += static_cast<std::size_t>(n);
                continue;
            }
            if (n < 0 && err == EINTR) {
                continue;
            }
            if (n == 0 || err == EAGAIN || err == EWOULDBLOCK) {
                // Device busy: the rest stays queued for the next flush
                break;
            }

            auto failed = Result<std::size_t>::error(Status::DWRITE_ERROR,
                    "write(" + path_ + "): " + std::strerror(err));
            bytes_written_ += written;
            drop_connection(std::strerror(err));
            return Result<std::size_t>::error(failed, "flush");
        }
        bytes_written_ += written;

        if (!has_pending()) {
            tx_queue_.clear();
            tx_offset_ = 0;
        } else if (tx_offset_ >= tx_capacity_ / 2) {
            tx_queue_.erase(tx_queue_.begin(),
                tx_queue_.begin() + static_cast<std::ptrdiff_t>(tx_offset_));
            tx_offset_ = 0;
        }
        return Result<std::size_t>::success(written);
    }

} // namespace serialmux
