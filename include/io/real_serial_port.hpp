/**
 * @file real_serial_port.hpp
 * @brief Real serial port implementation using termios2/ioctl
 * @version 0.1
 * @date 2025-11-10
 */

#pragma once

#include "byte_channel.hpp"
#include "../exception/serialmux_exception.hpp"
#include <cstdint>
#include <string>

namespace serialmux {

    /**
     * @brief Physical serial device opened non-blocking in raw 8N1 mode
     *
     * The baud rate is programmed with BOTHER so any positive integer rate the
     * driver accepts can be used. An advisory exclusive lock is taken on the
     * descriptor so a second multiplexer cannot own the same device.
     */
    class RealSerialPort : public IByteChannel {
        private:
            std::string device_path_;
            std::uint32_t baud_rate_;
            int fd_ = -1;

        public:
            /**
             * @brief Construct and open serial port
             * @param device_path Device path (e.g., "/dev/ttyUSB0")
             * @param baud_rate Serial baud rate in bps
             * @throws DeviceException if port cannot be opened, locked or configured
             */
            RealSerialPort(const std::string& device_path, std::uint32_t baud_rate);

            ~RealSerialPort() override;

            RealSerialPort(const RealSerialPort&) = delete;
            RealSerialPort& operator=(const RealSerialPort&) = delete;

            // IByteChannel implementation
            ssize_t write(const void* data, std::size_t len) override;
            ssize_t read(void* data, std::size_t len) override;
            bool is_open() const override { return fd_ >= 0; }
            void close() override;
            std::string get_path() const override { return device_path_; }
            int get_fd() const override { return fd_; }

            std::uint32_t get_baud_rate() const { return baud_rate_; }

        private:
            /**
             * @brief Open and lock the device node
             * @throws DeviceException on failure
             */
            void open_port();

            /**
             * @brief Configure raw mode and baud rate
             * @throws DeviceException on failure
             */
            void configure_port();
    };

} // namespace serialmux
