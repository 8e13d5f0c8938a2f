/**
 * @file real_serial_port.cpp
 * @brief Real serial port implementation
 * @version 0.1
 * @date 2025-11-10
 */

#include "../include/io/real_serial_port.hpp"
#include "../include/log.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <sys/file.h>
#include <sys/ioctl.h>
#include <asm/termbits.h>
#include <cerrno>
#include <cstring>

namespace serialmux {

    // ===================================================================
    // Constructor / Destructor
    // ===================================================================

    RealSerialPort::RealSerialPort(const std::string& device_path, std::uint32_t baud_rate)
        : device_path_(device_path), baud_rate_(baud_rate) {
        open_port();
        try {
            configure_port();
        } catch (const DeviceException&) {
            close();
            throw;
        }
    }

    RealSerialPort::~RealSerialPort() {
        close();
    }

    // ===================================================================
    // IByteChannel Implementation
    // ===================================================================

    ssize_t RealSerialPort::write(const void* data, std::size_t len) {
        if (fd_ < 0) {
            errno = ENOTCONN;
            return -1;
        }
        return ::write(fd_, data, len);  // Returns -1 on error, errno set by write()
    }

    ssize_t RealSerialPort::read(void* data, std::size_t len) {
        if (fd_ < 0) {
            errno = ENOTCONN;
            return -1;
        }
        // VMIN=0/VTIME=1 with O_NONBLOCK: EAGAIN when empty, 0 only after hangup
        return ::read(fd_, data, len);
    }

    void RealSerialPort::close() {
        if (fd_ >= 0) {
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
            fd_ = -1;
        }
    }

    // ===================================================================
    // Private Methods
    // ===================================================================

    void RealSerialPort::open_port() {
        fd_ = ::open(device_path_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
        if (fd_ < 0) {
            throw DeviceException(Status::DNOT_FOUND,
                "RealSerialPort::open_port: " + device_path_ + ": " +
                std::string(std::strerror(errno)));
        }

        // Try to acquire exclusive lock; fails if another process owns the device
        if (::flock(fd_, LOCK_EX | LOCK_NB) < 0) {
            int saved_errno = errno;
            ::close(fd_);
            fd_ = -1;
            throw DeviceException(Status::DBUSY,
                "RealSerialPort::open_port: " + device_path_ + " is locked: " +
                std::string(std::strerror(saved_errno)));
        }

        log::debug("SERIAL", "Opened " + device_path_ + " (fd=" + std::to_string(fd_) + ")");
    }

    void RealSerialPort::configure_port() {
        if (fd_ < 0) {
            throw DeviceException(Status::DNOT_OPEN,
                "RealSerialPort::configure_port: port not open");
        }

        struct termios2 tty {};
        if (::ioctl(fd_, TCGETS2, &tty) != 0) {
            throw DeviceException(Status::DCONFIG_ERROR,
                "RealSerialPort::configure_port: ioctl TCGETS2 failed: " +
                std::string(std::strerror(errno)));
        }

        tty.c_cflag = BOTHER     // Use custom baud rate
            | CS8                // 8 data bits, 1 stop bit, no parity
            | CREAD              // Enable receiver
            | CLOCAL;            // Ignore modem control lines
        tty.c_iflag = IGNPAR;    // Ignore framing and parity errors
        tty.c_oflag = 0;         // No output processing
        tty.c_lflag = 0;         // Non-canonical mode, no echo, no signals
        tty.c_ispeed = baud_rate_;
        tty.c_ospeed = baud_rate_;
        tty.c_cc[VTIME] = 1;
        tty.c_cc[VMIN] = 0;

        if (::ioctl(fd_, TCSETS2, &tty) != 0) {
            throw DeviceException(Status::DCONFIG_ERROR,
                "RealSerialPort::configure_port: ioctl TCSETS2 failed: " +
                std::string(std::strerror(errno)));
        }

        log::debug("SERIAL", "Configured " + device_path_ + " at " +
            std::to_string(baud_rate_) + " baud");
    }

} // namespace serialmux
