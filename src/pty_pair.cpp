/**
 * @file pty_pair.cpp
 * @brief Pseudo-terminal pair implementation
 * @version 0.1
 * @date 2025-11-10
 */

#include "../include/io/pty_pair.hpp"
#include "../include/log.hpp"

#include <fcntl.h>
#include <poll.h>
#include <pty.h>
#include <termios.h>
#include <unistd.h>
#include <sys/stat.h>
#include <cerrno>
#include <climits>
#include <cstring>

namespace serialmux {

    namespace {

        void make_raw(int fd) {
            struct termios tio {};
            if (::tcgetattr(fd, &tio) != 0) {
                throw EndpointException(Status::PCREATE_ERROR,
                    "PtyPair: tcgetattr failed: " + std::string(std::strerror(errno)));
            }
            ::cfmakeraw(&tio);
            if (::tcsetattr(fd, TCSANOW, &tio) != 0) {
                throw EndpointException(Status::PCREATE_ERROR,
                    "PtyPair: tcsetattr failed: " + std::string(std::strerror(errno)));
            }
        }

    } // namespace

    // ===================================================================
    // Constructor / Destructor
    // ===================================================================

    PtyPair::PtyPair() {
        int slave_fd = -1;
        if (::openpty(&master_fd_, &slave_fd, nullptr, nullptr, nullptr) < 0) {
            master_fd_ = -1;
            throw EndpointException(Status::PCREATE_ERROR,
                "PtyPair: openpty failed: " + std::string(std::strerror(errno)));
        }

        try {
            char name[PATH_MAX] = {};
            int rc = ::ttyname_r(slave_fd, name, sizeof(name));
            if (rc != 0) {
                throw EndpointException(Status::PCREATE_ERROR,
                    "PtyPair: ttyname_r failed: " + std::string(std::strerror(rc)));
            }
            slave_name_ = name;

            make_raw(master_fd_);
            make_raw(slave_fd);

            if (::fchmod(slave_fd, 0666) != 0) {
                log::warn("PTY", "Cannot chmod " + slave_name_ + ": " +
                    std::string(std::strerror(errno)));
            }

            int flags = ::fcntl(master_fd_, F_GETFL);
            if (flags < 0 || ::fcntl(master_fd_, F_SETFL, flags | O_NONBLOCK) < 0 ||
                ::fcntl(master_fd_, F_SETFD, FD_CLOEXEC) < 0) {
                throw EndpointException(Status::PCREATE_ERROR,
                    "PtyPair: fcntl failed: " + std::string(std::strerror(errno)));
            }
        } catch (const EndpointException&) {
            ::close(slave_fd);
            close();
            throw;
        }

        ::close(slave_fd);
        log::debug("PTY", "Allocated " + slave_name_ + " (master fd=" +
            std::to_string(master_fd_) + ")");
    }

    PtyPair::~PtyPair() {
        close();
    }

    // ===================================================================
    // IByteChannel Implementation
    // ===================================================================

    ssize_t PtyPair::write(const void* data, std::size_t len) {
        if (master_fd_ < 0) {
            errno = EBADF;
            return -1;
        }
        return ::write(master_fd_, data, len);
    }

    ssize_t PtyPair::read(void* data, std::size_t len) {
        if (master_fd_ < 0) {
            errno = EBADF;
            return -1;
        }
        return ::read(master_fd_, data, len);
    }

    void PtyPair::close() {
        if (master_fd_ >= 0) {
            ::close(master_fd_);
            master_fd_ = -1;
        }
    }

    // ===================================================================
    // IPtyChannel Implementation
    // ===================================================================

    PeerState PtyPair::peer_state() {
        if (master_fd_ < 0) {
            return PeerState::ERROR;
        }

        struct pollfd pfd {};
        pfd.fd = master_fd_;
        pfd.events = POLLIN;

        int ret;
        do {
            ret = ::poll(&pfd, 1, 0);
        } while (ret < 0 && errno == EINTR);

        if (ret < 0 || (pfd.revents & POLLNVAL)) {
            return PeerState::ERROR;
        }
        // Master reports POLLHUP while no descriptor on the slave side is open
        if (pfd.revents & POLLHUP) {
            return PeerState::ABSENT;
        }
        return PeerState::PRESENT;
    }

} // namespace serialmux
