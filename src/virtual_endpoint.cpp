/**
 * @file virtual_endpoint.cpp
 * @brief Virtual port state machine implementation
 * @version 0.1
 * @date 2025-11-10
 */

#include "../include/pattern/virtual_endpoint.hpp"
#include "../include/io/pty_pair.hpp"
#include "../include/exception/serialmux_exception.hpp"
#include "../include/log.hpp"

#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <climits>
#include <cstring>
#include <stdexcept>

namespace serialmux {

    namespace {

        bool is_symlink(const std::string& path) {
            struct stat st {};
            return ::lstat(path.c_str(), &st) == 0 && S_ISLNK(st.st_mode);
        }

        bool path_exists(const std::string& path) {
            struct stat st {};
            return ::lstat(path.c_str(), &st) == 0;
        }

        std::string errno_text(int err) {
            return std::string(std::strerror(err));
        }

    } // namespace

    // ===================================================================
    // Constructor / Factory
    // ===================================================================

    VirtualEndpoint::VirtualEndpoint(std::string symlink_path, PtyFactory factory)
        : symlink_path_(std::move(symlink_path)), factory_(std::move(factory)) {
        if (!factory_) {
            throw std::invalid_argument("VirtualEndpoint: PTY factory is empty");
        }
    }

    std::unique_ptr<VirtualEndpoint> VirtualEndpoint::create(const std::string& symlink_path) {
        auto factory = [](const std::string&) {
                return std::unique_ptr<IPtyChannel>(std::make_unique<PtyPair>());
            };
        return std::make_unique<VirtualEndpoint>(symlink_path, factory);
    }

    VirtualEndpoint::~VirtualEndpoint() {
        close();
    }

    // ===================================================================
    // Creation / Teardown
    // ===================================================================

    bool VirtualEndpoint::open() {
        if (state_ == EndpointState::IDLE || state_ == EndpointState::ACTIVE) {
            return true;
        }

        release_channel();
        try {
            channel_ = factory_(symlink_path_);
            if (!channel_) {
                throw EndpointException(Status::PCREATE_ERROR,
                          "VirtualEndpoint::open: factory returned no channel");
            }
            slave_name_ = channel_->get_slave_name();
            ++generation_;
            publish_link();
        } catch (const SerialMuxException& e) {
            mark_dead(e.what());
            return false;
        }

        state_ = EndpointState::IDLE;
        last_error_.clear();
        log::info("PORT", symlink_path_ + " -> " + slave_name_);
        return true;
    }

    bool VirtualEndpoint::recreate() {
        const std::string message = "Recreating " + symlink_path_ + " (was " +
            to_string(state_) + ")";
        if (last_error_.empty()) {
            log::info("PORT", message);
        } else {
            log::debug("PORT", message);
        }
        release_channel();
        state_ = EndpointState::ABSENT;
        return open();
    }

    void VirtualEndpoint::close() {
        if (state_ == EndpointState::ABSENT && !channel_) {
            return;
        }

        release_channel();
        if (is_symlink(symlink_path_)) {
            if (::unlink(symlink_path_.c_str()) != 0 && errno != ENOENT) {
                log::warn("PORT", "Cannot remove " + symlink_path_ + ": " + errno_text(errno));
            } else {
                log::info("PORT", "Removed " + symlink_path_);
            }
        }
        state_ = EndpointState::ABSENT;
        slave_name_.clear();
    }

    void VirtualEndpoint::release_channel() {
        if (channel_) {
            channel_->close();
            channel_.reset();
        }
    }

    void VirtualEndpoint::publish_link() {
        if (path_exists(symlink_path_) && !is_symlink(symlink_path_)) {
            throw EndpointException(Status::PLINK_ERROR,
                      "VirtualEndpoint: refusing to replace non-symlink " + symlink_path_);
        }

        // Build the new link beside the old one, then swap it in atomically.
        // The staging name carries pid and generation so it cannot be another
        // configured port.
        const std::string staging = symlink_path_ + ".serialmux-" +
            std::to_string(::getpid()) + "-" + std::to_string(generation_);
        if (is_symlink(staging) && ::unlink(staging.c_str()) != 0) {
            throw EndpointException(Status::PLINK_ERROR,
                      "VirtualEndpoint: cannot remove stale " + staging + ": " + errno_text(errno));
        }
        if (::symlink(slave_name_.c_str(), staging.c_str()) != 0) {
            throw EndpointException(Status::PLINK_ERROR,
                      "VirtualEndpoint: symlink " + staging + ": " + errno_text(errno));
        }
        if (::rename(staging.c_str(), symlink_path_.c_str()) != 0) {
            int err = errno;
            ::unlink(staging.c_str());
            throw EndpointException(Status::PLINK_ERROR,
                      "VirtualEndpoint: rename to " + symlink_path_ + ": " + errno_text(err));
        }
    }

    bool VirtualEndpoint::verify_link() const {
        if (state_ != EndpointState::IDLE && state_ != EndpointState::ACTIVE) {
            return true;
        }

        char target[PATH_MAX] = {};
        ssize_t len = ::readlink(symlink_path_.c_str(), target, sizeof(target) - 1);
        if (len < 0) {
            return false;
        }
        return std::string(target, static_cast<std::size_t>(len)) == slave_name_;
    }

    int VirtualEndpoint::get_fd() const {
        return channel_ ? channel_->get_fd() : -1;
    }

    // ===================================================================
    // Client Detection
    // ===================================================================

    bool VirtualEndpoint::accept_client() {
        if (state_ != EndpointState::IDLE) {
            return false;
        }

        switch (channel_->peer_state()) {
        case PeerState::PRESENT:
            state_ = EndpointState::ACTIVE;
            log::info("PORT", "Client attached to " + symlink_path_);
            return true;
        case PeerState::ERROR:
            mark_dead("peer state check failed");
            return false;
        default:
            return false;
        }
    }

    void VirtualEndpoint::detach_client(const std::string& reason) {
        state_ = EndpointState::IDLE;
        log::info("PORT", "Client detached from " + symlink_path_ + " (" + reason + ")");
    }

    void VirtualEndpoint::mark_dead(const std::string& reason) {
        state_ = EndpointState::DEAD;
        if (reason == last_error_) {
            log::debug("PORT", symlink_path_ + " is still dead: " + reason);
            return;
        }
        last_error_ = reason;
        log::warn("PORT", symlink_path_ + " is dead: " + reason);
    }

    // ===================================================================
    // Data Transfer
    // ===================================================================

    Result<std::size_t> VirtualEndpoint::read(boost::span<std::uint8_t> buffer) {
        if (state_ == EndpointState::DEAD) {
            return Result<std::size_t>::error(Status::PDEAD, "endpoint read");
        }
        if (state_ != EndpointState::ACTIVE) {
            return Result<std::size_t>::error(Status::PNO_CLIENT, "endpoint read");
        }

        ssize_t n = channel_->read(buffer.data(), buffer.size());
        int err = errno;
        if (n > 0) {
            return Result<std::size_t>::success(static_cast<std::size_t>(n));
        }
        if (n < 0 && (err == EAGAIN || err == EWOULDBLOCK || err == EINTR)) {
            return Result<std::size_t>::success(0);
        }
        if (n == 0 || err == EIO) {
            detach_client(n == 0 ? "end of stream" : errno_text(err));
            return Result<std::size_t>::error(Status::PNO_CLIENT, "endpoint read");
        }

        mark_dead("read: " + errno_text(err));
        return Result<std::size_t>::error(Status::PDEAD, "endpoint read");
    }

    Result<std::size_t> VirtualEndpoint::write(boost::span<const std::uint8_t> data) {
        if (state_ == EndpointState::DEAD) {
            return Result<std::size_t>::error(Status::PDEAD, "endpoint write");
        }
        if (state_ != EndpointState::ACTIVE) {
            return Result<std::size_t>::error(Status::PNO_CLIENT, "endpoint write");
        }

        std::size_t written = 0;
        while (written < data.size()) {
            ssize_t n = channel_->write(data.data() + written, data.size() - written);
            int err = errno;
            if (n > 0) {
                written += static_cast<std::size_t>(n);
                continue;
            }
            if (n < 0 && err == EINTR) {
                continue;
            }
            if (n == 0 || err == EAGAIN || err == EWOULDBLOCK) {
                // Client is not draining its side; the rest is dropped for this endpoint
                break;
            }
            if (err == EIO) {
                detach_client(errno_text(err));
                return Result<std::size_t>::error(Status::PNO_CLIENT, "endpoint write");
            }

            mark_dead("write: " + errno_text(err));
            return Result<std::size_t>::error(Status::PDEAD, "endpoint write");
        }
        return Result<std::size_t>::success(written);
    }

} // namespace serialmux
