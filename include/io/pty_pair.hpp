/**
 * @file pty_pair.hpp
 * @brief Pseudo-terminal pair backing one virtual port
 * @version 0.1
 * @date 2025-11-10
 */

#pragma once

#include "pty_channel.hpp"
#include "../exception/serialmux_exception.hpp"
#include <string>

namespace serialmux {

    /**
     * @brief PTY-pair allocated with openpty(), master side held by the multiplexer
     *
     * On construction both sides are switched to raw mode, the slave node is made
     * world read/writable and the local slave descriptor is closed. Keeping the
     * slave closed is what lets the kernel report a client hang-up on the master
     * (EIO on read, POLLHUP on poll). The master is non-blocking.
     */
    class PtyPair : public IPtyChannel {
        private:
            int master_fd_ = -1;
            std::string slave_name_;

        public:
            /**
             * @brief Allocate and configure a fresh PTY-pair
             * @throws EndpointException (PCREATE_ERROR) on failure
             */
            PtyPair();

            ~PtyPair() override;

            PtyPair(const PtyPair&) = delete;
            PtyPair& operator=(const PtyPair&) = delete;

            // IByteChannel implementation
            ssize_t write(const void* data, std::size_t len) override;
            ssize_t read(void* data, std::size_t len) override;
            bool is_open() const override { return master_fd_ >= 0; }
            void close() override;
            std::string get_path() const override { return slave_name_; }
            int get_fd() const override { return master_fd_; }

            // IPtyChannel implementation
            std::string get_slave_name() const override { return slave_name_; }
            PeerState peer_state() override;
    };

} // namespace serialmux
