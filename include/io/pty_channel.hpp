/**
 * @file pty_channel.hpp
 * @brief Abstract interface for the master side of a pseudo-terminal pair
 * @version 0.1
 * @date 2025-11-10
 */

#pragma once

#include "byte_channel.hpp"
#include "../enums/state.hpp"
#include <string>

namespace serialmux {

    /**
     * @brief Master side of a PTY-pair whose slave side is handed to clients
     *
     * Implementations:
     * - PtyPair: openpty() based
     * - MockPtyChannel: scriptable peer presence for testing
     */
    class IPtyChannel : public IByteChannel {
        public:
            /**
             * @brief Get the slave device node clients open (e.g. "/dev/pts/4")
             * @return std::string Slave node path
             */
            virtual std::string get_slave_name() const = 0;

            /**
             * @brief Check whether a client currently holds the slave side open
             *
             * Must not consume or inject any data.
             *
             * @return PeerState PRESENT, ABSENT, or ERROR if the master is unusable
             */
            virtual PeerState peer_state() = 0;
    };

} // namespace serialmux
