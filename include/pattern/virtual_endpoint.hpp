/**
 * @file virtual_endpoint.hpp
 * @brief One named virtual port: a PTY-pair published under a stable symlink
 * @version 0.1
 * @date 2025-11-10
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <boost/core/span.hpp>

#include "../enums/state.hpp"
#include "../io/pty_channel.hpp"
#include "../template/result.hpp"

namespace serialmux {

    /**
     * @brief Virtual port state machine
     *
     * @code{.txt}
     *   ABSENT --open()--> IDLE <--client closed-- ACTIVE
     *                        |  --accept_client()------>   |
     *                        +------> DEAD <-----------+   (PTY-pair error)
     *   DEAD --recreate()--> IDLE  (fresh PTY-pair, same symlink path)
     *   any  --close()-->   ABSENT (symlink removed)
     * @endcode
     *
     * Each open()/recreate() allocates a brand new PTY-pair through the factory;
     * an OS handle is never reused once it was released. The symlink is
     * replaced with rename(), so clients never observe a missing path during
     * recreation.
     */
    class VirtualEndpoint {
        public:
            using PtyFactory = std::function<std::unique_ptr<IPtyChannel>(
                        const std::string& symlink_path)>;

            /**
             * @brief Constructor with dependency injection
             * @param symlink_path Stable path published for clients
             * @param factory Allocates a PTY-pair or throws EndpointException
             */
            VirtualEndpoint(std::string symlink_path, PtyFactory factory);

            /**
             * @brief Factory method using PtyPair
             */
            static std::unique_ptr<VirtualEndpoint> create(const std::string& symlink_path);

            ~VirtualEndpoint();

            VirtualEndpoint(const VirtualEndpoint&) = delete;
            VirtualEndpoint& operator=(const VirtualEndpoint&) = delete;

            /**
             * @brief Allocate a PTY-pair and publish the symlink
             * @return bool True if the endpoint is now IDLE, false if DEAD
             */
            bool open();

            /**
             * @brief Release what is left of the current PTY-pair and open a fresh one
             *
             * The symlink is only touched by the atomic replacement, never removed.
             *
             * @return bool True if the endpoint is now IDLE
             */
            bool recreate();

            /**
             * @brief Check an IDLE endpoint for a newly attached client
             * @return bool True if the endpoint just became ACTIVE
             */
            bool accept_client();

            /**
             * @brief Check that the symlink still resolves to the current slave node
             * @return bool False if the link vanished or was redirected;
             *         always true when there is nothing published
             */
            bool verify_link() const;

            /**
             * @brief Read bytes written by the client
             * @return Result<std::size_t> Bytes read (0 if nothing ready);
             *         PNO_CLIENT if no client is attached (ACTIVE -> IDLE);
             *         PDEAD if the PTY-pair failed
             */
            Result<std::size_t> read(boost::span<std::uint8_t> buffer);

            /**
             * @brief Write bytes to the client
             *
             * Bytes the client side cannot take right now are dropped for this
             * endpoint only; the returned count tells how many were accepted.
             *
             * @return Result<std::size_t> Bytes accepted;
             *         PNO_CLIENT if no client is attached; PDEAD if the PTY-pair failed
             */
            Result<std::size_t> write(boost::span<const std::uint8_t> data);

            /**
             * @brief Permanent teardown: close the PTY-pair and remove the symlink
             *
             * Idempotent. The symlink is only removed while it is still a symlink.
             */
            void close();

            EndpointState state() const { return state_; }
            bool is_active() const { return state_ == EndpointState::ACTIVE; }
            bool is_dead() const { return state_ == EndpointState::DEAD; }

            const std::string& get_symlink_path() const { return symlink_path_; }
            /// Slave node of the current PTY-pair, empty when none is allocated
            const std::string& get_slave_name() const { return slave_name_; }
            /// Master descriptor for poll(), -1 when none is allocated
            int get_fd() const;
            /// Number of PTY-pairs allocated so far
            std::uint64_t generation() const { return generation_; }
            /// Why the endpoint last went DEAD, empty once it came back up
            const std::string& last_error() const { return last_error_; }

        private:
            std::string symlink_path_;
            PtyFactory factory_;
            std::unique_ptr<IPtyChannel> channel_;
            std::string slave_name_;
            EndpointState state_ = EndpointState::ABSENT;
            std::uint64_t generation_ = 0;
            std::string last_error_;

            void release_channel();
            void publish_link();
            void detach_client(const std::string& reason);
            void mark_dead(const std::string& reason);
    };

} // namespace serialmux
