/**
 * @file endpoint_pool.hpp
 * @brief Fixed-size set of virtual ports and their supervisor
 * @version 0.1
 * @date 2025-11-10
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "virtual_endpoint.hpp"

namespace serialmux {

    /**
     * @brief Owner of one VirtualEndpoint per configured symlink path
     *
     * The collection is built once in the constructor, in configuration order,
     * and never resized. Endpoints are addressed by index; callers get
     * references to query and move data, never ownership.
     *
     * Once begin_shutdown() was called no endpoint is recreated anymore, so a
     * symlink removed during teardown is never published again.
     *
     * An endpoint that just died is recreated on the next supervise() call.
     * When that fails, further attempts for the same endpoint wait for the
     * retry interval, and only the first failure of a streak is logged as a
     * warning.
     */
    class EndpointPool {
        public:
            using Clock = std::chrono::steady_clock;

            static constexpr std::chrono::milliseconds DEFAULT_RETRY_INTERVAL{2000};

            /**
             * @brief Constructor with dependency injection
             * @param symlink_paths Ordered, distinct symlink paths
             * @param factory PTY factory handed to every endpoint
             * @param retry_interval Delay between failed recreations of one endpoint
             */
            EndpointPool(const std::vector<std::string>& symlink_paths,
                VirtualEndpoint::PtyFactory factory,
                std::chrono::milliseconds retry_interval = DEFAULT_RETRY_INTERVAL);

            /**
             * @brief Factory method using PtyPair for every endpoint
             */
            static std::unique_ptr<EndpointPool> create(const std::vector<std::string>& symlink_paths,
                std::chrono::milliseconds retry_interval = DEFAULT_RETRY_INTERVAL);

            ~EndpointPool();

            EndpointPool(const EndpointPool&) = delete;
            EndpointPool& operator=(const EndpointPool&) = delete;

            /**
             * @brief Create every endpoint's PTY-pair and symlink
             * @return std::size_t Number of endpoints that came up IDLE
             */
            std::size_t open_all();

            /**
             * @brief Recreate every DEAD endpoint and every endpoint whose symlink
             * no longer resolves to its slave node
             *
             * A failed recreation leaves the endpoint DEAD until the retry
             * interval elapsed and does not hold up the others. No-op once
             * shutdown began.
             *
             * @param now Current time (drives the per-endpoint retry timer)
             * @return std::size_t Number of recreations attempted
             */
            std::size_t supervise(Clock::time_point now);

            /**
             * @brief Check every IDLE endpoint for a newly attached client
             * @return std::size_t Number of endpoints that became ACTIVE
             */
            std::size_t accept_clients();

            /**
             * @brief Close every endpoint and remove every symlink. Idempotent.
             */
            void close_all();

            void begin_shutdown() { shutting_down_.store(true); }
            bool is_shutting_down() const { return shutting_down_.load(); }

            std::size_t size() const { return endpoints_.size(); }
            VirtualEndpoint& at(std::size_t index) { return *endpoints_.at(index); }
            const VirtualEndpoint& at(std::size_t index) const { return *endpoints_.at(index); }

            std::size_t active_count() const { return count(EndpointState::ACTIVE); }
            std::size_t idle_count() const { return count(EndpointState::IDLE); }
            std::size_t dead_count() const { return count(EndpointState::DEAD); }

            /// Total recreations since construction
            std::uint64_t recreations() const { return recreations_; }

            std::chrono::milliseconds retry_interval() const { return retry_interval_; }

        private:
            struct Retry {
                Clock::time_point not_before{};
                bool failing = false;
            };

            std::vector<std::unique_ptr<VirtualEndpoint> > endpoints_;
            std::vector<Retry> retries_;
            std::chrono::milliseconds retry_interval_;
            std::atomic<bool> shutting_down_{false};
            std::uint64_t recreations_ = 0;

            std::size_t count(EndpointState state) const;
    };

} // namespace serialmux
