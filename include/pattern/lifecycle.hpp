/**
 * @file lifecycle.hpp
 * @brief Signal driven orderly shutdown of the multiplexer
 * @version 0.1
 * @date 2025-11-10
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <memory>
#include <signal.h>

#include "serial_mux.hpp"

namespace serialmux {

    /**
     * @brief Process-wide termination handling
     *
     * The signal handler only records the request in a sig_atomic_t flag; all
     * teardown happens on the main thread in shutdown(). shutdown() runs its
     * body once per controller, so a second signal arriving mid-teardown, or a
     * second call, never closes anything twice.
     *
     * @code{.cpp}
     * LifecycleController lifecycle;
     * lifecycle.install_signal_handlers();
     * auto mux = LifecycleController::startup(config);
     * mux->start();
     * lifecycle.wait_for_shutdown();
     * lifecycle.shutdown(*mux);
     * @endcode
     */
    class LifecycleController {
        public:
            using MuxFactory = std::function<std::unique_ptr<SerialMux>(const MuxConfig&)>;

            LifecycleController() = default;

            /**
             * @brief Restores the signal dispositions replaced by install_signal_handlers()
             */
            ~LifecycleController();

            LifecycleController(const LifecycleController&) = delete;
            LifecycleController& operator=(const LifecycleController&) = delete;

            /**
             * @brief Route SIGINT and SIGTERM to the shutdown flag
             * @throws std::system_error if sigaction fails
             */
            void install_signal_handlers();

            /**
             * @brief Validate the configuration, build the multiplexer and
             * publish its virtual ports
             *
             * Nothing is built and no symlink is created when the configuration
             * is rejected. The returned multiplexer is not started.
             *
             * @param config Merged configuration
             * @param factory Builds the multiplexer from the validated configuration
             * @throws ConfigException if the configuration is invalid
             */
            static std::unique_ptr<SerialMux> startup(const MuxConfig& config,
                const MuxFactory& factory = &SerialMux::create);

            /**
             * @brief Block in ticks until a termination request arrives
             * @param tick Sleep granularity
             */
            void wait_for_shutdown(std::chrono::milliseconds tick = std::chrono::milliseconds(100));

            /**
             * @brief Tear everything down, once
             *
             * Order: no new recreations, cycle thread stopped, device closed,
             * every PTY-pair closed and every symlink removed.
             *
             * @return bool True if this call performed the teardown
             */
            bool shutdown(SerialMux& mux);

            bool is_shut_down() const { return shut_down_.load(); }

            /// Async-signal-safe; also usable to request shutdown programmatically
            static void request_shutdown(int signum = SIGTERM);
            static bool shutdown_requested() { return stop_flag_ != 0; }
            /// Signal that caused the request, 0 if none
            static int last_signal() { return static_cast<int>(last_signal_); }
            /// Clear a pending request
            static void reset();

            /**
             * @brief Point descriptor 0 at /dev/null
             *
             * The daemon never reads stdin; this keeps pseudo-terminal
             * descriptors from landing on 0 when started with stdin closed.
             *
             * @throws std::system_error if /dev/null cannot be opened
             */
            static void detach_stdin();

        private:
            static inline volatile std::sig_atomic_t stop_flag_ = 0;
            static inline volatile std::sig_atomic_t last_signal_ = 0;

            std::atomic<bool> shut_down_{false};
            bool handlers_installed_ = false;
            struct sigaction old_int_ {};
            struct sigaction old_term_ {};

            static void signal_handler(int signum);
    };

} // namespace serialmux
