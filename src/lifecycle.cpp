/**
 * @file lifecycle.cpp
 * @brief Shutdown controller implementation
 * @version 0.1
 * @date 2025-11-10
 */

#include "../include/pattern/lifecycle.hpp"
#include "../include/log.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace serialmux {

    LifecycleController::~LifecycleController() {
        if (handlers_installed_) {
            ::sigaction(SIGINT, &old_int_, nullptr);
            ::sigaction(SIGTERM, &old_term_, nullptr);
        }
    }

    void LifecycleController::signal_handler(int signum) {
        last_signal_ = signum;
        stop_flag_ = 1;
    }

    void LifecycleController::request_shutdown(int signum) {
        signal_handler(signum);
    }

    void LifecycleController::reset() {
        stop_flag_ = 0;
        last_signal_ = 0;
    }

    void LifecycleController::install_signal_handlers() {
        struct sigaction sa {};
        sa.sa_handler = &LifecycleController::signal_handler;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0;  // No SA_RESTART: let a pending poll() return early

        if (::sigaction(SIGINT, &sa, &old_int_) != 0) {
            throw std::system_error(errno, std::generic_category(), "sigaction(SIGINT)");
        }
        if (::sigaction(SIGTERM, &sa, &old_term_) != 0) {
            int err = errno;
            ::sigaction(SIGINT, &old_int_, nullptr);
            throw std::system_error(err, std::generic_category(), "sigaction(SIGTERM)");
        }
        handlers_installed_ = true;
        log::debug("LIFECYCLE", "SIGINT/SIGTERM handlers installed");
    }

    std::unique_ptr<SerialMux> LifecycleController::startup(const MuxConfig& config,
        const MuxFactory& factory) {
        config.validate();

        auto mux = factory(config);
        if (!mux) {
            throw std::invalid_argument("LifecycleController::startup: factory returned no multiplexer");
        }
        mux->open();
        return mux;
    }

    void LifecycleController::wait_for_shutdown(std::chrono::milliseconds tick) {
        while (!shutdown_requested()) {
            std::this_thread::sleep_for(tick);
        }
        log::info("LIFECYCLE", "Termination requested (signal " +
            std::to_string(last_signal()) + ")");
    }

    bool LifecycleController::shutdown(SerialMux& mux) {
        bool expected = false;
        if (!shut_down_.compare_exchange_strong(expected, true)) {
            return false;
        }

        log::info("LIFECYCLE", "Shutting down");
        mux.pool().begin_shutdown();
        mux.stop();
        mux.device().close();
        mux.pool().close_all();
        log::info("LIFECYCLE", "Final " + mux.get_statistics().to_string());
        return true;
    }

    void LifecycleController::detach_stdin() {
        int fd = ::open("/dev/null", O_RDONLY);
        if (fd < 0) {
            throw std::system_error(errno, std::generic_category(), "open(/dev/null)");
        }
        if (fd != STDIN_FILENO) {
            if (::dup2(fd, STDIN_FILENO) < 0) {
                int err = errno;
                ::close(fd);
                throw std::system_error(err, std::generic_category(), "dup2(stdin)");
            }
            ::close(fd);
        }
    }

} // namespace serialmux
