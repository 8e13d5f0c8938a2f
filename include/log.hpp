/**
 * @file log.hpp
 * @brief Tagged, timestamped log lines on stderr with a verbosity threshold
 * @version 0.1
 * @date 2025-11-10
 *
 * Every line has the form "HH:MM:SS.mmm [LEVEL] [TAG] message". The threshold
 * only changes how much is printed, never what the multiplexer does.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace serialmux {
    namespace log {

        enum class Level : std::uint8_t {
            DEBUG = 0,
            INFO = 1,
            WARN = 2,
            ERROR = 3
        };

        namespace detail {
            inline std::atomic<Level>& threshold() {
                static std::atomic<Level> level{Level::WARN};
                return level;
            }

            inline std::mutex& output_mutex() {
                static std::mutex m;
                return m;
            }

            inline const char* level_name(Level level) {
                switch (level) {
                case Level::DEBUG: return "DEBUG";
                case Level::INFO:  return "INFO ";
                case Level::WARN:  return "WARN ";
                case Level::ERROR: return "ERROR";
                default:           return "?????";
                }
            }
        } // namespace detail

        /**
         * @brief Get current timestamp as formatted string
         * @return std::string Timestamp in format "HH:MM:SS.mmm"
         */
        inline std::string get_timestamp() {
            auto now = std::chrono::system_clock::now();
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) % 1000;
            auto timer = std::chrono::system_clock::to_time_t(now);
            std::tm bt{};
            localtime_r(&timer, &bt);

            std::ostringstream oss;
            oss << std::put_time(&bt, "%H:%M:%S");
            oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
            return oss.str();
        }

        inline void set_level(Level level) {
            detail::threshold().store(level, std::memory_order_relaxed);
        }

        inline Level get_level() {
            return detail::threshold().load(std::memory_order_relaxed);
        }

        /// DEBUG when verbose, WARN otherwise
        inline void set_verbose(bool verbose) {
            set_level(verbose ? Level::DEBUG : Level::WARN);
        }

        inline bool enabled(Level level) {
            return static_cast<std::uint8_t>(level) >=
                   static_cast<std::uint8_t>(get_level());
        }

        inline void write(Level level, const std::string& tag, const std::string& message) {
            if (!enabled(level)) {
                return;
            }
            std::ostringstream line;
            line << get_timestamp() << " [" << detail::level_name(level) << "] ["
                 << tag << "] " << message << '\n';

            std::lock_guard<std::mutex> lock(detail::output_mutex());
            std::cerr << line.str() << std::flush;
        }

        inline void debug(const std::string& tag, const std::string& message) {
            write(Level::DEBUG, tag, message);
        }

        inline void info(const std::string& tag, const std::string& message) {
            write(Level::INFO, tag, message);
        }

        inline void warn(const std::string& tag, const std::string& message) {
            write(Level::WARN, tag, message);
        }

        inline void error(const std::string& tag, const std::string& message) {
            write(Level::ERROR, tag, message);
        }

    } // namespace log
} // namespace serialmux
