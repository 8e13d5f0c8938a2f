/**
 * @file serialmux_exception.hpp
 * @brief Exception hierarchy for the serialmux library
 * @version 0.1
 * @date 2025-11-10
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

#include <stdexcept>
#include <string>
#include "../enums/error.hpp"

namespace serialmux {

    /**
     * @class SerialMuxException
     * @brief Base exception class for all serialmux errors
     *
     * This exception stores the original Status code for programmatic error handling
     * while providing a descriptive error message via what().
     */
    class SerialMuxException : public std::runtime_error {
        protected:
            Status status_;     ///< Original error status code
            std::string context_; ///< Operation context (function name, etc.)

        public:
            /**
             * @brief Construct exception with status code and context
             * @param status The error status code
             * @param context Description of where the error occurred
             */
            SerialMuxException(Status status, const std::string& context)
                : std::runtime_error(format_message(status, context)),
                status_(status),
                context_(context) {}

            /**
             * @brief Get the status code
             * @return Status code associated with this exception
             */
            Status status() const noexcept { return status_; }

            /**
             * @brief Get the operation context
             * @return Context string describing where error occurred
             */
            const std::string& context() const noexcept { return context_; }

        private:
            static std::string format_message(Status status, const std::string& context) {
                SerialMuxErrorCategory category;
                return "[" + category.message(static_cast<int>(status)) + "] in " + context;
            }
    };

    // === Derived Exception Classes ===

    /**
     * @class DeviceException
     * @brief Exception for physical device open, configuration and I/O errors
     *
     * Corresponds to D* status codes.
     */
    class DeviceException : public SerialMuxException {
        public:
            using SerialMuxException::SerialMuxException;
    };

    /**
     * @class EndpointException
     * @brief Exception for pseudo-terminal and symlink errors
     *
     * Corresponds to P* status codes.
     */
    class EndpointException : public SerialMuxException {
        public:
            using SerialMuxException::SerialMuxException;
    };

    /**
     * @class ConfigException
     * @brief Exception for invalid startup configuration
     *
     * Corresponds to C* status codes.
     */
    class ConfigException : public SerialMuxException {
        public:
            using SerialMuxException::SerialMuxException;
    };

} // namespace serialmux
