/**
 * @file error.hpp
 * @brief Error codes for serialmux operations.
 * @version 0.1
 * @date 2025-11-10
 */

#pragma once
#include <string>
#include <system_error>
#include <type_traits>

namespace serialmux {

/**
 * @enum Status
 * @brief Enumeration of error codes for serialmux operations.
 * These codes can be converted to std::error_code for integration with
 * standard error handling mechanisms.
 * @note SUCCESS (0) indicates no error.
 * If starts with 'D' it is a physical device error.
 * If starts with 'P' it is a pseudo-terminal (virtual endpoint) error.
 * If starts with 'C' it is a configuration error.
 * @see std::error_code
 */
    enum class Status : int {
        SUCCESS = 0,        /**< No error */
        DNOT_FOUND = 1,     /**< Device not found or cannot be opened */
        DNOT_OPEN = 2,      /**< Device not open */
        DBUSY = 3,          /**< Device locked by another owner */
        DREAD_ERROR = 4,    /**< Device read error */
        DWRITE_ERROR = 5,   /**< Device write error */
        DCONFIG_ERROR = 6,  /**< Device configuration error */
        DDISCONNECTED = 7,  /**< Device link lost */
        PCREATE_ERROR = 8,  /**< Pseudo-terminal allocation failed */
        PLINK_ERROR = 9,    /**< Symlink publication failed */
        PNO_CLIENT = 10,    /**< No client attached to the virtual port */
        PDEAD = 11,         /**< Pseudo-terminal unusable */
        CBAD_PATH = 12,     /**< Malformed path in configuration */
        CDUPLICATE_PATH = 13, /**< Duplicate path in configuration */
        CBAD_VALUE = 14,    /**< Out of range configuration value */
        UNKNOWN = 255       /**< Unknown error */
    };

/**
 * @class SerialMuxErrorCategory
 * @brief Custom error category for serialmux errors.
 */
    class SerialMuxErrorCategory : public std::error_category {
        public:
            const char*name() const noexcept override {
                return "serialmux::Status";
            }

            std::string message(int ev) const override {
                switch (static_cast<Status>(ev)) {
                case Status::SUCCESS:
                    return "Success";
                case Status::DNOT_FOUND:
                    return "Device not found";
                case Status::DNOT_OPEN:
                    return "Device not open";
                case Status::DBUSY:
                    return "Device busy";
                case Status::DREAD_ERROR:
                    return "Device read error";
                case Status::DWRITE_ERROR:
                    return "Device write error";
                case Status::DCONFIG_ERROR:
                    return "Device configuration error";
                case Status::DDISCONNECTED:
                    return "Device disconnected";
                case Status::PCREATE_ERROR:
                    return "Pseudo-terminal creation failed";
                case Status::PLINK_ERROR:
                    return "Virtual port link error";
                case Status::PNO_CLIENT:
                    return "No client attached";
                case Status::PDEAD:
                    return "Virtual port dead";
                case Status::CBAD_PATH:
                    return "Bad path";
                case Status::CDUPLICATE_PATH:
                    return "Duplicate path";
                case Status::CBAD_VALUE:
                    return "Bad configuration value";
                case Status::UNKNOWN:
                    return "Unknown error";
                default:
                    return "Unrecognized error";
                }
            }
    };

// Get the error category instance
    inline const std::error_category &serialmux_category() {
        static SerialMuxErrorCategory instance;
        return instance;
    }

// Make error_code from Status
    inline std::error_code make_error_code(Status e) {
        return {static_cast<int>(e), serialmux_category()};
    }

} // namespace serialmux

// Register the enum for use with std::error_code
namespace std {
    template<> struct is_error_code_enum<serialmux::Status> : true_type {};
} // namespace std
