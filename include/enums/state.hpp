/**
 * @file state.hpp
 * @brief State machine enums for the device link and the virtual ports.
 * @version 0.1
 * @date 2025-11-10
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

#include <cstdint>
#include <string>

namespace serialmux {

    /**
     * @brief Connection state of the physical device.
     * @note Transitions are:
     *
     * - DISCONNECTED -> CONNECTING: retry timer expired
     *
     * - CONNECTING -> CONNECTED: open and configure succeeded
     *
     * - CONNECTING -> DISCONNECTED: open failed, next attempt scheduled
     *
     * - CONNECTED -> DISCONNECTED: read/write failure, handle closed
     */
    enum class DeviceState : std::uint8_t {
        DISCONNECTED = 0,
        CONNECTING = 1,
        CONNECTED = 2
    };

    /**
     * @brief Lifecycle state of one virtual port.
     * @note ABSENT is only observed before the first open() and after close().
     */
    enum class EndpointState : std::uint8_t {
        ABSENT = 0,
        IDLE = 1,   // PTY-pair published, no client attached
        ACTIVE = 2, // a client holds the slave side open
        DEAD = 3    // PTY-pair unusable, waiting for recreation
    };

    /**
     * @brief Result of probing the master side of a PTY-pair for a client.
     */
    enum class PeerState : std::uint8_t {
        ABSENT = 0,
        PRESENT = 1,
        ERROR = 2
    };

    // === Enum Helper Functions ===

    inline std::string to_string(DeviceState state) {
        switch (state) {
        case DeviceState::DISCONNECTED: return "DISCONNECTED";
        case DeviceState::CONNECTING:   return "CONNECTING";
        case DeviceState::CONNECTED:    return "CONNECTED";
        default:                        return "UNKNOWN";
        }
    }

    inline std::string to_string(EndpointState state) {
        switch (state) {
        case EndpointState::ABSENT: return "ABSENT";
        case EndpointState::IDLE:   return "IDLE";
        case EndpointState::ACTIVE: return "ACTIVE";
        case EndpointState::DEAD:   return "DEAD";
        default:                    return "UNKNOWN";
        }
    }

    inline std::string to_string(PeerState state) {
        switch (state) {
        case PeerState::ABSENT:  return "ABSENT";
        case PeerState::PRESENT: return "PRESENT";
        case PeerState::ERROR:   return "ERROR";
        default:                 return "UNKNOWN";
        }
    }

} // namespace serialmux
