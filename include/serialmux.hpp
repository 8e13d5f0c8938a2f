/**
 * @file serialmux.hpp
 * @brief Header file to facilitate the inclusion of the serialmux library
 * @version 0.1
 * @date 2025-11-10
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

// Include the status codes and state enums
#include "enums/error.hpp"
#include "enums/state.hpp"
// Include exception hierarchy and result type
#include "exception/serialmux_exception.hpp"
#include "template/result.hpp"
// Include logging
#include "log.hpp"
// Include the byte channel interfaces and implementations
#include "io/byte_channel.hpp"
#include "io/pty_channel.hpp"
#include "io/real_serial_port.hpp"
#include "io/pty_pair.hpp"
// Include the configuration
#include "pattern/mux_config.hpp"
// Include the multiplexer components
#include "pattern/device_connection.hpp"
#include "pattern/virtual_endpoint.hpp"
#include "pattern/endpoint_pool.hpp"
#include "pattern/serial_mux.hpp"
#include "pattern/lifecycle.hpp"
