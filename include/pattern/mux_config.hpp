/**
 * @file mux_config.hpp
 * @brief Configuration structure for the serial multiplexer
 * @version 0.1
 * @date 2025-11-10
 *
 * Supports multiple configuration sources:
 * 1. JSON file parsing (e.g. /etc/serialmux.json)
 * 2. Environment variables (SERIALMUX_*)
 * 3. Programmatic defaults
 * 4. Direct construction
 *
 * Priority: Environment variables > JSON file > Defaults
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <string>
#include <cstdint>
#include <optional>
#include <map>
#include <vector>

#include <nlohmann/json.hpp>

namespace serialmux {

    /**
     * @brief Configuration for the multiplexer, static for the process lifetime
     *
     * Environment Variables:
     *
     * - SERIALMUX_DEVICE: Physical device path (default: "/dev/ttyUSB0")
     *
     * - SERIALMUX_BAUD: Serial baud rate in bps (default: 115200)
     *
     * - SERIALMUX_VIRTUAL_PORTS: Comma separated symlink paths
     *   (default: "/dev/ttyV0,/dev/ttyV1,/dev/ttyV2")
     *
     * - SERIALMUX_RECONNECT_INTERVAL: Device reopen interval in ms (default: 2000)
     *
     * - SERIALMUX_POLL_INTERVAL: Scheduling cycle wait in ms (default: 200)
     *
     * - SERIALMUX_TX_QUEUE: Bytes queued toward a busy device before clients
     *   are held back (default: 65536)
     *
     * - SERIALMUX_STATS_INTERVAL: Statistics log period in s, 0 disables (default: 60)
     *
     * - SERIALMUX_VERBOSE: Debug logging (true/false, default: false)
     */
    struct MuxConfig {
        // === Ports ===
        std::string device_path = "/dev/ttyUSB0";
        std::uint32_t baud_rate = 115200;
        std::vector<std::string> virtual_ports = {"/dev/ttyV0", "/dev/ttyV1", "/dev/ttyV2"};

        // === Timing ===
        std::uint32_t reconnect_interval_ms = 2000;
        std::uint32_t poll_interval_ms = 200;
        std::uint32_t stats_interval_s = 60;

        // === Flow control ===
        std::uint32_t tx_queue_bytes = 65536;

        static constexpr std::uint32_t MIN_TX_QUEUE_BYTES = 256;
        static constexpr std::uint32_t MAX_TX_QUEUE_BYTES = 16 * 1024 * 1024;

        // === Logging ===
        bool verbose = false;

        /**
         * @brief Validate configuration
         *
         * Besides logical checks, verifies that each virtual port's parent
         * directory exists and that no virtual port would replace a file that is
         * not a symlink.
         *
         * @throws ConfigException CBAD_PATH, CDUPLICATE_PATH or CBAD_VALUE naming the field
         */
        void validate() const;

        /**
         * @brief Create default configuration
         * @return MuxConfig with sensible defaults
         */
        static MuxConfig create_default();

        /**
         * @brief Load configuration from JSON file
         * @param filepath Path to JSON file
         * @return MuxConfig loaded from JSON file, defaults for missing keys
         * @throws ConfigException CBAD_PATH if the file cannot be read,
         *         CBAD_VALUE if it cannot be parsed or a value has the wrong form
         */
        static MuxConfig from_file(const std::string& filepath);

        /**
         * @brief Load configuration from JSON object
         * @param j JSON object containing a "serialmux" section
         * @return MuxConfig loaded from JSON
         * @throws ConfigException CBAD_VALUE if JSON values are malformed
         */
        static MuxConfig from_json(const nlohmann::json& j);

        /**
         * @brief Load configuration with priority: env vars > JSON file > defaults
         * @param config_file_path Optional path to JSON config file; must exist if given
         * @return MuxConfig with merged settings
         * @throws ConfigException if the file cannot be read or parsed, or a value
         *         has the wrong form
         */
        static MuxConfig load(const std::optional<std::string>& config_file_path = std::nullopt);

        /**
         * @brief Human-readable summary for the startup log
         */
        std::string to_string() const;

        private:
            /**
             * @brief Apply configuration from key-value map
             * @param config Configuration to update
             * @param vars Key-value pairs keyed by environment variable name
             */
            static void apply_config_map(MuxConfig& config,
                const std::map<std::string, std::string>& vars);

            /**
             * @brief Split a comma separated list, trimming blanks around items
             */
            static std::vector<std::string> split_list(const std::string& value);
    };

} // namespace serialmux
