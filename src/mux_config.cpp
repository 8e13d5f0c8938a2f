/**
 * @file mux_config.cpp
 * @brief Configuration structure implementation
 * @version 0.1
 * @date 2025-11-10
 */

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <set>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "../include/pattern/mux_config.hpp"
#include "../include/exception/serialmux_exception.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace serialmux {

    namespace {

        const char* const kEnvKeys[] = {
            "SERIALMUX_DEVICE",
            "SERIALMUX_BAUD",
            "SERIALMUX_VIRTUAL_PORTS",
            "SERIALMUX_RECONNECT_INTERVAL",
            "SERIALMUX_POLL_INTERVAL",
            "SERIALMUX_TX_QUEUE",
            "SERIALMUX_STATS_INTERVAL",
            "SERIALMUX_VERBOSE",
        };

        std::uint32_t parse_uint32(const std::string& name, const std::string& value) {
            if (value.empty() || value[0] == '-') {
                throw ConfigException(Status::CBAD_VALUE, "Invalid " + name + ": '" + value + "'");
            }
            std::size_t pos = 0;
            unsigned long parsed = 0;
            try {
                parsed = std::stoul(value, &pos, 0);  // Support hex (0x...)
            } catch (const std::out_of_range&) {
                throw ConfigException(Status::CBAD_VALUE, name + " out of range: '" + value + "'");
            } catch (const std::invalid_argument&) {
                throw ConfigException(Status::CBAD_VALUE, "Invalid " + name + ": '" + value + "'");
            }
            if (pos != value.size() || parsed > 0xFFFFFFFFUL) {
                throw ConfigException(Status::CBAD_VALUE, "Invalid " + name + ": '" + value + "'");
            }
            return static_cast<std::uint32_t>(parsed);
        }

        bool parse_bool(const std::string& value) {
            std::string v = value;
            std::transform(v.begin(), v.end(), v.begin(), ::tolower);
            return v == "true" || v == "1" || v == "yes" || v == "on";
        }

        void check_path(const std::string& field, const std::string& path) {
            if (path.empty()) {
                throw ConfigException(Status::CBAD_PATH, field + " cannot be empty");
            }
            if (path.find('\0') != std::string::npos) {
                throw ConfigException(Status::CBAD_PATH, field + " contains a NUL byte");
            }
            if (path[0] != '/') {
                throw ConfigException(Status::CBAD_PATH, field + " must be an absolute path: " + path);
            }
            if (path.size() == 1 || path.back() == '/') {
                throw ConfigException(Status::CBAD_PATH,
                          field + " must name a file, not a directory: " + path);
            }
        }

    } // namespace

    // === Configuration Validation ===

    void MuxConfig::validate() const {
        check_path("Device path", device_path);

        if (baud_rate == 0) {
            throw ConfigException(Status::CBAD_VALUE, "Baud rate must be > 0");
        }

        if (virtual_ports.empty()) {
            throw ConfigException(Status::CBAD_VALUE, "At least one virtual port is required");
        }

        const auto device_normal = fs::path(device_path).lexically_normal();
        std::set<fs::path> seen;
        for (const auto& port : virtual_ports) {
            check_path("Virtual port path", port);

            auto normal = fs::path(port).lexically_normal();
            if (normal == device_normal) {
                throw ConfigException(Status::CDUPLICATE_PATH,
                          "Virtual port path equals device path: " + port);
            }
            if (!seen.insert(normal).second) {
                throw ConfigException(Status::CDUPLICATE_PATH, "Duplicate virtual port path: " + port);
            }

            std::error_code ec;
            if (!fs::is_directory(normal.parent_path(), ec)) {
                throw ConfigException(Status::CBAD_PATH, "Virtual port directory does not exist: " +
                          normal.parent_path().string());
            }
            auto status = fs::symlink_status(normal, ec);
            if (!ec && fs::exists(status) && !fs::is_symlink(status)) {
                throw ConfigException(Status::CBAD_PATH,
                          "Virtual port path exists and is not a symlink: " + port);
            }
        }

        // Validate timing
        if (poll_interval_ms == 0 || poll_interval_ms > 60000) {
            throw ConfigException(Status::CBAD_VALUE, "Poll interval must be in 1..60000 ms");
        }
        if (reconnect_interval_ms == 0 || reconnect_interval_ms > 600000) {
            throw ConfigException(Status::CBAD_VALUE, "Reconnect interval must be in 1..600000 ms");
        }
        if (tx_queue_bytes < MIN_TX_QUEUE_BYTES || tx_queue_bytes > MAX_TX_QUEUE_BYTES) {
            throw ConfigException(Status::CBAD_VALUE, "Device TX queue must be in " +
                      std::to_string(MIN_TX_QUEUE_BYTES) + ".." +
                      std::to_string(MAX_TX_QUEUE_BYTES) + " bytes");
        }
    }

    // === Factory Methods ===

    MuxConfig MuxConfig::create_default() {
        MuxConfig config;
        config.device_path = "/dev/ttyUSB0";
        config.baud_rate = 115200;
        config.virtual_ports = {"/dev/ttyV0", "/dev/ttyV1", "/dev/ttyV2"};
        config.reconnect_interval_ms = 2000;
        config.poll_interval_ms = 200;
        config.tx_queue_bytes = 65536;
        config.stats_interval_s = 60;
        config.verbose = false;
        return config;
    }

    std::vector<std::string> MuxConfig::split_list(const std::string& value) {
        std::vector<std::string> items;
        std::stringstream ss(value);
        std::string item;
        while (std::getline(ss, item, ',')) {
            auto first = item.find_first_not_of(" \t");
            auto last = item.find_last_not_of(" \t");
            if (first == std::string::npos) {
                throw ConfigException(Status::CBAD_PATH,
                          "Empty entry in virtual port list: '" + value + "'");
            }
            items.push_back(item.substr(first, last - first + 1));
        }
        return items;
    }

    // === JSON Parsing ===

    MuxConfig MuxConfig::from_json(const json& j) {
        MuxConfig config = create_default();

        if (!j.contains("serialmux")) {
            return config;
        }

        std::map<std::string, std::string> config_map;
        try {
            const auto& sm = j.at("serialmux");

            // Convert JSON fields to SERIALMUX_* format to reuse the env parsing logic
            if (sm.contains("device_path")) {
                config_map["SERIALMUX_DEVICE"] = sm["device_path"].get<std::string>();
            }
            if (sm.contains("baud_rate")) {
                config_map["SERIALMUX_BAUD"] = std::to_string(sm["baud_rate"].get<std::uint32_t>());
            }
            if (sm.contains("reconnect_interval_ms")) {
                config_map["SERIALMUX_RECONNECT_INTERVAL"] =
                    std::to_string(sm["reconnect_interval_ms"].get<std::uint32_t>());
            }
            if (sm.contains("poll_interval_ms")) {
                config_map["SERIALMUX_POLL_INTERVAL"] =
                    std::to_string(sm["poll_interval_ms"].get<std::uint32_t>());
            }
            if (sm.contains("tx_queue_bytes")) {
                config_map["SERIALMUX_TX_QUEUE"] =
                    std::to_string(sm["tx_queue_bytes"].get<std::uint32_t>());
            }
            if (sm.contains("stats_interval_s")) {
                config_map["SERIALMUX_STATS_INTERVAL"] =
                    std::to_string(sm["stats_interval_s"].get<std::uint32_t>());
            }
            if (sm.contains("verbose")) {
                config_map["SERIALMUX_VERBOSE"] = sm["verbose"].get<bool>() ? "true" : "false";
            }

            // Paths may contain commas, so the list is taken as an array directly
            if (sm.contains("virtual_ports")) {
                config.virtual_ports = sm["virtual_ports"].get<std::vector<std::string> >();
            }
        } catch (const json::exception& e) {
            throw ConfigException(Status::CBAD_VALUE,
                      "Malformed serialmux configuration: " + std::string(e.what()));
        }

        apply_config_map(config, config_map);
        return config;
    }

    // === Configuration Application ===

    void MuxConfig::apply_config_map(MuxConfig& config,
        const std::map<std::string, std::string>& vars) {
        auto get_val = [&vars](const std::string& key) -> std::optional<std::string> {
                auto it = vars.find(key);
                if (it != vars.end()) {
                    return it->second;
                }
                return std::nullopt;
            };

        if (auto val = get_val("SERIALMUX_DEVICE")) {
            config.device_path = *val;
        }
        if (auto val = get_val("SERIALMUX_BAUD")) {
            config.baud_rate = parse_uint32("baud rate", *val);
        }
        if (auto val = get_val("SERIALMUX_VIRTUAL_PORTS")) {
            config.virtual_ports = split_list(*val);
        }
        if (auto val = get_val("SERIALMUX_RECONNECT_INTERVAL")) {
            config.reconnect_interval_ms = parse_uint32("reconnect interval", *val);
        }
        if (auto val = get_val("SERIALMUX_POLL_INTERVAL")) {
            config.poll_interval_ms = parse_uint32("poll interval", *val);
        }
        if (auto val = get_val("SERIALMUX_TX_QUEUE")) {
            config.tx_queue_bytes = parse_uint32("device TX queue", *val);
        }
        if (auto val = get_val("SERIALMUX_STATS_INTERVAL")) {
            config.stats_interval_s = parse_uint32("stats interval", *val);
        }
        if (auto val = get_val("SERIALMUX_VERBOSE")) {
            config.verbose = parse_bool(*val);
        }
    }

    // === Load Methods ===

    MuxConfig MuxConfig::from_file(const std::string& filepath) {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            throw ConfigException(Status::CBAD_PATH, "Cannot open JSON config file: " + filepath);
        }

        json j;
        try {
            file >> j;
        } catch (const json::exception& e) {
            throw ConfigException(Status::CBAD_VALUE,
                      "JSON parse error in " + filepath + ": " + e.what());
        }
        return from_json(j);
    }

    MuxConfig MuxConfig::load(const std::optional<std::string>& config_file_path) {
        MuxConfig config = config_file_path.has_value() ?
            from_file(*config_file_path) : create_default();

        // Environment variables that are actually set override the file
        std::map<std::string, std::string> env_vars;
        for (const char* key : kEnvKeys) {
            if (const char* val = std::getenv(key)) {
                env_vars[key] = val;
            }
        }

        if (!env_vars.empty()) {
            apply_config_map(config, env_vars);
        }

        return config;
    }

    std::string MuxConfig::to_string() const {
        std::ostringstream oss;
        oss << "device=" << device_path << " @ " << baud_rate << " baud, virtual ports=[";
        for (std::size_t i = 0; i < virtual_ports.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << virtual_ports[i];
        }
        oss << "], reconnect=" << reconnect_interval_ms << "ms, poll=" << poll_interval_ms
            << "ms, tx queue=" << tx_queue_bytes << "B, stats=" << stats_interval_s << "s";
        return oss.str();
    }

} // namespace serialmux
