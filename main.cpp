#include "include/serialmux.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <optional>
#include <algorithm>
#include <getopt.h>

using namespace serialmux;

namespace {

    struct CommandLine {
        std::optional<std::string> config_file;
        bool verbose = false;
    };

    // Helper function to format a chunk as hex string
    std::string format_bytes(boost::span<const std::uint8_t> data, std::size_t max_bytes = 32) {
        std::ostringstream oss;
        oss << std::hex << std::uppercase << std::setfill('0');
        std::size_t shown = std::min(data.size(), max_bytes);
        for (std::size_t i = 0; i < shown; ++i) {
            oss << std::setw(2) << static_cast<int>(data[i]);
            if (i + 1 < shown) oss << " ";
        }
        if (data.size() > shown) {
            oss << " ...";
        }
        return oss.str();
    }

    void display_help(const std::string& program_name) {
        std::cout << "Usage: " << program_name << " [-v] [-c <config.json>] [-h]\n\n"
                  << "Shares one serial device between several programs through\n"
                  << "pseudo-terminal symlinks.\n\n"
                  << "Options:\n"
                  << "  -c <file>  JSON configuration file ({\"serialmux\": {...}})\n"
                  << "  -v         Verbose (debug) logging\n"
                  << "  -h         Show this help\n\n"
                  << "Environment overrides: SERIALMUX_DEVICE, SERIALMUX_BAUD,\n"
                  << "  SERIALMUX_VIRTUAL_PORTS, SERIALMUX_RECONNECT_INTERVAL,\n"
                  << "  SERIALMUX_POLL_INTERVAL, SERIALMUX_TX_QUEUE,\n"
                  << "  SERIALMUX_STATS_INTERVAL, SERIALMUX_VERBOSE\n";
    }

    /**
     * @brief Parse command line
     * @return std::optional<CommandLine> nullopt when the process should exit
     *         with the code stored in exit_code
     */
    std::optional<CommandLine> parse_arguments(int argc, char* argv[], int& exit_code) {
        CommandLine cmd;
        int opt;
        opterr = 0;
        while ((opt = getopt(argc, argv, ":c:vh")) != -1) {
            switch (opt) {
            case 'c':
                cmd.config_file = std::string(optarg);
                break;
            case 'v':
                cmd.verbose = true;
                break;
            case 'h':
                display_help(argv[0]);
                exit_code = 0;
                return std::nullopt;
            case ':':
                std::cerr << "[ERROR] Option -" << static_cast<char>(optopt) <<
                    " requires an argument\n\n";
                display_help(argv[0]);
                exit_code = 1;
                return std::nullopt;
            default:
                std::cerr << "[ERROR] Unknown option -" << static_cast<char>(optopt) << "\n\n";
                display_help(argv[0]);
                exit_code = 1;
                return std::nullopt;
            }
        }
        if (optind < argc) {
            std::cerr << "[ERROR] Unexpected argument: " << argv[optind] << "\n\n";
            display_help(argv[0]);
            exit_code = 1;
            return std::nullopt;
        }
        return cmd;
    }

} // namespace

int main(int argc, char* argv[]) {
    int exit_code = 0;
    auto cmd = parse_arguments(argc, argv, exit_code);
    if (!cmd) {
        return exit_code;
    }

    // === Configuration (fatal errors end here, before anything is created) ===
    MuxConfig config;
    try {
        config = MuxConfig::load(cmd->config_file);
        if (cmd->verbose) {
            config.verbose = true;
        }
    } catch (const ConfigException& e) {
        std::cerr << "[ERROR] Configuration error: " << e.what() << "\n";
        return 1;
    }
    log::set_verbose(config.verbose);

    LifecycleController lifecycle;
    try {
        LifecycleController::detach_stdin();
        lifecycle.install_signal_handlers();

        auto mux = LifecycleController::startup(config);

        if (config.verbose) {
            mux->set_device_to_endpoints_callback(
                [](const std::string& source, boost::span<const std::uint8_t> data) {
                    log::debug("DATA", source + " -> ports (" + std::to_string(data.size()) +
                        " B): " + format_bytes(data));
                });
            mux->set_endpoint_to_device_callback(
                [](const std::string& source, boost::span<const std::uint8_t> data) {
                    log::debug("DATA", source + " -> device (" + std::to_string(data.size()) +
                        " B): " + format_bytes(data));
                });
        }

        mux->start();
        log::info("MAIN", "Running, send SIGINT or SIGTERM to stop");

        lifecycle.wait_for_shutdown();
        lifecycle.shutdown(*mux);
    } catch (const ConfigException& e) {
        std::cerr << "[ERROR] Configuration error: " << e.what() << "\n";
        return 1;
    } catch (const SerialMuxException& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        std::cerr << "  Status code: " << static_cast<int>(e.status()) << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Unexpected error: " << e.what() << "\n";
        return 1;
    }

    log::info("MAIN", "Exiting");
    return 0;
}
