#include "arg_parser.hpp"
#include <nfcollect/collector.hpp>
#include <nfcollect/config.hpp>
#include <nfcollect/logging.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

using namespace nfcollect;

namespace {

std::atomic<bool> g_stop(false);

void handle_signal(int) {
    g_stop = true;
}

struct ProgramOptions {
    std::string config_file;
    CollectorConfig overrides;
    std::string pairing = "reverse_tuple";
};

// Command-line values win over the configuration file
void apply_overrides(const tools::ArgParser& parser, const ProgramOptions& opts,
                     CollectorConfig& config) {
    if (parser.was_set("listen")) config.listen_address = opts.overrides.listen_address;
    if (parser.was_set("port")) config.port = opts.overrides.port;
    if (parser.was_set("output")) config.output_path = opts.overrides.output_path;
    if (parser.was_set("connections")) config.connections_path = opts.overrides.connections_path;
    if (parser.was_set("workers")) config.workers = opts.overrides.workers;
    if (parser.was_set("log-level")) config.log_level = opts.overrides.log_level;
    if (parser.was_set("pairing")) config.pairing = parse_pairing_mode(opts.pairing);
}

} // namespace

int main(int argc, char** argv) {
    ProgramOptions opts;

    tools::ArgParser parser("nfcollectd - NetFlow v9 / IPFIX collector");

    parser.add_option("-c", "config", opts.config_file,
                      "YAML configuration file");
    parser.add_option("-l", "listen", opts.overrides.listen_address,
                      "Listen address (IPv4 or IPv6)");
    parser.add_option("-p", "port", opts.overrides.port,
                      "UDP port");
    parser.add_option("-o", "output", opts.overrides.output_path,
                      "Flow export file (JSON Lines, appended)");
    parser.add_option("", "connections", opts.overrides.connections_path,
                      "Connection export file (JSON Lines, appended)");
    parser.add_option("-w", "workers", opts.overrides.workers,
                      "Number of decode workers");
    parser.add_option("", "pairing", opts.pairing,
                      "Flow pairing: reverse_tuple, sequential");
    parser.add_option("-v", "log-level", opts.overrides.log_level,
                      "Log level: trace, debug, info, warn, error, off");

    if (!parser.parse(argc, argv)) {
        if (parser.should_show_help()) {
            parser.print_help();
            return 0;
        }
        std::cerr << "Error: " << parser.error() << "\n\n";
        parser.print_help(std::cerr);
        return 1;
    }

    auto logger = Logger::instance();

    try {
        CollectorConfig config;
        if (!opts.config_file.empty()) {
            config = load_config_file(opts.config_file);
        }
        apply_overrides(parser, opts, config);

        std::string error;
        if (!config.validate(&error)) {
            SPDLOG_LOGGER_CRITICAL(logger, "Invalid configuration: {}", error);
            return 1;
        }

        spdlog::level::level_enum level;
        if (Logger::parse_level(config.log_level, level)) {
            Logger::set_level(level);
        }

        CollectorService service(config);

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        service.start();
        while (!g_stop) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        SPDLOG_LOGGER_INFO(logger, "Shutting down");
        service.stop();
    } catch (const std::invalid_argument& e) {
        SPDLOG_LOGGER_CRITICAL(logger, "{}", e.what());
        return 1;
    } catch (const ConfigError& e) {
        SPDLOG_LOGGER_CRITICAL(logger, "{}", e.what());
        return 1;
    } catch (const ExportError& e) {
        SPDLOG_LOGGER_CRITICAL(logger, "{}", e.what());
        return 1;
    } catch (const std::runtime_error& e) {
        SPDLOG_LOGGER_CRITICAL(logger, "{}", e.what());
        return 1;
    }

    return 0;
}
