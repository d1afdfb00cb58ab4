#ifndef NFCOLLECT_CONFIG_HPP
#define NFCOLLECT_CONFIG_HPP

#include "session_aggregator.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>

namespace nfcollect {

/**
 * Invalid or unreadable configuration
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Collector configuration
 *
 * YAML layout (every key optional):
 *
 *   listen:
 *     address: 0.0.0.0
 *     port: 2055
 *     receive_timeout_ms: 200
 *     receive_buffer_bytes: 4194304
 *   workers:
 *     count: 4
 *     queue_capacity: 4096
 *   templates:
 *     max_per_exporter: 1024
 *     timeout_seconds: 1800
 *   aggregation:
 *     pairing: reverse_tuple
 *     batch_timeout_ms: 5000
 *   export:
 *     path: flows.json
 *     connections_path: ""
 *     queue_capacity: 1024
 *   logging:
 *     level: info
 */
struct CollectorConfig {
    std::string listen_address = "0.0.0.0";
    uint16_t port = 2055;
    uint32_t receive_timeout_ms = 200;
    uint32_t receive_buffer_bytes = 4 * 1024 * 1024;

    size_t workers = 4;
    size_t queue_capacity = 4096;

    size_t max_templates_per_exporter = 1024;
    uint32_t template_timeout_s = 1800;

    PairingMode pairing = PairingMode::REVERSE_TUPLE;
    uint32_t batch_timeout_ms = 5000;

    std::string output_path = "flows.json";
    std::string connections_path;  // empty = no connection export
    size_t sink_queue_capacity = 1024;

    std::string log_level = "info";

    /**
     * Validate configuration
     */
    bool validate(std::string* error = nullptr) const;
};

/**
 * Parse YAML text on top of the defaults
 *
 * @throws ConfigError on syntax errors, unknown keys or wrongly typed values
 */
CollectorConfig parse_config(const std::string& yaml_text);

/**
 * @throws ConfigError if the file cannot be read or parsed
 */
CollectorConfig load_config_file(const std::string& path);

} // namespace nfcollect

#endif // NFCOLLECT_CONFIG_HPP
