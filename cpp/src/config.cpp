#include "nfcollect/config.hpp"
#include "nfcollect/logging.hpp"
#include <yaml-cpp/yaml.h>
#include <arpa/inet.h>
#include <set>

namespace nfcollect {

namespace {

void check_keys(const YAML::Node& node, const std::string& section,
                const std::set<std::string>& allowed) {
    if (node.IsNull()) {
        return;
    }
    if (!node.IsMap()) {
        throw ConfigError("Section '" + section + "' must be a mapping");
    }
    for (const auto& entry : node) {
        std::string key = entry.first.as<std::string>();
        if (allowed.count(key) == 0) {
            throw ConfigError("Unknown key '" + key + "' in section '" + section + "'");
        }
    }
}

template<typename T>
void read_value(const YAML::Node& section, const char* key, const std::string& section_name,
                T& target) {
    const YAML::Node value = section[key];
    if (!value) {
        return;
    }
    try {
        target = value.as<T>();
    } catch (const YAML::Exception&) {
        throw ConfigError("Invalid value for " + section_name + "." + key + ": " +
                          YAML::Dump(value));
    }
}

CollectorConfig config_from_node(const YAML::Node& root) {
    CollectorConfig config;
    if (root.IsNull()) {
        return config;
    }

    check_keys(root, "<root>", {"listen", "workers", "templates", "aggregation", "export", "logging"});

    if (const YAML::Node listen = root["listen"]) {
        check_keys(listen, "listen", {"address", "port", "receive_timeout_ms", "receive_buffer_bytes"});
        read_value(listen, "address", "listen", config.listen_address);
        read_value(listen, "port", "listen", config.port);
        read_value(listen, "receive_timeout_ms", "listen", config.receive_timeout_ms);
        read_value(listen, "receive_buffer_bytes", "listen", config.receive_buffer_bytes);
    }

    if (const YAML::Node workers = root["workers"]) {
        check_keys(workers, "workers", {"count", "queue_capacity"});
        read_value(workers, "count", "workers", config.workers);
        read_value(workers, "queue_capacity", "workers", config.queue_capacity);
    }

    if (const YAML::Node templates = root["templates"]) {
        check_keys(templates, "templates", {"max_per_exporter", "timeout_seconds"});
        read_value(templates, "max_per_exporter", "templates", config.max_templates_per_exporter);
        read_value(templates, "timeout_seconds", "templates", config.template_timeout_s);
    }

    if (const YAML::Node aggregation = root["aggregation"]) {
        check_keys(aggregation, "aggregation", {"pairing", "batch_timeout_ms"});
        std::string pairing = pairing_mode_name(config.pairing);
        read_value(aggregation, "pairing", "aggregation", pairing);
        try {
            config.pairing = parse_pairing_mode(pairing);
        } catch (const std::invalid_argument& e) {
            throw ConfigError(e.what());
        }
        read_value(aggregation, "batch_timeout_ms", "aggregation", config.batch_timeout_ms);
    }

    if (const YAML::Node exports = root["export"]) {
        check_keys(exports, "export", {"path", "connections_path", "queue_capacity"});
        read_value(exports, "path", "export", config.output_path);
        read_value(exports, "connections_path", "export", config.connections_path);
        read_value(exports, "queue_capacity", "export", config.sink_queue_capacity);
    }

    if (const YAML::Node logging = root["logging"]) {
        check_keys(logging, "logging", {"level"});
        read_value(logging, "level", "logging", config.log_level);
    }

    return config;
}

} // namespace

bool CollectorConfig::validate(std::string* error) const {
    unsigned char addr[16];
    if (inet_pton(AF_INET, listen_address.c_str(), addr) != 1 &&
        inet_pton(AF_INET6, listen_address.c_str(), addr) != 1) {
        if (error) *error = "listen address is not an IPv4 or IPv6 address: " + listen_address;
        return false;
    }

    if (workers == 0) {
        if (error) *error = "workers must be at least 1";
        return false;
    }

    if (queue_capacity == 0 || sink_queue_capacity == 0) {
        if (error) *error = "queue capacities must be at least 1";
        return false;
    }

    if (receive_timeout_ms == 0) {
        if (error) *error = "receive_timeout_ms must be positive";
        return false;
    }

    if (batch_timeout_ms == 0) {
        if (error) *error = "batch_timeout_ms must be positive";
        return false;
    }

    if (output_path.empty() && connections_path.empty()) {
        if (error) *error = "at least one of export.path and export.connections_path is required";
        return false;
    }

    if (!output_path.empty() && output_path == connections_path) {
        if (error) *error = "flows and connections cannot share an export file: " + output_path;
        return false;
    }

    spdlog::level::level_enum level;
    if (!Logger::parse_level(log_level, level)) {
        if (error) *error = "unknown log level: " + log_level;
        return false;
    }

    return true;
}

CollectorConfig parse_config(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid YAML: ") + e.what());
    }
    return config_from_node(root);
}

CollectorConfig load_config_file(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw ConfigError("Cannot read config file: " + path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid YAML in " + path + ": " + e.what());
    }
    return config_from_node(root);
}

} // namespace nfcollect
