#include "nfcollect/export_sink.hpp"
#include "nfcollect/logging.hpp"
#include "nfcollect/utils.hpp"
#include <arpa/inet.h>
#include <algorithm>
#include <iterator>
#include <sstream>

namespace nfcollect {

using json = nlohmann::json;

namespace {

bool is_ip_address(const std::string& text) {
    unsigned char buf[16];
    return inet_pton(AF_INET, text.c_str(), buf) == 1 ||
           inet_pton(AF_INET6, text.c_str(), buf) == 1;
}

bool is_ipv4_address_key(const std::string& name) {
    return name.rfind("IPV4_", 0) == 0 && name.size() > 5 &&
           name.compare(name.size() - 4, 4, "ADDR") == 0;
}

// 2^64, first double past the uint64_t range
constexpr double UINT64_LIMIT = 18446744073709551616.0;

double parse_timestamp_key(const std::string& key) {
    try {
        size_t consumed = 0;
        double value = std::stod(key, &consumed);
        if (consumed != key.size() || !(value >= 0) || value >= 4294967296.0) {
            throw ExportError("Invalid export timestamp: " + key);
        }
        return value;
    } catch (const std::logic_error&) {
        throw ExportError("Invalid export timestamp: " + key);
    }
}

void append_document(const json& document, ExportDump& dump) {
    if (!document.is_object()) {
        throw ExportError("Export document must be an object of timestamp -> flows");
    }

    for (auto it = document.begin(); it != document.end(); ++it) {
        if (!it.value().is_array()) {
            throw ExportError("Flows of export " + it.key() + " are not an array");
        }

        ExportEntry entry;
        entry.key = it.key();
        entry.time = parse_timestamp_key(it.key());
        for (const auto& flow : it.value()) {
            entry.flows.push_back(flow_from_json(flow));
        }
        dump.push_back(std::move(entry));
    }
}

void sort_dump(ExportDump& dump) {
    std::stable_sort(dump.begin(), dump.end(), [](const ExportEntry& lhs, const ExportEntry& rhs) {
        return lhs.time < rhs.time;
    });
}

} // namespace

JsonExportSink::JsonExportSink(const std::string& path, ExportContent content)
    : path_(path), output_(nullptr), content_(content), batches_written_(0) {
    file_.open(path, std::ios::out | std::ios::app);
    if (!file_) {
        throw ExportError("Cannot open export file: " + path);
    }
    output_ = &file_;
    SPDLOG_LOGGER_INFO(Logger::instance(), "Appending {} to {}",
                       content == ExportContent::FLOWS ? "flows" : "connections", path);
}

JsonExportSink::JsonExportSink(std::ostream& output, ExportContent content)
    : output_(&output), content_(content), batches_written_(0) {
}

void JsonExportSink::write(const ExportBatch& batch) {
    json line = batch_to_json(batch, content_);
    if (line.empty()) {
        return;
    }

    *output_ << line.dump() << "\n";
    if (!*output_) {
        throw ExportError("Write failed" + (path_.empty() ? std::string() : ": " + path_));
    }
    batches_written_++;
}

void JsonExportSink::flush() {
    output_->flush();
    if (!*output_) {
        throw ExportError("Flush failed" + (path_.empty() ? std::string() : ": " + path_));
    }
}

std::string JsonExportSink::format_name() const {
    return content_ == ExportContent::FLOWS ? "json-lines/flows" : "json-lines/connections";
}

json flow_to_json(const FlowRecord& flow) {
    json object = json::object();
    for (const auto& [name, value] : flow.fields()) {
        if (value.is_number()) {
            object[name] = value.number;
        } else {
            object[name] = value.text;
        }
    }
    return object;
}

json connection_to_json(const Connection& connection) {
    return json{
        {"src", connection.src},
        {"dest", connection.dest},
        {"src_port", connection.src_port},
        {"dest_port", connection.dest_port},
        {"size", connection.size},
        {"duration", connection.duration},
        {"ip_version", connection.ip_version},
        {"protocol", connection.protocol}
    };
}

json batch_to_json(const ExportBatch& batch, ExportContent content) {
    json records = json::array();

    if (content == ExportContent::FLOWS) {
        for (const auto& flow : batch.flows) {
            records.push_back(flow_to_json(flow));
        }
    } else {
        for (const auto& connection : batch.connections) {
            records.push_back(connection_to_json(connection));
        }
    }

    if (records.empty()) {
        return json::object();
    }

    json line = json::object();
    line[std::to_string(batch.timestamp)] = std::move(records);
    return line;
}

FlowRecord flow_from_json(const json& object) {
    if (!object.is_object()) {
        throw ExportError("Flow record must be a JSON object");
    }

    FlowRecord flow;
    for (auto it = object.begin(); it != object.end(); ++it) {
        const std::string& name = it.key();
        const json& value = it.value();

        if (value.is_number_unsigned()) {
            uint64_t number = value.get<uint64_t>();
            if (is_ipv4_address_key(name) && number <= 0xFFFFFFFFULL) {
                flow.set(name, FieldValue::from_address(
                                   utils::uint32_to_ip_str(static_cast<uint32_t>(number))));
            } else {
                flow.set(name, FieldValue::from_uint(number));
            }
        } else if (value.is_number_integer()) {
            int64_t number = value.get<int64_t>();
            flow.set(name, FieldValue::from_uint(number < 0 ? 0 : static_cast<uint64_t>(number)));
        } else if (value.is_number_float()) {
            double number = value.get<double>();
            if (number >= 0 && number < UINT64_LIMIT) {
                flow.set(name, FieldValue::from_uint(static_cast<uint64_t>(number)));
            } else {
                flow.set(name, FieldValue::from_text(value.dump()));
            }
        } else if (value.is_boolean()) {
            flow.set(name, FieldValue::from_uint(value.get<bool>() ? 1 : 0));
        } else if (value.is_string()) {
            const std::string& text = value.get_ref<const std::string&>();
            if (is_ip_address(text)) {
                flow.set(name, FieldValue::from_address(text));
            } else {
                flow.set(name, FieldValue::from_text(text));
            }
        } else {
            flow.set(name, FieldValue::from_text(value.dump()));
        }
    }
    return flow;
}

ExportDump read_export_stream(std::istream& input) {
    std::string text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    ExportDump dump;

    json document = json::parse(text, nullptr, false);
    if (!document.is_discarded()) {
        append_document(document, dump);
        sort_dump(dump);
        return dump;
    }

    // Not a single document: JSON Lines, one batch per line
    std::istringstream lines(text);
    std::string line;
    size_t line_number = 0;
    while (std::getline(lines, line)) {
        line_number++;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        json batch = json::parse(line, nullptr, false);
        if (batch.is_discarded()) {
            throw ExportError("Malformed JSON on line " + std::to_string(line_number));
        }
        append_document(batch, dump);
    }

    sort_dump(dump);
    return dump;
}

ExportDump read_export_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ExportError("Cannot open export file: " + path);
    }
    return read_export_stream(file);
}

ExportContent parse_export_content(const std::string& name) {
    if (name == "flows") {
        return ExportContent::FLOWS;
    }
    if (name == "connections") {
        return ExportContent::CONNECTIONS;
    }
    throw std::invalid_argument("Unknown export content: " + name);
}

} // namespace nfcollect
