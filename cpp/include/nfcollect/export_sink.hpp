#ifndef NFCOLLECT_EXPORT_SINK_HPP
#define NFCOLLECT_EXPORT_SINK_HPP

#include "batch_assembler.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <vector>

namespace nfcollect {

/**
 * Export destination cannot be opened, written or read back
 */
class ExportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class ExportContent {
    FLOWS,        // normalized flow records
    CONNECTIONS   // paired connections
};

/**
 * Destination for finished export batches
 */
class ExportSink {
public:
    virtual ~ExportSink() = default;

    /**
     * Persist one batch
     *
     * @throws ExportError on write failure
     */
    virtual void write(const ExportBatch& batch) = 0;

    virtual void flush() = 0;

    virtual std::string format_name() const = 0;
};

/**
 * JSON Lines sink
 *
 * Every batch becomes one line mapping the export timestamp to its
 * records:
 *
 *   {"1700000000": [{"IN_BYTES": 2048, "IPV4_SRC_ADDR": "10.0.0.1", ...}, ...]}
 *
 * Files are opened in append mode so restarts never truncate earlier
 * exports. read_export_file() reads the lines back as one entry per batch.
 */
class JsonExportSink : public ExportSink {
public:
    /**
     * Open a file for appending
     *
     * @throws ExportError if the file cannot be opened
     */
    explicit JsonExportSink(const std::string& path, ExportContent content = ExportContent::FLOWS);

    /**
     * Write to an existing stream (not owned)
     */
    explicit JsonExportSink(std::ostream& output, ExportContent content = ExportContent::FLOWS);

    void write(const ExportBatch& batch) override;
    void flush() override;
    std::string format_name() const override;

    ExportContent content() const { return content_; }
    uint64_t batches_written() const { return batches_written_; }

private:
    std::string path_;
    std::ofstream file_;
    std::ostream* output_;
    ExportContent content_;
    uint64_t batches_written_;
};

nlohmann::json flow_to_json(const FlowRecord& flow);
nlohmann::json connection_to_json(const Connection& connection);

/**
 * One JSON Lines object for a batch, empty when the batch has nothing to
 * export for the content type
 */
nlohmann::json batch_to_json(const ExportBatch& batch, ExportContent content);

/**
 * Rebuild a flow record from a JSON object
 *
 * Strings holding an IP address become addresses; integers under IPv4
 * address keys (as written by older collectors) are converted to dotted
 * quads. Numbers outside the unsigned 64-bit range keep their JSON text.
 *
 * @throws ExportError if json is not an object
 */
FlowRecord flow_from_json(const nlohmann::json& json);

/**
 * Flows exported under one timestamp key
 */
struct ExportEntry {
    std::string key;   // key as written, e.g. "1700000000" or "1700000000.25"
    double time = 0;   // numeric value of the key
    std::vector<FlowRecord> flows;

    // Whole seconds of the key
    uint32_t timestamp() const { return static_cast<uint32_t>(time); }
};

/**
 * Export entries ordered by key value
 *
 * Every key of every document or line is its own entry, even when two
 * keys share a value; flows are paired within an entry only.
 */
using ExportDump = std::vector<ExportEntry>;

/**
 * Read a single JSON document or JSON Lines
 *
 * Entries with equal key values keep their input order.
 *
 * @throws ExportError on malformed input
 */
ExportDump read_export_stream(std::istream& input);

/**
 * @throws ExportError if the file cannot be read or is malformed
 */
ExportDump read_export_file(const std::string& path);

ExportContent parse_export_content(const std::string& name);

} // namespace nfcollect

#endif // NFCOLLECT_EXPORT_SINK_HPP
