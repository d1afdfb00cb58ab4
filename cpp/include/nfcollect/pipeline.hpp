#ifndef NFCOLLECT_PIPELINE_HPP
#define NFCOLLECT_PIPELINE_HPP

#include "batch_assembler.hpp"
#include "flow_normalizer.hpp"
#include "packet_decoder.hpp"
#include "session_aggregator.hpp"
#include "template_store.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace nfcollect {

struct PipelineOptions {
    TemplateStoreOptions templates;
    PairingMode pairing = PairingMode::REVERSE_TUPLE;
    std::chrono::milliseconds batch_timeout{5000};

    // Pair flows into connections when a batch closes
    bool pair_connections = true;
};

/**
 * Synchronous decode path of one collector worker
 *
 * Datagram -> PacketDecoder -> FlowNormalizer -> BatchAssembler ->
 * SessionAggregator. All per-exporter state (templates, batches, pairing,
 * sequence numbers) lives here, so a pipeline must only be driven by one
 * thread.
 */
class FlowPipeline {
public:
    using Clock = std::chrono::steady_clock;

    struct Stats {
        uint64_t packets = 0;
        uint64_t records = 0;
        uint64_t options_records = 0;
        uint64_t flows = 0;
        uint64_t connections = 0;
        uint64_t unpaired_flows = 0;
        uint64_t unknown_template_sets = 0;
        uint64_t templates_learned = 0;
        uint64_t sequence_gaps = 0;
        uint64_t sequence_reorders = 0;
        uint64_t batches = 0;
    };

    explicit FlowPipeline(PipelineOptions options = PipelineOptions());

    FlowPipeline(const FlowPipeline&) = delete;
    FlowPipeline& operator=(const FlowPipeline&) = delete;

    /**
     * Process one datagram
     *
     * @return batches completed by this datagram, connections filled in
     * @throws DecodeError if the datagram is malformed; state of other
     *         exporters and of earlier datagrams is unaffected
     */
    std::vector<ExportBatch> process(const uint8_t* data, size_t length,
                                     const std::string& exporter_address,
                                     Clock::time_point now = Clock::now());

    /**
     * Close batches idle for longer than the batch timeout and drop
     * expired templates
     */
    std::vector<ExportBatch> collect_idle(Clock::time_point now = Clock::now());

    /**
     * Close every open batch (shutdown)
     */
    std::vector<ExportBatch> flush();

    const Stats& stats() const { return stats_; }
    size_t exporter_count() const { return exporters_.size(); }
    const TemplateStore& template_store() const { return store_; }

private:
    struct SequenceTracker {
        bool initialized = false;
        uint32_t expected = 0;
    };

    struct ExporterState {
        ExporterState(const Exporter& exporter, const PipelineOptions& options);

        BatchAssembler assembler;
        SessionAggregator aggregator;
        SequenceTracker sequence;
    };

    ExporterState& state_for(const Exporter& exporter);
    void track_sequence(ExporterState& state, const DecodedPacket& packet);
    ExportBatch finish(ExporterState& state, ExportBatch batch);

    PipelineOptions options_;
    TemplateStore store_;
    PacketDecoder decoder_;
    FlowNormalizer normalizer_;
    std::map<Exporter, ExporterState> exporters_;
    Stats stats_;
};

} // namespace nfcollect

#endif // NFCOLLECT_PIPELINE_HPP
