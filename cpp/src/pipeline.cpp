#include "nfcollect/pipeline.hpp"
#include "nfcollect/logging.hpp"
#include <tuple>

namespace nfcollect {

FlowPipeline::ExporterState::ExporterState(const Exporter& exporter,
                                           const PipelineOptions& options)
    : assembler(exporter, options.batch_timeout),
      aggregator(options.pairing, exporter.to_string()) {
}

FlowPipeline::FlowPipeline(PipelineOptions options)
    : options_(options),
      store_(options.templates),
      decoder_(store_) {
}

FlowPipeline::ExporterState& FlowPipeline::state_for(const Exporter& exporter) {
    auto it = exporters_.find(exporter);
    if (it == exporters_.end()) {
        SPDLOG_LOGGER_INFO(Logger::instance(), "New exporter {}", exporter.to_string());
        it = exporters_.emplace(std::piecewise_construct, std::forward_as_tuple(exporter),
                                std::forward_as_tuple(exporter, options_)).first;
    }
    return it->second;
}

void FlowPipeline::track_sequence(ExporterState& state, const DecodedPacket& packet) {
    SequenceTracker& tracker = state.sequence;
    const uint32_t sequence = packet.header.sequence;

    if (tracker.initialized && sequence != tracker.expected) {
        // Serial number arithmetic: ahead of expectation is a gap, behind is a reorder
        int32_t delta = static_cast<int32_t>(sequence - tracker.expected);
        if (delta > 0) {
            stats_.sequence_gaps++;
            SPDLOG_LOGGER_DEBUG(Logger::instance(), "Sequence gap from {}: expected {}, got {}",
                                packet.exporter.to_string(), tracker.expected, sequence);
        } else {
            stats_.sequence_reorders++;
            SPDLOG_LOGGER_DEBUG(Logger::instance(), "Reordered packet from {}: expected {}, got {}",
                                packet.exporter.to_string(), tracker.expected, sequence);
        }
    }

    if (packet.header.protocol() == ProtocolVersion::IPFIX) {
        // IPFIX counts data records; records of unknown templates cannot be counted
        if (packet.unknown_template_sets > 0) {
            tracker.initialized = false;
            return;
        }
        tracker.expected = sequence + static_cast<uint32_t>(packet.records.size());
    } else {
        tracker.expected = sequence + 1;
    }
    tracker.initialized = true;
}

ExportBatch FlowPipeline::finish(ExporterState& state, ExportBatch batch) {
    if (options_.pair_connections) {
        uint64_t unpaired_before = state.aggregator.stats().unpaired_flows;
        batch.connections = state.aggregator.pair_batch(batch.flows, batch.timestamp);
        stats_.connections += batch.connections.size();
        stats_.unpaired_flows += state.aggregator.stats().unpaired_flows - unpaired_before;
    }

    stats_.batches++;
    SPDLOG_LOGGER_DEBUG(Logger::instance(), "Batch {} of {} closed: {} flows, {} connections",
                        batch.timestamp, batch.exporter.to_string(), batch.flows.size(),
                        batch.connections.size());
    return batch;
}

std::vector<ExportBatch> FlowPipeline::process(const uint8_t* data, size_t length,
                                               const std::string& exporter_address,
                                               Clock::time_point now) {
    DecodedPacket packet = decoder_.decode(data, length, exporter_address, now);
    stats_.packets++;
    stats_.records += packet.records.size();
    stats_.unknown_template_sets += packet.unknown_template_sets;
    stats_.templates_learned += packet.templates_learned;

    ExporterState& state = state_for(packet.exporter);
    track_sequence(state, packet);

    std::vector<FlowRecord> flows = normalizer_.normalize(packet);
    stats_.options_records += packet.options_record_count();
    stats_.flows += flows.size();

    std::vector<ExportBatch> completed;
    if (!flows.empty()) {
        state.assembler.add_flows(packet.header.unix_secs, std::move(flows), now);
    }

    while (auto batch = state.assembler.get_complete_batch()) {
        completed.push_back(finish(state, std::move(*batch)));
    }
    return completed;
}

std::vector<ExportBatch> FlowPipeline::collect_idle(Clock::time_point now) {
    std::vector<ExportBatch> completed;

    for (auto& [exporter, state] : exporters_) {
        for (auto& batch : state.assembler.collect_idle(now)) {
            completed.push_back(finish(state, std::move(batch)));
        }
    }

    size_t expired = store_.expire(now);
    if (expired > 0) {
        SPDLOG_LOGGER_DEBUG(Logger::instance(), "{} templates expired", expired);
    }
    return completed;
}

std::vector<ExportBatch> FlowPipeline::flush() {
    std::vector<ExportBatch> completed;

    for (auto& [exporter, state] : exporters_) {
        for (auto& batch : state.assembler.flush_all()) {
            completed.push_back(finish(state, std::move(batch)));
        }
    }
    return completed;
}

} // namespace nfcollect
