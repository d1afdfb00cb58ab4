#ifndef NFCOLLECT_BATCH_ASSEMBLER_HPP
#define NFCOLLECT_BATCH_ASSEMBLER_HPP

#include "flow_record.hpp"
#include "session_aggregator.hpp"
#include "template_store.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <vector>

namespace nfcollect {

/**
 * Flows of one exporter sharing one export timestamp, plus the
 * connections paired from them
 */
struct ExportBatch {
    uint32_t timestamp = 0;  // packet header epoch seconds
    Exporter exporter;
    std::vector<FlowRecord> flows;
    std::vector<Connection> connections;
};

/**
 * Groups an exporter's flows into batches by export timestamp
 *
 * A batch is complete when flows with a later timestamp arrive, when no
 * flow was added to it for idle_timeout, or on flush. Complete batches are
 * handed out oldest first.
 *
 * A timestamp older than the newest one seen, with no batch open for it,
 * means the exporter's clock went back (restart, clock step). Every open
 * batch is completed and the new timestamp becomes the newest, so batches
 * after the step are assembled normally.
 */
class BatchAssembler {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @param exporter Exporter every batch is tagged with
     * @param idle_timeout Inactivity after which an open batch is closed
     */
    BatchAssembler(Exporter exporter, std::chrono::milliseconds idle_timeout);

    /**
     * Add a flow to the batch of its export timestamp
     */
    void add_flow(uint32_t timestamp, FlowRecord flow, Clock::time_point now = Clock::now());

    void add_flows(uint32_t timestamp, std::vector<FlowRecord> flows,
                   Clock::time_point now = Clock::now());

    /**
     * Check if a batch older than the latest timestamp is buffered
     */
    bool has_complete_batch() const;

    /**
     * Take the oldest complete batch
     */
    std::optional<ExportBatch> get_complete_batch();

    /**
     * Take every batch that has been idle for longer than the timeout
     */
    std::vector<ExportBatch> collect_idle(Clock::time_point now = Clock::now());

    /**
     * Take all remaining batches in timestamp order
     */
    std::vector<ExportBatch> flush_all();

    // Batches buffered, open or complete
    size_t batch_count() const { return batches_.size() + completed_.size(); }
    size_t flow_count() const;

    uint64_t clock_resets() const { return clock_resets_; }

    const Exporter& exporter() const { return exporter_; }

private:
    struct OpenBatch {
        std::vector<FlowRecord> flows;
        Clock::time_point last_update;
    };

    ExportBatch close(std::map<uint32_t, OpenBatch>::iterator it);
    std::vector<ExportBatch> take_completed();

    Exporter exporter_;
    std::chrono::milliseconds idle_timeout_;
    std::map<uint32_t, OpenBatch> batches_;
    std::deque<ExportBatch> completed_;  // closed by a clock reset, not yet taken
    uint32_t latest_timestamp_;
    bool has_latest_;
    uint64_t clock_resets_;
};

} // namespace nfcollect

#endif // NFCOLLECT_BATCH_ASSEMBLER_HPP
