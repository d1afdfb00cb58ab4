#ifndef NFCOLLECT_SESSION_AGGREGATOR_HPP
#define NFCOLLECT_SESSION_AGGREGATOR_HPP

#include "flow_record.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace nfcollect {

/**
 * Bidirectional connection derived from two unidirectional flows
 *
 * src is the peer that sent more data (the flow with the larger IN_BYTES),
 * not necessarily the initiator.
 */
struct Connection {
    std::string src;
    std::string dest;
    uint16_t src_port = 0;
    uint16_t dest_port = 0;
    uint64_t size = 0;      // bytes sent by src
    uint64_t duration = 0;  // milliseconds
    int ip_version = 4;
    uint8_t protocol = 0;
    uint32_t timestamp = 0; // export time of the batch

    /**
     * Build a connection from two flows
     *
     * Addresses, ports, size and duration come from the flow with the
     * larger IN_BYTES; on a tie the first flow wins.
     */
    static Connection from_flows(const FlowRecord& first, const FlowRecord& second,
                                 uint32_t timestamp = 0);
};

bool operator==(const Connection& lhs, const Connection& rhs);

/**
 * last - first on the 32-bit sysUpTime clock, 2^32 added when the
 * uptime counter wrapped in between
 */
uint64_t wrapped_duration(uint64_t first, uint64_t last);

/**
 * Duration of a flow in milliseconds
 *
 * Uses FIRST_SWITCHED/LAST_SWITCHED, then the IPFIX absolute
 * FLOW_START_MILLISECONDS/FLOW_END_MILLISECONDS; 0 when neither pair is
 * complete.
 */
uint64_t flow_duration_ms(const FlowRecord& flow);

enum class PairingMode {
    REVERSE_TUPLE,  // match reversed 5-tuples first, then pair leftovers in order
    SEQUENTIAL      // pair flows two at a time in arrival order
};

/**
 * @throws std::invalid_argument for names other than "reverse_tuple" and "sequential"
 */
PairingMode parse_pairing_mode(const std::string& name);
std::string pairing_mode_name(PairingMode mode);

/**
 * Pairs the flows of one exporter's batch into connections
 *
 * Sequential pairing is a two-state machine:
 *
 *   EMPTY --offer--> HOLDING_ONE --offer--> emit connection, EMPTY
 *
 * end_batch() resets the machine; a flow still held is dropped and
 * counted, never carried into the next batch.
 */
class SessionAggregator {
public:
    enum class State {
        EMPTY,
        HOLDING_ONE
    };

    struct Stats {
        uint64_t connections = 0;
        uint64_t tuple_matches = 0;
        uint64_t unpaired_flows = 0;
    };

    explicit SessionAggregator(PairingMode mode = PairingMode::REVERSE_TUPLE,
                               std::string context = "");

    /**
     * Feed one flow to the sequential state machine
     *
     * @return the connection when this flow completes a pair
     */
    std::optional<Connection> offer(FlowRecord flow, uint32_t timestamp = 0);

    /**
     * Close the current batch
     *
     * @return the dropped flow, if one was held
     */
    std::optional<FlowRecord> end_batch();

    /**
     * Pair all flows of a batch according to the pairing mode
     *
     * Connections are returned in the arrival order of their first flow.
     */
    std::vector<Connection> pair_batch(const std::vector<FlowRecord>& flows, uint32_t timestamp);

    State state() const { return state_; }
    PairingMode mode() const { return mode_; }
    const Stats& stats() const { return stats_; }

private:
    PairingMode mode_;
    std::string context_;
    State state_;
    std::optional<FlowRecord> pending_;
    Stats stats_;
};

} // namespace nfcollect

#endif // NFCOLLECT_SESSION_AGGREGATOR_HPP
