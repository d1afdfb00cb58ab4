#include "nfcollect/session_aggregator.hpp"
#include "nfcollect/logging.hpp"
#include <algorithm>
#include <deque>
#include <map>
#include <stdexcept>
#include <tuple>

namespace nfcollect {

namespace {

using FiveTuple = std::tuple<std::string, std::string, uint16_t, uint16_t, uint8_t>;

FiveTuple forward_tuple(const FlowRecord& flow) {
    return FiveTuple(flow.source_address(), flow.destination_address(),
                     flow.source_port(), flow.destination_port(), flow.protocol());
}

FiveTuple reverse_tuple(const FlowRecord& flow) {
    return FiveTuple(flow.destination_address(), flow.source_address(),
                     flow.destination_port(), flow.source_port(), flow.protocol());
}

} // namespace

Connection Connection::from_flows(const FlowRecord& first, const FlowRecord& second,
                                  uint32_t timestamp) {
    uint64_t first_bytes = first.get_uint(flow_key::IN_BYTES).value_or(0);
    uint64_t second_bytes = second.get_uint(flow_key::IN_BYTES).value_or(0);
    const FlowRecord& src = first_bytes >= second_bytes ? first : second;

    Connection connection;
    connection.ip_version = src.ip_version();
    connection.src = src.source_address();
    connection.dest = src.destination_address();
    connection.src_port = src.source_port();
    connection.dest_port = src.destination_port();
    connection.size = src.get_uint(flow_key::IN_BYTES).value_or(0);
    connection.duration = flow_duration_ms(src);
    connection.protocol = src.protocol();
    connection.timestamp = timestamp;
    return connection;
}

bool operator==(const Connection& lhs, const Connection& rhs) {
    return std::tie(lhs.src, lhs.dest, lhs.src_port, lhs.dest_port, lhs.size, lhs.duration,
                    lhs.ip_version, lhs.protocol, lhs.timestamp) ==
           std::tie(rhs.src, rhs.dest, rhs.src_port, rhs.dest_port, rhs.size, rhs.duration,
                    rhs.ip_version, rhs.protocol, rhs.timestamp);
}

uint64_t wrapped_duration(uint64_t first, uint64_t last) {
    if (last >= first) {
        return last - first;
    }
    return (uint64_t(1) << 32) - first + last;
}

uint64_t flow_duration_ms(const FlowRecord& flow) {
    auto first = flow.get_uint(flow_key::FIRST_SWITCHED);
    auto last = flow.get_uint(flow_key::LAST_SWITCHED);
    if (first && last) {
        return wrapped_duration(*first, *last);
    }

    auto start = flow.get_uint(flow_key::FLOW_START_MILLISECONDS);
    auto end = flow.get_uint(flow_key::FLOW_END_MILLISECONDS);
    if (start && end && *end >= *start) {
        return *end - *start;
    }
    return 0;
}

PairingMode parse_pairing_mode(const std::string& name) {
    if (name == "reverse_tuple") {
        return PairingMode::REVERSE_TUPLE;
    }
    if (name == "sequential") {
        return PairingMode::SEQUENTIAL;
    }
    throw std::invalid_argument("Unknown pairing mode: " + name +
                                " (expected reverse_tuple or sequential)");
}

std::string pairing_mode_name(PairingMode mode) {
    return mode == PairingMode::SEQUENTIAL ? "sequential" : "reverse_tuple";
}

SessionAggregator::SessionAggregator(PairingMode mode, std::string context)
    : mode_(mode), context_(std::move(context)), state_(State::EMPTY) {
}

std::optional<Connection> SessionAggregator::offer(FlowRecord flow, uint32_t timestamp) {
    switch (state_) {
    case State::EMPTY:
        pending_ = std::move(flow);
        state_ = State::HOLDING_ONE;
        return std::nullopt;

    case State::HOLDING_ONE: {
        Connection connection = Connection::from_flows(*pending_, flow, timestamp);
        pending_.reset();
        state_ = State::EMPTY;
        stats_.connections++;
        return connection;
    }
    }
    return std::nullopt;
}

std::optional<FlowRecord> SessionAggregator::end_batch() {
    if (state_ == State::EMPTY) {
        return std::nullopt;
    }

    std::optional<FlowRecord> dropped = std::move(pending_);
    pending_.reset();
    state_ = State::EMPTY;
    stats_.unpaired_flows++;

    SPDLOG_LOGGER_WARN(Logger::instance(), "Dropping unpaired flow {} -> {} at end of batch{}{}",
                       dropped->source_address(), dropped->destination_address(),
                       context_.empty() ? "" : " from ", context_);
    return dropped;
}

std::vector<Connection> SessionAggregator::pair_batch(const std::vector<FlowRecord>& flows,
                                                      uint32_t timestamp) {
    // (arrival index of the first flow, connection)
    std::vector<std::pair<size_t, Connection>> paired;
    std::vector<bool> matched(flows.size(), false);

    if (mode_ == PairingMode::REVERSE_TUPLE) {
        std::map<FiveTuple, std::deque<size_t>> waiting;

        for (size_t i = 0; i < flows.size(); ++i) {
            const FlowRecord& flow = flows[i];
            if (flow.source_address().empty() || flow.destination_address().empty()) {
                continue;
            }

            auto it = waiting.find(reverse_tuple(flow));
            if (it != waiting.end() && !it->second.empty()) {
                size_t partner = it->second.front();
                it->second.pop_front();
                matched[partner] = true;
                matched[i] = true;
                paired.emplace_back(partner, Connection::from_flows(flows[partner], flow, timestamp));
                stats_.connections++;
                stats_.tuple_matches++;
            } else {
                waiting[forward_tuple(flow)].push_back(i);
            }
        }
    }

    size_t held_index = 0;
    for (size_t i = 0; i < flows.size(); ++i) {
        if (matched[i]) {
            continue;
        }
        if (state_ == State::EMPTY) {
            held_index = i;
        }
        auto connection = offer(flows[i], timestamp);
        if (connection) {
            paired.emplace_back(held_index, std::move(*connection));
        }
    }
    end_batch();

    std::stable_sort(paired.begin(), paired.end(),
                     [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });

    std::vector<Connection> connections;
    connections.reserve(paired.size());
    for (auto& entry : paired) {
        connections.push_back(std::move(entry.second));
    }
    return connections;
}

} // namespace nfcollect
