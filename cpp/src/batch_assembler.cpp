#include "nfcollect/batch_assembler.hpp"
#include "nfcollect/logging.hpp"
#include <iterator>

namespace nfcollect {

BatchAssembler::BatchAssembler(Exporter exporter, std::chrono::milliseconds idle_timeout)
    : exporter_(std::move(exporter)),
      idle_timeout_(idle_timeout),
      latest_timestamp_(0),
      has_latest_(false),
      clock_resets_(0) {
}

void BatchAssembler::add_flow(uint32_t timestamp, FlowRecord flow, Clock::time_point now) {
    if (has_latest_ && timestamp < latest_timestamp_ && batches_.count(timestamp) == 0) {
        SPDLOG_LOGGER_INFO(Logger::instance(),
                           "Export time of {} went back from {} to {}, closing {} open batch(es)",
                           exporter_.to_string(), latest_timestamp_, timestamp, batches_.size());
        while (!batches_.empty()) {
            completed_.push_back(close(batches_.begin()));
        }
        latest_timestamp_ = timestamp;
        clock_resets_++;
    }

    OpenBatch& batch = batches_[timestamp];
    batch.flows.push_back(std::move(flow));
    batch.last_update = now;

    if (!has_latest_ || timestamp > latest_timestamp_) {
        latest_timestamp_ = timestamp;
        has_latest_ = true;
    }
}

void BatchAssembler::add_flows(uint32_t timestamp, std::vector<FlowRecord> flows,
                               Clock::time_point now) {
    for (auto& flow : flows) {
        add_flow(timestamp, std::move(flow), now);
    }
}

bool BatchAssembler::has_complete_batch() const {
    if (!completed_.empty()) {
        return true;
    }
    if (!has_latest_ || batches_.empty()) {
        return false;
    }

    // Flows from a later export mean the oldest batch has been fully received
    return batches_.begin()->first < latest_timestamp_;
}

std::optional<ExportBatch> BatchAssembler::get_complete_batch() {
    if (!completed_.empty()) {
        ExportBatch batch = std::move(completed_.front());
        completed_.pop_front();
        return batch;
    }
    if (!has_complete_batch()) {
        return std::nullopt;
    }
    return close(batches_.begin());
}

std::vector<ExportBatch> BatchAssembler::collect_idle(Clock::time_point now) {
    std::vector<ExportBatch> result = take_completed();

    for (auto it = batches_.begin(); it != batches_.end();) {
        if (now - it->second.last_update >= idle_timeout_) {
            auto next = std::next(it);
            result.push_back(close(it));
            it = next;
        } else {
            ++it;
        }
    }

    return result;
}

std::vector<ExportBatch> BatchAssembler::flush_all() {
    std::vector<ExportBatch> result = take_completed();

    while (!batches_.empty()) {
        result.push_back(close(batches_.begin()));
    }

    return result;
}

size_t BatchAssembler::flow_count() const {
    size_t count = 0;
    for (const auto& [timestamp, batch] : batches_) {
        count += batch.flows.size();
    }
    for (const auto& batch : completed_) {
        count += batch.flows.size();
    }
    return count;
}

std::vector<ExportBatch> BatchAssembler::take_completed() {
    std::vector<ExportBatch> result(std::make_move_iterator(completed_.begin()),
                                    std::make_move_iterator(completed_.end()));
    completed_.clear();
    return result;
}

ExportBatch BatchAssembler::close(std::map<uint32_t, OpenBatch>::iterator it) {
    ExportBatch batch;
    batch.timestamp = it->first;
    batch.exporter = exporter_;
    batch.flows = std::move(it->second.flows);
    batches_.erase(it);
    return batch;
}

} // namespace nfcollect
