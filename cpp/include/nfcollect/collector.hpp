#ifndef NFCOLLECT_COLLECTOR_HPP
#define NFCOLLECT_COLLECTOR_HPP

#include "config.hpp"
#include "export_sink.hpp"
#include "pipeline.hpp"
#include "thread_safe_queue.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace nfcollect {

/**
 * Collector counters, summed over all workers
 */
struct CollectorStats {
    uint64_t datagrams_received = 0;
    uint64_t datagrams_dropped = 0;   // worker queue full
    uint64_t datagrams_invalid = 0;   // DecodeError
    uint64_t records_decoded = 0;
    uint64_t options_records = 0;
    uint64_t unknown_template_sets = 0;
    uint64_t flows = 0;
    uint64_t connections = 0;
    uint64_t unpaired_flows = 0;
    uint64_t sequence_gaps = 0;
    uint64_t sequence_reorders = 0;
    uint64_t batches_written = 0;
    uint64_t batches_dropped = 0;     // sink queue overflow
    uint64_t export_errors = 0;
};

/**
 * NetFlow v9 / IPFIX collector service
 *
 * Threads:
 *   - receiver: reads datagrams from the UDP socket and shards them by
 *     exporter address onto the worker queues
 *   - workers: each drives its own FlowPipeline, so every exporter's
 *     templates, batches and pairing state belong to exactly one thread
 *   - sink writer: drains finished batches into the export sinks
 *
 * Shutdown drains everything in order: the receiver stops, workers finish
 * their queues and close all open batches, the sink writer writes what is
 * left and flushes.
 */
class CollectorService {
public:
    /**
     * Create a service exporting to the files named in the configuration
     *
     * @throws ConfigError if the configuration is invalid
     * @throws ExportError if an export file cannot be opened
     */
    explicit CollectorService(CollectorConfig config);

    /**
     * Create a service exporting to the given sinks
     */
    CollectorService(CollectorConfig config, std::vector<std::unique_ptr<ExportSink>> sinks);

    ~CollectorService();

    CollectorService(const CollectorService&) = delete;
    CollectorService& operator=(const CollectorService&) = delete;

    /**
     * Bind the socket and start all threads
     *
     * @throws std::runtime_error if the socket cannot be bound
     */
    void start();

    /**
     * start() and block until stopped
     */
    void run();

    /**
     * Ask the service to stop; returns immediately
     */
    void request_stop();

    /**
     * Stop, drain all queues and flush the sinks
     */
    void stop();

    /**
     * Block until a requested stop has completed
     */
    void wait();

    bool is_running() const { return running_; }

    /**
     * Port the socket is bound to (useful with port 0)
     */
    uint16_t bound_port() const { return bound_port_; }

    CollectorStats stats() const;

    const CollectorConfig& config() const { return config_; }

private:
    struct Datagram {
        std::vector<uint8_t> data;
        std::string exporter_address;
    };

    struct Worker {
        Worker(size_t id, const PipelineOptions& options, size_t queue_capacity);

        size_t id;
        FlowPipeline pipeline;
        ThreadSafeQueue<Datagram> queue;
        std::thread thread;

        mutable std::mutex stats_mutex;
        FlowPipeline::Stats stats;
        uint64_t invalid = 0;
    };

    void open_socket();
    void close_socket();
    void receive_loop();
    void worker_loop(Worker& worker);
    void sink_loop();
    void flush_sinks();
    void update_stats(Worker& worker, bool invalid);
    void submit(std::vector<ExportBatch> batches);
    void shutdown();

    CollectorConfig config_;
    std::vector<std::unique_ptr<ExportSink>> sinks_;
    std::vector<std::unique_ptr<Worker>> workers_;
    ThreadSafeQueue<ExportBatch> sink_queue_;

    int socket_fd_;
    uint16_t bound_port_;

    std::thread receive_thread_;
    std::thread sink_thread_;

    std::atomic<bool> running_;
    std::atomic<bool> stop_requested_;
    std::mutex shutdown_mutex_;

    std::atomic<uint64_t> datagrams_received_;
    std::atomic<uint64_t> batches_written_;
    std::atomic<uint64_t> export_errors_;
};

} // namespace nfcollect

#endif // NFCOLLECT_COLLECTOR_HPP
