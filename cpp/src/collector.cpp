#include "nfcollect/collector.hpp"
#include "nfcollect/logging.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <functional>
#include <stdexcept>

namespace nfcollect {

namespace {

constexpr size_t MAX_DATAGRAM_SIZE = 65535;
constexpr std::chrono::milliseconds IDLE_CHECK_INTERVAL(100);

std::string address_to_string(const sockaddr_storage& addr) {
    char buf[INET6_ADDRSTRLEN] = {0};

    if (addr.ss_family == AF_INET) {
        const auto* v4 = reinterpret_cast<const sockaddr_in*>(&addr);
        inet_ntop(AF_INET, &v4->sin_addr, buf, sizeof(buf));
        return buf;
    }

    const auto* v6 = reinterpret_cast<const sockaddr_in6*>(&addr);
    if (IN6_IS_ADDR_V4MAPPED(&v6->sin6_addr)) {
        // Dual-stack socket: report IPv4 exporters by their IPv4 address
        inet_ntop(AF_INET, &v6->sin6_addr.s6_addr[12], buf, sizeof(buf));
        return buf;
    }
    inet_ntop(AF_INET6, &v6->sin6_addr, buf, sizeof(buf));
    return buf;
}

std::vector<std::unique_ptr<ExportSink>> open_sinks(const CollectorConfig& config) {
    std::string error;
    if (!config.validate(&error)) {
        throw ConfigError("Invalid configuration: " + error);
    }

    std::vector<std::unique_ptr<ExportSink>> sinks;
    if (!config.output_path.empty()) {
        sinks.push_back(std::make_unique<JsonExportSink>(config.output_path, ExportContent::FLOWS));
    }
    if (!config.connections_path.empty()) {
        sinks.push_back(std::make_unique<JsonExportSink>(config.connections_path,
                                                         ExportContent::CONNECTIONS));
    }
    return sinks;
}

PipelineOptions pipeline_options(const CollectorConfig& config) {
    PipelineOptions options;
    options.templates.max_templates_per_exporter = config.max_templates_per_exporter;
    options.templates.template_timeout = std::chrono::seconds(config.template_timeout_s);
    options.pairing = config.pairing;
    options.batch_timeout = std::chrono::milliseconds(config.batch_timeout_ms);
    options.pair_connections = true;
    return options;
}

} // namespace

CollectorService::Worker::Worker(size_t worker_id, const PipelineOptions& options,
                                 size_t queue_capacity)
    : id(worker_id),
      pipeline(options),
      queue(queue_capacity, OverflowPolicy::DROP_NEWEST) {
}

CollectorService::CollectorService(CollectorConfig config)
    : CollectorService(config, open_sinks(config)) {
}

CollectorService::CollectorService(CollectorConfig config,
                                   std::vector<std::unique_ptr<ExportSink>> sinks)
    : config_(std::move(config)),
      sinks_(std::move(sinks)),
      sink_queue_(config_.sink_queue_capacity, OverflowPolicy::DROP_OLDEST),
      socket_fd_(-1),
      bound_port_(0),
      running_(false),
      stop_requested_(false),
      datagrams_received_(0),
      batches_written_(0),
      export_errors_(0) {
    std::string error;
    if (!config_.validate(&error)) {
        throw ConfigError("Invalid configuration: " + error);
    }

    PipelineOptions options = pipeline_options(config_);
    for (size_t i = 0; i < config_.workers; ++i) {
        workers_.push_back(std::make_unique<Worker>(i, options, config_.queue_capacity));
    }
}

CollectorService::~CollectorService() {
    if (running_) {
        stop();
    }
    close_socket();
}

void CollectorService::open_socket() {
    sockaddr_storage addr;
    std::memset(&addr, 0, sizeof(addr));
    socklen_t addr_len = 0;

    auto* v4 = reinterpret_cast<sockaddr_in*>(&addr);
    auto* v6 = reinterpret_cast<sockaddr_in6*>(&addr);
    if (inet_pton(AF_INET, config_.listen_address.c_str(), &v4->sin_addr) == 1) {
        v4->sin_family = AF_INET;
        v4->sin_port = htons(config_.port);
        addr_len = sizeof(sockaddr_in);
    } else if (inet_pton(AF_INET6, config_.listen_address.c_str(), &v6->sin6_addr) == 1) {
        v6->sin6_family = AF_INET6;
        v6->sin6_port = htons(config_.port);
        addr_len = sizeof(sockaddr_in6);
    } else {
        throw ConfigError("Invalid listen address: " + config_.listen_address);
    }

    socket_fd_ = socket(addr.ss_family, SOCK_DGRAM, 0);
    if (socket_fd_ < 0) {
        throw std::runtime_error(std::string("Cannot create UDP socket: ") + std::strerror(errno));
    }

    // Bounded receive wait so the receiver notices stop requests
    timeval timeout;
    timeout.tv_sec = config_.receive_timeout_ms / 1000;
    timeout.tv_usec = (config_.receive_timeout_ms % 1000) * 1000;
    if (setsockopt(socket_fd_, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) != 0) {
        std::string reason = std::strerror(errno);
        close_socket();
        throw std::runtime_error("Cannot set receive timeout: " + reason);
    }

    int buffer_size = static_cast<int>(config_.receive_buffer_bytes);
    if (buffer_size > 0 &&
        setsockopt(socket_fd_, SOL_SOCKET, SO_RCVBUF, &buffer_size, sizeof(buffer_size)) != 0) {
        SPDLOG_LOGGER_WARN(Logger::instance(), "Cannot set receive buffer to {} bytes: {}",
                           buffer_size, std::strerror(errno));
    }

    if (bind(socket_fd_, reinterpret_cast<sockaddr*>(&addr), addr_len) != 0) {
        std::string reason = std::strerror(errno);
        close_socket();
        throw std::runtime_error("Cannot bind to " + config_.listen_address + ":" +
                                 std::to_string(config_.port) + ": " + reason);
    }

    sockaddr_storage bound;
    socklen_t bound_len = sizeof(bound);
    if (getsockname(socket_fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        bound_port_ = ntohs(bound.ss_family == AF_INET
                                ? reinterpret_cast<sockaddr_in*>(&bound)->sin_port
                                : reinterpret_cast<sockaddr_in6*>(&bound)->sin6_port);
    } else {
        bound_port_ = config_.port;
    }
}

void CollectorService::close_socket() {
    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
    }
}

void CollectorService::start() {
    if (running_) {
        throw std::runtime_error("Collector already running");
    }

    open_socket();
    stop_requested_ = false;
    running_ = true;

    sink_thread_ = std::thread(&CollectorService::sink_loop, this);
    for (auto& worker : workers_) {
        Worker* w = worker.get();
        worker->thread = std::thread([this, w] { worker_loop(*w); });
    }
    receive_thread_ = std::thread(&CollectorService::receive_loop, this);

    SPDLOG_LOGGER_INFO(Logger::instance(),
                       "Listening on {}:{} with {} workers, pairing {}, exporting to {} sink(s)",
                       config_.listen_address, bound_port_, workers_.size(),
                       pairing_mode_name(config_.pairing), sinks_.size());
}

void CollectorService::run() {
    start();
    wait();
}

void CollectorService::request_stop() {
    stop_requested_ = true;
}

void CollectorService::stop() {
    request_stop();
    wait();
}

void CollectorService::wait() {
    shutdown();
}

void CollectorService::receive_loop() {
    std::vector<uint8_t> buffer(MAX_DATAGRAM_SIZE);

    while (!stop_requested_) {
        sockaddr_storage source;
        socklen_t source_len = sizeof(source);
        ssize_t received = recvfrom(socket_fd_, buffer.data(), buffer.size(), 0,
                                    reinterpret_cast<sockaddr*>(&source), &source_len);
        if (received < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                continue;
            }
            SPDLOG_LOGGER_WARN(Logger::instance(), "recvfrom failed: {}", std::strerror(errno));
            continue;
        }

        datagrams_received_++;

        Datagram datagram;
        datagram.exporter_address = address_to_string(source);
        datagram.data.assign(buffer.begin(), buffer.begin() + received);

        // Shard by exporter so one worker owns all of an exporter's state
        size_t shard = std::hash<std::string>{}(datagram.exporter_address) % workers_.size();
        Worker& worker = *workers_[shard];
        std::string address = datagram.exporter_address;
        if (!worker.queue.push(std::move(datagram))) {
            uint64_t dropped = worker.queue.dropped();
            if (dropped % 1000 == 1) {
                SPDLOG_LOGGER_WARN(Logger::instance(),
                                   "Worker {} queue full, dropped datagram from {} ({} dropped so far)",
                                   worker.id, address, dropped);
            }
        }
    }
}

void CollectorService::update_stats(Worker& worker, bool invalid) {
    std::lock_guard<std::mutex> lock(worker.stats_mutex);
    worker.stats = worker.pipeline.stats();
    if (invalid) {
        worker.invalid++;
    }
}

void CollectorService::worker_loop(Worker& worker) {
    auto last_idle_check = FlowPipeline::Clock::now();

    while (true) {
        auto datagram = worker.queue.try_pop(IDLE_CHECK_INTERVAL);

        if (datagram) {
            bool invalid = false;
            try {
                submit(worker.pipeline.process(datagram->data.data(), datagram->data.size(),
                                               datagram->exporter_address));
            } catch (const DecodeError& e) {
                invalid = true;
                SPDLOG_LOGGER_WARN(Logger::instance(), "Dropping datagram from {} ({} bytes): {}",
                                   datagram->exporter_address, datagram->data.size(), e.what());
            }
            update_stats(worker, invalid);
        } else if (worker.queue.is_done()) {
            break;
        }

        auto now = FlowPipeline::Clock::now();
        if (now - last_idle_check >= IDLE_CHECK_INTERVAL) {
            submit(worker.pipeline.collect_idle(now));
            update_stats(worker, false);
            last_idle_check = now;
        }
    }

    submit(worker.pipeline.flush());
    update_stats(worker, false);
    SPDLOG_LOGGER_DEBUG(Logger::instance(), "Worker {} drained", worker.id);
}

void CollectorService::submit(std::vector<ExportBatch> batches) {
    for (auto& batch : batches) {
        sink_queue_.push(std::move(batch));
    }
}

void CollectorService::sink_loop() {
    while (auto batch = sink_queue_.pop()) {
        for (auto& sink : sinks_) {
            try {
                sink->write(*batch);
            } catch (const ExportError& e) {
                export_errors_++;
                SPDLOG_LOGGER_ERROR(Logger::instance(), "{} sink: {}", sink->format_name(), e.what());
            }
        }
        batches_written_++;

        if (sink_queue_.empty()) {
            flush_sinks();
        }
    }
    flush_sinks();
}

void CollectorService::flush_sinks() {
    for (auto& sink : sinks_) {
        try {
            sink->flush();
        } catch (const ExportError& e) {
            export_errors_++;
            SPDLOG_LOGGER_ERROR(Logger::instance(), "{} sink: {}", sink->format_name(), e.what());
        }
    }
}

void CollectorService::shutdown() {
    std::lock_guard<std::mutex> lock(shutdown_mutex_);
    if (!running_) {
        return;
    }

    if (receive_thread_.joinable()) {
        receive_thread_.join();
    }

    for (auto& worker : workers_) {
        worker->queue.set_done();
    }
    for (auto& worker : workers_) {
        if (worker->thread.joinable()) {
            worker->thread.join();
        }
    }

    sink_queue_.set_done();
    if (sink_thread_.joinable()) {
        sink_thread_.join();
    }

    close_socket();
    running_ = false;

    CollectorStats totals = stats();
    SPDLOG_LOGGER_INFO(Logger::instance(),
                       "Collector stopped: {} datagrams ({} dropped, {} invalid), {} flows, "
                       "{} connections, {} unpaired, {} batches written ({} dropped)",
                       totals.datagrams_received, totals.datagrams_dropped,
                       totals.datagrams_invalid, totals.flows, totals.connections,
                       totals.unpaired_flows, totals.batches_written, totals.batches_dropped);
}

CollectorStats CollectorService::stats() const {
    CollectorStats totals;
    totals.datagrams_received = datagrams_received_;
    totals.batches_written = batches_written_;
    totals.batches_dropped = sink_queue_.dropped();
    totals.export_errors = export_errors_;

    for (const auto& worker : workers_) {
        totals.datagrams_dropped += worker->queue.dropped();

        std::lock_guard<std::mutex> lock(worker->stats_mutex);
        totals.datagrams_invalid += worker->invalid;
        totals.records_decoded += worker->stats.records;
        totals.options_records += worker->stats.options_records;
        totals.unknown_template_sets += worker->stats.unknown_template_sets;
        totals.flows += worker->stats.flows;
        totals.connections += worker->stats.connections;
        totals.unpaired_flows += worker->stats.unpaired_flows;
        totals.sequence_gaps += worker->stats.sequence_gaps;
        totals.sequence_reorders += worker->stats.sequence_reorders;
    }
    return totals;
}

} // namespace nfcollect
