#include "nfcollect/report.hpp"
#include "nfcollect/logging.hpp"
#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace nfcollect {

std::string human_size(uint64_t bytes) {
    if (bytes < 1024) {
        return std::to_string(bytes) + "B";
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    double value = static_cast<double>(bytes) / 1024.0;
    if (value < 1024.0) {
        oss << value << "K";
        return oss.str();
    }

    value /= 1024.0;
    if (value < 1024.0) {
        oss << value << "M";
        return oss.str();
    }

    oss << value / 1024.0 << "G";
    return oss.str();
}

std::string human_duration(uint64_t milliseconds) {
    uint64_t seconds = milliseconds / 1000;

    std::ostringstream oss;
    if (seconds < 60) {
        oss << seconds << " sec";
    } else if (seconds > 3600) {
        oss << seconds / 3600 << ":"
            << std::setfill('0') << std::setw(2) << (seconds % 3600) / 60 << "."
            << std::setw(2) << seconds % 60 << " hours";
    } else {
        oss << std::setfill('0') << std::setw(2) << seconds / 60 << ":"
            << std::setw(2) << seconds % 60 << " min";
    }
    return oss.str();
}

std::string format_timestamp(uint32_t epoch_seconds) {
    std::time_t time = static_cast<std::time_t>(epoch_seconds);
    std::tm local;
    if (localtime_r(&time, &local) == nullptr) {
        return std::to_string(epoch_seconds);
    }

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M.%S", &local);
    return buf;
}

std::string SystemResolver::hostname(const std::string& address) {
    sockaddr_storage addr;
    std::memset(&addr, 0, sizeof(addr));
    socklen_t addr_len = 0;

    auto* v4 = reinterpret_cast<sockaddr_in*>(&addr);
    auto* v6 = reinterpret_cast<sockaddr_in6*>(&addr);
    if (inet_pton(AF_INET, address.c_str(), &v4->sin_addr) == 1) {
        v4->sin_family = AF_INET;
        addr_len = sizeof(sockaddr_in);
    } else if (inet_pton(AF_INET6, address.c_str(), &v6->sin6_addr) == 1) {
        v6->sin6_family = AF_INET6;
        addr_len = sizeof(sockaddr_in6);
    } else {
        return address;
    }

    char host[NI_MAXHOST];
    int rc = getnameinfo(reinterpret_cast<sockaddr*>(&addr), addr_len, host, sizeof(host),
                         nullptr, 0, NI_NAMEREQD);
    if (rc != 0) {
        SPDLOG_LOGGER_TRACE(Logger::instance(), "No host name for {}: {}", address, gai_strerror(rc));
        return address;
    }
    return host;
}

std::optional<std::string> SystemResolver::service(uint16_t port) {
    servent entry;
    servent* result = nullptr;
    char buf[1024];

    if (getservbyport_r(htons(port), nullptr, &entry, buf, sizeof(buf), &result) != 0 ||
        result == nullptr) {
        return std::nullopt;
    }
    return std::string(result->s_name);
}

std::string NumericResolver::hostname(const std::string& address) {
    return address;
}

CachingResolver::CachingResolver(std::unique_ptr<Resolver> inner)
    : inner_(std::move(inner)) {
}

std::string CachingResolver::hostname(const std::string& address) {
    auto it = hostnames_.find(address);
    if (it != hostnames_.end()) {
        return it->second;
    }
    std::string name = inner_->hostname(address);
    hostnames_.emplace(address, name);
    return name;
}

std::optional<std::string> CachingResolver::service(uint16_t port) {
    auto it = services_.find(port);
    if (it != services_.end()) {
        return it->second;
    }
    std::optional<std::string> name = inner_->service(port);
    services_.emplace(port, name);
    return name;
}

std::string connection_service(const Connection& connection, Resolver& resolver) {
    if (auto name = resolver.service(connection.src_port)) {
        return *name;
    }
    if (auto name = resolver.service(connection.dest_port)) {
        return *name;
    }
    return "unknown";
}

std::string format_report_line(const Connection& connection, const std::string& timestamp,
                               Resolver& resolver) {
    std::string service = connection_service(connection, resolver);
    std::transform(service.begin(), service.end(), service.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    std::ostringstream oss;
    oss << timestamp << ": "
        << std::left << std::setw(7) << service << " | "
        << std::setw(8) << human_size(connection.size) << " | "
        << std::setw(9) << human_duration(connection.duration) << " | "
        << resolver.hostname(connection.src) << " (" << connection.src << ") to "
        << resolver.hostname(connection.dest) << " (" << connection.dest << ")";
    return oss.str();
}

size_t write_report(const ExportDump& dump, const ReportOptions& options, Resolver& resolver,
                    std::ostream& output) {
    size_t lines = 0;
    SessionAggregator aggregator(options.pairing);

    for (const auto& entry : dump) {
        std::string when = format_timestamp(entry.timestamp());

        for (const auto& connection : aggregator.pair_batch(entry.flows, entry.timestamp())) {
            if (connection.size > options.min_size) {
                output << format_report_line(connection, when, resolver) << "\n";
                lines++;
            }
        }
    }
    return lines;
}

} // namespace nfcollect
