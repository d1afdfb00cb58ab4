#ifndef NFCOLLECT_REPORT_HPP
#define NFCOLLECT_REPORT_HPP

#include "export_sink.hpp"
#include "session_aggregator.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

namespace nfcollect {

/**
 * Human-readable byte count: "512B", "2.00K", "1.50M", "3.25G" (base 1024)
 */
std::string human_size(uint64_t bytes);

/**
 * Human-readable duration of a millisecond count, floored to seconds:
 * "42 sec", "05:07 min", "2:03.04 hours"
 */
std::string human_duration(uint64_t milliseconds);

/**
 * Local time of an epoch timestamp as "YYYY-mm-dd HH:MM.SS"
 */
std::string format_timestamp(uint32_t epoch_seconds);

/**
 * Name lookups used by the report
 */
class Resolver {
public:
    virtual ~Resolver() = default;

    /**
     * Host name of an address, the address itself when it has none
     */
    virtual std::string hostname(const std::string& address) = 0;

    /**
     * Service registered for a port, if any
     */
    virtual std::optional<std::string> service(uint16_t port) = 0;
};

/**
 * Reverse DNS and the services database
 */
class SystemResolver : public Resolver {
public:
    std::string hostname(const std::string& address) override;
    std::optional<std::string> service(uint16_t port) override;
};

/**
 * Services database only; addresses are never looked up
 */
class NumericResolver : public SystemResolver {
public:
    std::string hostname(const std::string& address) override;
};

/**
 * Memoizes another resolver
 */
class CachingResolver : public Resolver {
public:
    explicit CachingResolver(std::unique_ptr<Resolver> inner);

    std::string hostname(const std::string& address) override;
    std::optional<std::string> service(uint16_t port) override;

private:
    std::unique_ptr<Resolver> inner_;
    std::map<std::string, std::string> hostnames_;
    std::map<uint16_t, std::optional<std::string>> services_;
};

/**
 * Service of the sending port, else of the receiving port, else "unknown"
 */
std::string connection_service(const Connection& connection, Resolver& resolver);

/**
 * "<timestamp>: <SERVICE> | <size> | <duration> | <src host> (<src>) to <dest host> (<dest>)"
 */
std::string format_report_line(const Connection& connection, const std::string& timestamp,
                               Resolver& resolver);

struct ReportOptions {
    uint64_t min_size = 1024 * 1024;  // only connections larger than this are listed
    PairingMode pairing = PairingMode::REVERSE_TUPLE;
};

/**
 * Pair every export of a dump and print the large connections
 *
 * Entries are visited in dump order and paired one entry at a time.
 *
 * @return number of lines written
 */
size_t write_report(const ExportDump& dump, const ReportOptions& options, Resolver& resolver,
                    std::ostream& output);

} // namespace nfcollect

#endif // NFCOLLECT_REPORT_HPP
