#ifndef NFCOLLECT_LOGGING_HPP
#define NFCOLLECT_LOGGING_HPP

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace nfcollect {

/**
 * Process-wide logger
 *
 * Usage:
 *   SPDLOG_LOGGER_INFO(Logger::instance(), "Listening on {}:{}", addr, port);
 *
 * All library components and tools log through the same "nfcollect"
 * logger, which writes colored output to stderr.
 */
class Logger {
public:
    static std::shared_ptr<spdlog::logger> instance();

    /**
     * Set the minimum level of the shared logger
     */
    static void set_level(spdlog::level::level_enum level);

    /**
     * Parse a level name (trace, debug, info, warn, error, critical, off)
     *
     * @return false if the name is not a known level
     */
    static bool parse_level(const std::string& name, spdlog::level::level_enum& level);
};

} // namespace nfcollect

#endif // NFCOLLECT_LOGGING_HPP
