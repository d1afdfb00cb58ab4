#include "nfcollect/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>

namespace nfcollect {

std::shared_ptr<spdlog::logger> Logger::instance() {
    static std::shared_ptr<spdlog::logger> logger = [] {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto created = std::make_shared<spdlog::logger>("nfcollect", sink);
        created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        created->set_level(spdlog::level::info);
        return created;
    }();
    return logger;
}

void Logger::set_level(spdlog::level::level_enum level) {
    instance()->set_level(level);
}

bool Logger::parse_level(const std::string& name, spdlog::level::level_enum& level) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "warning") {
        lower = "warn";
    }

    // from_str() maps unknown names to "off", so check that case explicitly
    spdlog::level::level_enum parsed = spdlog::level::from_str(lower);
    if (parsed == spdlog::level::off && lower != "off") {
        return false;
    }

    level = parsed;
    return true;
}

} // namespace nfcollect
