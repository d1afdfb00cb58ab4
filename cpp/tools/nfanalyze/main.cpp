#include "arg_parser.hpp"
#include <nfcollect/export_sink.hpp>
#include <nfcollect/logging.hpp>
#include <nfcollect/report.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <sys/stat.h>

using namespace nfcollect;

namespace {

bool file_exists(const std::string& path) {
    struct stat buffer;
    return stat(path.c_str(), &buffer) == 0;
}

} // namespace

int main(int argc, char** argv) {
    std::string filename;
    uint64_t min_size = 1024 * 1024;
    bool sequential = false;
    bool no_resolve = false;
    std::string log_level = "error";

    tools::ArgParser parser("nfanalyze - list large connections of a collector export");

    parser.add_positional("filename", filename,
                          "Export file written by nfcollectd (JSON or JSON Lines)");
    parser.add_option("", "min-size", min_size,
                      "Only list connections larger than this many bytes");
    parser.add_flag("", "sequential", sequential,
                    "Pair flows two at a time in arrival order instead of by 5-tuple");
    parser.add_flag("", "no-resolve", no_resolve,
                    "Do not resolve addresses to host names");
    parser.add_option("-v", "log-level", log_level,
                      "Log level: trace, debug, info, warn, error, off");

    if (!parser.parse(argc, argv)) {
        if (parser.should_show_help()) {
            parser.print_help();
            return 0;
        }
        std::cerr << "Error: " << parser.error() << "\n";
        std::cerr << "Use " << argv[0] << " <filename>.json\n";
        return 1;
    }

    spdlog::level::level_enum level;
    if (!Logger::parse_level(log_level, level)) {
        std::cerr << "Error: unknown log level: " << log_level << "\n";
        return 1;
    }
    Logger::set_level(level);

    if (!file_exists(filename)) {
        std::cerr << "File " << filename << " does not exist!\n";
        return 1;
    }

    ExportDump dump;
    try {
        dump = read_export_file(filename);
    } catch (const ExportError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    ReportOptions options;
    options.min_size = min_size;
    options.pairing = sequential ? PairingMode::SEQUENTIAL : PairingMode::REVERSE_TUPLE;

    std::unique_ptr<Resolver> inner;
    if (no_resolve) {
        inner = std::make_unique<NumericResolver>();
    } else {
        inner = std::make_unique<SystemResolver>();
    }
    CachingResolver resolver(std::move(inner));

    write_report(dump, options, resolver, std::cout);
    return 0;
}
