#include "trace_parser.h"
#include "summary.h"
#include "logger.h"
#include <iostream>
#include <string>
#include <vector>

enum ExitCode {
    kExitOk = 0,
    kExitUsage = 1,
    kExitIo = 2,
    kExitFormat = 3,
    kExitSchema = 4,
    kExitEmpty = 5
};

static void print_usage(std::ostream& os) {
    os << "Usage: trace_stats [-v|--verbose]... [--log-json] <trace.xml|trace.xml.gz>\n"
       << "Prints CPU/Duration/Reads/Writes statistics for '" << kApplicationNameFilter
       << "' events whose TextData contains '" << kTextDataMarker << "'.\n";
}

static int exit_code_for(ParseStatus st) {
    switch (st) {
        case ParseStatus::Ok: return kExitOk;
        case ParseStatus::IoError: return kExitIo;
        case ParseStatus::FormatError: return kExitFormat;
        case ParseStatus::SchemaError: return kExitSchema;
    }
    return kExitFormat;
}

int main(int argc, char* argv[]) {
    std::string path;
    std::string arg_error;
    int verbose_count = 0;
    bool json_log = false;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-h" || a == "--help") {
            print_usage(std::cout);
            return kExitOk;
        } else if (a == "-v" || a == "--verbose") {
            ++verbose_count;
        } else if (a == "--log-json") {
            json_log = true;
        } else if (a.size() > 1 && a[0] == '-') {
            if (arg_error.empty()) arg_error = "Unknown option: " + a;
        } else if (path.empty()) {
            path = a;
        } else {
            if (arg_error.empty()) arg_error = "Only one input file is accepted, got extra: " + a;
        }
    }

    // Logging flags apply to argument errors too, whatever their position.
    logger::set_json(json_log);
    logger::set_level(logger::level_for_verbosity(verbose_count));

    if (arg_error.empty() && path.empty()) arg_error = "Missing input file";
    if (!arg_error.empty()) {
        logger::error(arg_error);
        print_usage(std::cerr);
        return kExitUsage;
    }

    logger::info("Processing: " + path);
    std::vector<TraceEvent> events;
    ParseStatus st = parse_trace_xml(path, events);
    if (st != ParseStatus::Ok) {
        logger::error(std::string("Failed to parse ") + path + ": " + describe(st));
        return exit_code_for(st);
    }

    std::vector<TraceEvent> filtered = filter_events(events);

    TraceSummary summary;
    if (!buildSummary(filtered, summary)) return kExitEmpty;

    if (!printSummary(summary, std::cout)) {
        logger::error("Failed to write the summary to stdout");
        return kExitIo;
    }
    return kExitOk;
}
