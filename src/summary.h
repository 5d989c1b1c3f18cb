#pragma once
#include <iosfwd>
#include <string>
#include <vector>
#include "trace_parser.h"

// Events whose TextData lacks this marker are not part of the statistics.
constexpr const char* kTextDataMarker = "declare";

struct TraceSummary {
    int min_cpu = 0;
    int max_cpu = 0;
    int min_duration = 0;
    int max_duration = 0;
    double average_cpu = 0.0;
    double average_duration = 0.0;
    double average_reads = 0.0;
    double average_writes = 0.0;
    int sample_size = 0;
};

// Keep events whose text_data contains kTextDataMarker and whose cpu is positive.
std::vector<TraceEvent> filter_events(const std::vector<TraceEvent>& events);

// Reduce `events` into `out`. Returns false (and logs) when `events` is empty,
// since min/max/average are undefined then.
bool buildSummary(const std::vector<TraceEvent>& events, TraceSummary& out);

// "<label padded to 20>:<value padded to 20>"
std::string printable_line(const std::string& label, const std::string& value);

// Two-decimal fixed rendering in the classic locale.
std::string format_value(double v);

// Writes the nine report lines; false when `os` fails.
bool printSummary(const TraceSummary& summary, std::ostream& os);
