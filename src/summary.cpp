#include "summary.h"
#include "logger.h"
#include <algorithm>
#include <iomanip>
#include <iterator>
#include <locale>
#include <ostream>
#include <sstream>

std::vector<TraceEvent> filter_events(const std::vector<TraceEvent>& events) {
    std::vector<TraceEvent> out;
    std::copy_if(events.begin(), events.end(), std::back_inserter(out), [](const TraceEvent& e) {
        return e.text_data.find(kTextDataMarker) != std::string::npos && e.cpu > 0;
    });
    logger::info("Events after TextData/CPU filter: " + std::to_string(out.size()) + " of " + std::to_string(events.size()));
    return out;
}

bool buildSummary(const std::vector<TraceEvent>& events, TraceSummary& out) {
    if (events.empty()) {
        logger::error("No events left after filtering; statistics are undefined");
        return false;
    }

    TraceSummary s;
    s.min_cpu = s.max_cpu = events.front().cpu;
    s.min_duration = s.max_duration = events.front().duration;

    long long sum_cpu = 0, sum_duration = 0, sum_reads = 0, sum_writes = 0;
    for (const auto &e : events) {
        s.min_cpu = std::min(s.min_cpu, e.cpu);
        s.max_cpu = std::max(s.max_cpu, e.cpu);
        s.min_duration = std::min(s.min_duration, e.duration);
        s.max_duration = std::max(s.max_duration, e.duration);
        sum_cpu += e.cpu;
        sum_duration += e.duration;
        sum_reads += e.reads;
        sum_writes += e.writes;
    }

    const double n = static_cast<double>(events.size());
    s.sample_size = static_cast<int>(events.size());
    s.average_cpu = static_cast<double>(sum_cpu) / n;
    s.average_duration = static_cast<double>(sum_duration) / n;
    s.average_reads = static_cast<double>(sum_reads) / n;
    s.average_writes = static_cast<double>(sum_writes) / n;

    out = s;
    return true;
}

std::string format_value(double v) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::fixed << std::setprecision(2) << v;
    return oss.str();
}

std::string printable_line(const std::string& label, const std::string& value) {
    std::ostringstream oss;
    oss << std::setw(20) << std::right << label << ':' << std::setw(20) << std::right << value;
    return oss.str();
}

bool printSummary(const TraceSummary& summary, std::ostream& os) {
    os << printable_line("Sample Size", format_value(summary.sample_size)) << '\n';

    os << printable_line("Min CPU", format_value(summary.min_cpu)) << '\n';
    os << printable_line("Max CPU", format_value(summary.max_cpu)) << '\n';
    os << printable_line("Average CPU", format_value(summary.average_cpu)) << '\n';

    os << printable_line("Min Duration", format_value(summary.min_duration)) << '\n';
    os << printable_line("Max Duration", format_value(summary.max_duration)) << '\n';
    os << printable_line("Average Duration", format_value(summary.average_duration)) << '\n';

    os << printable_line("Average Reads", format_value(summary.average_reads)) << '\n';
    os << printable_line("Average Writes", format_value(summary.average_writes)) << '\n';
    os.flush();
    return static_cast<bool>(os);
}
