#include "../src/summary.h"
#include <cmath>
#include <iostream>
#include <vector>

static TraceEvent make_event(const std::string& text, int cpu, int duration, int reads, int writes) {
    TraceEvent e;
    e.application_name = kApplicationNameFilter;
    e.text_data = text;
    e.cpu = cpu;
    e.duration = duration;
    e.reads = reads;
    e.writes = writes;
    return e;
}

static bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

int main() {
    std::vector<TraceEvent> events = {
        make_event("declare x", 10, 100, 5, 2),
        make_event("declare y", 20, 300, 15, 8),
        make_event("declare z", 0, 50, 1, 0),        // cpu == 0
        make_event("select 1", 50, 500, 40, 4),      // no marker
        make_event("DECLARE @a int", 9, 90, 9, 9),   // case differs
        make_event("i declare war", 5, 10, 0, 0),    // substring match
        make_event("declare neg", -1, 10, 0, 0),     // negative cpu
    };

    std::vector<TraceEvent> kept = filter_events(events);
    if (kept.size() != 3) {
        std::cerr << "unexpected filtered count: " << kept.size() << "\n";
        return 2;
    }
    if (kept[2].text_data != "i declare war") {
        std::cerr << "substring match not kept\n";
        return 3;
    }

    // Example from the two-event trace.
    std::vector<TraceEvent> pair(kept.begin(), kept.begin() + 2);
    TraceSummary s;
    if (!buildSummary(pair, s)) {
        std::cerr << "buildSummary failed\n";
        return 4;
    }
    if (s.sample_size != 2 || s.min_cpu != 10 || s.max_cpu != 20 || s.min_duration != 100 || s.max_duration != 300) {
        std::cerr << "min/max mismatch\n";
        return 5;
    }
    if (!near(s.average_cpu, 15.0) || !near(s.average_duration, 200.0) || !near(s.average_reads, 10.0) || !near(s.average_writes, 5.0)) {
        std::cerr << "average mismatch\n";
        return 6;
    }

    TraceSummary all;
    if (!buildSummary(kept, all)) {
        std::cerr << "buildSummary failed on three events\n";
        return 7;
    }
    if (all.sample_size != 3 || all.min_cpu != 5 || all.min_duration != 10) {
        std::cerr << "three-event min mismatch\n";
        return 8;
    }
    if (!(all.min_cpu <= all.average_cpu && all.average_cpu <= all.max_cpu)) {
        std::cerr << "average cpu outside [min, max]\n";
        return 9;
    }
    if (!(all.min_duration <= all.average_duration && all.average_duration <= all.max_duration)) {
        std::cerr << "average duration outside [min, max]\n";
        return 10;
    }
    if (!near(all.average_cpu, 35.0 / 3.0)) {
        std::cerr << "floating-point average expected\n";
        return 11;
    }

    // Sums must not overflow int.
    std::vector<TraceEvent> big = {
        make_event("declare a", 2147483647, 2147483647, 2147483647, 0),
        make_event("declare b", 2147483647, 2147483647, 2147483647, 0),
    };
    TraceSummary bs;
    if (!buildSummary(big, bs) || !near(bs.average_cpu, 2147483647.0) || !near(bs.average_reads, 2147483647.0)) {
        std::cerr << "large values averaged incorrectly\n";
        return 12;
    }

    std::vector<TraceEvent> none;
    TraceSummary untouched;
    untouched.sample_size = 42;
    if (buildSummary(none, untouched)) {
        std::cerr << "empty input must fail\n";
        return 13;
    }
    if (untouched.sample_size != 42) {
        std::cerr << "failed buildSummary modified its output\n";
        return 14;
    }

    std::cout << "OK\n";
    return 0;
}
