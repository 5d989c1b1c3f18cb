#pragma once
#include <string>
#include <vector>

// Only events recorded by this client application are considered.
constexpr const char* kApplicationNameFilter = "Microsoft JDBC Driver for SQL Server";

struct TraceEvent {
    std::string application_name;
    std::string login_name;
    std::string text_data;
    int duration = 0;
    int cpu = 0;
    int reads = 0;
    int writes = 0;
};

enum class ParseStatus {
    Ok = 0,
    IoError,      // missing or unreadable file, gzip failure
    FormatError,  // not well-formed XML, no Events container
    SchemaError   // Column without name attribute, non-integer numeric column
};

const char* describe(ParseStatus status);

// Parse a SQL trace XML file at `xmlPath` (".gz" is inflated first when built
// with zlib) and append one TraceEvent per relevant event to `events`.
// On any failure the error is logged and `events` is left untouched.
ParseStatus parse_trace_xml(const std::string& xmlPath, std::vector<TraceEvent>& events);

// Same as parse_trace_xml for a document already held in memory.
ParseStatus parse_trace_buffer(const std::string& data, std::vector<TraceEvent>& events);

// Integer conversion used for numeric columns: optional surrounding
// whitespace, optional sign, decimal digits, must fit in int.
bool parse_int_column(const std::string& text, int& out);
