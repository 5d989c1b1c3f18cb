#include "trace_parser.h"
#include "logger.h"
#include <pugixml.hpp>
#include <climits>
#include <cstring>
#include <sstream>
#include <locale>
#ifdef HAVE_ZLIB
#include <zlib.h>
#endif

const char* describe(ParseStatus status) {
    switch (status) {
        case ParseStatus::Ok: return "ok";
        case ParseStatus::IoError: return "I/O error";
        case ParseStatus::FormatError: return "format error";
        case ParseStatus::SchemaError: return "schema error";
    }
    return "unknown error";
}

static std::string local_name(const char* qname) {
    if (!qname) return std::string();
    const char* p = std::strrchr(qname, ':');
    return p ? std::string(p + 1) : std::string(qname);
}

static std::string name_prefix(const char* qname) {
    if (!qname) return std::string();
    const char* p = std::strrchr(qname, ':');
    return p ? std::string(qname, p) : std::string();
}

// Namespace URI of an element, resolved through the nearest in-scope
// xmlns / xmlns:prefix declaration.
static std::string namespace_uri(pugi::xml_node node) {
    std::string prefix = name_prefix(node.name());
    std::string decl = prefix.empty() ? std::string("xmlns") : "xmlns:" + prefix;
    for (pugi::xml_node n = node; n && n.type() == pugi::node_element; n = n.parent()) {
        pugi::xml_attribute a = n.attribute(decl.c_str());
        if (a) return a.as_string();
    }
    return std::string();
}

static bool has_name(pugi::xml_node node, const std::string& ns, const char* local) {
    return node.type() == pugi::node_element
        && local_name(node.name()) == local
        && namespace_uri(node) == ns;
}

// Concatenated text of all descendant text and CDATA nodes.
struct TextCollector : pugi::xml_tree_walker {
    std::string out;

    bool for_each(pugi::xml_node& node) override {
        if (node.type() == pugi::node_pcdata || node.type() == pugi::node_cdata) out += node.value();
        return true;
    }
};

static std::string text_content(pugi::xml_node node) {
    TextCollector collector;
    node.traverse(collector);
    return collector.out;
}

static std::vector<pugi::xml_node> columns_of(pugi::xml_node element, const std::string& ns) {
    std::vector<pugi::xml_node> cols;
    for (pugi::xml_node c : element.children()) {
        if (has_name(c, ns, "Column")) cols.push_back(c);
    }
    return cols;
}

bool parse_int_column(const std::string& text, int& out) {
    std::istringstream iss(text);
    iss.imbue(std::locale::classic());
    long long v = 0;
    if (!(iss >> v)) return false;
    iss >> std::ws;
    if (!iss.eof()) return false;
    if (v < INT_MIN || v > INT_MAX) return false;
    out = static_cast<int>(v);
    return true;
}

static bool is_relevant_event(pugi::xml_node element, const std::string& ns) {
    int matches = 0;
    std::string value;
    for (pugi::xml_node col : columns_of(element, ns)) {
        if (std::strcmp(col.attribute("name").as_string(), "ApplicationName") == 0) {
            ++matches;
            value = text_content(col);
        }
    }
    return matches == 1 && value == kApplicationNameFilter;
}

static ParseStatus parse_event(pugi::xml_node element, const std::string& ns, TraceEvent& ev) {
    for (pugi::xml_node col : columns_of(element, ns)) {
        pugi::xml_attribute nameAttr = col.attribute("name");
        if (!nameAttr) {
            logger::error(std::string("Column without 'name' attribute in event <") + element.name() + ">");
            return ParseStatus::SchemaError;
        }
        std::string column = nameAttr.as_string();
        std::string value = text_content(col);

        int* target = nullptr;
        if (column == "Duration") target = &ev.duration;
        else if (column == "CPU") target = &ev.cpu;
        else if (column == "Reads") target = &ev.reads;
        else if (column == "Writes") target = &ev.writes;
        else if (column == "TextData") ev.text_data = value;
        else if (column == "ApplicationName") ev.application_name = value;
        else if (column == "LoginName") ev.login_name = value;

        if (target && !parse_int_column(value, *target)) {
            logger::error("Column '" + column + "' is not an integer: '" + value + "'");
            return ParseStatus::SchemaError;
        }
    }
    return ParseStatus::Ok;
}

static ParseStatus extract_events(const pugi::xml_document& doc, std::vector<TraceEvent>& events) {
    pugi::xml_node root = doc.document_element();
    std::string ns = root.attribute("xmlns").as_string();

    pugi::xml_node container;
    for (pugi::xml_node c : root.children()) {
        if (has_name(c, ns, "Events")) { container = c; break; }
    }
    if (!container) {
        logger::error(std::string("No Events element under root <") + root.name() + ">");
        return ParseStatus::FormatError;
    }

    std::vector<TraceEvent> parsed;
    std::size_t candidates = 0;
    for (pugi::xml_node candidate : container.children()) {
        if (candidate.type() != pugi::node_element) continue;
        ++candidates;
        if (!is_relevant_event(candidate, ns)) continue;

        TraceEvent ev;
        ParseStatus st = parse_event(candidate, ns, ev);
        if (st != ParseStatus::Ok) return st;
        parsed.push_back(ev);
    }

    logger::info("Candidates: " + std::to_string(candidates) + ", relevant: " + std::to_string(parsed.size()));
    events.insert(events.end(), parsed.begin(), parsed.end());
    return ParseStatus::Ok;
}

static ParseStatus check_load(const pugi::xml_parse_result& result, const std::string& source) {
    if (result) return ParseStatus::Ok;
    logger::error(std::string("XML error: ") + result.description() + " in " + source
                  + " (offset " + std::to_string(result.offset) + ")");
    switch (result.status) {
        case pugi::status_file_not_found:
        case pugi::status_io_error:
        case pugi::status_out_of_memory:
            return ParseStatus::IoError;
        default:
            return ParseStatus::FormatError;
    }
}

ParseStatus parse_trace_buffer(const std::string& data, std::vector<TraceEvent>& events) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_buffer(data.c_str(), data.size(), pugi::parse_default);
    ParseStatus st = check_load(result, "<buffer>");
    if (st != ParseStatus::Ok) return st;
    return extract_events(doc, events);
}

ParseStatus parse_trace_xml(const std::string& xmlPath, std::vector<TraceEvent>& events) {
    pugi::xml_document doc;

    pugi::xml_parse_result result;
    bool is_gz = (xmlPath.size() >= 3 && xmlPath.substr(xmlPath.size() - 3) == ".gz");
#ifdef HAVE_ZLIB
    auto load_gz_to_string = [](const std::string &path, std::string &out) -> bool {
        gzFile f = gzopen(path.c_str(), "rb");
        if (!f) return false;
        char buf[8192];
        int n = 0;
        out.clear();
        while ((n = gzread(f, buf, sizeof(buf))) > 0) out.append(buf, n);
        if (n < 0) {
            int errnum = 0;
            logger::error(std::string("gzip read error: ") + gzerror(f, &errnum) + " for " + path);
            gzclose(f);
            return false;
        }
        int gzerr = gzclose(f);
        if (gzerr != Z_OK) {
            logger::error(std::string("gzip read error (gzclose returned ") + std::to_string(gzerr) + ") for " + path);
            return false;
        }
        logger::debug(std::string("Read ") + std::to_string(out.size()) + " bytes from gz file " + path);
        return true;
    };

    if (is_gz) {
        std::string data;
        if (!load_gz_to_string(xmlPath, data)) {
            logger::error(std::string("Cannot read gzip input: ") + xmlPath);
            return ParseStatus::IoError;
        }
        result = doc.load_buffer(data.c_str(), data.size(), pugi::parse_default);
    } else {
        result = doc.load_file(xmlPath.c_str(), pugi::parse_default);
    }
#else
    if (is_gz) {
        logger::error(std::string("gzip support not available (build without zlib): ") + xmlPath);
        return ParseStatus::IoError;
    }
    result = doc.load_file(xmlPath.c_str(), pugi::parse_default);
#endif

    ParseStatus st = check_load(result, xmlPath);
    if (st != ParseStatus::Ok) return st;
    return extract_events(doc, events);
}
