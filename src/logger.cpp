#include "logger.h"
#include <cstdio>
#include <iostream>
#include <mutex>

static LogLevel g_level = LogLevel::Warn;
static std::mutex g_log_mtx;
static bool g_json = false;

namespace logger {
    void set_level(LogLevel lvl) { g_level = lvl; }
    LogLevel get_level() { return g_level; }
    void set_json(bool on) { g_json = on; }
    bool is_json() { return g_json; }

    LogLevel level_for_verbosity(int verbose_count) {
        if (verbose_count >= 2) return LogLevel::Debug;
        if (verbose_count == 1) return LogLevel::Info;
        return LogLevel::Warn;
    }

    static void emit_plain(const char* prefix, const std::string& msg) {
        std::lock_guard<std::mutex> lg(g_log_mtx);
        std::cerr << prefix << msg << std::endl;
    }

    static void emit_json(const char* level, const std::string& msg) {
        std::lock_guard<std::mutex> lg(g_log_mtx);
        std::cerr << "{\"level\":\"" << level << "\",\"msg\":\"";
        for (char c : msg) {
            if (c == '\\') std::cerr << "\\\\";
            else if (c == '"') std::cerr << "\\\"";
            else if (c == '\n') std::cerr << "\\n";
            else if (c == '\t') std::cerr << "\\t";
            else if (c == '\r') std::cerr << "\\r";
            else if (c == '\b') std::cerr << "\\b";
            else if (c == '\f') std::cerr << "\\f";
            else if (static_cast<unsigned char>(c) < 0x20) {
                char esc[8];
                std::snprintf(esc, sizeof(esc), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                std::cerr << esc;
            }
            else std::cerr << c;
        }
        std::cerr << "\"}" << std::endl;
    }

    static bool enabled(LogLevel lvl) { return (int)g_level >= (int)lvl; }

    void error(const std::string& msg) { if (enabled(LogLevel::Error)) { if (g_json) emit_json("ERROR", msg); else emit_plain("ERROR: ", msg); } }
    void warn(const std::string& msg)  { if (enabled(LogLevel::Warn))  { if (g_json) emit_json("WARN", msg);  else emit_plain("WARN: ", msg); } }
    void info(const std::string& msg)  { if (enabled(LogLevel::Info))  { if (g_json) emit_json("INFO", msg);  else emit_plain("INFO: ", msg); } }
    void debug(const std::string& msg) { if (enabled(LogLevel::Debug)) { if (g_json) emit_json("DEBUG", msg); else emit_plain("DEBUG: ", msg); } }
}
