#include "../src/logger.h"
#include <iostream>
#include <sstream>
#include <string>

// Runs `fn` with std::cerr redirected and returns what it wrote.
template <typename Fn>
static std::string capture_cerr(Fn fn) {
    std::ostringstream buf;
    std::streambuf* old = std::cerr.rdbuf(buf.rdbuf());
    fn();
    std::cerr.rdbuf(old);
    return buf.str();
}

int main() {
    logger::set_level(LogLevel::Debug);

    logger::set_json(true);
    std::string out = capture_cerr([] { logger::error("Column 'CPU' is not an integer: '1\r2\x01'"); });
    const std::string expected_json =
        "{\"level\":\"ERROR\",\"msg\":\"Column 'CPU' is not an integer: '1\\r2\\u0001'\"}\n";
    if (out != expected_json) {
        std::cerr << "control characters not escaped: " << out;
        return 2;
    }

    out = capture_cerr([] { logger::warn(std::string("q\"b\\s\n\t\b\f") + '\x1f'); });
    if (out != "{\"level\":\"WARN\",\"msg\":\"q\\\"b\\\\s\\n\\t\\b\\f\\u001f\"}\n") {
        std::cerr << "escape mismatch: " << out;
        return 3;
    }

    // Bytes above 0x7f (UTF-8) pass through unchanged.
    out = capture_cerr([] { logger::info("path /tmp/\xd1\x82.xml"); });
    if (out != "{\"level\":\"INFO\",\"msg\":\"path /tmp/\xd1\x82.xml\"}\n") {
        std::cerr << "utf-8 bytes altered: " << out;
        return 4;
    }

    logger::set_json(false);
    out = capture_cerr([] { logger::error("plain"); });
    if (out != "ERROR: plain\n") {
        std::cerr << "plain format mismatch: " << out;
        return 5;
    }

    logger::set_level(logger::level_for_verbosity(0));
    out = capture_cerr([] { logger::info("hidden"); logger::warn("shown"); });
    if (out != "WARN: shown\n") {
        std::cerr << "level filtering mismatch: " << out;
        return 6;
    }

    std::cout << "OK\n";
    return 0;
}
