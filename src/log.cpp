// =============================================================================
// log.cpp - Log level names
// =============================================================================

#include "lendx/log.hpp"

namespace lendx {

namespace log {

std::optional<Level> parse_level(std::string_view name) {
    if (name == "trace") return Level::TRACE;
    if (name == "debug") return Level::DEBUG;
    if (name == "info") return Level::INFO;
    if (name == "warn" || name == "warning") return Level::WARN;
    if (name == "error") return Level::ERROR;
    if (name == "off" || name == "none") return Level::OFF;
    return std::nullopt;
}

const char* level_name(Level level) {
    switch (level) {
        case Level::TRACE: return "trace";
        case Level::DEBUG: return "debug";
        case Level::INFO: return "info";
        case Level::WARN: return "warn";
        case Level::ERROR: return "error";
        case Level::OFF: return "off";
    }
    return "unknown";
}

} // namespace log

} // namespace lendx
