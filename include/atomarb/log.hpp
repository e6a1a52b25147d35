// AtomArb - Logging
// Leveled line logger on std::clog with streaming macros

#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>

namespace atomarb::log {

enum class Level : uint8_t {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

inline constexpr const char* to_string(Level l) noexcept {
    switch (l) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
        case Level::Off: return "OFF";
    }
    return "UNKNOWN";
}

// "trace" | "debug" | "info" | "warn" | "error" | "off"; throws std::invalid_argument otherwise
Level parse_level(std::string_view name);

void set_level(Level level) noexcept;
[[nodiscard]] Level level() noexcept;

[[nodiscard]] inline bool enabled(Level l) noexcept {
    return l >= level() && l != Level::Off;
}

// Writes one timestamped line; serialized across threads
void write(Level level, const std::string& message);

}  // namespace atomarb::log

#define ATOMARB_LOG(lvl, msg)                                         \
    do {                                                              \
        if (::atomarb::log::enabled(lvl)) {                           \
            std::ostringstream atomarb_log_os_;                       \
            atomarb_log_os_ << msg;                                   \
            ::atomarb::log::write(lvl, atomarb_log_os_.str());        \
        }                                                             \
    } while (0)

#define ATOMARB_LOG_TRACE(msg) ATOMARB_LOG(::atomarb::log::Level::Trace, msg)
#define ATOMARB_LOG_DEBUG(msg) ATOMARB_LOG(::atomarb::log::Level::Debug, msg)
#define ATOMARB_LOG_INFO(msg) ATOMARB_LOG(::atomarb::log::Level::Info, msg)
#define ATOMARB_LOG_WARN(msg) ATOMARB_LOG(::atomarb::log::Level::Warn, msg)
#define ATOMARB_LOG_ERROR(msg) ATOMARB_LOG(::atomarb::log::Level::Error, msg)
