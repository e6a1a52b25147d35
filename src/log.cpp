// AtomArb - Logging Implementation

#include <atomarb/log.hpp>
#include <atomarb/types.hpp>
#include <atomic>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace atomarb::log {

namespace {

std::atomic<Level> g_level{Level::Info};
std::mutex g_write_mutex;

}  // namespace

Level parse_level(std::string_view name) {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "off") return Level::Off;
    throw std::invalid_argument("Unknown log level: " + std::string(name));
}

void set_level(Level level) noexcept {
    g_level.store(level, std::memory_order_relaxed);
}

Level level() noexcept {
    return g_level.load(std::memory_order_relaxed);
}

void write(Level level, const std::string& message) {
    std::lock_guard lock(g_write_mutex);
    std::clog << now_ms() << " [" << to_string(level) << "] " << message << '\n';
}

}  // namespace atomarb::log
