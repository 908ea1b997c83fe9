#include <quicsock/Log.hpp>

namespace qs::log {

namespace detail {
    std::atomic<Level> g_minLevel{Level::Info};
}

void setLogFunction(LogFunction func) {
    getLogFunction() = std::move(func);
}

LogFunction& getLogFunction() {
    static LogFunction function = [](Level level, const std::string& message) {
        fmt::println("[quicsock] [{}] {}", levelToString(level), message);
    };

    return function;
}

void setMinLevel(Level level) {
    detail::g_minLevel.store(level, std::memory_order::relaxed);
}

Level minLevel() {
    return detail::g_minLevel.load(std::memory_order::relaxed);
}

std::string_view levelToString(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warning: return "WARN";
        case Level::Error: return "ERROR";
    }

    return "UNKNOWN";
}

}
