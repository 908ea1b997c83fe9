#pragma once

#include <fmt/format.h>
#include "util/compat.hpp"

#include <atomic>
#include <string>

namespace qs::log {

enum class Level {
    Debug, Info, Warning, Error
};

using LogFunction = move_only_function<void(Level, const std::string&)>;

/// Replaces the log sink. Every message emitted by quicsock goes through this function.
/// Must not be called while other threads may be logging.
void setLogFunction(LogFunction func);
LogFunction& getLogFunction();

/// Messages below this level are dropped before being formatted. Defaults to Info.
void setMinLevel(Level level);
Level minLevel();

std::string_view levelToString(Level level);

namespace detail {
    extern std::atomic<Level> g_minLevel;

    template <typename... Args>
    void emit(Level level, fmt::format_string<Args...> fmt, Args&&... args) {
        if (level < g_minLevel.load(std::memory_order::relaxed)) {
            return;
        }

        getLogFunction()(level, fmt::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    detail::emit(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void info(fmt::format_string<Args...> fmt, Args&&... args) {
    detail::emit(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(fmt::format_string<Args...> fmt, Args&&... args) {
    detail::emit(Level::Warning, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void error(fmt::format_string<Args...> fmt, Args&&... args) {
    detail::emit(Level::Error, fmt, std::forward<Args>(args)...);
}

}
