#include "ogcode/log/Log.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <initializer_list>
#include <iostream>
#include <mutex>

namespace ogcode::log {

namespace {

constexpr std::size_t LEVEL_COUNT = 3; // Info, Warning, Error

LogHandler defaultHandler(LogLevel level) {
    std::ostream& stream = level == LogLevel::Info ? std::cout : std::cerr;
    return [&stream](std::string_view message) {
        stream << message;
        stream.flush();
    };
}

struct Registry {
    std::mutex mutex;
    std::array<LogHandler, LEVEL_COUNT> handlers{
        defaultHandler(LogLevel::Info),
        defaultHandler(LogLevel::Warning),
        defaultHandler(LogLevel::Error),
    };
};

Registry& registry() {
    static Registry instance;
    return instance;
}

std::atomic<LogLevel> threshold{LogLevel::Info};

std::size_t slot(LogLevel level) {
    return static_cast<std::size_t>(level);
}

} // namespace

void setLogLevel(LogLevel level) {
    threshold.store(level);
}

LogLevel logLevel() {
    return threshold.load();
}

bool isEnabled(LogLevel level) {
    return level != LogLevel::Off && slot(level) >= slot(threshold.load());
}

void setLogHandler(LogLevel level, LogHandler handler) {
    if (level == LogLevel::Off) {
        return;
    }
    auto& reg = registry();
    std::lock_guard lock(reg.mutex);
    reg.handlers[slot(level)] = handler ? std::move(handler) : defaultHandler(level);
}

void resetLogHandlers() {
    auto& reg = registry();
    std::lock_guard lock(reg.mutex);
    for (auto level : {LogLevel::Info, LogLevel::Warning, LogLevel::Error}) {
        reg.handlers[slot(level)] = defaultHandler(level);
    }
}

void dispatch(LogLevel level, std::string_view message) {
    if (level == LogLevel::Off) {
        return;
    }
    LogHandler handler;
    {
        // Handlers run outside the lock so they may log themselves.
        auto& reg = registry();
        std::lock_guard lock(reg.mutex);
        handler = reg.handlers[slot(level)];
    }
    handler(message);
}

} // namespace ogcode::log
