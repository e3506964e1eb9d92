// Log.hpp
// -----------------------------------------------------------------------------
// Process-wide logging with one replaceable handler per level. Messages below
// the current threshold are dropped before their arguments are formatted.
// Components prefix their messages with their name in brackets.

#pragma once

#include <functional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace ogcode::log {

using LogHandler = std::function<void(std::string_view)>;

enum class LogLevel { Info, Warning, Error, Off };

/// Drop messages below @p level (default: Info). Off silences everything.
void setLogLevel(LogLevel level);
LogLevel logLevel();
bool isEnabled(LogLevel level);

/// Install @p handler for @p level; an empty handler restores the default
/// (stdout for info, stderr otherwise).
void setLogHandler(LogLevel level, LogHandler handler);
void resetLogHandlers();

inline void setInfoLogHandler(LogHandler handler) { setLogHandler(LogLevel::Info, std::move(handler)); }
inline void setWarningLogHandler(LogHandler handler) { setLogHandler(LogLevel::Warning, std::move(handler)); }
inline void setErrorLogHandler(LogHandler handler) { setLogHandler(LogLevel::Error, std::move(handler)); }

/// Deliver an already formatted message, bypassing the threshold check.
void dispatch(LogLevel level, std::string_view message);

namespace detail {

template<typename... Args>
std::string concat(Args&&... args) {
    std::ostringstream out;
    (out << ... << std::forward<Args>(args));
    return out.str();
}

template<typename... Args>
constexpr bool isSingleString =
    sizeof...(Args) == 1 && (std::is_convertible_v<std::decay_t<Args>, std::string_view> && ...);

} // namespace detail

template<typename... Args>
void logAt(LogLevel level, Args&&... args) {
    if (!isEnabled(level)) {
        return;
    }
    if constexpr (detail::isSingleString<Args...>) {
        dispatch(level, std::string_view(std::forward<Args>(args)...));
    } else {
        dispatch(level, detail::concat(std::forward<Args>(args)...));
    }
}

template<typename... Args>
void logInfo(Args&&... args) {
    logAt(LogLevel::Info, std::forward<Args>(args)...);
}

template<typename... Args>
void logWarning(Args&&... args) {
    logAt(LogLevel::Warning, std::forward<Args>(args)...);
}

template<typename... Args>
void logError(Args&&... args) {
    logAt(LogLevel::Error, std::forward<Args>(args)...);
}

} // namespace ogcode::log

namespace ogcode {
using log::LogHandler;
using log::LogLevel;
using log::setLogLevel;
using log::logLevel;
using log::setLogHandler;
using log::setInfoLogHandler;
using log::setWarningLogHandler;
using log::setErrorLogHandler;
using log::resetLogHandlers;
using log::logInfo;
using log::logWarning;
using log::logError;
} // namespace ogcode
