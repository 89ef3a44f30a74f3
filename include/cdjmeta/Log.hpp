#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace cdjmeta {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

/**
 * A single log record. Can render itself as a JSONL line for machine-readable logs.
 */
struct LogEntry {
    LogLevel level;
    std::string message;
    std::string source;
    int64_t timestamp_ms;

    [[nodiscard]] std::string toJsonl() const;
    [[nodiscard]] std::string toText() const;
};

[[nodiscard]] const char* toString(LogLevel level) noexcept;

/**
 * Process-wide log sink. By default writes "Source: message" lines to std::cerr.
 */
class Log {
public:
    using Sink = std::function<void(const LogEntry&)>;

    static void setLevel(LogLevel level);
    [[nodiscard]] static LogLevel getLevel();

    /**
     * Switch the default std::cerr output between plain text and JSONL.
     */
    static void setJsonl(bool enabled);
    [[nodiscard]] static bool isJsonl();

    /**
     * Route log entries somewhere other than std::cerr. Passing an empty
     * function restores the default.
     */
    static void setSink(Sink sink);

    [[nodiscard]] static bool isEnabled(LogLevel level);

    static void write(LogLevel level, std::string_view source, std::string message);

    template <typename... Args>
    static void debug(std::string_view source, fmt::format_string<Args...> format, Args&&... args) {
        if (isEnabled(LogLevel::Debug)) {
            write(LogLevel::Debug, source, fmt::format(format, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void info(std::string_view source, fmt::format_string<Args...> format, Args&&... args) {
        if (isEnabled(LogLevel::Info)) {
            write(LogLevel::Info, source, fmt::format(format, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void warn(std::string_view source, fmt::format_string<Args...> format, Args&&... args) {
        if (isEnabled(LogLevel::Warning)) {
            write(LogLevel::Warning, source, fmt::format(format, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void error(std::string_view source, fmt::format_string<Args...> format, Args&&... args) {
        if (isEnabled(LogLevel::Error)) {
            write(LogLevel::Error, source, fmt::format(format, std::forward<Args>(args)...));
        }
    }
};

} // namespace cdjmeta
