#include "cdjmeta/Log.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>

namespace cdjmeta {

namespace {

std::atomic<LogLevel> minimumLevel{LogLevel::Info};
std::atomic<bool> jsonlOutput{false};

std::mutex sinkMutex;
Log::Sink customSink;

std::string escapeJson(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    result += fmt::format("\\u{:04x}", static_cast<int>(c));
                } else {
                    result += c;
                }
        }
    }
    return result;
}

int64_t nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

const char* toString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug:   return "debug";
        case LogLevel::Info:    return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error:   return "error";
    }
    return "info";
}

std::string LogEntry::toJsonl() const {
    return fmt::format(R"({{"level":"{}","message":"{}","source":"{}","timestamp_ms":{}}})",
                       cdjmeta::toString(level), escapeJson(message), escapeJson(source), timestamp_ms);
}

std::string LogEntry::toText() const {
    if (level == LogLevel::Info) {
        return fmt::format("{}: {}", source, message);
    }
    return fmt::format("{}: [{}] {}", source, cdjmeta::toString(level), message);
}

void Log::setLevel(LogLevel level) {
    minimumLevel.store(level);
}

LogLevel Log::getLevel() {
    return minimumLevel.load();
}

void Log::setJsonl(bool enabled) {
    jsonlOutput.store(enabled);
}

bool Log::isJsonl() {
    return jsonlOutput.load();
}

void Log::setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(sinkMutex);
    customSink = std::move(sink);
}

bool Log::isEnabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(minimumLevel.load());
}

void Log::write(LogLevel level, std::string_view source, std::string message) {
    LogEntry entry{level, std::move(message), std::string(source), nowMillis()};

    std::lock_guard<std::mutex> lock(sinkMutex);
    if (customSink) {
        customSink(entry);
        return;
    }
    std::cerr << (jsonlOutput.load() ? entry.toJsonl() : entry.toText()) << std::endl;
}

} // namespace cdjmeta
