#include "mpt/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace mpt {

namespace {

std::atomic<int> current_level{static_cast<int>(LogLevel::kWarning)};

std::mutex &log_mutex() {
    static std::mutex mutex;
    return mutex;
}

const char *level_tag(LogLevel level) {
    switch (level) {
    case LogLevel::kError:
        return "error";
    case LogLevel::kWarning:
        return "warn";
    case LogLevel::kInfo:
        return "info";
    case LogLevel::kDebug:
        return "debug";
    }
    return "log";
}

} // namespace

void set_log_level(LogLevel level) noexcept {
    current_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() noexcept {
    return static_cast<LogLevel>(current_level.load(std::memory_order_relaxed));
}

LogLine::LogLine(LogLevel level) : level_(level) {}

LogLine::~LogLine() {
    std::lock_guard<std::mutex> lock(log_mutex());
    std::cerr << "[mpt] " << level_tag(level_) << ": " << stream_.str() << std::endl;
}

} // namespace mpt
