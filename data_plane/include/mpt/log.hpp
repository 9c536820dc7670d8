#pragma once

#include <sstream>

namespace mpt {

enum class LogLevel { kError = 0, kWarning = 1, kInfo = 2, kDebug = 3 };

void set_log_level(LogLevel level) noexcept;

LogLevel log_level() noexcept;

inline bool log_enabled(LogLevel level) noexcept {
    return static_cast<int>(level) <= static_cast<int>(log_level());
}

// Buffers one line and writes it to std::cerr on destruction so lines from
// concurrent part workers never interleave.
class LogLine {
  public:
    explicit LogLine(LogLevel level);
    ~LogLine();

    LogLine(const LogLine &) = delete;
    LogLine &operator=(const LogLine &) = delete;

    template <typename T>
    LogLine &operator<<(const T &value) {
        stream_ << value;
        return *this;
    }

  private:
    LogLevel level_;
    std::ostringstream stream_;
};

} // namespace mpt

#define MPT_LOG(level)                                                                             \
    if (!::mpt::log_enabled(::mpt::LogLevel::level)) {                                             \
    } else                                                                                         \
        ::mpt::LogLine(::mpt::LogLevel::level)
