#pragma once

#include <cstdint>
#include <functional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

// Core Log subsystem
// Responsible for: leveled, categorized line logging for the engine and its driver.
// Should NOT do: player-facing message history (see sim::MessageLog) or file rotation.
namespace tinyfactory::core {

enum class LogLevel : uint8_t {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
    Trace = 4
};

// Receives every emitted line instead of stdout/stderr when installed.
using LogSink = std::function<void(LogLevel level, std::string_view category, std::string_view message)>;

void setLogLevel(LogLevel level);
[[nodiscard]] LogLevel logLevel();
[[nodiscard]] bool shouldLog(LogLevel level);
void initializeLogLevelFromEnvironment();
[[nodiscard]] LogLevel parseLogLevel(std::string_view text, LogLevel fallback);
[[nodiscard]] const char* logLevelName(LogLevel level);

// Pass an empty sink to restore console output.
// The sink runs outside the write lock, so it may log itself.
void setLogSink(LogSink sink);

class LogLine {
public:
    LogLine(LogLevel level, std::string_view category);
    ~LogLine();

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    [[nodiscard]] std::ostream& stream();

private:
    LogLevel m_level;
    std::string m_category;
    std::ostringstream m_stream;
};

} // namespace tinyfactory::core

#define TF_LOG_STREAM(level, category) \
    if (!::tinyfactory::core::shouldLog(level)) {} else ::tinyfactory::core::LogLine((level), (category)).stream()

#define TF_LOGE(category) TF_LOG_STREAM(::tinyfactory::core::LogLevel::Error, (category))
#define TF_LOGW(category) TF_LOG_STREAM(::tinyfactory::core::LogLevel::Warn, (category))
#define TF_LOGI(category) TF_LOG_STREAM(::tinyfactory::core::LogLevel::Info, (category))
#define TF_LOGD(category) TF_LOG_STREAM(::tinyfactory::core::LogLevel::Debug, (category))
#define TF_LOGT(category) TF_LOG_STREAM(::tinyfactory::core::LogLevel::Trace, (category))
