#pragma once

#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace tinynotes::server {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError,
};

std::optional<LogLevel> parse_log_level(std::string_view text);

class Logger {
public:
    explicit Logger(const std::string& file_path, LogLevel min_level = LogLevel::kInfo, bool echo_to_console = true);

    void log(LogLevel level, std::string_view message);

    void debug(std::string_view message) { log(LogLevel::kDebug, message); }
    void info(std::string_view message) { log(LogLevel::kInfo, message); }
    void warn(std::string_view message) { log(LogLevel::kWarn, message); }
    void error(std::string_view message) { log(LogLevel::kError, message); }

    LogLevel min_level() const { return min_level_; }

private:
    static const char* level_to_string(LogLevel level);
    void ensure_stream();

    std::mutex mutex_;
    std::ofstream stream_;
    std::string file_path_;
    LogLevel min_level_;
    bool echo_to_console_;
};

}  // namespace tinynotes::server
