#include "logger.hpp"

#include "time_format.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace tinynotes::server {

std::optional<LogLevel> parse_log_level(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return std::nullopt;
}

Logger::Logger(const std::string& file_path, LogLevel min_level, bool echo_to_console)
    : file_path_(file_path), min_level_(min_level), echo_to_console_(echo_to_console) {
    ensure_stream();
}

void Logger::ensure_stream() {
    if (stream_.is_open() || file_path_.empty()) {
        return;
    }
    const auto parent = std::filesystem::path(file_path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    stream_.open(file_path_, std::ios::app);
    if (!stream_) {
        throw std::runtime_error("Failed to open log file: " + file_path_);
    }
}

const char* Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug:
            return "DEBUG";
        case LogLevel::kInfo:
            return "INFO";
        case LogLevel::kWarn:
            return "WARN";
        case LogLevel::kError:
            return "ERROR";
        default:
            return "INFO";
    }
}

void Logger::log(LogLevel level, std::string_view message) {
    if (level < min_level_) {
        return;
    }
    const std::string stamp = local_time_string(std::chrono::system_clock::now());
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_stream();
    if (stream_.is_open()) {
        stream_ << stamp << " [" << level_to_string(level) << "] " << message << '\n';
        stream_.flush();
    }
    if (echo_to_console_) {
        std::clog << stamp << " [" << level_to_string(level) << "] " << message << '\n';
    }
}

}  // namespace tinynotes::server
