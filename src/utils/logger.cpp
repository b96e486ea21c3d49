#include "logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <thread>

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::write(LogLevel p_level, const char* p_file, int p_line, const std::string& p_message) {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm_buf{};
    localtime_r(&seconds, &tm_buf);

    std::string_view file(p_file);
    auto slash = file.find_last_of('/');
    if (slash != std::string_view::npos) {
        file.remove_prefix(slash + 1);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << '.'
              << std::setfill('0') << std::setw(3) << millis << std::setfill(' ')
              << " [" << level_name(p_level) << "] "
              << "[" << std::this_thread::get_id() << "] "
              << file << ":" << p_line << " - " << p_message << '\n';
}

bool Logger::parse_level(std::string_view p_name, LogLevel& p_level) {
    std::string name(p_name);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name == "debug") {
        p_level = LogLevel::Debug;
    } else if (name == "info") {
        p_level = LogLevel::Info;
    } else if (name == "warn" || name == "warning") {
        p_level = LogLevel::Warn;
    } else if (name == "error") {
        p_level = LogLevel::Error;
    } else {
        return false;
    }
    return true;
}

const char* Logger::level_name(LogLevel p_level) {
    switch (p_level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "?";
}
