#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace squirrel {
namespace logging {

Level Logger::threshold_ = Level::LVL_INFO;
std::mutex Logger::mutex_;

void Logger::init(Level threshold) { set_level(threshold); }

void Logger::set_level(Level level) {
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = level;
}

Level Logger::level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return threshold_;
}

bool Logger::enabled(Level level) { return level != Level::LVL_NONE && level >= Logger::level(); }

void Logger::log(Level level, const char *file, int line, const std::string &message) {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < threshold_) {
        return;
    }

    std::cerr << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    std::cerr << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
    std::cerr << " [" << level_to_string(level) << "]";
    if (level == Level::LVL_INFO || level == Level::LVL_WARN) {
        std::cerr << " ";
    }
    std::cerr << " " << message;

    // Source location only for debug output
    if (level == Level::LVL_DEBUG && file != nullptr) {
        std::string path(file);
        auto slash = path.find_last_of('/');
        std::cerr << " (" << (slash == std::string::npos ? path : path.substr(slash + 1)) << ":" << line << ")";
    }
    std::cerr << "\n";

    if (level >= Level::LVL_ERROR) {
        std::cerr << std::flush;
    }
}

Level string_to_level(const std::string &level_str) {
    std::string s = level_str;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });

    if (s == "DEBUG") return Level::LVL_DEBUG;
    if (s == "INFO") return Level::LVL_INFO;
    if (s == "WARN") return Level::LVL_WARN;
    if (s == "ERROR") return Level::LVL_ERROR;

    return Level::LVL_INFO;
}

const char *level_to_string(Level level) {
    switch (level) {
        case Level::LVL_DEBUG:
            return "DEBUG";
        case Level::LVL_INFO:
            return "INFO";
        case Level::LVL_WARN:
            return "WARN";
        case Level::LVL_ERROR:
            return "ERROR";
        default:
            return "NONE";
    }
}

}  // namespace logging
}  // namespace squirrel
