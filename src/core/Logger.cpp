/**
 * @file Logger.cpp
 * @brief Implementation of centralized logging system
 */

#include "Logger.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <sstream>

namespace brew {

std::unordered_map<std::string, LogLevel> Logger::facility_levels_;
LogLevel Logger::default_level_ = LogLevel::INFO;
std::mutex Logger::registry_mutex_;

namespace {

const char* levelTag(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::WARNING:  return "WARN";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::DETAILED: return "DETAIL";
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::TRACE:    return "TRACE";
    }
    return "?";
}

void trim(std::string& s) {
    s.erase(0, s.find_first_not_of(" \t\n\r"));
    s.erase(s.find_last_not_of(" \t\n\r") + 1);
}

} // namespace

Logger::Logger(const std::string& component_name)
    : component_name_(component_name),
      last_level_(LogLevel::INFO),
      repeat_count_(0),
      has_last_message_(false) {
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    flushDuplicatesLocked();
    std::cout.flush();
}

void Logger::outputMessage(LogLevel level, const std::string& message) const {
    std::lock_guard<std::mutex> lock(output_mutex_);

    // Single verbosity check using facility-aware effective level
    if (static_cast<int>(level) <= static_cast<int>(getEffectiveLevel())) {

        // Duplicate of the last message: count it, output the summary later
        if (has_last_message_ && message == last_message_ && level == last_level_) {
            repeat_count_++;
            return;
        }

        flushDuplicatesLocked();
        doOutput(level, message);

        last_message_ = message;
        last_level_ = level;
        repeat_count_ = 0;
        has_last_message_ = true;
    }
}

void Logger::flushDuplicatesLocked() const {
    if (has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "The previous message occurred " + std::to_string(repeat_count_ + 1) + " times.");
        repeat_count_ = 0;
    }
}

void Logger::doOutput(LogLevel level, const std::string& message) const {
    // THE ACTUAL SINGLE POINT OF OUTPUT

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    // Format timestamp as HH:MM:SS.mmm
    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);
    char timestamp[32];
    std::snprintf(timestamp, sizeof(timestamp), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms.count()));

    std::cout << "[" << timestamp << "] [" << levelTag(level) << "] [" << component_name_ << "] "
              << message << std::endl;
}

void Logger::flush() const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    flushDuplicatesLocked();
    std::cout.flush();
}

// ============================================================================
// Facility-based logging implementation
// ============================================================================

void Logger::setFacilityLevel(const std::string& facility, LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_[facility] = level;
}

void Logger::setDefaultLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    default_level_ = level;
}

LogLevel Logger::getFacilityLevel(const std::string& facility) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    auto it = facility_levels_.find(facility);
    if (it != facility_levels_.end()) {
        return it->second;
    }

    return default_level_;
}

void Logger::parseLogConfig(const std::string& config) {
    if (config.empty()) return;

    std::lock_guard<std::mutex> lock(registry_mutex_);

    std::stringstream ss(config);
    std::string token;

    while (std::getline(ss, token, ',')) {
        trim(token);
        if (token.empty()) continue;

        size_t equals_pos = token.find('=');
        if (equals_pos != std::string::npos) {
            std::string facility = token.substr(0, equals_pos);
            std::string level_str = token.substr(equals_pos + 1);
            trim(facility);
            trim(level_str);

            try {
                int level_int = std::stoi(level_str);
                LogLevel level = static_cast<LogLevel>(std::clamp(level_int, 1, 6));

                if (facility == "default") {
                    default_level_ = level;
                } else {
                    facility_levels_[facility] = level;
                }
            } catch (const std::exception&) {
                std::cerr << "Warning: Invalid log level '" << level_str << "' for facility '" << facility << "'" << std::endl;
            }
        } else {
            try {
                int level_int = std::stoi(token);
                default_level_ = static_cast<LogLevel>(std::clamp(level_int, 1, 6));
            } catch (const std::exception&) {
                std::cerr << "Warning: Invalid default log level '" << token << "'" << std::endl;
            }
        }
    }
}

void Logger::resetLevels() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_.clear();
    default_level_ = LogLevel::INFO;
}

LogLevel Logger::getEffectiveLevel() const {
    return getFacilityLevel(component_name_);
}

} // namespace brew
