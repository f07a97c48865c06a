/**
 * @file Logger.hpp
 * @brief Centralized logging system with verbosity control
 *
 * Provides a single point of logging control for the map runtime and the
 * controller. Implements exactly one outputMessage() method with one
 * verbosity check and one std::cout call.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <iostream>
#include <string>
#include <mutex>
#include <unordered_map>

namespace brew {

/**
 * @brief Log levels
 *
 * Level 1: Errors (disrupts execution)
 * Level 2: Warnings (disables functionality)
 * Level 3: Information (high-level)
 * Level 4: Detailed information (codepath execution)
 * Level 5: Basic debugging (objects, methods)
 * Level 6: Detailed debugging (variable values)
 */
enum class LogLevel {
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DETAILED = 4,
    DEBUG = 5,
    TRACE = 6
};

/**
 * @brief Centralized logger with single point of output control
 *
 * Each instance is bound to a facility (component) name. The effective
 * level of an instance is the facility-specific level if one was configured,
 * otherwise the global default level.
 */
class Logger {
public:
    /**
     * @brief Constructor with facility name
     * @param component_name Facility used for level lookup and message prefix
     */
    explicit Logger(const std::string& component_name);

    /**
     * @brief Destructor - flushes pending duplicate summary
     */
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Output a message if it meets the current verbosity level
     *
     * THIS IS THE SINGLE POINT OF LOGGING CONTROL
     *
     * @param level Level of this message
     * @param message Message to output
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    /**
     * @brief Check if a message level would be output
     * @param level Level to check
     * @return true if message would be output
     */
    bool shouldOutput(LogLevel level) const {
        return static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
    }

    void error(const std::string& message) const {
        outputMessage(LogLevel::ERROR, message);
    }

    void warning(const std::string& message) const {
        outputMessage(LogLevel::WARNING, message);
    }

    void info(const std::string& message) const {
        outputMessage(LogLevel::INFO, message);
    }

    void detailed(const std::string& message) const {
        outputMessage(LogLevel::DETAILED, message);
    }

    void debug(const std::string& message) const {
        outputMessage(LogLevel::DEBUG, message);
    }

    void trace(const std::string& message) const {
        outputMessage(LogLevel::TRACE, message);
        flush();  // Flush after highest debug level messages
    }

    /**
     * @brief Flush console output, emitting any pending duplicate summary
     */
    void flush() const;

    const std::string& component() const { return component_name_; }

    // ========================================================================
    // Facility-based logging control
    // ========================================================================

    /**
     * @brief Set log level for a specific facility (component)
     *
     * @example
     * Logger::setFacilityLevel("FeatureLayer", LogLevel::TRACE);
     */
    static void setFacilityLevel(const std::string& facility, LogLevel level);

    /**
     * @brief Set default log level for all facilities without a specific level
     */
    static void setDefaultLevel(LogLevel level);

    /**
     * @brief Get log level for a specific facility (falls back to default)
     */
    static LogLevel getFacilityLevel(const std::string& facility);

    /**
     * @brief Parse and apply log configuration from string
     *
     * Supports:
     * - Simple level: "5" sets default to DEBUG
     * - Facility-specific: "FeatureLayer=6,Controller=3"
     * - Mixed: "4,FeatureLayer=6"
     * - Explicit default: "default=2"
     *
     * Levels outside 1..6 are clamped; unparsable entries are skipped with a
     * warning on stderr.
     */
    static void parseLogConfig(const std::string& config);

    /**
     * @brief Clear all facility-specific levels and restore default INFO
     */
    static void resetLevels();

    /**
     * @brief Effective level: facility-specific if set, else global default
     */
    LogLevel getEffectiveLevel() const;

private:
    std::string component_name_;
    mutable std::mutex output_mutex_;

    // Message deduplication state
    mutable std::string last_message_;
    mutable LogLevel last_level_;
    mutable int repeat_count_;
    mutable bool has_last_message_;

    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::mutex registry_mutex_;

    void doOutput(LogLevel level, const std::string& message) const;
    void flushDuplicatesLocked() const;
};

} // namespace brew
