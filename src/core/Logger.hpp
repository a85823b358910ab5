/**
 * @file Logger.hpp
 * @brief Component logger with facility-based verbosity control
 *
 * Every pipeline component owns a Logger named after itself. All output goes
 * through outputMessage(), which holds the single verbosity check and the
 * single console write; the optional global log file mirrors that write.
 */

#pragma once

#include <iostream>
#include <fstream>
#include <memory>
#include <string>
#include <optional>
#include <mutex>
#include <unordered_map>

namespace osmprint {

/**
 * @brief Log levels
 *
 * Level 1: Errors (run cannot continue)
 * Level 2: Warnings (a feature or output was dropped)
 * Level 3: Information (pipeline stages)
 * Level 4: Detailed information (codepath execution)
 * Level 5: Basic debugging (objects, counts)
 * Level 6: Detailed debugging (coordinates, values)
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
 * @brief Per-component logger
 */
class Logger {
public:
    /**
     * @param component_name Facility used to look up per-component levels
     */
    explicit Logger(const std::string& component_name);

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Output a message if it passes the effective verbosity level
     *
     * Consecutive identical messages are collapsed into one line plus a
     * repeat count.
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    /// Pin this instance to a level; WARNING restores the global default
    void setLogLevel(LogLevel level) { instance_level_ = level; }

    bool shouldOutput(LogLevel level) const {
        return static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
    }

    void error(const std::string& message) const { outputMessage(LogLevel::ERROR, message); }
    void warning(const std::string& message) const { outputMessage(LogLevel::WARNING, message); }
    void info(const std::string& message) const { outputMessage(LogLevel::INFO, message); }
    void detailed(const std::string& message) const { outputMessage(LogLevel::DETAILED, message); }
    void debug(const std::string& message) const { outputMessage(LogLevel::DEBUG, message); }

    void trace(const std::string& message) const {
        outputMessage(LogLevel::TRACE, message);
        flush();
    }

    /**
     * @brief Emit any pending repeat summary and flush console and file
     */
    void flush() const;

    /**
     * @brief Effective level: facility override, then instance level, then default
     */
    LogLevel getEffectiveLevel() const;

    // ========================================================================
    // Facility-based logging control
    // ========================================================================

    static void setFacilityLevel(const std::string& facility, LogLevel level);
    static void setDefaultLevel(LogLevel level);
    static LogLevel getFacilityLevel(const std::string& facility);
    static void clearFacilityLevels();

    /**
     * @brief Parse and apply a log configuration string
     *
     * Formats:
     * - "5" sets the default level to DEBUG
     * - "ModelBuilder=6,BoundaryClipper=4" sets facility levels
     * - "3,ThreeMFExporter=6" mixes both; "default=4" is also accepted
     *
     * Invalid tokens are reported on stderr and ignored.
     */
    static void parseLogConfig(const std::string& config);

    /**
     * @brief Apply OSMPRINT_LOG_LEVEL and OSMPRINT_LOG_FILE if set
     */
    static void configureFromEnvironment();

    /**
     * @brief Mirror every logger's output into a shared file (append mode)
     * @param log_file Path, or nullopt to stop mirroring
     * @return false if the file could not be opened
     */
    static bool setGlobalLogFile(const std::optional<std::string>& log_file);

private:
    std::string component_name_;
    LogLevel instance_level_ = LogLevel::WARNING;
    mutable std::mutex output_mutex_;

    mutable std::string last_message_;
    mutable LogLevel last_level_ = LogLevel::INFO;
    mutable int repeat_count_ = 0;

    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::shared_ptr<std::ofstream> log_file_;
    static std::mutex registry_mutex_;

    void emitRepeatSummary() const;
    void write(LogLevel level, const std::string& message) const;
};

} // namespace osmprint
