/**
 * @file Logger.cpp
 * @brief Implementation of the component logger
 */

#include "Logger.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <sstream>

namespace osmprint {

std::unordered_map<std::string, LogLevel> Logger::facility_levels_;
LogLevel Logger::default_level_ = LogLevel::INFO;
std::shared_ptr<std::ofstream> Logger::log_file_;
std::mutex Logger::registry_mutex_;

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    const auto last = text.find_last_not_of(" \t\n\r");
    return text.substr(first, last - first + 1);
}

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARNING: return "WARN ";
        case LogLevel::INFO: return "INFO ";
        case LogLevel::DETAILED: return "DETL ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "?    ";
}

// "HH:MM:SS.mmm" local time
std::string timestamp_now() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d:%02d.%03d",
                  local.tm_hour, local.tm_min, local.tm_sec, static_cast<int>(millis.count()));
    return buffer;
}

} // namespace

Logger::Logger(const std::string& component_name) : component_name_(component_name) {}

Logger::~Logger() {
    flush();
}

void Logger::outputMessage(LogLevel level, const std::string& message) const {
    if (!shouldOutput(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(output_mutex_);
    if (!last_message_.empty() && message == last_message_ && level == last_level_) {
        ++repeat_count_;
        return;
    }

    emitRepeatSummary();
    write(level, message);
    last_message_ = message;
    last_level_ = level;
}

void Logger::emitRepeatSummary() const {
    if (repeat_count_ > 0) {
        write(last_level_, "The previous message occurred " + std::to_string(repeat_count_ + 1) + " times.");
        repeat_count_ = 0;
    }
}

void Logger::write(LogLevel level, const std::string& message) const {
    std::ostringstream line;
    line << "[" << timestamp_now() << "] " << level_tag(level) << " " << component_name_ << ": " << message;

    std::cout << line.str() << std::endl;

    std::lock_guard<std::mutex> lock(registry_mutex_);
    if (log_file_ && log_file_->is_open()) {
        *log_file_ << line.str() << std::endl;
    }
}

void Logger::flush() const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    emitRepeatSummary();
    std::cout.flush();

    std::lock_guard<std::mutex> registry_lock(registry_mutex_);
    if (log_file_ && log_file_->is_open()) {
        log_file_->flush();
    }
}

LogLevel Logger::getEffectiveLevel() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    auto it = facility_levels_.find(component_name_);
    if (it != facility_levels_.end()) {
        return it->second;
    }
    if (instance_level_ != LogLevel::WARNING) {
        return instance_level_;
    }
    return default_level_;
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
    return it != facility_levels_.end() ? it->second : default_level_;
}

void Logger::clearFacilityLevels() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_.clear();
}

void Logger::parseLogConfig(const std::string& config) {
    std::stringstream ss(config);
    std::string token;
    while (std::getline(ss, token, ',')) {
        token = trim(token);
        if (token.empty()) continue;

        std::string facility;
        std::string level_str = token;
        const size_t equals_pos = token.find('=');
        if (equals_pos != std::string::npos) {
            facility = trim(token.substr(0, equals_pos));
            level_str = trim(token.substr(equals_pos + 1));
        }

        int level_int = 0;
        try {
            level_int = std::stoi(level_str);
        } catch (const std::exception&) {
            std::cerr << "Warning: Invalid log level '" << level_str << "'"
                      << (facility.empty() ? "" : " for facility '" + facility + "'") << std::endl;
            continue;
        }

        const LogLevel level = static_cast<LogLevel>(std::clamp(level_int, 1, 6));
        if (facility.empty() || facility == "default") {
            setDefaultLevel(level);
        } else {
            setFacilityLevel(facility, level);
        }
    }
}

void Logger::configureFromEnvironment() {
    if (const char* level = std::getenv("OSMPRINT_LOG_LEVEL")) {
        parseLogConfig(level);
    }
    if (const char* file = std::getenv("OSMPRINT_LOG_FILE")) {
        if (!setGlobalLogFile(std::string(file))) {
            std::cerr << "Warning: Failed to open log file from OSMPRINT_LOG_FILE: " << file << std::endl;
        }
    }
}

bool Logger::setGlobalLogFile(const std::optional<std::string>& log_file) {
    std::shared_ptr<std::ofstream> stream;
    if (log_file) {
        std::error_code ec;
        const std::filesystem::path log_path(*log_file);
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path(), ec);
        }
        stream = std::make_shared<std::ofstream>(*log_file, std::ios::app);
        if (!stream->is_open()) {
            return false;
        }
    }

    std::lock_guard<std::mutex> lock(registry_mutex_);
    log_file_ = std::move(stream);
    return true;
}

} // namespace osmprint
