// src/core/logger.cpp

#include "barsim/core/logger.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iostream>
#include <stdexcept>
#include <vector>
#include "barsim/core/time_utils.hpp"

namespace barsim {

thread_local std::string Logger::current_component_;

std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARNING:
            return "WARNING";
        case LogLevel::ERR:
            return "ERROR";
        case LogLevel::FATAL:
            return "FATAL";
        default:
            return "UNKNOWN";
    }
}

LogLevel level_from_string(const std::string& level, LogLevel fallback) {
    if (level == "TRACE")
        return LogLevel::TRACE;
    if (level == "DEBUG")
        return LogLevel::DEBUG;
    if (level == "INFO")
        return LogLevel::INFO;
    if (level == "WARNING")
        return LogLevel::WARNING;
    if (level == "ERROR")
        return LogLevel::ERR;
    if (level == "FATAL")
        return LogLevel::FATAL;
    return fallback;
}

std::string log_destination_to_string(LogDestination dest) {
    switch (dest) {
        case LogDestination::CONSOLE:
            return "CONSOLE";
        case LogDestination::FILE:
            return "FILE";
        case LogDestination::BOTH:
            return "BOTH";
        default:
            return "UNKNOWN";
    }
}

LogDestination log_destination_from_string(const std::string& dest, LogDestination fallback) {
    if (dest == "CONSOLE")
        return LogDestination::CONSOLE;
    if (dest == "FILE")
        return LogDestination::FILE;
    if (dest == "BOTH")
        return LogDestination::BOTH;
    return fallback;
}

nlohmann::json LoggerConfig::to_json() const {
    nlohmann::json j;
    j["min_level"] = level_to_string(min_level);
    j["destination"] = log_destination_to_string(destination);
    j["log_directory"] = log_directory;
    j["filename_prefix"] = filename_prefix;
    j["include_timestamp"] = include_timestamp;
    j["include_level"] = include_level;
    j["max_file_size"] = max_file_size;
    j["max_files"] = max_files;
    j["version"] = version;
    return j;
}

void LoggerConfig::from_json(const nlohmann::json& j) {
    if (j.contains("min_level"))
        min_level = level_from_string(j.at("min_level").get<std::string>(), min_level);
    if (j.contains("destination"))
        destination =
            log_destination_from_string(j.at("destination").get<std::string>(), destination);
    if (j.contains("log_directory"))
        log_directory = j.at("log_directory").get<std::string>();
    if (j.contains("filename_prefix"))
        filename_prefix = j.at("filename_prefix").get<std::string>();
    if (j.contains("include_timestamp"))
        include_timestamp = j.at("include_timestamp").get<bool>();
    if (j.contains("include_level"))
        include_level = j.at("include_level").get<bool>();
    if (j.contains("max_file_size"))
        max_file_size = j.at("max_file_size").get<size_t>();
    if (j.contains("max_files"))
        max_files = j.at("max_files").get<size_t>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::reset_for_tests() {
    Logger& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.initialized_.store(false, std::memory_order_release);
    if (logger.log_file_.is_open()) {
        logger.log_file_.close();
    }
    logger.config_ = LoggerConfig();
    logger.session_timestamp_.clear();
    logger.part_number_ = 1;
}

void Logger::initialize(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;

    if (log_file_.is_open()) {
        log_file_.close();
    }

    if (config_.destination == LogDestination::FILE ||
        config_.destination == LogDestination::BOTH) {
        session_timestamp_ = core::get_formatted_time("%Y%m%d_%H%M%S");
        part_number_ = 1;
        open_log_file();
    }

    initialized_.store(true, std::memory_order_release);
}

void Logger::open_log_file() {
    std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);

    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create log directory: " + log_dir.string() + " - " +
                                 ec.message());
    }

    enforce_retention(log_dir);

    // prefix_YYYYMMDD_HHMMSS_partN.log
    std::filesystem::path log_path =
        log_dir / (config_.filename_prefix + "_" + session_timestamp_ + "_part" +
                   std::to_string(part_number_) + ".log");

    log_file_.open(log_path, std::ios::app);
    if (!log_file_.is_open()) {
        throw std::runtime_error("Failed to open log file: " + log_path.string());
    }
}

void Logger::enforce_retention(const std::filesystem::path& log_dir) const {
    std::vector<std::filesystem::path> log_files;
    for (const auto& entry : std::filesystem::directory_iterator(log_dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".log" &&
            entry.path().filename().string().rfind(config_.filename_prefix, 0) == 0) {
            log_files.push_back(entry.path());
        }
    }

    std::sort(log_files.begin(), log_files.end(), [](const auto& a, const auto& b) {
        return std::filesystem::last_write_time(a) < std::filesystem::last_write_time(b);
    });

    // Leave room for the file about to be opened
    while (!log_files.empty() && log_files.size() >= config_.max_files) {
        std::error_code ec;
        std::filesystem::remove(log_files.front(), ec);
        log_files.erase(log_files.begin());
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!initialized_.load(std::memory_order_acquire)) {
        std::cerr << "WARNING: Logger not initialized. Message: " << message << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (level < config_.min_level) {
        return;
    }

    std::string formatted = format_message(level, message);

    if (config_.destination == LogDestination::CONSOLE ||
        config_.destination == LogDestination::BOTH) {
        write_to_console(formatted);
    }

    if (config_.destination == LogDestination::FILE ||
        config_.destination == LogDestination::BOTH) {
        write_to_file(formatted);
    }
}

std::string Logger::format_message(LogLevel level, const std::string& message) const {
    std::ostringstream ss;

    if (config_.include_timestamp) {
        ss << core::get_formatted_time("%Y-%m-%d %H:%M:%S") << " ";
    }

    if (config_.include_level) {
        ss << "[" << level_to_string(level) << "] ";
    }

    if (!current_component_.empty()) {
        ss << "[" << current_component_ << "] ";
    }

    ss << message;
    return ss.str();
}

void Logger::write_to_console(const std::string& message) {
    std::cout << message << std::endl;
}

void Logger::write_to_file(const std::string& message) {
    if (!log_file_.is_open()) {
        return;
    }

    log_file_ << message << std::endl;

    if (log_file_.tellp() >= static_cast<std::streampos>(config_.max_file_size)) {
        rotate_log_files();
    }
}

void Logger::rotate_log_files() {
    log_file_.close();
    ++part_number_;
    try {
        open_log_file();
    } catch (const std::runtime_error& e) {
        std::cerr << "WARNING: Log rotation failed, file output disabled: " << e.what()
                  << std::endl;
    }
}

}  // namespace barsim
