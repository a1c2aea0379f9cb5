// include/barsim/core/logger.hpp
#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "barsim/core/config_base.hpp"

namespace barsim {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Per-step detail
    DEBUG,    // Ledger transitions, indicator registration
    INFO,     // Run lifecycle
    WARNING,  // Suspicious but recoverable input
    ERR,      // Failed run
    FATAL     // Unusable process state
};

/**
 * @brief Log destination type
 */
enum class LogDestination {
    CONSOLE,  // Standard output
    FILE,     // File output
    BOTH      // Both console and file
};

std::string level_to_string(LogLevel level);
LogLevel level_from_string(const std::string& level, LogLevel fallback = LogLevel::INFO);
std::string log_destination_to_string(LogDestination dest);
LogDestination log_destination_from_string(const std::string& dest,
                                           LogDestination fallback = LogDestination::CONSOLE);

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"barsim"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{10 * 1024 * 1024};  // rotate after 10MB
    size_t max_files{5};                     // files kept in log_directory

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Process-wide, mutex-guarded logger
 *
 * Messages below the configured level are dropped before formatting.
 * File output rotates to a new part once max_file_size is reached and the
 * oldest files beyond max_files are removed.
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Initialize the logger with configuration
     * @param config Logger configuration
     * @throws std::runtime_error if the log directory or file cannot be opened
     */
    void initialize(const LoggerConfig& config);

    /**
     * @brief Reset the logger for testing
     */
    static void reset_for_tests();

    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
    }

    LogLevel get_min_level() const {
        return config_.min_level;
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Tag subsequent messages from this thread with a component name
     */
    static void register_component(const std::string& component) {
        current_component_ = component;
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    // All private helpers assume mutex_ is held
    void open_log_file();
    void enforce_retention(const std::filesystem::path& log_dir) const;
    void rotate_log_files();
    void write_to_file(const std::string& message);
    void write_to_console(const std::string& message);
    std::string format_message(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::atomic<bool> initialized_{false};
    static thread_local std::string current_component_;

    std::string session_timestamp_;  // YYYYMMDD_HHMMSS
    int part_number_{1};
};

/**
 * @brief Convenience macro for logging
 * Usage: LOG(LogLevel::INFO, "Message: " << variable)
 */
#define LOG(level, message)                                                \
    do {                                                                   \
        if (level >= ::barsim::Logger::instance().get_min_level()) {       \
            std::ostringstream os;                                         \
            os << message;                                                 \
            ::barsim::Logger::instance().log(level, os.str());             \
        }                                                                  \
    } while (0)

#define TRACE(message) LOG(::barsim::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::barsim::LogLevel::DEBUG, message)
#define INFO(message) LOG(::barsim::LogLevel::INFO, message)
#define WARN(message) LOG(::barsim::LogLevel::WARNING, message)
#define ERROR(message) LOG(::barsim::LogLevel::ERR, message)
#define FATAL(message) LOG(::barsim::LogLevel::FATAL, message)
}  // namespace barsim
