#pragma once
// ============================================================================
// MERIDIAN - Logger
// ============================================================================
// Thin facade over spdlog. Formatting happens only when the level is enabled
// Console + rotating file sinks, optional async queue
// ============================================================================

#include <fmt/format.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace meridian::utils {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/// Parse "debug", "INFO", "warning"... Unknown names map to Info
[[nodiscard]] LogLevel parse_log_level(std::string_view name) noexcept;

// ============================================================================
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string log_file = "logs/meridian.log";  // Empty disables the file sink
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";
    bool console = true;

    // Performance settings
    bool async = false;
    size_t queue_size = 8192;       // Async queue size
    size_t flush_interval_ms = 1000;

    // File settings
    size_t max_file_size_mb = 100;
    size_t max_files = 10;
};

// ============================================================================
// Logger Interface
// ============================================================================

class Logger {
public:
    /// Initialize the global logger. Call before starting worker threads
    static void initialize(const LogConfig& config = LogConfig{});

    /// Shutdown the logger (flush and close)
    static void shutdown();

    /// Get the global logger instance (console fallback until initialized)
    static Logger& instance();

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel level() const noexcept {
        return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
    }
    [[nodiscard]] bool should_log(LogLevel level) const noexcept {
        return level >= this->level() && level != LogLevel::Off;
    }

    template <typename... Args>
    void log(LogLevel level, std::string_view fmt, Args&&... args) {
        if (!should_log(level)) return;
        if constexpr (sizeof...(Args) == 0) {
            write(level, fmt);
        } else {
            try {
                write(level, fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...));
            } catch (const fmt::format_error& e) {
                write(LogLevel::Error, std::string("bad log format '") + std::string(fmt) +
                                           "': " + e.what());
            }
        }
    }

    template <typename... Args>
    void trace(std::string_view fmt, Args&&... args) {
        log(LogLevel::Trace, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(std::string_view fmt, Args&&... args) {
        log(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(std::string_view fmt, Args&&... args) {
        log(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(std::string_view fmt, Args&&... args) {
        log(LogLevel::Warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(std::string_view fmt, Args&&... args) {
        log(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void critical(std::string_view fmt, Args&&... args) {
        log(LogLevel::Critical, fmt, std::forward<Args>(args)...);
    }

    /// Flush all pending logs
    void flush();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger();
    ~Logger();

    void write(LogLevel level, std::string_view message);

    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::atomic<int> level_{static_cast<int>(LogLevel::Info)};
};

// ============================================================================
// Convenience Macros
// ============================================================================

#define LOG_TRACE(...) ::meridian::utils::Logger::instance().trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::meridian::utils::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...) ::meridian::utils::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...) ::meridian::utils::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...) ::meridian::utils::Logger::instance().error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::meridian::utils::Logger::instance().critical(__VA_ARGS__)

// ============================================================================
// Scoped Timer for Performance Measurement
// ============================================================================

class ScopedTimer {
public:
    explicit ScopedTimer(std::string_view name, LogLevel level = LogLevel::Debug)
        : name_(name), level_(level), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        const auto end = std::chrono::steady_clock::now();
        const auto duration =
            std::chrono::duration_cast<std::chrono::microseconds>(end - start_).count();
        log_duration(duration);
    }

    // Non-copyable
    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    void log_duration(int64_t microseconds) const;

    std::string_view name_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_;
};

#define MERIDIAN_CONCAT_INNER(a, b) a##b
#define MERIDIAN_CONCAT(a, b) MERIDIAN_CONCAT_INNER(a, b)
#define SCOPED_TIMER(name) \
    ::meridian::utils::ScopedTimer MERIDIAN_CONCAT(scoped_timer_, __LINE__)(name)

}  // namespace meridian::utils
