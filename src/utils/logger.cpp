// ============================================================================
// MERIDIAN - Logger Implementation
// ============================================================================

#include "meridian/utils/logger.hpp"

#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <filesystem>
#include <iostream>
#include <vector>

namespace meridian::utils {

namespace {

constexpr const char* kLoggerName = "meridian";

spdlog::level::level_enum to_spdlog(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off: return spdlog::level::off;
    }
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> make_console_fallback() {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, std::move(sink));
    logger->set_pattern("[%H:%M:%S.%e] [%l] %v");
    logger->set_level(spdlog::level::trace);
    return logger;
}

}  // namespace

struct Logger::Impl {
    std::shared_ptr<spdlog::logger> logger = make_console_fallback();
    bool async = false;
};

Logger::Logger() : impl_(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

LogLevel parse_log_level(std::string_view name) noexcept {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return LogLevel::Info;
}

void Logger::initialize(const LogConfig& config) {
    auto& self = instance();

    std::vector<spdlog::sink_ptr> sinks;
    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (!config.log_file.empty()) {
        try {
            const auto parent = std::filesystem::path(config.log_file).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.log_file, config.max_file_size_mb * 1024 * 1024, config.max_files));
        } catch (const std::exception& e) {
            std::cerr << "[LOGGER] File sink disabled (" << config.log_file << "): "
                      << e.what() << "\n";
        }
    }

    std::shared_ptr<spdlog::logger> logger;
    if (config.async) {
        spdlog::init_thread_pool(config.queue_size, 1);
        logger = std::make_shared<spdlog::async_logger>(
            kLoggerName, sinks.begin(), sinks.end(), spdlog::thread_pool(),
            spdlog::async_overflow_policy::block);
    } else {
        logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    }

    logger->set_pattern(config.pattern);
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::warn);

    // flush_every only reaches registered loggers
    spdlog::drop(kLoggerName);
    spdlog::register_logger(logger);

    self.impl_->logger = std::move(logger);
    self.impl_->async = config.async;
    self.set_level(config.level);

    spdlog::flush_every(std::chrono::milliseconds(config.flush_interval_ms));
}

void Logger::shutdown() {
    auto& self = instance();
    self.flush();
    self.impl_->logger = make_console_fallback();
    self.impl_->async = false;
    spdlog::shutdown();
}

void Logger::set_level(LogLevel level) {
    level_.store(static_cast<int>(level), std::memory_order_relaxed);
}

void Logger::flush() {
    impl_->logger->flush();
}

void Logger::write(LogLevel level, std::string_view message) {
    impl_->logger->log(to_spdlog(level), message);
}

void ScopedTimer::log_duration(int64_t microseconds) const {
    Logger::instance().log(level_, "{} took {} us", name_, microseconds);
}

}  // namespace meridian::utils
