#include "diagnostic_logger.hpp"
#include "supervisor_config.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace sidecar {

// ============================================================================
// Sinks
// ============================================================================

FileLogSink::FileLogSink(fs::path path) : path_(std::move(path)) {}

void FileLogSink::write(std::time_t timestamp, const std::string& message) noexcept {
    try {
        std::error_code ec;
        if (path_.has_parent_path()) {
            fs::create_directories(path_.parent_path(), ec);
        }

        std::ofstream file(path_, std::ios::app);
        if (!file) {
            return;
        }
        file << "[" << timestamp << "] " << message << "\n";
    } catch (const std::exception&) {
        // 日志写入失败不影响调用方
    }
}

void ConsoleLogSink::write(std::time_t /*timestamp*/, const std::string& message) noexcept {
    try {
        std::cerr << message << std::endl;
    } catch (const std::exception&) {
    }
}

// ============================================================================
// DiagnosticLogger
// ============================================================================

std::shared_ptr<DiagnosticLogger> DiagnosticLogger::create(const PlatformProfile& profile,
                                                           const SupervisorConfig& config,
                                                           const EnvLookup& env) {
    auto logger = std::make_shared<DiagnosticLogger>();

    auto dir = resolve_app_data_dir(profile, config.app_name, env);
    if (dir) {
        auto file_sink = std::make_shared<FileLogSink>(*dir / config.log_file_name);
        logger->log_file_ = file_sink->path();
        logger->add_sink(std::move(file_sink));
    }
    logger->add_sink(std::make_shared<ConsoleLogSink>());

    if (!dir) {
        logger->record("[DiagnosticLogger] No application data directory for " +
                       to_string(profile.platform) + ", logging to console only");
    }
    return logger;
}

void DiagnosticLogger::add_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void DiagnosticLogger::record(const std::string& message) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t timestamp = std::chrono::system_clock::to_time_t(now);

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->write(timestamp, message);
    }
}

fs::path DiagnosticLogger::log_file() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_file_;
}

} // namespace sidecar
