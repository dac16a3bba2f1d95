#pragma once

#include <ctime>
#include <filesystem>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include "platform_profile.hpp"

namespace sidecar {

struct SupervisorConfig;

/**
 * LogSink - 日志输出目标
 *
 * write() 不得抛出异常：日志失败绝不能中断启动流程。
 */
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(std::time_t timestamp, const std::string& message) noexcept = 0;
};

/**
 * FileLogSink - 追加写入 "[<unix时间戳>] <消息>" 到日志文件
 *
 * 每次写入时打开文件并按需创建父目录；任何文件错误都被忽略。
 */
class FileLogSink final : public LogSink {
public:
    explicit FileLogSink(std::filesystem::path path);

    void write(std::time_t timestamp, const std::string& message) noexcept override;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * ConsoleLogSink - 原样输出到 stderr
 */
class ConsoleLogSink final : public LogSink {
public:
    void write(std::time_t timestamp, const std::string& message) noexcept override;
};

/**
 * DiagnosticLogger - 诊断日志
 *
 * 线程安全：就绪等待线程和主控制线程可以同时记录。
 */
class DiagnosticLogger {
public:
    DiagnosticLogger() = default;

    DiagnosticLogger(const DiagnosticLogger&) = delete;
    DiagnosticLogger& operator=(const DiagnosticLogger&) = delete;

    /**
     * 按平台配置创建标准日志器（日志文件 + stderr）
     *
     * 无法确定应用数据目录时只输出到 stderr。
     */
    static std::shared_ptr<DiagnosticLogger> create(const PlatformProfile& profile,
                                                    const SupervisorConfig& config,
                                                    const EnvLookup& env);

    void add_sink(std::shared_ptr<LogSink> sink);

    /**
     * 记录一条消息到所有输出目标
     */
    void record(const std::string& message);

    /**
     * 将任意可输出的值拼接为一条消息
     *
     * 用法: logger.log("[ProjectLocator] Checking ", path);
     */
    template <typename... Args>
    void log(Args&&... args) {
        std::ostringstream ss;
        (ss << ... << std::forward<Args>(args));
        record(ss.str());
    }

    /**
     * 日志文件路径（仅输出到控制台时为空）
     */
    std::filesystem::path log_file() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
    std::filesystem::path log_file_;
};

} // namespace sidecar
