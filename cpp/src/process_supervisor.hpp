#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>

#include "child_process.hpp"
#include "command_resolver.hpp"
#include "diagnostic_logger.hpp"
#include "platform_profile.hpp"
#include "project_locator.hpp"
#include "readiness_prober.hpp"
#include "supervisor_config.hpp"

namespace sidecar {

enum class SupervisorState {
    Idle,              // 没有子进程
    Starting,          // 正在派生
    Running,           // 持有子进程句柄，就绪检查在后台进行
    ExternallyManaged, // 启动时服务器已在监听，不接管
    Stopped,           // 已终止
};

std::string to_string(SupervisorState state);

enum class StartOutcome {
    AlreadyRunning,
    Spawned,
    SpawnFailed,
};

std::string to_string(StartOutcome outcome);

/**
 * ProcessSupervisor - 伴随服务器进程管理器
 *
 * 负责：
 * 1. 启动前探测服务器是否已在运行
 * 2. 查找项目目录、选择调用方式、派生服务器子进程
 * 3. 后台等待服务器就绪（只记录日志）
 * 4. 宿主退出时终止子进程
 *
 * 必须通过 create() 以 shared_ptr 持有：后台就绪线程共享所有权。
 * 所有公开方法都是线程安全的。
 */
class ProcessSupervisor : public std::enable_shared_from_this<ProcessSupervisor> {
public:
    static std::shared_ptr<ProcessSupervisor> create(SupervisorConfig config,
                                                     PlatformProfile profile,
                                                     std::shared_ptr<DiagnosticLogger> logger,
                                                     EnvLookup env = process_env);

    // 禁止拷贝
    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    /**
     * 确保服务器在运行
     *
     * 服务器已可达时不派生；派生失败只记录日志，不抛出异常。
     */
    StartOutcome ensure_started();

    /**
     * 终止子进程并清空句柄
     *
     * 可重复调用：没有子进程时什么也不做。
     */
    void shutdown();

    SupervisorState state() const;
    bool has_process() const;

    /**
     * 子进程 PID（没有子进程时为 std::nullopt）
     */
    std::optional<pid_t> child_pid() const;

    bool is_server_reachable() const { return prober_.is_reachable(); }

    const Endpoint& endpoint() const { return config_.endpoint; }
    const SupervisorConfig& config() const { return config_; }

    /**
     * 组装子进程启动参数
     */
    LaunchSpec build_launch_spec(const CommandInvocation& invocation,
                                 RunMode mode,
                                 const std::optional<std::filesystem::path>& project_dir) const;

private:
    ProcessSupervisor(SupervisorConfig config,
                      PlatformProfile profile,
                      std::shared_ptr<DiagnosticLogger> logger,
                      EnvLookup env);

    void start_readiness_wait();

    SupervisorConfig config_;
    PlatformProfile profile_;
    std::shared_ptr<DiagnosticLogger> logger_;
    EnvLookup env_;
    ReadinessProber prober_;

    mutable std::mutex mutex_;
    std::optional<ChildProcess> process_;
    SupervisorState state_ = SupervisorState::Idle;
};

/**
 * ScopedShutdown - 离开作用域时（包括异常展开）关闭监管器
 *
 * 后台就绪线程共享监管器的所有权，释放调用方的 shared_ptr 不会终止子进程。
 */
class ScopedShutdown {
public:
    explicit ScopedShutdown(std::shared_ptr<ProcessSupervisor> supervisor)
        : supervisor_(std::move(supervisor)) {}

    ~ScopedShutdown();

    // 禁止拷贝
    ScopedShutdown(const ScopedShutdown&) = delete;
    ScopedShutdown& operator=(const ScopedShutdown&) = delete;

private:
    std::shared_ptr<ProcessSupervisor> supervisor_;
};

} // namespace sidecar
