#include "process_supervisor.hpp"

#include <iostream>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace sidecar {

std::string to_string(SupervisorState state) {
    switch (state) {
    case SupervisorState::Idle:
        return "idle";
    case SupervisorState::Starting:
        return "starting";
    case SupervisorState::Running:
        return "running";
    case SupervisorState::ExternallyManaged:
        return "externally-managed";
    case SupervisorState::Stopped:
        return "stopped";
    }
    return "unknown";
}

std::string to_string(StartOutcome outcome) {
    switch (outcome) {
    case StartOutcome::AlreadyRunning:
        return "already-running";
    case StartOutcome::Spawned:
        return "spawned";
    case StartOutcome::SpawnFailed:
        return "spawn-failed";
    }
    return "unknown";
}

std::shared_ptr<ProcessSupervisor> ProcessSupervisor::create(SupervisorConfig config,
                                                             PlatformProfile profile,
                                                             std::shared_ptr<DiagnosticLogger> logger,
                                                             EnvLookup env) {
    return std::shared_ptr<ProcessSupervisor>(
        new ProcessSupervisor(std::move(config), std::move(profile), std::move(logger), std::move(env)));
}

ProcessSupervisor::ProcessSupervisor(SupervisorConfig config,
                                     PlatformProfile profile,
                                     std::shared_ptr<DiagnosticLogger> logger,
                                     EnvLookup env)
    : config_(std::move(config)),
      profile_(std::move(profile)),
      logger_(std::move(logger)),
      env_(std::move(env)),
      prober_(config_.endpoint, config_.connect_timeout, config_.backoff_unit) {}

StartOutcome ProcessSupervisor::ensure_started() {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SupervisorState::Starting || state_ == SupervisorState::Running) {
            logger_->log("[ProcessSupervisor] Server already started by this supervisor");
            return StartOutcome::AlreadyRunning;
        }
        state_ = SupervisorState::Starting;
    } catch (const std::system_error& e) {
        logger_->log("[ProcessSupervisor] Failed to lock supervisor state: ", e.what());
        return StartOutcome::SpawnFailed;
    }

    auto set_state = [this](SupervisorState next) {
        try {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = next;
        } catch (const std::system_error& e) {
            logger_->log("[ProcessSupervisor] Failed to lock supervisor state: ", e.what());
        }
    };

    // 已有服务器在监听时不接管
    if (prober_.is_reachable()) {
        logger_->log("[ProcessSupervisor] Server is already running on ", config_.endpoint.to_string());
        set_state(SupervisorState::ExternallyManaged);
        return StartOutcome::AlreadyRunning;
    }

    logger_->log("[ProcessSupervisor] Starting server...");

    // 1. 查找项目目录
    ProjectLocator locator(config_.identity,
                           ProjectLocator::inputs_from_process(config_, profile_, env_),
                           logger_);
    std::optional<fs::path> project_dir = locator.locate();
    if (project_dir) {
        logger_->log("[ProcessSupervisor] Found ", config_.identity.project_name, " project at: ",
                     project_dir->string());
    } else {
        std::error_code ec;
        auto exe = current_executable_path();
        logger_->log("[ProcessSupervisor] Warning: Could not find ", config_.identity.project_name,
                     " project directory");
        logger_->log("[ProcessSupervisor] Current exe: ", exe ? exe->string() : std::string("<unknown>"));
        logger_->log("[ProcessSupervisor] Current dir: ", fs::current_path(ec).string());
        logger_->log("[ProcessSupervisor] Trying to start from current directory...");
    }

    // 2. 运行模式
    RunMode mode = resolve_run_mode(config_, env_);
    const std::string& mode_command = mode == RunMode::Development ? config_.dev_command : config_.prod_command;
    logger_->log("[ProcessSupervisor] Running in ", to_string(mode), " mode, using '", config_.command.tool,
                 " ", mode_command, "'");

    // 3. 调用方式
    CommandResolver resolver(config_.command, profile_.invocation, logger_);
    CommandInvocation invocation = resolver.resolve();

    LaunchSpec spec = build_launch_spec(invocation, mode, project_dir);
    if (spec.working_dir) {
        logger_->log("[ProcessSupervisor] Setting working directory to: ", spec.working_dir->string());
    }

    // 4. 派生
    ChildProcess child;
    try {
        child = ChildProcess::spawn(spec);
    } catch (const SpawnError& e) {
        logger_->log("[ProcessSupervisor] Failed to start server: ", e.what());
        logger_->log("[ProcessSupervisor] Make sure '", config_.command.tool,
                     "' is installed globally: ", config_.command.install_hint);
        if (project_dir) {
            logger_->log("[ProcessSupervisor] Project directory: ", project_dir->string());
        }
        set_state(SupervisorState::Idle);
        return StartOutcome::SpawnFailed;
    }

    const pid_t pid = child.pid();
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SupervisorState::Starting) {
            // 派生期间收到了 shutdown，不再保存句柄，child 析构时终止
            logger_->log("[ProcessSupervisor] Shutdown requested while starting, stopping pid ", pid);
            return StartOutcome::SpawnFailed;
        }
        process_.emplace(std::move(child));
        state_ = SupervisorState::Running;
    } catch (const std::system_error& e) {
        logger_->log("[ProcessSupervisor] Failed to lock server process handle: ", e.what());
        return StartOutcome::SpawnFailed;
    }

    logger_->log("[ProcessSupervisor] Server process started (pid ", pid, ")");
    start_readiness_wait();
    return StartOutcome::Spawned;
}

void ProcessSupervisor::start_readiness_wait() {
    auto self = shared_from_this();
    const int attempts = config_.readiness_attempts;

    // 不等待结果：线程只写日志，进程退出时可能仍在运行
    try {
        std::thread([self, attempts]() {
            if (self->prober_.wait_until_ready(attempts)) {
                self->logger_->log("[ProcessSupervisor] Server is ready on ", self->config_.endpoint.to_string());
            } else {
                self->logger_->log("[ProcessSupervisor] Warning: Server may not be ready yet (",
                                   self->config_.endpoint.to_string(), " unreachable after ", attempts,
                                   " attempts)");
            }
        }).detach();
    } catch (const std::system_error& e) {
        logger_->log("[ProcessSupervisor] Failed to start readiness wait: ", e.what());
    }
}

void ProcessSupervisor::shutdown() {
    logger_->log("[ProcessSupervisor] Shutting down server...");

    // 持锁只取出句柄，终止过程在锁外进行
    std::optional<ChildProcess> child;
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        if (process_) {
            child.emplace(std::move(*process_));
            process_.reset();
        }
        state_ = SupervisorState::Stopped;
    } catch (const std::system_error& e) {
        logger_->log("[ProcessSupervisor] Failed to lock server process handle during shutdown: ", e.what());
        return;
    }

    if (!child) {
        logger_->log("[ProcessSupervisor] No server process to shut down");
        return;
    }

    const pid_t pid = child->pid();
    std::error_code ec = child->terminate(config_.terminate_grace);
    if (ec) {
        logger_->log("[ProcessSupervisor] Failed to kill server (pid ", pid, "): ", ec.message());
    } else {
        logger_->log("[ProcessSupervisor] Server shut down successfully (pid ", pid, ")");
    }
}

SupervisorState ProcessSupervisor::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool ProcessSupervisor::has_process() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return process_.has_value();
}

std::optional<pid_t> ProcessSupervisor::child_pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (process_ && process_->valid()) {
        return process_->pid();
    }
    return std::nullopt;
}

LaunchSpec ProcessSupervisor::build_launch_spec(const CommandInvocation& invocation,
                                                RunMode mode,
                                                const std::optional<fs::path>& project_dir) const {
    LaunchSpec spec;
    spec.executable = invocation.executable;
    spec.args = invocation.prefix_args;
    spec.args.insert(spec.args.end(), config_.fixed_flags.begin(), config_.fixed_flags.end());
    spec.args.push_back(mode == RunMode::Development ? config_.dev_command : config_.prod_command);
    spec.working_dir = project_dir;
    spec.env = config_.child_env;
    spec.new_process_group = true;
    return spec;
}

// ============================================================================
// ScopedShutdown
// ============================================================================

ScopedShutdown::~ScopedShutdown() {
    if (!supervisor_) {
        return;
    }
    try {
        supervisor_->shutdown();
    } catch (const std::exception& e) {
        std::cerr << "[ProcessSupervisor] Shutdown failed while leaving scope: " << e.what() << std::endl;
    }
}

} // namespace sidecar
