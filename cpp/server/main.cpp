/**
 * main.cpp - 监管器宿主可执行文件入口
 *
 * 用法: sidecar_host [--port PORT] [--bridge-port PORT] [--project DIR] [--dev|--prod]
 *
 * 这个可执行文件用于：
 * 1. 启动（或复用已在运行的）伴随服务器
 * 2. 通过 Shell Bridge 接收宿主窗口事件
 * 3. 在宿主退出、收到 SIGINT/SIGTERM 时终止服务器
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "child_process.hpp"
#include "diagnostic_logger.hpp"
#include "platform_profile.hpp"
#include "process_supervisor.hpp"
#include "shell_bridge.hpp"
#include "supervisor_config.hpp"

namespace {

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int /*signal*/) {
    g_shutdown_requested = true;
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [OPTIONS]\n"
              << "\n"
              << "Options:\n"
              << "  --port PORT          Server port probed for readiness (default: 3000)\n"
              << "  --bridge-port PORT   Shell bridge gRPC port, 0 disables (default: 47310)\n"
              << "  --project DIR        Project directory (overrides ELIZA_PROJECT_PATH)\n"
              << "  --dev                Run the server in development mode\n"
              << "  --prod               Run the server in production mode\n"
              << "  --help               Show this help message\n"
              << std::endl;
}

/**
 * 解析命令行参数，覆盖配置
 * @return false 表示应当退出（--help）
 * @throws sidecar::ConfigError 如果参数无效
 */
bool apply_arguments(int argc, char** argv,
                     sidecar::SupervisorConfig& config,
                     std::map<std::string, std::string>& env_overrides) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return false;
        } else if (arg == "--port" && i + 1 < argc) {
            config.endpoint.port = sidecar::parse_port(argv[++i], "--port");
        } else if (arg == "--bridge-port" && i + 1 < argc) {
            config.bridge_port = sidecar::parse_port(argv[++i], "--bridge-port", true);
        } else if (arg == "--project" && i + 1 < argc) {
            env_overrides[config.project_path_env] = argv[++i];
        } else if (arg == "--dev") {
            config.run_mode_override = sidecar::RunMode::Development;
        } else if (arg == "--prod") {
            config.run_mode_override = sidecar::RunMode::Production;
        } else {
            throw sidecar::ConfigError("Unknown option: " + arg);
        }
    }
    return true;
}

/**
 * 启动失败时告知用户：日志 + 平台对话框（阻塞直到用户关闭）
 */
void present_fatal_error(const sidecar::PlatformProfile& profile,
                         const sidecar::DiagnosticLogger& logger,
                         const std::string& message) {
    std::string text = "Failed to start Eliza Desktop App:\n\n" + message;
    auto log_file = logger.log_file();
    if (!log_file.empty()) {
        text += "\n\nCheck the log file at:\n" + log_file.string();
    }

    auto command = sidecar::fatal_dialog_command(profile, "Eliza Desktop Error", text);
    if (command.empty()) {
        std::cerr << text << std::endl;
        return;
    }

    sidecar::LaunchSpec spec;
    spec.executable = command.front();
    spec.args.assign(command.begin() + 1, command.end());
    try {
        sidecar::ChildProcess dialog = sidecar::ChildProcess::spawn(spec);
        dialog.wait_for_exit(std::chrono::hours(24));
    } catch (const sidecar::SpawnError& e) {
        std::cerr << text << "\n(" << e.what() << ")" << std::endl;
    }
}

int run(const std::shared_ptr<sidecar::DiagnosticLogger>& logger,
        const sidecar::SupervisorConfig& config,
        const sidecar::PlatformProfile& profile,
        const sidecar::EnvLookup& env) {
    auto supervisor = sidecar::ProcessSupervisor::create(config, profile, logger, env);
    // 任何退出路径（包括 bridge.start() 抛出异常）都终止服务器
    sidecar::ScopedShutdown shutdown_guard(supervisor);

    logger->log("[main] Setup starting...");
    sidecar::StartOutcome outcome = supervisor->ensure_started();
    logger->log("[main] Server start outcome: ", sidecar::to_string(outcome));

    if (config.bridge_port == 0) {
        logger->log("[main] Shell bridge disabled, waiting for SIGINT/SIGTERM");
        while (!g_shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        supervisor->shutdown();
        return 0;
    }

    sidecar::ShellBridge bridge(supervisor, logger, config.bridge_port);
    bridge.start();
    logger->log("[main] Setup complete");

    bridge.wait_for_exit(std::chrono::milliseconds(100), &g_shutdown_requested);

    // EXIT 事件和信号都在这里关闭服务器，之后才停止 bridge
    logger->log("[main] Shutting down...");
    supervisor->shutdown();
    bridge.stop();

    logger->log("[main] Done.");
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    sidecar::PlatformProfile profile = sidecar::profile_for(sidecar::current_platform());
    sidecar::SupervisorConfig config = sidecar::SupervisorConfig::defaults();

    // 命令行中的 --project 优先于真实环境变量
    std::map<std::string, std::string> env_overrides;
    sidecar::EnvLookup env = [&env_overrides](const std::string& name) -> std::optional<std::string> {
        auto it = env_overrides.find(name);
        if (it != env_overrides.end()) {
            return it->second;
        }
        return sidecar::process_env(name);
    };

    std::shared_ptr<sidecar::DiagnosticLogger> logger;
    try {
        config.apply_environment(env);
        if (!apply_arguments(argc, argv, config, env_overrides)) {
            return 0;
        }
        if (config.console_only_errors) {
            profile.fatal_error = sidecar::FatalErrorPresentation::ConsoleOnly;
        }
    } catch (const sidecar::ConfigError& e) {
        print_usage(argv[0]);
        logger = sidecar::DiagnosticLogger::create(profile, config, env);
        logger->log("[main] Invalid configuration: ", e.what());
        present_fatal_error(profile, *logger, e.what());
        return 1;
    }

    logger = sidecar::DiagnosticLogger::create(profile, config, env);
    logger->log("[main] Starting Eliza Desktop App (", sidecar::to_string(profile.platform), ")...");

    // 顶层错误边界：任何未处理的异常都先写日志再退出
    try {
        return run(logger, config, profile, env);
    } catch (const std::exception& e) {
        logger->log("[main] Failed to start host: ", e.what());
        present_fatal_error(profile, *logger, e.what());
        return 1;
    }
}
