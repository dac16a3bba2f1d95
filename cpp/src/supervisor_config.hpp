#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "platform_profile.hpp"

namespace sidecar {

/**
 * ConfigError - 配置值无效（端口越界、数字格式错误等）
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * ProjectIdentity - 目标项目在磁盘上的约定位置与身份
 *
 * 常见布局: <home>/<workspace>/<org>/<project>/<manifest>
 */
struct ProjectIdentity {
    std::string workspace_dir = "Civ";
    std::string org_dir = "eliza";
    std::string project_name = "trading-brain";
    std::string manifest_file = "package.json";
};

/**
 * Endpoint - 就绪探测使用的回环地址
 */
struct Endpoint {
    std::string host = "127.0.0.1";
    int port = 3000;

    std::string to_string() const { return host + ":" + std::to_string(port); }
};

/**
 * ToolCommand - 被监管工具的调用方式候选
 */
struct ToolCommand {
    std::string wrapper = "bunx";
    std::vector<std::string> wrapper_args = {"--bun"};
    std::string tool = "elizaos";
    std::string version_arg = "--version";
    std::string install_hint = "bun i -g @elizaos/cli";

    // 试探调用的最长等待时间
    std::chrono::milliseconds trial_timeout{10000};
};

enum class RunMode {
    Development,
    Production,
};

std::string to_string(RunMode mode);

/**
 * SupervisorConfig - 监管器全部可调参数
 *
 * 默认值编译在代码中，可被 SIDECAR_* 环境变量和命令行参数覆盖。
 */
struct SupervisorConfig {
    // 日志
    std::string app_name = "Eliza Desktop";
    std::string log_file_name = "eliza-desktop.log";

    // 项目发现
    ProjectIdentity identity;
    std::string project_path_env = "ELIZA_PROJECT_PATH";
    std::vector<std::filesystem::path> fallback_paths;

    // 运行模式
    std::string dev_mode_env = "ELIZA_DESKTOP_DEV";
    std::optional<RunMode> run_mode_override;
    std::string dev_command = "dev";
    std::string prod_command = "start";

    // 子进程命令行与环境
    ToolCommand command;
    std::vector<std::string> fixed_flags = {"--no-emoji"};
    std::vector<std::pair<std::string, std::string>> child_env;

    // 就绪探测
    Endpoint endpoint;
    int readiness_attempts = 10;
    std::chrono::milliseconds backoff_unit{1000};
    std::chrono::milliseconds connect_timeout{2000};

    // 终止子进程时 SIGTERM 之后等待的时间，超时则 SIGKILL
    std::chrono::milliseconds terminate_grace{5000};

    // Shell Bridge（0 表示不启动）
    int bridge_port = 47310;

    // 致命错误只输出到控制台
    bool console_only_errors = false;

    /**
     * 获取默认配置（包含子进程固定环境变量与平台回退路径）
     */
    static SupervisorConfig defaults();

    /**
     * 应用 SIDECAR_* 环境变量覆盖
     * @throws ConfigError 如果值无效
     */
    void apply_environment(const EnvLookup& env);
};

/**
 * 解析端口号
 * @param allow_zero 是否允许 0（Shell Bridge 用 0 表示禁用）
 * @throws ConfigError 如果不是 [0|1, 65535] 范围内的整数
 */
int parse_port(const std::string& text, const std::string& source, bool allow_zero = false);

/**
 * 判断本次运行使用开发模式还是生产模式
 *
 * 优先级：显式覆盖 > 开发模式环境变量 > 调试构建（未定义 NDEBUG）
 */
RunMode resolve_run_mode(const SupervisorConfig& config, const EnvLookup& env);

/**
 * 当前二进制是否为调试构建
 */
bool is_debug_build();

} // namespace sidecar
