#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace sidecar {

/**
 * 环境变量读取函数
 *
 * 所有读取环境变量的地方都通过它注入，测试时可以传入一个 map 而不用修改真实进程环境。
 */
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/**
 * 读取当前进程环境变量（未设置时返回 std::nullopt）
 */
std::optional<std::string> process_env(const std::string& name);

enum class HostPlatform {
    Linux,
    MacOS,
    Windows,
};

// 日志文件所在的应用数据目录
enum class LogSinkStrategy {
    XdgDataHome,          // $XDG_DATA_HOME 或 ~/.local/share
    MacApplicationSupport, // ~/Library/Application Support
    WindowsAppData,       // %APPDATA%
};

// 是否优先通过包装工具（bunx）调用目标工具
enum class InvocationStrategy {
    PreferWrapper,
    DirectOnly,
};

// 启动失败时如何告知用户
enum class FatalErrorPresentation {
    ConsoleOnly,
    Dialog,
};

/**
 * PlatformProfile - 启动时根据平台一次性选定的能力配置
 *
 * 平台相关的分支都收敛在这里，其它模块只读取字段。
 */
struct PlatformProfile {
    HostPlatform platform = HostPlatform::Linux;
    LogSinkStrategy log_sink = LogSinkStrategy::XdgDataHome;
    InvocationStrategy invocation = InvocationStrategy::DirectOnly;
    FatalErrorPresentation fatal_error = FatalErrorPresentation::Dialog;

    // 用户主目录变量名（HOME / USERPROFILE）
    std::string home_env = "HOME";
};

/**
 * 编译期确定的当前平台
 */
HostPlatform current_platform();

/**
 * 获取指定平台的能力配置
 */
PlatformProfile profile_for(HostPlatform platform);

std::string to_string(HostPlatform platform);

/**
 * 解析每用户应用数据目录
 * @param profile 平台配置
 * @param app_name 应用显示名称（作为子目录名）
 * @param env 环境变量读取函数
 * @return 目录路径；所需环境变量缺失时返回 std::nullopt
 */
std::optional<std::filesystem::path> resolve_app_data_dir(const PlatformProfile& profile,
                                                          const std::string& app_name,
                                                          const EnvLookup& env);

/**
 * 构建阻塞式错误对话框的命令行
 * @return argv（第一个元素为可执行文件）；平台不支持对话框时为空
 */
std::vector<std::string> fatal_dialog_command(const PlatformProfile& profile,
                                              const std::string& title,
                                              const std::string& message);

} // namespace sidecar
