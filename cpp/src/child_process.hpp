#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>
#include <sys/types.h>

namespace sidecar {

/**
 * SpawnError - 操作系统无法启动子进程（fork 失败、可执行文件不存在、chdir 失败等）
 */
class SpawnError : public std::runtime_error {
public:
    SpawnError(const std::string& what, int error_code)
        : std::runtime_error(what), error_code_(error_code) {}

    int error_code() const { return error_code_; }

private:
    int error_code_;
};

/**
 * LaunchSpec - 启动子进程所需的全部信息
 */
struct LaunchSpec {
    std::string executable;               // 通过 PATH 查找
    std::vector<std::string> args;        // 不含 argv[0]
    std::optional<std::filesystem::path> working_dir;
    std::vector<std::pair<std::string, std::string>> env; // 叠加在当前环境之上
    bool new_process_group = true;        // 终止时向整个进程组发信号
    bool silence_output = false;          // stdin/stdout/stderr 重定向到 /dev/null
};

/**
 * ChildProcess - 子进程句柄
 *
 * 负责：
 * 1. fork + execvp 派生子进程，并通过 CLOEXEC pipe 同步报告 exec 失败
 * 2. 存活检查
 * 3. SIGTERM → 等待 → SIGKILL 的终止流程
 *
 * 只能移动不能拷贝；析构时若子进程仍在运行则终止它。
 */
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;

    // 禁止拷贝
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /**
     * 派生子进程
     * @throws SpawnError 如果 fork/exec/chdir 失败
     */
    static ChildProcess spawn(const LaunchSpec& spec);

    /**
     * 试探运行：只关心操作系统能否启动该进程
     *
     * 输出被丢弃；超时后强制结束子进程。
     * @return 退出码（被信号终止时为 128 + 信号值）
     * @throws SpawnError 如果进程无法启动
     */
    static int run_trial(const LaunchSpec& spec, std::chrono::milliseconds timeout);

    /**
     * 终止子进程
     * @param grace SIGTERM 之后等待退出的时间，超时则 SIGKILL
     * @return 空 error_code 表示子进程已结束并被回收
     */
    std::error_code terminate(std::chrono::milliseconds grace);

    /**
     * 等待子进程退出
     * @return 退出码；超时返回 std::nullopt
     */
    std::optional<int> wait_for_exit(std::chrono::milliseconds timeout);

    /**
     * 检查子进程是否仍在运行（会回收已退出的子进程）
     */
    bool is_alive();

    pid_t pid() const { return pid_; }

    /**
     * 是否仍持有一个未回收的子进程
     */
    bool valid() const { return pid_ > 0; }

private:
    explicit ChildProcess(pid_t pid, bool process_group) : pid_(pid), process_group_(process_group) {}

    int send_signal(int signal) const;
    bool reap_nonblocking();

    pid_t pid_ = -1;
    bool process_group_ = false;
    std::optional<int> exit_code_;
};

} // namespace sidecar
