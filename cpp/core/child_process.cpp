#include "child_process.hpp"

#include <cerrno>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace sidecar {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(100);
constexpr auto kDestructorGrace = std::chrono::milliseconds(5000);

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

std::string describe(const LaunchSpec& spec) {
    std::string text = spec.executable;
    for (const auto& arg : spec.args) {
        text += " " + arg;
    }
    return text;
}

// 当前环境 + 覆盖项，覆盖项优先
std::vector<std::string> build_environment(const std::vector<std::pair<std::string, std::string>>& overrides) {
    std::vector<std::string> entries;
    for (char** it = environ; it != nullptr && *it != nullptr; ++it) {
        std::string entry(*it);
        std::string key = entry.substr(0, entry.find('='));
        bool overridden = false;
        for (const auto& [name, _] : overrides) {
            if (name == key) {
                overridden = true;
                break;
            }
        }
        if (!overridden) {
            entries.push_back(std::move(entry));
        }
    }
    for (const auto& [name, value] : overrides) {
        entries.push_back(name + "=" + value);
    }
    return entries;
}

} // anonymous namespace

ChildProcess::~ChildProcess() {
    if (valid()) {
        // 析构中无法上报错误，终止失败时子进程由操作系统在父进程退出后收养
        (void)terminate(kDestructorGrace);
    }
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(other.pid_), process_group_(other.process_group_), exit_code_(other.exit_code_) {
    other.pid_ = -1;
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        if (valid()) {
            (void)terminate(kDestructorGrace);
        }
        pid_ = other.pid_;
        process_group_ = other.process_group_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
    }
    return *this;
}

ChildProcess ChildProcess::spawn(const LaunchSpec& spec) {
    if (spec.executable.empty()) {
        throw SpawnError("Empty executable name", EINVAL);
    }

    // fork 之后子进程只能调用 async-signal-safe 函数，argv/envp 在这里准备好
    std::vector<std::string> env_entries = build_environment(spec.env);
    std::vector<char*> envp;
    envp.reserve(env_entries.size() + 1);
    for (auto& entry : env_entries) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    std::vector<char*> argv;
    argv.reserve(spec.args.size() + 2);
    argv.push_back(const_cast<char*>(spec.executable.c_str()));
    for (const auto& arg : spec.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::string cwd = spec.working_dir ? spec.working_dir->string() : std::string();

    int null_fd = -1;
    if (spec.silence_output) {
        null_fd = open("/dev/null", O_RDWR | O_CLOEXEC);
        if (null_fd < 0) {
            throw SpawnError("Failed to open /dev/null: " + std::string(strerror(errno)), errno);
        }
    }

    // exec 成功时写端随 CLOEXEC 关闭，父进程读到 EOF；失败时子进程写入 errno
    int status_fds[2];
    if (pipe(status_fds) < 0) {
        int err = errno;
        close_fd(null_fd);
        throw SpawnError("Failed to create pipe: " + std::string(strerror(err)), err);
    }
    fcntl(status_fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(status_fds[1], F_SETFD, FD_CLOEXEC);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_fd(status_fds[0]);
        close_fd(status_fds[1]);
        close_fd(null_fd);
        throw SpawnError("Fork failed: " + std::string(strerror(err)), err);
    }

    if (pid == 0) {
        // ===== 子进程 =====
        int report_fd = status_fds[1];
        auto report_and_exit = [report_fd](int err) {
            ssize_t ignored = write(report_fd, &err, sizeof(err));
            (void)ignored;
            _exit(127);
        };

        sigset_t empty_mask;
        sigemptyset(&empty_mask);
        sigprocmask(SIG_SETMASK, &empty_mask, nullptr);

        if (spec.new_process_group) {
            setpgid(0, 0);
        }
        if (null_fd >= 0) {
            dup2(null_fd, STDIN_FILENO);
            dup2(null_fd, STDOUT_FILENO);
            dup2(null_fd, STDERR_FILENO);
        }
        if (!cwd.empty() && chdir(cwd.c_str()) < 0) {
            report_and_exit(errno);
        }

        environ = envp.data();
        execvp(argv[0], argv.data());

        // execvp 返回说明失败了
        report_and_exit(errno);
    }

    // ===== 父进程 =====
    if (spec.new_process_group) {
        setpgid(pid, pid);
    }
    close_fd(status_fds[1]);
    close_fd(null_fd);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_fds[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(status_fds[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        throw SpawnError("Failed to start '" + describe(spec) + "': " + strerror(child_errno), child_errno);
    }

    return ChildProcess(pid, spec.new_process_group);
}

int ChildProcess::run_trial(const LaunchSpec& spec, std::chrono::milliseconds timeout) {
    LaunchSpec trial = spec;
    trial.silence_output = true;

    ChildProcess child = spawn(trial);
    if (auto code = child.wait_for_exit(timeout)) {
        return *code;
    }

    // 超时：已经证明可以启动，直接强制结束
    std::error_code ec = child.terminate(std::chrono::milliseconds(0));
    if (ec) {
        throw SpawnError("Failed to stop trial '" + describe(spec) + "': " + ec.message(), ec.value());
    }
    return child.exit_code_.value_or(128 + SIGKILL);
}

std::error_code ChildProcess::terminate(std::chrono::milliseconds grace) {
    if (!valid() || reap_nonblocking()) {
        return {};
    }

    // 先发送 SIGTERM
    if (send_signal(SIGTERM) < 0 && errno != ESRCH) {
        return std::error_code(errno, std::system_category());
    }

    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (reap_nonblocking()) {
            return {};
        }
        std::this_thread::sleep_for(kPollInterval);
    }
    if (reap_nonblocking()) {
        return {};
    }

    // 超时则强制 SIGKILL
    if (send_signal(SIGKILL) < 0 && errno != ESRCH) {
        return std::error_code(errno, std::system_category());
    }

    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid_, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == pid_) {
        exit_code_ = decode_status(status);
    } else if (errno != ECHILD) {
        return std::error_code(errno, std::system_category());
    }
    pid_ = -1;
    return {};
}

std::optional<int> ChildProcess::wait_for_exit(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (valid()) {
        if (reap_nonblocking()) {
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return exit_code_;
}

bool ChildProcess::is_alive() {
    return valid() && !reap_nonblocking();
}

int ChildProcess::send_signal(int signal) const {
    if (process_group_) {
        if (kill(-pid_, signal) == 0) {
            return 0;
        }
        // setpgid 可能还没生效，退回到单个进程
        if (errno != ESRCH) {
            return -1;
        }
    }
    return kill(pid_, signal);
}

bool ChildProcess::reap_nonblocking() {
    int status = 0;
    pid_t result = waitpid(pid_, &status, WNOHANG);
    if (result == pid_) {
        exit_code_ = decode_status(status);
        pid_ = -1;
        return true;
    }
    if (result < 0 && errno == ECHILD) {
        pid_ = -1;
        return true;
    }
    return false;
}

} // namespace sidecar
