#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

#include "diagnostic_logger.hpp"
#include "process_supervisor.hpp"

// Forward declarations for gRPC types
namespace grpc {
class Server;
}

namespace sidecar {

class ShellBridgeServiceImpl;

/**
 * ShellBridge - 宿主框架集成点
 *
 * 在 127.0.0.1 上提供 gRPC 服务，宿主 Shell 通过它：
 * 1. 通知窗口关闭请求（终止服务器）
 * 2. 通知最终退出（终止服务器并结束 wait_for_exit）
 * 3. 查询状态、调用问候命令
 */
class ShellBridge {
public:
    /**
     * @param supervisor 共享的监管器
     * @param port 监听端口（0 = 由系统分配）
     */
    ShellBridge(std::shared_ptr<ProcessSupervisor> supervisor,
                std::shared_ptr<DiagnosticLogger> logger,
                int port);

    ~ShellBridge();

    // 禁止拷贝
    ShellBridge(const ShellBridge&) = delete;
    ShellBridge& operator=(const ShellBridge&) = delete;

    /**
     * 启动 gRPC 服务器
     * @throws std::runtime_error 如果无法监听端口
     */
    void start();

    /**
     * 停止 gRPC 服务器（不可在 RPC 处理线程中调用）
     */
    void stop();

    /**
     * 阻塞直到收到 EXIT 事件或 request_exit()
     * @param poll_interval 检查 external_stop 的间隔
     * @param external_stop 外部停止标志（信号处理函数设置），可为空
     */
    void wait_for_exit(std::chrono::milliseconds poll_interval,
                       const std::atomic<bool>* external_stop = nullptr);

    /**
     * 标记退出并唤醒 wait_for_exit
     */
    void request_exit();

    bool exit_requested() const { return exit_requested_.load(); }

    /**
     * 实际监听的端口（start() 之后有效）
     */
    int bound_port() const { return bound_port_; }

    bool is_running() const { return running_.load(); }

private:
    std::shared_ptr<ProcessSupervisor> supervisor_;
    std::shared_ptr<DiagnosticLogger> logger_;
    int port_;
    int bound_port_ = 0;

    std::atomic<bool> running_{false};
    std::atomic<bool> exit_requested_{false};
    std::mutex exit_mutex_;
    std::condition_variable exit_cv_;

    std::unique_ptr<ShellBridgeServiceImpl> service_;
    std::unique_ptr<grpc::Server> server_;
};

/**
 * 问候命令的返回文本
 */
std::string greeting_for(const std::string& name);

} // namespace sidecar
