#include "shell_bridge.hpp"

#include <stdexcept>

#include <grpcpp/grpcpp.h>
#include "shell_bridge.grpc.pb.h"

namespace sidecar {

std::string greeting_for(const std::string& name) {
    return "Hello, " + name + "! You've been greeted from sidecar!";
}

// ============================================================================
// ShellBridge gRPC Service Implementation
// ============================================================================

class ShellBridgeServiceImpl final : public bridge::ShellBridge::Service {
public:
    ShellBridgeServiceImpl(ShellBridge* owner,
                           std::shared_ptr<ProcessSupervisor> supervisor,
                           std::shared_ptr<DiagnosticLogger> logger)
        : owner_(owner), supervisor_(std::move(supervisor)), logger_(std::move(logger)) {}

    grpc::Status Greet(
        grpc::ServerContext* context,
        const bridge::GreetRequest* request,
        bridge::GreetResponse* response) override {

        response->set_message(greeting_for(request->name()));
        return grpc::Status::OK;
    }

    grpc::Status GetStatus(
        grpc::ServerContext* context,
        const bridge::StatusRequest* request,
        bridge::StatusResponse* response) override {

        try {
            response->set_state(to_string(supervisor_->state()));
            response->set_server_reachable(supervisor_->is_server_reachable());
            auto pid = supervisor_->child_pid();
            response->set_child_pid(pid ? static_cast<int32_t>(*pid) : 0);
            response->set_endpoint(supervisor_->endpoint().to_string());
        } catch (const std::exception& e) {
            logger_->log("[ShellBridge] GetStatus failed: ", e.what());
            return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
        }
        return grpc::Status::OK;
    }

    grpc::Status NotifyWindowEvent(
        grpc::ServerContext* context,
        const bridge::WindowEventRequest* request,
        bridge::WindowEventResponse* response) override {

        try {
            switch (request->kind()) {
            case bridge::WindowEventRequest::CLOSE_REQUESTED:
                logger_->log("[ShellBridge] Close requested for window '", request->window_label(), "'");
                supervisor_->shutdown();
                response->set_handled(true);
                response->set_message("server shut down");
                break;

            case bridge::WindowEventRequest::EXIT:
                logger_->log("[ShellBridge] Host application exiting");
                // 终止服务器可能超过 stop() 的截止时间，关闭和 Shutdown 都交给等待 wait_for_exit 的主线程
                owner_->request_exit();
                response->set_handled(true);
                response->set_message("exit acknowledged");
                break;

            default:
                return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "unknown window event");
            }
        } catch (const std::exception& e) {
            logger_->log("[ShellBridge] Window event handling failed: ", e.what());
            return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
        }
        return grpc::Status::OK;
    }

private:
    ShellBridge* owner_;
    std::shared_ptr<ProcessSupervisor> supervisor_;
    std::shared_ptr<DiagnosticLogger> logger_;
};

// ============================================================================
// ShellBridge Implementation
// ============================================================================

ShellBridge::ShellBridge(std::shared_ptr<ProcessSupervisor> supervisor,
                         std::shared_ptr<DiagnosticLogger> logger,
                         int port)
    : supervisor_(std::move(supervisor)), logger_(std::move(logger)), port_(port) {}

ShellBridge::~ShellBridge() {
    stop();
}

void ShellBridge::start() {
    if (running_.load()) {
        return;
    }

    // 只监听回环地址
    std::string server_address = "127.0.0.1:" + std::to_string(port_);

    service_ = std::make_unique<ShellBridgeServiceImpl>(this, supervisor_, logger_);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials(), &bound_port_);
    builder.RegisterService(service_.get());

    server_ = builder.BuildAndStart();
    if (!server_ || bound_port_ == 0) {
        server_.reset();
        throw std::runtime_error("Failed to start shell bridge on " + server_address);
    }

    running_ = true;
    logger_->log("[ShellBridge] gRPC server listening on 127.0.0.1:", bound_port_);
}

void ShellBridge::stop() {
    if (running_.exchange(false)) {
        logger_->log("[ShellBridge] Stopping...");
        if (server_) {
            server_->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));
        }
    }
    request_exit();
}

void ShellBridge::wait_for_exit(std::chrono::milliseconds poll_interval,
                                const std::atomic<bool>* external_stop) {
    std::unique_lock<std::mutex> lock(exit_mutex_);
    while (!exit_requested_.load()) {
        if (external_stop && external_stop->load()) {
            return;
        }
        exit_cv_.wait_for(lock, poll_interval);
    }
}

void ShellBridge::request_exit() {
    {
        std::lock_guard<std::mutex> lock(exit_mutex_);
        exit_requested_ = true;
    }
    exit_cv_.notify_all();
}

} // namespace sidecar
