#include "test_helpers.hpp"

#include <grpcpp/grpcpp.h>
#include "shell_bridge.grpc.pb.h"

#include "shell_bridge.hpp"

using namespace sidecar;
using namespace sidecar::test;
using namespace std::chrono_literals;

namespace {

SupervisorConfig bridge_config(int port) {
    SupervisorConfig config = SupervisorConfig::defaults();
    config.endpoint.port = port;
    config.command.wrapper.clear();
    config.command.tool = "sh";
    config.fixed_flags = {"-c", "exec sleep 30"};
    config.run_mode_override = RunMode::Production;
    config.fallback_paths.clear();
    config.readiness_attempts = 1;
    config.backoff_unit = 10ms;
    config.connect_timeout = 100ms;
    config.terminate_grace = 1000ms;
    return config;
}

PlatformProfile bridge_profile() {
    PlatformProfile profile = profile_for(HostPlatform::Linux);
    profile.invocation = InvocationStrategy::DirectOnly;
    profile.fatal_error = FatalErrorPresentation::ConsoleOnly;
    return profile;
}

struct bridge_fixture {
    std::shared_ptr<memory_sink> sink;
    std::shared_ptr<DiagnosticLogger> logger = memory_logger(sink);
    std::shared_ptr<ProcessSupervisor> supervisor =
        ProcessSupervisor::create(bridge_config(unused_port()), bridge_profile(), logger, map_env({}));
    ShellBridge shell{supervisor, logger, 0};
    std::unique_ptr<bridge::ShellBridge::Stub> stub;

    bridge_fixture() {
        shell.start();
        REQUIRE(shell.bound_port() > 0);
        auto channel = grpc::CreateChannel("127.0.0.1:" + std::to_string(shell.bound_port()),
                                           grpc::InsecureChannelCredentials());
        stub = bridge::ShellBridge::NewStub(channel);
    }

    ~bridge_fixture() {
        supervisor->shutdown();
        shell.stop();
    }

    grpc::Status notify(bridge::WindowEventRequest::Kind kind, bridge::WindowEventResponse& response) {
        grpc::ClientContext context;
        context.set_deadline(std::chrono::system_clock::now() + 10s);
        bridge::WindowEventRequest request;
        request.set_kind(kind);
        request.set_window_label("main");
        return stub->NotifyWindowEvent(&context, request, &response);
    }
};

} // namespace

TEST_CASE("greeting text", "[bridge]") {
    CHECK(greeting_for("Ada") == "Hello, Ada! You've been greeted from sidecar!");
}

TEST_CASE("Greet rpc", "[bridge]") {
    bridge_fixture fixture;

    grpc::ClientContext context;
    bridge::GreetRequest request;
    request.set_name("World");
    bridge::GreetResponse response;

    auto status = fixture.stub->Greet(&context, request, &response);
    REQUIRE(status.ok());
    CHECK(response.message() == "Hello, World! You've been greeted from sidecar!");
}

TEST_CASE("GetStatus reports the supervisor", "[bridge]") {
    bridge_fixture fixture;

    auto query = [&fixture]() {
        grpc::ClientContext context;
        bridge::StatusRequest request;
        bridge::StatusResponse response;
        auto status = fixture.stub->GetStatus(&context, request, &response);
        REQUIRE(status.ok());
        return response;
    };

    auto idle = query();
    CHECK(idle.state() == "idle");
    CHECK(idle.child_pid() == 0);
    CHECK_FALSE(idle.server_reachable());
    CHECK(idle.endpoint() == fixture.supervisor->endpoint().to_string());

    REQUIRE(fixture.supervisor->ensure_started() == StartOutcome::Spawned);
    auto running = query();
    CHECK(running.state() == "running");
    CHECK(running.child_pid() == static_cast<int32_t>(*fixture.supervisor->child_pid()));
}

TEST_CASE("close request stops the server but keeps the bridge", "[bridge]") {
    bridge_fixture fixture;
    REQUIRE(fixture.supervisor->ensure_started() == StartOutcome::Spawned);

    bridge::WindowEventResponse response;
    auto status = fixture.notify(bridge::WindowEventRequest::CLOSE_REQUESTED, response);
    REQUIRE(status.ok());
    CHECK(response.handled());
    CHECK_FALSE(fixture.supervisor->has_process());
    CHECK(fixture.supervisor->state() == SupervisorState::Stopped);
    CHECK_FALSE(fixture.shell.exit_requested());
    CHECK(fixture.sink->contains("Close requested for window 'main'"));
}

TEST_CASE("exit event releases wait_for_exit and leaves shutdown to the host", "[bridge]") {
    bridge_fixture fixture;
    REQUIRE(fixture.supervisor->ensure_started() == StartOutcome::Spawned);

    bridge::WindowEventResponse response;
    auto status = fixture.notify(bridge::WindowEventRequest::EXIT, response);
    REQUIRE(status.ok());
    CHECK(response.handled());
    CHECK(response.message() == "exit acknowledged");
    CHECK(fixture.shell.exit_requested());
    CHECK(fixture.sink->contains("Host application exiting"));

    // 回复不等待服务器终止
    CHECK(fixture.supervisor->has_process());

    // 已经请求退出，立即返回
    fixture.shell.wait_for_exit(10ms);

    // 宿主退出顺序：先关闭服务器，再停止 bridge
    auto pid = fixture.supervisor->child_pid();
    REQUIRE(pid);
    fixture.supervisor->shutdown();
    fixture.shell.stop();
    CHECK_FALSE(fixture.supervisor->has_process());
    CHECK(fixture.supervisor->state() == SupervisorState::Stopped);
    CHECK(fixture.sink->contains("Server shut down successfully (pid " + std::to_string(*pid) + ")"));
}

TEST_CASE("wait_for_exit honours the external stop flag", "[bridge]") {
    bridge_fixture fixture;
    std::atomic<bool> stop{true};

    fixture.shell.wait_for_exit(10ms, &stop);
    CHECK_FALSE(fixture.shell.exit_requested());
}
