#include "test_helpers.hpp"

#include <cerrno>
#include <stdexcept>
#include <signal.h>

#include "process_supervisor.hpp"

using namespace sidecar;
using namespace sidecar::test;
using namespace std::chrono_literals;

namespace {

/**
 * 用 sh 代替真实服务器：sh -c "<script>" start
 */
SupervisorConfig test_config(int port, const std::string& script = "exec sleep 30") {
    SupervisorConfig config = SupervisorConfig::defaults();
    config.endpoint.port = port;
    config.command.wrapper.clear();
    config.command.tool = "sh";
    config.command.trial_timeout = 2000ms;
    config.fixed_flags = {"-c", script};
    config.run_mode_override = RunMode::Production;
    config.fallback_paths.clear();
    config.readiness_attempts = 2;
    config.backoff_unit = 10ms;
    config.connect_timeout = 100ms;
    config.terminate_grace = 1000ms;
    return config;
}

PlatformProfile test_profile() {
    PlatformProfile profile = profile_for(HostPlatform::Linux);
    profile.invocation = InvocationStrategy::DirectOnly;
    profile.fatal_error = FatalErrorPresentation::ConsoleOnly;
    return profile;
}

bool process_exists(pid_t pid) {
    return kill(pid, 0) == 0 || errno == EPERM;
}

bool wait_for_file(const std::filesystem::path& path, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (std::filesystem::exists(path) && !read_text_file(path).empty()) {
            return true;
        }
        std::this_thread::sleep_for(20ms);
    }
    return false;
}

} // namespace

TEST_CASE("build_launch_spec assembles the command line", "[supervisor]") {
    std::shared_ptr<memory_sink> sink;
    auto supervisor = ProcessSupervisor::create(SupervisorConfig::defaults(), test_profile(),
                                                memory_logger(sink), map_env({}));

    CommandInvocation wrapper{"bunx", {"--bun", "elizaos"}};
    auto spec = supervisor->build_launch_spec(wrapper, RunMode::Development, std::filesystem::path("/proj"));
    CHECK(spec.executable == "bunx");
    CHECK(spec.args == std::vector<std::string>{"--bun", "elizaos", "--no-emoji", "dev"});
    REQUIRE(spec.working_dir);
    CHECK(*spec.working_dir == std::filesystem::path("/proj"));
    CHECK(spec.new_process_group);
    CHECK(spec.env.size() == 8);

    auto direct = supervisor->build_launch_spec(CommandInvocation{"elizaos", {}}, RunMode::Production, std::nullopt);
    CHECK(direct.args == std::vector<std::string>{"--no-emoji", "start"});
    CHECK_FALSE(direct.working_dir.has_value());
}

TEST_CASE("reachable server is not spawned again", "[supervisor]") {
    tcp_listener listener;
    std::shared_ptr<memory_sink> sink;
    auto supervisor = ProcessSupervisor::create(test_config(listener.port()), test_profile(),
                                                memory_logger(sink), map_env({}));

    CHECK(supervisor->ensure_started() == StartOutcome::AlreadyRunning);
    CHECK(supervisor->state() == SupervisorState::ExternallyManaged);
    CHECK_FALSE(supervisor->has_process());
    CHECK(sink->contains("Server is already running"));

    // 不属于我们的服务器，shutdown 什么也不终止
    supervisor->shutdown();
    CHECK(sink->contains("No server process to shut down"));
}

TEST_CASE("spawn then shutdown", "[supervisor]") {
    temp_dir tmp("sidecar_supervisor");
    auto project = make_project(tmp.path / "trading-brain");

    std::shared_ptr<memory_sink> sink;
    auto supervisor = ProcessSupervisor::create(
        test_config(unused_port(), "printf '%s|%s' \"$(pwd)\" \"$ELIZA_USE_LOCAL_SERVER\" > started.txt; exec sleep 30"),
        test_profile(), memory_logger(sink), map_env({{"ELIZA_PROJECT_PATH", project.string()}}));

    REQUIRE(supervisor->ensure_started() == StartOutcome::Spawned);
    CHECK(supervisor->state() == SupervisorState::Running);
    REQUIRE(supervisor->has_process());

    auto pid = supervisor->child_pid();
    REQUIRE(pid);
    CHECK(process_exists(*pid));

    // 子进程在项目目录中运行，并继承固定环境变量
    REQUIRE(wait_for_file(project / "started.txt", 5000ms));
    CHECK(read_text_file(project / "started.txt") == project.string() + "|true");

    SECTION("second start is a no-op") {
        CHECK(supervisor->ensure_started() == StartOutcome::AlreadyRunning);
        CHECK(supervisor->child_pid() == pid);
    }

    supervisor->shutdown();
    CHECK(supervisor->state() == SupervisorState::Stopped);
    CHECK_FALSE(supervisor->has_process());
    CHECK_FALSE(supervisor->child_pid().has_value());
    CHECK_FALSE(process_exists(*pid));
    CHECK(sink->contains("Server shut down successfully"));

    // 再次调用是安全的
    supervisor->shutdown();
    CHECK(sink->contains("No server process to shut down"));
}

TEST_CASE("spawn failure leaves the supervisor idle", "[supervisor]") {
    auto config = test_config(unused_port());
    config.command.tool = "sidecar-missing-tool";

    std::shared_ptr<memory_sink> sink;
    auto supervisor = ProcessSupervisor::create(config, test_profile(), memory_logger(sink), map_env({}));

    CHECK(supervisor->ensure_started() == StartOutcome::SpawnFailed);
    CHECK(supervisor->state() == SupervisorState::Idle);
    CHECK_FALSE(supervisor->has_process());
    CHECK(sink->contains("Failed to start server"));
    CHECK(sink->contains(config.command.install_hint));
}

TEST_CASE("missing project still spawns from the current directory", "[supervisor]") {
    std::shared_ptr<memory_sink> sink;
    auto supervisor = ProcessSupervisor::create(test_config(unused_port()), test_profile(),
                                                memory_logger(sink), map_env({}));

    CHECK(supervisor->ensure_started() == StartOutcome::Spawned);
    CHECK(sink->contains("Could not find trading-brain project directory"));
    supervisor->shutdown();
    CHECK_FALSE(supervisor->has_process());
}

TEST_CASE("readiness wait only logs", "[supervisor]") {
    std::shared_ptr<memory_sink> sink;
    auto supervisor = ProcessSupervisor::create(test_config(unused_port()), test_profile(),
                                                memory_logger(sink), map_env({}));

    REQUIRE(supervisor->ensure_started() == StartOutcome::Spawned);

    // 服务器从不监听：等待耗尽后记录警告，监管器状态不受影响
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!sink->contains("may not be ready") && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(20ms);
    }
    CHECK(sink->contains("may not be ready"));
    CHECK(supervisor->state() == SupervisorState::Running);

    supervisor->shutdown();
}

TEST_CASE("shutdown before the server is ready", "[supervisor]") {
    auto config = test_config(unused_port());
    config.readiness_attempts = 3;
    config.backoff_unit = 20ms;

    std::shared_ptr<memory_sink> sink;
    auto supervisor = ProcessSupervisor::create(config, test_profile(), memory_logger(sink), map_env({}));

    REQUIRE(supervisor->ensure_started() == StartOutcome::Spawned);
    auto pid = supervisor->child_pid();
    REQUIRE(pid);

    supervisor->shutdown();
    CHECK_FALSE(process_exists(*pid));

    // 后台等待结束时只记录警告，不能恢复已关闭的状态
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!sink->contains("may not be ready") && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(20ms);
    }
    REQUIRE(sink->contains("may not be ready"));
    CHECK_FALSE(supervisor->has_process());
    CHECK_FALSE(supervisor->child_pid());
    CHECK(supervisor->state() == SupervisorState::Stopped);
}

TEST_CASE("scoped shutdown terminates the server during unwinding", "[supervisor]") {
    auto config = test_config(unused_port());
    config.readiness_attempts = 20;
    config.backoff_unit = 50ms;

    std::shared_ptr<memory_sink> sink;
    auto supervisor = ProcessSupervisor::create(config, test_profile(), memory_logger(sink), map_env({}));

    REQUIRE(supervisor->ensure_started() == StartOutcome::Spawned);
    auto pid = supervisor->child_pid();
    REQUIRE(pid);

    // 宿主启动失败：异常离开作用域
    try {
        ScopedShutdown guard(supervisor);
        throw std::runtime_error("Failed to start shell bridge on 127.0.0.1:1");
    } catch (const std::runtime_error& e) {
        CHECK(std::string(e.what()).find("shell bridge") != std::string::npos);
    }

    CHECK_FALSE(process_exists(*pid));
    CHECK(supervisor->state() == SupervisorState::Stopped);
    CHECK(sink->contains("Server shut down successfully"));

    // 就绪线程仍持有监管器，释放调用方的引用后子进程也不能复活
    supervisor.reset();
    CHECK_FALSE(process_exists(*pid));
}
