/**
 * python_bindings.cpp - pybind11 绑定
 *
 * 将 C++ ProcessSupervisor 暴露为 Python 模块 sidecar._supervisor，
 * 供 Python 编写的宿主 Shell 嵌入使用
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "diagnostic_logger.hpp"
#include "platform_profile.hpp"
#include "process_supervisor.hpp"
#include "supervisor_config.hpp"

namespace py = pybind11;

namespace sidecar {

/**
 * Python 兼容的 ProcessSupervisor 包装器
 *
 * 阻塞调用（探测、派生、终止）期间释放 GIL
 */
class PySupervisor {
public:
    PySupervisor(int port, std::optional<std::string> project_path, bool development) {
        PlatformProfile profile = profile_for(current_platform());
        profile.fatal_error = FatalErrorPresentation::ConsoleOnly;

        SupervisorConfig config = SupervisorConfig::defaults();
        config.apply_environment(process_env);
        if (port > 0) {
            config.endpoint.port = port;
        }
        config.run_mode_override = development ? RunMode::Development : RunMode::Production;

        const std::string override_name = config.project_path_env;
        EnvLookup env = [override_name, project_path](const std::string& name) -> std::optional<std::string> {
            if (project_path && name == override_name) {
                return project_path;
            }
            return process_env(name);
        };

        logger_ = DiagnosticLogger::create(profile, config, env);
        supervisor_ = ProcessSupervisor::create(std::move(config), profile, logger_, env);
    }

    ~PySupervisor() {
        py::gil_scoped_release release;
        supervisor_->shutdown();
    }

    std::string ensure_started() {
        StartOutcome outcome;
        {
            py::gil_scoped_release release;
            outcome = supervisor_->ensure_started();
        }
        return to_string(outcome);
    }

    void shutdown() {
        py::gil_scoped_release release;
        supervisor_->shutdown();
    }

    std::string state() const {
        return to_string(supervisor_->state());
    }

    std::optional<int> child_pid() const {
        auto pid = supervisor_->child_pid();
        if (pid) {
            return static_cast<int>(*pid);
        }
        return std::nullopt;
    }

    bool is_server_reachable() const {
        py::gil_scoped_release release;
        return supervisor_->is_server_reachable();
    }

    std::string endpoint() const {
        return supervisor_->endpoint().to_string();
    }

    std::string log_file() const {
        return logger_->log_file().string();
    }

private:
    std::shared_ptr<DiagnosticLogger> logger_;
    std::shared_ptr<ProcessSupervisor> supervisor_;
};

} // namespace sidecar

PYBIND11_MODULE(_supervisor, m) {
    m.doc() = "Sidecar C++ Core - companion server supervisor";

    py::class_<sidecar::PySupervisor>(m, "Supervisor")
        .def(py::init<int, std::optional<std::string>, bool>(),
             py::arg("port") = 0,
             py::arg("project_path") = py::none(),
             py::arg("development") = false,
             R"doc(
             创建 Supervisor 实例

             Args:
                 port: 服务器端口（0 = 使用默认值或 SIDECAR_PORT）
                 project_path: 项目目录，优先于自动查找
                 development: True 使用开发模式命令
             )doc")
        .def("ensure_started", &sidecar::PySupervisor::ensure_started,
             "确保服务器在运行，返回 'already-running' / 'spawned' / 'spawn-failed'")
        .def("shutdown", &sidecar::PySupervisor::shutdown,
             "终止服务器子进程（可重复调用）")
        .def_property_readonly("state", &sidecar::PySupervisor::state,
             "监管器状态")
        .def_property_readonly("child_pid", &sidecar::PySupervisor::child_pid,
             "子进程 PID，没有子进程时为 None")
        .def("is_server_reachable", &sidecar::PySupervisor::is_server_reachable,
             "服务器端口是否可连接")
        .def_property_readonly("endpoint", &sidecar::PySupervisor::endpoint,
             "服务器地址")
        .def_property_readonly("log_file", &sidecar::PySupervisor::log_file,
             "日志文件路径（仅控制台日志时为空）");

    m.attr("__version__") = "0.1.0";
}
