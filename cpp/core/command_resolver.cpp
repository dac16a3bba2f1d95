#include "command_resolver.hpp"
#include "child_process.hpp"

namespace sidecar {

std::string CommandInvocation::to_string() const {
    std::string text = executable;
    for (const auto& arg : prefix_args) {
        text += " " + arg;
    }
    return text;
}

CommandResolver::CommandResolver(ToolCommand command,
                                 InvocationStrategy strategy,
                                 std::shared_ptr<DiagnosticLogger> logger)
    : command_(std::move(command)), strategy_(strategy), logger_(std::move(logger)) {}

CommandInvocation CommandResolver::wrapper_invocation() const {
    CommandInvocation invocation;
    invocation.executable = command_.wrapper;
    invocation.prefix_args = command_.wrapper_args;
    invocation.prefix_args.push_back(command_.tool);
    return invocation;
}

CommandInvocation CommandResolver::direct_invocation() const {
    return CommandInvocation{command_.tool, {}};
}

CommandInvocation CommandResolver::resolve() const {
    if (strategy_ == InvocationStrategy::PreferWrapper && !command_.wrapper.empty()) {
        CommandInvocation wrapper = wrapper_invocation();
        if (try_start(wrapper)) {
            logger_->log("[CommandResolver] Found ", command_.tool, " via ", command_.wrapper);
            return wrapper;
        }
    }

    CommandInvocation direct = direct_invocation();
    if (try_start(direct)) {
        logger_->log("[CommandResolver] Found ", command_.tool, " directly");
    } else {
        logger_->log("[CommandResolver] Warning: Could not find ", command_.tool,
                     " command. Make sure it's installed: ", command_.install_hint);
    }
    return direct;
}

bool CommandResolver::try_start(const CommandInvocation& invocation) const {
    LaunchSpec spec;
    spec.executable = invocation.executable;
    spec.args = invocation.prefix_args;
    spec.args.push_back(command_.version_arg);
    spec.new_process_group = true;

    try {
        int code = ChildProcess::run_trial(spec, command_.trial_timeout);
        logger_->log("[CommandResolver] '", invocation.to_string(), " ", command_.version_arg,
                     "' exited with ", code);
        return true;
    } catch (const SpawnError& e) {
        logger_->log("[CommandResolver] ", invocation.executable, " not found: ", e.what());
        return false;
    }
}

} // namespace sidecar
