#pragma once

#include <memory>
#include <string>
#include <vector>

#include "diagnostic_logger.hpp"
#include "supervisor_config.hpp"

namespace sidecar {

/**
 * CommandInvocation - 调用被监管工具的方式：可执行文件 + 参数前缀
 */
struct CommandInvocation {
    std::string executable;
    std::vector<std::string> prefix_args;

    bool operator==(const CommandInvocation& other) const {
        return executable == other.executable && prefix_args == other.prefix_args;
    }
    bool operator!=(const CommandInvocation& other) const { return !(*this == other); }

    std::string to_string() const;
};

/**
 * CommandResolver - 选择本机上能够启动的工具调用方式
 *
 * 只要操作系统能启动进程就算成功，不检查 --version 的退出码。
 * 两种方式都启动不了时仍返回直接调用形式，由最终的 spawn 报错。
 */
class CommandResolver {
public:
    CommandResolver(ToolCommand command,
                    InvocationStrategy strategy,
                    std::shared_ptr<DiagnosticLogger> logger);

    CommandInvocation resolve() const;

    // bunx --bun elizaos
    CommandInvocation wrapper_invocation() const;
    // elizaos
    CommandInvocation direct_invocation() const;

private:
    /**
     * 用版本参数试探启动
     * @return 进程能够启动返回 true
     */
    bool try_start(const CommandInvocation& invocation) const;

    ToolCommand command_;
    InvocationStrategy strategy_;
    std::shared_ptr<DiagnosticLogger> logger_;
};

} // namespace sidecar
