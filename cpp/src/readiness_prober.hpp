#pragma once

#include <chrono>
#include <functional>

#include "supervisor_config.hpp"

namespace sidecar {

/**
 * ReadinessProber - 通过 TCP 连接判断服务器是否在监听
 *
 * 不讲任何应用层协议，连接成功即认为就绪。
 */
class ReadinessProber {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    /**
     * @param endpoint 探测地址
     * @param connect_timeout 单次连接超时
     * @param backoff_unit 退避时间单位（延迟依次为 1,2,4,8,8,... 个单位）
     * @param sleeper 睡眠函数（默认 std::this_thread::sleep_for）
     */
    ReadinessProber(Endpoint endpoint,
                    std::chrono::milliseconds connect_timeout,
                    std::chrono::milliseconds backoff_unit,
                    Sleeper sleeper = {});

    /**
     * 尝试一次 TCP 连接
     * @return 连接成功返回 true；拒绝、超时、不可达等错误一律返回 false
     */
    bool is_reachable() const;

    /**
     * 重复探测直到成功或用尽次数
     *
     * 两次探测之间按指数退避睡眠，最多探测 max_attempts 次。
     */
    bool wait_until_ready(int max_attempts) const;

    /**
     * 第 attempt 次失败后的等待时间（从 0 开始计数），第 4 次起封顶为 8 个单位
     */
    static std::chrono::milliseconds backoff_delay(int attempt, std::chrono::milliseconds unit);

    const Endpoint& endpoint() const { return endpoint_; }

private:
    Endpoint endpoint_;
    std::chrono::milliseconds connect_timeout_;
    std::chrono::milliseconds backoff_unit_;
    Sleeper sleeper_;
};

} // namespace sidecar
