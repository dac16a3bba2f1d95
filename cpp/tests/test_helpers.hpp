#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <catch2/catch.hpp>

#include "diagnostic_logger.hpp"
#include "platform_profile.hpp"
#include "supervisor_config.hpp"

namespace sidecar::test {

namespace fs = std::filesystem;

struct temp_dir {
    fs::path path{};

    explicit temp_dir(const std::string& prefix) {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        std::ostringstream dir_name;
        dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
        path = fs::temp_directory_path() / dir_name.str();
        fs::create_directories(path);
        // 规范化，避免 /tmp 是符号链接时与 locate() 的结果不一致
        path = fs::canonical(path);
    }

    ~temp_dir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

inline void write_text_file(const fs::path& path, const std::string& text) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    std::ofstream out(path);
    REQUIRE(out.good());
    out << text;
    REQUIRE(out.good());
}

inline std::string read_text_file(const fs::path& path) {
    std::ifstream in(path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

/**
 * 创建一个带 package.json 的项目目录
 */
inline fs::path make_project(const fs::path& dir, const std::string& name = "trading-brain") {
    fs::create_directories(dir);
    write_text_file(dir / "package.json", "{\n  \"name\": \"" + name + "\",\n  \"version\": \"1.0.0\"\n}\n");
    return dir;
}

/**
 * 基于 map 的环境变量，不触碰真实进程环境
 */
inline EnvLookup map_env(std::map<std::string, std::string> values) {
    return [values = std::move(values)](const std::string& name) -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

/**
 * 记录到内存的日志输出
 */
class memory_sink : public LogSink {
public:
    void write(std::time_t /*timestamp*/, const std::string& message) noexcept override {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.push_back(message);
    }

    std::vector<std::string> messages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    bool contains(const std::string& needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& message : messages_) {
            if (message.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> messages_;
};

/**
 * 只写内存的日志器
 */
inline std::shared_ptr<DiagnosticLogger> memory_logger(std::shared_ptr<memory_sink>& sink) {
    auto logger = std::make_shared<DiagnosticLogger>();
    sink = std::make_shared<memory_sink>();
    logger->add_sink(sink);
    return logger;
}

/**
 * 回环地址上的监听 socket（只 listen，不 accept；连接由内核完成握手）
 */
class tcp_listener {
public:
    explicit tcp_listener(int port = 0) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(fd_ >= 0);

        int reuse = 1;
        ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = htons(static_cast<uint16_t>(port));
        REQUIRE(::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        REQUIRE(::listen(fd_, 16) == 0);

        socklen_t len = sizeof(addr);
        REQUIRE(::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
        port_ = ntohs(addr.sin_port);
    }

    ~tcp_listener() { close(); }

    tcp_listener(const tcp_listener&) = delete;
    tcp_listener& operator=(const tcp_listener&) = delete;

    int port() const { return port_; }

    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
    int port_ = 0;
};

/**
 * 一个当前没有监听者的回环端口
 */
inline int unused_port() {
    tcp_listener listener;
    int port = listener.port();
    listener.close();
    return port;
}

} // namespace sidecar::test
