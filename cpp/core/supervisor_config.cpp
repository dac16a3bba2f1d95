#include "supervisor_config.hpp"

#include <sstream>

namespace fs = std::filesystem;

namespace sidecar {

namespace {

std::vector<fs::path> split_path_list(const std::string& text) {
    std::vector<fs::path> paths;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ':')) {
        if (!item.empty()) {
            paths.emplace_back(item);
        }
    }
    return paths;
}

int parse_positive(const std::string& text, const std::string& source) {
    std::size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(source + ": expected a number, got '" + text + "'");
    }
    if (consumed != text.size() || value < 1) {
        throw ConfigError(source + ": expected a positive number, got '" + text + "'");
    }
    return value;
}

} // anonymous namespace

std::string to_string(RunMode mode) {
    return mode == RunMode::Development ? "development" : "production";
}

SupervisorConfig SupervisorConfig::defaults() {
    SupervisorConfig config;

    // 强制本地服务器模式，关闭更新检查、遥测提示和彩色输出
    config.child_env = {
        {"ELIZA_USE_LOCAL_SERVER", "true"},
        {"CI", "true"},
        {"NO_UPDATE_CHECK", "1"},
        {"ELIZA_TEST_MODE", "true"},
        {"ELIZA_CLI_TEST_MODE", "true"},
        {"ELIZA_SKIP_LOCAL_CLI_DELEGATION", "true"},
        {"npm_config_update_notifier", "false"},
        {"NO_COLOR", "true"},
    };

    const auto& id = config.identity;
    config.fallback_paths = {
        fs::path("/opt") / id.org_dir / id.project_name,
        fs::path("/usr/local/share") / id.org_dir / id.project_name,
        fs::path("/srv") / id.org_dir / id.project_name,
    };

    return config;
}

void SupervisorConfig::apply_environment(const EnvLookup& env) {
    if (auto port = env("SIDECAR_PORT")) {
        endpoint.port = parse_port(*port, "SIDECAR_PORT");
    }
    if (auto host = env("SIDECAR_HOST"); host && !host->empty()) {
        endpoint.host = *host;
    }
    if (auto bridge = env("SIDECAR_BRIDGE_PORT")) {
        bridge_port = parse_port(*bridge, "SIDECAR_BRIDGE_PORT", true);
    }
    if (auto attempts = env("SIDECAR_READY_ATTEMPTS")) {
        readiness_attempts = parse_positive(*attempts, "SIDECAR_READY_ATTEMPTS");
    }
    if (auto fallbacks = env("SIDECAR_FALLBACK_PATHS")) {
        fallback_paths = split_path_list(*fallbacks);
    }
    if (env("SIDECAR_NO_DIALOG")) {
        console_only_errors = true;
    }
}

int parse_port(const std::string& text, const std::string& source, bool allow_zero) {
    std::size_t consumed = 0;
    int value = -1;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(source + ": invalid port '" + text + "'");
    }

    const int lowest = allow_zero ? 0 : 1;
    if (consumed != text.size() || value < lowest || value > 65535) {
        throw ConfigError(source + ": port out of range '" + text + "'");
    }
    return value;
}

RunMode resolve_run_mode(const SupervisorConfig& config, const EnvLookup& env) {
    if (config.run_mode_override) {
        return *config.run_mode_override;
    }
    if (env(config.dev_mode_env)) {
        return RunMode::Development;
    }
    return is_debug_build() ? RunMode::Development : RunMode::Production;
}

bool is_debug_build() {
#ifdef NDEBUG
    return false;
#else
    return true;
#endif
}

} // namespace sidecar
