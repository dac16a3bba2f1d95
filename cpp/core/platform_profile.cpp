#include "platform_profile.hpp"

#include <cstdlib>

namespace fs = std::filesystem;

namespace sidecar {

namespace {

// AppleScript 字符串中的引号和反斜杠需要转义
std::string escape_applescript(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        if (c == '"' || c == '\\') {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }
    return escaped;
}

} // anonymous namespace

std::optional<std::string> process_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

HostPlatform current_platform() {
#if defined(_WIN32)
    return HostPlatform::Windows;
#elif defined(__APPLE__)
    return HostPlatform::MacOS;
#else
    return HostPlatform::Linux;
#endif
}

PlatformProfile profile_for(HostPlatform platform) {
    PlatformProfile profile;
    profile.platform = platform;

    switch (platform) {
    case HostPlatform::Windows:
        // Windows 上 elizaos 通常通过 bun 安装，优先尝试 bunx
        profile.log_sink = LogSinkStrategy::WindowsAppData;
        profile.invocation = InvocationStrategy::PreferWrapper;
        profile.fatal_error = FatalErrorPresentation::Dialog;
        profile.home_env = "USERPROFILE";
        break;
    case HostPlatform::MacOS:
        profile.log_sink = LogSinkStrategy::MacApplicationSupport;
        profile.invocation = InvocationStrategy::DirectOnly;
        profile.fatal_error = FatalErrorPresentation::Dialog;
        profile.home_env = "HOME";
        break;
    case HostPlatform::Linux:
        profile.log_sink = LogSinkStrategy::XdgDataHome;
        profile.invocation = InvocationStrategy::DirectOnly;
        profile.fatal_error = FatalErrorPresentation::Dialog;
        profile.home_env = "HOME";
        break;
    }

    return profile;
}

std::string to_string(HostPlatform platform) {
    switch (platform) {
    case HostPlatform::Linux:
        return "linux";
    case HostPlatform::MacOS:
        return "macos";
    case HostPlatform::Windows:
        return "windows";
    }
    return "unknown";
}

std::optional<fs::path> resolve_app_data_dir(const PlatformProfile& profile,
                                             const std::string& app_name,
                                             const EnvLookup& env) {
    auto non_empty = [&env](const std::string& name) -> std::optional<std::string> {
        auto value = env(name);
        if (value && !value->empty()) {
            return value;
        }
        return std::nullopt;
    };

    switch (profile.log_sink) {
    case LogSinkStrategy::WindowsAppData:
        if (auto app_data = non_empty("APPDATA")) {
            return fs::path(*app_data) / app_name;
        }
        return std::nullopt;

    case LogSinkStrategy::MacApplicationSupport:
        if (auto home = non_empty(profile.home_env)) {
            return fs::path(*home) / "Library" / "Application Support" / app_name;
        }
        return std::nullopt;

    case LogSinkStrategy::XdgDataHome:
        if (auto data_home = non_empty("XDG_DATA_HOME")) {
            return fs::path(*data_home) / app_name;
        }
        if (auto home = non_empty(profile.home_env)) {
            return fs::path(*home) / ".local" / "share" / app_name;
        }
        return std::nullopt;
    }

    return std::nullopt;
}

std::vector<std::string> fatal_dialog_command(const PlatformProfile& profile,
                                              const std::string& title,
                                              const std::string& message) {
    if (profile.fatal_error != FatalErrorPresentation::Dialog) {
        return {};
    }

    switch (profile.platform) {
    case HostPlatform::Linux:
        return {"zenity", "--error", "--no-wrap", "--title=" + title, "--text=" + message};
    case HostPlatform::MacOS:
        return {"osascript", "-e",
                "display alert \"" + escape_applescript(title) + "\" message \"" +
                    escape_applescript(message) + "\" as critical"};
    case HostPlatform::Windows:
        return {"msg", "*", title + ": " + message};
    }

    return {};
}

} // namespace sidecar
