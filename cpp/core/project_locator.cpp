#include "project_locator.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

#if defined(__APPLE__)
#include <mach-o/dyld.h>
#endif

namespace fs = std::filesystem;

namespace sidecar {

namespace {

std::optional<fs::path> canonical_or_skip(const fs::path& path) {
    std::error_code ec;
    fs::path canonical = fs::canonical(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return canonical;
}

} // anonymous namespace

std::string to_string(CandidateSource source) {
    switch (source) {
    case CandidateSource::EnvironmentOverride:
        return "environment override";
    case CandidateSource::HomeConvention:
        return "home directory";
    case CandidateSource::ExecutableAncestor:
        return "executable ancestors";
    case CandidateSource::WorkingDirAncestor:
        return "working directory ancestors";
    case CandidateSource::Fallback:
        return "fallback paths";
    }
    return "unknown";
}

std::string to_string(ManifestMatch match) {
    switch (match) {
    case ManifestMatch::None:
        return "none";
    case ManifestMatch::ExactName:
        return "exact name";
    case ManifestMatch::CompactName:
        return "compact name";
    case ManifestMatch::Substring:
        return "substring";
    }
    return "unknown";
}

ProjectLocator::ProjectLocator(ProjectIdentity identity,
                               LocatorInputs inputs,
                               std::shared_ptr<DiagnosticLogger> logger)
    : identity_(std::move(identity)), inputs_(std::move(inputs)), logger_(std::move(logger)) {}

LocatorInputs ProjectLocator::inputs_from_process(const SupervisorConfig& config,
                                                  const PlatformProfile& profile,
                                                  const EnvLookup& env) {
    LocatorInputs inputs;

    if (auto override_path = env(config.project_path_env); override_path && !override_path->empty()) {
        inputs.override_path = fs::path(*override_path);
    }
    if (auto home = env(profile.home_env); home && !home->empty()) {
        inputs.home_dir = fs::path(*home);
    }
    inputs.executable_path = current_executable_path();

    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (!ec) {
        inputs.working_dir = cwd;
    }

    inputs.fallback_paths = config.fallback_paths;
    return inputs;
}

std::vector<Candidate> ProjectLocator::candidates() const {
    std::vector<Candidate> out;
    const auto& ws = identity_.workspace_dir;
    const auto& org = identity_.org_dir;
    const auto& project = identity_.project_name;

    // 1. 环境变量（最高优先级）
    if (inputs_.override_path) {
        out.push_back({CandidateSource::EnvironmentOverride, *inputs_.override_path});
    }

    // 2. 主目录下的常见开发位置
    if (inputs_.home_dir) {
        const fs::path& home = *inputs_.home_dir;
        const fs::path conventional[] = {
            home / ws / org / project,
            home / "Documents" / ws / org / project,
            home / "Desktop" / ws / org / project,
            home / "Projects" / ws / org / project,
            home / org / project,
            home / ws / project,
        };
        for (const auto& path : conventional) {
            out.push_back({CandidateSource::HomeConvention, path});
        }
    }

    // 3. 从可执行文件所在目录向上（安装版）
    if (inputs_.executable_path && inputs_.executable_path->has_parent_path()) {
        add_ancestor_walk(out, inputs_.executable_path->parent_path(), kExecutableWalkDepth,
                          CandidateSource::ExecutableAncestor, true);
    }

    // 4. 从当前工作目录向上
    if (inputs_.working_dir) {
        add_ancestor_walk(out, *inputs_.working_dir, kWorkingDirWalkDepth,
                          CandidateSource::WorkingDirAncestor, false);
    }

    // 5. 最后的回退路径
    for (const auto& path : inputs_.fallback_paths) {
        out.push_back({CandidateSource::Fallback, path});
    }

    return out;
}

void ProjectLocator::add_ancestor_walk(std::vector<Candidate>& out,
                                       const fs::path& start,
                                       int depth,
                                       CandidateSource source,
                                       bool include_sibling) const {
    fs::path current = start;
    for (int level = 0; level < depth; ++level) {
        out.push_back({source, current / identity_.org_dir / identity_.project_name});
        if (include_sibling) {
            out.push_back({source, current / identity_.project_name});
        }

        fs::path parent = current.parent_path();
        if (parent.empty() || parent == current) {
            break;
        }
        current = parent;
    }
}

std::optional<fs::path> ProjectLocator::locate() const {
    logger_->log("[ProjectLocator] Searching for ", identity_.project_name, " project...");

    if (inputs_.home_dir) {
        logger_->log("[ProjectLocator] Checking common dev locations from home: ", inputs_.home_dir->string());
    }
    if (inputs_.executable_path) {
        logger_->log("[ProjectLocator] Exe path: ", inputs_.executable_path->string());
    }
    if (inputs_.working_dir) {
        logger_->log("[ProjectLocator] Current working directory: ", inputs_.working_dir->string());
    }

    for (const auto& candidate : candidates()) {
        auto canonical = canonical_or_skip(candidate.path);
        if (!canonical) {
            if (candidate.source == CandidateSource::EnvironmentOverride) {
                logger_->log("[ProjectLocator] Override path does not exist: ", candidate.path.string());
            }
            continue;
        }

        ManifestMatch match = match_manifest(*canonical, identity_);
        if (match == ManifestMatch::None) {
            logger_->log("[ProjectLocator] Rejected ", canonical->string(), " (", to_string(candidate.source),
                         "): no ", identity_.manifest_file, " declaring ", identity_.project_name);
            continue;
        }

        logger_->log("[ProjectLocator] Found ", identity_.project_name, " via ", to_string(candidate.source),
                     ": ", canonical->string(), " (manifest match: ", to_string(match), ")");
        return canonical;
    }

    logger_->log("[ProjectLocator] Could not find ", identity_.project_name, " project directory in any location");
    return std::nullopt;
}

ManifestMatch ProjectLocator::match_manifest(const fs::path& dir, const ProjectIdentity& identity) {
    std::error_code ec;
    if (!fs::exists(dir, ec) || !fs::is_directory(dir, ec)) {
        return ManifestMatch::None;
    }

    const fs::path manifest = dir / identity.manifest_file;
    if (!fs::is_regular_file(manifest, ec)) {
        return ManifestMatch::None;
    }

    std::ifstream in(manifest, std::ios::binary);
    if (!in) {
        return ManifestMatch::None;
    }
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return ManifestMatch::None;
    }

    const std::string& name = identity.project_name;
    if (contents.find("\"name\": \"" + name + "\"") != std::string::npos) {
        return ManifestMatch::ExactName;
    }
    if (contents.find("\"name\":\"" + name + "\"") != std::string::npos) {
        return ManifestMatch::CompactName;
    }
    // TODO: 子串匹配可能误认依赖列表或注释中提到项目名的无关 manifest，需要解析 JSON 的 name 字段
    if (contents.find(name) != std::string::npos) {
        return ManifestMatch::Substring;
    }
    return ManifestMatch::None;
}

bool ProjectLocator::is_valid_project_dir(const fs::path& dir, const ProjectIdentity& identity) {
    return match_manifest(dir, identity) != ManifestMatch::None;
}

std::optional<fs::path> current_executable_path() {
#if defined(__APPLE__)
    uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);
    std::string buffer(size, '\0');
    if (_NSGetExecutablePath(buffer.data(), &size) != 0) {
        return std::nullopt;
    }
    buffer.resize(std::char_traits<char>::length(buffer.c_str()));
    return fs::path(buffer);
#else
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return std::nullopt;
    }
    return exe;
#endif
}

} // namespace sidecar
