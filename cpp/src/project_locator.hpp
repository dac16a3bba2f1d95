#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "diagnostic_logger.hpp"
#include "supervisor_config.hpp"

namespace sidecar {

/**
 * 候选路径来源，按优先级从高到低排列
 */
enum class CandidateSource {
    EnvironmentOverride,
    HomeConvention,
    ExecutableAncestor,
    WorkingDirAncestor,
    Fallback,
};

std::string to_string(CandidateSource source);

struct Candidate {
    CandidateSource source;
    std::filesystem::path path;
};

/**
 * manifest 与项目名称的匹配方式
 */
enum class ManifestMatch {
    None,
    ExactName,   // "name": "<project>"
    CompactName, // "name":"<project>"
    Substring,   // 文件中任意位置出现 <project>
};

std::string to_string(ManifestMatch match);

/**
 * LocatorInputs - 搜索所需的外部信息
 *
 * 缺失的项对应的搜索策略直接跳过。
 */
struct LocatorInputs {
    std::optional<std::filesystem::path> override_path;
    std::optional<std::filesystem::path> home_dir;
    std::optional<std::filesystem::path> executable_path;
    std::optional<std::filesystem::path> working_dir;
    std::vector<std::filesystem::path> fallback_paths;
};

/**
 * ProjectLocator - 在多个约定位置中查找目标项目目录
 *
 * 搜索顺序：
 * 1. 环境变量指定的路径
 * 2. 用户主目录下的常见开发目录
 * 3. 从可执行文件所在目录向上最多 15 层
 * 4. 从当前工作目录向上最多 10 层
 * 5. 硬编码的回退路径
 *
 * 每个候选路径先规范化（不存在则跳过），再检查 manifest 身份。
 */
class ProjectLocator {
public:
    static constexpr int kExecutableWalkDepth = 15;
    static constexpr int kWorkingDirWalkDepth = 10;

    ProjectLocator(ProjectIdentity identity,
                   LocatorInputs inputs,
                   std::shared_ptr<DiagnosticLogger> logger);

    /**
     * 从当前进程收集搜索输入（环境变量、可执行文件路径、工作目录）
     */
    static LocatorInputs inputs_from_process(const SupervisorConfig& config,
                                             const PlatformProfile& profile,
                                             const EnvLookup& env);

    /**
     * 查找项目目录
     * @return 第一个通过校验的规范化路径；都不通过时返回 std::nullopt
     */
    std::optional<std::filesystem::path> locate() const;

    /**
     * 按优先级排列的全部候选路径（未规范化）
     */
    std::vector<Candidate> candidates() const;

    /**
     * 检查 manifest 的项目名称
     */
    static ManifestMatch match_manifest(const std::filesystem::path& dir, const ProjectIdentity& identity);

    /**
     * 目录存在、是目录、包含 manifest 且 manifest 声明了项目名称
     */
    static bool is_valid_project_dir(const std::filesystem::path& dir, const ProjectIdentity& identity);

private:
    void add_ancestor_walk(std::vector<Candidate>& out,
                           const std::filesystem::path& start,
                           int depth,
                           CandidateSource source,
                           bool include_sibling) const;

    ProjectIdentity identity_;
    LocatorInputs inputs_;
    std::shared_ptr<DiagnosticLogger> logger_;
};

/**
 * 当前可执行文件的路径
 */
std::optional<std::filesystem::path> current_executable_path();

} // namespace sidecar
