#include "InstallScanner.hpp"
#include "../platform/ExecutableInspector.hpp"
#include "../utils/PathUtils.hpp"

#include <system_error>
#include <unordered_set>
#include <utility>

#include <plog/Log.h>

namespace fxprobe
{

InstallScanner::InstallScanner(const platform::IEnvironment& environment, const config::DiscoverySettings& settings)
    : environment_(environment), settings_(settings)
{
}

std::vector<std::string> InstallScanner::CollectCandidates() const
{
    std::vector<std::string> candidates;

    for (const auto& name : settings_.environment_variables)
    {
        auto value = environment_.GetVariable(name);
        if (!value)
            continue;
        for (auto& entry : platform::SplitPathList(*value, environment_.PathListSeparator()))
            candidates.push_back(std::move(entry));
    }

    for (const auto& root : environment_.GetStandardInstallRoots())
    {
        if (!root.empty())
            candidates.push_back((root / settings_.runtime_directory).string());
    }

    for (const auto& dir : settings_.search_directories)
        candidates.push_back(dir);

    return candidates;
}

std::vector<InstallRoot> InstallScanner::FindInstallRoots() const
{
    std::vector<InstallRoot> roots;
    std::unordered_set<std::string> seen;

    for (const auto& candidate : CollectCandidates())
    {
        std::filesystem::path directory = utils::PathUtils::Normalize(candidate);
        if (directory.empty())
            continue;
        if (!seen.insert(utils::PathUtils::ComparisonKey(directory)).second)
            continue;

        if (auto root = ProbeCandidate(directory))
            roots.push_back(*root);
    }

    PLOG_INFO << "Found " << roots.size() << " runtime install root(s)";
    return roots;
}

std::optional<InstallRoot> InstallScanner::ProbeCandidate(const std::filesystem::path& directory) const
{
    try
    {
        std::error_code ec;
        if (!std::filesystem::is_directory(directory, ec))
        {
            PLOG_VERBOSE << "Skipping " << directory.string() << ": not a directory";
            return std::nullopt;
        }

        auto launcher = directory / settings_.launcher;
        if (!std::filesystem::is_regular_file(launcher, ec))
        {
            PLOG_VERBOSE << "Skipping " << directory.string() << ": no " << settings_.launcher;
            return std::nullopt;
        }

        auto bitness = platform::ExecutableInspector::DetectBitness(launcher);
        if (!bitness)
        {
            PLOG_DEBUG << "Skipping " << directory.string() << ": launcher bitness unknown";
            return std::nullopt;
        }

        PLOG_DEBUG << "Install root " << directory.string() << " (" << ToInt(*bitness) << "-bit)";
        return InstallRoot{ directory, *bitness };
    }
    catch (const std::system_error& e)
    {
        // Path conversion of malformed entries can throw on some platforms
        PLOG_DEBUG << "Skipping candidate: " << e.what();
        return std::nullopt;
    }
}

} // namespace fxprobe
