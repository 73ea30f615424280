#include "RuntimePathProvider.hpp"
#include "Resolver.hpp"
#include "../discovery/InstallEnumerator.hpp"
#include "../discovery/InstallScanner.hpp"
#include "../utils/PathUtils.hpp"

#include <stdexcept>
#include <utility>

#include <plog/Log.h>

namespace fxprobe
{

RuntimePathProvider::RuntimePathProvider(const platform::IEnvironment& environment,
                                         const config::DiscoverySettings& settings)
    : index_(Scan(environment, settings))
{
}

RuntimePathProvider::RuntimePathProvider(FrameworkIndex index) : index_(std::move(index))
{
}

FrameworkIndex RuntimePathProvider::Scan(const platform::IEnvironment& environment,
                                         const config::DiscoverySettings& settings)
{
    InstallScanner scanner(environment, settings);
    InstallEnumerator enumerator(settings.shared_directory);

    auto roots = scanner.FindInstallRoots();
    auto paths = enumerator.EnumerateAll(roots);
    return FrameworkIndex::Build(paths, settings.primary_family);
}

const FrameworkPaths* RuntimePathProvider::TryGetFrameworkPaths(int major, int minor, Bitness bitness) const
{
    return Resolver::Resolve(index_, major, minor, bitness);
}

std::optional<std::vector<std::filesystem::path>> RuntimePathProvider::TryGetPaths(int major, int minor,
                                                                                   Bitness bitness) const
{
    const FrameworkPaths* info = TryGetFrameworkPaths(major, minor, bitness);
    if (!info)
        return std::nullopt;
    return info->paths();
}

std::optional<FrameworkVersion> RuntimePathProvider::TryGetVersion(const std::filesystem::path& file) const
{
    if (file.empty())
        throw std::invalid_argument("TryGetVersion requires a file path");

    for (const auto& info : index_.groups())
    {
        for (const auto& path : info.paths())
        {
            if (utils::PathUtils::IsFileInDir(path, file))
                return info.reportedVersion();
        }
    }

    PLOG_VERBOSE << file.string() << " is not part of an installed runtime";
    return std::nullopt;
}

} // namespace fxprobe
