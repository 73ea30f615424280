#pragma once

#include "../discovery/InstallEnumerator.hpp"
#include "../runtime/Bitness.hpp"
#include "../runtime/FrameworkVersion.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fxprobe
{

// Framework version directories of one install root that share a bitness
// and a version (all prerelease labels of a release count as one version).
// Resolution hands out the whole group, eg. the NETCore, AspNetCore and
// WindowsDesktop directories of 3.1.7.
class FrameworkPaths
{
public:
    // members must be non-empty; their order is kept
    FrameworkPaths(const std::vector<FrameworkPath>& members, const std::string& primaryFamily);

    const std::vector<std::filesystem::path>& paths() const { return paths_; }

    Bitness bitness() const { return bitness_; }

    // Version of the first member
    const FrameworkVersion& version() const { return version_; }

    // Version answered by reverse lookups; same member as version()
    const FrameworkVersion& reportedVersion() const { return version_; }

    // True when one of the members is the primary runtime family
    bool hasRuntimeAppPath() const { return has_runtime_app_path_; }

    // Upper-cased install root directory
    const std::string& installRootKey() const { return install_root_key_; }

    static std::string InstallRootKeyOf(const std::filesystem::path& versionDirectory);

private:
    std::vector<std::filesystem::path> paths_;
    Bitness bitness_;
    FrameworkVersion version_;
    bool has_runtime_app_path_ = false;
    std::string install_root_key_;
};

// Search order: bitness, then version (stable after prerelease), then the
// primary-runtime flag and install root so equal versions sort reproducibly
bool operator<(const FrameworkPaths& a, const FrameworkPaths& b);

} // namespace fxprobe
