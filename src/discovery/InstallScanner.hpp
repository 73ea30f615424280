#pragma once

#include "../config/ProbeConfig.hpp"
#include "../platform/Environment.hpp"
#include "../runtime/Bitness.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fxprobe
{

// A directory holding the runtime launcher and its shared frameworks
struct InstallRoot
{
    std::filesystem::path directory;
    Bitness bitness;
};

// Finds runtime install roots from environment variables and OS install
// locations. Best effort: candidates that cannot be probed are skipped.
class InstallScanner
{
public:
    InstallScanner(const platform::IEnvironment& environment, const config::DiscoverySettings& settings);

    // Raw candidate directories in source order, before any filtering
    std::vector<std::string> CollectCandidates() const;

    // Deduplicated install roots whose launcher bitness is known
    std::vector<InstallRoot> FindInstallRoots() const;

private:
    std::optional<InstallRoot> ProbeCandidate(const std::filesystem::path& directory) const;

    const platform::IEnvironment& environment_;
    const config::DiscoverySettings& settings_;
};

} // namespace fxprobe
