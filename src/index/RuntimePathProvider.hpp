#pragma once

#include "FrameworkIndex.hpp"
#include "../config/ProbeConfig.hpp"
#include "../platform/Environment.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace fxprobe
{

// Snapshot of the runtimes installed on this machine.
// Scans once on construction; construct a new provider to rescan.
// All queries are const and may run concurrently.
class RuntimePathProvider
{
public:
    RuntimePathProvider(const platform::IEnvironment& environment, const config::DiscoverySettings& settings);

    explicit RuntimePathProvider(FrameworkIndex index);

    bool HasInstalls() const { return !index_.empty(); }

    // Best group for the requested runtime, nullptr when nothing is installed
    const FrameworkPaths* TryGetFrameworkPaths(int major, int minor, Bitness bitness) const;

    // Framework directories of the best group
    std::optional<std::vector<std::filesystem::path>> TryGetPaths(int major, int minor, Bitness bitness) const;

    // Version of the install containing file. Throws std::invalid_argument
    // for an empty path.
    std::optional<FrameworkVersion> TryGetVersion(const std::filesystem::path& file) const;

    const FrameworkIndex& index() const { return index_; }

private:
    static FrameworkIndex Scan(const platform::IEnvironment& environment, const config::DiscoverySettings& settings);

    FrameworkIndex index_;
};

} // namespace fxprobe
