#pragma once

#include <compare>
#include <optional>
#include <string>

namespace fxprobe
{

// Version of a shared framework directory (major.minor.patch[-extra])
class FrameworkVersion
{
public:
    // Default constructor (0.0.0)
    FrameworkVersion();

    FrameworkVersion(int major, int minor, int patch, std::string extra = {});

    int major() const { return major_; }

    int minor() const { return minor_; }

    int patch() const { return patch_; }

    // Prerelease label, empty for a stable release
    const std::string& extra() const { return extra_; }

    bool isPrerelease() const { return !extra_.empty(); }

    // Convert to string (e.g., "3.0.0-preview-27216-02")
    std::string toString() const;

    // Parse a version directory name ("3.1.7" or "3.0.0-preview-18579-0056").
    // Returns nullopt for names that are not version directories.
    static std::optional<FrameworkVersion> fromDirectoryName(const std::string& name);

    // Orders by major, minor, patch; a stable release sorts after every
    // prerelease of the same major.minor.patch, prereleases by label.
    std::strong_ordering operator<=>(const FrameworkVersion& other) const;
    bool operator==(const FrameworkVersion& other) const = default;

private:
    int major_;
    int minor_;
    int patch_;
    std::string extra_;
};

// Grouping key that treats every prerelease label of a major.minor.patch as
// the same version. Preview builds of one release ship framework families
// with different build suffixes, eg.:
//      shared/Microsoft.AspNetCore.App/3.0.0-preview-18579-0056
//      shared/Microsoft.NETCore.App/3.0.0-preview-27216-02
struct FrameworkVersionKey
{
    int major = 0;
    int minor = 0;
    int patch = 0;
    bool prerelease = false;

    static FrameworkVersionKey of(const FrameworkVersion& version)
    {
        return { version.major(), version.minor(), version.patch(), version.isPrerelease() };
    }

    bool operator==(const FrameworkVersionKey& other) const = default;
};

} // namespace fxprobe
