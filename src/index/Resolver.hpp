#pragma once

#include "FrameworkIndex.hpp"

#include <cstdint>

namespace fxprobe
{

// Picks the framework group that best matches a requested runtime version.
//
// Tiers, each tried with the requested bitness and then the other one:
//   1. same major: exact minor with the primary runtime wins at once,
//      otherwise any exact minor, otherwise the closest minor
//   2. same major, any minor
//   3. any version
// Every tier scans from the newest group down.
class Resolver
{
public:
    // Returns nullptr when the index has nothing usable.
    // Throws std::invalid_argument for a negative major or minor.
    static const FrameworkPaths* Resolve(const FrameworkIndex& index, int major, int minor, Bitness bitness);

    // 0 for an exact minor, growing with distance above the request; every
    // minor below the request ranks after every minor at or above it
    static std::uint32_t MinorDistance(int requestedMinor, int minor);

    // Closer minor wins; on a tie a stable release beats a prerelease and
    // the incumbent is kept otherwise
    static const FrameworkPaths& BestMinorVersion(int requestedMinor, const FrameworkPaths& incumbent,
                                                  const FrameworkPaths& candidate);

private:
    static const FrameworkPaths* FindMajorMinor(const FrameworkIndex& index, int major, int minor, Bitness bitness);
    static const FrameworkPaths* FindMajor(const FrameworkIndex& index, int major, Bitness bitness);
    static const FrameworkPaths* FindAny(const FrameworkIndex& index, Bitness bitness);
};

} // namespace fxprobe
