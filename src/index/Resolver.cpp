#include "Resolver.hpp"

#include <stdexcept>

#include <plog/Log.h>

namespace fxprobe
{

const FrameworkPaths* Resolver::Resolve(const FrameworkIndex& index, int major, int minor, Bitness bitness)
{
    if (major < 0 || minor < 0)
        throw std::invalid_argument("Requested runtime version must not be negative");

    const Bitness other = OtherBitness(bitness);
    const FrameworkPaths* found = nullptr;

    found = FindMajorMinor(index, major, minor, bitness);
    if (!found)
        found = FindMajorMinor(index, major, minor, other);
    if (!found)
        found = FindMajor(index, major, bitness);
    if (!found)
        found = FindMajor(index, major, other);
    if (!found)
        found = FindAny(index, bitness);
    if (!found)
        found = FindAny(index, other);

    if (found)
    {
        PLOG_DEBUG << "Resolved " << major << "." << minor << " (" << ToInt(bitness) << "-bit) to "
                   << found->version().toString() << " (" << ToInt(found->bitness()) << "-bit)";
    }
    else
    {
        PLOG_DEBUG << "No installed runtime for " << major << "." << minor << " (" << ToInt(bitness) << "-bit)";
    }
    return found;
}

std::uint32_t Resolver::MinorDistance(int requestedMinor, int minor)
{
    if (minor >= requestedMinor)
        return static_cast<std::uint32_t>(minor - requestedMinor);
    return 0x80000000u + static_cast<std::uint32_t>(requestedMinor) - static_cast<std::uint32_t>(minor) - 1;
}

const FrameworkPaths& Resolver::BestMinorVersion(int requestedMinor, const FrameworkPaths& incumbent,
                                                 const FrameworkPaths& candidate)
{
    std::uint32_t di = MinorDistance(requestedMinor, incumbent.version().minor());
    std::uint32_t dc = MinorDistance(requestedMinor, candidate.version().minor());
    if (di < dc)
        return incumbent;
    if (dc < di)
        return candidate;
    if (candidate.version().isPrerelease())
        return incumbent;
    if (incumbent.version().isPrerelease())
        return candidate;
    return incumbent;
}

const FrameworkPaths* Resolver::FindMajorMinor(const FrameworkIndex& index, int major, int minor, Bitness bitness)
{
    const auto& groups = index.groups();
    const FrameworkPaths* bestMajor = nullptr;
    const FrameworkPaths* exactMinor = nullptr;

    for (auto it = groups.rbegin(); it != groups.rend(); ++it)
    {
        const FrameworkPaths& info = *it;
        if (info.bitness() != bitness || info.version().major() != major)
            continue;

        bestMajor = bestMajor ? &BestMinorVersion(minor, *bestMajor, info) : &info;

        if (info.version().minor() == minor)
        {
            if (info.hasRuntimeAppPath())
                return &info;
            if (!exactMinor)
                exactMinor = &info;
        }
    }
    return exactMinor ? exactMinor : bestMajor;
}

const FrameworkPaths* Resolver::FindMajor(const FrameworkIndex& index, int major, Bitness bitness)
{
    const auto& groups = index.groups();
    const FrameworkPaths* first = nullptr;

    for (auto it = groups.rbegin(); it != groups.rend(); ++it)
    {
        if (it->bitness() != bitness || it->version().major() != major)
            continue;
        if (it->hasRuntimeAppPath())
            return &*it;
        if (!first)
            first = &*it;
    }
    return first;
}

const FrameworkPaths* Resolver::FindAny(const FrameworkIndex& index, Bitness bitness)
{
    const auto& groups = index.groups();
    const FrameworkPaths* first = nullptr;

    for (auto it = groups.rbegin(); it != groups.rend(); ++it)
    {
        if (it->bitness() != bitness)
            continue;
        if (it->hasRuntimeAppPath())
            return &*it;
        if (!first)
            first = &*it;
    }
    return first;
}

} // namespace fxprobe
