#include "FrameworkIndex.hpp"

#include <algorithm>
#include <functional>
#include <unordered_map>
#include <utility>

#include <plog/Log.h>

namespace fxprobe
{

namespace
{

struct GroupKey
{
    std::string installRoot;
    Bitness bitness;
    FrameworkVersionKey version;

    bool operator==(const GroupKey& other) const = default;
};

struct GroupKeyHash
{
    size_t operator()(const GroupKey& key) const
    {
        size_t h = std::hash<std::string>{}(key.installRoot);
        auto mix = [&h](size_t v)
        {
            h ^= v + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        };
        mix(static_cast<size_t>(ToInt(key.bitness)));
        mix(static_cast<size_t>(key.version.major));
        mix(static_cast<size_t>(key.version.minor));
        mix(static_cast<size_t>(key.version.patch));
        mix(key.version.prerelease ? 1 : 0);
        return h;
    }
};

} // namespace

FrameworkIndex::FrameworkIndex(std::vector<FrameworkPaths> groups) : groups_(std::move(groups))
{
}

FrameworkIndex FrameworkIndex::Build(const std::vector<FrameworkPath>& paths, const std::string& primaryFamily)
{
    // Members per key, keys in order of first appearance
    std::unordered_map<GroupKey, size_t, GroupKeyHash> slots;
    std::vector<std::vector<FrameworkPath>> members;

    for (const auto& path : paths)
    {
        GroupKey key{ FrameworkPaths::InstallRootKeyOf(path.path), path.bitness,
                      FrameworkVersionKey::of(path.version) };
        auto [it, inserted] = slots.try_emplace(std::move(key), members.size());
        if (inserted)
            members.emplace_back();
        members[it->second].push_back(path);
    }

    std::vector<FrameworkPaths> groups;
    groups.reserve(members.size());
    for (const auto& group : members)
        groups.emplace_back(group, primaryFamily);

    std::stable_sort(groups.begin(), groups.end());

    PLOG_INFO << "Indexed " << paths.size() << " framework path(s) into " << groups.size() << " group(s)";
    return FrameworkIndex(std::move(groups));
}

} // namespace fxprobe
