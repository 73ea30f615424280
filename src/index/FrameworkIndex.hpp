#pragma once

#include "FrameworkPaths.hpp"

#include <string>
#include <vector>

namespace fxprobe
{

// Sorted, immutable list of framework groups
class FrameworkIndex
{
public:
    FrameworkIndex() = default;

    // Groups paths by (install root, bitness, version ignoring prerelease
    // label) and sorts the groups into search order
    static FrameworkIndex Build(const std::vector<FrameworkPath>& paths, const std::string& primaryFamily);

    const std::vector<FrameworkPaths>& groups() const { return groups_; }

    bool empty() const { return groups_.empty(); }

    size_t size() const { return groups_.size(); }

private:
    explicit FrameworkIndex(std::vector<FrameworkPaths> groups);

    std::vector<FrameworkPaths> groups_;
};

} // namespace fxprobe
