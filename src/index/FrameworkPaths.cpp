#include "FrameworkPaths.hpp"
#include "../utils/PathUtils.hpp"

#include <stdexcept>

namespace fxprobe
{

FrameworkPaths::FrameworkPaths(const std::vector<FrameworkPath>& members, const std::string& primaryFamily)
    : bitness_(Bitness::Bits64)
{
    if (members.empty())
        throw std::invalid_argument("FrameworkPaths requires at least one framework path");

    const FrameworkPath& first = members.front();
    bitness_ = first.bitness;
    version_ = first.version;
    install_root_key_ = InstallRootKeyOf(first.path);

    paths_.reserve(members.size());
    for (const auto& member : members)
    {
        paths_.push_back(member.path);
        if (utils::PathUtils::FileNameEqualsIgnoreCase(member.path.parent_path().filename(), primaryFamily))
            has_runtime_app_path_ = true;
    }
}

std::string FrameworkPaths::InstallRootKeyOf(const std::filesystem::path& versionDirectory)
{
    // <root>/shared/<family>/<version> -> <root>/shared
    return utils::PathUtils::ComparisonKey(versionDirectory.parent_path().parent_path());
}

bool operator<(const FrameworkPaths& a, const FrameworkPaths& b)
{
    if (a.bitness() != b.bitness())
        return ToInt(a.bitness()) < ToInt(b.bitness());
    if (auto c = a.version() <=> b.version(); c != 0)
        return c < 0;
    if (a.hasRuntimeAppPath() != b.hasRuntimeAppPath())
        return !a.hasRuntimeAppPath();
    return a.installRootKey() < b.installRootKey();
}

} // namespace fxprobe
