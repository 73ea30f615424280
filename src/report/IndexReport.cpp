#include "IndexReport.hpp"

using json = nlohmann::json;

namespace fxprobe::report
{

json IndexReport::ToJson(const FrameworkVersion& version)
{
    json out;
    out["version"] = version.toString();
    out["major"] = version.major();
    out["minor"] = version.minor();
    out["patch"] = version.patch();
    out["prerelease"] = version.extra();
    return out;
}

json IndexReport::ToJson(const FrameworkPaths& group)
{
    json paths = json::array();
    for (const auto& path : group.paths())
        paths.push_back(path.string());

    json out;
    out["bitness"] = ToInt(group.bitness());
    out["version"] = ToJson(group.version());
    out["has_runtime_app"] = group.hasRuntimeAppPath();
    out["paths"] = std::move(paths);
    return out;
}

json IndexReport::ToJson(const FrameworkIndex& index)
{
    json groups = json::array();
    for (const auto& group : index.groups())
        groups.push_back(ToJson(group));

    json out;
    out["groups"] = std::move(groups);
    return out;
}

json IndexReport::ResolutionToJson(int major, int minor, Bitness bitness, const FrameworkPaths* result)
{
    json out;
    out["request"] = { { "major", major }, { "minor", minor }, { "bitness", ToInt(bitness) } };
    out["result"] = result ? ToJson(*result) : json(nullptr);
    return out;
}

} // namespace fxprobe::report
