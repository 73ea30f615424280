#pragma once

#include "../index/FrameworkIndex.hpp"

#include <nlohmann/json.hpp>

namespace fxprobe::report
{

// JSON rendering of discovery results for the command line tool
class IndexReport
{
public:
    static nlohmann::json ToJson(const FrameworkVersion& version);

    static nlohmann::json ToJson(const FrameworkPaths& group);

    // {"groups": [...]} in search order
    static nlohmann::json ToJson(const FrameworkIndex& index);

    // Request plus the chosen group, "result" is null when nothing matched
    static nlohmann::json ResolutionToJson(int major, int minor, Bitness bitness, const FrameworkPaths* result);
};

} // namespace fxprobe::report
