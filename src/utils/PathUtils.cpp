#include "PathUtils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <type_traits>

namespace fxprobe::utils
{

namespace
{

bool IsSeparator(char c) { return c == '/' || c == '\\'; }

bool PrefixMatches(const std::string& str, const std::string& prefix)
{
#ifdef _WIN32
    return PathUtils::EqualsIgnoreCase(str.substr(0, prefix.length()), prefix);
#else
    return str.compare(0, prefix.length(), prefix) == 0;
#endif
}

} // namespace

std::string PathUtils::ToUpper(const std::string& str)
{
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c)
                   {
                       return static_cast<char>(std::toupper(c));
                   });
    return result;
}

bool PathUtils::EqualsIgnoreCase(const std::string& a, const std::string& b)
{
    return a.length() == b.length() && ToUpper(a) == ToUpper(b);
}

bool PathUtils::FileNameEqualsIgnoreCase(const std::filesystem::path& name, const std::string& expected)
{
    using unit_type = std::make_unsigned_t<std::filesystem::path::value_type>;

    const auto& native = name.native();
    if (native.length() != expected.length())
        return false;

    for (size_t i = 0; i < native.length(); ++i)
    {
        auto actual = static_cast<std::uint32_t>(static_cast<unit_type>(native[i]));
        auto wanted = static_cast<std::uint32_t>(static_cast<unsigned char>(expected[i]));
        if (actual < 0x80 && wanted < 0x80)
        {
            actual = static_cast<std::uint32_t>(std::toupper(static_cast<int>(actual)));
            wanted = static_cast<std::uint32_t>(std::toupper(static_cast<int>(wanted)));
        }
        if (actual != wanted)
            return false;
    }
    return true;
}

std::string PathUtils::Trim(const std::string& str)
{
    auto notSpace = [](unsigned char c)
    {
        return !std::isspace(c);
    };
    auto first = std::find_if(str.begin(), str.end(), notSpace);
    auto last = std::find_if(str.rbegin(), str.rend(), notSpace).base();
    if (first >= last)
        return {};
    return std::string(first, last);
}

std::filesystem::path PathUtils::Normalize(const std::string& path)
{
    std::filesystem::path normalized = std::filesystem::path(Trim(path)).lexically_normal();
    if (!normalized.has_filename() && normalized.has_relative_path())
        normalized = normalized.parent_path();
    return normalized.parent_path() / normalized.filename();
}

std::string PathUtils::ComparisonKey(const std::filesystem::path& path)
{
    return ToUpper(path.lexically_normal().string());
}

bool PathUtils::IsFileInDir(const std::filesystem::path& dir, const std::filesystem::path& file)
{
    std::string dirStr = Normalize(dir.string()).string();
    std::string fileStr = file.lexically_normal().string();
    if (dirStr.empty() || fileStr.length() < dirStr.length() + 1)
        return false;
    if (!PrefixMatches(fileStr, dirStr))
        return false;
    // A root such as "/" already ends with its separator
    if (IsSeparator(dirStr.back()))
        return true;
    return IsSeparator(fileStr[dirStr.length()]);
}

} // namespace fxprobe::utils
