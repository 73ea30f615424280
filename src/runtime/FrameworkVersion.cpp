#include "FrameworkVersion.hpp"

#include <regex>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace fxprobe
{

namespace
{

// Components are all digits, so only overflow can fail; it parses as 0
int ParseComponent(const std::string& digits)
{
    try
    {
        return std::stoi(digits);
    }
    catch (const std::out_of_range&)
    {
        return 0;
    }
}

} // namespace

FrameworkVersion::FrameworkVersion() : major_(0), minor_(0), patch_(0)
{
}

FrameworkVersion::FrameworkVersion(int major, int minor, int patch, std::string extra)
    : major_(major), minor_(minor), patch_(patch), extra_(std::move(extra))
{
}

std::string FrameworkVersion::toString() const
{
    std::ostringstream oss;
    oss << major_ << "." << minor_ << "." << patch_;
    if (!extra_.empty())
        oss << "-" << extra_;
    return oss.str();
}

std::optional<FrameworkVersion> FrameworkVersion::fromDirectoryName(const std::string& name)
{
    static const std::regex stableRegex(R"(^(\d+)\.(\d+)\.(\d+)$)");
    static const std::regex prereleaseRegex(R"(^(\d+)\.(\d+)\.(\d+)-(.+)$)");

    std::smatch match;
    if (std::regex_match(name, match, stableRegex))
    {
        return FrameworkVersion(ParseComponent(match[1].str()), ParseComponent(match[2].str()),
                                ParseComponent(match[3].str()));
    }

    if (std::regex_match(name, match, prereleaseRegex))
    {
        return FrameworkVersion(ParseComponent(match[1].str()), ParseComponent(match[2].str()),
                                ParseComponent(match[3].str()), match[4].str());
    }

    return std::nullopt;
}

std::strong_ordering FrameworkVersion::operator<=>(const FrameworkVersion& other) const
{
    if (auto c = major_ <=> other.major_; c != 0)
        return c;
    if (auto c = minor_ <=> other.minor_; c != 0)
        return c;
    if (auto c = patch_ <=> other.patch_; c != 0)
        return c;

    if (extra_.empty() != other.extra_.empty())
        return extra_.empty() ? std::strong_ordering::greater : std::strong_ordering::less;

    int c = extra_.compare(other.extra_);
    if (c < 0)
        return std::strong_ordering::less;
    if (c > 0)
        return std::strong_ordering::greater;
    return std::strong_ordering::equal;
}

} // namespace fxprobe
