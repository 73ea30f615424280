#include "InstallEnumerator.hpp"
#include "../utils/ErrorReporter.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <plog/Log.h>

namespace fxprobe
{

FrameworkPath::FrameworkPath(std::filesystem::path path, Bitness bitness, FrameworkVersion version)
    : path(std::move(path)), bitness(bitness), version(std::move(version))
{
    if (this->path.empty())
        throw std::invalid_argument("FrameworkPath requires a directory");
}

InstallEnumerator::InstallEnumerator(std::string sharedDirectory) : shared_directory_(std::move(sharedDirectory))
{
}

std::vector<FrameworkPath> InstallEnumerator::Enumerate(const InstallRoot& root) const
{
    std::vector<FrameworkPath> paths;

    std::error_code ec;
    auto sharedDir = root.directory / shared_directory_;
    if (!std::filesystem::is_directory(sharedDir, ec))
    {
        PLOG_DEBUG << "No " << shared_directory_ << " directory in " << root.directory.string();
        return paths;
    }

    // Known families: Microsoft.NETCore.App, Microsoft.WindowsDesktop.App,
    // Microsoft.AspNetCore.All, Microsoft.AspNetCore.App
    auto families = ListDirectories(sharedDir, ec);
    if (ec)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Discovery,
                                            "Skipping runtime install with an unreadable frameworks directory",
                                            sharedDir.string() + ": " + ec.message());
        return paths;
    }

    for (const auto& familyDir : families)
    {
        for (const auto& versionDir : ListDirectories(familyDir, ec))
        {
            try
            {
                // Every later string conversion of this path is a prefix of this one
                const std::string display = versionDir.string();
                auto version = FrameworkVersion::fromDirectoryName(versionDir.filename().string());
                if (!version)
                {
                    PLOG_VERBOSE << "Ignoring non-version directory " << display;
                    continue;
                }
                paths.emplace_back(versionDir, root.bitness, *version);
            }
            catch (const std::system_error& e)
            {
                // Names without a narrow representation (Windows code pages)
                PLOG_DEBUG << "Skipping framework directory: " << e.what();
            }
        }
    }

    PLOG_DEBUG << root.directory.string() << ": " << paths.size() << " framework version(s)";
    return paths;
}

std::vector<FrameworkPath> InstallEnumerator::EnumerateAll(const std::vector<InstallRoot>& roots) const
{
    std::vector<FrameworkPath> all;
    for (const auto& root : roots)
    {
        auto paths = Enumerate(root);
        all.insert(all.end(), std::make_move_iterator(paths.begin()), std::make_move_iterator(paths.end()));
    }
    return all;
}

std::vector<std::filesystem::path> InstallEnumerator::ListDirectories(const std::filesystem::path& dir,
                                                                    std::error_code& ec)
{
    std::vector<std::filesystem::path> dirs;

    ec.clear();
    std::filesystem::directory_iterator it(dir, ec);
    if (ec)
    {
        PLOG_DEBUG << "Cannot list directory: " << ec.message();
        return dirs;
    }

    for (; it != std::filesystem::directory_iterator(); it.increment(ec))
    {
        if (ec)
            break;
        std::error_code typeEc;
        if (it->is_directory(typeEc))
            dirs.push_back(it->path());
    }
    if (ec)
    {
        PLOG_DEBUG << "Directory listing aborted: " << ec.message();
        return {};
    }

    std::sort(dirs.begin(), dirs.end());
    return dirs;
}

} // namespace fxprobe
