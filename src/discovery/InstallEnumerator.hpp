#pragma once

#include "InstallScanner.hpp"
#include "../runtime/Bitness.hpp"
#include "../runtime/FrameworkVersion.hpp"

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace fxprobe
{

// One version directory of one framework family,
// eg. <root>/shared/Microsoft.NETCore.App/3.1.7
struct FrameworkPath
{
    FrameworkPath(std::filesystem::path path, Bitness bitness, FrameworkVersion version);

    std::filesystem::path path;
    Bitness bitness;
    FrameworkVersion version;
};

// Lists <root>/<shared>/<family>/<version> directories of an install root
class InstallEnumerator
{
public:
    explicit InstallEnumerator(std::string sharedDirectory = "shared");

    std::vector<FrameworkPath> Enumerate(const InstallRoot& root) const;

    std::vector<FrameworkPath> EnumerateAll(const std::vector<InstallRoot>& roots) const;

private:
    // Immediate child directories sorted by name. Empty with ec set when the
    // directory cannot be listed completely.
    static std::vector<std::filesystem::path> ListDirectories(const std::filesystem::path& dir, std::error_code& ec);

    std::string shared_directory_;
};

} // namespace fxprobe
