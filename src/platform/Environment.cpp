#include "Environment.hpp"
#include "../utils/PathUtils.hpp"

#include <cstdlib>

namespace fxprobe::platform
{

std::optional<std::string> SystemEnvironment::GetVariable(const std::string& name) const
{
    const char* value = std::getenv(name.c_str());
    if (!value)
        return std::nullopt;
    return std::string(value);
}

std::vector<std::filesystem::path> SystemEnvironment::GetStandardInstallRoots() const
{
    std::vector<std::filesystem::path> roots;
#ifdef _WIN32
    std::string programFiles = GetVariable("ProgramFiles").value_or("");
    std::string programFilesX86 = GetVariable("ProgramFiles(x86)").value_or("");

    // A 32-bit process sees the x86 folder in both variables
    if (!programFiles.empty() && utils::PathUtils::EqualsIgnoreCase(programFiles, programFilesX86))
        programFiles = (std::filesystem::path(programFiles).parent_path() / "Program Files").string();

    if (!programFiles.empty())
        roots.emplace_back(programFiles);
    if (!programFilesX86.empty())
        roots.emplace_back(programFilesX86);
#else
    for (const char* root : { "/usr/share", "/usr/lib", "/usr/lib64", "/usr/local/share", "/opt" })
        roots.emplace_back(root);
#endif
    return roots;
}

char SystemEnvironment::PathListSeparator() const
{
#ifdef _WIN32
    return ';';
#else
    return ':';
#endif
}

std::vector<std::string> SplitPathList(const std::string& value, char separator)
{
    std::vector<std::string> entries;
    size_t start = 0;
    for (size_t i = 0; i <= value.length(); ++i)
    {
        if (i == value.length() || value[i] == separator)
        {
            if (i > start)
                entries.push_back(value.substr(start, i - start));
            start = i + 1;
        }
    }
    return entries;
}

} // namespace fxprobe::platform
