#pragma once

#include <filesystem>
#include <string>

namespace fxprobe::utils
{

// Lexical path helpers. Nothing here touches the filesystem or resolves links.
class PathUtils
{
public:
    static std::string ToUpper(const std::string& str);

    static bool EqualsIgnoreCase(const std::string& a, const std::string& b);

    // Compares a file name to an ASCII name without a narrow conversion of
    // the path, so names outside the active code page simply do not match
    static bool FileNameEqualsIgnoreCase(const std::filesystem::path& name, const std::string& expected);

    static std::string Trim(const std::string& str);

    // Trims, folds "." and ".." segments and drops a trailing separator
    static std::filesystem::path Normalize(const std::string& path);

    // Identity used for case-insensitive comparison of directories
    static std::string ComparisonKey(const std::filesystem::path& path);

    // True when file lies anywhere below dir
    static bool IsFileInDir(const std::filesystem::path& dir, const std::filesystem::path& file);
};

} // namespace fxprobe::utils
