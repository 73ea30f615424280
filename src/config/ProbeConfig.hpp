#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <plog/Severity.h>
#include <toml++/toml.h>

namespace fxprobe::config
{

struct DiscoverySettings
{
    // Scanned in order; each value is split on the path-list separator
    std::vector<std::string> environment_variables{ "PATH", "DOTNET_ROOT(x86)", "DOTNET_ROOT" };
#ifdef _WIN32
    std::string launcher = "dotnet.exe";
#else
    std::string launcher = "dotnet";
#endif
    // Joined onto every OS standard install root
    std::string runtime_directory = "dotnet";
    std::string shared_directory = "shared";
    std::string primary_family = "Microsoft.NETCore.App";
    std::vector<std::string> search_directories;
};

struct LoggingSettings
{
    std::string file = "logs/fxprobe.log";
    plog::Severity level = plog::info;
    bool append = true;
    bool console = false;
    size_t max_file_size = 10 * 1024 * 1024;
    size_t backup_count = 3;
};

struct ProbeConfig
{
    DiscoverySettings discovery;
    LoggingSettings logging;
};

// Loads ProbeConfig from TOML. Problems never fail the load: the affected
// keys keep their defaults and a Configuration warning is reported.
class ConfigLoader
{
public:
    static constexpr const char* kDefaultPath = "fxprobe.toml";

    // Missing file yields defaults without a warning
    static ProbeConfig LoadFile(const std::string& path);

    static ProbeConfig LoadString(const std::string& content, const std::string& sourceName = "<string>");

private:
    static void ApplyDiscovery(const toml::table& root, DiscoverySettings& out, const std::string& sourceName);
    static void ApplyLogging(const toml::table& root, LoggingSettings& out, const std::string& sourceName);
    static void ReportInvalid(const std::string& key, const std::string& sourceName);
};

} // namespace fxprobe::config
