#include "ProbeConfig.hpp"
#include "../utils/ErrorReporter.hpp"

#include <cstdint>
#include <fstream>
#include <sstream>
#include <utility>

#include <plog/Log.h>

namespace fxprobe::config
{

namespace
{

bool ReadStringArray(toml::node_view<const toml::node> node, std::vector<std::string>& out)
{
    const toml::array* array = node.as_array();
    if (!array)
        return false;

    std::vector<std::string> values;
    for (const auto& element : *array)
    {
        auto value = element.value<std::string>();
        if (!value)
            return false;
        values.push_back(*value);
    }
    out = std::move(values);
    return true;
}

bool ReadString(toml::node_view<const toml::node> node, std::string& out)
{
    auto value = node.value<std::string>();
    if (!value || value->empty())
        return false;
    out = *value;
    return true;
}

} // namespace

ProbeConfig ConfigLoader::LoadFile(const std::string& path)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
    {
        PLOG_DEBUG << "No configuration at " << path << ", using defaults";
        return ProbeConfig{};
    }

    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return LoadString(buffer.str(), path);
}

ProbeConfig ConfigLoader::LoadString(const std::string& content, const std::string& sourceName)
{
    ProbeConfig config;
    try
    {
        const toml::table root = toml::parse(content, sourceName);
        ApplyDiscovery(root, config.discovery, sourceName);
        ApplyLogging(root, config.logging, sourceName);
    }
    catch (const toml::parse_error& pe)
    {
        std::string details;
        if (pe.source().begin.line > 0)
            details = "Error at line " + std::to_string(pe.source().begin.line) + ": " + std::string(pe.description());
        else
            details = std::string(pe.description());

        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors. Using defaults.",
                                            details + "\nFile: " + sourceName);
        return ProbeConfig{};
    }
    return config;
}

void ConfigLoader::ApplyDiscovery(const toml::table& root, DiscoverySettings& out, const std::string& sourceName)
{
    const auto discovery = root["discovery"];
    if (!discovery)
        return;

    struct StringKey
    {
        const char* key;
        std::string* target;
    };
    const StringKey stringKeys[] = {
        { "launcher", &out.launcher },
        { "runtime_directory", &out.runtime_directory },
        { "shared_directory", &out.shared_directory },
        { "primary_family", &out.primary_family },
    };
    for (const auto& entry : stringKeys)
    {
        if (discovery[entry.key] && !ReadString(discovery[entry.key], *entry.target))
            ReportInvalid(std::string("discovery.") + entry.key, sourceName);
    }

    if (discovery["environment_variables"] &&
        !ReadStringArray(discovery["environment_variables"], out.environment_variables))
        ReportInvalid("discovery.environment_variables", sourceName);

    if (discovery["search_directories"] &&
        !ReadStringArray(discovery["search_directories"], out.search_directories))
        ReportInvalid("discovery.search_directories", sourceName);
}

void ConfigLoader::ApplyLogging(const toml::table& root, LoggingSettings& out, const std::string& sourceName)
{
    const auto logging = root["logging"];
    if (!logging)
        return;

    if (logging["file"] && !ReadString(logging["file"], out.file))
        ReportInvalid("logging.file", sourceName);

    if (logging["level"])
    {
        auto level = logging["level"].value<int64_t>();
        if (level && *level >= plog::none && *level <= plog::verbose)
            out.level = static_cast<plog::Severity>(*level);
        else
            ReportInvalid("logging.level", sourceName);
    }

    if (logging["append"])
    {
        if (auto append = logging["append"].value<bool>())
            out.append = *append;
        else
            ReportInvalid("logging.append", sourceName);
    }

    if (logging["console"])
    {
        if (auto console = logging["console"].value<bool>())
            out.console = *console;
        else
            ReportInvalid("logging.console", sourceName);
    }

    if (logging["max_file_size"])
    {
        auto size = logging["max_file_size"].value<int64_t>();
        if (size && *size > 0)
            out.max_file_size = static_cast<size_t>(*size);
        else
            ReportInvalid("logging.max_file_size", sourceName);
    }

    if (logging["backup_count"])
    {
        auto count = logging["backup_count"].value<int64_t>();
        if (count && *count >= 0)
            out.backup_count = static_cast<size_t>(*count);
        else
            ReportInvalid("logging.backup_count", sourceName);
    }
}

void ConfigLoader::ReportInvalid(const std::string& key, const std::string& sourceName)
{
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                        "Ignoring invalid configuration value '" + key + "'",
                                        "File: " + sourceName);
}

} // namespace fxprobe::config
