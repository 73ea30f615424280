#pragma once

#include "../config/ProbeConfig.hpp"
#include "../runtime/Bitness.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace fxprobe::cli
{

enum class ParseStatus
{
    Run,
    ShowHelp,
    ShowVersion,
    UsageError
};

struct Options
{
    std::string command;
    std::string argument;
    std::string config_path = config::ConfigLoader::kDefaultPath;
    std::optional<Bitness> bitness;
    bool json = false;
    bool verbose = false;
};

struct RequestedVersion
{
    int major = 0;
    int minor = 0;
};

// Argument handling of the fxprobe tool. Nothing here touches the machine.
class CommandLine
{
public:
    // Fills options from argv. On UsageError, error holds the message to
    // print; it is empty when only the usage text applies.
    static ParseStatus Parse(int argc, const char* const argv[], Options& options, std::string& error);

    static bool IsKnownCommand(const std::string& command);

    static bool NeedsArgument(const std::string& command);

    // "5", "5.0" or "v5.0"; minor defaults to 0
    static std::optional<RequestedVersion> ParseRequestedVersion(const std::string& text);

    static void PrintUsage(std::ostream& out, const char* program_name);
};

} // namespace fxprobe::cli
