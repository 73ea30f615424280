#include "CommandLine.hpp"

#include <cstdlib>
#include <cstring>
#include <regex>
#include <stdexcept>

namespace fxprobe::cli
{

ParseStatus CommandLine::Parse(int argc, const char* const argv[], Options& options, std::string& error)
{
    error.clear();

    for (int i = 1; i < argc; ++i)
    {
        if (strcmp(argv[i], "--help") == 0)
        {
            return ParseStatus::ShowHelp;
        }
        else if (strcmp(argv[i], "--version") == 0)
        {
            return ParseStatus::ShowVersion;
        }
        else if (strcmp(argv[i], "--json") == 0)
        {
            options.json = true;
        }
        else if (strcmp(argv[i], "--verbose") == 0)
        {
            options.verbose = true;
        }
        else if (strcmp(argv[i], "--config") == 0 || strcmp(argv[i], "--bitness") == 0)
        {
            if (i + 1 >= argc)
            {
                error = std::string("Option ") + argv[i] + " requires a value";
                return ParseStatus::UsageError;
            }

            if (strcmp(argv[i], "--config") == 0)
            {
                options.config_path = argv[++i];
                continue;
            }

            options.bitness = BitnessFromInt(std::atoi(argv[++i]));
            if (!options.bitness)
            {
                error = "Bitness must be 32 or 64";
                return ParseStatus::UsageError;
            }
        }
        else if (options.command.empty())
        {
            options.command = argv[i];
        }
        else if (options.argument.empty())
        {
            options.argument = argv[i];
        }
        else
        {
            error = std::string("Unexpected argument: ") + argv[i];
            return ParseStatus::UsageError;
        }
    }

    if (options.command.empty())
        return ParseStatus::UsageError;

    if (!IsKnownCommand(options.command))
    {
        error = "Unknown command: " + options.command;
        return ParseStatus::UsageError;
    }

    if (NeedsArgument(options.command) && options.argument.empty())
        return ParseStatus::UsageError;

    if (!NeedsArgument(options.command) && !options.argument.empty())
    {
        error = "Unexpected argument: " + options.argument;
        return ParseStatus::UsageError;
    }

    return ParseStatus::Run;
}

bool CommandLine::IsKnownCommand(const std::string& command)
{
    return command == "list" || command == "resolve" || command == "version-of";
}

bool CommandLine::NeedsArgument(const std::string& command)
{
    return command == "resolve" || command == "version-of";
}

std::optional<RequestedVersion> CommandLine::ParseRequestedVersion(const std::string& text)
{
    static const std::regex versionRegex(R"(^v?(\d+)(?:\.(\d+))?$)");
    std::smatch match;
    if (!std::regex_match(text, match, versionRegex))
        return std::nullopt;

    try
    {
        RequestedVersion version;
        version.major = std::stoi(match[1].str());
        version.minor = match[2].matched ? std::stoi(match[2].str()) : 0;
        return version;
    }
    catch (const std::out_of_range&)
    {
        return std::nullopt;
    }
}

void CommandLine::PrintUsage(std::ostream& out, const char* program_name)
{
    out << "Usage: " << program_name << " [OPTIONS] COMMAND\n";
    out << "Locates installed shared runtimes and picks the best match for a version.\n\n";
    out << "Commands:\n";
    out << "  list                 List every installed framework group in search order\n";
    out << "  resolve MAJOR[.MINOR]\n";
    out << "                       Print the framework directories best matching a version\n";
    out << "  version-of FILE      Print the runtime version whose install contains FILE\n";
    out << "\nOptions:\n";
    out << "  --config FILE        Read settings from FILE (default: fxprobe.toml)\n";
    out << "  --bitness 32|64      Requested bitness for resolve (default: this process)\n";
    out << "  --json               Print results as JSON\n";
    out << "  --verbose            Also log to the console\n";
    out << "  --version            Show version information\n";
    out << "  --help               Show this help message\n";
}

} // namespace fxprobe::cli
