#include "cli/CommandLine.hpp"
#include "config/ProbeConfig.hpp"
#include "index/RuntimePathProvider.hpp"
#include "platform/Environment.hpp"
#include "report/IndexReport.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

#include <plog/Log.h>

#ifndef FXPROBE_VERSION
#define FXPROBE_VERSION "0.0.0"
#endif

namespace
{

constexpr int kExitFound = 0;
constexpr int kExitNotFound = 1;
constexpr int kExitUsage = 2;

void PrintVersion()
{
    std::cout << "fxprobe " << FXPROBE_VERSION << "\n";
    std::cout << "Platform: ";
#ifdef _WIN32
    std::cout << "Windows\n";
#else
    std::cout << "Linux\n";
#endif
}

void FlushErrorReports()
{
    for (const auto& report : fxprobe::utils::ErrorReporter::GetPendingErrors())
    {
        std::cerr << fxprobe::utils::ErrorReporter::SeverityToString(report.severity) << ": "
                  << report.user_message;
        if (!report.technical_details.empty())
            std::cerr << " (" << report.technical_details << ")";
        std::cerr << "\n";
    }
}

int ListCommand(const fxprobe::RuntimePathProvider& provider, const fxprobe::cli::Options& options)
{
    if (options.json)
    {
        std::cout << fxprobe::report::IndexReport::ToJson(provider.index()).dump(2) << "\n";
        return provider.HasInstalls() ? kExitFound : kExitNotFound;
    }

    if (!provider.HasInstalls())
    {
        std::cout << "No installed runtimes found\n";
        return kExitNotFound;
    }

    for (const auto& group : provider.index().groups())
    {
        std::cout << group.version().toString() << " (" << fxprobe::ToInt(group.bitness()) << "-bit)"
                  << (group.hasRuntimeAppPath() ? "" : " [no core runtime]") << "\n";
        for (const auto& path : group.paths())
            std::cout << "    " << path.string() << "\n";
    }
    return kExitFound;
}

int ResolveCommand(const fxprobe::RuntimePathProvider& provider, const fxprobe::cli::Options& options)
{
    auto requested = fxprobe::cli::CommandLine::ParseRequestedVersion(options.argument);
    if (!requested)
    {
        std::cerr << "Invalid version: " << options.argument << "\n";
        return kExitUsage;
    }

    fxprobe::Bitness bitness = options.bitness.value_or(fxprobe::HostBitness());
    const fxprobe::FrameworkPaths* result =
        provider.TryGetFrameworkPaths(requested->major, requested->minor, bitness);

    if (options.json)
    {
        std::cout << fxprobe::report::IndexReport::ResolutionToJson(requested->major, requested->minor, bitness,
                                                                    result)
                         .dump(2)
                  << "\n";
    }
    else if (result)
    {
        for (const auto& path : result->paths())
            std::cout << path.string() << "\n";
    }
    else
    {
        std::cerr << "No installed runtime satisfies " << options.argument << "\n";
    }
    return result ? kExitFound : kExitNotFound;
}

int VersionOfCommand(const fxprobe::RuntimePathProvider& provider, const fxprobe::cli::Options& options)
{
    std::error_code ec;
    auto file = std::filesystem::absolute(options.argument, ec);
    if (ec)
        file = options.argument;

    auto version = provider.TryGetVersion(file);
    if (options.json)
    {
        nlohmann::json out;
        out["file"] = options.argument;
        out["version"] = version ? fxprobe::report::IndexReport::ToJson(*version) : nlohmann::json(nullptr);
        std::cout << out.dump(2) << "\n";
    }
    else if (version)
    {
        std::cout << version->toString() << "\n";
    }
    else
    {
        std::cerr << options.argument << " is not inside an installed runtime\n";
    }
    return version ? kExitFound : kExitNotFound;
}

} // namespace

int main(int argc, char* argv[])
{
    using fxprobe::cli::CommandLine;
    using fxprobe::cli::ParseStatus;

    fxprobe::cli::Options options;
    std::string error;
    switch (CommandLine::Parse(argc, argv, options, error))
    {
    case ParseStatus::ShowHelp:
        CommandLine::PrintUsage(std::cout, argv[0]);
        return kExitFound;
    case ParseStatus::ShowVersion:
        PrintVersion();
        return kExitFound;
    case ParseStatus::UsageError:
        if (error.empty())
            CommandLine::PrintUsage(std::cerr, argv[0]);
        else
            std::cerr << error << "\nRun '" << argv[0] << " --help' for usage.\n";
        return kExitUsage;
    case ParseStatus::Run:
        break;
    }

    auto config = fxprobe::config::ConfigLoader::LoadFile(options.config_path);
    if (options.verbose)
    {
        config.logging.console = true;
        config.logging.level = plog::debug;
    }
    if (!fxprobe::utils::LogManager::Initialize(config.logging))
        std::cerr << "Warning: logging is unavailable, continuing without a log file\n";

    PLOG_INFO << "fxprobe " << FXPROBE_VERSION << " command: " << options.command;

    fxprobe::platform::SystemEnvironment environment;
    fxprobe::RuntimePathProvider provider(environment, config.discovery);

    int exit_code = kExitUsage;
    if (options.command == "list")
        exit_code = ListCommand(provider, options);
    else if (options.command == "resolve")
        exit_code = ResolveCommand(provider, options);
    else
        exit_code = VersionOfCommand(provider, options);

    FlushErrorReports();
    fxprobe::utils::LogManager::Shutdown();
    return exit_code;
}
