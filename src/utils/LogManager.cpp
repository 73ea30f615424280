#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "../config/ProbeConfig.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace fxprobe::utils
{

bool LogManager::s_initialized = false;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const config::LoggingSettings& settings)
{
    if (s_initialized)
        return true;

    // plog keeps its logger for the whole process; reuse it after Shutdown()
    if (auto logger = plog::get(); logger && !s_appenders.empty())
    {
        logger->setMaxSeverity(settings.level);
        s_initialized = true;
        return true;
    }

    if (!PrepareLogDirectory(settings))
        return false;

    try
    {
        if (!settings.append)
        {
            std::ofstream(settings.file, std::ios::trunc).close();
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            settings.file.c_str(), settings.max_file_size, static_cast<int>(settings.backup_count));

        // The logger only borrows appenders; own each one before it is registered
        auto* file_sink = file_appender.get();
        s_appenders.push_back(std::move(file_appender));
        plog::init(settings.level, file_sink);

        if (settings.console)
        {
            s_appenders.push_back(std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>());
            if (auto logger = plog::get())
                logger->addAppender(s_appenders.back().get());
        }
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to initialize logging", ex.what());
        return false;
    }

    s_initialized = true;
    return true;
}

void LogManager::Shutdown()
{
    // Appenders stay registered with the logger, so they are muted rather than freed
    if (auto logger = plog::get())
        logger->setMaxSeverity(plog::none);
    s_initialized = false;
}

bool LogManager::IsInitialized() { return s_initialized; }

bool LogManager::PrepareLogDirectory(const config::LoggingSettings& settings)
{
    auto directory = std::filesystem::path(settings.file).parent_path();
    if (directory.empty())
        return true;

    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory",
                                     directory.string() + ": " + ec.message());
        return false;
    }
    return true;
}

} // namespace fxprobe::utils
