#pragma once

#include <memory>
#include <vector>

namespace plog
{
class IAppender;
}

namespace fxprobe::config
{
struct LoggingSettings;
}

namespace fxprobe::utils
{

class LogManager
{
public:
    // Sets up the default plog instance: rolling file appender plus an
    // optional console appender. Safe to call more than once.
    static bool Initialize(const config::LoggingSettings& settings);

    static void Shutdown();

    static bool IsInitialized();

private:
    LogManager() = default;

    static bool PrepareLogDirectory(const config::LoggingSettings& settings);

    static bool s_initialized;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace fxprobe::utils
