#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fxprobe::platform
{

// Source of process environment and OS install locations.
// Discovery reads the machine only through this interface.
class IEnvironment
{
public:
    virtual ~IEnvironment() = default;

    virtual std::optional<std::string> GetVariable(const std::string& name) const = 0;

    // Program-files style roots, 64-bit root first
    virtual std::vector<std::filesystem::path> GetStandardInstallRoots() const = 0;

    virtual char PathListSeparator() const = 0;
};

// Environment of the running process
class SystemEnvironment : public IEnvironment
{
public:
    ~SystemEnvironment() override = default;

    std::optional<std::string> GetVariable(const std::string& name) const override;
    std::vector<std::filesystem::path> GetStandardInstallRoots() const override;
    char PathListSeparator() const override;
};

// Splits a path-list value, dropping empty entries
std::vector<std::string> SplitPathList(const std::string& value, char separator);

} // namespace fxprobe::platform
