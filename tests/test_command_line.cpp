#include <catch2/catch_test_macros.hpp>
#include "cli/CommandLine.hpp"

#include <sstream>
#include <vector>

using namespace fxprobe;
using fxprobe::cli::CommandLine;
using fxprobe::cli::Options;
using fxprobe::cli::ParseStatus;

namespace {

struct ParseOutcome {
    ParseStatus status;
    Options options;
    std::string error;
};

ParseOutcome parse(std::vector<const char*> args) {
    args.insert(args.begin(), "fxprobe");
    ParseOutcome outcome;
    outcome.status = CommandLine::Parse(static_cast<int>(args.size()), args.data(), outcome.options, outcome.error);
    return outcome;
}

}  // namespace

TEST_CASE("CommandLine - Commands", "[cli]") {
    SECTION("list") {
        auto outcome = parse({ "list" });
        REQUIRE(outcome.status == ParseStatus::Run);
        REQUIRE(outcome.options.command == "list");
        REQUIRE(outcome.options.config_path == "fxprobe.toml");
    }

    SECTION("resolve with options in any position") {
        auto outcome = parse({ "--json", "resolve", "--bitness", "32", "5.0", "--config", "alt.toml" });
        REQUIRE(outcome.status == ParseStatus::Run);
        REQUIRE(outcome.options.command == "resolve");
        REQUIRE(outcome.options.argument == "5.0");
        REQUIRE(outcome.options.bitness == Bitness::Bits32);
        REQUIRE(outcome.options.config_path == "alt.toml");
        REQUIRE(outcome.options.json);
    }

    SECTION("Help and version win over everything else") {
        REQUIRE(parse({ "list", "--help" }).status == ParseStatus::ShowHelp);
        REQUIRE(parse({ "--version", "bogus" }).status == ParseStatus::ShowVersion);
    }
}

TEST_CASE("CommandLine - Usage errors", "[cli]") {
    SECTION("No command") {
        auto outcome = parse({});
        REQUIRE(outcome.status == ParseStatus::UsageError);
        REQUIRE(outcome.error.empty());
    }

    SECTION("Option value missing at the end") {
        auto config = parse({ "list", "--config" });
        REQUIRE(config.status == ParseStatus::UsageError);
        REQUIRE(config.error == "Option --config requires a value");

        auto bitness = parse({ "resolve", "5.0", "--bitness" });
        REQUIRE(bitness.status == ParseStatus::UsageError);
        REQUIRE(bitness.error == "Option --bitness requires a value");
    }

    SECTION("Option alone is not taken as a command") {
        auto outcome = parse({ "--config" });
        REQUIRE(outcome.status == ParseStatus::UsageError);
        REQUIRE(outcome.options.command.empty());
    }

    SECTION("Unknown command is rejected") {
        auto outcome = parse({ "scan" });
        REQUIRE(outcome.status == ParseStatus::UsageError);
        REQUIRE(outcome.error == "Unknown command: scan");
    }

    SECTION("Unsupported bitness") {
        REQUIRE(parse({ "resolve", "5.0", "--bitness", "16" }).status == ParseStatus::UsageError);
    }

    SECTION("Missing or extra command arguments") {
        REQUIRE(parse({ "resolve" }).status == ParseStatus::UsageError);
        REQUIRE(parse({ "version-of" }).status == ParseStatus::UsageError);
        REQUIRE(parse({ "list", "extra" }).status == ParseStatus::UsageError);
        REQUIRE(parse({ "resolve", "5.0", "6.0" }).status == ParseStatus::UsageError);
    }
}

TEST_CASE("CommandLine - Requested version", "[cli]") {
    auto full = CommandLine::ParseRequestedVersion("5.1");
    REQUIRE(full.has_value());
    REQUIRE(full->major == 5);
    REQUIRE(full->minor == 1);

    auto majorOnly = CommandLine::ParseRequestedVersion("v6");
    REQUIRE(majorOnly.has_value());
    REQUIRE(majorOnly->major == 6);
    REQUIRE(majorOnly->minor == 0);

    REQUIRE_FALSE(CommandLine::ParseRequestedVersion("5.x").has_value());
    REQUIRE_FALSE(CommandLine::ParseRequestedVersion("99999999999").has_value());
}

TEST_CASE("CommandLine - Usage text", "[cli]") {
    std::ostringstream out;
    CommandLine::PrintUsage(out, "fxprobe");
    REQUIRE(out.str().find("Usage: fxprobe [OPTIONS] COMMAND") == 0);
    REQUIRE(out.str().find("version-of FILE") != std::string::npos);
}
