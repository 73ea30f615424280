#include <catch2/catch_test_macros.hpp>
#include "discovery/InstallScanner.hpp"
#include "utils/fake_environment.hpp"
#include "utils/install_fixture.hpp"

using namespace fxprobe;
using test_utils::ExecutableImages;
using test_utils::FakeEnvironment;
using test_utils::TempInstallTree;

namespace {

config::DiscoverySettings testSettings() {
    config::DiscoverySettings settings;
    settings.environment_variables = { "PATH", "DOTNET_ROOT(x86)", "DOTNET_ROOT" };
    settings.launcher = "dotnet.exe";
    settings.runtime_directory = "dotnet";
    return settings;
}

}  // namespace

TEST_CASE("InstallScanner - Candidate sources", "[scanner]") {
    FakeEnvironment env;
    auto settings = testSettings();

    SECTION("Environment variables in configured order, then standard roots, then search dirs") {
        env.setVariable("DOTNET_ROOT", "/root-override");
        env.setVariable("PATH", "/usr/bin;/opt/tools");
        env.setVariable("DOTNET_ROOT(x86)", "/root-x86");
        env.addStandardRoot("/programs");
        env.addStandardRoot("/programs-x86");
        settings.search_directories = { "/extra" };

        InstallScanner scanner(env, settings);
        auto candidates = scanner.CollectCandidates();

        std::vector<std::string> expected = {
            "/usr/bin",
            "/opt/tools",
            "/root-x86",
            "/root-override",
            (std::filesystem::path("/programs") / "dotnet").string(),
            (std::filesystem::path("/programs-x86") / "dotnet").string(),
            "/extra",
        };
        REQUIRE(candidates == expected);
    }

    SECTION("Unset variables and empty entries contribute nothing") {
        env.setVariable("PATH", ";;");
        InstallScanner scanner(env, settings);
        REQUIRE(scanner.CollectCandidates().empty());
    }
}

TEST_CASE("InstallScanner - Filtering install roots", "[scanner]") {
    TempInstallTree tree;
    FakeEnvironment env;
    auto settings = testSettings();

    SECTION("Directory with a launcher is an install root") {
        auto dir = tree.addInstall("x64/dotnet", Bitness::Bits64, "dotnet.exe");
        env.setVariable("DOTNET_ROOT", dir.string());

        auto roots = InstallScanner(env, settings).FindInstallRoots();
        REQUIRE(roots.size() == 1);
        REQUIRE(roots[0].directory == dir);
        REQUIRE(roots[0].bitness == Bitness::Bits64);
    }

    SECTION("Launcher bitness is taken from the header") {
        auto dir = tree.addInstall("x86/dotnet", Bitness::Bits32, "dotnet.exe");
        env.setVariable("PATH", dir.string());

        auto roots = InstallScanner(env, settings).FindInstallRoots();
        REQUIRE(roots.size() == 1);
        REQUIRE(roots[0].bitness == Bitness::Bits32);
    }

    SECTION("Standard roots are joined with the runtime directory name") {
        tree.addInstall("programs/dotnet", Bitness::Bits64, "dotnet.exe");
        env.addStandardRoot(tree.root() / "programs");

        auto roots = InstallScanner(env, settings).FindInstallRoots();
        REQUIRE(roots.size() == 1);
        REQUIRE(roots[0].directory == tree.root() / "programs" / "dotnet");
    }

    SECTION("Directories without a launcher are skipped") {
        auto dir = tree.makeDirectory("bin");
        tree.writeFile("bin/other.exe", ExecutableImages::pe(Bitness::Bits64));
        env.setVariable("PATH", dir.string());

        REQUIRE(InstallScanner(env, settings).FindInstallRoots().empty());
    }

    SECTION("Launchers with an unreadable header are skipped") {
        auto dir = tree.makeDirectory("broken");
        tree.writeFile("broken/dotnet.exe", "not an executable");
        env.setVariable("PATH", dir.string());

        REQUIRE(InstallScanner(env, settings).FindInstallRoots().empty());
    }

    SECTION("Missing directories are skipped") {
        env.setVariable("PATH", (tree.root() / "does-not-exist").string());
        REQUIRE(InstallScanner(env, settings).FindInstallRoots().empty());
    }

    SECTION("Launcher that is a directory is skipped") {
        auto dir = tree.makeDirectory("odd");
        tree.makeDirectory("odd/dotnet.exe");
        env.setVariable("PATH", dir.string());

        REQUIRE(InstallScanner(env, settings).FindInstallRoots().empty());
    }

    SECTION("Duplicates collapse to the first occurrence") {
        auto dir = tree.addInstall("dotnet", Bitness::Bits64, "dotnet.exe");
        env.setVariable("PATH", dir.string() + ";" + dir.string() + "/;" + dir.string() + "/.");
        env.setVariable("DOTNET_ROOT", " " + dir.string() + " ");

        auto roots = InstallScanner(env, settings).FindInstallRoots();
        REQUIRE(roots.size() == 1);
        REQUIRE(roots[0].directory == dir);
    }

    SECTION("Duplicates are detected case-insensitively") {
        auto dir = tree.addInstall("dotnet", Bitness::Bits64, "dotnet.exe");
        auto upper = tree.root() / "DOTNET";
        env.setVariable("PATH", dir.string() + ";" + upper.string());

        auto roots = InstallScanner(env, settings).FindInstallRoots();
        REQUIRE(roots.size() == 1);
        REQUIRE(roots[0].directory == dir);
    }

    SECTION("Roots keep source order") {
        auto first = tree.addInstall("b/dotnet", Bitness::Bits32, "dotnet.exe");
        auto second = tree.addInstall("a/dotnet", Bitness::Bits64, "dotnet.exe");
        env.setVariable("PATH", first.string());
        env.setVariable("DOTNET_ROOT", second.string());

        auto roots = InstallScanner(env, settings).FindInstallRoots();
        REQUIRE(roots.size() == 2);
        REQUIRE(roots[0].directory == first);
        REQUIRE(roots[1].directory == second);
    }

    SECTION("Configured launcher name is used") {
        settings.launcher = "dotnet";
        auto dir = tree.makeDirectory("linux/dotnet");
        tree.writeFile("linux/dotnet/dotnet", ExecutableImages::elf(2));
        env.setVariable("DOTNET_ROOT", dir.string());

        auto roots = InstallScanner(env, settings).FindInstallRoots();
        REQUIRE(roots.size() == 1);
        REQUIRE(roots[0].bitness == Bitness::Bits64);
    }
}
