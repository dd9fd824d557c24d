// SPDX-License-Identifier: Apache-2.0
#include <core/Error.hpp>
#include <core/Log.hpp>
#include <engine/Platform.hpp>

#include <catch2/catch_test_macros.hpp>

#include <format>
#include <string>
#include <vector>

using namespace xcaption;

TEST_CASE("platform and architecture names", "[platform]")
{
    CHECK(platformName(Platform::Windows) == "win32");
    CHECK(platformName(Platform::MacOS) == "darwin");
    CHECK(platformName(Platform::Linux) == "linux");
    CHECK(archName(Arch::X64) == "x64");
    CHECK(archName(Arch::Arm64) == "arm64");

#if defined(__linux__)
    CHECK(currentPlatform() == Platform::Linux);
#endif
}

#if !defined(_WIN32)
TEST_CASE("kernelRelease reports the running kernel", "[platform]")
{
    CHECK_FALSE(kernelRelease().empty());
}
#endif

TEST_CASE("errors format with their stable code name", "[error]")
{
    auto const error = Error { .code = ErrorCode::OsVersionIncompatible, .message = "too old" };

    CHECK(errorCodeName(ErrorCode::OsVersionIncompatible) == "OSVersionIncompatible");
    CHECK(errorCodeName(ErrorCode::ModelCorrupted) == "ModelCorrupted");
    CHECK(std::format("{}", error) == "[OSVersionIncompatible] too old");
    CHECK(isCancellation(Error { .code = ErrorCode::Cancelled }));
    CHECK_FALSE(isCancellation(error));
}

TEST_CASE("log levels filter and route messages", "[log]")
{
    auto received = std::vector<std::string> {};
    log::setCallback([&received](log::Level level, std::string_view message) {
        received.push_back(std::format("{}:{}", log::levelName(level), message));
    });
    auto const previous = log::getLevel();
    log::setLevel(log::Level::Info);

    log::info("loaded {}", 1);
    log::debug("hidden {}", 2);
    log::warning("careful");

    log::setLevel(previous);
    log::setCallback({});

    CHECK(received == std::vector<std::string> { "info:loaded 1", "warning:careful" });
    CHECK(log::parseLevel("warn") == log::Level::Warning);
    CHECK(log::parseLevel("trace") == log::Level::Trace);
    CHECK_FALSE(log::parseLevel("verbose").has_value());
}
