// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace xcaption
{

/// @brief Operating system family the process runs on.
enum class Platform : std::uint8_t
{
    Windows,
    MacOS,
    Linux,
    Unknown,
};

/// @brief CPU architecture the process runs on.
enum class Arch : std::uint8_t
{
    X64,
    Arm64,
    Unknown,
};

/// @brief Returns the platform this binary was built for.
[[nodiscard]] constexpr auto currentPlatform() -> Platform
{
#if defined(_WIN32)
    return Platform::Windows;
#elif defined(__APPLE__)
    return Platform::MacOS;
#elif defined(__linux__)
    return Platform::Linux;
#else
    return Platform::Unknown;
#endif
}

/// @brief Returns the CPU architecture this binary was built for.
[[nodiscard]] constexpr auto currentArch() -> Arch
{
#if defined(__x86_64__) || defined(_M_X64)
    return Arch::X64;
#elif defined(__aarch64__) || defined(_M_ARM64)
    return Arch::Arm64;
#else
    return Arch::Unknown;
#endif
}

/// @brief Returns the conventional short platform name ("win32", "darwin", "linux").
[[nodiscard]] constexpr auto platformName(Platform platform) -> std::string_view
{
    switch (platform)
    {
        case Platform::Windows: return "win32";
        case Platform::MacOS: return "darwin";
        case Platform::Linux: return "linux";
        case Platform::Unknown: return "unknown";
    }
    return "unknown";
}

/// @brief Returns the conventional short architecture name ("x64", "arm64").
[[nodiscard]] constexpr auto archName(Arch arch) -> std::string_view
{
    switch (arch)
    {
        case Arch::X64: return "x64";
        case Arch::Arm64: return "arm64";
        case Arch::Unknown: return "unknown";
    }
    return "unknown";
}

/// @brief Returns the release string of the running kernel (as printed by `uname -r`).
/// @return The release, or an empty string if it cannot be determined.
[[nodiscard]] auto kernelRelease() -> std::string;

/// @brief Maps a Darwin kernel release (e.g. "23.4.0") to a marketing macOS version.
///
/// Darwin 20 and later map to macOS (major - 9), Darwin 5..19 to macOS 10.(major - 4).
/// @return e.g. "macOS 14", "macOS 10.15", or "an unknown macOS version".
[[nodiscard]] auto macosVersionFromKernelRelease(std::string_view release) -> std::string;

} // namespace xcaption
