// SPDX-License-Identifier: Apache-2.0
#include "Platform.hpp"

#include <array>
#include <charconv>
#include <format>

#ifdef _WIN32
    #define WIN32_LEAN_AND_MEAN
    #include <windows.h>
#else
    #include <sys/utsname.h>
#endif

namespace xcaption
{

namespace
{

    struct DarwinToMacos
    {
        int firstDarwinMajor;
        int lastDarwinMajor;
        int offset;
        bool legacyTenSeries;
    };

    // Darwin 20 shipped with macOS 11; before that every release was a 10.x.
    constexpr auto DarwinOffsets = std::array<DarwinToMacos, 2> { {
        { .firstDarwinMajor = 20, .lastDarwinMajor = 99, .offset = -9, .legacyTenSeries = false },
        { .firstDarwinMajor = 5, .lastDarwinMajor = 19, .offset = -4, .legacyTenSeries = true },
    } };

} // namespace

auto kernelRelease() -> std::string
{
#ifdef _WIN32
    auto info = OSVERSIONINFOA {};
    info.dwOSVersionInfoSize = sizeof(info);
    if (!GetVersionExA(&info))
        return {};
    return std::format("{}.{}.{}", info.dwMajorVersion, info.dwMinorVersion, info.dwBuildNumber);
#else
    auto name = utsname {};
    if (uname(&name) != 0)
        return {};
    return name.release;
#endif
}

auto macosVersionFromKernelRelease(std::string_view release) -> std::string
{
    auto major = 0;
    auto const* const begin = release.data();
    auto const* const end = release.data() + release.size();
    auto const [ptr, ec] = std::from_chars(begin, end, major);
    if (ec != std::errc {} || ptr == begin)
        return "an unknown macOS version";

    for (auto const& entry: DarwinOffsets)
    {
        if (major < entry.firstDarwinMajor || major > entry.lastDarwinMajor)
            continue;
        if (entry.legacyTenSeries)
            return std::format("macOS 10.{}", major + entry.offset);
        return std::format("macOS {}", major + entry.offset);
    }

    return "an unknown macOS version";
}

} // namespace xcaption
