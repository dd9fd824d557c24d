// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace xcaption
{

/// @brief Phrase tables used to recognise native-layer failures.
///
/// The tables depend on the exact wording of the dynamic loader, the Objective-C runtime and
/// whisper.cpp. Bump PhraseTableVersion whenever an entry is added or removed. Matching is a
/// case-insensitive substring search; a message that matches nothing is reported as a generic
/// failure rather than guessed into a category.
namespace phrases
{
    constexpr auto PhraseTableVersion = 1;

    /// Addon or one of its libraries was built for a newer macOS than the running one.
    constexpr auto OsVersionIncompatible = std::array<std::string_view, 5> {
        "built for macOS",
        "newer than running OS",
        "Symbol not found",
        "MTLResidencySetDescriptor",
        "_OBJC_CLASS_$_",
    };

    /// A dependency of the addon could not be located or initialised by the dynamic loader.
    constexpr auto LibraryMissing = std::array<std::string_view, 6> {
        "Library not loaded",
        ".dylib",
        "cannot open shared object file",
        "error loading shared library",
        "The specified module could not be found",
        "module did not self-register",
    };

    /// The model file is damaged, truncated or not a whisper model.
    constexpr auto ModelCorrupted = std::array<std::string_view, 4> {
        "not all tensors loaded",
        "tensors loaded",
        "failed to load model",
        "failed to initialize",
    };
} // namespace phrases

/// @brief Oldest macOS release the shipped native libraries run on.
constexpr auto MinimumMacosVersion = std::string_view { "macOS 15.6" };

/// @brief Whether a failure happened while loading the addon or while running a transcription.
enum class FailureStage : std::uint8_t
{
    Load,
    Call,
};

/// @brief Context attached to a classified failure.
struct FailureContext
{
    FailureStage stage = FailureStage::Call;
    std::string audioPath;
    std::string modelPath;

    /// Running kernel release, used to name the installed macOS version.
    std::string kernelRelease;

    /// Additional diagnostic text from the native layer (a stack trace, where available).
    std::string details;
};

[[nodiscard]] auto matchesOsVersionIncompatibility(std::string_view text) -> bool;
[[nodiscard]] auto matchesLibraryMissing(std::string_view text) -> bool;
[[nodiscard]] auto matchesCorruption(std::string_view text) -> bool;

/// @brief Builds the ModelCorrupted error reported for a damaged or unloadable model.
[[nodiscard]] auto makeModelCorruptedError(std::string_view rawMessage, const FailureContext& context) -> Error;

/// @brief Maps raw native error text to an actionable error.
///
/// Precedence: OS-version incompatibility, missing library, model corruption. Anything else
/// becomes TranscriptionFailed (call stage) or EngineLoadFailed (load stage) with the raw
/// message and the context fields attached.
[[nodiscard]] auto classifyFailure(std::string_view rawMessage, const FailureContext& context) -> Error;

} // namespace xcaption
