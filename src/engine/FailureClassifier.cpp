// SPDX-License-Identifier: Apache-2.0
#include "FailureClassifier.hpp"

#include <engine/Platform.hpp>

#include <algorithm>
#include <format>
#include <span>

namespace xcaption
{

namespace
{

    auto toLowerAscii(std::string_view text) -> std::string
    {
        auto result = std::string(text);
        std::ranges::transform(result, result.begin(), [](char c) {
            return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
        });
        return result;
    }

    auto containsAny(std::string_view text, std::span<const std::string_view> needles) -> bool
    {
        auto const haystack = toLowerAscii(text);
        return std::ranges::any_of(needles, [&](std::string_view needle) {
            return haystack.find(toLowerAscii(needle)) != std::string::npos;
        });
    }

    auto stagePrefix(FailureStage stage) -> std::string_view
    {
        return stage == FailureStage::Load ? "Failed to load native addon" : "Transcription failed";
    }

    auto orDefault(std::string_view path) -> std::string_view
    {
        return path.empty() ? std::string_view { "default" } : path;
    }

    auto withContext(Error error, std::string_view rawMessage, const FailureContext& context) -> Error
    {
        error.originalMessage = std::string(rawMessage);
        error.audioPath = context.audioPath;
        error.modelPath = context.modelPath;
        return error;
    }

} // namespace

auto matchesOsVersionIncompatibility(std::string_view text) -> bool
{
    return containsAny(text, phrases::OsVersionIncompatible);
}

auto matchesLibraryMissing(std::string_view text) -> bool
{
    return containsAny(text, phrases::LibraryMissing);
}

auto matchesCorruption(std::string_view text) -> bool
{
    return containsAny(text, phrases::ModelCorrupted);
}

auto makeModelCorruptedError(std::string_view rawMessage, const FailureContext& context) -> Error
{
    auto error = Error {
        .code = ErrorCode::ModelCorrupted,
        .message = std::format("MODEL_CORRUPTED: The model file is corrupted or failed to initialize. "
                               "Error: {}\nModel path: {}",
                               rawMessage,
                               orDefault(context.modelPath)),
    };
    return withContext(std::move(error), rawMessage, context);
}

auto classifyFailure(std::string_view rawMessage, const FailureContext& context) -> Error
{
    if (matchesOsVersionIncompatibility(rawMessage))
    {
        auto const running = macosVersionFromKernelRelease(context.kernelRelease);
        auto error = Error {
            .code = ErrorCode::OsVersionIncompatible,
            .message = std::format("{}: macOS version incompatibility.\n"
                                   "The native libraries were built for {} or newer, but your system is "
                                   "running {}.\n"
                                   "Please update your macOS to version {} or later, or use libraries "
                                   "compiled for your macOS version.\n\n"
                                   "Original error: {}",
                                   stagePrefix(context.stage),
                                   MinimumMacosVersion,
                                   running,
                                   MinimumMacosVersion.substr(6),
                                   rawMessage),
        };
        return withContext(std::move(error), rawMessage, context);
    }

    if (matchesLibraryMissing(rawMessage))
    {
        auto error = Error {
            .code = ErrorCode::LibraryMissing,
            .message = std::format("{}: Missing or incompatible library dependencies.\n"
                                   "Make sure all required shared libraries are in the same directory as "
                                   "the addon.\n"
                                   "Original error: {}",
                                   stagePrefix(context.stage),
                                   rawMessage),
        };
        return withContext(std::move(error), rawMessage, context);
    }

    if (matchesCorruption(rawMessage))
        return makeModelCorruptedError(rawMessage, context);

    if (context.stage == FailureStage::Load)
    {
        auto error = Error {
            .code = ErrorCode::EngineLoadFailed,
            .message = std::format("{}: {}", stagePrefix(context.stage), rawMessage),
        };
        return withContext(std::move(error), rawMessage, context);
    }

    auto message = std::format("Transcription error: {}\nAudio file: {}\nModel path: {}\n",
                               rawMessage,
                               context.audioPath,
                               orDefault(context.modelPath));
    if (!context.details.empty())
        message += std::format("\nStack trace:\n{}", context.details);

    auto error = Error { .code = ErrorCode::TranscriptionFailed, .message = std::move(message) };
    return withContext(std::move(error), rawMessage, context);
}

} // namespace xcaption
