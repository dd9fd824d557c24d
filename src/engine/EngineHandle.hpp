// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <expected>
#include <filesystem>
#include <functional>
#include <string>

namespace xcaption
{

/// @brief A failure raised by the native transcription call.
struct NativeFailure
{
    std::string message;

    /// Extra diagnostic text (a native stack trace or log tail), may be empty.
    std::string details;
};

/// @brief Outcome of one native call: the raw payload or the native failure.
///
/// A payload of `null` means the engine settled successfully without producing a result.
using NativeOutcome = std::expected<nlohmann::json, NativeFailure>;

/// @brief Progress sink handed to the native call, receives percentages in [0, 100].
///
/// Invoked from inside the native call; must not throw.
using NativeProgressFunction = std::function<void(int percent)>;

/// @brief The callable transcription entry point of an engine.
using NativeTranscribeFunction =
    std::function<NativeOutcome(const nlohmann::json& params, const NativeProgressFunction& progress)>;

/// @brief Loaded, callable transcription engine.
///
/// Immutable and cheap to copy; copies share the underlying module, which stays loaded for as
/// long as any copy exists. The engine behind a handle is not reentrant: callers must not run
/// two transcriptions through the same engine concurrently (see TranscriptionService).
class EngineHandle
{
  public:
    /// @param transcribe The entry point.
    /// @param source Where the engine was loaded from (empty for in-process engines).
    explicit EngineHandle(NativeTranscribeFunction transcribe, std::filesystem::path source = {});

    /// @brief Runs the engine's entry point.
    [[nodiscard]] auto invoke(const nlohmann::json& params, const NativeProgressFunction& progress) const
        -> NativeOutcome;

    [[nodiscard]] auto source() const -> const std::filesystem::path& { return _source; }

  private:
    NativeTranscribeFunction _transcribe;
    std::filesystem::path _source;
};

} // namespace xcaption
