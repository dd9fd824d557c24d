// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <engine/EngineHandle.hpp>
#include <transcription/ScriptConverter.hpp>
#include <transcription/TranscriptionInvoker.hpp>
#include <transcription/TranscriptionTypes.hpp>

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace xcaption
{

/// @brief What a transcription hands back to its caller.
enum class OutputKind : std::uint8_t
{
    Segments,
    Subtitle,
};

/// @brief Per-request options of the inbound transcription contract.
struct TranscriptionOptions
{
    std::string language = "auto";

    /// Model file; empty selects the default model.
    std::string modelPath;

    std::string prompt;

    ProgressFunction progress;
    CancellationPredicate cancellationCheck;

    bool useGpu = true;
    bool flashAttention = false;
    int threads = 0;

    OutputKind output = OutputKind::Segments;
};

/// @brief Result of a successful transcription.
struct TranscriptionOutput
{
    Transcript transcript;

    /// SRT text, only set for OutputKind::Subtitle when at least one segment qualifies.
    std::optional<std::string> subtitle;
};

/// @brief Creates the script converter for a language code (nullptr if none applies).
using ScriptConverterFactory = std::function<Result<std::unique_ptr<ScriptConverter>>(std::string_view language)>;

/// @brief Runs the full pipeline synchronously: invoke, normalize, optionally serialize.
///
/// @param converter Used for the Chinese variants; may be nullptr to skip script conversion.
[[nodiscard]] auto runTranscription(const EngineHandle& engine,
                                    const std::string& audioPath,
                                    const TranscriptionOptions& options,
                                    const EngineDefaults& defaults,
                                    const ScriptConverter* converter) -> Result<TranscriptionOutput>;

/// @brief Serialises transcriptions through one engine on a background worker thread.
///
/// The engine behind an EngineHandle is not reentrant, so requests are queued and executed one
/// at a time in submission order. Script converters are created on first use per language and
/// reused afterwards.
class TranscriptionService
{
  public:
    /// @param converterFactory Defaults to makeScriptConverter().
    TranscriptionService(EngineHandle engine, EngineDefaults defaults, ScriptConverterFactory converterFactory = {});
    ~TranscriptionService();

    TranscriptionService(const TranscriptionService&) = delete;
    TranscriptionService& operator=(const TranscriptionService&) = delete;

    /// @brief Queues a transcription (non-blocking).
    /// @return A future resolving to the output or the classified error.
    [[nodiscard]] auto submit(std::string audioPath, TranscriptionOptions options)
        -> std::future<Result<TranscriptionOutput>>;

    /// @brief Queues a transcription and waits for it.
    [[nodiscard]] auto transcribe(std::string audioPath, TranscriptionOptions options) -> Result<TranscriptionOutput>;

    /// @brief Number of requests waiting to start.
    [[nodiscard]] auto pending() const -> std::size_t;

    /// @brief Stops the worker.
    ///
    /// Queued requests resolve to Cancelled; a running request is asked to cancel through its
    /// cancellation predicate. Later submissions resolve to Cancelled immediately.
    void shutdown();

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace xcaption
