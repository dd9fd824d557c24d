// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <string>

namespace xcaption::engine
{

/// @brief Parameters of one whisper.cpp transcription, decoded from the host's JSON object.
struct WhisperRequest
{
    std::string language = "auto";
    std::string prompt;
    std::string modelPath;
    std::string audioPath;

    bool useGpu = true;
    bool flashAttention = false;

    /// @brief Suppress whisper.cpp's informational output (host key "no_prints").
    bool quiet = true;

    bool translate = false;
    bool noTimestamps = false;
    bool detectLanguage = false;

    /// @brief Encoder context size; 0 uses the model's full context.
    int audioContext = 0;

    /// @brief Maximum segment length in characters; 0 disables splitting.
    int maxSegmentLength = 0;

    /// @brief Inference threads; 0 picks a default from the hardware concurrency.
    int threads = 0;
};

/// @brief Decodes the host's parameter object.
///
/// "comma_in_time" is accepted but has no effect: timestamps are always emitted as seconds.
/// @return The request, or InvalidArgument if "model" or "fname_inp" is missing.
[[nodiscard]] auto parseWhisperRequest(const nlohmann::json& params) -> Result<WhisperRequest>;

/// @brief Receives whisper.cpp progress in percent.
using ProgressSink = std::function<void(int percent)>;

/// @brief Decodes the audio, runs whisper_full() and collects the segments.
///
/// @return `{"language": "..", "segments": [{"start": s, "end": s, "text": ".."}]}` with times
///         in seconds, or an error whose message carries whisper.cpp's own wording
///         (e.g. "failed to initialize whisper context").
[[nodiscard]] auto runWhisper(const WhisperRequest& request, const ProgressSink& progress) -> Result<nlohmann::json>;

} // namespace xcaption::engine
