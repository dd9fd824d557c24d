// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace xcaption
{

/// @brief Receives transcription progress as a percentage in [0, 100].
using ProgressFunction = std::function<void(int percent)>;

/// @brief Queried during a transcription; returning true requests cooperative cancellation.
using CancellationPredicate = std::function<bool()>;

/// @brief A timestamped span of recognised text.
///
/// Invariant: start <= end and text is non-empty for every segment produced by normalizeResult().
struct Segment
{
    double start = 0.0; ///< Seconds.
    double end = 0.0;   ///< Seconds.
    std::string text;

    /// Timestamps as the engine spelled them (e.g. "00:00:01.500"); empty when reported as numbers.
    std::string startStamp;
    std::string endStamp;
};

/// @brief Canonical transcription output.
struct Transcript
{
    std::vector<Segment> segments;

    /// Segment texts joined by single spaces.
    std::string text;

    /// Language reported by the engine, or the requested language code.
    std::string language;

    /// End time of the last segment, if any segment was produced.
    std::optional<double> duration;

    /// False when the engine produced output without timing information.
    bool hasTimestamps = false;
};

/// @brief Everything needed for one native transcription call.
struct TranscriptionRequest
{
    /// 16 kHz, mono, 16-bit PCM WAV file. Only its existence is verified.
    std::string audioPath;

    /// "auto", an ISO-639 code, or one of the Chinese variants "zh_sim" / "zh_trad".
    std::string language = "auto";

    /// Initial decoding prompt. Ignored for the Chinese variants.
    std::string prompt;

    /// Model file; empty selects the default model.
    std::string modelPath;

    bool useGpu = true;
    bool flashAttention = false;

    /// Inference threads; 0 lets the engine decide.
    int threads = 0;

    ProgressFunction progress;
    CancellationPredicate cancellationCheck;
};

/// @brief Untyped payload returned by the engine, consumed by normalizeResult().
///
/// Either a JSON string holding serialized output, an array of segments, or an object
/// holding the segment array under one of several keys.
struct RawEngineResult
{
    nlohmann::json payload;
};

} // namespace xcaption
