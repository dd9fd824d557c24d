// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <transcription/ScriptConverter.hpp>
#include <transcription/TranscriptionTypes.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace xcaption
{

/// @brief Structural shape recognised in a raw engine payload.
enum class ParsedShape : std::uint8_t
{
    /// Text that is not structured data: a transcript without timestamps.
    PlainText,
    /// The payload itself is the segment sequence.
    SegmentSequence,
    /// An object holding the segment sequence under a known key.
    KeyedSegments,
    /// Compatibility shim: an object whose values are segment-like objects. Only tried last.
    ScannedValues,
    /// Nothing usable (null, a scalar, or an object without segments).
    Empty,
};

/// @brief Result of shape discovery.
struct ShapeProbe
{
    ParsedShape shape = ParsedShape::Empty;

    /// Candidate segment entries (always a JSON array).
    nlohmann::json segments = nlohmann::json::array();

    /// Language reported by the engine alongside the segments, if any.
    std::string detectedLanguage;

    /// True if the payload arrived as serialized text and was parsed.
    bool fromText = false;
};

/// @brief Keys probed, in order, for the segment sequence inside an object payload.
constexpr auto SegmentContainerKeys = std::array<std::string_view, 3> { "segments", "result", "transcription" };

/// @brief Classifies a raw payload and extracts its candidate segment entries.
[[nodiscard]] auto discoverShape(const RawEngineResult& raw) -> ShapeProbe;

/// @brief Extracts one canonical segment from a `[start, end, text]` triple or a keyed object.
///
/// Keys: start|from, end|to, text|text_segment|content. Timestamps may be seconds or time
/// strings. Returns std::nullopt unless start, end and non-empty text are all present and
/// start <= end.
[[nodiscard]] auto extractSegment(const nlohmann::json& entry) -> std::optional<Segment>;

/// @brief Normalizes a raw payload into the canonical transcript.
///
/// Pure: the same payload, language and converter always yield the same transcript. Partial
/// segments are dropped. For "zh_sim"/"zh_trad" every segment's text is passed through
/// @p converter when one is given; conversion failures leave the text unconverted.
[[nodiscard]] auto normalizeResult(const RawEngineResult& raw,
                                   std::string_view language,
                                   const ScriptConverter* converter = nullptr) -> Transcript;

} // namespace xcaption
