// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <transcription/TranscriptionTypes.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace xcaption
{

/// @brief Largest timestamp, in seconds, accepted from an engine or a subtitle file.
constexpr auto MaxTimestampSeconds = 100'000'000.0;

/// @brief Formats seconds as an SRT timecode "HH:MM:SS,mmm".
///
/// Hours are not wrapped. Negative input is clamped to zero and input above MaxTimestampSeconds
/// to that bound; milliseconds are truncated.
[[nodiscard]] auto formatTimecode(double seconds) -> std::string;

/// @brief Serializes segments as SubRip (SRT) text.
///
/// Segments are numbered from 1 in order; segments whose trimmed text is empty are skipped and
/// do not consume an index. Timestamps the engine reported as strings are reused with the
/// first '.' replaced by ','.
/// @return The subtitle text, or std::nullopt if no segment qualifies.
[[nodiscard]] auto toSubtitleText(std::span<const Segment> segments) -> std::optional<std::string>;

/// @brief Parses a timestamp such as "01:02:05,125", "00:01.5", "3.25" or "12" into seconds.
/// @return std::nullopt for malformed text or a value above MaxTimestampSeconds.
[[nodiscard]] auto parseTimeString(std::string_view text) -> std::optional<double>;

/// @brief Reads SubRip (SRT) text back into segments.
///
/// Blocks are separated by blank lines; the index line is optional; multi-line text is joined
/// with single spaces. Malformed blocks are skipped.
[[nodiscard]] auto parseSubtitleText(std::string_view text) -> std::vector<Segment>;

/// @brief Removes leading and trailing ASCII whitespace.
[[nodiscard]] auto trimWhitespace(std::string_view text) -> std::string_view;

} // namespace xcaption
