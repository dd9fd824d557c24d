// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <string>
#include <vector>

namespace xcaption::engine
{

/// @brief Sample rate expected by whisper.cpp.
constexpr auto DecoderSampleRate = 16000u;

/// @brief Decodes an audio file into mono float32 PCM at DecoderSampleRate.
///
/// Any format miniaudio can decode is accepted (WAV, FLAC, MP3); the samples are converted
/// and resampled as needed.
/// @return The samples, or an IoError if the file cannot be opened or decoded.
[[nodiscard]] auto decodeAudioFile(const std::string& path) -> Result<std::vector<float>>;

} // namespace xcaption::engine
