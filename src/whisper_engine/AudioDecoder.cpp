// SPDX-License-Identifier: Apache-2.0
#include "AudioDecoder.hpp"

#include <core/Log.hpp>

#include <miniaudio.h>

#include <array>
#include <format>

namespace xcaption::engine
{

namespace
{

    constexpr auto ChunkFrames = ma_uint64 { 4096 };

    /// @brief Owns an initialized ma_decoder.
    struct DecoderGuard
    {
        ma_decoder decoder {};
        bool initialized = false;

        ~DecoderGuard()
        {
            if (initialized)
                ma_decoder_uninit(&decoder);
        }
    };

} // namespace

auto decodeAudioFile(const std::string& path) -> Result<std::vector<float>>
{
    auto const config = ma_decoder_config_init(ma_format_f32, 1, DecoderSampleRate);

    auto guard = DecoderGuard {};
    auto const initResult = ma_decoder_init_file(path.c_str(), &config, &guard.decoder);
    if (initResult != MA_SUCCESS)
        return makeError(ErrorCode::IoError,
                         std::format("Failed to open audio file {}: {}", path, ma_result_description(initResult)));
    guard.initialized = true;

    auto samples = std::vector<float> {};
    auto buffer = std::array<float, ChunkFrames> {};

    while (true)
    {
        auto framesRead = ma_uint64 { 0 };
        auto const readResult = ma_decoder_read_pcm_frames(&guard.decoder, buffer.data(), ChunkFrames, &framesRead);
        samples.insert(samples.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(framesRead));

        if (readResult == MA_AT_END || framesRead == 0)
            break;
        if (readResult != MA_SUCCESS)
            return makeError(ErrorCode::IoError,
                             std::format("Failed to decode audio file {}: {}", path, ma_result_description(readResult)));
    }

    log::debug("Decoded {} samples ({:.2f}s) from {}",
               samples.size(),
               static_cast<double>(samples.size()) / DecoderSampleRate,
               path);
    return samples;
}

} // namespace xcaption::engine
