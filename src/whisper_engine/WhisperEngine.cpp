// SPDX-License-Identifier: Apache-2.0
#include "WhisperEngine.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <whisper.h>

#include <algorithm>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "AudioDecoder.hpp"

namespace xcaption::engine
{

namespace
{

    /// @brief Default thread count when the host leaves it to the engine.
    constexpr auto MaxDefaultThreads = 4;

    /// @brief State of the whisper.cpp log forwarder.
    struct WhisperLogState
    {
        std::mutex mutex;

        /// Line buffer for whisper.cpp log continuation messages.
        std::string lineBuffer;

        /// Last complete line logged at error level, attached to failure messages.
        std::string lastError;

        bool quiet = true;
    };

    auto whisperLog = WhisperLogState {};

    /// @brief Maps ggml_log_level to xcaption::log::Level.
    /// @param level The ggml log level.
    /// @param quiet Demote informational output to debug.
    /// @return The corresponding log level, or std::nullopt for GGML_LOG_LEVEL_NONE.
    auto mapGgmlLevel(ggml_log_level level, bool quiet) -> std::optional<log::Level>
    {
        switch (level)
        {
            case GGML_LOG_LEVEL_ERROR: return log::Level::Error;
            case GGML_LOG_LEVEL_WARN: return log::Level::Warning;
            case GGML_LOG_LEVEL_INFO: return quiet ? log::Level::Debug : log::Level::Info;
            case GGML_LOG_LEVEL_DEBUG: return log::Level::Debug;
            default: return std::nullopt;
        }
    }

    /// @brief Log callback for whisper.cpp that forwards messages to xcaption::log.
    ///
    /// Handles continuation lines by buffering partial lines and emitting complete lines
    /// on newline characters.
    void whisperLogCallback(ggml_log_level level, char const* text, void* /*userData*/)
    {
        if (level == GGML_LOG_LEVEL_NONE || text == nullptr)
            return;

        auto lock = std::lock_guard(whisperLog.mutex);
        whisperLog.lineBuffer += text;

        while (true)
        {
            auto const nlPos = whisperLog.lineBuffer.find('\n');
            if (nlPos == std::string::npos)
                break;

            auto line = whisperLog.lineBuffer.substr(0, nlPos);

            // Strip trailing whitespace
            auto const end = line.find_last_not_of(" \t\r");
            if (end != std::string::npos)
                line = line.substr(0, end + 1);

            if (!line.empty() && end != std::string::npos)
            {
                auto const logLevel = mapGgmlLevel(level, whisperLog.quiet).value_or(log::Level::Debug);
                if (logLevel == log::Level::Error)
                    whisperLog.lastError = line;
                log::write(logLevel, line);
            }

            whisperLog.lineBuffer.erase(0, nlPos + 1);
        }
    }

    void resetWhisperLog(bool quiet)
    {
        auto lock = std::lock_guard(whisperLog.mutex);
        whisperLog.lineBuffer.clear();
        whisperLog.lastError.clear();
        whisperLog.quiet = quiet;
    }

    /// @brief Appends the last error whisper.cpp logged, if any, to @p message.
    auto withWhisperDiagnostics(std::string message) -> std::string
    {
        auto lock = std::lock_guard(whisperLog.mutex);
        if (!whisperLog.lastError.empty())
            message += std::format(" ({})", whisperLog.lastError);
        return message;
    }

    void progressTrampoline(whisper_context* /*ctx*/, whisper_state* /*state*/, int progress, void* userData)
    {
        auto const* const sink = static_cast<const ProgressSink*>(userData);
        if (sink && *sink)
            (*sink)(std::clamp(progress, 0, 100));
    }

    auto defaultThreadCount() -> int
    {
        auto const hardware = static_cast<int>(std::thread::hardware_concurrency());
        return std::clamp(hardware, 1, MaxDefaultThreads);
    }

    using ContextPtr = std::unique_ptr<whisper_context, decltype(&whisper_free)>;

} // namespace

auto parseWhisperRequest(const nlohmann::json& params) -> Result<WhisperRequest>
{
    if (!params.is_object())
        return makeError(ErrorCode::InvalidArgument, "Engine parameters must be a JSON object");

    auto request = WhisperRequest {
        .language = json::getStringOr(params, "language", "auto"),
        .prompt = json::getStringOr(params, "prompt", ""),
        .modelPath = json::getStringOr(params, "model", ""),
        .audioPath = json::getStringOr(params, "fname_inp", ""),
        .useGpu = json::getBoolOr(params, "use_gpu", true),
        .flashAttention = json::getBoolOr(params, "flash_attn", false),
        .quiet = json::getBoolOr(params, "no_prints", true),
        .translate = json::getBoolOr(params, "translate", false),
        .noTimestamps = json::getBoolOr(params, "no_timestamps", false),
        .detectLanguage = json::getBoolOr(params, "detect_language", false),
        .audioContext = json::getIntOr(params, "audio_ctx", 0),
        .maxSegmentLength = json::getIntOr(params, "max_len", 0),
        .threads = json::getIntOr(params, "n_threads", 0),
    };

    if (request.modelPath.empty())
        return makeError(ErrorCode::InvalidArgument, "Missing engine parameter: model");
    if (request.audioPath.empty())
        return makeError(ErrorCode::InvalidArgument, "Missing engine parameter: fname_inp");
    if (request.language.empty())
        request.language = "auto";

    return request;
}

auto runWhisper(const WhisperRequest& request, const ProgressSink& progress) -> Result<nlohmann::json>
{
    resetWhisperLog(request.quiet);
    whisper_log_set(whisperLogCallback, nullptr);

    auto samples = decodeAudioFile(request.audioPath);
    if (!samples)
        return std::unexpected(samples.error());

    auto contextParams = whisper_context_default_params();
    contextParams.use_gpu = request.useGpu;
    contextParams.flash_attn = request.flashAttention;

    auto const context = ContextPtr(whisper_init_from_file_with_params(request.modelPath.c_str(), contextParams),
                                    &whisper_free);
    if (!context)
        return makeError(
            ErrorCode::ModelCorrupted,
            withWhisperDiagnostics(std::format("failed to initialize whisper context (model: {})", request.modelPath)));

    log::info("Whisper model loaded: {}", request.modelPath);

    auto params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.language = request.language.c_str();
    params.initial_prompt = request.prompt.empty() ? nullptr : request.prompt.c_str();
    params.translate = request.translate;
    params.no_timestamps = request.noTimestamps;
    params.detect_language = request.detectLanguage;
    params.audio_ctx = request.audioContext;
    params.max_len = request.maxSegmentLength;
    params.token_timestamps = request.maxSegmentLength > 0;
    params.n_threads = request.threads > 0 ? request.threads : defaultThreadCount();
    params.print_progress = false;
    params.print_special = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.progress_callback = &progressTrampoline;
    params.progress_callback_user_data = const_cast<ProgressSink*>(&progress);

    auto const result = whisper_full(context.get(), params, samples->data(), static_cast<int>(samples->size()));
    if (result != 0)
        return makeError(ErrorCode::TranscriptionFailed,
                         withWhisperDiagnostics(std::format("whisper_full failed with code: {}", result)));

    auto segments = nlohmann::json::array();
    auto const nSegments = whisper_full_n_segments(context.get());
    for (auto i = 0; i < nSegments; ++i)
    {
        auto const* const text = whisper_full_get_segment_text(context.get(), i);

        // whisper.cpp reports segment times in centiseconds.
        segments.push_back({
            { "start", static_cast<double>(whisper_full_get_segment_t0(context.get(), i)) / 100.0 },
            { "end", static_cast<double>(whisper_full_get_segment_t1(context.get(), i)) / 100.0 },
            { "text", text ? std::string(text) : std::string {} },
        });
    }

    auto const* const language = whisper_lang_str(whisper_full_lang_id(context.get()));

    if (progress)
        progress(100);

    log::info("Whisper produced {} segment(s)", nSegments);
    return nlohmann::json {
        { "language", language ? std::string(language) : request.language },
        { "segments", std::move(segments) },
    };
}

} // namespace xcaption::engine
