// SPDX-License-Identifier: Apache-2.0
#include "TranscriptionInvoker.hpp"

#include <core/Log.hpp>
#include <engine/FailureClassifier.hpp>
#include <engine/Platform.hpp>
#include <transcription/Language.hpp>
#include <transcription/SubtitleCodec.hpp>

#include <atomic>
#include <cstdlib>
#include <format>
#include <system_error>

namespace xcaption
{

namespace
{

    constexpr auto BundledModelFileName = std::string_view { "model.bin" };

    auto isRegularFile(const std::filesystem::path& path) -> bool
    {
        auto ec = std::error_code {};
        return std::filesystem::is_regular_file(path, ec);
    }

    /// @brief Progress sink shared between the native callback and the awaiting code.
    ///
    /// The callback only records cancellation; the Cancelled error itself is produced after the
    /// native call has returned.
    class ProgressGate
    {
      public:
        explicit ProgressGate(const TranscriptionRequest& request): _request(request) {}

        void operator()(int percent)
        {
            if (_cancelled.load())
                return;

            try
            {
                if (_request.cancellationCheck && _request.cancellationCheck())
                {
                    log::debug("Cancellation requested at {}%", percent);
                    _cancelled.store(true);
                    return;
                }

                if (percent < 0 || percent > 100)
                    return;

                auto previous = _lastForwarded.load();
                do
                {
                    if (percent < previous)
                        return;
                } while (!_lastForwarded.compare_exchange_weak(previous, percent));

                if (_request.progress)
                    _request.progress(percent);
            }
            catch (const std::exception& e)
            {
                log::warning("Progress callback raised an exception, ignoring: {}", e.what());
            }
        }

        /// @brief True if cancellation was observed during the call or is requested now.
        [[nodiscard]] auto cancelled() -> bool
        {
            if (!_cancelled.load() && _request.cancellationCheck && _request.cancellationCheck())
                _cancelled.store(true);
            return _cancelled.load();
        }

      private:
        const TranscriptionRequest& _request;
        std::atomic<bool> _cancelled = false;
        std::atomic<int> _lastForwarded = -1;
    };

    auto isEmptyPayload(const nlohmann::json& payload) -> bool
    {
        if (payload.is_null())
            return true;
        if (payload.is_boolean())
            return !payload.get<bool>();
        if (payload.is_string())
            return trimWhitespace(payload.get_ref<const std::string&>()).empty();
        return false;
    }

    auto callEngine(const EngineHandle& engine, const nlohmann::json& params, const NativeProgressFunction& progress)
        -> NativeOutcome
    {
        try
        {
            return engine.invoke(params, progress);
        }
        catch (const std::exception& e)
        {
            return std::unexpected(NativeFailure { .message = e.what(), .details = {} });
        }
    }

} // namespace

auto defaultModelFileName() -> std::string
{
    if (auto const* env = std::getenv("XCAPTION_WHISPER_MODEL_FILE"))
    {
        if (auto const name = trimWhitespace(env); !name.empty())
            return std::string(name);
    }
    return std::string(BundledModelFileName);
}

auto resolveModelPath(const std::string& requested, const EngineDefaults& defaults) -> std::string
{
    if (!requested.empty())
    {
        auto const path = std::filesystem::path(requested);
        if (isRegularFile(path))
            return requested;

        if (path.is_relative() && !defaults.modelsDir.empty())
        {
            auto const candidate = defaults.modelsDir / path;
            if (isRegularFile(candidate))
                return candidate.string();
        }
        return requested;
    }

    if (!defaults.modelsDir.empty())
    {
        auto const candidate = defaults.modelsDir / defaultModelFileName();
        if (isRegularFile(candidate))
            return candidate.string();
    }

    return (defaults.assetsDir / BundledModelFileName).string();
}

auto buildEngineParams(const TranscriptionRequest& request, const std::string& modelPath) -> nlohmann::json
{
    auto params = nlohmann::json {
        { "language", effectiveLanguage(request.language) },
        { "prompt", effectivePrompt(request.language, request.prompt) },
        { "model", modelPath },
        { "fname_inp", request.audioPath },
        { "use_gpu", request.useGpu },
        { "flash_attn", request.flashAttention },
        { "no_prints", true },
        { "comma_in_time", false },
        { "translate", false },
        { "no_timestamps", false },
        { "detect_language", false },
        { "audio_ctx", 0 },
        { "max_len", 0 },
    };
    if (request.threads > 0)
        params["n_threads"] = request.threads;
    return params;
}

auto invokeTranscription(const EngineHandle& engine,
                         const TranscriptionRequest& request,
                         const EngineDefaults& defaults) -> Result<RawEngineResult>
{
    if (!isSupportedLanguage(request.language))
        return makeError(ErrorCode::InvalidArgument, std::format("Unsupported language code: '{}'", request.language));

    if (auto ec = std::error_code {}; !std::filesystem::exists(request.audioPath, ec))
    {
        auto error = Error {
            .code = ErrorCode::IoError,
            .message = std::format("Audio file not found: {}", request.audioPath),
            .originalMessage = {},
            .audioPath = request.audioPath,
            .modelPath = request.modelPath,
        };
        return makeError(std::move(error));
    }

    auto const modelPath = resolveModelPath(request.modelPath, defaults);
    auto const params = buildEngineParams(request, modelPath);

    log::debug("Language: {}", params["language"].get<std::string>());
    log::debug("Initial prompt: {}", params["prompt"].get<std::string>());
    log::info("Using model at: {}", modelPath);
    log::info("Starting transcription of {}", request.audioPath);

    auto gate = ProgressGate(request);
    auto const outcome = callEngine(engine, params, [&gate](int percent) { gate(percent); });

    if (gate.cancelled())
    {
        log::info("Transcription cancelled");
        auto error = Error {
            .code = ErrorCode::Cancelled,
            .message = "Transcription cancelled",
            .originalMessage = {},
            .audioPath = request.audioPath,
            .modelPath = modelPath,
        };
        return makeError(std::move(error));
    }

    if (!outcome)
    {
        auto const& failure = outcome.error();
        auto const context = FailureContext {
            .stage = FailureStage::Call,
            .audioPath = request.audioPath,
            .modelPath = modelPath,
            .kernelRelease = kernelRelease(),
            .details = failure.details,
        };

        // A model that does not load is reported as corrupted even if the text also matches
        // another category.
        if (matchesCorruption(std::format("{} {}", failure.message, failure.details)))
        {
            log::error("Model corruption or initialization failure detected: {}", failure.message);
            return makeError(makeModelCorruptedError(failure.message, context));
        }

        auto error = classifyFailure(failure.message, context);
        log::error("{}", error.message);
        return makeError(std::move(error));
    }

    if (isEmptyPayload(*outcome))
    {
        log::error("Engine returned no result; the model might be corrupted");
        auto error = Error {
            .code = ErrorCode::ModelCorrupted,
            .message = "MODEL_CORRUPTED: Transcription returned no result. "
                       "The model file might be corrupted or failed to initialize.",
            .originalMessage = {},
            .audioPath = request.audioPath,
            .modelPath = modelPath,
        };
        return makeError(std::move(error));
    }

    log::info("Transcription finished");
    return RawEngineResult { .payload = *outcome };
}

} // namespace xcaption
