// SPDX-License-Identifier: Apache-2.0
#include "TranscriptionService.hpp"

#include <core/Log.hpp>
#include <transcription/Language.hpp>
#include <transcription/ResultNormalizer.hpp>
#include <transcription/SubtitleCodec.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>

namespace xcaption
{

namespace
{

    struct Job
    {
        std::string audioPath;
        TranscriptionOptions options;
        std::promise<Result<TranscriptionOutput>> promise;
    };

    auto cancelledError(std::string_view reason, const std::string& audioPath) -> Error
    {
        return Error {
            .code = ErrorCode::Cancelled,
            .message = std::string(reason),
            .originalMessage = {},
            .audioPath = audioPath,
            .modelPath = {},
        };
    }

} // namespace

auto runTranscription(const EngineHandle& engine,
                      const std::string& audioPath,
                      const TranscriptionOptions& options,
                      const EngineDefaults& defaults,
                      const ScriptConverter* converter) -> Result<TranscriptionOutput>
{
    auto const request = TranscriptionRequest {
        .audioPath = audioPath,
        .language = options.language.empty() ? std::string("auto") : options.language,
        .prompt = options.prompt,
        .modelPath = options.modelPath,
        .useGpu = options.useGpu,
        .flashAttention = options.flashAttention,
        .threads = options.threads,
        .progress = options.progress,
        .cancellationCheck = options.cancellationCheck,
    };

    auto raw = invokeTranscription(engine, request, defaults);
    if (!raw)
        return std::unexpected(std::move(raw.error()));

    auto output = TranscriptionOutput {
        .transcript = normalizeResult(*raw, request.language, converter),
        .subtitle = std::nullopt,
    };
    log::info("Transcript has {} segment(s)", output.transcript.segments.size());

    if (options.output == OutputKind::Subtitle)
    {
        output.subtitle = toSubtitleText(output.transcript.segments);
        if (!output.subtitle)
            log::warning("No timestamped segments available, subtitle output is empty");
    }

    return output;
}

struct TranscriptionService::Impl
{
    EngineHandle engine;
    EngineDefaults defaults;
    ScriptConverterFactory converterFactory;

    // Only touched by the worker thread.
    std::map<std::string, std::shared_ptr<const ScriptConverter>, std::less<>> converters;

    mutable std::mutex mutex;
    std::condition_variable_any cv;
    std::deque<Job> queue;
    bool shutdownRequested = false;
    std::atomic<bool> stopping = false;

    // Must stay the last member: joined before the state it uses is destroyed.
    std::jthread worker;

    Impl(EngineHandle engine, EngineDefaults defaults, ScriptConverterFactory factory):
        engine(std::move(engine)), defaults(std::move(defaults)), converterFactory(std::move(factory))
    {
        if (!converterFactory)
            converterFactory = makeScriptConverter;
    }

    /// @brief Worker thread function that processes the request queue.
    /// @param stopToken The stop token for cooperative cancellation.
    void run(const std::stop_token& stopToken)
    {
        while (!stopToken.stop_requested())
        {
            auto job = std::optional<Job> {};
            {
                auto lock = std::unique_lock(mutex);
                cv.wait(lock, stopToken, [this] { return !queue.empty() || shutdownRequested; });

                if (stopToken.stop_requested() || shutdownRequested)
                    return;

                if (queue.empty())
                    continue;

                job.emplace(std::move(queue.front()));
                queue.pop_front();
            }

            execute(*job);
        }
    }

    void execute(Job& job)
    {
        // The service's own stop request is folded into the caller's predicate.
        auto options = std::move(job.options);
        options.cancellationCheck = [this, check = std::move(options.cancellationCheck)] {
            return stopping.load() || (check && check());
        };

        auto const* converter = converterFor(options.language);
        job.promise.set_value(runTranscription(engine, job.audioPath, options, defaults, converter));
    }

    auto converterFor(const std::string& language) -> const ScriptConverter*
    {
        if (chineseVariant(language) == ChineseVariant::None)
            return nullptr;

        if (auto const it = converters.find(language); it != converters.end())
            return it->second.get();

        auto created = converterFactory(language);
        auto converter = std::shared_ptr<const ScriptConverter> {};
        if (created)
            converter = std::move(*created);
        else
            log::warning("Script conversion disabled for {}: {}", language, created.error().message);

        converters.emplace(language, converter);
        return converter.get();
    }
};

TranscriptionService::TranscriptionService(EngineHandle engine,
                                           EngineDefaults defaults,
                                           ScriptConverterFactory converterFactory):
    _impl(std::make_unique<Impl>(std::move(engine), std::move(defaults), std::move(converterFactory)))
{
    _impl->worker = std::jthread([this](const std::stop_token& token) { _impl->run(token); });
    log::debug("Transcription service started (engine: {})", _impl->engine.source().string());
}

TranscriptionService::~TranscriptionService()
{
    shutdown();
}

auto TranscriptionService::submit(std::string audioPath, TranscriptionOptions options)
    -> std::future<Result<TranscriptionOutput>>
{
    auto job = Job { .audioPath = std::move(audioPath), .options = std::move(options), .promise = {} };
    auto future = job.promise.get_future();

    {
        auto lock = std::lock_guard(_impl->mutex);
        if (!_impl->shutdownRequested)
        {
            _impl->queue.push_back(std::move(job));
            _impl->cv.notify_one();
            return future;
        }
    }

    job.promise.set_value(Result<TranscriptionOutput>(
        std::unexpected(cancelledError("Transcription service has been shut down", job.audioPath))));
    return future;
}

auto TranscriptionService::transcribe(std::string audioPath, TranscriptionOptions options)
    -> Result<TranscriptionOutput>
{
    return submit(std::move(audioPath), std::move(options)).get();
}

auto TranscriptionService::pending() const -> std::size_t
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->queue.size();
}

void TranscriptionService::shutdown()
{
    auto abandoned = std::deque<Job> {};
    {
        auto lock = std::lock_guard(_impl->mutex);
        if (_impl->shutdownRequested)
            return;
        _impl->shutdownRequested = true;
        _impl->stopping.store(true);
        abandoned.swap(_impl->queue);
    }

    _impl->cv.notify_all();

    for (auto& job: abandoned)
        job.promise.set_value(Result<TranscriptionOutput>(
            std::unexpected(cancelledError("Transcription cancelled before it started", job.audioPath))));

    if (!abandoned.empty())
        log::info("Cancelled {} queued transcription(s)", abandoned.size());

    if (_impl->worker.joinable())
    {
        _impl->worker.request_stop();
        _impl->worker.join();
    }
}

} // namespace xcaption
