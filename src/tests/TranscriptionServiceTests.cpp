// SPDX-License-Identifier: Apache-2.0
#include <transcription/TranscriptionService.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <condition_variable>
#include <format>
#include <mutex>
#include <thread>

#include "TestSupport.hpp"

using namespace xcaption;
using namespace std::chrono_literals;

namespace
{

constexpr auto SamplePayload =
    R"({"language":"en","segments":[{"start":0,"end":1.25,"text":" Hello "},{"start":1.25,"end":2.5,"text":"world"}]})";

auto sampleEngine() -> EngineHandle
{
    return EngineHandle([](const nlohmann::json&, const NativeProgressFunction& progress) {
        progress(50);
        progress(100);
        return NativeOutcome(nlohmann::json(SamplePayload));
    });
}

/// @brief Engine that blocks until released, for observing the queue.
struct GatedEngine
{
    std::mutex mutex;
    std::condition_variable cv;
    bool released = false;
    bool entered = false;
    int calls = 0;

    auto handle() -> EngineHandle
    {
        return EngineHandle([this](const nlohmann::json&, const NativeProgressFunction& progress) {
            {
                auto lock = std::unique_lock(mutex);
                ++calls;
                entered = true;
                cv.notify_all();
                cv.wait(lock, [this] { return released; });
            }
            progress(100);
            return NativeOutcome(nlohmann::json(SamplePayload));
        });
    }

    void waitUntilEntered()
    {
        auto lock = std::unique_lock(mutex);
        cv.wait(lock, [this] { return entered; });
    }

    void release()
    {
        auto lock = std::lock_guard(mutex);
        released = true;
        cv.notify_all();
    }
};

/// @brief Converter that upper-cases ASCII letters.
class UpperCaseConverter final: public ScriptConverter
{
  public:
    [[nodiscard]] auto convert(std::string_view text) const -> Result<std::string> override
    {
        auto result = std::string(text);
        for (auto& c: result)
        {
            if (c >= 'a' && c <= 'z')
                c = static_cast<char>(c - 'a' + 'A');
        }
        return result;
    }
};

} // namespace

TEST_CASE("runTranscription produces segments and subtitle text", "[service]")
{
    auto const dir = test::TempDir {};
    auto const audio = dir.write("audio.wav", "RIFF").string();

    auto options = TranscriptionOptions {};
    options.output = OutputKind::Subtitle;

    auto const result = runTranscription(sampleEngine(), audio, options, EngineDefaults {}, nullptr);

    REQUIRE(result.has_value());
    CHECK(result->transcript.segments.size() == 2);
    CHECK(result->transcript.text == "Hello world");
    CHECK(result->transcript.language == "en");
    REQUIRE(result->subtitle.has_value());
    CHECK(*result->subtitle
          == "1\n00:00:00,000 --> 00:00:01,250\nHello\n\n"
             "2\n00:00:01,250 --> 00:00:02,500\nworld");
}

TEST_CASE("runTranscription leaves the subtitle empty for segment output", "[service]")
{
    auto const dir = test::TempDir {};
    auto const result =
        runTranscription(sampleEngine(), dir.write("a.wav", "RIFF").string(), {}, EngineDefaults {}, nullptr);

    REQUIRE(result.has_value());
    CHECK_FALSE(result->subtitle.has_value());
}

TEST_CASE("TranscriptionService runs submitted requests", "[service]")
{
    auto const dir = test::TempDir {};
    auto service = TranscriptionService(sampleEngine(), EngineDefaults {});

    auto progress = std::vector<int> {};
    auto options = TranscriptionOptions {};
    options.progress = [&progress](int percent) { progress.push_back(percent); };

    auto const result = service.transcribe(dir.write("audio.wav", "RIFF").string(), std::move(options));

    REQUIRE(result.has_value());
    CHECK(result->transcript.segments.size() == 2);
    CHECK(progress == std::vector<int> { 50, 100 });
}

TEST_CASE("TranscriptionService reports classified errors through the future", "[service]")
{
    auto service = TranscriptionService(sampleEngine(), EngineDefaults {});

    auto future = service.submit("/does/not/exist.wav", {});
    auto const result = future.get();

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ErrorCode::IoError);
}

TEST_CASE("TranscriptionService executes one request at a time in order", "[service]")
{
    auto const dir = test::TempDir {};
    auto const audio = dir.write("audio.wav", "RIFF").string();
    auto engine = GatedEngine {};
    auto service = TranscriptionService(engine.handle(), EngineDefaults {});

    auto first = service.submit(audio, {});
    engine.waitUntilEntered();
    auto second = service.submit(audio, {});

    CHECK(service.pending() == 1);
    CHECK(second.wait_for(50ms) == std::future_status::timeout);

    engine.release();

    CHECK(first.get().has_value());
    CHECK(second.get().has_value());
    CHECK(engine.calls == 2);
    CHECK(service.pending() == 0);
}

TEST_CASE("shutdown cancels queued requests", "[service]")
{
    auto const dir = test::TempDir {};
    auto const audio = dir.write("audio.wav", "RIFF").string();
    auto engine = GatedEngine {};
    auto service = TranscriptionService(engine.handle(), EngineDefaults {});

    auto running = service.submit(audio, {});
    engine.waitUntilEntered();
    auto queued = service.submit(audio, {});

    // Release the engine once shutdown has started waiting for the worker.
    auto releaser = std::jthread([&engine] {
        std::this_thread::sleep_for(50ms);
        engine.release();
    });
    service.shutdown();

    auto const queuedResult = queued.get();
    REQUIRE_FALSE(queuedResult.has_value());
    CHECK(queuedResult.error().code == ErrorCode::Cancelled);

    // The running request observed the stop through its cancellation predicate.
    auto const runningResult = running.get();
    REQUIRE_FALSE(runningResult.has_value());
    CHECK(runningResult.error().code == ErrorCode::Cancelled);

    auto const late = service.submit(audio, {}).get();
    REQUIRE_FALSE(late.has_value());
    CHECK(late.error().code == ErrorCode::Cancelled);
}

TEST_CASE("TranscriptionService creates converters once per language", "[service]")
{
    auto const dir = test::TempDir {};
    auto const audio = dir.write("audio.wav", "RIFF").string();
    auto created = 0;

    auto factory = [&created](std::string_view language) -> Result<std::unique_ptr<ScriptConverter>> {
        ++created;
        if (language == "zh_trad")
            return makeError(ErrorCode::ConfigError, "no conversion data");
        return std::make_unique<UpperCaseConverter>();
    };
    auto service = TranscriptionService(sampleEngine(), EngineDefaults {}, factory);

    auto options = TranscriptionOptions {};
    options.language = "zh_sim";
    auto const first = service.transcribe(audio, options);
    auto const second = service.transcribe(audio, options);

    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(first->transcript.text == "HELLO WORLD");
    CHECK(created == 1);

    // A converter that cannot be created leaves the text unconverted.
    options.language = "zh_trad";
    auto const third = service.transcribe(audio, options);
    REQUIRE(third.has_value());
    CHECK(third->transcript.text == "Hello world");
    CHECK(created == 2);

    options.language = "en";
    REQUIRE(service.transcribe(audio, options).has_value());
    CHECK(created == 2);
}
