// SPDX-License-Identifier: Apache-2.0
#include <transcription/Language.hpp>
#include <transcription/TranscriptionInvoker.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <stdexcept>
#include <vector>

#include "TestSupport.hpp"

using namespace xcaption;

namespace
{

auto engineReturning(nlohmann::json payload) -> EngineHandle
{
    return EngineHandle([payload = std::move(payload)](const nlohmann::json&, const NativeProgressFunction&) {
        return NativeOutcome(payload);
    });
}

auto engineFailingWith(std::string message, std::string details = {}) -> EngineHandle
{
    return EngineHandle([message = std::move(message), details = std::move(details)](const nlohmann::json&,
                                                                                      const NativeProgressFunction&) {
        return NativeOutcome(std::unexpected(NativeFailure { .message = message, .details = details }));
    });
}

} // namespace

TEST_CASE("buildEngineParams carries the request and fixed flags", "[invoker]")
{
    auto request = TranscriptionRequest {};
    request.audioPath = "/tmp/in.wav";
    request.language = "zh_trad";
    request.prompt = "ignored";
    request.useGpu = false;
    request.threads = 6;

    auto const params = buildEngineParams(request, "/models/model.bin");

    CHECK(params["language"] == "zh");
    CHECK(params["prompt"] == std::string(TraditionalChinesePrompt));
    CHECK(params["model"] == "/models/model.bin");
    CHECK(params["fname_inp"] == "/tmp/in.wav");
    CHECK(params["use_gpu"] == false);
    CHECK(params["flash_attn"] == false);
    CHECK(params["no_prints"] == true);
    CHECK(params["comma_in_time"] == false);
    CHECK(params["translate"] == false);
    CHECK(params["no_timestamps"] == false);
    CHECK(params["detect_language"] == false);
    CHECK(params["audio_ctx"] == 0);
    CHECK(params["max_len"] == 0);
    CHECK(params["n_threads"] == 6);
}

TEST_CASE("resolveModelPath prefers existing caller paths", "[invoker]")
{
    auto const dir = test::TempDir {};
    std::filesystem::create_directories(dir.path() / "models");
    std::filesystem::create_directories(dir.path() / "assets");
    auto const defaults = EngineDefaults { .assetsDir = dir.path() / "assets", .modelsDir = dir.path() / "models" };

    SECTION("absolute caller path")
    {
        auto const model = dir.write("custom.bin", "x");
        CHECK(resolveModelPath(model.string(), defaults) == model.string());
    }

    SECTION("relative caller path found in the models directory")
    {
        auto const model = dir.write("models/small.bin", "x");
        CHECK(resolveModelPath("small.bin", defaults) == model.string());
    }

    SECTION("missing caller path is passed through")
    {
        CHECK(resolveModelPath("/does/not/exist.bin", defaults) == "/does/not/exist.bin");
    }

    SECTION("default model in the models directory")
    {
        auto const model = dir.write("models/model.bin", "x");
        CHECK(resolveModelPath("", defaults) == model.string());
    }

    SECTION("bundled model as the last resort")
    {
        CHECK(resolveModelPath("", defaults) == (dir.path() / "assets" / "model.bin").string());
    }
}

TEST_CASE("invokeTranscription returns the raw payload", "[invoker]")
{
    auto const dir = test::TempDir {};
    auto request = TranscriptionRequest {};
    request.audioPath = dir.write("audio.wav", "RIFF").string();

    auto seenParams = nlohmann::json {};
    auto const engine = EngineHandle([&seenParams](const nlohmann::json& params, const NativeProgressFunction&) {
        seenParams = params;
        return NativeOutcome(nlohmann::json(R"({"segments":[]})"));
    });

    auto const result = invokeTranscription(engine, request, EngineDefaults { .assetsDir = dir.path() });

    REQUIRE(result.has_value());
    CHECK(result->payload == R"({"segments":[]})");
    CHECK(seenParams["model"] == (dir.path() / "model.bin").string());
    CHECK(seenParams["language"] == "auto");
}

TEST_CASE("invokeTranscription validates its inputs", "[invoker]")
{
    auto const engine = engineReturning("[]");

    SECTION("missing audio file")
    {
        auto request = TranscriptionRequest {};
        request.audioPath = "/does/not/exist.wav";
        auto const result = invokeTranscription(engine, request, {});
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == ErrorCode::IoError);
        CHECK(result.error().message == "Audio file not found: /does/not/exist.wav");
    }

    SECTION("unsupported language")
    {
        auto request = TranscriptionRequest {};
        request.language = "Klingon";
        auto const result = invokeTranscription(engine, request, {});
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("progress is forwarded within range and never decreases", "[invoker]")
{
    auto const dir = test::TempDir {};
    auto received = std::vector<int> {};

    auto request = TranscriptionRequest {};
    request.audioPath = dir.write("audio.wav", "RIFF").string();
    request.progress = [&received](int percent) { received.push_back(percent); };

    auto const engine = EngineHandle([](const nlohmann::json&, const NativeProgressFunction& progress) {
        for (auto const percent: { 0, 10, 5, 50, 150, -1, 50, 100 })
            progress(percent);
        return NativeOutcome(nlohmann::json("[]"));
    });

    REQUIRE(invokeTranscription(engine, request, {}).has_value());
    CHECK(received == std::vector<int> { 0, 10, 50, 50, 100 });
}

TEST_CASE("cancellation wins once the predicate has reported true", "[invoker]")
{
    auto const dir = test::TempDir {};
    auto cancelAfter = std::atomic<int> { 2 };
    auto received = std::vector<int> {};

    auto request = TranscriptionRequest {};
    request.audioPath = dir.write("audio.wav", "RIFF").string();
    request.progress = [&received](int percent) { received.push_back(percent); };
    request.cancellationCheck = [&cancelAfter] { return cancelAfter.fetch_sub(1) <= 0; };

    auto const ticking = [](NativeOutcome outcome) {
        return EngineHandle([outcome](const nlohmann::json&, const NativeProgressFunction& progress) {
            for (auto percent = 0; percent <= 100; percent += 10)
                progress(percent);
            return outcome;
        });
    };

    SECTION("native call succeeded")
    {
        auto const result = invokeTranscription(ticking(nlohmann::json("[]")), request, {});
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == ErrorCode::Cancelled);
        CHECK(result.error().message == "Transcription cancelled");
        CHECK(received == std::vector<int> { 0, 10 });
    }

    SECTION("native call failed")
    {
        auto const failure = NativeOutcome(std::unexpected(NativeFailure { .message = "boom", .details = {} }));
        auto const result = invokeTranscription(ticking(failure), request, {});
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == ErrorCode::Cancelled);
    }
}

TEST_CASE("cancellation is checked after the call settles", "[invoker]")
{
    auto const dir = test::TempDir {};
    auto cancelled = std::atomic<bool> { false };

    auto request = TranscriptionRequest {};
    request.audioPath = dir.write("audio.wav", "RIFF").string();
    request.cancellationCheck = [&cancelled] { return cancelled.load(); };

    // No progress ticks at all; the flag flips while the engine runs.
    auto const engine = EngineHandle([&cancelled](const nlohmann::json&, const NativeProgressFunction&) {
        cancelled = true;
        return NativeOutcome(nlohmann::json("[]"));
    });

    auto const result = invokeTranscription(engine, request, {});
    REQUIRE_FALSE(result.has_value());
    CHECK(isCancellation(result.error()));
}

TEST_CASE("native failures are classified", "[invoker]")
{
    auto const dir = test::TempDir {};
    auto request = TranscriptionRequest {};
    request.audioPath = dir.write("audio.wav", "RIFF").string();

    SECTION("whisper context failure")
    {
        auto const result = invokeTranscription(engineFailingWith("failed to initialize whisper context"), request, {});
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == ErrorCode::ModelCorrupted);
        CHECK(result.error().message.find("Model path: model.bin") != std::string::npos);
    }

    SECTION("corruption reported only in the details")
    {
        auto const engine = engineFailingWith("whisper error", "whisper_model_load: not all tensors loaded");
        auto const result = invokeTranscription(engine, request, {});
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == ErrorCode::ModelCorrupted);
    }

    SECTION("missing Metal symbol")
    {
        auto const engine = engineFailingWith("Symbol not found: _OBJC_CLASS_$_MTLResidencySetDescriptor");
        auto const result = invokeTranscription(engine, request, {});
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == ErrorCode::OsVersionIncompatible);
        CHECK(result.error().message.find("macOS 15.6") != std::string::npos);
    }

    SECTION("anything else")
    {
        auto const result = invokeTranscription(engineFailingWith("disk on fire"), request, {});
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == ErrorCode::TranscriptionFailed);
        CHECK(result.error().message.find("Audio file: " + request.audioPath) != std::string::npos);
    }

    SECTION("engine throws")
    {
        auto const engine = EngineHandle([](const nlohmann::json&, const NativeProgressFunction&) -> NativeOutcome {
            throw std::runtime_error("failed to load model");
        });
        auto const result = invokeTranscription(engine, request, {});
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == ErrorCode::ModelCorrupted);
    }
}

TEST_CASE("an empty result is treated as a corrupted model", "[invoker]")
{
    auto const dir = test::TempDir {};
    auto request = TranscriptionRequest {};
    request.audioPath = dir.write("audio.wav", "RIFF").string();

    for (auto const& payload: { nlohmann::json(nullptr), nlohmann::json(""), nlohmann::json(false) })
    {
        auto const result = invokeTranscription(engineReturning(payload), request, {});
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == ErrorCode::ModelCorrupted);
        CHECK(result.error().message.starts_with("MODEL_CORRUPTED: Transcription returned no result."));
    }
}

TEST_CASE("errors name the model path that was actually used", "[invoker]")
{
    auto const dir = test::TempDir {};
    auto request = TranscriptionRequest {};
    request.audioPath = dir.write("audio.wav", "RIFF").string();
    auto const defaults = EngineDefaults { .assetsDir = dir.path() };
    auto const expected = (dir.path() / "model.bin").string();

    SECTION("native failure")
    {
        auto const engine = engineFailingWith("failed to initialize whisper context");
        auto const result = invokeTranscription(engine, request, defaults);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().modelPath == expected);
        CHECK(result.error().message.find("Model path: " + expected) != std::string::npos);
    }

    SECTION("unclassified failure")
    {
        auto const result = invokeTranscription(engineFailingWith("disk on fire"), request, defaults);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == ErrorCode::TranscriptionFailed);
        CHECK(result.error().modelPath == expected);
    }

    SECTION("empty result")
    {
        auto const result = invokeTranscription(engineReturning(nullptr), request, defaults);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == ErrorCode::ModelCorrupted);
        CHECK(result.error().modelPath == expected);
    }

    SECTION("model found in the models directory")
    {
        auto const models = test::TempDir {};
        auto const model = models.write("small.bin", "ggml");
        request.modelPath = "small.bin";

        auto const withModels = EngineDefaults { .assetsDir = dir.path(), .modelsDir = models.path() };
        auto const result = invokeTranscription(engineReturning(""), request, withModels);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().modelPath == model.string());
    }
}
