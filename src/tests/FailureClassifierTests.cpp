// SPDX-License-Identifier: Apache-2.0
#include <engine/FailureClassifier.hpp>
#include <engine/Platform.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace xcaption;

namespace
{

auto callContext(std::string kernel = "21.6.0") -> FailureContext
{
    return FailureContext {
        .stage = FailureStage::Call,
        .audioPath = "/tmp/audio.wav",
        .modelPath = "/models/model.bin",
        .kernelRelease = std::move(kernel),
        .details = {},
    };
}

} // namespace

TEST_CASE("whisper context initialisation failure is classified as ModelCorrupted", "[classifier]")
{
    auto const error = classifyFailure("failed to initialize whisper context", callContext());

    CHECK(error.code == ErrorCode::ModelCorrupted);
    CHECK(error.message.starts_with("MODEL_CORRUPTED:"));
    CHECK(error.message.find("Model path: /models/model.bin") != std::string::npos);
    CHECK(error.originalMessage == "failed to initialize whisper context");
}

TEST_CASE("missing Metal class is classified as OS incompatibility", "[classifier]")
{
    auto const error =
        classifyFailure("Symbol not found: _OBJC_CLASS_$_MTLResidencySetDescriptor", callContext("21.6.0"));

    REQUIRE(error.code == ErrorCode::OsVersionIncompatible);
    CHECK(error.message.find("macOS 15.6") != std::string::npos);
    CHECK(error.message.find("running macOS 12") != std::string::npos);
    CHECK(error.message.find("Original error: Symbol not found") != std::string::npos);
}

TEST_CASE("OS incompatibility takes precedence over other categories", "[classifier]")
{
    // Matches all three tables.
    auto const message = "dlopen(libggml.dylib): Symbol not found, failed to load model";

    CHECK(classifyFailure(message, callContext()).code == ErrorCode::OsVersionIncompatible);
    CHECK(classifyFailure("Library not loaded: failed to load model", callContext()).code
          == ErrorCode::LibraryMissing);
}

TEST_CASE("loader messages for missing dependencies are classified as LibraryMissing", "[classifier]")
{
    auto const context = FailureContext { .stage = FailureStage::Load };

    SECTION("macOS")
    {
        auto const error = classifyFailure("Library not loaded: @rpath/libwhisper.1.dylib", context);
        CHECK(error.code == ErrorCode::LibraryMissing);
        CHECK(error.message.starts_with("Failed to load native addon"));
    }

    SECTION("Linux")
    {
        auto const error =
            classifyFailure("libggml.so: cannot open shared object file: No such file or directory", context);
        CHECK(error.code == ErrorCode::LibraryMissing);
    }

    SECTION("Windows")
    {
        CHECK(classifyFailure("The specified module could not be found.", context).code == ErrorCode::LibraryMissing);
    }
}

TEST_CASE("matching is case-insensitive", "[classifier]")
{
    CHECK(matchesCorruption("NOT ALL TENSORS LOADED FROM MODEL FILE"));
    CHECK(matchesLibraryMissing("library NOT loaded"));
    CHECK(matchesOsVersionIncompatibility("symbol not found: _foo"));
}

TEST_CASE("unmatched call failures become TranscriptionFailed with context", "[classifier]")
{
    auto context = callContext();
    context.modelPath.clear();
    context.details = "at whisper_full (whisper.cpp:1234)";

    auto const error = classifyFailure("out of memory", context);

    CHECK(error.code == ErrorCode::TranscriptionFailed);
    CHECK(error.message.starts_with("Transcription error: out of memory\n"));
    CHECK(error.message.find("Audio file: /tmp/audio.wav") != std::string::npos);
    CHECK(error.message.find("Model path: default") != std::string::npos);
    CHECK(error.message.find("Stack trace:\nat whisper_full") != std::string::npos);
    CHECK(error.audioPath == "/tmp/audio.wav");
}

TEST_CASE("unmatched load failures become EngineLoadFailed", "[classifier]")
{
    auto const error = classifyFailure("invalid ELF header", FailureContext { .stage = FailureStage::Load });

    CHECK(error.code == ErrorCode::EngineLoadFailed);
    CHECK(error.message == "Failed to load native addon: invalid ELF header");
}

TEST_CASE("macosVersionFromKernelRelease maps Darwin releases", "[classifier][platform]")
{
    CHECK(macosVersionFromKernelRelease("24.1.0") == "macOS 15");
    CHECK(macosVersionFromKernelRelease("20.6.0") == "macOS 11");
    CHECK(macosVersionFromKernelRelease("19.6.0") == "macOS 10.15");
    CHECK(macosVersionFromKernelRelease("") == "an unknown macOS version");
    CHECK(macosVersionFromKernelRelease("garbage") == "an unknown macOS version");
}
