// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <engine/EngineLoader.hpp>
#include <transcription/Language.hpp>
#include <transcription/TranscriptionService.hpp>
#include <xcaption/Config.hpp>

#include <CLI/CLI.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <csignal>
#include <filesystem>
#include <format>
#include <fstream>
#include <print>

namespace
{

    constexpr auto ExitFailure = 1;
    constexpr auto ExitCancelled = 130;

    auto interrupted = std::atomic<bool> { false };

    void onInterrupt(int /*signal*/)
    {
        interrupted.store(true);
    }

    auto transcriptToJson(const xcaption::Transcript& transcript) -> nlohmann::json
    {
        auto segments = nlohmann::json::array();
        for (auto const& segment: transcript.segments)
            segments.push_back({ { "start", segment.start }, { "end", segment.end }, { "text", segment.text } });

        auto root = nlohmann::json {
            { "language", transcript.language },
            { "text", transcript.text },
            { "segments", std::move(segments) },
        };
        if (transcript.duration)
            root["duration"] = *transcript.duration;
        return root;
    }

    auto render(const xcaption::TranscriptionOutput& output, xcaption::OutputFormat format) -> std::string
    {
        switch (format)
        {
            case xcaption::OutputFormat::Srt: return output.subtitle.value_or(std::string {});
            case xcaption::OutputFormat::Json: return transcriptToJson(output.transcript).dump(2);
            case xcaption::OutputFormat::Text: return output.transcript.text;
        }
        return {};
    }

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "xcaption-transcribe: Generate captions from a 16 kHz mono WAV file" };

    auto audioPath = std::string {};
    auto modelPath = std::string {};
    auto language = std::string {};
    auto prompt = std::string {};
    auto format = std::string {};
    auto outputPath = std::string {};
    auto configPath = std::string {};
    auto engineDir = std::string {};
    auto cpuOnly = false;
    auto verbose = false;

    app.add_option("audio", audioPath, "Path to the 16 kHz, mono, 16-bit PCM WAV file")->required();
    app.add_option("-m,--model", modelPath, "Path to the whisper model file");
    app.add_option("-l,--language", language, "Language code (auto, zh_sim, zh_trad or an ISO-639 code)");
    app.add_option("-p,--prompt", prompt, "Initial decoding prompt");
    app.add_option("-f,--format", format, "Output format (srt|json|text)")
        ->check(CLI::IsMember({ "srt", "json", "text" }));
    app.add_option("-o,--output", outputPath, "Write the result to this file instead of stdout");
    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--engine-dir", engineDir, "Directory holding the native engine addon");
    app.add_flag("--cpu", cpuOnly, "Disable GPU acceleration");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    // Load config
    auto configResult = configPath.empty() ? xcaption::loadConfig() : xcaption::loadConfigFromFile(configPath);
    if (!configResult)
    {
        xcaption::log::error("Failed to load config: {}", configResult.error().message);
        return ExitFailure;
    }

    auto& config = *configResult;
    xcaption::log::setLevel(verbose ? xcaption::log::Level::Debug : config.logLevel);

    // Apply CLI overrides
    if (!engineDir.empty())
        config.engine.assetsDir = engineDir;
    if (!modelPath.empty())
        config.engine.modelPath = modelPath;
    if (!language.empty())
        config.transcription.language = language;
    if (!prompt.empty())
        config.transcription.prompt = prompt;
    if (!format.empty())
        config.output.format = *xcaption::parseOutputFormat(format);
    if (cpuOnly)
        config.transcription.useGpu = false;

    if (!xcaption::isSupportedLanguage(config.transcription.language))
    {
        xcaption::log::error("Unsupported language code: '{}'", config.transcription.language);
        return ExitFailure;
    }

    auto const assetsDir = config.engine.assetsDir.empty() ? xcaption::defaultEngineAssetsDir()
                                                           : std::filesystem::path(config.engine.assetsDir);
    auto const modelsDir = config.engine.modelsDir.empty() ? xcaption::defaultModelsDir() : config.engine.modelsDir;

    auto engine = xcaption::EngineRegistry::instance().initialize(assetsDir);
    if (!engine)
    {
        xcaption::log::error("{}", engine.error());
        return ExitFailure;
    }

    std::signal(SIGINT, onInterrupt);

    auto service = xcaption::TranscriptionService(
        *engine, xcaption::EngineDefaults { .assetsDir = assetsDir, .modelsDir = modelsDir });

    auto options = xcaption::TranscriptionOptions {
        .language = config.transcription.language,
        .modelPath = config.engine.modelPath,
        .prompt = config.transcription.prompt,
        .progress = [](int percent) { std::print(stderr, "\rTranscribing: {:3}%", percent); },
        .cancellationCheck = [] { return interrupted.load(); },
        .useGpu = config.transcription.useGpu,
        .flashAttention = config.transcription.flashAttention,
        .threads = config.transcription.threads,
        .output = config.output.format == xcaption::OutputFormat::Srt ? xcaption::OutputKind::Subtitle
                                                                       : xcaption::OutputKind::Segments,
    };

    auto result = service.transcribe(audioPath, std::move(options));
    std::println(stderr, "");

    if (!result)
    {
        if (xcaption::isCancellation(result.error()))
        {
            xcaption::log::info("Transcription cancelled");
            return ExitCancelled;
        }
        xcaption::log::error("{}", result.error());
        return ExitFailure;
    }

    if (!result->transcript.hasTimestamps)
        xcaption::log::warning("The engine produced no timestamped segments");

    auto const text = render(*result, config.output.format);

    if (outputPath.empty())
    {
        std::println("{}", text);
        return 0;
    }

    auto file = std::ofstream(outputPath);
    if (!file.is_open())
    {
        xcaption::log::error("Cannot write output file: {}", outputPath);
        return ExitFailure;
    }
    file << text << '\n';
    xcaption::log::info("Wrote {} output to {}", xcaption::outputFormatName(config.output.format), outputPath);
    return 0;
}
