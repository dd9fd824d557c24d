// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <transcription/Language.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace xcaption
{

namespace
{

    auto invalidValue(std::string_view key, std::string_view value) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::ConfigError, std::format("Invalid value for '{}': '{}'", key, value));
    }

} // namespace

auto outputFormatName(OutputFormat format) -> std::string_view
{
    switch (format)
    {
        case OutputFormat::Srt: return "srt";
        case OutputFormat::Json: return "json";
        case OutputFormat::Text: return "text";
    }
    return "srt";
}

auto parseOutputFormat(std::string_view name) -> std::optional<OutputFormat>
{
    if (name == "srt")
        return OutputFormat::Srt;
    if (name == "json")
        return OutputFormat::Json;
    if (name == "text" || name == "txt")
        return OutputFormat::Text;
    return std::nullopt;
}

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\xcaption";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/xcaption";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/xcaption";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/xcaption";
    return ".";
#endif
}

auto defaultDataDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\xcaption";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/xcaption";
    return ".";
#else
    auto const* const xdgData = std::getenv("XDG_DATA_HOME");
    if (xdgData)
        return std::string(xdgData) + "/xcaption";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.local/share/xcaption";
    return ".";
#endif
}

auto defaultModelsDir() -> std::string
{
    if (auto const* const modelsDir = std::getenv("XCAPTION_MODELS_DIR"); modelsDir && *modelsDir)
        return modelsDir;
    return (std::filesystem::path(defaultDataDir()) / "models").string();
}

auto defaultConfigPath() -> std::string
{
    return (std::filesystem::path(defaultConfigDir()) / "config.json").string();
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    auto const content = ss.str();

    auto parseResult = json::parse(content);
    if (!parseResult)
        return makeError(ErrorCode::ConfigError,
                         std::format("Invalid config file {}: {}", path, parseResult.error().message));

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("Config file {} must hold a JSON object", path));

    auto config = AppConfig {};

    // Engine section
    if (root.contains("engine"))
    {
        auto const& engine = root["engine"];
        config.engine.assetsDir = json::getStringOr(engine, "assetsDir", "");
        config.engine.modelsDir = json::getStringOr(engine, "modelsDir", "");
        config.engine.modelPath = json::getStringOr(engine, "modelPath", "");
    }

    // Transcription section
    if (root.contains("transcription"))
    {
        auto const& transcription = root["transcription"];
        config.transcription.language = json::getStringOr(transcription, "language", "auto");
        config.transcription.prompt = json::getStringOr(transcription, "prompt", "");
        config.transcription.useGpu = json::getBoolOr(transcription, "useGpu", true);
        config.transcription.flashAttention = json::getBoolOr(transcription, "flashAttention", false);
        config.transcription.threads = json::getIntOr(transcription, "threads", 0);

        if (!isSupportedLanguage(config.transcription.language))
            return invalidValue("transcription.language", config.transcription.language);
        if (config.transcription.threads < 0)
            return invalidValue("transcription.threads", std::to_string(config.transcription.threads));
    }

    // Output section
    if (root.contains("output"))
    {
        auto const formatName = json::getStringOr(root["output"], "format", "srt");
        auto const format = parseOutputFormat(formatName);
        if (!format)
            return invalidValue("output.format", formatName);
        config.output.format = *format;
    }

    if (root.contains("logLevel"))
    {
        auto const levelName = json::getStringOr(root, "logLevel", "info");
        auto const level = log::parseLevel(levelName);
        if (!level)
            return invalidValue("logLevel", levelName);
        config.logLevel = *level;
    }

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    // Engine section
    auto engine = nlohmann::json::object();
    if (!config.engine.assetsDir.empty())
        engine["assetsDir"] = config.engine.assetsDir;
    if (!config.engine.modelsDir.empty())
        engine["modelsDir"] = config.engine.modelsDir;
    if (!config.engine.modelPath.empty())
        engine["modelPath"] = config.engine.modelPath;
    root["engine"] = std::move(engine);

    // Transcription section
    auto transcription = nlohmann::json::object();
    transcription["language"] = config.transcription.language;
    if (!config.transcription.prompt.empty())
        transcription["prompt"] = config.transcription.prompt;
    transcription["useGpu"] = config.transcription.useGpu;
    transcription["flashAttention"] = config.transcription.flashAttention;
    transcription["threads"] = config.transcription.threads;
    root["transcription"] = std::move(transcription);

    root["output"] = { { "format", std::string(outputFormatName(config.output.format)) } };
    root["logLevel"] = std::string(log::levelName(config.logLevel));

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (auto ec = std::error_code {}; !std::filesystem::exists(path, ec))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }
    return loadConfigFromFile(path);
}

} // namespace xcaption
