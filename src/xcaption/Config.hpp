// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace xcaption
{

/// @brief How the command-line driver writes a transcript.
enum class OutputFormat : std::uint8_t
{
    Srt,
    Json,
    Text,
};

[[nodiscard]] auto outputFormatName(OutputFormat format) -> std::string_view;

/// @brief Parses "srt", "json" or "text".
[[nodiscard]] auto parseOutputFormat(std::string_view name) -> std::optional<OutputFormat>;

/// @brief Engine configuration section.
struct EngineConfig
{
    /// @brief Directory holding the native addon. Empty selects defaultEngineAssetsDir().
    std::string assetsDir;

    /// @brief Directory holding downloaded models. Empty selects defaultModelsDir().
    std::string modelsDir;

    /// @brief Model file used when a request names none.
    std::string modelPath;
};

/// @brief Transcription defaults section.
struct TranscriptionConfig
{
    std::string language = "auto";
    std::string prompt;
    bool useGpu = true;
    bool flashAttention = false;
    int threads = 0;
};

/// @brief Output configuration section.
struct OutputConfig
{
    OutputFormat format = OutputFormat::Srt;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    EngineConfig engine;
    TranscriptionConfig transcription;
    OutputConfig output;
    log::Level logLevel = log::Level::Info;
};

/// @brief Loads the application configuration from the default config path.
///
/// A missing config file is not an error and yields the defaults.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration, or ConfigError for unreadable files and invalid values.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Returns the default data directory path for the current platform.
/// On Linux: $XDG_DATA_HOME/xcaption or ~/.local/share/xcaption
/// On macOS: ~/Library/Application Support/xcaption
/// On Windows: %APPDATA%\xcaption
[[nodiscard]] auto defaultDataDir() -> std::string;

/// @brief Returns the directory holding downloaded models.
///
/// $XCAPTION_MODELS_DIR if set, otherwise the "models" directory inside defaultDataDir().
[[nodiscard]] auto defaultModelsDir() -> std::string;

} // namespace xcaption
