// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <engine/EngineHandle.hpp>
#include <transcription/TranscriptionTypes.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace xcaption
{

/// @brief Directories the invoker falls back to when the request leaves a path unspecified.
struct EngineDefaults
{
    /// Directory holding the native addon and its bundled model.
    std::filesystem::path assetsDir;

    /// Directory holding downloaded models.
    std::filesystem::path modelsDir;
};

/// @brief Name of the model file looked up in the models directory.
///
/// $XCAPTION_WHISPER_MODEL_FILE if set, otherwise "model.bin".
[[nodiscard]] auto defaultModelFileName() -> std::string;

/// @brief Resolves the model file a request will use.
///
/// An existing caller path wins; a relative caller path is also tried under the models
/// directory. Without a caller path the default model in the models directory is used, then
/// the one in the assets directory. Resolution never fails: if nothing exists the last
/// candidate is returned and the engine reports the problem.
[[nodiscard]] auto resolveModelPath(const std::string& requested, const EngineDefaults& defaults) -> std::string;

/// @brief Builds the parameter object passed to the native entry point.
[[nodiscard]] auto buildEngineParams(const TranscriptionRequest& request, const std::string& modelPath)
    -> nlohmann::json;

/// @brief Runs one transcription through @p engine.
///
/// Blocks until the native call settles. The cancellation predicate is only consulted from the
/// progress callback and after the call returns; once it has reported true, the outcome is
/// Cancelled whether the native call succeeded or failed. Native failures are classified with
/// classifyFailure().
[[nodiscard]] auto invokeTranscription(const EngineHandle& engine,
                                       const TranscriptionRequest& request,
                                       const EngineDefaults& defaults) -> Result<RawEngineResult>;

} // namespace xcaption
