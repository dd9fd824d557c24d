// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <engine/EngineHandle.hpp>
#include <engine/Platform.hpp>

#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace xcaption
{

/// @brief Returns the addon filename expected for a platform/architecture pair.
/// @return The filename, or std::nullopt if the pair is not supported.
[[nodiscard]] auto addonFilename(Platform platform, Arch arch) -> std::optional<std::string_view>;

/// @brief Human-readable list of supported pairs, e.g. "win32/x64 (xcaption-engine-win64.dll), ...".
[[nodiscard]] auto supportedAddonsDescription() -> std::string;

/// @brief Lists the addon-like files (shared libraries) present in @p assetsDir, sorted by name.
/// @return Comma separated filenames, or "none".
[[nodiscard]] auto listAvailableAddons(const std::filesystem::path& assetsDir) -> std::string;

/// @brief Returns the engine assets directory.
///
/// $XCAPTION_ENGINE_DIR if set, otherwise the "engine" directory next to the executable.
[[nodiscard]] auto defaultEngineAssetsDir() -> std::filesystem::path;

/// @brief Resolves, loads and validates the native addon for the given platform.
///
/// Fails with EngineNotFound for unsupported pairs or a missing addon file, with
/// OsVersionIncompatible or LibraryMissing when the dynamic loader's message says so, and with
/// EngineLoadFailed when the module cannot be loaded for another reason or exports no entry point.
[[nodiscard]] auto loadEngine(const std::filesystem::path& assetsDir,
                              Platform platform = currentPlatform(),
                              Arch arch = currentArch()) -> Result<EngineHandle>;

/// @brief Process-wide, load-once owner of the native engine.
///
/// The first call to initialize() (or engine()) loads the addon; concurrent first calls are
/// serialised and every later call returns the memoised outcome, including a load failure.
/// The engine is never unloaded before process exit.
class EngineRegistry
{
  public:
    /// @brief Performs the actual load; loadEngine() for the process-wide registry.
    using LoadFunction = std::function<Result<EngineHandle>(const std::filesystem::path& assetsDir)>;

    /// @brief The process-wide registry, backed by loadEngine().
    [[nodiscard]] static auto instance() -> EngineRegistry&;

    explicit EngineRegistry(LoadFunction load);

    EngineRegistry(const EngineRegistry&) = delete;
    EngineRegistry& operator=(const EngineRegistry&) = delete;

    /// @brief Loads the engine from @p assetsDir unless a load was already attempted.
    [[nodiscard]] auto initialize(const std::filesystem::path& assetsDir) -> Result<EngineHandle>;

    /// @brief Returns the engine, loading it from defaultEngineAssetsDir() on first use.
    [[nodiscard]] auto engine() -> Result<EngineHandle>;

  private:
    LoadFunction _load;
    std::once_flag _once;
    std::optional<Result<EngineHandle>> _outcome;
};

} // namespace xcaption
