// SPDX-License-Identifier: Apache-2.0
#include "EngineLoader.hpp"

#include <core/Log.hpp>
#include <engine/EngineAbi.h>
#include <engine/FailureClassifier.hpp>
#include <engine/SharedLibrary.hpp>

#include <algorithm>
#include <array>
#include <cstdlib>
#include <format>
#include <memory>
#include <vector>

#if defined(_WIN32)
    #define WIN32_LEAN_AND_MEAN
    #include <windows.h>
#elif defined(__APPLE__)
    #include <mach-o/dyld.h>
#endif

namespace xcaption
{

namespace
{

    struct AddonEntry
    {
        Platform platform;
        Arch arch;
        std::string_view filename;
    };

    constexpr auto AddonTable = std::array<AddonEntry, 4> { {
        { .platform = Platform::Windows, .arch = Arch::X64, .filename = "xcaption-engine-win64.dll" },
        { .platform = Platform::MacOS, .arch = Arch::Arm64, .filename = "libxcaption-engine.dylib" },
        { .platform = Platform::Linux, .arch = Arch::X64, .filename = "libxcaption-engine-linux-x64.so" },
        { .platform = Platform::Linux, .arch = Arch::Arm64, .filename = "libxcaption-engine-linux-arm64.so" },
    } };

    constexpr auto AddonExtensions = std::array<std::string_view, 4> { ".so", ".dylib", ".dll", ".node" };

    /// @brief State shared between a native call and its C callbacks.
    struct CallState
    {
        const NativeProgressFunction* progress = nullptr;
        std::optional<std::string> payload;
        std::string error;
    };

    void onProgress(int percent, void* user)
    {
        auto* const state = static_cast<CallState*>(user);
        if (!state->progress || !*state->progress)
            return;

        // Nothing may unwind through the addon's frames.
        try
        {
            (*state->progress)(percent);
        }
        catch (const std::exception& e)
        {
            log::warning("Progress sink raised an exception, ignoring: {}", e.what());
        }
    }

    void onResult(const char* data, size_t size, void* user)
    {
        auto* const state = static_cast<CallState*>(user);
        if (data)
            state->payload.emplace(data, size);
    }

    void onError(const char* message, void* user)
    {
        auto* const state = static_cast<CallState*>(user);
        if (message)
            state->error = message;
    }

    /// @brief Adapts an exported C entry point to a NativeTranscribeFunction.
    ///
    /// The library is captured by shared ownership so that it outlives every handle copy.
    auto bindEntryPoint(std::shared_ptr<SharedLibrary> library, XcaptionTranscribeFn entry)
        -> NativeTranscribeFunction
    {
        return [library = std::move(library), entry](const nlohmann::json& params,
                                                      const NativeProgressFunction& progress) -> NativeOutcome {
            auto state = CallState { .progress = &progress, .payload = std::nullopt, .error = {} };
            auto const callbacks = XcaptionEngineCallbacks {
                .progress = &onProgress,
                .result = &onResult,
                .error = &onError,
                .user = &state,
            };

            auto const serialized = params.dump();
            auto const status = entry(serialized.c_str(), &callbacks);

            if (status != 0)
            {
                auto message = state.error.empty() ? std::format("Native engine returned status {}", status)
                                                   : std::move(state.error);
                return std::unexpected(NativeFailure { .message = std::move(message), .details = {} });
            }

            if (!state.payload)
                return nlohmann::json(nullptr);
            return nlohmann::json(std::move(*state.payload));
        };
    }

    auto executableDir() -> std::filesystem::path
    {
        auto ec = std::error_code {};
#if defined(_WIN32)
        auto buffer = std::wstring(MAX_PATH, L'\0');
        auto const length = GetModuleFileNameW(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
        if (length > 0)
        {
            buffer.resize(length);
            return std::filesystem::path(buffer).parent_path();
        }
#elif defined(__APPLE__)
        auto size = uint32_t { 0 };
        _NSGetExecutablePath(nullptr, &size);
        auto buffer = std::string(size, '\0');
        if (_NSGetExecutablePath(buffer.data(), &size) == 0)
            return std::filesystem::canonical(buffer.c_str(), ec).parent_path();
#else
        auto const self = std::filesystem::read_symlink("/proc/self/exe", ec);
        if (!ec)
            return self.parent_path();
#endif
        return std::filesystem::current_path(ec);
    }

} // namespace

auto addonFilename(Platform platform, Arch arch) -> std::optional<std::string_view>
{
    auto const it = std::ranges::find_if(
        AddonTable, [&](AddonEntry const& entry) { return entry.platform == platform && entry.arch == arch; });
    if (it == AddonTable.end())
        return std::nullopt;
    return it->filename;
}

auto supportedAddonsDescription() -> std::string
{
    auto text = std::string {};
    for (auto const& entry: AddonTable)
    {
        if (!text.empty())
            text += ", ";
        text += std::format("{}/{} ({})", platformName(entry.platform), archName(entry.arch), entry.filename);
    }
    return text;
}

auto listAvailableAddons(const std::filesystem::path& assetsDir) -> std::string
{
    auto names = std::vector<std::string> {};
    auto ec = std::error_code {};
    for (auto it = std::filesystem::directory_iterator(assetsDir, ec);
         !ec && it != std::filesystem::directory_iterator();
         it.increment(ec))
    {
        auto const extension = it->path().extension().string();
        if (std::ranges::find(AddonExtensions, std::string_view(extension)) != AddonExtensions.end())
            names.push_back(it->path().filename().string());
    }

    if (names.empty())
        return "none";

    std::ranges::sort(names);
    auto text = std::string {};
    for (auto const& name: names)
    {
        if (!text.empty())
            text += ", ";
        text += name;
    }
    return text;
}

auto defaultEngineAssetsDir() -> std::filesystem::path
{
    if (auto const* const env = std::getenv("XCAPTION_ENGINE_DIR"); env && *env)
        return std::filesystem::path(env);
    return executableDir() / "engine";
}

auto loadEngine(const std::filesystem::path& assetsDir, Platform platform, Arch arch) -> Result<EngineHandle>
{
    auto const filename = addonFilename(platform, arch);
    if (!filename)
        return makeError(ErrorCode::EngineNotFound,
                         std::format("Unsupported platform/architecture combination: {}/{}\n"
                                     "Supported combinations: {}",
                                     platformName(platform),
                                     archName(arch),
                                     supportedAddonsDescription()));

    auto const addonPath = assetsDir / *filename;
    auto ec = std::error_code {};
    if (!std::filesystem::is_regular_file(addonPath, ec))
        return makeError(ErrorCode::EngineNotFound,
                         std::format("Native addon not found.\n"
                                     "Expected: {}\n"
                                     "Path: {}\n"
                                     "Available addons: {}\n"
                                     "Please ensure {} exists in the engine directory.",
                                     *filename,
                                     addonPath.string(),
                                     listAvailableAddons(assetsDir),
                                     *filename));

    log::info("Loading native addon from: {}", addonPath.string());

    auto library = SharedLibrary::open(addonPath);
    if (!library)
    {
        auto const context = FailureContext {
            .stage = FailureStage::Load,
            .audioPath = {},
            .modelPath = {},
            .kernelRelease = kernelRelease(),
            .details = {},
        };
        auto error = classifyFailure(library.error().originalMessage, context);
        log::error("{}", error.message);
        return makeError(std::move(error));
    }

    auto* symbol = library->symbol(XCAPTION_ENGINE_ENTRY_POINT);
    if (!symbol)
        symbol = library->symbol(XCAPTION_ENGINE_LEGACY_ENTRY_POINT);
    if (!symbol)
    {
        log::error("Native addon {} exports no transcription entry point", addonPath.string());
        return makeError(ErrorCode::EngineLoadFailed,
                         std::format("Native addon loaded but the transcription entry point ({} or {}) was "
                                     "not found or is invalid: {}",
                                     XCAPTION_ENGINE_ENTRY_POINT,
                                     XCAPTION_ENGINE_LEGACY_ENTRY_POINT,
                                     addonPath.string()));
    }

    auto const entry = reinterpret_cast<XcaptionTranscribeFn>(symbol);
    auto shared = std::make_shared<SharedLibrary>(std::move(*library));

    log::info("Native addon loaded successfully");
    return EngineHandle(bindEntryPoint(std::move(shared), entry), addonPath);
}

auto EngineRegistry::instance() -> EngineRegistry&
{
    static auto registry =
        EngineRegistry([](const std::filesystem::path& assetsDir) { return loadEngine(assetsDir); });
    return registry;
}

EngineRegistry::EngineRegistry(LoadFunction load): _load(std::move(load))
{
}

auto EngineRegistry::initialize(const std::filesystem::path& assetsDir) -> Result<EngineHandle>
{
    std::call_once(_once, [&] { _outcome.emplace(_load(assetsDir)); });
    return *_outcome;
}

auto EngineRegistry::engine() -> Result<EngineHandle>
{
    return initialize(defaultEngineAssetsDir());
}

} // namespace xcaption
