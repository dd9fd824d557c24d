// SPDX-License-Identifier: Apache-2.0
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <engine/EngineAbi.h>

#include <string>
#include <string_view>

#include "WhisperEngine.hpp"

namespace xcaption::engine
{

namespace
{

    constexpr auto StatusOk = 0;
    constexpr auto StatusFailed = 1;
    constexpr auto StatusInvalidCall = 2;

    void reportError(const XcaptionEngineCallbacks& callbacks, std::string_view message)
    {
        if (!callbacks.error)
            return;
        auto const text = std::string(message);
        callbacks.error(text.c_str(), callbacks.user);
    }

    auto transcribe(const char* paramsJson, const XcaptionEngineCallbacks& callbacks) -> int
    {
        auto params = json::parse(paramsJson ? std::string_view { paramsJson } : std::string_view {});
        if (!params)
        {
            reportError(callbacks, params.error().message);
            return StatusFailed;
        }

        auto request = parseWhisperRequest(*params);
        if (!request)
        {
            reportError(callbacks, request.error().message);
            return StatusFailed;
        }

        auto const progress = [&callbacks](int percent) {
            if (callbacks.progress)
                callbacks.progress(percent, callbacks.user);
        };

        auto result = runWhisper(*request, progress);
        if (!result)
        {
            log::error("{}", result.error().message);
            reportError(callbacks, result.error().message);
            return StatusFailed;
        }

        // whisper.cpp may split a multi-byte character across segments.
        auto const payload = result->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        if (callbacks.result)
            callbacks.result(payload.data(), payload.size(), callbacks.user);
        return StatusOk;
    }

    auto guardedTranscribe(const char* paramsJson, const XcaptionEngineCallbacks* callbacks) -> int
    {
        if (!callbacks)
            return StatusInvalidCall;

        // No C++ exception may cross the C boundary.
        try
        {
            return transcribe(paramsJson, *callbacks);
        }
        catch (const std::exception& e)
        {
            reportError(*callbacks, e.what());
            return StatusFailed;
        }
    }

} // namespace

} // namespace xcaption::engine

extern "C"
{

XCAPTION_ENGINE_EXPORT int xcaption_transcribe(const char* params_json, const XcaptionEngineCallbacks* callbacks)
{
    return xcaption::engine::guardedTranscribe(params_json, callbacks);
}

XCAPTION_ENGINE_EXPORT int xcaption_whisper(const char* params_json, const XcaptionEngineCallbacks* callbacks)
{
    return xcaption::engine::guardedTranscribe(params_json, callbacks);
}

} // extern "C"
