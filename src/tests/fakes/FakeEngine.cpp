// SPDX-License-Identifier: Apache-2.0
#include <engine/EngineAbi.h>

#include <nlohmann/json.hpp>

#include <exception>
#include <fstream>
#include <string>

// Scriptable engine addon used by the loader tests.
//
// The audio file named by `fname_inp` holds a JSON script:
//   progress:   percentages reported in order
//   result:     payload; strings are emitted verbatim, anything else serialized
//   error:      failure message reported before returning `status` (default 1)
//   status:     return code
//   echoParams: emit the received parameters as the payload

namespace
{

auto readScript(const std::string& path) -> nlohmann::json
{
    auto file = std::ifstream(path);
    if (!file)
        return nlohmann::json::object();
    return nlohmann::json::parse(file, nullptr, false);
}

auto run(const char* paramsJson, const XcaptionEngineCallbacks* callbacks) -> int
{
    auto const params = nlohmann::json::parse(paramsJson);
    auto const script = readScript(params.value("fname_inp", std::string {}));
    if (script.is_discarded())
    {
        callbacks->error("fake engine: unreadable script", callbacks->user);
        return 3;
    }

    if (auto const it = script.find("progress"); it != script.end() && it->is_array())
    {
        for (auto const& percent: *it)
            callbacks->progress(percent.get<int>(), callbacks->user);
    }

    if (auto const it = script.find("error"); it != script.end())
    {
        auto const message = it->get<std::string>();
        callbacks->error(message.c_str(), callbacks->user);
        return script.value("status", 1);
    }

    auto payload = std::string {};
    if (script.value("echoParams", false))
        payload = params.dump();
    else if (auto const it = script.find("result"); it != script.end())
        payload = it->is_string() ? it->get<std::string>() : it->dump();

    if (!payload.empty())
        callbacks->result(payload.data(), payload.size(), callbacks->user);
    return script.value("status", 0);
}

} // namespace

extern "C" XCAPTION_ENGINE_EXPORT int xcaption_transcribe(const char* params_json,
                                                           const XcaptionEngineCallbacks* callbacks)
{
    if (!params_json || !callbacks)
        return 2;

    try
    {
        return run(params_json, callbacks);
    }
    catch (const std::exception& e)
    {
        callbacks->error(e.what(), callbacks->user);
        return 1;
    }
}
