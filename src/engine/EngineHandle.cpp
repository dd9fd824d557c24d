// SPDX-License-Identifier: Apache-2.0
#include "EngineHandle.hpp"

namespace xcaption
{

EngineHandle::EngineHandle(NativeTranscribeFunction transcribe, std::filesystem::path source):
    _transcribe(std::move(transcribe)), _source(std::move(source))
{
}

auto EngineHandle::invoke(const nlohmann::json& params, const NativeProgressFunction& progress) const
    -> NativeOutcome
{
    if (!_transcribe)
        return std::unexpected(NativeFailure { .message = "Engine handle has no entry point", .details = {} });
    return _transcribe(params, progress);
}

} // namespace xcaption
