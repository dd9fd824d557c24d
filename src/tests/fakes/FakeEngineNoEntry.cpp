// SPDX-License-Identifier: Apache-2.0
#include <engine/EngineAbi.h>

// Loadable module that exports no transcription entry point.

extern "C" XCAPTION_ENGINE_EXPORT int xcaption_engine_abi_version()
{
    return XCAPTION_ENGINE_ABI_VERSION;
}
