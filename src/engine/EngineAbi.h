/* SPDX-License-Identifier: Apache-2.0 */
#ifndef XCAPTION_ENGINE_ABI_H
#define XCAPTION_ENGINE_ABI_H

/*
 * C interface between the host and a native transcription addon.
 *
 * An addon is a shared library exporting XCAPTION_ENGINE_ENTRY_POINT. The host passes the
 * transcription parameters as a UTF-8 JSON object and receives progress, the result payload
 * and error text through callbacks. All strings handed to callbacks are only valid for the
 * duration of the callback; the host copies what it needs.
 *
 * An addon must never let a C++ exception escape the entry point and must not assume that
 * the progress callback can interrupt it: the host only ever records cancellation there.
 */

#include <stddef.h>

#ifdef _WIN32
    #define XCAPTION_ENGINE_EXPORT __declspec(dllexport)
#else
    #define XCAPTION_ENGINE_EXPORT __attribute__((visibility("default")))
#endif

#define XCAPTION_ENGINE_ABI_VERSION 1

/* Exported symbol the host looks up first. */
#define XCAPTION_ENGINE_ENTRY_POINT "xcaption_transcribe"

/* Legacy name of the same entry point, accepted when the primary symbol is absent. */
#define XCAPTION_ENGINE_LEGACY_ENTRY_POINT "xcaption_whisper"

#ifdef __cplusplus
extern "C"
{
#endif

typedef struct XcaptionEngineCallbacks
{
    /* Percentage in [0, 100]. May be called any number of times, from any thread. */
    void (*progress)(int percent, void* user);

    /* Transcription payload (JSON or plain text). Called at most once. */
    void (*result)(const char* data, size_t size, void* user);

    /* Native failure description. Called at most once, before a non-zero return. */
    void (*error)(const char* message, void* user);

    void* user;
} XcaptionEngineCallbacks;

/*
 * Runs one transcription. `params_json` keys: language, prompt, model, fname_inp, use_gpu,
 * flash_attn, no_prints, comma_in_time, translate, no_timestamps, detect_language,
 * audio_ctx, max_len, n_threads.
 *
 * Returns 0 on success, non-zero on failure.
 */
typedef int (*XcaptionTranscribeFn)(const char* params_json, const XcaptionEngineCallbacks* callbacks);

#ifdef __cplusplus
}
#endif

#endif /* XCAPTION_ENGINE_ABI_H */
