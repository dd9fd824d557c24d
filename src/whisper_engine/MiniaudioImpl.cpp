// SPDX-License-Identifier: Apache-2.0

// Single translation unit for the miniaudio implementation.
// This file must be compiled exactly once. AudioDecoder includes <miniaudio.h> without the
// IMPLEMENTATION define; the MA_NO_* feature switches are set for the whole target.
#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>
