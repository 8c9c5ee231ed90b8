// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <climits>
#include <cstdint>

enum : uint16_t { PS_COMMON_START_RANGE = 1000, PS_BRIDGE_START_RANGE = 2000 };

#define EXPAND_ENUM(a, b) PS_WHAT_##a,
#define EXPAND_ERROR_MESSAGE(a, b) #a ": " b,

#define COMMON_ERROR_TABLE(X)                                                  \
  X(UKNW, "undocumented error")                                                \
  X(BADALLOC, "allocation error")                                              \
  X(STDEXCEPT, "standard exception caught")                                    \
  X(UKNWEXCEPT, "unknown exception caught")

#define BRIDGE_ERROR_TABLE(X)                                                  \
  X(ENCODING, "error encoding the profile")                                    \
  X(UPLOAD_RETRYABLE, "upload failed after exhausting retries")                \
  X(UPLOAD_FATAL, "upload rejected by the endpoint")                           \
  X(UPLOAD_CANCELLED, "upload cancelled")                                      \
  X(EXPORTER, "error exporting")                                               \
  X(EXPORT_TIMEOUT, "pending export failed to return in time")                 \
  X(TRANSPORT, "error in http transport")                                      \
  X(SCHEDULER, "error in export scheduler")                                    \
  X(PROFSHIP_STATS, "error in stats module")                                   \
  X(CONFIG, "invalid configuration")                                           \
  X(ARGUMENT, "error writing arguments")                                       \
  X(INPUT_PROCESS, "error reading input samples")                              \
  X(UNITTEST, "unit test error")

enum PSRes_What : uint16_t {
  PS_WHAT_MIN_ERRNO = PS_COMMON_START_RANGE,
  // common errors
  COMMON_ERROR_TABLE(EXPAND_ENUM) COMMON_ERROR_SIZE,
  PS_WHAT_MIN_BRIDGE = PS_BRIDGE_START_RANGE,
  BRIDGE_ERROR_TABLE(EXPAND_ENUM) BRIDGE_ERROR_SIZE,
  // max
  PS_WHAT_MAX = SHRT_MAX,
};

/// Retrieve an explicit error message matching the error ID (from table above)
const char *psres_error_message(int16_t what);
