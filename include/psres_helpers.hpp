// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "logger.hpp"
#include "profship_base.hpp"
#include "psres_def.hpp"
#include "psres_list.hpp"

#include <cerrno>
#include <cstring>

namespace profship {

/// Standardized way of formatting error log
#define LOG_ERROR_DETAILS(log_func, what)                                      \
  log_func("%s at %s:%u", psres_error_message(what), __FILE__, __LINE__);

/// Returns an error psres while using the LG_ERR API
#define PSRES_RETURN_ERROR_LOG(what, ...)                                      \
  do {                                                                         \
    LG_ERR(__VA_ARGS__);                                                       \
    LOG_ERROR_DETAILS(LG_ERR, what);                                           \
    return psres_error(what);                                                  \
  } while (0)

/// Returns a warning psres with the appropriate LG_WRN message
#define PSRES_RETURN_WARN_LOG(what, ...)                                       \
  do {                                                                         \
    LG_WRN(__VA_ARGS__);                                                       \
    LOG_ERROR_DETAILS(LG_WRN, what);                                           \
    return psres_warn(what);                                                   \
  } while (0)

/// Evaluate function and return error if -1 (log errno)
#define PSRES_CHECK_ERRNO(eval, what, ...)                                     \
  do {                                                                         \
    if (unlikely((eval) == -1)) {                                              \
      const int e = errno;                                                     \
      LG_ERR(__VA_ARGS__);                                                     \
      LOG_ERROR_DETAILS(LG_ERR, what);                                         \
      LG_ERR("errno(%d): %s", e, strerror(e));                                 \
      return psres_error(what);                                                \
    }                                                                          \
  } while (0)

/// Check boolean and log
#define PSRES_CHECK_BOOL(eval, what, ...)                                      \
  do {                                                                         \
    if (unlikely(!(eval))) {                                                   \
      PSRES_RETURN_ERROR_LOG(what, __VA_ARGS__);                               \
    }                                                                          \
  } while (0)

inline int psres_sev_to_log_level(int sev) {
  switch (sev) {
  case PS_SEV_ERROR:
    return LL_ERROR;
  case PS_SEV_WARN:
    return LL_WARNING;
  case PS_SEV_NOTICE:
    return LL_DEBUG;
  default: // no log
    return LL_LENGTH;
  }
}

/// Forward result if not OK, whatever the severity
#define PSRES_CHECK_FWD_STRICT(psres)                                          \
  do {                                                                         \
    PSRes lpsres = psres; /* single eval */                                    \
    if (IsPSResNotOK(lpsres)) {                                                \
      LG_IF_LVL_OK(psres_sev_to_log_level(lpsres._sev),                        \
                   "Forward error at %s:%u - %s", __FILE__, __LINE__,          \
                   psres_error_message(lpsres._what));                         \
      return lpsres;                                                           \
    }                                                                          \
  } while (0)

/// Forward result if Fatal, log and continue otherwise
#define PSRES_CHECK_FWD(psres)                                                 \
  do {                                                                         \
    PSRes lpsres = psres; /* single eval */                                    \
    if (IsPSResNotOK(lpsres)) {                                                \
      if (IsPSResFatal(lpsres)) {                                              \
        LG_ERR("Forward error at %s:%u - %s", __FILE__, __LINE__,              \
               psres_error_message(lpsres._what));                             \
        return lpsres;                                                         \
      }                                                                        \
      if (lpsres._sev == PS_SEV_WARN) {                                        \
        LG_WRN("Recover from sev=%d at %s:%u - %s", lpsres._sev, __FILE__,     \
               __LINE__, psres_error_message(lpsres._what));                   \
      } else {                                                                 \
        LG_NTC("Recover from sev=%d at %s:%u - %s", lpsres._sev, __FILE__,     \
               __LINE__, psres_error_message(lpsres._what));                   \
      }                                                                        \
    }                                                                          \
  } while (0)

} // namespace profship
