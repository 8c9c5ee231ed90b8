// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "profship_base.hpp"
#include "version.hpp"

#include <cstdarg>

namespace profship {

enum LOG_OPTS {
  LOG_DISABLE = 0,
  LOG_STDOUT = 1,
  LOG_STDERR = 2,
  LOG_FILE = 3,
};

// syslog-like levels
enum LOG_LVL {
  LL_FORCE_ERROR = -3,
  LL_FORCE_WARNING = -4,
  LL_FORCE_NOTICE = -5,
  LL_FORCE_INFORMATIONAL = -6,
  LL_FORCE_DEBUG = -7,
  LL_EMERGENCY = 0, // No force override because always printed
  LL_ALERT = 1,
  LL_CRITICAL = 2,
  LL_ERROR = 3,
  LL_WARNING = 4,
  LL_NOTICE = 5,
  LL_INFORMATIONAL = 6,
  LL_DEBUG = 7,
  LL_LENGTH,
};

// Manage the logging backend. The host owns the lifecycle: components only
// emit through the LG_* macros.
void LOG_close();
bool LOG_open(int mode, const char *opts);

// Formatted print to the profship logging facility
// Log-print-Formatted with Level and Name
printflike(3, 4) void lprintfln(int lvl, const char *name, const char *fmt,
                                ...);

// Same as above, used by the macros once the level was checked
// O for optional
printflike(3, 4) void olprintfln(int lvl, const char *name, const char *fmt,
                                 ...);

// V for variadic, as per libc's v*printf() functions
void vlprintfln(int lvl, const char *name, const char *format, va_list args);

// Setters for global logger context
void LOG_setlevel(int lvl);
int LOG_getlevel();

bool LOG_is_logging_enabled_for_level(int level);

/******************************* Logging Macros *******************************/
#define ABS(__x)                                                               \
  ({                                                                           \
    const typeof(__x) _x = (__x);                                              \
    _x < 0 ? -1 * _x : _x;                                                     \
  })

// Avoid calling arguments (which can have CPU costs unless level is OK)
#define LG_IF_LVL_OK(level, ...)                                               \
  do {                                                                         \
    if (unlikely(profship::LOG_is_logging_enabled_for_level(level))) {         \
      profship::olprintfln(ABS(level), MYNAME, __VA_ARGS__);                   \
    }                                                                          \
  } while (false)

#define LG_ERR(...) LG_IF_LVL_OK(profship::LL_ERROR, __VA_ARGS__)
#define LG_WRN(...) LG_IF_LVL_OK(profship::LL_WARNING, __VA_ARGS__)
#define LG_NTC(...) LG_IF_LVL_OK(profship::LL_NOTICE, __VA_ARGS__)
#define LG_NFO(...) LG_IF_LVL_OK(profship::LL_INFORMATIONAL, __VA_ARGS__)
#define LG_DBG(...) LG_IF_LVL_OK(profship::LL_DEBUG, __VA_ARGS__)
#define PRINT_NFO(...) LG_IF_LVL_OK(-1 * profship::LL_INFORMATIONAL, __VA_ARGS__)

} // namespace profship
