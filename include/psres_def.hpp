// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "profship_base.hpp"

#include <cstdint>

// although we keep it in a int16, we only need a uint8 for the enum
enum PS_RES_SEV : uint8_t {
  PS_SEV_OK = 0,
  PS_SEV_NOTICE = 1,
  PS_SEV_WARN = 2,
  PS_SEV_ERROR = 3,
};

/// Result structure containing a what / severity
struct PSRes {
  union {
    struct {
      int16_t _what; // Type of result (see psres_list.hpp)
      int16_t _sev;  // error, warn, OK...
    };
    int32_t _val;
  };
};

#define FillPSRes(res, sev, what)                                              \
  do {                                                                         \
    (res)._sev = (sev);                                                        \
    (res)._what = (what);                                                      \
  } while (0)

#define InitPSResOK(res)                                                       \
  do {                                                                         \
    (res)._val = 0;                                                            \
  } while (0)

/// sev, what
inline PSRes psres_create(int16_t sev, int16_t what) {
  PSRes psres;
  FillPSRes(psres, sev, what);
  return psres;
}

/// Creates a PSRes taking an error code (what)
inline PSRes psres_error(int16_t what) {
  return psres_create(PS_SEV_ERROR, what);
}

/// Creates a PSRes with a warning taking an error code (what)
inline PSRes psres_warn(int16_t what) { return psres_create(PS_SEV_WARN, what); }

/// Create an OK PSRes
inline PSRes psres_init() {
  PSRes psres = {};
  return psres;
}

/// returns a bool : true if they are equal
inline bool psres_equal(PSRes lhs, PSRes rhs) { return lhs._val == rhs._val; }

// Assumption behind these is that SEV_ERROR does not occur often

/// true if psres is not OK (unlikely)
#define IsPSResNotOK(res) unlikely((res)._sev != PS_SEV_OK)

/// true if psres is OK (likely)
#define IsPSResOK(res) likely((res)._sev == PS_SEV_OK)

/// true if psres is fatal (unlikely)
#define IsPSResFatal(res) unlikely((res)._sev == PS_SEV_ERROR)

inline bool operator==(PSRes lhs, PSRes rhs) { return psres_equal(lhs, rhs); }
