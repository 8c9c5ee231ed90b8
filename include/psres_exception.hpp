// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "psres_def.hpp"
#include "psres_helpers.hpp"
#include "psres_list.hpp"

#include <exception>
#include <new>

namespace profship {

/// Standard exception containing a PSRes
class PSException : public std::exception {
public:
  explicit PSException(PSRes psres) : _psres(psres) {}
  PSException(int16_t sev, int16_t what) : _psres(psres_create(sev, what)) {}
  [[nodiscard]] PSRes get_PSRes() const { return _psres; }

  [[nodiscard]] const char *what() const noexcept override {
    return psres_error_message(_psres._what);
  }

private:
  PSRes _psres;
};
} // namespace profship

/// Catch exceptions and convert them back to a result code
#define CatchExcept2PSRes()                                                    \
  catch (const profship::PSException &e) {                                     \
    PSRES_CHECK_FWD(e.get_PSRes());                                            \
  }                                                                            \
  catch (const std::bad_alloc &ba) {                                           \
    LOG_ERROR_DETAILS(LG_ERR, PS_WHAT_BADALLOC);                               \
    return psres_error(PS_WHAT_BADALLOC);                                      \
  }                                                                            \
  catch (const std::exception &e) {                                            \
    LG_ERR("Exception caught: %s", e.what());                                  \
    LOG_ERROR_DETAILS(LG_ERR, PS_WHAT_STDEXCEPT);                              \
    return psres_error(PS_WHAT_STDEXCEPT);                                     \
  }                                                                            \
  catch (...) {                                                                \
    LOG_ERROR_DETAILS(LG_ERR, PS_WHAT_UKNWEXCEPT);                             \
    return psres_error(PS_WHAT_UKNWEXCEPT);                                    \
  }
