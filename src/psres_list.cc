// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "psres_list.hpp"

#include <iterator>

namespace {
const char *s_common_error_messages[] = {
    COMMON_ERROR_TABLE(EXPAND_ERROR_MESSAGE)};

const char *s_bridge_error_messages[] = {
    BRIDGE_ERROR_TABLE(EXPAND_ERROR_MESSAGE)};
} // namespace

const char *psres_error_message(int16_t what) {
  if (what > PS_WHAT_MIN_ERRNO && what < COMMON_ERROR_SIZE) {
    return s_common_error_messages[what - PS_WHAT_MIN_ERRNO - 1];
  }
  if (what > PS_WHAT_MIN_BRIDGE && what < BRIDGE_ERROR_SIZE) {
    return s_bridge_error_messages[what - PS_WHAT_MIN_BRIDGE - 1];
  }
  return "Unknown error. Please update " __FILE__ "";
}
