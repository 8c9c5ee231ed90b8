// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "logger_setup.hpp"

#include "logger.hpp"
#include "profship_cmdline.hpp"

#include <iterator>
#include <string_view>

namespace profship {

namespace {
// Same order in both tables
constexpr std::string_view k_mode_names[] = {"stdout", "stderr", "disabled"};
constexpr int k_modes[] = {LOG_STDOUT, LOG_STDERR, LOG_DISABLE};

constexpr std::string_view k_level_names[] = {"debug", "informational",
                                              "notice", "warn", "error"};
constexpr int k_levels[] = {LL_DEBUG, LL_INFORMATIONAL, LL_NOTICE, LL_WARNING,
                            LL_ERROR};
static_assert(std::size(k_level_names) == std::size(k_levels));
static_assert(std::size(k_mode_names) == std::size(k_modes));
} // namespace

void setup_logger(const char *log_mode, const char *log_level) {
  int const level_idx = arg_which(log_level ? log_level : "", k_level_names);
  LOG_setlevel(level_idx == -1 ? LL_WARNING : k_levels[level_idx]);

  // anything that is not a known mode is a file path
  if (log_mode && *log_mode) {
    int const idx = arg_which(log_mode, k_mode_names);
    if (idx != -1) {
      LOG_open(k_modes[idx], nullptr);
    } else if (!LOG_open(LOG_FILE, log_mode)) {
      LOG_open(LOG_STDERR, nullptr);
      LG_WRN("Unable to open log file %s, using stderr", log_mode);
    }
  } else {
    LOG_open(LOG_STDOUT, nullptr);
  }
}

} // namespace profship
