// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "profship_stats.hpp"

#include "psres.hpp"

#include <array>
#include <atomic>
#include <cinttypes>

namespace profship {

namespace {

#define X_PATH(a, b, c) "profship." b,
const char *stats_paths[] = {STATS_TABLE(X_PATH)};
#undef X_PATH

#define X_TYPES(a, b, c) c,
const STAT_KIND stats_types[] = {STATS_TABLE(X_TYPES)};
#undef X_TYPES

std::array<std::atomic<int64_t>, STATS_LEN> s_profship_stats{};
} // namespace

PSRes profship_stats_add(unsigned int stat, int64_t in, int64_t *out) {
  if (stat >= STATS_LEN) {
    PSRES_RETURN_WARN_LOG(PS_WHAT_PROFSHIP_STATS, "Invalid stat");
  }

  int64_t const retval = s_profship_stats[stat].fetch_add(in) + in;

  if (out) {
    *out = retval;
  }
  return psres_init();
}

PSRes profship_stats_set(unsigned int stat, int64_t n) {
  if (stat >= STATS_LEN) {
    PSRES_RETURN_WARN_LOG(PS_WHAT_PROFSHIP_STATS, "Invalid stat");
  }
  s_profship_stats[stat] = n;
  return psres_init();
}

PSRes profship_stats_clear(unsigned int stat) {
  return profship_stats_set(stat, 0);
}

PSRes profship_stats_clear_all() {
  for (auto &stat : s_profship_stats) {
    stat = 0;
  }
  return psres_init();
}

PSRes profship_stats_get(unsigned int stat, int64_t *out) {
  if (stat >= STATS_LEN) {
    PSRES_RETURN_WARN_LOG(PS_WHAT_PROFSHIP_STATS, "Invalid stat");
  }

  if (out) {
    *out = s_profship_stats[stat];
  }
  return psres_init();
}

const char *profship_stats_name(unsigned int stat) {
  if (stat >= STATS_LEN) {
    return "unknown";
  }
  return stats_paths[stat];
}

void profship_stats_print() {
  for (unsigned int i = 0; i < STATS_LEN; ++i) {
    LG_NTC("%s: %" PRId64 "%s", stats_paths[i], s_profship_stats[i].load(),
           stats_types[i] == STAT_GAUGE ? " (last)" : "");
  }
}

} // namespace profship
