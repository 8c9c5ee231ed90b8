// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "psres_def.hpp"

#include <cstdint>

namespace profship {

// Counters are cumulative for the process, gauges hold the last value
enum STAT_KIND : uint8_t { STAT_COUNTER, STAT_GAUGE };

#define X_ENUM(a, b, c) STATS_##a,
#define STATS_TABLE(X)                                                         \
  X(SAMPLES_RECORDED, "samples.recorded", STAT_COUNTER)                        \
  X(SAMPLES_DROPPED, "samples.dropped", STAT_COUNTER)                          \
  X(SAMPLES_FILTERED, "samples.filtered", STAT_COUNTER)                        \
  X(SAMPLES_SKIPPED, "samples.skipped", STAT_COUNTER)                          \
  X(PROFILES_BUILT, "profiles.built", STAT_COUNTER)                            \
  X(PPROF_SIZE, "pprof.size", STAT_GAUGE)                                      \
  X(PAYLOAD_SIZE, "payload.size", STAT_GAUGE)                                  \
  X(UPLOAD_ATTEMPTS, "upload.attempts", STAT_COUNTER)                          \
  X(UPLOAD_SUCCESSES, "upload.successes", STAT_COUNTER)                        \
  X(UPLOAD_FAILURES, "upload.failures", STAT_COUNTER)                          \
  X(CYCLES_RUN, "cycles.run", STAT_COUNTER)                                     \
  X(CYCLES_SKIPPED, "cycles.skipped", STAT_COUNTER)                            \
  X(CYCLES_ABANDONED, "cycles.abandoned", STAT_COUNTER)

// Expand the enum/index for the individual stats
enum PROFSHIP_STATS : uint8_t { STATS_TABLE(X_ENUM) STATS_LEN };
#undef X_ENUM

// The backend store is a static array of atomics: these can be called from
// any thread. `out` can be NULL.
PSRes profship_stats_add(unsigned int stat, int64_t in, int64_t *out);

// Setting and clearing are last-through-the-gate operations
PSRes profship_stats_set(unsigned int stat, int64_t in);
PSRes profship_stats_clear(unsigned int stat);
PSRes profship_stats_clear_all();

// Merely gets the value of the statistic.
PSRes profship_stats_get(unsigned int stat, int64_t *out);

// Name of the stat as printed in the logs
const char *profship_stats_name(unsigned int stat);

// Print all known stats to the configured log
void profship_stats_print();

} // namespace profship
