// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace profship {

// Sample types understood by the ingestion endpoint. Each type is exported as
// a (value, count) column pair. The last columns describe how the endpoint
// should render the type (sample_type_config of the ingest form).
//  type,          pprof,          unit,        count column,
//     a,              b,             c,                    d,
//  units,     aggregation,  display name,   sampled,  memory
//      e,               f,             g,         h,       i
// clang-format off
#define SAMPLE_TYPE_TABLE(X)                                                                                                                  \
  X(CPU,           "cpu-time",      "nanoseconds", "cpu-samples",           "samples", "sum",     "cpu_time",      true,  false)            \
  X(WALL,          "wall-time",     "nanoseconds", "wall-samples",          "samples", "sum",     "wall_time",     true,  false)            \
  X(ALLOC_SPACE,   "alloc-space",   "bytes",       "alloc-space-samples",   "bytes",   "sum",     "alloc_space",   true,  true)             \
  X(ALLOC_OBJECTS, "alloc-objects", "count",       "alloc-objects-samples", "objects", "sum",     "alloc_objects", true,  true)             \
  X(HEAP_SPACE,    "heap-space",    "bytes",       "heap-space-samples",    "bytes",   "average", "heap_space",    false, true)
// clang-format on

#define X_ENUM(a, b, c, d, e, f, g, h, i) PS_SAMPLE_##a,
enum PROFSHIP_SAMPLE_TYPES : int32_t {
  SAMPLE_TYPE_TABLE(X_ENUM) PS_SAMPLE_TYPE_LENGTH,
};
#undef X_ENUM

struct SampleTypeInfo {
  std::string_view pprof_type;
  std::string_view unit;
  std::string_view count_type;
  std::string_view units;
  std::string_view aggregation;
  std::string_view display_name;
  bool sampled;
  bool memory;
};

using SampleTypeMask = uint32_t;

inline constexpr SampleTypeMask sample_type_bit(int32_t id) {
  return SampleTypeMask{1} << id;
}

inline constexpr SampleTypeMask k_all_sample_types_mask =
    sample_type_bit(PS_SAMPLE_TYPE_LENGTH) - 1;

inline constexpr SampleTypeMask k_memory_sample_types_mask =
    sample_type_bit(PS_SAMPLE_ALLOC_SPACE) |
    sample_type_bit(PS_SAMPLE_ALLOC_OBJECTS) |
    sample_type_bit(PS_SAMPLE_HEAP_SPACE);

/// nullptr if the id is not part of the table (unrecognized sample type)
const SampleTypeInfo *sample_type_info(int32_t id);

inline bool is_known_sample_type(int32_t id) {
  return id >= 0 && id < PS_SAMPLE_TYPE_LENGTH;
}

/// Accepts the short name (cpu_time, alloc_space...), the pprof name
/// (cpu-time...) or an alias (cpu, wall, alloc, objects, heap)
std::optional<int32_t> sample_type_from_str(std::string_view str);

/// Short lower case name (cpu_time, wall_time, alloc_space...)
std::string_view sample_type_short_name(int32_t id);

struct Frame {
  std::string function;
  std::string file;
  int64_t line{0};

  auto operator<=>(const Frame &) const = default;
};

// Frames are ordered leaf first
using Stack = std::vector<Frame>;

struct Sample {
  int32_t sample_type{PS_SAMPLE_CPU};
  Stack frames;
  int64_t value{0};
  int64_t timestamp_ns{0};
};

/// Nanoseconds since the epoch (realtime clock)
int64_t wall_clock_ns();

} // namespace profship
