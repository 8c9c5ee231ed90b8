// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "sample.hpp"

#include "profship_cmdline.hpp"

#include <chrono>
#include <initializer_list>
#include <iterator>
#include <span>

namespace profship {

namespace {
#define X_INFO(a, b, c, d, e, f, g, h, i)                                      \
  {.pprof_type = b,                                                            \
   .unit = c,                                                                  \
   .count_type = d,                                                            \
   .units = e,                                                                 \
   .aggregation = f,                                                           \
   .display_name = g,                                                          \
   .sampled = h,                                                               \
   .memory = i},
constexpr SampleTypeInfo s_sample_type_infos[] = {SAMPLE_TYPE_TABLE(X_INFO)};
#undef X_INFO

#define X_STR(a, b, c, d, e, f, g, h, i) g,
constexpr std::string_view s_short_names[] = {SAMPLE_TYPE_TABLE(X_STR)};
#undef X_STR

#define X_STR(a, b, c, d, e, f, g, h, i) b,
constexpr std::string_view s_pprof_names[] = {SAMPLE_TYPE_TABLE(X_STR)};
#undef X_STR

// cpu_time is accepted, cpu is friendlier on a command line
constexpr std::string_view s_aliases[] = {"cpu", "wall", "alloc", "objects",
                                          "heap"};
static_assert(std::size(s_aliases) == PS_SAMPLE_TYPE_LENGTH);
} // namespace

const SampleTypeInfo *sample_type_info(int32_t id) {
  if (!is_known_sample_type(id)) {
    return nullptr;
  }
  return &s_sample_type_infos[id];
}

std::optional<int32_t> sample_type_from_str(std::string_view str) {
  for (const auto &names : {std::span<const std::string_view>{s_short_names},
                            std::span<const std::string_view>{s_pprof_names},
                            std::span<const std::string_view>{s_aliases}}) {
    int const idx = arg_which(str, names);
    if (idx != -1) {
      return idx;
    }
  }
  return std::nullopt;
}

std::string_view sample_type_short_name(int32_t id) {
  if (!is_known_sample_type(id)) {
    return "unknown";
  }
  return s_short_names[id];
}

int64_t wall_clock_ns() {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace profship
