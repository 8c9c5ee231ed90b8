// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "sample.hpp"

#include <cstdint>
#include <vector>

namespace profship {

/// A closed collection period, handed from the accumulator to the builder
struct ProfileWindow {
  int64_t start_ns{0};
  int64_t end_ns{0};
  std::vector<Sample> samples;
  uint64_t dropped{0};  // overflowed the per type capacity
  uint64_t filtered{0}; // disabled sample types

  [[nodiscard]] bool empty() const { return samples.empty(); }
  [[nodiscard]] int64_t duration_ns() const { return end_ns - start_ns; }
};

} // namespace profship
