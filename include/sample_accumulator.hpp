// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "profile_window.hpp"
#include "sample.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

namespace profship {

inline constexpr size_t k_default_capacity_per_type = 100000;

struct AccumulatorConfig {
  size_t capacity_per_type{k_default_capacity_per_type};
  SampleTypeMask enabled_types{k_all_sample_types_mask};
};

/// Collects samples from any number of sampler threads into the open window.
/// record() holds the lock for a constant amount of work. Building the closed
/// window out of the per type buffers happens after the lock is released.
class SampleAccumulator {
public:
  explicit SampleAccumulator(const AccumulatorConfig &config);
  SampleAccumulator(const AccumulatorConfig &config, int64_t start_ns);

  SampleAccumulator(const SampleAccumulator &) = delete;
  SampleAccumulator &operator=(const SampleAccumulator &) = delete;

  /// Never blocks on I/O and never throws. Samples of disabled types are
  /// counted as filtered. On overflow the oldest sample of the same type is
  /// dropped.
  void record(Sample sample) noexcept;

  /// Closes the open window at the current time and opens its successor
  ProfileWindow swap();
  /// Closes the open window at end_ns, the successor starts at end_ns
  ProfileWindow swap(int64_t end_ns);

  [[nodiscard]] size_t pending() const;
  [[nodiscard]] uint64_t dropped_total() const { return _dropped_total; }
  [[nodiscard]] const AccumulatorConfig &config() const { return _config; }

private:
  // unrecognized sample types are kept in the last slot, the builder decides
  // what to do with them
  static constexpr size_t k_nb_slots = PS_SAMPLE_TYPE_LENGTH + 1;

  struct OpenWindow {
    int64_t start_ns{0};
    std::array<std::deque<Sample>, k_nb_slots> slots;
    size_t nb_samples{0};
    uint64_t dropped{0};
    uint64_t filtered{0};
  };

  static size_t slot_of(int32_t sample_type) {
    return is_known_sample_type(sample_type)
        ? static_cast<size_t>(sample_type)
        : k_nb_slots - 1;
  }

  AccumulatorConfig _config;
  mutable std::mutex _mutex;
  OpenWindow _open;
  std::atomic<uint64_t> _dropped_total{0};
};

} // namespace profship
