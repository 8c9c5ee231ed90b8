// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "sample_accumulator.hpp"

#include "profship_stats.hpp"

#include <algorithm>
#include <iterator>
#include <new>
#include <optional>
#include <utility>

namespace profship {

SampleAccumulator::SampleAccumulator(const AccumulatorConfig &config)
    : SampleAccumulator(config, wall_clock_ns()) {}

SampleAccumulator::SampleAccumulator(const AccumulatorConfig &config,
                                     int64_t start_ns)
    : _config(config) {
  _open.start_ns = start_ns;
}

void SampleAccumulator::record(Sample sample) noexcept {
  int32_t const type = sample.sample_type;
  if (is_known_sample_type(type) &&
      !(_config.enabled_types & sample_type_bit(type))) {
    {
      std::lock_guard const lock(_mutex);
      ++_open.filtered;
    }
    profship_stats_add(STATS_SAMPLES_FILTERED, 1, nullptr);
    return;
  }

  // Evicted samples are released once the lock is gone
  std::optional<Sample> evicted;
  try {
    std::lock_guard const lock(_mutex);
    auto &slot = _open.slots[slot_of(type)];
    bool const full =
        !slot.empty() && slot.size() >= _config.capacity_per_type;
    slot.push_back(std::move(sample));
    if (full) {
      evicted.emplace(std::move(slot.front()));
      slot.pop_front();
      ++_open.dropped;
    } else {
      ++_open.nb_samples;
    }
  } catch (const std::bad_alloc &) {
    // the sample is lost, report it the same way as an overflow
    evicted.emplace();
    std::lock_guard const lock(_mutex);
    ++_open.dropped;
  }

  if (evicted) {
    ++_dropped_total;
    profship_stats_add(STATS_SAMPLES_DROPPED, 1, nullptr);
  } else {
    profship_stats_add(STATS_SAMPLES_RECORDED, 1, nullptr);
  }
}

ProfileWindow SampleAccumulator::swap() { return swap(wall_clock_ns()); }

ProfileWindow SampleAccumulator::swap(int64_t end_ns) {
  OpenWindow closed;
  {
    std::lock_guard const lock(_mutex);
    // a clock going backward must not produce a negative window
    end_ns = std::max(end_ns, _open.start_ns);
    closed.start_ns = end_ns;
    std::swap(closed, _open);
  }

  ProfileWindow window;
  window.start_ns = closed.start_ns;
  window.end_ns = end_ns;
  window.dropped = closed.dropped;
  window.filtered = closed.filtered;
  window.samples.reserve(closed.nb_samples);
  for (auto &slot : closed.slots) {
    std::ranges::move(slot, std::back_inserter(window.samples));
  }
  return window;
}

size_t SampleAccumulator::pending() const {
  std::lock_guard const lock(_mutex);
  return _open.nb_samples;
}

} // namespace profship
