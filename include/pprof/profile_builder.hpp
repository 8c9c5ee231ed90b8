// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "profile_window.hpp"
#include "psres_def.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace profship {

/// Serialized pprof (perftools.profiles.Profile) of one window. Never
/// modified once built.
class BinaryProfile {
public:
  BinaryProfile() = default;
  BinaryProfile(std::string serialized, int64_t start_ns, int64_t end_ns,
                size_t nb_stacks, size_t nb_skipped)
      : _serialized(std::move(serialized)), _start_ns(start_ns),
        _end_ns(end_ns), _nb_stacks(nb_stacks), _nb_skipped(nb_skipped) {}

  [[nodiscard]] const std::string &serialized() const { return _serialized; }
  [[nodiscard]] int64_t start_ns() const { return _start_ns; }
  [[nodiscard]] int64_t end_ns() const { return _end_ns; }
  // distinct stack traces
  [[nodiscard]] size_t nb_stacks() const { return _nb_stacks; }
  // samples of unrecognized type
  [[nodiscard]] size_t nb_skipped() const { return _nb_skipped; }

private:
  std::string _serialized;
  int64_t _start_ns{0};
  int64_t _end_ns{0};
  size_t _nb_stacks{0};
  size_t _nb_skipped{0};
};

/// Aggregates the samples of a window by identical stack trace. Each sample
/// type present in the window becomes a (value, count) column pair, in the
/// order of the sample type table.
/// The output only depends on the multiset of samples and the window bounds:
/// the order in which samples were recorded has no influence on the bytes.
/// Samples of unrecognized types are skipped. The profile is still produced
/// and a warning (PS_WHAT_ENCODING) is returned.
class ProfileBuilder {
public:
  PSRes build(const ProfileWindow &window, BinaryProfile *out) const;
};

/// Log the aggregated content of a profile (debug helper)
void pprof_print_profile(const BinaryProfile &profile);

} // namespace profship
