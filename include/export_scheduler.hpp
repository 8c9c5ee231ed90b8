// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "exporter/backoff_uploader.hpp"
#include "exporter/payload_encoder.hpp"
#include "pprof/profile_builder.hpp"
#include "psres_def.hpp"
#include "sample_accumulator.hpp"

#include <chrono>
#include <memory>
#include <string_view>
#include <thread>

namespace profship {

enum class SchedulerState : uint8_t { kIdle, kExporting, kStopped };

enum class CycleOutcome : uint8_t {
  kSuccess,
  kEmpty,
  kEncodingDropped,
  kUploadRetryableExhausted,
  kUploadFatal,
  kUploadCancelled,
  kSkipped, // another cycle is in flight
  kStopped, // scheduler is stopped, nothing was done
};

std::string_view scheduler_state_name(SchedulerState state);
std::string_view cycle_outcome_name(CycleOutcome outcome);

struct SchedulerConfig {
  std::chrono::milliseconds export_interval{10000};
  std::chrono::milliseconds flush_timeout{5000};
  bool show_samples{false};
};

/// Drives swap -> build -> encode -> upload. At most one cycle runs at a
/// time, whoever triggers it (timer, run_cycle or stop).
class ExportScheduler {
public:
  ExportScheduler(std::shared_ptr<SampleAccumulator> accumulator,
                  std::shared_ptr<PayloadEncoder> encoder,
                  std::shared_ptr<BackoffUploader> uploader,
                  const SchedulerConfig &config);
  ~ExportScheduler();

  ExportScheduler(const ExportScheduler &) = delete;
  ExportScheduler &operator=(const ExportScheduler &) = delete;

  /// Spawns the timer thread
  PSRes start();

  /// Final flush when idle, otherwise waits for the cycle in flight. Returns
  /// within flush_timeout; a cycle still running then is abandoned (warning
  /// result PS_WHAT_EXPORT_TIMEOUT).
  PSRes stop();

  /// One tick: runs a cycle if idle, skips otherwise
  CycleOutcome run_cycle();

  [[nodiscard]] SchedulerState state() const;
  [[nodiscard]] bool started() const;

private:
  struct Core;

  static void timer_loop(const std::shared_ptr<Core> &core);

  std::shared_ptr<Core> _core;
  std::thread _timer;
  std::thread _flush;
};

} // namespace profship
