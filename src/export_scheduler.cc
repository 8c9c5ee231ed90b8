// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "export_scheduler.hpp"

#include "profship_stats.hpp"
#include "psres.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <system_error>

namespace profship {

namespace {

int outcome_log_level(CycleOutcome outcome) {
  switch (outcome) {
  case CycleOutcome::kSuccess:
    return LL_NOTICE;
  case CycleOutcome::kEmpty:
  case CycleOutcome::kSkipped:
  case CycleOutcome::kStopped:
    return LL_INFORMATIONAL;
  default:
    return LL_WARNING;
  }
}

CycleOutcome upload_outcome(PSRes res) {
  if (IsPSResOK(res)) {
    return CycleOutcome::kSuccess;
  }
  switch (res._what) {
  case PS_WHAT_UPLOAD_RETRYABLE:
    return CycleOutcome::kUploadRetryableExhausted;
  case PS_WHAT_UPLOAD_CANCELLED:
    return CycleOutcome::kUploadCancelled;
  default:
    return CycleOutcome::kUploadFatal;
  }
}

} // namespace

std::string_view scheduler_state_name(SchedulerState state) {
  switch (state) {
  case SchedulerState::kIdle:
    return "idle";
  case SchedulerState::kExporting:
    return "exporting";
  case SchedulerState::kStopped:
    return "stopped";
  }
  return "unknown";
}

std::string_view cycle_outcome_name(CycleOutcome outcome) {
  switch (outcome) {
  case CycleOutcome::kSuccess:
    return "success";
  case CycleOutcome::kEmpty:
    return "empty";
  case CycleOutcome::kEncodingDropped:
    return "encoding-dropped";
  case CycleOutcome::kUploadRetryableExhausted:
    return "upload-retryable-exhausted";
  case CycleOutcome::kUploadFatal:
    return "upload-fatal";
  case CycleOutcome::kUploadCancelled:
    return "upload-cancelled";
  case CycleOutcome::kSkipped:
    return "skipped";
  case CycleOutcome::kStopped:
    return "stopped";
  }
  return "unknown";
}

// Shared with the threads running cycles, so that an abandoned cycle keeps
// its collaborators alive
struct ExportScheduler::Core {
  Core(std::shared_ptr<SampleAccumulator> accumulator_,
       std::shared_ptr<PayloadEncoder> encoder_,
       std::shared_ptr<BackoffUploader> uploader_,
       const SchedulerConfig &config_)
      : accumulator(std::move(accumulator_)), encoder(std::move(encoder_)),
        uploader(std::move(uploader_)), config(config_) {}

  // Requires the Exporting state, leaves end_state (unless stop() gave up)
  CycleOutcome owned_cycle(SchedulerState end_state);
  CycleOutcome tick(SchedulerState end_state);
  PSRes export_cycle(uint32_t cycle, CycleOutcome *outcome);

  std::shared_ptr<SampleAccumulator> accumulator;
  ProfileBuilder builder;
  std::shared_ptr<PayloadEncoder> encoder;
  std::shared_ptr<BackoffUploader> uploader;
  SchedulerConfig config;

  std::mutex mutex;
  std::condition_variable cv;
  std::atomic<SchedulerState> state{SchedulerState::kIdle};
  std::atomic<bool> started{false};
  std::atomic<uint32_t> nb_cycles{0};
  bool stop_requested{false}; // guarded by mutex
};

CycleOutcome ExportScheduler::Core::tick(SchedulerState end_state) {
  SchedulerState expected = SchedulerState::kIdle;
  if (!state.compare_exchange_strong(expected, SchedulerState::kExporting)) {
    if (expected == SchedulerState::kExporting) {
      profship_stats_add(STATS_CYCLES_SKIPPED, 1, nullptr);
      LG_NFO("[SCHEDULER] Export in progress, skipping tick");
      return CycleOutcome::kSkipped;
    }
    return CycleOutcome::kStopped;
  }
  return owned_cycle(end_state);
}

CycleOutcome ExportScheduler::Core::owned_cycle(SchedulerState end_state) {
  uint32_t const cycle = ++nb_cycles;
  // exceptions can only come from the swap, its samples are lost
  CycleOutcome outcome = CycleOutcome::kEncodingDropped;
  if (IsPSResNotOK(export_cycle(cycle, &outcome))) {
    LG_WRN("[SCHEDULER] cycle=%u interrupted", cycle);
  }
  {
    std::lock_guard const lock(mutex);
    SchedulerState expected = SchedulerState::kExporting;
    // fails when stop() abandoned this cycle
    state.compare_exchange_strong(expected, end_state);
  }
  cv.notify_all();
  return outcome;
}

PSRes ExportScheduler::Core::export_cycle(uint32_t cycle,
                                          CycleOutcome *outcome) {
  try {
    auto const cycle_start = std::chrono::steady_clock::now();
    profship_stats_add(STATS_CYCLES_RUN, 1, nullptr);
    ProfileWindow window = accumulator->swap();
    size_t const nb_samples = window.samples.size();
    if (window.dropped) {
      LG_WRN("[SCHEDULER] cycle=%u dropped=%lu (per type capacity reached)",
             cycle, window.dropped);
    }

    UploadReport report;
    if (window.empty()) {
      *outcome = CycleOutcome::kEmpty;
    } else {
      BinaryProfile profile;
      PSRes res = builder.build(window, &profile);
      // samples are no longer needed
      window = ProfileWindow{};
      if (IsPSResFatal(res)) {
        *outcome = CycleOutcome::kEncodingDropped;
      } else {
        if (config.show_samples) {
          pprof_print_profile(profile);
        }
        UploadPayload payload;
        res = encoder->encode(profile, &payload);
        if (IsPSResFatal(res)) {
          *outcome = CycleOutcome::kEncodingDropped;
        } else {
          *outcome = upload_outcome(uploader->upload(payload, &report));
        }
      }
    }

    auto const duration_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - cycle_start)
            .count();
    LG_IF_LVL_OK(outcome_log_level(*outcome),
                 "[SCHEDULER] cycle=%u outcome=%s samples=%zu attempts=%d "
                 "duration_ms=%ld",
                 cycle, std::string(cycle_outcome_name(*outcome)).c_str(),
                 nb_samples, report.attempts, static_cast<long>(duration_ms));
    if (*outcome != CycleOutcome::kEmpty) {
      profship_stats_print();
    }
  }
  CatchExcept2PSRes();
  return {};
}

ExportScheduler::ExportScheduler(std::shared_ptr<SampleAccumulator> accumulator,
                                 std::shared_ptr<PayloadEncoder> encoder,
                                 std::shared_ptr<BackoffUploader> uploader,
                                 const SchedulerConfig &config)
    : _core(std::make_shared<Core>(std::move(accumulator), std::move(encoder),
                                   std::move(uploader), config)) {}

ExportScheduler::~ExportScheduler() {
  if (IsPSResNotOK(stop())) {
    LG_NFO("[SCHEDULER] Destroyed with an export in flight");
  }
}

SchedulerState ExportScheduler::state() const { return _core->state; }

bool ExportScheduler::started() const { return _core->started; }

CycleOutcome ExportScheduler::run_cycle() {
  return _core->tick(SchedulerState::kIdle);
}

void ExportScheduler::timer_loop(const std::shared_ptr<Core> &core) {
  using namespace std::chrono;
  auto const interval = core->config.export_interval;
  auto next_tick = steady_clock::now() + interval;
  while (true) {
    {
      std::unique_lock lock(core->mutex);
      if (core->cv.wait_until(lock, next_tick,
                              [&core] { return core->stop_requested; })) {
        return;
      }
    }
    if (core->tick(SchedulerState::kIdle) == CycleOutcome::kStopped) {
      return;
    }
    next_tick += interval;
    auto const now = steady_clock::now();
    // A cycle that overran the interval: the ticks it covered are skipped and
    // the schedule restarts from now
    if (now > next_tick) {
      int64_t const missed = (now - next_tick) / interval + 1;
      LG_WRN("[SCHEDULER] Timer skew detected; skipped %ld tick(s)",
             static_cast<long>(missed));
      profship_stats_add(STATS_CYCLES_SKIPPED, missed, nullptr);
      next_tick = now + interval;
    }
  }
}

PSRes ExportScheduler::start() {
  std::lock_guard const lock(_core->mutex);
  if (_core->started || _core->stop_requested) {
    PSRES_RETURN_WARN_LOG(PS_WHAT_SCHEDULER,
                          "[SCHEDULER] Unable to start (state=%s)",
                          std::string(scheduler_state_name(_core->state)).c_str());
  }
  try {
    _timer = std::thread(timer_loop, _core);
  }
  CatchExcept2PSRes();
  _core->started = true;
  LG_NTC("[SCHEDULER] Started (export_interval=%ldms)",
         static_cast<long>(_core->config.export_interval.count()));
  return {};
}

PSRes ExportScheduler::stop() {
  auto const deadline =
      std::chrono::steady_clock::now() + _core->config.flush_timeout;
  {
    std::lock_guard const lock(_core->mutex);
    if (_core->state == SchedulerState::kStopped) {
      return {};
    }
    _core->stop_requested = true;
  }
  _core->cv.notify_all();

  SchedulerState expected = SchedulerState::kIdle;
  if (_core->state.compare_exchange_strong(expected,
                                           SchedulerState::kExporting)) {
    LG_NTC("[SCHEDULER] Stopping, flushing the open window");
    try {
      _flush = std::thread([core = _core] {
        core->owned_cycle(SchedulerState::kStopped);
      });
    } catch (const std::system_error &e) {
      LG_ERR("[SCHEDULER] Unable to start the flush: %s", e.what());
      _core->state = SchedulerState::kStopped;
      if (_timer.joinable()) {
        _timer.join();
      }
      PSRES_RETURN_ERROR_LOG(PS_WHAT_SCHEDULER,
                             "[SCHEDULER] Stopped without final flush");
    }
  } else {
    LG_NTC("[SCHEDULER] Stopping, waiting for the export in flight");
  }

  bool completed = false;
  {
    std::unique_lock lock(_core->mutex);
    completed = _core->cv.wait_until(lock, deadline, [this] {
      return _core->state != SchedulerState::kExporting;
    });
    _core->state = SchedulerState::kStopped;
  }

  if (!completed) {
    profship_stats_add(STATS_CYCLES_ABANDONED, 1, nullptr);
    _core->uploader->cancel();
    // the network call in flight finishes on its own, the core outlives us
    if (_timer.joinable()) {
      _timer.detach();
    }
    if (_flush.joinable()) {
      _flush.detach();
    }
    PSRES_RETURN_WARN_LOG(PS_WHAT_EXPORT_TIMEOUT,
                          "[SCHEDULER] Export still running after %ldms, "
                          "abandoning it",
                          static_cast<long>(
                              _core->config.flush_timeout.count()));
  }
  if (_timer.joinable()) {
    _timer.join();
  }
  if (_flush.joinable()) {
    _flush.join();
  }
  LG_NTC("[SCHEDULER] Stopped");
  return {};
}

} // namespace profship
