// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "export_config.hpp"
#include "export_scheduler.hpp"
#include "exporter/http_transport.hpp"
#include "psres_def.hpp"
#include "sample.hpp"

#include <memory>

namespace profship {

/// Entry point for the host. The host owns the logger and drives the
/// lifecycle: record() from any thread, start() once, stop() once.
class ExportBridge {
public:
  /// Validates the configuration. A null transport selects libcurl.
  static PSRes create(const ExportConfig &config,
                      std::shared_ptr<HttpTransport> transport,
                      std::unique_ptr<ExportBridge> *out);

  ExportBridge(const ExportConfig &config,
               std::shared_ptr<HttpTransport> transport);

  ExportBridge(const ExportBridge &) = delete;
  ExportBridge &operator=(const ExportBridge &) = delete;

  void record(Sample sample) noexcept {
    _accumulator->record(std::move(sample));
  }

  PSRes start() { return _scheduler->start(); }
  PSRes stop() { return _scheduler->stop(); }

  [[nodiscard]] const ExportConfig &config() const { return _config; }
  [[nodiscard]] SampleAccumulator &accumulator() { return *_accumulator; }
  [[nodiscard]] ExportScheduler &scheduler() { return *_scheduler; }

private:
  ExportConfig _config;
  std::shared_ptr<SampleAccumulator> _accumulator;
  std::unique_ptr<ExportScheduler> _scheduler;
};

} // namespace profship
