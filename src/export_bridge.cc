// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "export_bridge.hpp"

#include "exporter/curl_transport.hpp"
#include "psres.hpp"

namespace profship {

namespace {
SchedulerConfig scheduler_config(const ExportConfig &config) {
  SchedulerConfig scheduler;
  scheduler.export_interval = config.export_interval;
  scheduler.flush_timeout = config.flush_timeout;
  scheduler.show_samples = config.show_samples;
  return scheduler;
}
} // namespace

ExportBridge::ExportBridge(const ExportConfig &config,
                           std::shared_ptr<HttpTransport> transport)
    : _config(config),
      _accumulator(std::make_shared<SampleAccumulator>(config.accumulator)) {
  _config.exporter.endpoint = normalize_endpoint(config.exporter.endpoint);
  auto encoder = std::make_shared<PayloadEncoder>(
      _config.exporter, _config.accumulator.enabled_types);
  auto uploader = std::make_shared<BackoffUploader>(
      std::move(transport), _config.exporter.endpoint, _config.retry,
      _config.exporter.do_export);
  _scheduler = std::make_unique<ExportScheduler>(
      _accumulator, std::move(encoder), std::move(uploader),
      scheduler_config(_config));
}

PSRes ExportBridge::create(const ExportConfig &config,
                           std::shared_ptr<HttpTransport> transport,
                           std::unique_ptr<ExportBridge> *out) {
  try {
    ExportConfig normalized = config;
    normalized.exporter.endpoint = normalize_endpoint(config.exporter.endpoint);
    PSRES_CHECK_FWD(export_config_validate(normalized));
    if (normalized.exporter.token.empty()) {
      LG_WRN("[BRIDGE] No auth token configured, uploads are anonymous");
    }
    if (!transport) {
      transport = std::make_shared<CurlTransport>();
    }
    *out = std::make_unique<ExportBridge>(normalized, std::move(transport));
    LG_NTC("[BRIDGE] Exporting %s to %s",
           normalized.exporter.service.c_str(),
           normalized.exporter.endpoint.c_str());
  }
  CatchExcept2PSRes();
  return {};
}

} // namespace profship
