// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "exporter/backoff_uploader.hpp"
#include "exporter_input.hpp"
#include "psres_def.hpp"
#include "sample_accumulator.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace profship {

inline constexpr std::chrono::milliseconds k_default_export_interval{10000};
inline constexpr std::chrono::milliseconds k_default_flush_timeout{5000};

// Read-only once the bridge is constructed
struct ExportConfig {
  ExporterInput exporter;
  RetryPolicy retry;
  AccumulatorConfig accumulator;
  std::chrono::milliseconds export_interval{k_default_export_interval};
  std::chrono::milliseconds flush_timeout{k_default_flush_timeout};
  bool show_samples{false}; // print each profile (debug)
};

PSRes export_config_validate(const ExportConfig &config);

void export_config_print(const ExportConfig &config);

// Keeps the last 4 characters
std::string token_to_dbg_string(std::string_view token);

} // namespace profship
