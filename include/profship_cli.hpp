// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "export_config.hpp"
#include "exporter_input.hpp"
#include "psres_def.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace profship {

// NOLINTNEXTLINE(clang-analyzer-optin.performance.Padding)
struct ProfshipCLI {
public:
  int parse(int argc, const char *argv[]);

  // Basic options
  ExporterInput exporter_input;
  std::string tags;
  std::string upload_format;

  // Export settings
  std::chrono::seconds upload_period{};
  std::chrono::milliseconds flush_timeout{};
  std::vector<std::string> sample_types;
  bool enable_memory_profiling{true};
  size_t capacity_per_type{0};

  // Retry settings
  int32_t max_attempts{0};
  std::chrono::milliseconds backoff_base{};
  std::chrono::milliseconds backoff_cap{};
  std::chrono::milliseconds retry_budget{};
  std::chrono::milliseconds request_timeout{};

  // Input
  std::string input_path; // folded stacks, stdin if empty
  std::string input_sample_type;

  // debug
  std::string log_level;
  std::string log_mode;
  bool show_config{false};
  bool show_samples{false};
  bool version{false}; // request version
  bool enable{true};

  bool continue_exec{false};
};

/// Validated configuration, the endpoint is normalized
PSRes export_config_from_cli(const ProfshipCLI &cli, ExportConfig *config);

} // namespace profship
