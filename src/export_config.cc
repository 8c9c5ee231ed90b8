// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "export_config.hpp"

#include "psres.hpp"
#include "version.hpp"

#include <absl/strings/match.h>
#include <absl/strings/str_join.h>
#include <vector>

namespace profship {

namespace {
constexpr size_t k_visible_token_chars = 4;

std::string enabled_types_str(SampleTypeMask mask) {
  std::vector<std::string_view> names;
  for (int32_t type = 0; type < PS_SAMPLE_TYPE_LENGTH; ++type) {
    if (mask & sample_type_bit(type)) {
      names.push_back(sample_type_short_name(type));
    }
  }
  return absl::StrJoin(names, ",");
}
} // namespace

std::string token_to_dbg_string(std::string_view token) {
  size_t const len = token.length();
  if (len <= k_visible_token_chars) {
    return std::string(len, '*');
  }
  std::string masked(len, '*');
  masked.replace(len - k_visible_token_chars, k_visible_token_chars,
                 token.substr(len - k_visible_token_chars));
  return masked;
}

PSRes export_config_validate(const ExportConfig &config) {
  const ExporterInput &input = config.exporter;
  PSRES_CHECK_BOOL(!input.service.empty(), PS_WHAT_CONFIG,
                   "[CONFIG] Service name should not be empty");
  PSRES_CHECK_BOOL(absl::StartsWith(input.endpoint, "http://") ||
                       absl::StartsWith(input.endpoint, "https://"),
                   PS_WHAT_CONFIG, "[CONFIG] Unsupported endpoint scheme: %s",
                   input.endpoint.c_str());
  PSRES_CHECK_BOOL(config.export_interval.count() > 0, PS_WHAT_CONFIG,
                   "[CONFIG] Export interval should be positive");
  PSRES_CHECK_BOOL(config.flush_timeout.count() > 0, PS_WHAT_CONFIG,
                   "[CONFIG] Flush timeout should be positive");
  PSRES_CHECK_BOOL(config.retry.max_attempts >= 1, PS_WHAT_CONFIG,
                   "[CONFIG] At least one upload attempt is required (%d)",
                   config.retry.max_attempts);
  PSRES_CHECK_BOOL(config.retry.base_delay.count() >= 0 &&
                       config.retry.max_delay >= config.retry.base_delay,
                   PS_WHAT_CONFIG,
                   "[CONFIG] Invalid backoff (base=%ldms, cap=%ldms)",
                   static_cast<long>(config.retry.base_delay.count()),
                   static_cast<long>(config.retry.max_delay.count()));
  PSRES_CHECK_BOOL(config.retry.max_elapsed.count() >= 0, PS_WHAT_CONFIG,
                   "[CONFIG] Retry budget should not be negative");
  PSRES_CHECK_BOOL(config.retry.request_timeout.count() > 0, PS_WHAT_CONFIG,
                   "[CONFIG] Request timeout should be positive");
  PSRES_CHECK_BOOL(config.accumulator.capacity_per_type > 0, PS_WHAT_CONFIG,
                   "[CONFIG] Capacity per sample type should be positive");
  PSRES_CHECK_BOOL(config.accumulator.enabled_types != 0, PS_WHAT_CONFIG,
                   "[CONFIG] No sample type is enabled");
  return {};
}

void export_config_print(const ExportConfig &config) {
  const ExporterInput &input = config.exporter;
  auto version_str = str_version();
  PRINT_NFO("Version: %.*s", static_cast<int>(version_str.size()),
            version_str.data());
  PRINT_NFO("Exporter Input:");
  PRINT_NFO("  - endpoint: %s", input.endpoint.c_str());
  if (!input.token.empty()) {
    PRINT_NFO("  - token: %s", token_to_dbg_string(input.token).c_str());
  }
  PRINT_NFO("  - service: %s", input.service.c_str());
  if (!input.environment.empty()) {
    PRINT_NFO("  - environment: %s", input.environment.c_str());
  }
  if (!input.host.empty()) {
    PRINT_NFO("  - host: %s", input.host.c_str());
  }
  PRINT_NFO("  - spy_name: %s", input.spy_name.c_str());
  PRINT_NFO("  - upload_format: %s",
            std::string(upload_format_name(input.format)).c_str());
  PRINT_NFO("  - do_export: %s", input.do_export ? "true" : "false");
  if (!input.user_tags.empty()) {
    PRINT_NFO("Tags:");
    for (const auto &[key, value] : input.user_tags) {
      PRINT_NFO("  - %s: %s", key.c_str(), value.c_str());
    }
  }
  PRINT_NFO("Export options:");
  PRINT_NFO("  - export_interval: %ldms",
            static_cast<long>(config.export_interval.count()));
  PRINT_NFO("  - flush_timeout: %ldms",
            static_cast<long>(config.flush_timeout.count()));
  PRINT_NFO("  - capacity_per_type: %zu", config.accumulator.capacity_per_type);
  PRINT_NFO("  - sample_types: %s",
            enabled_types_str(config.accumulator.enabled_types).c_str());
  PRINT_NFO("Retry policy:");
  PRINT_NFO("  - max_attempts: %d", config.retry.max_attempts);
  PRINT_NFO("  - backoff: base=%ldms cap=%ldms",
            static_cast<long>(config.retry.base_delay.count()),
            static_cast<long>(config.retry.max_delay.count()));
  PRINT_NFO("  - retry_budget: %ldms",
            static_cast<long>(config.retry.max_elapsed.count()));
  PRINT_NFO("  - request_timeout: %ldms",
            static_cast<long>(config.retry.request_timeout.count()));
  PRINT_NFO("Debug:");
  if (!input.debug_pprof_prefix.empty()) {
    PRINT_NFO("  - debug_pprof_prefix: %s", input.debug_pprof_prefix.c_str());
  }
  PRINT_NFO("  - show_samples: %s", config.show_samples ? "true" : "false");
}

} // namespace profship
