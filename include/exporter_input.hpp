// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "tags.hpp"

#include <string>
#include <string_view>

namespace profship {

inline constexpr std::string_view k_default_endpoint{"http://localhost:4040"};
inline constexpr std::string_view k_ingest_path{"/ingest"};
inline constexpr std::string_view k_default_service{"helloworld"};
inline constexpr std::string_view k_default_spy_name{"profship"};

enum class UploadFormat {
  kGzip,      // body is the gzip compressed pprof
  kMultipart, // ingest form with the profile and its sample type config
};

/// Static metadata attached to every upload
struct ExporterInput {
  std::string endpoint{k_default_endpoint}; // base url or full ingest url
  std::string token;                        // bearer token [hidden]
  std::string service{k_default_service};
  std::string environment; // ex: staging / local / prod
  std::string host;        // reported host name
  Tags user_tags;
  std::string spy_name{k_default_spy_name};
  UploadFormat format{UploadFormat::kGzip};
  std::string debug_pprof_prefix; // local pprof prefix (debug)
  bool do_export{true};           // prevent uploads if needed (debug flag)
};

std::string_view upload_format_name(UploadFormat format);

/// Adds a scheme when missing and the ingest path when the url has none
std::string normalize_endpoint(std::string_view endpoint);

} // namespace profship
