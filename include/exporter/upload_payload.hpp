// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "tags.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace profship {

/// Everything needed to send one profile. Built by the encoder, consumed once
/// by the uploader.
struct UploadPayload {
  std::string body;
  std::string content_type;
  std::string content_encoding; // "gzip", empty for multipart
  std::string service;
  Labels labels;
  std::string auth_token;
  int64_t start_ns{0};
  int64_t end_ns{0};
  std::string format{"pprof"};
  std::string spy_name;
};

/// Pyroscope application name: service{key=value,...}
std::string ingest_app_name(const UploadPayload &payload);

/// <endpoint>?name=...&from=...&until=...&format=...&spyName=...
std::string ingest_url(std::string_view endpoint, const UploadPayload &payload);

/// Percent-encoding of a query parameter value
std::string url_encode(std::string_view value);

} // namespace profship
