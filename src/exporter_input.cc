// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "exporter_input.hpp"

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

namespace profship {

std::string_view upload_format_name(UploadFormat format) {
  switch (format) {
  case UploadFormat::kGzip:
    return "gzip";
  case UploadFormat::kMultipart:
    return "multipart";
  }
  return "unknown";
}

std::string normalize_endpoint(std::string_view endpoint) {
  endpoint = absl::StripAsciiWhitespace(endpoint);
  if (endpoint.empty()) {
    endpoint = k_default_endpoint;
  }

  std::string url;
  // not available, assume http
  if (endpoint.find("://") == std::string_view::npos) {
    url = absl::StrCat("http://", endpoint);
  } else {
    url = std::string(endpoint);
  }

  size_t const host_start = url.find("://") + 3;
  size_t const path_start = url.find('/', host_start);
  if (path_start == std::string::npos) {
    absl::StrAppend(&url, k_ingest_path);
  } else if (path_start == url.size() - 1) {
    url.pop_back();
    absl::StrAppend(&url, k_ingest_path);
  }
  return url;
}

} // namespace profship
