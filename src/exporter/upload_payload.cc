// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "exporter/upload_payload.hpp"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <cctype>

namespace profship {

std::string url_encode(std::string_view value) {
  std::string encoded;
  encoded.reserve(value.size());
  for (char c : value) {
    auto const uc = static_cast<unsigned char>(c);
    // RFC 3986 unreserved characters
    if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
      encoded.push_back(c);
    } else {
      absl::StrAppendFormat(&encoded, "%%%02X", uc);
    }
  }
  return encoded;
}

std::string ingest_app_name(const UploadPayload &payload) {
  if (payload.labels.empty()) {
    return payload.service;
  }
  std::string name = absl::StrCat(payload.service, "{");
  bool first = true;
  for (const auto &[key, value] : payload.labels) {
    absl::StrAppend(&name, first ? "" : ",", key, "=", value);
    first = false;
  }
  name.push_back('}');
  return name;
}

std::string ingest_url(std::string_view endpoint,
                       const UploadPayload &payload) {
  return absl::StrCat(endpoint, "?name=", url_encode(ingest_app_name(payload)),
                      "&from=", payload.start_ns, "&until=", payload.end_ns,
                      "&format=", url_encode(payload.format),
                      "&spyName=", url_encode(payload.spy_name));
}

} // namespace profship
