// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace profship {

inline constexpr std::chrono::milliseconds k_default_request_timeout{10000};

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
  std::string url;
  HttpHeaders headers;
  std::string_view body; // owned by the payload being sent
  std::chrono::milliseconds timeout{k_default_request_timeout};
};

struct HttpResponse {
  enum class Status {
    kOk,              // a response was received, see http_code
    kConnectionError, // nothing received (dns, refused, reset...)
    kTimeout,
  };
  Status status{Status::kConnectionError};
  long http_code{0};
  std::string message; // transport error or start of the response body
};

/// One HTTP POST per call, no retry. Implementations must be usable from the
/// export thread while another thread holds a reference to them.
class HttpTransport {
public:
  virtual ~HttpTransport() = default;
  virtual HttpResponse post(const HttpRequest &request) = 0;
};

std::string_view http_status_name(HttpResponse::Status status);

} // namespace profship
