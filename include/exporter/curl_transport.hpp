// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "exporter/http_transport.hpp"

#include <mutex>

namespace profship {

/// libcurl backed transport. The easy handle is reused between calls to keep
/// the connection alive.
class CurlTransport : public HttpTransport {
public:
  CurlTransport();
  ~CurlTransport() override;

  CurlTransport(const CurlTransport &) = delete;
  CurlTransport &operator=(const CurlTransport &) = delete;

  HttpResponse post(const HttpRequest &request) override;

private:
  std::mutex _mutex;
  void *_handle{nullptr}; // CURL easy handle
};

} // namespace profship
