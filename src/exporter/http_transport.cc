// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "exporter/http_transport.hpp"

namespace profship {

std::string_view http_status_name(HttpResponse::Status status) {
  switch (status) {
  case HttpResponse::Status::kOk:
    return "response";
  case HttpResponse::Status::kConnectionError:
    return "connection-error";
  case HttpResponse::Status::kTimeout:
    return "timeout";
  }
  return "unknown";
}

} // namespace profship
