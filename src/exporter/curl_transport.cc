// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "exporter/curl_transport.hpp"

#include "defer.hpp"
#include "logger.hpp"

#include <absl/strings/str_cat.h>
#include <algorithm>
#include <curl/curl.h>

namespace profship {

namespace {
// only the start of the answer is kept, for diagnostics
constexpr size_t k_max_response_body = 512;
constexpr std::chrono::milliseconds k_max_connect_timeout{3000};

std::once_flag s_curl_init_flag;
CURLcode s_curl_init_code = CURLE_OK;

size_t write_response(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *body = static_cast<std::string *>(userdata);
  size_t const len = size * nmemb;
  if (body->size() < k_max_response_body) {
    body->append(ptr, std::min(len, k_max_response_body - body->size()));
  }
  return len;
}
} // namespace

#define CURL_SETOPT_OR_RETURN(handle, opt, value, response)                    \
  do {                                                                         \
    CURLcode const lrc = curl_easy_setopt(handle, opt, value);                 \
    if (lrc != CURLE_OK) {                                                     \
      (response).message =                                                     \
          absl::StrCat("curl option " #opt ": ", curl_easy_strerror(lrc));     \
      return response;                                                         \
    }                                                                          \
  } while (0)

CurlTransport::CurlTransport() {
  std::call_once(s_curl_init_flag,
                 [] { s_curl_init_code = curl_global_init(CURL_GLOBAL_ALL); });
  if (s_curl_init_code != CURLE_OK) {
    LG_ERR("[TRANSPORT] Unable to initialize curl: %s",
           curl_easy_strerror(s_curl_init_code));
    return;
  }
  _handle = curl_easy_init();
  if (!_handle) {
    LG_ERR("[TRANSPORT] Unable to create curl handle");
  }
}

CurlTransport::~CurlTransport() {
  if (_handle) {
    curl_easy_cleanup(static_cast<CURL *>(_handle));
  }
}

HttpResponse CurlTransport::post(const HttpRequest &request) {
  HttpResponse response;
  std::lock_guard const lock(_mutex);
  if (!_handle) {
    response.message = "curl is not available";
    return response;
  }
  CURL *curl = static_cast<CURL *>(_handle);
  curl_easy_reset(curl);

  curl_slist *header_list = nullptr;
  defer { curl_slist_free_all(header_list); };
  for (const auto &[name, value] : request.headers) {
    std::string const line = absl::StrCat(name, ": ", value);
    curl_slist *appended = curl_slist_append(header_list, line.c_str());
    if (!appended) {
      response.message = "unable to allocate headers";
      return response;
    }
    header_list = appended;
  }
  // no 100-continue round trip
  curl_slist *appended = curl_slist_append(header_list, "Expect:");
  if (!appended) {
    response.message = "unable to allocate headers";
    return response;
  }
  header_list = appended;

  std::string response_body;
  char error_buffer[CURL_ERROR_SIZE] = {};
  long const timeout_ms = static_cast<long>(request.timeout.count());
  long const connect_timeout_ms =
      std::min(timeout_ms, static_cast<long>(k_max_connect_timeout.count()));

  CURL_SETOPT_OR_RETURN(curl, CURLOPT_URL, request.url.c_str(), response);
  CURL_SETOPT_OR_RETURN(curl, CURLOPT_POST, 1L, response);
  CURL_SETOPT_OR_RETURN(curl, CURLOPT_POSTFIELDS, request.body.data(),
                        response);
  CURL_SETOPT_OR_RETURN(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                        static_cast<curl_off_t>(request.body.size()), response);
  CURL_SETOPT_OR_RETURN(curl, CURLOPT_HTTPHEADER, header_list, response);
  CURL_SETOPT_OR_RETURN(curl, CURLOPT_TIMEOUT_MS, timeout_ms, response);
  CURL_SETOPT_OR_RETURN(curl, CURLOPT_CONNECTTIMEOUT_MS, connect_timeout_ms,
                        response);
  // signals are not an option from a library thread
  CURL_SETOPT_OR_RETURN(curl, CURLOPT_NOSIGNAL, 1L, response);
  CURL_SETOPT_OR_RETURN(curl, CURLOPT_ERRORBUFFER, error_buffer, response);
  CURL_SETOPT_OR_RETURN(curl, CURLOPT_WRITEFUNCTION, write_response, response);
  CURL_SETOPT_OR_RETURN(curl, CURLOPT_WRITEDATA, &response_body, response);

  CURLcode const rc = curl_easy_perform(curl);
  if (rc == CURLE_OK) {
    CURLcode const info_rc =
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.http_code);
    if (info_rc != CURLE_OK || response.http_code == 0) {
      response.status = HttpResponse::Status::kConnectionError;
      response.message = info_rc != CURLE_OK
          ? absl::StrCat("unable to read response code: ",
                         curl_easy_strerror(info_rc))
          : "no response code received";
      return response;
    }
    response.status = HttpResponse::Status::kOk;
    response.message = std::move(response_body);
  } else {
    response.status = rc == CURLE_OPERATION_TIMEDOUT
        ? HttpResponse::Status::kTimeout
        : HttpResponse::Status::kConnectionError;
    response.message = *error_buffer ? error_buffer : curl_easy_strerror(rc);
  }
  return response;
}

} // namespace profship
