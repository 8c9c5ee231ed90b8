// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "exporter/http_transport.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace profship {

// Copy of a request, the original body is only borrowed
struct RecordedRequest {
  std::string url;
  HttpHeaders headers;
  std::string body;
  std::chrono::milliseconds timeout{0};

  std::string header(std::string_view name) const {
    for (const auto &[key, value] : headers) {
      if (key == name) {
        return value;
      }
    }
    return {};
  }
};

// Answers with scripted responses, 200 once the script is exhausted. When
// blocking is enabled, post() waits until release() is called.
class FakeTransport : public HttpTransport {
public:
  static HttpResponse http(long code, std::string message = {}) {
    HttpResponse response;
    response.status = HttpResponse::Status::kOk;
    response.http_code = code;
    response.message = std::move(message);
    return response;
  }

  static HttpResponse failure(HttpResponse::Status status) {
    HttpResponse response;
    response.status = status;
    response.message = "fake transport failure";
    return response;
  }

  void push(HttpResponse response) {
    std::lock_guard const lock(_mutex);
    _script.push_back(std::move(response));
  }

  void block() {
    std::lock_guard const lock(_mutex);
    _blocking = true;
  }

  void release() {
    {
      std::lock_guard const lock(_mutex);
      _blocking = false;
    }
    _cv.notify_all();
  }

  // Waits until a post() is blocked on the gate
  bool wait_blocked(std::chrono::milliseconds timeout) {
    std::unique_lock lock(_mutex);
    return _cv.wait_for(lock, timeout, [this] { return _nb_blocked > 0; });
  }

  HttpResponse post(const HttpRequest &request) override {
    std::unique_lock lock(_mutex);
    _requests.push_back(RecordedRequest{request.url, request.headers,
                                        std::string(request.body),
                                        request.timeout});
    if (_blocking) {
      ++_nb_blocked;
      _cv.notify_all();
      _cv.wait(lock, [this] { return !_blocking; });
      --_nb_blocked;
    }
    if (_script.empty()) {
      return http(200);
    }
    HttpResponse response = std::move(_script.front());
    _script.pop_front();
    return response;
  }

  std::vector<RecordedRequest> requests() const {
    std::lock_guard const lock(_mutex);
    return _requests;
  }

  size_t nb_requests() const {
    std::lock_guard const lock(_mutex);
    return _requests.size();
  }

private:
  mutable std::mutex _mutex;
  std::condition_variable _cv;
  std::deque<HttpResponse> _script;
  std::vector<RecordedRequest> _requests;
  bool _blocking{false};
  int _nb_blocked{0};
};

} // namespace profship
