// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "exporter/http_transport.hpp"
#include "exporter/upload_payload.hpp"
#include "psres_def.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace profship {

inline constexpr int32_t k_default_max_attempts = 3;
inline constexpr std::chrono::milliseconds k_default_base_delay{500};
inline constexpr std::chrono::milliseconds k_default_max_delay{4000};
inline constexpr std::chrono::milliseconds k_default_max_elapsed{30000};

struct RetryPolicy {
  int32_t max_attempts{k_default_max_attempts};
  std::chrono::milliseconds base_delay{k_default_base_delay};
  std::chrono::milliseconds max_delay{k_default_max_delay};
  // total budget for one payload (0 disables the budget)
  std::chrono::milliseconds max_elapsed{k_default_max_elapsed};
  std::chrono::milliseconds request_timeout{k_default_request_timeout};
};

enum class AttemptOutcome { kSuccess, kRetryable, kFatal };

// Terminal classification of a failed attempt sequence
enum class ErrorKind { kRetryableExhausted, kFatal, kCancelled };

std::string_view attempt_outcome_name(AttemptOutcome outcome);
std::string_view error_kind_name(ErrorKind kind);

/// 2xx succeed. Connection failures, timeouts, 5xx and 429 are retryable.
/// Everything else (other 4xx, 3xx, informational) is fatal.
AttemptOutcome classify_response(const HttpResponse &response);

/// Delay waited before attempt number `attempt` (attempt 1 has none).
/// e = base * 2^(attempt-2), delay = min(cap, e/2 + jitter * e/2).
/// Non decreasing in `attempt` for a fixed jitter in [0, 1).
std::chrono::milliseconds backoff_delay(const RetryPolicy &policy,
                                        int32_t attempt, double jitter);

struct RetryState {
  int32_t attempt{0};
  int32_t max_attempts{0};
  std::chrono::milliseconds next_delay{0};
  std::optional<ErrorKind> last_error;
  long last_http_code{0};
  std::string last_message;
  std::chrono::milliseconds elapsed{0};
};

struct UploadReport {
  bool success{false};
  std::optional<ErrorKind> error;
  int32_t attempts{0};
  long last_http_code{0};
  std::string last_message;
  std::vector<std::chrono::milliseconds> delays; // one per retry
};

class BackoffUploader {
public:
  using ClassifyFn = std::function<AttemptOutcome(const HttpResponse &)>;
  // returns a value in [0, 1)
  using JitterFn = std::function<double()>;
  using SleepFn = std::function<void(std::chrono::milliseconds)>;

  BackoffUploader(std::shared_ptr<HttpTransport> transport,
                  std::string endpoint, RetryPolicy policy = {},
                  bool do_export = true);

  BackoffUploader(const BackoffUploader &) = delete;
  BackoffUploader &operator=(const BackoffUploader &) = delete;

  // Injection points, to be set before the first upload
  void set_classifier(ClassifyFn classify) { _classify = std::move(classify); }
  void set_jitter(JitterFn jitter) { _jitter = std::move(jitter); }
  void set_sleep(SleepFn sleep) { _sleep = std::move(sleep); }

  /// Sends the payload, retrying retryable failures. Never throws.
  /// The error result carries PS_WHAT_UPLOAD_RETRYABLE, PS_WHAT_UPLOAD_FATAL
  /// or PS_WHAT_UPLOAD_CANCELLED. report is optional.
  PSRes upload(const UploadPayload &payload, UploadReport *report = nullptr);

  /// Interrupts a backoff wait and prevents further attempts. The network
  /// call in progress is not aborted.
  void cancel();
  bool cancelled() const;

  const RetryPolicy &policy() const { return _policy; }
  const std::string &endpoint() const { return _endpoint; }

private:
  HttpHeaders build_headers(const UploadPayload &payload) const;
  PSRes run_attempts(const HttpRequest &request, UploadReport &report);
  // false if cancelled
  bool wait_before_retry(std::chrono::milliseconds delay);

  std::shared_ptr<HttpTransport> _transport;
  std::string _endpoint;
  RetryPolicy _policy;
  bool _do_export;
  ClassifyFn _classify;
  JitterFn _jitter;
  SleepFn _sleep;

  mutable std::mutex _mutex;
  std::condition_variable _cv;
  bool _cancelled{false};
};

} // namespace profship
