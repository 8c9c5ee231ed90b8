// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "exporter/backoff_uploader.hpp"

#include "profship_stats.hpp"
#include "psres.hpp"
#include "version.hpp"

#include <absl/strings/str_cat.h>
#include <algorithm>
#include <cmath>
#include <random>

namespace profship {

namespace {
constexpr long k_http_too_many_requests = 429;
constexpr long k_http_bad_request = 400;
constexpr long k_http_unauthorized = 401;
constexpr long k_http_forbidden = 403;
constexpr long k_http_not_found = 404;
// 2^62 is far beyond any cap
constexpr int32_t k_max_backoff_shift = 62;

double default_jitter() {
  thread_local std::mt19937_64 gen{std::random_device{}()};
  std::uniform_real_distribution<double> dist(0.0, 1.0);
  return dist(gen);
}

void log_rejection_hint(long http_code) {
  switch (http_code) {
  case k_http_bad_request:
    LG_ERR("[UPLOADER] Error 400 (Bad request) - Check your API key");
    break;
  case k_http_unauthorized:
  case k_http_forbidden:
    LG_ERR("[UPLOADER] Error %ld (Unauthorized) - Check your API key",
           http_code);
    break;
  case k_http_not_found:
    LG_ERR("[UPLOADER] Error 404 (Not found) - Check your endpoint path");
    break;
  default:
    break;
  }
}

std::string truncated_message(const std::string &message) {
  constexpr size_t k_max_logged_message = 128;
  if (message.size() <= k_max_logged_message) {
    return message;
  }
  return absl::StrCat(message.substr(0, k_max_logged_message), "...");
}
} // namespace

std::string_view attempt_outcome_name(AttemptOutcome outcome) {
  switch (outcome) {
  case AttemptOutcome::kSuccess:
    return "success";
  case AttemptOutcome::kRetryable:
    return "retryable";
  case AttemptOutcome::kFatal:
    return "fatal";
  }
  return "unknown";
}

std::string_view error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kRetryableExhausted:
    return "upload-retryable-exhausted";
  case ErrorKind::kFatal:
    return "upload-fatal";
  case ErrorKind::kCancelled:
    return "upload-cancelled";
  }
  return "unknown";
}

AttemptOutcome classify_response(const HttpResponse &response) {
  if (response.status != HttpResponse::Status::kOk) {
    // connection errors and timeouts
    return AttemptOutcome::kRetryable;
  }
  long const code = response.http_code;
  if (code < 100 || code > 599) {
    // no usable status line, treated as a transport fault
    return AttemptOutcome::kRetryable;
  }
  if (code >= 200 && code < 300) {
    return AttemptOutcome::kSuccess;
  }
  if (code >= 500 || code == k_http_too_many_requests) {
    return AttemptOutcome::kRetryable;
  }
  return AttemptOutcome::kFatal;
}

std::chrono::milliseconds backoff_delay(const RetryPolicy &policy,
                                        int32_t attempt, double jitter) {
  if (attempt <= 1 || policy.base_delay.count() <= 0) {
    return std::chrono::milliseconds{0};
  }
  jitter = std::clamp(jitter, 0.0, std::nextafter(1.0, 0.0));
  int32_t const shift = std::min(attempt - 2, k_max_backoff_shift);
  double const exponential =
      std::ldexp(static_cast<double>(policy.base_delay.count()), shift);
  double const delay = exponential / 2 + jitter * exponential / 2;
  double const cap = static_cast<double>(policy.max_delay.count());
  return std::chrono::milliseconds{
      static_cast<int64_t>(std::min(delay, cap))};
}

BackoffUploader::BackoffUploader(std::shared_ptr<HttpTransport> transport,
                                 std::string endpoint, RetryPolicy policy,
                                 bool do_export)
    : _transport(std::move(transport)), _endpoint(std::move(endpoint)),
      _policy(policy), _do_export(do_export), _classify(classify_response),
      _jitter(default_jitter) {}

void BackoffUploader::cancel() {
  {
    std::lock_guard const lock(_mutex);
    _cancelled = true;
  }
  _cv.notify_all();
}

bool BackoffUploader::cancelled() const {
  std::lock_guard const lock(_mutex);
  return _cancelled;
}

bool BackoffUploader::wait_before_retry(std::chrono::milliseconds delay) {
  if (_sleep) {
    _sleep(delay);
    return !cancelled();
  }
  std::unique_lock lock(_mutex);
  return !_cv.wait_for(lock, delay, [this] { return _cancelled; });
}

HttpHeaders BackoffUploader::build_headers(const UploadPayload &payload) const {
  HttpHeaders headers;
  if (!payload.auth_token.empty()) {
    headers.emplace_back("Authorization",
                         absl::StrCat("Bearer ", payload.auth_token));
  }
  headers.emplace_back("User-Agent", str_user_agent());
  headers.emplace_back("Content-Type", payload.content_type);
  if (!payload.content_encoding.empty()) {
    headers.emplace_back("Content-Encoding", payload.content_encoding);
  }
  return headers;
}

PSRes BackoffUploader::upload(const UploadPayload &payload,
                              UploadReport *report) {
  UploadReport local_report;
  UploadReport &rep = report ? *report : local_report;
  rep = {};
  try {
    if (!_do_export) {
      LG_NTC("[UPLOADER] Export disabled, dropping %zu bytes",
             payload.body.size());
      rep.success = true;
      return {};
    }
    if (!_transport) {
      PSRES_RETURN_ERROR_LOG(PS_WHAT_TRANSPORT, "[UPLOADER] No transport");
    }
    HttpRequest request;
    request.url = ingest_url(_endpoint, payload);
    request.headers = build_headers(payload);
    request.body = payload.body;
    request.timeout = _policy.request_timeout;
    LG_DBG("[UPLOADER] POST %s (%zu bytes)", request.url.c_str(),
           payload.body.size());
    return run_attempts(request, rep);
  }
  CatchExcept2PSRes();
  return {};
}

PSRes BackoffUploader::run_attempts(const HttpRequest &request,
                                    UploadReport &report) {
  using namespace std::chrono;
  RetryState state;
  state.max_attempts = std::max(_policy.max_attempts, 1);

  while (true) {
    ++state.attempt;
    if (state.attempt > 1) {
      if (!wait_before_retry(state.next_delay)) {
        state.last_error = ErrorKind::kCancelled;
        --state.attempt; // this attempt never happened
        break;
      }
      report.delays.push_back(state.next_delay);
      state.elapsed += state.next_delay;
    }
    if (cancelled()) {
      state.last_error = ErrorKind::kCancelled;
      --state.attempt;
      break;
    }

    profship_stats_add(STATS_UPLOAD_ATTEMPTS, 1, nullptr);
    auto const attempt_start = steady_clock::now();
    HttpResponse const response = _transport->post(request);
    state.elapsed +=
        duration_cast<milliseconds>(steady_clock::now() - attempt_start);
    AttemptOutcome const outcome = _classify(response);
    state.last_http_code = response.http_code;
    state.last_message = response.message;

    LG_IF_LVL_OK(outcome == AttemptOutcome::kSuccess ? LL_NOTICE : LL_WARNING,
                 "[UPLOADER] attempt=%d/%d delay_ms=%ld outcome=%s "
                 "status=%s http_code=%ld",
                 state.attempt, state.max_attempts,
                 static_cast<long>(state.attempt > 1 ? state.next_delay.count()
                                                     : 0),
                 std::string(attempt_outcome_name(outcome)).c_str(),
                 std::string(http_status_name(response.status)).c_str(),
                 response.http_code);

    if (outcome == AttemptOutcome::kSuccess) {
      profship_stats_add(STATS_UPLOAD_SUCCESSES, 1, nullptr);
      LG_NTC("[UPLOADER] Upload completed (attempts=%d, http_code=%ld)",
             state.attempt, response.http_code);
      report.success = true;
      report.attempts = state.attempt;
      report.last_http_code = state.last_http_code;
      report.last_message = std::move(state.last_message);
      return {};
    }
    profship_stats_add(STATS_UPLOAD_FAILURES, 1, nullptr);
    if (outcome == AttemptOutcome::kFatal) {
      state.last_error = ErrorKind::kFatal;
      log_rejection_hint(response.http_code);
      break;
    }
    state.last_error = ErrorKind::kRetryableExhausted;
    if (state.attempt >= state.max_attempts) {
      break;
    }
    state.next_delay = backoff_delay(_policy, state.attempt + 1, _jitter());
    if (_policy.max_elapsed.count() > 0 &&
        state.elapsed + state.next_delay > _policy.max_elapsed) {
      LG_WRN("[UPLOADER] Retry budget of %ld ms exhausted (elapsed=%ld ms)",
             static_cast<long>(_policy.max_elapsed.count()),
             static_cast<long>(state.elapsed.count()));
      break;
    }
  }

  report.error = state.last_error;
  report.attempts = state.attempt;
  report.last_http_code = state.last_http_code;
  report.last_message = state.last_message;

  switch (state.last_error.value_or(ErrorKind::kRetryableExhausted)) {
  case ErrorKind::kCancelled:
    PSRES_RETURN_WARN_LOG(PS_WHAT_UPLOAD_CANCELLED,
                          "[UPLOADER] Upload cancelled after %d attempt(s)",
                          state.attempt);
  case ErrorKind::kFatal:
    PSRES_RETURN_ERROR_LOG(
        PS_WHAT_UPLOAD_FATAL,
        "[UPLOADER] Upload rejected (attempts=%d, http_code=%ld): %s",
        state.attempt, state.last_http_code,
        truncated_message(state.last_message).c_str());
  case ErrorKind::kRetryableExhausted:
  default:
    PSRES_RETURN_ERROR_LOG(
        PS_WHAT_UPLOAD_RETRYABLE,
        "[UPLOADER] Upload failed (attempts=%d, http_code=%ld): %s",
        state.attempt, state.last_http_code,
        truncated_message(state.last_message).c_str());
  }
}

} // namespace profship
