// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "exporter/backoff_uploader.hpp"

#include "fake_transport.hpp"
#include "loghandle.hpp"
#include "profship_stats.hpp"
#include "psres.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <thread>

namespace profship {

using std::chrono::milliseconds;

namespace {
constexpr std::string_view k_endpoint{"http://localhost:4040/ingest"};

UploadPayload make_payload() {
  UploadPayload payload;
  payload.body = "compressed-profile";
  payload.content_type = "application/octet-stream";
  payload.content_encoding = "gzip";
  payload.service = "checkout";
  payload.labels = {{"env", "prod"}};
  payload.auth_token = "secret";
  payload.start_ns = 10;
  payload.end_ns = 20;
  payload.spy_name = "profship";
  return payload;
}

// Deterministic uploader: no real sleep, jitter in the middle of the range
std::unique_ptr<BackoffUploader>
make_uploader(std::shared_ptr<FakeTransport> transport,
              std::vector<milliseconds> *slept, RetryPolicy policy = {}) {
  auto uploader = std::make_unique<BackoffUploader>(
      std::move(transport), std::string(k_endpoint), policy);
  uploader->set_jitter([] { return 0.5; });
  uploader->set_sleep([slept](milliseconds delay) { slept->push_back(delay); });
  return uploader;
}
} // namespace

TEST(BackoffUploader, Classification) {
  EXPECT_EQ(classify_response(FakeTransport::http(200)),
            AttemptOutcome::kSuccess);
  EXPECT_EQ(classify_response(FakeTransport::http(204)),
            AttemptOutcome::kSuccess);
  EXPECT_EQ(classify_response(FakeTransport::http(500)),
            AttemptOutcome::kRetryable);
  EXPECT_EQ(classify_response(FakeTransport::http(503)),
            AttemptOutcome::kRetryable);
  EXPECT_EQ(classify_response(FakeTransport::http(429)),
            AttemptOutcome::kRetryable);
  EXPECT_EQ(classify_response(FakeTransport::http(400)),
            AttemptOutcome::kFatal);
  EXPECT_EQ(classify_response(FakeTransport::http(403)),
            AttemptOutcome::kFatal);
  EXPECT_EQ(classify_response(FakeTransport::http(301)),
            AttemptOutcome::kFatal);
  EXPECT_EQ(classify_response(
                FakeTransport::failure(HttpResponse::Status::kConnectionError)),
            AttemptOutcome::kRetryable);
  EXPECT_EQ(classify_response(
                FakeTransport::failure(HttpResponse::Status::kTimeout)),
            AttemptOutcome::kRetryable);
  // a response without a status code is a transport fault
  EXPECT_EQ(classify_response(FakeTransport::http(0)),
            AttemptOutcome::kRetryable);
  EXPECT_EQ(classify_response(FakeTransport::http(999)),
            AttemptOutcome::kRetryable);
}

TEST(BackoffUploader, MissingStatusCodeIsRetried) {
  LogHandle handle;
  auto transport = std::make_shared<FakeTransport>();
  transport->push(FakeTransport::http(0, "empty reply"));
  transport->push(FakeTransport::http(200));
  std::vector<milliseconds> slept;
  auto uploader = make_uploader(transport, &slept);

  UploadReport report;
  EXPECT_TRUE(IsPSResOK(uploader->upload(make_payload(), &report)));
  EXPECT_EQ(report.attempts, 2);
  EXPECT_EQ(slept.size(), 1u);
  EXPECT_EQ(transport->nb_requests(), 2);
}

TEST(BackoffUploader, BackoffDelay) {
  RetryPolicy policy;
  policy.base_delay = milliseconds{500};
  policy.max_delay = milliseconds{4000};
  EXPECT_EQ(backoff_delay(policy, 1, 0.5), milliseconds{0});
  EXPECT_EQ(backoff_delay(policy, 2, 0.0), milliseconds{250});
  EXPECT_EQ(backoff_delay(policy, 2, 0.5), milliseconds{375});
  EXPECT_EQ(backoff_delay(policy, 3, 0.0), milliseconds{500});
  EXPECT_EQ(backoff_delay(policy, 3, 0.5), milliseconds{750});
  // capped
  EXPECT_EQ(backoff_delay(policy, 10, 0.5), milliseconds{4000});
  EXPECT_EQ(backoff_delay(policy, 1000, 0.9), milliseconds{4000});
  // jitter outside of the range is clamped
  EXPECT_EQ(backoff_delay(policy, 2, -3.0), milliseconds{250});
  EXPECT_LT(backoff_delay(policy, 2, 7.0), milliseconds{500});
}

TEST(BackoffUploader, BackoffDelayNonDecreasing) {
  RetryPolicy policy;
  policy.base_delay = milliseconds{100};
  policy.max_delay = milliseconds{60000};
  for (double jitter : {0.0, 0.25, 0.5, 0.99}) {
    milliseconds previous{0};
    for (int32_t attempt = 1; attempt < 80; ++attempt) {
      milliseconds const delay = backoff_delay(policy, attempt, jitter);
      EXPECT_GE(delay, previous);
      EXPECT_LE(delay, policy.max_delay);
      previous = delay;
    }
  }
}

TEST(BackoffUploader, RetriesUntilSuccess) {
  LogHandle handle;
  profship_stats_clear_all();
  auto transport = std::make_shared<FakeTransport>();
  transport->push(FakeTransport::http(503));
  transport->push(FakeTransport::http(503));
  transport->push(FakeTransport::http(200));
  std::vector<milliseconds> slept;
  auto uploader = make_uploader(transport, &slept);

  UploadReport report;
  PSRes const res = uploader->upload(make_payload(), &report);
  EXPECT_TRUE(IsPSResOK(res));
  EXPECT_TRUE(report.success);
  EXPECT_FALSE(report.error);
  EXPECT_EQ(report.attempts, 3);
  EXPECT_EQ(report.last_http_code, 200);
  EXPECT_EQ(transport->nb_requests(), 3);
  EXPECT_EQ(report.delays,
            (std::vector<milliseconds>{milliseconds{375}, milliseconds{750}}));
  EXPECT_EQ(slept, report.delays);

  int64_t value = 0;
  profship_stats_get(STATS_UPLOAD_ATTEMPTS, &value);
  EXPECT_EQ(value, 3);
  profship_stats_get(STATS_UPLOAD_FAILURES, &value);
  EXPECT_EQ(value, 2);
  profship_stats_get(STATS_UPLOAD_SUCCESSES, &value);
  EXPECT_EQ(value, 1);
}

TEST(BackoffUploader, FatalStopsImmediately) {
  LogHandle handle;
  auto transport = std::make_shared<FakeTransport>();
  transport->push(FakeTransport::http(400, "invalid profile"));
  std::vector<milliseconds> slept;
  auto uploader = make_uploader(transport, &slept);

  UploadReport report;
  PSRes const res = uploader->upload(make_payload(), &report);
  EXPECT_TRUE(IsPSResFatal(res));
  EXPECT_EQ(res._what, PS_WHAT_UPLOAD_FATAL);
  EXPECT_FALSE(report.success);
  ASSERT_TRUE(report.error);
  EXPECT_EQ(*report.error, ErrorKind::kFatal);
  EXPECT_EQ(report.attempts, 1);
  EXPECT_EQ(report.last_http_code, 400);
  EXPECT_EQ(report.last_message, "invalid profile");
  EXPECT_TRUE(report.delays.empty());
  EXPECT_TRUE(slept.empty());
  EXPECT_EQ(transport->nb_requests(), 1);
}

TEST(BackoffUploader, ExhaustsMaxAttempts) {
  LogHandle handle;
  auto transport = std::make_shared<FakeTransport>();
  for (int i = 0; i < 10; ++i) {
    transport->push(FakeTransport::failure(
        i % 2 ? HttpResponse::Status::kTimeout
              : HttpResponse::Status::kConnectionError));
  }
  RetryPolicy policy;
  policy.max_attempts = 4;
  std::vector<milliseconds> slept;
  auto uploader = make_uploader(transport, &slept, policy);

  UploadReport report;
  PSRes const res = uploader->upload(make_payload(), &report);
  EXPECT_TRUE(IsPSResFatal(res));
  EXPECT_EQ(res._what, PS_WHAT_UPLOAD_RETRYABLE);
  ASSERT_TRUE(report.error);
  EXPECT_EQ(*report.error, ErrorKind::kRetryableExhausted);
  EXPECT_EQ(report.attempts, 4);
  EXPECT_EQ(transport->nb_requests(), 4);
  ASSERT_EQ(report.delays.size(), 3);
  for (size_t i = 1; i < report.delays.size(); ++i) {
    EXPECT_GE(report.delays[i], report.delays[i - 1]);
  }
}

TEST(BackoffUploader, TooManyRequestsIsRetried) {
  LogHandle handle;
  auto transport = std::make_shared<FakeTransport>();
  transport->push(FakeTransport::http(429));
  std::vector<milliseconds> slept;
  auto uploader = make_uploader(transport, &slept);
  UploadReport report;
  EXPECT_TRUE(IsPSResOK(uploader->upload(make_payload(), &report)));
  EXPECT_EQ(report.attempts, 2);
}

TEST(BackoffUploader, RetryBudget) {
  LogHandle handle;
  auto transport = std::make_shared<FakeTransport>();
  for (int i = 0; i < 10; ++i) {
    transport->push(FakeTransport::http(502));
  }
  RetryPolicy policy;
  policy.max_attempts = 10;
  policy.base_delay = milliseconds{500};
  policy.max_delay = milliseconds{4000};
  policy.max_elapsed = milliseconds{1000};
  std::vector<milliseconds> slept;
  auto uploader = make_uploader(transport, &slept, policy);
  uploader->set_jitter([] { return 0.0; });

  // waits of 250 then 500, the next wait of 1000 would exceed the budget
  UploadReport report;
  PSRes const res = uploader->upload(make_payload(), &report);
  EXPECT_EQ(res._what, PS_WHAT_UPLOAD_RETRYABLE);
  EXPECT_EQ(report.attempts, 3);
  EXPECT_EQ(report.delays,
            (std::vector<milliseconds>{milliseconds{250}, milliseconds{500}}));
}

TEST(BackoffUploader, CancelDuringBackoff) {
  LogHandle handle;
  auto transport = std::make_shared<FakeTransport>();
  transport->push(FakeTransport::http(503));
  transport->push(FakeTransport::http(503));
  auto uploader = std::make_unique<BackoffUploader>(
      transport, std::string(k_endpoint), RetryPolicy{});
  BackoffUploader *raw = uploader.get();
  uploader->set_sleep([raw](milliseconds) { raw->cancel(); });

  UploadReport report;
  PSRes const res = uploader->upload(make_payload(), &report);
  EXPECT_FALSE(IsPSResOK(res));
  EXPECT_FALSE(IsPSResFatal(res));
  EXPECT_EQ(res._what, PS_WHAT_UPLOAD_CANCELLED);
  ASSERT_TRUE(report.error);
  EXPECT_EQ(*report.error, ErrorKind::kCancelled);
  EXPECT_EQ(report.attempts, 1);
  EXPECT_TRUE(report.delays.empty());
  EXPECT_EQ(transport->nb_requests(), 1);
  EXPECT_TRUE(uploader->cancelled());
}

TEST(BackoffUploader, CancelInterruptsWait) {
  LogHandle handle;
  auto transport = std::make_shared<FakeTransport>();
  transport->push(FakeTransport::http(503));
  RetryPolicy policy;
  policy.base_delay = milliseconds{60000};
  policy.max_delay = milliseconds{60000};
  policy.max_elapsed = milliseconds{0};
  BackoffUploader uploader(transport, std::string(k_endpoint), policy);

  std::thread canceller([&] {
    while (transport->nb_requests() == 0) {
      std::this_thread::sleep_for(milliseconds{1});
    }
    uploader.cancel();
  });
  auto const start = std::chrono::steady_clock::now();
  PSRes const res = uploader.upload(make_payload());
  canceller.join();
  EXPECT_EQ(res._what, PS_WHAT_UPLOAD_CANCELLED);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds{20});
  EXPECT_EQ(transport->nb_requests(), 1);
}

TEST(BackoffUploader, RequestContent) {
  LogHandle handle;
  auto transport = std::make_shared<FakeTransport>();
  std::vector<milliseconds> slept;
  RetryPolicy policy;
  policy.request_timeout = milliseconds{1234};
  auto uploader = make_uploader(transport, &slept, policy);
  ASSERT_TRUE(IsPSResOK(uploader->upload(make_payload())));

  std::vector<RecordedRequest> const requests = transport->requests();
  ASSERT_EQ(requests.size(), 1);
  const RecordedRequest &request = requests[0];
  EXPECT_EQ(request.url, "http://localhost:4040/ingest?name=checkout%7Benv%3D"
                         "prod%7D&from=10&until=20&format=pprof"
                         "&spyName=profship");
  EXPECT_EQ(request.body, "compressed-profile");
  EXPECT_EQ(request.timeout, milliseconds{1234});
  EXPECT_EQ(request.header("Authorization"), "Bearer secret");
  EXPECT_EQ(request.header("Content-Type"), "application/octet-stream");
  EXPECT_EQ(request.header("Content-Encoding"), "gzip");
  EXPECT_EQ(request.header("User-Agent").rfind("profship/", 0), 0);
}

TEST(BackoffUploader, AnonymousUpload) {
  LogHandle handle;
  auto transport = std::make_shared<FakeTransport>();
  std::vector<milliseconds> slept;
  auto uploader = make_uploader(transport, &slept);
  UploadPayload payload = make_payload();
  payload.auth_token.clear();
  ASSERT_TRUE(IsPSResOK(uploader->upload(payload)));
  EXPECT_TRUE(transport->requests()[0].header("Authorization").empty());
}

TEST(BackoffUploader, ExportDisabled) {
  LogHandle handle;
  auto transport = std::make_shared<FakeTransport>();
  BackoffUploader uploader(transport, std::string(k_endpoint), RetryPolicy{},
                           false);
  UploadReport report;
  EXPECT_TRUE(IsPSResOK(uploader.upload(make_payload(), &report)));
  EXPECT_TRUE(report.success);
  EXPECT_EQ(report.attempts, 0);
  EXPECT_EQ(transport->nb_requests(), 0);
}

TEST(BackoffUploader, CustomClassifier) {
  LogHandle handle;
  auto transport = std::make_shared<FakeTransport>();
  transport->push(FakeTransport::http(404));
  std::vector<milliseconds> slept;
  auto uploader = make_uploader(transport, &slept);
  uploader->set_classifier([](const HttpResponse &response) {
    return response.http_code == 404 ? AttemptOutcome::kRetryable
                                     : classify_response(response);
  });
  UploadReport report;
  EXPECT_TRUE(IsPSResOK(uploader->upload(make_payload(), &report)));
  EXPECT_EQ(report.attempts, 2);
}

TEST(BackoffUploader, NoTransport) {
  LogHandle handle;
  BackoffUploader uploader(nullptr, std::string(k_endpoint));
  PSRes const res = uploader.upload(make_payload());
  EXPECT_TRUE(IsPSResFatal(res));
  EXPECT_EQ(res._what, PS_WHAT_TRANSPORT);
}

} // namespace profship
