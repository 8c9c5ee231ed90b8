// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "exporter/payload_encoder.hpp"

#include "loghandle.hpp"
#include "psres.hpp"

#include <cstdio>
#include <filesystem>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>
#include <zlib.h>

namespace profship {

namespace {
BinaryProfile make_profile() {
  ProfileWindow window;
  window.start_ns = 1'700'000'000'000'000'000;
  window.end_ns = 1'700'000'010'000'000'000;
  Sample sample;
  sample.sample_type = PS_SAMPLE_CPU;
  sample.value = 42;
  sample.frames = {Frame{"leaf", "lib.py", 3}, Frame{"main", "app.py", 1}};
  window.samples.push_back(sample);
  BinaryProfile profile;
  EXPECT_TRUE(IsPSResOK(ProfileBuilder().build(window, &profile)));
  return profile;
}

ExporterInput make_input(UploadFormat format) {
  ExporterInput input;
  input.endpoint = "http://localhost:4040/ingest";
  input.service = "checkout";
  input.environment = "staging";
  input.host = "box-1";
  input.token = "secret-token";
  input.user_tags = {{"team", "perf"}};
  input.format = format;
  return input;
}

std::string gunzip(const std::string &compressed) {
  z_stream strm{};
  EXPECT_EQ(inflateInit2(&strm, 15 + 16), Z_OK);
  std::string output(1 << 20, '\0');
  strm.next_in =
      reinterpret_cast<Bytef *>(const_cast<char *>(compressed.data()));
  strm.avail_in = static_cast<uInt>(compressed.size());
  strm.next_out = reinterpret_cast<Bytef *>(output.data());
  strm.avail_out = static_cast<uInt>(output.size());
  EXPECT_EQ(inflate(&strm, Z_FINISH), Z_STREAM_END);
  output.resize(strm.total_out);
  inflateEnd(&strm);
  return output;
}
} // namespace

TEST(PayloadEncoder, GzipBody) {
  LogHandle handle;
  BinaryProfile const profile = make_profile();
  PayloadEncoder const encoder(make_input(UploadFormat::kGzip));
  UploadPayload payload;
  ASSERT_TRUE(IsPSResOK(encoder.encode(profile, &payload)));

  ASSERT_GE(payload.body.size(), 10);
  EXPECT_EQ(static_cast<unsigned char>(payload.body[0]), 0x1f);
  EXPECT_EQ(static_cast<unsigned char>(payload.body[1]), 0x8b);
  EXPECT_EQ(gunzip(payload.body), profile.serialized());
  EXPECT_EQ(payload.content_type, "application/octet-stream");
  EXPECT_EQ(payload.content_encoding, "gzip");
  EXPECT_EQ(payload.service, "checkout");
  EXPECT_EQ(payload.auth_token, "secret-token");
  EXPECT_EQ(payload.start_ns, profile.start_ns());
  EXPECT_EQ(payload.end_ns, profile.end_ns());
  EXPECT_EQ(payload.spy_name, "profship");
  EXPECT_EQ(payload.labels.at("env"), "staging");
  EXPECT_EQ(payload.labels.at("host"), "box-1");
  EXPECT_EQ(payload.labels.at("team"), "perf");
}

TEST(PayloadEncoder, EncodeIsIdempotent) {
  LogHandle handle;
  BinaryProfile const profile = make_profile();
  for (UploadFormat format : {UploadFormat::kGzip, UploadFormat::kMultipart}) {
    PayloadEncoder const encoder(make_input(format));
    UploadPayload first;
    UploadPayload second;
    ASSERT_TRUE(IsPSResOK(encoder.encode(profile, &first)));
    ASSERT_TRUE(IsPSResOK(encoder.encode(profile, &second)));
    EXPECT_EQ(first.body, second.body);
    EXPECT_EQ(first.content_type, second.content_type);
    EXPECT_EQ(first.labels, second.labels);
  }
}

TEST(PayloadEncoder, MultipartForm) {
  LogHandle handle;
  BinaryProfile const profile = make_profile();
  PayloadEncoder const encoder(make_input(UploadFormat::kMultipart),
                               sample_type_bit(PS_SAMPLE_CPU));
  UploadPayload payload;
  ASSERT_TRUE(IsPSResOK(encoder.encode(profile, &payload)));

  std::string const prefix = "multipart/form-data; boundary=";
  ASSERT_EQ(payload.content_type.compare(0, prefix.size(), prefix), 0);
  std::string const boundary = payload.content_type.substr(prefix.size());
  EXPECT_FALSE(boundary.empty());
  EXPECT_TRUE(payload.content_encoding.empty());

  EXPECT_EQ(payload.body.find("--" + boundary + "\r\n"), 0);
  EXPECT_NE(payload.body.find("name=\"profile\""), std::string::npos);
  EXPECT_NE(payload.body.find("name=\"sample_type_config\""),
            std::string::npos);
  std::string const closing = "--" + boundary + "--";
  EXPECT_EQ(payload.body.rfind(closing), payload.body.size() - closing.size());
  EXPECT_NE(payload.body.find(sample_type_config_json(
                sample_type_bit(PS_SAMPLE_CPU))),
            std::string::npos);
}

TEST(PayloadEncoder, SampleTypeConfig) {
  nlohmann::json const config = nlohmann::json::parse(sample_type_config_json(
      sample_type_bit(PS_SAMPLE_CPU) | sample_type_bit(PS_SAMPLE_HEAP_SPACE)));
  ASSERT_EQ(config.size(), 2);
  EXPECT_EQ(config["cpu-time"]["units"], "samples");
  EXPECT_EQ(config["cpu-time"]["display-name"], "cpu_time");
  EXPECT_EQ(config["cpu-time"]["sampled"], true);
  EXPECT_EQ(config["heap-space"]["aggregation"], "average");
  EXPECT_EQ(config["heap-space"]["sampled"], false);
  EXPECT_FALSE(config.contains("wall-time"));
}

TEST(PayloadEncoder, DebugPprofCopy) {
  LogHandle handle;
  std::filesystem::path const dir =
      std::filesystem::temp_directory_path() / "profship_encoder_ut";
  std::filesystem::create_directories(dir);
  ExporterInput input = make_input(UploadFormat::kGzip);
  input.debug_pprof_prefix = (dir / "dump-").string();

  PayloadEncoder const encoder(input);
  UploadPayload payload;
  ASSERT_TRUE(IsPSResOK(encoder.encode(make_profile(), &payload)));

  // 1'700'000'000 s is 2023-11-14T22:13:20Z
  std::filesystem::path const expected = dir / "dump-20231114T221320Z.pprof.gz";
  ASSERT_TRUE(std::filesystem::exists(expected));
  EXPECT_EQ(std::filesystem::file_size(expected), payload.body.size());
  std::filesystem::remove_all(dir);
}

TEST(UploadPayload, IngestUrl) {
  UploadPayload payload;
  payload.service = "checkout";
  payload.labels = {{"env", "prod"}, {"host", "box 1"}};
  payload.start_ns = 100;
  payload.end_ns = 200;
  payload.spy_name = "profship";

  EXPECT_EQ(ingest_app_name(payload), "checkout{env=prod,host=box 1}");
  std::string const url = ingest_url("http://localhost:4040/ingest", payload);
  EXPECT_EQ(url, "http://localhost:4040/ingest"
                 "?name=checkout%7Benv%3Dprod%2Chost%3Dbox%201%7D"
                 "&from=100&until=200&format=pprof&spyName=profship");

  payload.labels.clear();
  EXPECT_EQ(ingest_app_name(payload), "checkout");
}

TEST(ExporterInput, NormalizeEndpoint) {
  EXPECT_EQ(normalize_endpoint(""), "http://localhost:4040/ingest");
  EXPECT_EQ(normalize_endpoint("collector:4040"),
            "http://collector:4040/ingest");
  EXPECT_EQ(normalize_endpoint("https://profiles.example.com/"),
            "https://profiles.example.com/ingest");
  EXPECT_EQ(normalize_endpoint("https://profiles.example.com/api/v1/push"),
            "https://profiles.example.com/api/v1/push");
}

} // namespace profship
