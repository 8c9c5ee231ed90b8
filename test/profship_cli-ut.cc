// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include <gtest/gtest.h>

#include "defer.hpp"
#include "loghandle.hpp"
#include "profship_cli.hpp"
#include "profship_cmdline.hpp"
#include "psres.hpp"

#include <cstdlib>

namespace profship {

namespace {
// the environment of the test runner must not leak into the options
void clear_env() {
  for (const char *name :
       {"PROFILING_ENDPOINT", "TOKEN", "SERVICE_NAME", "PROFSHIP_ENV",
        "PROFSHIP_HOST", "PROFSHIP_TAGS", "PROFSHIP_UPLOAD_PERIOD",
        "PROFSHIP_UPLOAD_FORMAT", "PROFSHIP_ENABLED_TYPES",
        "ENABLE_MEMORY_PROFILING", "ENABLE_PROFILING",
        "PROFSHIP_MAX_ATTEMPTS", "PROFSHIP_LOG_LEVEL", "PROFSHIP_LOG_MODE"}) {
    unsetenv(name);
  }
}
} // namespace

TEST(profship_cli, help) {
  LogHandle handle;
  const char *argv[] = {MYNAME, "--help"};
  int argc = sizeof(argv) / sizeof(argv[0]);
  ProfshipCLI cli;
  int res = cli.parse(argc, argv);
  EXPECT_EQ(0, res);
  EXPECT_FALSE(cli.continue_exec);
}

TEST(profship_cli, version) {
  const char *argv[] = {MYNAME, "--version"};
  int argc = sizeof(argv) / sizeof(argv[0]);
  ProfshipCLI cli;
  int res = cli.parse(argc, argv);
  EXPECT_EQ(0, res);
  EXPECT_FALSE(cli.continue_exec);
}

TEST(profship_cli, defaults) {
  LogHandle handle;
  clear_env();
  const char *argv[] = {MYNAME};
  int argc = sizeof(argv) / sizeof(argv[0]);
  ProfshipCLI cli;
  int res = cli.parse(argc, argv);
  EXPECT_EQ(0, res);
  EXPECT_TRUE(cli.continue_exec);
  EXPECT_EQ(cli.exporter_input.endpoint, "http://localhost:4040");
  EXPECT_EQ(cli.exporter_input.service, "helloworld");
  EXPECT_TRUE(cli.exporter_input.token.empty());
  EXPECT_EQ(cli.upload_period, std::chrono::seconds{10});
  EXPECT_EQ(cli.upload_format, "gzip");
  EXPECT_EQ(cli.max_attempts, 3);
  EXPECT_EQ(cli.backoff_base, std::chrono::milliseconds{500});
  EXPECT_EQ(cli.backoff_cap, std::chrono::milliseconds{4000});
  EXPECT_EQ(cli.flush_timeout, std::chrono::milliseconds{5000});
  EXPECT_EQ(cli.input_sample_type, "cpu");
  EXPECT_TRUE(cli.enable);

  ExportConfig config;
  ASSERT_TRUE(IsPSResOK(export_config_from_cli(cli, &config)));
  EXPECT_EQ(config.exporter.endpoint, "http://localhost:4040/ingest");
  EXPECT_EQ(config.exporter.format, UploadFormat::kGzip);
  EXPECT_EQ(config.accumulator.enabled_types, k_all_sample_types_mask);
  EXPECT_EQ(config.export_interval, std::chrono::milliseconds{10000});
  EXPECT_FALSE(config.exporter.host.empty());
}

TEST(profship_cli, env_vars) {
  LogHandle handle;
  clear_env();
  setenv("PROFILING_ENDPOINT", "https://profiles.example.com", 1);
  setenv("TOKEN", "my-token", 1);
  setenv("SERVICE_NAME", "billing", 1);
  setenv("ENABLE_MEMORY_PROFILING", "false", 1);
  defer { clear_env(); };

  const char *argv[] = {MYNAME, "--tags", "team:perf,zone:a", "-u", "30"};
  int argc = sizeof(argv) / sizeof(argv[0]);
  ProfshipCLI cli;
  ASSERT_EQ(0, cli.parse(argc, argv));
  EXPECT_EQ(cli.exporter_input.token, "my-token");
  EXPECT_EQ(cli.exporter_input.service, "billing");
  EXPECT_FALSE(cli.enable_memory_profiling);

  ExportConfig config;
  ASSERT_TRUE(IsPSResOK(export_config_from_cli(cli, &config)));
  EXPECT_EQ(config.exporter.endpoint, "https://profiles.example.com/ingest");
  EXPECT_EQ(config.exporter.token, "my-token");
  ASSERT_EQ(config.exporter.user_tags.size(), 2);
  EXPECT_EQ(config.exporter.user_tags[1], Tag("zone", "a"));
  EXPECT_EQ(config.export_interval, std::chrono::milliseconds{30000});
  EXPECT_EQ(config.accumulator.enabled_types & k_memory_sample_types_mask, 0u);
  EXPECT_NE(config.accumulator.enabled_types & sample_type_bit(PS_SAMPLE_CPU),
            0u);
}

TEST(profship_cli, export_options) {
  LogHandle handle;
  clear_env();
  const char *argv[] = {MYNAME,
                        "--endpoint",
                        "collector:9000",
                        "--upload_format",
                        "multipart",
                        "--enabled_types",
                        "cpu,alloc_space",
                        "--max_attempts",
                        "5",
                        "--backoff_base",
                        "100",
                        "--backoff_cap",
                        "800",
                        "--host",
                        "box-7",
                        "--sample_type",
                        "wall"};
  int argc = sizeof(argv) / sizeof(argv[0]);
  ProfshipCLI cli;
  ASSERT_EQ(0, cli.parse(argc, argv));
  EXPECT_EQ(cli.sample_types.size(), 2);
  EXPECT_EQ(cli.input_sample_type, "wall");

  ExportConfig config;
  ASSERT_TRUE(IsPSResOK(export_config_from_cli(cli, &config)));
  EXPECT_EQ(config.exporter.endpoint, "http://collector:9000/ingest");
  EXPECT_EQ(config.exporter.format, UploadFormat::kMultipart);
  EXPECT_EQ(config.exporter.host, "box-7");
  EXPECT_EQ(config.accumulator.enabled_types,
            sample_type_bit(PS_SAMPLE_CPU) |
                sample_type_bit(PS_SAMPLE_ALLOC_SPACE));
  EXPECT_EQ(config.retry.max_attempts, 5);
  EXPECT_EQ(config.retry.base_delay, std::chrono::milliseconds{100});
  EXPECT_EQ(config.retry.max_delay, std::chrono::milliseconds{800});
}

TEST(profship_cli, invalid_options) {
  LogHandle handle;
  clear_env();
  {
    const char *argv[] = {MYNAME, "--max_attempts", "0"};
    int argc = sizeof(argv) / sizeof(argv[0]);
    ProfshipCLI cli;
    EXPECT_NE(0, cli.parse(argc, argv));
    EXPECT_FALSE(cli.continue_exec);
  }
  {
    const char *argv[] = {MYNAME, "--enabled_types", "cpu,gpu"};
    int argc = sizeof(argv) / sizeof(argv[0]);
    ProfshipCLI cli;
    EXPECT_NE(0, cli.parse(argc, argv));
  }
  {
    const char *argv[] = {MYNAME, "--upload_format", "zip"};
    int argc = sizeof(argv) / sizeof(argv[0]);
    ProfshipCLI cli;
    EXPECT_NE(0, cli.parse(argc, argv));
  }
}

TEST(profship_cli, inconsistent_retry_settings) {
  LogHandle handle;
  clear_env();
  const char *argv[] = {MYNAME, "--backoff_base", "1000", "--backoff_cap",
                        "10"};
  int argc = sizeof(argv) / sizeof(argv[0]);
  ProfshipCLI cli;
  ASSERT_EQ(0, cli.parse(argc, argv));
  ExportConfig config;
  PSRes const res = export_config_from_cli(cli, &config);
  EXPECT_TRUE(IsPSResFatal(res));
  EXPECT_EQ(res._what, PS_WHAT_CONFIG);
}

TEST(profship_cmdline, arg_which) {
  constexpr std::string_view formats[] = {"gzip", "multipart"};
  EXPECT_EQ(arg_which("gzip", formats), 0);
  EXPECT_EQ(arg_which("MultiPart", formats), 1);
  EXPECT_EQ(arg_which("zip", formats), -1);
  EXPECT_EQ(arg_which("", formats), -1);
}

TEST(profship_cli, sample_type_names) {
  EXPECT_EQ(sample_type_from_str("cpu"), PS_SAMPLE_CPU);
  EXPECT_EQ(sample_type_from_str("wall_time"), PS_SAMPLE_WALL);
  EXPECT_EQ(sample_type_from_str("alloc-objects"), PS_SAMPLE_ALLOC_OBJECTS);
  EXPECT_EQ(sample_type_from_str("heap"), PS_SAMPLE_HEAP_SPACE);
  EXPECT_FALSE(sample_type_from_str("gpu"));
  EXPECT_EQ(sample_type_short_name(PS_SAMPLE_ALLOC_SPACE), "alloc_space");
  EXPECT_EQ(sample_type_short_name(99), "unknown");
}

} // namespace profship
