// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "defer.hpp"
#include "export_bridge.hpp"
#include "folded_stack_reader.hpp"
#include "logger.hpp"
#include "logger_setup.hpp"
#include "profship_cli.hpp"
#include "profship_stats.hpp"
#include "psres.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>

namespace profship {

namespace {

std::atomic<bool> s_stop_requested{false};

void on_stop_signal(int /*sig*/) { s_stop_requested = true; }

bool install_stop_handler(int sig) {
  struct sigaction sa;
  sigemptyset(&sa.sa_mask);
  // no SA_RESTART: a blocking read on stdin is interrupted
  sa.sa_flags = 0;
  sa.sa_handler = on_stop_signal;
  if (sigaction(sig, &sa, nullptr) != 0) {
    LG_ERR("Failed to install signal handler for signal %d: %s", sig,
           strerror(errno));
    return false;
  }
  return true;
}

size_t drain(FoldedStackReader &reader) {
  Sample sample;
  size_t nb_samples = 0;
  while (!s_stop_requested && reader.next(&sample)) {
    ++nb_samples;
  }
  return nb_samples;
}

PSRes run(const ProfshipCLI &cli, std::istream &input) {
  ExportConfig config;
  PSRES_CHECK_FWD(export_config_from_cli(cli, &config));
  if (cli.show_config) {
    export_config_print(config);
  }

  std::optional<int32_t> const sample_type =
      sample_type_from_str(cli.input_sample_type);
  PSRES_CHECK_BOOL(sample_type, PS_WHAT_ARGUMENT, "Unknown sample type %s",
                   cli.input_sample_type.c_str());
  FoldedStackReader reader(input, *sample_type);

  if (!cli.enable) {
    LG_NTC("Profiling is disabled, discarding the input");
    size_t const nb_samples = drain(reader);
    LG_NFO("Discarded %zu samples", nb_samples);
    return {};
  }

  std::unique_ptr<ExportBridge> bridge;
  PSRES_CHECK_FWD(ExportBridge::create(config, nullptr, &bridge));
  PSRES_CHECK_FWD(bridge->start());

  Sample sample;
  size_t nb_samples = 0;
  while (!s_stop_requested && reader.next(&sample)) {
    bridge->record(std::move(sample));
    ++nb_samples;
  }
  if (s_stop_requested) {
    LG_NTC("Stop requested, flushing %zu samples",
           bridge->accumulator().pending());
  } else {
    LG_NTC("End of input, flushing %zu samples",
           bridge->accumulator().pending());
  }
  LG_NFO("Read %zu lines (%zu samples, %zu invalid)", reader.nb_lines(),
         nb_samples, reader.nb_invalid());

  PSRes const res = bridge->stop();
  profship_stats_print();
  return res;
}

} // namespace

} // namespace profship

int main(int argc, char *argv[]) {
  using namespace profship;

  ProfshipCLI cli;
  int const res = cli.parse(argc, const_cast<const char **>(argv));
  if (!cli.continue_exec) {
    return res;
  }

  setup_logger(cli.log_mode.c_str(), cli.log_level.c_str());
  defer { LOG_close(); };

  if (!install_stop_handler(SIGINT) || !install_stop_handler(SIGTERM)) {
    return -1;
  }

  std::ifstream input_file;
  if (!cli.input_path.empty()) {
    input_file.open(cli.input_path);
    if (!input_file) {
      LG_ERR("Unable to open input file %s", cli.input_path.c_str());
      return -1;
    }
  }
  std::istream &input = cli.input_path.empty() ? std::cin : input_file;

  PSRes const run_res = run(cli, input);
  if (IsPSResFatal(run_res)) {
    LG_ERR("Exiting on error: %s", psres_error_message(run_res._what));
    return -1;
  }
  return 0;
}
