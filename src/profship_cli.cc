// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "profship_cli.hpp"

#include "profship_cmdline.hpp"
#include "psres.hpp"
#include "sample.hpp"
#include "tags.hpp"
#include "version.hpp"

#include <CLI/CLI.hpp>
#include <array>
#include <climits>
#include <optional>
#include <string_view>
#include <unistd.h>

namespace profship {

namespace {
constexpr std::chrono::seconds k_default_upload_period{10};

constexpr std::array<std::string_view, 2> k_upload_formats{"gzip",
                                                           "multipart"};

struct SampleTypeValidator : public CLI::Validator {
  SampleTypeValidator() {
    name_ = "SAMPLE_TYPE";
    func_ = [](const std::string &str) {
      if (!sample_type_from_str(str)) {
        return std::string("Unknown sample type: ") + str;
      }
      return std::string();
    };
  }
};

std::string local_hostname() {
  char hostname[HOST_NAME_MAX + 1] = {};
  if (gethostname(hostname, sizeof(hostname) - 1) == -1) {
    LG_WRN("[CONFIG] Unable to read the host name");
    return {};
  }
  return hostname;
}
} // namespace

int ProfshipCLI::parse(int argc, const char *argv[]) {
  CLI::App app{MYNAME " reads folded stacks and ships them as pprof profiles "
                      "to a profiling ingest endpoint.\n"
                      " eg: " MYNAME " -S my_service -U http://localhost:4040 "
                      "--input stacks.txt\n",
               MYNAME}; // avoid auto-generation of NAME (which includes path)

  // Basic options to surface
  app.add_option("--endpoint,--url,-U", exporter_input.endpoint,
                 "Ingest endpoint. Either <host>:<port>, http://<host>:<port> "
                 "or a full url.\n"
                 "/ingest is appended when no path is given.")
      ->default_val(std::string(k_default_endpoint))
      ->envname("PROFILING_ENDPOINT");
  app.add_option("--token", exporter_input.token,
                 "Bearer token sent with every upload.")
      ->envname("TOKEN");
  app.add_option("--service,-S", exporter_input.service,
                 "The name of the profiled service."
                 " Profiles are grouped by service.")
      ->default_val(std::string(k_default_service))
      ->envname("SERVICE_NAME");
  app.add_option("--environment,-E", exporter_input.environment,
                 "Environment label attached to the profiles.")
      ->envname("PROFSHIP_ENV");
  app.add_option("--host,-H", exporter_input.host,
                 "Host label attached to the profiles (default: hostname).")
      ->envname("PROFSHIP_HOST");
  app.add_option("--tags,-T", tags,
                 "Labels attached to the profiles\n"
                 "Specified as a list of tags, ie: key1:value1,key2:value2\n")
      ->envname("PROFSHIP_TAGS");

  // Export settings
  app.add_option<std::chrono::seconds, unsigned>(
         "--upload_period,--upload-period,-u", upload_period,
         "Upload period for profiles (in seconds).\n")
      ->default_val(k_default_upload_period.count())
      ->group("Export settings")
      ->envname("PROFSHIP_UPLOAD_PERIOD");
  app.add_option("--upload_format,--upload-format", upload_format,
                 "One of gzip (compressed pprof body) or multipart "
                 "(ingest form with the sample type configuration).")
      ->default_val("gzip")
      ->check(CLI::IsMember({"gzip", "multipart"}))
      ->group("Export settings")
      ->envname("PROFSHIP_UPLOAD_FORMAT");
  app.add_option("--spy_name,--spy-name", exporter_input.spy_name,
                 "Name of the profiler reported to the backend.")
      ->default_val(std::string(k_default_spy_name))
      ->group("Export settings")
      ->envname("PROFSHIP_SPY_NAME");
  app.add_option("--enabled_types,--enabled-types", sample_types,
                 "Sample types to export (default: all).\n"
                 "Samples of other types are filtered out.")
      ->delimiter(',')
      ->check(SampleTypeValidator())
      ->group("Export settings")
      ->envname("PROFSHIP_ENABLED_TYPES");
  app.add_option("--memory_profiling,--memory-profiling",
                 enable_memory_profiling,
                 "Export allocation and heap sample types.")
      ->default_val(true)
      ->group("Export settings")
      ->envname("ENABLE_MEMORY_PROFILING");
  app.add_option("--capacity_per_type,--capacity-per-type", capacity_per_type,
                 "Samples kept per type and window. The oldest samples are "
                 "dropped beyond this bound.")
      ->default_val(k_default_capacity_per_type)
      ->check(CLI::PositiveNumber)
      ->group("Export settings")
      ->envname("PROFSHIP_CAPACITY_PER_TYPE");
  app.add_option<std::chrono::milliseconds, unsigned>(
         "--flush_timeout,--flush-timeout", flush_timeout,
         "Time (ms) given to the last export on shutdown.")
      ->default_val(k_default_flush_timeout.count())
      ->group("Export settings")
      ->envname("PROFSHIP_FLUSH_TIMEOUT");

  // Retry settings
  app.add_option("--max_attempts,--max-attempts", max_attempts,
                 "Upload attempts per profile.")
      ->default_val(k_default_max_attempts)
      ->check(CLI::Range(1, 100))
      ->group("Retry settings")
      ->envname("PROFSHIP_MAX_ATTEMPTS");
  app.add_option<std::chrono::milliseconds, unsigned>(
         "--backoff_base,--backoff-base", backoff_base,
         "Base delay (ms) of the exponential backoff.")
      ->default_val(k_default_base_delay.count())
      ->group("Retry settings")
      ->envname("PROFSHIP_BACKOFF_BASE");
  app.add_option<std::chrono::milliseconds, unsigned>(
         "--backoff_cap,--backoff-cap", backoff_cap,
         "Maximum delay (ms) between two attempts.")
      ->default_val(k_default_max_delay.count())
      ->group("Retry settings")
      ->envname("PROFSHIP_BACKOFF_CAP");
  app.add_option<std::chrono::milliseconds, unsigned>(
         "--retry_budget,--retry-budget", retry_budget,
         "Total time (ms) spent on one profile, 0 for no limit.")
      ->default_val(k_default_max_elapsed.count())
      ->group("Retry settings")
      ->envname("PROFSHIP_RETRY_BUDGET");
  app.add_option<std::chrono::milliseconds, unsigned>(
         "--request_timeout,--request-timeout", request_timeout,
         "Timeout (ms) of a single upload request.")
      ->default_val(k_default_request_timeout.count())
      ->group("Retry settings")
      ->envname("PROFSHIP_REQUEST_TIMEOUT");

  // Input
  app.add_option("--input,-i", input_path,
                 "File of folded stacks (\"root;caller;leaf value\" lines).\n"
                 "Reads stdin when not set.")
      ->group("Input");
  app.add_option("--sample_type,--sample-type", input_sample_type,
                 "Sample type of the input values.")
      ->default_val("cpu")
      ->check(SampleTypeValidator())
      ->group("Input");

  // Debug
  app.add_option("--log_level,--log-level,-l", log_level,
                 "One of debug, informational, notice, warn, error.")
      ->default_val("warn")
      ->check(
          CLI::IsMember({"debug", "informational", "notice", "warn", "error"}))
      ->group("Debug options")
      ->envname("PROFSHIP_LOG_LEVEL");
  app.add_option("--log_mode,--log-mode,-o", log_mode,
                 "One of stdout, stderr, disabled or a file path.")
      ->default_val("stdout")
      ->group("Debug options")
      ->envname("PROFSHIP_LOG_MODE");
  app.add_flag("--show_config,--show-config", show_config,
               "Display the configuration.")
      ->default_val(false)
      ->group("Debug options");
  app.add_flag("--show_samples,--show-samples", show_samples,
               "Display each exported profile as logs.\n")
      ->group("Debug options");
  app.add_flag("--version,-v", version, "Display the version.\n")
      ->group("Debug options");
  app.add_option("--enable", enable,
                 "Option to disable profiling.\n"
                 "Input is then read and discarded.\n")
      ->default_val(true)
      ->envname("ENABLE_PROFILING")
      ->group("Debug options");

  // Hidden options
  app.add_option("--do_export,--do-export", exporter_input.do_export,
                 "Debug flag to prevent exporting the profiles")
      ->default_val(true)
      ->group("");
  app.add_option("--debug_pprof_prefix,--debug-pprof-prefix",
                 exporter_input.debug_pprof_prefix,
                 "Prefix path to capture pprof files locally")
      ->group("")
      ->envname("PROFSHIP_PPROF_PREFIX");

  // Parse
  CLI11_PARSE(app, argc, argv);

  // Version then exit
  if (version) {
    print_version();
    return static_cast<int>(CLI::ExitCodes::Success);
  }

  continue_exec = true;
  return static_cast<int>(CLI::ExitCodes::Success);
}

PSRes export_config_from_cli(const ProfshipCLI &cli, ExportConfig *config) {
  ExportConfig result;
  result.exporter = cli.exporter_input;
  result.exporter.endpoint = normalize_endpoint(cli.exporter_input.endpoint);
  if (!cli.tags.empty()) {
    split(cli.tags, result.exporter.user_tags);
  }
  if (result.exporter.host.empty()) {
    result.exporter.host = local_hostname();
  }

  int const format = arg_which(cli.upload_format, k_upload_formats);
  if (format == -1) {
    PSRES_RETURN_ERROR_LOG(PS_WHAT_ARGUMENT, "[CONFIG] Unknown upload format %s",
                           cli.upload_format.c_str());
  }
  result.exporter.format =
      format == 0 ? UploadFormat::kGzip : UploadFormat::kMultipart;

  SampleTypeMask enabled = 0;
  for (const auto &name : cli.sample_types) {
    std::optional<int32_t> const type = sample_type_from_str(name);
    if (!type) {
      PSRES_RETURN_ERROR_LOG(PS_WHAT_ARGUMENT, "[CONFIG] Unknown sample type %s",
                             name.c_str());
    }
    enabled |= sample_type_bit(*type);
  }
  if (cli.sample_types.empty()) {
    enabled = k_all_sample_types_mask;
  }
  if (!cli.enable_memory_profiling) {
    enabled &= ~k_memory_sample_types_mask;
  }
  result.accumulator.enabled_types = enabled;
  result.accumulator.capacity_per_type = cli.capacity_per_type;

  result.export_interval = cli.upload_period;
  result.flush_timeout = cli.flush_timeout;
  result.retry.max_attempts = cli.max_attempts;
  result.retry.base_delay = cli.backoff_base;
  result.retry.max_delay = cli.backoff_cap;
  result.retry.max_elapsed = cli.retry_budget;
  result.retry.request_timeout = cli.request_timeout;
  result.show_samples = cli.show_samples;

  PSRES_CHECK_FWD(export_config_validate(result));
  *config = std::move(result);
  return {};
}

} // namespace profship
