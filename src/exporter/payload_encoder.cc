// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "exporter/payload_encoder.hpp"

#include "defer.hpp"
#include "profship_stats.hpp"
#include "psres.hpp"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <cerrno>
#include <climits>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <iterator>
#include <nlohmann/json.hpp>
#include <unistd.h>
#include <zlib.h>

namespace profship {

namespace {
// 15 bits of window, +16 selects the gzip wrapper
constexpr int k_gzip_window_bits = 15 + 16;
constexpr int k_zlib_mem_level = 8;

constexpr std::string_view k_octet_stream{"application/octet-stream"};

void append_form_part(std::string &body, std::string_view boundary,
                      std::string_view name, std::string_view data) {
  absl::StrAppend(&body, "--", boundary, "\r\n",
                  "Content-Disposition: form-data; name=\"", name,
                  "\"; filename=\"", name, "\"\r\n",
                  "Content-Type: ", k_octet_stream, "\r\n\r\n", data, "\r\n");
}

std::string form_boundary(std::string_view compressed_profile,
                          std::string_view config) {
  uLong const crc = crc32(
      0L, reinterpret_cast<const Bytef *>(compressed_profile.data()),
      static_cast<uInt>(compressed_profile.size()));
  std::string boundary = absl::StrFormat("profship-%08lx", crc);
  // the boundary must not appear in the parts
  while (compressed_profile.find(boundary) != std::string_view::npos ||
         config.find(boundary) != std::string_view::npos) {
    boundary.push_back('x');
  }
  return boundary;
}

} // namespace

PSRes gzip_compress(std::string_view input, std::string *out) {
  if (input.size() > UINT_MAX) {
    PSRES_RETURN_ERROR_LOG(PS_WHAT_ENCODING,
                           "[ENCODER] Profile too large to compress (%zu)",
                           input.size());
  }
  z_stream strm{};
  int rc = deflateInit2(&strm, k_gzip_level, Z_DEFLATED, k_gzip_window_bits,
                        k_zlib_mem_level, Z_DEFAULT_STRATEGY);
  if (rc != Z_OK) {
    PSRES_RETURN_ERROR_LOG(PS_WHAT_ENCODING,
                           "[ENCODER] Unable to initialize zlib (%d)", rc);
  }
  defer { deflateEnd(&strm); };

  out->resize(deflateBound(&strm, static_cast<uLong>(input.size())));
  // zlib does not modify the input
  strm.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(input.data()));
  strm.avail_in = static_cast<uInt>(input.size());
  strm.next_out = reinterpret_cast<Bytef *>(out->data());
  strm.avail_out = static_cast<uInt>(out->size());

  rc = deflate(&strm, Z_FINISH);
  if (rc != Z_STREAM_END) {
    out->clear();
    PSRES_RETURN_ERROR_LOG(PS_WHAT_ENCODING,
                           "[ENCODER] Compression failed (%d): %s", rc,
                           strm.msg ? strm.msg : "no message");
  }
  out->resize(strm.total_out);
  return {};
}

std::string sample_type_config_json(SampleTypeMask types) {
  nlohmann::json config = nlohmann::json::object();
  for (int32_t type = 0; type < PS_SAMPLE_TYPE_LENGTH; ++type) {
    if (!(types & sample_type_bit(type))) {
      continue;
    }
    const SampleTypeInfo *info = sample_type_info(type);
    config[std::string(info->pprof_type)] = {
        {"units", std::string(info->units)},
        {"aggregation", std::string(info->aggregation)},
        {"display-name", std::string(info->display_name)},
        {"sampled", info->sampled},
    };
  }
  return config.dump();
}

PSRes write_debug_pprof(std::string_view compressed_profile, int64_t start_ns,
                        std::string_view prefix) {
  constexpr size_t k_max_time_length = 128;
  char time_start[k_max_time_length] = {};
  time_t const start_s = start_ns / 1000000000;
  tm tm_storage;
  tm *tm_start = gmtime_r(&start_s, &tm_storage);
  if (!tm_start) {
    PSRES_RETURN_ERROR_LOG(PS_WHAT_EXPORTER, "[ENCODER] Invalid start time");
  }
  strftime(time_start, std::size(time_start), "%Y%m%dT%H%M%SZ", tm_start);

  std::string const filename = absl::StrCat(prefix, time_start, ".pprof.gz");
  LG_NTC("[ENCODER] Writing pprof to file %s", filename.c_str());
  constexpr int read_write_user_only = 0600;
  int const fd = open(filename.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC,
                      read_write_user_only);
  PSRES_CHECK_ERRNO(fd, PS_WHAT_EXPORTER, "Failure to create pprof file %s",
                    filename.c_str());
  defer { close(fd); };

  const char *data = compressed_profile.data();
  size_t remaining = compressed_profile.size();
  while (remaining > 0) {
    ssize_t const written = write(fd, data, remaining);
    if (written < 0 && errno == EINTR) {
      continue;
    }
    PSRES_CHECK_ERRNO(written, PS_WHAT_EXPORTER,
                      "Failed to write pprof file %s", filename.c_str());
    data += written;
    remaining -= written;
  }
  return {};
}

PayloadEncoder::PayloadEncoder(ExporterInput input,
                               SampleTypeMask enabled_types)
    : _input(std::move(input)),
      _sample_type_config(sample_type_config_json(enabled_types)) {
  if (!_input.environment.empty()) {
    _labels["env"] = _input.environment;
  }
  if (!_input.host.empty()) {
    _labels["host"] = _input.host;
  }
  add_tags_to_labels(_input.user_tags, _labels);
}

PSRes PayloadEncoder::encode(const BinaryProfile &profile,
                             UploadPayload *out) const {
  try {
    std::string compressed;
    PSRES_CHECK_FWD(gzip_compress(profile.serialized(), &compressed));

    if (!_input.debug_pprof_prefix.empty()) {
      // debug copies never fail the cycle
      if (IsPSResNotOK(write_debug_pprof(compressed, profile.start_ns(),
                                         _input.debug_pprof_prefix))) {
        LG_WRN("[ENCODER] Unable to write debug pprof with prefix %s",
               _input.debug_pprof_prefix.c_str());
      }
    }

    UploadPayload payload;
    payload.service = _input.service;
    payload.labels = _labels;
    payload.auth_token = _input.token;
    payload.start_ns = profile.start_ns();
    payload.end_ns = profile.end_ns();
    payload.spy_name = _input.spy_name;

    switch (_input.format) {
    case UploadFormat::kMultipart: {
      std::string const boundary =
          form_boundary(compressed, _sample_type_config);
      payload.body.reserve(compressed.size() + _sample_type_config.size() +
                           512);
      append_form_part(payload.body, boundary, "profile", compressed);
      append_form_part(payload.body, boundary, "sample_type_config",
                       _sample_type_config);
      absl::StrAppend(&payload.body, "--", boundary, "--");
      payload.content_type =
          absl::StrCat("multipart/form-data; boundary=", boundary);
      break;
    }
    case UploadFormat::kGzip:
    default:
      payload.body = std::move(compressed);
      payload.content_type = k_octet_stream;
      payload.content_encoding = "gzip";
      break;
    }

    LG_DBG("[ENCODER] Payload format=%s pprof=%zu body=%zu",
           std::string(upload_format_name(_input.format)).c_str(),
           profile.serialized().size(), payload.body.size());
    profship_stats_set(STATS_PAYLOAD_SIZE,
                       static_cast<int64_t>(payload.body.size()));
    *out = std::move(payload);
  }
  CatchExcept2PSRes();
  return {};
}

} // namespace profship
