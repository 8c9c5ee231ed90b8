// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "exporter/upload_payload.hpp"
#include "exporter_input.hpp"
#include "pprof/profile_builder.hpp"
#include "psres_def.hpp"
#include "sample.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace profship {

inline constexpr int k_gzip_level = 6;

/// gzip wrapper with a zero mtime: same input, same bytes
PSRes gzip_compress(std::string_view input, std::string *out);

/// JSON description of the sample types, as expected by the ingest form
std::string sample_type_config_json(SampleTypeMask types);

/// Local copy of a compressed profile: <prefix><UTC time>.pprof.gz
PSRes write_debug_pprof(std::string_view compressed_profile, int64_t start_ns,
                        std::string_view prefix);

/// Turns a profile into the body and metadata of an upload. The output only
/// depends on the profile and on the static metadata given at construction.
class PayloadEncoder {
public:
  explicit PayloadEncoder(ExporterInput input,
                          SampleTypeMask enabled_types = k_all_sample_types_mask);

  PSRes encode(const BinaryProfile &profile, UploadPayload *out) const;

  [[nodiscard]] const ExporterInput &input() const { return _input; }

private:
  ExporterInput _input;
  Labels _labels;
  std::string _sample_type_config;
};

} // namespace profship
