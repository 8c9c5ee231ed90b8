// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "pprof/profile_builder.hpp"

#include "profship_stats.hpp"
#include "psres.hpp"

#include "profile.pb.h"

#include <absl/container/flat_hash_map.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <array>
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <map>
#include <string_view>
#include <tuple>
#include <vector>

namespace profship {

namespace {

struct ValueSum {
  int64_t value{0};
  int64_t count{0};
};

using TypeValues = std::array<ValueSum, PS_SAMPLE_TYPE_LENGTH>;

struct StackPtrLess {
  bool operator()(const Stack *lhs, const Stack *rhs) const {
    return *lhs < *rhs;
  }
};

// Groups are visited in stack order, which makes the numbering of strings,
// functions and locations independent of the recording order.
using StackGroups = std::map<const Stack *, TypeValues, StackPtrLess>;

class PProfEncoder {
public:
  PProfEncoder() {
    // string_table[0] must be ""
    _profile.add_string_table("");
  }

  int64_t intern_string(std::string_view sv) {
    if (sv.empty()) {
      return 0;
    }
    const auto index = static_cast<int64_t>(_profile.string_table_size());
    const auto inserted = _strings.try_emplace(std::string(sv), index);
    if (!inserted.second) {
      return inserted.first->second;
    }
    _profile.add_string_table(inserted.first->first);
    return index;
  }

  uint64_t intern_function(const Frame &frame) {
    // ids start at 1, 0 is reserved
    const uint64_t id = _profile.function_size() + 1;
    const auto inserted = _functions.try_emplace(
        std::make_tuple(frame.function, frame.file), id);
    if (!inserted.second) {
      return inserted.first->second;
    }
    perftools::profiles::Function &function = *_profile.add_function();
    function.set_id(id);
    function.set_name(intern_string(frame.function));
    function.set_system_name(function.name());
    function.set_filename(intern_string(frame.file));
    return id;
  }

  uint64_t intern_location(const Frame &frame) {
    const auto it = _locations.find(frame);
    if (it != _locations.end()) {
      return it->second;
    }
    const uint64_t function_id = intern_function(frame);
    const uint64_t id = _profile.location_size() + 1;
    perftools::profiles::Location &location = *_profile.add_location();
    location.set_id(id);
    perftools::profiles::Line &line = *location.add_line();
    line.set_function_id(function_id);
    line.set_line(frame.line);
    _locations.emplace(frame, id);
    return id;
  }

  void add_value_type(std::string_view type, std::string_view unit) {
    perftools::profiles::ValueType &value_type = *_profile.add_sample_type();
    value_type.set_type(intern_string(type));
    value_type.set_unit(intern_string(unit));
  }

  perftools::profiles::Profile &profile() { return _profile; }

private:
  perftools::profiles::Profile _profile;
  absl::flat_hash_map<std::string, int64_t> _strings;
  absl::flat_hash_map<std::tuple<std::string, std::string>, uint64_t>
      _functions;
  std::map<Frame, uint64_t> _locations;
};

PSRes serialize_deterministic(const perftools::profiles::Profile &profile,
                              std::string *out) {
  out->clear();
  {
    google::protobuf::io::StringOutputStream string_stream(out);
    google::protobuf::io::CodedOutputStream coded_stream(&string_stream);
    coded_stream.SetSerializationDeterministic(true);
    if (!profile.SerializeToCodedStream(&coded_stream)) {
      PSRES_RETURN_ERROR_LOG(PS_WHAT_ENCODING,
                             "[PPROF] Unable to serialize profile");
    }
  }
  return {};
}

} // namespace

PSRes ProfileBuilder::build(const ProfileWindow &window,
                            BinaryProfile *out) const {
  try {
    StackGroups groups;
    std::array<bool, PS_SAMPLE_TYPE_LENGTH> present{};
    size_t nb_skipped = 0;

    for (const Sample &sample : window.samples) {
      if (!is_known_sample_type(sample.sample_type)) {
        ++nb_skipped;
        continue;
      }
      present[sample.sample_type] = true;
      ValueSum &sum = groups[&sample.frames][sample.sample_type];
      sum.value += sample.value;
      ++sum.count;
    }

    PProfEncoder encoder;
    perftools::profiles::Profile &profile = encoder.profile();

    // column layout: (value, count) for each present type, in table order
    std::vector<int32_t> columns;
    for (int32_t type = 0; type < PS_SAMPLE_TYPE_LENGTH; ++type) {
      if (!present[type]) {
        continue;
      }
      const SampleTypeInfo *info = sample_type_info(type);
      encoder.add_value_type(info->pprof_type, info->unit);
      encoder.add_value_type(info->count_type, "count");
      columns.push_back(type);
    }

    for (const auto &[stack, values] : groups) {
      perftools::profiles::Sample &pprof_sample = *profile.add_sample();
      // frames are leaf first, as pprof expects
      for (const Frame &frame : *stack) {
        pprof_sample.add_location_id(encoder.intern_location(frame));
      }
      for (int32_t type : columns) {
        pprof_sample.add_value(values[type].value);
        pprof_sample.add_value(values[type].count);
      }
    }

    profile.set_time_nanos(window.start_ns);
    profile.set_duration_nanos(window.duration_ns());
    if (!columns.empty()) {
      const SampleTypeInfo *info = sample_type_info(columns.front());
      perftools::profiles::ValueType &period_type =
          *profile.mutable_period_type();
      period_type.set_type(encoder.intern_string(info->pprof_type));
      period_type.set_unit(encoder.intern_string(info->unit));
      profile.set_default_sample_type(encoder.intern_string(info->pprof_type));
    }

    std::string serialized;
    PSRES_CHECK_FWD(serialize_deterministic(profile, &serialized));

    LG_DBG("[PPROF] Built profile stacks=%zu samples=%zu columns=%zu size=%zu",
           groups.size(), window.samples.size(), columns.size() * 2,
           serialized.size());
    profship_stats_add(STATS_PROFILES_BUILT, 1, nullptr);
    profship_stats_set(STATS_PPROF_SIZE, static_cast<int64_t>(serialized.size()));

    *out = BinaryProfile(std::move(serialized), window.start_ns, window.end_ns,
                         groups.size(), nb_skipped);

    if (nb_skipped) {
      profship_stats_add(STATS_SAMPLES_SKIPPED, nb_skipped, nullptr);
      PSRES_RETURN_WARN_LOG(PS_WHAT_ENCODING,
                            "[PPROF] Skipped %zu samples of unrecognized type",
                            nb_skipped);
    }
  }
  CatchExcept2PSRes();
  return {};
}

void pprof_print_profile(const BinaryProfile &binary_profile) {
  perftools::profiles::Profile profile;
  if (!profile.ParseFromString(binary_profile.serialized())) {
    LG_WRN("[PPROF] Unable to decode profile for display");
    return;
  }
  auto str = [&profile](int64_t idx) -> std::string_view {
    if (idx < 0 || idx >= profile.string_table_size()) {
      return "?";
    }
    return profile.string_table(idx);
  };
  std::vector<std::string> columns;
  for (const auto &value_type : profile.sample_type()) {
    columns.push_back(
        absl::StrCat(str(value_type.type()), "/", str(value_type.unit())));
  }
  PRINT_NFO("[PPROF] columns: %s", absl::StrJoin(columns, ", ").c_str());

  for (const auto &sample : profile.sample()) {
    std::vector<std::string_view> names;
    // display root first
    for (auto it = sample.location_id().rbegin();
         it != sample.location_id().rend(); ++it) {
      const auto &location = profile.location(static_cast<int>(*it - 1));
      const auto &function =
          profile.function(static_cast<int>(location.line(0).function_id() - 1));
      names.push_back(str(function.name()));
    }
    PRINT_NFO("[PPROF] %s %s", absl::StrJoin(names, ";").c_str(),
              absl::StrJoin(sample.value(), " ").c_str());
  }
}

} // namespace profship
