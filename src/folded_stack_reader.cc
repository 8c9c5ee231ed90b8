// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "folded_stack_reader.hpp"

#include "psres.hpp"

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_split.h>
#include <string>
#include <vector>

namespace profship {

Frame parse_folded_frame(std::string_view token) {
  Frame frame;
  token = absl::StripAsciiWhitespace(token);
  size_t const open = token.rfind(" (");
  if (token.empty() || open == std::string_view::npos || token.back() != ')') {
    frame.function = std::string(token);
    return frame;
  }
  std::string_view location =
      token.substr(open + 2, token.size() - open - 3); // drop " (" and ")"
  frame.function =
      std::string(absl::StripAsciiWhitespace(token.substr(0, open)));
  size_t const colon = location.rfind(':');
  int64_t line = 0;
  if (colon != std::string_view::npos &&
      absl::SimpleAtoi(location.substr(colon + 1), &line)) {
    frame.file = std::string(location.substr(0, colon));
    frame.line = line;
  } else {
    frame.file = std::string(location);
  }
  return frame;
}

PSRes parse_folded_line(std::string_view line, int32_t sample_type,
                        int64_t timestamp_ns, Sample *out) {
  line = absl::StripAsciiWhitespace(line);
  if (line.empty() || line.front() == '#') {
    return psres_warn(PS_WHAT_INPUT_PROCESS);
  }
  size_t const sep = line.find_last_of(" \t");
  if (sep == std::string_view::npos) {
    PSRES_RETURN_ERROR_LOG(PS_WHAT_INPUT_PROCESS,
                           "[INPUT] Missing value in line: %.*s",
                           static_cast<int>(line.size()), line.data());
  }
  int64_t value = 0;
  if (!absl::SimpleAtoi(line.substr(sep + 1), &value) || value < 0) {
    PSRES_RETURN_ERROR_LOG(PS_WHAT_INPUT_PROCESS,
                           "[INPUT] Invalid value in line: %.*s",
                           static_cast<int>(line.size()), line.data());
  }
  std::string_view const stack =
      absl::StripTrailingAsciiWhitespace(line.substr(0, sep));
  std::vector<std::string_view> tokens =
      absl::StrSplit(stack, ';', absl::SkipWhitespace());
  if (tokens.empty()) {
    PSRES_RETURN_ERROR_LOG(PS_WHAT_INPUT_PROCESS,
                           "[INPUT] Empty stack in line: %.*s",
                           static_cast<int>(line.size()), line.data());
  }

  Sample sample;
  sample.sample_type = sample_type;
  sample.value = value;
  sample.timestamp_ns = timestamp_ns;
  sample.frames.reserve(tokens.size());
  // folded stacks are root first
  for (auto it = tokens.rbegin(); it != tokens.rend(); ++it) {
    sample.frames.push_back(parse_folded_frame(*it));
  }
  *out = std::move(sample);
  return {};
}

bool FoldedStackReader::next(Sample *sample) {
  std::string line;
  while (std::getline(_input, line)) {
    ++_nb_lines;
    PSRes const res =
        parse_folded_line(line, _sample_type, wall_clock_ns(), sample);
    if (IsPSResOK(res)) {
      return true;
    }
    if (IsPSResFatal(res)) {
      ++_nb_invalid;
      LG_DBG("[INPUT] Skipping line %zu", _nb_lines);
    }
  }
  return false;
}

} // namespace profship
