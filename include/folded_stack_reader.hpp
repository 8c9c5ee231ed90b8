// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "psres_def.hpp"
#include "sample.hpp"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string_view>

namespace profship {

/// Parses one folded stack line: "root;caller;leaf <value>".
/// A frame can carry its location: "func (file.c:12)".
/// Frames come out leaf first. Warning result on blank or comment lines,
/// error on malformed lines.
PSRes parse_folded_line(std::string_view line, int32_t sample_type,
                        int64_t timestamp_ns, Sample *out);

Frame parse_folded_frame(std::string_view token);

class FoldedStackReader {
public:
  FoldedStackReader(std::istream &input, int32_t sample_type)
      : _input(input), _sample_type(sample_type) {}

  /// false once the input is exhausted. Malformed lines are logged and
  /// skipped.
  bool next(Sample *sample);

  [[nodiscard]] size_t nb_lines() const { return _nb_lines; }
  [[nodiscard]] size_t nb_invalid() const { return _nb_invalid; }

private:
  std::istream &_input;
  int32_t _sample_type;
  size_t _nb_lines{0};
  size_t _nb_invalid{0};
};

} // namespace profship
