// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace profship {

using Tag = std::pair<std::string, std::string>;
using Tags = std::vector<Tag>;

// Labels attached to an upload, sorted by key
using Labels = std::map<std::string, std::string>;

/// Parses "key1:value1,key2:value2". Invalid tags are logged and skipped.
void split(std::string_view str_view, Tags &tags, char c = ',');

/// Label keys are restricted to [a-zA-Z_][a-zA-Z0-9_.]*
bool is_valid_label_key(std::string_view key);

/// Adds tags to labels, the last value wins on duplicated keys.
/// Tags whose key is not a valid label key are dropped.
void add_tags_to_labels(const Tags &tags, Labels &labels);

struct UserTags {
  explicit UserTags(std::string_view tag_str);
  Tags _tags;
};

} // namespace profship
