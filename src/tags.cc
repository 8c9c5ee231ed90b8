// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "tags.hpp"

#include "logger.hpp"

#include <algorithm>
#include <cctype>

namespace profship {

namespace {
constexpr size_t k_max_tag_length = 200;

bool is_tag_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' ||
      c == ':' || c == '.' || c == '/';
}

// First character is a letter, no trailing colon
bool validate_tag(std::string_view tag) {
  if (tag.empty() || tag.length() > k_max_tag_length) {
    return false;
  }
  if (!std::isalpha(static_cast<unsigned char>(tag.front()))) {
    return false;
  }
  if (tag.back() == ':') {
    return false;
  }
  return std::ranges::all_of(tag, is_tag_char);
}

Tag split_kv(std::string_view str_view, char c = ':') {
  size_t const pos = str_view.find(c);

  if (pos == std::string_view::npos || pos == str_view.size() - 1) {
    LG_WRN("[TAGS] Error, bad tag value %.*s",
           static_cast<int>(str_view.size()), str_view.data());
    return {};
  }

  return {std::string(str_view.substr(0, pos)),
          std::string(str_view.substr(pos + 1))};
}

} // namespace

void split(std::string_view str_view, Tags &tags, char c) {
  size_t begin = 0;

  while (begin < str_view.size()) {
    size_t end = str_view.find(c, begin);
    if (end == std::string_view::npos) {
      end = str_view.size();
    }

    std::string_view const tag = str_view.substr(begin, end - begin);
    begin = end + 1;

    if (!validate_tag(tag)) {
      LG_WRN("[TAGS] Bad tag value - skip %.*s", static_cast<int>(tag.size()),
             tag.data());
      continue;
    }

    Tag current_tag = split_kv(tag);
    if (current_tag == Tag()) {
      continue;
    }
    tags.push_back(std::move(current_tag));
  }
}

bool is_valid_label_key(std::string_view key) {
  if (key.empty()) {
    return false;
  }
  auto first = static_cast<unsigned char>(key.front());
  if (!std::isalpha(first) && key.front() != '_') {
    return false;
  }
  return std::ranges::all_of(key, [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
  });
}

void add_tags_to_labels(const Tags &tags, Labels &labels) {
  for (const auto &[key, value] : tags) {
    if (!is_valid_label_key(key)) {
      LG_WRN("[TAGS] Tag key %s is not a valid label name - skip", key.c_str());
      continue;
    }
    labels[key] = value;
  }
}

UserTags::UserTags(std::string_view tag_str) {
  if (!tag_str.empty()) {
    split(tag_str, _tags);
  }
}

} // namespace profship
