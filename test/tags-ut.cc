// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "tags.hpp"

#include "loghandle.hpp"

#include <gtest/gtest.h>

namespace profship {

TEST(Tags, simple) {
  const char *tag_input = "mister:sanchez";
  Tags tags;
  split(tag_input, tags);
  EXPECT_EQ(tags.size(), 1);
  EXPECT_EQ(tags[0].first, "mister");
  EXPECT_EQ(tags[0].second, "sanchez");
}

TEST(Tags, bad) {
  Tags tags;
  LogHandle handle;
  {
    const char *tag_input = "something:%q!@#";
    split(tag_input, tags);
    EXPECT_EQ(tags.size(), 0);
  }
  {
    const char *tag_input = "empty:";
    split(tag_input, tags);
    EXPECT_EQ(tags.size(), 0);
  }
  {
    const char *tag_input = "novalue";
    split(tag_input, tags);
    EXPECT_EQ(tags.size(), 0);
  }
  {
    const char *tag_input = "1starts:withdigit";
    split(tag_input, tags);
    EXPECT_EQ(tags.size(), 0);
  }
}

TEST(Tags, more_tags) {
  const char *tag_input = "mister:sanchez,mister:anderson,i:have,no:"
                          "imagination,for:test,values:haha";
  Tags tags;
  split(tag_input, tags);
  EXPECT_EQ(tags.size(), 6);
  EXPECT_EQ(tags[0].first, "mister");
  EXPECT_EQ(tags[0].second, "sanchez");
  EXPECT_EQ(tags[1].first, "mister");
  EXPECT_EQ(tags[1].second, "anderson");
}

TEST(Tags, skip_bad_keep_good) {
  LogHandle handle;
  Tags tags;
  split("region:us-east-1,,bad!:tag,version:1.2", tags);
  ASSERT_EQ(tags.size(), 2);
  EXPECT_EQ(tags[0], Tag("region", "us-east-1"));
  EXPECT_EQ(tags[1], Tag("version", "1.2"));
}

TEST(Tags, user_tags) {
  LogHandle handle;
  UserTags const user_tags("team:profiling,zone:b");
  ASSERT_EQ(user_tags._tags.size(), 2);
  EXPECT_EQ(user_tags._tags[1].first, "zone");

  UserTags const empty_tags("");
  EXPECT_TRUE(empty_tags._tags.empty());
}

TEST(Tags, label_keys) {
  EXPECT_TRUE(is_valid_label_key("service"));
  EXPECT_TRUE(is_valid_label_key("_private"));
  EXPECT_TRUE(is_valid_label_key("k8s.pod_name"));
  EXPECT_FALSE(is_valid_label_key(""));
  EXPECT_FALSE(is_valid_label_key("9lives"));
  EXPECT_FALSE(is_valid_label_key("with-dash"));
  EXPECT_FALSE(is_valid_label_key("with/slash"));
}

TEST(Tags, add_to_labels) {
  LogHandle handle;
  Tags const tags{{"zone", "a"}, {"bad-key", "x"}, {"team", "t"},
                  {"zone", "b"}};
  Labels labels{{"service", "svc"}};
  add_tags_to_labels(tags, labels);
  EXPECT_EQ(labels.size(), 3);
  EXPECT_EQ(labels["service"], "svc");
  EXPECT_EQ(labels["team"], "t");
  // last value wins
  EXPECT_EQ(labels["zone"], "b");
  EXPECT_EQ(labels.count("bad-key"), 0);
}

} // namespace profship
