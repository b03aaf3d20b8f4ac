/* Sift
 * Copyright 2026 The Sift Authors
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#include "sift/coll/seen_set.hpp"
#include "sift/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <list>
#include <string>
#include <vector>

namespace sift::coll::test
{

namespace
{
using std::string;
using std::vector;

/// Hashes only the length: lots of collisions, which must not matter.
struct Length_hash
{
  size_t operator()(const string& str) const
  {
    return str.size();
  }
};

} // Anonymous namespace

TEST(Seen_set, Example)
{
  Seen_set<string> seen;
  EXPECT_TRUE(seen.see("a"));
  EXPECT_TRUE(seen.see("b"));
  EXPECT_FALSE(seen.see("a"));

  const vector<string> vals{ "a", "b", "c", "a" };
  EXPECT_EQ(seen.filter_seen(vals), (vector<string>{ "a", "b" }));
  EXPECT_EQ(seen.filter_not_seen(vals), vector<string>{ "c" });
}

TEST(Seen_set, See_once_until_clear)
{
  Seen_set<int> seen;
  EXPECT_TRUE(seen.empty());
  EXPECT_FALSE(seen.has(1));
  EXPECT_TRUE(seen.filter_seen(vector<int>{ 1, 2 }).empty());
  EXPECT_EQ(seen.filter_not_seen(vector<int>{ 2, 1, 2 }), (vector<int>{ 2, 1 }));

  for (int round = 0; round != 2; ++round)
  {
    for (int val = 0; val != 10; ++val)
    {
      EXPECT_TRUE(seen.see(val));
      EXPECT_FALSE(seen.see(val));
      EXPECT_TRUE(seen.has(val));
    }
    EXPECT_EQ(seen.size(), 10u);

    seen.set_seen(3); // Already seen: no change.
    seen.set_seen(42);
    EXPECT_TRUE(seen.has(42));
    EXPECT_EQ(seen.size(), 11u);

    seen.clear();
    EXPECT_TRUE(seen.empty());
    EXPECT_FALSE(seen.has(3));
  }
} // TEST(Seen_set, See_once_until_clear)

TEST(Seen_set, Filters_partition_the_distinct_input)
{
  Seen_set<int> seen(nullptr, 64);
  for (int val = 0; val < 20; val += 3)
  {
    seen.see(val);
  }

  const std::list<int> vals{ 5, 3, 0, 5, 7, 3, 18, 19, 0, 1 };
  const auto seen_vals = seen.filter_seen(vals.begin(), vals.end());
  const auto not_seen_vals = seen.filter_not_seen(vals.begin(), vals.end());
  EXPECT_EQ(seen_vals, (vector<int>{ 3, 0, 18 }));
  EXPECT_EQ(not_seen_vals, (vector<int>{ 5, 7, 19, 1 }));

  // Together: exactly the distinct input values.
  auto all = seen_vals;
  all.insert(all.end(), not_seen_vals.begin(), not_seen_vals.end());
  std::sort(all.begin(), all.end());
  vector<int> distinct(vals.begin(), vals.end());
  std::sort(distinct.begin(), distinct.end());
  distinct.erase(std::unique(distinct.begin(), distinct.end()), distinct.end());
  EXPECT_EQ(all, distinct);

  // Filtering does not mark anything.
  EXPECT_FALSE(seen.has(5));
}

TEST(Seen_set, Custom_hash_copy_move)
{
  using std::swap;
  using Set_t = Seen_set<string, Length_hash>;

  Set_t seen1;
  EXPECT_TRUE(seen1.see("ab"));
  EXPECT_TRUE(seen1.see("cd")); // Same hash, different value.
  EXPECT_FALSE(seen1.see("ab"));
  EXPECT_EQ(seen1.size(), 2u);

  Set_t seen2(seen1);
  seen2.see("xyz");
  EXPECT_FALSE(seen1.has("xyz"));

  Set_t seen3(std::move(seen2));
  EXPECT_TRUE(seen2.empty());
  EXPECT_TRUE(seen3.has("xyz"));

  swap(seen1, seen3);
  EXPECT_EQ(seen1.size(), 3u);
  EXPECT_EQ(seen3.size(), 2u);

  seen3 = std::move(seen1);
  EXPECT_TRUE(seen1.empty());
  EXPECT_EQ(seen3.size(), 3u);
}

TEST(Seen_set, Logging)
{
  sift::test::Test_logger logger(log::Sev::S_TRACE);
  Seen_set<string> seen(&logger);
  seen.see("secret-value");
  seen.see("secret-value");
  seen.filter_not_seen(vector<string>{ "other-secret" });

  const auto out = logger.output();
  EXPECT_NE(out.find("marked new value; size now [1]"), string::npos) << out;
  EXPECT_NE(out.find("filtered for not-seen values; result size [1]"), string::npos) << out;
  EXPECT_EQ(out.find("secret"), string::npos) << out; // Values themselves are never logged.
}

} // namespace sift::coll::test
