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
#include "sift/coll/ordered_map.hpp"
#include "sift/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <map>
#include <string>
#include <vector>

namespace sift::coll::test
{

namespace
{
using std::string;
using std::vector;
using Map = Ordered_map<int, string>;

/// Checks that `map`'s iteration, keys(), get() and contains() all agree with `expected`.
void check_matches(const Map& map, const std::map<int, string>& expected)
{
  EXPECT_EQ(map.size(), expected.size());
  EXPECT_EQ(map.empty(), expected.empty());

  vector<int> expected_keys;
  for (const auto& key_and_val : expected)
  {
    expected_keys.push_back(key_and_val.first);
    EXPECT_TRUE(map.contains(key_and_val.first));
    EXPECT_EQ(map.get(key_and_val.first), std::make_pair(key_and_val.second, true));
  }
  EXPECT_EQ(map.keys(), expected_keys);

  auto expected_it = expected.begin();
  for (const auto& entry : map)
  {
    ASSERT_NE(expected_it, expected.end());
    EXPECT_EQ(entry.first, expected_it->first);
    EXPECT_EQ(entry.second, expected_it->second);
    ++expected_it;
  }
  EXPECT_EQ(expected_it, expected.end());
}

} // Anonymous namespace

TEST(Ordered_map, Example)
{
  Map map;
  EXPECT_TRUE(map.add(5, "e"));
  EXPECT_TRUE(map.add(1, "a"));
  EXPECT_TRUE(map.add(3, "c"));
  EXPECT_EQ(map.keys(), (vector<int>{ 1, 3, 5 }));
  EXPECT_EQ(map.get(3), std::make_pair(string("c"), true));

  EXPECT_TRUE(map.remove(1));
  EXPECT_EQ(map.keys(), (vector<int>{ 3, 5 }));
  EXPECT_FALSE(map.contains(1));
  EXPECT_EQ(map.get(1), std::make_pair(string(), false));
}

TEST(Ordered_map, Empty_and_absent)
{
  Map map;
  EXPECT_TRUE(map.empty());
  EXPECT_EQ(map.size(), 0u);
  EXPECT_EQ(map.get(42), std::make_pair(string(), false));
  EXPECT_FALSE(map.contains(42));
  EXPECT_FALSE(map.remove(42));
  EXPECT_TRUE(map.keys().empty());
  EXPECT_TRUE(map.map().empty());
  EXPECT_EQ(map.begin(), map.end());
  EXPECT_EQ(map.cbegin(), map.cend());

  map.clear(); // No-op.
  EXPECT_TRUE(map.empty());

  map.add(1, "x");
  EXPECT_FALSE(map.remove(2)); // Absent key: no-op.
  EXPECT_EQ(map.size(), 1u);
}

TEST(Ordered_map, Add_vs_force_add)
{
  Map map;
  EXPECT_TRUE(map.add(7, "first"));
  EXPECT_FALSE(map.add(7, "second")); // First writer wins.
  EXPECT_EQ(map.get(7).first, "first");

  EXPECT_FALSE(map.force_add(7, "third")); // Last writer wins; but not a new key.
  EXPECT_EQ(map.get(7).first, "third");
  EXPECT_EQ(map.size(), 1u);
  EXPECT_EQ(map.keys(), vector<int>{ 7 });

  EXPECT_TRUE(map.force_add(2, "two"));
  EXPECT_EQ(map.keys(), (vector<int>{ 2, 7 }));

  // Lvalue overloads.
  const int key = 4;
  const string val("four");
  EXPECT_TRUE(map.add(key, val));
  EXPECT_FALSE(map.force_add(key, string("FOUR")));
  EXPECT_EQ(map.get(key).first, "FOUR");
  EXPECT_EQ(map.keys(), (vector<int>{ 2, 4, 7 }));
} // TEST(Ordered_map, Add_vs_force_add)

TEST(Ordered_map, Against_std_map)
{
  // A deterministic mix of add/force_add/remove, checked against std::map at each step.
  Map map;
  std::map<int, string> expected;
  unsigned int state = 12345;
  for (int step = 0; step != 500; ++step)
  {
    state = (state * 1103515245u) + 12345u;
    const int key = int((state >> 16) % 40);
    const string val = std::to_string(step);

    switch ((state >> 8) % 3)
    {
    case 0:
      EXPECT_EQ(map.add(key, val), expected.emplace(key, val).second);
      break;
    case 1:
    {
      const bool is_new = expected.count(key) == 0;
      expected[key] = val;
      EXPECT_EQ(map.force_add(key, val), is_new);
      break;
    }
    default:
      EXPECT_EQ(map.remove(key), expected.erase(key) == 1);
    }

    const auto keys = map.keys();
    for (size_t idx = 1; idx < keys.size(); ++idx)
    {
      ASSERT_LT(keys[idx - 1], keys[idx]); // Strictly increasing.
    }
    EXPECT_EQ(map.contains(key), map.get(key).second);
  }
  check_matches(map, expected);

  // Add-then-remove of a fresh key restores the size.
  const auto size_before = map.size();
  EXPECT_TRUE(map.add(1000, "k"));
  EXPECT_TRUE(map.remove(1000));
  EXPECT_EQ(map.size(), size_before);
  EXPECT_FALSE(map.contains(1000));
} // TEST(Ordered_map, Against_std_map)

TEST(Ordered_map, Initializer_list_and_iteration)
{
  const Map map{ { 5, "e" }, { 1, "a" }, { 5, "E" }, { 3, "c" } };
  check_matches(map, { { 1, "a" }, { 3, "c" }, { 5, "e" } }); // First of the 5s wins.

  // Traversal can stop early; and each begin() starts over.
  vector<int> seen_keys;
  for (const auto& entry : map)
  {
    seen_keys.push_back(entry.first);
    if (entry.first == 3)
    {
      break;
    }
  }
  EXPECT_EQ(seen_keys, (vector<int>{ 1, 3 }));

  auto it = map.begin();
  EXPECT_EQ((*it).first, 1);
  EXPECT_EQ(it->second, "a");
  ++it;
  EXPECT_EQ(it->first, 3);
  EXPECT_EQ(std::distance(map.begin(), map.end()), 3);
}

TEST(Ordered_map, Snapshots_are_independent)
{
  Map map{ { 2, "b" }, { 1, "a" } };
  auto keys = map.keys();
  auto values = map.map();
  keys.push_back(99);
  values[99] = "zz";
  values[1] = "changed";

  EXPECT_EQ(map.keys(), (vector<int>{ 1, 2 }));
  EXPECT_EQ(map.get(1).first, "a");
  EXPECT_FALSE(map.contains(99));

  map.add(3, "c");
  EXPECT_EQ(keys.size(), 3u); // Unaffected the other way around too.
  EXPECT_EQ(values.size(), 3u);
  EXPECT_EQ(map.map().size(), 3u);
}

TEST(Ordered_map, Copy_move_swap)
{
  using std::swap;

  Map map1{ { 1, "a" }, { 2, "b" } };
  Map map2(map1);
  map2.add(3, "c");
  EXPECT_EQ(map1.size(), 2u);
  EXPECT_EQ(map2.size(), 3u);

  map1 = map2;
  EXPECT_EQ(map1.keys(), (vector<int>{ 1, 2, 3 }));
  map1.remove(2);
  EXPECT_TRUE(map2.contains(2));

  Map map3(std::move(map2));
  EXPECT_TRUE(map2.empty());
  EXPECT_TRUE(map2.keys().empty());
  EXPECT_EQ(map3.keys(), (vector<int>{ 1, 2, 3 }));

  map2 = std::move(map3);
  EXPECT_TRUE(map3.empty());
  EXPECT_EQ(map2.size(), 3u);

  swap(map1, map2);
  EXPECT_EQ(map1.keys(), (vector<int>{ 1, 2, 3 }));
  EXPECT_EQ(map2.keys(), (vector<int>{ 1, 3 }));
  EXPECT_EQ(map2.get(3).first, "c");
} // TEST(Ordered_map, Copy_move_swap)

TEST(Ordered_map, Custom_order_and_hint)
{
  Ordered_map<string, int, std::greater<string>> map(nullptr, 100);
  map.add("b", 2);
  map.add("c", 3);
  map.add("a", 1);
  EXPECT_EQ(map.keys(), (vector<string>{ "c", "b", "a" }));
  EXPECT_GE(map.map().bucket_count(), 3u);
  EXPECT_TRUE(map.contains("b"));
  EXPECT_TRUE(map.remove("c"));
  EXPECT_EQ(map.keys(), (vector<string>{ "b", "a" }));
}

TEST(Ordered_map, Logging)
{
  sift::test::Test_logger logger(log::Sev::S_TRACE);
  Map map(&logger);
  map.add(5, "e");
  map.add(1, "a");
  map.remove(5);
  map.clear();

  const auto out = logger.output();
  EXPECT_NE(out.find(": SIFT-COLL: "), string::npos) << out;
  EXPECT_NE(out.find("inserted key at position [0]; size now [1]"), string::npos) << out;
  EXPECT_NE(out.find("inserted key at position [0]; size now [2]"), string::npos) << out;
  EXPECT_NE(out.find("removed key at position [1]; size now [1]"), string::npos) << out;
  EXPECT_NE(out.find("clearing [1] keys"), string::npos) << out;

  // Filtered out at the default severity.
  sift::test::Test_logger quiet_logger(log::Sev::S_INFO);
  Map map2(&quiet_logger);
  map2.add(1, "a");
  EXPECT_TRUE(quiet_logger.output().empty());
}

} // namespace sift::coll::test
