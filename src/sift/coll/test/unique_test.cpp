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
#include "sift/coll/unique.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <forward_list>
#include <string>
#include <vector>

namespace sift::coll::test
{

namespace
{
using std::string;
using std::vector;

/// Returns `true` if and only if no two elements of `vals` are equal.
template<typename T>
bool all_distinct(const vector<T>& vals)
{
  for (size_t idx1 = 0; idx1 != vals.size(); ++idx1)
  {
    for (size_t idx2 = idx1 + 1; idx2 != vals.size(); ++idx2)
    {
      if (vals[idx1] == vals[idx2])
      {
        return false;
      }
    }
  }
  return true;
}

} // Anonymous namespace

TEST(Unique_stable, Basics)
{
  vector<int> vals{ 3, 1, 3, 2, 1, 1 };
  unique_in_place(&vals);
  EXPECT_EQ(vals, (vector<int>{ 3, 1, 2 }));

  vector<int> empty_vals;
  unique_in_place(&empty_vals);
  EXPECT_TRUE(empty_vals.empty());

  vector<int> one{ 7 };
  unique_in_place(&one);
  EXPECT_EQ(one, vector<int>{ 7 });

  vector<int> same{ 4, 4, 4, 4 };
  unique_in_place(&same);
  EXPECT_EQ(same, vector<int>{ 4 });

  vector<int> distinct{ 5, 4, 3, 2, 1 };
  unique_in_place(&distinct);
  EXPECT_EQ(distinct, (vector<int>{ 5, 4, 3, 2, 1 }));

  vector<string> strs{ "b", "a", "b", "c", "a" };
  const auto new_end = unique_stable(strs.begin(), strs.end());
  EXPECT_EQ(new_end - strs.begin(), 3);
  strs.erase(new_end, strs.end());
  EXPECT_EQ(strs, (vector<string>{ "b", "a", "c" }));
} // TEST(Unique_stable, Basics)

TEST(Unique_stable, Custom_equality_and_forward_iterators)
{
  vector<string> strs{ "Abc", "xyz", "aBC", "XYZ", "q" };
  unique_in_place(&strs, [](const string& lhs, const string& rhs) { return boost::algorithm::iequals(lhs, rhs); });
  EXPECT_EQ(strs, (vector<string>{ "Abc", "xyz", "q" }));

  // A forward_list has no erase(); so compact, then cut the tail after the last kept node.
  std::forward_list<int> list{ 2, 2, 1, 2, 3, 1 };
  const auto new_end = unique_stable(list.begin(), list.end());
  auto last_kept = list.before_begin();
  for (auto it = list.begin(); it != new_end; ++it)
  {
    ++last_kept;
  }
  list.erase_after(last_kept, list.end());
  EXPECT_EQ(vector<int>(list.begin(), list.end()), (vector<int>{ 2, 1, 3 }));
}

TEST(Unique_stable, Properties)
{
  // A deterministic assortment of inputs with many repeats.
  for (int seed = 1; seed != 50; ++seed)
  {
    vector<int> vals;
    unsigned int state = seed;
    for (int idx = 0; idx != seed; ++idx)
    {
      state = (state * 1103515245u) + 12345u;
      vals.push_back(int((state >> 16) % 7));
    }

    auto result = vals;
    unique_in_place(&result);

    EXPECT_TRUE(all_distinct(result));

    // First-occurrence order: walk the input, keeping each value the first time it appears.
    vector<int> expected;
    for (const int val : vals)
    {
      if (std::find(expected.begin(), expected.end(), val) == expected.end())
      {
        expected.push_back(val);
      }
    }
    EXPECT_EQ(result, expected);

    // Idempotent.
    auto again = result;
    unique_in_place(&again);
    EXPECT_EQ(again, result);
  }
} // TEST(Unique_stable, Properties)

} // namespace sift::coll::test
