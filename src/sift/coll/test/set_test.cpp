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
#include "sift/coll/equality_set.hpp"
#include "sift/coll/ordered_map.hpp"
#include "sift/coll/seen_set.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace sift::coll::test
{

namespace
{

/// Equality-only element type for the Equality_set member of the mix.
struct Tag
{
  int m_id;

  bool equals(const Tag& other) const
  {
    return m_id == other.m_id;
  }
};

} // Anonymous namespace

TEST(Set, Polymorphic_use)
{
  Ordered_map<int, std::string> map;
  Equality_set<Tag> tags;
  Seen_set<std::string> seen;

  const std::vector<Set*> sets{ &map, &tags, &seen };
  for (const auto set : sets)
  {
    EXPECT_TRUE(set->empty());
    EXPECT_EQ(set->size(), 0u);
    set->clear(); // No-op on empty.
    EXPECT_TRUE(set->empty());
  }

  map.add(1, "a");
  map.add(2, "b");
  tags.add(Tag{ 7 });
  seen.see("x");
  seen.see("y");
  seen.see("z");

  const std::vector<size_t> expected_sizes{ 2, 1, 3 };
  for (size_t idx = 0; idx != sets.size(); ++idx)
  {
    EXPECT_FALSE(sets[idx]->empty());
    EXPECT_EQ(sets[idx]->size(), expected_sizes[idx]);
    sets[idx]->clear();
    EXPECT_TRUE(sets[idx]->empty());
    EXPECT_EQ(sets[idx]->size(), 0u);
  }

  // Still usable after a reset through the interface.
  EXPECT_TRUE(map.add(1, "again"));
  EXPECT_EQ(map.keys(), std::vector<int>{ 1 });
  EXPECT_TRUE(seen.see("x"));
} // TEST(Set, Polymorphic_use)

} // namespace sift::coll::test
