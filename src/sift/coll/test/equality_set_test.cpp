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
#include "sift/test/test_logger.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <gtest/gtest.h>
#include <iterator>
#include <list>
#include <string>
#include <vector>

namespace sift::coll::test
{

namespace
{
using std::string;
using std::vector;

/// A type comparable only via equals(): no hashing, no ordering, no `operator==`.
class Point
{
public:
  Point(int x, int y) : m_x(x), m_y(y) {}

  bool equals(const Point& other) const
  {
    return (m_x == other.m_x) && (m_y == other.m_y);
  }

  int x() const { return m_x; }

private:
  int m_x;
  int m_y;
};

using Point_set = Equality_set<Point>;

/// Returns `true` if and only if no two elements of `set` are equal under equals().
bool pairwise_distinct(const Point_set& set)
{
  for (auto it1 = set.begin(); it1 != set.end(); ++it1)
  {
    for (auto it2 = std::next(it1); it2 != set.end(); ++it2)
    {
      if (it1->equals(*it2))
      {
        return false;
      }
    }
  }
  return true;
}

/// Case-insensitive string equality.
struct Iequals
{
  bool operator()(const string& lhs, const string& rhs) const
  {
    return boost::algorithm::iequals(lhs, rhs);
  }
};

} // Anonymous namespace

TEST(Equality_set, Add)
{
  Point_set set;
  EXPECT_TRUE(set.empty());
  EXPECT_EQ(set.begin(), set.end());
  EXPECT_FALSE(set.contains(Point(0, 0)));

  EXPECT_TRUE(set.add(Point(1, 2)));
  EXPECT_FALSE(set.add(Point(1, 2)));
  const Point pt(3, 4);
  EXPECT_TRUE(set.add(pt));
  EXPECT_FALSE(set.add(pt));
  EXPECT_EQ(set.size(), 2u);
  EXPECT_TRUE(set.contains(Point(3, 4)));
  EXPECT_FALSE(set.contains(Point(4, 3)));

  // Insertion order.
  vector<int> xs;
  for (const auto& elem : set)
  {
    xs.push_back(elem.x());
  }
  EXPECT_EQ(xs, (vector<int>{ 1, 3 }));

  set.clear();
  EXPECT_TRUE(set.empty());
  EXPECT_TRUE(set.add(Point(1, 2)));
} // TEST(Equality_set, Add)

TEST(Equality_set, Add_many)
{
  Point_set set;
  EXPECT_EQ(set.add_many({ Point(1, 1), Point(2, 2), Point(1, 1), Point(3, 3) }), 3u); // In-input dup filtered.
  EXPECT_EQ(set.size(), 3u);

  const vector<Point> more{ Point(3, 3), Point(4, 4), Point(4, 4) };
  EXPECT_EQ(set.add_many(more), 1u);

  const std::list<Point> list{ Point(5, 5), Point(1, 1) };
  EXPECT_EQ(set.add_many(list.begin(), list.end()), 1u);
  EXPECT_EQ(set.size(), 5u);
  EXPECT_TRUE(pairwise_distinct(set));

  EXPECT_EQ(set.add_many(vector<Point>()), 0u);
}

TEST(Equality_set, Unite)
{
  Point_set set1;
  set1.add_many({ Point(1, 1), Point(2, 2) });
  Point_set set2;
  set2.add_many({ Point(2, 2), Point(3, 3), Point(4, 4) });

  EXPECT_EQ(set1.unite(set2), 2u);
  EXPECT_EQ(set1.size(), 4u);
  EXPECT_EQ(set1.unite(set2), 0u); // Repeat: nothing new.
  EXPECT_EQ(set1.unite(set1), 0u); // Self.
  EXPECT_EQ(set1.size(), 4u);
  EXPECT_TRUE(pairwise_distinct(set1));

  EXPECT_EQ(set2.size(), 3u); // Untouched.
  Point_set empty_set;
  EXPECT_EQ(set2.unite(empty_set), 0u);
  EXPECT_EQ(empty_set.unite(set2), 3u);
}

TEST(Equality_set, Custom_equality_copy_move)
{
  using std::swap;
  using String_set = Equality_set<string, Iequals>;

  String_set set1;
  EXPECT_TRUE(set1.add("Hello"));
  EXPECT_FALSE(set1.add("HELLO"));
  EXPECT_TRUE(set1.add("world"));
  EXPECT_EQ(*set1.begin(), "Hello"); // The first one is kept.

  String_set set2(set1);
  set2.add("extra");
  EXPECT_EQ(set1.size(), 2u);
  EXPECT_EQ(set2.size(), 3u);

  String_set set3(std::move(set2));
  EXPECT_TRUE(set2.empty());
  EXPECT_EQ(set3.size(), 3u);

  swap(set1, set3);
  EXPECT_EQ(set1.size(), 3u);
  EXPECT_EQ(set3.size(), 2u);

  set3 = std::move(set1);
  EXPECT_TRUE(set1.empty());
  EXPECT_TRUE(set3.contains("EXTRA"));
}

TEST(Equality_set, Logging)
{
  sift::test::Test_logger logger(log::Sev::S_TRACE);
  Point_set set(&logger);
  set.add(Point(1, 1));
  set.add(Point(1, 1));
  Point_set other;
  other.add(Point(2, 2));
  set.unite(other);

  const auto out = logger.output();
  EXPECT_NE(out.find("appended element; size now [1]"), string::npos) << out;
  EXPECT_NE(out.find("appended element; size now [2]"), string::npos) << out;
  EXPECT_NE(out.find("added [1]; size now [2]"), string::npos) << out;
}

} // namespace sift::coll::test
