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
#include "sift/util/util.hpp"
#include "sift/util/string_ostream.hpp"
#include "sift/util/detail/util.hpp"
#include "sift/log/log.hpp"
#include <gtest/gtest.h>
#include <iomanip>
#include <memory>
#include <sstream>

namespace sift::util::test
{

namespace
{
using std::string;
} // Anonymous namespace

TEST(Util_scoped_setter, Interface)
{
  string str;
  int num = 0;
  {
    Scoped_setter<string> set{&str, "abc"};
    Scoped_setter<int> set2{&num, 10};
    EXPECT_EQ(str, "abc");
    EXPECT_EQ(num, 10);
    {
      // Move-construct out of a heap copy, then destroy the moved-from one: that must restore nothing.
      auto set2_ptr = std::make_unique<Scoped_setter<int>>(&num, 5);
      Scoped_setter<int> set2_a{std::move(*set2_ptr)};
      EXPECT_EQ(num, 5);
      set2_ptr.reset();
      EXPECT_EQ(num, 5);

      Scoped_setter<string> set_a{&str, "def"};
      EXPECT_EQ(str, "def");
    }
    EXPECT_EQ(str, "abc");
    EXPECT_EQ(num, 10);
  }
  EXPECT_TRUE(str.empty());
  EXPECT_EQ(num, 0);
} // TEST(Util_scoped_setter, Interface)

TEST(Util_misc, Interface)
{
  EXPECT_EQ(ostream_op_string("abc[", 2, "] flag[", true, "]:", std::hex, 12),
            "abc[2] flag[1]:c");

  string out;
  ostream_op_to_string(&out, "x=", 1);
  ostream_op_to_string(&out, ";y=", 2); // Appends.
  EXPECT_EQ(out, "x=1;y=2");

  static_assert(get_last_path_segment("/a/b/c.cpp") == "c.cpp");
  static_assert(get_last_path_segment("c.cpp") == "c.cpp");
  EXPECT_EQ(get_last_path_segment("dir/"), "");

  const string where(SIFT_UTIL_WHERE_AM_I_STR());
  EXPECT_EQ(where.find("util_test.cpp:TestBody("), 0u) << where;
} // TEST(Util_misc, Interface)

TEST(Util_istream_to_enum, Interface)
{
  using log::Sev;

  const auto parse = [](const string& str, bool accept_num_encoding, bool case_sensitive)
  {
    std::istringstream is(str);
    return istream_to_enum(&is, Sev::S_NONE, Sev::S_END_SENTINEL, accept_num_encoding, case_sensitive);
  };

  EXPECT_EQ(parse("WARNING", true, false), Sev::S_WARNING);
  EXPECT_EQ(parse("warning", true, false), Sev::S_WARNING);
  EXPECT_EQ(parse("warning", true, true), Sev::S_NONE);
  EXPECT_EQ(parse("5", true, false), Sev::S_DEBUG);
  EXPECT_EQ(parse("5", false, false), Sev::S_NONE);
  EXPECT_EQ(parse("99", true, false), Sev::S_NONE); // Out of range.
  EXPECT_EQ(parse("", true, false), Sev::S_NONE);

  // Stops at the first character that cannot be part of a token.
  std::istringstream is("TRACE;rest");
  EXPECT_EQ(istream_to_enum(&is, Sev::S_NONE, Sev::S_END_SENTINEL), Sev::S_TRACE);
  EXPECT_EQ(char(is.peek()), ';');
} // TEST(Util_istream_to_enum, Interface)

TEST(String_ostream, Interface)
{
  String_ostream os;
  os.os() << "abc" << 1;
  os.os().flush();
  EXPECT_EQ(os.str(), "abc1");
  os.os() << 'd';
  os.os().flush();
  EXPECT_EQ(os.str(), "abc1d");
  os.str_clear();
  EXPECT_TRUE(os.str().empty());

  string target("pre-");
  String_ostream os2(&target);
  os2.os() << "post";
  os2.os().flush();
  EXPECT_EQ(target, "pre-post");
  EXPECT_EQ(&os2.str(), &target);
} // TEST(String_ostream, Interface)

} // namespace sift::util::test
