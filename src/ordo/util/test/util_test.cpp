/* Ordo
 * Copyright 2023 Akamai Technologies, Inc.
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

#include "ordo/util/util.hpp"
#include "ordo/util/string_ostream.hpp"
#include "ordo/col/col_fwd.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <string>

namespace ordo::util::test
{

namespace
{
using std::string;

enum class Color
{
  S_RED = 0,
  S_GREEN,
  S_DARK_BLUE,
  S_END_SENTINEL
};

std::ostream& operator<<(std::ostream& os, Color val)
{
  switch (val)
  {
  case Color::S_RED: return os << "RED";
  case Color::S_GREEN: return os << "GREEN";
  case Color::S_DARK_BLUE: return os << "DARK_BLUE";
  case Color::S_END_SENTINEL: break;
  }
  return os << "?";
}

Color parse_color(const string& str, bool accept_num = true, bool case_sensitive = false)
{
  std::istringstream is(str);
  return istream_to_enum(&is, Color::S_END_SENTINEL, Color::S_END_SENTINEL, accept_num, case_sensitive);
}

} // Anonymous namespace

TEST(Util, Ostream_op_string)
{
  EXPECT_EQ(ostream_op_string("a", 1, ':', 2.5), "a1:2.5");
  string str = "x=";
  ostream_op_to_string(&str, 7, '/', "y");
  EXPECT_EQ(str, "x=7/y");
}

TEST(Util, Istream_to_enum)
{
  EXPECT_EQ(parse_color("green"), Color::S_GREEN);
  EXPECT_EQ(parse_color("DARK_blue"), Color::S_DARK_BLUE);
  EXPECT_EQ(parse_color("2"), Color::S_DARK_BLUE);
  EXPECT_EQ(parse_color("3"), Color::S_END_SENTINEL); // Out of range.
  EXPECT_EQ(parse_color("2", false), Color::S_END_SENTINEL);
  EXPECT_EQ(parse_color("green", true, true), Color::S_END_SENTINEL);
  EXPECT_EQ(parse_color("GREEN", true, true), Color::S_GREEN);
  EXPECT_EQ(parse_color(""), Color::S_END_SENTINEL);

  // Stops at the first character not in [A-Za-z0-9_].
  std::istringstream is("red,rest");
  EXPECT_EQ(istream_to_enum(&is, Color::S_END_SENTINEL, Color::S_END_SENTINEL), Color::S_RED);
  EXPECT_EQ(is.get(), ',');
}

TEST(Util, Where_am_i)
{
  const string where = ORDO_UTIL_WHERE_AM_I_STR();
  EXPECT_EQ(where.find("util_test.cpp:"), 0u) << where;
  EXPECT_NE(where.find('('), string::npos) << where;
  std::ostringstream os;
  os << ORDO_UTIL_WHERE_AM_I();
  EXPECT_EQ(os.str().find("util_test.cpp:"), 0u) << os.str();

  static_assert(get_last_path_segment("/a/b/c.cpp") == "c.cpp");
  static_assert(get_last_path_segment("c.cpp") == "c.cpp");
  static_assert(get_last_path_segment("a/") == "");
}

TEST(String_ostream, Interface)
{
  String_ostream os;
  EXPECT_EQ(os.str(), "");
  os.os() << "abc" << 12;
  EXPECT_EQ(os.str(), "abc12");
  os.str_clear();
  EXPECT_EQ(os.str(), "");
  os.os() << col::Backend::S_ARRAY;
  EXPECT_EQ(os.str(), "ARRAY");

  string target = "pre-";
  {
    String_ostream os2(&target);
    os2.os() << "post";
    EXPECT_EQ(os2.str(), "pre-post");
  }
  EXPECT_EQ(target, "pre-post");
}

} // namespace ordo::util::test
