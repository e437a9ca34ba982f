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

#include "ordo/col/linked_hash_map.hpp"
#include "ordo/util/util.hpp"
#include <boost/algorithm/string.hpp>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace ordo::col::test
{

namespace
{
using std::string;
using std::vector;
using Str_map = Linked_hash_map<string, int>;

/// Case-insensitive hash and equality, to check the custom functor plumbing.
struct Ci_hash
{
  size_t operator()(const string& str) const
  {
    return boost::hash<string>()(boost::algorithm::to_lower_copy(str));
  }
};

struct Ci_equal
{
  bool operator()(const string& lhs, const string& rhs) const
  {
    return boost::algorithm::iequals(lhs, rhs);
  }
};

/// Checks that keys(), values(), each() agree with `exp_keys`, and that first()/last() are its ends.
void check_order(const Str_map& map, const vector<string>& exp_keys, const string& ctx)
{
  ASSERT_EQ(map.keys(), exp_keys) << ctx;
  ASSERT_EQ(map.size(), exp_keys.size()) << ctx;

  const auto values = map.values();
  vector<string> visited;
  size_t idx = 0;
  map.each([&](const string& key, const int& value)
  {
    visited.push_back(key);
    EXPECT_EQ(value, values[idx++]) << ctx;
  });
  EXPECT_EQ(visited, exp_keys) << ctx;

  string key;
  int value = -1;
  if (exp_keys.empty())
  {
    EXPECT_FALSE(map.first(&key, &value)) << ctx;
    EXPECT_EQ(key, "") << ctx;
    EXPECT_EQ(value, 0) << ctx;
    EXPECT_FALSE(map.last(&key, &value)) << ctx;
    return;
  }
  // else

  EXPECT_TRUE(map.first(&key, &value)) << ctx;
  EXPECT_EQ(key, exp_keys.front()) << ctx;
  EXPECT_EQ(value, values.front()) << ctx;
  EXPECT_TRUE(map.last(&key, &value)) << ctx;
  EXPECT_EQ(key, exp_keys.back()) << ctx;
  EXPECT_EQ(value, values.back()) << ctx;
}

} // Anonymous namespace

// Yes... this is very cheesy... but this is a test, so I don't really care.
#define CTX util::ostream_op_string("Caller context [", ORDO_UTIL_WHERE_AM_I_STR(), "].")

TEST(Linked_hash_map, Insertion_order_and_update)
{
  Str_map map;
  check_order(map, {}, CTX);

  map.put("a", 1).put("b", 2).put("c", 3);
  check_order(map, {"a", "b", "c"}, CTX);

  map.put("b", 99); // Update in place: position kept.
  check_order(map, {"a", "b", "c"}, CTX);
  int value = 0;
  EXPECT_TRUE(map.get("b", &value));
  EXPECT_EQ(value, 99);
  EXPECT_EQ(map.values(), (vector<int>{1, 99, 3}));
}

TEST(Linked_hash_map, Del_keeps_rest_of_order)
{
  Str_map map{{"a", 1}, {"b", 2}, {"c", 3}};
  EXPECT_TRUE(map.del("b"));
  check_order(map, {"a", "c"}, CTX);
  EXPECT_EQ(map.size(), 2u);

  // Remove the ends too.
  EXPECT_TRUE(map.del("a"));
  check_order(map, {"c"}, CTX);
  EXPECT_TRUE(map.del("c"));
  check_order(map, {}, CTX);
  EXPECT_TRUE(map.empty());

  // Slots freed above get reused; order must still be insertion order.
  map.put("x", 1).put("y", 2).put("z", 3).put("w", 4);
  check_order(map, {"x", "y", "z", "w"}, CTX);
  map.del("y");
  map.put("v", 5);
  check_order(map, {"x", "z", "w", "v"}, CTX);
}

TEST(Linked_hash_map, Move_to_end_and_front)
{
  Str_map map{{"a", 1}, {"b", 2}, {"c", 3}};

  EXPECT_TRUE(map.move_to_end("a"));
  check_order(map, {"b", "c", "a"}, CTX);
  EXPECT_TRUE(map.move_to_front("c"));
  check_order(map, {"c", "b", "a"}, CTX);

  // Already at that extreme: no-op returning true.
  EXPECT_TRUE(map.move_to_end("a"));
  check_order(map, {"c", "b", "a"}, CTX);
  EXPECT_TRUE(map.move_to_front("c"));
  check_order(map, {"c", "b", "a"}, CTX);

  // The moved key's current value follows it.
  map.put("b", 42);
  EXPECT_TRUE(map.move_to_end("b"));
  string key;
  int value = 0;
  EXPECT_TRUE(map.last(&key, &value));
  EXPECT_EQ(key, "b");
  EXPECT_EQ(value, 42);
  EXPECT_TRUE(map.move_to_front("b"));
  EXPECT_TRUE(map.first(&key, &value));
  EXPECT_EQ(key, "b");
  EXPECT_EQ(value, 42);
  check_order(map, {"b", "c", "a"}, CTX);
}

TEST(Linked_hash_map, Move_missing_key)
{
  Str_map map{{"a", 1}, {"b", 2}, {"c", 3}};
  EXPECT_FALSE(map.move_to_end("missing"));
  EXPECT_FALSE(map.move_to_front("missing"));
  check_order(map, {"a", "b", "c"}, CTX);
  EXPECT_FALSE(map.contains("missing"));

  Str_map empty_map;
  EXPECT_FALSE(empty_map.move_to_end("a"));
  check_order(empty_map, {}, CTX);
}

TEST(Linked_hash_map, Single_entry_moves)
{
  Str_map map;
  map.put("only", 1);
  EXPECT_TRUE(map.move_to_end("only"));
  EXPECT_TRUE(map.move_to_front("only"));
  check_order(map, {"only"}, CTX);
  EXPECT_TRUE(map.del("only"));
  check_order(map, {}, CTX);
}

TEST(Linked_hash_map, Reorderable_through_map_interface)
{
  Str_map map{{"a", 1}, {"b", 2}};
  Map<string, int>& base = map;
  auto* const reorderable = base.reorderable();
  ASSERT_NE(reorderable, nullptr);
  EXPECT_TRUE(reorderable->move_to_end("a"));
  check_order(map, {"b", "a"}, CTX);
  EXPECT_EQ(base.to_string(), "map[b:2 a:1]");
}

TEST(Linked_hash_map, Initializer_list_duplicates)
{
  // A repeated key keeps its first position and its last value.
  const Str_map map{{"p", 1}, {"q", 2}, {"p", 3}};
  check_order(map, {"p", "q"}, CTX);
  EXPECT_EQ(map.values(), (vector<int>{3, 2}));
}

TEST(Linked_hash_map, Copy_move_swap_clear)
{
  using std::swap; // ADL-swap.

  Str_map map{{"a", 1}, {"b", 2}, {"c", 3}};
  map.move_to_front("c");

  Str_map copy(map);
  check_order(copy, {"c", "a", "b"}, CTX);
  copy.del("a");
  check_order(map, {"c", "a", "b"}, CTX);

  Str_map moved(std::move(copy));
  check_order(moved, {"c", "b"}, CTX);
  check_order(copy, {}, CTX); // Moved-from: empty.

  swap(moved, map);
  check_order(moved, {"c", "a", "b"}, CTX);
  check_order(map, {"c", "b"}, CTX);

  map = std::move(moved);
  check_order(map, {"c", "a", "b"}, CTX);

  // Moved-from and cleared maps are fully usable.
  moved.put("n", 1);
  check_order(moved, {"n"}, CTX);
  map.clear();
  check_order(map, {}, CTX);
  map.put("b", 1).put("a", 2);
  check_order(map, {"b", "a"}, CTX);
}

TEST(Linked_hash_map, Custom_hash_and_pred)
{
  Linked_hash_map<string, int, Ci_hash, Ci_equal> map(16);
  map.put("Alpha", 1).put("beta", 2).put("ALPHA", 3);
  EXPECT_EQ(map.size(), 2u);
  EXPECT_EQ(map.keys(), (vector<string>{"Alpha", "beta"})); // First spelling kept.
  int value = 0;
  EXPECT_TRUE(map.get("alpha", &value));
  EXPECT_EQ(value, 3);
  EXPECT_TRUE(map.move_to_end("ALPHA"));
  EXPECT_EQ(map.keys(), (vector<string>{"beta", "Alpha"}));
}

TEST(Linked_hash_map, Many_entries)
{
  Linked_hash_map<int, int> map;
  for (int idx = 0; idx != 1000; ++idx)
  {
    map.put(idx, idx * 2);
  }
  for (int idx = 0; idx != 1000; idx += 2)
  {
    EXPECT_TRUE(map.del(idx));
  }
  for (int idx = 1; idx < 1000; idx += 4)
  {
    EXPECT_TRUE(map.move_to_front(idx));
  }
  EXPECT_EQ(map.size(), 500u);

  const auto keys = map.keys();
  ASSERT_EQ(keys.size(), 500u);
  // Front: the moved ones, most recently moved first: 997, 993, ..., 1.  Then the rest in insertion order.
  EXPECT_EQ(keys.front(), 997);
  EXPECT_EQ(keys[249], 1);
  EXPECT_EQ(keys[250], 3);
  EXPECT_EQ(keys.back(), 999);
  int value = 0;
  EXPECT_TRUE(map.get(501, &value));
  EXPECT_EQ(value, 1002);
}

} // namespace ordo::col::test
