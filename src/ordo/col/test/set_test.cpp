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

#include "ordo/col/array_map.hpp"
#include "ordo/col/hash_map.hpp"
#include "ordo/col/linked_hash_map.hpp"
#include "ordo/col/set.hpp"
#include "ordo/util/util.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <vector>

namespace ordo::col::test
{

namespace
{
using std::string;
using std::vector;

template<typename Set_t>
class Set_contract_test : public ::testing::Test
{
protected:
  Set_t m_set;
};

using Set_types = ::testing::Types<Hash_set<string>, Array_set<string>, Linked_set<string>>;

} // Anonymous namespace

TYPED_TEST_SUITE(Set_contract_test, Set_types);

TYPED_TEST(Set_contract_test, Add_remove_contains)
{
  Set<string>& set = this->m_set;
  EXPECT_TRUE(set.empty());
  EXPECT_EQ(set.to_string(), "set[]");

  set.add("p").add("q").add("p");
  EXPECT_EQ(set.size(), 2u);
  EXPECT_TRUE(set.contains("p"));
  EXPECT_TRUE(set.contains("q"));
  EXPECT_FALSE(set.contains("r"));

  set.remove("p").remove("r"); // Absent element: no-op.
  EXPECT_EQ(set.size(), 1u);
  EXPECT_FALSE(set.contains("p"));
  EXPECT_EQ(set.elems(), (vector<string>{"q"}));
  EXPECT_EQ(set.to_string(), "set[q]");

  set.clear();
  EXPECT_TRUE(set.empty());
  EXPECT_TRUE(set.elems().empty());
  set.add("z");
  EXPECT_EQ(set.size(), 1u);
}

TYPED_TEST(Set_contract_test, Each_matches_elems)
{
  Set<string>& set = this->m_set;
  set.add("c").add("a").add("b").add("a");
  vector<string> visited;
  set.each([&](const string& elem) { visited.push_back(elem); });
  EXPECT_EQ(visited, set.elems());

  string expected_str = "set[";
  for (size_t idx = 0; idx != visited.size(); ++idx)
  {
    util::ostream_op_to_string(&expected_str, (idx == 0) ? "" : " ", visited[idx]);
  }
  expected_str += ']';
  EXPECT_EQ(util::ostream_op_string(set), expected_str);

  auto sorted = visited;
  std::sort(sorted.begin(), sorted.end());
  EXPECT_EQ(sorted, (vector<string>{"a", "b", "c"}));
}

TEST(Set, Insertion_ordered_backends)
{
  Linked_set<string> linked_set;
  linked_set.add("p").add("q").add("p");
  EXPECT_EQ(linked_set.size(), 2u);
  EXPECT_EQ(linked_set.elems(), (vector<string>{"p", "q"}));

  Array_set<string> array_set{"z", "y", "z", "x"};
  EXPECT_EQ(array_set.elems(), (vector<string>{"z", "y", "x"}));
  EXPECT_EQ(array_set.to_string(), "set[z y x]");
}

TEST(Set, Reordering_linked)
{
  Linked_set<string> set{"a", "b", "c"};
  EXPECT_TRUE(set.reorderable());
  EXPECT_TRUE(set.move_to_end("a"));
  EXPECT_EQ(set.elems(), (vector<string>{"b", "c", "a"}));
  EXPECT_TRUE(set.move_to_front("c"));
  EXPECT_EQ(set.elems(), (vector<string>{"c", "b", "a"}));
  EXPECT_FALSE(set.move_to_end("missing"));
  EXPECT_EQ(set.elems(), (vector<string>{"c", "b", "a"}));

  // Same through the abstract interface.
  Set<string>& base = set;
  EXPECT_TRUE(base.move_to_front("a"));
  EXPECT_EQ(base.elems(), (vector<string>{"a", "c", "b"}));

  string front;
  EXPECT_TRUE(set.map().first(&front));
  EXPECT_EQ(front, "a");
}

TEST(Set, Reordering_unsupported)
{
  static_assert(!Array_set<int>::S_REORDERABLE);
  static_assert(!Hash_set<int>::S_REORDERABLE);
  static_assert(Linked_set<int>::S_REORDERABLE);

  Array_set<int> array_set{1, 2, 3};
  EXPECT_FALSE(array_set.reorderable());
  EXPECT_FALSE(array_set.move_to_end(1));
  EXPECT_FALSE(array_set.move_to_front(3));
  EXPECT_EQ(array_set.elems(), (vector<int>{1, 2, 3}));

  Hash_set<int> hash_set{1, 2};
  EXPECT_FALSE(hash_set.reorderable());
  EXPECT_FALSE(hash_set.move_to_end(1));
  EXPECT_EQ(hash_set.size(), 2u);
}

TEST(Set, Backend_with_bucket_count)
{
  Hash_set<int> set(Hash_map<int, Unit>(128));
  EXPECT_GE(set.map().bucket_count(), 128u);
  set.add(5).add(6);
  EXPECT_EQ(set.size(), 2u);
}

} // namespace ordo::col::test
