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

#include "ordo/col/factory.hpp"
#include "ordo/cfg/error/error.hpp"
#include "ordo/log/buffer_logger.hpp"
#include "ordo/log/config.hpp"
#include "ordo/util/util.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

namespace ordo::col::test
{

namespace
{
using std::string;
using std::vector;
} // Anonymous namespace

// Yes... this is very cheesy... but this is a test, so I don't really care.
#define CTX util::ostream_op_string("Caller context [", ORDO_UTIL_WHERE_AM_I_STR(), "].")

TEST(Backend, Stream_io)
{
  EXPECT_EQ(util::ostream_op_string(Backend::S_HASH), "HASH");
  EXPECT_EQ(util::ostream_op_string(Backend::S_ARRAY), "ARRAY");
  EXPECT_EQ(util::ostream_op_string(Backend::S_LINKED_HASH), "LINKED_HASH");

  const auto parse = [](const string& str)
  {
    std::istringstream is(str);
    Backend backend = Backend::S_HASH;
    is >> backend;
    return backend;
  };
  EXPECT_EQ(parse("hash"), Backend::S_HASH);
  EXPECT_EQ(parse("Array"), Backend::S_ARRAY);
  EXPECT_EQ(parse("LINKED_HASH"), Backend::S_LINKED_HASH);
  EXPECT_EQ(parse("2"), Backend::S_LINKED_HASH);
  EXPECT_EQ(parse("tree"), Backend::S_END_SENTINEL);
}

TEST(Factory, Make_map_by_backend)
{
  const auto check = [](Backend backend, bool exp_ordered, bool exp_reorderable, const string& ctx)
  {
    auto map = make_map<string, int>(backend);
    ASSERT_TRUE(map) << ctx;
    map->put("b", 1).put("a", 2).put("c", 3).put("b", 4);
    EXPECT_EQ(map->size(), 3u) << ctx;
    int value = 0;
    EXPECT_TRUE(map->get("b", &value)) << ctx;
    EXPECT_EQ(value, 4) << ctx;
    if (exp_ordered)
    {
      EXPECT_EQ(map->keys(), (vector<string>{"b", "a", "c"})) << ctx;
    }
    EXPECT_EQ(map->reorderable() != nullptr, exp_reorderable) << ctx;
  };

  check(Backend::S_HASH, false, false, CTX);
  check(Backend::S_ARRAY, true, false, CTX);
  check(Backend::S_LINKED_HASH, true, true, CTX);
  EXPECT_FALSE((make_map<string, int>(Backend::S_END_SENTINEL)));

  auto default_map = make_map<int, int>();
  ASSERT_TRUE(default_map);
  EXPECT_NE((dynamic_cast<Hash_map<int, int>*>(default_map.get())), nullptr);
}

TEST(Factory, Make_set_by_backend)
{
  for (const auto backend : { Backend::S_HASH, Backend::S_ARRAY, Backend::S_LINKED_HASH })
  {
    auto set = make_set<string>(backend, 32);
    ASSERT_TRUE(set) << backend;
    set->add("p").add("q").add("p");
    EXPECT_EQ(set->size(), 2u) << backend;
    EXPECT_EQ(set->reorderable(), backend == Backend::S_LINKED_HASH) << backend;
    if (backend != Backend::S_HASH)
    {
      EXPECT_EQ(set->elems(), (vector<string>{"p", "q"})) << backend;
    }
  }
  EXPECT_FALSE(make_set<int>(Backend::S_END_SENTINEL));
}

TEST(Factory, Make_from_options)
{
  cfg::Container_options opts;
  opts.m_st_backend = Backend::S_LINKED_HASH;
  opts.m_st_n_buckets = 16;

  Error_code err_code;
  auto map = make_map<string, int>(opts, &err_code);
  EXPECT_FALSE(err_code);
  ASSERT_TRUE(map);
  EXPECT_NE((dynamic_cast<Linked_hash_map<string, int>*>(map.get())), nullptr);

  auto set = make_set<string>(opts); // Throwing form; succeeds.
  ASSERT_TRUE(set);
  EXPECT_TRUE(set->reorderable());

  opts.m_st_backend = Backend::S_END_SENTINEL;
  map = make_map<string, int>(opts, &err_code);
  EXPECT_FALSE(map);
  EXPECT_EQ(err_code, Error_code(cfg::error::Code::S_UNKNOWN_BACKEND));
  EXPECT_THROW(make_set<string>(opts), error::Runtime_error);
}

TEST(Factory, Make_lru_cache)
{
  log::Config config(log::Sev::S_WARNING);
  log::Buffer_logger logger(&config);

  cfg::Container_options opts;
  opts.m_st_lru_capacity = 3;
  Error_code err_code;
  auto cache = make_lru_cache<string, int>(&logger, opts, &err_code);
  EXPECT_FALSE(err_code);
  ASSERT_TRUE(cache);
  EXPECT_EQ(cache->capacity(), 3u);
  EXPECT_EQ(cache->get_logger(), &logger);
  EXPECT_EQ(logger.buffer_str_copy(), ""); // INFO construction message filtered out.

  opts.m_st_lru_capacity = 0;
  cache = make_lru_cache<string, int>(&logger, opts, &err_code);
  EXPECT_FALSE(cache);
  EXPECT_EQ(err_code, Error_code(cfg::error::Code::S_INVALID_CAPACITY));
  EXPECT_NE(logger.buffer_str_copy().find("[warn]"), string::npos) << "Emitted error must be logged.";

  try
  {
    make_lru_cache<string, int>(&logger, opts);
    FAIL() << "Should have thrown.";
  }
  catch (const error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), Error_code(cfg::error::Code::S_INVALID_CAPACITY));
  }
}

} // namespace ordo::col::test
