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

#include "ordo/col/lru_cache.hpp"
#include "ordo/log/buffer_logger.hpp"
#include "ordo/log/config.hpp"
#include "ordo/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <string>
#include <utility>
#include <vector>

namespace ordo::col::test
{

namespace
{
using std::string;
using std::vector;
using Cache = Lru_cache<string, int>;
} // Anonymous namespace

TEST(Lru_cache, Evicts_least_recently_used)
{
  ordo::test::Test_logger logger;
  Cache cache(&logger, 2);
  EXPECT_EQ(cache.capacity(), 2u);
  EXPECT_TRUE(cache.empty());

  cache.put("x", 1).put("y", 2);
  EXPECT_EQ(cache.keys(), (vector<string>{"x", "y"}));

  int value = 0;
  EXPECT_TRUE(cache.get("x", &value));
  EXPECT_EQ(value, 1);
  EXPECT_EQ(cache.keys(), (vector<string>{"y", "x"}));

  cache.put("z", 3);
  EXPECT_EQ(cache.keys(), (vector<string>{"x", "z"}));
  EXPECT_EQ(cache.size(), 2u);
  EXPECT_FALSE(cache.contains("y"));
  value = 7;
  EXPECT_FALSE(cache.get("y", &value));
  EXPECT_EQ(value, 0);
}

TEST(Lru_cache, Peek_does_not_touch)
{
  Cache cache(nullptr, 2);
  cache.put("a", 1).put("b", 2);
  int value = 0;
  EXPECT_TRUE(cache.peek("a", &value));
  EXPECT_EQ(value, 1);
  EXPECT_TRUE(cache.contains("a"));
  EXPECT_EQ(cache.keys(), (vector<string>{"a", "b"}));

  cache.put("c", 3); // "a" is still least recently used.
  EXPECT_EQ(cache.keys(), (vector<string>{"b", "c"}));
}

TEST(Lru_cache, Put_existing_updates_and_touches)
{
  Cache cache(nullptr, 3);
  cache.put("a", 1).put("b", 2).put("c", 3);
  cache.put("a", 10);
  EXPECT_EQ(cache.size(), 3u);
  EXPECT_EQ(cache.keys(), (vector<string>{"b", "c", "a"}));

  cache.put("d", 4); // Full, new key: "b" goes.
  EXPECT_EQ(cache.keys(), (vector<string>{"c", "a", "d"}));
  const auto entries = cache.entries();
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[1].m_key, "a");
  EXPECT_EQ(entries[1].m_value, 10);
}

TEST(Lru_cache, Eviction_handler)
{
  vector<std::pair<string, int>> evicted;
  Cache cache(nullptr, 1, 0, [&](const string& key, const int& value) { evicted.emplace_back(key, value); });

  cache.put("a", 1);
  EXPECT_TRUE(evicted.empty());
  cache.put("a", 2); // Update, not eviction.
  EXPECT_TRUE(evicted.empty());
  cache.put("b", 3);
  ASSERT_EQ(evicted.size(), 1u);
  EXPECT_EQ(evicted[0], std::make_pair(string("a"), 2));

  // del() and clear() are not evictions.
  int value = 0;
  EXPECT_TRUE(cache.del("b", &value));
  EXPECT_EQ(value, 3);
  cache.put("c", 4).clear();
  EXPECT_TRUE(cache.empty());
  EXPECT_EQ(evicted.size(), 1u);
}

TEST(Lru_cache, Logging)
{
  log::Config config(log::Sev::S_TRACE);
  config.init_component_names<Ordo_log_component>(S_ORDO_LOG_COMPONENT_NAME_MAP);
  log::Buffer_logger logger(&config);

  Cache cache(&logger, 1);
  auto log_str = logger.buffer_str_copy();
  EXPECT_NE(log_str.find("[info]"), string::npos) << log_str;
  EXPECT_NE(log_str.find("COL: "), string::npos) << log_str;
  EXPECT_NE(log_str.find("capacity [1]"), string::npos) << log_str;

  logger.buffer_clear();
  cache.put("first", 1).put("second", 2);
  log_str = logger.buffer_str_copy();
  EXPECT_NE(log_str.find("[trce]"), string::npos) << log_str;
  EXPECT_NE(log_str.find("evicted key [first]"), string::npos) << log_str;

  // At INFO no eviction is logged.
  config.configure_default_verbosity(log::Sev::S_INFO, true);
  logger.buffer_clear();
  cache.put("third", 3);
  EXPECT_EQ(logger.buffer_str_copy(), "");
}

TEST(Lru_cache, Zero_capacity)
{
  EXPECT_THROW(Cache(nullptr, 0), error::Runtime_error);
  try
  {
    Cache cache(nullptr, 0);
    FAIL() << "Should have thrown.";
  }
  catch (const error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), Error_code(cfg::error::Code::S_INVALID_CAPACITY));
  }
}

TEST(Lru_cache, Capacity_one_churn)
{
  Lru_cache<int, int> cache(nullptr, 1);
  for (int idx = 0; idx != 100; ++idx)
  {
    cache.put(idx, idx);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.keys(), (vector<int>{idx}));
  }
}

} // namespace ordo::col::test
