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

#include "ordo/log/buffer_logger.hpp"
#include "ordo/log/config.hpp"
#include "ordo/log/log.hpp"
#include "ordo/log/simple_ostream_logger.hpp"
#include "ordo/util/util.hpp"
#include <boost/unordered_map.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <sstream>
#include <string>
#include <typeinfo>

namespace ordo::log::test
{

namespace
{
using std::string;

/// A component `enum` of a hypothetical user module, to coexist with Ordo_log_component in one Config.
enum class Test_log_component : unsigned int
{
  S_ALPHA = 0,
  S_BETA,
  S_END_SENTINEL
};

const boost::unordered_multimap<Test_log_component, string> S_TEST_LOG_COMPONENT_NAME_MAP
  ({ { Test_log_component::S_ALPHA, "ALPHA" },
     { Test_log_component::S_BETA, "BETA" } });

/// Logs one message of each severity FATAL through DATA, with the given component.
template<typename Component_payload>
void log_each_sev(Logger* logger_ptr, Component_payload component_payload)
{
  ORDO_LOG_SET_CONTEXT(logger_ptr, component_payload);

  ORDO_LOG_FATAL("msg-fatal");
  ORDO_LOG_ERROR("msg-error");
  ORDO_LOG_WARNING("msg-warning");
  ORDO_LOG_INFO("msg-info");
  ORDO_LOG_DEBUG("msg-debug");
  ORDO_LOG_TRACE("msg-trace");
  ORDO_LOG_DATA("msg-data");
}

bool contains(const string& haystack, const string& needle)
{
  return haystack.find(needle) != string::npos;
}

/// Logger that passes everything and keeps a copy of the last message and its metadata.
class Capturing_logger : public Logger
{
public:
  bool should_log(Sev, const Component&) const override
  {
    return true;
  }

  void do_log(Msg_metadata* metadata, util::String_view msg) override
  {
    m_last_metadata = *metadata;
    m_last_msg = string(msg);
    ++m_n_msgs;
  }

  Msg_metadata m_last_metadata;
  string m_last_msg;
  unsigned int m_n_msgs = 0;
}; // class Capturing_logger

} // Anonymous namespace

TEST(Sev, Stream_io)
{
  EXPECT_EQ(util::ostream_op_string(Sev::S_WARNING), "WARNING");
  EXPECT_EQ(util::ostream_op_string(Sev::S_DATA), "DATA");

  const auto parse = [](const string& str)
  {
    std::istringstream is(str);
    Sev sev = Sev::S_FATAL;
    is >> sev;
    return sev;
  };
  EXPECT_EQ(parse("trace"), Sev::S_TRACE);
  EXPECT_EQ(parse("Info"), Sev::S_INFO);
  EXPECT_EQ(parse("4"), Sev::S_INFO);
  EXPECT_EQ(parse("loud"), Sev::S_NONE);
}

TEST(Log_context, Interface)
{
  using std::swap; // ADL-swap.

  Config config;
  Buffer_logger logger1(&config);
  Buffer_logger logger2(&config);

  Log_context ctx1;
  EXPECT_EQ(ctx1.get_logger(), nullptr);
  EXPECT_TRUE(ctx1.get_log_component().empty());

  Log_context ctx2(&logger1, Test_log_component::S_BETA);
  EXPECT_EQ(ctx2.get_logger(), &logger1);
  ASSERT_FALSE(ctx2.get_log_component().empty());
  EXPECT_TRUE(ctx2.get_log_component().payload_type() == typeid(Test_log_component));
  EXPECT_EQ(ctx2.get_log_component().payload<Test_log_component>(), Test_log_component::S_BETA);

  swap(ctx1, ctx2);
  EXPECT_EQ(ctx1.get_logger(), &logger1);
  EXPECT_EQ(ctx2.get_logger(), nullptr);
  EXPECT_TRUE(ctx2.get_log_component().empty());

  Log_context ctx3(&logger2);
  EXPECT_EQ(ctx3.get_logger(), &logger2);
  EXPECT_TRUE(ctx3.get_log_component().empty());
  ctx3 = ctx1;
  EXPECT_EQ(ctx3.get_logger(), &logger1);
  EXPECT_EQ(int(ctx3.get_log_component().payload_enum_raw_value()), int(Test_log_component::S_BETA));
}

TEST(Config, Default_verbosity)
{
  Config config(Sev::S_WARNING);
  Buffer_logger logger(&config);

  log_each_sev(&logger, Test_log_component::S_ALPHA);
  auto log_str = logger.buffer_str_copy();
  EXPECT_TRUE(contains(log_str, "msg-fatal")) << log_str;
  EXPECT_TRUE(contains(log_str, "msg-error")) << log_str;
  EXPECT_TRUE(contains(log_str, "msg-warning")) << log_str;
  EXPECT_FALSE(contains(log_str, "msg-info")) << log_str;
  EXPECT_FALSE(contains(log_str, "msg-data")) << log_str;

  config.configure_default_verbosity(Sev::S_DATA, false);
  logger.buffer_clear();
  EXPECT_EQ(logger.buffer_str_copy(), "");
  log_each_sev(&logger, Test_log_component::S_ALPHA);
  log_str = logger.buffer_str_copy();
  EXPECT_TRUE(contains(log_str, "msg-data")) << log_str;
  EXPECT_TRUE(contains(log_str, "[data]")) << log_str;
  EXPECT_TRUE(contains(log_str, "[fatl]")) << log_str;

  // Null logger: nothing happens, nothing crashes.
  log_each_sev(static_cast<Logger*>(nullptr), Test_log_component::S_ALPHA);
}

TEST(Config, Component_verbosity)
{
  Config config(Sev::S_ERROR);
  config.init_component_names<Test_log_component>(S_TEST_LOG_COMPONENT_NAME_MAP, false, "test");
  config.init_component_names<Ordo_log_component>(S_ORDO_LOG_COMPONENT_NAME_MAP, false, "ordo");
  Buffer_logger logger(&config);

  config.configure_component_verbosity(Sev::S_INFO, Test_log_component::S_ALPHA);
  EXPECT_TRUE(config.configure_component_verbosity_by_name(Sev::S_TRACE, "ordo_col"));
  EXPECT_FALSE(config.configure_component_verbosity_by_name(Sev::S_TRACE, "col")); // Prefix required.
  EXPECT_FALSE(config.configure_component_verbosity_by_name(Sev::S_TRACE, "test_gamma"));

  EXPECT_TRUE(config.output_whether_should_log(Sev::S_INFO, Component(Test_log_component::S_ALPHA)));
  EXPECT_FALSE(config.output_whether_should_log(Sev::S_DEBUG, Component(Test_log_component::S_ALPHA)));
  EXPECT_FALSE(config.output_whether_should_log(Sev::S_WARNING, Component(Test_log_component::S_BETA)));
  EXPECT_TRUE(config.output_whether_should_log(Sev::S_TRACE, Component(Ordo_log_component::S_COL)));
  EXPECT_FALSE(config.output_whether_should_log(Sev::S_TRACE, Component(Ordo_log_component::S_CFG)));
  EXPECT_FALSE(config.output_whether_should_log(Sev::S_WARNING, Component()));

  log_each_sev(&logger, Test_log_component::S_ALPHA);
  const auto log_str = logger.buffer_str_copy();
  EXPECT_TRUE(contains(log_str, "TEST_ALPHA: ")) << log_str;
  EXPECT_TRUE(contains(log_str, "msg-info")) << log_str;
  EXPECT_FALSE(contains(log_str, "msg-debug")) << log_str;

  // Reset drops the overrides.
  config.configure_default_verbosity(Sev::S_ERROR, true);
  EXPECT_FALSE(config.output_whether_should_log(Sev::S_INFO, Component(Test_log_component::S_ALPHA)));
  EXPECT_FALSE(config.output_whether_should_log(Sev::S_TRACE, Component(Ordo_log_component::S_COL)));
}

TEST(Ostream_log_msg_writer, Line_format)
{
  Config config(Sev::S_INFO);
  config.m_use_human_friendly_time_stamps = false;
  config.init_component_names<Test_log_component>(S_TEST_LOG_COMPONENT_NAME_MAP);
  Buffer_logger logger(&config);

  {
    ORDO_LOG_SET_CONTEXT(&logger, Test_log_component::S_BETA);
    ORDO_LOG_INFO("Value [" << 42 << "].");
  }
  const auto log_str = logger.buffer_str_copy();

  // <sec>.<usec> [info]: T<thread>: BETA: log_test.cpp:<function>(<line>): Value [42].
  EXPECT_TRUE(contains(log_str, " [info]: T")) << log_str;
  EXPECT_TRUE(contains(log_str, ": BETA: log_test.cpp:")) << log_str;
  EXPECT_TRUE(contains(log_str, "): Value [42].\n")) << log_str;
  const auto dot_pos = log_str.find('.');
  ASSERT_NE(dot_pos, string::npos);
  EXPECT_EQ(log_str.find(' '), dot_pos + 7) << "Expected <sec>.<6-digit usec> prefix: " << log_str;
}

TEST(Log_macros, Call_site_metadata)
{
  Capturing_logger logger;
  unsigned int expected_line = 0;
  const auto before = std::chrono::system_clock::now();
  {
    ORDO_LOG_SET_CONTEXT(&logger, Test_log_component::S_BETA);
    expected_line = __LINE__ + 1;
    ORDO_LOG_WARNING("Pair [" << 1 << ", " << 2 << "].");
  }
  const auto after = std::chrono::system_clock::now();

  ASSERT_EQ(logger.m_n_msgs, 1u);
  EXPECT_EQ(logger.m_last_msg, "Pair [1, 2].");

  const auto& metadata = logger.m_last_metadata;
  EXPECT_EQ(metadata.m_msg_sev, Sev::S_WARNING);
  ASSERT_FALSE(metadata.m_msg_component.empty());
  EXPECT_TRUE(metadata.m_msg_component.payload_type() == typeid(Test_log_component));
  EXPECT_TRUE(metadata.m_msg_component.payload<Test_log_component>() == Test_log_component::S_BETA);
  EXPECT_EQ(string(metadata.m_msg_src_file), "log_test.cpp");
  EXPECT_EQ(metadata.m_msg_src_line, expected_line);
  EXPECT_FALSE(metadata.m_msg_src_function.empty());
  EXPECT_TRUE(metadata.m_called_when >= before);
  EXPECT_TRUE(metadata.m_called_when <= after);
  EXPECT_EQ(metadata.m_call_thread_id, util::this_thread_id());

  // Null Logger: no-op.
  {
    ORDO_LOG_SET_CONTEXT(static_cast<Logger*>(0), Test_log_component::S_BETA);
    ORDO_LOG_WITHOUT_CHECKING(Sev::S_INFO, "dropped");
  }
  EXPECT_EQ(logger.m_n_msgs, 1u);
}

TEST(Simple_ostream_logger, Error_split)
{
  Config config(Sev::S_INFO);
  std::ostringstream out_os;
  std::ostringstream err_os;
  Simple_ostream_logger logger(&config, out_os, err_os);

  log_each_sev(&logger, Test_log_component::S_ALPHA);
  const auto out_str = out_os.str();
  const auto err_str = err_os.str();
  EXPECT_TRUE(contains(out_str, "msg-info")) << out_str;
  EXPECT_FALSE(contains(out_str, "msg-warning")) << out_str;
  EXPECT_TRUE(contains(err_str, "msg-warning")) << err_str;
  EXPECT_TRUE(contains(err_str, "msg-error")) << err_str;
  EXPECT_TRUE(contains(err_str, "msg-fatal")) << err_str;
  EXPECT_FALSE(contains(err_str, "msg-info")) << err_str;
  EXPECT_EQ(logger.n_msgs_logged(false), 1u); // INFO.
  EXPECT_EQ(logger.n_msgs_logged(true), 3u); // FATAL, ERROR, WARNING.
}

TEST(Simple_ostream_logger, Error_threshold_and_shared_stream)
{
  Config config(Sev::S_TRACE);
  std::ostringstream out_os;
  std::ostringstream err_os;
  Simple_ostream_logger logger(&config, out_os, err_os, Sev::S_ERROR);

  log_each_sev(&logger, Test_log_component::S_ALPHA);
  EXPECT_TRUE(contains(out_os.str(), "msg-warning")) << out_os.str();
  EXPECT_FALSE(contains(err_os.str(), "msg-warning")) << err_os.str();
  EXPECT_TRUE(contains(err_os.str(), "msg-error")) << err_os.str();
  EXPECT_EQ(logger.n_msgs_logged(false), 4u); // WARNING, INFO, DEBUG, TRACE.
  EXPECT_EQ(logger.n_msgs_logged(true), 2u); // FATAL, ERROR.

  std::ostringstream both_os;
  Simple_ostream_logger one_stream_logger(&config, both_os, both_os);
  log_each_sev(&one_stream_logger, Test_log_component::S_ALPHA);
  const auto both_str = both_os.str();
  EXPECT_LT(both_str.find("msg-fatal"), both_str.find("msg-info")) << both_str;
  EXPECT_LT(both_str.find("msg-info"), both_str.find("msg-trace")) << both_str;
  EXPECT_FALSE(contains(both_str, "msg-data")) << both_str;
}

} // namespace ordo::log::test
