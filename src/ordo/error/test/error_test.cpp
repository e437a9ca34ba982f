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

#include "ordo/error/error.hpp"
#include "ordo/cfg/error/error.hpp"
#include "ordo/log/buffer_logger.hpp"
#include "ordo/log/config.hpp"
#include "ordo/util/util.hpp"
#include <gtest/gtest.h>
#include <string>

namespace ordo::error::test
{

namespace
{
using std::string;

/// A function following the `Error_code* err_code = 0` convention: fails if `val` is negative.
int halve(int val, log::Logger* logger_ptr, Error_code* err_code = 0)
{
  ORDO_ERROR_EXEC_AND_THROW_ON_ERROR(int, halve, val, logger_ptr, _1);
  // else

  ORDO_LOG_SET_CONTEXT(logger_ptr, Ordo_log_component::S_UNCAT);
  if (val < 0)
  {
    ORDO_ERROR_EMIT_ERROR(cfg::error::Code::S_INVALID_CAPACITY);
    return 0;
  }
  // else

  err_code->clear();
  return val / 2;
}

} // Anonymous namespace

TEST(Runtime_error, What)
{
  const Error_code code(cfg::error::Code::S_INVALID_BUCKET_COUNT);
  const string code_str = util::ostream_op_string('[', code, ']');
  EXPECT_EQ(code_str.find("[ordo/cfg:"), 0u) << code_str;

  const Runtime_error with_code(code, "ctx-string");
  EXPECT_EQ(with_code.code(), code);
  EXPECT_EQ(with_code.context(), "ctx-string");
  EXPECT_EQ(string(with_code.what()), "ctx-string: " + code.message() + ' ' + code_str);

  const Runtime_error no_context(code);
  EXPECT_TRUE(no_context.context().empty());
  EXPECT_EQ(string(no_context.what()), code.message() + ' ' + code_str);

  const Runtime_error no_code("just-context");
  EXPECT_FALSE(no_code.code());
  EXPECT_EQ(no_code.context(), "just-context");
  EXPECT_STREQ(no_code.what(), "just-context");
}

TEST(Exec_and_throw_on_error, Both_modes)
{
  log::Config config(log::Sev::S_WARNING);
  log::Buffer_logger logger(&config);

  Error_code err_code;
  EXPECT_EQ(halve(10, &logger, &err_code), 5);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(halve(-1, &logger, &err_code), 0);
  EXPECT_EQ(err_code, Error_code(cfg::error::Code::S_INVALID_CAPACITY));
  EXPECT_NE(logger.buffer_str_copy().find("Error code emitted"), string::npos);

  EXPECT_EQ(halve(8, nullptr), 4);
  try
  {
    halve(-3, nullptr);
    FAIL() << "Should have thrown.";
  }
  catch (const Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), Error_code(cfg::error::Code::S_INVALID_CAPACITY));
    EXPECT_NE(string(exc.what()).find("halve"), string::npos) << exc.what();
  }
}

} // namespace ordo::error::test
