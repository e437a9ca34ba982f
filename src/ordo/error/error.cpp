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

/// @file
#include "ordo/error/error.hpp"
#include "ordo/util/util.hpp"

namespace ordo::error
{

namespace
{

/// Builds Runtime_error::what() text from its parts.
std::string compose_what(const Error_code& err_code, util::String_view context)
{
  if (!err_code)
  {
    return std::string(context);
  }
  // else

  return context.empty()
           ? util::ostream_op_string(err_code.message(), " [", err_code, ']')
           : util::ostream_op_string(context, ": ", err_code.message(), " [", err_code, ']');
}

} // Anonymous namespace

// Implementations.

Runtime_error::Runtime_error(const Error_code& err_code_or_success, util::String_view context) :
  boost::system::system_error(err_code_or_success),
  m_context(context),
  m_what(compose_what(err_code_or_success, context))
{
  // Nothing.
}

Runtime_error::Runtime_error(util::String_view context) :
  Runtime_error(Error_code(), context)
{
  // Nothing.
}

const std::string& Runtime_error::context() const
{
  return m_context;
}

const char* Runtime_error::what() const noexcept // Virtual.
{
  return m_what.c_str();
}

} // namespace ordo::error
