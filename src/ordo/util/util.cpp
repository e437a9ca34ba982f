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
#include "ordo/util/util.hpp"

namespace ordo::util
{

// Implementations.

Null_interface::~Null_interface() = default;

Thread_id this_thread_id()
{
  return boost::this_thread::get_id();
}

std::string get_where_am_i_str(String_view file, String_view function, unsigned int line)
{
  std::string result;
  result.reserve(file.size() + function.size() + 16);
  result.append(file);
  result += ':';
  result.append(function);
  result += '(';
  result += std::to_string(line);
  result += ')';
  return result;
}

} // namespace ordo::util
