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
#pragma once

#include "ordo/util/util_fwd.hpp"

namespace ordo::util
{

// Free functions: in *this* specific case they must be `constexpr` and therefore are defined right here.

/**
 * Helper that finds the last path segment in the given file path, for use with `__FILE__` in logging and
 * ORDO_UTIL_WHERE_AM_I().  So "/a/b/c.cpp" yields "c.cpp"; a path without separators is returned as-is.
 *
 * @param full_path
 *        Full path, presumably a `__FILE__`.
 * @return View into `full_path` past its last `/` (or all of it).
 */
constexpr String_view get_last_path_segment(String_view full_path)
{
  String_view path(full_path);
  constexpr char SEP = '/';
  const auto sep_pos = path.rfind(SEP);
  if (sep_pos != String_view::npos)
  {
    path.remove_prefix(sep_pos + 1);
  }
  return path;
} // get_last_path_segment()

} // namespace ordo::util

// Macros.

/**
 * Helper macro, same as ORDO_UTIL_WHERE_AM_I(), but takes the source location details as arguments instead of
 * grabbing them from `__FILE__`, `__FUNCTION__`, `__LINE__`.
 *
 * @param ARG_file
 *        File name (or its last segment).
 * @param ARG_function
 *        Function name.
 * @param ARG_line
 *        Line number.
 * @return `ostream` fragment.
 */
#define ORDO_UTIL_WHERE_AM_I_FROM_ARGS(ARG_file, ARG_function, ARG_line) \
  ARG_file << ':' << ARG_function << '(' << ARG_line << ')'
