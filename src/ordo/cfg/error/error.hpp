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

#include "ordo/common.hpp"

/**
 * Namespace containing the ordo::cfg module's extension of boost.system error conventions, so that those APIs
 * can return codes/messages from within their own new set of error codes/messages.  Note that many errors ordo::cfg
 * might report are not its own codes but boost.program_options failures folded into Code::S_OPTION_PARSE_FAILED.
 */
namespace ordo::cfg::error
{

// Types.

/// All possible errors returned (via ordo::Error_code arguments) by ordo::cfg functions/methods.
enum class Code
{
  /// Config text could not be parsed into options (syntax error, unknown option or malformed value).
  S_OPTION_PARSE_FAILED = 1,
  /// Backend option does not name a known container backend.
  S_UNKNOWN_BACKEND,
  /// LRU cache capacity must be at least 1.
  S_INVALID_CAPACITY,
  /// Initial bucket count is out of range.
  S_INVALID_BUCKET_COUNT
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a matching #Error_code, which will return the message corresponding to
 * that value.  Not usually invoked directly: thanks to the `is_error_code_enum` specialization below, an
 * `Error_code` can be constructed or assigned from a `Code` directly.
 *
 * @param err_code
 *        Value.
 * @return See above.
 */
Error_code make_error_code(Code err_code);

} // namespace ordo::cfg::error

/// We may add some ADL-based overloads into this namespace outside `ordo`.
namespace boost::system
{

// Types.

/// Tells boost.system that cfg::error::Code values convert implicitly to ordo::Error_code.
template<>
struct is_error_code_enum<::ordo::cfg::error::Code>
{
  /// Means `Code` `enum` values can be used for ordo::Error_code.
  static const bool value = true;
};

} // namespace boost::system
