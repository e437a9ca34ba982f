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
#include "ordo/log/log_fwd.hpp"
#include <iosfwd>

/**
 * Ordo module containing the configuration knobs of the containers, i.e., Container_options, parseable from text
 * via boost.program_options.  The factories in ordo::col consume it.
 */
namespace ordo::cfg
{
// Types.

struct Container_options;

// Free functions.

/**
 * Prints the name of each option in `opts`, along with its current value, in boost.program_options help format.
 *
 * @param os
 *        Stream to which to print.
 * @param opts
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Container_options& opts);

/**
 * Parses `key = value` config text (boost.program_options config-file syntax) into a Container_options, starting
 * from the defaults, and validates the result (see Container_options::validate()).  `*opts` is modified only on
 * success.
 *
 * @param is
 *        Stream with the config text.
 * @param opts
 *        Where to store the result on success.
 * @param logger_ptr
 *        Logger to use for logging subsequently; may be null.
 * @param err_code
 *        See ordo::Error_code docs for error reporting semantics.  error::Code generated:
 *        error::Code::S_OPTION_PARSE_FAILED, or any code from Container_options::validate().
 * @return `true` on success; `false` on error (if `err_code` is not null).
 */
bool parse_config_stream(std::istream& is, Container_options* opts, log::Logger* logger_ptr,
                         Error_code* err_code = 0);

} // namespace ordo::cfg
