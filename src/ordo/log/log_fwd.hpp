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
#include <cstddef>
#include <iosfwd>

/**
 * Ordo module providing logging functionality.  It is deliberately small: a Logger interface with a severity
 * and component filter, a Config holding that filter, the `ORDO_LOG_...()` call-site macros, and two synchronous
 * concrete loggers (Simple_ostream_logger and Buffer_logger).  Ordo's own log call sites are in ordo::col
 * (Lru_cache) and ordo::cfg (option parsing); a null `Logger*` anywhere simply disables logging at that site.
 *
 * A log call site supplies a severity (Sev) and a Component: any `enum class` value whose underlying type is
 * `unsigned int`, so a user application can share a Logger with Ordo while keeping its own component `enum`.
 */
namespace ordo::log
{
// Types.

// Find doc headers near the bodies of these compound types.

class Buffer_logger;
class Component;
class Config;
class Logger;
class Log_context;
struct Msg_metadata;
class Ostream_log_msg_writer;
class Simple_ostream_logger;

/**
 * Enumeration containing one of several message severity levels, ordered from highest to lowest severity
 * (lowest to highest verbosity).  Values are consecutive from 0, so a Sev may index an array directly.
 *
 * The supplied `ostream<<` operator, together with this `enum`, is suitable for util::istream_to_enum();
 * `istream>>` is built on the latter.  Hence I/O of Sev is available out of the box, including in
 * boost.program_options parsing.
 *
 * Sev::S_WARNING is the least severe "abnormal" condition: Simple_ostream_logger sends it (and anything more severe)
 * to its error stream.
 */
enum class Sev : size_t
{
  /// Sentinel: must not be used for an actual message; as a filter it means "log nothing."
  S_NONE = 0,
  /// The program will abort imminently due to the condition being logged.
  S_FATAL,
  /// A "bad" condition worse than a WARNING.
  S_ERROR,
  /// A "bad" condition that is not frequent enough to be TRACE.
  S_WARNING,
  /// A not-"bad" condition that is not frequent enough to be TRACE.
  S_INFO,
  /// Like INFO in frequency but of subjectively less interest to a human reader.
  S_DEBUG,
  /// Any condition that may occur with great frequency; enabling it may affect performance.
  S_TRACE,
  /// Like TRACE but includes dumps of variable-length data (such as entire container contents).
  S_DATA,
  /// Sentinel: not a severity.
  S_END_SENTINEL
};

// Free functions.

/**
 * Serializes a log::Sev to a standard output stream: "FATAL", "WARNING", etc.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Sev val);

/**
 * Deserializes a log::Sev from a standard input stream, case-insensitively; a number is also accepted.
 * Unrecognized input yields Sev::S_NONE.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Sev& val);

} // namespace ordo::log
