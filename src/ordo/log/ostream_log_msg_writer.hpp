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

#include "ordo/log/log.hpp"
#include <boost/io/ios_state.hpp>
#include <boost/noncopyable.hpp>
#include <array>
#include <chrono>

namespace ordo::log
{
// Types.

/**
 * Utility class, each object of which wraps a given `ostream` and outputs discrete messages to it adorned with time
 * stamps and other formatting such as separating newlines.  A Logger that writes to an `ostream` (as do
 * Simple_ostream_logger and Buffer_logger) owns one or more of these and funnels each do_log() into log().
 *
 * A line looks like:
 *
 *   ~~~
 *   2023-09-14 13:05:07.123456 -0700 [info]: T140234: COL: lru_cache.hpp:put(210): Evicting [...].
 *   ~~~
 *
 * The component part is omitted if the Config has no name registered for it.
 *
 * ### Thread safety ###
 * Not safe for concurrent log() calls; the owning Logger must serialize them.  No one else should touch the
 * `ostream` while `*this` exists: its formatting state is changed, and restored only in the destructor.
 */
class Ostream_log_msg_writer :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs object wrapping the given `ostream`.  Does not write anything to it.
   *
   * @param config
   *        Controls behavior of `*this`, such as time stamp format.  Must stay alive while `*this` exists.
   * @param os
   *        The stream to which to write.
   */
  explicit Ostream_log_msg_writer(const Config& config, std::ostream& os);

  /// Restores the formatting state of the `ostream` given to the constructor.
  ~Ostream_log_msg_writer() noexcept;

  // Methods.

  /**
   * Logs to the wrapped `ostream` the given message and associated metadata like severity and time stamp; plus
   * a newline.
   *
   * @param metadata
   *        See Logger::do_log().
   * @param msg
   *        See Logger::do_log().
   */
  void log(const Msg_metadata& metadata, util::String_view msg);

private:
  // Methods.

  /**
   * Writes the time stamp part of a line, in the format selected by Config::m_use_human_friendly_time_stamps.
   *
   * @param called_when
   *        Time stamp.
   */
  void log_time_stamp(const std::chrono::system_clock::time_point& called_when);

  // Constants.

  /// Mapping from Sev to its brief string description, shown in each line.
  static const std::array<util::String_view, size_t(Sev::S_END_SENTINEL)> S_SEV_STRS;

  // Data.

  /// Reference to the config object passed to constructor.
  const Config& m_config;

  /// Reference to stream to which to log messages.
  std::ostream& m_os;

  /// Formatter state of #m_os at construction.  Its destructor restores that state.
  boost::io::ios_all_saver m_clean_os_state;
}; // class Ostream_log_msg_writer

} // namespace ordo::log
