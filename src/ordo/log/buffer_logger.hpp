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

#include "ordo/log/ostream_log_msg_writer.hpp"
#include "ordo/log/log.hpp"
#include "ordo/util/string_ostream.hpp"

namespace ordo::log
{

// Types.

/**
 * An implementation of Logger that logs messages to an internal `std::string` buffer, which can be read back
 * via buffer_str_copy().  Tests use it to check what was logged.
 *
 * ### Thread safety ###
 * should_log(), do_log() and buffer_str_copy() are safe to call concurrently.
 */
class Buffer_logger :
  public Logger
{
public:
  // Constructors/destructor.

  /**
   * Constructs logger to subsequently log to an internal `std::string`, initially blank.
   *
   * @param config
   *        Controls behavior of this Logger.  Saved in #m_config.
   */
  explicit Buffer_logger(Config* config);

  // Methods.

  /**
   * Implements interface method by returning `true` if the severity and component (which is allowed to be null)
   * indicate it should, per #m_config.
   *
   * @param sev
   *        Severity of the message.
   * @param component
   *        Component of the message.
   * @return See above.
   */
  bool should_log(Sev sev, const Component& component) const override;

  /**
   * Implements interface method by synchronously appending the message, with metadata, to the buffer.
   *
   * @param metadata
   *        All information to potentially log in addition to `msg`.
   * @param msg
   *        The message.
   */
  void do_log(Msg_metadata* metadata, util::String_view msg) override;

  /**
   * Returns a copy of everything logged so far.
   *
   * @return See above.
   */
  std::string buffer_str_copy() const;

  /// Discards everything logged so far.
  void buffer_clear();

  // Data.  (Public!)

  /// Reference to the config object passed to constructor.
  Config* const m_config;

private:
  // Data.

  /// The buffer and the stream writing to it.
  util::String_ostream m_os;

  /// Writes each message to `m_os.os()`.
  Ostream_log_msg_writer m_os_writer;

  /// Mutex protecting against log messages being logged concurrently and against reading while logging.
  mutable util::Mutex_non_recursive m_log_mutex;
}; // class Buffer_logger

} // namespace ordo::log
