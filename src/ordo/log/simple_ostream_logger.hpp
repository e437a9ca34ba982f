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
#include <boost/array.hpp>
#include <boost/shared_ptr.hpp>
#include <iostream>

namespace ordo::log
{

// Types.

/**
 * A Logger that writes each message, as formatted by Ostream_log_msg_writer, to one of two `ostream`s: the error
 * stream for messages at least as severe as a threshold (Sev::S_WARNING by default), the regular stream for the
 * rest.  The two may be the same stream (then only one writer exists).  Logging is synchronous and serialized
 * by an internal mutex; it also keeps a count of messages sent to each stream.
 *
 * ### Thread safety ###
 * All methods are safe to call concurrently.  `*m_config` may be modified concurrently only via its
 * `configure_*()` methods.
 */
class Simple_ostream_logger :
  public Logger
{
public:
  // Constructors/destructor.

  /**
   * Constructs logger to subsequently log to the given standard `ostream` (or 2 thereof).  No one else should
   * write to those streams while `*this` exists.
   *
   * @param config
   *        Controls filtering and formatting.  Saved in #m_config.
   * @param os
   *        Stream for messages less severe than `min_err_sev`.
   * @param os_for_err
   *        Stream for messages of severity `min_err_sev` or more severe.
   * @param min_err_sev
   *        Least severe Sev that goes to `os_for_err`.
   */
  explicit Simple_ostream_logger(Config* config,
                                 std::ostream& os = std::cout, std::ostream& os_for_err = std::cerr,
                                 Sev min_err_sev = Sev::S_WARNING);

  // Methods.

  /**
   * Implements interface method by returning `true` if the severity and component (which is allowed to be empty)
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
   * Implements interface method by synchronously writing the message to the stream its severity selects.
   *
   * @param metadata
   *        All information to potentially log in addition to `msg`.
   * @param msg
   *        The message.
   */
  void do_log(Msg_metadata* metadata, util::String_view msg) override;

  /**
   * Number of do_log() calls so far that went to the regular stream (`err_stream == false`) or the error stream.
   *
   * @param err_stream
   *        Which stream.
   * @return See above.
   */
  size_t n_msgs_logged(bool err_stream) const;

  // Data.  (Public!)

  /// Reference to the config object passed to constructor.
  Config* const m_config;

private:
  // Types.

  /// Short-hand for ref-counted pointer to a given Ostream_log_msg_writer; see #m_os_writers for ref-count use.
  using Ostream_log_msg_writer_ptr = boost::shared_ptr<Ostream_log_msg_writer>;

  // Methods.

  /**
   * Index into #m_os_writers and #m_n_msgs for a message of the given severity.
   *
   * @param sev
   *        Severity.
   * @return 0 or 1.
   */
  size_t stream_idx(Sev sev) const;

  // Data.

  /// See constructor.
  const Sev m_min_err_sev;

  /// Writers: [0] for the regular stream; [1] for the error stream.  One shared object if the streams are the same.
  boost::array<Ostream_log_msg_writer_ptr, 2> m_os_writers;

  /// Message counts, indexed like #m_os_writers.  Protected by #m_log_mutex.
  boost::array<size_t, 2> m_n_msgs;

  /// Mutex protecting against log messages being logged concurrently and thus being garbled.
  mutable util::Mutex_non_recursive m_log_mutex;
}; // class Simple_ostream_logger

} // namespace ordo::log
