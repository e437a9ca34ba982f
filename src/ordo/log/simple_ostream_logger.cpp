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
#include "ordo/log/simple_ostream_logger.hpp"
#include "ordo/log/config.hpp"

namespace ordo::log
{

// Implementations.

Simple_ostream_logger::Simple_ostream_logger(Config* config,
                                             std::ostream& os, std::ostream& os_for_err, Sev min_err_sev) :
  m_config(config),
  m_min_err_sev(min_err_sev)
{
  m_os_writers[0].reset(new Ostream_log_msg_writer(*m_config, os));
  if (&os == &os_for_err)
  {
    m_os_writers[1] = m_os_writers[0];
  }
  else
  {
    m_os_writers[1].reset(new Ostream_log_msg_writer(*m_config, os_for_err));
  }
  m_n_msgs.fill(0);
}

bool Simple_ostream_logger::should_log(Sev sev, const Component& component) const // Virtual.
{
  return m_config->output_whether_should_log(sev, component);
}

size_t Simple_ostream_logger::stream_idx(Sev sev) const
{
  // Lower Sev value means more severe.
  return (sev <= m_min_err_sev) ? 1 : 0;
}

void Simple_ostream_logger::do_log(Msg_metadata* metadata, util::String_view msg) // Virtual.
{
  const auto idx = stream_idx(metadata->m_msg_sev);

  // One mutex even if the streams differ: they may still end up on one device (2>&1).
  util::Lock_guard<decltype(m_log_mutex)> lock(m_log_mutex);
  m_os_writers[idx]->log(*metadata, msg);
  ++m_n_msgs[idx];
}

size_t Simple_ostream_logger::n_msgs_logged(bool err_stream) const
{
  util::Lock_guard<decltype(m_log_mutex)> lock(m_log_mutex);
  return m_n_msgs[err_stream ? 1 : 0];
}

} // namespace ordo::log
