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
#include "ordo/log/ostream_log_msg_writer.hpp"
#include "ordo/log/config.hpp"
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <cassert>
#include <ctime>

namespace ordo::log
{

// Static initializations.

const std::array<util::String_view, size_t(Sev::S_END_SENTINEL)> Ostream_log_msg_writer::S_SEV_STRS
  = { { "null", // Never used (sentinel).
        "fatl", "eror", "warn", "info", "debg", "trce", "data" } };

// Implementations.

Ostream_log_msg_writer::Ostream_log_msg_writer(const Config& config, std::ostream& os) :
  m_config(config),
  m_os(os),
  m_clean_os_state(m_os) // Memorize this before any messing with formatting.
{
  // Nothing else.
}

Ostream_log_msg_writer::~Ostream_log_msg_writer() noexcept = default;

void Ostream_log_msg_writer::log(const Msg_metadata& metadata, util::String_view msg)
{
  using std::flush;

  // time_stamp [<sevr>]: T<thread ID>: <component>: <file>:<function>(<line>): <msg>

  assert(metadata.m_msg_sev != Sev::S_NONE); // S_NONE can be used only as a sentinel.

  log_time_stamp(metadata.m_called_when);

  m_os << '[' << S_SEV_STRS[size_t(metadata.m_msg_sev)] << "]: T" << metadata.m_call_thread_id << ": ";

  // Config may omit this part: component null or not registered.
  if (m_config.output_component_to_ostream(&m_os, metadata.m_msg_component))
  {
    m_os << ": ";
  }

  m_os << ORDO_UTIL_WHERE_AM_I_FROM_ARGS(metadata.m_msg_src_file, metadata.m_msg_src_function,
                                         metadata.m_msg_src_line)
       << ": "
       << msg << '\n'
       << flush;
} // Ostream_log_msg_writer::log()

void Ostream_log_msg_writer::log_time_stamp(const std::chrono::system_clock::time_point& called_when)
{
  using std::chrono::duration_cast;
  using std::chrono::microseconds;
  using std::chrono::system_clock;

  const auto usec_since_epoch = duration_cast<microseconds>(called_when.time_since_epoch()).count();
  const auto sec = usec_since_epoch / 1000000;
  const auto usec = usec_since_epoch % 1000000;

  if (m_config.m_use_human_friendly_time_stamps)
  {
    // Local time zone; the seconds part gets microsecond resolution spliced in.
    const auto local = fmt::localtime(system_clock::to_time_t(called_when));
    fmt::print(m_os, "{:%Y-%m-%d %H:%M:%S}.{:06} {:%z} ", local, usec, local);
  }
  else
  {
    fmt::print(m_os, "{}.{:06} ", sec, usec);
  }
} // Ostream_log_msg_writer::log_time_stamp()

} // namespace ordo::log
