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
#include "ordo/log/config.hpp"
#include <boost/algorithm/string.hpp>
#include <cassert>

namespace ordo::log
{
// Static initializations.

// By definition INFO is the most-verbose severity meant to avoid affecting performance.
const Sev Config::S_MOST_VERBOSE_SEV_DEFAULT = Sev::S_INFO;

// Implementations.

Config::Config(Sev most_verbose_sev_default) :
  m_use_human_friendly_time_stamps(true),
  m_verbosity_default(most_verbose_sev_default)
{
  // Nothing.
}

Config::Component_key Config::component_key(const Component& component)
{
  return Component_key(component.payload_type().hash_code(), component.payload_enum_raw_value());
}

std::string Config::normalized_component_name(util::String_view name)
{
  std::string normalized(name);
  boost::algorithm::to_upper(normalized);
  return normalized;
}

void Config::register_component_name(Component_key key, const std::string& output_name,
                                     const std::string& lookup_name)
{
  // First name registered for a component wins for output; every name works for lookup.
  m_component_names.emplace(key, output_name);
  m_component_keys_by_name[lookup_name] = key;
}

void Config::store_severity_by_component(Component_key key, Sev most_verbose_sev)
{
  util::Lock_guard<util::Mutex_non_recursive> lock(m_verbosities_mutex);
  m_verbosities_by_component[key] = most_verbose_sev;
}

void Config::configure_default_verbosity(Sev most_verbose_sev, bool reset)
{
  util::Lock_guard<util::Mutex_non_recursive> lock(m_verbosities_mutex);
  m_verbosity_default = most_verbose_sev;
  if (reset)
  {
    m_verbosities_by_component.clear();
  }
}

bool Config::configure_component_verbosity_by_name(Sev most_verbose_sev, util::String_view component_name)
{
  const auto key_it = m_component_keys_by_name.find(normalized_component_name(component_name));
  if (key_it == m_component_keys_by_name.end())
  {
    return false;
  }
  // else

  store_severity_by_component(key_it->second, most_verbose_sev);
  return true;
}

bool Config::output_whether_should_log(Sev sev, const Component& component) const
{
  assert(sev != Sev::S_NONE); // S_NONE can be used only as a sentinel.

  util::Lock_guard<util::Mutex_non_recursive> lock(m_verbosities_mutex);
  if (!component.empty())
  {
    const auto sev_it = m_verbosities_by_component.find(component_key(component));
    if (sev_it != m_verbosities_by_component.end())
    {
      return sev <= sev_it->second;
    }
  }
  return sev <= m_verbosity_default;
}

bool Config::output_component_to_ostream(std::ostream* os, const Component& component) const
{
  if (component.empty())
  {
    return false;
  }
  // else

  const auto name_it = m_component_names.find(component_key(component));
  if (name_it == m_component_names.end())
  {
    return false;
  }
  // else

  *os << name_it->second;
  return true;
}

} // namespace ordo::log
