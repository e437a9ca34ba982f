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
#include <boost/unordered_map.hpp>
#include <string>
#include <utility>

namespace ordo::log
{
// Types.

/**
 * Class used to configure the filtering and logging behavior of the Loggers in this module.  In a given Logger,
 * should_log() is expected to defer to output_whether_should_log(); and the message writer defers to
 * output_component_to_ostream() for the component part of each line.
 *
 * The filter is the most-verbose-allowed Sev: a default one, plus optional per-component overrides, each
 * component being identified by its `enum` type and value.  A component `enum` type can register human-readable
 * names for its values via init_component_names(); the names are then printed in each log line and can be used to
 * configure verbosity via configure_component_verbosity_by_name().
 *
 * ### Thread safety ###
 * init_component_names() must be called before any concurrent use of `*this`.  After that, the `configure_*()`
 * methods may be called concurrently with each other and with the `output_*()` methods.
 */
class Config
{
public:
  // Constants.

  /// Recommended default value for the Config constructor's `most_verbose_sev_default` argument.
  static const Sev S_MOST_VERBOSE_SEV_DEFAULT;

  // Constructors/destructor.

  /**
   * Constructs a conceptually blank but functional set of Config.  Only the default verbosity is set; no component
   * names are registered (so components are not printed).
   *
   * @param most_verbose_sev_default
   *        The most-verbose severity allowed for any component without its own override.
   */
  explicit Config(Sev most_verbose_sev_default = S_MOST_VERBOSE_SEV_DEFAULT);

  // Methods.

  /**
   * Registers the string names of each member of the `enum class Component_payload`, for printing and for
   * configure_component_verbosity_by_name().  If a value has several names, the first one in iteration order is the
   * one printed; all of them are accepted by name-based configuration.
   *
   * @tparam Component_payload
   *         See log::Component.
   * @param component_names
   *        Map from each value to its name(s).  Names are normalized to upper case.
   * @param output_components_numerically
   *        If `true`, the component is printed as its number instead of its name.
   * @param payload_type_prefix_or_empty
   *        If not empty, each name is prefixed with this plus `_` (both for output and for lookup by name).
   *        Useful for distinguishing the components of different `enum` types sharing one Config.
   */
  template<typename Component_payload>
  void init_component_names(const boost::unordered_multimap<Component_payload, std::string>& component_names,
                            bool output_components_numerically = false,
                            util::String_view payload_type_prefix_or_empty = util::String_view());

  /**
   * Given a message severity and component, returns whether the message should be logged, based on the default
   * verbosity and any override for that component.
   *
   * @param sev
   *        Severity of the message.
   * @param component
   *        Component of the message; may be empty, in which case the default verbosity applies.
   * @return See above.
   */
  bool output_whether_should_log(Sev sev, const Component& component) const;

  /**
   * Writes the registered name of the given component to the given stream, if it has one.
   *
   * @param os
   *        Stream to which to write.
   * @param component
   *        Component to print; may be empty.
   * @return `true` if and only if something was written.
   */
  bool output_component_to_ostream(std::ostream* os, const Component& component) const;

  /**
   * Sets the default verbosity to the given value.  If `reset`, also clears any per-component overrides.
   *
   * @param most_verbose_sev
   *        New value.
   * @param reset
   *        See above.
   */
  void configure_default_verbosity(Sev most_verbose_sev, bool reset);

  /**
   * Sets the per-component verbosity override for the given component.
   *
   * @tparam Component_payload
   *         See log::Component.
   * @param most_verbose_sev
   *        New value.
   * @param component_payload
   *        The component to which it applies.
   */
  template<typename Component_payload>
  void configure_component_verbosity(Sev most_verbose_sev, Component_payload component_payload);

  /**
   * Like configure_component_verbosity() but the component is specified by its registered name
   * (case-insensitively, including the prefix, if one was given to init_component_names()).
   *
   * @param most_verbose_sev
   *        New value.
   * @param component_name
   *        Name of the component.
   * @return `true` on success; `false` if the name is not registered.
   */
  bool configure_component_verbosity_by_name(Sev most_verbose_sev, util::String_view component_name);

  // Data.

  /**
   * Config setting: If `true`, time stamps are printed as local date-time; otherwise as seconds.microseconds since
   * the POSIX epoch.  Default: `true`.
   */
  bool m_use_human_friendly_time_stamps;

private:
  // Types.

  /// Identifies a component across `enum` types: (`typeid(Payload).hash_code()`, numeric value).
  using Component_key = std::pair<size_t, Component::enum_raw_t>;

  // Methods.

  /**
   * Returns the key for the given non-empty component.
   *
   * @param component
   *        Non-empty Component.
   * @return See above.
   */
  static Component_key component_key(const Component& component);

  /**
   * Upper-cases the given name, for storage and lookup.
   *
   * @param name
   *        Name.
   * @return See above.
   */
  static std::string normalized_component_name(util::String_view name);

  /**
   * Registers one name for one component; helper of init_component_names().
   *
   * @param key
   *        Component.
   * @param output_name
   *        What to print for the component (if it has none yet).
   * @param lookup_name
   *        Name (already normalized) by which to find it in configure_component_verbosity_by_name().
   */
  void register_component_name(Component_key key, const std::string& output_name, const std::string& lookup_name);

  /**
   * Stores the override for the given component.
   *
   * @param key
   *        Component.
   * @param most_verbose_sev
   *        New value.
   */
  void store_severity_by_component(Component_key key, Sev most_verbose_sev);

  // Data.

  /// Protects #m_verbosity_default and #m_verbosities_by_component.
  mutable util::Mutex_non_recursive m_verbosities_mutex;

  /// The most-verbose severity for components without an override.  Protected by #m_verbosities_mutex.
  Sev m_verbosity_default;

  /// Per-component overrides.  Protected by #m_verbosities_mutex.
  boost::unordered_map<Component_key, Sev> m_verbosities_by_component;

  /// What to print for each registered component.  Fixed after init_component_names().
  boost::unordered_map<Component_key, std::string> m_component_names;

  /// Lookup by normalized name.  Fixed after init_component_names().
  boost::unordered_map<std::string, Component_key> m_component_keys_by_name;
}; // class Config

// Template implementations.

template<typename Component_payload>
void Config::init_component_names
       (const boost::unordered_multimap<Component_payload, std::string>& component_names,
        bool output_components_numerically,
        util::String_view payload_type_prefix_or_empty)
{
  std::string prefix;
  if (!payload_type_prefix_or_empty.empty())
  {
    prefix.assign(payload_type_prefix_or_empty);
    prefix += '_';
  }

  for (const auto& name_pair : component_names)
  {
    const Component_key key(component_key(Component(name_pair.first)));
    const auto lookup_name = normalized_component_name(prefix + name_pair.second);
    register_component_name(key,
                            output_components_numerically ? std::to_string(key.second) : lookup_name,
                            lookup_name);
  }
}

template<typename Component_payload>
void Config::configure_component_verbosity(Sev most_verbose_sev, Component_payload component_payload)
{
  store_severity_by_component(component_key(Component(component_payload)), most_verbose_sev);
}

} // namespace ordo::log
