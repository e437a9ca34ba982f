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

#include "ordo/cfg/cfg_fwd.hpp"
#include "ordo/col/col_fwd.hpp"
#include <boost/program_options.hpp>
#include <cstdint>
#include <string>

namespace ordo::cfg
{
// Types.

/**
 * A set of low-level options affecting the construction of ordo::col containers through the factories in
 * col/factory.hpp.  Like a typical option `struct` it is default-constructed to the recommended values, after which
 * the user may modify the public members directly or load them from text via parse_config_stream().
 *
 * All members are prefixed `m_st_`: they are static options, read once when a container is constructed.
 *
 * Option names for boost.program_options are the member names minus `m_st_`, with `_` replaced by `-`.
 */
struct Container_options
{
  // Types.

  /// Short-hand for boost.program_options config options description.  See setup_config_parsing().
  using Options_description = boost::program_options::options_description;

  // Constants.

  /// Largest allowed #m_st_n_buckets.  Not every value up to it fits in `size_t` on every platform.
  static const std::uint64_t S_MAX_N_BUCKETS;

  // Constructors/destructor.

  /// Constructs a Container_options with values equal to those used by Ordo when the user does not specify any.
  Container_options();

  // Methods.

  /**
   * Modifies a boost.program_options options description object to enable subsequent parsing of a command line
   * or config file into the members of `*this`.  Defaults are taken from the current values in `*this`.
   *
   * @param opts_desc
   *        The #Options_description object into which to load the help information, defaults, and mapping to members
   *        of `*this`.
   */
  void setup_config_parsing(Options_description* opts_desc);

  /**
   * Checks the values in `*this` for consistency.
   *
   * @param err_code
   *        See ordo::Error_code docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_UNKNOWN_BACKEND, error::Code::S_INVALID_CAPACITY, error::Code::S_INVALID_BUCKET_COUNT.
   * @return `true` if valid; `false` otherwise (if `err_code` is not null).
   */
  bool validate(Error_code* err_code = 0) const;

  // Data.

  /// Which map backend the factories construct.
  col::Backend m_st_backend;

  /// Initial bucket count for the hash-based backends; 0 means the library default.  Ignored by Array_map.
  size_t m_st_n_buckets;

  /// Capacity of a cache made by col::make_lru_cache().  Must be at least 1.
  size_t m_st_lru_capacity;

private:
  // Friends.

  // Friend of Container_options: For access to our internals.
  friend std::ostream& operator<<(std::ostream& os, const Container_options& opts);

  // Methods.

  /**
   * Helper that, for a given option `m_blah`, takes something like `"m_st_blah_blah"` and returns the similar
   * program_options option name `"blah-blah"`.
   *
   * @param opt_id
   *        A string whose content equals the name of a member, e.g., `"m_st_lru_capacity"`.
   * @return See above.
   */
  static std::string opt_id_to_str(const std::string& opt_id);

  /**
   * Loads the full set of boost.program_options config options into the given Options_description, mapped to the
   * members of `*target` with defaults from `defaults_source`.
   *
   * @param opts_desc
   *        The Options_description object to load.
   * @param target
   *        The object whose members the parsed values are stored into.
   * @param defaults_source
   *        Where the default values come from.
   * @param printout_only
   *        If `true`, `opts_desc` is only good for printing (values shown as defaults, no descriptions).
   */
  static void setup_config_parsing_helper(Options_description* opts_desc,
                                          Container_options* target,
                                          const Container_options& defaults_source,
                                          bool printout_only);

  /**
   * Adds one option to `*opts_desc`.  Helper of setup_config_parsing_helper().
   *
   * @tparam Opt_type
   *         The type of the option (such as `size_t`).
   * @param opts_desc
   *        See setup_config_parsing_helper().
   * @param opt_id
   *        Member name; see opt_id_to_str().
   * @param target_val
   *        Where the parsed value is stored.
   * @param default_val
   *        Default value.
   * @param description
   *        Help text.
   * @param printout_only
   *        See setup_config_parsing_helper().
   */
  template<typename Opt_type>
  static void add_config_option(Options_description* opts_desc,
                                const std::string& opt_id,
                                Opt_type* target_val, const Opt_type& default_val,
                                const char* description, bool printout_only);
}; // struct Container_options

} // namespace ordo::cfg
