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
#include "ordo/cfg/container_options.hpp"
#include "ordo/cfg/error/error.hpp"
#include "ordo/error/error.hpp"
#include "ordo/log/log.hpp"
#include <boost/algorithm/string.hpp>

// Internal macros (#undef at the end of file).

/// @cond
/* -^- Doxygen, please ignore the following.  (Don't want docs generated for temp macro; this is more maintainable
 * than specifying the macro name to omit it, in Doxygen-config EXCLUDE_SYMBOLS.) */

#define ADD_CONFIG_OPTION(ARG_opt, ARG_desc) \
  Container_options::add_config_option(opts_desc, #ARG_opt, &target->ARG_opt, defaults_source.ARG_opt, ARG_desc, \
                                       printout_only)

// -v- Doxygen, please stop ignoring.
/// @endcond

namespace ordo::cfg
{

// Static initializations.

const std::uint64_t Container_options::S_MAX_N_BUCKETS = std::uint64_t(1) << 32;

// Implementations.

Container_options::Container_options() :
  // Plain hash table, as for a map constructed with no particular backend in mind.
  m_st_backend(col::Backend::S_HASH),
  // Let the hash table pick.
  m_st_n_buckets(0),
  m_st_lru_capacity(128)
{
  // Nothing.
}

template<typename Opt_type>
void Container_options::add_config_option(Options_description* opts_desc,
                                          const std::string& opt_id,
                                          Opt_type* target_val, const Opt_type& default_val,
                                          const char* description, bool printout_only) // Static.
{
  using boost::program_options::value;
  if (printout_only)
  {
    opts_desc->add_options()
      (opt_id_to_str(opt_id).c_str(), value<Opt_type>()->default_value(default_val));
  }
  else
  {
    opts_desc->add_options()
      (opt_id_to_str(opt_id).c_str(), value<Opt_type>(target_val)->default_value(default_val),
       description);
  }
}

void Container_options::setup_config_parsing_helper(Options_description* opts_desc,
                                                    Container_options* target,
                                                    const Container_options& defaults_source,
                                                    bool printout_only) // Static.
{
  ADD_CONFIG_OPTION
    (m_st_backend,
     "Which map backend the container factories construct: HASH (hash table, no order), ARRAY (parallel arrays, "
       "insertion order, linear-time lookup) or LINKED_HASH (hash index over a linked list, insertion order with "
       "constant-time lookup and reordering).  Case-insensitive.");
  ADD_CONFIG_OPTION
    (m_st_n_buckets,
     "Initial bucket count of the hash index in HASH and LINKED_HASH backends; 0 lets the hash table choose.  "
       "Ignored by ARRAY.");
  ADD_CONFIG_OPTION
    (m_st_lru_capacity,
     "Maximum number of entries in an LRU cache; inserting a new key into a full cache evicts the least recently "
       "used entry.  Must be at least 1.");
} // Container_options::setup_config_parsing_helper()

void Container_options::setup_config_parsing(Options_description* opts_desc)
{
  // Set up *opts_desc to parse into *this when the caller chooses to.  Take defaults from *this.
  setup_config_parsing_helper(opts_desc, this, *this, false);
}

bool Container_options::validate(Error_code* err_code) const
{
  ORDO_ERROR_EXEC_AND_THROW_ON_ERROR(bool, validate, _1);
  // else

  if ((m_st_backend < col::Backend::S_HASH) || (m_st_backend >= col::Backend::S_END_SENTINEL))
  {
    *err_code = error::Code::S_UNKNOWN_BACKEND;
    return false;
  }
  if (m_st_lru_capacity == 0)
  {
    *err_code = error::Code::S_INVALID_CAPACITY;
    return false;
  }
  if (std::uint64_t(m_st_n_buckets) > S_MAX_N_BUCKETS)
  {
    *err_code = error::Code::S_INVALID_BUCKET_COUNT;
    return false;
  }
  // else

  err_code->clear();
  return true;
} // Container_options::validate()

std::ostream& operator<<(std::ostream& os, const Container_options& opts)
{
  Container_options sink;
  Container_options::Options_description opts_desc{"Container option values"};
  Container_options::setup_config_parsing_helper(&opts_desc, &sink, opts, true);
  return os << opts_desc;
}

std::string Container_options::opt_id_to_str(const std::string& opt_id) // Static.
{
  using boost::algorithm::starts_with;
  using boost::algorithm::replace_all;
  using std::string;

  const string STATIC_PREFIX = "m_st_";

  string str = opt_id;
  if (starts_with(opt_id, STATIC_PREFIX))
  {
    str.erase(0, STATIC_PREFIX.size());
  }

  replace_all(str, "_", "-");
  return str;
}

bool parse_config_stream(std::istream& is, Container_options* opts, log::Logger* logger_ptr, Error_code* err_code)
{
  namespace opts_ns = boost::program_options;

  ORDO_ERROR_EXEC_AND_THROW_ON_ERROR(bool, parse_config_stream, is, opts, logger_ptr, _1);
  // else

  ORDO_LOG_SET_CONTEXT(logger_ptr, Ordo_log_component::S_CFG);

  // Parse into a fresh object: *opts changes only if everything succeeds.
  Container_options parsed;
  Container_options::Options_description opts_desc("Container options");
  parsed.setup_config_parsing(&opts_desc);

  try
  {
    opts_ns::variables_map vm;
    opts_ns::store(opts_ns::parse_config_file(is, opts_desc), vm);
    opts_ns::notify(vm);
  }
  catch (const opts_ns::error& exc)
  {
    ORDO_LOG_WARNING("Container options text could not be parsed: [" << exc.what() << "].");
    ORDO_ERROR_EMIT_ERROR(error::Code::S_OPTION_PARSE_FAILED);
    return false;
  }

  Error_code validate_err_code;
  if (!parsed.validate(&validate_err_code))
  {
    ORDO_LOG_WARNING("Container options parsed but invalid: backend [" << parsed.m_st_backend << "], "
                     "n-buckets [" << parsed.m_st_n_buckets << "], lru-capacity [" << parsed.m_st_lru_capacity << "].");
    ORDO_ERROR_EMIT_ERROR(validate_err_code);
    return false;
  }
  // else

  ORDO_LOG_INFO("Container options parsed: backend [" << parsed.m_st_backend << "], "
                "n-buckets [" << parsed.m_st_n_buckets << "], lru-capacity [" << parsed.m_st_lru_capacity << "].");
  *opts = parsed;
  err_code->clear();
  return true;
} // parse_config_stream()

} // namespace ordo::cfg

#undef ADD_CONFIG_OPTION
