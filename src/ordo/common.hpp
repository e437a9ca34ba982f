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

#include <boost/system/error_code.hpp>
#include <boost/unordered_map.hpp>
#include <functional>
#include <string>

/* We build in C++17 mode ourselves, and the headers use `if constexpr`, `std::optional` and friends; so a translation
 * unit `#include`ing ordo/ API headers must do the same. */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any ordo/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for the Ordo project: a family of ordered-collection engines (maps and sets with
 * interchangeable backends) plus the small logging, error and configuration facilities they are packaged with.
 *
 * Each module lives in its own sub-namespace:
 *   - ordo::col: the containers proper -- the Map and Set contracts, the Hash_map, Array_map and Linked_hash_map
 *     backends, the Set adapter and Lru_cache.  This is the reason the project exists.
 *   - ordo::cfg: Container_options, the parsed-from-text knobs selecting a backend and its sizing.
 *   - ordo::log: logging (Logger interface, macros, a couple of concrete loggers).
 *   - ordo::error: error-reporting conventions on top of boost.system.
 *   - ordo::util: miscellany used by the above.
 *
 * The containers themselves neither log nor throw; absence of a key is always reported via a `bool` result.  Only the
 * configuration-driven construction paths can fail, and those report errors via #Error_code (see that doc header).
 */
namespace ordo
{
// Types.

/**
 * Short-hand for a boost.system error code.  Ordo APIs that can fail follow this convention (borrowed wholesale
 * from boost.asio): the last argument is `Error_code* err_code = 0`.
 *   - If `err_code` is not null, then on failure `*err_code` is set to a truthy value, and the method returns
 *     normally (with some "null" return value); on success `*err_code` is set to a falsy (success) value.
 *   - If `err_code` is null, then on failure an ordo::error::Runtime_error (which is a `boost::system::system_error`
 *     storing the code) is thrown; on success the method simply returns.
 *
 * ordo::error::Runtime_error and ORDO_ERROR_EXEC_AND_THROW_ON_ERROR() exist to make implementing this convention
 * nearly free.
 */
using Error_code = boost::system::error_code;

/**
 * Short-hand for polymorphic functor holder.  Exists to be able to write `Function<void (int)>` in our own namespace;
 * it is simply `std::function` with a couple of niceties.
 *
 * @tparam Signature
 *         Same as for `std::function`.
 */
template<typename Signature>
class Function;

/**
 * Specialization that actually defines Function: `std::function` plus empty() and clear().
 *
 * @tparam Result
 *         Return type of the function signature.
 * @tparam Args
 *         Argument types of the function signature.
 */
template<typename Result, typename... Args>
class Function<Result (Args...)> :
  public std::function<Result (Args...)>
{
public:
  // Types.

  /// Short-hand for the base.  We add no data of our own in this subclass, just a handful of APIs.
  using Function_base = std::function<Result (Args...)>;

  // Ctors/destructor.

  /// Inherit all the constructors from #Function_base.  Add none of our own.
  using Function_base::Function_base;

  // Methods.

  /**
   * Returns `true` if and only if `*this` stores no callable target.
   * @return See above.
   */
  bool empty() const noexcept;

  /// Makes it so that empty() is `true`.
  void clear() noexcept;
}; // class Function<Result (Args...)>

/**
 * The ordo::log::Component payload enumeration comprising various log components used by Ordo's own internal
 * logging.  Users of ordo::log in their own projects should define their own such `enum class` and pass its values
 * to Log_context and friends; the two can coexist in one Logger's Config.
 *
 * Values must be consecutive from 0; `S_END_SENTINEL` must be last.
 */
enum class Ordo_log_component : unsigned int
{
  /// Log call sites outside any more specific component.
  S_UNCAT = 0,
  /// Logging from namespace ordo::log.
  S_LOG,
  /// Logging from namespace ordo::col (the containers; in practice Lru_cache).
  S_COL,
  /// Logging from namespace ordo::cfg.
  S_CFG,
  /// Sentinel: not a component.
  S_END_SENTINEL
};

/**
 * Maps each value in ordo::Ordo_log_component to its string name (sans `S_` prefix), for log output and for
 * configuring verbosity by name.  See log::Config::init_component_names().
 */
extern const boost::unordered_multimap<Ordo_log_component, std::string> S_ORDO_LOG_COMPONENT_NAME_MAP;

// Template implementations.

template<typename Result, typename... Args>
bool Function<Result (Args...)>::empty() const noexcept
{
  return !*this;
}

template<typename Result, typename... Args>
void Function<Result (Args...)>::clear() noexcept
{
  *this = {};
}

} // namespace ordo
