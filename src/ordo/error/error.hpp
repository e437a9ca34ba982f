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

#include "ordo/error/error_fwd.hpp"
#include "ordo/log/log.hpp"
#include "ordo/util/detail/util.hpp"
#include <boost/system/system_error.hpp>
#include <string>

namespace ordo::error
{
// Types.

/**
 * An exception that stores an #Error_code plus a context string naming where the failure was raised.  This is
 * what the `Error_code* err_code = 0` convention throws when `err_code` is null and a failure occurs; and what
 * throwing-only constructors such as col::Lru_cache's throw directly.
 *
 * what() reads `<context>: <message> [<category>:<value>]`, omitting the `<context>: ` part if the context is
 * empty.  Constructed with a falsy code, what() is the context alone.
 */
class Runtime_error :
  public boost::system::system_error
{
public:
  // Constructors/destructor.

  /**
   * Constructs Runtime_error.
   *
   * @param err_code_or_success
   *        The #Error_code describing the error; or a falsy (success) value, if only `context` is of interest.
   * @param context
   *        String describing the context, typically ORDO_UTIL_WHERE_AM_I_STR() of the throw site.
   */
  explicit Runtime_error(const Error_code& err_code_or_success, util::String_view context = "");

  /**
   * Constructs Runtime_error carrying only the context message.
   *
   * @param context
   *        See other constructor.
   */
  explicit Runtime_error(util::String_view context);

  // Methods.

  /**
   * The context given at construction.
   * @return See above.
   */
  const std::string& context() const;

  /**
   * Returns the message described in the class doc header.
   * @return See above.
   */
  const char* what() const noexcept override;

private:
  // Data.

  /// See context().
  const std::string m_context;

  /// See what().  Composed once at construction.
  const std::string m_what;
}; // class Runtime_error

// Template implementations.

template<typename Func, typename Ret>
bool exec_and_throw_on_error(const Func& func, Ret* ret, Error_code* err_code, util::String_view context)
{
  if (err_code)
  {
    // Caller can now assume non-null err_code and do the real work.
    return false;
  }
  // else

  Error_code our_err_code;
  *ret = func(&our_err_code);
  if (our_err_code)
  {
    throw Runtime_error(our_err_code, context);
  }
  // else
  return true;
} // exec_and_throw_on_error()

} // namespace ordo::error

// Macros.

/**
 * Sets `*err_code` to `ARG_val` and logs a WARNING describing it.  Requires `err_code` (non-null `Error_code*`)
 * and logging context (`get_logger()`, `get_log_component()`) to be in scope.
 *
 * @param ARG_val
 *        Value convertible to #Error_code.
 */
#define ORDO_ERROR_EMIT_ERROR(ARG_val) \
  ORDO_UTIL_SEMICOLON_SAFE \
  ( \
    ::ordo::Error_code ORDO_ERROR_EMIT_ERR_val(ARG_val); \
    ORDO_LOG_WARNING("Error code emitted: [" << ORDO_ERROR_EMIT_ERR_val << "] " \
                     "[" << ORDO_ERROR_EMIT_ERR_val.message() << "]."); \
    *err_code = ORDO_ERROR_EMIT_ERR_val; \
  )

/**
 * Logs a WARNING describing the given error code, without emitting it anywhere.
 *
 * @param ARG_val
 *        Value convertible to #Error_code.
 */
#define ORDO_ERROR_LOG_ERROR(ARG_val) \
  ORDO_UTIL_SEMICOLON_SAFE \
  ( \
    ::ordo::Error_code ORDO_ERROR_LOG_ERR_val(ARG_val); \
    ORDO_LOG_WARNING("Error occurred: [" << ORDO_ERROR_LOG_ERR_val << "] " \
                     "[" << ORDO_ERROR_LOG_ERR_val.message() << "]."); \
  )

/**
 * Narrow-use macro that implements the error code/exception semantics expected of most public Ordo methods that
 * can fail and return a value, in the case where the user passes a null `err_code`.  Place it at the top of such a
 * method `M(..., Error_code* err_code = 0)`: if `err_code` is null, it re-invokes `M` with a real `Error_code*`
 * (named `_1` in the argument list) and either returns its result or throws error::Runtime_error.  Otherwise it does
 * nothing, and the rest of `M` proceeds with a non-null `err_code`.
 *
 * @param ARG_ret_type
 *        The return type of `M`.  Must be default-constructible and contain no unparenthesized commas.
 * @param ARG_function_name
 *        `M` itself (suitable for calling; so prefix it with `this->` or a namespace as needed).
 * @param ...
 *        The arguments to `M`, with `_1` in place of `err_code`.
 */
#define ORDO_ERROR_EXEC_AND_THROW_ON_ERROR(ARG_ret_type, ARG_function_name, ...) \
  ORDO_UTIL_SEMICOLON_SAFE \
  ( \
    ARG_ret_type result; \
    if (::ordo::error::exec_and_throw_on_error \
          ([&](::ordo::Error_code* _1) -> ARG_ret_type \
             { return ARG_function_name(__VA_ARGS__); }, \
           &result, err_code, ORDO_UTIL_WHERE_AM_I_LITERAL(ARG_function_name))) \
    { \
      return result; \
    } \
    /* else: err_code is non-null; the invoker proceeds. */ \
  )
