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

#include "ordo/common.hpp"
#include <boost/thread/thread.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/locks.hpp>
#include <iosfwd>
#include <string>
#include <string_view>

/**
 * Ordo module containing miscellaneous general-use facilities that don't fit into any other Ordo module.
 * Mostly these are helpers for the other modules: `ostream`-to-`string` conversion, `enum` parsing, a few
 * synchronization short-hands used by the loggers, and macros used by the logging and error macros.
 */
namespace ordo::util
{
// Types.

// Find doc headers near the bodies of these compound types.

class Null_interface;
class String_ostream;

/// Commonly used `char`-based string view; a/k/a `std::string_view`.
using String_view = std::string_view;

/// Short-hand for standard thread class.  We use boost.thread (for now), as do our loggers.
using Thread = boost::thread;

/// Short-hand for an OS-provided ID of a util::Thread.
using Thread_id = Thread::id;

/// Short-hand for non-reentrant, exclusive mutex.
using Mutex_non_recursive = boost::mutex;

/**
 * Short-hand for advanced-capability RAII lock guard for any mutex, ensuring exclusive ownership of that mutex.
 *
 * @tparam Mutex
 *         A non-recursive or recursive mutex type.  Recommend one of: #Mutex_non_recursive.
 */
template<typename Mutex>
using Lock_guard = boost::unique_lock<Mutex>;

// Free functions.

/**
 * Returns the ID of the calling thread.  Equivalent to `boost::this_thread::get_id()`.
 *
 * @return See above.
 */
Thread_id this_thread_id();

/**
 * Writes to the specified string, as if the given arguments were each passed, via `<<` in sequence,
 * to an `ostringstream`, and then the result were appended to the aforementioned string variable.
 *
 * Tip: It works nicely, 99% as nicely as simply `<<`ing an `ostream`; but certain language subtleties mean
 * you may not be able to (e.g.) pass an `enum class` that has no `<<` defined.
 *
 * @tparam T
 *         Each type `T` is such that `os << t`, with types `T const & t` and `ostream& os`, builds and writes
 *         `t` to `os`, returning lvalue `os`.
 * @param target_str
 *        Pointer to the string to which to append.
 * @param ostream_args
 *        One or more arguments, such as each argument is suitable for `<<` to an `ostream`.
 */
template<typename ...T>
void ostream_op_to_string(std::string* target_str, T const &... ostream_args);

/**
 * Equivalent to ostream_op_to_string() but returns a new `string` by value instead of writing to the caller's
 * `string`.  This is useful at least in constructor initializers, where it is not possible to first
 * declare a stack variable.
 *
 * @tparam T
 *         See ostream_op_to_string().
 * @param ostream_args
 *        See ostream_op_to_string().
 * @return Resulting `std::string`.
 */
template<typename ...T>
std::string ostream_op_string(T const &... ostream_args);

/**
 * "Induction step" version of variadic function template that simply outputs arguments 2+ via
 * `<<` to the given `ostream`, in the order given.
 *
 * @tparam T1
 *         See `ostream_args`.
 * @tparam T_rest
 *         See `ostream_args`.
 * @param os
 *        Pointer to stream to which to sequentially send arguments for output.
 * @param ostream_arg1
 *        First argument.
 * @param remaining_ostream_args
 *        The remaining arguments in the same form as `ostream_args`.
 */
template<typename T1, typename ...T_rest>
void feed_args_to_ostream(std::ostream* os, T1 const & ostream_arg1, T_rest const &... remaining_ostream_args);

/**
 * "Induction base" for a variadic function template, this simply outputs given item to given `ostream` via `<<`.
 *
 * @tparam T
 *         See each of `...T` in ostream_op_to_string().
 * @param os
 *        See ostream_op_to_string().
 * @param only_ostream_arg
 *        See each of `ostream_args` in ostream_op_to_string().
 */
template<typename T>
void feed_args_to_ostream(std::ostream* os, T const & only_ostream_arg);

/**
 * Deserializes an `enum class` value from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character; the resulting string is then mapped to an `Enum`.  If none is
 * recognized, `enum_default` is the result.  The recognized values are:
 *   - "0", "1", ...: Corresponds to the underlying-integer conversion to that `Enum`.  (Can be disabled optionally.)
 *   - Case-[in]sensitive string encoding of the `Enum`, as determined by `operator<<(ostream&)` -- which must exist
 *     (or this will not compile).  Informally we recommend the encoding to be the non-S_-prefix part of the actual
 *     `Enum` member; e.g., `"WARNING"` for log::Sev::S_WARNING.
 *
 * Error semantics: There are no invalid values or exceptions thrown; `enum_default` returned is the worst case.
 *
 * @tparam Enum
 *         An `enum class` whose values from `enum_lowest` up to (excluding) `enum_sentinel` are consecutive,
 *         and for each of which `ostream << Enum` yields a distinct alphanumeric-or-underscore, non-digit-leading
 *         string.
 * @param is_ptr
 *        Stream from which to deserialize.
 * @param enum_default
 *        Value to return if the token matches nothing.
 * @param enum_sentinel
 *        `Enum` value such that all valid deserializable values have numeric conversions strictly lower than it.
 * @param accept_num_encoding
 *        If `true`, a numeric value is accepted as an encoding; otherwise it is not.
 * @param case_sensitive
 *        If `true`, then the token must exactly equal an `ostream<<` encoding; otherwise modulo case.
 * @param enum_lowest
 *        The lowest `Enum` value.
 * @return See above.
 */
template<typename Enum>
Enum istream_to_enum(std::istream* is_ptr, Enum enum_default, Enum enum_sentinel,
                     bool accept_num_encoding = true, bool case_sensitive = false,
                     Enum enum_lowest = Enum(0));

/**
 * Helper for ORDO_UTIL_WHERE_AM_I_STR(): builds the "file:function(line)" string.
 *
 * @param file
 *        File name (presumably already stripped of directories).
 * @param function
 *        Function name.
 * @param line
 *        Line number.
 * @return See above.
 */
std::string get_where_am_i_str(String_view file, String_view function, unsigned int line);

// Macros.

/**
 * Expands to an `ostream` fragment `X` (suitable for, for example: `std::cout << X << ": Hi!"`) containing
 * the file name, function name, and line number at the macro invocation's context.
 */
#define ORDO_UTIL_WHERE_AM_I() \
  ORDO_UTIL_WHERE_AM_I_FROM_ARGS(::ordo::util::get_last_path_segment \
                                   (::ordo::util::String_view(__FILE__, sizeof(__FILE__) - 1)), \
                                 ::ordo::util::String_view(__FUNCTION__, sizeof(__FUNCTION__) - 1), \
                                 __LINE__)

/// Same as ORDO_UTIL_WHERE_AM_I() but evaluates to an `std::string`.
#define ORDO_UTIL_WHERE_AM_I_STR() \
  ::ordo::util::get_where_am_i_str(::ordo::util::get_last_path_segment \
                                     (::ordo::util::String_view(__FILE__, sizeof(__FILE__) - 1)), \
                                   ::ordo::util::String_view(__FUNCTION__, sizeof(__FUNCTION__) - 1), \
                                   __LINE__)

/**
 * Same as ORDO_UTIL_WHERE_AM_I_STR() but with `ARG_function` supplied by the caller, as a literal, instead of
 * `__FUNCTION__`.  Used to give context to exceptions thrown by ORDO_ERROR_EXEC_AND_THROW_ON_ERROR().
 *
 * @param ARG_function
 *        Function name token (not a string).
 */
#define ORDO_UTIL_WHERE_AM_I_LITERAL(ARG_function) \
  ::ordo::util::get_where_am_i_str(::ordo::util::get_last_path_segment \
                                     (::ordo::util::String_view(__FILE__, sizeof(__FILE__) - 1)), \
                                   ::ordo::util::String_view(#ARG_function), \
                                   __LINE__)

/**
 * Use this to create a semicolon-safe version of a "void" functional macro definition consisting of at least two
 * statements; or of one statement that would become two statements by appending a semicolon.
 *
 * @param ARG_func_macro_definition
 *        The intended macro definition, ignoring semicolon safety.
 */
#define ORDO_UTIL_SEMICOLON_SAFE(ARG_func_macro_definition) \
  do \
  { \
    ARG_func_macro_definition \
  } \
  while (false)

} // namespace ordo::util
