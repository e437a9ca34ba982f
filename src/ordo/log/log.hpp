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

#include "ordo/log/log_fwd.hpp"
#include "ordo/util/util.hpp"
#include "ordo/util/string_ostream.hpp"
#include <chrono>
#include <ostream>
#include <typeinfo>
#include <type_traits>

// Macros.  These (conceptually) belong to the ordo::log namespace (hence the prefix for each macro).

/**
 * Logs a WARNING message into ordo::log::Logger `*get_logger()` with ordo::log::Component `get_log_component()`,
 * if such logging is enabled by that Logger.  Supplies context information to be potentially logged with message,
 * like current time, source file/line/function, and thread ID, as well as the message itself.
 *
 * `get_logger()` and `get_log_component()` are typically supplied by a Log_context the calling class derives from;
 * or by ORDO_LOG_SET_CONTEXT() in a free function.
 *
 * @param ARG_stream_fragment
 *        Same as in ORDO_LOG_WITH_CHECKING().
 */
#define ORDO_LOG_WARNING(ARG_stream_fragment) \
  ORDO_LOG_WITH_CHECKING(::ordo::log::Sev::S_WARNING, ARG_stream_fragment)

/**
 * Logs a FATAL message.  Otherwise see ORDO_LOG_WARNING().
 *
 * @param ARG_stream_fragment
 *        Same as in ORDO_LOG_WITH_CHECKING().
 */
#define ORDO_LOG_FATAL(ARG_stream_fragment) \
  ORDO_LOG_WITH_CHECKING(::ordo::log::Sev::S_FATAL, ARG_stream_fragment)

/**
 * Logs an ERROR message.  Otherwise see ORDO_LOG_WARNING().
 *
 * @param ARG_stream_fragment
 *        Same as in ORDO_LOG_WITH_CHECKING().
 */
#define ORDO_LOG_ERROR(ARG_stream_fragment) \
  ORDO_LOG_WITH_CHECKING(::ordo::log::Sev::S_ERROR, ARG_stream_fragment)

/**
 * Logs an INFO message.  Otherwise see ORDO_LOG_WARNING().
 *
 * @param ARG_stream_fragment
 *        Same as in ORDO_LOG_WITH_CHECKING().
 */
#define ORDO_LOG_INFO(ARG_stream_fragment) \
  ORDO_LOG_WITH_CHECKING(::ordo::log::Sev::S_INFO, ARG_stream_fragment)

/**
 * Logs a DEBUG message.  Otherwise see ORDO_LOG_WARNING().
 *
 * @param ARG_stream_fragment
 *        Same as in ORDO_LOG_WITH_CHECKING().
 */
#define ORDO_LOG_DEBUG(ARG_stream_fragment) \
  ORDO_LOG_WITH_CHECKING(::ordo::log::Sev::S_DEBUG, ARG_stream_fragment)

/**
 * Logs a TRACE message.  Otherwise see ORDO_LOG_WARNING().
 *
 * @param ARG_stream_fragment
 *        Same as in ORDO_LOG_WITH_CHECKING().
 */
#define ORDO_LOG_TRACE(ARG_stream_fragment) \
  ORDO_LOG_WITH_CHECKING(::ordo::log::Sev::S_TRACE, ARG_stream_fragment)

/**
 * Logs a DATA message.  Otherwise see ORDO_LOG_WARNING().
 *
 * @param ARG_stream_fragment
 *        Same as in ORDO_LOG_WITH_CHECKING().
 */
#define ORDO_LOG_DATA(ARG_stream_fragment) \
  ORDO_LOG_WITH_CHECKING(::ordo::log::Sev::S_DATA, ARG_stream_fragment)

/**
 * For the rest of the block within which this macro is instantiated, causes all `ORDO_LOG_...()` invocations to
 * log to `ARG_logger_ptr` with component `Component(ARG_component_payload)`, instead of the normal
 * `get_logger()` and `get_log_component()`, if there even such things are available in the block.  This is useful,
 * for example, in free functions, where there is no Log_context to derive from.
 *
 * @param ARG_logger_ptr
 *        `Logger*` to use in subsequent `ORDO_LOG_...()` invocations in this block.  May be null.
 * @param ARG_component_payload
 *        Component payload (an `enum class` value) to use in those invocations.
 */
#define ORDO_LOG_SET_CONTEXT(ARG_logger_ptr, ARG_component_payload) \
  [[maybe_unused]] \
    const auto get_logger \
      = [logger_ptr_copy = static_cast<::ordo::log::Logger*>(ARG_logger_ptr)] \
          () -> ::ordo::log::Logger* { return logger_ptr_copy; }; \
  [[maybe_unused]] \
    const auto get_log_component = [component = ::ordo::log::Component(ARG_component_payload)] \
                                     () -> const ::ordo::log::Component & \
  { \
    return component; \
  }

/**
 * Logs a message of the specified severity into ordo::log::Logger `*get_logger()` with ordo::log::Component
 * `get_log_component()` if such logging is enabled by said Logger.  No-op if `get_logger()` is null.
 *
 * @param ARG_sev
 *        Severity (type ordo::log::Sev).
 * @param ARG_stream_fragment
 *        Fragment of code as if writing to a standard `ostream`.  A terminating newline will be appended by the
 *        Logger and should not be included here.
 */
#define ORDO_LOG_WITH_CHECKING(ARG_sev, ARG_stream_fragment) \
  ORDO_UTIL_SEMICOLON_SAFE \
  ( \
    ::ordo::log::Logger const * const ORDO_LOG_W_CHK_logger = get_logger(); \
    if (ORDO_LOG_W_CHK_logger && ORDO_LOG_W_CHK_logger->should_log(ARG_sev, get_log_component())) \
    { \
      ORDO_LOG_WITHOUT_CHECKING(ARG_sev, ARG_stream_fragment); \
    } \
  )

/**
 * Identical to ORDO_LOG_WITH_CHECKING() but foregoes the filter (Logger::should_log()) check.  No-op if
 * `get_logger()` returns null.
 *
 * @warning If invoking this directly, the caller must manually ensure the severity is enabled in the Logger.
 *
 * @param ARG_sev
 *        See ORDO_LOG_WITH_CHECKING().
 * @param ARG_stream_fragment
 *        See ORDO_LOG_WITH_CHECKING().
 */
#define ORDO_LOG_WITHOUT_CHECKING(ARG_sev, ARG_stream_fragment) \
  ORDO_UTIL_SEMICOLON_SAFE \
  ( \
    ::ordo::log::Logger* const ORDO_LOG_WO_CHK_logger = get_logger(); \
    if (!ORDO_LOG_WO_CHK_logger) \
    { \
      break; \
    } \
    /* else */ \
    ::ordo::util::String_ostream ORDO_LOG_WO_CHK_msg_os; \
    ORDO_LOG_WO_CHK_msg_os.os() << ARG_stream_fragment; \
    /* Filled member by member: a braced initializer here would split into several macro arguments. */ \
    ::ordo::log::Msg_metadata ORDO_LOG_WO_CHK_metadata; \
    ORDO_LOG_WO_CHK_metadata.m_msg_component = get_log_component(); \
    ORDO_LOG_WO_CHK_metadata.m_msg_sev = ARG_sev; \
    ORDO_LOG_WO_CHK_metadata.m_msg_src_file \
      = ::ordo::util::get_last_path_segment(::ordo::util::String_view(__FILE__, sizeof(__FILE__) - 1)); \
    ORDO_LOG_WO_CHK_metadata.m_msg_src_line = __LINE__; \
    ORDO_LOG_WO_CHK_metadata.m_msg_src_function = ::ordo::util::String_view(__FUNCTION__, sizeof(__FUNCTION__) - 1); \
    ORDO_LOG_WO_CHK_metadata.m_called_when = ::std::chrono::system_clock::now(); \
    ORDO_LOG_WO_CHK_metadata.m_call_thread_id = ::ordo::util::this_thread_id(); \
    ORDO_LOG_WO_CHK_logger->do_log(&ORDO_LOG_WO_CHK_metadata, \
                                   ::ordo::util::String_view(ORDO_LOG_WO_CHK_msg_os.str())); \
  )

namespace ordo::log
{
// Types.

/**
 * A light-weight class, each object storing a *component* payload encoding an `enum` value from `enum` type of
 * user's choice, and a light-weight ID of that `enum` type itself.  A Component is supplied, at every log call site,
 * along with the message; Log_context (or ORDO_LOG_SET_CONTEXT()) stores one so it need not be typed out each time.
 *
 * A Component can be empty (default-constructed), in which case every Logger must still accept the message.
 */
class Component
{
public:
  // Types.

  /// The type `Payload` must be `enum class Payload : enum_raw_t`: an `enum` type encoded via this integer type.
  using enum_raw_t = unsigned int;

  // Constructors/destructor.

  /// Constructs a Component that stores no payload: empty() returns `true`.
  Component();

  /**
   * Constructs a Component with the given payload of an `enum class : Component::enum_raw_t` type.
   *
   * @tparam Payload
   *         See above.
   * @param payload
   *        The payload value.
   */
  template<typename Payload>
  Component(Payload payload);

  // Methods.

  /**
   * Returns `true` if `*this` stores no payload.
   * @return See above.
   */
  bool empty() const;

  /**
   * Returns reference to the `typeid` of the `Payload` type of the stored payload.  Behavior undefined if empty().
   * @return See above.
   */
  const std::type_info& payload_type() const;

  /**
   * Returns the stored payload converted to the given `enum` type.  Behavior undefined if empty() or if `Payload`
   * is not the type stored.
   *
   * @tparam Payload
   *         See payload_type().
   * @return See above.
   */
  template<typename Payload>
  Payload payload() const;

  /**
   * Returns the stored payload's numeric value.  Behavior undefined if empty().
   * @return See above.
   */
  enum_raw_t payload_enum_raw_value() const;

private:
  // Data.

  /// `&typeid(Payload)`; or null if empty().
  std::type_info const * m_payload_type_or_null;

  /// The `enum` value of the payload, as its underlying integer.
  enum_raw_t m_payload_enum_raw_value;
}; // class Component

/**
 * Simple data store containing all of the information generated at every logging call site by ordo::log, except
 * the message itself, which is passed to Logger::do_log() separately.
 */
struct Msg_metadata
{
  // Data.

  /// Component of message, as of this writing coming from either Log_context constructor or ORDO_LOG_SET_CONTEXT().
  Component m_msg_component;

  /// Severity of message, typically determined by choice of macro (e.g., ORDO_LOG_WARNING()) at the call site.
  Sev m_msg_sev;

  /// Source file name, with any directories stripped.  Points to a literal; valid for the program's lifetime.
  util::String_view m_msg_src_file;

  /// Copy of integer `__LINE__` of the log call site.
  unsigned int m_msg_src_line;

  /// Copy of `__FUNCTION__` of the log call site.  Points to a literal; valid for the program's lifetime.
  util::String_view m_msg_src_function;

  /// Time stamp from as close as possible to entry into the log call site (usually `ORDO_LOG_WARNING()` or similar).
  std::chrono::system_clock::time_point m_called_when;

  /// Thread ID of the thread from which the message originated.
  util::Thread_id m_call_thread_id;
}; // struct Msg_metadata

/**
 * Interface that the user should implement, passing the implementing Logger into logging classes (Ordo's own
 * classes like col::Lru_cache; and user's own logging classes) at construction (plus free/`static` logging
 * functions).  The class (or function) will then implicitly use that Logger in the logging piece of the
 * `ORDO_LOG_...()` macros.
 *
 * Each Logger decides, via should_log(), which messages pass; and then does whatever it wants with the message
 * in do_log().  The two implementations here are synchronous: do_log() returns after the message is written.
 *
 * ### Thread safety ###
 * should_log() and do_log() may be called concurrently from any threads; implementations must be safe for that.
 */
class Logger :
  public util::Null_interface
{
public:
  // Methods.

  /**
   * Given attributes of a hypothetical message that would be logged, return `true` if that message should be logged
   * and `false` otherwise.
   *
   * @param sev
   *        Severity of the message.
   * @param component
   *        Component of the message.  May be empty().
   * @return `true` if and only if the message should be passed to do_log().
   */
  virtual bool should_log(Sev sev, const Component& component) const = 0;

  /**
   * Given a message and its severity, logs that message and possibly severity WITHOUT checking whether it should
   * be logged (i.e., without performing logic that should_log() performs).
   *
   * @param metadata
   *        All information to potentially log in addition to `msg`.  Valid only for the duration of the call.
   * @param msg
   *        The message.  Valid only for the duration of the call.
   */
  virtual void do_log(Msg_metadata* metadata, util::String_view msg) = 0;
}; // class Logger

/**
 * Convenience class that simply stores a Logger and/or Component passed into a constructor; and returns this
 * Logger and Component via get_logger() and get_log_component() public accessors.  A class that logs
 * typically derives from it, which makes the `ORDO_LOG_...()` macros work in its member functions.
 */
class Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs Log_context by storing the given pointer to a Logger and a null Component.
   *
   * @param logger
   *        Pointer to store.  Rationale for providing the null default: To facilitate subclass `= default` no-arg
   *        constructors.
   */
  explicit Log_context(Logger* logger = 0);

  /**
   * Constructs Log_context by storing the given pointer to a Logger and a new Component storing the
   * specified generically typed payload (an `enum` value).
   *
   * @tparam Component_payload
   *         See Component constructor.
   * @param logger
   *        Pointer to store.
   * @param component_payload
   *        See Component constructor.
   */
  template<typename Component_payload>
  explicit Log_context(Logger* logger, Component_payload component_payload);

  // Methods.

  /**
   * Returns the stored Logger pointer, particularly as many `ORDO_LOG_*()` macros expect.
   *
   * @return See above.
   */
  Logger* get_logger() const;

  /**
   * Returns reference to the stored Component object, particularly as many `ORDO_LOG_*()` macros expect.
   *
   * @return See above.
   */
  const Component& get_log_component() const;

  /**
   * Swaps Logger pointers and Component objects held by `*this` and `other`.
   *
   * @param other
   *        Other object.
   */
  void swap(Log_context& other);

private:
  // Data.

  /// The held Logger pointer.  Non-`const` to allow assignment to work.
  Logger* m_logger;
  /// The held Component object.  Non-`const` to allow assignment to work.
  Component m_component;
}; // class Log_context

// Free functions.

/**
 * Log_context ADL-friendly swap: Equivalent to `val1.swap(val2)`.
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 */
void swap(Log_context& val1, Log_context& val2);

// Template implementations.

template<typename Payload>
Component::Component(Payload payload) :
  m_payload_type_or_null(&(typeid(Payload))),
  m_payload_enum_raw_value(static_cast<enum_raw_t>(payload))
{
  static_assert(std::is_enum_v<Payload>, "Payload type must be an enum.");
  static_assert(std::is_same_v<typename std::underlying_type_t<Payload>, enum_raw_t>,
                "Payload enum underlying type must equal enum_raw_t.");
}

template<typename Payload>
Payload Component::payload() const
{
  return static_cast<Payload>(m_payload_enum_raw_value);
}

template<typename Component_payload>
Log_context::Log_context(Logger* logger, Component_payload component_payload) :
  m_logger(logger),
  m_component(component_payload)
{
  // Nothing.
}

} // namespace ordo::log
