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

#include "ordo/util/util_fwd.hpp"
#include <boost/iostreams/stream.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/noncopyable.hpp>

namespace ordo::util
{

/**
 * Similar to `ostringstream` but allows fast read-only access directly into the `std::string` being written;
 * and some limited write access to that string.  Also it can take over an existing `std::string`.
 *
 * The log macros use one of these to compose each message before handing it to the Logger.
 */
class String_ostream :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Wraps either the given `std::string` or a newly created empty string if a null pointer is passed.
   *
   * @param target_str
   *        Pointer to the string to append to; null to use an internal string, blank at first.
   *        Accessing `*target_str` other than via this API while `*this` exists is undefined behavior.
   */
  explicit String_ostream(std::string* target_str = nullptr);

  // Methods.

  /**
   * Access to stream that will write to owned string.
   *
   * @return Stream.
   */
  std::ostream& os();

  /**
   * Read-only access to stream that will write to owned string.
   *
   * @return Read-only reference to stream.
   */
  const std::ostream& os() const;

  /**
   * Read-only access to the string being wrapped.  Its address never changes for a given `*this`.
   *
   * @return See above.
   */
  const std::string& str() const;

  /// Performs `std::string::clear()` on the object returned by `str()`.
  void str_clear();

private:
  // Types.

  /// Short-hand for an `ostream` writing to which will append to an std::string it is adapting.
  using String_appender_ostream = boost::iostreams::stream<boost::iostreams::back_insert_device<std::string>>;

  // Data.

  /// Underlying string to use if user chooses not to pass in their own in constructor.  Otherwise unused.
  std::string m_own_target_str;

  /// Pointer to the target string.  Either &m_own_target_str or the user's pointer.
  std::string* const m_target_str;

  /// The output stream adapter, appending to `*m_target_str`.
  String_appender_ostream m_target_appender_ostream;
}; // class String_ostream

} // namespace ordo::util
