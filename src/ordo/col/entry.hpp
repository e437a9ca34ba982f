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

#include "ordo/col/col_fwd.hpp"
#include <ostream>

namespace ordo::col
{

/**
 * A (key, value) snapshot, as returned by Map::entries() and similar.  It is a copy: modifying it does not affect
 * the container it came from.
 *
 * @tparam Key_t
 *         Key type.
 * @tparam Mapped_t
 *         Value type.
 */
template<typename Key_t, typename Mapped_t>
struct Entry
{
  // Types.

  /// Convenience alias for template arg.
  using Key = Key_t;

  /// Convenience alias for template arg.
  using Mapped = Mapped_t;

  // Data.

  /// The key.
  Key m_key;

  /// The value mapped to #m_key at the time of the snapshot.
  Mapped m_value;
}; // struct Entry

// Free functions.

/**
 * Returns `true` if and only if both key and value are equal.
 *
 * @relatesalso Entry
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
template<typename Key_t, typename Mapped_t>
bool operator==(const Entry<Key_t, Mapped_t>& val1, const Entry<Key_t, Mapped_t>& val2)
{
  return (val1.m_key == val2.m_key) && (val1.m_value == val2.m_value);
}

/**
 * Negation of the `==` counterpart.
 *
 * @relatesalso Entry
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
template<typename Key_t, typename Mapped_t>
bool operator!=(const Entry<Key_t, Mapped_t>& val1, const Entry<Key_t, Mapped_t>& val2)
{
  return !(val1 == val2);
}

/**
 * Prints `key:value`.
 *
 * @relatesalso Entry
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename Key_t, typename Mapped_t>
std::ostream& operator<<(std::ostream& os, const Entry<Key_t, Mapped_t>& val)
{
  return os << val.m_key << ':' << val.m_value;
}

} // namespace ordo::col
