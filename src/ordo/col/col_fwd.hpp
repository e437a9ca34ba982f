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
#include <boost/container_hash/hash.hpp>
#include <functional>
#include <iosfwd>

/**
 * Ordo module containing the ordered-collection engines: the Map and Set contracts and their backends.
 *
 * Three map backends satisfy one contract (Map), so callers can swap them without touching call sites:
 *   - Hash_map: a hash table; no order.
 *   - Array_map: two parallel arrays; insertion order, linear-time lookup.  Good for few entries.
 *   - Linked_hash_map: a hash index over a doubly linked list; insertion order with O(1) lookup, plus O(1)
 *     reordering (Reorderable), which is what Lru_cache is built on.
 *
 * Basic_map_set turns any of them into a Set by mapping each element to Unit.
 *
 * None of these is internally synchronized.  None throws (except on allocation failure); absence of a key is
 * reported through a `bool` result and a zero value.
 */
namespace ordo::col
{
// Types.

// Find doc headers near the bodies of these compound types.

template<typename Key, typename Mapped>
struct Entry;

template<typename Key, typename Mapped>
class Map;

template<typename Key>
class Reorderable;

template<typename Key, typename Mapped, typename Hash = boost::hash<Key>, typename Pred = std::equal_to<Key>>
class Hash_map;

template<typename Key, typename Mapped, typename Pred = std::equal_to<Key>>
class Array_map;

template<typename Key, typename Mapped, typename Hash = boost::hash<Key>, typename Pred = std::equal_to<Key>>
class Linked_hash_map;

template<typename T>
class Set;

template<typename T, typename Backend_map>
class Basic_map_set;

template<typename Key, typename Mapped>
class Lru_cache;

/// The value type stored by the map inside a Set: it carries no information.
struct Unit {};

/**
 * Set of `T` backed by a Hash_map: no order.
 *
 * @tparam T
 *         Element type.
 */
template<typename T>
using Hash_set = Basic_map_set<T, Hash_map<T, Unit>>;

/**
 * Set of `T` backed by an Array_map: insertion order.
 *
 * @tparam T
 *         Element type.
 */
template<typename T>
using Array_set = Basic_map_set<T, Array_map<T, Unit>>;

/**
 * Set of `T` backed by a Linked_hash_map: insertion order, plus `move_to_end()` and `move_to_front()`.
 *
 * @tparam T
 *         Element type.
 */
template<typename T>
using Linked_set = Basic_map_set<T, Linked_hash_map<T, Unit>>;

/**
 * Enumerates the map backends, for choosing one at run time (see make_map() and cfg::Container_options).
 * Stream I/O is supplied and is suitable for util::istream_to_enum(), hence also for boost.program_options.
 */
enum class Backend
{
  /// Hash_map.
  S_HASH = 0,
  /// Array_map.
  S_ARRAY,
  /// Linked_hash_map.
  S_LINKED_HASH,
  /// Sentinel: not a backend.  Also the result of reading an unrecognized name.
  S_END_SENTINEL
};

// Free functions.

/**
 * Serializes a Backend: "HASH", "ARRAY" or "LINKED_HASH".
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Backend val);

/**
 * Deserializes a Backend, case-insensitively; a number is also accepted.  An unrecognized token yields
 * Backend::S_END_SENTINEL.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Backend& val);

} // namespace ordo::col
