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

#include "ordo/col/entry.hpp"
#include "ordo/util/util.hpp"
#include <cstddef>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace ordo::col
{

/**
 * The reordering capability: an interface implemented by map backends that keep an explicit order which can be
 * changed in constant time, namely Linked_hash_map.  It is the building block for LRU eviction (see Lru_cache):
 * move_to_end() marks an entry most recently used; the front is then the least recently used one.
 *
 * Given a Map, use Map::reorderable() to find out whether it has this capability.
 *
 * @tparam Key_t
 *         Key type.
 */
template<typename Key_t>
class Reorderable :
  public util::Null_interface
{
public:
  // Types.

  /// Convenience alias for template arg.
  using Key = Key_t;

  // Methods.

  /**
   * Moves the entry with the given key to the end of the order.  If it is already there, does nothing.
   *
   * @param key
   *        Key.
   * @return `false` if there is no such key (nothing changes); `true` otherwise.
   */
  virtual bool move_to_end(const Key& key) = 0;

  /**
   * Moves the entry with the given key to the front of the order.  If it is already there, does nothing.
   *
   * @param key
   *        Key.
   * @return `false` if there is no such key (nothing changes); `true` otherwise.
   */
  virtual bool move_to_front(const Key& key) = 0;
}; // class Reorderable

/**
 * The map contract: an associative container of unique #Key to #Mapped, implemented by the backends Hash_map,
 * Array_map and Linked_hash_map.  Code holding a `Map&` (or a Map::Ptr from make_map()) works identically with any of
 * them; the backends differ only in order of enumeration and in performance.
 *
 * ### Order ###
 * keys(), values(), entries(), each() and `operator<<` all enumerate in the same order, which is the backend's:
 * unspecified for Hash_map; insertion order for the other two.  Overwriting the value of an existing key never
 * changes that key's position.
 *
 * ### Absent keys ###
 * Nothing here fails.  A lookup or removal of a key that is not present returns `false` and reports the zero value
 * `Mapped{}` through its out-arg.
 *
 * ### Thread safety ###
 * None: no two threads may access one Map concurrently unless all accesses are `const`.
 *
 * @tparam Key_t
 *         Key type.  Copyable; equality-comparable (and hashable, for the hash-based backends) according to the
 *         backend's `Pred` (and `Hash`).
 * @tparam Mapped_t
 *         Value type.  Copyable and default-constructible.
 */
template<typename Key_t, typename Mapped_t>
class Map :
  public util::Null_interface
{
public:
  // Types.

  /// Convenience alias for template arg.
  using Key = Key_t;

  /// Convenience alias for template arg.
  using Mapped = Mapped_t;

  /// Short-hand for the (key, value) snapshot type.
  using Map_entry = Entry<Key, Mapped>;

  /// Expresses sizes/lengths of relevant things.
  using size_type = std::size_t;

  /// Short-hand for the function type invoked by each().
  using Visitor = Function<void (const Key&, const Mapped&)>;

  /// Short-hand for a uniquely owned Map of some backend, as returned by make_map().
  using Ptr = std::unique_ptr<Map>;

  // Methods.

  /**
   * Maps `key` to `value`: inserts the key (at the end of the order, if the backend has one) if it is not present;
   * otherwise overwrites its value in place.
   *
   * @param key
   *        Key.
   * @param value
   *        Value.
   * @return `*this`.
   */
  virtual Map& put(Key key, Mapped value) = 0;

  /**
   * Looks up `key` without modifying anything.
   *
   * @param key
   *        Key.
   * @param value
   *        If not null: receives the mapped value; or `Mapped{}` if absent.
   * @return `true` if and only if `key` is present.
   */
  virtual bool get(const Key& key, Mapped* value = 0) const = 0;

  /**
   * Removes `key`, if present.  The rest of the order is unchanged.
   *
   * @param key
   *        Key.
   * @param prior_value
   *        If not null: receives the value `key` had; or `Mapped{}` if absent.
   * @return `true` if and only if `key` was present (and is now gone).
   */
  virtual bool del(const Key& key, Mapped* prior_value = 0) = 0;

  /**
   * Returns `true` if and only if `key` is present; same as `get(key)`.
   *
   * @param key
   *        Key.
   * @return See above.
   */
  virtual bool contains(const Key& key) const = 0;

  /**
   * Returns a copy of all keys, in order.
   * @return See above.
   */
  virtual std::vector<Key> keys() const = 0;

  /**
   * Returns a copy of all values, in the same order as keys().
   * @return See above.
   */
  virtual std::vector<Mapped> values() const = 0;

  /**
   * Removes everything.  `*this` remains usable.
   * @return `*this`.
   */
  virtual Map& clear() = 0;

  /**
   * Returns the number of keys.  Constant-time.
   * @return See above.
   */
  virtual size_type size() const = 0;

  /**
   * Returns `size() == 0`.
   * @return See above.
   */
  virtual bool empty() const = 0;

  /**
   * Invokes `visitor(key, value)` for each entry, in order.  `visitor` must not modify `*this`.
   *
   * @param visitor
   *        Function to invoke.
   */
  virtual void each(const Visitor& visitor) const = 0;

  /**
   * Returns the reordering capability of this backend, or null if it has none.  Default: null.
   * @return See above.
   */
  virtual Reorderable<Key>* reorderable();

  /**
   * Returns a copy of all (key, value) pairs, in order.
   * @return See above.
   */
  std::vector<Map_entry> entries() const;

  /**
   * Returns the `operator<<` rendering of `*this`: `map[k1:v1 k2:v2]` (or `map[]`).
   * @return See above.
   */
  std::string to_string() const;
}; // class Map

// Free functions.

/**
 * Prints the entries of `val`, in order, as `map[k1:v1 k2:v2]`; or `map[]` if empty.
 *
 * @relatesalso Map
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename Key_t, typename Mapped_t>
std::ostream& operator<<(std::ostream& os, const Map<Key_t, Mapped_t>& val);

// Template implementations.

template<typename Key_t, typename Mapped_t>
Reorderable<Key_t>* Map<Key_t, Mapped_t>::reorderable() // Virtual.
{
  return 0;
}

template<typename Key_t, typename Mapped_t>
std::vector<typename Map<Key_t, Mapped_t>::Map_entry> Map<Key_t, Mapped_t>::entries() const
{
  std::vector<Map_entry> result;
  result.reserve(size());
  each([&](const Key& key, const Mapped& value) { result.push_back(Map_entry{key, value}); });
  return result;
}

template<typename Key_t, typename Mapped_t>
std::string Map<Key_t, Mapped_t>::to_string() const
{
  return util::ostream_op_string(*this);
}

template<typename Key_t, typename Mapped_t>
std::ostream& operator<<(std::ostream& os, const Map<Key_t, Mapped_t>& val)
{
  os << "map[";
  bool first = true;
  val.each([&](const Key_t& key, const Mapped_t& value)
  {
    if (!first)
    {
      os << ' ';
    }
    first = false;
    os << key << ':' << value;
  });
  return os << ']';
}

} // namespace ordo::col
