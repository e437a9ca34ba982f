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

#include "ordo/col/map.hpp"
#include <cassert>
#include <initializer_list>
#include <utility>

namespace ordo::col
{

/**
 * Map backend storing keys and values in two index-aligned arrays, in insertion order.  Lookup is a linear scan,
 * so this suits small maps, where it beats hashing on both memory and speed.
 *
 * Invariant: `m_keys.size() == m_values.size()`; `m_values[i]` is the value of `m_keys[i]`; and the array order is
 * the insertion order.  del() closes the gap by shifting, keeping the relative order of the rest.  clear() truncates
 * both arrays but keeps their capacity.
 *
 * @tparam Key_t
 *         Key type.  See Map.
 * @tparam Mapped_t
 *         Value type.  See Map.
 * @tparam Pred_t
 *         Equality functor type: `bool (const Key&, const Key&)`.
 */
template<typename Key_t, typename Mapped_t, typename Pred_t>
class Array_map :
  public Map<Key_t, Mapped_t>
{
public:
  // Types.

  /// Short-hand for our base class.
  using Base = Map<Key_t, Mapped_t>;

  /// Convenience alias for template arg.
  using Key = Key_t;

  /// Convenience alias for template arg.
  using Mapped = Mapped_t;

  /// Convenience alias for template arg.
  using Pred = Pred_t;

  /// Short-hand for key/mapped-value pairs, as accepted by the `initializer_list` constructor.
  using Value = std::pair<Key, Mapped>;

  /// Expresses sizes/lengths of relevant things.
  using size_type = typename Base::size_type;

  /// Short-hand for the function type invoked by each().
  using Visitor = typename Base::Visitor;

  // Constructors/destructor.

  /**
   * Constructs empty structure.
   *
   * @param pred
   *        Instance of the equality function type.
   */
  explicit Array_map(const Pred& pred = Pred{});

  /**
   * Constructs structure with the given contents, as if by `put()`ting each pair in order.
   *
   * @param values
   *        Values with which to fill the structure.
   * @param pred
   *        See other constructor.
   */
  explicit Array_map(std::initializer_list<Value> values, const Pred& pred = Pred{});

  // Methods.

  /**
   * Implements Map::put(): overwrites in place if found by linear scan; otherwise appends.
   *
   * @param key
   *        Key.
   * @param value
   *        Value.
   * @return `*this`.
   */
  Array_map& put(Key key, Mapped value) override;

  /**
   * Implements Map::get() via linear scan.
   *
   * @param key
   *        Key.
   * @param value
   *        See Map::get().
   * @return See Map::get().
   */
  bool get(const Key& key, Mapped* value = 0) const override;

  /**
   * Implements Map::del(): linear scan, then shift of everything after the removed position.
   *
   * @param key
   *        Key.
   * @param prior_value
   *        See Map::del().
   * @return See Map::del().
   */
  bool del(const Key& key, Mapped* prior_value = 0) override;

  /**
   * Implements Map::contains() via linear scan.
   *
   * @param key
   *        Key.
   * @return See Map::contains().
   */
  bool contains(const Key& key) const override;

  /**
   * Implements Map::keys(): insertion order.
   * @return See Map::keys().
   */
  std::vector<Key> keys() const override;

  /**
   * Implements Map::values(): insertion order.
   * @return See Map::values().
   */
  std::vector<Mapped> values() const override;

  /**
   * Implements Map::clear(): truncates both arrays, keeping capacity.
   * @return `*this`.
   */
  Array_map& clear() override;

  /**
   * Implements Map::size().
   * @return See Map::size().
   */
  size_type size() const override;

  /**
   * Implements Map::empty().
   * @return See Map::empty().
   */
  bool empty() const override;

  /**
   * Implements Map::each(): insertion order.
   *
   * @param visitor
   *        See Map::each().
   */
  void each(const Visitor& visitor) const override;

  /**
   * Reads the oldest entry.  Constant-time.
   *
   * @param key
   *        If not null: receives the key; or `Key{}` if empty.
   * @param value
   *        If not null: receives the value; or `Mapped{}` if empty.
   * @return `false` if and only if empty().
   */
  bool first(Key* key = 0, Mapped* value = 0) const;

  /**
   * Reads the newest entry.  Constant-time.
   *
   * @param key
   *        If not null: receives the key; or `Key{}` if empty.
   * @param value
   *        If not null: receives the value; or `Mapped{}` if empty.
   * @return `false` if and only if empty().
   */
  bool last(Key* key = 0, Mapped* value = 0) const;

  /**
   * Returns the number of entries the arrays can hold without reallocating.
   * @return See above.
   */
  size_type capacity() const;

  /**
   * Swaps the contents of this structure and `other`.
   *
   * @param other
   *        The other structure.
   */
  void swap(Array_map& other);

private:
  // Methods.

  /**
   * Returns the position of `key` in the arrays, or `size()` if absent.
   *
   * @param key
   *        Key.
   * @return See above.
   */
  size_type find_idx(const Key& key) const;

  /**
   * Helper of first() and last(): reads the entry at `idx` into the out-args, or zero values if empty().
   *
   * @param idx
   *        Position; ignored if empty().
   * @param key
   *        See first().
   * @param value
   *        See first().
   * @return See first().
   */
  bool read_at(size_type idx, Key* key, Mapped* value) const;

  // Data.

  /// Key equality.
  Pred m_pred;

  /// The keys, in insertion order.
  std::vector<Key> m_keys;

  /// The values; `m_values[i]` belongs to `m_keys[i]`.
  std::vector<Mapped> m_values;
}; // class Array_map

// Free functions.

/**
 * Equivalent to `val1.swap(val2)`.
 *
 * @relatesalso Array_map
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 */
template<typename Key_t, typename Mapped_t, typename Pred_t>
void swap(Array_map<Key_t, Mapped_t, Pred_t>& val1, Array_map<Key_t, Mapped_t, Pred_t>& val2);

// Template implementations.

template<typename Key_t, typename Mapped_t, typename Pred_t>
Array_map<Key_t, Mapped_t, Pred_t>::Array_map(const Pred& pred) :
  m_pred(pred)
{
  // That's all.
}

template<typename Key_t, typename Mapped_t, typename Pred_t>
Array_map<Key_t, Mapped_t, Pred_t>::Array_map(std::initializer_list<Value> values, const Pred& pred) :
  Array_map(pred)
{
  m_keys.reserve(values.size());
  m_values.reserve(values.size());
  for (const auto& key_and_mapped : values)
  {
    put(key_and_mapped.first, key_and_mapped.second);
  }
}

template<typename Key_t, typename Mapped_t, typename Pred_t>
typename Array_map<Key_t, Mapped_t, Pred_t>::size_type
  Array_map<Key_t, Mapped_t, Pred_t>::find_idx(const Key& key) const
{
  const size_type n = m_keys.size();
  size_type idx = 0;
  while ((idx != n) && (!m_pred(m_keys[idx], key)))
  {
    ++idx;
  }
  return idx;
}

template<typename Key_t, typename Mapped_t, typename Pred_t>
Array_map<Key_t, Mapped_t, Pred_t>& Array_map<Key_t, Mapped_t, Pred_t>::put(Key key, Mapped value) // Virtual.
{
  const auto idx = find_idx(key);
  if (idx == m_keys.size())
  {
    m_keys.push_back(std::move(key));
    m_values.push_back(std::move(value));
  }
  else
  {
    m_values[idx] = std::move(value); // Position unchanged.
  }

  assert(m_keys.size() == m_values.size());
  return *this;
}

template<typename Key_t, typename Mapped_t, typename Pred_t>
bool Array_map<Key_t, Mapped_t, Pred_t>::get(const Key& key, Mapped* value) const // Virtual.
{
  const auto idx = find_idx(key);
  const bool found = idx != m_keys.size();
  if (value)
  {
    *value = found ? m_values[idx] : Mapped{};
  }
  return found;
}

template<typename Key_t, typename Mapped_t, typename Pred_t>
bool Array_map<Key_t, Mapped_t, Pred_t>::del(const Key& key, Mapped* prior_value) // Virtual.
{
  const auto idx = find_idx(key);
  if (idx == m_keys.size())
  {
    if (prior_value)
    {
      *prior_value = Mapped{};
    }
    return false;
  }
  // else

  if (prior_value)
  {
    *prior_value = std::move(m_values[idx]);
  }
  // vector::erase() shifts the tail down by one, preserving its order.
  m_keys.erase(m_keys.begin() + idx);
  m_values.erase(m_values.begin() + idx);

  assert(m_keys.size() == m_values.size());
  return true;
}

template<typename Key_t, typename Mapped_t, typename Pred_t>
bool Array_map<Key_t, Mapped_t, Pred_t>::contains(const Key& key) const // Virtual.
{
  return find_idx(key) != m_keys.size();
}

template<typename Key_t, typename Mapped_t, typename Pred_t>
std::vector<Key_t> Array_map<Key_t, Mapped_t, Pred_t>::keys() const // Virtual.
{
  return m_keys;
}

template<typename Key_t, typename Mapped_t, typename Pred_t>
std::vector<Mapped_t> Array_map<Key_t, Mapped_t, Pred_t>::values() const // Virtual.
{
  return m_values;
}

template<typename Key_t, typename Mapped_t, typename Pred_t>
Array_map<Key_t, Mapped_t, Pred_t>& Array_map<Key_t, Mapped_t, Pred_t>::clear() // Virtual.
{
  m_keys.clear();
  m_values.clear();
  return *this;
}

template<typename Key_t, typename Mapped_t, typename Pred_t>
typename Array_map<Key_t, Mapped_t, Pred_t>::size_type Array_map<Key_t, Mapped_t, Pred_t>::size() const // Virtual.
{
  return m_keys.size();
}

template<typename Key_t, typename Mapped_t, typename Pred_t>
bool Array_map<Key_t, Mapped_t, Pred_t>::empty() const // Virtual.
{
  return m_keys.empty();
}

template<typename Key_t, typename Mapped_t, typename Pred_t>
void Array_map<Key_t, Mapped_t, Pred_t>::each(const Visitor& visitor) const // Virtual.
{
  const size_type n = m_keys.size();
  for (size_type idx = 0; idx != n; ++idx)
  {
    visitor(m_keys[idx], m_values[idx]);
  }
}

template<typename Key_t, typename Mapped_t, typename Pred_t>
bool Array_map<Key_t, Mapped_t, Pred_t>::read_at(size_type idx, Key* key, Mapped* value) const
{
  const bool found = !m_keys.empty();
  if (key)
  {
    *key = found ? m_keys[idx] : Key{};
  }
  if (value)
  {
    *value = found ? m_values[idx] : Mapped{};
  }
  return found;
}

template<typename Key_t, typename Mapped_t, typename Pred_t>
bool Array_map<Key_t, Mapped_t, Pred_t>::first(Key* key, Mapped* value) const
{
  return read_at(0, key, value);
}

template<typename Key_t, typename Mapped_t, typename Pred_t>
bool Array_map<Key_t, Mapped_t, Pred_t>::last(Key* key, Mapped* value) const
{
  return read_at(m_keys.size() - 1, key, value); // Wraps around if empty, but then read_at() ignores it.
}

template<typename Key_t, typename Mapped_t, typename Pred_t>
typename Array_map<Key_t, Mapped_t, Pred_t>::size_type Array_map<Key_t, Mapped_t, Pred_t>::capacity() const
{
  return m_keys.capacity();
}

template<typename Key_t, typename Mapped_t, typename Pred_t>
void Array_map<Key_t, Mapped_t, Pred_t>::swap(Array_map& other)
{
  using std::swap;

  swap(m_pred, other.m_pred);
  m_keys.swap(other.m_keys);
  m_values.swap(other.m_values);
}

template<typename Key_t, typename Mapped_t, typename Pred_t>
void swap(Array_map<Key_t, Mapped_t, Pred_t>& val1, Array_map<Key_t, Mapped_t, Pred_t>& val2)
{
  val1.swap(val2);
}

} // namespace ordo::col
