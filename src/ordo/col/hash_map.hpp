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
#include <boost/unordered_map.hpp>
#include <initializer_list>
#include <utility>

namespace ordo::col
{

/**
 * Map backend that is a thin wrapper around a hash table (`boost::unordered_map`).  put(), get(), del() and
 * contains() are constant-time on average.  Enumeration order is unspecified and may change after any insertion.
 *
 * clear() replaces the table with a fresh one (same hasher, predicate and initial bucket count), releasing the
 * buckets; this differs from Array_map, which keeps its capacity.
 *
 * @tparam Key_t
 *         Key type.  See Map.
 * @tparam Mapped_t
 *         Value type.  See Map.
 * @tparam Hash_t
 *         Hasher type.  Same requirements and semantics as `boost::unordered_map<>` counterpart.
 * @tparam Pred_t
 *         Equality functor type.  Same requirements and semantics as `boost::unordered_map<>` counterpart.
 */
template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
class Hash_map :
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
  using Hash = Hash_t;

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
   * @param n_buckets
   *        Initial bucket count of the table; 0 to let the table choose.  Also used by clear().
   * @param hasher_obj
   *        Instance of the hash function type.
   * @param pred
   *        Instance of the equality function type.
   */
  explicit Hash_map(size_type n_buckets = 0, const Hash& hasher_obj = Hash{}, const Pred& pred = Pred{});

  /**
   * Constructs structure with the given contents, as if by `put()`ting each pair in order (so a repeated key ends
   * up with its last value).
   *
   * @param values
   *        Values with which to fill the structure.
   * @param n_buckets
   *        See other constructor.
   * @param hasher_obj
   *        See other constructor.
   * @param pred
   *        See other constructor.
   */
  explicit Hash_map(std::initializer_list<Value> values,
                    size_type n_buckets = 0, const Hash& hasher_obj = Hash{}, const Pred& pred = Pred{});

  // Methods.

  /**
   * Implements Map::put().  Constant-time on average.
   *
   * @param key
   *        Key.
   * @param value
   *        Value.
   * @return `*this`.
   */
  Hash_map& put(Key key, Mapped value) override;

  /**
   * Implements Map::get().  Constant-time on average.
   *
   * @param key
   *        Key.
   * @param value
   *        See Map::get().
   * @return See Map::get().
   */
  bool get(const Key& key, Mapped* value = 0) const override;

  /**
   * Implements Map::del().  Constant-time on average.
   *
   * @param key
   *        Key.
   * @param prior_value
   *        See Map::del().
   * @return See Map::del().
   */
  bool del(const Key& key, Mapped* prior_value = 0) override;

  /**
   * Implements Map::contains().
   *
   * @param key
   *        Key.
   * @return See Map::contains().
   */
  bool contains(const Key& key) const override;

  /**
   * Implements Map::keys().  Order is unspecified.
   * @return See Map::keys().
   */
  std::vector<Key> keys() const override;

  /**
   * Implements Map::values().  Order matches keys() if nothing is modified in-between.
   * @return See Map::values().
   */
  std::vector<Mapped> values() const override;

  /**
   * Implements Map::clear() by swapping in a new, empty table.
   * @return `*this`.
   */
  Hash_map& clear() override;

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
   * Implements Map::each().
   *
   * @param visitor
   *        See Map::each().
   */
  void each(const Visitor& visitor) const override;

  /**
   * Returns the current bucket count of the underlying table.
   * @return See above.
   */
  size_type bucket_count() const;

  /**
   * Swaps the contents of this structure and `other`.
   *
   * @param other
   *        The other structure.
   */
  void swap(Hash_map& other);

private:
  // Types.

  /// Short-hand for the underlying table.
  using Table = boost::unordered_map<Key, Mapped, Hash, Pred>;

  // Data.

  /// Bucket count given at construction (0 = table default), reused by clear().
  size_type m_n_buckets;

  /// The table.
  Table m_table;
}; // class Hash_map

// Free functions.

/**
 * Equivalent to `val1.swap(val2)`.
 *
 * @relatesalso Hash_map
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 */
template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
void swap(Hash_map<Key_t, Mapped_t, Hash_t, Pred_t>& val1, Hash_map<Key_t, Mapped_t, Hash_t, Pred_t>& val2);

// Template implementations.

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Hash_map(size_type n_buckets, const Hash& hasher_obj, const Pred& pred) :
  m_n_buckets(n_buckets),
  m_table(n_buckets, hasher_obj, pred)
{
  // That's all.
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Hash_map(std::initializer_list<Value> values,
                                                    size_type n_buckets, const Hash& hasher_obj, const Pred& pred) :
  Hash_map(n_buckets, hasher_obj, pred)
{
  for (const auto& key_and_mapped : values)
  {
    put(key_and_mapped.first, key_and_mapped.second);
  }
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Hash_map<Key_t, Mapped_t, Hash_t, Pred_t>&
  Hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::put(Key key, Mapped value) // Virtual.
{
  const auto table_it = m_table.find(key);
  if (table_it == m_table.end())
  {
    m_table.emplace(std::move(key), std::move(value));
  }
  else
  {
    table_it->second = std::move(value);
  }
  return *this;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
bool Hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::get(const Key& key, Mapped* value) const // Virtual.
{
  const auto table_it = m_table.find(key);
  const bool found = table_it != m_table.end();
  if (value)
  {
    *value = found ? table_it->second : Mapped{};
  }
  return found;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
bool Hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::del(const Key& key, Mapped* prior_value) // Virtual.
{
  const auto table_it = m_table.find(key);
  if (table_it == m_table.end())
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
    *prior_value = std::move(table_it->second);
  }
  m_table.erase(table_it);
  return true;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
bool Hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::contains(const Key& key) const // Virtual.
{
  return m_table.find(key) != m_table.end();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
std::vector<Key_t> Hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::keys() const // Virtual.
{
  std::vector<Key> result;
  result.reserve(m_table.size());
  for (const auto& key_and_mapped : m_table)
  {
    result.push_back(key_and_mapped.first);
  }
  return result;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
std::vector<Mapped_t> Hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::values() const // Virtual.
{
  std::vector<Mapped> result;
  result.reserve(m_table.size());
  for (const auto& key_and_mapped : m_table)
  {
    result.push_back(key_and_mapped.second);
  }
  return result;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Hash_map<Key_t, Mapped_t, Hash_t, Pred_t>& Hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::clear() // Virtual.
{
  Table fresh_table(m_n_buckets, m_table.hash_function(), m_table.key_eq());
  m_table.swap(fresh_table); // Old buckets go away with fresh_table.
  return *this;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::size_type
  Hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::size() const // Virtual.
{
  return m_table.size();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
bool Hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::empty() const // Virtual.
{
  return m_table.empty();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
void Hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::each(const Visitor& visitor) const // Virtual.
{
  for (const auto& key_and_mapped : m_table)
  {
    visitor(key_and_mapped.first, key_and_mapped.second);
  }
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::size_type
  Hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::bucket_count() const
{
  return m_table.bucket_count();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
void Hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::swap(Hash_map& other)
{
  using std::swap;

  swap(m_n_buckets, other.m_n_buckets);
  m_table.swap(other.m_table);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
void swap(Hash_map<Key_t, Mapped_t, Hash_t, Pred_t>& val1, Hash_map<Key_t, Mapped_t, Hash_t, Pred_t>& val2)
{
  val1.swap(val2);
}

} // namespace ordo::col
