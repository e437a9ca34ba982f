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

#include "ordo/col/linked_hash_map.hpp"
#include "ordo/cfg/error/error.hpp"
#include "ordo/error/error.hpp"
#include "ordo/log/log.hpp"
#include <vector>

namespace ordo::col
{

/**
 * Least-recently-used cache of at most capacity() entries, built on Linked_hash_map: the front of the list is the
 * least recently used entry, the end the most recently used one.  get() and put() mark the key used (move it to the
 * end); peek() and contains() do not.  put() of a new key into a full cache first evicts the front entry.
 *
 * Logging: INFO on construction, TRACE on each eviction, to the Logger given at construction (may be null), with
 * component Ordo_log_component::S_COL.
 *
 * ### Thread safety ###
 * None, as for any Map; note get() is not `const`.
 *
 * @tparam Key_t
 *         Key type.  As for Linked_hash_map; additionally `ostream << Key` must be supported (for logging).
 * @tparam Mapped_t
 *         Value type.  As for Linked_hash_map.
 */
template<typename Key_t, typename Mapped_t>
class Lru_cache :
  public log::Log_context
{
public:
  // Types.

  /// Convenience alias for template arg.
  using Key = Key_t;

  /// Convenience alias for template arg.
  using Mapped = Mapped_t;

  /// The storage.
  using Storage = Linked_hash_map<Key, Mapped>;

  /// Expresses sizes/lengths of relevant things.
  using size_type = typename Storage::size_type;

  /// Short-hand for the (key, value) snapshot type.
  using Map_entry = typename Storage::Map_entry;

  /// Function invoked with each evicted entry, just after it has been removed.
  using Eviction_handler = Function<void (const Key& key, const Mapped& value)>;

  // Constructors/destructor.

  /**
   * Constructs empty cache.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging; may be null.
   * @param capacity
   *        Maximum size(); must be at least 1.
   * @param n_buckets
   *        Initial bucket count of the storage's hash index; 0 to let it choose.
   * @param on_eviction
   *        If not empty: invoked for each evicted entry.
   * @throws error::Runtime_error
   *         If `capacity` is 0, with code cfg::error::Code::S_INVALID_CAPACITY.  Use make_lru_cache() to get an
   *         #Error_code instead.
   */
  explicit Lru_cache(log::Logger* logger_ptr, size_type capacity, size_type n_buckets = 0,
                     Eviction_handler&& on_eviction = Eviction_handler{});

  // Methods.

  /**
   * Looks up `key`; on success marks it most recently used.
   *
   * @param key
   *        Key.
   * @param value
   *        If not null: receives the value; or `Mapped{}` if absent.
   * @return `true` if and only if `key` is present.
   */
  bool get(const Key& key, Mapped* value = 0);

  /**
   * Same as get() but leaves the usage order alone.
   *
   * @param key
   *        Key.
   * @param value
   *        See get().
   * @return See get().
   */
  bool peek(const Key& key, Mapped* value = 0) const;

  /**
   * Maps `key` to `value` and marks it most recently used.  If `key` is new and the cache is full, the least
   * recently used entry is evicted first.
   *
   * @param key
   *        Key.
   * @param value
   *        Value.
   * @return `*this`.
   */
  Lru_cache& put(Key key, Mapped value);

  /**
   * Removes `key`, if present.  This is not an eviction: the eviction handler is not invoked.
   *
   * @param key
   *        Key.
   * @param prior_value
   *        If not null: receives the value `key` had; or `Mapped{}` if absent.
   * @return `true` if and only if `key` was present.
   */
  bool del(const Key& key, Mapped* prior_value = 0);

  /**
   * Returns `true` if and only if `key` is present.  Does not mark it used.
   *
   * @param key
   *        Key.
   * @return See above.
   */
  bool contains(const Key& key) const;

  /**
   * Returns the number of entries, at most capacity().
   * @return See above.
   */
  size_type size() const;

  /**
   * Returns `size() == 0`.
   * @return See above.
   */
  bool empty() const;

  /**
   * Returns the capacity given at construction.
   * @return See above.
   */
  size_type capacity() const;

  /**
   * Removes everything, without invoking the eviction handler.
   * @return `*this`.
   */
  Lru_cache& clear();

  /**
   * Returns a copy of all keys, least recently used first.
   * @return See above.
   */
  std::vector<Key> keys() const;

  /**
   * Returns a copy of all entries, least recently used first.
   * @return See above.
   */
  std::vector<Map_entry> entries() const;

private:
  // Methods.

  /// Removes the least recently used entry, logging it and invoking the eviction handler.  Requires `!empty()`.
  void evict_one();

  // Data.

  /// See capacity().
  const size_type m_capacity;

  /// The entries, in usage order.
  Storage m_storage;

  /// See constructor.
  Eviction_handler m_on_eviction;
}; // class Lru_cache

// Template implementations.

template<typename Key_t, typename Mapped_t>
Lru_cache<Key_t, Mapped_t>::Lru_cache(log::Logger* logger_ptr, size_type capacity, size_type n_buckets,
                                      Eviction_handler&& on_eviction) :
  log::Log_context(logger_ptr, Ordo_log_component::S_COL),
  m_capacity(capacity),
  m_storage(n_buckets),
  m_on_eviction(std::move(on_eviction))
{
  if (m_capacity == 0)
  {
    ORDO_LOG_WARNING("Lru_cache [" << this << "]: capacity 0 requested; refusing.");
    throw error::Runtime_error(cfg::error::Code::S_INVALID_CAPACITY, ORDO_UTIL_WHERE_AM_I_STR());
  }
  // else

  ORDO_LOG_INFO("Lru_cache [" << this << "]: created with capacity [" << m_capacity << "], "
                "initial bucket count [" << n_buckets << "]; "
                "eviction handler [" << (m_on_eviction.empty() ? "none" : "set") << "].");
}

template<typename Key_t, typename Mapped_t>
bool Lru_cache<Key_t, Mapped_t>::get(const Key& key, Mapped* value)
{
  if (!m_storage.move_to_end(key))
  {
    if (value)
    {
      *value = Mapped{};
    }
    return false;
  }
  // else

  return m_storage.get(key, value);
}

template<typename Key_t, typename Mapped_t>
bool Lru_cache<Key_t, Mapped_t>::peek(const Key& key, Mapped* value) const
{
  return m_storage.get(key, value);
}

template<typename Key_t, typename Mapped_t>
Lru_cache<Key_t, Mapped_t>& Lru_cache<Key_t, Mapped_t>::put(Key key, Mapped value)
{
  if (m_storage.move_to_end(key))
  {
    m_storage.put(std::move(key), std::move(value)); // Existing key: overwritten where it now is, at the end.
    return *this;
  }
  // else

  if (m_storage.size() == m_capacity)
  {
    evict_one();
  }
  m_storage.put(std::move(key), std::move(value));

  assert(m_storage.size() <= m_capacity);
  return *this;
}

template<typename Key_t, typename Mapped_t>
void Lru_cache<Key_t, Mapped_t>::evict_one()
{
  Key key;
  Mapped value;
  [[maybe_unused]] const bool found = m_storage.first(&key);
  assert(found);
  m_storage.del(key, &value);

  ORDO_LOG_TRACE("Lru_cache [" << this << "]: evicted key [" << key << "]; "
                 "size [" << m_storage.size() << "/" << m_capacity << "].");

  if (!m_on_eviction.empty())
  {
    m_on_eviction(key, value);
  }
}

template<typename Key_t, typename Mapped_t>
bool Lru_cache<Key_t, Mapped_t>::del(const Key& key, Mapped* prior_value)
{
  return m_storage.del(key, prior_value);
}

template<typename Key_t, typename Mapped_t>
bool Lru_cache<Key_t, Mapped_t>::contains(const Key& key) const
{
  return m_storage.contains(key);
}

template<typename Key_t, typename Mapped_t>
typename Lru_cache<Key_t, Mapped_t>::size_type Lru_cache<Key_t, Mapped_t>::size() const
{
  return m_storage.size();
}

template<typename Key_t, typename Mapped_t>
bool Lru_cache<Key_t, Mapped_t>::empty() const
{
  return m_storage.empty();
}

template<typename Key_t, typename Mapped_t>
typename Lru_cache<Key_t, Mapped_t>::size_type Lru_cache<Key_t, Mapped_t>::capacity() const
{
  return m_capacity;
}

template<typename Key_t, typename Mapped_t>
Lru_cache<Key_t, Mapped_t>& Lru_cache<Key_t, Mapped_t>::clear()
{
  m_storage.clear();
  return *this;
}

template<typename Key_t, typename Mapped_t>
std::vector<Key_t> Lru_cache<Key_t, Mapped_t>::keys() const
{
  return m_storage.keys();
}

template<typename Key_t, typename Mapped_t>
std::vector<typename Lru_cache<Key_t, Mapped_t>::Map_entry> Lru_cache<Key_t, Mapped_t>::entries() const
{
  return m_storage.entries();
}

} // namespace ordo::col
