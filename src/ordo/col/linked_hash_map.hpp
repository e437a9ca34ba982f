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
#include <cassert>
#include <initializer_list>
#include <optional>
#include <utility>

namespace ordo::col
{

/**
 * Map backend combining a hash index with a doubly linked list threading all entries in order: constant-time
 * (on average) put(), get() and del(), like Hash_map; while keeping a well-defined order, like Array_map.  That order is
 * insertion order, unless changed through the Reorderable interface: move_to_end() and move_to_front() are
 * also constant-time, which is what Lru_cache is built on.
 *
 * ### Internals ###
 * The list nodes live in an arena (a `vector` of slots) owned by `*this` and are addressed by their slot index, a
 * *handle*.  The `prev`/`next` links and the index values are handles, so nothing but the arena owns a node; freed
 * slots are recycled via a free-list.  Handles stay valid across arena reallocation, which makes copying `*this`
 * a plain member-wise copy.
 *
 * Invariants:
 *   - `m_index.size()` equals the number of nodes reachable from #m_head via `next`, which equals size().
 *   - The list is a single chain from #m_head (front, oldest) to #m_tail (end, newest): `prev` of the head and
 *     `next` of the tail are #S_NULL_HANDLE; both ends are #S_NULL_HANDLE if and only if empty().
 *   - Each key has exactly one node; overwriting a value never creates a node or moves one.
 *
 * ### Thread safety ###
 * Same as for `boost::unordered_map`.
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
class Linked_hash_map :
  public Map<Key_t, Mapped_t>,
  public Reorderable<Key_t>
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
   *        Initial bucket count of the index; 0 to let the index choose.  Also used by clear().
   * @param hasher_obj
   *        Instance of the hash function type.
   * @param pred
   *        Instance of the equality function type.
   */
  explicit Linked_hash_map(size_type n_buckets = 0, const Hash& hasher_obj = Hash{}, const Pred& pred = Pred{});

  /**
   * Constructs structure with the given contents, as if by `put()`ting each pair in order: so the order is that of
   * `values`, except a repeated key keeps its first position and gets its last value.
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
  explicit Linked_hash_map(std::initializer_list<Value> values,
                           size_type n_buckets = 0, const Hash& hasher_obj = Hash{}, const Pred& pred = Pred{});

  /**
   * Constructs object that is a copy of `src`, with the same order.
   *
   * @param src
   *        Object to copy.
   */
  Linked_hash_map(const Linked_hash_map& src) = default;

  /**
   * Constructs object by making it equal to `src`, while making `src` empty.  Constant-time.
   *
   * @param src
   *        Object to move.
   */
  Linked_hash_map(Linked_hash_map&& src);

  // Methods.

  /**
   * Overwrites `*this` with a copy of `src`.
   *
   * @param src
   *        Object to copy.
   * @return `*this`.
   */
  Linked_hash_map& operator=(const Linked_hash_map& src) = default;

  /**
   * Overwrites `*this` with `src`'s contents, while making `src` empty.
   *
   * @param src
   *        Object to move.
   * @return `*this`.
   */
  Linked_hash_map& operator=(Linked_hash_map&& src);

  /**
   * Implements Map::put().  A new key goes to the end of the order; an existing key keeps its position.
   * Constant-time on average.
   *
   * @param key
   *        Key.
   * @param value
   *        Value.
   * @return `*this`.
   */
  Linked_hash_map& put(Key key, Mapped value) override;

  /**
   * Implements Map::get() via the index.  Does not affect the order.
   *
   * @param key
   *        Key.
   * @param value
   *        See Map::get().
   * @return See Map::get().
   */
  bool get(const Key& key, Mapped* value = 0) const override;

  /**
   * Implements Map::del(): unlinks the node from the list and frees it.  Constant-time on average.
   *
   * @param key
   *        Key.
   * @param prior_value
   *        See Map::del().
   * @return See Map::del().
   */
  bool del(const Key& key, Mapped* prior_value = 0) override;

  /**
   * Implements Map::contains() via the index.
   *
   * @param key
   *        Key.
   * @return See Map::contains().
   */
  bool contains(const Key& key) const override;

  /**
   * Implements Map::keys(): list order, front to end.
   * @return See Map::keys().
   */
  std::vector<Key> keys() const override;

  /**
   * Implements Map::values(): list order, front to end.
   * @return See Map::values().
   */
  std::vector<Mapped> values() const override;

  /**
   * Implements Map::clear() by discarding the index and the node arena wholesale.
   * @return `*this`.
   */
  Linked_hash_map& clear() override;

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
   * Implements Map::each(): list order, front to end.
   *
   * @param visitor
   *        See Map::each().
   */
  void each(const Visitor& visitor) const override;

  /**
   * Implements Map::reorderable().
   * @return `this`.
   */
  Reorderable<Key>* reorderable() override;

  /**
   * Implements Reorderable::move_to_end(): splices the node out and relinks it as the new tail.  The index is not
   * touched.  Constant-time on average.
   *
   * @param key
   *        Key.
   * @return See Reorderable::move_to_end().
   */
  bool move_to_end(const Key& key) override;

  /**
   * Implements Reorderable::move_to_front(): splices the node out and relinks it as the new head.
   *
   * @param key
   *        Key.
   * @return See Reorderable::move_to_front().
   */
  bool move_to_front(const Key& key) override;

  /**
   * Reads the entry at the front of the order.  Constant-time.
   *
   * @param key
   *        If not null: receives the key; or `Key{}` if empty.
   * @param value
   *        If not null: receives the value; or `Mapped{}` if empty.
   * @return `false` if and only if empty().
   */
  bool first(Key* key = 0, Mapped* value = 0) const;

  /**
   * Reads the entry at the end of the order.  Constant-time.
   *
   * @param key
   *        If not null: receives the key; or `Key{}` if empty.
   * @param value
   *        If not null: receives the value; or `Mapped{}` if empty.
   * @return `false` if and only if empty().
   */
  bool last(Key* key = 0, Mapped* value = 0) const;

  /**
   * Swaps the contents of this structure and `other`.  Constant-time.
   *
   * @param other
   *        The other structure.
   */
  void swap(Linked_hash_map& other);

private:
  // Types.

  /// Identifies a node: its slot in #m_nodes.
  using Handle = size_type;

  /// One list element.
  struct Node
  {
    /// The key (a copy of the one in the index).
    Key m_key;
    /// The value.
    Mapped m_mapped;
    /// Previous node (towards the front); or #S_NULL_HANDLE.
    Handle m_prev;
    /// Next node (towards the end); or #S_NULL_HANDLE.
    Handle m_next;
  };

  /// Short-hand for the hash index: key to handle of its node.
  using Index = boost::unordered_map<Key, Handle, Hash, Pred>;

  // Constants.

  /// The handle of no node.
  static constexpr Handle S_NULL_HANDLE = Handle(-1);

  // Methods.

  /**
   * Returns the node with the given (valid) handle.
   *
   * @param handle
   *        Handle of a live node.
   * @return See above.
   */
  Node& node(Handle handle);

  /**
   * Returns the node with the given (valid) handle.
   *
   * @param handle
   *        Handle of a live node.
   * @return See above.
   */
  const Node& node(Handle handle) const;

  /**
   * Creates an unlinked node, reusing a free slot if any.
   *
   * @param key
   *        Key.
   * @param mapped
   *        Value.
   * @return Its handle.
   */
  Handle alloc_node(Key key, Mapped mapped);

  /**
   * Destroys an (unlinked) node and makes its slot free.
   *
   * @param handle
   *        Handle of a live node.
   */
  void free_node(Handle handle);

  /**
   * Splices the given node out of the list, fixing up its neighbors and #m_head / #m_tail.  Its own links are reset.
   *
   * @param handle
   *        Handle of a linked node.
   */
  void unlink(Handle handle);

  /**
   * Links the given unlinked node in as the new tail.
   *
   * @param handle
   *        Handle of an unlinked node.
   */
  void link_at_end(Handle handle);

  /**
   * Links the given unlinked node in as the new head.
   *
   * @param handle
   *        Handle of an unlinked node.
   */
  void link_at_front(Handle handle);

  /**
   * Helper of first() and last().
   *
   * @param handle
   *        #m_head or #m_tail.
   * @param key
   *        See first().
   * @param value
   *        See first().
   * @return See first().
   */
  bool read_at(Handle handle, Key* key, Mapped* value) const;

  // Data.

  /// Bucket count given at construction (0 = index default), reused by clear().
  size_type m_n_buckets;

  /// The node arena: slot `h` holds the node with handle `h`, or nothing if `h` is free.
  std::vector<std::optional<Node>> m_nodes;

  /// Handles of the empty slots in #m_nodes, reused before the arena grows.
  std::vector<Handle> m_free_handles;

  /// Key to handle of its node.  Its size is size().
  Index m_index;

  /// Front of the list (least recently inserted or moved to end); #S_NULL_HANDLE if empty.
  Handle m_head;

  /// End of the list (most recently inserted or moved to end); #S_NULL_HANDLE if empty.
  Handle m_tail;
}; // class Linked_hash_map

// Free functions.

/**
 * Equivalent to `val1.swap(val2)`.
 *
 * @relatesalso Linked_hash_map
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 */
template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
void swap(Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>& val1,
          Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>& val2);

// Template implementations.

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Linked_hash_map(size_type n_buckets,
                                                                  const Hash& hasher_obj,
                                                                  const Pred& pred) :
  m_n_buckets(n_buckets),
  m_index(n_buckets, hasher_obj, pred),
  m_head(S_NULL_HANDLE),
  m_tail(S_NULL_HANDLE)
{
  // That's all.
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Linked_hash_map(std::initializer_list<Value> values,
                                                                  size_type n_buckets,
                                                                  const Hash& hasher_obj,
                                                                  const Pred& pred) :
  Linked_hash_map(n_buckets, hasher_obj, pred)
{
  m_nodes.reserve(values.size());
  for (const auto& key_and_mapped : values)
  {
    put(key_and_mapped.first, key_and_mapped.second);
  }
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Linked_hash_map(Linked_hash_map&& src) :
  Linked_hash_map(src.m_n_buckets, src.m_index.hash_function(), src.m_index.key_eq())
{
  swap(src);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>&
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::operator=(Linked_hash_map&& src)
{
  if (&src != this)
  {
    clear();
    swap(src);
  }
  return *this;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Node&
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::node(Handle handle)
{
  assert((handle < m_nodes.size()) && m_nodes[handle]);
  return *(m_nodes[handle]);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
const typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Node&
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::node(Handle handle) const
{
  assert((handle < m_nodes.size()) && m_nodes[handle]);
  return *(m_nodes[handle]);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Handle
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::alloc_node(Key key, Mapped mapped)
{
  Node new_node{std::move(key), std::move(mapped), S_NULL_HANDLE, S_NULL_HANDLE};
  if (m_free_handles.empty())
  {
    m_nodes.emplace_back(std::move(new_node));
    return m_nodes.size() - 1;
  }
  // else

  const Handle handle = m_free_handles.back();
  m_free_handles.pop_back();
  assert(!m_nodes[handle]);
  m_nodes[handle].emplace(std::move(new_node));
  return handle;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
void Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::free_node(Handle handle)
{
  assert((handle < m_nodes.size()) && m_nodes[handle]);
  m_nodes[handle].reset();
  m_free_handles.push_back(handle);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
void Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::unlink(Handle handle)
{
  auto& the_node = node(handle);

  if (the_node.m_prev == S_NULL_HANDLE)
  {
    assert(m_head == handle);
    m_head = the_node.m_next;
  }
  else
  {
    node(the_node.m_prev).m_next = the_node.m_next;
  }

  if (the_node.m_next == S_NULL_HANDLE)
  {
    assert(m_tail == handle);
    m_tail = the_node.m_prev;
  }
  else
  {
    node(the_node.m_next).m_prev = the_node.m_prev;
  }

  the_node.m_prev = the_node.m_next = S_NULL_HANDLE;
} // Linked_hash_map::unlink()

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
void Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::link_at_end(Handle handle)
{
  auto& the_node = node(handle);
  assert((the_node.m_prev == S_NULL_HANDLE) && (the_node.m_next == S_NULL_HANDLE));

  the_node.m_prev = m_tail;
  if (m_tail == S_NULL_HANDLE)
  {
    assert(m_head == S_NULL_HANDLE);
    m_head = handle;
  }
  else
  {
    node(m_tail).m_next = handle;
  }
  m_tail = handle;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
void Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::link_at_front(Handle handle)
{
  auto& the_node = node(handle);
  assert((the_node.m_prev == S_NULL_HANDLE) && (the_node.m_next == S_NULL_HANDLE));

  the_node.m_next = m_head;
  if (m_head == S_NULL_HANDLE)
  {
    assert(m_tail == S_NULL_HANDLE);
    m_tail = handle;
  }
  else
  {
    node(m_head).m_prev = handle;
  }
  m_head = handle;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>&
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::put(Key key, Mapped value) // Virtual.
{
  const auto index_it = m_index.find(key);
  if (index_it != m_index.end())
  {
    node(index_it->second).m_mapped = std::move(value); // Position unchanged.
    return *this;
  }
  // else

  const Handle handle = alloc_node(key, std::move(value)); // The index keeps the other copy of key.
  m_index.emplace(std::move(key), handle);
  link_at_end(handle);

  assert(m_index.size() + m_free_handles.size() == m_nodes.size());
  return *this;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
bool Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::get(const Key& key, Mapped* value) const // Virtual.
{
  const auto index_it = m_index.find(key);
  const bool found = index_it != m_index.end();
  if (value)
  {
    *value = found ? node(index_it->second).m_mapped : Mapped{};
  }
  return found;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
bool Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::del(const Key& key, Mapped* prior_value) // Virtual.
{
  const auto index_it = m_index.find(key);
  if (index_it == m_index.end())
  {
    if (prior_value)
    {
      *prior_value = Mapped{};
    }
    return false;
  }
  // else

  const Handle handle = index_it->second;
  if (prior_value)
  {
    *prior_value = std::move(node(handle).m_mapped);
  }
  unlink(handle);
  m_index.erase(index_it);
  free_node(handle);

  assert(m_index.size() + m_free_handles.size() == m_nodes.size());
  return true;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
bool Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::contains(const Key& key) const // Virtual.
{
  return m_index.find(key) != m_index.end();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
std::vector<Key_t> Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::keys() const // Virtual.
{
  std::vector<Key> result;
  result.reserve(size());
  for (Handle handle = m_head; handle != S_NULL_HANDLE; handle = node(handle).m_next)
  {
    result.push_back(node(handle).m_key);
  }
  return result;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
std::vector<Mapped_t> Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::values() const // Virtual.
{
  std::vector<Mapped> result;
  result.reserve(size());
  for (Handle handle = m_head; handle != S_NULL_HANDLE; handle = node(handle).m_next)
  {
    result.push_back(node(handle).m_mapped);
  }
  return result;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>& Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::clear() // Virtual.
{
  Index fresh_index(m_n_buckets, m_index.hash_function(), m_index.key_eq());
  m_index.swap(fresh_index);
  decltype(m_nodes)().swap(m_nodes);
  decltype(m_free_handles)().swap(m_free_handles);
  m_head = m_tail = S_NULL_HANDLE;
  return *this;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::size_type
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::size() const // Virtual.
{
  return m_index.size();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
bool Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::empty() const // Virtual.
{
  return m_index.empty();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
void Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::each(const Visitor& visitor) const // Virtual.
{
  for (Handle handle = m_head; handle != S_NULL_HANDLE; handle = node(handle).m_next)
  {
    const auto& the_node = node(handle);
    visitor(the_node.m_key, the_node.m_mapped);
  }
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Reorderable<Key_t>* Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::reorderable() // Virtual.
{
  return this;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
bool Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::move_to_end(const Key& key) // Virtual.
{
  const auto index_it = m_index.find(key);
  if (index_it == m_index.end())
  {
    return false;
  }
  // else

  const Handle handle = index_it->second;
  if (handle != m_tail)
  {
    unlink(handle);
    link_at_end(handle);
  }
  return true;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
bool Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::move_to_front(const Key& key) // Virtual.
{
  const auto index_it = m_index.find(key);
  if (index_it == m_index.end())
  {
    return false;
  }
  // else

  const Handle handle = index_it->second;
  if (handle != m_head)
  {
    unlink(handle);
    link_at_front(handle);
  }
  return true;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
bool Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::read_at(Handle handle, Key* key, Mapped* value) const
{
  const bool found = handle != S_NULL_HANDLE;
  if (key)
  {
    *key = found ? node(handle).m_key : Key{};
  }
  if (value)
  {
    *value = found ? node(handle).m_mapped : Mapped{};
  }
  return found;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
bool Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::first(Key* key, Mapped* value) const
{
  return read_at(m_head, key, value);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
bool Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::last(Key* key, Mapped* value) const
{
  return read_at(m_tail, key, value);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
void Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::swap(Linked_hash_map& other)
{
  using std::swap;

  swap(m_n_buckets, other.m_n_buckets);
  m_nodes.swap(other.m_nodes); // Handles are slot numbers: still valid in the new owner.
  m_free_handles.swap(other.m_free_handles);
  m_index.swap(other.m_index);
  swap(m_head, other.m_head);
  swap(m_tail, other.m_tail);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
void swap(Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>& val1,
          Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>& val2)
{
  val1.swap(val2);
}

} // namespace ordo::col
