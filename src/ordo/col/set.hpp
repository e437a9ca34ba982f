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
#include <initializer_list>
#include <memory>
#include <ostream>
#include <string>
#include <type_traits>
#include <vector>

namespace ordo::col
{

/**
 * The set contract: a collection of unique #Element values.  The order of elems(), each() and `operator<<` is that
 * of the underlying map backend (see Basic_map_set, the only implementation).
 *
 * Duplicate add() is idempotent: it changes neither size() nor order.
 *
 * move_to_end() and move_to_front() exist on every Set, but only a set whose backend is Reorderable (Linked_set)
 * actually reorders; on any other they return `false` and do nothing.  reorderable() says which it is.
 *
 * @tparam T_t
 *         Element type.  Same requirements as the `Key_t` of the backend's Map.
 */
template<typename T_t>
class Set :
  public util::Null_interface
{
public:
  // Types.

  /// Convenience alias for template arg.
  using Element = T_t;

  /// Expresses sizes/lengths of relevant things.
  using size_type = std::size_t;

  /// Short-hand for the function type invoked by each().
  using Visitor = Function<void (const Element&)>;

  /// Short-hand for a uniquely owned Set of some backend, as returned by make_set().
  using Ptr = std::unique_ptr<Set>;

  // Methods.

  /**
   * Adds `elem`, if not already present (at the end of the order, if the backend has one).
   *
   * @param elem
   *        Element.
   * @return `*this`.
   */
  virtual Set& add(Element elem) = 0;

  /**
   * Removes `elem`, if present.
   *
   * @param elem
   *        Element.
   * @return `*this`.
   */
  virtual Set& remove(const Element& elem) = 0;

  /**
   * Returns `true` if and only if `elem` is present.
   *
   * @param elem
   *        Element.
   * @return See above.
   */
  virtual bool contains(const Element& elem) const = 0;

  /**
   * Returns a copy of all elements, in order.
   * @return See above.
   */
  virtual std::vector<Element> elems() const = 0;

  /**
   * Removes everything.
   * @return `*this`.
   */
  virtual Set& clear() = 0;

  /**
   * Returns the number of elements.
   * @return See above.
   */
  virtual size_type size() const = 0;

  /**
   * Returns `size() == 0`.
   * @return See above.
   */
  virtual bool empty() const = 0;

  /**
   * Invokes `visitor(elem)` for each element, in order.  `visitor` must not modify `*this`.
   *
   * @param visitor
   *        Function to invoke.
   */
  virtual void each(const Visitor& visitor) const = 0;

  /**
   * Moves `elem` to the end of the order, if the backend can reorder.
   *
   * @param elem
   *        Element.
   * @return `true` if and only if reorderable() and `elem` is present.
   */
  virtual bool move_to_end(const Element& elem) = 0;

  /**
   * Moves `elem` to the front of the order, if the backend can reorder.
   *
   * @param elem
   *        Element.
   * @return `true` if and only if reorderable() and `elem` is present.
   */
  virtual bool move_to_front(const Element& elem) = 0;

  /**
   * Returns `true` if and only if move_to_end() and move_to_front() can do anything.
   * @return See above.
   */
  virtual bool reorderable() const = 0;

  /**
   * Returns the `operator<<` rendering of `*this`: `set[e1 e2]` (or `set[]`).
   * @return See above.
   */
  std::string to_string() const;
}; // class Set

/**
 * Set implementation over an embedded map backend, mapping each element to Unit.  Use the aliases Hash_set,
 * Array_set and Linked_set rather than naming this directly.
 *
 * The backend type is known at compile time, so whether it is Reorderable is too: for a non-Reorderable backend
 * move_to_end() and move_to_front() compile down to `return false`.
 *
 * @tparam T_t
 *         Element type.
 * @tparam Backend_map_t
 *         A Map<T_t, Unit> implementation: Hash_map, Array_map or Linked_hash_map with `Mapped = Unit`.
 */
template<typename T_t, typename Backend_map_t>
class Basic_map_set :
  public Set<T_t>
{
public:
  // Types.

  /// Convenience alias for template arg.
  using Element = T_t;

  /// Convenience alias for template arg.
  using Backend_map = Backend_map_t;

  /// Expresses sizes/lengths of relevant things.
  using size_type = typename Set<Element>::size_type;

  /// Short-hand for the function type invoked by each().
  using Visitor = typename Set<Element>::Visitor;

  static_assert(std::is_base_of_v<Map<Element, Unit>, Backend_map>,
                "Backend_map_t must implement Map<T_t, Unit>.");

  // Constants.

  /// Whether `Backend_map` has the Reorderable capability.
  static constexpr bool S_REORDERABLE = std::is_base_of_v<Reorderable<Element>, Backend_map>;

  // Constructors/destructor.

  /// Constructs empty set.
  Basic_map_set();

  /**
   * Constructs set whose backend is `backend_map` (moved-in), and whose elements are therefore its keys.  Useful to
   * supply a backend constructed with non-default arguments, such as a bucket count.
   *
   * @param backend_map
   *        The backend.
   */
  explicit Basic_map_set(Backend_map&& backend_map);

  /**
   * Constructs set containing the given elements, in the given order, as if by add()ing each.
   *
   * @param elems
   *        Elements.
   */
  Basic_map_set(std::initializer_list<Element> elems);

  // Methods.

  /**
   * Implements Set::add().
   *
   * @param elem
   *        Element.
   * @return `*this`.
   */
  Basic_map_set& add(Element elem) override;

  /**
   * Implements Set::remove().
   *
   * @param elem
   *        Element.
   * @return `*this`.
   */
  Basic_map_set& remove(const Element& elem) override;

  /**
   * Implements Set::contains().
   *
   * @param elem
   *        Element.
   * @return See Set::contains().
   */
  bool contains(const Element& elem) const override;

  /**
   * Implements Set::elems(): the backend's keys().
   * @return See Set::elems().
   */
  std::vector<Element> elems() const override;

  /**
   * Implements Set::clear().
   * @return `*this`.
   */
  Basic_map_set& clear() override;

  /**
   * Implements Set::size().
   * @return See Set::size().
   */
  size_type size() const override;

  /**
   * Implements Set::empty().
   * @return See Set::empty().
   */
  bool empty() const override;

  /**
   * Implements Set::each().
   *
   * @param visitor
   *        See Set::each().
   */
  void each(const Visitor& visitor) const override;

  /**
   * Implements Set::move_to_end().
   *
   * @param elem
   *        Element.
   * @return See Set::move_to_end().
   */
  bool move_to_end(const Element& elem) override;

  /**
   * Implements Set::move_to_front().
   *
   * @param elem
   *        Element.
   * @return See Set::move_to_front().
   */
  bool move_to_front(const Element& elem) override;

  /**
   * Implements Set::reorderable().
   * @return #S_REORDERABLE.
   */
  bool reorderable() const override;

  /**
   * Read-only access to the backend map.
   * @return See above.
   */
  const Backend_map& map() const;

private:
  // Data.

  /// The backend: keys are the elements.
  Backend_map m_map;
}; // class Basic_map_set

// Free functions.

/**
 * Prints the elements of `val`, in order, as `set[e1 e2]`; or `set[]` if empty.
 *
 * @relatesalso Set
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename T_t>
std::ostream& operator<<(std::ostream& os, const Set<T_t>& val);

// Template implementations.

template<typename T_t>
std::string Set<T_t>::to_string() const
{
  return util::ostream_op_string(*this);
}

template<typename T_t, typename Backend_map_t>
Basic_map_set<T_t, Backend_map_t>::Basic_map_set() = default;

template<typename T_t, typename Backend_map_t>
Basic_map_set<T_t, Backend_map_t>::Basic_map_set(Backend_map&& backend_map) :
  m_map(std::move(backend_map))
{
  // Nothing else.
}

template<typename T_t, typename Backend_map_t>
Basic_map_set<T_t, Backend_map_t>::Basic_map_set(std::initializer_list<Element> elems)
{
  for (const auto& elem : elems)
  {
    add(elem);
  }
}

template<typename T_t, typename Backend_map_t>
Basic_map_set<T_t, Backend_map_t>& Basic_map_set<T_t, Backend_map_t>::add(Element elem) // Virtual.
{
  m_map.put(std::move(elem), Unit{});
  return *this;
}

template<typename T_t, typename Backend_map_t>
Basic_map_set<T_t, Backend_map_t>& Basic_map_set<T_t, Backend_map_t>::remove(const Element& elem) // Virtual.
{
  m_map.del(elem);
  return *this;
}

template<typename T_t, typename Backend_map_t>
bool Basic_map_set<T_t, Backend_map_t>::contains(const Element& elem) const // Virtual.
{
  return m_map.contains(elem);
}

template<typename T_t, typename Backend_map_t>
std::vector<T_t> Basic_map_set<T_t, Backend_map_t>::elems() const // Virtual.
{
  return m_map.keys();
}

template<typename T_t, typename Backend_map_t>
Basic_map_set<T_t, Backend_map_t>& Basic_map_set<T_t, Backend_map_t>::clear() // Virtual.
{
  m_map.clear();
  return *this;
}

template<typename T_t, typename Backend_map_t>
typename Basic_map_set<T_t, Backend_map_t>::size_type Basic_map_set<T_t, Backend_map_t>::size() const // Virtual.
{
  return m_map.size();
}

template<typename T_t, typename Backend_map_t>
bool Basic_map_set<T_t, Backend_map_t>::empty() const // Virtual.
{
  return m_map.empty();
}

template<typename T_t, typename Backend_map_t>
void Basic_map_set<T_t, Backend_map_t>::each(const Visitor& visitor) const // Virtual.
{
  m_map.each([&](const Element& elem, const Unit&) { visitor(elem); });
}

template<typename T_t, typename Backend_map_t>
bool Basic_map_set<T_t, Backend_map_t>::move_to_end([[maybe_unused]] const Element& elem) // Virtual.
{
  if constexpr(S_REORDERABLE)
  {
    return m_map.move_to_end(elem);
  }
  else
  {
    return false;
  }
}

template<typename T_t, typename Backend_map_t>
bool Basic_map_set<T_t, Backend_map_t>::move_to_front([[maybe_unused]] const Element& elem) // Virtual.
{
  if constexpr(S_REORDERABLE)
  {
    return m_map.move_to_front(elem);
  }
  else
  {
    return false;
  }
}

template<typename T_t, typename Backend_map_t>
bool Basic_map_set<T_t, Backend_map_t>::reorderable() const // Virtual.
{
  return S_REORDERABLE;
}

template<typename T_t, typename Backend_map_t>
const Backend_map_t& Basic_map_set<T_t, Backend_map_t>::map() const
{
  return m_map;
}

template<typename T_t>
std::ostream& operator<<(std::ostream& os, const Set<T_t>& val)
{
  os << "set[";
  bool first = true;
  val.each([&](const T_t& elem)
  {
    if (!first)
    {
      os << ' ';
    }
    first = false;
    os << elem;
  });
  return os << ']';
}

} // namespace ordo::col
