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

#include "ordo/col/array_map.hpp"
#include "ordo/col/hash_map.hpp"
#include "ordo/col/linked_hash_map.hpp"
#include "ordo/col/lru_cache.hpp"
#include "ordo/col/set.hpp"
#include "ordo/cfg/container_options.hpp"
#include "ordo/error/error.hpp"
#include <memory>

namespace ordo::col
{
// Free functions.

/**
 * Constructs an empty Map of the given backend, for code that wants to choose it at run time.
 *
 * @tparam Key
 *         Key type.
 * @tparam Mapped
 *         Value type.
 * @param backend
 *        Which backend.  Default: Backend::S_HASH.
 * @param n_buckets
 *        Initial bucket count for Hash_map and Linked_hash_map; 0 to let them choose.  Ignored by Array_map.
 * @return The new Map; or null if `backend` is not a real backend (Backend::S_END_SENTINEL or garbage).
 */
template<typename Key, typename Mapped>
typename Map<Key, Mapped>::Ptr make_map(Backend backend = Backend::S_HASH, size_t n_buckets = 0);

/**
 * Constructs an empty Set of the given backend.
 *
 * @tparam T
 *         Element type.
 * @param backend
 *        See make_map().
 * @param n_buckets
 *        See make_map().
 * @return The new Set; or null if `backend` is not a real backend.
 */
template<typename T>
typename Set<T>::Ptr make_set(Backend backend = Backend::S_HASH, size_t n_buckets = 0);

/**
 * Constructs an empty Map according to the given options, after validating them.
 *
 * @tparam Key
 *         Key type.
 * @tparam Mapped
 *         Value type.
 * @param opts
 *        Options; `m_st_backend` and `m_st_n_buckets` are used.
 * @param err_code
 *        See ordo::Error_code docs for error reporting semantics.  Error codes: those of
 *        cfg::Container_options::validate().
 * @return The new Map; or null on error.
 */
template<typename Key, typename Mapped>
typename Map<Key, Mapped>::Ptr make_map(const cfg::Container_options& opts, Error_code* err_code = 0);

/**
 * Constructs an empty Set according to the given options, after validating them.
 *
 * @tparam T
 *         Element type.
 * @param opts
 *        See make_map().
 * @param err_code
 *        See make_map().
 * @return The new Set; or null on error.
 */
template<typename T>
typename Set<T>::Ptr make_set(const cfg::Container_options& opts, Error_code* err_code = 0);

/**
 * Constructs an empty Lru_cache according to the given options, after validating them.
 *
 * @tparam Key
 *         Key type.
 * @tparam Mapped
 *         Value type.
 * @param logger_ptr
 *        Logger for the cache (and for logging errors here); may be null.
 * @param opts
 *        Options; `m_st_lru_capacity` and `m_st_n_buckets` are used.  `m_st_backend` must be valid but is otherwise
 *        ignored: the cache always uses Linked_hash_map.
 * @param err_code
 *        See make_map().
 * @return The new cache; or null on error.
 */
template<typename Key, typename Mapped>
std::unique_ptr<Lru_cache<Key, Mapped>> make_lru_cache(log::Logger* logger_ptr, const cfg::Container_options& opts,
                                                       Error_code* err_code = 0);

// Template implementations.

template<typename Key, typename Mapped>
typename Map<Key, Mapped>::Ptr make_map(Backend backend, size_t n_buckets)
{
  switch (backend)
  {
  case Backend::S_HASH:
    return std::make_unique<Hash_map<Key, Mapped>>(n_buckets);
  case Backend::S_ARRAY:
    return std::make_unique<Array_map<Key, Mapped>>();
  case Backend::S_LINKED_HASH:
    return std::make_unique<Linked_hash_map<Key, Mapped>>(n_buckets);
  case Backend::S_END_SENTINEL:
    break;
  }
  return {};
}

template<typename T>
typename Set<T>::Ptr make_set(Backend backend, size_t n_buckets)
{
  switch (backend)
  {
  case Backend::S_HASH:
    return std::make_unique<Hash_set<T>>(Hash_map<T, Unit>(n_buckets));
  case Backend::S_ARRAY:
    return std::make_unique<Array_set<T>>();
  case Backend::S_LINKED_HASH:
    return std::make_unique<Linked_set<T>>(Linked_hash_map<T, Unit>(n_buckets));
  case Backend::S_END_SENTINEL:
    break;
  }
  return {};
}

template<typename Key, typename Mapped>
typename Map<Key, Mapped>::Ptr make_map(const cfg::Container_options& opts, Error_code* err_code)
{
  using Ptr = typename Map<Key, Mapped>::Ptr;

  /* Can't use ORDO_ERROR_EXEC_AND_THROW_ON_ERROR(): the return type has template commas.  Do what it does
   * by hand. */
  Ptr result;
  if (error::exec_and_throw_on_error([&](Error_code* actual_err_code) -> Ptr
                                       { return make_map<Key, Mapped>(opts, actual_err_code); },
                                     &result, err_code, ORDO_UTIL_WHERE_AM_I_STR()))
  {
    return result;
  }
  // else

  if (!opts.validate(err_code))
  {
    return {};
  }
  // else
  return make_map<Key, Mapped>(opts.m_st_backend, opts.m_st_n_buckets);
}

template<typename T>
typename Set<T>::Ptr make_set(const cfg::Container_options& opts, Error_code* err_code)
{
  using Ptr = typename Set<T>::Ptr;

  Ptr result;
  if (error::exec_and_throw_on_error([&](Error_code* actual_err_code) -> Ptr
                                       { return make_set<T>(opts, actual_err_code); },
                                     &result, err_code, ORDO_UTIL_WHERE_AM_I_STR()))
  {
    return result;
  }
  // else

  if (!opts.validate(err_code))
  {
    return {};
  }
  // else
  return make_set<T>(opts.m_st_backend, opts.m_st_n_buckets);
}

template<typename Key, typename Mapped>
std::unique_ptr<Lru_cache<Key, Mapped>> make_lru_cache(log::Logger* logger_ptr, const cfg::Container_options& opts,
                                                       Error_code* err_code)
{
  using Ptr = std::unique_ptr<Lru_cache<Key, Mapped>>;

  Ptr result;
  if (error::exec_and_throw_on_error([&](Error_code* actual_err_code) -> Ptr
                                       { return make_lru_cache<Key, Mapped>(logger_ptr, opts, actual_err_code); },
                                     &result, err_code, ORDO_UTIL_WHERE_AM_I_STR()))
  {
    return result;
  }
  // else

  ORDO_LOG_SET_CONTEXT(logger_ptr, Ordo_log_component::S_COL);

  Error_code validate_err_code;
  if (!opts.validate(&validate_err_code))
  {
    ORDO_ERROR_EMIT_ERROR(validate_err_code);
    return {};
  }
  // else

  err_code->clear();
  return std::make_unique<Lru_cache<Key, Mapped>>(logger_ptr, opts.m_st_lru_capacity, opts.m_st_n_buckets);
}

} // namespace ordo::col
