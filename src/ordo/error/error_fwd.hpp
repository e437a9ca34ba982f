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
#include "ordo/util/util_fwd.hpp"

/**
 * Ordo module that facilitates working with error codes and exceptions, chiefly the `Error_code* err_code = 0`
 * convention (see ordo::Error_code doc header) used by the Ordo APIs that can fail.  The error codes themselves are
 * defined by each module that emits them (such as ordo::cfg::error).
 */
namespace ordo::error
{
// Types.

class Runtime_error;

// Free functions.

/**
 * Helper for implementing the `Error_code* err_code = 0` convention in a method that returns a value.
 * If `err_code` is not null, does nothing and returns `false`: the caller should proceed normally, setting
 * `*err_code` as needed.  If it is null, executes `func(&our_err_code)`, stores its result into `*ret`, and returns
 * `true` if it succeeded; or throws Runtime_error (storing `our_err_code` and `context`) if it failed.
 *
 * Use ORDO_ERROR_EXEC_AND_THROW_ON_ERROR() in non-template code; in template code calling this directly is
 * typically easier.
 *
 * @tparam Func
 *         Functor with signature `Ret (Error_code*)`.
 * @tparam Ret
 *         Type returned by `func`.
 * @param func
 *        Typically the caller itself, invoked recursively with a non-null `Error_code*`.
 * @param ret
 *        Where to place `func()`'s result, if it is executed and succeeds.
 * @param err_code
 *        The caller's `err_code` argument.
 * @param context
 *        String describing the call site, for the exception's `what()`.
 * @return `true` if `func()` ran and succeeded; `false` if the caller should proceed with a non-null `err_code`.
 */
template<typename Func, typename Ret>
bool exec_and_throw_on_error(const Func& func, Ret* ret, Error_code* err_code, util::String_view context);

} // namespace ordo::error
