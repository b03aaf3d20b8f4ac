/* Sift
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

#include "sift/util/util_fwd.hpp"
#include "sift/common.hpp"

/**
 * Sift module that facilitates working with error codes and exceptions; essentially comprised of niceties on top
 * boost.system's error facility.
 *
 * The convention, followed by every Sift API that can fail: the last (or nearly so) argument is
 * `Error_code* err_code = 0`.  If the caller passes non-null, then on failure `*err_code` is set to a truthy value
 * and the function returns normally (on success `*err_code` is made falsy).  If the caller passes null (the default),
 * then on failure Runtime_error, which carries that same code, is thrown instead.  SIFT_ERROR_EXEC_AND_THROW_ON_ERROR()
 * implements the bifurcation with minimal boiler-plate.
 *
 * Note that the containers in sift::coll do not use this at all: none of their operations can fail other than by
 * memory exhaustion (which is reported by `std::bad_alloc` like in any STL container).
 */
namespace sift::error
{
// Types.

// Find doc headers near the bodies of these compound types.

class Runtime_error;

// Free functions.

/**
 * Helper for SIFT_ERROR_EXEC_AND_THROW_ON_ERROR() macro that executes the given operation, throwing Runtime_error
 * if it reports an error; but only if `err_code` is null.  If it is not null, it does nothing and returns `false`,
 * so the caller knows to perform the operation itself, reporting any error via `*err_code`.
 *
 * @tparam Func
 *         Functor type with signature `Ret F(Error_code*)`.
 * @tparam Ret
 *         Return type of the operation; see SIFT_ERROR_EXEC_AND_THROW_ON_ERROR().
 * @param func
 *        The operation, which must set the passed-in `Error_code` to truthy on failure and falsy otherwise.
 * @param ret
 *        If `func()` executed and did not throw, its return value is placed here.
 * @param err_code
 *        The caller's `err_code` argument.
 * @param context
 *        Context info to place into Runtime_error, if one is thrown.
 * @return `true` if `func()` was executed (and did not throw); `false` if `err_code` was not null, so nothing
 *         was done.
 */
template<typename Func, typename Ret>
bool exec_and_throw_on_error(const Func& func, Ret* ret,
                             Error_code* err_code, util::String_view context);

/**
 * Equivalent of exec_and_throw_on_error() for operations that return `void`.
 *
 * @tparam Func
 *         Functor type with signature `void F(Error_code*)`.
 * @param func
 *        See exec_and_throw_on_error().
 * @param err_code
 *        See exec_and_throw_on_error().
 * @param context
 *        See exec_and_throw_on_error().
 * @return See exec_and_throw_on_error().
 */
template<typename Func>
bool exec_void_and_throw_on_error(const Func& func, Error_code* err_code, util::String_view context);

} // namespace sift::error
