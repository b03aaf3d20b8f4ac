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

#include "sift/error/error_fwd.hpp"
#include "sift/log/log.hpp"
#include "sift/util/detail/util.hpp"
#include <boost/system/system_error.hpp>
#include <stdexcept>

namespace sift::error
{
// Types.

/**
 * Exception thrown by Sift APIs that report errors by exception when no `Error_code*` is supplied.  It is a
 * `boost::system::system_error` carrying the #Error_code, so `code()` works as usual; what() differs only in that
 * a falsy code (a pure context-message error) is left out of the text.
 */
class Runtime_error :
  public boost::system::system_error
{
public:
  // Constructors/destructor.

  /**
   * Constructs the exception.
   *
   * @param err_code_or_success
   *        The error; or `Error_code()` if there is no code for it, in which case what() is `context` alone.
   * @param context
   *        Where and why it happened; SIFT_UTIL_WHERE_AM_I_STR() helps.
   */
  explicit Runtime_error(const Error_code& err_code_or_success, util::String_view context = "");

  /**
   * Same as `Runtime_error(Error_code(), context)`.
   *
   * @param context
   *        See the other ctor.
   */
  explicit Runtime_error(util::String_view context);

  // Methods.

  /**
   * `context` alone if the code is falsy; otherwise system_error's rendering of `context` plus the code's message.
   *
   * @return See above.
   */
  const char* what() const noexcept override;

private:
  // Data.

  /// `context` when the code is falsy (system_error::what() would print the code regardless); else empty.
  const std::string m_context_if_no_code;
}; // class Runtime_error

// Free functions: in *_fwd.hpp.

// Template implementations.

template<typename Func, typename Ret>
bool exec_and_throw_on_error(const Func& func, Ret* ret,
                             Error_code* err_code, util::String_view context)
{
  if (err_code)
  {
    return false;
  }
  // else: caller wants an exception on error.

  Error_code our_err_code;
  *ret = func(&our_err_code);
  if (our_err_code)
  {
    throw Runtime_error(our_err_code, context);
  }
  return true;
}

template<typename Func>
bool exec_void_and_throw_on_error(const Func& func, Error_code* err_code, util::String_view context)
{
  if (err_code)
  {
    return false;
  }
  // else

  Error_code our_err_code;
  func(&our_err_code);
  if (our_err_code)
  {
    throw Runtime_error(our_err_code, context);
  }
  return true;
}

} // namespace sift::error

// Macros.

/**
 * Logs `ARG_val` at WARNING level, then stores it into `*err_code`.  Requires an `Error_code* err_code` (non-null)
 * in scope, besides the usual logging context.
 *
 * @param ARG_val
 *        Anything convertible to sift::Error_code.
 */
#define SIFT_ERROR_EMIT_ERROR(ARG_val) \
  SIFT_UTIL_SEMICOLON_SAFE \
  ( \
    const ::sift::Error_code sift_error_emitted(ARG_val); \
    SIFT_LOG_WARNING("Error code emitted: [" << sift_error_emitted << "] [" << sift_error_emitted.message() << "]."); \
    *err_code = sift_error_emitted; \
  )

/**
 * First statement of a Sift API function `F(..., Error_code* err_code = 0)` that reports errors either way.  If
 * `err_code` is null, re-invokes `F` with a local code in its place, returns the result on success and throws
 * error::Runtime_error on failure.  If `err_code` is non-null, does nothing: the rest of `F` runs and reports
 * through `*err_code`.
 *
 *   ~~~
 *   size_t load(util::String_view text, Error_code* err_code = 0)
 *   {
 *     SIFT_ERROR_EXEC_AND_THROW_ON_ERROR(size_t, load, text, _1);
 *     // err_code is non-null from here on.
 *     ...
 *   }
 *   ~~~
 *
 * @param ARG_ret_type
 *        Return type of `F`; not `void` (use exec_void_and_throw_on_error() there) and not a reference.
 * @param ARG_function_name
 *        `F`.
 * @param ...
 *        `F`'s arguments, with `_1` where `err_code` goes.
 */
#define SIFT_ERROR_EXEC_AND_THROW_ON_ERROR(ARG_ret_type, ARG_function_name, ...) \
  SIFT_UTIL_SEMICOLON_SAFE \
  ( \
    ARG_ret_type sift_error_result; \
    if (::sift::error::exec_and_throw_on_error \
          ([&](::sift::Error_code* _1) -> ARG_ret_type { return ARG_function_name(__VA_ARGS__); }, \
           &sift_error_result, err_code, SIFT_UTIL_WHERE_AM_I_LITERAL(ARG_function_name))) \
    { \
      return sift_error_result; \
    } \
  )
