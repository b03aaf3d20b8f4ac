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

#include "sift/util/detail/util_fwd.hpp"
#include <boost/thread/mutex.hpp>
#include <boost/thread/locks.hpp>
#include <iostream>
#include <string_view>

/**
 * Odds and ends shared by the other Sift modules: RAII and string-building helpers, `enum` parsing, source-location
 * macros, mutex aliases.  Everything outside util/detail/ is usable by Sift users as well.
 */
namespace sift::util
{
// Types.

// Find doc headers near the bodies of these compound types.

class Null_interface;

template<typename Value>
class Scoped_setter;

class String_ostream;

/// Non-owning view of characters stored elsewhere.  The log macros build these from `__FILE__`, `__FUNCTION__`.
using String_view = std::string_view;

/// Plain exclusive mutex; not reentrant.
using Mutex_non_recursive = boost::mutex;

/**
 * Scoped exclusive lock on a mutex.
 *
 * @tparam Mutex
 *         Mutex type; usually #Mutex_non_recursive.
 */
template<typename Mutex>
using Lock_guard = boost::unique_lock<Mutex>;

// Free functions.

/**
 * Appends to `*target_str` the text that `os << a1 << a2 << ...` would produce.  Existing contents of
 * `*target_str` are kept.
 *
 * @tparam T
 *         Types printable via `ostream::operator<<`.
 * @param target_str
 *        Non-null string to append to.
 * @param ostream_args
 *        Values to print, in order.
 */
template<typename ...T>
void ostream_op_to_string(std::string* target_str, const T&... ostream_args);

/**
 * Like ostream_op_to_string(), but into a new string, returned.  Handy in constructor initializer lists and in
 * exception messages.
 *
 * @tparam T
 *         See ostream_op_to_string().
 * @param ostream_args
 *        See ostream_op_to_string().
 * @return The formatted string.
 */
template<typename ...T>
std::string ostream_op_string(const T&... ostream_args);

/**
 * Prints each argument, in order, to `*os` via `<<`.  Recursive case.
 *
 * @tparam T1
 *         Type of the first argument.
 * @tparam T_rest
 *         Types of the rest.
 * @param os
 *        Non-null target stream.
 * @param ostream_arg1
 *        First value.
 * @param remaining_ostream_args
 *        The rest.
 */
template<typename T1, typename ...T_rest>
void feed_args_to_ostream(std::ostream* os, const T1& ostream_arg1, const T_rest&... remaining_ostream_args);

/**
 * Prints one argument to `*os` via `<<`.  Base case of the above.
 *
 * @tparam T
 *         Type of the argument.
 * @param os
 *        Non-null target stream.
 * @param only_ostream_arg
 *        The value.
 */
template<typename T>
void feed_args_to_ostream(std::ostream* os, const T& only_ostream_arg);

/**
 * Reads an `enum` value from `*is_ptr`: consumes the longest run of letters, digits and underscores, leaving the
 * following character unread, and maps the token to an `Enum`.  Accepted tokens are the `operator<<()` rendering of
 * any value in [`enum_lowest`, `enum_sentinel`), case-insensitive by default; and, unless disabled, that value's
 * decimal integer.  Anything else (including an empty token) yields `enum_default`.
 *
 * `operator>>()` for a Sift `enum` (log::Sev for one) is normally a one-line call of this function.
 *
 * @tparam Enum
 *         An `enum` whose values from `enum_lowest` to `enum_sentinel` are consecutive non-negative integers.
 * @param is_ptr
 *        Non-null source stream.
 * @param enum_default
 *        Result for an unrecognized token.
 * @param enum_sentinel
 *        One past the last valid value.
 * @param accept_num_encoding
 *        Whether a decimal integer token is accepted.
 * @param case_sensitive
 *        Whether names must match case exactly.
 * @param enum_lowest
 *        First valid value.
 * @return See above.
 */
template<typename Enum>
Enum istream_to_enum(std::istream* is_ptr, Enum enum_default, Enum enum_sentinel,
                     bool accept_num_encoding = true, bool case_sensitive = false,
                     Enum enum_lowest = Enum(0));

// Macros.

/**
 * Expands to an `ostream` fragment printing `file:function(line)` for the point of use; as in
 * `os << SIFT_UTIL_WHERE_AM_I() << ": oops"`.  The file is the base name only.  All pieces are compile-time constants.
 */
#define SIFT_UTIL_WHERE_AM_I() \
  SIFT_UTIL_WHERE_AM_I_FROM_ARGS(::sift::util::get_last_path_segment \
                                   (::sift::util::String_view(__FILE__, sizeof(__FILE__) - 1)), \
                                 ::sift::util::String_view(__FUNCTION__, sizeof(__FUNCTION__) - 1), \
                                 __LINE__)

/// SIFT_UTIL_WHERE_AM_I() as an `std::string`, built at run time.
#define SIFT_UTIL_WHERE_AM_I_STR() \
  ::sift::util::get_where_am_i_str(::sift::util::get_last_path_segment \
                                     (::sift::util::String_view(__FILE__, sizeof(__FILE__) - 1)), \
                                   ::sift::util::String_view(__FUNCTION__, sizeof(__FUNCTION__) - 1), \
                                   __LINE__)

/**
 * String literal `"<__FILE__>:<ARG_function>(<__LINE__>)"`.  `__FILE__` keeps its directories here, since
 * stripping them is not possible in a literal.
 *
 * @param ARG_function
 *        Bare function identifier; it is stringified.
 */
#define SIFT_UTIL_WHERE_AM_I_LITERAL(ARG_function) \
  __FILE__ ":" #ARG_function "(" SIFT_UTIL_STRINGIFY_EXPANDED(__LINE__) ")"

/**
 * Stringifies `ARG_text` after macro-expanding it: `SIFT_UTIL_STRINGIFY_EXPANDED(__LINE__)` gives `"123"`.
 *
 * @param ARG_text
 *        Text to expand and stringify.
 */
#define SIFT_UTIL_STRINGIFY_EXPANDED(ARG_text) \
  SIFT_UTIL_STRINGIFY_LITERALLY(ARG_text)

/**
 * Stringifies `ARG_text` verbatim.
 *
 * @param ARG_text
 *        Text to stringify.
 */
#define SIFT_UTIL_STRINGIFY_LITERALLY(ARG_text) \
  #ARG_text

/**
 * Wraps a multi-statement macro body into one statement that takes the call site's trailing semicolon, so that
 * `if (c) SOME_MACRO(x); else ...` parses as intended.  Inside the body `break` exits the macro early.
 *
 * @param ARG_func_macro_definition
 *        The macro body.
 */
#define SIFT_UTIL_SEMICOLON_SAFE(ARG_func_macro_definition) \
  do \
  { \
    ARG_func_macro_definition \
  } \
  while (false)

} // namespace sift::util
