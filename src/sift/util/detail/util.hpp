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

namespace sift::util
{

// Free functions: in *_fwd.hpp.

// Template/constexpr implementations.

constexpr std::string_view get_last_path_segment(std::string_view full_path)
{
  constexpr char SEP = '/';

  // Scan backwards; written as a loop so older constexpr evaluators accept it.
  for (auto pos = full_path.size(); pos != 0; --pos)
  {
    if (full_path[pos - 1] == SEP)
    {
      return full_path.substr(pos);
    }
  }
  return full_path;
}

} // namespace sift::util

// Macros.

/**
 * SIFT_UTIL_WHERE_AM_I() with the location supplied explicitly: `<<`-chains `file:function(line)`.
 *
 * @param ARG_file
 *        File name (`String_view` or `const char*`), printed as given.
 * @param ARG_function
 *        Function name.
 * @param ARG_line
 *        Line number.
 */
#define SIFT_UTIL_WHERE_AM_I_FROM_ARGS(ARG_file, ARG_function, ARG_line) \
  ARG_file << ':' << ARG_function << '(' << ARG_line << ')'

/**
 * The pieces of SIFT_UTIL_WHERE_AM_I_FROM_ARGS() as a comma-separated argument list, for util::ostream_op_string()
 * and friends.  Strips directories from `ARG_file`.
 *
 * @param ARG_file
 *        See SIFT_UTIL_WHERE_AM_I_FROM_ARGS().
 * @param ARG_function
 *        See SIFT_UTIL_WHERE_AM_I_FROM_ARGS().
 * @param ARG_line
 *        See SIFT_UTIL_WHERE_AM_I_FROM_ARGS().
 */
#define SIFT_UTIL_WHERE_AM_I_FROM_ARGS_TO_ARGS(ARG_file, ARG_function, ARG_line) \
  ::sift::util::get_last_path_segment(ARG_file), ':', ARG_function, '(', ARG_line, ')'
