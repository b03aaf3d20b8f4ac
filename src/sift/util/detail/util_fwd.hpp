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

#include "sift/common.hpp"
#include <string>
#include <string_view>

namespace sift::util
{

// Free functions.

/**
 * The part of `path` after its last `/`, or all of `path` if there is none; a view into the same characters.
 * `constexpr`, so the log macros strip `__FILE__` at compile time when given `String_view(__FILE__, sizeof(__FILE__) - 1)`.
 *
 * @param path
 *        A file path.
 * @return See above.
 */
constexpr std::string_view get_last_path_segment(std::string_view path);

/**
 * Returns what SIFT_UTIL_WHERE_AM_I() would print, for the given location.
 *
 * @param file
 *        File path; directories are stripped.
 * @param function
 *        Function name.
 * @param line
 *        Line number.
 * @return See above.
 */
std::string get_where_am_i_str(std::string_view file, std::string_view function, unsigned int line);

} // namespace sift::util
