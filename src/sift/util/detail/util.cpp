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
#include "sift/util/detail/util.hpp"
#include "sift/util/util.hpp"

namespace sift::util
{

std::string get_where_am_i_str(std::string_view file, std::string_view function, unsigned int line)
{
  return ostream_op_string(SIFT_UTIL_WHERE_AM_I_FROM_ARGS_TO_ARGS(file, function, line));
}

} // namespace sift::util
