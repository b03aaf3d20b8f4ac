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
#include "sift/common.hpp"

namespace sift
{

/// @cond
// -^- Doxygen, please ignore the following.  It is macro magic with nothing useful to document.

// Static initializers.

/* The cpp half of the trio begun in detail/common.hpp: defines the (Sift_log_component -> std::string) multimap
 * declared there, one entry per enum member, generated from the same declare-file.  The name macros are
 * re-established, as the header trio's end-cap leaves them defined but this file must not depend on that. */
#ifndef SIFT_LOG_CFG_COMPONENT_ENUM_CLASS
#  define SIFT_LOG_CFG_COMPONENT_ENUM_CLASS Sift_log_component
#endif
#ifndef SIFT_LOG_CFG_COMPONENT_ENUM_NAME_MAP
#  define SIFT_LOG_CFG_COMPONENT_ENUM_NAME_MAP S_SIFT_LOG_COMPONENT_NAME_MAP
#endif
#include "sift/log/macros/config_enum_start_cpp.macros.hpp"
#include "sift/detail/macros/log_component_enum_declare.macros.hpp"
#include "sift/log/macros/config_enum_end_cpp.macros.hpp"

// -v- Doxygen, please stop ignoring.
/// @endcond

} // namespace sift
