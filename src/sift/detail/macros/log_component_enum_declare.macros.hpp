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

/// @cond
// -^- Doxygen, please ignore the following.  This is macro magic and not a regular `#pragma once` header.

/* See common.hpp and common.cpp which #include us.
 * The following macro invocations specify:
 *   - each enum variable name of `enum class Sift_log_component` (`S_` is auto-prepended to each name);
 *   - for each, its numeric counterpart;
 *   - for each, its name, used for output and when configuring verbosity by name (auto-derived from the variable
 *     name via the # macro operator).
 *
 * Keep the numeric values in ascending order; `S_END_SENTINEL` is auto-appended and equals the last value plus 1,
 * so do not declare one named END_SENTINEL. */

// Log call sites outside namespace `sift::X`, for all X in `sift`.
SIFT_LOG_CFG_COMPONENT_DEFINE(UNCAT, 0)
// Logging from namespace sift::log.
SIFT_LOG_CFG_COMPONENT_DEFINE(LOG, 1)
// Logging from namespace sift::error.
SIFT_LOG_CFG_COMPONENT_DEFINE(ERROR, 2)
// Logging from namespace sift::util.
SIFT_LOG_CFG_COMPONENT_DEFINE(UTIL, 3)
// Logging from namespace sift::coll (the containers).
SIFT_LOG_CFG_COMPONENT_DEFINE(COLL, 4)

// -v- Doxygen, please stop ignoring.
/// @endcond
