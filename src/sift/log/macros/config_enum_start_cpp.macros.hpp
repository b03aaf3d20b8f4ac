/* Sift
 * Copyright 2026 The Sift Authors
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

/* The .cpp counterpart of config_enum_start_hdr.macros.hpp: `#include` it in exactly one translation unit, with
 * the same two SIFT_LOG_CFG_COMPONENT_ENUM_* macros in effect, followed by the same declare-file and then
 * config_enum_end_cpp.macros.hpp.  The result is the definition of the name multimap declared in the header trio,
 * with one entry per enum member whose value is the member name sans the `S_` prefix. */
#define SIFT_LOG_CFG_COMPONENT_DEFINE(ARG_name_root, ARG_enum_val) \
  { SIFT_LOG_CFG_COMPONENT_ENUM_CLASS::S_ ## ARG_name_root, #ARG_name_root },
const boost::unordered_multimap<SIFT_LOG_CFG_COMPONENT_ENUM_CLASS, std::string>
  SIFT_LOG_CFG_COMPONENT_ENUM_NAME_MAP
{

// -v- Doxygen, please stop ignoring.
/// @endcond
