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

/* This file is to be `#include`d after the following:
 *   #define SIFT_LOG_CFG_COMPONENT_ENUM_CLASS X_log_component
 *   #define SIFT_LOG_CFG_COMPONENT_ENUM_NAME_MAP S_X_LOG_COMPONENT_NAME_MAP
 * where X is some way to name your sift::log-logging module/project.
 *
 * After `#include`ing this file, declare X_log_component's enum members, typically by `#include`ing a file named
 * X/.../log_component_enum_declare.macros.hpp, featuring only lines of this format:
 *   SIFT_LOG_CFG_COMPONENT_DEFINE(FIRST_COMPONENT_NAME, 0)
 *   SIFT_LOG_CFG_COMPONENT_DEFINE(SECOND_COMPONENT_NAME, 1)
 * Then `#include` the end-cap counterpart to the present file (config_enum_end_hdr.macros.hpp).
 *
 * Lastly repeat the procedure in a .cpp file (e.g., Sift's own common.cpp) with the _cpp counterparts
 * config_enum_{start|end}_cpp.macros.hpp book-ending another `#include` of the same declare-file. */
#define SIFT_LOG_CFG_COMPONENT_DEFINE(ARG_name_root, ARG_enum_val) \
  S_ ## ARG_name_root = ARG_enum_val,
/* The underlying type must equal sift::log::Component::enum_raw_t; a static_assert() in Component code ensures
 * this does not go out of sync. */
enum class SIFT_LOG_CFG_COMPONENT_ENUM_CLASS : unsigned int
{

// -v- Doxygen, please stop ignoring.
/// @endcond
