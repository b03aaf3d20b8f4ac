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

#include "sift/detail/common.hpp"
#include <boost/system/error_code.hpp>
#include <functional>

/* We build in C++17 mode ourselves, and the headers use C++17 features (`if constexpr`, nested namespace
 * definitions, `std::string_view`); so a linking user must be in that mode at least. */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any sift/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for the Sift project, a collection of order-preserving, invariant-keeping generic containers
 * (plus the logging and error-reporting facilities they, and their users, need).
 *
 * Each symbol therein is in a sub-namespace (module), with the following exceptions which are so commonly used that
 * they are placed directly here for brevity.
 *
 * The modules, leaf-first:
 *   - util: miscellaneous general-use facilities (string-building, semicolon-safe macros, etc.);
 *   - error: boost.system-based error reporting (Error_code-or-exception convention);
 *   - log: the logging facility (Logger interface, Config, verbosity control, a couple of concrete loggers);
 *   - coll: the containers proper (Ordered_map, Equality_set, Seen_set) and the stable-dedup algorithm.
 */
namespace sift
{

// Types.

/**
 * Short-hand for a boost.system error code (which basically encapsulates an integer/`enum` error code and a pointer
 * through which to obtain a statically stored message string); this is how Sift modules report errors to the user.
 * See sift::error doc header for the convention.
 */
using Error_code = boost::system::error_code;

#ifdef SIFT_DOXYGEN_ONLY // Actual compilation will ignore the below; but Doxygen will scan it and generate docs.

/**
 * The sift::log::Component payload enumeration comprising various log components used by Sift's own internal
 * logging.  Internal Sift code specifies members thereof when indicating the log component for each particular
 * piece of logging code.  Sift user specifies it, albeit very rarely, when configuring their program's logging
 * such as via sift::log::Config::init_component_to_union_idx_mapping() and sift::log::Config::init_component_names().
 *
 * The actual members are listed in `sift/detail/macros/log_component_enum_declare.macros.hpp`.
 */
enum class Sift_log_component
{
  /**
   * CAUTION: see sift::Sift_log_component doc header for directions to find actual members of this
   * `enum class`.  This entry is a placeholder for Doxygen purposes only, because of the macro magic involved
   * in generating the actual `enum class`.
   */
  S_END_SENTINEL
};

/**
 * The map generated by sift::log macro magic that maps each enumerated value in sift::Sift_log_component to its
 * string representation as used in log output and verbosity config.  Sift user specifies, albeit very rarely,
 * when configuring their program's logging via sift::log::Config::init_component_names().
 */
extern const boost::unordered_multimap<Sift_log_component, std::string> S_SIFT_LOG_COMPONENT_NAME_MAP;

#endif // SIFT_DOXYGEN_ONLY

} // namespace sift
