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

/**
 * Namespace containing the sift::log module's extension of boost.system error conventions, so that that API can
 * return codes/messages from within its own new set of error codes/messages.  Users of Verbosity_config's
 * error-reporting API (parse_and_apply()) compare against these.  See sift::error doc header for the general
 * Error_code-or-exception convention.
 */
namespace sift::log::error
{

// Types.

/**
 * All possible errors returned (via sift::Error_code arguments) by sift::log functions/methods.  These values are
 * convertible to sift::Error_code (a/k/a `boost::system::error_code`) and thus extend the set of errors that
 * sift::Error_code can represent.
 *
 * When you modify this, make sure to update the message strings in error.cpp.
 */
enum class Code
{
  /// Verbosity config text could not be parsed: bad pair syntax or an unrecognizable severity.
  S_VERBOSITY_CONFIG_MALFORMED = 1,
  /// Verbosity config text names a component not registered with the target Config.
  S_VERBOSITY_CONFIG_UNKNOWN_COMPONENT
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight sift::Error_code (a/k/a boost.system `error_code`)
 * representing that error.  This is needed to make the `boost::system::error_code::error_code<Code>()` template
 * implementation work.  Or, slightly more in English, it glues the (completely general) sift::Error_code
 * to the (`log`-specific) error code set sift::log::error::Code, so that one can implicitly covert from the latter
 * to the former.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding sift::Error_code.
 */
Error_code make_error_code(Code err_code);

} // namespace sift::log::error

/// We may add some ADL-based overloads into this namespace outside `sift`.
namespace boost::system
{

// Types.

/**
 * Specialization that tells boost.system that sift::log::error::Code values are error codes, so that they can be
 * implicitly converted to sift::Error_code via sift::log::error::make_error_code().
 */
template<>
struct is_error_code_enum<::sift::log::error::Code>
{
  /// Means `Code` `enum` values can be used for sift::Error_code.
  static const bool value = true;
};

} // namespace boost::system
