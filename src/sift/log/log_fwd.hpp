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

#include "sift/util/util_fwd.hpp"
#include "sift/common.hpp"
#include <iosfwd>

/**
 * Sift module providing logging functionality.  Sift itself logs through it, at TRACE verbosity, from the
 * containers in sift::coll; and a Sift user is free to use it for their own code.
 *
 * The design, in brief:
 *   - Logger is the interface: it decides whether a message of a given severity and Component should be logged
 *     at all (should_log()) and then does the logging (do_log()).  It is an abstract class, so the user picks
 *     or writes the concrete implementation.  We supply Buffer_logger (writes to an in-memory buffer that the
 *     user can read back or dump, e.g. in tests).
 *   - Config stores the verbosity (max Sev) per Component; Buffer_logger consults it in
 *     should_log().  Verbosity_config is a parse-able text representation thereof, like "ALL:INFO;COLL:TRACE".
 *   - The `SIFT_LOG_*()` macros are the call-site API: `SIFT_LOG_INFO("Value is [" << x << "].")`.
 *     They obtain the Logger and Component by calling `get_logger()` and `get_log_component()` in the
 *     call-site scope; these come either from deriving from Log_context or from SIFT_LOG_SET_CONTEXT().
 *     The `<<` fragment is not evaluated at all unless should_log() says yes, so a disabled TRACE statement costs
 *     about one virtual call.
 *   - A null Logger is valid everywhere: nothing is logged.
 */
namespace sift::log
{

// Types.

// Find doc headers near the bodies of these compound types.

class Buffer_logger;
class Component;
class Config;
class Logger;
class Log_context;
struct Msg_metadata;
class Ostream_log_msg_writer;
class Verbosity_config;

/**
 * Message severity.  Numerically larger means less severe and typically more frequent; so a verbosity threshold
 * `T` lets through exactly the messages with `sev <= T`.  Sift's own code logs at TRACE (sift::coll) and WARNING
 * (error reporting); the other levels are there for the user.
 */
enum class Sev : size_t
{
  /// Never a message's severity; as a threshold it lets nothing through.
  S_NONE = 0,

  /// The program cannot continue.
  S_FATAL,

  /// Something failed, worse than a WARNING.
  S_ERROR,

  /// Something went wrong, and it does not happen often; a frequent problem belongs at TRACE instead.
  S_WARNING,

  /// Noteworthy and infrequent; a production log at INFO must not cost measurable performance.
  S_INFO,

  /// As infrequent as INFO, but of less interest.
  S_DEBUG,

  /// Per-operation detail, possibly very frequent.  Every sift::coll mutation logs here.
  S_TRACE,

  /// TRACE plus bulk data dumps.  sift::coll does not use it, as it never prints elements.
  S_DATA,

  /// One past the last real value.
  S_END_SENTINEL
}; // enum class Sev

// Free functions.

/**
 * Reads a Sev written as its name in any case ("warning", "WARNING") or as its number ("3").  Anything else reads
 * as Sev::S_NONE.  See util::istream_to_enum().
 *
 * @param is
 *        Source stream.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Sev& val);

/**
 * Prints a Sev as its upper-case name, readable back by `operator>>()`.
 *
 * @param os
 *        Target stream.
 * @param val
 *        Value.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Sev val);

/**
 * `val1.swap(val2)`.
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 */
void swap(Log_context& val1, Log_context& val2);

} // namespace sift::log
