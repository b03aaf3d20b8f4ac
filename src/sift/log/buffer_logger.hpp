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

#include "sift/log/log.hpp"
#include "sift/log/ostream_log_msg_writer.hpp"
#include "sift/util/string_ostream.hpp"
#include "sift/util/util_fwd.hpp"
#include <string>

namespace sift::log
{

// Types.

/**
 * An implementation of Logger that logs messages to an internal `std::string` buffer and provides read-only access
 * to this buffer (for example, if one wants to write out its contents when exiting program, or inspect it in a
 * unit test).  Each line is formatted by an Ostream_log_msg_writer.
 *
 * ### Thread safety ###
 * Logging is thread-safe.  buffer_str_copy() is safe to call concurrently with logging; buffer_str() is not.
 */
class Buffer_logger :
  public Logger
{
public:
  // Constructors/destructor.

  /**
   * Constructs logger to subsequently log to the internal buffer, initially empty.
   *
   * @param config
   *        Controls behavior of `*this`; must exist as long as `*this` does.
   */
  explicit Buffer_logger(Config* config);

  // Methods.

  /**
   * Asks #m_config.
   *
   * @param sev
   *        Message severity.
   * @param component
   *        Message component.
   * @return See above.
   */
  bool should_log(Sev sev, const Component& component) const override;

  /**
   * Implements interface method by returning `false`; do_log() appends to the buffer synchronously.
   *
   * @return See above.
   */
  bool logs_asynchronously() const override;

  /**
   * Appends one formatted line to the buffer.
   *
   * @param metadata
   *        Call-site metadata.
   * @param msg
   *        The message.
   */
  void do_log(Msg_metadata* metadata, util::String_view msg) override;

  /**
   * Read-only access to the buffer string containing the messages logged thus far.  Not safe to use while
   * another thread may be logging via `*this`.
   *
   * @return Read-only reference.
   */
  const std::string& buffer_str() const;

  /**
   * Returns a copy of buffer_str() in thread-safe fashion.
   *
   * @return A copy.
   */
  const std::string buffer_str_copy() const;

  // Data.  (Public!)

  /// The Config given to the ctor; its verbosities may be changed while logging goes on.
  Config* const m_config;

private:
  // Data.

  /// The buffer.
  util::String_ostream m_os;

  /// Formats lines into #m_os.
  Ostream_log_msg_writer m_os_writer;

  /// Mutex protecting against log messages being logged concurrently, and against reading while logging.
  mutable util::Mutex_non_recursive m_log_mutex;
}; // class Buffer_logger

} // namespace sift::log
