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
#pragma once

#include "sift/log/log.hpp"
#include "sift/util/util_fwd.hpp"
#include <boost/io/ios_state.hpp>
#include <vector>
#include <ostream>

namespace sift::log
{

// Types.

/**
 * Utility class, each object of which wraps a given `ostream` and outputs discrete messages to it adorned with time
 * stamps and other formatting such as separating newlines.  A Logger that outputs to an `ostream` (console, string
 * buffer, file) is expected to keep one of these per stream and merely call log() once it has decided to in fact
 * log a message.
 *
 * Each log() call writes exactly one line of this form:
 *
 *   `<time stamp> [<sev>]: T<thread ID>: <component>: <file>:<function>(<line>): <msg>`
 *
 * where:
 *   - `<time stamp>` is either local time with microsecond resolution and the time zone offset, e.g.,
 *     `2026-10-17 14:01:22.086374 +0000`; or seconds.microseconds since the POSIX epoch.  Which one depends on
 *     Config::m_use_human_friendly_time_stamps at construction time.
 *   - `<sev>` is a 4-letter abbreviation of the Sev (`fatl`, `eror`, `warn`, `info`, `debg`, `trce`, `data`).
 *   - `<component>: ` is present only if Config::output_component_to_ostream() chooses to print something.
 *
 * ### Thread safety ###
 * None.  The owning Logger must ensure no two log() calls on one `*this` run concurrently, and that nothing else
 * writes to the `ostream` meanwhile.
 *
 * The `ostream`'s formatting state is saved at construction and restored at destruction; in between `*this` may
 * change it at will.
 */
class Ostream_log_msg_writer :
  private boost::noncopyable
{
public:
  // Constants.

  /// Abbreviation of each Sev, indexed by its numeric value; `S_SEV_STRS[0]` (Sev::S_NONE) is never output.
  static const std::vector<util::String_view> S_SEV_STRS;

  // Constructors/destructor.

  /**
   * Constructs the writer.  `config` and `os` must both outlive `*this`.
   *
   * @param config
   *        Controls the time stamp style and the component output.
   * @param os
   *        Stream to which to write subsequently via log().
   */
  explicit Ostream_log_msg_writer(const Config& config, std::ostream& os);

  /// Restores `os` formatting state to what it was at construction.
  ~Ostream_log_msg_writer() noexcept;

  // Methods.

  /**
   * Logs to the wrapped `ostream` the given message and associated metadata, followed by a newline, then flushes.
   *
   * @param metadata
   *        See Logger::do_log().  `metadata.m_msg_sev` must not be Sev::S_NONE.
   * @param msg
   *        The message.  No newline is expected at its end.
   */
  void log(const Msg_metadata& metadata, util::String_view msg);

private:
  // Methods.

  /**
   * Writes the human-friendly local-time time stamp plus a trailing space.
   *
   * @param metadata
   *        See log().
   */
  void write_human_friendly_time_stamp(const Msg_metadata& metadata);

  /**
   * Writes the seconds.microseconds-since-epoch time stamp plus a trailing space.
   *
   * @param metadata
   *        See log().
   */
  void write_epoch_time_stamp(const Msg_metadata& metadata);

  // Data.

  /// Reference to the config object passed to constructor.
  const Config& m_config;

  /// Snapshot of Config::m_use_human_friendly_time_stamps at construction.
  const bool m_human_friendly_time_stamps;

  /// Reference to stream to which to log messages.
  std::ostream& m_os;

  /// Formatter state of #m_os at construction; restored in destructor.
  boost::io::ios_all_saver m_clean_os_state;
}; // class Ostream_log_msg_writer

} // namespace sift::log
