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
#include <boost/iostreams/stream.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/noncopyable.hpp>

namespace sift::util
{

/**
 * An `ostream` whose output is appended directly onto an `std::string`, which the caller may read at any time via
 * str() without copying.  The string is either one the caller supplies or one held internally.
 *
 * The log call-site macros format each message through one of these; Buffer_logger keeps its whole log in one.
 * As with any buffered stream, flush os() before looking at str().
 */
class String_ostream :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Attaches to `*target_str`, or to an internal empty string if null.  Output is appended after any existing text.
   *
   * @param target_str
   *        String to append to, or null.  While `*this` lives, touch it only through `*this`.
   */
  explicit String_ostream(std::string* target_str = nullptr);

  // Methods.

  /**
   * The stream.
   * @return See above.
   */
  std::ostream& os();

  /**
   * The stream, read-only.
   * @return See above.
   */
  const std::ostream& os() const;

  /**
   * The target string; same object for the lifetime of `*this`.
   * @return See above.
   */
  const std::string& str() const;

  /// Flushes, then empties the target string.
  void str_clear();

private:
  // Types.

  /// Device that `push_back()`s everything written onto a string.
  using Appender = boost::iostreams::back_insert_device<std::string>;

  /// Stream over #Appender.
  using Appender_ostream = boost::iostreams::stream<Appender>;

  // Data.

  /// The target when none was passed to the ctor.
  std::string m_own_target_str;

  /// The target string: caller's or #m_own_target_str.
  std::string* const m_target;

  /// Device appending to `*m_target`.
  Appender m_appender;

  /// The stream over #m_appender.
  Appender_ostream m_os;
}; // class String_ostream

} // namespace sift::util
