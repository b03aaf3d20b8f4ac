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
#include "sift/log/ostream_log_msg_writer.hpp"
#include "sift/log/config.hpp"
#include "sift/util/detail/util.hpp"
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <chrono>
#include <cassert>
#include <iterator>

namespace sift::log
{

// Static initializations.

const std::vector<util::String_view> Ostream_log_msg_writer::S_SEV_STRS({ "null", // Never used (sentinel).
                                                                          "fatl", "eror", "warn",
                                                                          "info", "debg", "trce", "data" });

// Implementations.

Ostream_log_msg_writer::Ostream_log_msg_writer(const Config& config, std::ostream& os) :
  m_config(config),
  m_human_friendly_time_stamps(m_config.m_use_human_friendly_time_stamps),
  m_os(os),
  m_clean_os_state(m_os) // Memorize this before any messing with formatting.
{
  // Nothing else.
}

Ostream_log_msg_writer::~Ostream_log_msg_writer() noexcept
{
  // m_clean_os_state dtor restores m_os formatting.
}

void Ostream_log_msg_writer::log(const Msg_metadata& metadata, util::String_view msg)
{
  using std::flush;

  assert(metadata.m_msg_sev != Sev::S_NONE); // S_NONE can be used only as a sentinel.

  if (m_human_friendly_time_stamps)
  {
    write_human_friendly_time_stamp(metadata);
  }
  else
  {
    write_epoch_time_stamp(metadata);
  }

  m_os << '[' << S_SEV_STRS[static_cast<size_t>(metadata.m_msg_sev)] << "]: T" << metadata.m_call_thread_id << ": ";

  // Config may decide to print nothing (e.g., the component's enum was never registered).
  if (m_config.output_component_to_ostream(&m_os, metadata.m_msg_component))
  {
    m_os << ": ";
  }

  m_os << SIFT_UTIL_WHERE_AM_I_FROM_ARGS(metadata.m_msg_src_file, metadata.m_msg_src_function, metadata.m_msg_src_line)
       << ": "
       << msg << '\n'
       << flush;
} // Ostream_log_msg_writer::log()

void Ostream_log_msg_writer::write_human_friendly_time_stamp(const Msg_metadata& metadata)
{
  using std::chrono::duration_cast;
  using std::chrono::microseconds;
  using std::chrono::system_clock;

  /* localtime() gets us the present time zone, but only to the whole second; so splice in the sub-second part
   * ourselves, computed from the full-precision m_called_when. */
  const auto local_tm = fmt::localtime(system_clock::to_time_t(metadata.m_called_when));
  const auto usec = duration_cast<microseconds>(metadata.m_called_when.time_since_epoch()).count() % 1000000;

  fmt::memory_buffer buf;
  fmt::format_to(std::back_inserter(buf), "{0:%Y-%m-%d %H:%M:%S}.{1:06} {0:%z} ", local_tm, usec);
  m_os << util::String_view(buf.data(), buf.size());
}

void Ostream_log_msg_writer::write_epoch_time_stamp(const Msg_metadata& metadata)
{
  using std::chrono::duration_cast;
  using std::chrono::microseconds;

  const auto usec_since_epoch = duration_cast<microseconds>(metadata.m_called_when.time_since_epoch()).count();

  // sec.usec, padded with zeroes up to 6 digits.
  m_os << fmt::format("{}.{:06} ", usec_since_epoch / 1000000, usec_since_epoch % 1000000);
}

} // namespace sift::log
