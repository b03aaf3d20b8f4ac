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
#include "sift/log/log.hpp"
#include "sift/util/util.hpp"

namespace sift::log
{

// Component implementations.

Component::Component() :
  m_payload_type_or_null(nullptr)
{
  // m_payload_enum_raw_value stays garbage while empty().
}

Component::Component(const Component&) = default;
Component::Component(Component&&) = default;
Component& Component::operator=(const Component&) = default;
Component& Component::operator=(Component&&) = default;

bool Component::empty() const
{
  return m_payload_type_or_null == nullptr;
}

const std::type_info& Component::payload_type() const
{
  assert(!empty());
  return *m_payload_type_or_null;
}

std::type_index Component::payload_type_index() const
{
  return payload_type();
}

Component::enum_raw_t Component::payload_enum_raw_value() const
{
  assert(!empty());
  return m_payload_enum_raw_value;
}

// Log_context implementations.

Log_context::Log_context(Logger* logger) :
  m_logger(logger)
{
}

Log_context::Log_context(const Log_context&) = default;
Log_context& Log_context::operator=(const Log_context&) = default;

Log_context::Log_context(Log_context&& src) :
  Log_context()
{
  swap(src);
}

Log_context& Log_context::operator=(Log_context&& src)
{
  if (&src == this)
  {
    return *this;
  }
  // else
  Log_context(std::move(src)).swap(*this);
  return *this;
}

Logger* Log_context::get_logger() const
{
  return m_logger;
}

const Component& Log_context::get_log_component() const
{
  return m_component;
}

void Log_context::swap(Log_context& other)
{
  using std::swap;

  swap(m_logger, other.m_logger);
  swap(m_component, other.m_component);
}

void swap(Log_context& val1, Log_context& val2)
{
  val1.swap(val2);
}

// Sev implementations.

std::ostream& operator<<(std::ostream& os, Sev val)
{
  // These strings must be what operator>>() (via istream_to_enum()) accepts.
  switch (val)
  {
  case Sev::S_NONE:    return os << "NONE";
  case Sev::S_FATAL:   return os << "FATAL";
  case Sev::S_ERROR:   return os << "ERROR";
  case Sev::S_WARNING: return os << "WARNING";
  case Sev::S_INFO:    return os << "INFO";
  case Sev::S_DEBUG:   return os << "DEBUG";
  case Sev::S_TRACE:   return os << "TRACE";
  case Sev::S_DATA:    return os << "DATA";
  case Sev::S_END_SENTINEL: break;
  }

  assert(false && "Sentinel or corrupt Sev value printed.");
  return os;
}

std::istream& operator>>(std::istream& is, Sev& val)
{
  // Case-insensitive name or its integer; anything else yields S_NONE.
  val = util::istream_to_enum(&is, Sev::S_NONE, Sev::S_END_SENTINEL);
  return is;
}

} // namespace sift::log
