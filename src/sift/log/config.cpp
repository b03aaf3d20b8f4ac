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
#include "sift/log/config.hpp"
#include <boost/algorithm/string.hpp>

namespace sift::log
{

// Static initializations.

const Sev Config::S_MOST_VERBOSE_SEV_DEFAULT = Sev::S_INFO;

// Config implementations.

Config::Config(Sev most_verbose_sev_default) :
  m_use_human_friendly_time_stamps(true),
  m_verbosity_default(raw_sev_t(most_verbose_sev_default))
{
}

Config::Config(const Config&) = default;

bool Config::output_whether_should_log(Sev sev, const Component& component) const
{
  // All loads are relaxed: a verbosity change racing with a log call may go either way, and nothing else is published.
  using std::memory_order_relaxed;

  const Sev thread_override = *this_thread_verbosity_override();
  if (thread_override != Sev::S_END_SENTINEL)
  {
    return sev <= thread_override;
  }
  // else

  raw_sev_t threshold = raw_sev_t(-1);
  if (!component.empty())
  {
    const auto idx = component_to_union_idx(component);
    if ((idx != component_union_idx_t(-1)) && (size_t(idx) < m_verbosities_by_union_idx.size()))
    {
      threshold = m_verbosities_by_union_idx[idx].load(memory_order_relaxed);
    }
  }
  if (threshold == raw_sev_t(-1))
  {
    threshold = m_verbosity_default.load(memory_order_relaxed);
  }

  return sev <= Sev(threshold);
} // Config::output_whether_should_log()

bool Config::output_component_to_ostream(std::ostream* os, const Component& component) const
{
  assert(os);

  if (component.empty())
  {
    return false;
  }
  // else
  const auto idx = component_to_union_idx(component);
  if (idx == component_union_idx_t(-1))
  {
    return false;
  }
  // else

  // Numeric output if the name was never recorded (output_components_numerically, or names never registered).
  const auto name_it = m_names_by_union_idx.find(idx);
  if (name_it == m_names_by_union_idx.end())
  {
    *os << idx;
  }
  else
  {
    *os << name_it->second;
  }
  return true;
}

void Config::configure_default_verbosity(Sev most_verbose_sev_default, bool reset)
{
  m_verbosity_default.store(raw_sev_t(most_verbose_sev_default), std::memory_order_relaxed);
  if (!reset)
  {
    return;
  }
  // else
  for (size_t idx = 0; idx != m_verbosities_by_union_idx.size(); ++idx)
  {
    store_severity_by_component(component_union_idx_t(idx), raw_sev_t(-1));
  }
}

bool Config::configure_component_verbosity_by_name(Sev most_verbose_sev, util::String_view component_name)
{
  const auto idx_it = m_union_idxs_by_name.find(normalized_component_name(component_name));
  if (idx_it == m_union_idxs_by_name.end())
  {
    return false;
  }
  // else
  store_severity_by_component(idx_it->second, raw_sev_t(most_verbose_sev));
  return true;
}

Config::component_union_idx_t Config::component_to_union_idx(const Component& component) const
{
  const auto offset_it = m_offsets_by_payload_type.find(component.payload_type_index());
  return (offset_it == m_offsets_by_payload_type.end())
           ? component_union_idx_t(-1)
           : (offset_it->second + component.payload_enum_raw_value());
}

void Config::store_severity_by_component(component_union_idx_t component_union_idx, raw_sev_t most_verbose_sev_or_none)
{
  assert(size_t(component_union_idx) < m_verbosities_by_union_idx.size());
  m_verbosities_by_union_idx[component_union_idx].store(most_verbose_sev_or_none, std::memory_order_relaxed);
}

std::string Config::normalized_component_name(util::String_view name) // Static.
{
  std::string result(name);
  normalize_component_name(&result);
  return result;
}

void Config::normalize_component_name(std::string* name) // Static.
{
  boost::algorithm::to_upper(*name, std::locale::classic());
}

Sev* Config::this_thread_verbosity_override() // Static.
{
  thread_local Sev s_override = Sev::S_END_SENTINEL;
  return &s_override;
}

util::Scoped_setter<Sev> Config::this_thread_verbosity_override_auto(Sev most_verbose_sev_or_none) // Static.
{
  return util::Scoped_setter<Sev>(this_thread_verbosity_override(), std::move(most_verbose_sev_or_none));
}

// Config::Atomic_raw_sev implementations.

Config::Atomic_raw_sev::Atomic_raw_sev(raw_sev_t init_val) :
  std::atomic<raw_sev_t>(init_val)
{
}

Config::Atomic_raw_sev::Atomic_raw_sev(const Atomic_raw_sev& src) :
  std::atomic<raw_sev_t>(src.load(std::memory_order_relaxed))
{
}

} // namespace sift::log
