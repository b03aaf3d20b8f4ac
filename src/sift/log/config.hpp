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
#include <boost/unordered_map.hpp>
#include <atomic>
#include <cstdint>
#include <limits>
#include <typeindex>
#include <type_traits>
#include <utility>
#include <vector>

namespace sift::log
{

// Types.

/**
 * Class used to configure the filtering and logging behavior of log::Logger implementations: Sift's
 * Buffer_logger, and available to any user-written Logger that wishes to use it.
 *
 * ### What it stores ###
 * Two things:
 *   - The verbosity: for each Component, the most-verbose Sev that passes the filter; plus a default for components
 *     without one (and for messages with no Component at all).  output_whether_should_log() implements the filter.
 *   - Component names: so that output_component_to_ostream() can print a component by name; and so that
 *     configure_component_verbosity_by_name() (and thus Verbosity_config) can refer to it by name.
 *
 * ### Component "union" indexing ###
 * A Config can serve several `enum class` component types at once (e.g., sift::Sift_log_component and one of
 * the user's own).  Each such type gets its own non-overlapping range of a conceptual "union" index space;
 * init_component_to_union_idx_mapping() registers the range, and the per-component tables are indexed by it.
 * Typically:
 *
 *   ~~~
 *   Config cfg;
 *   cfg.init_component_to_union_idx_mapping<Sift_log_component>
 *     (0, Config::standard_component_payload_enum_sparse_length<Sift_log_component>());
 *   cfg.init_component_names<Sift_log_component>(S_SIFT_LOG_COMPONENT_NAME_MAP, false, "sift-");
 *   ~~~
 *
 * ### Thread safety ###
 * The `init_*()` calls must all complete before `*this` is used by any Logger; after that, concurrent
 * `configure_*()` and `output_*()` calls are safe: the severities are stored in atomics, and the read path
 * (output_whether_should_log(), invoked at each log call site) is lock-free.
 */
class Config
{
public:
  // Types.

  /// Unsigned index into the flat union of component tables maintained by a Config.
  using component_union_idx_t = Component::enum_raw_t;

  // Constants.

  /// Default verbosity of a default-constructed Config: Sev::S_INFO.
  static const Sev S_MOST_VERBOSE_SEV_DEFAULT;

  // Constructors/destructor.

  /**
   * Constructs a conceptually blank but functional set of Config.  Namely, no component enums are yet
   * registered (call init_component_to_union_idx_mapping() and init_component_names() to register 0 or more
   * such enums), and the default verbosity is as given.
   *
   * @param most_verbose_sev_default
   *        The most-verbose (numerically highest) Sev that passes the filter for a message with no
   *        component-specific verbosity configured.
   */
  explicit Config(Sev most_verbose_sev_default = S_MOST_VERBOSE_SEV_DEFAULT);

  /**
   * Copy-constructs `*this` to be equal to `src` config object.  Performance-wise, this will copy internal
   * per-component tables.  Severities are read (atomically) from `src`; a concurrent `configure_*()` on `src`
   * may or may not be reflected.
   *
   * @param src
   *        Source object.
   */
  Config(const Config& src);

  /// Not movable.
  Config(Config&&) = delete;

  // Methods.

  /// For now at least there's no reason for copy assignment.
  void operator=(const Config&) = delete;

  /// Not assignable.
  void operator=(Config&&) = delete;

  /**
   * The filter behind Logger::should_log().  The threshold is the first of these that applies: this thread's
   * override (this_thread_verbosity_override()); the verbosity configured for `component`; the default verbosity.
   *
   * @param sev
   *        Severity of the message.
   * @param component
   *        Component of the message; `component.empty() == true` is allowed.
   * @return `true` if and only if `sev` is at or below the applicable threshold.
   */
  bool output_whether_should_log(Sev sev, const Component& component) const;

  /**
   * Prints `component` by its registered name (or union index, if so registered).
   *
   * @param os
   *        Non-null target stream.
   * @param component
   *        Component; may be empty().
   * @return `false`, with nothing printed, if `component` is empty() or of an unregistered type.
   */
  bool output_component_to_ostream(std::ostream* os, const Component& component) const;

  /**
   * Registers component `enum` type `Component_payload`: its value `v` gets union index
   * `enum_to_num_offset + v`.  Register each type once, with ranges that do not overlap.
   *
   * @tparam Component_payload
   *         The component `enum`.
   * @param enum_to_num_offset
   *        Union index of value 0.
   * @param enum_sparse_length
   *        One plus the highest raw value of `Component_payload`; see standard_component_payload_enum_sparse_length().
   */
  template<typename Component_payload>
  void init_component_to_union_idx_mapping(component_union_idx_t enum_to_num_offset,
                                           size_t enum_sparse_length);

  /**
   * Registers names for the values of an already-mapped `Component_payload`, for printing and for
   * configure_component_verbosity_by_name().  A value's full name is the prefix plus its name in `component_names`,
   * upper-cased.
   *
   * @tparam Component_payload
   *         The component `enum`.
   * @param component_names
   *        Non-empty name(s) of each value.
   * @param output_components_numerically
   *        Print union indices instead of names (names still work for configuration).
   * @param payload_type_prefix_or_empty
   *        Prefix applied to every name; empty for none.
   */
  template<typename Component_payload>
  void init_component_names(const boost::unordered_multimap<Component_payload, std::string>& component_names,
                            bool output_components_numerically = false,
                            util::String_view payload_type_prefix_or_empty = util::String_view());

  /**
   * Sets the verbosity used for components without their own.
   *
   * @param most_verbose_sev_default
   *        The new default.
   * @param reset
   *        If and only if `true`, every component-specific verbosity is removed.
   */
  void configure_default_verbosity(Sev most_verbose_sev_default, bool reset);

  /**
   * Sets the verbosity of one component.
   *
   * @tparam Component_payload
   *         The component `enum`.
   * @param most_verbose_sev
   *        The verbosity.
   * @param component_payload
   *        The component.
   * @return `true` on success; `false` if `Component_payload` was never registered via
   *         init_component_to_union_idx_mapping().
   */
  template<typename Component_payload>
  bool configure_component_verbosity(Sev most_verbose_sev, Component_payload component_payload);

  /**
   * Like configure_component_verbosity() but the component is given by name (case-insensitively), as registered
   * via init_component_names().
   *
   * @param most_verbose_sev
   *        The verbosity.
   * @param component_name
   *        Name, including the prefix given to init_component_names() if any.
   * @return `true` on success; `false` if the name is unknown.
   */
  bool configure_component_verbosity_by_name(Sev most_verbose_sev,
                                             util::String_view component_name);

  /**
   * `enum_sparse_length` for init_component_to_union_idx_mapping() of an `enum` ending in `S_END_SENTINEL`.
   *
   * @tparam Component_payload
   *         See init_component_to_union_idx_mapping().
   * @return See above.
   */
  template<typename Component_payload>
  static size_t standard_component_payload_enum_sparse_length();

  /**
   * This thread's verbosity override, writable.  While it is not Sev::S_END_SENTINEL (its initial value), it is the
   * threshold for every output_whether_should_log() call in this thread, on any Config.
   *
   * @return See above.
   */
  static Sev* this_thread_verbosity_override();

  /**
   * Sets this thread's override until the returned object is destroyed:
   *
   *   ~~~
   *   {
   *     const auto quiet = Config::this_thread_verbosity_override_auto(Sev::S_NONE);
   *     ...; // Nothing logged from this thread here.
   *   }
   *   ~~~
   *
   * @param most_verbose_sev_or_none
   *        Override; Sev::S_END_SENTINEL for none.
   * @return Restorer.
   */
  static util::Scoped_setter<Sev> this_thread_verbosity_override_auto(Sev most_verbose_sev_or_none);

  // Data.

  /**
   * Time stamp style for the Sift loggers: local date, time and UTC offset if `true`; seconds since the Unix epoch
   * if `false`.  Set it before logging starts.
   */
  bool m_use_human_friendly_time_stamps;

private:
  // Types.

  /// A Sev as stored in the verbosity tables; `raw_sev_t(-1)` means no verbosity is set there.
  using raw_sev_t = uint8_t;

  /// `atomic<raw_sev_t>` made default-constructible (to "not set") and copyable, so it can live in a `vector`.
  class Atomic_raw_sev : public std::atomic<raw_sev_t>
  {
  public:
    /**
     * Constructs with the given value.
     * @param init_val
     *        Value.
     */
    Atomic_raw_sev(raw_sev_t init_val = raw_sev_t(-1));

    /**
     * Constructs with a relaxed load of `src`.
     * @param src
     *        Source.
     */
    Atomic_raw_sev(const Atomic_raw_sev& src);
  }; // class Atomic_raw_sev

  static_assert(std::is_unsigned_v<component_union_idx_t> && (sizeof(size_t) >= sizeof(component_union_idx_t)),
                "Union indices must convert losslessly to vector indices.");

  // Methods.

  /**
   * `name` upper-cased (classic locale).
   * @param name
   *        Name.
   * @return See above.
   */
  static std::string normalized_component_name(util::String_view name);

  /**
   * Upper-cases `*name` in place.
   * @param name
   *        Non-null name.
   */
  static void normalize_component_name(std::string* name);

  /**
   * Union index of a non-empty() `component`; `component_union_idx_t(-1)` if its `enum` type was never registered.
   *
   * @param component
   *        Non-empty component.
   * @return See above.
   */
  component_union_idx_t component_to_union_idx(const Component& component) const;

  /**
   * Stores a verbosity (or `raw_sev_t(-1)`) at an in-range union index.
   *
   * @param component_union_idx
   *        Index into #m_verbosities_by_union_idx.
   * @param most_verbose_sev_or_none
   *        Value.
   */
  void store_severity_by_component(component_union_idx_t component_union_idx, raw_sev_t most_verbose_sev_or_none);

  // Data.

  /// For each registered payload `enum`, the union index of its value 0.
  boost::unordered_map<std::type_index, component_union_idx_t> m_offsets_by_payload_type;

  /// Verbosity for components without one of their own.
  Atomic_raw_sev m_verbosity_default;

  /// Per-component verbosity by union index.  Only resized during `init_*()`; later only the elements change.
  std::vector<Atomic_raw_sev> m_verbosities_by_union_idx;

  /// Printed name by union index; no entry means print the index.
  boost::unordered_map<component_union_idx_t, std::string> m_names_by_union_idx;

  /// Union index by normalized full name, for configure_component_verbosity_by_name().
  boost::unordered_map<std::string, component_union_idx_t> m_union_idxs_by_name;
}; // class Config

// Template implementations.

template<typename Component_payload>
void Config::init_component_to_union_idx_mapping(component_union_idx_t enum_to_num_offset,
                                                 size_t enum_sparse_length)
{
  assert(enum_sparse_length != 0);
  const size_t end_idx = size_t(enum_to_num_offset) + enum_sparse_length;
  assert(end_idx <= size_t(std::numeric_limits<component_union_idx_t>::max()));

  // Same key as Component(x).payload_type_index() for any x of this type.
  const auto inserted = m_offsets_by_payload_type.emplace(std::type_index(typeid(Component_payload)),
                                                          enum_to_num_offset).second;
  assert(inserted && "Component payload type registered twice.");
  (void)inserted;

  if (end_idx > m_verbosities_by_union_idx.size())
  {
    m_verbosities_by_union_idx.resize(end_idx); // New slots are "not set."
  }
}

template<typename Component_payload>
void Config::init_component_names
       (const boost::unordered_multimap<Component_payload, std::string>& component_names,
        bool output_components_numerically,
        util::String_view payload_type_prefix_or_empty)
{
  using std::string;

  const string prefix = normalized_component_name(payload_type_prefix_or_empty);

  for (const auto& [enum_val, raw_name] : component_names)
  {
    assert(!raw_name.empty());
    string name = raw_name;
    normalize_component_name(&name);

    const auto idx = component_to_union_idx(Component(enum_val));
    assert((idx != component_union_idx_t(-1)) && "Call init_component_to_union_idx_mapping() first.");

    const bool inserted = m_union_idxs_by_name.emplace(prefix + name, idx).second;
    assert(inserted && "Duplicate component name.");
    (void)inserted;

    if (output_components_numerically)
    {
      continue;
    }
    // else

    // An `enum` value with several names prints as "PREFIX-NAME1,NAME2".
    string& printed = m_names_by_union_idx[idx];
    printed += printed.empty() ? (prefix + name) : (',' + name);
  }
} // Config::init_component_names()

template<typename Component_payload>
bool Config::configure_component_verbosity(Sev most_verbose_sev, Component_payload component_payload)
{
  const auto idx = component_to_union_idx(Component(component_payload));
  if (idx == component_union_idx_t(-1))
  {
    return false;
  }
  // else
  store_severity_by_component(idx, raw_sev_t(most_verbose_sev));
  return true;
}

template<typename Component_payload>
size_t Config::standard_component_payload_enum_sparse_length() // Static.
{
  // S_END_SENTINEL is one past the highest value, gaps included.
  return size_t(Component_payload::S_END_SENTINEL);
}

} // namespace sift::log
