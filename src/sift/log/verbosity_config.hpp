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

#include "sift/log/verbosity_config_fwd.hpp"
#include "sift/log/config.hpp"
#include <utility>
#include <string>
#include <vector>

namespace sift::log
{

// Types.

/**
 * Optional-use structure encapsulating a full set of verbosity config, such that one can parse it from a config source
 * (like an options file or environment variable) in concise form and apply it to a log::Config object.
 *
 * The text form is a `;`-separated list of `<component>:<sev>` pairs, applied left to right.  `<component>` is a name
 * as registered via Config::init_component_names() (case-insensitive); the special name "ALL" (or an empty name,
 * or the pair reduced to just `<sev>`) denotes the catch-all default verbosity.  `<sev>` is anything
 * `operator>>(istream&, Sev&)` accepts.  E.g.: "ALL:INFO;SIFT-COLL:TRACE" or just "WARNING".
 *
 * The first pair always sets the default verbosity and, when applied, resets any component-specific
 * verbosities.  If the text does not begin with a catch-all pair, one with Config::S_MOST_VERBOSE_SEV_DEFAULT
 * is implied.
 */
class Verbosity_config
{
public:
  // Types.

  /// One `<component>:<sev>` setting; an empty component name stands for the default verbosity.
  using Component_sev_pair = std::pair<std::string, Sev>;

  /// The settings in application order; the first is always a default-verbosity one.
  using Component_sev_pair_seq = std::vector<Component_sev_pair>;

  // Constants.

  /// String that Verbosity_config::parse() treats as the default/catch-all verbosity's "component" specifier.
  static const std::string S_ALL_COMPONENT_NAME_ALIAS;

  /// Separates component/severity pairs in a Verbosity_config specifier string.
  static const char S_TOKEN_SEPARATOR;

  /// Separates component and severity within each pair in a Verbosity_config specifier string.
  static const char S_PAIR_SEPARATOR;

  // Constructors/destructor.

  /**
   * Constructs `*this` to be the default verbosity config: a single catch-all pair with
   * Config::S_MOST_VERBOSE_SEV_DEFAULT.
   */
  Verbosity_config();

  // Methods.

  /**
   * Deserializes `*this` from a standard input stream.  Reads up to but not including the next space (or end of
   * stream).  On failure `*this` is unchanged, and last_result_message() explains what went wrong.
   *
   * @param is
   *        Stream from which to deserialize.
   * @return `true` if and only if successfully parsed; `last_result_message().empty()` in that case.
   */
  bool parse(std::istream& is);

  /**
   * Applies `*this` to the given log::Config.  On failure (an unknown component name), `*target_config` may be
   * partially modified (the pairs up to the failing one having been applied); last_result_message() explains.
   *
   * @param target_config
   *        The log::Config to modify.  Must not be null.
   * @return `true` if and only if successfully applied; `last_result_message().empty()` in that case.
   */
  bool apply_to_config(Config* target_config);

  /**
   * Parses the given text, as-if via parse(), and applies the result, as-if via apply_to_config(), to the given
   * Config; reporting failure via error code.  On parse failure `*target_config` is untouched.
   *
   * @param config_text
   *        The text; see class doc header for format.
   * @param target_config
   *        The log::Config to modify.  Must not be null.
   * @param err_code
   *        See sift::error doc header for semantics.  Error codes: log::error::Code::S_VERBOSITY_CONFIG_MALFORMED,
   *        log::error::Code::S_VERBOSITY_CONFIG_UNKNOWN_COMPONENT.
   * @return `true` on success; `false` on failure (only if `err_code` is not null).
   */
  bool parse_and_apply(util::String_view config_text, Config* target_config, Error_code* err_code = 0);

  /**
   * To be used after parse() or `operator<<` or apply_to_config(), returns "" on success or a message
   * describing the problem on failure.
   *
   * @return See above.
   */
  const std::string& last_result_message() const;

  /**
   * Returns the result of the last successful parse(), or the default (see ctor) if none.
   * The first pair's name is always empty (the catch-all), and names are normalized to upper case.
   *
   * @return See above.
   */
  const Component_sev_pair_seq& component_sev_pairs() const;

private:
  // Data.

  /// See component_sev_pairs().
  Component_sev_pair_seq m_component_sev_pairs;

  /// See last_result_message().
  std::string m_last_result_message;
}; // class Verbosity_config

// Free functions: in *_fwd.hpp.

} // namespace sift::log
