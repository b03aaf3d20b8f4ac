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
#include "sift/log/verbosity_config.hpp"
#include "sift/log/error/error.hpp"
#include "sift/error/error.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <sstream>

namespace sift::log
{

// Static initializations.

const std::string Verbosity_config::S_ALL_COMPONENT_NAME_ALIAS("ALL");
const char Verbosity_config::S_TOKEN_SEPARATOR(';');
const char Verbosity_config::S_PAIR_SEPARATOR(':');

// Implementations.

Verbosity_config::Verbosity_config() :
  m_component_sev_pairs({ Component_sev_pair(std::string(), Config::S_MOST_VERBOSE_SEV_DEFAULT) })
{
}

bool Verbosity_config::parse(std::istream& is)
{
  using util::ostream_op_string;
  using boost::algorithm::split;
  using boost::algorithm::is_any_of;
  using boost::algorithm::to_upper_copy;
  using std::string;
  using std::vector;

  const std::locale& loc = std::locale::classic();

  string text;
  is >> text; // One whitespace-delimited word.

  vector<string> tokens;
  if (!text.empty())
  {
    split(tokens, text, is_any_of(string(1, S_TOKEN_SEPARATOR)));
  }

  Component_sev_pair_seq pairs;
  pairs.reserve(tokens.size() + 1);
  for (const auto& token : tokens)
  {
    vector<string> halves;
    split(halves, token, is_any_of(string(1, S_PAIR_SEPARATOR)));

    if (token.empty() || (halves.size() > 2))
    {
      m_last_result_message = ostream_op_string("Token [", token, "] of [", text, "] is not of the form `<sev>`, `",
                                                S_ALL_COMPONENT_NAME_ALIAS, S_PAIR_SEPARATOR, "<sev>` or `<component>",
                                                S_PAIR_SEPARATOR, "<sev>`.");
      return false;
    }
    // else

    // "<sev>" and "ALL:<sev>" both become the empty component name, meaning the default.
    string component_name = (halves.size() == 1) ? string() : to_upper_copy(halves.front(), loc);
    if (component_name == S_ALL_COMPONENT_NAME_ALIAS)
    {
      component_name.clear();
    }
    const string& sev_str = halves.back();

    /* lexical_cast<Sev> fails on trailing junk (as in "INFO+"); but an unknown or empty word quietly reads as S_NONE,
     * so S_NONE is only accepted when spelled out. */
    Sev sev = Sev::S_NONE;
    const bool ok = boost::conversion::try_lexical_convert(sev_str, sev)
                      && ((sev != Sev::S_NONE) || (to_upper_copy(sev_str, loc) == "NONE") || (sev_str == "0"));
    if (!ok)
    {
      m_last_result_message = ostream_op_string("Severity [", sev_str, "] in [", text, "] is not a known severity.");
      return false;
    }
    // else

    pairs.emplace_back(std::move(component_name), sev);
  } // for (token : tokens)

  if (pairs.empty() || !pairs.front().first.empty())
  {
    pairs.emplace(pairs.begin(), string(), Config::S_MOST_VERBOSE_SEV_DEFAULT);
  }

  m_component_sev_pairs = std::move(pairs);
  m_last_result_message.clear();
  return true;
} // Verbosity_config::parse()

bool Verbosity_config::apply_to_config(Config* target_config_ptr)
{
  using util::ostream_op_string;

  assert(target_config_ptr);
  auto& target_config = *target_config_ptr;

  // The leading pair is always the default; applying it also wipes all per-component verbosities.
  assert((!m_component_sev_pairs.empty()) && m_component_sev_pairs.front().first.empty());
  target_config.configure_default_verbosity(m_component_sev_pairs.front().second, true);

  for (size_t idx = 1; idx != m_component_sev_pairs.size(); ++idx)
  {
    const auto& pair = m_component_sev_pairs[idx];
    const auto& component_name = pair.first;
    const auto sev = pair.second;

    if (component_name.empty())
    {
      target_config.configure_default_verbosity(sev, false);
    }
    else if (!target_config.configure_component_verbosity_by_name(sev, component_name))
    {
      m_last_result_message = ostream_op_string("Component name [", component_name, "] is unknown.");
      return false;
    }
  }

  m_last_result_message.clear();
  return true;
} // Verbosity_config::apply_to_config()

bool Verbosity_config::parse_and_apply(util::String_view config_text, Config* target_config, Error_code* err_code)
{
  SIFT_ERROR_EXEC_AND_THROW_ON_ERROR(bool, parse_and_apply, config_text, target_config, _1);
  // err_code is non-null from here on.

  SIFT_LOG_SET_CONTEXT(nullptr, Sift_log_component::S_LOG); // For SIFT_ERROR_EMIT_ERROR(); nothing gets logged.

  std::istringstream is{std::string(config_text)};
  if (!parse(is))
  {
    SIFT_ERROR_EMIT_ERROR(error::Code::S_VERBOSITY_CONFIG_MALFORMED);
    return false;
  }
  // else

  if (!apply_to_config(target_config))
  {
    SIFT_ERROR_EMIT_ERROR(error::Code::S_VERBOSITY_CONFIG_UNKNOWN_COMPONENT);
    return false;
  }
  // else

  err_code->clear();
  return true;
} // Verbosity_config::parse_and_apply()

const std::string& Verbosity_config::last_result_message() const
{
  return m_last_result_message;
}

const Verbosity_config::Component_sev_pair_seq& Verbosity_config::component_sev_pairs() const
{
  return m_component_sev_pairs;
}

std::istream& operator>>(std::istream& is, Verbosity_config& val)
{
  val.parse(is);
  return is;
}

std::ostream& operator<<(std::ostream& os, const Verbosity_config& val)
{
  bool first = true;
  for (const auto& [component_name, sev] : val.component_sev_pairs())
  {
    if (!first)
    {
      os << Verbosity_config::S_TOKEN_SEPARATOR;
    }
    first = false;

    os << (component_name.empty() ? Verbosity_config::S_ALL_COMPONENT_NAME_ALIAS : component_name)
       << Verbosity_config::S_PAIR_SEPARATOR << sev;
  }
  return os;
}

bool operator==(const Verbosity_config& val1, const Verbosity_config& val2)
{
  return val1.component_sev_pairs() == val2.component_sev_pairs();
}

bool operator!=(const Verbosity_config& val1, const Verbosity_config& val2)
{
  return !(val1 == val2);
}

} // namespace sift::log
